#include "engine/http_quiz_grader.hpp"
#include "util/logger.hpp"

#include <curl/curl.h>
#include <memory>
#include <mutex>
#include <sstream>
#include <stdexcept>
#include <thread>

namespace xpeconomy {
namespace engine {

namespace {

size_t writeCallback(char *ptr, size_t size, size_t nmemb, void *userdata)
{
    if (!userdata) return 0;
    std::string &resp = *reinterpret_cast<std::string*>(userdata);
    size_t total = size * nmemb;
    resp.append(ptr, total);
    return total;
}

std::string escapeJson(const std::string &in)
{
    std::string out;
    for (char c : in) {
        switch (c) {
        case '"':  out += "\\\""; break;
        case '\\': out += "\\\\"; break;
        case '\n': out += "\\n";  break;
        case '\r': out += "\\r";  break;
        case '\t': out += "\\t";  break;
        default:
            if (static_cast<unsigned char>(c) >= 0x20) {
                out += c;
            }
            break;
        }
    }
    return out;
}

// Finds "key": <integer> in a flat JSON object.
bool findInteger(const std::string &response, const std::string &key, int64_t &out)
{
    std::string search = "\"" + key + "\"";
    size_t pos = response.find(search);
    if (pos == std::string::npos) {
        return false;
    }
    pos = response.find(':', pos + search.size());
    if (pos == std::string::npos) {
        return false;
    }
    ++pos;
    while (pos < response.size() && (response[pos] == ' ' || response[pos] == '"')) {
        ++pos;
    }
    size_t end = pos;
    if (end < response.size() && response[end] == '-') {
        ++end;
    }
    while (end < response.size() && response[end] >= '0' && response[end] <= '9') {
        ++end;
    }
    if (end == pos) {
        return false;
    }
    try {
        out = std::stoll(response.substr(pos, end - pos));
    }
    catch (const std::exception &) {
        return false;
    }
    return true;
}

} // namespace

HttpQuizGrader::HttpQuizGrader(const std::string &endpoint, uint64_t transferTimeoutMs)
    : m_endpoint(endpoint), m_timeoutMs(transferTimeoutMs)
{
    initCurl();
}

void HttpQuizGrader::initCurl()
{
    static bool initialized = false;
    static std::mutex initMutex;
    std::lock_guard<std::mutex> lock(initMutex);
    if (!initialized) {
        curl_global_init(CURL_GLOBAL_ALL);
        initialized = true;
    }
}

std::future<QuizGrade> HttpQuizGrader::Grade(const QuizSubmission &submission)
{
    auto promise = std::make_shared<std::promise<QuizGrade>>();
    std::future<QuizGrade> future = promise->get_future();

    std::string endpoint = m_endpoint;
    uint64_t timeoutMs = m_timeoutMs;
    std::thread([promise, endpoint, timeoutMs, submission]() {
        try {
            promise->set_value(post(endpoint, timeoutMs, submission));
        }
        catch (const std::exception &) {
            promise->set_exception(std::current_exception());
        }
    }).detach();

    return future;
}

std::string HttpQuizGrader::BuildRequestBody(const QuizSubmission &submission)
{
    std::ostringstream oss;
    oss << "{\"account_id\":\"" << escapeJson(submission.accountId) << "\","
        << "\"content_id\":\"" << escapeJson(submission.contentId) << "\","
        << "\"wpm_used\":" << submission.wpmUsed << ","
        << "\"answers\":[";
    for (size_t i = 0; i < submission.answers.size(); ++i) {
        if (i > 0) {
            oss << ",";
        }
        oss << "\"" << escapeJson(submission.answers[i]) << "\"";
    }
    oss << "]}";
    return oss.str();
}

QuizGrade HttpQuizGrader::ParseResponse(const std::string &response, int64_t fallbackWpm)
{
    QuizGrade grade;
    if (!findInteger(response, "score_pct", grade.scorePct)) {
        throw std::runtime_error("[HttpQuizGrader] response has no score_pct: " + response);
    }
    if (!findInteger(response, "wpm_used", grade.wpmUsed)) {
        grade.wpmUsed = fallbackWpm;
    }
    return grade;
}

QuizGrade HttpQuizGrader::post(const std::string &endpoint, uint64_t timeoutMs, const QuizSubmission &submission)
{
    CURL *curl = curl_easy_init();
    if (!curl) {
        throw std::runtime_error("[HttpQuizGrader] curl_easy_init failed");
    }

    std::string body = BuildRequestBody(submission);
    std::string response;
    struct curl_slist *headers = nullptr;
    headers = curl_slist_append(headers, "Content-Type: application/json");

    curl_easy_setopt(curl, CURLOPT_URL, endpoint.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body.c_str());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(timeoutMs));
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, writeCallback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response);

    CURLcode res = curl_easy_perform(curl);
    long httpCode = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &httpCode);

    curl_slist_free_all(headers);
    curl_easy_cleanup(curl);

    if (res != CURLE_OK) {
        util::logger::warn("[HttpQuizGrader] POST " + endpoint + " failed: " + curl_easy_strerror(res));
        throw std::runtime_error(std::string("[HttpQuizGrader] transfer failed: ") + curl_easy_strerror(res));
    }
    if (httpCode != 200) {
        throw std::runtime_error("[HttpQuizGrader] grading service answered HTTP " + std::to_string(httpCode));
    }
    return ParseResponse(response, submission.wpmUsed);
}

} // namespace engine
} // namespace xpeconomy
