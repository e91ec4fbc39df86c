#ifndef XPECONOMY_ENGINE_HTTP_QUIZ_GRADER_HPP
#define XPECONOMY_ENGINE_HTTP_QUIZ_GRADER_HPP

#include <string>
#include <future>
#include <cstdint>
#include "engine/quiz_grader.hpp"

/**
 * @file http_quiz_grader.hpp
 * @brief IQuizGrader backed by an HTTP grading service.
 *
 * DESIGN:
 *   - Uses libcurl to POST the submission as JSON to the configured endpoint
 *     (default: http://127.0.0.1:8090/grade).
 *   - The service answers {"score_pct":<int>,"wpm_used":<int>}.
 *   - Each Grade() runs its transfer on a detached worker thread, bounded by
 *     CURLOPT_TIMEOUT_MS, and fulfils the returned future with the grade or
 *     with a std::runtime_error describing the failure.
 *   - A global libcurl init is done once per process.
 *
 * REQUIREMENTS:
 *   - You must link against libcurl (-lcurl) for this code to function.
 */

namespace xpeconomy {
namespace engine {

class HttpQuizGrader : public IQuizGrader
{
public:
    HttpQuizGrader(const std::string &endpoint, uint64_t transferTimeoutMs);

    std::future<QuizGrade> Grade(const QuizSubmission &submission) override;

    /// JSON body posted for a submission.
    static std::string BuildRequestBody(const QuizSubmission &submission);

    /**
     * @brief Parse the grading service's answer.
     * @throw std::runtime_error when score_pct is missing.
     */
    static QuizGrade ParseResponse(const std::string &response, int64_t fallbackWpm);

private:
    static void initCurl();
    static QuizGrade post(const std::string &endpoint, uint64_t timeoutMs, const QuizSubmission &submission);

    std::string m_endpoint;
    uint64_t m_timeoutMs;
};

} // namespace engine
} // namespace xpeconomy

#endif // XPECONOMY_ENGINE_HTTP_QUIZ_GRADER_HPP
