#ifndef XPECONOMY_SERVICE_RESPONSE_HPP
#define XPECONOMY_SERVICE_RESPONSE_HPP

#include <string>
#include <map>
#include <sstream>
#include <cstdint>
#include <iomanip>
#include "core/errors.hpp"

/**
 * @file response.hpp
 * @brief JSON response returned for every service request.
 *
 * Status codes follow HTTP:
 *   200 success, 400 ValidationError / PrerequisiteMissing, 402 InsufficientXP,
 *   404 NotFound, 409 AlreadyOwned, 423 AccountFrozen / CommentLocked,
 *   500 storage failure or InvariantViolation, 503 TransientConflict, 504 Timeout.
 *
 * USAGE EXAMPLE:
 *   @code
 *   using namespace xpeconomy::service;
 *
 *   Response resp(200, "OK", "", {{"spendable_xp", "80"}});
 *   std::string jsonOut = resp.toJson();
 *   // => {"status":200,"message":"OK","data":"","fields":{"spendable_xp":"80"}}
 *   @endcode
 */

namespace xpeconomy {
namespace service {

inline int statusForError(core::ErrorCode code)
{
    switch (code) {
    case core::ErrorCode::Ok:                  return 200;
    case core::ErrorCode::InsufficientXP:      return 402;
    case core::ErrorCode::AlreadyOwned:        return 409;
    case core::ErrorCode::AccountFrozen:       return 423;
    case core::ErrorCode::CommentLocked:       return 423;
    case core::ErrorCode::TransientConflict:   return 503;
    case core::ErrorCode::Timeout:             return 504;
    case core::ErrorCode::ValidationError:     return 400;
    case core::ErrorCode::PrerequisiteMissing: return 400;
    case core::ErrorCode::NotFound:            return 404;
    case core::ErrorCode::InvariantViolation:  return 500;
    case core::ErrorCode::StorageError:        return 500;
    }
    return 500;
}

/**
 * @struct Response
 * @brief Represents a service-layer response, serialized back to the client as one JSON line.
 */
struct Response
{
    int statusCode;      ///< HTTP-like status code
    std::string message; ///< A short status or reason phrase
    std::string data;    ///< Main payload (may itself be JSON)
    std::map<std::string, std::string> fields;   ///< sorted, so output is stable

    Response(int code = 200,
             const std::string &msg = "OK",
             const std::string &dat = "",
             const std::map<std::string, std::string> &extra = {})
        : statusCode(code), message(msg), data(dat), fields(extra)
    {
    }

    /**
     * @brief Failure response for a Result; the error name goes into fields["error"]
     *        and an InsufficientXP shortfall into fields["shortfall"].
     */
    template <typename T>
    static Response fromError(const core::Result<T> &result)
    {
        Response resp(statusForError(result.code()), result.message());
        resp.fields["error"] = core::errorCodeName(result.code());
        if (result.code() == core::ErrorCode::InsufficientXP) {
            resp.fields["shortfall"] = std::to_string(result.shortfall());
        }
        return resp;
    }

    bool ok() const { return statusCode == 200; }

    /**
     * @brief Convert the Response into a JSON string:
     *   {"status":200,"message":"OK","data":"...","fields":{...}}
     */
    std::string toJson() const
    {
        std::ostringstream oss;
        oss << "{";
        oss << R"("status":)" << statusCode << ",";
        oss << R"("message":")" << escapeString(message) << "\",";
        oss << R"("data":")" << escapeString(data) << "\",";
        oss << R"("fields":{)";
        bool first = true;
        for (const auto &kv : fields) {
            if (!first) {
                oss << ",";
            }
            oss << "\"" << escapeString(kv.first) << "\":\"" << escapeString(kv.second) << "\"";
            first = false;
        }
        oss << "}}";
        return oss.str();
    }

    /**
     * @brief Escape characters in a string for JSON, e.g. " -> \".
     */
    static std::string escapeString(const std::string &in)
    {
        std::ostringstream oss;
        for (char c : in) {
            switch (c) {
            case '"':  oss << "\\\""; break;
            case '\\': oss << "\\\\"; break;
            case '\b': oss << "\\b";  break;
            case '\f': oss << "\\f";  break;
            case '\n': oss << "\\n";  break;
            case '\r': oss << "\\r";  break;
            case '\t': oss << "\\t";  break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    oss << "\\u" << std::hex << std::setw(4) << std::setfill('0')
                        << static_cast<int>(static_cast<unsigned char>(c)) << std::dec;
                } else {
                    oss << c;
                }
                break;
            }
        }
        return oss.str();
    }
};

} // namespace service
} // namespace xpeconomy

#endif // XPECONOMY_SERVICE_RESPONSE_HPP
