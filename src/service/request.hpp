#ifndef XPECONOMY_SERVICE_REQUEST_HPP
#define XPECONOMY_SERVICE_REQUEST_HPP

#include <string>
#include <stdexcept>
#include <unordered_map>
#include <cctype>
#include <cstdint>

/**
 * @file request.hpp
 * @brief Parses one request line into a Request object for the ServiceManager.
 *
 * FORMAT:
 *   <Type> key=value key="value with spaces" ...
 *
 *   - Type is the first whitespace-separated token.
 *   - Values may be double-quoted; inside quotes \" and \\ are unescaped.
 *   - A key given twice keeps the last value.
 *
 * USAGE EXAMPLE:
 *   @code
 *   using namespace xpeconomy::service;
 *
 *   Request req = parseRequest(R"(Spend account=alice amount=30 purpose=manual description="Gift card")");
 *   // req.type == "Spend", req.params["description"] == "Gift card"
 *   @endcode
 */

namespace xpeconomy {
namespace service {

/**
 * @struct Request
 * @brief A request type plus its key-value parameters.
 */
struct Request
{
    std::string type;                                      ///< e.g. "Earn", "PurchaseFeature"
    std::unordered_map<std::string, std::string> params;   ///< key -> unquoted value

    bool has(const std::string &key) const
    {
        return params.find(key) != params.end();
    }

    /// Value of key, or fallback when absent.
    std::string get(const std::string &key, const std::string &fallback = "") const
    {
        auto it = params.find(key);
        return it == params.end() ? fallback : it->second;
    }
};

/**
 * @brief Parse a request line. Throws std::runtime_error on malformed input.
 */
inline Request parseRequest(const std::string &line)
{
    Request req;
    size_t pos = 0;
    const size_t n = line.size();

    auto skipSpace = [&]() {
        while (pos < n && std::isspace(static_cast<unsigned char>(line[pos]))) {
            pos++;
        }
    };

    skipSpace();
    size_t typeStart = pos;
    while (pos < n && !std::isspace(static_cast<unsigned char>(line[pos]))) {
        pos++;
    }
    req.type = line.substr(typeStart, pos - typeStart);
    if (req.type.empty()) {
        throw std::runtime_error("parseRequest: empty request line");
    }
    if (req.type.find('=') != std::string::npos) {
        throw std::runtime_error("parseRequest: request line must start with a request type");
    }

    while (true) {
        skipSpace();
        if (pos >= n) {
            break;
        }

        // key
        size_t keyStart = pos;
        while (pos < n && line[pos] != '=' && !std::isspace(static_cast<unsigned char>(line[pos]))) {
            pos++;
        }
        std::string key = line.substr(keyStart, pos - keyStart);
        if (pos >= n || line[pos] != '=') {
            throw std::runtime_error("parseRequest: expected key=value, got '" + key + "'");
        }
        if (key.empty()) {
            throw std::runtime_error("parseRequest: empty key at position " + std::to_string(keyStart));
        }
        pos++; // '='

        // value
        std::string value;
        if (pos < n && line[pos] == '"') {
            pos++;
            bool closed = false;
            while (pos < n) {
                char c = line[pos];
                if (c == '\\' && pos + 1 < n && (line[pos + 1] == '"' || line[pos + 1] == '\\')) {
                    value.push_back(line[pos + 1]);
                    pos += 2;
                    continue;
                }
                if (c == '"') {
                    closed = true;
                    pos++;
                    break;
                }
                value.push_back(c);
                pos++;
            }
            if (!closed) {
                throw std::runtime_error("parseRequest: unmatched quote for value of key=" + key);
            }
            if (pos < n && !std::isspace(static_cast<unsigned char>(line[pos]))) {
                throw std::runtime_error("parseRequest: unexpected text after quoted value of key=" + key);
            }
        }
        else {
            size_t valStart = pos;
            while (pos < n && !std::isspace(static_cast<unsigned char>(line[pos]))) {
                pos++;
            }
            value = line.substr(valStart, pos - valStart);
        }
        req.params[key] = value;
    }
    return req;
}

} // namespace service
} // namespace xpeconomy

#endif // XPECONOMY_SERVICE_REQUEST_HPP
