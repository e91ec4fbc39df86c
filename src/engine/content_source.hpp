#ifndef XPECONOMY_ENGINE_CONTENT_SOURCE_HPP
#define XPECONOMY_ENGINE_CONTENT_SOURCE_HPP

#include <string>
#include <optional>
#include <unordered_map>
#include <mutex>
#include <cstdint>
#include "config/economy_params.hpp"
#include "engine/xp_calculator.hpp"

namespace xpeconomy {
namespace engine {

/// What the reward formula needs to know about one piece of content.
struct ContentInfo
{
    std::string contentId;
    int64_t length = 0;          ///< in the deployment's length metric
    double readingLevel = 0.0;
};

/**
 * @class IContentSource
 * @brief Supplies length and reading level per content id. Implemented by the
 *        content subsystem; InMemoryContentSource serves the daemon and tests.
 */
class IContentSource
{
public:
    virtual ~IContentSource() = default;
    virtual std::optional<ContentInfo> Lookup(const std::string &contentId) = 0;
};

class InMemoryContentSource : public IContentSource
{
public:
    explicit InMemoryContentSource(config::LengthMetric metric = config::LengthMetric::Words)
        : m_metric(metric)
    {
    }

    void Register(const std::string &contentId, int64_t length, double readingLevel)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_content[contentId] = ContentInfo{contentId, length, readingLevel};
    }

    /// Measures text with the configured metric.
    void RegisterText(const std::string &contentId, const std::string &text, double readingLevel)
    {
        Register(contentId, MeasureContent(text, m_metric), readingLevel);
    }

    std::optional<ContentInfo> Lookup(const std::string &contentId) override
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_content.find(contentId);
        if (it == m_content.end()) {
            return std::nullopt;
        }
        return it->second;
    }

private:
    config::LengthMetric m_metric;
    std::mutex m_mutex;
    std::unordered_map<std::string, ContentInfo> m_content;
};

} // namespace engine
} // namespace xpeconomy

#endif // XPECONOMY_ENGINE_CONTENT_SOURCE_HPP
