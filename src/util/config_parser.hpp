#ifndef XPECONOMY_UTIL_CONFIG_PARSER_HPP
#define XPECONOMY_UTIL_CONFIG_PARSER_HPP

#include <string>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <cstdint>
#include <mutex>
#include "config/service_config.hpp"
#include "config/economy_params.hpp"
#include "util/logger.hpp"

/**
 * @file config_parser.hpp
 * @brief Reads the xpeconomyd "key=value" configuration file.
 *
 * Populates both the process settings (ServiceConfig) and the economy tuning
 * (EconomyParams). Lines starting with '#' and blank lines are ignored.
 *
 * USAGE:
 *   @code
 *   xpeconomy::config::ServiceConfig service;
 *   xpeconomy::config::EconomyParams economy = xpeconomy::config::getDefaultParams();
 *   xpeconomy::util::ConfigParser parser(service, economy);
 *   parser.loadFromFile("xpeconomy.conf");
 *   @endcode
 *
 * A missing file is not an error: the defaults stay in place and a warning is logged.
 * Malformed lines and non-numeric values for numeric keys throw std::runtime_error.
 */

namespace xpeconomy {
namespace util {

class ConfigParser
{
public:
    ConfigParser(config::ServiceConfig &serviceConfig, config::EconomyParams &economyParams)
        : serviceConfig_(serviceConfig)
        , economyParams_(economyParams)
    {
    }

    /**
     * @brief Parse the given file line by line.
     * @return false if the file does not exist (defaults kept), true otherwise.
     * @throw std::runtime_error on malformed content.
     */
    inline bool loadFromFile(const std::string &filepath)
    {
        std::lock_guard<std::mutex> lock(mutex_);

        std::ifstream inFile(filepath);
        if (!inFile.is_open()) {
            logger::warn("[ConfigParser] File not found, using defaults: " + filepath);
            return false;
        }

        logger::info("[ConfigParser] Loading config from " + filepath);
        parseStream(inFile);
        logger::info("[ConfigParser] Config loaded.");
        return true;
    }

    /**
     * @brief Parse configuration held in a string (used by tests and embedded setups).
     */
    inline void loadFromString(const std::string &content)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        std::istringstream in(content);
        parseStream(in);
    }

private:
    config::ServiceConfig &serviceConfig_;
    config::EconomyParams &economyParams_;
    std::mutex mutex_;

    inline void parseStream(std::istream &in)
    {
        std::string line;
        size_t lineNo = 0;
        while (std::getline(in, line)) {
            ++lineNo;
            trim(line);
            if (line.empty() || line[0] == '#') {
                continue;
            }

            auto pos = line.find('=');
            if (pos == std::string::npos) {
                throw std::runtime_error("ConfigParser: invalid line " + std::to_string(lineNo)
                    + " (no '='): " + line);
            }
            std::string key = line.substr(0, pos);
            std::string val = line.substr(pos + 1);
            trim(key);
            trim(val);

            applyKeyValue(key, val);
        }
    }

    inline void applyKeyValue(const std::string &key, const std::string &val)
    {
        config::ServiceConfig &sc = serviceConfig_;
        config::EconomyParams &ep = economyParams_;

        // Process settings
        if (key == "dataDirectory") {
            sc.dataDirectory = val;
        }
        else if (key == "databaseFile") {
            sc.databaseFile = val;
        }
        else if (key == "logLevel") {
            logger::parseLogLevel(val);
            sc.logLevel = val;
        }
        else if (key == "logFile") {
            sc.logFile = val;
        }
        else if (key == "monitorIntervalSeconds") {
            sc.monitorIntervalSeconds = parseUInt(key, val);
        }
        else if (key == "monitorThreads") {
            sc.monitorThreads = static_cast<uint32_t>(parseUInt(key, val));
        }
        else if (key == "graderEndpoint") {
            sc.graderEndpoint = val;
        }
        else if (key == "graderTimeoutMs") {
            sc.graderTimeoutMs = parseUInt(key, val);
        }
        // Economy tuning
        else if (key == "lengthMetric") {
            if (val == "words") {
                ep.lengthMetric = config::LengthMetric::Words;
            } else if (val == "letters") {
                ep.lengthMetric = config::LengthMetric::Letters;
            } else {
                throw std::runtime_error("ConfigParser: lengthMetric must be 'words' or 'letters', got '"
                    + val + "'");
            }
        }
        else if (key == "initialCurrentWpm") { ep.initialCurrentWpm = parseInt(key, val); }
        else if (key == "initialMaxWpm") { ep.initialMaxWpm = parseInt(key, val); }
        else if (key == "minWpm") { ep.minWpm = parseInt(key, val); }
        else if (key == "wpmStep") { ep.wpmStep = parseInt(key, val); }
        else if (key == "progressionBonusXp") { ep.progressionBonusXp = parseInt(key, val); }
        else if (key == "passThresholdPct") { ep.passThresholdPct = parseInt(key, val); }
        else if (key == "speedBaseWpm") { ep.speedBaseWpm = parseDouble(key, val); }
        else if (key == "perfectBonusRate") { ep.perfectBonusRate = parseDouble(key, val); }
        else if (key == "diminishingBase") { ep.diminishingBase = parseDouble(key, val); }
        else if (key == "commentCost") { ep.commentCost = parseInt(key, val); }
        else if (key == "replyCost") { ep.replyCost = parseInt(key, val); }
        else if (key == "bronzeCost") { ep.bronzeCost = parseInt(key, val); }
        else if (key == "silverCost") { ep.silverCost = parseInt(key, val); }
        else if (key == "goldCost") { ep.goldCost = parseInt(key, val); }
        else if (key == "reportTrollCost") { ep.reportTrollCost = parseInt(key, val); }
        else if (key == "reportBadCost") { ep.reportBadCost = parseInt(key, val); }
        else if (key == "reportSevereCost") { ep.reportSevereCost = parseInt(key, val); }
        else if (key == "authorRewardRate") { ep.authorRewardRate = parseDouble(key, val); }
        else if (key == "maxTransactionAmount") { ep.maxTransactionAmount = parseInt(key, val); }
        else if (key == "lockRetryLimit") { ep.lockRetryLimit = static_cast<uint32_t>(parseUInt(key, val)); }
        else if (key == "retryBackoffMs") { ep.retryBackoffMs = static_cast<uint32_t>(parseUInt(key, val)); }
        else if (key == "velocityWindowSeconds") { ep.velocityWindowSeconds = parseInt(key, val); }
        else if (key == "velocityThresholdXp") { ep.velocityThresholdXp = parseInt(key, val); }
        else if (key == "maxTransactionsPerMinute") { ep.maxTransactionsPerMinute = parseInt(key, val); }
        else if (key == "largeTransactionThreshold") { ep.largeTransactionThreshold = parseInt(key, val); }
        else if (key == "freezeOnViolation") { ep.freezeOnViolation = parseBool(key, val); }
        else {
            logger::warn("[ConfigParser] Unrecognized key '" + key + "' with value '" + val + "'");
            return;
        }
        logger::debug("[ConfigParser] " + key + " set to " + val);
    }

    inline void trim(std::string &s)
    {
        static const std::string whitespace = " \t\r\n";
        auto pos = s.find_first_not_of(whitespace);
        if (pos != std::string::npos) {
            s.erase(0, pos);
        }
        else {
            s.clear();
            return;
        }
        pos = s.find_last_not_of(whitespace);
        if (pos != std::string::npos) {
            s.erase(pos + 1);
        }
    }

    inline uint64_t parseUInt(const std::string &key, const std::string &val) const
    {
        if (!val.empty() && val[0] == '-') {
            throw std::runtime_error("ConfigParser: " + key + " must not be negative: '" + val + "'");
        }
        try {
            size_t idx = 0;
            uint64_t n = std::stoull(val, &idx, 10);
            if (idx != val.size()) {
                throw std::runtime_error("Non-numeric suffix");
            }
            return n;
        }
        catch (const std::exception &ex) {
            throw std::runtime_error("ConfigParser: " + key + " expects an unsigned integer, got '"
                + val + "': " + ex.what());
        }
    }

    inline int64_t parseInt(const std::string &key, const std::string &val) const
    {
        try {
            size_t idx = 0;
            long long n = std::stoll(val, &idx, 10);
            if (idx != val.size()) {
                throw std::runtime_error("Non-numeric suffix");
            }
            return static_cast<int64_t>(n);
        }
        catch (const std::exception &ex) {
            throw std::runtime_error("ConfigParser: " + key + " expects an integer, got '"
                + val + "': " + ex.what());
        }
    }

    inline double parseDouble(const std::string &key, const std::string &val) const
    {
        try {
            size_t idx = 0;
            double d = std::stod(val, &idx);
            if (idx != val.size()) {
                throw std::runtime_error("Non-numeric suffix");
            }
            return d;
        }
        catch (const std::exception &ex) {
            throw std::runtime_error("ConfigParser: " + key + " expects a number, got '"
                + val + "': " + ex.what());
        }
    }

    inline bool parseBool(const std::string &key, const std::string &val) const
    {
        if (val == "true" || val == "1" || val == "yes") {
            return true;
        }
        if (val == "false" || val == "0" || val == "no") {
            return false;
        }
        throw std::runtime_error("ConfigParser: " + key + " expects true/false, got '" + val + "'");
    }
};

} // namespace util
} // namespace xpeconomy

#endif // XPECONOMY_UTIL_CONFIG_PARSER_HPP
