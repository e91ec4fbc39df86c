#ifndef XPECONOMY_CONFIG_SERVICE_CONFIG_HPP
#define XPECONOMY_CONFIG_SERVICE_CONFIG_HPP

#include <string>
#include <cstdint>

/**
 * @file service_config.hpp
 * @brief Defines the local settings of one xpeconomyd process.
 *
 * USAGE:
 *   - Populated manually or through config_parser.hpp
 *   - Contains storage location, logging, monitoring cadence and the grading endpoint.
 */

namespace xpeconomy {
namespace config {

/**
 * @struct ServiceConfig
 * @brief Holds essential local configuration:
 *   - dataDirectory: Where the ledger database lives.
 *   - databaseFile: SQLite file name inside dataDirectory (":memory:" for a throwaway ledger).
 *   - logLevel / logFile: Logger setup.
 *   - monitorIntervalSeconds / monitorThreads: Cadence and parallelism of invariant checks.
 *   - graderEndpoint / graderTimeoutMs: External quiz grading service.
 */
struct ServiceConfig
{
    /**
     * @brief Construct a new ServiceConfig with defaults:
     *   dataDirectory = "./xpeconomy_data"
     *   databaseFile = "ledger.sqlite"
     *   logLevel = "INFO"
     *   monitorIntervalSeconds = 300
     */
    ServiceConfig()
        : dataDirectory("./xpeconomy_data"),
          databaseFile("ledger.sqlite"),
          logLevel("INFO"),
          logFile(""),
          monitorIntervalSeconds(300),
          monitorThreads(2),
          graderEndpoint("http://127.0.0.1:8090/grade"),
          graderTimeoutMs(5000)
    {
    }

    /// Full path to the SQLite ledger, or ":memory:".
    std::string databasePath() const
    {
        if (databaseFile == ":memory:") {
            return databaseFile;
        }
        return dataDirectory + "/" + databaseFile;
    }

    std::string dataDirectory;
    std::string databaseFile;

    /// DEBUG, INFO, WARN, ERROR or CRITICAL.
    std::string logLevel;

    /// Empty means console only.
    std::string logFile;

    uint64_t monitorIntervalSeconds;
    uint32_t monitorThreads;

    std::string graderEndpoint;
    uint64_t graderTimeoutMs;
};

} // namespace config
} // namespace xpeconomy

#endif // XPECONOMY_CONFIG_SERVICE_CONFIG_HPP
