#include <chrono>
#include <filesystem>
#include <iostream>
#include <string>
#include <system_error>

#include "config/economy_params.hpp"
#include "config/service_config.hpp"
#include "engine/content_source.hpp"
#include "engine/quiz_processor.hpp"
#include "engine/speed_progression.hpp"
#include "features/feature_store.hpp"
#include "ledger/transaction_manager.hpp"
#include "monitor/ledger_monitor.hpp"
#include "monitor/monitor_scheduler.hpp"
#include "service/service_manager.hpp"
#include "social/social_interaction_manager.hpp"
#include "storage/ledger_store.hpp"
#include "util/config_parser.hpp"
#include "util/logger.hpp"

namespace logger = xpeconomy::util::logger;

int main(int argc, char** argv) {
    // stdout carries one JSON response per request line
    xpeconomy::util::logger::Logger::getInstance().setStderrOnly(true);

    // 1. Parse configuration
    xpeconomy::config::ServiceConfig serviceConfig;
    xpeconomy::config::EconomyParams params = xpeconomy::config::getDefaultParams();
    xpeconomy::util::ConfigParser configParser(serviceConfig, params);

    std::string configPath = "xpeconomy.conf";
    if (argc > 1) {
        configPath = argv[1];
    }

    try {
        if (!configParser.loadFromFile(configPath)) {
            logger::warn("[main] No config at " + configPath + ", running with defaults.");
        }
        logger::configure(serviceConfig.logLevel, serviceConfig.logFile);
    } catch (const std::runtime_error& ex) {
        std::cerr << "xpeconomyd: invalid configuration " << configPath << ": " << ex.what() << std::endl;
        return 1;
    }

    logger::info("[main] XP economy service starting (config " + configPath + ", profile "
                 + params.profileID + ").");

    // 2. Open the ledger
    if (serviceConfig.databaseFile != ":memory:") {
        std::error_code ec;
        std::filesystem::create_directories(serviceConfig.dataDirectory, ec);
        if (ec) {
            logger::error("[main] Cannot create data directory " + serviceConfig.dataDirectory + ": "
                          + ec.message());
            return 1;
        }
    }

    xpeconomy::storage::LedgerStore store(serviceConfig.databasePath());
    if (!store.Open()) {
        logger::error("[main] Failed to open ledger at " + serviceConfig.databasePath());
        return 1;
    }

    // 3. Wire the components
    xpeconomy::ledger::TransactionManager transactions(store, params);
    xpeconomy::engine::InMemoryContentSource content(params.lengthMetric);
    xpeconomy::engine::SpeedProgressionController progression(transactions, params);
    xpeconomy::engine::QuizProcessor quizzes(transactions, progression, content, params);
    xpeconomy::features::FeatureStore featureStore(transactions, params);
    xpeconomy::social::SocialInteractionManager social(transactions, params);
    xpeconomy::monitor::LedgerMonitor ledgerMonitor(transactions, params, serviceConfig.monitorThreads);

    if (!featureStore.SeedDefaultCatalog()) {
        logger::error("[main] Could not seed the feature catalog.");
        return 1;
    }

    xpeconomy::service::ServiceManager services;
    services.RegisterTransactionManager(&transactions);
    services.RegisterContentSource(&content);
    services.RegisterQuizProcessor(&quizzes);
    services.RegisterSpeedProgression(&progression);
    services.RegisterFeatureStore(&featureStore);
    services.RegisterSocialManager(&social);
    services.RegisterLedgerMonitor(&ledgerMonitor);

    // 4. Periodic invariant checks
    xpeconomy::monitor::MonitorScheduler scheduler(ledgerMonitor);
    scheduler.ConfigureInterval(std::chrono::seconds(serviceConfig.monitorIntervalSeconds));
    if (serviceConfig.monitorIntervalSeconds > 0) {
        scheduler.StartScheduling();
    } else {
        logger::warn("[main] monitorIntervalSeconds is 0, periodic monitoring disabled.");
    }

    // 5. Serve request lines from stdin, one JSON response per line
    logger::info("[main] Ready for requests on stdin.");
    std::string line;
    while (std::getline(std::cin, line)) {
        if (line.empty() || line[0] == '#') {
            continue;
        }
        if (line == "Quit") {
            break;
        }
        std::cout << services.HandleLine(line).toJson() << std::endl;
    }

    // 6. Shutdown
    scheduler.StopScheduling();
    store.Close();

    logger::info("[main] XP economy service exiting.");
    return 0;
}
