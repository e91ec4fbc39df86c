#ifndef XPECONOMY_TEST_ECONOMY_FIXTURE_HPP
#define XPECONOMY_TEST_ECONOMY_FIXTURE_HPP

#include <gtest/gtest.h>
#include <sqlite3.h>
#include <cstdio>
#include <memory>
#include <string>

#include "config/economy_params.hpp"
#include "ledger/transaction_manager.hpp"
#include "storage/ledger_store.hpp"

/**
 * @file economy_fixture.hpp
 * @brief Shared fixture: a private ledger with a hand-driven clock.
 *
 * The ledger is ":memory:" unless a test calls useFileDatabase(), which
 * tests that need a second raw SQLite connection (tampering, locking) or
 * units running side by side use.
 */

namespace xpeconomy {
namespace test {

// 2023-11-14T22:13:20Z, mid-day so +/- a few hours stays on the same day
constexpr int64_t kStartMillis = 1700000000000;
constexpr int64_t kDayMillis = 86400000;

class EconomyTest : public ::testing::Test {
  protected:
    EconomyTest()
        : nowMs(kStartMillis),
          params(config::getTestParams()),
          store(std::make_unique<storage::LedgerStore>(":memory:", [this]() { return nowMs; })),
          tm(std::make_unique<ledger::TransactionManager>(*store, params)) {}

    void SetUp() override { ASSERT_TRUE(store->Open()); }

    void TearDown() override {
        tm.reset();
        store.reset();
        if (!filePath.empty()) {
            removeDatabaseFiles(filePath);
        }
    }

    /// Replace the in-memory ledger with a fresh file-backed one.
    void useFileDatabase(const std::string& path) {
        tm.reset();
        store.reset();
        removeDatabaseFiles(path);
        filePath = path;
        store = std::make_unique<storage::LedgerStore>(path, [this]() { return nowMs; });
        ASSERT_TRUE(store->Open());
        tm = std::make_unique<ledger::TransactionManager>(*store, params);
    }

    /// Run SQL on a second raw connection to the file database.
    int rawExec(const std::string& sql) {
        sqlite3* db = nullptr;
        int rc = sqlite3_open(filePath.c_str(), &db);
        if (rc == SQLITE_OK) {
            rc = sqlite3_exec(db, sql.c_str(), nullptr, nullptr, nullptr);
        }
        sqlite3_close(db);
        return rc;
    }

    void createFunded(const std::string& accountId, int64_t amount) {
        ASSERT_TRUE(tm->CreateAccount(accountId).ok());
        if (amount > 0) {
            ASSERT_TRUE(tm->Earn(accountId, amount, core::sources::AdminGrant, "starting balance").ok());
        }
    }

    int64_t spendable(const std::string& accountId) { return tm->GetBalance(accountId).value().spendableXp; }

    int64_t accumulated(const std::string& accountId) {
        return tm->GetBalance(accountId).value().accumulatedXp;
    }

    static void removeDatabaseFiles(const std::string& path) {
        std::remove(path.c_str());
        std::remove((path + "-wal").c_str());
        std::remove((path + "-shm").c_str());
    }

    int64_t nowMs;
    config::EconomyParams params;
    std::unique_ptr<storage::LedgerStore> store;
    std::unique_ptr<ledger::TransactionManager> tm;
    std::string filePath;
};

} // namespace test
} // namespace xpeconomy

#endif // XPECONOMY_TEST_ECONOMY_FIXTURE_HPP
