#ifndef XPECONOMY_STORAGE_LEDGER_STORE_HPP
#define XPECONOMY_STORAGE_LEDGER_STORE_HPP

#include <string>
#include <vector>
#include <optional>
#include <functional>
#include <mutex>
#include <condition_variable>
#include <cstdint>
#include <sqlite3.h>
#include "core/types.hpp"
#include "core/errors.hpp"

/**
 * @file ledger_store.hpp
 * @brief Durable SQLite storage for the XP economy.
 *
 * Every method is safe to call from several threads. Connections come from a
 * small pool: a unit of work started with RunInTransaction() keeps one
 * connection for its whole duration, and every store call the same thread makes
 * inside the unit runs on it. Units on different threads therefore proceed
 * side by side; SQLite itself only serializes the span from a unit's first
 * write to its commit.
 *
 * File databases run in WAL mode with a short busy timeout, so a writer that
 * cannot get the write lock (another unit, another process) surfaces as a
 * StoreError with busy() == true. ":memory:" gives a private throwaway ledger
 * for tests; it lives in a single connection, so its units run one at a time.
 *
 * The transactions and feature_purchases tables are append-only: triggers
 * abort any UPDATE or DELETE on them.
 *
 * All SQLite failures other than expected constraint conflicts throw
 * core::StoreError.
 */

namespace xpeconomy {
namespace storage {

/// Returns unix time in milliseconds.
using Clock = std::function<int64_t()>;

int64_t systemClockMillis();

struct TransactionTotals
{
    int64_t sumAmount = 0;
    int64_t sumEarned = 0;
    int64_t sumSpent = 0;   ///< positive magnitude of all SPEND amounts
    int64_t count = 0;
};

class LedgerStore
{
public:
    explicit LedgerStore(const std::string &dbPath, Clock clock = systemClockMillis);
    ~LedgerStore();

    LedgerStore(const LedgerStore&) = delete;
    LedgerStore& operator=(const LedgerStore&) = delete;

    /**
     * @brief Open (or create) the database and apply the schema.
     * @return false if the database could not be opened or initialised.
     */
    bool Open();
    bool IsOpen() const;
    void Close();

    const std::string& Path() const { return m_dbPath; }
    int64_t NowMillis() const { return m_clock(); }

    /**
     * @brief Run body inside BEGIN IMMEDIATE ... COMMIT.
     *
     * body returns true to commit, false to roll back. An exception thrown by
     * body rolls back and is rethrown. Units do not nest.
     * @return true if the unit committed.
     * @throw core::StoreError when BEGIN or COMMIT fails (busy() for lock contention).
     */
    bool RunInTransaction(const std::function<bool()> &body);

    // ----- accounts --------------------------------------------------------
    /// @return false if the account id already exists.
    bool InsertAccount(const core::Account &account);
    std::optional<core::Account> LoadAccount(const std::string &accountId);
    /**
     * @brief Compare-and-swap update of the mutable balance fields.
     * @return false if the row's version no longer equals expectedVersion.
     */
    bool UpdateAccount(const core::Account &account, int64_t expectedVersion);
    bool SetSpendingFrozen(const std::string &accountId, bool frozen, const std::string &reason);
    std::vector<std::string> ListAccountIds();

    // ----- transactions ----------------------------------------------------
    int64_t InsertTransaction(const core::Transaction &tx);
    std::optional<core::Transaction> LoadTransaction(int64_t id);
    std::optional<core::Transaction> FindTransactionByRequestKey(const std::string &requestKey);
    /**
     * @brief Transactions of one account.
     * @param type  restrict to EARN or SPEND when set
     * @param limit 0 for all rows
     * @param newestFirst order by id descending when true
     */
    std::vector<core::Transaction> LoadTransactions(const std::string &accountId,
                                                    std::optional<core::TransactionType> type = std::nullopt,
                                                    size_t limit = 0,
                                                    bool newestFirst = false);
    std::vector<core::Transaction> LoadTransactionsSince(const std::string &accountId, int64_t sinceMillis);
    TransactionTotals SumTransactions(const std::string &accountId);
    /// Sum of |amount| over the account's transactions whose source is one of sources.
    int64_t SumAmountBySources(const std::string &accountId, const std::vector<std::string> &sources);
    TransactionTotals SumAllTransactionsSince(int64_t sinceMillis);
    int64_t CountActiveAccountsSince(int64_t sinceMillis);

    // ----- quiz attempts ---------------------------------------------------
    int64_t CountAttempts(const std::string &accountId, const std::string &contentId);
    bool HasPassedAttempt(const std::string &accountId, const std::string &contentId);
    int64_t InsertQuizAttempt(const core::QuizAttempt &attempt);
    std::optional<core::QuizAttempt> FindQuizAttemptByRequestKey(const std::string &requestKey);
    std::vector<core::QuizAttempt> LoadQuizAttempts(const std::string &accountId, const std::string &contentId);
    /// Speed of the account's most recent passed attempt on any content.
    std::optional<int64_t> LastPassedWpm(const std::string &accountId);

    // ----- comments --------------------------------------------------------
    int64_t GetCommentCredits(const std::string &accountId, const std::string &contentId);
    void AddCommentCredit(const std::string &accountId, const std::string &contentId);
    /// @return false when no credit was left.
    bool ConsumeCommentCredit(const std::string &accountId, const std::string &contentId);
    /// @return false if the comment id already exists.
    bool InsertComment(const core::CommentRecord &comment);
    std::optional<core::CommentRecord> LoadComment(const std::string &commentId);
    int64_t CountCommentsByAuthor(const std::string &accountId);

    // ----- interactions ----------------------------------------------------
    int64_t InsertInteraction(const core::InteractionRecord &interaction);
    std::optional<core::InteractionRecord> FindInteractionByRequestKey(const std::string &requestKey);
    int64_t CountPositiveInteractionsGiven(const std::string &accountId);
    int64_t CountPositiveInteractionsReceived(const std::string &accountId);

    // ----- feature catalog and ownership -----------------------------------
    void UpsertCatalogEntry(const core::FeatureCatalogEntry &entry);
    std::optional<core::FeatureCatalogEntry> LoadCatalogEntry(const std::string &featureId);
    std::vector<core::FeatureCatalogEntry> LoadCatalog();
    void UpsertBundle(const core::FeatureBundle &bundle);
    std::optional<core::FeatureBundle> LoadBundle(const std::string &bundleId);
    std::vector<core::FeatureBundle> LoadBundles();

    /// @return false if the account already owns the feature.
    bool InsertPurchase(const core::FeaturePurchase &purchase);
    bool OwnsFeature(const std::string &accountId, const std::string &featureId);
    std::vector<std::string> OwnedFeatures(const std::string &accountId);
    std::vector<core::FeaturePurchase> LoadPurchases(const std::string &accountId);
    int64_t CountPurchasesSince(int64_t sinceMillis);

    // ----- monitoring ------------------------------------------------------
    int64_t InsertReviewFlag(const core::ReviewFlag &flag);
    std::vector<core::ReviewFlag> LoadReviewFlags(const std::string &accountId);

    /**
     * @brief zlib-compress payload and store it in audit_archive.
     * @return the archive row id.
     */
    int64_t ArchiveSnapshot(const std::string &accountId, const std::string &reason, const std::string &payload);
    /// @return the decompressed payload, or nullopt if the id is unknown.
    std::optional<std::string> LoadArchive(int64_t archiveId);
    int64_t CountArchives(const std::string &accountId);

private:
    class Lease;

    bool initDatabaseSchema(sqlite3 *db);
    sqlite3 *openConnection();
    sqlite3 *acquireConnection();
    void releaseConnection(sqlite3 *db);

    std::string m_dbPath;
    Clock m_clock;

    mutable std::mutex m_poolMutex;
    std::condition_variable m_poolCv;
    std::vector<sqlite3*> m_idle;
    bool m_open;
    size_t m_connectionCount;
    size_t m_maxConnections;
};

} // namespace storage
} // namespace xpeconomy

#endif // XPECONOMY_STORAGE_LEDGER_STORE_HPP
