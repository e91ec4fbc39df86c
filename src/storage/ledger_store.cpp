#include "storage/ledger_store.hpp"
#include "util/hashing.hpp"
#include "util/logger.hpp"

#include <chrono>
#include <sstream>
#include <zlib.h>

namespace xpeconomy {
namespace storage {

using core::StoreError;

int64_t systemClockMillis()
{
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

namespace {

bool isBusyCode(int rc)
{
    int primary = rc & 0xff;
    return primary == SQLITE_BUSY || primary == SQLITE_LOCKED;
}

[[noreturn]] void throwStoreError(sqlite3 *db, int rc, const std::string &what)
{
    std::string detail = db ? sqlite3_errmsg(db) : sqlite3_errstr(rc);
    throw StoreError("[LedgerStore] " + what + ": " + detail, rc, isBusyCode(rc));
}

// -----------------------------------------------------------------------------
// Prepared statement owned for the duration of one call.
// -----------------------------------------------------------------------------
class Statement
{
public:
    Statement(sqlite3 *db, const std::string &sql)
        : m_db(db), m_stmt(nullptr)
    {
        int rc = sqlite3_prepare_v2(db, sql.c_str(), -1, &m_stmt, nullptr);
        if (rc != SQLITE_OK || !m_stmt) {
            throwStoreError(db, rc, "prepare failed for '" + sql + "'");
        }
    }

    ~Statement() { sqlite3_finalize(m_stmt); }

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    void bindInt(int idx, int64_t value)
    {
        check(sqlite3_bind_int64(m_stmt, idx, value), "bind int");
    }

    void bindText(int idx, const std::string &value)
    {
        check(sqlite3_bind_text(m_stmt, idx, value.c_str(), static_cast<int>(value.size()), SQLITE_TRANSIENT),
              "bind text");
    }

    /// Binds NULL for an empty string (NULLs never collide in UNIQUE columns).
    void bindTextOrNull(int idx, const std::string &value)
    {
        if (value.empty()) {
            check(sqlite3_bind_null(m_stmt, idx), "bind null");
        } else {
            bindText(idx, value);
        }
    }

    void bindOptionalInt(int idx, const std::optional<int64_t> &value)
    {
        if (value) {
            bindInt(idx, *value);
        } else {
            check(sqlite3_bind_null(m_stmt, idx), "bind null");
        }
    }

    void bindBlob(int idx, const void *data, size_t len)
    {
        check(sqlite3_bind_blob(m_stmt, idx, data, static_cast<int>(len), SQLITE_TRANSIENT), "bind blob");
    }

    /// @return true for a row, false when done.
    bool step()
    {
        int rc = sqlite3_step(m_stmt);
        if (rc == SQLITE_ROW) {
            return true;
        }
        if (rc == SQLITE_DONE) {
            return false;
        }
        throwStoreError(m_db, rc, "step failed");
    }

    /// Executes a write; returns false on a constraint conflict.
    bool stepInsert()
    {
        int rc = sqlite3_step(m_stmt);
        if (rc == SQLITE_DONE) {
            return true;
        }
        if ((rc & 0xff) == SQLITE_CONSTRAINT) {
            return false;
        }
        throwStoreError(m_db, rc, "write failed");
    }

    int64_t colInt(int col) const { return sqlite3_column_int64(m_stmt, col); }

    bool colIsNull(int col) const { return sqlite3_column_type(m_stmt, col) == SQLITE_NULL; }

    std::string colText(int col) const
    {
        const unsigned char *text = sqlite3_column_text(m_stmt, col);
        if (!text) {
            return std::string();
        }
        return std::string(reinterpret_cast<const char*>(text),
                           static_cast<size_t>(sqlite3_column_bytes(m_stmt, col)));
    }

    std::string colBlob(int col) const
    {
        const void *blob = sqlite3_column_blob(m_stmt, col);
        int len = sqlite3_column_bytes(m_stmt, col);
        if (!blob || len <= 0) {
            return std::string();
        }
        return std::string(static_cast<const char*>(blob), static_cast<size_t>(len));
    }

private:
    void check(int rc, const char *what)
    {
        if (rc != SQLITE_OK) {
            throwStoreError(m_db, rc, what);
        }
    }

    sqlite3 *m_db;
    sqlite3_stmt *m_stmt;
};

const char *kAccountColumns =
    "account_id, accumulated_xp, spendable_xp, current_wpm, max_wpm, streak_days, last_earn_day,"
    " spending_frozen, frozen_reason, last_hash, version, created_at";

const char *kTransactionColumns =
    "id, account_id, type, amount, source, description, balance_after, created_at,"
    " quiz_attempt_id, comment_id, feature_ref, request_key, prev_hash, entry_hash";

const char *kQuizColumns =
    "id, account_id, content_id, attempt_number, score_pct, wpm_used, xp_awarded, is_perfect,"
    " passed, request_key, created_at";

const char *kCommentColumns =
    "comment_id, author_id, content_id, parent_id, is_free, cost_paid, transaction_id, created_at";

const char *kInteractionColumns =
    "id, actor_id, comment_id, author_id, tier, cost, author_reward, request_key, created_at";

const char *kCatalogColumns = "feature_id, name, price, category, prerequisites, bundle_id";

const char *kPurchaseColumns = "id, account_id, feature_id, cost_paid, transaction_id, bundle_id, created_at";

core::Account readAccount(const Statement &st)
{
    core::Account a;
    a.accountId      = st.colText(0);
    a.accumulatedXp  = st.colInt(1);
    a.spendableXp    = st.colInt(2);
    a.currentWpm     = st.colInt(3);
    a.maxWpm         = st.colInt(4);
    a.streakDays     = st.colInt(5);
    a.lastEarnDay    = st.colInt(6);
    a.spendingFrozen = st.colInt(7) != 0;
    a.frozenReason   = st.colText(8);
    a.lastHash       = st.colText(9);
    a.version        = st.colInt(10);
    a.createdAt      = st.colInt(11);
    return a;
}

core::Transaction readTransaction(const Statement &st)
{
    core::Transaction t;
    t.id           = st.colInt(0);
    t.accountId    = st.colText(1);
    t.type         = st.colText(2) == "SPEND" ? core::TransactionType::Spend : core::TransactionType::Earn;
    t.amount       = st.colInt(3);
    t.source       = st.colText(4);
    t.description  = st.colText(5);
    t.balanceAfter = st.colInt(6);
    t.createdAt    = st.colInt(7);
    if (!st.colIsNull(8)) {
        t.refs.quizAttemptId = st.colInt(8);
    }
    t.refs.commentId  = st.colText(9);
    t.refs.featureRef = st.colText(10);
    t.requestKey      = st.colText(11);
    t.prevHash        = st.colText(12);
    t.entryHash       = st.colText(13);
    return t;
}

core::QuizAttempt readQuizAttempt(const Statement &st)
{
    core::QuizAttempt q;
    q.id            = st.colInt(0);
    q.accountId     = st.colText(1);
    q.contentId     = st.colText(2);
    q.attemptNumber = st.colInt(3);
    q.scorePct      = st.colInt(4);
    q.wpmUsed       = st.colInt(5);
    q.xpAwarded     = st.colInt(6);
    q.isPerfect     = st.colInt(7) != 0;
    q.passed        = st.colInt(8) != 0;
    q.requestKey    = st.colText(9);
    q.createdAt     = st.colInt(10);
    return q;
}

core::CommentRecord readComment(const Statement &st)
{
    core::CommentRecord c;
    c.commentId = st.colText(0);
    c.authorId  = st.colText(1);
    c.contentId = st.colText(2);
    c.parentId  = st.colText(3);
    c.isFree    = st.colInt(4) != 0;
    c.costPaid  = st.colInt(5);
    if (!st.colIsNull(6)) {
        c.transactionId = st.colInt(6);
    }
    c.createdAt = st.colInt(7);
    return c;
}

core::InteractionRecord readInteraction(const Statement &st)
{
    core::InteractionRecord r;
    r.id           = st.colInt(0);
    r.actorId      = st.colText(1);
    r.commentId    = st.colText(2);
    r.authorId     = st.colText(3);
    r.tier         = core::parseInteractionTier(st.colText(4)).value_or(core::InteractionTier::Bronze);
    r.cost         = st.colInt(5);
    r.authorReward = st.colInt(6);
    r.requestKey   = st.colText(7);
    r.createdAt    = st.colInt(8);
    return r;
}

std::string joinCsv(const std::vector<std::string> &items)
{
    std::string out;
    for (size_t i = 0; i < items.size(); ++i) {
        if (i > 0) {
            out += ',';
        }
        out += items[i];
    }
    return out;
}

std::vector<std::string> splitCsv(const std::string &csv)
{
    std::vector<std::string> out;
    std::stringstream ss(csv);
    std::string item;
    while (std::getline(ss, item, ',')) {
        if (!item.empty()) {
            out.push_back(item);
        }
    }
    return out;
}

core::FeatureCatalogEntry readCatalogEntry(const Statement &st)
{
    core::FeatureCatalogEntry e;
    e.featureId     = st.colText(0);
    e.name          = st.colText(1);
    e.price         = st.colInt(2);
    e.category      = st.colText(3);
    e.prerequisites = splitCsv(st.colText(4));
    e.bundleId      = st.colText(5);
    return e;
}

core::FeaturePurchase readPurchase(const Statement &st)
{
    core::FeaturePurchase p;
    p.id            = st.colInt(0);
    p.accountId     = st.colText(1);
    p.featureId     = st.colText(2);
    p.costPaid      = st.colInt(3);
    p.transactionId = st.colInt(4);
    p.bundleId      = st.colText(5);
    p.createdAt     = st.colInt(6);
    return p;
}

void execOn(sqlite3 *db, const char *sql, const char *what)
{
    char *errMsg = nullptr;
    int rc = sqlite3_exec(db, sql, nullptr, nullptr, &errMsg);
    if (rc != SQLITE_OK) {
        std::string detail = errMsg ? errMsg : sqlite3_errstr(rc);
        if (errMsg) {
            sqlite3_free(errMsg);
        }
        throw StoreError(std::string("[LedgerStore] ") + what + ": " + detail, rc, isBusyCode(rc));
    }
}

bool isMemoryPath(const std::string &path)
{
    return path == ":memory:";
}

// A ":memory:" database lives inside its one connection.
constexpr size_t kMaxFileConnections = 16;
constexpr int kBusyTimeoutMs = 250;

/// Connection the calling thread holds on a store, if any.
struct ThreadConnection
{
    const LedgerStore *owner = nullptr;
    sqlite3 *db = nullptr;
    bool inUnit = false;
};

thread_local ThreadConnection t_connection;

} // namespace

// -----------------------------------------------------------------------------
// Connection lease. Reuses the connection this thread already holds on the
// store (so every statement of a unit of work runs on the unit's connection),
// otherwise checks one out of the pool until the lease ends.
// -----------------------------------------------------------------------------
class LedgerStore::Lease
{
public:
    explicit Lease(LedgerStore &store)
        : m_store(store), m_db(nullptr), m_owned(false)
    {
        if (t_connection.owner == &store) {
            m_db = t_connection.db;
            return;
        }
        m_db = store.acquireConnection();
        m_owned = true;
        m_previous = t_connection;
        t_connection.owner = &store;
        t_connection.db = m_db;
        t_connection.inUnit = false;
    }

    ~Lease()
    {
        if (m_owned) {
            t_connection = m_previous;
            m_store.releaseConnection(m_db);
        }
    }

    Lease(const Lease&) = delete;
    Lease& operator=(const Lease&) = delete;

    sqlite3 *get() const { return m_db; }

private:
    LedgerStore &m_store;
    sqlite3 *m_db;
    bool m_owned;
    ThreadConnection m_previous;
};

// -----------------------------------------------------------------------------
// Lifecycle
// -----------------------------------------------------------------------------
LedgerStore::LedgerStore(const std::string &dbPath, Clock clock)
    : m_dbPath(dbPath)
    , m_clock(std::move(clock))
    , m_open(false)
    , m_connectionCount(0)
    , m_maxConnections(isMemoryPath(dbPath) ? 1 : kMaxFileConnections)
{
}

LedgerStore::~LedgerStore()
{
    Close();
}

bool LedgerStore::Open()
{
    std::lock_guard<std::mutex> lock(m_poolMutex);
    if (m_open) {
        return true;
    }

    sqlite3 *db = nullptr;
    try {
        db = openConnection();
    }
    catch (const StoreError &ex) {
        util::logger::error(ex.what());
        return false;
    }

    if (!initDatabaseSchema(db)) {
        util::logger::error("[LedgerStore] Failed to initialize database schema.");
        sqlite3_close(db);
        return false;
    }

    m_idle.push_back(db);
    m_connectionCount = 1;
    m_open = true;
    util::logger::info("[LedgerStore] Opened ledger at " + m_dbPath);
    return true;
}

bool LedgerStore::IsOpen() const
{
    std::lock_guard<std::mutex> lock(m_poolMutex);
    return m_open;
}

void LedgerStore::Close()
{
    std::lock_guard<std::mutex> lock(m_poolMutex);
    for (sqlite3 *db : m_idle) {
        sqlite3_close(db);
    }
    m_connectionCount -= m_idle.size();
    m_idle.clear();
    m_open = false;
    m_poolCv.notify_all();
}

sqlite3 *LedgerStore::openConnection()
{
    sqlite3 *db = nullptr;
    int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;
    int rc = sqlite3_open_v2(m_dbPath.c_str(), &db, flags, nullptr);
    if (rc != SQLITE_OK || !db) {
        std::string detail = db ? sqlite3_errmsg(db) : sqlite3_errstr(rc);
        if (db) {
            sqlite3_close(db);
        }
        throw StoreError("[LedgerStore] Could not open database " + m_dbPath + ": " + detail, rc, isBusyCode(rc));
    }

    sqlite3_busy_timeout(db, kBusyTimeoutMs);
    try {
        if (!isMemoryPath(m_dbPath)) {
            execOn(db, "PRAGMA journal_mode=WAL;", "enable WAL");
        }
        execOn(db, "PRAGMA foreign_keys=ON;", "enable foreign keys");
    }
    catch (const StoreError &) {
        sqlite3_close(db);
        throw;
    }
    return db;
}

sqlite3 *LedgerStore::acquireConnection()
{
    std::unique_lock<std::mutex> lock(m_poolMutex);
    for (;;) {
        if (!m_open) {
            throw StoreError("[LedgerStore] database is not open", SQLITE_MISUSE, false);
        }
        if (!m_idle.empty()) {
            sqlite3 *db = m_idle.back();
            m_idle.pop_back();
            return db;
        }
        if (m_connectionCount < m_maxConnections) {
            break;
        }
        m_poolCv.wait(lock);
    }

    sqlite3 *db = openConnection();
    ++m_connectionCount;
    util::logger::debug("[LedgerStore] Opened connection " + std::to_string(m_connectionCount) + " to "
                        + m_dbPath);
    return db;
}

void LedgerStore::releaseConnection(sqlite3 *db)
{
    {
        std::lock_guard<std::mutex> lock(m_poolMutex);
        if (m_open) {
            m_idle.push_back(db);
        }
        else {
            sqlite3_close(db);
            --m_connectionCount;
        }
    }
    m_poolCv.notify_one();
}

bool LedgerStore::initDatabaseSchema(sqlite3 *db)
{
    static const char *ddl =
        "CREATE TABLE IF NOT EXISTS accounts ("
        " account_id TEXT PRIMARY KEY,"
        " accumulated_xp INTEGER NOT NULL DEFAULT 0,"
        " spendable_xp INTEGER NOT NULL DEFAULT 0,"
        " current_wpm INTEGER NOT NULL,"
        " max_wpm INTEGER NOT NULL,"
        " streak_days INTEGER NOT NULL DEFAULT 0,"
        " last_earn_day INTEGER NOT NULL DEFAULT -1,"
        " spending_frozen INTEGER NOT NULL DEFAULT 0,"
        " frozen_reason TEXT NOT NULL DEFAULT '',"
        " last_hash TEXT NOT NULL,"
        " version INTEGER NOT NULL DEFAULT 0,"
        " created_at INTEGER NOT NULL"
        ");"
        "CREATE TABLE IF NOT EXISTS transactions ("
        " id INTEGER PRIMARY KEY AUTOINCREMENT,"
        " account_id TEXT NOT NULL REFERENCES accounts(account_id),"
        " type TEXT NOT NULL CHECK (type IN ('EARN', 'SPEND')),"
        " amount INTEGER NOT NULL,"
        " source TEXT NOT NULL,"
        " description TEXT NOT NULL DEFAULT '',"
        " balance_after INTEGER NOT NULL,"
        " created_at INTEGER NOT NULL,"
        " quiz_attempt_id INTEGER,"
        " comment_id TEXT,"
        " feature_ref TEXT,"
        " request_key TEXT UNIQUE,"
        " prev_hash TEXT NOT NULL,"
        " entry_hash TEXT NOT NULL"
        ");"
        "CREATE INDEX IF NOT EXISTS idx_transactions_account_time ON transactions(account_id, created_at);"
        "CREATE TRIGGER IF NOT EXISTS transactions_no_update BEFORE UPDATE ON transactions"
        " BEGIN SELECT RAISE(ABORT, 'transactions are append-only'); END;"
        "CREATE TRIGGER IF NOT EXISTS transactions_no_delete BEFORE DELETE ON transactions"
        " BEGIN SELECT RAISE(ABORT, 'transactions are append-only'); END;"
        "CREATE TABLE IF NOT EXISTS quiz_attempts ("
        " id INTEGER PRIMARY KEY AUTOINCREMENT,"
        " account_id TEXT NOT NULL REFERENCES accounts(account_id),"
        " content_id TEXT NOT NULL,"
        " attempt_number INTEGER NOT NULL,"
        " score_pct INTEGER NOT NULL,"
        " wpm_used INTEGER NOT NULL,"
        " xp_awarded INTEGER NOT NULL,"
        " is_perfect INTEGER NOT NULL,"
        " passed INTEGER NOT NULL,"
        " request_key TEXT UNIQUE,"
        " created_at INTEGER NOT NULL,"
        " UNIQUE (account_id, content_id, attempt_number)"
        ");"
        "CREATE INDEX IF NOT EXISTS idx_quiz_attempts_account_content ON quiz_attempts(account_id, content_id);"
        "CREATE TABLE IF NOT EXISTS comment_credits ("
        " account_id TEXT NOT NULL,"
        " content_id TEXT NOT NULL,"
        " credits INTEGER NOT NULL DEFAULT 0,"
        " PRIMARY KEY (account_id, content_id)"
        ");"
        "CREATE TABLE IF NOT EXISTS comments ("
        " comment_id TEXT PRIMARY KEY,"
        " author_id TEXT NOT NULL,"
        " content_id TEXT NOT NULL,"
        " parent_id TEXT,"
        " is_free INTEGER NOT NULL,"
        " cost_paid INTEGER NOT NULL,"
        " transaction_id INTEGER,"
        " created_at INTEGER NOT NULL"
        ");"
        "CREATE TABLE IF NOT EXISTS interactions ("
        " id INTEGER PRIMARY KEY AUTOINCREMENT,"
        " actor_id TEXT NOT NULL,"
        " comment_id TEXT NOT NULL,"
        " author_id TEXT NOT NULL,"
        " tier TEXT NOT NULL,"
        " cost INTEGER NOT NULL,"
        " author_reward INTEGER NOT NULL,"
        " request_key TEXT UNIQUE,"
        " created_at INTEGER NOT NULL"
        ");"
        "CREATE TABLE IF NOT EXISTS feature_catalog ("
        " feature_id TEXT PRIMARY KEY,"
        " name TEXT NOT NULL,"
        " price INTEGER NOT NULL,"
        " category TEXT NOT NULL,"
        " prerequisites TEXT NOT NULL DEFAULT '',"
        " bundle_id TEXT NOT NULL DEFAULT ''"
        ");"
        "CREATE TABLE IF NOT EXISTS feature_bundles ("
        " bundle_id TEXT PRIMARY KEY,"
        " name TEXT NOT NULL,"
        " price INTEGER NOT NULL"
        ");"
        "CREATE TABLE IF NOT EXISTS bundle_members ("
        " bundle_id TEXT NOT NULL,"
        " feature_id TEXT NOT NULL,"
        " position INTEGER NOT NULL,"
        " PRIMARY KEY (bundle_id, feature_id)"
        ");"
        "CREATE TABLE IF NOT EXISTS feature_purchases ("
        " id INTEGER PRIMARY KEY AUTOINCREMENT,"
        " account_id TEXT NOT NULL REFERENCES accounts(account_id),"
        " feature_id TEXT NOT NULL,"
        " cost_paid INTEGER NOT NULL,"
        " transaction_id INTEGER NOT NULL,"
        " bundle_id TEXT,"
        " created_at INTEGER NOT NULL,"
        " UNIQUE (account_id, feature_id)"
        ");"
        "CREATE TRIGGER IF NOT EXISTS feature_purchases_no_update BEFORE UPDATE ON feature_purchases"
        " BEGIN SELECT RAISE(ABORT, 'purchases are permanent'); END;"
        "CREATE TRIGGER IF NOT EXISTS feature_purchases_no_delete BEFORE DELETE ON feature_purchases"
        " BEGIN SELECT RAISE(ABORT, 'purchases are permanent'); END;"
        "CREATE TABLE IF NOT EXISTS review_flags ("
        " id INTEGER PRIMARY KEY AUTOINCREMENT,"
        " account_id TEXT NOT NULL,"
        " kind TEXT NOT NULL,"
        " detail TEXT NOT NULL,"
        " violation INTEGER NOT NULL,"
        " created_at INTEGER NOT NULL"
        ");"
        "CREATE TABLE IF NOT EXISTS audit_archive ("
        " id INTEGER PRIMARY KEY AUTOINCREMENT,"
        " account_id TEXT NOT NULL,"
        " reason TEXT NOT NULL,"
        " raw_size INTEGER NOT NULL,"
        " payload BLOB NOT NULL,"
        " created_at INTEGER NOT NULL"
        ");";


    char *errMsg = nullptr;
    int rc = sqlite3_exec(db, ddl, nullptr, nullptr, &errMsg);
    if (rc != SQLITE_OK) {
        if (errMsg) {
            util::logger::error("[LedgerStore] initDatabaseSchema error: " + std::string(errMsg));
            sqlite3_free(errMsg);
        }
        return false;
    }
    return true;
}

// -----------------------------------------------------------------------------
// Units of work
// -----------------------------------------------------------------------------
bool LedgerStore::RunInTransaction(const std::function<bool()> &body)
{
    Lease db(*this);
    if (t_connection.inUnit) {
        throw StoreError("[LedgerStore] nested unit of work is not supported", SQLITE_MISUSE, false);
    }

    // DEFERRED: the write lock is taken by the unit's first write, not while
    // it is still reading.
    execOn(db.get(), "BEGIN DEFERRED;", "begin transaction");
    t_connection.inUnit = true;

    auto rollback = [&db]() {
        t_connection.inUnit = false;
        if (sqlite3_exec(db.get(), "ROLLBACK;", nullptr, nullptr, nullptr) != SQLITE_OK) {
            util::logger::error(std::string("[LedgerStore] Rollback failed: ") + sqlite3_errmsg(db.get()));
        }
    };

    bool commit = false;
    try {
        commit = body();
    }
    catch (...) {
        rollback();
        throw;
    }

    if (!commit) {
        rollback();
        return false;
    }

    int rc = sqlite3_exec(db.get(), "COMMIT;", nullptr, nullptr, nullptr);
    if (rc != SQLITE_OK) {
        std::string detail = sqlite3_errmsg(db.get());
        rollback();
        throw StoreError("[LedgerStore] commit failed: " + detail, rc, isBusyCode(rc));
    }
    t_connection.inUnit = false;
    return true;
}

// -----------------------------------------------------------------------------
// Accounts
// -----------------------------------------------------------------------------
bool LedgerStore::InsertAccount(const core::Account &account)
{
    Lease db(*this);
    Statement st(db.get(),
        "INSERT INTO accounts (account_id, accumulated_xp, spendable_xp, current_wpm, max_wpm,"
        " streak_days, last_earn_day, spending_frozen, frozen_reason, last_hash, version, created_at)"
        " VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?);");
    st.bindText(1, account.accountId);
    st.bindInt(2, account.accumulatedXp);
    st.bindInt(3, account.spendableXp);
    st.bindInt(4, account.currentWpm);
    st.bindInt(5, account.maxWpm);
    st.bindInt(6, account.streakDays);
    st.bindInt(7, account.lastEarnDay);
    st.bindInt(8, account.spendingFrozen ? 1 : 0);
    st.bindText(9, account.frozenReason);
    st.bindText(10, account.lastHash.empty() ? util::hashing::genesisHash() : account.lastHash);
    st.bindInt(11, account.version);
    st.bindInt(12, account.createdAt);
    return st.stepInsert();
}

std::optional<core::Account> LedgerStore::LoadAccount(const std::string &accountId)
{
    Lease db(*this);
    Statement st(db.get(), std::string("SELECT ") + kAccountColumns + " FROM accounts WHERE account_id = ?;");
    st.bindText(1, accountId);
    if (!st.step()) {
        return std::nullopt;
    }
    return readAccount(st);
}

bool LedgerStore::UpdateAccount(const core::Account &account, int64_t expectedVersion)
{
    Lease db(*this);
    Statement st(db.get(),
        "UPDATE accounts SET accumulated_xp = ?, spendable_xp = ?, current_wpm = ?, max_wpm = ?,"
        " streak_days = ?, last_earn_day = ?, last_hash = ?, version = version + 1"
        " WHERE account_id = ? AND version = ?;");
    st.bindInt(1, account.accumulatedXp);
    st.bindInt(2, account.spendableXp);
    st.bindInt(3, account.currentWpm);
    st.bindInt(4, account.maxWpm);
    st.bindInt(5, account.streakDays);
    st.bindInt(6, account.lastEarnDay);
    st.bindText(7, account.lastHash);
    st.bindText(8, account.accountId);
    st.bindInt(9, expectedVersion);
    st.step();
    return sqlite3_changes(db.get()) == 1;
}

bool LedgerStore::SetSpendingFrozen(const std::string &accountId, bool frozen, const std::string &reason)
{
    Lease db(*this);
    Statement st(db.get(),
        "UPDATE accounts SET spending_frozen = ?, frozen_reason = ?, version = version + 1"
        " WHERE account_id = ?;");
    st.bindInt(1, frozen ? 1 : 0);
    st.bindText(2, frozen ? reason : std::string());
    st.bindText(3, accountId);
    st.step();
    return sqlite3_changes(db.get()) == 1;
}

std::vector<std::string> LedgerStore::ListAccountIds()
{
    Lease db(*this);
    Statement st(db.get(), "SELECT account_id FROM accounts ORDER BY account_id;");
    std::vector<std::string> ids;
    while (st.step()) {
        ids.push_back(st.colText(0));
    }
    return ids;
}

// -----------------------------------------------------------------------------
// Transactions
// -----------------------------------------------------------------------------
int64_t LedgerStore::InsertTransaction(const core::Transaction &tx)
{
    Lease db(*this);
    Statement st(db.get(),
        "INSERT INTO transactions (account_id, type, amount, source, description, balance_after,"
        " created_at, quiz_attempt_id, comment_id, feature_ref, request_key, prev_hash, entry_hash)"
        " VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?);");
    st.bindText(1, tx.accountId);
    st.bindText(2, core::transactionTypeName(tx.type));
    st.bindInt(3, tx.amount);
    st.bindText(4, tx.source);
    st.bindText(5, tx.description);
    st.bindInt(6, tx.balanceAfter);
    st.bindInt(7, tx.createdAt);
    st.bindOptionalInt(8, tx.refs.quizAttemptId);
    st.bindTextOrNull(9, tx.refs.commentId);
    st.bindTextOrNull(10, tx.refs.featureRef);
    st.bindTextOrNull(11, tx.requestKey);
    st.bindText(12, tx.prevHash);
    st.bindText(13, tx.entryHash);
    if (!st.stepInsert()) {
        throw StoreError("[LedgerStore] duplicate transaction request key '" + tx.requestKey + "'",
                         SQLITE_CONSTRAINT, false);
    }
    return sqlite3_last_insert_rowid(db.get());
}

std::optional<core::Transaction> LedgerStore::LoadTransaction(int64_t id)
{
    Lease db(*this);
    Statement st(db.get(), std::string("SELECT ") + kTransactionColumns + " FROM transactions WHERE id = ?;");
    st.bindInt(1, id);
    if (!st.step()) {
        return std::nullopt;
    }
    return readTransaction(st);
}

std::optional<core::Transaction> LedgerStore::FindTransactionByRequestKey(const std::string &requestKey)
{
    if (requestKey.empty()) {
        return std::nullopt;
    }
    Lease db(*this);
    Statement st(db.get(), std::string("SELECT ") + kTransactionColumns
                       + " FROM transactions WHERE request_key = ?;");
    st.bindText(1, requestKey);
    if (!st.step()) {
        return std::nullopt;
    }
    return readTransaction(st);
}

std::vector<core::Transaction> LedgerStore::LoadTransactions(const std::string &accountId,
                                                             std::optional<core::TransactionType> type,
                                                             size_t limit,
                                                             bool newestFirst)
{
    Lease db(*this);
    std::string sql = std::string("SELECT ") + kTransactionColumns + " FROM transactions WHERE account_id = ?";
    if (type) {
        sql += " AND type = ?";
    }
    sql += newestFirst ? " ORDER BY id DESC" : " ORDER BY id ASC";
    if (limit > 0) {
        sql += " LIMIT ?";
    }
    sql += ";";

    Statement st(db.get(), sql);
    int idx = 1;
    st.bindText(idx++, accountId);
    if (type) {
        st.bindText(idx++, core::transactionTypeName(*type));
    }
    if (limit > 0) {
        st.bindInt(idx++, static_cast<int64_t>(limit));
    }

    std::vector<core::Transaction> out;
    while (st.step()) {
        out.push_back(readTransaction(st));
    }
    return out;
}

std::vector<core::Transaction> LedgerStore::LoadTransactionsSince(const std::string &accountId, int64_t sinceMillis)
{
    Lease db(*this);
    Statement st(db.get(), std::string("SELECT ") + kTransactionColumns
                       + " FROM transactions WHERE account_id = ? AND created_at >= ? ORDER BY created_at, id;");
    st.bindText(1, accountId);
    st.bindInt(2, sinceMillis);
    std::vector<core::Transaction> out;
    while (st.step()) {
        out.push_back(readTransaction(st));
    }
    return out;
}

TransactionTotals LedgerStore::SumTransactions(const std::string &accountId)
{
    Lease db(*this);
    Statement st(db.get(),
        "SELECT COALESCE(SUM(amount), 0),"
        " COALESCE(SUM(CASE WHEN type = 'EARN' THEN amount ELSE 0 END), 0),"
        " COALESCE(SUM(CASE WHEN type = 'SPEND' THEN -amount ELSE 0 END), 0),"
        " COUNT(*)"
        " FROM transactions WHERE account_id = ?;");
    st.bindText(1, accountId);
    TransactionTotals totals;
    if (st.step()) {
        totals.sumAmount = st.colInt(0);
        totals.sumEarned = st.colInt(1);
        totals.sumSpent  = st.colInt(2);
        totals.count     = st.colInt(3);
    }
    return totals;
}

int64_t LedgerStore::SumAmountBySources(const std::string &accountId, const std::vector<std::string> &sources)
{
    if (sources.empty()) {
        return 0;
    }
    Lease db(*this);
    std::string sql = "SELECT COALESCE(SUM(ABS(amount)), 0) FROM transactions WHERE account_id = ? AND source IN (";
    for (size_t i = 0; i < sources.size(); ++i) {
        sql += (i == 0) ? "?" : ", ?";
    }
    sql += ");";

    Statement st(db.get(), sql);
    st.bindText(1, accountId);
    for (size_t i = 0; i < sources.size(); ++i) {
        st.bindText(static_cast<int>(i) + 2, sources[i]);
    }
    return st.step() ? st.colInt(0) : 0;
}

TransactionTotals LedgerStore::SumAllTransactionsSince(int64_t sinceMillis)
{
    Lease db(*this);
    Statement st(db.get(),
        "SELECT COALESCE(SUM(amount), 0),"
        " COALESCE(SUM(CASE WHEN type = 'EARN' THEN amount ELSE 0 END), 0),"
        " COALESCE(SUM(CASE WHEN type = 'SPEND' THEN -amount ELSE 0 END), 0),"
        " COUNT(*)"
        " FROM transactions WHERE created_at >= ?;");
    st.bindInt(1, sinceMillis);
    TransactionTotals totals;
    if (st.step()) {
        totals.sumAmount = st.colInt(0);
        totals.sumEarned = st.colInt(1);
        totals.sumSpent  = st.colInt(2);
        totals.count     = st.colInt(3);
    }
    return totals;
}

int64_t LedgerStore::CountActiveAccountsSince(int64_t sinceMillis)
{
    Lease db(*this);
    Statement st(db.get(), "SELECT COUNT(DISTINCT account_id) FROM transactions WHERE created_at >= ?;");
    st.bindInt(1, sinceMillis);
    return st.step() ? st.colInt(0) : 0;
}

// -----------------------------------------------------------------------------
// Quiz attempts
// -----------------------------------------------------------------------------
int64_t LedgerStore::CountAttempts(const std::string &accountId, const std::string &contentId)
{
    Lease db(*this);
    Statement st(db.get(), "SELECT COUNT(*) FROM quiz_attempts WHERE account_id = ? AND content_id = ?;");
    st.bindText(1, accountId);
    st.bindText(2, contentId);
    return st.step() ? st.colInt(0) : 0;
}

bool LedgerStore::HasPassedAttempt(const std::string &accountId, const std::string &contentId)
{
    Lease db(*this);
    Statement st(db.get(),
        "SELECT 1 FROM quiz_attempts WHERE account_id = ? AND content_id = ? AND passed = 1 LIMIT 1;");
    st.bindText(1, accountId);
    st.bindText(2, contentId);
    return st.step();
}

int64_t LedgerStore::InsertQuizAttempt(const core::QuizAttempt &attempt)
{
    Lease db(*this);
    Statement st(db.get(),
        "INSERT INTO quiz_attempts (account_id, content_id, attempt_number, score_pct, wpm_used,"
        " xp_awarded, is_perfect, passed, request_key, created_at)"
        " VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?);");
    st.bindText(1, attempt.accountId);
    st.bindText(2, attempt.contentId);
    st.bindInt(3, attempt.attemptNumber);
    st.bindInt(4, attempt.scorePct);
    st.bindInt(5, attempt.wpmUsed);
    st.bindInt(6, attempt.xpAwarded);
    st.bindInt(7, attempt.isPerfect ? 1 : 0);
    st.bindInt(8, attempt.passed ? 1 : 0);
    st.bindTextOrNull(9, attempt.requestKey);
    st.bindInt(10, attempt.createdAt);
    if (!st.stepInsert()) {
        throw StoreError("[LedgerStore] quiz attempt conflicts with an existing row", SQLITE_CONSTRAINT, false);
    }
    return sqlite3_last_insert_rowid(db.get());
}

std::optional<core::QuizAttempt> LedgerStore::FindQuizAttemptByRequestKey(const std::string &requestKey)
{
    if (requestKey.empty()) {
        return std::nullopt;
    }
    Lease db(*this);
    Statement st(db.get(), std::string("SELECT ") + kQuizColumns + " FROM quiz_attempts WHERE request_key = ?;");
    st.bindText(1, requestKey);
    if (!st.step()) {
        return std::nullopt;
    }
    return readQuizAttempt(st);
}

std::vector<core::QuizAttempt> LedgerStore::LoadQuizAttempts(const std::string &accountId,
                                                             const std::string &contentId)
{
    Lease db(*this);
    Statement st(db.get(), std::string("SELECT ") + kQuizColumns
                       + " FROM quiz_attempts WHERE account_id = ? AND content_id = ? ORDER BY attempt_number;");
    st.bindText(1, accountId);
    st.bindText(2, contentId);
    std::vector<core::QuizAttempt> out;
    while (st.step()) {
        out.push_back(readQuizAttempt(st));
    }
    return out;
}

std::optional<int64_t> LedgerStore::LastPassedWpm(const std::string &accountId)
{
    Lease db(*this);
    Statement st(db.get(),
        "SELECT wpm_used FROM quiz_attempts WHERE account_id = ? AND passed = 1 ORDER BY id DESC LIMIT 1;");
    st.bindText(1, accountId);
    if (!st.step()) {
        return std::nullopt;
    }
    return st.colInt(0);
}

// -----------------------------------------------------------------------------
// Comments
// -----------------------------------------------------------------------------
int64_t LedgerStore::GetCommentCredits(const std::string &accountId, const std::string &contentId)
{
    Lease db(*this);
    Statement st(db.get(), "SELECT credits FROM comment_credits WHERE account_id = ? AND content_id = ?;");
    st.bindText(1, accountId);
    st.bindText(2, contentId);
    return st.step() ? st.colInt(0) : 0;
}

void LedgerStore::AddCommentCredit(const std::string &accountId, const std::string &contentId)
{
    Lease db(*this);
    Statement st(db.get(),
        "INSERT INTO comment_credits (account_id, content_id, credits) VALUES (?, ?, 1)"
        " ON CONFLICT(account_id, content_id) DO UPDATE SET credits = credits + 1;");
    st.bindText(1, accountId);
    st.bindText(2, contentId);
    st.step();
}

bool LedgerStore::ConsumeCommentCredit(const std::string &accountId, const std::string &contentId)
{
    Lease db(*this);
    Statement st(db.get(),
        "UPDATE comment_credits SET credits = credits - 1"
        " WHERE account_id = ? AND content_id = ? AND credits > 0;");
    st.bindText(1, accountId);
    st.bindText(2, contentId);
    st.step();
    return sqlite3_changes(db.get()) == 1;
}

bool LedgerStore::InsertComment(const core::CommentRecord &comment)
{
    Lease db(*this);
    Statement st(db.get(), std::string("INSERT INTO comments (") + kCommentColumns
                       + ") VALUES (?, ?, ?, ?, ?, ?, ?, ?);");
    st.bindText(1, comment.commentId);
    st.bindText(2, comment.authorId);
    st.bindText(3, comment.contentId);
    st.bindTextOrNull(4, comment.parentId);
    st.bindInt(5, comment.isFree ? 1 : 0);
    st.bindInt(6, comment.costPaid);
    st.bindOptionalInt(7, comment.transactionId);
    st.bindInt(8, comment.createdAt);
    return st.stepInsert();
}

std::optional<core::CommentRecord> LedgerStore::LoadComment(const std::string &commentId)
{
    Lease db(*this);
    Statement st(db.get(), std::string("SELECT ") + kCommentColumns + " FROM comments WHERE comment_id = ?;");
    st.bindText(1, commentId);
    if (!st.step()) {
        return std::nullopt;
    }
    return readComment(st);
}

int64_t LedgerStore::CountCommentsByAuthor(const std::string &accountId)
{
    Lease db(*this);
    Statement st(db.get(), "SELECT COUNT(*) FROM comments WHERE author_id = ?;");
    st.bindText(1, accountId);
    return st.step() ? st.colInt(0) : 0;
}

// -----------------------------------------------------------------------------
// Interactions
// -----------------------------------------------------------------------------
int64_t LedgerStore::InsertInteraction(const core::InteractionRecord &interaction)
{
    Lease db(*this);
    Statement st(db.get(),
        "INSERT INTO interactions (actor_id, comment_id, author_id, tier, cost, author_reward,"
        " request_key, created_at) VALUES (?, ?, ?, ?, ?, ?, ?, ?);");
    st.bindText(1, interaction.actorId);
    st.bindText(2, interaction.commentId);
    st.bindText(3, interaction.authorId);
    st.bindText(4, core::interactionTierName(interaction.tier));
    st.bindInt(5, interaction.cost);
    st.bindInt(6, interaction.authorReward);
    st.bindTextOrNull(7, interaction.requestKey);
    st.bindInt(8, interaction.createdAt);
    if (!st.stepInsert()) {
        throw StoreError("[LedgerStore] duplicate interaction request key '" + interaction.requestKey + "'",
                         SQLITE_CONSTRAINT, false);
    }
    return sqlite3_last_insert_rowid(db.get());
}

std::optional<core::InteractionRecord> LedgerStore::FindInteractionByRequestKey(const std::string &requestKey)
{
    if (requestKey.empty()) {
        return std::nullopt;
    }
    Lease db(*this);
    Statement st(db.get(), std::string("SELECT ") + kInteractionColumns
                       + " FROM interactions WHERE request_key = ?;");
    st.bindText(1, requestKey);
    if (!st.step()) {
        return std::nullopt;
    }
    return readInteraction(st);
}

int64_t LedgerStore::CountPositiveInteractionsGiven(const std::string &accountId)
{
    Lease db(*this);
    Statement st(db.get(),
        "SELECT COUNT(*) FROM interactions WHERE actor_id = ? AND tier IN ('bronze', 'silver', 'gold');");
    st.bindText(1, accountId);
    return st.step() ? st.colInt(0) : 0;
}

int64_t LedgerStore::CountPositiveInteractionsReceived(const std::string &accountId)
{
    Lease db(*this);
    Statement st(db.get(),
        "SELECT COUNT(*) FROM interactions WHERE author_id = ? AND tier IN ('bronze', 'silver', 'gold');");
    st.bindText(1, accountId);
    return st.step() ? st.colInt(0) : 0;
}

// -----------------------------------------------------------------------------
// Feature catalog and ownership
// -----------------------------------------------------------------------------
void LedgerStore::UpsertCatalogEntry(const core::FeatureCatalogEntry &entry)
{
    Lease db(*this);
    Statement st(db.get(), std::string("INSERT OR REPLACE INTO feature_catalog (") + kCatalogColumns
                       + ") VALUES (?, ?, ?, ?, ?, ?);");
    st.bindText(1, entry.featureId);
    st.bindText(2, entry.name);
    st.bindInt(3, entry.price);
    st.bindText(4, entry.category);
    st.bindText(5, joinCsv(entry.prerequisites));
    st.bindText(6, entry.bundleId);
    st.step();
}

std::optional<core::FeatureCatalogEntry> LedgerStore::LoadCatalogEntry(const std::string &featureId)
{
    Lease db(*this);
    Statement st(db.get(), std::string("SELECT ") + kCatalogColumns + " FROM feature_catalog WHERE feature_id = ?;");
    st.bindText(1, featureId);
    if (!st.step()) {
        return std::nullopt;
    }
    return readCatalogEntry(st);
}

std::vector<core::FeatureCatalogEntry> LedgerStore::LoadCatalog()
{
    Lease db(*this);
    Statement st(db.get(), std::string("SELECT ") + kCatalogColumns
                       + " FROM feature_catalog ORDER BY category, price, feature_id;");
    std::vector<core::FeatureCatalogEntry> out;
    while (st.step()) {
        out.push_back(readCatalogEntry(st));
    }
    return out;
}

void LedgerStore::UpsertBundle(const core::FeatureBundle &bundle)
{
    Lease db(*this);
    {
        Statement st(db.get(), "INSERT OR REPLACE INTO feature_bundles (bundle_id, name, price) VALUES (?, ?, ?);");
        st.bindText(1, bundle.bundleId);
        st.bindText(2, bundle.name);
        st.bindInt(3, bundle.price);
        st.step();
    }
    {
        Statement st(db.get(), "DELETE FROM bundle_members WHERE bundle_id = ?;");
        st.bindText(1, bundle.bundleId);
        st.step();
    }
    for (size_t i = 0; i < bundle.members.size(); ++i) {
        Statement member(db.get(), "INSERT INTO bundle_members (bundle_id, feature_id, position) VALUES (?, ?, ?);");
        member.bindText(1, bundle.bundleId);
        member.bindText(2, bundle.members[i]);
        member.bindInt(3, static_cast<int64_t>(i));
        member.step();

        Statement tag(db.get(), "UPDATE feature_catalog SET bundle_id = ? WHERE feature_id = ?;");
        tag.bindText(1, bundle.bundleId);
        tag.bindText(2, bundle.members[i]);
        tag.step();
    }
}

std::optional<core::FeatureBundle> LedgerStore::LoadBundle(const std::string &bundleId)
{
    Lease db(*this);
    core::FeatureBundle bundle;
    {
        Statement st(db.get(), "SELECT bundle_id, name, price FROM feature_bundles WHERE bundle_id = ?;");
        st.bindText(1, bundleId);
        if (!st.step()) {
            return std::nullopt;
        }
        bundle.bundleId = st.colText(0);
        bundle.name     = st.colText(1);
        bundle.price    = st.colInt(2);
    }
    Statement members(db.get(), "SELECT feature_id FROM bundle_members WHERE bundle_id = ? ORDER BY position;");
    members.bindText(1, bundleId);
    while (members.step()) {
        bundle.members.push_back(members.colText(0));
    }
    return bundle;
}

std::vector<core::FeatureBundle> LedgerStore::LoadBundles()
{
    Lease db(*this);
    std::vector<std::string> ids;
    {
        Statement st(db.get(), "SELECT bundle_id FROM feature_bundles ORDER BY bundle_id;");
        while (st.step()) {
            ids.push_back(st.colText(0));
        }
    }
    std::vector<core::FeatureBundle> out;
    for (const auto &id : ids) {
        auto bundle = LoadBundle(id);
        if (bundle) {
            out.push_back(*bundle);
        }
    }
    return out;
}

bool LedgerStore::InsertPurchase(const core::FeaturePurchase &purchase)
{
    Lease db(*this);
    Statement st(db.get(),
        "INSERT INTO feature_purchases (account_id, feature_id, cost_paid, transaction_id, bundle_id, created_at)"
        " VALUES (?, ?, ?, ?, ?, ?);");
    st.bindText(1, purchase.accountId);
    st.bindText(2, purchase.featureId);
    st.bindInt(3, purchase.costPaid);
    st.bindInt(4, purchase.transactionId);
    st.bindTextOrNull(5, purchase.bundleId);
    st.bindInt(6, purchase.createdAt);
    return st.stepInsert();
}

bool LedgerStore::OwnsFeature(const std::string &accountId, const std::string &featureId)
{
    Lease db(*this);
    Statement st(db.get(), "SELECT 1 FROM feature_purchases WHERE account_id = ? AND feature_id = ?;");
    st.bindText(1, accountId);
    st.bindText(2, featureId);
    return st.step();
}

std::vector<std::string> LedgerStore::OwnedFeatures(const std::string &accountId)
{
    Lease db(*this);
    Statement st(db.get(), "SELECT feature_id FROM feature_purchases WHERE account_id = ? ORDER BY id;");
    st.bindText(1, accountId);
    std::vector<std::string> out;
    while (st.step()) {
        out.push_back(st.colText(0));
    }
    return out;
}

std::vector<core::FeaturePurchase> LedgerStore::LoadPurchases(const std::string &accountId)
{
    Lease db(*this);
    Statement st(db.get(), std::string("SELECT ") + kPurchaseColumns
                       + " FROM feature_purchases WHERE account_id = ? ORDER BY id;");
    st.bindText(1, accountId);
    std::vector<core::FeaturePurchase> out;
    while (st.step()) {
        out.push_back(readPurchase(st));
    }
    return out;
}

int64_t LedgerStore::CountPurchasesSince(int64_t sinceMillis)
{
    Lease db(*this);
    Statement st(db.get(), "SELECT COUNT(*) FROM feature_purchases WHERE created_at >= ?;");
    st.bindInt(1, sinceMillis);
    return st.step() ? st.colInt(0) : 0;
}

// -----------------------------------------------------------------------------
// Monitoring
// -----------------------------------------------------------------------------
int64_t LedgerStore::InsertReviewFlag(const core::ReviewFlag &flag)
{
    Lease db(*this);
    Statement st(db.get(),
        "INSERT INTO review_flags (account_id, kind, detail, violation, created_at) VALUES (?, ?, ?, ?, ?);");
    st.bindText(1, flag.accountId);
    st.bindText(2, flag.kind);
    st.bindText(3, flag.detail);
    st.bindInt(4, flag.violation ? 1 : 0);
    st.bindInt(5, flag.createdAt);
    st.step();
    return sqlite3_last_insert_rowid(db.get());
}

std::vector<core::ReviewFlag> LedgerStore::LoadReviewFlags(const std::string &accountId)
{
    Lease db(*this);
    Statement st(db.get(),
        "SELECT id, account_id, kind, detail, violation, created_at FROM review_flags"
        " WHERE account_id = ? ORDER BY id;");
    st.bindText(1, accountId);
    std::vector<core::ReviewFlag> out;
    while (st.step()) {
        core::ReviewFlag f;
        f.id        = st.colInt(0);
        f.accountId = st.colText(1);
        f.kind      = st.colText(2);
        f.detail    = st.colText(3);
        f.violation = st.colInt(4) != 0;
        f.createdAt = st.colInt(5);
        out.push_back(f);
    }
    return out;
}

int64_t LedgerStore::ArchiveSnapshot(const std::string &accountId, const std::string &reason,
                                     const std::string &payload)
{
    uLongf compressedSize = compressBound(static_cast<uLong>(payload.size()));
    std::vector<Bytef> compressed(compressedSize);
    int zrc = compress2(compressed.data(), &compressedSize,
                        reinterpret_cast<const Bytef*>(payload.data()),
                        static_cast<uLong>(payload.size()), Z_BEST_COMPRESSION);
    if (zrc != Z_OK) {
        throw StoreError("[LedgerStore] zlib compress2 failed with code " + std::to_string(zrc), 0, false);
    }

    Lease db(*this);
    Statement st(db.get(),
        "INSERT INTO audit_archive (account_id, reason, raw_size, payload, created_at) VALUES (?, ?, ?, ?, ?);");
    st.bindText(1, accountId);
    st.bindText(2, reason);
    st.bindInt(3, static_cast<int64_t>(payload.size()));
    st.bindBlob(4, compressed.data(), compressedSize);
    st.bindInt(5, NowMillis());
    st.step();
    return sqlite3_last_insert_rowid(db.get());
}

std::optional<std::string> LedgerStore::LoadArchive(int64_t archiveId)
{
    Lease db(*this);
    Statement st(db.get(), "SELECT raw_size, payload FROM audit_archive WHERE id = ?;");
    st.bindInt(1, archiveId);
    if (!st.step()) {
        return std::nullopt;
    }

    uLongf rawSize = static_cast<uLongf>(st.colInt(0));
    std::string blob = st.colBlob(1);
    std::string raw(rawSize, '\0');
    if (rawSize == 0) {
        return raw;
    }
    int zrc = uncompress(reinterpret_cast<Bytef*>(&raw[0]), &rawSize,
                         reinterpret_cast<const Bytef*>(blob.data()), static_cast<uLong>(blob.size()));
    if (zrc != Z_OK) {
        throw StoreError("[LedgerStore] zlib uncompress failed with code " + std::to_string(zrc), 0, false);
    }
    raw.resize(rawSize);
    return raw;
}

int64_t LedgerStore::CountArchives(const std::string &accountId)
{
    Lease db(*this);
    Statement st(db.get(), "SELECT COUNT(*) FROM audit_archive WHERE account_id = ?;");
    st.bindText(1, accountId);
    return st.step() ? st.colInt(0) : 0;
}

} // namespace storage
} // namespace xpeconomy
