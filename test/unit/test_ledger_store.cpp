// test/unit/test_ledger_store.cpp
// -----------------------------------------------------------
// SQLite ledger: schema guards, account CAS, purchases, credits and archives.

#include <gtest/gtest.h>
#include <sqlite3.h>
#include <stdexcept>
#include <string>

#include "economy_fixture.hpp"
#include "storage/ledger_store.hpp"
#include "util/hashing.hpp"

namespace xpeconomy {
namespace test {
namespace {

using core::Account;
using core::StoreError;

Account makeAccount(const std::string& id) {
    Account a;
    a.accountId = id;
    a.currentWpm = 200;
    a.maxWpm = 225;
    a.createdAt = kStartMillis;
    return a;
}

class LedgerStoreTest : public EconomyTest {};

TEST_F(LedgerStoreTest, NewAccountStartsAtGenesis) {
    ASSERT_TRUE(store->InsertAccount(makeAccount("alice")));
    EXPECT_FALSE(store->InsertAccount(makeAccount("alice")));

    auto loaded = store->LoadAccount("alice");
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded->accumulatedXp, 0);
    EXPECT_EQ(loaded->spendableXp, 0);
    EXPECT_EQ(loaded->version, 0);
    EXPECT_EQ(loaded->lastEarnDay, -1);
    EXPECT_FALSE(loaded->spendingFrozen);
    EXPECT_EQ(loaded->lastHash, util::hashing::genesisHash());

    EXPECT_FALSE(store->LoadAccount("nobody").has_value());
}

TEST_F(LedgerStoreTest, UpdateAccountIsCompareAndSwap) {
    ASSERT_TRUE(store->InsertAccount(makeAccount("alice")));
    Account a = *store->LoadAccount("alice");
    a.spendableXp = 40;
    a.accumulatedXp = 40;

    ASSERT_TRUE(store->UpdateAccount(a, 0));
    EXPECT_EQ(store->LoadAccount("alice")->version, 1);

    // A writer still holding version 0 loses.
    a.spendableXp = 999;
    EXPECT_FALSE(store->UpdateAccount(a, 0));
    EXPECT_EQ(store->LoadAccount("alice")->spendableXp, 40);
}

TEST_F(LedgerStoreTest, FreezeBumpsVersion) {
    ASSERT_TRUE(store->InsertAccount(makeAccount("alice")));
    ASSERT_TRUE(store->SetSpendingFrozen("alice", true, "manual review"));

    auto frozen = store->LoadAccount("alice");
    EXPECT_TRUE(frozen->spendingFrozen);
    EXPECT_EQ(frozen->frozenReason, "manual review");
    EXPECT_EQ(frozen->version, 1);

    ASSERT_TRUE(store->SetSpendingFrozen("alice", false, "ignored"));
    auto thawed = store->LoadAccount("alice");
    EXPECT_FALSE(thawed->spendingFrozen);
    EXPECT_TRUE(thawed->frozenReason.empty());
    EXPECT_FALSE(store->SetSpendingFrozen("nobody", true, "x"));
}

TEST_F(LedgerStoreTest, RollbackDiscardsTheUnit) {
    bool committed = store->RunInTransaction([&]() {
        store->InsertAccount(makeAccount("alice"));
        return false;
    });
    EXPECT_FALSE(committed);
    EXPECT_FALSE(store->LoadAccount("alice").has_value());

    EXPECT_THROW(store->RunInTransaction([&]() -> bool {
        store->InsertAccount(makeAccount("bob"));
        throw std::runtime_error("step failed");
    }), std::runtime_error);
    EXPECT_FALSE(store->LoadAccount("bob").has_value());

    // The store is usable again afterwards.
    EXPECT_TRUE(store->RunInTransaction([&]() { return store->InsertAccount(makeAccount("carol")); }));
    EXPECT_TRUE(store->LoadAccount("carol").has_value());
}

TEST_F(LedgerStoreTest, NestedUnitIsRejected) {
    EXPECT_THROW(store->RunInTransaction([&]() {
        return store->RunInTransaction([]() { return true; });
    }), StoreError);
}

TEST_F(LedgerStoreTest, TransactionsAreAppendOnly) {
    useFileDatabase("test_ledger_append_only.sqlite");
    createFunded("alice", 100);

    EXPECT_NE(rawExec("UPDATE transactions SET amount = 5000;"), SQLITE_OK);
    EXPECT_NE(rawExec("DELETE FROM transactions;"), SQLITE_OK);

    auto history = store->LoadTransactions("alice");
    ASSERT_EQ(history.size(), (size_t)1);
    EXPECT_EQ(history[0].amount, 100);
}

TEST_F(LedgerStoreTest, PurchasesArePermanentAndUnique) {
    useFileDatabase("test_ledger_purchases.sqlite");
    createFunded("alice", 100);
    auto spent = tm->Spend("alice", 25, core::sources::FeaturePurchase, "OpenSans");
    ASSERT_TRUE(spent.ok());

    core::FeaturePurchase p;
    p.accountId = "alice";
    p.featureId = "font_opensans";
    p.costPaid = 25;
    p.transactionId = spent.value().id;
    p.createdAt = nowMs;
    EXPECT_TRUE(store->InsertPurchase(p));
    EXPECT_FALSE(store->InsertPurchase(p));
    EXPECT_TRUE(store->OwnsFeature("alice", "font_opensans"));

    EXPECT_NE(rawExec("DELETE FROM feature_purchases;"), SQLITE_OK);
    EXPECT_NE(rawExec("UPDATE feature_purchases SET cost_paid = 0;"), SQLITE_OK);
    ASSERT_EQ(store->LoadPurchases("alice").size(), (size_t)1);
    EXPECT_EQ(store->LoadPurchases("alice")[0].costPaid, 25);
}

TEST_F(LedgerStoreTest, RequestKeysAreUnique) {
    createFunded("alice", 0);
    ASSERT_TRUE(tm->Earn("alice", 10, core::sources::AdminGrant, "first", {}, "req-1").ok());

    auto found = store->FindTransactionByRequestKey("req-1");
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(found->amount, 10);
    EXPECT_FALSE(store->FindTransactionByRequestKey("").has_value());
    EXPECT_FALSE(store->FindTransactionByRequestKey("req-2").has_value());
}

TEST_F(LedgerStoreTest, CommentCreditsCount) {
    EXPECT_EQ(store->GetCommentCredits("alice", "article-1"), 0);
    EXPECT_FALSE(store->ConsumeCommentCredit("alice", "article-1"));

    store->AddCommentCredit("alice", "article-1");
    store->AddCommentCredit("alice", "article-1");
    EXPECT_EQ(store->GetCommentCredits("alice", "article-1"), 2);
    EXPECT_EQ(store->GetCommentCredits("alice", "article-2"), 0);

    EXPECT_TRUE(store->ConsumeCommentCredit("alice", "article-1"));
    EXPECT_TRUE(store->ConsumeCommentCredit("alice", "article-1"));
    EXPECT_FALSE(store->ConsumeCommentCredit("alice", "article-1"));
}

TEST_F(LedgerStoreTest, ArchiveRoundTripsThroughZlib) {
    std::string payload;
    for (int i = 0; i < 200; ++i) {
        payload += "row " + std::to_string(i) + "|EARN|120|quiz_completion\n";
    }
    int64_t id = store->ArchiveSnapshot("alice", "invariant violation", payload);
    EXPECT_GT(id, 0);
    EXPECT_EQ(store->CountArchives("alice"), 1);

    auto restored = store->LoadArchive(id);
    ASSERT_TRUE(restored.has_value());
    EXPECT_EQ(*restored, payload);
    EXPECT_FALSE(store->LoadArchive(id + 100).has_value());
}

TEST_F(LedgerStoreTest, TotalsSplitEarnAndSpend) {
    createFunded("alice", 300);
    ASSERT_TRUE(tm->Spend("alice", 120, core::sources::CommentPost, "comment").ok());
    ASSERT_TRUE(tm->Earn("alice", 15, core::sources::InteractionReceived, "bronze").ok());

    storage::TransactionTotals totals = store->SumTransactions("alice");
    EXPECT_EQ(totals.sumEarned, 315);
    EXPECT_EQ(totals.sumSpent, 120);
    EXPECT_EQ(totals.sumAmount, 195);
    EXPECT_EQ(totals.count, 3);

    EXPECT_EQ(store->SumAmountBySources("alice", {core::sources::CommentPost}), 120);
    EXPECT_EQ(store->SumAmountBySources("alice", {}), 0);
}

TEST_F(LedgerStoreTest, ReopenKeepsTheLedger) {
    const std::string path = "test_ledger_reopen.sqlite";
    useFileDatabase(path);
    createFunded("alice", 75);

    tm.reset();
    store->Close();
    EXPECT_FALSE(store->IsOpen());
    ASSERT_TRUE(store->Open());
    tm = std::make_unique<ledger::TransactionManager>(*store, params);

    EXPECT_EQ(spendable("alice"), 75);
    EXPECT_EQ(store->LoadTransactions("alice").size(), (size_t)1);
}

} // namespace
} // namespace test
} // namespace xpeconomy
