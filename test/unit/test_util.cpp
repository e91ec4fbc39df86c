// test/unit/test_util.cpp
// -----------------------------------------------------------
// Hashing, the worker pool, request parsing and JSON responses.

#include <gtest/gtest.h>
#include <atomic>
#include <future>
#include <stdexcept>
#include <vector>

#include "core/errors.hpp"
#include "service/request.hpp"
#include "service/response.hpp"
#include "util/hashing.hpp"
#include "util/logger.hpp"
#include "util/thread_pool.hpp"

namespace xpeconomy {
namespace {

TEST(HashingTest, Sha256KnownVector) {
    EXPECT_EQ(util::hashing::sha256("abc"),
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
    EXPECT_EQ(util::hashing::sha256(""),
              "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

TEST(HashingTest, GenesisIsAllZeros) {
    EXPECT_EQ(util::hashing::genesisHash(), std::string(64, '0'));
}

TEST(HashingTest, ChainHashDependsOnLinkAndFieldBoundaries) {
    const std::string& g = util::hashing::genesisHash();
    std::string h = util::hashing::chainHash(g, {"alice", "EARN", "120"});
    EXPECT_EQ(h.size(), (size_t)64);
    EXPECT_EQ(h, util::hashing::chainHash(g, {"alice", "EARN", "120"}));
    EXPECT_NE(h, util::hashing::chainHash(h, {"alice", "EARN", "120"}));
    EXPECT_NE(util::hashing::chainHash(g, {"ab", "c"}), util::hashing::chainHash(g, {"a", "bc"}));
}

TEST(ThreadPoolTest, RunsEveryTask) {
    util::ThreadPool pool(3);
    EXPECT_EQ(pool.size(), (size_t)3);

    std::atomic<int> ran(0);
    std::vector<std::future<int>> results;
    for (int i = 0; i < 20; ++i) {
        results.push_back(pool.enqueue([&ran](int x) { ++ran; return x * x; }, i));
    }
    int sum = 0;
    for (auto& r : results) {
        sum += r.get();
    }
    EXPECT_EQ(ran.load(), 20);
    EXPECT_EQ(sum, 2470);
}

TEST(ThreadPoolTest, ExceptionsSurfaceThroughTheFuture) {
    util::ThreadPool pool(1);
    auto failing = pool.enqueue([]() -> int { throw std::runtime_error("boom"); });
    EXPECT_THROW(failing.get(), std::runtime_error);
}

TEST(RequestTest, ParsesTypeAndQuotedValues) {
    service::Request req = service::parseRequest(
        R"(  Spend account=alice amount=30 description="Gift \"card\" for \\ bob" purpose=manual)");
    EXPECT_EQ(req.type, "Spend");
    EXPECT_EQ(req.get("account"), "alice");
    EXPECT_EQ(req.get("amount"), "30");
    EXPECT_EQ(req.get("description"), R"(Gift "card" for \ bob)");
    EXPECT_TRUE(req.has("purpose"));
    EXPECT_FALSE(req.has("request_id"));
    EXPECT_EQ(req.get("request_id", "none"), "none");
}

TEST(RequestTest, LastDuplicateKeyWins) {
    service::Request req = service::parseRequest("Balance account=alice account=bob");
    EXPECT_EQ(req.get("account"), "bob");
}

TEST(RequestTest, EmptyQuotedValue) {
    service::Request req = service::parseRequest(R"(Earn account=alice description="")");
    EXPECT_TRUE(req.has("description"));
    EXPECT_EQ(req.get("description"), "");
}

TEST(RequestTest, MalformedLinesThrow) {
    EXPECT_THROW(service::parseRequest(""), std::runtime_error);
    EXPECT_THROW(service::parseRequest("   "), std::runtime_error);
    EXPECT_THROW(service::parseRequest("account=alice"), std::runtime_error);
    EXPECT_THROW(service::parseRequest("Balance alice"), std::runtime_error);
    EXPECT_THROW(service::parseRequest("Balance =alice"), std::runtime_error);
    EXPECT_THROW(service::parseRequest(R"(Earn description="open)"), std::runtime_error);
    EXPECT_THROW(service::parseRequest(R"(Earn description="a"b)"), std::runtime_error);
}

TEST(ResponseTest, SerializesWithSortedFields) {
    service::Response resp(200, "OK", "", {{"spendable_xp", "80"}, {"accumulated_xp", "120"}});
    EXPECT_EQ(resp.toJson(),
              R"({"status":200,"message":"OK","data":"","fields":{"accumulated_xp":"120","spendable_xp":"80"}})");
    EXPECT_TRUE(resp.ok());
}

TEST(ResponseTest, EscapesControlCharacters) {
    EXPECT_EQ(service::Response::escapeString("a\"b\\c\nd\te"), "a\\\"b\\\\c\\nd\\te");
    EXPECT_EQ(service::Response::escapeString(std::string(1, '\x01')), "\\u0001");
}

TEST(ResponseTest, ErrorsMapToStatusCodes) {
    using core::ErrorCode;
    EXPECT_EQ(service::statusForError(ErrorCode::ValidationError), 400);
    EXPECT_EQ(service::statusForError(ErrorCode::PrerequisiteMissing), 400);
    EXPECT_EQ(service::statusForError(ErrorCode::InsufficientXP), 402);
    EXPECT_EQ(service::statusForError(ErrorCode::NotFound), 404);
    EXPECT_EQ(service::statusForError(ErrorCode::AlreadyOwned), 409);
    EXPECT_EQ(service::statusForError(ErrorCode::AccountFrozen), 423);
    EXPECT_EQ(service::statusForError(ErrorCode::CommentLocked), 423);
    EXPECT_EQ(service::statusForError(ErrorCode::InvariantViolation), 500);
    EXPECT_EQ(service::statusForError(ErrorCode::StorageError), 500);
    EXPECT_EQ(service::statusForError(ErrorCode::TransientConflict), 503);
    EXPECT_EQ(service::statusForError(ErrorCode::Timeout), 504);

    auto shortBy = core::Result<int>::Fail(ErrorCode::InsufficientXP, "Insufficient XP", 20);
    service::Response resp = service::Response::fromError(shortBy);
    EXPECT_EQ(resp.statusCode, 402);
    EXPECT_FALSE(resp.ok());
    EXPECT_EQ(resp.fields["error"], "InsufficientXP");
    EXPECT_EQ(resp.fields["shortfall"], "20");

    service::Response missing = service::Response::fromError(core::Result<int>::Fail(ErrorCode::NotFound, "gone"));
    EXPECT_EQ(missing.fields.count("shortfall"), (size_t)0);
}

TEST(LoggerTest, ParsesLevelNames) {
    using util::logger::LogLevel;
    EXPECT_EQ(util::logger::parseLogLevel("debug"), LogLevel::DEBUG);
    EXPECT_EQ(util::logger::parseLogLevel("Info"), LogLevel::INFO);
    EXPECT_EQ(util::logger::parseLogLevel("WARNING"), LogLevel::WARN);
    EXPECT_EQ(util::logger::parseLogLevel("ERROR"), LogLevel::ERROR);
    EXPECT_EQ(util::logger::parseLogLevel("critical"), LogLevel::CRITICAL);
    EXPECT_THROW(util::logger::parseLogLevel("verbose"), std::runtime_error);
}

} // namespace
} // namespace xpeconomy
