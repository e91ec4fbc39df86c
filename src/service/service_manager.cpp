#include "service/service_manager.hpp"
#include "engine/xp_calculator.hpp"
#include "util/logger.hpp"

#include <sstream>
#include <stdexcept>

namespace xpeconomy {
namespace service {

namespace {

class BadRequest : public std::runtime_error
{
public:
    explicit BadRequest(const std::string &what) : std::runtime_error(what) {}
};

std::string requireParam(const Request &req, const std::string &key)
{
    auto it = req.params.find(key);
    if (it == req.params.end() || it->second.empty()) {
        throw BadRequest(req.type + " requires " + key + "=");
    }
    return it->second;
}

int64_t parseInt(const std::string &key, const std::string &text)
{
    size_t used = 0;
    int64_t value = 0;
    try {
        value = std::stoll(text, &used);
    }
    catch (const std::exception &) {
        throw BadRequest(key + " must be an integer, got '" + text + "'");
    }
    if (used != text.size()) {
        throw BadRequest(key + " must be an integer, got '" + text + "'");
    }
    return value;
}

double parseDouble(const std::string &key, const std::string &text)
{
    size_t used = 0;
    double value = 0.0;
    try {
        value = std::stod(text, &used);
    }
    catch (const std::exception &) {
        throw BadRequest(key + " must be a number, got '" + text + "'");
    }
    if (used != text.size()) {
        throw BadRequest(key + " must be a number, got '" + text + "'");
    }
    return value;
}

int64_t intParam(const Request &req, const std::string &key)
{
    return parseInt(key, requireParam(req, key));
}

int64_t intParam(const Request &req, const std::string &key, int64_t fallback)
{
    return req.has(key) ? parseInt(key, req.get(key)) : fallback;
}

ledger::Deadline deadlineOf(const Request &req)
{
    if (!req.has("deadline_ms")) {
        return ledger::NoDeadline();
    }
    int64_t ms = parseInt("deadline_ms", req.get("deadline_ms"));
    if (ms < 0) {
        throw BadRequest("deadline_ms must not be negative");
    }
    return ledger::DeadlineIn(std::chrono::milliseconds(ms));
}

/// ':' is reserved for the keys components derive from a request id.
std::string requestIdOf(const Request &req)
{
    std::string id = req.get("request_id");
    if (ledger::IsReservedRequestKey(id)) {
        throw BadRequest("request_id must not contain ':'");
    }
    return id;
}

Response notRegistered(const std::string &component)
{
    return Response(500, component + " not registered.");
}

std::string boolText(bool b)
{
    return b ? "true" : "false";
}

std::string joinIds(const std::vector<std::string> &ids)
{
    std::string out;
    for (const auto &id : ids) {
        out += (out.empty() ? "" : ",") + id;
    }
    return out;
}

std::string transactionJson(const core::Transaction &tx)
{
    std::ostringstream oss;
    oss << "{\"id\":" << tx.id
        << ",\"type\":\"" << core::transactionTypeName(tx.type) << "\""
        << ",\"amount\":" << tx.amount
        << ",\"source\":\"" << Response::escapeString(tx.source) << "\""
        << ",\"description\":\"" << Response::escapeString(tx.description) << "\""
        << ",\"balance_after\":" << tx.balanceAfter
        << ",\"created_at\":" << tx.createdAt << "}";
    return oss.str();
}

Response transactionResponse(const core::Transaction &tx)
{
    Response resp(200, tx.replayed ? "Replayed" : "OK", transactionJson(tx));
    resp.fields["transaction_id"] = std::to_string(tx.id);
    resp.fields["balance_after"] = std::to_string(tx.balanceAfter);
    resp.fields["replayed"] = boolText(tx.replayed);
    return resp;
}

} // namespace

ServiceManager::ServiceManager()
    : m_transactions(nullptr)
    , m_content(nullptr)
    , m_quizzes(nullptr)
    , m_progression(nullptr)
    , m_features(nullptr)
    , m_social(nullptr)
    , m_monitor(nullptr)
{
}

void ServiceManager::RegisterTransactionManager(ledger::TransactionManager *transactions)
{
    m_transactions = transactions;
}

void ServiceManager::RegisterContentSource(engine::InMemoryContentSource *content)
{
    m_content = content;
}

void ServiceManager::RegisterQuizProcessor(engine::QuizProcessor *quizzes)
{
    m_quizzes = quizzes;
}

void ServiceManager::RegisterSpeedProgression(engine::SpeedProgressionController *progression)
{
    m_progression = progression;
}

void ServiceManager::RegisterFeatureStore(features::FeatureStore *store)
{
    m_features = store;
}

void ServiceManager::RegisterSocialManager(social::SocialInteractionManager *social)
{
    m_social = social;
}

void ServiceManager::RegisterLedgerMonitor(monitor::LedgerMonitor *monitor)
{
    m_monitor = monitor;
}

Response ServiceManager::HandleLine(const std::string &line)
{
    Request req;
    try {
        req = parseRequest(line);
    }
    catch (const std::runtime_error &ex) {
        return Response(400, ex.what());
    }
    return HandleRequest(req);
}

Response ServiceManager::HandleRequest(const Request &req)
{
    try {
        if (req.type == "CreateAccount")          return handleCreateAccount(req);
        else if (req.type == "Earn")              return handleEarn(req);
        else if (req.type == "Spend")             return handleSpend(req);
        else if (req.type == "Balance")           return handleBalance(req);
        else if (req.type == "CalculateReward")   return handleCalculateReward(req);
        else if (req.type == "RegisterContent")   return handleRegisterContent(req);
        else if (req.type == "RecordQuizAttempt") return handleRecordQuizAttempt(req);
        else if (req.type == "SetReadingSpeed")   return handleSetReadingSpeed(req);
        else if (req.type == "PurchaseFeature")   return handlePurchaseFeature(req);
        else if (req.type == "PurchaseBundle")    return handlePurchaseBundle(req);
        else if (req.type == "ListFeatures")      return handleListFeatures(req);
        else if (req.type == "RecommendFeatures") return handleRecommendFeatures(req);
        else if (req.type == "FeatureSummary")    return handleFeatureSummary(req);
        else if (req.type == "PostComment")       return handlePostComment(req);
        else if (req.type == "Interact")          return handleInteract(req);
        else if (req.type == "History")           return handleHistory(req);
        else if (req.type == "RunMonitor")        return handleRunMonitor(req);
        else if (req.type == "Unfreeze")          return handleUnfreeze(req);
        else if (req.type == "Metrics")           return handleMetrics(req);
        else {
            util::logger::warn("[ServiceManager] Unknown request type: " + req.type);
            return Response(400, "Unknown request type: " + req.type);
        }
    }
    catch (const BadRequest &ex) {
        util::logger::info("[ServiceManager] Rejected " + req.type + ": " + ex.what());
        return Response(400, ex.what());
    }
}

Response ServiceManager::handleCreateAccount(const Request &req)
{
    if (!m_transactions) return notRegistered("TransactionManager");
    auto created = m_transactions->CreateAccount(requireParam(req, "account"));
    if (!created) {
        return Response::fromError(created);
    }
    const core::Account &a = created.value();
    return Response(200, "Account created.", "", {
        {"account", a.accountId},
        {"current_wpm", std::to_string(a.currentWpm)},
        {"max_wpm", std::to_string(a.maxWpm)}
    });
}

Response ServiceManager::handleEarn(const Request &req)
{
    if (!m_transactions) return notRegistered("TransactionManager");
    auto earned = m_transactions->Earn(requireParam(req, "account"), intParam(req, "amount"),
                                       req.get("source", core::sources::AdminGrant), req.get("description"),
                                       {}, requestIdOf(req), deadlineOf(req));
    return earned ? transactionResponse(earned.value()) : Response::fromError(earned);
}

Response ServiceManager::handleSpend(const Request &req)
{
    if (!m_transactions) return notRegistered("TransactionManager");
    auto spent = m_transactions->Spend(requireParam(req, "account"), intParam(req, "amount"),
                                       req.get("purpose", core::sources::Manual), req.get("description"),
                                       {}, requestIdOf(req), deadlineOf(req));
    return spent ? transactionResponse(spent.value()) : Response::fromError(spent);
}

Response ServiceManager::handleBalance(const Request &req)
{
    if (!m_transactions) return notRegistered("TransactionManager");
    auto summary = m_transactions->GetBalanceSummary(requireParam(req, "account"));
    if (!summary) {
        return Response::fromError(summary);
    }
    const core::BalanceSummary &s = summary.value();
    return Response(200, "OK", "", {
        {"accumulated_xp", std::to_string(s.accumulatedXp)},
        {"spendable_xp", std::to_string(s.spendableXp)},
        {"lifetime_earned", std::to_string(s.lifetimeEarned)},
        {"lifetime_spent", std::to_string(s.lifetimeSpent)},
        {"current_wpm", std::to_string(s.currentWpm)},
        {"max_wpm", std::to_string(s.maxWpm)},
        {"spending_frozen", boolText(s.spendingFrozen)}
    });
}

Response ServiceManager::handleCalculateReward(const Request &req)
{
    if (!m_transactions) return notRegistered("TransactionManager");
    engine::RewardInput in;
    in.contentLength = intParam(req, "length");
    in.readingLevel  = parseDouble("reading_level", requireParam(req, "reading_level"));
    in.scorePct      = intParam(req, "score_pct");
    in.wpmUsed       = intParam(req, "wpm_used");
    in.attemptNumber = intParam(req, "attempt_number", 1);

    auto reward = engine::CalculateReward(in, m_transactions->Params());
    if (!reward) {
        return Response::fromError(reward);
    }
    const engine::RewardResult &r = reward.value();
    std::ostringstream speed, raw, bonus;
    speed << r.speedMultiplier;
    raw << r.raw;
    bonus << r.perfectBonus;
    return Response(200, "OK", "", {
        {"xp_awarded", std::to_string(r.xpAwarded)},
        {"passed", boolText(r.passed)},
        {"perfect", boolText(r.perfect)},
        {"speed_multiplier", speed.str()},
        {"raw", raw.str()},
        {"perfect_bonus", bonus.str()}
    });
}

Response ServiceManager::handleRegisterContent(const Request &req)
{
    if (!m_content) return notRegistered("ContentSource");
    int64_t length = intParam(req, "length");
    double level = parseDouble("reading_level", requireParam(req, "reading_level"));
    if (length < 0 || level < 0.0) {
        throw BadRequest("length and reading_level must not be negative");
    }
    m_content->Register(requireParam(req, "content"), length, level);
    return Response(200, "Content registered.");
}

Response ServiceManager::handleRecordQuizAttempt(const Request &req)
{
    if (!m_quizzes) return notRegistered("QuizProcessor");
    auto attempt = m_quizzes->RecordQuizAttempt(requireParam(req, "account"), requireParam(req, "content"),
                                                intParam(req, "score_pct"), intParam(req, "wpm_used"),
                                                requestIdOf(req), deadlineOf(req));
    if (!attempt) {
        return Response::fromError(attempt);
    }
    const core::QuizAttempt &a = attempt.value();
    return Response(200, a.replayed ? "Replayed" : "OK", "", {
        {"attempt_id", std::to_string(a.id)},
        {"attempt_number", std::to_string(a.attemptNumber)},
        {"xp_awarded", std::to_string(a.xpAwarded)},
        {"passed", boolText(a.passed)},
        {"perfect", boolText(a.isPerfect)},
        {"progression", boolText(a.progressionTriggered)},
        {"new_max_wpm", std::to_string(a.newMaxWpm)},
        {"streak_bonus", std::to_string(a.streakBonusXp)},
        {"comment_credit", boolText(a.commentCreditGranted)},
        {"replayed", boolText(a.replayed)}
    });
}

Response ServiceManager::handleSetReadingSpeed(const Request &req)
{
    if (!m_progression) return notRegistered("SpeedProgressionController");
    auto account = m_progression->SetCurrentWpm(requireParam(req, "account"), intParam(req, "wpm"));
    if (!account) {
        return Response::fromError(account);
    }
    return Response(200, "Reading speed updated.", "", {
        {"current_wpm", std::to_string(account.value().currentWpm)},
        {"max_wpm", std::to_string(account.value().maxWpm)}
    });
}

Response ServiceManager::handlePurchaseFeature(const Request &req)
{
    if (!m_features) return notRegistered("FeatureStore");
    auto purchase = m_features->PurchaseFeature(requireParam(req, "account"), requireParam(req, "feature"),
                                                deadlineOf(req));
    if (!purchase) {
        return Response::fromError(purchase);
    }
    return Response(200, "Feature purchased.", "", {
        {"feature", purchase.value().featureId},
        {"cost", std::to_string(purchase.value().costPaid)},
        {"transaction_id", std::to_string(purchase.value().transactionId)}
    });
}

Response ServiceManager::handlePurchaseBundle(const Request &req)
{
    if (!m_features) return notRegistered("FeatureStore");
    auto purchase = m_features->PurchaseBundle(requireParam(req, "account"), requireParam(req, "bundle"),
                                               deadlineOf(req));
    if (!purchase) {
        return Response::fromError(purchase);
    }
    std::string granted;
    for (const auto &p : purchase.value().granted) {
        granted += (granted.empty() ? "" : ",") + p.featureId;
    }
    return Response(200, "Bundle purchased.", "", {
        {"bundle", purchase.value().bundleId},
        {"charged", std::to_string(purchase.value().charged)},
        {"granted", granted},
        {"transaction_id", std::to_string(purchase.value().transaction.id)}
    });
}

Response ServiceManager::handleListFeatures(const Request &req)
{
    if (!m_features) return notRegistered("FeatureStore");
    const std::string account = requireParam(req, "account");
    auto listings = req.has("category") ? m_features->ListFeaturesByCategory(account, req.get("category"))
                                        : m_features->ListFeatures(account);
    if (!listings) {
        return Response::fromError(listings);
    }
    std::ostringstream oss;
    oss << "[";
    bool first = true;
    for (const auto &l : listings.value()) {
        if (!first) {
            oss << ",";
        }
        first = false;
        oss << "{\"id\":\"" << Response::escapeString(l.entry.featureId) << "\""
            << ",\"name\":\"" << Response::escapeString(l.entry.name) << "\""
            << ",\"price\":" << l.entry.price
            << ",\"category\":\"" << Response::escapeString(l.entry.category) << "\""
            << ",\"owned\":" << boolText(l.owned)
            << ",\"affordable\":" << boolText(l.affordable)
            << ",\"prerequisites_met\":" << boolText(l.prerequisitesMet) << "}";
    }
    oss << "]";
    return Response(200, "OK", oss.str(), {{"count", std::to_string(listings.value().size())}});
}

Response ServiceManager::handleRecommendFeatures(const Request &req)
{
    if (!m_features) return notRegistered("FeatureStore");
    int64_t limit = intParam(req, "limit", 3);
    if (limit <= 0) {
        throw BadRequest("limit must be positive");
    }
    auto recommended = m_features->GetFeatureRecommendations(requireParam(req, "account"),
                                                             static_cast<size_t>(limit));
    if (!recommended) {
        return Response::fromError(recommended);
    }
    const features::FeatureRecommendations &r = recommended.value();

    std::vector<std::string> affordable;
    std::ostringstream oss;
    oss << "{\"affordable\":[";
    for (size_t i = 0; i < r.affordable.size(); ++i) {
        const core::FeatureCatalogEntry &e = r.affordable[i];
        affordable.push_back(e.featureId);
        oss << (i ? "," : "") << "{\"id\":\"" << Response::escapeString(e.featureId) << "\""
            << ",\"price\":" << e.price
            << ",\"category\":\"" << Response::escapeString(e.category) << "\"}";
    }
    oss << "],\"bundles\":[";
    std::vector<std::string> bundles;
    for (size_t i = 0; i < r.bundles.size(); ++i) {
        const features::BundleRecommendation &b = r.bundles[i];
        bundles.push_back(b.bundle.bundleId);
        oss << (i ? "," : "") << "{\"id\":\"" << Response::escapeString(b.bundle.bundleId) << "\""
            << ",\"charge\":" << b.charge
            << ",\"savings\":" << b.savings
            << ",\"features\":\"" << Response::escapeString(joinIds(b.unowned)) << "\"}";
    }
    oss << "]}";

    return Response(200, "OK", oss.str(), {
        {"affordable", joinIds(affordable)},
        {"bundles", joinIds(bundles)},
        {"next_chunking", r.nextChunkingLevel},
        {"next_chunking_price", std::to_string(r.nextChunkingPrice)},
        {"next_chunking_affordable", boolText(r.nextChunkingAffordable)}
    });
}

Response ServiceManager::handleFeatureSummary(const Request &req)
{
    if (!m_features) return notRegistered("FeatureStore");
    auto summary = m_features->GetFeatureSummary(requireParam(req, "account"));
    if (!summary) {
        return Response::fromError(summary);
    }
    const features::FeatureSummary &s = summary.value();

    Response resp(200, "OK");
    std::ostringstream oss;
    oss << "[";
    for (size_t i = 0; i < s.categories.size(); ++i) {
        const features::CategorySummary &c = s.categories[i];
        oss << (i ? "," : "") << "{\"category\":\"" << Response::escapeString(c.category) << "\""
            << ",\"total\":" << c.total
            << ",\"owned\":" << c.owned
            << ",\"xp_spent\":" << c.xpSpent << "}";
        resp.fields["spent_" + c.category] = std::to_string(c.xpSpent);
    }
    oss << "]";
    resp.data = oss.str();
    resp.fields["owned"] = joinIds(s.owned);
    resp.fields["owned_count"] = std::to_string(s.owned.size());
    resp.fields["total_features"] = std::to_string(s.totalFeatures);
    resp.fields["xp_spent"] = std::to_string(s.xpSpent);
    return resp;
}

Response ServiceManager::handlePostComment(const Request &req)
{
    if (!m_social) return notRegistered("SocialInteractionManager");
    auto comment = m_social->PostComment(requireParam(req, "account"), requireParam(req, "comment"),
                                         requireParam(req, "content"), req.get("parent"), deadlineOf(req));
    if (!comment) {
        return Response::fromError(comment);
    }
    return Response(200, "Comment posted.", "", {
        {"comment", comment.value().commentId},
        {"free", boolText(comment.value().isFree)},
        {"cost", std::to_string(comment.value().costPaid)}
    });
}

Response ServiceManager::handleInteract(const Request &req)
{
    if (!m_social) return notRegistered("SocialInteractionManager");
    std::string tierName = requireParam(req, "tier");
    auto tier = core::parseInteractionTier(tierName);
    if (!tier) {
        throw BadRequest("Unknown interaction tier '" + tierName + "'");
    }
    auto interaction = m_social->Interact(requireParam(req, "account"), requireParam(req, "comment"), *tier,
                                          requestIdOf(req), deadlineOf(req));
    if (!interaction) {
        return Response::fromError(interaction);
    }
    const core::InteractionRecord &r = interaction.value();
    return Response(200, r.replayed ? "Replayed" : "OK", "", {
        {"tier", core::interactionTierName(r.tier)},
        {"cost", std::to_string(r.cost)},
        {"author", r.authorId},
        {"author_reward", std::to_string(r.authorReward)},
        {"request_id", r.requestKey},
        {"replayed", boolText(r.replayed)}
    });
}

Response ServiceManager::handleHistory(const Request &req)
{
    if (!m_transactions) return notRegistered("TransactionManager");
    std::optional<core::TransactionType> type;
    std::string typeName = req.get("type");
    if (typeName == "EARN") {
        type = core::TransactionType::Earn;
    }
    else if (typeName == "SPEND") {
        type = core::TransactionType::Spend;
    }
    else if (!typeName.empty()) {
        throw BadRequest("type must be EARN or SPEND");
    }
    int64_t limit = intParam(req, "limit", 50);
    if (limit <= 0) {
        throw BadRequest("limit must be positive");
    }

    auto history = m_transactions->GetHistory(requireParam(req, "account"), type, static_cast<size_t>(limit));
    if (!history) {
        return Response::fromError(history);
    }
    std::string data = "[";
    for (size_t i = 0; i < history.value().size(); ++i) {
        data += (i ? "," : "") + transactionJson(history.value()[i]);
    }
    data += "]";
    return Response(200, "OK", data, {{"count", std::to_string(history.value().size())}});
}

Response ServiceManager::handleRunMonitor(const Request &req)
{
    if (!m_monitor) return notRegistered("LedgerMonitor");
    if (req.has("account")) {
        auto audit = m_monitor->AuditAccount(req.get("account"));
        if (!audit) {
            return Response::fromError(audit);
        }
        std::string kinds;
        for (const auto &flag : audit.value().findings) {
            kinds += (kinds.empty() ? "" : ",") + flag.kind;
        }
        return Response(200, audit.value().HasViolation() ? "Invariant violation" : "OK", "", {
            {"findings", kinds},
            {"frozen", boolText(audit.value().frozen)}
        });
    }

    monitor::MonitorReport report = m_monitor->RunCycle();
    return Response(200, "Monitor cycle complete.", "", {
        {"accounts", std::to_string(report.accountsChecked)},
        {"violations", std::to_string(report.violations)},
        {"advisories", std::to_string(report.advisories)},
        {"frozen", std::to_string(report.frozen)},
        {"failures", std::to_string(report.failures)}
    });
}

Response ServiceManager::handleUnfreeze(const Request &req)
{
    if (!m_monitor) return notRegistered("LedgerMonitor");
    core::Status status = m_monitor->Unfreeze(requireParam(req, "account"));
    return status ? Response(200, "Spending unfrozen.") : Response::fromError(status);
}

Response ServiceManager::handleMetrics(const Request &req)
{
    if (!m_monitor) return notRegistered("LedgerMonitor");
    auto metrics = m_monitor->GetEconomyMetrics(intParam(req, "window_seconds", 86400));
    if (!metrics) {
        return Response::fromError(metrics);
    }
    const core::EconomyMetrics &m = metrics.value();
    return Response(200, "OK", "", {
        {"window_seconds", std::to_string(m.windowSeconds)},
        {"total_earned", std::to_string(m.totalEarned)},
        {"total_spent", std::to_string(m.totalSpent)},
        {"net", std::to_string(m.net)},
        {"active_accounts", std::to_string(m.activeAccounts)},
        {"purchases", std::to_string(m.purchases)},
        {"transactions", std::to_string(m.transactions)}
    });
}

} // namespace service
} // namespace xpeconomy
