#ifndef XPECONOMY_SERVICE_SERVICE_MANAGER_HPP
#define XPECONOMY_SERVICE_SERVICE_MANAGER_HPP

#include <string>
#include "service/request.hpp"
#include "service/response.hpp"
#include "ledger/transaction_manager.hpp"
#include "engine/content_source.hpp"
#include "engine/quiz_processor.hpp"
#include "engine/speed_progression.hpp"
#include "features/feature_store.hpp"
#include "social/social_interaction_manager.hpp"
#include "monitor/ledger_monitor.hpp"

/*
  service_manager.hpp
  --------------------------------
  Receives inbound request lines (stdin of xpeconomyd, tests, an RPC front end)
  and routes them to the subsystem that owns the operation.

  Request types:
    CreateAccount      account
    Earn               account amount source description [request_id]
    Spend              account amount purpose description [request_id]
    Balance            account
    CalculateReward    length reading_level score_pct wpm_used [attempt_number]
    RegisterContent    content length reading_level
    RecordQuizAttempt  account content score_pct wpm_used [request_id]
    SetReadingSpeed    account wpm
    PurchaseFeature    account feature
    PurchaseBundle     account bundle
    ListFeatures       account [category]
    RecommendFeatures  account [limit]
    FeatureSummary     account
    PostComment        account comment content [parent]
    Interact           account comment tier [request_id]
    History            account [type=EARN|SPEND] [limit]
    RunMonitor         [account]
    Unfreeze           account
    Metrics            [window_seconds]

  Every mutating request also accepts deadline_ms; once it passes the
  request fails with 504 and nothing is written.

  Components are registered by pointer, before requests are served; a request
  whose component was not registered fails with 500. HandleRequest takes no
  lock of its own and may be called from several threads: requests on
  different accounts only meet in the ledger.
*/

namespace xpeconomy {
namespace service {

class ServiceManager
{
public:
    ServiceManager();

    void RegisterTransactionManager(ledger::TransactionManager *transactions);
    void RegisterContentSource(engine::InMemoryContentSource *content);
    void RegisterQuizProcessor(engine::QuizProcessor *quizzes);
    void RegisterSpeedProgression(engine::SpeedProgressionController *progression);
    void RegisterFeatureStore(features::FeatureStore *store);
    void RegisterSocialManager(social::SocialInteractionManager *social);
    void RegisterLedgerMonitor(monitor::LedgerMonitor *monitor);

    Response HandleRequest(const Request &req);

    /// Parses the line first; parse errors are 400.
    Response HandleLine(const std::string &line);

private:
    Response handleCreateAccount(const Request &req);
    Response handleEarn(const Request &req);
    Response handleSpend(const Request &req);
    Response handleBalance(const Request &req);
    Response handleCalculateReward(const Request &req);
    Response handleRegisterContent(const Request &req);
    Response handleRecordQuizAttempt(const Request &req);
    Response handleSetReadingSpeed(const Request &req);
    Response handlePurchaseFeature(const Request &req);
    Response handlePurchaseBundle(const Request &req);
    Response handleListFeatures(const Request &req);
    Response handleRecommendFeatures(const Request &req);
    Response handleFeatureSummary(const Request &req);
    Response handlePostComment(const Request &req);
    Response handleInteract(const Request &req);
    Response handleHistory(const Request &req);
    Response handleRunMonitor(const Request &req);
    Response handleUnfreeze(const Request &req);
    Response handleMetrics(const Request &req);

    ledger::TransactionManager*         m_transactions;
    engine::InMemoryContentSource*      m_content;
    engine::QuizProcessor*              m_quizzes;
    engine::SpeedProgressionController* m_progression;
    features::FeatureStore*             m_features;
    social::SocialInteractionManager*   m_social;
    monitor::LedgerMonitor*             m_monitor;
};

} // namespace service
} // namespace xpeconomy

#endif // XPECONOMY_SERVICE_SERVICE_MANAGER_HPP
