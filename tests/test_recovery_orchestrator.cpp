// EN: Unit tests for the Recovery Orchestrator - strategy selection, retries, restoration, resumption and reporting.
// FR: Tests unitaires du Recovery Orchestrator - choix de stratégie, retries, restauration, reprise et rapport.

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include <algorithm>
#include <chrono>
#include <memory>
#include <stdexcept>
#include <thread>

#include "orchestrator/orchestration_config.hpp"
#include "orchestrator/recovery_orchestrator.hpp"
#include "test_helpers.hpp"

using namespace OBF;
using namespace OBF::Orchestrator;
using namespace std::chrono_literals;
using ::testing::_;
using ::testing::NiceMock;
using ::testing::Return;
using ::testing::Throw;

namespace {

class MockRecoveryExecutor : public RecoveryActionExecutor {
public:
    MOCK_METHOD(ActionOutcome, retryStage, (const FailureContext& context, int attempt), (override));
    MOCK_METHOD(ActionOutcome, restoreStage, (const FailureContext& context), (override));
    MOCK_METHOD(ActionOutcome, resumeWorkflow, (const FailureContext& context), (override));
    MOCK_METHOD(ActionOutcome, resetCircuit, (const std::string& service), (override));
};

ActionOutcome succeeded(const std::string& message = "ok") {
    ActionOutcome outcome;
    outcome.success = true;
    outcome.message = message;
    return outcome;
}

ActionOutcome failed(const std::string& message) {
    ActionOutcome outcome;
    outcome.message = message;
    return outcome;
}

bool hasRecommendation(const RecoveryResult& result, const std::string& text) {
    return std::find(result.recommendations.begin(), result.recommendations.end(), text) !=
           result.recommendations.end();
}

} // namespace

// EN: Test fixture with millisecond delays, a manual clock and a live escalation engine
// FR: Fixture de test avec des délais en millisecondes, une horloge manuelle et un moteur d'escalade réel
class RecoveryOrchestratorTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_.immediate_delay = 1ms;
        config_.backoff_base = 5ms;
        config_.backoff_cap = 20ms;

        clock_ = std::make_shared<Testing::ManualClock>();
        notifier_ = std::make_shared<NiceMock<Testing::MockNotificationService>>();
        ON_CALL(*notifier_, notify(_, _, _, _)).WillByDefault(Return(std::optional<std::string>("notif-1")));
        escalations_ = std::make_shared<EscalationRuleEngine>(DefaultCatalog::escalationRules(),
                                                              DynamicEscalationConfig{}, notifier_, metrics_,
                                                              std::vector<std::string>{"hr_director@company.com"});
        circuits_ = std::make_shared<CircuitBreakerManager>(CircuitBreakerConfig{}, metrics_);
        orchestrator_ = std::make_unique<RecoveryOrchestrator>(config_, metrics_, clock_, circuits_, escalations_);
    }

    static FailureContext transientFailure() {
        FailureContext context;
        context.session_id = "session-7";
        context.stage_id = "it_provisioning";
        context.errors = {"Connection timeout while calling active_directory backend"};
        context.error_count = 1;
        return context;
    }

    Testing::QuietLogger quiet_;
    RecoveryConfig config_;
    MetricsAggregator metrics_;
    std::shared_ptr<Testing::ManualClock> clock_;
    std::shared_ptr<NiceMock<Testing::MockNotificationService>> notifier_;
    std::shared_ptr<EscalationRuleEngine> escalations_;
    std::shared_ptr<CircuitBreakerManager> circuits_;
    std::unique_ptr<RecoveryOrchestrator> orchestrator_;
    MockRecoveryExecutor executor_;
    CancellationToken token_;
};

// EN: The error category and context pick the strategy
// FR: La catégorie d'erreur et le contexte choisissent la stratégie
TEST_F(RecoveryOrchestratorTest, StrategySelection) {
    FailureContext context = transientFailure();
    EXPECT_EQ(orchestrator_->selectStrategy(context, ErrorCategory::TRANSIENT), RecoveryStrategy::IMMEDIATE_RETRY);
    EXPECT_EQ(orchestrator_->selectStrategy(context, ErrorCategory::RESOURCE_EXHAUSTION),
              RecoveryStrategy::EXPONENTIAL_BACKOFF_RETRY);
    EXPECT_EQ(orchestrator_->selectStrategy(context, ErrorCategory::STATE_INCONSISTENCY),
              RecoveryStrategy::STATE_RESTORATION);
    EXPECT_EQ(orchestrator_->selectStrategy(context, ErrorCategory::UNRECOVERABLE),
              RecoveryStrategy::ESCALATE_TO_HUMAN);
    EXPECT_EQ(orchestrator_->selectStrategy(context, ErrorCategory::DEPENDENCY_UNAVAILABLE),
              RecoveryStrategy::ESCALATE_TO_HUMAN);

    context.error_count = 3;
    EXPECT_EQ(orchestrator_->selectStrategy(context, ErrorCategory::TRANSIENT), RecoveryStrategy::ESCALATE_TO_HUMAN);
    context.last_completed_stage = "data_aggregation";
    EXPECT_EQ(orchestrator_->selectStrategy(context, ErrorCategory::TRANSIENT), RecoveryStrategy::WORKFLOW_RESUMPTION);
    EXPECT_EQ(orchestrator_->selectStrategy(context, ErrorCategory::QUALITY_VIOLATION),
              RecoveryStrategy::WORKFLOW_RESUMPTION);
    EXPECT_EQ(orchestrator_->selectStrategy(context, ErrorCategory::UNRECOVERABLE),
              RecoveryStrategy::ESCALATE_TO_HUMAN);
}

// EN: An explicit category wins over message classification
// FR: Une catégorie explicite l'emporte sur la classification des messages
TEST_F(RecoveryOrchestratorTest, Categorization) {
    FailureContext context = transientFailure();
    EXPECT_EQ(RecoveryOrchestrator::categorize(context), ErrorCategory::TRANSIENT);
    context.errors.push_back("HTTP 503 Service Unavailable");
    EXPECT_EQ(RecoveryOrchestrator::categorize(context), ErrorCategory::DEPENDENCY_UNAVAILABLE);
    context.category = ErrorCategory::STATE_INCONSISTENCY;
    EXPECT_EQ(RecoveryOrchestrator::categorize(context), ErrorCategory::STATE_INCONSISTENCY);
}

// EN: A transient failure recovers on the second immediate retry
// FR: Un échec transitoire se rétablit au second retry immédiat
TEST_F(RecoveryOrchestratorTest, ImmediateRetrySucceeds) {
    EXPECT_CALL(executor_, retryStage(_, 1)).WillOnce(Return(failed("timeout again")));
    EXPECT_CALL(executor_, retryStage(_, 2)).WillOnce(Return(succeeded("dispatched")));

    auto result = orchestrator_->recover(transientFailure(), executor_, token_);

    EXPECT_EQ(result.status, RecoveryStatus::SUCCESS);
    EXPECT_EQ(result.strategy, RecoveryStrategy::IMMEDIATE_RETRY);
    EXPECT_TRUE(result.can_resume);
    ASSERT_EQ(result.attempts.size(), 2u);
    EXPECT_EQ(result.attempts[0].status, AttemptStatus::FAILED);
    EXPECT_EQ(result.attempts[1].attempt_number, 2);
    EXPECT_FALSE(result.escalation_event_id.has_value());
    EXPECT_TRUE(hasRecommendation(result, "Consider exponential backoff for better success rate"));
    EXPECT_TRUE(hasRecommendation(result, "Document the successful recovery strategy"));
    EXPECT_EQ(metrics_.get(Metric::RECOVERY_SUCCESS), 1u);
    EXPECT_EQ(metrics_.get(Metric::RECOVERY_ATTEMPTS), 2u);
}

// EN: Exhausted retries report failure and escalate, never a disguised success
// FR: Des retries épuisés rapportent l'échec et escaladent, jamais un succès déguisé
TEST_F(RecoveryOrchestratorTest, ExhaustedRetriesEscalate) {
    EXPECT_CALL(executor_, retryStage(_, _)).Times(3).WillRepeatedly(Return(failed("still down")));

    auto result = orchestrator_->recover(transientFailure(), executor_, token_, "emp-7");

    EXPECT_EQ(result.status, RecoveryStatus::FAILED);
    EXPECT_FALSE(result.can_resume);
    EXPECT_EQ(result.attempts.size(), 3u);
    EXPECT_EQ(result.message, "Recovery exhausted without success");
    ASSERT_TRUE(result.escalation_event_id.has_value());

    auto event = escalations_->getEvent(*result.escalation_event_id);
    ASSERT_TRUE(event.has_value());
    EXPECT_EQ(event->level, EscalationLevel::CRITICAL);
    EXPECT_EQ(event->stage_id, "it_provisioning");
    EXPECT_TRUE(hasRecommendation(result, "Low recovery success rate - consider an alternative strategy"));
    EXPECT_TRUE(hasRecommendation(result, "Conduct a post-mortem of the recovery failure"));
    EXPECT_EQ(metrics_.get(Metric::RECOVERY_FAILED), 1u);
}

// EN: A degraded retry lets the stage resume but is reported as partial
// FR: Un retry dégradé permet la reprise mais est rapporté comme partiel
TEST_F(RecoveryOrchestratorTest, DegradedRetryIsPartial) {
    ActionOutcome degraded = succeeded("dispatched to fallback worker");
    degraded.degraded = true;
    EXPECT_CALL(executor_, retryStage(_, 1)).WillOnce(Return(degraded));

    auto result = orchestrator_->recover(transientFailure(), executor_, token_);
    EXPECT_EQ(result.status, RecoveryStatus::PARTIAL);
    EXPECT_TRUE(result.can_resume);
    EXPECT_EQ(result.attempts[0].status, AttemptStatus::DEGRADED);
    EXPECT_EQ(metrics_.get(Metric::RECOVERY_PARTIAL), 1u);
}

// EN: Executor exceptions become failed attempts
// FR: Les exceptions de l'exécuteur deviennent des tentatives en échec
TEST_F(RecoveryOrchestratorTest, ExecutorExceptionIsFailedAttempt) {
    EXPECT_CALL(executor_, retryStage(_, 1)).WillOnce(Throw(std::runtime_error("worker pool saturated")));
    EXPECT_CALL(executor_, retryStage(_, 2)).WillOnce(Return(succeeded()));

    auto result = orchestrator_->recover(transientFailure(), executor_, token_);
    EXPECT_EQ(result.status, RecoveryStatus::SUCCESS);
    EXPECT_EQ(result.attempts[0].status, AttemptStatus::FAILED);
    EXPECT_EQ(result.attempts[0].message, "worker pool saturated");
}

// EN: Resource exhaustion waits with exponential backoff between attempts
// FR: L'épuisement de ressources attend avec un backoff exponentiel entre les tentatives
TEST_F(RecoveryOrchestratorTest, BackoffBetweenAttempts) {
    FailureContext context = transientFailure();
    context.errors = {"HTTP 429 Too Many Requests from asset_management"};
    EXPECT_CALL(executor_, retryStage(_, _)).Times(3).WillRepeatedly(Return(failed("429")));

    auto start = std::chrono::steady_clock::now();
    auto result = orchestrator_->recover(context, executor_, token_);

    EXPECT_EQ(result.strategy, RecoveryStrategy::EXPONENTIAL_BACKOFF_RETRY);
    EXPECT_EQ(result.category, ErrorCategory::RESOURCE_EXHAUSTION);
    EXPECT_GE(std::chrono::steady_clock::now() - start, 15ms);
}

// EN: An open circuit rejects the retry without calling the executor
// FR: Un circuit ouvert rejette le retry sans appeler l'exécuteur
TEST_F(RecoveryOrchestratorTest, OpenCircuitRejectsRetry) {
    for (int i = 0; i < 5; ++i) {
        circuits_->recordOutcome("active_directory", false, clock_->now());
    }
    FailureContext context = transientFailure();
    context.failing_service = "active_directory";
    EXPECT_CALL(executor_, retryStage(_, _)).Times(0);

    auto result = orchestrator_->recover(context, executor_, token_);
    EXPECT_EQ(result.status, RecoveryStatus::FAILED);
    ASSERT_EQ(result.attempts.size(), 1u);
    EXPECT_EQ(result.attempts[0].status, AttemptStatus::REJECTED);
    EXPECT_TRUE(hasRecommendation(result,
                                  "Dependency circuit is open - wait for its recovery timeout before retrying"));
}

// EN: State inconsistencies restore the last checkpoint
// FR: Les incohérences d'état restaurent le dernier checkpoint
TEST_F(RecoveryOrchestratorTest, StateRestoration) {
    FailureContext context = transientFailure();
    context.errors = {"checksum mismatch in stage record"};
    EXPECT_CALL(executor_, restoreStage(_)).WillOnce(Return(succeeded("checkpoint restored")));

    auto result = orchestrator_->recover(context, executor_, token_);
    EXPECT_EQ(result.strategy, RecoveryStrategy::STATE_RESTORATION);
    EXPECT_EQ(result.status, RecoveryStatus::SUCCESS);
    EXPECT_EQ(result.attempts[0].action, RecoveryActionType::STATE_RESTORE);
}

// EN: Resumption resets an unhealthy circuit first; a failed reset leaves a partial recovery
// FR: La reprise réinitialise d'abord un circuit malsain ; un reset en échec laisse une récupération partielle
TEST_F(RecoveryOrchestratorTest, WorkflowResumption) {
    for (int i = 0; i < 5; ++i) {
        circuits_->recordOutcome("e_signature", false, clock_->now());
    }
    FailureContext context;
    context.session_id = "session-7";
    context.stage_id = "contract_management";
    context.category = ErrorCategory::DEPENDENCY_UNAVAILABLE;
    context.last_completed_stage = "it_provisioning";
    context.failing_service = "e_signature";

    EXPECT_CALL(executor_, resetCircuit("e_signature"))
        .WillOnce(Return(succeeded()))
        .WillOnce(Return(failed("provider still unreachable")));
    EXPECT_CALL(executor_, resumeWorkflow(_)).Times(2).WillRepeatedly(Return(succeeded()));

    auto clean = orchestrator_->recover(context, executor_, token_);
    EXPECT_EQ(clean.strategy, RecoveryStrategy::WORKFLOW_RESUMPTION);
    EXPECT_EQ(clean.status, RecoveryStatus::SUCCESS);
    ASSERT_EQ(clean.attempts.size(), 2u);
    EXPECT_EQ(clean.attempts[0].action, RecoveryActionType::CIRCUIT_RESET);

    auto partial = orchestrator_->recover(context, executor_, token_);
    EXPECT_EQ(partial.status, RecoveryStatus::PARTIAL);
    EXPECT_TRUE(partial.can_resume);
}

// EN: Unrecoverable failures go straight to an emergency human escalation
// FR: Les échecs irrécupérables partent directement en escalade humaine d'urgence
TEST_F(RecoveryOrchestratorTest, UnrecoverableEscalates) {
    FailureContext context = transientFailure();
    context.errors = {"Permission denied for contract archive"};

    auto result = orchestrator_->recover(context, executor_, token_, "emp-7");
    EXPECT_EQ(result.strategy, RecoveryStrategy::ESCALATE_TO_HUMAN);
    EXPECT_EQ(result.status, RecoveryStatus::FAILED);
    EXPECT_TRUE(result.attempts.empty());
    EXPECT_EQ(result.message, "No automatic strategy applies, human intervention required");
    ASSERT_TRUE(result.escalation_event_id.has_value());
    EXPECT_EQ(escalations_->getEvent(*result.escalation_event_id)->level, EscalationLevel::EMERGENCY);
}

// EN: A cancelled token stops recovery before the next action
// FR: Un jeton annulé arrête la récupération avant l'action suivante
TEST_F(RecoveryOrchestratorTest, CancellationBeforeStart) {
    token_.cancel();
    EXPECT_CALL(executor_, retryStage(_, _)).Times(0);

    auto result = orchestrator_->recover(transientFailure(), executor_, token_);
    EXPECT_EQ(result.status, RecoveryStatus::CANCELLED);
    ASSERT_EQ(result.attempts.size(), 1u);
    EXPECT_EQ(result.attempts[0].status, AttemptStatus::CANCELLED);
    EXPECT_FALSE(result.escalation_event_id.has_value());
    EXPECT_EQ(metrics_.get(Metric::RECOVERY_FAILED), 0u);
}

// EN: Cancelling during a backoff wait ends the recovery promptly
// FR: Annuler pendant une attente de backoff termine la récupération rapidement
TEST_F(RecoveryOrchestratorTest, CancellationDuringBackoff) {
    config_.backoff_base = 10s;
    config_.backoff_cap = 60s;
    RecoveryOrchestrator slow(config_, metrics_, clock_);

    FailureContext context = transientFailure();
    context.category = ErrorCategory::RESOURCE_EXHAUSTION;
    EXPECT_CALL(executor_, retryStage(_, 1)).WillOnce(Return(failed("quota exceeded")));

    std::thread canceller([this] {
        std::this_thread::sleep_for(50ms);
        token_.cancel();
    });
    auto start = std::chrono::steady_clock::now();
    auto result = slow.recover(context, executor_, token_);
    canceller.join();

    EXPECT_LT(std::chrono::steady_clock::now() - start, 5s);
    EXPECT_EQ(result.status, RecoveryStatus::CANCELLED);
    ASSERT_EQ(result.attempts.size(), 2u);
    EXPECT_EQ(result.attempts[1].attempt_number, 2);
}

// EN: Results are kept per session until cleared
// FR: Les résultats sont conservés par session jusqu'à leur effacement
TEST_F(RecoveryOrchestratorTest, HistoryPerSession) {
    EXPECT_CALL(executor_, retryStage(_, _)).WillRepeatedly(Return(succeeded()));
    orchestrator_->recover(transientFailure(), executor_, token_);
    orchestrator_->recover(transientFailure(), executor_, token_);

    EXPECT_EQ(orchestrator_->history("session-7").size(), 2u);
    EXPECT_TRUE(orchestrator_->history("session-8").empty());
    orchestrator_->clearSession("session-7");
    EXPECT_TRUE(orchestrator_->history("session-7").empty());
}

// EN: Status derivation looks at the last outcome of each action type
// FR: La dérivation du statut regarde le dernier résultat de chaque type d'action
TEST_F(RecoveryOrchestratorTest, StatusDerivation) {
    bool can_resume = true;
    EXPECT_EQ(RecoveryOrchestrator::deriveStatus({}, can_resume), RecoveryStatus::FAILED);
    EXPECT_FALSE(can_resume);

    RecoveryAttempt failed_retry;
    failed_retry.status = AttemptStatus::FAILED;
    RecoveryAttempt good_retry;
    good_retry.status = AttemptStatus::SUCCEEDED;
    EXPECT_EQ(RecoveryOrchestrator::deriveStatus({failed_retry, good_retry}, can_resume), RecoveryStatus::SUCCESS);
    EXPECT_TRUE(can_resume);
    EXPECT_EQ(RecoveryOrchestrator::deriveStatus({good_retry, failed_retry}, can_resume), RecoveryStatus::FAILED);
}

// EN: Invalid settings and a missing clock are refused
// FR: Les réglages invalides et une horloge absente sont refusés
TEST_F(RecoveryOrchestratorTest, ConfigurationValidation) {
    RecoveryConfig config;
    config.max_retry_attempts = 0;
    config.backoff_factor = 0.5;
    config.backoff_cap = 1000ms;

    std::vector<std::string> errors;
    EXPECT_FALSE(RecoveryOrchestrator::validateConfig(config, errors));
    EXPECT_EQ(errors.size(), 3u);
    EXPECT_THROW(RecoveryOrchestrator(config, metrics_, clock_), std::invalid_argument);
    EXPECT_THROW(RecoveryOrchestrator(RecoveryConfig{}, metrics_, nullptr), std::invalid_argument);
}
