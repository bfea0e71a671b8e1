// EN: Unit tests for the Pipeline State Machine - session lifecycle, worker reports, gates, recovery and escalation.
// FR: Tests unitaires de la Pipeline State Machine - cycle de vie, rapports des workers, gates, récupération et escalade.

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <future>
#include <memory>
#include <stdexcept>
#include <thread>

#include "infrastructure/storage/session_archive.hpp"
#include "infrastructure/system/error_recovery.hpp"
#include "orchestrator/circuit_breaker_manager.hpp"
#include "orchestrator/orchestration_config.hpp"
#include "orchestrator/pipeline_state_machine.hpp"
#include "orchestrator/stage_registry.hpp"
#include "test_helpers.hpp"

using namespace OBF;
using namespace OBF::Orchestrator;
using namespace std::chrono_literals;
using ::testing::_;
using ::testing::Gt;
using ::testing::HasSubstr;
using ::testing::InSequence;
using ::testing::Invoke;
using ::testing::NiceMock;
using ::testing::Return;
using ::testing::Throw;

namespace {

const std::vector<std::string> kStages = {"data_collection", "data_aggregation", "it_provisioning",
                                          "contract_management", "meeting_coordination"};

nlohmann::json passingPayload(const std::string& stage) {
    if (stage == "data_collection") {
        return {{"initialDataCollected", true}, {"confirmationCompleted", true}, {"documentationValidated", true},
                {"collectionCompleteness", 95}, {"dataQualityScore", 90}};
    }
    if (stage == "data_aggregation") {
        return {{"aggregationCompleted", true}, {"overallQualityScore", 88}, {"validationPassed", true},
                {"readyForSequential", true}, {"completenessScore", 90}, {"consistencyScore", 92},
                {"reliabilityScore", 85}};
    }
    if (stage == "it_provisioning") {
        return {{"credentialsCreated", true}, {"equipmentAssigned", true}, {"securityCompliance", 98}};
    }
    if (stage == "contract_management") {
        return {{"contractGenerated", true}, {"legalValidationPassed", true}, {"signatureProcessComplete", true},
                {"documentArchived", true}, {"complianceScore", 95}, {"legalValidationScore", 97}};
    }
    return {{"stakeholdersEngaged", 4}, {"meetingsScheduled", 3}, {"calendarIntegrationActive", true},
            {"stakeholderEngagementScore", 85}, {"schedulingEfficiencyScore", 80}};
}

bool contains(const std::vector<std::string>& items, const std::string& text) {
    return std::any_of(items.begin(), items.end(),
                       [&text](const std::string& item) { return item.find(text) != std::string::npos; });
}

bool ready(const std::shared_future<SessionResult>& future) {
    return future.wait_for(2s) == std::future_status::ready;
}

StageRecord record(const std::string& stage, StageStatus status, double progress = 0.0, int errors = 0) {
    StageRecord r;
    r.stage_id = stage;
    r.status = status;
    r.progress_percent = progress;
    r.error_count = errors;
    return r;
}

} // namespace

// EN: Test fixture wiring the built-in catalog to mocked workers and a manual clock
// FR: Fixture de test branchant le catalogue intégré sur des workers simulés et une horloge manuelle
class PipelineStateMachineTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_ = DefaultCatalog::onboardingDefaults();
        config_.pipeline.worker_threads = 2;
        config_.recovery.immediate_delay = 1ms;
        config_.recovery.backoff_base = 5ms;
        config_.recovery.backoff_cap = 20ms;

        clock_ = std::make_shared<Testing::ManualClock>();
        dispatcher_ = std::make_shared<NiceMock<Testing::MockStageDispatcher>>();
        notifier_ = std::make_shared<NiceMock<Testing::MockNotificationService>>();
        ON_CALL(*dispatcher_, dispatch(_, _, _)).WillByDefault(Return(true));
        ON_CALL(*notifier_, notify(_, _, _, _)).WillByDefault(Return(std::optional<std::string>("notif-1")));
        ON_CALL(*notifier_, createIncident(_)).WillByDefault(Return(std::optional<std::string>("INC-1")));
    }

    void TearDown() override {
        machine_.reset();
    }

    PipelineDependencies dependencies() {
        PipelineDependencies deps;
        deps.dispatcher = dispatcher_;
        deps.notifier = notifier_;
        deps.clock = clock_;
        return deps;
    }

    PipelineStateMachine& machine() {
        if (!machine_) {
            machine_ = std::make_unique<PipelineStateMachine>(config_, dependencies(), metrics_);
        }
        return *machine_;
    }

    SessionHandle start(const std::string& id = "onb-ana") {
        auto handle = machine().startSession("employee-ana", id);
        machine().waitForIdle();
        return handle;
    }

    OutcomeAck complete(const std::string& session, const std::string& stage) {
        auto ack = machine().reportStageOutcome(session, stage, StageStatus::COMPLETED, passingPayload(stage));
        machine().waitForIdle();
        return ack;
    }

    OutcomeAck fail(const std::string& session, const std::string& stage, const std::string& error) {
        auto ack = machine().reportStageOutcome(session, stage, StageStatus::FAILED, {{"attempt", "worker"}}, {error});
        machine().waitForIdle();
        return ack;
    }

    SessionSnapshot snapshot(const std::string& session) {
        auto snap = machine().getSessionSnapshot(session);
        EXPECT_TRUE(snap.has_value());
        return snap.value_or(SessionSnapshot{});
    }

    Testing::QuietLogger quiet_;
    OrchestrationConfig config_;
    MetricsAggregator metrics_;
    std::shared_ptr<Testing::ManualClock> clock_;
    std::shared_ptr<NiceMock<Testing::MockStageDispatcher>> dispatcher_;
    std::shared_ptr<NiceMock<Testing::MockNotificationService>> notifier_;
    std::unique_ptr<PipelineStateMachine> machine_;
};

// EN: Five passing reports walk the session through every stage in order
// FR: Cinq rapports valides font traverser chaque étape dans l'ordre
TEST_F(PipelineStateMachineTest, HappyPathCompletesSession) {
    {
        InSequence sequence;
        for (const auto& stage : kStages) {
            EXPECT_CALL(*dispatcher_, dispatch("onb-ana", stage, 1)).WillOnce(Return(true));
        }
    }

    auto handle = start();
    EXPECT_EQ(handle.session_id, "onb-ana");
    for (const auto& stage : kStages) {
        EXPECT_EQ(complete("onb-ana", stage).disposition, OutcomeDisposition::ACCEPTED);
    }

    ASSERT_TRUE(ready(handle.result));
    const SessionResult& result = handle.result.get();
    EXPECT_TRUE(result.succeeded());
    EXPECT_TRUE(result.failure_reason.empty());
    EXPECT_DOUBLE_EQ(result.snapshot.overall_progress, 100.0);
    EXPECT_EQ(result.snapshot.quality_gate_results.size(), 5u);
    EXPECT_EQ(result.snapshot.sla_results.size(), 5u);
    for (const auto& stage : result.snapshot.stages) {
        EXPECT_EQ(stage.status, StageStatus::COMPLETED) << stage.stage_id;
        EXPECT_TRUE(stage.completed_at.has_value());
    }

    EXPECT_EQ(metrics_.get(Metric::SESSIONS_COMPLETED), 1u);
    EXPECT_EQ(metrics_.get(Metric::ACTIVE_SESSIONS), 0u);
    EXPECT_TRUE(machine().activeSessions().empty());
    EXPECT_TRUE(machine().evictSession("onb-ana"));
    EXPECT_FALSE(machine().getSessionSnapshot("onb-ana").has_value());
}

// EN: Session ids are generated when omitted and validated when given
// FR: Les ids de session sont générés si absents et validés s'ils sont fournis
TEST_F(PipelineStateMachineTest, StartValidation) {
    auto generated = machine().startSession("employee-bo");
    EXPECT_EQ(generated.session_id.rfind("onb-", 0), 0u);

    start("onb-ana");
    EXPECT_THROW(machine().startSession("employee-ana", "onb-ana"), std::invalid_argument);
    EXPECT_THROW(machine().startSession("", "onb-cy"), std::invalid_argument);
    EXPECT_THROW(machine().startSession("employee-cy", "../etc"), std::invalid_argument);

    auto active = machine().activeSessions();
    EXPECT_EQ(active.size(), 2u);
    EXPECT_FALSE(machine().evictSession("onb-ana"));
    EXPECT_EQ(metrics_.get(Metric::SESSIONS_STARTED), 2u);
}

// EN: Repeated identical reports are duplicates; stale or premature reports are rejected
// FR: Les rapports identiques répétés sont des doublons ; les rapports périmés ou prématurés sont rejetés
TEST_F(PipelineStateMachineTest, DuplicateAndOutOfOrderReports) {
    start();

    EXPECT_EQ(machine().reportStageOutcome("onb-ana", "data_aggregation", StageStatus::COMPLETED,
                                           passingPayload("data_aggregation")).disposition,
              OutcomeDisposition::REJECTED);

    auto first = machine().reportStageOutcome("onb-ana", "data_collection", StageStatus::COMPLETED,
                                              passingPayload("data_collection"));
    auto second = machine().reportStageOutcome("onb-ana", "data_collection", StageStatus::COMPLETED,
                                               passingPayload("data_collection"));
    machine().waitForIdle();
    EXPECT_EQ(first.disposition, OutcomeDisposition::ACCEPTED);
    EXPECT_EQ(second.disposition, OutcomeDisposition::DUPLICATE);

    auto replay = machine().reportStageOutcome("onb-ana", "data_collection", StageStatus::COMPLETED,
                                               passingPayload("data_collection"));
    EXPECT_EQ(replay.disposition, OutcomeDisposition::DUPLICATE);

    auto changed = machine().reportStageOutcome("onb-ana", "data_collection", StageStatus::FAILED,
                                                nlohmann::json::object(), {"late failure"});
    EXPECT_EQ(changed.disposition, OutcomeDisposition::REJECTED);
    EXPECT_EQ(changed.reason, "Stage already completed");

    EXPECT_EQ(machine().reportStageOutcome("onb-ana", "data_aggregation", StageStatus::WAITING,
                                           nlohmann::json::object()).disposition,
              OutcomeDisposition::REJECTED);
    EXPECT_EQ(machine().reportStageOutcome("onb-zed", "data_collection", StageStatus::COMPLETED,
                                           nlohmann::json::object()).reason,
              "Unknown session");
    EXPECT_EQ(machine().reportStageOutcome("onb-ana", "welcome_lunch", StageStatus::COMPLETED,
                                           nlohmann::json::object()).reason,
              "Unknown stage");

    auto snap = snapshot("onb-ana");
    EXPECT_EQ(snap.current_stage, "data_aggregation");
    EXPECT_EQ(snap.stages[0].status, StageStatus::COMPLETED);
    EXPECT_EQ(snap.stages[1].status, StageStatus::PROCESSING);
    EXPECT_EQ(metrics_.get(Metric::OUTCOMES_DUPLICATE), 2u);
}

// EN: Progress reports move the overall percentage and show in the snapshot
// FR: Les rapports de progression font bouger le pourcentage global et apparaissent dans le snapshot
TEST_F(PipelineStateMachineTest, ProgressAndSnapshot) {
    start();

    EXPECT_TRUE(machine().reportProgress("onb-ana", "data_collection", 40.0));
    EXPECT_FALSE(machine().reportProgress("onb-ana", "data_aggregation", 10.0));
    auto heartbeat = machine().reportStageOutcome("onb-ana", "data_collection", StageStatus::PROCESSING,
                                                  {{"progress_percent", 30.0}});
    EXPECT_EQ(heartbeat.disposition, OutcomeDisposition::ACCEPTED);

    auto snap = snapshot("onb-ana");
    EXPECT_EQ(snap.subject_id, "employee-ana");
    EXPECT_EQ(snap.phase, SessionPhase::IN_STAGE);
    EXPECT_EQ(snap.current_stage, "data_collection");
    EXPECT_EQ(snap.current_stage_index, 0u);
    ASSERT_EQ(snap.stages.size(), 5u);
    EXPECT_DOUBLE_EQ(snap.stages[0].progress_percent, 40.0);
    EXPECT_DOUBLE_EQ(snap.overall_progress, 8.0);
    EXPECT_EQ(snap.started_at, clock_->now());
    EXPECT_FALSE(snap.circuit_states.empty());
    EXPECT_TRUE(snap.blocking_issues.empty());

    clock_->advance(45min);
    snap = snapshot("onb-ana");
    EXPECT_TRUE(contains(snap.blocking_issues, "Stage data_collection stalled for 45 minutes"));

    auto json = snap.toJson();
    EXPECT_EQ(json["session_id"], "onb-ana");
    EXPECT_EQ(json["phase"], "in_stage");
    EXPECT_EQ(json["stages"].size(), 5u);
}

// EN: Extensions are recorded once per event id on the running stage
// FR: Les extensions sont enregistrées une fois par id d'événement sur l'étape en cours
TEST_F(PipelineStateMachineTest, SlaExtension) {
    start();

    EXPECT_EQ(machine().requestSlaExtension("onb-ana", "data_collection", "ext-1"), ExtensionDecision::GRANTED);
    EXPECT_EQ(machine().requestSlaExtension("onb-ana", "data_collection", "ext-1"),
              ExtensionDecision::ALREADY_GRANTED);
    EXPECT_EQ(machine().requestSlaExtension("onb-ana", "data_collection", "ext-2"), ExtensionDecision::DENIED);
    EXPECT_EQ(machine().requestSlaExtension("onb-zed", "data_collection", "ext-1"), ExtensionDecision::DENIED);

    auto snap = snapshot("onb-ana");
    EXPECT_EQ(snap.stages[0].extension_events, std::vector<std::string>{"ext-1"});
}

// EN: A soft gate holds the stage, warns the SLA contacts and accepts a corrected report
// FR: Un gate souple retient l'étape, avertit les contacts SLA et accepte un rapport corrigé
TEST_F(PipelineStateMachineTest, SoftGateFailureAcceptsResubmission) {
    EXPECT_CALL(*notifier_, notify(_, EscalationLevel::WARNING, HasSubstr("data_collection"), false))
        .WillOnce(Return(std::optional<std::string>("notif-7")));
    start();

    auto weak = machine().reportStageOutcome("onb-ana", "data_collection", StageStatus::COMPLETED,
                                             {{"initialDataCollected", true}, {"collectionCompleteness", 90}});
    machine().waitForIdle();
    EXPECT_EQ(weak.disposition, OutcomeDisposition::ACCEPTED);

    auto held = snapshot("onb-ana");
    EXPECT_EQ(held.stages[0].status, StageStatus::ESCALATED);
    EXPECT_EQ(held.stages[0].gate_failures, 1);
    ASSERT_EQ(held.quality_gate_results.size(), 1u);
    EXPECT_EQ(held.quality_gate_results[0].status, GateStatus::MANUAL_REVIEW);
    EXPECT_TRUE(contains(held.blocking_issues, "Stage data_collection is held by its quality gate"));
    EXPECT_TRUE(contains(held.blocking_issues, "Stage data_collection awaits manual review"));
    EXPECT_EQ(metrics_.get(Metric::NOTIFICATIONS_SENT), 1u);

    EXPECT_EQ(complete("onb-ana", "data_collection").disposition, OutcomeDisposition::ACCEPTED);
    auto moved = snapshot("onb-ana");
    EXPECT_EQ(moved.stages[0].status, StageStatus::COMPLETED);
    EXPECT_EQ(moved.current_stage, "data_aggregation");
    EXPECT_TRUE(moved.blocking_issues.empty());
}

// EN: A blocking gate waits for an authorized bypass of the current stage
// FR: Un gate bloquant attend un bypass autorisé de l'étape courante
TEST_F(PipelineStateMachineTest, BlockedGateBypass) {
    start();
    complete("onb-ana", "data_collection");
    complete("onb-ana", "data_aggregation");

    machine().reportStageOutcome("onb-ana", "it_provisioning", StageStatus::COMPLETED,
                                 {{"credentialsCreated", true}, {"equipmentAssigned", false},
                                  {"securityCompliance", 80}});
    machine().waitForIdle();
    auto held = snapshot("onb-ana");
    EXPECT_EQ(held.stages[2].status, StageStatus::ESCALATED);
    EXPECT_EQ(held.quality_gate_results.back().status, GateStatus::FAILED);

    BypassRequest manager{"manager", "jo.manager", "start date is tomorrow"};
    auto denied = machine().bypassStage("onb-ana", "it_provisioning", manager);
    EXPECT_EQ(denied.disposition, OutcomeDisposition::REJECTED);
    EXPECT_THAT(denied.reason, HasSubstr("cannot bypass"));

    BypassRequest hr{"hr_manager", "kim.hr", "meetings later"};
    EXPECT_EQ(machine().bypassStage("onb-ana", "meeting_coordination", hr).reason,
              "Only the current stage can be bypassed");
    EXPECT_THAT(machine().bypassStage("onb-ana", "contract_management", BypassRequest{"director", "d", "r"}).reason,
                HasSubstr("is not bypassable"));

    BypassRequest it{"it_manager", "lee.it", "laptop ships Monday"};
    EXPECT_EQ(machine().bypassStage("onb-ana", "it_provisioning", it).disposition, OutcomeDisposition::ACCEPTED);
    machine().waitForIdle();

    auto moved = snapshot("onb-ana");
    EXPECT_EQ(moved.stages[2].status, StageStatus::COMPLETED);
    EXPECT_EQ(moved.current_stage, "contract_management");
    const auto& gate = moved.quality_gate_results[2];
    EXPECT_EQ(gate.status, GateStatus::BYPASS);
    EXPECT_EQ(gate.bypassed_by, std::optional<std::string>("lee.it"));

    EXPECT_EQ(machine().bypassStage("onb-ana", "it_provisioning", it).disposition, OutcomeDisposition::REJECTED);
}

// EN: A transient worker failure is retried and the stage finishes normally
// FR: Un échec transitoire du worker est retenté et l'étape se termine normalement
TEST_F(PipelineStateMachineTest, WorkerFailureRecovers) {
    EXPECT_CALL(*dispatcher_, dispatch(_, _, _)).WillRepeatedly(Return(true));
    EXPECT_CALL(*dispatcher_, dispatch("onb-ana", "data_collection", 1)).WillOnce(Return(true));
    EXPECT_CALL(*dispatcher_, dispatch("onb-ana", "data_collection", 2)).WillOnce(Return(true));
    start();

    EXPECT_EQ(fail("onb-ana", "data_collection", "Connection timeout talking to hr_system").disposition,
              OutcomeDisposition::ACCEPTED);

    auto snap = snapshot("onb-ana");
    EXPECT_EQ(snap.stages[0].status, StageStatus::PROCESSING);
    EXPECT_EQ(snap.stages[0].error_count, 1);
    EXPECT_EQ(snap.stages[0].recoveries, 1);
    EXPECT_EQ(snap.stages[0].dispatch_attempts, 2);
    ASSERT_EQ(snap.recovery_results.size(), 1u);
    EXPECT_EQ(snap.recovery_results[0].status, RecoveryStatus::SUCCESS);
    EXPECT_EQ(snap.recovery_results[0].strategy, RecoveryStrategy::IMMEDIATE_RETRY);
    EXPECT_EQ(snap.recovery_attempts.size(), 1u);

    EXPECT_EQ(complete("onb-ana", "data_collection").disposition, OutcomeDisposition::ACCEPTED);
    EXPECT_EQ(snapshot("onb-ana").current_stage, "data_aggregation");
}

// EN: A worker that keeps refusing the retries leaves the session failed and escalated
// FR: Un worker qui refuse tous les retries laisse la session en échec et escaladée
TEST_F(PipelineStateMachineTest, ExhaustedRetriesFailSession) {
    ON_CALL(*dispatcher_, dispatch(_, "data_collection", Gt(1))).WillByDefault(Return(false));
    auto handle = start();

    fail("onb-ana", "data_collection", "Connection timeout talking to hr_system");

    ASSERT_TRUE(ready(handle.result));
    const SessionResult& result = handle.result.get();
    EXPECT_EQ(result.phase, SessionPhase::FAILED_REQUIRES_RECOVERY);
    EXPECT_THAT(result.failure_reason, HasSubstr("Recovery failed for stage data_collection"));

    ASSERT_EQ(result.snapshot.recovery_results.size(), 1u);
    EXPECT_EQ(result.snapshot.recovery_results[0].status, RecoveryStatus::FAILED);
    EXPECT_EQ(result.snapshot.recovery_results[0].attempts.size(),
              static_cast<size_t>(config_.recovery.max_retry_attempts));

    ASSERT_FALSE(result.snapshot.escalation_events.empty());
    const auto& escalation = result.snapshot.escalation_events.back();
    EXPECT_EQ(escalation.rule_id, "manual_escalation");
    EXPECT_EQ(escalation.level, EscalationLevel::CRITICAL);
    EXPECT_EQ(metrics_.get(Metric::SESSIONS_FAILED), 1u);

    EXPECT_EQ(machine().reportStageOutcome("onb-ana", "data_collection", StageStatus::COMPLETED,
                                           passingPayload("data_collection")).disposition,
              OutcomeDisposition::REJECTED);
}

// EN: Each stage gets a bounded number of recovery runs
// FR: Chaque étape dispose d'un nombre borné de récupérations
TEST_F(PipelineStateMachineTest, RecoveryBudgetPerStage) {
    auto handle = start();

    fail("onb-ana", "data_collection", "Connection timeout (1)");
    fail("onb-ana", "data_collection", "Connection timeout (2)");
    EXPECT_NE(handle.result.wait_for(0s), std::future_status::ready);
    fail("onb-ana", "data_collection", "Connection timeout (3)");

    ASSERT_TRUE(ready(handle.result));
    const SessionResult& result = handle.result.get();
    EXPECT_EQ(result.phase, SessionPhase::FAILED_REQUIRES_RECOVERY);
    EXPECT_EQ(result.failure_reason, "Recovery attempts exhausted for stage data_collection");
    EXPECT_EQ(result.snapshot.stages[0].recoveries, config_.pipeline.max_stage_recoveries);
    EXPECT_EQ(result.snapshot.stages[0].error_count, 3);

    const auto& events = result.snapshot.escalation_events;
    EXPECT_TRUE(std::any_of(events.begin(), events.end(),
                            [](const EscalationEvent& e) { return e.rule_id == "agent_failure_recovery"; }));
}

// EN: An open dependency circuit fails the dispatch without calling the worker
// FR: Un circuit de dépendance ouvert fait échouer l'envoi sans appeler le worker
TEST_F(PipelineStateMachineTest, OpenCircuitBlocksDispatch) {
    EXPECT_CALL(*dispatcher_, dispatch(_, _, _)).Times(0);
    for (int i = 0; i < config_.circuit_breaker.defaults.failure_threshold; ++i) {
        machine().circuits().recordOutcome("hr_system", false, clock_->now());
    }
    ASSERT_EQ(machine().circuits().getState("hr_system"), BreakerState::OPEN);

    auto handle = start();

    ASSERT_TRUE(ready(handle.result));
    const SessionResult& result = handle.result.get();
    EXPECT_EQ(result.phase, SessionPhase::FAILED_REQUIRES_RECOVERY);
    EXPECT_THAT(result.failure_reason, HasSubstr("data_collection"));
    EXPECT_EQ(result.snapshot.stages[0].errors, std::vector<std::string>{"Dependency unavailable: hr_system"});
    ASSERT_EQ(result.snapshot.recovery_results.size(), 1u);
    EXPECT_EQ(result.snapshot.recovery_results[0].category, ErrorCategory::DEPENDENCY_UNAVAILABLE);
}

// EN: A stage failing during a half-open trial reopens the dependency circuit
// FR: Une étape en échec pendant un essai half-open rouvre le circuit de la dépendance
TEST_F(PipelineStateMachineTest, HalfOpenDependencyReopensOnStageFailure) {
    CircuitBreakerConfig hr;
    hr.failure_threshold = 2;
    hr.recovery_timeout = 5000ms;
    machine().circuits().setServiceConfig("hr_system", hr);
    machine().circuits().recordOutcome("hr_system", false, clock_->now());
    machine().circuits().recordOutcome("hr_system", false, clock_->now());
    ASSERT_EQ(machine().circuits().getState("hr_system"), BreakerState::OPEN);

    clock_->advance(5s);
    EXPECT_CALL(*dispatcher_, dispatch("onb-ana", "data_collection", 1)).WillOnce(Return(true));
    auto handle = start();
    ASSERT_EQ(machine().circuits().getState("hr_system"), BreakerState::HALF_OPEN);

    fail("onb-ana", "data_collection", "Connection timeout talking to hr_system");

    EXPECT_EQ(machine().circuits().getState("hr_system"), BreakerState::OPEN);
    ASSERT_TRUE(ready(handle.result));
    const SessionResult& result = handle.result.get();
    EXPECT_EQ(result.phase, SessionPhase::FAILED_REQUIRES_RECOVERY);
    EXPECT_THAT(result.failure_reason, HasSubstr("Recovery failed for stage data_collection"));
    ASSERT_EQ(result.snapshot.recovery_results.size(), 1u);
    ASSERT_FALSE(result.snapshot.recovery_results[0].attempts.empty());
    EXPECT_EQ(result.snapshot.recovery_results[0].attempts[0].status, AttemptStatus::REJECTED);

    clock_->advance(5s);
    EXPECT_TRUE(machine().circuits().allowRequest("hr_system", clock_->now()));
    EXPECT_EQ(machine().circuits().getState("hr_system"), BreakerState::HALF_OPEN);
}

// EN: A stage completing during a half-open trial closes the dependency circuit
// FR: Une étape terminée pendant un essai half-open ferme le circuit de la dépendance
TEST_F(PipelineStateMachineTest, HalfOpenDependencyClosesOnStageCompletion) {
    CircuitBreakerConfig hr;
    hr.failure_threshold = 2;
    hr.recovery_timeout = 5000ms;
    machine().circuits().setServiceConfig("hr_system", hr);
    machine().circuits().recordOutcome("hr_system", false, clock_->now());
    machine().circuits().recordOutcome("hr_system", false, clock_->now());

    clock_->advance(5s);
    start();
    ASSERT_EQ(machine().circuits().getState("hr_system"), BreakerState::HALF_OPEN);

    EXPECT_EQ(complete("onb-ana", "data_collection").disposition, OutcomeDisposition::ACCEPTED);
    EXPECT_EQ(machine().circuits().getState("hr_system"), BreakerState::CLOSED);
    EXPECT_EQ(snapshot("onb-ana").current_stage, "data_aggregation");
}

// EN: A paused session holds its next dispatch until resumed
// FR: Une session en pause retient son prochain envoi jusqu'à la reprise
TEST_F(PipelineStateMachineTest, PauseDefersAdvance) {
    start();
    EXPECT_TRUE(machine().pauseSession("onb-ana", "waiting for the badge office"));
    EXPECT_FALSE(machine().pauseSession("onb-ana", "again"));

    EXPECT_CALL(*dispatcher_, dispatch("onb-ana", "data_aggregation", 1)).Times(0);
    complete("onb-ana", "data_collection");

    auto paused = snapshot("onb-ana");
    EXPECT_TRUE(paused.paused);
    EXPECT_EQ(paused.stages[1].status, StageStatus::WAITING);
    EXPECT_TRUE(contains(paused.blocking_issues, "Pipeline paused: waiting for the badge office"));
    ::testing::Mock::VerifyAndClearExpectations(dispatcher_.get());
    ON_CALL(*dispatcher_, dispatch(_, _, _)).WillByDefault(Return(true));

    EXPECT_CALL(*dispatcher_, dispatch("onb-ana", "data_aggregation", 1)).WillOnce(Return(true));
    EXPECT_TRUE(machine().resumeSession("onb-ana"));
    EXPECT_FALSE(machine().resumeSession("onb-ana"));
    machine().waitForIdle();

    auto resumed = snapshot("onb-ana");
    EXPECT_FALSE(resumed.paused);
    EXPECT_EQ(resumed.stages[1].status, StageStatus::PROCESSING);
}

// EN: Cancellation resolves the future at once and freezes the session
// FR: L'annulation résout le future immédiatement et fige la session
TEST_F(PipelineStateMachineTest, CancellationResolvesFuture) {
    auto handle = start();

    EXPECT_TRUE(machine().cancelSession("onb-ana", "offer withdrawn"));
    EXPECT_FALSE(machine().cancelSession("onb-ana", "twice"));
    EXPECT_FALSE(machine().cancelSession("onb-zed"));

    ASSERT_EQ(handle.result.wait_for(0s), std::future_status::ready);
    EXPECT_EQ(handle.result.get().phase, SessionPhase::CANCELLED);
    EXPECT_EQ(handle.result.get().failure_reason, "offer withdrawn");

    auto late = machine().reportStageOutcome("onb-ana", "data_collection", StageStatus::COMPLETED,
                                             passingPayload("data_collection"));
    EXPECT_EQ(late.disposition, OutcomeDisposition::REJECTED);
    EXPECT_EQ(late.reason, "Session is cancelled");
    EXPECT_FALSE(machine().pauseSession("onb-ana", "too late"));
    EXPECT_EQ(metrics_.get(Metric::SESSIONS_CANCELLED), 1u);

    auto stored = machine().sessionResult("onb-ana");
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(stored->get().phase, SessionPhase::CANCELLED);
}

// EN: A breached high-criticality stage pauses the session and opens an incident
// FR: Une étape critique en violation met la session en pause et ouvre un incident
TEST_F(PipelineStateMachineTest, SlaBreachEscalatesAndPauses) {
    EXPECT_CALL(*notifier_, createIncident(_)).WillOnce(Return(std::optional<std::string>("INC-42")));
    start();
    complete("onb-ana", "data_collection");

    clock_->advance(14min);
    machine().evaluateTimers();
    machine().waitForIdle();

    auto snap = snapshot("onb-ana");
    ASSERT_EQ(snap.sla_results.size(), 2u);
    EXPECT_EQ(snap.sla_results[1].stage_id, "data_aggregation");
    EXPECT_EQ(snap.sla_results[1].status, SlaStatus::BREACHED);
    EXPECT_TRUE(snap.paused);

    auto breach = std::find_if(snap.escalation_events.begin(), snap.escalation_events.end(),
                               [](const EscalationEvent& e) { return e.rule_id == "critical_sla_breach"; });
    ASSERT_NE(breach, snap.escalation_events.end());
    EXPECT_EQ(breach->stage_id, "data_aggregation");
    EXPECT_EQ(breach->incident_id, std::optional<std::string>("INC-42"));
    EXPECT_TRUE(breach->requires_ack);

    EXPECT_TRUE(machine().acknowledgeEscalation(breach->event_id, "ops-lead"));
    EXPECT_TRUE(machine().resolveEscalation(breach->event_id, "worker restarted"));
    EXPECT_FALSE(machine().acknowledgeEscalation("esc-999", "ops-lead"));

    machine().evaluateTimers();
    machine().waitForIdle();
    auto again = snapshot("onb-ana");
    EXPECT_EQ(std::count_if(again.escalation_events.begin(), again.escalation_events.end(),
                            [](const EscalationEvent& e) { return e.rule_id == "critical_sla_breach"; }),
              1);
}

// EN: A stage that finished late no longer triggers breach rules once the next stage runs
// FR: Une étape terminée en retard ne déclenche plus les règles de violation une fois l'étape suivante lancée
TEST_F(PipelineStateMachineTest, LateCompletedStageStaysQuiet) {
    EXPECT_CALL(*notifier_, createIncident(_)).Times(0);
    start();
    complete("onb-ana", "data_collection");

    clock_->advance(14min);
    EXPECT_EQ(complete("onb-ana", "data_aggregation").disposition, OutcomeDisposition::ACCEPTED);
    machine().evaluateTimers();
    machine().waitForIdle();

    auto snap = snapshot("onb-ana");
    EXPECT_EQ(snap.current_stage, "it_provisioning");
    EXPECT_EQ(snap.stages[2].status, StageStatus::PROCESSING);
    ASSERT_EQ(snap.sla_results.size(), 3u);
    EXPECT_EQ(snap.sla_results[1].stage_id, "data_aggregation");
    EXPECT_EQ(snap.sla_results[1].status, SlaStatus::BREACHED);
    EXPECT_EQ(snap.sla_results[2].status, SlaStatus::ON_TIME);
    EXPECT_FALSE(snap.paused);
    EXPECT_TRUE(std::none_of(snap.escalation_events.begin(), snap.escalation_events.end(),
                             [](const EscalationEvent& e) { return e.rule_id == "critical_sla_breach"; }));
}

// EN: A gate warning that cannot be delivered is counted and the stage stays held
// FR: Un avertissement de gate non délivrable est compté et l'étape reste retenue
TEST_F(PipelineStateMachineTest, GateWarningDeliveryFailure) {
    EXPECT_CALL(*notifier_, notify(_, EscalationLevel::WARNING, HasSubstr("data_collection"), false))
        .WillOnce(Throw(std::runtime_error("smtp down")));
    auto handle = start();

    auto weak = machine().reportStageOutcome("onb-ana", "data_collection", StageStatus::COMPLETED,
                                             {{"initialDataCollected", true}, {"collectionCompleteness", 90}});
    machine().waitForIdle();
    EXPECT_EQ(weak.disposition, OutcomeDisposition::ACCEPTED);

    auto held = snapshot("onb-ana");
    EXPECT_EQ(held.phase, SessionPhase::IN_STAGE);
    EXPECT_EQ(held.stages[0].status, StageStatus::ESCALATED);
    EXPECT_EQ(metrics_.get(Metric::NOTIFICATIONS_FAILED), 1u);
    EXPECT_EQ(metrics_.get(Metric::NOTIFICATIONS_SENT), 0u);
    EXPECT_NE(handle.result.wait_for(0s), std::future_status::ready);

    EXPECT_EQ(complete("onb-ana", "data_collection").disposition, OutcomeDisposition::ACCEPTED);
    EXPECT_EQ(snapshot("onb-ana").current_stage, "data_aggregation");
}

// EN: The current stage index never moves backwards through retries, restorations and resumptions
// FR: L'index de l'étape courante ne recule jamais au fil des retries, restaurations et reprises
TEST_F(PipelineStateMachineTest, CurrentStageIndexNeverDecreases) {
    auto handle = start();
    std::vector<size_t> indices{snapshot("onb-ana").current_stage_index};
    auto track = [&]() { indices.push_back(snapshot("onb-ana").current_stage_index); };

    complete("onb-ana", "data_collection");
    track();
    fail("onb-ana", "data_aggregation", "Connection timeout talking to database");
    track();
    complete("onb-ana", "data_aggregation");
    track();
    fail("onb-ana", "it_provisioning", "Validation failed: missing field badge_id");
    track();
    complete("onb-ana", "it_provisioning");
    track();
    fail("onb-ana", "contract_management", "State mismatch in contract draft");
    track();
    complete("onb-ana", "contract_management");
    track();
    complete("onb-ana", "meeting_coordination");
    track();

    EXPECT_TRUE(std::is_sorted(indices.begin(), indices.end()));
    EXPECT_EQ(indices[2], 1u);
    EXPECT_EQ(indices[4], 2u);
    EXPECT_EQ(indices[6], 3u);

    ASSERT_TRUE(ready(handle.result));
    const SessionResult& result = handle.result.get();
    EXPECT_TRUE(result.succeeded());
    ASSERT_EQ(result.snapshot.recovery_results.size(), 3u);
    EXPECT_EQ(result.snapshot.recovery_results[0].strategy, RecoveryStrategy::IMMEDIATE_RETRY);
    EXPECT_EQ(result.snapshot.recovery_results[1].strategy, RecoveryStrategy::WORKFLOW_RESUMPTION);
    EXPECT_EQ(result.snapshot.recovery_results[2].strategy, RecoveryStrategy::STATE_RESTORATION);
    for (const auto& recovery : result.snapshot.recovery_results) {
        EXPECT_NE(recovery.status, RecoveryStatus::FAILED) << recovery.stage_id;
    }
}

// EN: A finished session is only evicted once its queued work has drained
// FR: Une session terminée n'est évincée qu'une fois son travail en file écoulé
TEST_F(PipelineStateMachineTest, EvictionWaitsForDrainingStrand) {
    std::promise<void> entered;
    std::promise<void> release;
    std::shared_future<void> released = release.get_future().share();
    EXPECT_CALL(*dispatcher_, dispatch("onb-ana", "data_collection", 1))
        .WillOnce(Invoke([&entered, released](const std::string&, const std::string&, int) {
            entered.set_value();
            released.wait();
            return true;
        }));

    machine().startSession("employee-ana", "onb-ana");
    bool running = entered.get_future().wait_for(2s) == std::future_status::ready;
    EXPECT_TRUE(running);
    EXPECT_TRUE(machine().cancelSession("onb-ana", "offer withdrawn"));
    if (running) {
        EXPECT_FALSE(machine().evictSession("onb-ana"));
    }

    release.set_value();
    machine().waitForIdle();
    EXPECT_TRUE(machine().evictSession("onb-ana"));
    EXPECT_FALSE(machine().getSessionSnapshot("onb-ana").has_value());
}

// EN: The background loop starts once and stops cleanly
// FR: La boucle de fond démarre une fois et s'arrête proprement
TEST_F(PipelineStateMachineTest, MonitoringLoop) {
    start();
    EXPECT_FALSE(machine().isMonitoring());
    machine().startMonitoring(5ms);
    machine().startMonitoring(5ms);
    EXPECT_TRUE(machine().isMonitoring());
    std::this_thread::sleep_for(20ms);
    machine().stopMonitoring();
    EXPECT_FALSE(machine().isMonitoring());
    machine().waitForIdle();

    auto snap = snapshot("onb-ana");
    ASSERT_EQ(snap.sla_results.size(), 1u);
    EXPECT_EQ(snap.sla_results[0].status, SlaStatus::ON_TIME);
}

// EN: Terminal snapshots land in the archive when one is configured
// FR: Les snapshots terminaux arrivent dans l'archive si elle est configurée
TEST_F(PipelineStateMachineTest, ArchiveStoresTerminalSnapshot) {
    const auto directory = std::filesystem::temp_directory_path() / "obf_pipeline_archive_test";
    std::filesystem::remove_all(directory);

    ArchiveOptions options;
    options.directory = directory.string();
    auto archive = std::make_shared<SessionArchive>(options);
    auto deps = dependencies();
    deps.archive = archive;
    machine_ = std::make_unique<PipelineStateMachine>(config_, deps, metrics_);

    auto handle = start();
    for (const auto& stage : kStages) {
        complete("onb-ana", stage);
    }
    ASSERT_TRUE(ready(handle.result));

    auto document = archive->load("onb-ana");
    ASSERT_TRUE(document.has_value());
    EXPECT_EQ((*document)["snapshot"]["phase"], "completed");
    EXPECT_EQ((*document)["registry"]["session_id"], "onb-ana");
    EXPECT_TRUE(document->contains("archived_at"));

    std::filesystem::remove_all(directory);
}

// EN: Shutdown cancels running sessions and refuses new ones
// FR: L'arrêt annule les sessions en cours et refuse les nouvelles
TEST_F(PipelineStateMachineTest, ShutdownCancelsRunningSessions) {
    auto handle = start();
    machine().shutdown();
    machine().shutdown();

    ASSERT_TRUE(ready(handle.result));
    EXPECT_EQ(handle.result.get().phase, SessionPhase::CANCELLED);
    EXPECT_EQ(handle.result.get().failure_reason, "Pipeline shutdown");
    EXPECT_THROW(machine().startSession("employee-bo"), std::runtime_error);
}

// EN: Construction refuses a missing dispatcher and an invalid configuration
// FR: La construction refuse un dispatcher absent et une configuration invalide
TEST_F(PipelineStateMachineTest, ConstructionValidation) {
    PipelineDependencies no_dispatcher;
    EXPECT_THROW({ PipelineStateMachine rejected(config_, no_dispatcher, metrics_); }, std::invalid_argument);

    OrchestrationConfig broken = config_;
    broken.stages.clear();
    try {
        PipelineStateMachine machine(broken, dependencies(), metrics_);
        FAIL() << "expected ConfigurationError";
    } catch (const ConfigurationError& e) {
        EXPECT_FALSE(e.errors().empty());
        EXPECT_THAT(std::string(e.what()), HasSubstr("stages must not be empty"));
    }

    EXPECT_EQ(machine().registry().definitions().size(), 5u);
}

// EN: Fingerprints depend on status, payload and errors
// FR: Les empreintes dépendent du statut, du payload et des erreurs
TEST(PipelineUtilsTest, OutcomeFingerprint) {
    nlohmann::json payload = {{"score", 90}};
    auto base = PipelineUtils::outcomeFingerprint(StageStatus::COMPLETED, payload, {});
    EXPECT_EQ(base.size(), 16u);
    EXPECT_EQ(base, PipelineUtils::outcomeFingerprint(StageStatus::COMPLETED, payload, {}));
    EXPECT_NE(base, PipelineUtils::outcomeFingerprint(StageStatus::FAILED, payload, {}));
    EXPECT_NE(base, PipelineUtils::outcomeFingerprint(StageStatus::COMPLETED, {{"score", 91}}, {}));
    EXPECT_NE(base, PipelineUtils::outcomeFingerprint(StageStatus::COMPLETED, payload, {"warning"}));
}

// EN: Completed stages plus the running stage's share
// FR: Étapes terminées plus la part de l'étape en cours
TEST(PipelineUtilsTest, OverallProgress) {
    std::vector<StageRecord> stages = {
        record("a", StageStatus::COMPLETED, 100.0),
        record("b", StageStatus::PROCESSING, 50.0),
        record("c", StageStatus::WAITING),
        record("d", StageStatus::WAITING)
    };
    EXPECT_DOUBLE_EQ(PipelineUtils::overallProgress(stages, 1), 37.5);
    EXPECT_DOUBLE_EQ(PipelineUtils::overallProgress(stages, 4), 25.0);
    EXPECT_DOUBLE_EQ(PipelineUtils::overallProgress({}, 0), 0.0);
}

// EN: Failed, held, stalled and error-heavy stages are listed
// FR: Les étapes en échec, retenues, bloquées et chargées d'erreurs sont listées
TEST(PipelineUtilsTest, BlockingIssues) {
    Testing::ManualClock clock;
    auto running = record("data_collection", StageStatus::PROCESSING);
    running.started_at = clock.now() - 40min;
    std::vector<StageRecord> stages = {
        running,
        record("data_aggregation", StageStatus::FAILED, 0.0, 5),
        record("it_provisioning", StageStatus::TIMEOUT),
        record("contract_management", StageStatus::ESCALATED)
    };

    std::vector<std::string> expected = {
        "Stage data_collection stalled for 40 minutes",
        "Stage data_aggregation failed",
        "Stage data_aggregation has 5 errors",
        "Stage it_provisioning timed out",
        "Stage contract_management is held by its quality gate"
    };
    EXPECT_EQ(PipelineUtils::blockingIssues(stages, clock.now(), 3, 30.0), expected);
    EXPECT_EQ(PipelineUtils::blockingIssues(stages, clock.now() - 15min, 10, 30.0).size(), 3u);
}
