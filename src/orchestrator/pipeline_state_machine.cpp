// EN: Implementation of the Pipeline State Machine - one serialized mailbox per session on a shared thread pool.
// FR: Implémentation de la Pipeline State Machine - une boîte aux lettres sérialisée par session sur un pool partagé.

#include "orchestrator/pipeline_state_machine.hpp"

#include "infrastructure/config/config_manager.hpp"
#include "infrastructure/logging/logger.hpp"
#include "infrastructure/system/error_recovery.hpp"
#include "infrastructure/threading/thread_pool.hpp"
#include "orchestrator/circuit_breaker_manager.hpp"
#include "orchestrator/escalation_rule_engine.hpp"
#include "orchestrator/http_collaborators.hpp"
#include "orchestrator/quality_gate_engine.hpp"
#include "orchestrator/recovery_orchestrator.hpp"
#include "orchestrator/sla_monitor.hpp"
#include "orchestrator/stage_registry.hpp"

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <deque>
#include <functional>
#include <iomanip>
#include <map>
#include <mutex>
#include <set>
#include <shared_mutex>
#include <sstream>
#include <stdexcept>
#include <thread>
#include <unordered_map>

namespace OBF {
namespace Orchestrator {

namespace {

constexpr const char* kModule = "pipeline";

OutcomeAck makeAck(OutcomeDisposition disposition, const std::string& reason) {
    OutcomeAck ack;
    ack.disposition = disposition;
    ack.reason = reason;
    return ack;
}

ActionOutcome makeOutcome(bool success, bool degraded, const std::string& message) {
    ActionOutcome outcome;
    outcome.success = success;
    outcome.degraded = degraded;
    outcome.message = message;
    return outcome;
}

} // namespace

// ---------------------------------------------------------------------------
// EN: PipelineUtils
// FR: PipelineUtils
// ---------------------------------------------------------------------------

namespace PipelineUtils {

std::string outcomeFingerprint(StageStatus status, const nlohmann::json& payload,
                               const std::vector<std::string>& errors) {
    nlohmann::json document = {
        {"status", OrchestrationUtils::stageStatusToString(status)},
        {"payload", payload},
        {"errors", errors}
    };
    std::ostringstream out;
    out << std::hex << std::setw(16) << std::setfill('0') << std::hash<std::string>{}(document.dump());
    return out.str();
}

double overallProgress(const std::vector<StageRecord>& stages, size_t current_index) {
    if (stages.empty()) {
        return 0.0;
    }
    double completed = 0.0;
    for (const auto& record : stages) {
        if (record.status == StageStatus::COMPLETED) {
            completed += 1.0;
        }
    }
    if (current_index < stages.size() && stages[current_index].status != StageStatus::COMPLETED) {
        completed += std::clamp(stages[current_index].progress_percent, 0.0, 100.0) / 100.0;
    }
    return std::min(100.0, completed / static_cast<double>(stages.size()) * 100.0);
}

std::vector<std::string> blockingIssues(const std::vector<StageRecord>& stages, TimePoint now,
                                        int max_errors, double stalled_minutes) {
    std::vector<std::string> issues;
    for (const auto& record : stages) {
        switch (record.status) {
            case StageStatus::FAILED:
                issues.push_back("Stage " + record.stage_id + " failed");
                break;
            case StageStatus::TIMEOUT:
                issues.push_back("Stage " + record.stage_id + " timed out");
                break;
            case StageStatus::ESCALATED:
                issues.push_back("Stage " + record.stage_id + " is held by its quality gate");
                break;
            case StageStatus::PROCESSING:
                if (record.started_at) {
                    double minutes = std::chrono::duration<double, std::ratio<60>>(now - *record.started_at).count();
                    if (minutes > stalled_minutes) {
                        issues.push_back("Stage " + record.stage_id + " stalled for " +
                                         std::to_string(static_cast<long long>(minutes)) + " minutes");
                    }
                }
                break;
            default:
                break;
        }
        if (record.error_count > max_errors) {
            issues.push_back("Stage " + record.stage_id + " has " + std::to_string(record.error_count) + " errors");
        }
    }
    return issues;
}

} // namespace PipelineUtils

// ---------------------------------------------------------------------------
// EN: Impl
// FR: Impl
// ---------------------------------------------------------------------------

class PipelineStateMachine::Impl : public EscalationActionHandler, public RecoveryActionExecutor {
public:
    struct Session {
        std::string id;
        std::string subject;
        TimePoint started_at;

        // EN: Guarded by mutex
        // FR: Protégés par mutex
        mutable std::mutex mutex;
        SessionPhase phase = SessionPhase::INITIATED;
        std::optional<TimePoint> finished_at;
        bool paused = false;
        std::string pause_reason;
        bool pending_advance = false;
        size_t current_index = 0;
        std::map<std::string, QualityGateResult> gate_results;
        std::map<std::string, SlaResult> sla_results;
        std::vector<RecoveryResult> recovery_results;
        std::set<std::string> manual_review;
        std::string failure_reason;

        // EN: Strand: tasks of one session never run concurrently
        // FR: Strand : les tâches d'une session ne s'exécutent jamais en parallèle
        std::mutex strand_mutex;
        std::deque<std::function<void(Session&)>> mailbox;
        bool draining = false;

        CancellationToken token;
        std::promise<SessionResult> promise;
        std::shared_future<SessionResult> result;
    };
    using SessionPtr = std::shared_ptr<Session>;

    Impl(const OrchestrationConfig& config, PipelineDependencies dependencies, MetricsAggregator& metrics);
    ~Impl() override;

    // EN: EscalationActionHandler
    // FR: EscalationActionHandler
    bool pausePipeline(const std::string& session_id, const std::string& reason) override;
    bool restartDependency(const std::string& session_id, const std::string& stage_id) override;
    bool routeToManualReview(const std::string& session_id, const std::string& stage_id) override;

    // EN: RecoveryActionExecutor
    // FR: RecoveryActionExecutor
    ActionOutcome retryStage(const FailureContext& context, int attempt) override;
    ActionOutcome restoreStage(const FailureContext& context) override;
    ActionOutcome resumeWorkflow(const FailureContext& context) override;
    ActionOutcome resetCircuit(const std::string& service) override;

    SessionHandle startSession(const std::string& subject_id, const std::string& session_id);
    OutcomeAck reportStageOutcome(const std::string& session_id, const std::string& stage_id, StageStatus status,
                                  const nlohmann::json& payload, const std::vector<std::string>& errors);
    bool reportProgress(const std::string& session_id, const std::string& stage_id, double percent);

    void evaluateTimers();
    void startMonitoring(std::chrono::milliseconds interval);
    void stopMonitoring();
    bool isMonitoring() const;

    bool pauseSession(const std::string& session_id, const std::string& reason);
    bool resumeSession(const std::string& session_id);
    bool cancelSession(const std::string& session_id, const std::string& reason);
    OutcomeAck bypassStage(const std::string& session_id, const std::string& stage_id, const BypassRequest& request);
    ExtensionDecision requestSlaExtension(const std::string& session_id, const std::string& stage_id,
                                          const std::string& extension_event_id);

    std::optional<SessionSnapshot> snapshot(const std::string& session_id) const;
    std::optional<std::shared_future<SessionResult>> sessionResult(const std::string& session_id) const;
    std::vector<std::string> activeSessions() const;
    bool evictSession(const std::string& session_id);
    void waitForIdle();
    void shutdown();

    TimePoint now() const { return deps_.clock->now(); }

    OrchestrationConfig config_;
    MetricsAggregator& metrics_;
    PipelineDependencies deps_;
    std::shared_ptr<SessionArchive> archive_;

    StageRegistry registry_;
    QualityGateEngine gates_;
    SlaMonitor sla_;
    std::shared_ptr<CircuitBreakerManager> circuits_;
    std::shared_ptr<EscalationRuleEngine> escalations_;
    RecoveryOrchestrator recovery_;

private:
    static PipelineDependencies normalize(PipelineDependencies dependencies, const OrchestrationConfig& config);
    static const OrchestrationConfig& validated(const OrchestrationConfig& config);

    SessionPtr find(const std::string& session_id) const;
    std::string generateSessionId();

    // EN: Strand plumbing
    // FR: Mécanique du strand
    void post(const SessionPtr& session, const std::string& name, std::function<void(Session&)> task);
    void drain(const SessionPtr& session);
    void finishTasks(size_t count);

    // EN: Session tasks, always run on the session strand
    // FR: Tâches de session, toujours exécutées sur le strand de la session
    void advance(Session& session);
    bool dispatchStage(Session& session, const std::string& stage_id, std::string& failure,
                       std::optional<std::string>& failing_service, bool& deferred);
    void handleOutcome(Session& session, const std::string& stage_id, StageStatus status,
                       const nlohmann::json& payload, const std::vector<std::string>& errors);
    void handleCompletion(Session& session, const std::string& stage_id, const nlohmann::json& payload);
    void completeStage(Session& session, const std::string& stage_id, TimePoint at);
    void handleGateFailure(Session& session, const std::string& stage_id, const QualityGateResult& gate, TimePoint at);
    void handleStageFailure(Session& session, const std::string& stage_id, StageStatus status,
                            const std::vector<std::string>& errors, std::optional<ErrorCategory> category,
                            std::optional<std::string> failing_service);
    void applyBypass(Session& session, const std::string& stage_id, const BypassRequest& request);
    void evaluateSession(Session& session, TimePoint at);
    void evaluateEscalations(Session& session, TimePoint at);
    void finalize(Session& session);
    void failSession(Session& session, const std::string& reason, bool already_escalated);

    // EN: Terminal transition; exactly one caller wins and delivers the result
    // FR: Transition terminale ; un seul appelant gagne et livre le résultat
    bool enterTerminal(Session& session, SessionPhase phase, const std::string& reason);

    SessionSnapshot buildSnapshot(const Session& session) const;
    EscalationSignals buildSignals(Session& session, TimePoint at) const;
    std::optional<std::string> unhealthyDependency(const std::string& stage_id) const;
    void reportTrialOutcome(const std::string& stage_id, bool healthy, TimePoint at);
    std::string currentStageId(const Session& session) const;
    bool isTerminal(const Session& session) const;
    size_t activeCount() const;
    double sessionErrorRate() const;

    std::atomic<uint64_t> next_session_{1};

    mutable std::shared_mutex sessions_mutex_;
    std::unordered_map<std::string, SessionPtr> sessions_;

    std::mutex idle_mutex_;
    std::condition_variable idle_condition_;
    size_t pending_tasks_ = 0;

    mutable std::mutex monitor_mutex_;
    std::condition_variable monitor_condition_;
    std::thread monitor_thread_;
    bool monitoring_ = false;

    std::atomic<bool> shut_down_{false};

    // EN: Declared last so workers stop before the state they use is destroyed
    // FR: Déclaré en dernier pour que les workers s'arrêtent avant la destruction de l'état utilisé
    ThreadPool pool_;
};

const OrchestrationConfig& PipelineStateMachine::Impl::validated(const OrchestrationConfig& config) {
    std::vector<std::string> errors;
    if (!ConfigManager::validate(config, errors)) {
        throw ConfigurationError(errors);
    }
    return config;
}

PipelineDependencies PipelineStateMachine::Impl::normalize(PipelineDependencies dependencies,
                                                           const OrchestrationConfig& config) {
    if (!dependencies.dispatcher) {
        throw std::invalid_argument("PipelineStateMachine requires a stage dispatcher");
    }
    if (!dependencies.clock) {
        dependencies.clock = std::make_shared<SystemClock>();
    }
    if (!dependencies.notifier) {
        if (!config.notifications.webhook_url.empty() || !config.notifications.incident_url.empty()) {
            dependencies.notifier = std::make_shared<WebhookNotificationService>(config.notifications);
        } else {
            dependencies.notifier = std::make_shared<LoggingNotificationService>();
        }
    }
    if (!dependencies.health_probe && !config.circuit_breaker.health_endpoints.empty()) {
        dependencies.health_probe = std::make_shared<HttpHealthProbe>(config.circuit_breaker.health_endpoints,
                                                                      config.notifications.connect_timeout_ms,
                                                                      config.notifications.request_timeout_ms);
    }
    if (!dependencies.archive && config.archive.enabled) {
        ArchiveOptions options;
        options.directory = config.archive.directory;
        options.compress = config.archive.compress;
        dependencies.archive = std::make_shared<SessionArchive>(options);
    }
    return dependencies;
}

PipelineStateMachine::Impl::Impl(const OrchestrationConfig& config, PipelineDependencies dependencies,
                                 MetricsAggregator& metrics)
    : config_(validated(config)),
      metrics_(metrics),
      deps_(normalize(std::move(dependencies), config_)),
      archive_(deps_.archive),
      registry_(config_.stages),
      gates_(config_.quality_gates, config_.authorization, config_.metric_aliases, metrics_),
      sla_(config_.sla, BusinessCalendar(config_.business_hours), metrics_),
      circuits_(std::make_shared<CircuitBreakerManager>(config_.circuit_breaker.defaults, metrics_,
                                                        deps_.health_probe)),
      escalations_(std::make_shared<EscalationRuleEngine>(config_.escalation.rules, config_.escalation.dynamic,
                                                          deps_.notifier, metrics_,
                                                          config_.escalation.management_recipients)),
      recovery_(config_.recovery, metrics_, deps_.clock, circuits_, escalations_),
      pool_(ThreadPoolConfig{config_.pipeline.worker_threads, 10000}) {

    for (const auto& entry : config_.circuit_breaker.overrides) {
        circuits_->setServiceConfig(entry.first, entry.second);
    }
    for (const auto& service : config_.circuit_breaker.monitored_services) {
        circuits_->registerService(service);
    }

    std::vector<StageProfile> profiles;
    for (const auto& stage : config_.stages) {
        StageProfile profile;
        profile.stage_id = stage.id;
        profile.criticality = stage.criticality;
        if (auto sla = sla_.config(stage.id)) {
            profile.breach_minutes = sla->breach_minutes;
        }
        profiles.push_back(profile);
    }
    escalations_->setStageProfiles(profiles);
    escalations_->setActionHandler(this);

    LOG_INFO_META(kModule, "Pipeline state machine ready",
                  (std::unordered_map<std::string, std::string>{
                      {"pipeline", config_.pipeline.name},
                      {"version", config_.pipeline.version},
                      {"stages", std::to_string(config_.stages.size())},
                      {"workers", std::to_string(config_.pipeline.worker_threads)}
                  }));
}

PipelineStateMachine::Impl::~Impl() {
    shutdown();
    escalations_->setActionHandler(nullptr);
}

PipelineStateMachine::Impl::SessionPtr PipelineStateMachine::Impl::find(const std::string& session_id) const {
    std::shared_lock<std::shared_mutex> lock(sessions_mutex_);
    auto it = sessions_.find(session_id);
    return it == sessions_.end() ? nullptr : it->second;
}

std::string PipelineStateMachine::Impl::generateSessionId() {
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(now().time_since_epoch()).count();
    return "onb-" + std::to_string(millis) + "-" + std::to_string(next_session_.fetch_add(1));
}

bool PipelineStateMachine::Impl::isTerminal(const Session& session) const {
    std::lock_guard<std::mutex> lock(session.mutex);
    return OrchestrationUtils::isTerminalPhase(session.phase);
}

std::string PipelineStateMachine::Impl::currentStageId(const Session& session) const {
    std::lock_guard<std::mutex> lock(session.mutex);
    const auto& defs = registry_.definitions();
    return session.current_index < defs.size() ? defs[session.current_index].id : std::string();
}

// ---------------------------------------------------------------------------
// EN: Strand
// FR: Strand
// ---------------------------------------------------------------------------

void PipelineStateMachine::Impl::post(const SessionPtr& session, const std::string& name,
                                      std::function<void(Session&)> task) {
    {
        std::lock_guard<std::mutex> lock(idle_mutex_);
        ++pending_tasks_;
    }

    bool schedule = false;
    {
        std::lock_guard<std::mutex> lock(session->strand_mutex);
        session->mailbox.push_back(std::move(task));
        if (!session->draining) {
            session->draining = true;
            schedule = true;
        }
    }
    if (!schedule) {
        return;
    }

    try {
        pool_.post("session:" + session->id + ":" + name, TaskPriority::NORMAL,
                   [this, session]() { drain(session); });
    } catch (const std::runtime_error& e) {
        size_t dropped = 0;
        {
            std::lock_guard<std::mutex> lock(session->strand_mutex);
            dropped = session->mailbox.size();
            session->mailbox.clear();
            session->draining = false;
        }
        LOG_ERROR(kModule, "Could not schedule task " + name + " of session " + session->id + ": " + e.what());
        finishTasks(dropped);
    }
}

void PipelineStateMachine::Impl::drain(const SessionPtr& session) {
    ScopedCorrelation correlation(session->id);
    while (true) {
        std::function<void(Session&)> task;
        {
            std::lock_guard<std::mutex> lock(session->strand_mutex);
            if (session->mailbox.empty()) {
                session->draining = false;
                return;
            }
            task = std::move(session->mailbox.front());
            session->mailbox.pop_front();
        }

        try {
            task(*session);
        } catch (const std::exception& e) {
            LOG_ERROR_META(kModule, "Session task failed: " + std::string(e.what()),
                           (std::unordered_map<std::string, std::string>{{"session_id", session->id}}));
            failSession(*session, "Internal error: " + std::string(e.what()), false);
        }
        finishTasks(1);
    }
}

void PipelineStateMachine::Impl::finishTasks(size_t count) {
    std::lock_guard<std::mutex> lock(idle_mutex_);
    pending_tasks_ -= std::min(count, pending_tasks_);
    if (pending_tasks_ == 0) {
        idle_condition_.notify_all();
    }
}

void PipelineStateMachine::Impl::waitForIdle() {
    std::unique_lock<std::mutex> lock(idle_mutex_);
    idle_condition_.wait(lock, [this]() { return pending_tasks_ == 0; });
}

// ---------------------------------------------------------------------------
// EN: Session lifecycle
// FR: Cycle de vie des sessions
// ---------------------------------------------------------------------------

SessionHandle PipelineStateMachine::Impl::startSession(const std::string& subject_id, const std::string& session_id) {
    if (shut_down_.load()) {
        throw std::runtime_error("Pipeline is shut down");
    }
    if (subject_id.empty()) {
        throw std::invalid_argument("Subject id must not be empty");
    }

    const std::string id = session_id.empty() ? generateSessionId() : session_id;
    if (!SessionArchive::isSafeId(id)) {
        throw std::invalid_argument("Invalid session id: " + id);
    }

    auto session = std::make_shared<Session>();
    session->id = id;
    session->subject = subject_id;
    session->started_at = now();
    session->result = session->promise.get_future().share();

    {
        std::unique_lock<std::shared_mutex> lock(sessions_mutex_);
        if (sessions_.count(id) != 0 || !registry_.createSession(id)) {
            throw std::invalid_argument("Session already exists: " + id);
        }
        sessions_.emplace(id, session);
    }

    metrics_.increment(Metric::SESSIONS_STARTED);
    metrics_.increment(Metric::ACTIVE_SESSIONS);
    LOG_INFO_META(kModule, "Session started",
                  (std::unordered_map<std::string, std::string>{
                      {"session_id", id},
                      {"subject_id", subject_id}
                  }));

    post(session, "start", [this](Session& s) { advance(s); });
    return SessionHandle{id, session->result};
}

void PipelineStateMachine::Impl::advance(Session& session) {
    std::string stage_id;
    {
        std::lock_guard<std::mutex> lock(session.mutex);
        if (OrchestrationUtils::isTerminalPhase(session.phase)) {
            return;
        }
        if (session.paused) {
            session.pending_advance = true;
            return;
        }
        const auto& defs = registry_.definitions();
        if (session.current_index < defs.size()) {
            session.phase = SessionPhase::IN_STAGE;
            stage_id = defs[session.current_index].id;
        }
    }

    if (stage_id.empty()) {
        finalize(session);
        return;
    }

    std::string failure;
    std::optional<std::string> failing_service;
    bool deferred = false;
    if (dispatchStage(session, stage_id, failure, failing_service, deferred) || isTerminal(session)) {
        return;
    }

    std::optional<ErrorCategory> category;
    if (failing_service) {
        category = ErrorCategory::DEPENDENCY_UNAVAILABLE;
    }
    handleStageFailure(session, stage_id, StageStatus::FAILED, {failure}, category, failing_service);
}

bool PipelineStateMachine::Impl::dispatchStage(Session& session, const std::string& stage_id, std::string& failure,
                                               std::optional<std::string>& failing_service, bool& deferred) {
    deferred = false;
    {
        std::lock_guard<std::mutex> lock(session.mutex);
        if (OrchestrationUtils::isTerminalPhase(session.phase)) {
            failure = "Session is no longer running";
            return false;
        }
        if (session.paused) {
            session.pending_advance = true;
            deferred = true;
            return true;
        }
    }

    const TimePoint at = now();
    auto definition = registry_.definition(stage_id);
    if (!definition) {
        failure = "Unknown stage " + stage_id;
        return false;
    }

    // EN: Open dependency circuits fail the dispatch without calling the worker
    // FR: Un circuit de dépendance ouvert fait échouer l'envoi sans appeler le worker
    for (const auto& dependency : definition->dependencies) {
        if (!circuits_->allowRequest(dependency, at)) {
            failure = "Dependency unavailable: " + dependency;
            failing_service = dependency;
            LOG_WARN(kModule, "Stage " + stage_id + " not dispatched, circuit open for " + dependency);
            return false;
        }
    }

    registry_.transition(session.id, stage_id, StageStatus::PROCESSING, at);
    int attempt = 0;
    registry_.update(session.id, stage_id, [&attempt](StageRecord& record) {
        attempt = ++record.dispatch_attempts;
        record.outcome_fingerprint.clear();
    });
    if (attempt == 1) {
        registry_.checkpoint(session.id, stage_id);
    }

    try {
        if (!deps_.dispatcher->dispatch(session.id, stage_id, attempt)) {
            failure = "Worker rejected stage " + stage_id;
            return false;
        }
    } catch (const std::exception& e) {
        failure = "Dispatch of stage " + stage_id + " failed: " + e.what();
        return false;
    }

    LOG_DEBUG(kModule, "Dispatched " + stage_id + " (attempt " + std::to_string(attempt) + ")");
    return true;
}

OutcomeAck PipelineStateMachine::Impl::reportStageOutcome(const std::string& session_id, const std::string& stage_id,
                                                          StageStatus status, const nlohmann::json& payload,
                                                          const std::vector<std::string>& errors) {
    auto respond = [this, &session_id, &stage_id](OutcomeDisposition disposition, const std::string& reason) {
        switch (disposition) {
            case OutcomeDisposition::ACCEPTED: metrics_.increment(Metric::OUTCOMES_ACCEPTED); break;
            case OutcomeDisposition::DUPLICATE: metrics_.increment(Metric::OUTCOMES_DUPLICATE); break;
            case OutcomeDisposition::REJECTED: metrics_.increment(Metric::OUTCOMES_REJECTED); break;
        }
        if (disposition != OutcomeDisposition::ACCEPTED) {
            LOG_DEBUG(kModule, "Outcome of " + session_id + "/" + stage_id + " " +
                      OrchestrationUtils::dispositionToString(disposition) + ": " + reason);
        }
        return makeAck(disposition, reason);
    };

    auto session = find(session_id);
    if (!session) {
        return respond(OutcomeDisposition::REJECTED, "Unknown session");
    }
    auto index = registry_.indexOf(stage_id);
    if (!index) {
        return respond(OutcomeDisposition::REJECTED, "Unknown stage");
    }

    const std::string fingerprint = PipelineUtils::outcomeFingerprint(status, payload, errors);

    std::lock_guard<std::mutex> lock(session->mutex);
    auto record = registry_.getStage(session_id, stage_id);
    if (!record) {
        return respond(OutcomeDisposition::REJECTED, "Stage record missing");
    }
    const bool same_report = !record->outcome_fingerprint.empty() && record->outcome_fingerprint == fingerprint;

    if (OrchestrationUtils::isTerminalPhase(session->phase)) {
        return same_report
            ? respond(OutcomeDisposition::DUPLICATE, "Outcome already recorded")
            : respond(OutcomeDisposition::REJECTED,
                      "Session is " + OrchestrationUtils::sessionPhaseToString(session->phase));
    }
    if (status == StageStatus::WAITING || status == StageStatus::ESCALATED) {
        return respond(OutcomeDisposition::REJECTED,
                       "Status " + OrchestrationUtils::stageStatusToString(status) + " cannot be reported");
    }
    if (*index > session->current_index) {
        return respond(OutcomeDisposition::REJECTED, "Stage has not started yet");
    }
    if (record->status == StageStatus::COMPLETED || *index < session->current_index) {
        return same_report
            ? respond(OutcomeDisposition::DUPLICATE, "Outcome already recorded")
            : respond(OutcomeDisposition::REJECTED, "Stage already completed");
    }
    if (record->status == StageStatus::WAITING) {
        return respond(OutcomeDisposition::REJECTED, "Stage has not been dispatched");
    }

    if (status == StageStatus::PROCESSING) {
        // EN: Heartbeat: only the progress moves
        // FR: Battement : seule la progression avance
        if (payload.is_object() && payload.contains("progress_percent") && payload["progress_percent"].is_number()) {
            double percent = std::clamp(payload["progress_percent"].get<double>(), 0.0, 100.0);
            registry_.update(session_id, stage_id, [percent](StageRecord& r) {
                r.progress_percent = std::max(r.progress_percent, percent);
            });
        }
        return respond(OutcomeDisposition::ACCEPTED, "Progress recorded");
    }

    if (same_report) {
        return respond(OutcomeDisposition::DUPLICATE, "Outcome already recorded");
    }
    if (record->status == StageStatus::FAILED || record->status == StageStatus::TIMEOUT) {
        return respond(OutcomeDisposition::REJECTED, "Stage is under recovery");
    }

    registry_.update(session_id, stage_id, [&fingerprint](StageRecord& r) { r.outcome_fingerprint = fingerprint; });
    post(session, "outcome:" + stage_id, [this, stage_id, status, payload, errors](Session& s) {
        handleOutcome(s, stage_id, status, payload, errors);
    });
    return respond(OutcomeDisposition::ACCEPTED, "Outcome queued");
}

bool PipelineStateMachine::Impl::reportProgress(const std::string& session_id, const std::string& stage_id,
                                                double percent) {
    auto session = find(session_id);
    auto index = registry_.indexOf(stage_id);
    if (!session || !index) {
        return false;
    }
    std::lock_guard<std::mutex> lock(session->mutex);
    if (OrchestrationUtils::isTerminalPhase(session->phase) || *index != session->current_index) {
        return false;
    }
    auto record = registry_.getStage(session_id, stage_id);
    if (!record || record->status != StageStatus::PROCESSING) {
        return false;
    }
    const double clamped = std::clamp(percent, 0.0, 100.0);
    return registry_.update(session_id, stage_id, [clamped](StageRecord& r) { r.progress_percent = clamped; });
}

void PipelineStateMachine::Impl::handleOutcome(Session& session, const std::string& stage_id, StageStatus status,
                                               const nlohmann::json& payload, const std::vector<std::string>& errors) {
    if (isTerminal(session)) {
        return;
    }
    if (status == StageStatus::COMPLETED) {
        handleCompletion(session, stage_id, payload);
    } else {
        handleStageFailure(session, stage_id, status, errors, std::nullopt, std::nullopt);
    }
}

void PipelineStateMachine::Impl::handleCompletion(Session& session, const std::string& stage_id,
                                                  const nlohmann::json& payload) {
    const TimePoint at = now();
    registry_.update(session.id, stage_id, [&payload](StageRecord& r) { r.output_payload = payload; });

    QualityGateResult gate = gates_.evaluate(stage_id, payload, at);
    if (gates_.hasGate(stage_id)) {
        std::lock_guard<std::mutex> lock(session.mutex);
        session.gate_results[stage_id] = gate;
    }

    if (gate.status == GateStatus::PASSED || gate.status == GateStatus::BYPASS) {
        completeStage(session, stage_id, at);
    } else {
        handleGateFailure(session, stage_id, gate, at);
    }
}

void PipelineStateMachine::Impl::completeStage(Session& session, const std::string& stage_id, TimePoint at) {
    if (registry_.transition(session.id, stage_id, StageStatus::COMPLETED, at) != TransitionResult::APPLIED) {
        LOG_WARN(kModule, "Stage " + stage_id + " could not be completed from its current status");
        return;
    }
    registry_.checkpoint(session.id, stage_id);

    auto record = registry_.getStage(session.id, stage_id);
    if (record && record->started_at && sla_.hasConfig(stage_id)) {
        SlaSignal signal;
        signal.completed = true;
        signal.error_count = record->error_count;
        signal.extensions_used = static_cast<int>(record->extension_events.size());
        SlaResult final_sla = sla_.evaluate(stage_id, *record->started_at, at, signal);
        sla_.recordCompletion(stage_id, final_sla.elapsed_minutes);
        std::lock_guard<std::mutex> lock(session.mutex);
        session.sla_results[stage_id] = final_sla;
    }

    reportTrialOutcome(stage_id, true, at);

    {
        std::lock_guard<std::mutex> lock(session.mutex);
        session.manual_review.erase(stage_id);
        auto index = registry_.indexOf(stage_id);
        if (index && *index == session.current_index) {
            ++session.current_index;
        }
    }
    LOG_INFO_META(kModule, "Stage completed",
                  (std::unordered_map<std::string, std::string>{
                      {"session_id", session.id},
                      {"stage", stage_id}
                  }));
    advance(session);
}

void PipelineStateMachine::Impl::handleGateFailure(Session& session, const std::string& stage_id,
                                                   const QualityGateResult& gate, TimePoint at) {
    auto config = gates_.gate(stage_id);
    if (!config) {
        return;
    }

    int failures = 0;
    registry_.update(session.id, stage_id, [&failures](StageRecord& r) { failures = ++r.gate_failures; });
    registry_.transition(session.id, stage_id, StageStatus::ESCALATED, at);

    LOG_WARN_META(kModule, "Quality gate held stage",
                  (std::unordered_map<std::string, std::string>{
                      {"session_id", session.id},
                      {"stage", stage_id},
                      {"status", OrchestrationUtils::gateStatusToString(gate.status)},
                      {"score", QualityGateEngine::formatNumber(gate.score)},
                      {"failures", std::to_string(failures)},
                      {"action", OrchestrationUtils::failureActionToString(config->failure_action)}
                  }));

    if (gate.status == GateStatus::MANUAL_REVIEW) {
        std::lock_guard<std::mutex> lock(session.mutex);
        session.manual_review.insert(stage_id);
    }

    const std::string summary = "Quality gate of stage " + stage_id + " returned " +
                                OrchestrationUtils::gateStatusToString(gate.status) + " (score " +
                                QualityGateEngine::formatNumber(gate.score) + ")";
    switch (config->failure_action) {
        case GateFailureAction::BLOCK:
            LOG_INFO(kModule, "Stage " + stage_id + " blocked until resubmission or bypass");
            break;

        case GateFailureAction::WARN: {
            std::vector<std::string> recipients;
            if (auto sla = sla_.config(stage_id)) {
                recipients = sla->escalation_contacts;
            }
            if (recipients.empty()) {
                recipients = config_.escalation.management_recipients;
            }
            std::optional<std::string> id;
            try {
                id = deps_.notifier->notify(recipients, EscalationLevel::WARNING,
                                            summary + " for " + session.subject, false);
            } catch (const std::exception& e) {
                LOG_ERROR(kModule, "Gate warning for " + stage_id + " threw: " + e.what());
            }
            metrics_.increment(id ? Metric::NOTIFICATIONS_SENT : Metric::NOTIFICATIONS_FAILED);
            break;
        }

        case GateFailureAction::ESCALATE:
            escalations_->escalateManually(session.id, session.subject, stage_id, EscalationLevel::CRITICAL,
                                           summary, at);
            break;
    }

    evaluateEscalations(session, at);

    if (!config->retry_allowed || failures > config->max_retries) {
        failSession(session, "Quality gate of stage " + stage_id + " failed " + std::to_string(failures) +
                    " time(s)", false);
    }
}

void PipelineStateMachine::Impl::handleStageFailure(Session& session, const std::string& stage_id, StageStatus status,
                                                    const std::vector<std::string>& errors,
                                                    std::optional<ErrorCategory> category,
                                                    std::optional<std::string> failing_service) {
    const TimePoint at = now();
    const StageStatus failed_status = status == StageStatus::TIMEOUT ? StageStatus::TIMEOUT : StageStatus::FAILED;

    registry_.update(session.id, stage_id, [&errors](StageRecord& r) {
        r.errors.insert(r.errors.end(), errors.begin(), errors.end());
        r.error_count += std::max<int>(1, static_cast<int>(errors.size()));
    });
    registry_.transition(session.id, stage_id, failed_status, at);
    if (!failing_service) {
        reportTrialOutcome(stage_id, false, at);
    }

    LOG_WARN_META(kModule, "Stage failed",
                  (std::unordered_map<std::string, std::string>{
                      {"session_id", session.id},
                      {"stage", stage_id},
                      {"status", OrchestrationUtils::stageStatusToString(failed_status)},
                      {"error", errors.empty() ? std::string("unspecified") : errors.front()}
                  }));

    evaluateEscalations(session, at);
    if (isTerminal(session)) {
        return;
    }

    auto record = registry_.getStage(session.id, stage_id);
    if (!record) {
        throw StateInconsistencyError("Stage record vanished: " + stage_id);
    }
    if (record->recoveries >= config_.pipeline.max_stage_recoveries) {
        failSession(session, "Recovery attempts exhausted for stage " + stage_id, false);
        return;
    }
    registry_.update(session.id, stage_id, [](StageRecord& r) { ++r.recoveries; });

    FailureContext context;
    context.session_id = session.id;
    context.stage_id = stage_id;
    context.category = category;
    context.errors = errors;
    context.error_count = record->error_count;
    context.last_completed_stage = registry_.lastCompletedStage(session.id);
    context.failing_service = failing_service ? failing_service : unhealthyDependency(stage_id);

    RecoveryResult result = recovery_.recover(context, *this, session.token, session.subject);
    {
        std::lock_guard<std::mutex> lock(session.mutex);
        session.recovery_results.push_back(result);
    }

    switch (result.status) {
        case RecoveryStatus::SUCCESS:
        case RecoveryStatus::PARTIAL:
            LOG_INFO(kModule, "Stage " + stage_id + " back in progress after " +
                     OrchestrationUtils::recoveryStatusToString(result.status) + " recovery");
            break;
        case RecoveryStatus::CANCELLED:
            break;
        case RecoveryStatus::FAILED:
            failSession(session, "Recovery failed for stage " + stage_id + ": " + result.message,
                        result.escalation_event_id.has_value());
            break;
    }
}

void PipelineStateMachine::Impl::reportTrialOutcome(const std::string& stage_id, bool healthy, TimePoint at) {
    auto definition = registry_.definition(stage_id);
    if (!definition) {
        return;
    }
    // EN: The stage ran as the trial call of its half-open dependencies; its outcome settles them
    // FR: L'étape a servi d'appel d'essai à ses dépendances half-open ; son résultat les tranche
    for (const auto& dependency : definition->dependencies) {
        if (circuits_->getState(dependency) == BreakerState::HALF_OPEN) {
            circuits_->recordOutcome(dependency, healthy, at);
        }
    }
}

std::optional<std::string> PipelineStateMachine::Impl::unhealthyDependency(const std::string& stage_id) const {
    auto definition = registry_.definition(stage_id);
    if (!definition) {
        return std::nullopt;
    }
    for (const auto& dependency : definition->dependencies) {
        if (circuits_->getState(dependency) != BreakerState::CLOSED) {
            return dependency;
        }
    }
    return std::nullopt;
}

void PipelineStateMachine::Impl::finalize(Session& session) {
    {
        std::lock_guard<std::mutex> lock(session.mutex);
        if (OrchestrationUtils::isTerminalPhase(session.phase)) {
            return;
        }
        session.phase = SessionPhase::FINALIZING;
    }

    for (const auto& record : registry_.getStages(session.id)) {
        if (record.status != StageStatus::COMPLETED) {
            failSession(session, "Finalization found stage " + record.stage_id + " in status " +
                        OrchestrationUtils::stageStatusToString(record.status), false);
            return;
        }
    }
    enterTerminal(session, SessionPhase::COMPLETED, "");
}

void PipelineStateMachine::Impl::failSession(Session& session, const std::string& reason, bool already_escalated) {
    if (isTerminal(session)) {
        return;
    }
    if (!already_escalated) {
        escalations_->escalateManually(session.id, session.subject, currentStageId(session),
                                       EscalationLevel::CRITICAL, reason, now());
    }
    enterTerminal(session, SessionPhase::FAILED_REQUIRES_RECOVERY, reason);
}

bool PipelineStateMachine::Impl::enterTerminal(Session& session, SessionPhase phase, const std::string& reason) {
    {
        std::lock_guard<std::mutex> lock(session.mutex);
        if (OrchestrationUtils::isTerminalPhase(session.phase)) {
            return false;
        }
        session.phase = phase;
        session.finished_at = now();
        session.pending_advance = false;
        if (!reason.empty()) {
            session.failure_reason = reason;
        }
    }
    session.token.cancel();

    switch (phase) {
        case SessionPhase::COMPLETED: metrics_.increment(Metric::SESSIONS_COMPLETED); break;
        case SessionPhase::CANCELLED: metrics_.increment(Metric::SESSIONS_CANCELLED); break;
        default: metrics_.increment(Metric::SESSIONS_FAILED); break;
    }
    metrics_.decrement(Metric::ACTIVE_SESSIONS);

    SessionResult result;
    result.session_id = session.id;
    result.phase = phase;
    result.failure_reason = reason;
    result.snapshot = buildSnapshot(session);

    std::unordered_map<std::string, std::string> meta{
        {"session_id", session.id},
        {"phase", OrchestrationUtils::sessionPhaseToString(phase)}
    };
    if (!reason.empty()) {
        meta["reason"] = reason;
    }
    if (phase == SessionPhase::COMPLETED) {
        LOG_INFO_META(kModule, "Session finished", meta);
    } else {
        LOG_WARN_META(kModule, "Session finished", meta);
    }

    if (archive_) {
        nlohmann::json document = {
            {"snapshot", result.snapshot.toJson()},
            {"registry", registry_.exportSession(session.id).value_or(nlohmann::json())},
            {"archived_at", OrchestrationUtils::formatTimestamp(now())}
        };
        if (!archive_->store(session.id, document)) {
            LOG_WARN(kModule, "Session " + session.id + " could not be archived");
        }
    }

    session.promise.set_value(std::move(result));
    return true;
}

// ---------------------------------------------------------------------------
// EN: Timers and escalation
// FR: Minuteries et escalade
// ---------------------------------------------------------------------------

void PipelineStateMachine::Impl::evaluateTimers() {
    std::vector<SessionPtr> sessions;
    {
        std::shared_lock<std::shared_mutex> lock(sessions_mutex_);
        for (const auto& entry : sessions_) {
            sessions.push_back(entry.second);
        }
    }
    const TimePoint at = now();
    for (const auto& session : sessions) {
        if (!isTerminal(*session)) {
            post(session, "timers", [this, at](Session& s) { evaluateSession(s, at); });
        }
    }
}

void PipelineStateMachine::Impl::evaluateSession(Session& session, TimePoint at) {
    if (isTerminal(session)) {
        return;
    }
    const std::string stage_id = currentStageId(session);
    if (!stage_id.empty() && sla_.hasConfig(stage_id)) {
        auto record = registry_.getStage(session.id, stage_id);
        if (record && record->started_at && record->status != StageStatus::WAITING &&
            record->status != StageStatus::COMPLETED) {
            SlaSignal signal;
            if (record->progress_percent > 0.0) {
                signal.progress_percent = record->progress_percent;
            }
            signal.error_count = record->error_count;
            signal.extensions_used = static_cast<int>(record->extension_events.size());
            if (config_.pipeline.sla_load_adjustment) {
                signal.system_load = pool_.currentLoad();
            }
            SlaResult result = sla_.evaluate(stage_id, *record->started_at, at, signal);
            std::lock_guard<std::mutex> lock(session.mutex);
            session.sla_results[stage_id] = result;
        }
    }
    evaluateEscalations(session, at);
}

void PipelineStateMachine::Impl::evaluateEscalations(Session& session, TimePoint at) {
    auto events = escalations_->evaluate(buildSignals(session, at));
    if (!events.empty()) {
        LOG_DEBUG(kModule, std::to_string(events.size()) + " escalation(s) fired for " + session.id);
    }
}

EscalationSignals PipelineStateMachine::Impl::buildSignals(Session& session, TimePoint at) const {
    EscalationSignals signals;
    signals.session_id = session.id;
    signals.subject_id = session.subject;
    signals.now = at;

    size_t current = 0;
    std::map<std::string, QualityGateResult> gate_results;
    std::map<std::string, SlaResult> sla_results;
    {
        std::lock_guard<std::mutex> lock(session.mutex);
        current = session.current_index;
        gate_results = session.gate_results;
        sla_results = session.sla_results;
    }

    const auto records = registry_.getStages(session.id);
    const auto& defs = registry_.definitions();
    for (size_t i = 0; i < records.size() && i <= current; ++i) {
        const auto& record = records[i];
        // EN: Finished stages keep their results in the snapshot but no longer trigger rules
        // FR: Les étapes terminées gardent leurs résultats dans le snapshot mais ne déclenchent plus de règles
        if (record.status == StageStatus::COMPLETED) {
            continue;
        }
        StageSignal stage;
        stage.stage_id = record.stage_id;
        stage.status = record.status;
        stage.criticality = defs[i].criticality;
        stage.error_count = record.error_count;
        stage.retry_attempts = record.gate_failures + record.recoveries;
        if (auto sla = sla_.config(record.stage_id)) {
            stage.breach_minutes = sla->breach_minutes;
        }
        auto sla_it = sla_results.find(record.stage_id);
        if (sla_it != sla_results.end()) {
            stage.sla = sla_it->second;
        }
        auto gate_it = gate_results.find(record.stage_id);
        if (gate_it != gate_results.end()) {
            stage.gate = gate_it->second;
        }
        signals.stages.push_back(stage);
    }

    signals.circuits = circuits_->getAllStates();
    signals.concurrent_sessions = activeCount();
    signals.system_load = pool_.currentLoad();
    signals.error_rate = sessionErrorRate();
    signals.outside_business_hours = !sla_.calendar().isBusinessTime(at);
    return signals;
}

size_t PipelineStateMachine::Impl::activeCount() const {
    std::shared_lock<std::shared_mutex> lock(sessions_mutex_);
    return static_cast<size_t>(std::count_if(sessions_.begin(), sessions_.end(), [this](const auto& entry) {
        return !isTerminal(*entry.second);
    }));
}

double PipelineStateMachine::Impl::sessionErrorRate() const {
    const double completed = static_cast<double>(metrics_.get(Metric::SESSIONS_COMPLETED));
    const double failed = static_cast<double>(metrics_.get(Metric::SESSIONS_FAILED));
    return completed + failed > 0.0 ? failed / (completed + failed) : 0.0;
}

void PipelineStateMachine::Impl::startMonitoring(std::chrono::milliseconds interval) {
    std::lock_guard<std::mutex> lock(monitor_mutex_);
    if (monitoring_ || shut_down_.load()) {
        return;
    }
    monitoring_ = true;
    monitor_thread_ = std::thread([this, interval]() {
        LOG_INFO(kModule, "Monitoring started (every " + std::to_string(interval.count()) + "ms)");
        std::unique_lock<std::mutex> guard(monitor_mutex_);
        while (monitoring_) {
            guard.unlock();
            try {
                if (deps_.health_probe) {
                    circuits_->probeAll(now());
                }
                evaluateTimers();
            } catch (const std::exception& e) {
                LOG_ERROR(kModule, "Monitoring cycle failed: " + std::string(e.what()));
            }
            guard.lock();
            monitor_condition_.wait_for(guard, interval, [this]() { return !monitoring_; });
        }
        LOG_INFO(kModule, "Monitoring stopped");
    });
}

void PipelineStateMachine::Impl::stopMonitoring() {
    {
        std::lock_guard<std::mutex> lock(monitor_mutex_);
        if (!monitoring_) {
            return;
        }
        monitoring_ = false;
    }
    monitor_condition_.notify_all();
    if (monitor_thread_.joinable()) {
        monitor_thread_.join();
    }
}

bool PipelineStateMachine::Impl::isMonitoring() const {
    std::lock_guard<std::mutex> lock(monitor_mutex_);
    return monitoring_;
}

// ---------------------------------------------------------------------------
// EN: Operator controls
// FR: Contrôles opérateur
// ---------------------------------------------------------------------------

bool PipelineStateMachine::Impl::pauseSession(const std::string& session_id, const std::string& reason) {
    return pausePipeline(session_id, reason);
}

bool PipelineStateMachine::Impl::resumeSession(const std::string& session_id) {
    auto session = find(session_id);
    if (!session) {
        return false;
    }
    bool pending = false;
    {
        std::lock_guard<std::mutex> lock(session->mutex);
        if (!session->paused || OrchestrationUtils::isTerminalPhase(session->phase)) {
            return false;
        }
        session->paused = false;
        session->pause_reason.clear();
        pending = session->pending_advance;
        session->pending_advance = false;
    }
    LOG_INFO(kModule, "Session " + session_id + " resumed");
    if (pending) {
        post(session, "resume", [this](Session& s) { advance(s); });
    }
    return true;
}

bool PipelineStateMachine::Impl::cancelSession(const std::string& session_id, const std::string& reason) {
    auto session = find(session_id);
    if (!session) {
        return false;
    }
    return enterTerminal(*session, SessionPhase::CANCELLED, reason);
}

OutcomeAck PipelineStateMachine::Impl::bypassStage(const std::string& session_id, const std::string& stage_id,
                                                   const BypassRequest& request) {
    auto session = find(session_id);
    auto index = registry_.indexOf(stage_id);
    if (!session || !index) {
        return makeAck(OutcomeDisposition::REJECTED, "Unknown session or stage");
    }
    auto gate = gates_.gate(stage_id);
    if (!gate || !gate->bypassable) {
        return makeAck(OutcomeDisposition::REJECTED, "Gate of stage " + stage_id + " is not bypassable");
    }
    if (!gates_.isAuthorized(request.authorization_level, gate->bypass_auth_level)) {
        return makeAck(OutcomeDisposition::REJECTED, "Authorization level " + request.authorization_level +
                       " cannot bypass a gate requiring " + gate->bypass_auth_level);
    }

    {
        std::lock_guard<std::mutex> lock(session->mutex);
        if (OrchestrationUtils::isTerminalPhase(session->phase)) {
            return makeAck(OutcomeDisposition::REJECTED, "Session is no longer running");
        }
        if (*index != session->current_index) {
            return makeAck(OutcomeDisposition::REJECTED, "Only the current stage can be bypassed");
        }
        auto record = registry_.getStage(session_id, stage_id);
        if (!record || record->status != StageStatus::ESCALATED) {
            return makeAck(OutcomeDisposition::REJECTED, "Stage is not held by its quality gate");
        }
    }

    post(session, "bypass:" + stage_id, [this, stage_id, request](Session& s) { applyBypass(s, stage_id, request); });
    return makeAck(OutcomeDisposition::ACCEPTED, "Bypass queued");
}

void PipelineStateMachine::Impl::applyBypass(Session& session, const std::string& stage_id,
                                             const BypassRequest& request) {
    if (isTerminal(session)) {
        return;
    }
    auto record = registry_.getStage(session.id, stage_id);
    if (!record || record->status != StageStatus::ESCALATED) {
        return;
    }
    const TimePoint at = now();
    QualityGateResult result = gates_.evaluate(stage_id, record->output_payload, at, request);
    {
        std::lock_guard<std::mutex> lock(session.mutex);
        session.gate_results[stage_id] = result;
    }
    if (result.status == GateStatus::BYPASS || result.status == GateStatus::PASSED) {
        completeStage(session, stage_id, at);
    }
}

ExtensionDecision PipelineStateMachine::Impl::requestSlaExtension(const std::string& session_id,
                                                                  const std::string& stage_id,
                                                                  const std::string& extension_event_id) {
    auto session = find(session_id);
    if (!session) {
        return ExtensionDecision::DENIED;
    }
    std::lock_guard<std::mutex> lock(session->mutex);
    if (OrchestrationUtils::isTerminalPhase(session->phase)) {
        return ExtensionDecision::DENIED;
    }
    auto record = registry_.getStage(session_id, stage_id);
    if (!record || record->status == StageStatus::COMPLETED) {
        return ExtensionDecision::DENIED;
    }
    ExtensionDecision decision = sla_.requestExtension(stage_id, record->extension_events, extension_event_id);
    if (decision == ExtensionDecision::GRANTED) {
        registry_.update(session_id, stage_id, [&extension_event_id](StageRecord& r) {
            r.extension_events.push_back(extension_event_id);
        });
    }
    return decision;
}

// ---------------------------------------------------------------------------
// EN: Automatic escalation actions
// FR: Actions automatiques d'escalade
// ---------------------------------------------------------------------------

bool PipelineStateMachine::Impl::pausePipeline(const std::string& session_id, const std::string& reason) {
    auto session = find(session_id);
    if (!session) {
        return false;
    }
    {
        std::lock_guard<std::mutex> lock(session->mutex);
        if (OrchestrationUtils::isTerminalPhase(session->phase) || session->paused) {
            return false;
        }
        session->paused = true;
        session->pause_reason = reason;
    }
    LOG_WARN(kModule, "Session " + session_id + " paused: " + reason);
    return true;
}

bool PipelineStateMachine::Impl::restartDependency(const std::string& session_id, const std::string& stage_id) {
    auto definition = registry_.definition(stage_id);
    if (!definition || definition->dependencies.empty()) {
        return false;
    }
    const TimePoint at = now();
    for (const auto& dependency : definition->dependencies) {
        if (circuits_->getState(dependency) == BreakerState::CLOSED) {
            continue;
        }
        if (deps_.health_probe) {
            circuits_->probe(dependency, at);
        } else {
            circuits_->reset(dependency, at);
        }
        LOG_INFO(kModule, "Dependency " + dependency + " restarted for session " + session_id);
    }
    return true;
}

bool PipelineStateMachine::Impl::routeToManualReview(const std::string& session_id, const std::string& stage_id) {
    auto session = find(session_id);
    if (!session) {
        return false;
    }
    std::lock_guard<std::mutex> lock(session->mutex);
    if (OrchestrationUtils::isTerminalPhase(session->phase)) {
        return false;
    }
    session->manual_review.insert(stage_id);
    return true;
}

// ---------------------------------------------------------------------------
// EN: Recovery actions
// FR: Actions de récupération
// ---------------------------------------------------------------------------

ActionOutcome PipelineStateMachine::Impl::retryStage(const FailureContext& context, int attempt) {
    auto session = find(context.session_id);
    if (!session) {
        return makeOutcome(false, false, "Unknown session " + context.session_id);
    }
    if (!registry_.resetForRetry(context.session_id, context.stage_id)) {
        return makeOutcome(false, false, "Stage " + context.stage_id + " cannot be reset");
    }

    std::string failure;
    std::optional<std::string> failing_service;
    bool deferred = false;
    if (!dispatchStage(*session, context.stage_id, failure, failing_service, deferred)) {
        return makeOutcome(false, false, failure);
    }
    if (deferred) {
        return makeOutcome(true, true, "Stage reset, dispatch deferred while the session is paused");
    }
    return makeOutcome(true, false, "Stage redispatched (retry " + std::to_string(attempt) + ")");
}

ActionOutcome PipelineStateMachine::Impl::restoreStage(const FailureContext& context) {
    auto session = find(context.session_id);
    if (!session) {
        return makeOutcome(false, false, "Unknown session " + context.session_id);
    }

    bool degraded = false;
    if (!registry_.restoreCheckpoint(context.session_id, context.stage_id)) {
        if (!registry_.resetForRetry(context.session_id, context.stage_id)) {
            return makeOutcome(false, false, "Stage " + context.stage_id + " has no checkpoint and cannot be reset");
        }
        degraded = true;
    }

    std::string failure;
    std::optional<std::string> failing_service;
    bool deferred = false;
    if (!dispatchStage(*session, context.stage_id, failure, failing_service, deferred)) {
        return makeOutcome(false, false, failure);
    }
    return makeOutcome(true, degraded || deferred,
                       degraded ? "Stage reset without checkpoint and redispatched"
                                : "Stage restored from checkpoint and redispatched");
}

ActionOutcome PipelineStateMachine::Impl::resumeWorkflow(const FailureContext& context) {
    auto session = find(context.session_id);
    if (!session) {
        return makeOutcome(false, false, "Unknown session " + context.session_id);
    }
    auto resume_index = registry_.resetAfterLastCompleted(context.session_id);
    if (!resume_index) {
        return makeOutcome(false, false, "No completed stage to resume from");
    }

    std::string stage_id;
    {
        std::lock_guard<std::mutex> lock(session->mutex);
        if (*resume_index != session->current_index) {
            LOG_INFO(kModule, "Recovery moves session " + context.session_id + " to stage index " +
                     std::to_string(*resume_index));
        }
        session->current_index = *resume_index;
        stage_id = registry_.definitions()[*resume_index].id;
    }

    std::string failure;
    std::optional<std::string> failing_service;
    bool deferred = false;
    if (!dispatchStage(*session, stage_id, failure, failing_service, deferred)) {
        return makeOutcome(false, false, failure);
    }
    ActionOutcome outcome = makeOutcome(true, deferred, "Workflow resumed at stage " + stage_id);
    outcome.payload = {{"resume_stage", stage_id}, {"resume_index", *resume_index}};
    return outcome;
}

ActionOutcome PipelineStateMachine::Impl::resetCircuit(const std::string& service) {
    const TimePoint at = now();
    if (deps_.health_probe) {
        auto decision = circuits_->probe(service, at);
        if (decision && decision->state == BreakerState::CLOSED) {
            return makeOutcome(true, false, "Circuit " + service + " closed after a healthy probe");
        }
        return makeOutcome(false, false, "Service " + service + " is still unhealthy");
    }
    circuits_->reset(service, at);
    return makeOutcome(true, true, "Circuit " + service + " reset without health confirmation");
}

// ---------------------------------------------------------------------------
// EN: Queries
// FR: Requêtes
// ---------------------------------------------------------------------------

SessionSnapshot PipelineStateMachine::Impl::buildSnapshot(const Session& session) const {
    SessionSnapshot snapshot;
    snapshot.session_id = session.id;
    snapshot.subject_id = session.subject;
    snapshot.started_at = session.started_at;
    snapshot.stages = registry_.getStages(session.id);

    std::map<std::string, QualityGateResult> gate_results;
    std::map<std::string, SlaResult> sla_results;
    std::set<std::string> manual_review;
    std::string pause_reason;
    {
        std::lock_guard<std::mutex> lock(session.mutex);
        snapshot.phase = session.phase;
        snapshot.paused = session.paused;
        pause_reason = session.pause_reason;
        snapshot.current_stage_index = session.current_index;
        snapshot.finished_at = session.finished_at;
        snapshot.recovery_results = session.recovery_results;
        snapshot.failure_reason = session.failure_reason;
        gate_results = session.gate_results;
        sla_results = session.sla_results;
        manual_review = session.manual_review;
    }

    const auto& defs = registry_.definitions();
    snapshot.current_stage = snapshot.current_stage_index < defs.size() ? defs[snapshot.current_stage_index].id : "";
    snapshot.overall_progress = snapshot.phase == SessionPhase::COMPLETED
        ? 100.0
        : PipelineUtils::overallProgress(snapshot.stages, snapshot.current_stage_index);

    for (const auto& definition : defs) {
        auto gate_it = gate_results.find(definition.id);
        if (gate_it != gate_results.end()) {
            snapshot.quality_gate_results.push_back(gate_it->second);
        }
        auto sla_it = sla_results.find(definition.id);
        if (sla_it != sla_results.end()) {
            snapshot.sla_results.push_back(sla_it->second);
        }
    }

    snapshot.circuit_states = circuits_->getAllStates();
    snapshot.escalation_events = escalations_->history(session.id);
    for (const auto& result : snapshot.recovery_results) {
        snapshot.recovery_attempts.insert(snapshot.recovery_attempts.end(),
                                          result.attempts.begin(), result.attempts.end());
    }

    snapshot.blocking_issues = PipelineUtils::blockingIssues(snapshot.stages, now(),
                                                             config_.pipeline.max_errors_before_blocking,
                                                             config_.pipeline.stalled_stage_minutes);
    for (const auto& stage_id : manual_review) {
        snapshot.blocking_issues.push_back("Stage " + stage_id + " awaits manual review");
    }
    if (snapshot.paused) {
        snapshot.blocking_issues.push_back("Pipeline paused: " + pause_reason);
    }
    return snapshot;
}

std::optional<SessionSnapshot> PipelineStateMachine::Impl::snapshot(const std::string& session_id) const {
    auto session = find(session_id);
    if (!session) {
        return std::nullopt;
    }
    return buildSnapshot(*session);
}

std::optional<std::shared_future<SessionResult>> PipelineStateMachine::Impl::sessionResult(
    const std::string& session_id) const {
    auto session = find(session_id);
    if (!session) {
        return std::nullopt;
    }
    return session->result;
}

std::vector<std::string> PipelineStateMachine::Impl::activeSessions() const {
    std::vector<std::string> ids;
    {
        std::shared_lock<std::shared_mutex> lock(sessions_mutex_);
        for (const auto& entry : sessions_) {
            if (!isTerminal(*entry.second)) {
                ids.push_back(entry.first);
            }
        }
    }
    std::sort(ids.begin(), ids.end());
    return ids;
}

bool PipelineStateMachine::Impl::evictSession(const std::string& session_id) {
    {
        std::unique_lock<std::shared_mutex> lock(sessions_mutex_);
        auto it = sessions_.find(session_id);
        if (it == sessions_.end() || !isTerminal(*it->second)) {
            return false;
        }
        {
            // EN: A strand still running would keep writing escalation and registry state
            // FR: Un strand encore actif continuerait d'écrire l'état d'escalade et du registre
            std::lock_guard<std::mutex> strand(it->second->strand_mutex);
            if (it->second->draining) {
                return false;
            }
        }
        sessions_.erase(it);
    }
    registry_.removeSession(session_id);
    escalations_->clearSession(session_id);
    recovery_.clearSession(session_id);
    LOG_DEBUG(kModule, "Session " + session_id + " evicted");
    return true;
}

void PipelineStateMachine::Impl::shutdown() {
    if (shut_down_.exchange(true)) {
        return;
    }
    stopMonitoring();

    std::vector<SessionPtr> sessions;
    {
        std::shared_lock<std::shared_mutex> lock(sessions_mutex_);
        for (const auto& entry : sessions_) {
            sessions.push_back(entry.second);
        }
    }
    for (const auto& session : sessions) {
        enterTerminal(*session, SessionPhase::CANCELLED, "Pipeline shutdown");
    }

    waitForIdle();
    pool_.shutdown();
    LOG_INFO(kModule, "Pipeline state machine stopped");
}

// ---------------------------------------------------------------------------
// EN: PipelineStateMachine facade
// FR: Façade PipelineStateMachine
// ---------------------------------------------------------------------------

PipelineStateMachine::PipelineStateMachine(const OrchestrationConfig& config, PipelineDependencies dependencies,
                                           MetricsAggregator& metrics)
    : impl_(std::make_unique<Impl>(config, std::move(dependencies), metrics)) {}

PipelineStateMachine::~PipelineStateMachine() = default;

SessionHandle PipelineStateMachine::startSession(const std::string& subject_id, const std::string& session_id) {
    return impl_->startSession(subject_id, session_id);
}

OutcomeAck PipelineStateMachine::reportStageOutcome(const std::string& session_id, const std::string& stage_id,
                                                    StageStatus status, const nlohmann::json& payload,
                                                    const std::vector<std::string>& errors) {
    return impl_->reportStageOutcome(session_id, stage_id, status, payload, errors);
}

bool PipelineStateMachine::reportProgress(const std::string& session_id, const std::string& stage_id, double percent) {
    return impl_->reportProgress(session_id, stage_id, percent);
}

void PipelineStateMachine::evaluateTimers() { impl_->evaluateTimers(); }
void PipelineStateMachine::startMonitoring(std::chrono::milliseconds interval) { impl_->startMonitoring(interval); }
void PipelineStateMachine::stopMonitoring() { impl_->stopMonitoring(); }
bool PipelineStateMachine::isMonitoring() const { return impl_->isMonitoring(); }

bool PipelineStateMachine::pauseSession(const std::string& session_id, const std::string& reason) {
    return impl_->pauseSession(session_id, reason);
}

bool PipelineStateMachine::resumeSession(const std::string& session_id) {
    return impl_->resumeSession(session_id);
}

bool PipelineStateMachine::cancelSession(const std::string& session_id, const std::string& reason) {
    return impl_->cancelSession(session_id, reason);
}

OutcomeAck PipelineStateMachine::bypassStage(const std::string& session_id, const std::string& stage_id,
                                             const BypassRequest& request) {
    return impl_->bypassStage(session_id, stage_id, request);
}

ExtensionDecision PipelineStateMachine::requestSlaExtension(const std::string& session_id, const std::string& stage_id,
                                                            const std::string& extension_event_id) {
    return impl_->requestSlaExtension(session_id, stage_id, extension_event_id);
}

bool PipelineStateMachine::acknowledgeEscalation(const std::string& event_id, const std::string& operator_id) {
    return impl_->escalations_->acknowledge(event_id, operator_id, impl_->now());
}

bool PipelineStateMachine::resolveEscalation(const std::string& event_id, const std::string& note) {
    return impl_->escalations_->resolve(event_id, note, impl_->now());
}

std::optional<SessionSnapshot> PipelineStateMachine::getSessionSnapshot(const std::string& session_id) const {
    return impl_->snapshot(session_id);
}

std::optional<std::shared_future<SessionResult>> PipelineStateMachine::sessionResult(
    const std::string& session_id) const {
    return impl_->sessionResult(session_id);
}

std::vector<std::string> PipelineStateMachine::activeSessions() const { return impl_->activeSessions(); }
bool PipelineStateMachine::evictSession(const std::string& session_id) { return impl_->evictSession(session_id); }
void PipelineStateMachine::waitForIdle() { impl_->waitForIdle(); }
void PipelineStateMachine::shutdown() { impl_->shutdown(); }

CircuitBreakerManager& PipelineStateMachine::circuits() { return *impl_->circuits_; }
EscalationRuleEngine& PipelineStateMachine::escalations() { return *impl_->escalations_; }
const StageRegistry& PipelineStateMachine::registry() const { return impl_->registry_; }
const QualityGateEngine& PipelineStateMachine::qualityGates() const { return impl_->gates_; }
const SlaMonitor& PipelineStateMachine::slaMonitor() const { return impl_->sla_; }
const RecoveryOrchestrator& PipelineStateMachine::recovery() const { return impl_->recovery_; }

} // namespace Orchestrator
} // namespace OBF
