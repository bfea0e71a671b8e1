// EN: Core data model of the OnboardFlow orchestration engine - stages, gates, SLAs, circuits, escalations, recovery.
// FR: Modèle de données du moteur d'orchestration OnboardFlow - étapes, gates, SLA, circuits, escalades, récupération.

#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "infrastructure/system/error_recovery.hpp"

namespace OBF {
namespace Orchestrator {

using TimePoint = std::chrono::system_clock::time_point;

// ---------------------------------------------------------------------------
// EN: Stages
// FR: Étapes
// ---------------------------------------------------------------------------

// EN: Status of one stage inside a session
// FR: Statut d'une étape au sein d'une session
enum class StageStatus {
    WAITING = 0,        // EN: Not reached yet / FR: Pas encore atteinte
    PROCESSING = 1,     // EN: Dispatched to its worker / FR: Confiée à son worker
    COMPLETED = 2,      // EN: Output accepted by its quality gate / FR: Sortie acceptée par son quality gate
    FAILED = 3,         // EN: Worker reported a failure / FR: Le worker a signalé un échec
    TIMEOUT = 4,        // EN: Worker gave up on time / FR: Le worker a abandonné sur délai
    ESCALATED = 5       // EN: Quality gate refused the output / FR: Le quality gate a refusé la sortie
};

enum class StageCriticality {
    LOW = 0,
    MEDIUM = 1,
    HIGH = 2,
    CRITICAL = 3
};

// EN: Static description of one pipeline stage
// FR: Description statique d'une étape du pipeline
struct StageDefinition {
    std::string id;                              // EN: Stable identifier, e.g. "it_provisioning" / FR: Identifiant stable
    std::string name;                            // EN: Human-readable name / FR: Nom lisible
    StageCriticality criticality = StageCriticality::MEDIUM;
    std::vector<std::string> dependencies;       // EN: External services the worker calls / FR: Services externes appelés
};

// EN: Mutable per-session record of a stage, owned by the Stage Registry
// FR: Enregistrement mutable d'une étape par session, possédé par le Stage Registry
struct StageRecord {
    std::string stage_id;
    StageStatus status = StageStatus::WAITING;
    std::optional<TimePoint> started_at;
    std::optional<TimePoint> completed_at;
    int error_count = 0;
    std::vector<std::string> errors;
    nlohmann::json output_payload;
    double progress_percent = 0.0;
    int dispatch_attempts = 0;                   // EN: Times handed to the worker / FR: Nombre d'envois au worker
    int recoveries = 0;                          // EN: Recovery runs consumed / FR: Récupérations consommées
    int gate_failures = 0;                       // EN: Failed gate evaluations / FR: Évaluations de gate échouées
    std::vector<std::string> extension_events;   // EN: Consumed SLA extension event ids / FR: Extensions SLA consommées
    std::string outcome_fingerprint;             // EN: Hash of the last accepted report / FR: Empreinte du dernier rapport accepté

    bool isTerminal() const { return status == StageStatus::COMPLETED; }
    nlohmann::json toJson() const;
    static StageRecord fromJson(const nlohmann::json& json);
};

// ---------------------------------------------------------------------------
// EN: Quality gates
// FR: Quality gates
// ---------------------------------------------------------------------------

enum class GateFailureAction {
    BLOCK = 0,          // EN: Hold the stage until resubmission or bypass / FR: Bloque jusqu'à resoumission ou bypass
    WARN = 1,           // EN: Notify and hold / FR: Notifie et bloque
    ESCALATE = 2        // EN: Raise a critical escalation / FR: Lève une escalade critique
};

enum class QualityRuleKind {
    MIN_VALUE = 0,
    MAX_VALUE = 1,
    REQUIRED_BOOLEAN = 2,
    ALLOWED_VALUES = 3,
    UNKNOWN = 4         // EN: Unrecognized kind, passes by default / FR: Type inconnu, passe par défaut
};

struct QualityRule {
    std::string name;
    QualityRuleKind kind = QualityRuleKind::UNKNOWN;
    std::string raw_kind;                        // EN: Kind as written in configuration / FR: Type tel qu'écrit en configuration
    std::string field;                           // EN: Dotted path in the payload / FR: Chemin pointé dans le payload
    double value = 0.0;                          // EN: Bound for min/max rules / FR: Borne des règles min/max
    bool expected = true;                        // EN: Expected value for boolean rules / FR: Valeur attendue des règles booléennes
    std::vector<std::string> allowed_values;
};

struct ThresholdSpec {
    std::string metric;
    double min_value = 0.0;
};

struct QualityGateConfig {
    std::string stage_id;
    std::vector<std::string> required_fields;
    std::vector<ThresholdSpec> thresholds;
    std::vector<QualityRule> rules;
    bool mandatory = true;
    bool bypassable = false;
    std::string bypass_auth_level = "manager";
    GateFailureAction failure_action = GateFailureAction::BLOCK;
    bool retry_allowed = true;
    int max_retries = 2;

    bool isHardBlock() const { return mandatory && failure_action == GateFailureAction::BLOCK; }
};

enum class GateStatus {
    PASSED = 0,
    FAILED = 1,
    MANUAL_REVIEW = 2,
    BYPASS = 3
};

// EN: Authorization presented to force a gate open
// FR: Autorisation présentée pour forcer l'ouverture d'un gate
struct BypassRequest {
    std::string authorization_level;
    std::string authorized_by;
    std::string reason;
};

struct QualityGateResult {
    std::string stage_id;
    bool passed = false;
    double score = 0.0;
    GateStatus status = GateStatus::FAILED;
    std::vector<std::string> critical_issues;
    std::vector<std::string> warnings;
    double fields_score = 100.0;
    double thresholds_score = 100.0;
    double rules_score = 100.0;
    std::optional<std::string> bypass_reason;
    std::optional<std::string> bypassed_by;
    std::vector<std::string> next_actions;
    TimePoint evaluated_at;

    nlohmann::json toJson() const;
};

enum class QualityTrend {
    INSUFFICIENT_DATA = 0,
    IMPROVING = 1,
    STABLE = 2,
    DEGRADING = 3
};

struct QualityTrendAnalysis {
    QualityTrend trend = QualityTrend::INSUFFICIENT_DATA;
    double relative_change = 0.0;
    double confidence = 0.0;
    size_t samples = 0;
};

// ---------------------------------------------------------------------------
// EN: SLA
// FR: SLA
// ---------------------------------------------------------------------------

enum class SlaStatus {
    ON_TIME = 0,
    AT_RISK = 1,
    BREACHED = 2,
    EXTENDED = 3        // EN: On time thanks to consumed extensions / FR: Dans les temps grâce aux extensions
};

struct SlaConfig {
    std::string stage_id;
    double target_minutes = 0.0;
    double warning_minutes = 0.0;
    double critical_minutes = 0.0;
    double breach_minutes = 0.0;
    bool business_hours_only = false;
    std::vector<std::string> escalation_contacts;
    bool extensions_allowed = false;
    int max_extensions = 0;
    double extension_duration_minutes = 0.0;
};

// EN: Live inputs for prediction, supplied by the caller
// FR: Entrées courantes pour la prédiction, fournies par l'appelant
struct SlaSignal {
    std::optional<double> progress_percent;
    int error_count = 0;
    int extensions_used = 0;
    bool completed = false;
    std::optional<double> system_load;           // EN: 0..1, enables load-adjusted thresholds / FR: 0..1, active l'ajustement à la charge
};

struct SlaResult {
    std::string stage_id;
    SlaStatus status = SlaStatus::ON_TIME;
    double elapsed_minutes = 0.0;
    double remaining_minutes = 0.0;
    double predicted_total_minutes = 0.0;
    TimePoint predicted_completion;
    double breach_probability = 0.0;
    int extensions_used = 0;
    TimePoint evaluated_at;

    nlohmann::json toJson() const;
};

enum class ExtensionDecision {
    GRANTED = 0,
    ALREADY_GRANTED = 1,    // EN: Same event id seen before, nothing consumed / FR: Même événement déjà vu, rien consommé
    DENIED = 2
};

struct SlaSummary {
    size_t total = 0;
    size_t on_time = 0;
    size_t at_risk = 0;
    size_t breached = 0;
    size_t extended = 0;
    double compliance_percent = 100.0;
};

// ---------------------------------------------------------------------------
// EN: Circuit breakers
// FR: Circuit breakers
// ---------------------------------------------------------------------------

enum class BreakerState {
    CLOSED = 0,
    OPEN = 1,
    HALF_OPEN = 2
};

enum class CircuitAction {
    NONE = 0,
    OPEN_CIRCUIT = 1,
    TRANSITION_HALF_OPEN = 2,
    CLOSE_CIRCUIT = 3,
    REOPEN_CIRCUIT = 4
};

struct CircuitBreakerConfig {
    int failure_threshold = 5;
    std::chrono::milliseconds recovery_timeout{60000};
    int half_open_max_calls = 3;
    int success_threshold = 1;
};

struct CircuitState {
    std::string service_name;
    BreakerState state = BreakerState::CLOSED;
    int failure_count = 0;
    std::optional<TimePoint> last_failure_at;
    std::optional<TimePoint> last_state_change;
    uint64_t total_calls = 0;
    uint64_t total_failures = 0;

    nlohmann::json toJson() const;
};

struct CircuitDecision {
    std::string service_name;
    BreakerState state = BreakerState::CLOSED;
    BreakerState previous_state = BreakerState::CLOSED;
    CircuitAction recommended_action = CircuitAction::NONE;
    int failure_count = 0;
};

enum class ProtectionLevel {
    NONE = 0,
    LOW = 1,
    MEDIUM = 2,
    HIGH = 3
};

struct ProtectionReport {
    size_t total_services = 0;
    size_t closed = 0;
    size_t open = 0;
    size_t half_open = 0;
    std::vector<std::string> unhealthy_services;
    ProtectionLevel level = ProtectionLevel::NONE;

    nlohmann::json toJson() const;
};

// ---------------------------------------------------------------------------
// EN: Escalation
// FR: Escalade
// ---------------------------------------------------------------------------

enum class EscalationLevel {
    WARNING = 0,
    CRITICAL = 1,
    EMERGENCY = 2
};

// EN: Closed set of trigger predicates; stage-scoped kinds must hold on the same stage
// FR: Ensemble fermé de prédicats ; les types par étape doivent tenir sur la même étape
enum class ConditionKind {
    SLA_STATUS_IS = 0,              // EN: Stage-scoped / FR: Par étape
    STAGE_CRITICALITY_AT_LEAST = 1, // EN: Stage-scoped / FR: Par étape
    BREACH_DURATION_MINUTES = 2,    // EN: Stage-scoped, minutes past the breach line / FR: Minutes au-delà du seuil
    QUALITY_GATE_STATUS_IS = 3,     // EN: Stage-scoped / FR: Par étape
    RETRY_ATTEMPTS = 4,             // EN: Stage-scoped / FR: Par étape
    STAGE_STATUS_IS = 5,            // EN: Stage-scoped / FR: Par étape
    STAGE_ERROR_COUNT = 6,          // EN: Stage-scoped / FR: Par étape
    STAGES_AT_RISK = 7,             // EN: Session-scoped / FR: Par session
    CIRCUIT_OPEN_COUNT = 8,         // EN: Session-scoped / FR: Par session
    CONCURRENT_SESSIONS = 9,        // EN: Session-scoped / FR: Par session
    SYSTEM_LOAD = 10,               // EN: Session-scoped / FR: Par session
    ERROR_RATE = 11,                // EN: Session-scoped / FR: Par session
    OUTSIDE_BUSINESS_HOURS = 12     // EN: Session-scoped / FR: Par session
};

struct TriggerCondition {
    ConditionKind kind = ConditionKind::SLA_STATUS_IS;
    std::vector<SlaStatus> sla_statuses;
    std::vector<GateStatus> gate_statuses;
    std::vector<StageStatus> stage_statuses;
    StageCriticality min_criticality = StageCriticality::HIGH;
    double threshold = 0.0;                      // EN: Numeric kinds compare with >= / FR: Les types numériques comparent avec >=

    bool isStageScoped() const;
};

enum class AutomaticAction {
    PAUSE_PIPELINE = 0,
    RESTART_DEPENDENCY = 1,
    CREATE_INCIDENT = 2,
    NOTIFY_MANAGEMENT = 3,
    ROUTE_MANUAL_REVIEW = 4
};

struct EscalationRule {
    std::string id;
    std::string name;
    std::vector<TriggerCondition> conditions;    // EN: Combined with AND / FR: Combinées par ET
    EscalationLevel level = EscalationLevel::WARNING;
    std::vector<std::string> recipients;
    std::vector<AutomaticAction> automatic_actions;
    int cooldown_minutes = 15;
    int max_per_session = 3;
    bool requires_ack = false;
    std::string message_template;                // EN: {subject_id} {session_id} {stage} {level} / FR: Gabarit du message
};

struct EscalationEvent {
    std::string event_id;
    std::string session_id;
    std::string rule_id;
    EscalationLevel level = EscalationLevel::WARNING;
    std::string trigger_reason;
    std::string stage_id;
    std::vector<std::string> recipients;
    std::vector<std::string> actions_executed;
    std::optional<std::string> notification_id;
    std::optional<std::string> incident_id;
    bool requires_ack = false;
    bool acknowledged = false;
    std::string acknowledged_by;
    std::optional<TimePoint> acknowledged_at;
    std::optional<TimePoint> resolved_at;
    std::string resolution_note;
    bool dynamic = false;                        // EN: Fired by compound degradation detection / FR: Déclenché par la dégradation composée
    TimePoint created_at;

    nlohmann::json toJson() const;
};

// EN: Signals of one stage, as seen by the escalation engine
// FR: Signaux d'une étape, tels que vus par le moteur d'escalade
struct StageSignal {
    std::string stage_id;
    StageStatus status = StageStatus::WAITING;
    StageCriticality criticality = StageCriticality::MEDIUM;
    int error_count = 0;
    int retry_attempts = 0;
    std::optional<SlaResult> sla;
    std::optional<double> breach_minutes;        // EN: Breach line used for BREACH_DURATION_MINUTES / FR: Seuil de violation
    std::optional<QualityGateResult> gate;
};

struct EscalationSignals {
    std::string session_id;
    std::string subject_id;
    std::vector<StageSignal> stages;
    std::vector<CircuitState> circuits;
    size_t concurrent_sessions = 1;
    double system_load = 0.0;
    double error_rate = 0.0;
    bool outside_business_hours = false;
    TimePoint now;
};

// ---------------------------------------------------------------------------
// EN: Recovery
// FR: Récupération
// ---------------------------------------------------------------------------

enum class RecoveryStrategy {
    IMMEDIATE_RETRY = 0,
    EXPONENTIAL_BACKOFF_RETRY = 1,
    STATE_RESTORATION = 2,
    WORKFLOW_RESUMPTION = 3,
    ESCALATE_TO_HUMAN = 4
};

enum class RecoveryActionType {
    RETRY = 0,
    STATE_RESTORE = 1,
    CIRCUIT_RESET = 2,
    WORKFLOW_RESUME = 3
};

enum class AttemptStatus {
    SUCCEEDED = 0,
    DEGRADED = 1,       // EN: Worked with reduced guarantees / FR: A fonctionné avec des garanties réduites
    FAILED = 2,
    REJECTED = 3,       // EN: Not executed, circuit open / FR: Non exécutée, circuit ouvert
    CANCELLED = 4
};

enum class RecoveryStatus {
    SUCCESS = 0,
    PARTIAL = 1,
    FAILED = 2,
    CANCELLED = 3
};

struct FailureContext {
    std::string session_id;
    std::string stage_id;
    std::optional<ErrorCategory> category;       // EN: Classified from errors when absent / FR: Classifiée depuis les erreurs si absente
    std::vector<std::string> errors;
    int error_count = 0;
    std::optional<std::string> last_completed_stage;
    std::optional<std::string> failing_service;
};

// EN: What an executor reports back for one recovery action
// FR: Ce qu'un exécuteur renvoie pour une action de récupération
struct ActionOutcome {
    bool success = false;
    bool degraded = false;
    std::string message;
    nlohmann::json payload = nlohmann::json::object();
};

struct RecoveryAttempt {
    RecoveryActionType action = RecoveryActionType::RETRY;
    RecoveryStrategy strategy = RecoveryStrategy::IMMEDIATE_RETRY;
    int attempt_number = 0;
    AttemptStatus status = AttemptStatus::FAILED;
    double duration_seconds = 0.0;
    std::string message;
    nlohmann::json result_payload = nlohmann::json::object();
    TimePoint started_at;

    nlohmann::json toJson() const;
};

struct RecoveryResult {
    std::string session_id;
    std::string stage_id;
    RecoveryStrategy strategy = RecoveryStrategy::ESCALATE_TO_HUMAN;
    ErrorCategory category = ErrorCategory::TRANSIENT;
    RecoveryStatus status = RecoveryStatus::FAILED;
    std::vector<RecoveryAttempt> attempts;
    bool can_resume = false;
    std::string message;
    std::optional<std::string> escalation_event_id;
    std::vector<std::string> recommendations;
    double total_duration_seconds = 0.0;

    nlohmann::json toJson() const;
};

// ---------------------------------------------------------------------------
// EN: Sessions
// FR: Sessions
// ---------------------------------------------------------------------------

enum class SessionPhase {
    INITIATED = 0,
    IN_STAGE = 1,
    FINALIZING = 2,
    COMPLETED = 3,
    FAILED_REQUIRES_RECOVERY = 4,
    CANCELLED = 5
};

enum class OutcomeDisposition {
    ACCEPTED = 0,
    DUPLICATE = 1,
    REJECTED = 2
};

struct OutcomeAck {
    OutcomeDisposition disposition = OutcomeDisposition::REJECTED;
    std::string reason;

    bool accepted() const { return disposition == OutcomeDisposition::ACCEPTED; }
};

struct SessionSnapshot {
    std::string session_id;
    std::string subject_id;
    SessionPhase phase = SessionPhase::INITIATED;
    bool paused = false;
    std::string current_stage;
    size_t current_stage_index = 0;
    double overall_progress = 0.0;
    TimePoint started_at;
    std::optional<TimePoint> finished_at;
    std::vector<StageRecord> stages;
    std::vector<QualityGateResult> quality_gate_results;
    std::vector<SlaResult> sla_results;
    std::vector<CircuitState> circuit_states;
    std::vector<EscalationEvent> escalation_events;
    std::vector<RecoveryAttempt> recovery_attempts;
    std::vector<RecoveryResult> recovery_results;
    std::vector<std::string> blocking_issues;
    std::string failure_reason;

    nlohmann::json toJson() const;
};

// EN: Terminal outcome delivered through the session future
// FR: Résultat terminal livré par le future de la session
struct SessionResult {
    std::string session_id;
    SessionPhase phase = SessionPhase::COMPLETED;
    std::string failure_reason;
    SessionSnapshot snapshot;

    bool succeeded() const { return phase == SessionPhase::COMPLETED; }
};

// EN: Conversions between enums and their configuration/wire names
// FR: Conversions entre enums et leurs noms de configuration/transport
namespace OrchestrationUtils {

    std::string stageStatusToString(StageStatus status);
    StageStatus stageStatusFromString(const std::string& value);

    std::string criticalityToString(StageCriticality criticality);
    StageCriticality criticalityFromString(const std::string& value);

    std::string gateStatusToString(GateStatus status);
    GateStatus gateStatusFromString(const std::string& value);

    std::string failureActionToString(GateFailureAction action);
    GateFailureAction failureActionFromString(const std::string& value);

    std::string ruleKindToString(QualityRuleKind kind);
    QualityRuleKind ruleKindFromString(const std::string& value);

    std::string trendToString(QualityTrend trend);

    std::string slaStatusToString(SlaStatus status);
    SlaStatus slaStatusFromString(const std::string& value);

    std::string breakerStateToString(BreakerState state);
    std::string circuitActionToString(CircuitAction action);
    std::string protectionLevelToString(ProtectionLevel level);

    std::string escalationLevelToString(EscalationLevel level);
    EscalationLevel escalationLevelFromString(const std::string& value);

    std::string conditionKindToString(ConditionKind kind);
    ConditionKind conditionKindFromString(const std::string& value);

    std::string automaticActionToString(AutomaticAction action);
    AutomaticAction automaticActionFromString(const std::string& value);

    std::string strategyToString(RecoveryStrategy strategy);
    std::string recoveryActionToString(RecoveryActionType action);
    std::string attemptStatusToString(AttemptStatus status);
    std::string recoveryStatusToString(RecoveryStatus status);

    std::string sessionPhaseToString(SessionPhase phase);
    bool isTerminalPhase(SessionPhase phase);

    std::string dispositionToString(OutcomeDisposition disposition);

    // EN: ISO-8601 UTC rendering used in every JSON export
    // FR: Rendu ISO-8601 UTC utilisé dans chaque export JSON
    std::string formatTimestamp(const TimePoint& tp);
    std::optional<TimePoint> parseTimestamp(const std::string& value);

    // EN: Ordering rank of stage statuses; COMPLETED is terminal
    // FR: Rang d'ordre des statuts d'étape ; COMPLETED est terminal
    int stageStatusRank(StageStatus status);

} // namespace OrchestrationUtils

} // namespace Orchestrator
} // namespace OBF
