// EN: OrchestrationUtils implementation - enum names, timestamps and JSON export of the data model.
// FR: Implémentation d'OrchestrationUtils - noms d'enums, horodatages et export JSON du modèle de données.

#include "orchestrator/orchestration_types.hpp"

#include <algorithm>
#include <cctype>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace OBF {
namespace Orchestrator {

namespace {

std::string normalize(const std::string& value) {
    std::string lowered;
    lowered.reserve(value.size());
    for (char c : value) {
        if (c == '-' || c == ' ') {
            lowered.push_back('_');
        } else {
            lowered.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
        }
    }
    return lowered;
}

nlohmann::json optionalTimestamp(const std::optional<TimePoint>& tp) {
    if (!tp) {
        return nullptr;
    }
    return OrchestrationUtils::formatTimestamp(*tp);
}

template<typename T>
nlohmann::json optionalValue(const std::optional<T>& value) {
    if (!value) {
        return nullptr;
    }
    return *value;
}

} // namespace

namespace OrchestrationUtils {

std::string stageStatusToString(StageStatus status) {
    switch (status) {
        case StageStatus::WAITING: return "waiting";
        case StageStatus::PROCESSING: return "processing";
        case StageStatus::COMPLETED: return "completed";
        case StageStatus::FAILED: return "failed";
        case StageStatus::TIMEOUT: return "timeout";
        case StageStatus::ESCALATED: return "escalated";
    }
    return "unknown";
}

StageStatus stageStatusFromString(const std::string& value) {
    const std::string key = normalize(value);
    if (key == "waiting") return StageStatus::WAITING;
    if (key == "processing") return StageStatus::PROCESSING;
    if (key == "completed") return StageStatus::COMPLETED;
    if (key == "failed") return StageStatus::FAILED;
    if (key == "timeout") return StageStatus::TIMEOUT;
    if (key == "escalated") return StageStatus::ESCALATED;
    throw std::invalid_argument("Unknown stage status: " + value);
}

std::string criticalityToString(StageCriticality criticality) {
    switch (criticality) {
        case StageCriticality::LOW: return "low";
        case StageCriticality::MEDIUM: return "medium";
        case StageCriticality::HIGH: return "high";
        case StageCriticality::CRITICAL: return "critical";
    }
    return "unknown";
}

StageCriticality criticalityFromString(const std::string& value) {
    const std::string key = normalize(value);
    if (key == "low") return StageCriticality::LOW;
    if (key == "medium") return StageCriticality::MEDIUM;
    if (key == "high") return StageCriticality::HIGH;
    if (key == "critical") return StageCriticality::CRITICAL;
    throw std::invalid_argument("Unknown stage criticality: " + value);
}

std::string gateStatusToString(GateStatus status) {
    switch (status) {
        case GateStatus::PASSED: return "passed";
        case GateStatus::FAILED: return "failed";
        case GateStatus::MANUAL_REVIEW: return "manual_review";
        case GateStatus::BYPASS: return "bypass";
    }
    return "unknown";
}

GateStatus gateStatusFromString(const std::string& value) {
    const std::string key = normalize(value);
    if (key == "passed") return GateStatus::PASSED;
    if (key == "failed") return GateStatus::FAILED;
    if (key == "manual_review" || key == "manualreview") return GateStatus::MANUAL_REVIEW;
    if (key == "bypass") return GateStatus::BYPASS;
    throw std::invalid_argument("Unknown gate status: " + value);
}

std::string failureActionToString(GateFailureAction action) {
    switch (action) {
        case GateFailureAction::BLOCK: return "block";
        case GateFailureAction::WARN: return "warn";
        case GateFailureAction::ESCALATE: return "escalate";
    }
    return "unknown";
}

GateFailureAction failureActionFromString(const std::string& value) {
    const std::string key = normalize(value);
    if (key == "block") return GateFailureAction::BLOCK;
    if (key == "warn") return GateFailureAction::WARN;
    if (key == "escalate") return GateFailureAction::ESCALATE;
    throw std::invalid_argument("Unknown gate failure action: " + value);
}

std::string ruleKindToString(QualityRuleKind kind) {
    switch (kind) {
        case QualityRuleKind::MIN_VALUE: return "minValue";
        case QualityRuleKind::MAX_VALUE: return "maxValue";
        case QualityRuleKind::REQUIRED_BOOLEAN: return "requiredBoolean";
        case QualityRuleKind::ALLOWED_VALUES: return "allowedValues";
        case QualityRuleKind::UNKNOWN: return "unknown";
    }
    return "unknown";
}

QualityRuleKind ruleKindFromString(const std::string& value) {
    // EN: Accept both camelCase and snake_case spellings.
    // FR: Accepte les écritures camelCase et snake_case.
    std::string key;
    for (char c : value) {
        if (c != '_' && c != '-') {
            key.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
        }
    }
    if (key == "minvalue") return QualityRuleKind::MIN_VALUE;
    if (key == "maxvalue") return QualityRuleKind::MAX_VALUE;
    if (key == "requiredboolean") return QualityRuleKind::REQUIRED_BOOLEAN;
    if (key == "allowedvalues") return QualityRuleKind::ALLOWED_VALUES;
    return QualityRuleKind::UNKNOWN;
}

std::string trendToString(QualityTrend trend) {
    switch (trend) {
        case QualityTrend::INSUFFICIENT_DATA: return "insufficient_data";
        case QualityTrend::IMPROVING: return "improving";
        case QualityTrend::STABLE: return "stable";
        case QualityTrend::DEGRADING: return "degrading";
    }
    return "unknown";
}

std::string slaStatusToString(SlaStatus status) {
    switch (status) {
        case SlaStatus::ON_TIME: return "on_time";
        case SlaStatus::AT_RISK: return "at_risk";
        case SlaStatus::BREACHED: return "breached";
        case SlaStatus::EXTENDED: return "extended";
    }
    return "unknown";
}

SlaStatus slaStatusFromString(const std::string& value) {
    const std::string key = normalize(value);
    if (key == "on_time" || key == "ontime") return SlaStatus::ON_TIME;
    if (key == "at_risk" || key == "atrisk") return SlaStatus::AT_RISK;
    if (key == "breached") return SlaStatus::BREACHED;
    if (key == "extended") return SlaStatus::EXTENDED;
    throw std::invalid_argument("Unknown SLA status: " + value);
}

std::string breakerStateToString(BreakerState state) {
    switch (state) {
        case BreakerState::CLOSED: return "closed";
        case BreakerState::OPEN: return "open";
        case BreakerState::HALF_OPEN: return "half_open";
    }
    return "unknown";
}

std::string circuitActionToString(CircuitAction action) {
    switch (action) {
        case CircuitAction::NONE: return "none";
        case CircuitAction::OPEN_CIRCUIT: return "open_circuit";
        case CircuitAction::TRANSITION_HALF_OPEN: return "transition_half_open";
        case CircuitAction::CLOSE_CIRCUIT: return "close_circuit";
        case CircuitAction::REOPEN_CIRCUIT: return "reopen_circuit";
    }
    return "unknown";
}

std::string protectionLevelToString(ProtectionLevel level) {
    switch (level) {
        case ProtectionLevel::NONE: return "none";
        case ProtectionLevel::LOW: return "low";
        case ProtectionLevel::MEDIUM: return "medium";
        case ProtectionLevel::HIGH: return "high";
    }
    return "unknown";
}

std::string escalationLevelToString(EscalationLevel level) {
    switch (level) {
        case EscalationLevel::WARNING: return "warning";
        case EscalationLevel::CRITICAL: return "critical";
        case EscalationLevel::EMERGENCY: return "emergency";
    }
    return "unknown";
}

EscalationLevel escalationLevelFromString(const std::string& value) {
    const std::string key = normalize(value);
    if (key == "warning") return EscalationLevel::WARNING;
    if (key == "critical") return EscalationLevel::CRITICAL;
    if (key == "emergency") return EscalationLevel::EMERGENCY;
    throw std::invalid_argument("Unknown escalation level: " + value);
}

std::string conditionKindToString(ConditionKind kind) {
    switch (kind) {
        case ConditionKind::SLA_STATUS_IS: return "sla_status_is";
        case ConditionKind::STAGE_CRITICALITY_AT_LEAST: return "stage_criticality_at_least";
        case ConditionKind::BREACH_DURATION_MINUTES: return "breach_duration_minutes";
        case ConditionKind::QUALITY_GATE_STATUS_IS: return "quality_gate_status_is";
        case ConditionKind::RETRY_ATTEMPTS: return "retry_attempts";
        case ConditionKind::STAGE_STATUS_IS: return "stage_status_is";
        case ConditionKind::STAGE_ERROR_COUNT: return "stage_error_count";
        case ConditionKind::STAGES_AT_RISK: return "stages_at_risk";
        case ConditionKind::CIRCUIT_OPEN_COUNT: return "circuit_open_count";
        case ConditionKind::CONCURRENT_SESSIONS: return "concurrent_sessions";
        case ConditionKind::SYSTEM_LOAD: return "system_load";
        case ConditionKind::ERROR_RATE: return "error_rate";
        case ConditionKind::OUTSIDE_BUSINESS_HOURS: return "outside_business_hours";
    }
    return "unknown";
}

ConditionKind conditionKindFromString(const std::string& value) {
    const std::string key = normalize(value);
    if (key == "sla_status_is") return ConditionKind::SLA_STATUS_IS;
    if (key == "stage_criticality_at_least") return ConditionKind::STAGE_CRITICALITY_AT_LEAST;
    if (key == "breach_duration_minutes") return ConditionKind::BREACH_DURATION_MINUTES;
    if (key == "quality_gate_status_is") return ConditionKind::QUALITY_GATE_STATUS_IS;
    if (key == "retry_attempts") return ConditionKind::RETRY_ATTEMPTS;
    if (key == "stage_status_is") return ConditionKind::STAGE_STATUS_IS;
    if (key == "stage_error_count") return ConditionKind::STAGE_ERROR_COUNT;
    if (key == "stages_at_risk") return ConditionKind::STAGES_AT_RISK;
    if (key == "circuit_open_count") return ConditionKind::CIRCUIT_OPEN_COUNT;
    if (key == "concurrent_sessions") return ConditionKind::CONCURRENT_SESSIONS;
    if (key == "system_load") return ConditionKind::SYSTEM_LOAD;
    if (key == "error_rate") return ConditionKind::ERROR_RATE;
    if (key == "outside_business_hours") return ConditionKind::OUTSIDE_BUSINESS_HOURS;
    throw std::invalid_argument("Unknown trigger condition: " + value);
}

std::string automaticActionToString(AutomaticAction action) {
    switch (action) {
        case AutomaticAction::PAUSE_PIPELINE: return "pause_pipeline";
        case AutomaticAction::RESTART_DEPENDENCY: return "restart_dependency";
        case AutomaticAction::CREATE_INCIDENT: return "create_incident";
        case AutomaticAction::NOTIFY_MANAGEMENT: return "notify_management";
        case AutomaticAction::ROUTE_MANUAL_REVIEW: return "route_manual_review";
    }
    return "unknown";
}

AutomaticAction automaticActionFromString(const std::string& value) {
    const std::string key = normalize(value);
    if (key == "pause_pipeline") return AutomaticAction::PAUSE_PIPELINE;
    if (key == "restart_dependency") return AutomaticAction::RESTART_DEPENDENCY;
    if (key == "create_incident") return AutomaticAction::CREATE_INCIDENT;
    if (key == "notify_management") return AutomaticAction::NOTIFY_MANAGEMENT;
    if (key == "route_manual_review") return AutomaticAction::ROUTE_MANUAL_REVIEW;
    throw std::invalid_argument("Unknown automatic action: " + value);
}

std::string strategyToString(RecoveryStrategy strategy) {
    switch (strategy) {
        case RecoveryStrategy::IMMEDIATE_RETRY: return "immediate_retry";
        case RecoveryStrategy::EXPONENTIAL_BACKOFF_RETRY: return "exponential_backoff_retry";
        case RecoveryStrategy::STATE_RESTORATION: return "state_restoration";
        case RecoveryStrategy::WORKFLOW_RESUMPTION: return "workflow_resumption";
        case RecoveryStrategy::ESCALATE_TO_HUMAN: return "escalate_to_human";
    }
    return "unknown";
}

std::string recoveryActionToString(RecoveryActionType action) {
    switch (action) {
        case RecoveryActionType::RETRY: return "retry";
        case RecoveryActionType::STATE_RESTORE: return "state_restore";
        case RecoveryActionType::CIRCUIT_RESET: return "circuit_reset";
        case RecoveryActionType::WORKFLOW_RESUME: return "workflow_resume";
    }
    return "unknown";
}

std::string attemptStatusToString(AttemptStatus status) {
    switch (status) {
        case AttemptStatus::SUCCEEDED: return "succeeded";
        case AttemptStatus::DEGRADED: return "degraded";
        case AttemptStatus::FAILED: return "failed";
        case AttemptStatus::REJECTED: return "rejected";
        case AttemptStatus::CANCELLED: return "cancelled";
    }
    return "unknown";
}

std::string recoveryStatusToString(RecoveryStatus status) {
    switch (status) {
        case RecoveryStatus::SUCCESS: return "success";
        case RecoveryStatus::PARTIAL: return "partial";
        case RecoveryStatus::FAILED: return "failed";
        case RecoveryStatus::CANCELLED: return "cancelled";
    }
    return "unknown";
}

std::string sessionPhaseToString(SessionPhase phase) {
    switch (phase) {
        case SessionPhase::INITIATED: return "initiated";
        case SessionPhase::IN_STAGE: return "in_stage";
        case SessionPhase::FINALIZING: return "finalizing";
        case SessionPhase::COMPLETED: return "completed";
        case SessionPhase::FAILED_REQUIRES_RECOVERY: return "failed_requires_recovery";
        case SessionPhase::CANCELLED: return "cancelled";
    }
    return "unknown";
}

bool isTerminalPhase(SessionPhase phase) {
    return phase == SessionPhase::COMPLETED ||
           phase == SessionPhase::FAILED_REQUIRES_RECOVERY ||
           phase == SessionPhase::CANCELLED;
}

std::string dispositionToString(OutcomeDisposition disposition) {
    switch (disposition) {
        case OutcomeDisposition::ACCEPTED: return "accepted";
        case OutcomeDisposition::DUPLICATE: return "duplicate";
        case OutcomeDisposition::REJECTED: return "rejected";
    }
    return "unknown";
}

std::string formatTimestamp(const TimePoint& tp) {
    auto time_t = std::chrono::system_clock::to_time_t(tp);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()) % 1000;
    if (ms.count() < 0) {
        ms += std::chrono::milliseconds(1000);
        --time_t;
    }

    std::tm utc{};
    gmtime_r(&time_t, &utc);

    std::ostringstream oss;
    oss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S")
        << '.' << std::setfill('0') << std::setw(3) << ms.count() << 'Z';
    return oss.str();
}

std::optional<TimePoint> parseTimestamp(const std::string& value) {
    std::tm utc{};
    std::istringstream iss(value);
    iss >> std::get_time(&utc, "%Y-%m-%dT%H:%M:%S");
    if (iss.fail()) {
        return std::nullopt;
    }

    int millis = 0;
    if (iss.peek() == '.') {
        iss.get();
        std::string digits;
        while (digits.size() < 3 && std::isdigit(iss.peek())) {
            digits.push_back(static_cast<char>(iss.get()));
        }
        while (digits.size() < 3) {
            digits.push_back('0');
        }
        millis = std::stoi(digits);
    }

    auto seconds = timegm(&utc);
    return std::chrono::system_clock::from_time_t(seconds) + std::chrono::milliseconds(millis);
}

int stageStatusRank(StageStatus status) {
    switch (status) {
        case StageStatus::WAITING: return 0;
        case StageStatus::PROCESSING: return 1;
        case StageStatus::FAILED:
        case StageStatus::TIMEOUT:
        case StageStatus::ESCALATED: return 2;
        case StageStatus::COMPLETED: return 3;
    }
    return 0;
}

} // namespace OrchestrationUtils

// EN: JSON export of the data model
// FR: Export JSON du modèle de données

nlohmann::json StageRecord::toJson() const {
    return nlohmann::json{
        {"stage_id", stage_id},
        {"status", OrchestrationUtils::stageStatusToString(status)},
        {"started_at", optionalTimestamp(started_at)},
        {"completed_at", optionalTimestamp(completed_at)},
        {"error_count", error_count},
        {"errors", errors},
        {"output_payload", output_payload},
        {"progress_percent", progress_percent},
        {"dispatch_attempts", dispatch_attempts},
        {"recoveries", recoveries},
        {"gate_failures", gate_failures},
        {"extension_events", extension_events},
        {"outcome_fingerprint", outcome_fingerprint}
    };
}

StageRecord StageRecord::fromJson(const nlohmann::json& json) {
    StageRecord record;
    record.stage_id = json.at("stage_id").get<std::string>();
    record.status = OrchestrationUtils::stageStatusFromString(json.at("status").get<std::string>());
    if (json.contains("started_at") && json["started_at"].is_string()) {
        record.started_at = OrchestrationUtils::parseTimestamp(json["started_at"].get<std::string>());
    }
    if (json.contains("completed_at") && json["completed_at"].is_string()) {
        record.completed_at = OrchestrationUtils::parseTimestamp(json["completed_at"].get<std::string>());
    }
    record.error_count = json.value("error_count", 0);
    record.errors = json.value("errors", std::vector<std::string>{});
    record.output_payload = json.value("output_payload", nlohmann::json());
    record.progress_percent = json.value("progress_percent", 0.0);
    record.dispatch_attempts = json.value("dispatch_attempts", 0);
    record.recoveries = json.value("recoveries", 0);
    record.gate_failures = json.value("gate_failures", 0);
    record.extension_events = json.value("extension_events", std::vector<std::string>{});
    record.outcome_fingerprint = json.value("outcome_fingerprint", std::string{});
    return record;
}

nlohmann::json QualityGateResult::toJson() const {
    return nlohmann::json{
        {"stage_id", stage_id},
        {"passed", passed},
        {"score", score},
        {"status", OrchestrationUtils::gateStatusToString(status)},
        {"critical_issues", critical_issues},
        {"warnings", warnings},
        {"fields_score", fields_score},
        {"thresholds_score", thresholds_score},
        {"rules_score", rules_score},
        {"bypass_reason", optionalValue(bypass_reason)},
        {"bypassed_by", optionalValue(bypassed_by)},
        {"next_actions", next_actions},
        {"evaluated_at", OrchestrationUtils::formatTimestamp(evaluated_at)}
    };
}

nlohmann::json SlaResult::toJson() const {
    return nlohmann::json{
        {"stage_id", stage_id},
        {"status", OrchestrationUtils::slaStatusToString(status)},
        {"elapsed_minutes", elapsed_minutes},
        {"remaining_minutes", remaining_minutes},
        {"predicted_total_minutes", predicted_total_minutes},
        {"predicted_completion", OrchestrationUtils::formatTimestamp(predicted_completion)},
        {"breach_probability", breach_probability},
        {"extensions_used", extensions_used},
        {"evaluated_at", OrchestrationUtils::formatTimestamp(evaluated_at)}
    };
}

nlohmann::json CircuitState::toJson() const {
    return nlohmann::json{
        {"service_name", service_name},
        {"state", OrchestrationUtils::breakerStateToString(state)},
        {"failure_count", failure_count},
        {"last_failure_at", optionalTimestamp(last_failure_at)},
        {"last_state_change", optionalTimestamp(last_state_change)},
        {"total_calls", total_calls},
        {"total_failures", total_failures}
    };
}

nlohmann::json ProtectionReport::toJson() const {
    return nlohmann::json{
        {"total_services", total_services},
        {"closed", closed},
        {"open", open},
        {"half_open", half_open},
        {"unhealthy_services", unhealthy_services},
        {"protection_level", OrchestrationUtils::protectionLevelToString(level)}
    };
}

nlohmann::json EscalationEvent::toJson() const {
    return nlohmann::json{
        {"event_id", event_id},
        {"session_id", session_id},
        {"rule_id", rule_id},
        {"level", OrchestrationUtils::escalationLevelToString(level)},
        {"trigger_reason", trigger_reason},
        {"stage_id", stage_id},
        {"recipients", recipients},
        {"actions_executed", actions_executed},
        {"notification_id", optionalValue(notification_id)},
        {"incident_id", optionalValue(incident_id)},
        {"requires_ack", requires_ack},
        {"acknowledged", acknowledged},
        {"acknowledged_by", acknowledged_by},
        {"acknowledged_at", optionalTimestamp(acknowledged_at)},
        {"resolved_at", optionalTimestamp(resolved_at)},
        {"resolution_note", resolution_note},
        {"dynamic", dynamic},
        {"created_at", OrchestrationUtils::formatTimestamp(created_at)}
    };
}

nlohmann::json RecoveryAttempt::toJson() const {
    return nlohmann::json{
        {"action", OrchestrationUtils::recoveryActionToString(action)},
        {"strategy", OrchestrationUtils::strategyToString(strategy)},
        {"attempt_number", attempt_number},
        {"status", OrchestrationUtils::attemptStatusToString(status)},
        {"duration_seconds", duration_seconds},
        {"message", message},
        {"result_payload", result_payload},
        {"started_at", OrchestrationUtils::formatTimestamp(started_at)}
    };
}

nlohmann::json RecoveryResult::toJson() const {
    nlohmann::json attempts_json = nlohmann::json::array();
    for (const auto& attempt : attempts) {
        attempts_json.push_back(attempt.toJson());
    }
    return nlohmann::json{
        {"session_id", session_id},
        {"stage_id", stage_id},
        {"strategy", OrchestrationUtils::strategyToString(strategy)},
        {"category", ErrorRecoveryUtils::categoryToString(category)},
        {"status", OrchestrationUtils::recoveryStatusToString(status)},
        {"attempts", attempts_json},
        {"can_resume", can_resume},
        {"message", message},
        {"escalation_event_id", optionalValue(escalation_event_id)},
        {"recommendations", recommendations},
        {"total_duration_seconds", total_duration_seconds}
    };
}

nlohmann::json SessionSnapshot::toJson() const {
    auto toArray = [](const auto& items) {
        nlohmann::json array = nlohmann::json::array();
        for (const auto& item : items) {
            array.push_back(item.toJson());
        }
        return array;
    };

    return nlohmann::json{
        {"session_id", session_id},
        {"subject_id", subject_id},
        {"phase", OrchestrationUtils::sessionPhaseToString(phase)},
        {"paused", paused},
        {"current_stage", current_stage},
        {"current_stage_index", current_stage_index},
        {"overall_progress", overall_progress},
        {"started_at", OrchestrationUtils::formatTimestamp(started_at)},
        {"finished_at", optionalTimestamp(finished_at)},
        {"stages", toArray(stages)},
        {"quality_gate_results", toArray(quality_gate_results)},
        {"sla_results", toArray(sla_results)},
        {"circuit_states", toArray(circuit_states)},
        {"escalation_events", toArray(escalation_events)},
        {"recovery_attempts", toArray(recovery_attempts)},
        {"recovery_results", toArray(recovery_results)},
        {"blocking_issues", blocking_issues},
        {"failure_reason", failure_reason}
    };
}

bool TriggerCondition::isStageScoped() const {
    switch (kind) {
        case ConditionKind::SLA_STATUS_IS:
        case ConditionKind::STAGE_CRITICALITY_AT_LEAST:
        case ConditionKind::BREACH_DURATION_MINUTES:
        case ConditionKind::QUALITY_GATE_STATUS_IS:
        case ConditionKind::RETRY_ATTEMPTS:
        case ConditionKind::STAGE_STATUS_IS:
        case ConditionKind::STAGE_ERROR_COUNT:
            return true;
        default:
            return false;
    }
}

} // namespace Orchestrator
} // namespace OBF
