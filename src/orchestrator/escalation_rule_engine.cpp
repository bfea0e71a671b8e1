// EN: Escalation Rule Engine implementation.
// FR: Implémentation de l'Escalation Rule Engine.

#include "orchestrator/escalation_rule_engine.hpp"
#include "infrastructure/logging/logger.hpp"

#include <algorithm>
#include <sstream>

namespace OBF {
namespace Orchestrator {

namespace {

constexpr uint64_t kTimeMask = (uint64_t{1} << 48) - 1;
constexpr uint64_t kMaxCount = 0xFFFF;
constexpr char kKeySeparator = '\x1f';

int64_t toMillis(TimePoint tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

template<typename T>
bool contains(const std::vector<T>& values, const T& value) {
    return std::find(values.begin(), values.end(), value) != values.end();
}

bool isAtRisk(const StageSignal& stage) {
    return stage.sla &&
           (stage.sla->status == SlaStatus::AT_RISK || stage.sla->status == SlaStatus::BREACHED);
}

std::string joinRecipients(const std::vector<std::string>& recipients) {
    std::ostringstream out;
    for (size_t i = 0; i < recipients.size(); ++i) {
        if (i > 0) {
            out << ",";
        }
        out << recipients[i];
    }
    return out.str();
}

} // namespace

EscalationRuleEngine::EscalationRuleEngine(std::vector<EscalationRule> rules,
                                           DynamicEscalationConfig dynamic,
                                           std::shared_ptr<NotificationService> notifier,
                                           MetricsAggregator& metrics,
                                           std::vector<std::string> management_recipients)
    : rules_(std::move(rules)),
      dynamic_(std::move(dynamic)),
      notifier_(std::move(notifier)),
      metrics_(metrics),
      management_recipients_(std::move(management_recipients)) {
    if (!notifier_) {
        throw std::invalid_argument("EscalationRuleEngine requires a notification service");
    }

    std::vector<std::string> errors;
    std::vector<std::string> seen;
    for (const auto& rule : rules_) {
        validateRule(rule, errors);
        if (contains(seen, rule.id)) {
            errors.push_back("escalation rule '" + rule.id + "' is defined twice");
        }
        seen.push_back(rule.id);
    }
    if (!errors.empty()) {
        throw std::invalid_argument("Invalid escalation rules: " + errors.front());
    }
}

void EscalationRuleEngine::setActionHandler(EscalationActionHandler* handler) {
    handler_.store(handler);
}

void EscalationRuleEngine::setStageProfiles(const std::vector<StageProfile>& profiles) {
    std::unique_lock<std::shared_mutex> lock(profiles_mutex_);
    profiles_.clear();
    for (const auto& profile : profiles) {
        profiles_[profile.stage_id] = profile;
    }
}

std::vector<EscalationEvent> EscalationRuleEngine::evaluate(const EscalationSignals& signals) {
    std::vector<EscalationEvent> fired;
    const int64_t now_ms = toMillis(signals.now);

    for (const auto& rule : rules_) {
        auto matched_stage = matchRule(rule, signals);
        if (!matched_stage) {
            continue;
        }

        auto gate = gateFor(signals.session_id, rule.id);
        const int64_t cooldown_ms = static_cast<int64_t>(rule.cooldown_minutes) * 60000;
        if (!tryAcquire(*gate, now_ms, cooldown_ms, static_cast<uint64_t>(rule.max_per_session))) {
            metrics_.increment(Metric::ESCALATIONS_SUPPRESSED);
            LOG_DEBUG("escalation", "Rule " + rule.id + " suppressed for session " + signals.session_id +
                      " (cooldown or quota)");
            continue;
        }

        fired.push_back(fire(rule, signals, *matched_stage, describeMatch(rule, *matched_stage), false));
    }

    if (dynamic_.enabled) {
        std::vector<std::string> degraded;
        for (const auto& stage : signals.stages) {
            if (isAtRisk(stage)) {
                degraded.push_back(stage.stage_id);
            }
        }

        if (degraded.size() >= dynamic_.min_stages_at_risk) {
            auto gate = gateFor(signals.session_id, kDynamicRuleId);
            const int64_t cooldown_ms = static_cast<int64_t>(dynamic_.cooldown_minutes) * 60000;
            if (tryAcquire(*gate, now_ms, cooldown_ms, kMaxCount)) {
                EscalationRule rule;
                rule.id = kDynamicRuleId;
                rule.name = "Compound stage degradation";
                rule.level = dynamic_.level;
                rule.recipients = dynamic_.recipients.empty() ? management_recipients_ : dynamic_.recipients;
                rule.message_template = "{level}: {reason} for subject {subject_id} (session {session_id})";

                std::string reason = std::to_string(degraded.size()) + " stages at risk or breached: " +
                                     joinRecipients(degraded);
                fired.push_back(fire(rule, signals, degraded.front(), reason, true));
            } else {
                metrics_.increment(Metric::ESCALATIONS_SUPPRESSED);
            }
        }
    }

    return fired;
}

std::vector<EscalationEvent> EscalationRuleEngine::evaluate(const std::string& session_id,
                                                            const std::vector<QualityGateResult>& quality_results,
                                                            const std::vector<SlaResult>& sla_results,
                                                            const std::vector<CircuitState>& circuit_states,
                                                            TimePoint now) {
    EscalationSignals signals;
    signals.session_id = session_id;
    signals.circuits = circuit_states;
    signals.now = now;

    auto stageFor = [&](const std::string& stage_id) -> StageSignal& {
        for (auto& stage : signals.stages) {
            if (stage.stage_id == stage_id) {
                return stage;
            }
        }
        StageSignal stage;
        stage.stage_id = stage_id;
        stage.status = StageStatus::PROCESSING;
        {
            std::shared_lock<std::shared_mutex> lock(profiles_mutex_);
            auto it = profiles_.find(stage_id);
            if (it != profiles_.end()) {
                stage.criticality = it->second.criticality;
                stage.breach_minutes = it->second.breach_minutes;
            }
        }
        signals.stages.push_back(std::move(stage));
        return signals.stages.back();
    };

    for (const auto& sla : sla_results) {
        stageFor(sla.stage_id).sla = sla;
    }
    for (const auto& gate : quality_results) {
        auto& stage = stageFor(gate.stage_id);
        stage.gate = gate;
        if (!gate.passed) {
            stage.status = StageStatus::ESCALATED;
        }
    }

    return evaluate(signals);
}

EscalationEvent EscalationRuleEngine::escalateManually(const std::string& session_id,
                                                       const std::string& subject_id,
                                                       const std::string& stage_id,
                                                       EscalationLevel level,
                                                       const std::string& reason,
                                                       TimePoint now,
                                                       const std::vector<std::string>& recipients) {
    EscalationRule rule;
    rule.id = kManualRuleId;
    rule.name = "Manual escalation";
    rule.level = level;
    rule.recipients = recipients.empty() ? management_recipients_ : recipients;
    rule.requires_ack = level != EscalationLevel::WARNING;
    rule.message_template = "{level}: {reason} (subject {subject_id}, session {session_id}, stage {stage})";
    if (level == EscalationLevel::EMERGENCY) {
        rule.automatic_actions.push_back(AutomaticAction::CREATE_INCIDENT);
    }

    EscalationSignals signals;
    signals.session_id = session_id;
    signals.subject_id = subject_id;
    signals.now = now;
    return fire(rule, signals, stage_id, reason, false);
}

EscalationEvent EscalationRuleEngine::fire(const EscalationRule& rule, const EscalationSignals& signals,
                                           const std::string& stage_id, const std::string& reason, bool dynamic) {
    EscalationEvent event;
    event.event_id = nextEventId();
    event.session_id = signals.session_id;
    event.rule_id = rule.id;
    event.level = rule.level;
    event.trigger_reason = reason;
    event.stage_id = stage_id;
    event.recipients = rule.recipients;
    event.requires_ack = rule.requires_ack;
    event.dynamic = dynamic;
    event.created_at = signals.now;

    std::string message = rule.message_template.empty()
        ? "{level} escalation '" + rule.name + "' for session {session_id}: {reason}"
        : rule.message_template;
    message = renderMessage(message, {
        {"subject_id", signals.subject_id},
        {"session_id", signals.session_id},
        {"stage", stage_id.empty() ? std::string("-") : stage_id},
        {"level", OrchestrationUtils::escalationLevelToString(rule.level)},
        {"reason", reason}
    });

    metrics_.increment(Metric::ESCALATIONS_FIRED);
    std::unordered_map<std::string, std::string> meta{
        {"session_id", signals.session_id},
        {"rule_id", rule.id},
        {"level", OrchestrationUtils::escalationLevelToString(rule.level)},
        {"stage", stage_id},
        {"event_id", event.event_id}
    };
    if (rule.level == EscalationLevel::WARNING) {
        LOG_WARN_META("escalation", "Escalation fired: " + reason, meta);
    } else {
        LOG_ERROR_META("escalation", "Escalation fired: " + reason, meta);
    }

    sendNotification(event, message);
    executeActions(rule, event, signals.subject_id, message);
    store(event);
    return event;
}

void EscalationRuleEngine::sendNotification(EscalationEvent& event, const std::string& message) {
    if (event.recipients.empty()) {
        LOG_WARN("escalation", "Escalation " + event.event_id + " has no recipients, notification skipped");
        return;
    }
    try {
        event.notification_id = notifier_->notify(event.recipients, event.level, message, event.requires_ack);
    } catch (const std::exception& e) {
        LOG_ERROR("escalation", "Notification for " + event.event_id + " threw: " + e.what());
    }

    if (event.notification_id) {
        metrics_.increment(Metric::NOTIFICATIONS_SENT);
    } else {
        metrics_.increment(Metric::NOTIFICATIONS_FAILED);
        LOG_WARN("escalation", "Notification for " + event.event_id + " could not be delivered");
    }
}

void EscalationRuleEngine::executeActions(const EscalationRule& rule, EscalationEvent& event,
                                          const std::string& subject_id, const std::string& message) {
    EscalationActionHandler* handler = handler_.load();

    for (auto action : rule.automatic_actions) {
        const std::string name = OrchestrationUtils::automaticActionToString(action);
        bool ok = false;
        try {
            switch (action) {
                case AutomaticAction::PAUSE_PIPELINE:
                    ok = handler && handler->pausePipeline(event.session_id, event.trigger_reason);
                    break;
                case AutomaticAction::RESTART_DEPENDENCY:
                    ok = handler && handler->restartDependency(event.session_id, event.stage_id);
                    break;
                case AutomaticAction::ROUTE_MANUAL_REVIEW:
                    ok = handler && handler->routeToManualReview(event.session_id, event.stage_id);
                    break;
                case AutomaticAction::CREATE_INCIDENT: {
                    nlohmann::json context = {
                        {"event_id", event.event_id},
                        {"session_id", event.session_id},
                        {"subject_id", subject_id},
                        {"rule_id", event.rule_id},
                        {"level", OrchestrationUtils::escalationLevelToString(event.level)},
                        {"stage", event.stage_id},
                        {"reason", event.trigger_reason}
                    };
                    event.incident_id = notifier_->createIncident(context);
                    ok = event.incident_id.has_value();
                    if (ok) {
                        metrics_.increment(Metric::INCIDENTS_CREATED);
                    }
                    break;
                }
                case AutomaticAction::NOTIFY_MANAGEMENT:
                    if (!management_recipients_.empty()) {
                        ok = notifier_->notify(management_recipients_, event.level, message, false).has_value();
                        metrics_.increment(ok ? Metric::NOTIFICATIONS_SENT : Metric::NOTIFICATIONS_FAILED);
                    }
                    break;
            }
        } catch (const std::exception& e) {
            LOG_ERROR("escalation", "Action " + name + " for " + event.event_id + " threw: " + e.what());
            ok = false;
        }

        if (ok) {
            event.actions_executed.push_back(name);
        } else {
            event.actions_executed.push_back(name + ":failed");
            LOG_WARN("escalation", "Action " + name + " for " + event.event_id + " did not complete");
        }
    }
}

void EscalationRuleEngine::store(const EscalationEvent& event) {
    std::lock_guard<std::mutex> lock(events_mutex_);
    events_[event.event_id] = event;
    session_events_[event.session_id].push_back(event.event_id);
}

std::string EscalationRuleEngine::nextEventId() {
    return "esc-" + std::to_string(next_event_.fetch_add(1));
}

bool EscalationRuleEngine::acknowledge(const std::string& event_id, const std::string& operator_id, TimePoint now) {
    std::lock_guard<std::mutex> lock(events_mutex_);
    auto it = events_.find(event_id);
    if (it == events_.end() || it->second.acknowledged) {
        return false;
    }
    it->second.acknowledged = true;
    it->second.acknowledged_by = operator_id;
    it->second.acknowledged_at = now;
    LOG_INFO("escalation", "Escalation " + event_id + " acknowledged by " + operator_id);
    return true;
}

bool EscalationRuleEngine::resolve(const std::string& event_id, const std::string& note, TimePoint now) {
    std::lock_guard<std::mutex> lock(events_mutex_);
    auto it = events_.find(event_id);
    if (it == events_.end() || it->second.resolved_at) {
        return false;
    }
    it->second.resolved_at = now;
    it->second.resolution_note = note;
    LOG_INFO("escalation", "Escalation " + event_id + " resolved");
    return true;
}

std::optional<EscalationEvent> EscalationRuleEngine::getEvent(const std::string& event_id) const {
    std::lock_guard<std::mutex> lock(events_mutex_);
    auto it = events_.find(event_id);
    if (it == events_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<EscalationEvent> EscalationRuleEngine::history(const std::string& session_id) const {
    std::lock_guard<std::mutex> lock(events_mutex_);
    std::vector<EscalationEvent> result;
    auto it = session_events_.find(session_id);
    if (it == session_events_.end()) {
        return result;
    }
    for (const auto& id : it->second) {
        auto event = events_.find(id);
        if (event != events_.end()) {
            result.push_back(event->second);
        }
    }
    return result;
}

std::vector<EscalationEvent> EscalationRuleEngine::pendingAcknowledgements() const {
    std::lock_guard<std::mutex> lock(events_mutex_);
    std::vector<EscalationEvent> pending;
    for (const auto& [id, event] : events_) {
        if (event.requires_ack && !event.acknowledged && !event.resolved_at) {
            pending.push_back(event);
        }
    }
    std::sort(pending.begin(), pending.end(), [](const EscalationEvent& a, const EscalationEvent& b) {
        return a.created_at < b.created_at;
    });
    return pending;
}

size_t EscalationRuleEngine::firedCount(const std::string& session_id, const std::string& rule_id) const {
    std::shared_lock<std::shared_mutex> lock(gates_mutex_);
    auto it = gates_.find(session_id + kKeySeparator + rule_id);
    if (it == gates_.end()) {
        return 0;
    }
    return static_cast<size_t>(it->second->load() >> 48);
}

void EscalationRuleEngine::clearSession(const std::string& session_id) {
    {
        std::unique_lock<std::shared_mutex> lock(gates_mutex_);
        const std::string prefix = session_id + kKeySeparator;
        for (auto it = gates_.begin(); it != gates_.end();) {
            if (it->first.compare(0, prefix.size(), prefix) == 0) {
                it = gates_.erase(it);
            } else {
                ++it;
            }
        }
    }

    std::lock_guard<std::mutex> lock(events_mutex_);
    auto it = session_events_.find(session_id);
    if (it == session_events_.end()) {
        return;
    }
    for (const auto& id : it->second) {
        events_.erase(id);
    }
    session_events_.erase(it);
}

std::shared_ptr<std::atomic<uint64_t>> EscalationRuleEngine::gateFor(const std::string& session_id,
                                                                     const std::string& rule_id) {
    const std::string key = session_id + kKeySeparator + rule_id;
    {
        std::shared_lock<std::shared_mutex> lock(gates_mutex_);
        auto it = gates_.find(key);
        if (it != gates_.end()) {
            return it->second;
        }
    }
    std::unique_lock<std::shared_mutex> lock(gates_mutex_);
    auto& slot = gates_[key];
    if (!slot) {
        slot = std::make_shared<std::atomic<uint64_t>>(0);
    }
    return slot;
}

bool EscalationRuleEngine::tryAcquire(std::atomic<uint64_t>& gate, int64_t now_ms, int64_t cooldown_ms,
                                      uint64_t max_count) {
    max_count = std::min(max_count, kMaxCount);
    uint64_t current = gate.load();
    while (true) {
        const uint64_t count = current >> 48;
        const uint64_t last = current & kTimeMask;
        if (count >= max_count) {
            return false;
        }
        if (last != 0 && now_ms - static_cast<int64_t>(last - 1) < cooldown_ms) {
            return false;
        }
        const uint64_t next = ((count + 1) << 48) | (static_cast<uint64_t>(now_ms + 1) & kTimeMask);
        if (gate.compare_exchange_weak(current, next)) {
            return true;
        }
    }
}

std::optional<std::string> EscalationRuleEngine::matchRule(const EscalationRule& rule,
                                                           const EscalationSignals& signals) {
    if (rule.conditions.empty()) {
        return std::nullopt;
    }

    std::vector<const TriggerCondition*> stage_conditions;
    for (const auto& condition : rule.conditions) {
        if (condition.isStageScoped()) {
            stage_conditions.push_back(&condition);
        } else if (!sessionConditionHolds(condition, signals)) {
            return std::nullopt;
        }
    }

    if (stage_conditions.empty()) {
        return std::string();
    }

    for (const auto& stage : signals.stages) {
        bool all = std::all_of(stage_conditions.begin(), stage_conditions.end(),
                               [&stage](const TriggerCondition* condition) {
                                   return stageConditionHolds(*condition, stage);
                               });
        if (all) {
            return stage.stage_id;
        }
    }
    return std::nullopt;
}

bool EscalationRuleEngine::stageConditionHolds(const TriggerCondition& condition, const StageSignal& stage) {
    switch (condition.kind) {
        case ConditionKind::SLA_STATUS_IS:
            return stage.sla && contains(condition.sla_statuses, stage.sla->status);
        case ConditionKind::STAGE_CRITICALITY_AT_LEAST:
            return static_cast<int>(stage.criticality) >= static_cast<int>(condition.min_criticality);
        case ConditionKind::BREACH_DURATION_MINUTES:
            return stage.sla && stage.breach_minutes &&
                   stage.sla->elapsed_minutes - *stage.breach_minutes >= condition.threshold;
        case ConditionKind::QUALITY_GATE_STATUS_IS:
            return stage.gate && contains(condition.gate_statuses, stage.gate->status);
        case ConditionKind::RETRY_ATTEMPTS:
            return static_cast<double>(stage.retry_attempts) >= condition.threshold;
        case ConditionKind::STAGE_STATUS_IS:
            return contains(condition.stage_statuses, stage.status);
        case ConditionKind::STAGE_ERROR_COUNT:
            return static_cast<double>(stage.error_count) >= condition.threshold;
        default:
            return false;
    }
}

bool EscalationRuleEngine::sessionConditionHolds(const TriggerCondition& condition,
                                                 const EscalationSignals& signals) {
    switch (condition.kind) {
        case ConditionKind::STAGES_AT_RISK: {
            auto count = std::count_if(signals.stages.begin(), signals.stages.end(), isAtRisk);
            return static_cast<double>(count) >= condition.threshold;
        }
        case ConditionKind::CIRCUIT_OPEN_COUNT: {
            auto count = std::count_if(signals.circuits.begin(), signals.circuits.end(),
                                       [](const CircuitState& c) { return c.state == BreakerState::OPEN; });
            return static_cast<double>(count) >= condition.threshold;
        }
        case ConditionKind::CONCURRENT_SESSIONS:
            return static_cast<double>(signals.concurrent_sessions) >= condition.threshold;
        case ConditionKind::SYSTEM_LOAD:
            return signals.system_load >= condition.threshold;
        case ConditionKind::ERROR_RATE:
            return signals.error_rate >= condition.threshold;
        case ConditionKind::OUTSIDE_BUSINESS_HOURS:
            return signals.outside_business_hours;
        default:
            return false;
    }
}

std::string EscalationRuleEngine::renderMessage(const std::string& message_template,
                                                const std::map<std::string, std::string>& values) {
    std::string result;
    result.reserve(message_template.size());
    size_t pos = 0;
    while (pos < message_template.size()) {
        size_t open = message_template.find('{', pos);
        if (open == std::string::npos) {
            result.append(message_template, pos, std::string::npos);
            break;
        }
        size_t close = message_template.find('}', open);
        if (close == std::string::npos) {
            result.append(message_template, pos, std::string::npos);
            break;
        }
        result.append(message_template, pos, open - pos);
        auto it = values.find(message_template.substr(open + 1, close - open - 1));
        if (it != values.end()) {
            result += it->second;
        } else {
            // EN: Unknown placeholders are kept verbatim
            // FR: Les placeholders inconnus sont conservés tels quels
            result.append(message_template, open, close - open + 1);
        }
        pos = close + 1;
    }
    return result;
}

std::string EscalationRuleEngine::describeMatch(const EscalationRule& rule, const std::string& stage_id) {
    std::ostringstream out;
    out << rule.name << " [";
    for (size_t i = 0; i < rule.conditions.size(); ++i) {
        if (i > 0) {
            out << " and ";
        }
        out << OrchestrationUtils::conditionKindToString(rule.conditions[i].kind);
    }
    out << "]";
    if (!stage_id.empty()) {
        out << " on stage " << stage_id;
    }
    return out.str();
}

bool EscalationRuleEngine::validateRule(const EscalationRule& rule, std::vector<std::string>& errors) {
    const size_t before = errors.size();
    const std::string prefix = "escalation." + (rule.id.empty() ? std::string("<unnamed>") : rule.id) + ": ";

    if (rule.id.empty()) {
        errors.push_back(prefix + "rule id is required");
    }
    if (rule.cooldown_minutes <= 0) {
        errors.push_back(prefix + "cooldown_minutes must be positive");
    }
    if (rule.recipients.empty()) {
        errors.push_back(prefix + "at least one recipient is required");
    }
    if (rule.max_per_session < 1 || static_cast<uint64_t>(rule.max_per_session) > kMaxCount) {
        errors.push_back(prefix + "max_per_session must be between 1 and 65535");
    }
    if (rule.conditions.empty()) {
        errors.push_back(prefix + "at least one trigger condition is required");
    }
    for (const auto& condition : rule.conditions) {
        const std::string kind = OrchestrationUtils::conditionKindToString(condition.kind);
        switch (condition.kind) {
            case ConditionKind::SLA_STATUS_IS:
                if (condition.sla_statuses.empty()) {
                    errors.push_back(prefix + kind + " needs at least one status");
                }
                break;
            case ConditionKind::QUALITY_GATE_STATUS_IS:
                if (condition.gate_statuses.empty()) {
                    errors.push_back(prefix + kind + " needs at least one status");
                }
                break;
            case ConditionKind::STAGE_STATUS_IS:
                if (condition.stage_statuses.empty()) {
                    errors.push_back(prefix + kind + " needs at least one status");
                }
                break;
            case ConditionKind::STAGE_CRITICALITY_AT_LEAST:
            case ConditionKind::OUTSIDE_BUSINESS_HOURS:
                break;
            default:
                if (condition.threshold < 0.0) {
                    errors.push_back(prefix + kind + " threshold cannot be negative");
                }
                break;
        }
    }
    return errors.size() == before;
}

} // namespace Orchestrator
} // namespace OBF
