// EN: Escalation Rule Engine - typed trigger rules, cooldown/quota gating and automatic remediation actions.
// FR: Escalation Rule Engine - règles typées, limitation cooldown/quota et actions de remédiation automatiques.

#pragma once

#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "infrastructure/metrics/metrics_aggregator.hpp"
#include "orchestrator/collaborators.hpp"
#include "orchestrator/orchestration_types.hpp"

namespace OBF {
namespace Orchestrator {

// EN: Receiver of the automatic actions that act on a running session
// FR: Récepteur des actions automatiques qui agissent sur une session en cours
class EscalationActionHandler {
public:
    virtual ~EscalationActionHandler() = default;

    virtual bool pausePipeline(const std::string& session_id, const std::string& reason) = 0;
    virtual bool restartDependency(const std::string& session_id, const std::string& stage_id) = 0;
    virtual bool routeToManualReview(const std::string& session_id, const std::string& stage_id) = 0;
};

// EN: Compound degradation detection, independent from the configured rules
// FR: Détection de dégradation composée, indépendante des règles configurées
struct DynamicEscalationConfig {
    bool enabled = true;
    size_t min_stages_at_risk = 2;
    int cooldown_minutes = 30;
    EscalationLevel level = EscalationLevel::WARNING;
    std::vector<std::string> recipients;
};

// EN: Static facts about a stage used by the result-based evaluate() overload
// FR: Faits statiques d'une étape utilisés par la surcharge evaluate() basée sur les résultats
struct StageProfile {
    std::string stage_id;
    StageCriticality criticality = StageCriticality::MEDIUM;
    std::optional<double> breach_minutes;
};

class EscalationRuleEngine {
public:
    static constexpr const char* kDynamicRuleId = "dynamic_escalation";
    static constexpr const char* kManualRuleId = "manual_escalation";

    EscalationRuleEngine(std::vector<EscalationRule> rules,
                         DynamicEscalationConfig dynamic,
                         std::shared_ptr<NotificationService> notifier,
                         MetricsAggregator& metrics,
                         std::vector<std::string> management_recipients = {});

    EscalationRuleEngine(const EscalationRuleEngine&) = delete;
    EscalationRuleEngine& operator=(const EscalationRuleEngine&) = delete;

    // EN: Non-owning; the handler must outlive the engine or be reset to nullptr
    // FR: Non possédant ; le handler doit survivre au moteur ou être remis à nullptr
    void setActionHandler(EscalationActionHandler* handler);
    void setStageProfiles(const std::vector<StageProfile>& profiles);

    // EN: Evaluate every rule against a full signal set; returns the events fired by this call
    // FR: Évalue chaque règle contre un jeu complet de signaux ; retourne les événements émis par cet appel
    std::vector<EscalationEvent> evaluate(const EscalationSignals& signals);

    std::vector<EscalationEvent> evaluate(const std::string& session_id,
                                          const std::vector<QualityGateResult>& quality_results,
                                          const std::vector<SlaResult>& sla_results,
                                          const std::vector<CircuitState>& circuit_states,
                                          TimePoint now);

    // EN: Bypasses cooldown and quota; used for unrecoverable failures and gate escalations
    // FR: Ignore cooldown et quota ; utilisé pour les échecs irrécupérables et les escalades de gate
    EscalationEvent escalateManually(const std::string& session_id,
                                     const std::string& subject_id,
                                     const std::string& stage_id,
                                     EscalationLevel level,
                                     const std::string& reason,
                                     TimePoint now,
                                     const std::vector<std::string>& recipients = {});

    bool acknowledge(const std::string& event_id, const std::string& operator_id, TimePoint now);
    bool resolve(const std::string& event_id, const std::string& note, TimePoint now);

    std::optional<EscalationEvent> getEvent(const std::string& event_id) const;
    std::vector<EscalationEvent> history(const std::string& session_id) const;
    std::vector<EscalationEvent> pendingAcknowledgements() const;
    size_t firedCount(const std::string& session_id, const std::string& rule_id) const;

    // EN: Drop gates and history of a finished session
    // FR: Supprime compteurs et historique d'une session terminée
    void clearSession(const std::string& session_id);

    const std::vector<EscalationRule>& rules() const { return rules_; }

    // EN: Returns the stage the rule matched on ("" for session-wide rules), or nullopt
    // FR: Retourne l'étape sur laquelle la règle a correspondu ("" si globale), ou nullopt
    static std::optional<std::string> matchRule(const EscalationRule& rule, const EscalationSignals& signals);
    static bool stageConditionHolds(const TriggerCondition& condition, const StageSignal& stage);
    static bool sessionConditionHolds(const TriggerCondition& condition, const EscalationSignals& signals);

    static std::string renderMessage(const std::string& message_template,
                                     const std::map<std::string, std::string>& values);
    static bool validateRule(const EscalationRule& rule, std::vector<std::string>& errors);

    // EN: Packed gate word: upper 16 bits fire count, lower 48 bits last fire time in ms + 1
    // FR: Mot compacté : 16 bits hauts = nombre d'émissions, 48 bits bas = dernière émission en ms + 1
    static bool tryAcquire(std::atomic<uint64_t>& gate, int64_t now_ms, int64_t cooldown_ms, uint64_t max_count);

private:
    // EN: Shared so an evaluation in flight keeps its gate alive across clearSession
    // FR: Partagé pour qu'une évaluation en cours garde sa gate vivante malgré clearSession
    std::shared_ptr<std::atomic<uint64_t>> gateFor(const std::string& session_id, const std::string& rule_id);
    EscalationEvent fire(const EscalationRule& rule, const EscalationSignals& signals,
                         const std::string& stage_id, const std::string& reason, bool dynamic);
    void executeActions(const EscalationRule& rule, EscalationEvent& event, const std::string& subject_id,
                        const std::string& message);
    void sendNotification(EscalationEvent& event, const std::string& message);
    void store(const EscalationEvent& event);
    std::string nextEventId();

    static std::string describeMatch(const EscalationRule& rule, const std::string& stage_id);

    std::vector<EscalationRule> rules_;
    DynamicEscalationConfig dynamic_;
    std::shared_ptr<NotificationService> notifier_;
    MetricsAggregator& metrics_;
    std::vector<std::string> management_recipients_;
    std::atomic<EscalationActionHandler*> handler_{nullptr};

    mutable std::shared_mutex profiles_mutex_;
    std::unordered_map<std::string, StageProfile> profiles_;

    mutable std::shared_mutex gates_mutex_;
    std::unordered_map<std::string, std::shared_ptr<std::atomic<uint64_t>>> gates_;

    mutable std::mutex events_mutex_;
    std::unordered_map<std::string, EscalationEvent> events_;
    std::unordered_map<std::string, std::vector<std::string>> session_events_;
    std::atomic<uint64_t> next_event_{1};
};

} // namespace Orchestrator
} // namespace OBF
