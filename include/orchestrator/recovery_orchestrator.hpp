// EN: Recovery Orchestrator - selects and runs a remediation strategy for a failed stage, reporting truthfully.
// FR: Recovery Orchestrator - choisit et exécute une stratégie de remédiation pour une étape en échec, sans maquiller le résultat.

#pragma once

#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "infrastructure/metrics/metrics_aggregator.hpp"
#include "infrastructure/system/error_recovery.hpp"
#include "orchestrator/circuit_breaker_manager.hpp"
#include "orchestrator/collaborators.hpp"
#include "orchestrator/escalation_rule_engine.hpp"
#include "orchestrator/orchestration_types.hpp"

namespace OBF {
namespace Orchestrator {

// EN: Performs the concrete recovery actions on behalf of the orchestrator
// FR: Réalise les actions de récupération concrètes pour le compte de l'orchestrateur
class RecoveryActionExecutor {
public:
    virtual ~RecoveryActionExecutor() = default;

    virtual ActionOutcome retryStage(const FailureContext& context, int attempt) = 0;
    virtual ActionOutcome restoreStage(const FailureContext& context) = 0;
    virtual ActionOutcome resumeWorkflow(const FailureContext& context) = 0;
    virtual ActionOutcome resetCircuit(const std::string& service) = 0;
};

struct RecoveryConfig {
    int max_retry_attempts = 3;
    int immediate_retry_error_limit = 3;                 // EN: ImmediateRetry only below this error count / FR: ImmediateRetry seulement sous ce nombre d'erreurs
    std::chrono::milliseconds immediate_delay{100};
    std::chrono::milliseconds backoff_base{5000};
    double backoff_factor = 2.0;
    std::chrono::milliseconds backoff_cap{300000};
    bool backoff_jitter = false;
    double slow_recovery_seconds = 30.0;                 // EN: Above this, recommend tuning / FR: Au-delà, recommander un réglage
};

class RecoveryOrchestrator {
public:
    RecoveryOrchestrator(RecoveryConfig config,
                         MetricsAggregator& metrics,
                         std::shared_ptr<const Clock> clock,
                         std::shared_ptr<CircuitBreakerManager> circuits = nullptr,
                         std::shared_ptr<EscalationRuleEngine> escalations = nullptr);

    // EN: Runs the selected strategy to completion, cancellation or exhaustion; never throws for executor failures
    // FR: Exécute la stratégie choisie jusqu'au succès, à l'annulation ou à l'épuisement ; ne lève jamais pour un échec d'exécuteur
    RecoveryResult recover(const FailureContext& context,
                           RecoveryActionExecutor& executor,
                           const CancellationToken& token,
                           const std::string& subject_id = "");

    RecoveryStrategy selectStrategy(const FailureContext& context, ErrorCategory category) const;

    std::vector<RecoveryResult> history(const std::string& session_id) const;
    void clearSession(const std::string& session_id);

    const RecoveryConfig& config() const { return config_; }

    static ErrorCategory categorize(const FailureContext& context);
    static RecoveryStatus deriveStatus(const std::vector<RecoveryAttempt>& attempts, bool& can_resume);
    static std::vector<std::string> recommendationsFor(const RecoveryResult& result, double slow_recovery_seconds);
    static bool validateConfig(const RecoveryConfig& config, std::vector<std::string>& errors);

private:
    void runRetries(const FailureContext& context, RecoveryActionExecutor& executor,
                    const CancellationToken& token, RecoveryStrategy strategy, ErrorCategory category,
                    std::vector<RecoveryAttempt>& attempts);
    void runWorkflowResumption(const FailureContext& context, RecoveryActionExecutor& executor,
                               const CancellationToken& token, std::vector<RecoveryAttempt>& attempts);

    template<typename Action>
    RecoveryAttempt runAction(RecoveryActionType type, RecoveryStrategy strategy, int attempt_number, Action&& action);

    RecoveryAttempt cancelledAttempt(RecoveryActionType type, RecoveryStrategy strategy, int attempt_number) const;

    RecoveryConfig config_;
    MetricsAggregator& metrics_;
    std::shared_ptr<const Clock> clock_;
    std::shared_ptr<CircuitBreakerManager> circuits_;
    std::shared_ptr<EscalationRuleEngine> escalations_;

    mutable std::mutex history_mutex_;
    std::unordered_map<std::string, std::vector<RecoveryResult>> history_;
};

} // namespace Orchestrator
} // namespace OBF
