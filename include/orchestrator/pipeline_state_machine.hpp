// EN: Pipeline State Machine - drives each onboarding session through the ordered stages behind quality gates.
// FR: Pipeline State Machine - conduit chaque session d'onboarding à travers les étapes ordonnées derrière les quality gates.

#pragma once

#include <chrono>
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "infrastructure/metrics/metrics_aggregator.hpp"
#include "infrastructure/storage/session_archive.hpp"
#include "orchestrator/collaborators.hpp"
#include "orchestrator/orchestration_config.hpp"
#include "orchestrator/orchestration_types.hpp"

namespace OBF {
namespace Orchestrator {

class CircuitBreakerManager;
class EscalationRuleEngine;
class QualityGateEngine;
class RecoveryOrchestrator;
class SlaMonitor;
class StageRegistry;

// EN: Collaborators wired into the state machine; only the dispatcher is mandatory
// FR: Collaborateurs branchés dans la machine d'état ; seul le dispatcher est obligatoire
struct PipelineDependencies {
    std::shared_ptr<StageDispatcher> dispatcher;
    std::shared_ptr<NotificationService> notifier;       // EN: Defaults to LoggingNotificationService / FR: Par défaut LoggingNotificationService
    std::shared_ptr<HealthProbe> health_probe;           // EN: Enables circuit probing / FR: Active le sondage des circuits
    std::shared_ptr<const Clock> clock;                  // EN: Defaults to SystemClock / FR: Par défaut SystemClock
    std::shared_ptr<SessionArchive> archive;             // EN: Terminal snapshots are stored when set / FR: Snapshots terminaux stockés si présent
};

struct SessionHandle {
    std::string session_id;
    std::shared_future<SessionResult> result;
};

class PipelineStateMachine {
public:
    PipelineStateMachine(const OrchestrationConfig& config, PipelineDependencies dependencies,
                         MetricsAggregator& metrics);
    ~PipelineStateMachine();

    PipelineStateMachine(const PipelineStateMachine&) = delete;
    PipelineStateMachine& operator=(const PipelineStateMachine&) = delete;

    // EN: Creates the session and dispatches its first stage. Throws std::invalid_argument on a duplicate id.
    // FR: Crée la session et envoie sa première étape. Lève std::invalid_argument sur un id en double.
    SessionHandle startSession(const std::string& subject_id, const std::string& session_id = "");

    // EN: Only write path from workers. Identical repeated reports are answered DUPLICATE and change nothing.
    // FR: Seul chemin d'écriture des workers. Les rapports identiques répétés sont DUPLICATE et ne changent rien.
    OutcomeAck reportStageOutcome(const std::string& session_id,
                                  const std::string& stage_id,
                                  StageStatus status,
                                  const nlohmann::json& payload,
                                  const std::vector<std::string>& errors = {});

    bool reportProgress(const std::string& session_id, const std::string& stage_id, double percent);

    // EN: Re-evaluates SLAs and escalation rules of every active session.
    // FR: Réévalue SLA et règles d'escalade de chaque session active.
    void evaluateTimers();

    // EN: Background loop probing dependencies then calling evaluateTimers() every interval.
    // FR: Boucle de fond qui sonde les dépendances puis appelle evaluateTimers() à chaque intervalle.
    void startMonitoring(std::chrono::milliseconds interval);
    void stopMonitoring();
    bool isMonitoring() const;

    bool pauseSession(const std::string& session_id, const std::string& reason);
    bool resumeSession(const std::string& session_id);

    // EN: Synchronously marks the session CANCELLED and releases any retry wait.
    // FR: Marque la session CANCELLED de façon synchrone et libère toute attente de retry.
    bool cancelSession(const std::string& session_id, const std::string& reason = "cancelled by operator");

    // EN: Opens the gate of the current stage when the authorization satisfies the gate's bypass level.
    // FR: Ouvre le gate de l'étape courante si l'autorisation satisfait le niveau de bypass du gate.
    OutcomeAck bypassStage(const std::string& session_id, const std::string& stage_id, const BypassRequest& request);

    ExtensionDecision requestSlaExtension(const std::string& session_id, const std::string& stage_id,
                                          const std::string& extension_event_id);

    bool acknowledgeEscalation(const std::string& event_id, const std::string& operator_id);
    bool resolveEscalation(const std::string& event_id, const std::string& note);

    std::optional<SessionSnapshot> getSessionSnapshot(const std::string& session_id) const;
    std::optional<std::shared_future<SessionResult>> sessionResult(const std::string& session_id) const;
    std::vector<std::string> activeSessions() const;

    // EN: Drops a terminal session from memory; returns false while it is still running.
    // FR: Retire une session terminale de la mémoire ; retourne false tant qu'elle tourne.
    bool evictSession(const std::string& session_id);

    // EN: Blocks until every session mailbox is drained.
    // FR: Bloque jusqu'à ce que chaque boîte aux lettres de session soit vidée.
    void waitForIdle();

    // EN: Stops monitoring, cancels running sessions and joins the workers. Idempotent.
    // FR: Arrête la surveillance, annule les sessions en cours et joint les workers. Idempotent.
    void shutdown();

    CircuitBreakerManager& circuits();
    EscalationRuleEngine& escalations();
    const StageRegistry& registry() const;
    const QualityGateEngine& qualityGates() const;
    const SlaMonitor& slaMonitor() const;
    const RecoveryOrchestrator& recovery() const;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

namespace PipelineUtils {

    // EN: Stable fingerprint of a worker report, used for duplicate detection.
    // FR: Empreinte stable d'un rapport de worker, utilisée pour détecter les doublons.
    std::string outcomeFingerprint(StageStatus status, const nlohmann::json& payload,
                                   const std::vector<std::string>& errors);

    // EN: Completed share plus the partial progress of the current stage, 0..100.
    // FR: Part terminée plus la progression partielle de l'étape courante, 0..100.
    double overallProgress(const std::vector<StageRecord>& stages, size_t current_index);

    // EN: Failed stages, stages above the error limit and stalled stages.
    // FR: Étapes en échec, étapes au-delà de la limite d'erreurs et étapes bloquées.
    std::vector<std::string> blockingIssues(const std::vector<StageRecord>& stages, TimePoint now,
                                            int max_errors, double stalled_minutes);

} // namespace PipelineUtils

} // namespace Orchestrator
} // namespace OBF
