// EN: Stage Registry - per-session records of every stage, partitioned so sessions never contend.
// FR: Stage Registry - enregistrements par session de chaque étape, partitionnés pour éviter la contention.

#pragma once

#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include <nlohmann/json.hpp>

#include "orchestrator/orchestration_types.hpp"

namespace OBF {
namespace Orchestrator {

// EN: Result of a guarded status transition
// FR: Résultat d'une transition de statut gardée
enum class TransitionResult {
    APPLIED = 0,
    UNCHANGED = 1,          // EN: Already in the requested status / FR: Déjà dans le statut demandé
    REJECTED = 2,           // EN: Backward or out of terminal state / FR: Retour arrière ou sortie d'un état terminal
    NOT_FOUND = 3
};

class StageRegistry {
public:
    // EN: Stage order is the order of the definitions; ids must be unique and non-empty
    // FR: L'ordre des étapes est celui des définitions ; les ids doivent être uniques et non vides
    explicit StageRegistry(std::vector<StageDefinition> definitions);

    StageRegistry(const StageRegistry&) = delete;
    StageRegistry& operator=(const StageRegistry&) = delete;

    const std::vector<StageDefinition>& definitions() const { return definitions_; }
    std::optional<StageDefinition> definition(const std::string& stage_id) const;
    std::optional<size_t> indexOf(const std::string& stage_id) const;
    size_t stageCount() const { return definitions_.size(); }

    // EN: Create the partition of a session with every stage WAITING; false if it exists
    // FR: Crée la partition d'une session avec chaque étape WAITING ; false si elle existe
    bool createSession(const std::string& session_id);
    bool hasSession(const std::string& session_id) const;
    bool removeSession(const std::string& session_id);
    std::vector<std::string> sessionIds() const;

    std::optional<StageRecord> getStage(const std::string& session_id, const std::string& stage_id) const;
    std::vector<StageRecord> getStages(const std::string& session_id) const;

    // EN: Forward-only status change; COMPLETED is terminal
    // FR: Changement de statut uniquement vers l'avant ; COMPLETED est terminal
    TransitionResult transition(const std::string& session_id, const std::string& stage_id,
                                StageStatus next, TimePoint now);

    // EN: Mutate non-status fields under the partition lock; the mutator must not change status
    // FR: Modifie les champs hors statut sous le verrou de partition ; le mutateur ne doit pas changer le statut
    bool update(const std::string& session_id, const std::string& stage_id,
                const std::function<void(StageRecord&)>& mutator);

    // EN: Recovery reset: put a stage back to PROCESSING for another attempt
    // FR: Réinitialisation de récupération : remet une étape en PROCESSING pour une nouvelle tentative
    bool resetForRetry(const std::string& session_id, const std::string& stage_id);

    // EN: Recovery reset: every stage after the last completed one goes back to WAITING
    // FR: Réinitialisation de récupération : chaque étape après la dernière terminée revient à WAITING
    std::optional<size_t> resetAfterLastCompleted(const std::string& session_id);

    // EN: Save the clean state of a stage, taken when it is first dispatched
    // FR: Sauvegarde l'état propre d'une étape, pris lors de son premier envoi
    bool checkpoint(const std::string& session_id, const std::string& stage_id);

    // EN: Restore payload and status from the checkpoint; counters and error history are kept
    // FR: Restaure payload et statut depuis le checkpoint ; compteurs et historique d'erreurs conservés
    bool restoreCheckpoint(const std::string& session_id, const std::string& stage_id);

    std::optional<std::string> lastCompletedStage(const std::string& session_id) const;

    // EN: Whole-partition export and import, used for archiving and restoration
    // FR: Export et import d'une partition entière, pour l'archivage et la restauration
    std::optional<nlohmann::json> exportSession(const std::string& session_id) const;
    bool importSession(const std::string& session_id, const nlohmann::json& json);

private:
    struct Partition {
        mutable std::mutex mutex;
        std::vector<StageRecord> records;
        std::vector<std::optional<StageRecord>> checkpoints;
    };

    std::shared_ptr<Partition> partition(const std::string& session_id) const;
    StageRecord* findRecord(Partition& part, const std::string& stage_id) const;

    std::vector<StageDefinition> definitions_;
    std::unordered_map<std::string, size_t> index_;

    mutable std::shared_mutex sessions_mutex_;
    std::unordered_map<std::string, std::shared_ptr<Partition>> sessions_;
};

} // namespace Orchestrator
} // namespace OBF
