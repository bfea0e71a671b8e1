// EN: Stage Registry implementation. The map lock only guards partition lookup, each partition has its own mutex.
// FR: Implémentation du Stage Registry. Le verrou de la map ne garde que la recherche, chaque partition a son mutex.

#include "orchestrator/stage_registry.hpp"
#include "infrastructure/logging/logger.hpp"

#include <stdexcept>

namespace OBF {
namespace Orchestrator {

StageRegistry::StageRegistry(std::vector<StageDefinition> definitions)
    : definitions_(std::move(definitions)) {
    if (definitions_.empty()) {
        throw std::invalid_argument("StageRegistry requires at least one stage");
    }
    for (size_t i = 0; i < definitions_.size(); ++i) {
        const auto& id = definitions_[i].id;
        if (id.empty()) {
            throw std::invalid_argument("Stage id cannot be empty");
        }
        if (!index_.emplace(id, i).second) {
            throw std::invalid_argument("Duplicate stage id: " + id);
        }
    }
}

std::optional<StageDefinition> StageRegistry::definition(const std::string& stage_id) const {
    auto it = index_.find(stage_id);
    if (it == index_.end()) {
        return std::nullopt;
    }
    return definitions_[it->second];
}

std::optional<size_t> StageRegistry::indexOf(const std::string& stage_id) const {
    auto it = index_.find(stage_id);
    if (it == index_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool StageRegistry::createSession(const std::string& session_id) {
    auto part = std::make_shared<Partition>();
    part->records.reserve(definitions_.size());
    for (const auto& def : definitions_) {
        StageRecord record;
        record.stage_id = def.id;
        part->records.push_back(std::move(record));
    }
    part->checkpoints.resize(definitions_.size());

    std::unique_lock<std::shared_mutex> lock(sessions_mutex_);
    return sessions_.emplace(session_id, std::move(part)).second;
}

bool StageRegistry::hasSession(const std::string& session_id) const {
    std::shared_lock<std::shared_mutex> lock(sessions_mutex_);
    return sessions_.count(session_id) > 0;
}

bool StageRegistry::removeSession(const std::string& session_id) {
    std::unique_lock<std::shared_mutex> lock(sessions_mutex_);
    return sessions_.erase(session_id) > 0;
}

std::vector<std::string> StageRegistry::sessionIds() const {
    std::shared_lock<std::shared_mutex> lock(sessions_mutex_);
    std::vector<std::string> ids;
    ids.reserve(sessions_.size());
    for (const auto& [id, part] : sessions_) {
        ids.push_back(id);
    }
    return ids;
}

std::shared_ptr<StageRegistry::Partition> StageRegistry::partition(const std::string& session_id) const {
    std::shared_lock<std::shared_mutex> lock(sessions_mutex_);
    auto it = sessions_.find(session_id);
    if (it == sessions_.end()) {
        return nullptr;
    }
    return it->second;
}

StageRecord* StageRegistry::findRecord(Partition& part, const std::string& stage_id) const {
    auto idx = indexOf(stage_id);
    if (!idx || *idx >= part.records.size()) {
        return nullptr;
    }
    return &part.records[*idx];
}

std::optional<StageRecord> StageRegistry::getStage(const std::string& session_id,
                                                   const std::string& stage_id) const {
    auto part = partition(session_id);
    if (!part) {
        return std::nullopt;
    }
    std::lock_guard<std::mutex> lock(part->mutex);
    StageRecord* record = findRecord(*part, stage_id);
    if (!record) {
        return std::nullopt;
    }
    return *record;
}

std::vector<StageRecord> StageRegistry::getStages(const std::string& session_id) const {
    auto part = partition(session_id);
    if (!part) {
        return {};
    }
    std::lock_guard<std::mutex> lock(part->mutex);
    return part->records;
}

TransitionResult StageRegistry::transition(const std::string& session_id, const std::string& stage_id,
                                           StageStatus next, TimePoint now) {
    auto part = partition(session_id);
    if (!part) {
        return TransitionResult::NOT_FOUND;
    }
    std::lock_guard<std::mutex> lock(part->mutex);
    StageRecord* record = findRecord(*part, stage_id);
    if (!record) {
        return TransitionResult::NOT_FOUND;
    }

    if (record->status == next) {
        return TransitionResult::UNCHANGED;
    }
    if (record->status == StageStatus::COMPLETED) {
        return TransitionResult::REJECTED;
    }
    if (OrchestrationUtils::stageStatusRank(next) < OrchestrationUtils::stageStatusRank(record->status)) {
        LOG_WARN("registry", "Rejected backward transition of " + stage_id + " from " +
                 OrchestrationUtils::stageStatusToString(record->status) + " to " +
                 OrchestrationUtils::stageStatusToString(next));
        return TransitionResult::REJECTED;
    }

    record->status = next;
    if (next == StageStatus::PROCESSING && !record->started_at) {
        record->started_at = now;
    }
    if (next == StageStatus::COMPLETED) {
        record->completed_at = now;
        record->progress_percent = 100.0;
    }
    return TransitionResult::APPLIED;
}

bool StageRegistry::update(const std::string& session_id, const std::string& stage_id,
                           const std::function<void(StageRecord&)>& mutator) {
    auto part = partition(session_id);
    if (!part) {
        return false;
    }
    std::lock_guard<std::mutex> lock(part->mutex);
    StageRecord* record = findRecord(*part, stage_id);
    if (!record) {
        return false;
    }

    const StageStatus before = record->status;
    mutator(*record);
    if (record->status != before) {
        record->status = before;
        throw StateInconsistencyError("Stage status of " + stage_id + " may only change through transition()");
    }
    return true;
}

bool StageRegistry::resetForRetry(const std::string& session_id, const std::string& stage_id) {
    auto part = partition(session_id);
    if (!part) {
        return false;
    }
    std::lock_guard<std::mutex> lock(part->mutex);
    StageRecord* record = findRecord(*part, stage_id);
    if (!record || record->status == StageStatus::COMPLETED) {
        return false;
    }
    record->status = StageStatus::PROCESSING;
    record->completed_at.reset();
    record->progress_percent = 0.0;
    record->outcome_fingerprint.clear();
    return true;
}

std::optional<size_t> StageRegistry::resetAfterLastCompleted(const std::string& session_id) {
    auto part = partition(session_id);
    if (!part) {
        return std::nullopt;
    }
    std::lock_guard<std::mutex> lock(part->mutex);

    // EN: Resume point is the first stage that is not completed.
    // FR: Le point de reprise est la première étape non terminée.
    size_t resume_index = 0;
    while (resume_index < part->records.size() &&
           part->records[resume_index].status == StageStatus::COMPLETED) {
        ++resume_index;
    }
    if (resume_index == 0 || resume_index >= part->records.size()) {
        return std::nullopt;
    }

    for (size_t i = resume_index; i < part->records.size(); ++i) {
        auto& record = part->records[i];
        record.status = StageStatus::WAITING;
        record.started_at.reset();
        record.completed_at.reset();
        record.output_payload = nlohmann::json();
        record.progress_percent = 0.0;
        record.outcome_fingerprint.clear();
    }
    return resume_index;
}

bool StageRegistry::checkpoint(const std::string& session_id, const std::string& stage_id) {
    auto part = partition(session_id);
    if (!part) {
        return false;
    }
    std::lock_guard<std::mutex> lock(part->mutex);
    auto idx = indexOf(stage_id);
    if (!idx) {
        return false;
    }
    part->checkpoints[*idx] = part->records[*idx];
    return true;
}

bool StageRegistry::restoreCheckpoint(const std::string& session_id, const std::string& stage_id) {
    auto part = partition(session_id);
    if (!part) {
        return false;
    }
    std::lock_guard<std::mutex> lock(part->mutex);
    auto idx = indexOf(stage_id);
    if (!idx || !part->checkpoints[*idx]) {
        return false;
    }

    auto& record = part->records[*idx];
    if (record.status == StageStatus::COMPLETED) {
        return false;
    }
    const auto& saved = *part->checkpoints[*idx];
    record.status = saved.status;
    record.output_payload = saved.output_payload;
    record.progress_percent = saved.progress_percent;
    record.completed_at = saved.completed_at;
    record.outcome_fingerprint = saved.outcome_fingerprint;
    return true;
}

std::optional<std::string> StageRegistry::lastCompletedStage(const std::string& session_id) const {
    auto part = partition(session_id);
    if (!part) {
        return std::nullopt;
    }
    std::lock_guard<std::mutex> lock(part->mutex);
    std::optional<std::string> last;
    for (const auto& record : part->records) {
        if (record.status != StageStatus::COMPLETED) {
            break;
        }
        last = record.stage_id;
    }
    return last;
}

std::optional<nlohmann::json> StageRegistry::exportSession(const std::string& session_id) const {
    auto part = partition(session_id);
    if (!part) {
        return std::nullopt;
    }
    std::lock_guard<std::mutex> lock(part->mutex);

    nlohmann::json json;
    json["session_id"] = session_id;
    json["stages"] = nlohmann::json::array();
    for (const auto& record : part->records) {
        json["stages"].push_back(record.toJson());
    }
    return json;
}

bool StageRegistry::importSession(const std::string& session_id, const nlohmann::json& json) {
    if (!json.contains("stages") || !json["stages"].is_array()) {
        return false;
    }

    auto part = std::make_shared<Partition>();
    part->records.resize(definitions_.size());
    part->checkpoints.resize(definitions_.size());
    std::vector<bool> seen(definitions_.size(), false);

    try {
        for (const auto& entry : json["stages"]) {
            StageRecord record = StageRecord::fromJson(entry);
            auto idx = indexOf(record.stage_id);
            if (!idx) {
                LOG_WARN("registry", "Import of " + session_id + " names unknown stage " + record.stage_id);
                return false;
            }
            part->records[*idx] = std::move(record);
            seen[*idx] = true;
        }
    } catch (const std::exception& e) {
        LOG_ERROR("registry", "Import of " + session_id + " failed: " + std::string(e.what()));
        return false;
    }

    for (size_t i = 0; i < definitions_.size(); ++i) {
        if (!seen[i]) {
            part->records[i].stage_id = definitions_[i].id;
        }
    }

    std::unique_lock<std::shared_mutex> lock(sessions_mutex_);
    sessions_[session_id] = std::move(part);
    return true;
}

} // namespace Orchestrator
} // namespace OBF
