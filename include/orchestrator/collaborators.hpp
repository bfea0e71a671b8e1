// EN: Interfaces of the external collaborators the orchestration core talks to.
// FR: Interfaces des collaborateurs externes avec lesquels le cœur d'orchestration communique.

#pragma once

#include <atomic>
#include <chrono>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "orchestrator/orchestration_types.hpp"

namespace OBF {
namespace Orchestrator {

// EN: Notification and ticketing channel; both calls are fire-and-forget
// FR: Canal de notification et de ticketing ; les deux appels sont sans attente
class NotificationService {
public:
    virtual ~NotificationService() = default;

    // EN: Returns a notification id, or nullopt when delivery could not be queued
    // FR: Retourne un id de notification, ou nullopt si l'envoi n'a pu être mis en file
    virtual std::optional<std::string> notify(const std::vector<std::string>& recipients,
                                              EscalationLevel level,
                                              const std::string& message,
                                              bool requires_ack) = 0;

    virtual std::optional<std::string> createIncident(const nlohmann::json& context) = 0;
};

// EN: Notification service that only writes to the structured log
// FR: Service de notification qui écrit seulement dans le log structuré
class LoggingNotificationService : public NotificationService {
public:
    std::optional<std::string> notify(const std::vector<std::string>& recipients,
                                      EscalationLevel level,
                                      const std::string& message,
                                      bool requires_ack) override;

    std::optional<std::string> createIncident(const nlohmann::json& context) override;

private:
    std::atomic<uint64_t> next_id_{1};
};

struct HealthCheckResult {
    bool healthy = false;
    std::chrono::milliseconds latency{0};
    std::string detail;
};

// EN: Health probe of one external dependency
// FR: Sonde de santé d'une dépendance externe
class HealthProbe {
public:
    virtual ~HealthProbe() = default;
    virtual HealthCheckResult check(const std::string& service) = 0;
};

// EN: Hands work to the worker owning a stage; the worker answers later through reportStageOutcome
// FR: Confie le travail au worker d'une étape ; le worker répond plus tard via reportStageOutcome
class StageDispatcher {
public:
    virtual ~StageDispatcher() = default;

    // EN: Returns false when the worker could not accept the request
    // FR: Retourne false si le worker n'a pas pu accepter la demande
    virtual bool dispatch(const std::string& session_id, const std::string& stage_id, int attempt) = 0;
};

// EN: Time source, replaced by a manual clock in tests
// FR: Source de temps, remplacée par une horloge manuelle dans les tests
class Clock {
public:
    virtual ~Clock() = default;
    virtual TimePoint now() const = 0;
};

class SystemClock : public Clock {
public:
    TimePoint now() const override { return std::chrono::system_clock::now(); }
};

} // namespace Orchestrator
} // namespace OBF
