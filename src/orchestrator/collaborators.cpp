// EN: Log-only notification service used when no delivery channel is wired in.
// FR: Service de notification journal seul, utilisé quand aucun canal de livraison n'est branché.

#include "orchestrator/collaborators.hpp"
#include "infrastructure/logging/logger.hpp"

namespace OBF {
namespace Orchestrator {

std::optional<std::string> LoggingNotificationService::notify(const std::vector<std::string>& recipients,
                                                              EscalationLevel level,
                                                              const std::string& message,
                                                              bool requires_ack) {
    std::string joined;
    for (const auto& recipient : recipients) {
        if (!joined.empty()) {
            joined += ",";
        }
        joined += recipient;
    }

    std::string id = "ntf-" + std::to_string(next_id_.fetch_add(1));
    LOG_INFO_META("notify", message, (std::unordered_map<std::string, std::string>{
        {"notification_id", id},
        {"level", OrchestrationUtils::escalationLevelToString(level)},
        {"recipients", joined},
        {"requires_ack", requires_ack ? "true" : "false"}
    }));
    return id;
}

std::optional<std::string> LoggingNotificationService::createIncident(const nlohmann::json& context) {
    std::string id = "inc-" + std::to_string(next_id_.fetch_add(1));
    LOG_WARN_META("notify", "Incident created", (std::unordered_map<std::string, std::string>{
        {"incident_id", id},
        {"context", context.dump()}
    }));
    return id;
}

} // namespace Orchestrator
} // namespace OBF
