// EN: HTTP implementations of the health probe and notification collaborators.
// FR: Implémentations HTTP des collaborateurs de sonde de santé et de notification.

#pragma once

#include <atomic>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "infrastructure/networking/http_client.hpp"
#include "orchestrator/collaborators.hpp"
#include "orchestrator/orchestration_config.hpp"

namespace OBF {
namespace Orchestrator {

// EN: Probes each service with GET on its configured URL; 2xx is healthy, anything else is not
// FR: Sonde chaque service par GET sur son URL configurée ; 2xx est sain, le reste ne l'est pas
class HttpHealthProbe : public HealthProbe {
public:
    HttpHealthProbe(std::map<std::string, std::string> endpoints, long connect_timeout_ms, long request_timeout_ms);

    HealthCheckResult check(const std::string& service) override;

    bool hasEndpoint(const std::string& service) const;

private:
    std::map<std::string, std::string> endpoints_;
    HttpClient client_;
};

// EN: Posts notifications and incidents as JSON to webhooks, falling back to the log when a URL is unset
// FR: Poste notifications et incidents en JSON vers des webhooks, repli sur le log si une URL est absente
class WebhookNotificationService : public NotificationService {
public:
    explicit WebhookNotificationService(NotificationSettings settings);

    std::optional<std::string> notify(const std::vector<std::string>& recipients,
                                      EscalationLevel level,
                                      const std::string& message,
                                      bool requires_ack) override;

    std::optional<std::string> createIncident(const nlohmann::json& context) override;

    static nlohmann::json notificationBody(const std::string& id,
                                           const std::vector<std::string>& recipients,
                                           EscalationLevel level,
                                           const std::string& message,
                                           bool requires_ack);

private:
    std::optional<std::string> post(const std::string& url, const nlohmann::json& body, const std::string& fallback_id);

    NotificationSettings settings_;
    HttpClient client_;
    LoggingNotificationService fallback_;
    std::atomic<uint64_t> next_id_{1};
};

} // namespace Orchestrator
} // namespace OBF
