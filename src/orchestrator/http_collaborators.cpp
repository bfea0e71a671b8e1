// EN: HTTP health probe and webhook notification service.
// FR: Sonde de santé HTTP et service de notification webhook.

#include "orchestrator/http_collaborators.hpp"
#include "infrastructure/logging/logger.hpp"

#include <chrono>
#include <stdexcept>

namespace OBF {
namespace Orchestrator {

HttpHealthProbe::HttpHealthProbe(std::map<std::string, std::string> endpoints,
                                 long connect_timeout_ms, long request_timeout_ms)
    : endpoints_(std::move(endpoints)), client_(connect_timeout_ms, request_timeout_ms) {}

bool HttpHealthProbe::hasEndpoint(const std::string& service) const {
    return endpoints_.find(service) != endpoints_.end();
}

HealthCheckResult HttpHealthProbe::check(const std::string& service) {
    HealthCheckResult result;
    auto it = endpoints_.find(service);
    if (it == endpoints_.end()) {
        result.detail = "no health endpoint configured";
        return result;
    }

    try {
        HttpResponse response = client_.get(it->second);
        result.healthy = response.isSuccess();
        result.latency = std::chrono::milliseconds(response.elapsed_ms);
        result.detail = "HTTP " + std::to_string(response.status);
    } catch (const std::runtime_error& e) {
        // EN: Transport failures are an unhealthy answer, not an error of the probe.
        // FR: Les échecs de transport sont une réponse malsaine, pas une erreur de la sonde.
        result.detail = e.what();
    }

    LOG_DEBUG("health", service + " -> " + (result.healthy ? "healthy" : "unhealthy") + " (" + result.detail + ")");
    return result;
}

WebhookNotificationService::WebhookNotificationService(NotificationSettings settings)
    : settings_(std::move(settings)),
      client_(settings_.connect_timeout_ms, settings_.request_timeout_ms) {}

nlohmann::json WebhookNotificationService::notificationBody(const std::string& id,
                                                            const std::vector<std::string>& recipients,
                                                            EscalationLevel level,
                                                            const std::string& message,
                                                            bool requires_ack) {
    return {
        {"id", id},
        {"recipients", recipients},
        {"level", OrchestrationUtils::escalationLevelToString(level)},
        {"message", message},
        {"requires_ack", requires_ack},
        {"sent_at", OrchestrationUtils::formatTimestamp(std::chrono::system_clock::now())}
    };
}

std::optional<std::string> WebhookNotificationService::notify(const std::vector<std::string>& recipients,
                                                              EscalationLevel level,
                                                              const std::string& message,
                                                              bool requires_ack) {
    if (settings_.webhook_url.empty()) {
        return fallback_.notify(recipients, level, message, requires_ack);
    }
    const std::string id = "ntf-" + std::to_string(next_id_.fetch_add(1));
    return post(settings_.webhook_url, notificationBody(id, recipients, level, message, requires_ack), id);
}

std::optional<std::string> WebhookNotificationService::createIncident(const nlohmann::json& context) {
    if (settings_.incident_url.empty()) {
        return fallback_.createIncident(context);
    }
    const std::string id = "inc-" + std::to_string(next_id_.fetch_add(1));
    nlohmann::json body = context;
    body["id"] = id;
    return post(settings_.incident_url, body, id);
}

std::optional<std::string> WebhookNotificationService::post(const std::string& url, const nlohmann::json& body,
                                                            const std::string& fallback_id) {
    try {
        HttpResponse response = client_.post(url, body.dump(), {{"Content-Type", "application/json"}});
        if (!response.isSuccess()) {
            LOG_WARN("notify", "Webhook " + url + " answered HTTP " + std::to_string(response.status));
            return std::nullopt;
        }
        // EN: Prefer the id assigned by the receiver when it returns one.
        // FR: Préfère l'id attribué par le destinataire s'il en renvoie un.
        auto parsed = nlohmann::json::parse(response.body, nullptr, false);
        if (!parsed.is_discarded() && parsed.is_object() && parsed.contains("id") && parsed["id"].is_string()) {
            return parsed["id"].get<std::string>();
        }
        return fallback_id;
    } catch (const std::runtime_error& e) {
        LOG_WARN("notify", "Webhook delivery failed: " + std::string(e.what()));
        return std::nullopt;
    }
}

} // namespace Orchestrator
} // namespace OBF
