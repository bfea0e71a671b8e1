// EN: Typed configuration of the orchestration core, one struct per YAML section.
// FR: Configuration typée du cœur d'orchestration, une structure par section YAML.

#pragma once

#include <chrono>
#include <map>
#include <string>
#include <vector>

#include "orchestrator/business_calendar.hpp"
#include "orchestrator/escalation_rule_engine.hpp"
#include "orchestrator/orchestration_types.hpp"
#include "orchestrator/quality_gate_engine.hpp"
#include "orchestrator/recovery_orchestrator.hpp"

namespace OBF {
namespace Orchestrator {

struct PipelineSettings {
    std::string name = "employee_onboarding";
    std::string version = "1.0";
    size_t worker_threads = 4;
    int max_stage_recoveries = 2;                        // EN: Per stage, then FailedRequiresRecovery / FR: Par étape, puis FailedRequiresRecovery
    std::chrono::milliseconds monitor_interval{30000};
    int max_errors_before_blocking = 3;
    double stalled_stage_minutes = 30.0;
    bool sla_load_adjustment = false;
};

struct CircuitSettings {
    CircuitBreakerConfig defaults;
    std::map<std::string, CircuitBreakerConfig> overrides;
    std::vector<std::string> monitored_services;
    std::map<std::string, std::string> health_endpoints;   // EN: Service -> health URL / FR: Service -> URL de santé
};

// EN: Outbound channels; empty URLs keep notifications in the log only
// FR: Canaux sortants ; des URL vides gardent les notifications dans le log
struct NotificationSettings {
    std::string webhook_url;
    std::string incident_url;
    long connect_timeout_ms = 2000;
    long request_timeout_ms = 5000;
};

struct EscalationSettings {
    std::vector<EscalationRule> rules;
    DynamicEscalationConfig dynamic;
    std::vector<std::string> management_recipients;
};

struct LoggingSettings {
    std::string level = "info";
    std::string file;                                    // EN: Empty means no file sink / FR: Vide = pas de fichier
    bool console = true;
};

struct ArchiveSettings {
    bool enabled = false;
    std::string directory = "./archive";
    bool compress = true;
};

struct OrchestrationConfig {
    PipelineSettings pipeline;
    std::vector<StageDefinition> stages;
    AuthorizationHierarchy authorization;
    BusinessHoursConfig business_hours;
    std::vector<QualityGateConfig> quality_gates;
    MetricAliases metric_aliases;
    std::vector<SlaConfig> sla;
    CircuitSettings circuit_breaker;
    EscalationSettings escalation;
    RecoveryConfig recovery;
    NotificationSettings notifications;
    LoggingSettings logging;
    ArchiveSettings archive;
};

// EN: Built-in employee onboarding catalog, used when no file is given and as the base YAML overlays
// FR: Catalogue d'onboarding intégré, utilisé sans fichier et comme base des surcharges YAML
namespace DefaultCatalog {

    OrchestrationConfig onboardingDefaults();

    std::vector<StageDefinition> onboardingStages();
    AuthorizationHierarchy authorizationHierarchy();
    std::vector<QualityGateConfig> qualityGates();
    MetricAliases metricAliases();
    std::vector<SlaConfig> slaConfigs();
    std::vector<EscalationRule> escalationRules();

} // namespace DefaultCatalog

} // namespace Orchestrator
} // namespace OBF
