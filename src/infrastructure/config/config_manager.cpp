// EN: Implementation of the ConfigManager class. YAML overlay parsing, validation before swap, watcher and emitter.
// FR: Implémentation de la classe ConfigManager. Parsing YAML par superposition, validation avant remplacement, surveillance et émission.

#include "infrastructure/config/config_manager.hpp"
#include "infrastructure/logging/logger.hpp"
#include "orchestrator/circuit_breaker_manager.hpp"
#include "orchestrator/sla_monitor.hpp"

#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <regex>
#include <set>
#include <sstream>
#include <type_traits>

namespace OBF {

using namespace Orchestrator;

namespace {

// EN: Parsing context carrying the path of the node being read, for readable errors.
// FR: Contexte de parsing portant le chemin du nœud lu, pour des erreurs lisibles.
struct Reader {
    std::vector<std::string>& errors;

    std::string text(const YAML::Node& node) const {
        return ConfigManager::expandVariables(node.as<std::string>());
    }

    template<typename T>
    void scalar(const YAML::Node& parent, const char* key, T& target, const std::string& path) const {
        const YAML::Node node = parent[key];
        if (!node) {
            return;
        }
        try {
            if constexpr (std::is_same_v<T, std::string>) {
                target = text(node);
            } else {
                // EN: Expand first so "${OBF_THREADS}" works for numbers too.
                // FR: Expansion d'abord pour que "${OBF_THREADS}" marche aussi pour les nombres.
                target = YAML::Node(text(node)).as<T>();
            }
        } catch (const YAML::Exception&) {
            errors.push_back(path + "." + key + ": invalid value");
        }
    }

    void millis(const YAML::Node& parent, const char* key, std::chrono::milliseconds& target,
                const std::string& path) const {
        long long value = target.count();
        scalar(parent, key, value, path);
        target = std::chrono::milliseconds(value);
    }

    std::vector<std::string> list(const YAML::Node& node, const std::string& path) const {
        std::vector<std::string> result;
        if (!node) {
            return result;
        }
        if (!node.IsSequence()) {
            errors.push_back(path + ": expected a sequence");
            return result;
        }
        for (const auto& item : node) {
            result.push_back(text(item));
        }
        return result;
    }

    // EN: Converts an enum name, recording the error instead of aborting the whole load.
    // FR: Convertit un nom d'enum, en enregistrant l'erreur au lieu d'interrompre tout le chargement.
    template<typename Convert>
    auto enumValue(const YAML::Node& node, Convert convert, const std::string& path) const
        -> std::optional<decltype(convert(std::string()))> {
        try {
            return convert(text(node));
        } catch (const std::invalid_argument& e) {
            errors.push_back(path + ": " + e.what());
        }
        return std::nullopt;
    }
};

void readPipeline(const Reader& r, const YAML::Node& node, PipelineSettings& settings) {
    r.scalar(node, "name", settings.name, "pipeline");
    r.scalar(node, "version", settings.version, "pipeline");
    r.scalar(node, "worker_threads", settings.worker_threads, "pipeline");
    r.scalar(node, "max_stage_recoveries", settings.max_stage_recoveries, "pipeline");
    r.millis(node, "monitor_interval_ms", settings.monitor_interval, "pipeline");
    r.scalar(node, "max_errors_before_blocking", settings.max_errors_before_blocking, "pipeline");
    r.scalar(node, "stalled_stage_minutes", settings.stalled_stage_minutes, "pipeline");
    r.scalar(node, "sla_load_adjustment", settings.sla_load_adjustment, "pipeline");
}

std::vector<StageDefinition> readStages(const Reader& r, const YAML::Node& node) {
    std::vector<StageDefinition> stages;
    for (size_t i = 0; i < node.size(); ++i) {
        const YAML::Node item = node[i];
        const std::string path = "stages[" + std::to_string(i) + "]";
        StageDefinition stage;
        r.scalar(item, "id", stage.id, path);
        r.scalar(item, "name", stage.name, path);
        if (stage.name.empty()) {
            stage.name = stage.id;
        }
        if (item["criticality"]) {
            if (auto value = r.enumValue(item["criticality"], OrchestrationUtils::criticalityFromString, path)) {
                stage.criticality = *value;
            }
        }
        stage.dependencies = r.list(item["dependencies"], path + ".dependencies");
        stages.push_back(stage);
    }
    return stages;
}

void readBusinessHours(const Reader& r, const YAML::Node& node, BusinessHoursConfig& config) {
    r.scalar(node, "start_hour", config.start_hour, "business_hours");
    r.scalar(node, "end_hour", config.end_hour, "business_hours");
    r.scalar(node, "utc_offset_minutes", config.utc_offset_minutes, "business_hours");
    if (node["working_days"]) {
        config.working_days.clear();
        for (const auto& day : r.list(node["working_days"], "business_hours.working_days")) {
            try {
                config.working_days.push_back(std::stoi(day));
            } catch (const std::exception&) {
                r.errors.push_back("business_hours.working_days: invalid day " + day);
            }
        }
    }
}

QualityRule readRule(const Reader& r, const YAML::Node& node, const std::string& path) {
    QualityRule rule;
    r.scalar(node, "kind", rule.raw_kind, path);
    rule.kind = OrchestrationUtils::ruleKindFromString(rule.raw_kind);
    r.scalar(node, "field", rule.field, path);
    r.scalar(node, "value", rule.value, path);
    r.scalar(node, "expected", rule.expected, path);
    rule.allowed_values = r.list(node["allowed_values"], path + ".allowed_values");
    r.scalar(node, "name", rule.name, path);
    if (rule.name.empty()) {
        rule.name = rule.raw_kind + ":" + rule.field;
    }
    return rule;
}

std::vector<QualityGateConfig> readGates(const Reader& r, const YAML::Node& node) {
    std::vector<QualityGateConfig> gates;
    for (size_t i = 0; i < node.size(); ++i) {
        const YAML::Node item = node[i];
        const std::string path = "quality_gates[" + std::to_string(i) + "]";
        QualityGateConfig gate;
        r.scalar(item, "stage", gate.stage_id, path);
        gate.required_fields = r.list(item["required_fields"], path + ".required_fields");
        if (const YAML::Node thresholds = item["thresholds"]) {
            for (const auto& entry : thresholds) {
                ThresholdSpec spec;
                spec.metric = entry.first.as<std::string>();
                try {
                    spec.min_value = YAML::Node(r.text(entry.second)).as<double>();
                } catch (const YAML::Exception&) {
                    r.errors.push_back(path + ".thresholds." + spec.metric + ": invalid value");
                }
                gate.thresholds.push_back(spec);
            }
        }
        if (const YAML::Node rules = item["rules"]) {
            for (size_t j = 0; j < rules.size(); ++j) {
                gate.rules.push_back(readRule(r, rules[j], path + ".rules[" + std::to_string(j) + "]"));
            }
        }
        r.scalar(item, "mandatory", gate.mandatory, path);
        r.scalar(item, "bypassable", gate.bypassable, path);
        r.scalar(item, "bypass_auth_level", gate.bypass_auth_level, path);
        if (item["failure_action"]) {
            if (auto value = r.enumValue(item["failure_action"], OrchestrationUtils::failureActionFromString, path)) {
                gate.failure_action = *value;
            }
        }
        r.scalar(item, "retry_allowed", gate.retry_allowed, path);
        r.scalar(item, "max_retries", gate.max_retries, path);
        gates.push_back(gate);
    }
    return gates;
}

std::vector<SlaConfig> readSla(const Reader& r, const YAML::Node& node) {
    std::vector<SlaConfig> configs;
    for (size_t i = 0; i < node.size(); ++i) {
        const YAML::Node item = node[i];
        const std::string path = "sla[" + std::to_string(i) + "]";
        SlaConfig config;
        r.scalar(item, "stage", config.stage_id, path);
        r.scalar(item, "target_minutes", config.target_minutes, path);
        r.scalar(item, "warning_minutes", config.warning_minutes, path);
        r.scalar(item, "critical_minutes", config.critical_minutes, path);
        r.scalar(item, "breach_minutes", config.breach_minutes, path);
        r.scalar(item, "business_hours_only", config.business_hours_only, path);
        config.escalation_contacts = r.list(item["escalation_contacts"], path + ".escalation_contacts");
        r.scalar(item, "extensions_allowed", config.extensions_allowed, path);
        r.scalar(item, "max_extensions", config.max_extensions, path);
        r.scalar(item, "extension_duration_minutes", config.extension_duration_minutes, path);
        configs.push_back(config);
    }
    return configs;
}

void readBreaker(const Reader& r, const YAML::Node& node, CircuitBreakerConfig& config, const std::string& path) {
    r.scalar(node, "failure_threshold", config.failure_threshold, path);
    r.millis(node, "recovery_timeout_ms", config.recovery_timeout, path);
    r.scalar(node, "half_open_max_calls", config.half_open_max_calls, path);
    r.scalar(node, "success_threshold", config.success_threshold, path);
}

void readCircuits(const Reader& r, const YAML::Node& node, CircuitSettings& settings) {
    if (node["defaults"]) {
        readBreaker(r, node["defaults"], settings.defaults, "circuit_breaker.defaults");
    }
    if (const YAML::Node services = node["services"]) {
        for (const auto& entry : services) {
            const std::string service = entry.first.as<std::string>();
            CircuitBreakerConfig config = settings.defaults;
            readBreaker(r, entry.second, config, "circuit_breaker.services." + service);
            settings.overrides[service] = config;
        }
    }
    if (node["monitored_services"]) {
        settings.monitored_services = r.list(node["monitored_services"], "circuit_breaker.monitored_services");
    }
    if (const YAML::Node endpoints = node["health_endpoints"]) {
        for (const auto& entry : endpoints) {
            settings.health_endpoints[entry.first.as<std::string>()] = r.text(entry.second);
        }
    }
}

TriggerCondition readCondition(const Reader& r, const YAML::Node& node, const std::string& path) {
    TriggerCondition condition;
    if (auto kind = r.enumValue(node["kind"], OrchestrationUtils::conditionKindFromString, path + ".kind")) {
        condition.kind = *kind;
    }
    r.scalar(node, "threshold", condition.threshold, path);
    if (node["min_criticality"]) {
        if (auto value = r.enumValue(node["min_criticality"], OrchestrationUtils::criticalityFromString, path)) {
            condition.min_criticality = *value;
        }
    }
    for (const auto& status : r.list(node["statuses"], path + ".statuses")) {
        try {
            switch (condition.kind) {
                case ConditionKind::SLA_STATUS_IS:
                    condition.sla_statuses.push_back(OrchestrationUtils::slaStatusFromString(status));
                    break;
                case ConditionKind::QUALITY_GATE_STATUS_IS:
                    condition.gate_statuses.push_back(OrchestrationUtils::gateStatusFromString(status));
                    break;
                case ConditionKind::STAGE_STATUS_IS:
                    condition.stage_statuses.push_back(OrchestrationUtils::stageStatusFromString(status));
                    break;
                default:
                    r.errors.push_back(path + ": statuses not supported for " +
                                       OrchestrationUtils::conditionKindToString(condition.kind));
                    break;
            }
        } catch (const std::invalid_argument& e) {
            r.errors.push_back(path + ": " + e.what());
        }
    }
    return condition;
}

std::vector<EscalationRule> readRules(const Reader& r, const YAML::Node& node) {
    std::vector<EscalationRule> rules;
    for (size_t i = 0; i < node.size(); ++i) {
        const YAML::Node item = node[i];
        const std::string path = "escalation.rules[" + std::to_string(i) + "]";
        EscalationRule rule;
        r.scalar(item, "id", rule.id, path);
        r.scalar(item, "name", rule.name, path);
        if (const YAML::Node conditions = item["conditions"]) {
            for (size_t j = 0; j < conditions.size(); ++j) {
                rule.conditions.push_back(
                    readCondition(r, conditions[j], path + ".conditions[" + std::to_string(j) + "]"));
            }
        }
        if (item["level"]) {
            if (auto level = r.enumValue(item["level"], OrchestrationUtils::escalationLevelFromString, path)) {
                rule.level = *level;
            }
        }
        rule.recipients = r.list(item["recipients"], path + ".recipients");
        for (const auto& action : r.list(item["actions"], path + ".actions")) {
            try {
                rule.automatic_actions.push_back(OrchestrationUtils::automaticActionFromString(action));
            } catch (const std::invalid_argument& e) {
                r.errors.push_back(path + ": " + e.what());
            }
        }
        r.scalar(item, "cooldown_minutes", rule.cooldown_minutes, path);
        r.scalar(item, "max_per_session", rule.max_per_session, path);
        r.scalar(item, "requires_ack", rule.requires_ack, path);
        r.scalar(item, "message_template", rule.message_template, path);
        rules.push_back(rule);
    }
    return rules;
}

void readEscalation(const Reader& r, const YAML::Node& node, EscalationSettings& settings) {
    if (node["management_recipients"]) {
        settings.management_recipients = r.list(node["management_recipients"], "escalation.management_recipients");
    }
    if (const YAML::Node dynamic = node["dynamic"]) {
        r.scalar(dynamic, "enabled", settings.dynamic.enabled, "escalation.dynamic");
        r.scalar(dynamic, "min_stages_at_risk", settings.dynamic.min_stages_at_risk, "escalation.dynamic");
        r.scalar(dynamic, "cooldown_minutes", settings.dynamic.cooldown_minutes, "escalation.dynamic");
        if (dynamic["level"]) {
            if (auto level = r.enumValue(dynamic["level"], OrchestrationUtils::escalationLevelFromString,
                                         "escalation.dynamic.level")) {
                settings.dynamic.level = *level;
            }
        }
        if (dynamic["recipients"]) {
            settings.dynamic.recipients = r.list(dynamic["recipients"], "escalation.dynamic.recipients");
        }
    }
    if (node["rules"]) {
        settings.rules = readRules(r, node["rules"]);
    }
}

void readRecovery(const Reader& r, const YAML::Node& node, RecoveryConfig& config) {
    r.scalar(node, "max_retry_attempts", config.max_retry_attempts, "recovery");
    r.scalar(node, "immediate_retry_error_limit", config.immediate_retry_error_limit, "recovery");
    r.millis(node, "immediate_delay_ms", config.immediate_delay, "recovery");
    r.millis(node, "backoff_base_ms", config.backoff_base, "recovery");
    r.scalar(node, "backoff_factor", config.backoff_factor, "recovery");
    r.millis(node, "backoff_cap_ms", config.backoff_cap, "recovery");
    r.scalar(node, "backoff_jitter", config.backoff_jitter, "recovery");
    r.scalar(node, "slow_recovery_seconds", config.slow_recovery_seconds, "recovery");
}

// EN: Overlays every section present in the document onto the given base.
// FR: Superpose chaque section présente dans le document sur la base donnée.
OrchestrationConfig overlay(const YAML::Node& root, OrchestrationConfig config, std::vector<std::string>& errors) {
    const Reader r{errors};
    if (!root.IsMap()) {
        errors.push_back("configuration root must be a mapping");
        return config;
    }

    if (root["pipeline"]) readPipeline(r, root["pipeline"], config.pipeline);
    if (root["stages"]) config.stages = readStages(r, root["stages"]);
    if (root["business_hours"]) readBusinessHours(r, root["business_hours"], config.business_hours);

    if (const YAML::Node auth = root["authorization"]) {
        config.authorization.clear();
        for (const auto& entry : auth) {
            const std::string level = entry.first.as<std::string>();
            config.authorization[level] = r.list(entry.second, "authorization." + level);
        }
    }

    if (root["quality_gates"]) config.quality_gates = readGates(r, root["quality_gates"]);

    if (const YAML::Node aliases = root["metric_aliases"]) {
        for (const auto& entry : aliases) {
            const std::string metric = entry.first.as<std::string>();
            config.metric_aliases[metric] = r.list(entry.second, "metric_aliases." + metric);
        }
    }

    if (root["sla"]) config.sla = readSla(r, root["sla"]);
    if (root["circuit_breaker"]) readCircuits(r, root["circuit_breaker"], config.circuit_breaker);
    if (root["escalation"]) readEscalation(r, root["escalation"], config.escalation);
    if (root["recovery"]) readRecovery(r, root["recovery"], config.recovery);

    if (const YAML::Node notifications = root["notifications"]) {
        r.scalar(notifications, "webhook_url", config.notifications.webhook_url, "notifications");
        r.scalar(notifications, "incident_url", config.notifications.incident_url, "notifications");
        r.scalar(notifications, "connect_timeout_ms", config.notifications.connect_timeout_ms, "notifications");
        r.scalar(notifications, "request_timeout_ms", config.notifications.request_timeout_ms, "notifications");
    }
    if (const YAML::Node logging = root["logging"]) {
        r.scalar(logging, "level", config.logging.level, "logging");
        r.scalar(logging, "file", config.logging.file, "logging");
        r.scalar(logging, "console", config.logging.console, "logging");
    }
    if (const YAML::Node archive = root["archive"]) {
        r.scalar(archive, "enabled", config.archive.enabled, "archive");
        r.scalar(archive, "directory", config.archive.directory, "archive");
        r.scalar(archive, "compress", config.archive.compress, "archive");
    }
    return config;
}

void emitBreaker(YAML::Emitter& out, const CircuitBreakerConfig& config) {
    out << YAML::BeginMap;
    out << YAML::Key << "failure_threshold" << YAML::Value << config.failure_threshold;
    out << YAML::Key << "recovery_timeout_ms" << YAML::Value << static_cast<long long>(config.recovery_timeout.count());
    out << YAML::Key << "half_open_max_calls" << YAML::Value << config.half_open_max_calls;
    out << YAML::Key << "success_threshold" << YAML::Value << config.success_threshold;
    out << YAML::EndMap;
}

void emitCondition(YAML::Emitter& out, const TriggerCondition& condition) {
    out << YAML::BeginMap;
    out << YAML::Key << "kind" << YAML::Value << OrchestrationUtils::conditionKindToString(condition.kind);
    std::vector<std::string> statuses;
    for (auto status : condition.sla_statuses) statuses.push_back(OrchestrationUtils::slaStatusToString(status));
    for (auto status : condition.gate_statuses) statuses.push_back(OrchestrationUtils::gateStatusToString(status));
    for (auto status : condition.stage_statuses) statuses.push_back(OrchestrationUtils::stageStatusToString(status));
    if (!statuses.empty()) {
        out << YAML::Key << "statuses" << YAML::Value << YAML::Flow << statuses;
    }
    if (condition.kind == ConditionKind::STAGE_CRITICALITY_AT_LEAST) {
        out << YAML::Key << "min_criticality" << YAML::Value
            << OrchestrationUtils::criticalityToString(condition.min_criticality);
    }
    if (!condition.isStageScoped() || condition.threshold != 0.0) {
        out << YAML::Key << "threshold" << YAML::Value << condition.threshold;
    }
    out << YAML::EndMap;
}

std::string emit(const OrchestrationConfig& config) {
    YAML::Emitter out;
    out << YAML::BeginMap;

    out << YAML::Key << "pipeline" << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "name" << YAML::Value << config.pipeline.name;
    out << YAML::Key << "version" << YAML::Value << config.pipeline.version;
    out << YAML::Key << "worker_threads" << YAML::Value << config.pipeline.worker_threads;
    out << YAML::Key << "max_stage_recoveries" << YAML::Value << config.pipeline.max_stage_recoveries;
    out << YAML::Key << "monitor_interval_ms" << YAML::Value
        << static_cast<long long>(config.pipeline.monitor_interval.count());
    out << YAML::Key << "max_errors_before_blocking" << YAML::Value << config.pipeline.max_errors_before_blocking;
    out << YAML::Key << "stalled_stage_minutes" << YAML::Value << config.pipeline.stalled_stage_minutes;
    out << YAML::Key << "sla_load_adjustment" << YAML::Value << config.pipeline.sla_load_adjustment;
    out << YAML::EndMap;

    out << YAML::Key << "stages" << YAML::Value << YAML::BeginSeq;
    for (const auto& stage : config.stages) {
        out << YAML::BeginMap;
        out << YAML::Key << "id" << YAML::Value << stage.id;
        out << YAML::Key << "name" << YAML::Value << stage.name;
        out << YAML::Key << "criticality" << YAML::Value << OrchestrationUtils::criticalityToString(stage.criticality);
        out << YAML::Key << "dependencies" << YAML::Value << YAML::Flow << stage.dependencies;
        out << YAML::EndMap;
    }
    out << YAML::EndSeq;

    out << YAML::Key << "business_hours" << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "start_hour" << YAML::Value << config.business_hours.start_hour;
    out << YAML::Key << "end_hour" << YAML::Value << config.business_hours.end_hour;
    out << YAML::Key << "working_days" << YAML::Value << YAML::Flow << config.business_hours.working_days;
    out << YAML::Key << "utc_offset_minutes" << YAML::Value << config.business_hours.utc_offset_minutes;
    out << YAML::EndMap;

    out << YAML::Key << "authorization" << YAML::Value << YAML::BeginMap;
    for (const auto& [level, accepted] : config.authorization) {
        out << YAML::Key << level << YAML::Value << YAML::Flow << accepted;
    }
    out << YAML::EndMap;

    out << YAML::Key << "quality_gates" << YAML::Value << YAML::BeginSeq;
    for (const auto& gate : config.quality_gates) {
        out << YAML::BeginMap;
        out << YAML::Key << "stage" << YAML::Value << gate.stage_id;
        out << YAML::Key << "required_fields" << YAML::Value << YAML::Flow << gate.required_fields;
        out << YAML::Key << "thresholds" << YAML::Value << YAML::BeginMap;
        for (const auto& threshold : gate.thresholds) {
            out << YAML::Key << threshold.metric << YAML::Value << threshold.min_value;
        }
        out << YAML::EndMap;
        out << YAML::Key << "rules" << YAML::Value << YAML::BeginSeq;
        for (const auto& rule : gate.rules) {
            out << YAML::BeginMap;
            out << YAML::Key << "name" << YAML::Value << rule.name;
            out << YAML::Key << "kind" << YAML::Value
                << (rule.raw_kind.empty() ? OrchestrationUtils::ruleKindToString(rule.kind) : rule.raw_kind);
            out << YAML::Key << "field" << YAML::Value << rule.field;
            switch (rule.kind) {
                case QualityRuleKind::MIN_VALUE:
                case QualityRuleKind::MAX_VALUE:
                    out << YAML::Key << "value" << YAML::Value << rule.value;
                    break;
                case QualityRuleKind::REQUIRED_BOOLEAN:
                    out << YAML::Key << "expected" << YAML::Value << rule.expected;
                    break;
                case QualityRuleKind::ALLOWED_VALUES:
                    out << YAML::Key << "allowed_values" << YAML::Value << YAML::Flow << rule.allowed_values;
                    break;
                case QualityRuleKind::UNKNOWN:
                    break;
            }
            out << YAML::EndMap;
        }
        out << YAML::EndSeq;
        out << YAML::Key << "mandatory" << YAML::Value << gate.mandatory;
        out << YAML::Key << "bypassable" << YAML::Value << gate.bypassable;
        out << YAML::Key << "bypass_auth_level" << YAML::Value << gate.bypass_auth_level;
        out << YAML::Key << "failure_action" << YAML::Value << OrchestrationUtils::failureActionToString(gate.failure_action);
        out << YAML::Key << "retry_allowed" << YAML::Value << gate.retry_allowed;
        out << YAML::Key << "max_retries" << YAML::Value << gate.max_retries;
        out << YAML::EndMap;
    }
    out << YAML::EndSeq;

    out << YAML::Key << "metric_aliases" << YAML::Value << YAML::BeginMap;
    for (const auto& [metric, aliases] : config.metric_aliases) {
        out << YAML::Key << metric << YAML::Value << YAML::Flow << aliases;
    }
    out << YAML::EndMap;

    out << YAML::Key << "sla" << YAML::Value << YAML::BeginSeq;
    for (const auto& sla : config.sla) {
        out << YAML::BeginMap;
        out << YAML::Key << "stage" << YAML::Value << sla.stage_id;
        out << YAML::Key << "target_minutes" << YAML::Value << sla.target_minutes;
        out << YAML::Key << "warning_minutes" << YAML::Value << sla.warning_minutes;
        out << YAML::Key << "critical_minutes" << YAML::Value << sla.critical_minutes;
        out << YAML::Key << "breach_minutes" << YAML::Value << sla.breach_minutes;
        out << YAML::Key << "business_hours_only" << YAML::Value << sla.business_hours_only;
        out << YAML::Key << "escalation_contacts" << YAML::Value << YAML::Flow << sla.escalation_contacts;
        out << YAML::Key << "extensions_allowed" << YAML::Value << sla.extensions_allowed;
        out << YAML::Key << "max_extensions" << YAML::Value << sla.max_extensions;
        out << YAML::Key << "extension_duration_minutes" << YAML::Value << sla.extension_duration_minutes;
        out << YAML::EndMap;
    }
    out << YAML::EndSeq;

    out << YAML::Key << "circuit_breaker" << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "defaults" << YAML::Value;
    emitBreaker(out, config.circuit_breaker.defaults);
    out << YAML::Key << "services" << YAML::Value << YAML::BeginMap;
    for (const auto& [service, breaker] : config.circuit_breaker.overrides) {
        out << YAML::Key << service << YAML::Value;
        emitBreaker(out, breaker);
    }
    out << YAML::EndMap;
    out << YAML::Key << "monitored_services" << YAML::Value << YAML::Flow << config.circuit_breaker.monitored_services;
    out << YAML::Key << "health_endpoints" << YAML::Value << YAML::BeginMap;
    for (const auto& [service, url] : config.circuit_breaker.health_endpoints) {
        out << YAML::Key << service << YAML::Value << url;
    }
    out << YAML::EndMap;
    out << YAML::EndMap;

    out << YAML::Key << "escalation" << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "management_recipients" << YAML::Value << YAML::Flow
        << config.escalation.management_recipients;
    out << YAML::Key << "dynamic" << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "enabled" << YAML::Value << config.escalation.dynamic.enabled;
    out << YAML::Key << "min_stages_at_risk" << YAML::Value << config.escalation.dynamic.min_stages_at_risk;
    out << YAML::Key << "cooldown_minutes" << YAML::Value << config.escalation.dynamic.cooldown_minutes;
    out << YAML::Key << "level" << YAML::Value
        << OrchestrationUtils::escalationLevelToString(config.escalation.dynamic.level);
    out << YAML::Key << "recipients" << YAML::Value << YAML::Flow << config.escalation.dynamic.recipients;
    out << YAML::EndMap;
    out << YAML::Key << "rules" << YAML::Value << YAML::BeginSeq;
    for (const auto& rule : config.escalation.rules) {
        out << YAML::BeginMap;
        out << YAML::Key << "id" << YAML::Value << rule.id;
        out << YAML::Key << "name" << YAML::Value << rule.name;
        out << YAML::Key << "conditions" << YAML::Value << YAML::BeginSeq;
        for (const auto& condition : rule.conditions) {
            emitCondition(out, condition);
        }
        out << YAML::EndSeq;
        out << YAML::Key << "level" << YAML::Value << OrchestrationUtils::escalationLevelToString(rule.level);
        out << YAML::Key << "recipients" << YAML::Value << YAML::Flow << rule.recipients;
        std::vector<std::string> actions;
        for (auto action : rule.automatic_actions) {
            actions.push_back(OrchestrationUtils::automaticActionToString(action));
        }
        out << YAML::Key << "actions" << YAML::Value << YAML::Flow << actions;
        out << YAML::Key << "cooldown_minutes" << YAML::Value << rule.cooldown_minutes;
        out << YAML::Key << "max_per_session" << YAML::Value << rule.max_per_session;
        out << YAML::Key << "requires_ack" << YAML::Value << rule.requires_ack;
        out << YAML::Key << "message_template" << YAML::Value << rule.message_template;
        out << YAML::EndMap;
    }
    out << YAML::EndSeq;
    out << YAML::EndMap;

    out << YAML::Key << "recovery" << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "max_retry_attempts" << YAML::Value << config.recovery.max_retry_attempts;
    out << YAML::Key << "immediate_retry_error_limit" << YAML::Value << config.recovery.immediate_retry_error_limit;
    out << YAML::Key << "immediate_delay_ms" << YAML::Value << static_cast<long long>(config.recovery.immediate_delay.count());
    out << YAML::Key << "backoff_base_ms" << YAML::Value << static_cast<long long>(config.recovery.backoff_base.count());
    out << YAML::Key << "backoff_factor" << YAML::Value << config.recovery.backoff_factor;
    out << YAML::Key << "backoff_cap_ms" << YAML::Value << static_cast<long long>(config.recovery.backoff_cap.count());
    out << YAML::Key << "backoff_jitter" << YAML::Value << config.recovery.backoff_jitter;
    out << YAML::Key << "slow_recovery_seconds" << YAML::Value << config.recovery.slow_recovery_seconds;
    out << YAML::EndMap;

    out << YAML::Key << "notifications" << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "webhook_url" << YAML::Value << config.notifications.webhook_url;
    out << YAML::Key << "incident_url" << YAML::Value << config.notifications.incident_url;
    out << YAML::Key << "connect_timeout_ms" << YAML::Value << config.notifications.connect_timeout_ms;
    out << YAML::Key << "request_timeout_ms" << YAML::Value << config.notifications.request_timeout_ms;
    out << YAML::EndMap;

    out << YAML::Key << "logging" << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "level" << YAML::Value << config.logging.level;
    out << YAML::Key << "file" << YAML::Value << config.logging.file;
    out << YAML::Key << "console" << YAML::Value << config.logging.console;
    out << YAML::EndMap;

    out << YAML::Key << "archive" << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "enabled" << YAML::Value << config.archive.enabled;
    out << YAML::Key << "directory" << YAML::Value << config.archive.directory;
    out << YAML::Key << "compress" << YAML::Value << config.archive.compress;
    out << YAML::EndMap;

    out << YAML::EndMap;
    return out.c_str();
}

} // namespace

ConfigManager::ConfigManager()
    : config_(std::make_shared<const OrchestrationConfig>(DefaultCatalog::onboardingDefaults())) {}

// EN: Destructor stops file watching thread.
// FR: Le destructeur arrête le thread de surveillance de fichier.
ConfigManager::~ConfigManager() {
    disableWatching();
}

// EN: Load configuration from YAML file with error handling.
// FR: Charge la configuration depuis un fichier YAML avec gestion d'erreur.
bool ConfigManager::loadFromFile(const std::string& filename) {
    if (!std::filesystem::exists(filename)) {
        LOG_ERROR("config", "Configuration file not found: " + filename);
        std::lock_guard<std::mutex> lock(mutex_);
        last_errors_ = {"file not found: " + filename};
        return false;
    }

    try {
        return apply(YAML::LoadFile(filename), filename);
    } catch (const YAML::Exception& e) {
        LOG_ERROR("config", "YAML parsing error in " + filename + ": " + std::string(e.what()));
        std::lock_guard<std::mutex> lock(mutex_);
        last_errors_ = {std::string("yaml: ") + e.what()};
        return false;
    }
}

bool ConfigManager::loadFromString(const std::string& yaml_content) {
    try {
        return apply(YAML::Load(yaml_content), "<string>");
    } catch (const YAML::Exception& e) {
        LOG_ERROR("config", "YAML parsing error: " + std::string(e.what()));
        std::lock_guard<std::mutex> lock(mutex_);
        last_errors_ = {std::string("yaml: ") + e.what()};
        return false;
    }
}

void ConfigManager::loadDefaults() {
    install(DefaultCatalog::onboardingDefaults());
    LOG_INFO("config", "Built-in onboarding catalog loaded");
}

bool ConfigManager::apply(const YAML::Node& root, const std::string& origin) {
    std::vector<std::string> errors;
    OrchestrationConfig candidate = root.IsNull()
        ? DefaultCatalog::onboardingDefaults()
        : overlay(root, DefaultCatalog::onboardingDefaults(), errors);

    if (errors.empty()) {
        validate(candidate, errors);
    }
    if (!errors.empty()) {
        LOG_ERROR_META("config", "Configuration rejected, keeping previous version",
                       (std::unordered_map<std::string, std::string>{
                           {"origin", origin},
                           {"errors", std::to_string(errors.size())},
                           {"first_error", errors.front()}
                       }));
        std::lock_guard<std::mutex> lock(mutex_);
        last_errors_ = std::move(errors);
        return false;
    }

    install(std::move(candidate));
    LOG_INFO_META("config", "Configuration loaded", (std::unordered_map<std::string, std::string>{
        {"origin", origin},
        {"version", std::to_string(version_.load())}
    }));
    return true;
}

void ConfigManager::install(OrchestrationConfig config) {
    auto next = std::make_shared<const OrchestrationConfig>(std::move(config));
    std::lock_guard<std::mutex> lock(mutex_);
    config_ = std::move(next);
    last_errors_.clear();
    version_.fetch_add(1);
}

bool ConfigManager::saveToFile(const std::string& filename) const {
    try {
        std::ofstream file(filename);
        if (!file) {
            LOG_ERROR("config", "Cannot open file for writing: " + filename);
            return false;
        }
        file << dump() << "\n";
        LOG_INFO("config", "Configuration saved to: " + filename);
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("config", "Error saving config to " + filename + ": " + std::string(e.what()));
        return false;
    }
}

std::string ConfigManager::dump() const {
    return emit(*current());
}

bool ConfigManager::loadEnvironmentOverrides(const std::string& prefix) {
    OrchestrationConfig config = *current();
    std::vector<std::string> applied;

    if (const char* value = std::getenv((prefix + "WORKER_THREADS").c_str())) {
        try {
            config.pipeline.worker_threads = static_cast<size_t>(std::stoul(value));
            applied.push_back("pipeline.worker_threads");
        } catch (const std::exception&) {
            LOG_WARN("config", "Ignoring invalid " + prefix + "WORKER_THREADS: " + value);
        }
    }
    if (const char* value = std::getenv((prefix + "LOG_LEVEL").c_str())) {
        config.logging.level = value;
        applied.push_back("logging.level");
    }
    if (const char* value = std::getenv((prefix + "ARCHIVE_DIR").c_str())) {
        config.archive.directory = value;
        config.archive.enabled = true;
        applied.push_back("archive.directory");
    }

    if (applied.empty()) {
        return true;
    }
    std::vector<std::string> errors;
    if (!validate(config, errors)) {
        LOG_ERROR("config", "Environment overrides rejected: " + errors.front());
        std::lock_guard<std::mutex> lock(mutex_);
        last_errors_ = std::move(errors);
        return false;
    }
    install(std::move(config));
    for (const auto& key : applied) {
        LOG_INFO("config", "Environment override applied: " + key);
    }
    return true;
}

std::shared_ptr<const OrchestrationConfig> ConfigManager::current() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return config_;
}

std::vector<std::string> ConfigManager::lastErrors() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_errors_;
}

bool ConfigManager::validate(const OrchestrationConfig& config, std::vector<std::string>& errors) {
    const size_t before = errors.size();

    if (config.pipeline.worker_threads == 0) {
        errors.push_back("pipeline.worker_threads must be positive");
    }
    if (config.pipeline.max_stage_recoveries < 0) {
        errors.push_back("pipeline.max_stage_recoveries must not be negative");
    }
    if (config.pipeline.monitor_interval.count() <= 0) {
        errors.push_back("pipeline.monitor_interval_ms must be positive");
    }
    if (config.pipeline.max_errors_before_blocking <= 0) {
        errors.push_back("pipeline.max_errors_before_blocking must be positive");
    }
    if (config.pipeline.stalled_stage_minutes <= 0.0) {
        errors.push_back("pipeline.stalled_stage_minutes must be positive");
    }

    std::set<std::string> stage_ids;
    if (config.stages.empty()) {
        errors.push_back("stages must not be empty");
    }
    for (const auto& stage : config.stages) {
        if (stage.id.empty()) {
            errors.push_back("stage id must not be empty");
        } else if (!stage_ids.insert(stage.id).second) {
            errors.push_back("duplicate stage id: " + stage.id);
        }
    }

    BusinessCalendar::validate(config.business_hours, errors);

    std::set<std::string> gate_stages;
    for (const auto& gate : config.quality_gates) {
        QualityGateEngine::validateGate(gate, config.authorization, errors);
        if (!stage_ids.count(gate.stage_id)) {
            errors.push_back("quality gate references unknown stage: " + gate.stage_id);
        }
        if (!gate_stages.insert(gate.stage_id).second) {
            errors.push_back("duplicate quality gate for stage: " + gate.stage_id);
        }
    }

    std::set<std::string> sla_stages;
    for (const auto& sla : config.sla) {
        SlaMonitor::validateSlaConfig(sla, errors);
        if (!stage_ids.count(sla.stage_id)) {
            errors.push_back("SLA references unknown stage: " + sla.stage_id);
        }
        if (!sla_stages.insert(sla.stage_id).second) {
            errors.push_back("duplicate SLA for stage: " + sla.stage_id);
        }
    }

    CircuitBreakerManager::validateConfig(config.circuit_breaker.defaults, errors);
    for (const auto& [service, breaker] : config.circuit_breaker.overrides) {
        std::vector<std::string> breaker_errors;
        if (!CircuitBreakerManager::validateConfig(breaker, breaker_errors)) {
            for (const auto& error : breaker_errors) {
                errors.push_back(service + ": " + error);
            }
        }
    }

    std::set<std::string> rule_ids;
    for (const auto& rule : config.escalation.rules) {
        EscalationRuleEngine::validateRule(rule, errors);
        if (!rule_ids.insert(rule.id).second) {
            errors.push_back("duplicate escalation rule id: " + rule.id);
        }
    }
    if (config.escalation.dynamic.enabled && config.escalation.dynamic.min_stages_at_risk == 0) {
        errors.push_back("escalation.dynamic.min_stages_at_risk must be positive");
    }
    if (config.escalation.dynamic.cooldown_minutes < 0) {
        errors.push_back("escalation.dynamic.cooldown_minutes must not be negative");
    }

    RecoveryOrchestrator::validateConfig(config.recovery, errors);

    if (config.notifications.connect_timeout_ms <= 0 || config.notifications.request_timeout_ms <= 0) {
        errors.push_back("notifications timeouts must be positive");
    }

    static const std::set<std::string> kLevels = {"debug", "info", "warn", "warning", "error"};
    std::string level = config.logging.level;
    std::transform(level.begin(), level.end(), level.begin(), ::tolower);
    if (!kLevels.count(level)) {
        errors.push_back("logging.level must be one of debug, info, warn, error");
    }
    if (config.archive.enabled && config.archive.directory.empty()) {
        errors.push_back("archive.directory must be set when archiving is enabled");
    }

    return errors.size() == before;
}

// EN: Expand environment variables like ${HOME} in configuration values.
// FR: Étend les variables d'environnement comme ${HOME} dans les valeurs de configuration.
std::string ConfigManager::expandVariables(const std::string& value) {
    static const std::regex var_regex(R"(\$\{([^}]+)\})");
    std::string result;
    auto begin = std::sregex_iterator(value.begin(), value.end(), var_regex);
    size_t last = 0;
    for (auto it = begin; it != std::sregex_iterator(); ++it) {
        const std::smatch& match = *it;
        result.append(value, last, static_cast<size_t>(match.position(0)) - last);
        result += getEnvironmentVariable(match[1].str());
        last = static_cast<size_t>(match.position(0) + match.length(0));
    }
    result.append(value, last, std::string::npos);
    return result;
}

std::string ConfigManager::getEnvironmentVariable(const std::string& name) {
    const char* value = std::getenv(name.c_str());
    return value ? std::string(value) : std::string();
}

void ConfigManager::enableWatching(const std::string& filename, std::chrono::milliseconds interval) {
    std::lock_guard<std::mutex> lock(watch_mutex_);
    stopWatcher();

    watched_file_ = filename;
    watch_interval_ = interval;
    if (std::filesystem::exists(filename)) {
        last_write_time_ = std::filesystem::last_write_time(filename);
    }

    startWatcher();
    watching_enabled_ = true;
    LOG_INFO("config", "File watching enabled for: " + filename);
}

void ConfigManager::disableWatching() {
    std::lock_guard<std::mutex> lock(watch_mutex_);
    if (!watching_enabled_) {
        return;
    }
    stopWatcher();
    watching_enabled_ = false;
    LOG_INFO("config", "File watching disabled");
}

void ConfigManager::setReloadCallback(ReloadCallback callback) {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    reload_callback_ = std::move(callback);
}

void ConfigManager::startWatcher() {
    should_stop_watching_ = false;
    watcher_thread_ = std::make_unique<std::thread>([this]() {
        checkFileChanges();
    });
}

void ConfigManager::stopWatcher() {
    if (watcher_thread_) {
        should_stop_watching_ = true;
        watcher_thread_->join();
        watcher_thread_.reset();
    }
}

void ConfigManager::checkFileChanges() {
    constexpr auto kSlice = std::chrono::milliseconds(20);
    while (!should_stop_watching_) {
        auto waited = std::chrono::milliseconds(0);
        while (waited < watch_interval_ && !should_stop_watching_) {
            std::this_thread::sleep_for(kSlice);
            waited += kSlice;
        }
        if (should_stop_watching_ || watched_file_.empty() || !std::filesystem::exists(watched_file_)) {
            continue;
        }

        try {
            auto current_time = std::filesystem::last_write_time(watched_file_);
            if (current_time == last_write_time_) {
                continue;
            }
            last_write_time_ = current_time;
            LOG_INFO("config", "Configuration file changed, reloading: " + watched_file_);

            if (loadFromFile(watched_file_)) {
                ReloadCallback callback;
                {
                    std::lock_guard<std::mutex> lock(callback_mutex_);
                    callback = reload_callback_;
                }
                if (callback) {
                    callback(*current());
                }
            }
        } catch (const std::filesystem::filesystem_error& e) {
            LOG_ERROR("config", "Error checking file changes: " + std::string(e.what()));
        }
    }
}

} // namespace OBF
