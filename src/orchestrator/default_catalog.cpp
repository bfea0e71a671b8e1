// EN: Built-in onboarding catalog - stages, gates, SLAs and escalation rules of the standard pipeline.
// FR: Catalogue d'onboarding intégré - étapes, gates, SLA et règles d'escalade du pipeline standard.

#include "orchestrator/orchestration_config.hpp"

namespace OBF {
namespace Orchestrator {
namespace DefaultCatalog {

namespace {

QualityRule minValue(const std::string& field, double value) {
    QualityRule rule;
    rule.name = field + " >= " + QualityGateEngine::formatNumber(value);
    rule.kind = QualityRuleKind::MIN_VALUE;
    rule.raw_kind = "minValue";
    rule.field = field;
    rule.value = value;
    return rule;
}

QualityRule requiredBoolean(const std::string& field) {
    QualityRule rule;
    rule.name = field + " must be true";
    rule.kind = QualityRuleKind::REQUIRED_BOOLEAN;
    rule.raw_kind = "requiredBoolean";
    rule.field = field;
    rule.expected = true;
    return rule;
}

SlaConfig sla(const std::string& stage, double target, double warning, double critical, double breach,
              std::vector<std::string> contacts, int max_extensions, double extension_minutes,
              bool business_hours_only = false) {
    SlaConfig config;
    config.stage_id = stage;
    config.target_minutes = target;
    config.warning_minutes = warning;
    config.critical_minutes = critical;
    config.breach_minutes = breach;
    config.business_hours_only = business_hours_only;
    config.escalation_contacts = std::move(contacts);
    config.extensions_allowed = max_extensions > 0;
    config.max_extensions = max_extensions;
    config.extension_duration_minutes = extension_minutes;
    return config;
}

TriggerCondition slaStatusIs(std::vector<SlaStatus> statuses) {
    TriggerCondition condition;
    condition.kind = ConditionKind::SLA_STATUS_IS;
    condition.sla_statuses = std::move(statuses);
    return condition;
}

TriggerCondition stageStatusIs(std::vector<StageStatus> statuses) {
    TriggerCondition condition;
    condition.kind = ConditionKind::STAGE_STATUS_IS;
    condition.stage_statuses = std::move(statuses);
    return condition;
}

TriggerCondition numeric(ConditionKind kind, double threshold) {
    TriggerCondition condition;
    condition.kind = kind;
    condition.threshold = threshold;
    return condition;
}

} // namespace

std::vector<StageDefinition> onboardingStages() {
    return {
        {"data_collection", "Initial Data Collection", StageCriticality::MEDIUM, {"hr_system"}},
        {"data_aggregation", "Data Aggregation", StageCriticality::HIGH, {"database"}},
        {"it_provisioning", "IT Provisioning", StageCriticality::HIGH, {"active_directory", "asset_management"}},
        {"contract_management", "Contract Management", StageCriticality::HIGH, {"document_service", "e_signature"}},
        {"meeting_coordination", "Meeting Coordination", StageCriticality::MEDIUM, {"calendar_service"}}
    };
}

AuthorizationHierarchy authorizationHierarchy() {
    return {
        {"manager", {"manager", "senior_manager", "director"}},
        {"senior_manager", {"senior_manager", "director"}},
        {"it_manager", {"it_manager", "senior_manager", "director"}},
        {"hr_manager", {"hr_manager", "senior_manager", "director"}},
        {"director", {"director"}}
    };
}

std::vector<QualityGateConfig> qualityGates() {
    std::vector<QualityGateConfig> gates;

    QualityGateConfig collection;
    collection.stage_id = "data_collection";
    collection.required_fields = {"initialDataCollected", "confirmationCompleted", "documentationValidated"};
    collection.thresholds = {{"collectionCompleteness", 85.0}, {"dataQualityScore", 75.0}};
    collection.rules = {minValue("collectionCompleteness", 85.0)};
    collection.bypassable = true;
    collection.bypass_auth_level = "manager";
    collection.failure_action = GateFailureAction::WARN;
    collection.max_retries = 2;
    gates.push_back(collection);

    QualityGateConfig aggregation;
    aggregation.stage_id = "data_aggregation";
    aggregation.required_fields = {"aggregationCompleted", "overallQualityScore", "validationPassed", "readyForSequential"};
    aggregation.thresholds = {{"overallQualityScore", 70.0}, {"completenessScore", 80.0},
                              {"consistencyScore", 85.0}, {"reliabilityScore", 75.0}};
    aggregation.rules = {minValue("overallQualityScore", 70.0), requiredBoolean("validationPassed"),
                         minValue("completenessScore", 80.0)};
    aggregation.failure_action = GateFailureAction::BLOCK;
    aggregation.max_retries = 2;
    gates.push_back(aggregation);

    QualityGateConfig provisioning;
    provisioning.stage_id = "it_provisioning";
    provisioning.required_fields = {"credentialsCreated", "equipmentAssigned"};
    provisioning.thresholds = {{"securityCompliance", 95.0}};
    provisioning.rules = {requiredBoolean("credentialsCreated"), requiredBoolean("equipmentAssigned")};
    provisioning.bypassable = true;
    provisioning.bypass_auth_level = "it_manager";
    provisioning.failure_action = GateFailureAction::BLOCK;
    provisioning.max_retries = 3;
    gates.push_back(provisioning);

    QualityGateConfig contract;
    contract.stage_id = "contract_management";
    contract.required_fields = {"contractGenerated", "legalValidationPassed", "signatureProcessComplete", "documentArchived"};
    contract.thresholds = {{"complianceScore", 90.0}, {"legalValidationScore", 95.0}};
    contract.rules = {requiredBoolean("contractGenerated"), requiredBoolean("legalValidationPassed"),
                      requiredBoolean("signatureProcessComplete"), minValue("complianceScore", 90.0)};
    contract.failure_action = GateFailureAction::BLOCK;
    contract.max_retries = 2;
    gates.push_back(contract);

    QualityGateConfig meeting;
    meeting.stage_id = "meeting_coordination";
    meeting.required_fields = {"stakeholdersEngaged", "meetingsScheduled", "calendarIntegrationActive"};
    meeting.thresholds = {{"stakeholderEngagementScore", 80.0}, {"schedulingEfficiencyScore", 75.0}};
    meeting.rules = {minValue("stakeholdersEngaged", 3), minValue("meetingsScheduled", 3),
                     requiredBoolean("calendarIntegrationActive")};
    meeting.bypassable = true;
    meeting.bypass_auth_level = "hr_manager";
    meeting.failure_action = GateFailureAction::WARN;
    meeting.max_retries = 3;
    gates.push_back(meeting);

    return gates;
}

MetricAliases metricAliases() {
    return {
        {"securityCompliance", {"security_compliance_score", "securityComplianceScore"}},
        {"overallQualityScore", {"overall_quality_score", "qualityScore"}},
        {"complianceScore", {"compliance_score"}},
        {"collectionCompleteness", {"collection_completeness", "completeness"}}
    };
}

std::vector<SlaConfig> slaConfigs() {
    return {
        sla("data_collection", 15, 20, 25, 30, {"data_collection_team@company.com", "system_admin@company.com"}, 1, 10),
        sla("data_aggregation", 4, 5, 6, 8, {"data_team_lead@company.com", "system_admin@company.com"}, 1, 3),
        sla("it_provisioning", 8, 10, 12, 15, {"it_manager@company.com", "security_team@company.com"}, 2, 5, true),
        sla("contract_management", 12, 15, 18, 20, {"legal_team@company.com", "hr_coordinator@company.com"}, 2, 10),
        sla("meeting_coordination", 6, 8, 10, 12, {"hr_coordinator@company.com", "calendar_admin@company.com"}, 1, 5)
    };
}

std::vector<EscalationRule> escalationRules() {
    std::vector<EscalationRule> rules;

    EscalationRule breach;
    breach.id = "critical_sla_breach";
    breach.name = "Critical SLA Breach Alert";
    TriggerCondition high_criticality;
    high_criticality.kind = ConditionKind::STAGE_CRITICALITY_AT_LEAST;
    high_criticality.min_criticality = StageCriticality::HIGH;
    breach.conditions = {slaStatusIs({SlaStatus::BREACHED}), high_criticality,
                         numeric(ConditionKind::BREACH_DURATION_MINUTES, 5)};
    breach.level = EscalationLevel::CRITICAL;
    breach.recipients = {"pipeline_manager@company.com", "hr_director@company.com", "it_director@company.com"};
    breach.automatic_actions = {AutomaticAction::PAUSE_PIPELINE, AutomaticAction::CREATE_INCIDENT,
                                AutomaticAction::NOTIFY_MANAGEMENT};
    breach.message_template = "CRITICAL SLA BREACH: onboarding {subject_id} stage {stage} has breached its SLA. "
                              "Immediate intervention required.";
    breach.cooldown_minutes = 15;
    breach.max_per_session = 3;
    breach.requires_ack = true;
    rules.push_back(breach);

    EscalationRule quality;
    quality.id = "repeated_quality_failure";
    quality.name = "Repeated Quality Gate Failure";
    TriggerCondition gate_failed;
    gate_failed.kind = ConditionKind::QUALITY_GATE_STATUS_IS;
    gate_failed.gate_statuses = {GateStatus::FAILED, GateStatus::MANUAL_REVIEW};
    quality.conditions = {gate_failed, numeric(ConditionKind::RETRY_ATTEMPTS, 2)};
    quality.level = EscalationLevel::WARNING;
    quality.recipients = {"quality_assurance@company.com", "data_team_lead@company.com", "hr_coordinator@company.com"};
    quality.automatic_actions = {AutomaticAction::ROUTE_MANUAL_REVIEW};
    quality.message_template = "Quality gate failure for {subject_id} in {stage}. Multiple retry attempts failed. "
                               "Manual review required.";
    quality.cooldown_minutes = 20;
    quality.max_per_session = 2;
    rules.push_back(quality);

    EscalationRule worker;
    worker.id = "agent_failure_recovery";
    worker.name = "Stage Worker Failure with Auto Recovery";
    worker.conditions = {stageStatusIs({StageStatus::FAILED, StageStatus::TIMEOUT}),
                         numeric(ConditionKind::STAGE_ERROR_COUNT, 3)};
    worker.level = EscalationLevel::CRITICAL;
    worker.recipients = {"devops_team@company.com", "system_admin@company.com", "pipeline_support@company.com"};
    worker.automatic_actions = {AutomaticAction::RESTART_DEPENDENCY, AutomaticAction::CREATE_INCIDENT};
    worker.message_template = "Stage {stage} has failed repeatedly for {subject_id}. Auto-recovery initiated.";
    worker.cooldown_minutes = 10;
    worker.max_per_session = 5;
    worker.requires_ack = true;
    rules.push_back(worker);

    EscalationRule at_risk;
    at_risk.id = "multiple_stages_at_risk";
    at_risk.name = "Multiple Pipeline Stages At Risk";
    at_risk.conditions = {numeric(ConditionKind::STAGES_AT_RISK, 2)};
    at_risk.level = EscalationLevel::WARNING;
    at_risk.recipients = {"pipeline_coordinator@company.com", "hr_manager@company.com"};
    at_risk.message_template = "Multiple pipeline stages at risk for {subject_id}. Enhanced monitoring activated.";
    at_risk.cooldown_minutes = 30;
    at_risk.max_per_session = 2;
    rules.push_back(at_risk);

    EscalationRule overload;
    overload.id = "system_overload_detection";
    overload.name = "System Overload Detection";
    overload.conditions = {numeric(ConditionKind::CONCURRENT_SESSIONS, 10), numeric(ConditionKind::SYSTEM_LOAD, 0.9),
                           numeric(ConditionKind::ERROR_RATE, 0.3)};
    overload.level = EscalationLevel::EMERGENCY;
    overload.recipients = {"cto@company.com", "infrastructure_team@company.com", "incident_commander@company.com"};
    overload.automatic_actions = {AutomaticAction::CREATE_INCIDENT, AutomaticAction::NOTIFY_MANAGEMENT};
    overload.message_template = "SYSTEM EMERGENCY: high load detected while processing session {session_id}.";
    overload.cooldown_minutes = 5;
    overload.max_per_session = 1;
    overload.requires_ack = true;
    rules.push_back(overload);

    EscalationRule after_hours;
    after_hours.id = "business_hours_violation";
    after_hours.name = "Processing Outside Business Hours";
    TriggerCondition outside;
    outside.kind = ConditionKind::OUTSIDE_BUSINESS_HOURS;
    after_hours.conditions = {outside, stageStatusIs({StageStatus::ESCALATED})};
    after_hours.level = EscalationLevel::WARNING;
    after_hours.recipients = {"after_hours_support@company.com", "hr_emergency@company.com"};
    after_hours.message_template = "Onboarding {subject_id} requires manual intervention on {stage} outside business "
                                   "hours. Queued for next business day.";
    after_hours.cooldown_minutes = 60;
    after_hours.max_per_session = 1;
    rules.push_back(after_hours);

    return rules;
}

OrchestrationConfig onboardingDefaults() {
    OrchestrationConfig config;
    config.stages = onboardingStages();
    config.authorization = authorizationHierarchy();
    config.quality_gates = qualityGates();
    config.metric_aliases = metricAliases();
    config.sla = slaConfigs();
    config.escalation.rules = escalationRules();
    config.escalation.management_recipients = {"pipeline_manager@company.com", "hr_director@company.com"};
    config.escalation.dynamic.recipients = {"pipeline_coordinator@company.com"};

    for (const auto& stage : config.stages) {
        for (const auto& service : stage.dependencies) {
            config.circuit_breaker.monitored_services.push_back(service);
        }
    }
    return config;
}

} // namespace DefaultCatalog
} // namespace Orchestrator
} // namespace OBF
