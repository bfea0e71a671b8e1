// EN: Quality Gate Engine implementation - required fields, thresholds, rules, score and bypass.
// FR: Implémentation du Quality Gate Engine - champs requis, seuils, règles, score et bypass.

#include "orchestrator/quality_gate_engine.hpp"
#include "infrastructure/logging/logger.hpp"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <numeric>
#include <sstream>

namespace OBF {
namespace Orchestrator {

namespace {

std::optional<double> asNumber(const nlohmann::json& value) {
    if (value.is_number()) {
        return value.get<double>();
    }
    if (value.is_boolean()) {
        return value.get<bool>() ? 1.0 : 0.0;
    }
    if (value.is_string()) {
        const auto& text = value.get_ref<const std::string&>();
        try {
            size_t consumed = 0;
            double parsed = std::stod(text, &consumed);
            if (consumed == text.size()) {
                return parsed;
            }
        } catch (const std::exception&) {
            return std::nullopt;
        }
    }
    return std::nullopt;
}

double percentage(size_t passed, size_t total) {
    if (total == 0) {
        return 100.0;
    }
    return 100.0 * static_cast<double>(passed) / static_cast<double>(total);
}

} // namespace

QualityGateEngine::QualityGateEngine(std::vector<QualityGateConfig> gates,
                                     AuthorizationHierarchy hierarchy,
                                     MetricAliases aliases,
                                     MetricsAggregator& metrics)
    : hierarchy_(std::move(hierarchy)), aliases_(std::move(aliases)), metrics_(metrics) {
    for (auto& gate : gates) {
        std::string stage_id = gate.stage_id;
        if (!gates_.emplace(stage_id, std::move(gate)).second) {
            throw std::invalid_argument("Duplicate quality gate for stage: " + stage_id);
        }
    }
}

bool QualityGateEngine::hasGate(const std::string& stage_id) const {
    return gates_.count(stage_id) > 0;
}

std::optional<QualityGateConfig> QualityGateEngine::gate(const std::string& stage_id) const {
    auto it = gates_.find(stage_id);
    if (it == gates_.end()) {
        return std::nullopt;
    }
    return it->second;
}

QualityGateResult QualityGateEngine::evaluate(const std::string& stage_id,
                                              const nlohmann::json& payload,
                                              TimePoint now,
                                              const std::optional<BypassRequest>& bypass) {
    QualityGateResult result;
    result.stage_id = stage_id;
    result.evaluated_at = now;

    auto it = gates_.find(stage_id);
    if (it == gates_.end()) {
        result.passed = true;
        result.score = 100.0;
        result.status = GateStatus::PASSED;
        result.next_actions = {"proceed to next stage"};
        countResult(result);
        return result;
    }
    const QualityGateConfig& gate = it->second;

    // EN: 1. Required fields
    // FR: 1. Champs requis
    size_t fields_passed = 0;
    for (const auto& field : gate.required_fields) {
        auto value = resolvePath(payload, field);
        if (value && isPresent(*value)) {
            ++fields_passed;
        } else {
            result.critical_issues.push_back(field);
        }
    }
    const bool missing_fields = fields_passed < gate.required_fields.size();

    // EN: 2. Thresholds, compared with >=
    // FR: 2. Seuils, comparés avec >=
    size_t thresholds_passed = 0;
    for (const auto& threshold : gate.thresholds) {
        auto actual = lookupMetric(payload, threshold.metric);
        if (!actual) {
            result.critical_issues.push_back(threshold.metric + ": missing");
        } else if (*actual < threshold.min_value) {
            result.critical_issues.push_back(threshold.metric + ": " + formatNumber(*actual) + " < " +
                                             formatNumber(threshold.min_value));
        } else {
            ++thresholds_passed;
        }
    }
    const bool threshold_failures = thresholds_passed < gate.thresholds.size();

    // EN: 3. Rules; unknown kinds pass
    // FR: 3. Règles ; les types inconnus passent
    size_t rules_passed = 0;
    for (const auto& rule : gate.rules) {
        RuleOutcome outcome = evaluateRule(rule, payload);
        if (outcome.passed) {
            ++rules_passed;
        } else {
            result.warnings.push_back(rule.name + ": " + outcome.detail);
        }
        if (rule.kind == QualityRuleKind::UNKNOWN) {
            result.warnings.push_back(rule.name + ": unknown rule kind '" + rule.raw_kind + "' ignored");
        }
    }

    result.fields_score = percentage(fields_passed, gate.required_fields.size());
    result.thresholds_score = percentage(thresholds_passed, gate.thresholds.size());
    result.rules_score = percentage(rules_passed, gate.rules.size());
    result.score = (result.fields_score + result.thresholds_score + result.rules_score) / 3.0;

    result.passed = !missing_fields && !threshold_failures && result.score >= kPassingScore;
    if (result.passed) {
        result.status = GateStatus::PASSED;
    } else if (result.score > 0.0 && result.score < kPassingScore && !gate.isHardBlock()) {
        result.status = GateStatus::MANUAL_REVIEW;
    } else {
        result.status = GateStatus::FAILED;
    }

    if (!result.passed && bypass) {
        if (!gate.bypassable) {
            result.warnings.push_back("bypass denied: gate is not bypassable");
        } else if (!isAuthorized(bypass->authorization_level, gate.bypass_auth_level)) {
            result.warnings.push_back("bypass denied: level '" + bypass->authorization_level +
                                      "' does not satisfy '" + gate.bypass_auth_level + "'");
        } else {
            for (const auto& issue : result.critical_issues) {
                result.warnings.push_back("bypassed: " + issue);
            }
            result.critical_issues.clear();
            result.passed = true;
            result.status = GateStatus::BYPASS;
            result.bypass_reason = bypass->reason;
            result.bypassed_by = bypass->authorized_by;

            LOG_WARN_META("quality_gate", "Gate bypassed for stage " + stage_id,
                          (std::unordered_map<std::string, std::string>{
                              {"authorized_by", bypass->authorized_by},
                              {"authorization_level", bypass->authorization_level},
                              {"reason", bypass->reason}}));
        }
    }

    result.next_actions = nextActions(gate, result);
    recordScore(stage_id, result.score);
    countResult(result);

    LOG_DEBUG("quality_gate", "Stage " + stage_id + " scored " + formatNumber(result.score) + " -> " +
              OrchestrationUtils::gateStatusToString(result.status));
    return result;
}

bool QualityGateEngine::isAuthorized(const std::string& presented_level, const std::string& required_level) const {
    if (presented_level.empty()) {
        return false;
    }
    if (presented_level == required_level) {
        return true;
    }
    auto it = hierarchy_.find(required_level);
    if (it == hierarchy_.end()) {
        return false;
    }
    return std::find(it->second.begin(), it->second.end(), presented_level) != it->second.end();
}

std::optional<double> QualityGateEngine::lookupMetric(const nlohmann::json& payload, const std::string& metric) const {
    if (!payload.is_object()) {
        return std::nullopt;
    }

    auto lookupKey = [&payload](const std::string& key) -> std::optional<double> {
        if (key.find('.') != std::string::npos) {
            auto value = resolvePath(payload, key);
            return value ? asNumber(*value) : std::nullopt;
        }
        auto direct = payload.find(key);
        if (direct != payload.end()) {
            return asNumber(*direct);
        }
        for (const auto& item : payload.items()) {
            if (item.value().is_object()) {
                auto nested = item.value().find(key);
                if (nested != item.value().end()) {
                    return asNumber(*nested);
                }
            }
        }
        return std::nullopt;
    };

    if (auto value = lookupKey(metric)) {
        return value;
    }
    auto alias = aliases_.find(metric);
    if (alias != aliases_.end()) {
        for (const auto& key : alias->second) {
            if (auto value = lookupKey(key)) {
                return value;
            }
        }
    }
    return std::nullopt;
}

QualityTrendAnalysis QualityGateEngine::trendFor(const std::string& stage_id) const {
    std::vector<double> scores;
    {
        std::lock_guard<std::mutex> lock(history_mutex_);
        auto it = score_history_.find(stage_id);
        if (it != score_history_.end()) {
            scores.assign(it->second.begin(), it->second.end());
        }
    }
    return analyzeTrend(scores);
}

std::optional<nlohmann::json> QualityGateEngine::resolvePath(const nlohmann::json& payload, const std::string& path) {
    if (path.empty()) {
        return std::nullopt;
    }
    const nlohmann::json* current = &payload;
    std::stringstream ss(path);
    std::string segment;
    while (std::getline(ss, segment, '.')) {
        if (!current->is_object()) {
            return std::nullopt;
        }
        auto it = current->find(segment);
        if (it == current->end()) {
            return std::nullopt;
        }
        current = &(*it);
    }
    return *current;
}

bool QualityGateEngine::isPresent(const nlohmann::json& value) {
    if (value.is_null()) {
        return false;
    }
    if (value.is_boolean()) {
        return value.get<bool>();
    }
    if (value.is_string() || value.is_array() || value.is_object()) {
        return !value.empty();
    }
    return true;
}

QualityTrendAnalysis QualityGateEngine::analyzeTrend(const std::vector<double>& scores) {
    QualityTrendAnalysis analysis;
    analysis.samples = scores.size();
    if (scores.size() < 3) {
        return analysis;
    }

    double earlier_mean = std::accumulate(scores.begin(), scores.end() - 1, 0.0) /
                          static_cast<double>(scores.size() - 1);
    double last = scores.back();
    analysis.relative_change = earlier_mean == 0.0 ? 0.0 : (last - earlier_mean) / earlier_mean;
    analysis.confidence = std::min(1.0, static_cast<double>(scores.size()) / 10.0);

    if (analysis.relative_change < -0.15) {
        analysis.trend = QualityTrend::DEGRADING;
    } else if (analysis.relative_change > 0.10) {
        analysis.trend = QualityTrend::IMPROVING;
    } else {
        analysis.trend = QualityTrend::STABLE;
    }
    return analysis;
}

std::string QualityGateEngine::formatNumber(double value) {
    std::ostringstream oss;
    if (std::fabs(value - std::round(value)) < 1e-9) {
        oss << static_cast<long long>(std::llround(value));
        return oss.str();
    }
    oss << std::fixed << std::setprecision(2) << value;
    std::string text = oss.str();
    while (!text.empty() && text.back() == '0') {
        text.pop_back();
    }
    if (!text.empty() && text.back() == '.') {
        text.pop_back();
    }
    return text;
}

bool QualityGateEngine::validateGate(const QualityGateConfig& gate, const AuthorizationHierarchy& hierarchy,
                                     std::vector<std::string>& errors) {
    const size_t before = errors.size();
    const std::string prefix = "quality_gates." + gate.stage_id + ": ";

    if (gate.stage_id.empty()) {
        errors.push_back("quality_gates: gate without stage id");
    }
    for (const auto& field : gate.required_fields) {
        if (field.empty() || field.front() == '.' || field.back() == '.' ||
            field.find("..") != std::string::npos) {
            errors.push_back(prefix + "invalid required field path '" + field + "'");
        }
    }
    for (const auto& threshold : gate.thresholds) {
        if (threshold.metric.empty()) {
            errors.push_back(prefix + "threshold without metric name");
        }
    }
    for (const auto& rule : gate.rules) {
        if (rule.kind != QualityRuleKind::UNKNOWN && rule.field.empty()) {
            errors.push_back(prefix + "rule '" + rule.name + "' has no field");
        }
        if (rule.kind == QualityRuleKind::ALLOWED_VALUES && rule.allowed_values.empty()) {
            errors.push_back(prefix + "rule '" + rule.name + "' has no allowed values");
        }
    }
    if (gate.bypassable) {
        bool known = hierarchy.count(gate.bypass_auth_level) > 0;
        if (!known) {
            for (const auto& [level, grants] : hierarchy) {
                if (std::find(grants.begin(), grants.end(), gate.bypass_auth_level) != grants.end()) {
                    known = true;
                    break;
                }
            }
        }
        if (!known) {
            errors.push_back(prefix + "unknown bypass authorization level '" + gate.bypass_auth_level + "'");
        }
    }
    if (gate.max_retries < 0) {
        errors.push_back(prefix + "max_retries cannot be negative");
    }
    return errors.size() == before;
}

QualityGateEngine::RuleOutcome QualityGateEngine::evaluateRule(const QualityRule& rule,
                                                               const nlohmann::json& payload) const {
    RuleOutcome outcome;
    if (rule.kind == QualityRuleKind::UNKNOWN) {
        return outcome;
    }

    auto value = resolvePath(payload, rule.field);
    if (!value || value->is_null()) {
        outcome.passed = false;
        outcome.detail = rule.field + " missing";
        return outcome;
    }

    switch (rule.kind) {
        case QualityRuleKind::MIN_VALUE:
        case QualityRuleKind::MAX_VALUE: {
            auto number = asNumber(*value);
            if (!number) {
                outcome.passed = false;
                outcome.detail = rule.field + " is not numeric";
            } else if (rule.kind == QualityRuleKind::MIN_VALUE && *number < rule.value) {
                outcome.passed = false;
                outcome.detail = formatNumber(*number) + " < " + formatNumber(rule.value);
            } else if (rule.kind == QualityRuleKind::MAX_VALUE && *number > rule.value) {
                outcome.passed = false;
                outcome.detail = formatNumber(*number) + " > " + formatNumber(rule.value);
            }
            break;
        }
        case QualityRuleKind::REQUIRED_BOOLEAN:
            if (!value->is_boolean() || value->get<bool>() != rule.expected) {
                outcome.passed = false;
                outcome.detail = rule.field + " must be " + (rule.expected ? "true" : "false");
            }
            break;
        case QualityRuleKind::ALLOWED_VALUES: {
            std::string text = value->is_string() ? value->get<std::string>() : value->dump();
            if (std::find(rule.allowed_values.begin(), rule.allowed_values.end(), text) ==
                rule.allowed_values.end()) {
                outcome.passed = false;
                outcome.detail = "'" + text + "' not allowed";
            }
            break;
        }
        case QualityRuleKind::UNKNOWN:
            break;
    }
    return outcome;
}

std::vector<std::string> QualityGateEngine::nextActions(const QualityGateConfig& gate,
                                                        const QualityGateResult& result) const {
    std::vector<std::string> actions;
    switch (result.status) {
        case GateStatus::PASSED:
            actions.push_back("proceed to next stage");
            break;
        case GateStatus::BYPASS:
            actions.push_back("proceed under bypass");
            actions.push_back("review bypassed issues");
            break;
        case GateStatus::MANUAL_REVIEW:
            actions.push_back("manual review");
            break;
        case GateStatus::FAILED:
            if (gate.failure_action == GateFailureAction::ESCALATE) {
                actions.push_back("escalate");
            } else {
                actions.push_back("block and return");
            }
            break;
    }
    if (!result.passed && gate.retry_allowed) {
        actions.push_back("retry allowed (max " + std::to_string(gate.max_retries) + ")");
    }
    if (!result.passed && gate.bypassable) {
        actions.push_back("bypass with " + gate.bypass_auth_level + " authorization");
    }
    return actions;
}

void QualityGateEngine::recordScore(const std::string& stage_id, double score) {
    std::lock_guard<std::mutex> lock(history_mutex_);
    auto& history = score_history_[stage_id];
    history.push_back(score);
    while (history.size() > kTrendHistoryLimit) {
        history.pop_front();
    }
}

void QualityGateEngine::countResult(const QualityGateResult& result) {
    metrics_.increment(Metric::GATE_EVALUATIONS);
    switch (result.status) {
        case GateStatus::PASSED: metrics_.increment(Metric::GATE_PASSED); break;
        case GateStatus::FAILED: metrics_.increment(Metric::GATE_FAILED); break;
        case GateStatus::MANUAL_REVIEW: metrics_.increment(Metric::GATE_MANUAL_REVIEW); break;
        case GateStatus::BYPASS: metrics_.increment(Metric::GATE_BYPASSED); break;
    }
}

} // namespace Orchestrator
} // namespace OBF
