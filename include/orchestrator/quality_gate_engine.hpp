// EN: Quality Gate Engine - validates a stage's output payload before the pipeline may advance.
// FR: Quality Gate Engine - valide le payload de sortie d'une étape avant que le pipeline avance.

#pragma once

#include <deque>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include <nlohmann/json.hpp>

#include "infrastructure/metrics/metrics_aggregator.hpp"
#include "orchestrator/orchestration_types.hpp"

namespace OBF {
namespace Orchestrator {

// EN: Required level -> levels allowed to act on its behalf (itself included)
// FR: Niveau requis -> niveaux autorisés à agir à sa place (lui compris)
using AuthorizationHierarchy = std::map<std::string, std::vector<std::string>>;

// EN: Metric name -> alternative payload keys holding the same metric
// FR: Nom de métrique -> clés alternatives du payload portant la même métrique
using MetricAliases = std::map<std::string, std::vector<std::string>>;

class QualityGateEngine {
public:
    static constexpr double kPassingScore = 70.0;
    static constexpr size_t kTrendHistoryLimit = 50;

    QualityGateEngine(std::vector<QualityGateConfig> gates,
                      AuthorizationHierarchy hierarchy,
                      MetricAliases aliases,
                      MetricsAggregator& metrics);

    bool hasGate(const std::string& stage_id) const;
    std::optional<QualityGateConfig> gate(const std::string& stage_id) const;

    // EN: Evaluate a payload against the gate of a stage; a stage without gate always passes
    // FR: Évalue un payload contre le gate d'une étape ; une étape sans gate passe toujours
    QualityGateResult evaluate(const std::string& stage_id,
                               const nlohmann::json& payload,
                               TimePoint now,
                               const std::optional<BypassRequest>& bypass = std::nullopt);

    // EN: True if the presented level satisfies the required one under the hierarchy
    // FR: Vrai si le niveau présenté satisfait le niveau requis selon la hiérarchie
    bool isAuthorized(const std::string& presented_level, const std::string& required_level) const;

    // EN: Resolve a metric: top level, then one nested level, then aliases
    // FR: Résout une métrique : niveau racine, puis un niveau imbriqué, puis les alias
    std::optional<double> lookupMetric(const nlohmann::json& payload, const std::string& metric) const;

    QualityTrendAnalysis trendFor(const std::string& stage_id) const;

    // EN: Resolve a dotted path such as "equipment.laptop.serial"
    // FR: Résout un chemin pointé tel que "equipment.laptop.serial"
    static std::optional<nlohmann::json> resolvePath(const nlohmann::json& payload, const std::string& path);

    // EN: Non-null, non-empty and not false
    // FR: Non nul, non vide et non faux
    static bool isPresent(const nlohmann::json& value);

    static QualityTrendAnalysis analyzeTrend(const std::vector<double>& scores);

    // EN: Integral values without decimals, others with at most two
    // FR: Valeurs entières sans décimales, les autres avec au plus deux
    static std::string formatNumber(double value);

    static bool validateGate(const QualityGateConfig& gate, const AuthorizationHierarchy& hierarchy,
                             std::vector<std::string>& errors);

private:
    struct RuleOutcome {
        bool passed = true;
        std::string detail;
    };

    RuleOutcome evaluateRule(const QualityRule& rule, const nlohmann::json& payload) const;
    std::vector<std::string> nextActions(const QualityGateConfig& gate, const QualityGateResult& result) const;
    void recordScore(const std::string& stage_id, double score);
    void countResult(const QualityGateResult& result);

    std::unordered_map<std::string, QualityGateConfig> gates_;
    AuthorizationHierarchy hierarchy_;
    MetricAliases aliases_;
    MetricsAggregator& metrics_;

    mutable std::mutex history_mutex_;
    std::unordered_map<std::string, std::deque<double>> score_history_;
};

} // namespace Orchestrator
} // namespace OBF
