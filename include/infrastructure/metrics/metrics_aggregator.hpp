// EN: Process-wide orchestration counters, injected by reference into every component.
// FR: Compteurs d'orchestration du processus, injectés par référence dans chaque composant.

#pragma once

#include <array>
#include <atomic>
#include <cstdint>
#include <string>

#include <nlohmann/json.hpp>

namespace OBF {

// EN: Closed set of counters tracked by the orchestration core
// FR: Ensemble fermé de compteurs suivis par le cœur d'orchestration
enum class Metric : size_t {
    SESSIONS_STARTED = 0,
    SESSIONS_COMPLETED,
    SESSIONS_FAILED,
    SESSIONS_CANCELLED,
    ACTIVE_SESSIONS,          // EN: Gauge / FR: Jauge
    OUTCOMES_ACCEPTED,
    OUTCOMES_DUPLICATE,
    OUTCOMES_REJECTED,
    GATE_EVALUATIONS,
    GATE_PASSED,
    GATE_FAILED,
    GATE_MANUAL_REVIEW,
    GATE_BYPASSED,
    SLA_EVALUATIONS,
    SLA_ON_TIME,
    SLA_AT_RISK,
    SLA_BREACHED,
    SLA_EXTENSIONS_GRANTED,
    CIRCUIT_OPENED,
    CIRCUIT_HALF_OPENED,
    CIRCUIT_CLOSED,
    CIRCUIT_REJECTED_CALLS,
    ESCALATIONS_FIRED,
    ESCALATIONS_SUPPRESSED,
    NOTIFICATIONS_SENT,
    NOTIFICATIONS_FAILED,
    INCIDENTS_CREATED,
    RECOVERY_ATTEMPTS,
    RECOVERY_SUCCESS,
    RECOVERY_PARTIAL,
    RECOVERY_FAILED,
    METRIC_COUNT
};

constexpr size_t kMetricCount = static_cast<size_t>(Metric::METRIC_COUNT);

// EN: Point-in-time copy of every counter
// FR: Copie ponctuelle de chaque compteur
struct MetricsSnapshot {
    std::array<uint64_t, kMetricCount> values{};

    uint64_t get(Metric metric) const { return values[static_cast<size_t>(metric)]; }
    nlohmann::json toJson() const;
};

class MetricsAggregator {
public:
    MetricsAggregator() = default;

    MetricsAggregator(const MetricsAggregator&) = delete;
    MetricsAggregator& operator=(const MetricsAggregator&) = delete;

    void increment(Metric metric, uint64_t amount = 1);

    // EN: Only meaningful for gauges; never goes below zero
    // FR: N'a de sens que pour les jauges ; ne descend jamais sous zéro
    void decrement(Metric metric, uint64_t amount = 1);

    uint64_t get(Metric metric) const;

    MetricsSnapshot snapshot() const;
    nlohmann::json toJson() const { return snapshot().toJson(); }

    void reset();

    static std::string metricName(Metric metric);

private:
    std::array<std::atomic<uint64_t>, kMetricCount> counters_{};
};

} // namespace OBF
