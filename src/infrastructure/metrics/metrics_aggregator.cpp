// EN: Implementation of the MetricsAggregator - relaxed atomics, snapshot export as JSON.
// FR: Implémentation du MetricsAggregator - atomiques relâchés, export du snapshot en JSON.

#include "infrastructure/metrics/metrics_aggregator.hpp"

namespace OBF {

nlohmann::json MetricsSnapshot::toJson() const {
    nlohmann::json json = nlohmann::json::object();
    for (size_t i = 0; i < kMetricCount; ++i) {
        json[MetricsAggregator::metricName(static_cast<Metric>(i))] = values[i];
    }
    return json;
}

void MetricsAggregator::increment(Metric metric, uint64_t amount) {
    counters_[static_cast<size_t>(metric)].fetch_add(amount, std::memory_order_relaxed);
}

void MetricsAggregator::decrement(Metric metric, uint64_t amount) {
    auto& counter = counters_[static_cast<size_t>(metric)];
    uint64_t current = counter.load(std::memory_order_relaxed);
    uint64_t next = 0;
    do {
        next = current > amount ? current - amount : 0;
    } while (!counter.compare_exchange_weak(current, next, std::memory_order_relaxed));
}

uint64_t MetricsAggregator::get(Metric metric) const {
    return counters_[static_cast<size_t>(metric)].load(std::memory_order_relaxed);
}

MetricsSnapshot MetricsAggregator::snapshot() const {
    MetricsSnapshot snap;
    for (size_t i = 0; i < kMetricCount; ++i) {
        snap.values[i] = counters_[i].load(std::memory_order_relaxed);
    }
    return snap;
}

void MetricsAggregator::reset() {
    for (auto& counter : counters_) {
        counter.store(0, std::memory_order_relaxed);
    }
}

std::string MetricsAggregator::metricName(Metric metric) {
    switch (metric) {
        case Metric::SESSIONS_STARTED: return "sessions_started";
        case Metric::SESSIONS_COMPLETED: return "sessions_completed";
        case Metric::SESSIONS_FAILED: return "sessions_failed";
        case Metric::SESSIONS_CANCELLED: return "sessions_cancelled";
        case Metric::ACTIVE_SESSIONS: return "active_sessions";
        case Metric::OUTCOMES_ACCEPTED: return "outcomes_accepted";
        case Metric::OUTCOMES_DUPLICATE: return "outcomes_duplicate";
        case Metric::OUTCOMES_REJECTED: return "outcomes_rejected";
        case Metric::GATE_EVALUATIONS: return "gate_evaluations";
        case Metric::GATE_PASSED: return "gate_passed";
        case Metric::GATE_FAILED: return "gate_failed";
        case Metric::GATE_MANUAL_REVIEW: return "gate_manual_review";
        case Metric::GATE_BYPASSED: return "gate_bypassed";
        case Metric::SLA_EVALUATIONS: return "sla_evaluations";
        case Metric::SLA_ON_TIME: return "sla_on_time";
        case Metric::SLA_AT_RISK: return "sla_at_risk";
        case Metric::SLA_BREACHED: return "sla_breached";
        case Metric::SLA_EXTENSIONS_GRANTED: return "sla_extensions_granted";
        case Metric::CIRCUIT_OPENED: return "circuit_opened";
        case Metric::CIRCUIT_HALF_OPENED: return "circuit_half_opened";
        case Metric::CIRCUIT_CLOSED: return "circuit_closed";
        case Metric::CIRCUIT_REJECTED_CALLS: return "circuit_rejected_calls";
        case Metric::ESCALATIONS_FIRED: return "escalations_fired";
        case Metric::ESCALATIONS_SUPPRESSED: return "escalations_suppressed";
        case Metric::NOTIFICATIONS_SENT: return "notifications_sent";
        case Metric::NOTIFICATIONS_FAILED: return "notifications_failed";
        case Metric::INCIDENTS_CREATED: return "incidents_created";
        case Metric::RECOVERY_ATTEMPTS: return "recovery_attempts";
        case Metric::RECOVERY_SUCCESS: return "recovery_success";
        case Metric::RECOVERY_PARTIAL: return "recovery_partial";
        case Metric::RECOVERY_FAILED: return "recovery_failed";
        case Metric::METRIC_COUNT: break;
    }
    return "unknown";
}

} // namespace OBF
