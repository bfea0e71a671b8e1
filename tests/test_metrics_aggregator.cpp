// EN: Unit tests for the MetricsAggregator counters and gauges.
// FR: Tests unitaires des compteurs et jauges du MetricsAggregator.

#include <gtest/gtest.h>

#include <set>
#include <thread>
#include <vector>

#include "infrastructure/metrics/metrics_aggregator.hpp"

using namespace OBF;

class MetricsAggregatorTest : public ::testing::Test {
protected:
    MetricsAggregator metrics_;
};

// EN: Counters start at zero and accumulate increments
// FR: Les compteurs démarrent à zéro et accumulent les incréments
TEST_F(MetricsAggregatorTest, IncrementAccumulates) {
    EXPECT_EQ(metrics_.get(Metric::GATE_EVALUATIONS), 0u);
    metrics_.increment(Metric::GATE_EVALUATIONS);
    metrics_.increment(Metric::GATE_EVALUATIONS, 4);
    EXPECT_EQ(metrics_.get(Metric::GATE_EVALUATIONS), 5u);
    EXPECT_EQ(metrics_.get(Metric::GATE_PASSED), 0u);
}

// EN: Gauges never go below zero
// FR: Les jauges ne descendent jamais sous zéro
TEST_F(MetricsAggregatorTest, DecrementSaturatesAtZero) {
    metrics_.increment(Metric::ACTIVE_SESSIONS, 2);
    metrics_.decrement(Metric::ACTIVE_SESSIONS);
    EXPECT_EQ(metrics_.get(Metric::ACTIVE_SESSIONS), 1u);
    metrics_.decrement(Metric::ACTIVE_SESSIONS, 5);
    EXPECT_EQ(metrics_.get(Metric::ACTIVE_SESSIONS), 0u);
}

// EN: Concurrent increments are never lost
// FR: Les incréments concurrents ne sont jamais perdus
TEST_F(MetricsAggregatorTest, ConcurrentIncrements) {
    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([this] {
            for (int i = 0; i < 1000; ++i) {
                metrics_.increment(Metric::OUTCOMES_ACCEPTED);
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }
    EXPECT_EQ(metrics_.get(Metric::OUTCOMES_ACCEPTED), 8000u);
}

// EN: The JSON export names every counter once with snake_case keys
// FR: L'export JSON nomme chaque compteur une fois avec des clés snake_case
TEST_F(MetricsAggregatorTest, JsonExportNamesEveryCounter) {
    metrics_.increment(Metric::CIRCUIT_OPENED, 3);
    auto json = metrics_.toJson();

    EXPECT_EQ(json.size(), kMetricCount);
    EXPECT_EQ(json["circuit_opened"], 3u);
    EXPECT_EQ(json["sessions_started"], 0u);

    std::set<std::string> names;
    for (size_t i = 0; i < kMetricCount; ++i) {
        names.insert(MetricsAggregator::metricName(static_cast<Metric>(i)));
    }
    EXPECT_EQ(names.size(), kMetricCount);
    EXPECT_EQ(names.count("unknown"), 0u);
}

// EN: A snapshot is a stable copy and reset clears every counter
// FR: Un snapshot est une copie stable et reset efface chaque compteur
TEST_F(MetricsAggregatorTest, SnapshotAndReset) {
    metrics_.increment(Metric::RECOVERY_ATTEMPTS, 2);
    MetricsSnapshot snapshot = metrics_.snapshot();
    metrics_.increment(Metric::RECOVERY_ATTEMPTS);
    EXPECT_EQ(snapshot.get(Metric::RECOVERY_ATTEMPTS), 2u);

    metrics_.reset();
    EXPECT_EQ(metrics_.get(Metric::RECOVERY_ATTEMPTS), 0u);
}
