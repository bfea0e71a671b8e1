// EN: Unit tests for the Circuit Breaker Manager - thresholds, recovery timeout, half-open probing and reports.
// FR: Tests unitaires du Circuit Breaker Manager - seuils, délai de récupération, sondes half-open et rapports.

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include <memory>
#include <stdexcept>
#include <thread>
#include <vector>

#include "orchestrator/circuit_breaker_manager.hpp"
#include "test_helpers.hpp"

using namespace OBF;
using namespace OBF::Orchestrator;
using namespace std::chrono_literals;
using ::testing::Return;
using ::testing::Throw;

// EN: Test fixture with default thresholds (5 failures, 60s recovery, 3 half-open calls)
// FR: Fixture de test avec les seuils par défaut (5 échecs, 60s de récupération, 3 appels half-open)
class CircuitBreakerManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        manager_ = std::make_unique<CircuitBreakerManager>(CircuitBreakerConfig{}, metrics_);
    }

    void failTimes(const std::string& service, int count) {
        for (int i = 0; i < count; ++i) {
            manager_->recordOutcome(service, false, clock_.now());
        }
    }

    Testing::QuietLogger quiet_;
    Testing::ManualClock clock_;
    MetricsAggregator metrics_;
    std::unique_ptr<CircuitBreakerManager> manager_;
};

// EN: The fifth consecutive failure opens the circuit; later failures change nothing
// FR: Le cinquième échec consécutif ouvre le circuit ; les échecs suivants ne changent rien
TEST_F(CircuitBreakerManagerTest, OpensAfterThreshold) {
    failTimes("e_signature", 4);
    EXPECT_EQ(manager_->getState("e_signature"), BreakerState::CLOSED);

    auto opened = manager_->recordOutcome("e_signature", false, clock_.now());
    EXPECT_EQ(opened.previous_state, BreakerState::CLOSED);
    EXPECT_EQ(opened.state, BreakerState::OPEN);
    EXPECT_EQ(opened.recommended_action, CircuitAction::OPEN_CIRCUIT);
    EXPECT_EQ(opened.failure_count, 5);

    clock_.advance(10s);
    auto ignored = manager_->recordOutcome("e_signature", false, clock_.now());
    EXPECT_EQ(ignored.recommended_action, CircuitAction::NONE);
    EXPECT_EQ(ignored.failure_count, 5);
    EXPECT_EQ(metrics_.get(Metric::CIRCUIT_OPENED), 1u);
    EXPECT_EQ(manager_->openCircuitCount(), 1u);
}

// EN: A success while closed clears the consecutive failure count
// FR: Un succès en état fermé remet à zéro le compteur d'échecs consécutifs
TEST_F(CircuitBreakerManagerTest, SuccessClearsFailures) {
    failTimes("calendar_service", 4);
    manager_->recordOutcome("calendar_service", true, clock_.now());
    failTimes("calendar_service", 4);
    EXPECT_EQ(manager_->getState("calendar_service"), BreakerState::CLOSED);

    auto state = manager_->getCircuitState("calendar_service");
    ASSERT_TRUE(state.has_value());
    EXPECT_EQ(state->failure_count, 4);
    EXPECT_EQ(state->total_calls, 9u);
    EXPECT_EQ(state->total_failures, 8u);
}

// EN: An open circuit fails fast until the recovery timeout, then admits a limited number of probes
// FR: Un circuit ouvert échoue vite jusqu'au délai de récupération, puis admet un nombre limité de sondes
TEST_F(CircuitBreakerManagerTest, FailFastThenHalfOpen) {
    failTimes("hr_system", 5);
    EXPECT_FALSE(manager_->allowRequest("hr_system", clock_.now()));
    clock_.advance(59s);
    EXPECT_FALSE(manager_->allowRequest("hr_system", clock_.now()));
    EXPECT_EQ(metrics_.get(Metric::CIRCUIT_REJECTED_CALLS), 2u);

    clock_.advance(1s);
    EXPECT_TRUE(manager_->allowRequest("hr_system", clock_.now()));
    EXPECT_EQ(manager_->getState("hr_system"), BreakerState::HALF_OPEN);
    EXPECT_TRUE(manager_->allowRequest("hr_system", clock_.now()));
    EXPECT_TRUE(manager_->allowRequest("hr_system", clock_.now()));
    EXPECT_FALSE(manager_->allowRequest("hr_system", clock_.now()));
}

// EN: Half-open admissions that never report back are renewed after a recovery timeout
// FR: Les admissions half-open sans retour sont renouvelées après un délai de récupération
TEST_F(CircuitBreakerManagerTest, StaleHalfOpenAdmissionsRenew) {
    failTimes("hr_system", 5);
    clock_.advance(60s);
    for (int i = 0; i < 3; ++i) {
        ASSERT_TRUE(manager_->allowRequest("hr_system", clock_.now()));
    }
    EXPECT_FALSE(manager_->allowRequest("hr_system", clock_.now()));

    clock_.advance(59s);
    EXPECT_FALSE(manager_->allowRequest("hr_system", clock_.now()));

    clock_.advance(1s);
    EXPECT_TRUE(manager_->allowRequest("hr_system", clock_.now()));
    EXPECT_EQ(manager_->getState("hr_system"), BreakerState::HALF_OPEN);

    manager_->recordOutcome("hr_system", false, clock_.now());
    EXPECT_EQ(manager_->getState("hr_system"), BreakerState::OPEN);
}

// EN: Asking whether a call would be rejected never consumes a half-open admission
// FR: Demander si un appel serait refusé ne consomme jamais d'admission half-open
TEST_F(CircuitBreakerManagerTest, RejectsRequestDoesNotAdmit) {
    EXPECT_FALSE(manager_->rejectsRequest("database", clock_.now()));

    failTimes("database", 5);
    EXPECT_TRUE(manager_->rejectsRequest("database", clock_.now()));
    EXPECT_EQ(metrics_.get(Metric::CIRCUIT_REJECTED_CALLS), 0u);

    clock_.advance(60s);
    for (int i = 0; i < 10; ++i) {
        EXPECT_FALSE(manager_->rejectsRequest("database", clock_.now()));
    }
    EXPECT_EQ(manager_->getState("database"), BreakerState::OPEN);

    ASSERT_TRUE(manager_->allowRequest("database", clock_.now()));
    ASSERT_TRUE(manager_->allowRequest("database", clock_.now()));
    EXPECT_FALSE(manager_->rejectsRequest("database", clock_.now()));
    ASSERT_TRUE(manager_->allowRequest("database", clock_.now()));
    EXPECT_TRUE(manager_->rejectsRequest("database", clock_.now()));
}

// EN: A failed half-open probe reopens the circuit; a successful one closes it
// FR: Une sonde half-open en échec rouvre le circuit ; une sonde réussie le ferme
TEST_F(CircuitBreakerManagerTest, HalfOpenOutcomes) {
    failTimes("database", 5);
    clock_.advance(60s);
    ASSERT_TRUE(manager_->allowRequest("database", clock_.now()));

    auto reopened = manager_->recordOutcome("database", false, clock_.now());
    EXPECT_EQ(reopened.previous_state, BreakerState::HALF_OPEN);
    EXPECT_EQ(reopened.recommended_action, CircuitAction::REOPEN_CIRCUIT);
    EXPECT_EQ(manager_->getState("database"), BreakerState::OPEN);
    EXPECT_FALSE(manager_->allowRequest("database", clock_.now()));

    clock_.advance(60s);
    auto half_open = manager_->recordOutcome("database", true, clock_.now());
    EXPECT_EQ(half_open.recommended_action, CircuitAction::TRANSITION_HALF_OPEN);
    auto closed = manager_->recordOutcome("database", true, clock_.now());
    EXPECT_EQ(closed.recommended_action, CircuitAction::CLOSE_CIRCUIT);
    EXPECT_EQ(closed.state, BreakerState::CLOSED);
    EXPECT_EQ(closed.failure_count, 0);
    EXPECT_EQ(metrics_.get(Metric::CIRCUIT_OPENED), 2u);
    EXPECT_EQ(metrics_.get(Metric::CIRCUIT_CLOSED), 1u);
}

// EN: Per-service overrides apply to existing breakers only for that service
// FR: Les surcharges par service ne s'appliquent qu'aux breakers de ce service
TEST_F(CircuitBreakerManagerTest, ServiceOverride) {
    manager_->registerService("document_service");
    CircuitBreakerConfig strict;
    strict.failure_threshold = 2;
    strict.recovery_timeout = 5000ms;
    manager_->setServiceConfig("document_service", strict);

    failTimes("document_service", 2);
    failTimes("e_signature", 2);
    EXPECT_EQ(manager_->getState("document_service"), BreakerState::OPEN);
    EXPECT_EQ(manager_->getState("e_signature"), BreakerState::CLOSED);
    EXPECT_EQ(manager_->configFor("document_service").failure_threshold, 2);
    EXPECT_EQ(manager_->configFor("e_signature").failure_threshold, 5);

    clock_.advance(5s);
    EXPECT_TRUE(manager_->allowRequest("document_service", clock_.now()));

    CircuitBreakerConfig broken;
    broken.failure_threshold = 0;
    EXPECT_THROW(manager_->setServiceConfig("document_service", broken), std::invalid_argument);
}

// EN: Incoherent defaults are refused
// FR: Les valeurs par défaut incohérentes sont refusées
TEST_F(CircuitBreakerManagerTest, InvalidDefaults) {
    CircuitBreakerConfig config;
    config.recovery_timeout = 0ms;
    config.half_open_max_calls = 0;

    std::vector<std::string> errors;
    EXPECT_FALSE(CircuitBreakerManager::validateConfig(config, errors));
    EXPECT_EQ(errors.size(), 2u);
    EXPECT_THROW(CircuitBreakerManager(config, metrics_), std::invalid_argument);
}

// EN: call() records outcomes and refuses with DependencyUnavailableError when open
// FR: call() enregistre les résultats et refuse avec DependencyUnavailableError quand ouvert
TEST_F(CircuitBreakerManagerTest, GuardedCall) {
    int value = manager_->call("asset_management", clock_.now(), [] { return 42; });
    EXPECT_EQ(value, 42);

    for (int i = 0; i < 5; ++i) {
        EXPECT_THROW(manager_->call("asset_management", clock_.now(),
                                    []() -> int { throw std::runtime_error("connection refused"); }),
                     std::runtime_error);
    }
    EXPECT_EQ(manager_->getState("asset_management"), BreakerState::OPEN);

    try {
        manager_->call("asset_management", clock_.now(), [] {});
        FAIL() << "expected DependencyUnavailableError";
    } catch (const DependencyUnavailableError& e) {
        EXPECT_EQ(e.service(), "asset_management");
        EXPECT_EQ(e.category(), ErrorCategory::DEPENDENCY_UNAVAILABLE);
    }
}

// EN: Health probes feed every registered breaker; a throwing probe counts as unhealthy
// FR: Les sondes de santé alimentent chaque breaker enregistré ; une sonde qui lève compte comme malsaine
TEST_F(CircuitBreakerManagerTest, HealthProbing) {
    EXPECT_FALSE(manager_->probe("hr_system", clock_.now()).has_value());

    auto probe = std::make_shared<Testing::MockHealthProbe>();
    CircuitBreakerManager manager(CircuitBreakerConfig{}, metrics_, probe);
    manager.registerService("active_directory");
    manager.registerService("hr_system");

    HealthCheckResult healthy;
    healthy.healthy = true;
    EXPECT_CALL(*probe, check("hr_system")).WillRepeatedly(Return(healthy));
    EXPECT_CALL(*probe, check("active_directory")).WillRepeatedly(Throw(std::runtime_error("LDAP bind timeout")));

    for (int round = 0; round < 5; ++round) {
        auto decisions = manager.probeAll(clock_.now());
        ASSERT_EQ(decisions.size(), 2u);
        EXPECT_EQ(decisions[0].service_name, "active_directory");
    }
    EXPECT_EQ(manager.getState("active_directory"), BreakerState::OPEN);
    EXPECT_EQ(manager.getState("hr_system"), BreakerState::CLOSED);
}

// EN: The protection level follows the share of unhealthy services
// FR: Le niveau de protection suit la part de services malsains
TEST_F(CircuitBreakerManagerTest, ProtectionReport) {
    EXPECT_EQ(CircuitBreakerManager::levelFor(0, 0), ProtectionLevel::NONE);
    EXPECT_EQ(CircuitBreakerManager::levelFor(1, 4), ProtectionLevel::LOW);
    EXPECT_EQ(CircuitBreakerManager::levelFor(2, 4), ProtectionLevel::MEDIUM);
    EXPECT_EQ(CircuitBreakerManager::levelFor(3, 4), ProtectionLevel::HIGH);

    manager_->registerService("calendar_service");
    manager_->registerService("database");
    failTimes("e_signature", 5);

    auto report = manager_->protectionReport();
    EXPECT_EQ(report.total_services, 3u);
    EXPECT_EQ(report.open, 1u);
    EXPECT_EQ(report.closed, 2u);
    EXPECT_EQ(report.unhealthy_services, std::vector<std::string>{"e_signature"});
    EXPECT_EQ(report.level, ProtectionLevel::LOW);

    std::vector<std::string> expected = {"calendar_service", "database", "e_signature"};
    EXPECT_EQ(manager_->services(), expected);
}

// EN: A manual reset closes the circuit and clears the failures
// FR: Un reset manuel ferme le circuit et efface les échecs
TEST_F(CircuitBreakerManagerTest, ManualReset) {
    failTimes("e_signature", 5);
    manager_->reset("e_signature", clock_.now());
    EXPECT_EQ(manager_->getState("e_signature"), BreakerState::CLOSED);
    EXPECT_EQ(manager_->getCircuitState("e_signature")->failure_count, 0);
    EXPECT_TRUE(manager_->allowRequest("e_signature", clock_.now()));
}

// EN: Concurrent failures open the circuit exactly once and lose no call
// FR: Des échecs concurrents ouvrent le circuit une seule fois sans perdre d'appel
TEST_F(CircuitBreakerManagerTest, ConcurrentFailures) {
    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([this] { failTimes("database", 100); });
    }
    for (auto& thread : threads) {
        thread.join();
    }
    EXPECT_EQ(manager_->getState("database"), BreakerState::OPEN);
    EXPECT_EQ(manager_->getCircuitState("database")->total_calls, 800u);
    EXPECT_EQ(metrics_.get(Metric::CIRCUIT_OPENED), 1u);
}
