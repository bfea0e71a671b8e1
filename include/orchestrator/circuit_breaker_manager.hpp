// EN: Circuit Breaker Manager - per-service Closed/Open/HalfOpen state machines guarding external dependencies.
// FR: Circuit Breaker Manager - automates Closed/Open/HalfOpen par service protégeant les dépendances externes.

#pragma once

#include <atomic>
#include <cstdint>
#include <limits>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <vector>

#include "infrastructure/metrics/metrics_aggregator.hpp"
#include "infrastructure/system/error_recovery.hpp"
#include "orchestrator/collaborators.hpp"
#include "orchestrator/orchestration_types.hpp"

namespace OBF {
namespace Orchestrator {

class CircuitBreakerManager {
public:
    // EN: The probe is optional; without it probe() and probeAll() report nothing
    // FR: La sonde est optionnelle ; sans elle probe() et probeAll() ne rapportent rien
    CircuitBreakerManager(CircuitBreakerConfig defaults, MetricsAggregator& metrics,
                          std::shared_ptr<HealthProbe> probe = nullptr);

    CircuitBreakerManager(const CircuitBreakerManager&) = delete;
    CircuitBreakerManager& operator=(const CircuitBreakerManager&) = delete;

    // EN: Per-service override, applied to existing and future breakers of that service
    // FR: Surcharge par service, appliquée aux breakers existants et futurs de ce service
    void setServiceConfig(const std::string& service, const CircuitBreakerConfig& config);
    CircuitBreakerConfig configFor(const std::string& service) const;

    void registerService(const std::string& service);
    std::vector<std::string> services() const;

    // EN: Feed one health outcome into the breaker and return the resulting decision
    // FR: Injecte un résultat de santé dans le breaker et retourne la décision résultante
    CircuitDecision recordOutcome(const std::string& service, bool healthy, TimePoint now);

    // EN: Single fail-fast authority; admits at most half_open_max_calls probes while HalfOpen
    // FR: Autorité unique de fail-fast ; admet au plus half_open_max_calls sondes en HalfOpen
    bool allowRequest(const std::string& service, TimePoint now);

    // EN: Whether allowRequest would refuse right now, without taking a half-open admission
    // FR: Indique si allowRequest refuserait maintenant, sans consommer d'admission half-open
    bool rejectsRequest(const std::string& service, TimePoint now);

    std::optional<CircuitDecision> probe(const std::string& service, TimePoint now);
    std::vector<CircuitDecision> probeAll(TimePoint now);

    void reset(const std::string& service, TimePoint now);

    // EN: Lock-free reads through the breaker atomics
    // FR: Lectures sans verrou via les atomiques du breaker
    BreakerState getState(const std::string& service) const;
    std::optional<CircuitState> getCircuitState(const std::string& service) const;
    std::vector<CircuitState> getAllStates() const;
    size_t openCircuitCount() const;

    ProtectionReport protectionReport() const;

    // EN: Runs fn when the circuit admits the call, recording its outcome.
    //     Throws DependencyUnavailableError when the circuit rejects it; exceptions from fn are rethrown.
    // FR: Exécute fn si le circuit admet l'appel et enregistre son résultat.
    //     Lève DependencyUnavailableError si le circuit refuse ; les exceptions de fn sont relancées.
    template<typename F>
    auto call(const std::string& service, TimePoint now, F&& fn) -> decltype(fn()) {
        if (!allowRequest(service, now)) {
            throw DependencyUnavailableError(service, "Circuit open for service: " + service);
        }
        try {
            if constexpr (std::is_void_v<decltype(fn())>) {
                fn();
                recordOutcome(service, true, now);
            } else {
                auto result = fn();
                recordOutcome(service, true, now);
                return result;
            }
        } catch (const std::exception&) {
            recordOutcome(service, false, now);
            throw;
        }
    }

    static ProtectionLevel levelFor(size_t unhealthy, size_t total);
    static bool validateConfig(const CircuitBreakerConfig& config, std::vector<std::string>& errors);

private:
    static constexpr int64_t kNoTimestamp = std::numeric_limits<int64_t>::min();

    struct Breaker {
        std::mutex write_mutex;
        std::atomic<int> state{static_cast<int>(BreakerState::CLOSED)};
        std::atomic<int> failure_count{0};
        std::atomic<int64_t> last_failure_ms{kNoTimestamp};
        std::atomic<int64_t> last_change_ms{kNoTimestamp};
        std::atomic<uint64_t> total_calls{0};
        std::atomic<uint64_t> total_failures{0};
        int half_open_admitted = 0;      // EN: Guarded by write_mutex / FR: Protégé par write_mutex
        int half_open_successes = 0;     // EN: Guarded by write_mutex / FR: Protégé par write_mutex
        CircuitBreakerConfig config;     // EN: Guarded by write_mutex / FR: Protégé par write_mutex
    };

    Breaker& breakerFor(const std::string& service);
    const Breaker* findBreaker(const std::string& service) const;

    // EN: Caller holds breaker.write_mutex
    // FR: L'appelant détient breaker.write_mutex
    void transition(const std::string& service, Breaker& breaker, BreakerState next, TimePoint now);
    bool recoveryTimeoutElapsed(const Breaker& breaker, TimePoint now) const;
    bool halfOpenWindowExpired(const Breaker& breaker, TimePoint now) const;

    static CircuitState stateOf(const std::string& service, const Breaker& breaker);
    static int64_t toMillis(TimePoint tp);
    static TimePoint fromMillis(int64_t ms);

    CircuitBreakerConfig defaults_;
    MetricsAggregator& metrics_;
    std::shared_ptr<HealthProbe> probe_;

    mutable std::shared_mutex map_mutex_;
    std::unordered_map<std::string, std::unique_ptr<Breaker>> breakers_;
    std::unordered_map<std::string, CircuitBreakerConfig> overrides_;
};

} // namespace Orchestrator
} // namespace OBF
