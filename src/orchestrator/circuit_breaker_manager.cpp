// EN: Circuit Breaker Manager implementation.
// FR: Implémentation du Circuit Breaker Manager.

#include "orchestrator/circuit_breaker_manager.hpp"
#include "infrastructure/logging/logger.hpp"

#include <algorithm>
#include <map>
#include <stdexcept>

namespace OBF {
namespace Orchestrator {

CircuitBreakerManager::CircuitBreakerManager(CircuitBreakerConfig defaults, MetricsAggregator& metrics,
                                             std::shared_ptr<HealthProbe> probe)
    : defaults_(defaults), metrics_(metrics), probe_(std::move(probe)) {
    std::vector<std::string> errors;
    if (!validateConfig(defaults_, errors)) {
        throw std::invalid_argument("Invalid circuit breaker configuration: " + errors.front());
    }
}

void CircuitBreakerManager::setServiceConfig(const std::string& service, const CircuitBreakerConfig& config) {
    std::vector<std::string> errors;
    if (!validateConfig(config, errors)) {
        throw std::invalid_argument("Invalid circuit breaker configuration for " + service + ": " + errors.front());
    }

    Breaker* existing = nullptr;
    {
        std::unique_lock<std::shared_mutex> lock(map_mutex_);
        overrides_[service] = config;
        auto it = breakers_.find(service);
        if (it != breakers_.end()) {
            existing = it->second.get();
        }
    }
    if (existing) {
        std::lock_guard<std::mutex> lock(existing->write_mutex);
        existing->config = config;
    }
}

CircuitBreakerConfig CircuitBreakerManager::configFor(const std::string& service) const {
    std::shared_lock<std::shared_mutex> lock(map_mutex_);
    auto it = overrides_.find(service);
    return it != overrides_.end() ? it->second : defaults_;
}

void CircuitBreakerManager::registerService(const std::string& service) {
    breakerFor(service);
}

std::vector<std::string> CircuitBreakerManager::services() const {
    std::shared_lock<std::shared_mutex> lock(map_mutex_);
    std::vector<std::string> names;
    names.reserve(breakers_.size());
    for (const auto& [name, breaker] : breakers_) {
        names.push_back(name);
    }
    std::sort(names.begin(), names.end());
    return names;
}

CircuitBreakerManager::Breaker& CircuitBreakerManager::breakerFor(const std::string& service) {
    {
        std::shared_lock<std::shared_mutex> lock(map_mutex_);
        auto it = breakers_.find(service);
        if (it != breakers_.end()) {
            return *it->second;
        }
    }

    std::unique_lock<std::shared_mutex> lock(map_mutex_);
    auto it = breakers_.find(service);
    if (it != breakers_.end()) {
        return *it->second;
    }
    auto breaker = std::make_unique<Breaker>();
    auto override_it = overrides_.find(service);
    breaker->config = override_it != overrides_.end() ? override_it->second : defaults_;
    Breaker& ref = *breaker;
    breakers_.emplace(service, std::move(breaker));
    LOG_DEBUG("circuit", "Registered circuit breaker for service " + service);
    return ref;
}

const CircuitBreakerManager::Breaker* CircuitBreakerManager::findBreaker(const std::string& service) const {
    std::shared_lock<std::shared_mutex> lock(map_mutex_);
    auto it = breakers_.find(service);
    return it == breakers_.end() ? nullptr : it->second.get();
}

CircuitDecision CircuitBreakerManager::recordOutcome(const std::string& service, bool healthy, TimePoint now) {
    Breaker& breaker = breakerFor(service);
    std::lock_guard<std::mutex> lock(breaker.write_mutex);

    CircuitDecision decision;
    decision.service_name = service;
    decision.previous_state = static_cast<BreakerState>(breaker.state.load());

    breaker.total_calls.fetch_add(1);
    if (!healthy) {
        breaker.total_failures.fetch_add(1);
    }

    switch (decision.previous_state) {
        case BreakerState::CLOSED:
            if (healthy) {
                breaker.failure_count.store(0);
                break;
            }
            breaker.last_failure_ms.store(toMillis(now));
            if (breaker.failure_count.fetch_add(1) + 1 >= breaker.config.failure_threshold) {
                transition(service, breaker, BreakerState::OPEN, now);
                decision.recommended_action = CircuitAction::OPEN_CIRCUIT;
            }
            break;

        case BreakerState::OPEN:
            // EN: While open, outcomes never touch the failure count
            // FR: Circuit ouvert : les résultats ne modifient jamais le compteur d'échecs
            if (recoveryTimeoutElapsed(breaker, now)) {
                transition(service, breaker, BreakerState::HALF_OPEN, now);
                decision.recommended_action = CircuitAction::TRANSITION_HALF_OPEN;
            }
            break;

        case BreakerState::HALF_OPEN:
            if (!healthy) {
                breaker.failure_count.fetch_add(1);
                breaker.last_failure_ms.store(toMillis(now));
                transition(service, breaker, BreakerState::OPEN, now);
                decision.recommended_action = CircuitAction::REOPEN_CIRCUIT;
            } else if (++breaker.half_open_successes >= breaker.config.success_threshold) {
                breaker.failure_count.store(0);
                transition(service, breaker, BreakerState::CLOSED, now);
                decision.recommended_action = CircuitAction::CLOSE_CIRCUIT;
            }
            break;
    }

    decision.state = static_cast<BreakerState>(breaker.state.load());
    decision.failure_count = breaker.failure_count.load();
    return decision;
}

bool CircuitBreakerManager::allowRequest(const std::string& service, TimePoint now) {
    Breaker& breaker = breakerFor(service);
    std::lock_guard<std::mutex> lock(breaker.write_mutex);

    auto state = static_cast<BreakerState>(breaker.state.load());
    if (state == BreakerState::CLOSED) {
        return true;
    }

    if (state == BreakerState::OPEN) {
        if (!recoveryTimeoutElapsed(breaker, now)) {
            metrics_.increment(Metric::CIRCUIT_REJECTED_CALLS);
            return false;
        }
        transition(service, breaker, BreakerState::HALF_OPEN, now);
    }

    if (breaker.half_open_admitted >= breaker.config.half_open_max_calls) {
        // EN: Trial calls that never reported back for a whole recovery timeout are written off
        // FR: Les appels d'essai sans retour pendant tout un délai de récupération sont abandonnés
        if (!halfOpenWindowExpired(breaker, now)) {
            metrics_.increment(Metric::CIRCUIT_REJECTED_CALLS);
            return false;
        }
        LOG_DEBUG("circuit", "Half-open trial window of " + service + " renewed after " +
                  std::to_string(breaker.half_open_admitted) + " unreported call(s)");
        breaker.half_open_admitted = 0;
        breaker.last_change_ms.store(toMillis(now));
    }
    ++breaker.half_open_admitted;
    return true;
}

bool CircuitBreakerManager::rejectsRequest(const std::string& service, TimePoint now) {
    Breaker& breaker = breakerFor(service);
    std::lock_guard<std::mutex> lock(breaker.write_mutex);

    switch (static_cast<BreakerState>(breaker.state.load())) {
        case BreakerState::CLOSED:
            return false;
        case BreakerState::OPEN:
            return !recoveryTimeoutElapsed(breaker, now);
        case BreakerState::HALF_OPEN:
            return breaker.half_open_admitted >= breaker.config.half_open_max_calls &&
                   !halfOpenWindowExpired(breaker, now);
    }
    return false;
}

std::optional<CircuitDecision> CircuitBreakerManager::probe(const std::string& service, TimePoint now) {
    if (!probe_) {
        return std::nullopt;
    }

    HealthCheckResult result;
    try {
        result = probe_->check(service);
    } catch (const std::exception& e) {
        LOG_WARN("circuit", "Health probe for " + service + " threw: " + e.what());
        result.healthy = false;
        result.detail = e.what();
    }

    if (!result.healthy) {
        LOG_DEBUG("circuit", "Service " + service + " unhealthy: " + result.detail);
    }
    return recordOutcome(service, result.healthy, now);
}

std::vector<CircuitDecision> CircuitBreakerManager::probeAll(TimePoint now) {
    std::vector<CircuitDecision> decisions;
    if (!probe_) {
        return decisions;
    }
    for (const auto& service : services()) {
        if (auto decision = probe(service, now)) {
            decisions.push_back(*decision);
        }
    }
    return decisions;
}

void CircuitBreakerManager::reset(const std::string& service, TimePoint now) {
    Breaker& breaker = breakerFor(service);
    std::lock_guard<std::mutex> lock(breaker.write_mutex);
    breaker.failure_count.store(0);
    breaker.last_failure_ms.store(kNoTimestamp);
    if (static_cast<BreakerState>(breaker.state.load()) != BreakerState::CLOSED) {
        transition(service, breaker, BreakerState::CLOSED, now);
    }
    LOG_INFO("circuit", "Circuit for service " + service + " manually reset");
}

void CircuitBreakerManager::transition(const std::string& service, Breaker& breaker, BreakerState next,
                                       TimePoint now) {
    auto previous = static_cast<BreakerState>(breaker.state.exchange(static_cast<int>(next)));
    breaker.last_change_ms.store(toMillis(now));
    breaker.half_open_admitted = 0;
    breaker.half_open_successes = 0;

    switch (next) {
        case BreakerState::OPEN:
            metrics_.increment(Metric::CIRCUIT_OPENED);
            break;
        case BreakerState::HALF_OPEN:
            metrics_.increment(Metric::CIRCUIT_HALF_OPENED);
            break;
        case BreakerState::CLOSED:
            metrics_.increment(Metric::CIRCUIT_CLOSED);
            break;
    }

    std::unordered_map<std::string, std::string> meta{
        {"service", service},
        {"from", OrchestrationUtils::breakerStateToString(previous)},
        {"to", OrchestrationUtils::breakerStateToString(next)},
        {"failure_count", std::to_string(breaker.failure_count.load())}
    };
    if (next == BreakerState::OPEN) {
        LOG_WARN_META("circuit", "Circuit opened", meta);
    } else {
        LOG_INFO_META("circuit", "Circuit state changed", meta);
    }
}

bool CircuitBreakerManager::recoveryTimeoutElapsed(const Breaker& breaker, TimePoint now) const {
    int64_t reference = breaker.last_failure_ms.load();
    if (reference == kNoTimestamp) {
        reference = breaker.last_change_ms.load();
    }
    if (reference == kNoTimestamp) {
        return true;
    }
    return toMillis(now) - reference >= breaker.config.recovery_timeout.count();
}

bool CircuitBreakerManager::halfOpenWindowExpired(const Breaker& breaker, TimePoint now) const {
    const int64_t opened = breaker.last_change_ms.load();
    return opened == kNoTimestamp || toMillis(now) - opened >= breaker.config.recovery_timeout.count();
}

BreakerState CircuitBreakerManager::getState(const std::string& service) const {
    const Breaker* breaker = findBreaker(service);
    return breaker ? static_cast<BreakerState>(breaker->state.load()) : BreakerState::CLOSED;
}

std::optional<CircuitState> CircuitBreakerManager::getCircuitState(const std::string& service) const {
    const Breaker* breaker = findBreaker(service);
    if (!breaker) {
        return std::nullopt;
    }
    return stateOf(service, *breaker);
}

std::vector<CircuitState> CircuitBreakerManager::getAllStates() const {
    std::shared_lock<std::shared_mutex> lock(map_mutex_);
    std::vector<CircuitState> states;
    states.reserve(breakers_.size());
    for (const auto& [name, breaker] : breakers_) {
        states.push_back(stateOf(name, *breaker));
    }
    std::sort(states.begin(), states.end(),
              [](const CircuitState& a, const CircuitState& b) { return a.service_name < b.service_name; });
    return states;
}

size_t CircuitBreakerManager::openCircuitCount() const {
    std::shared_lock<std::shared_mutex> lock(map_mutex_);
    return static_cast<size_t>(std::count_if(breakers_.begin(), breakers_.end(), [](const auto& entry) {
        return static_cast<BreakerState>(entry.second->state.load()) == BreakerState::OPEN;
    }));
}

ProtectionReport CircuitBreakerManager::protectionReport() const {
    ProtectionReport report;
    for (const auto& state : getAllStates()) {
        ++report.total_services;
        switch (state.state) {
            case BreakerState::CLOSED:
                ++report.closed;
                break;
            case BreakerState::OPEN:
                ++report.open;
                report.unhealthy_services.push_back(state.service_name);
                break;
            case BreakerState::HALF_OPEN:
                ++report.half_open;
                report.unhealthy_services.push_back(state.service_name);
                break;
        }
    }
    report.level = levelFor(report.open + report.half_open, report.total_services);
    return report;
}

ProtectionLevel CircuitBreakerManager::levelFor(size_t unhealthy, size_t total) {
    if (total == 0 || unhealthy == 0) {
        return ProtectionLevel::NONE;
    }
    double ratio = static_cast<double>(unhealthy) / static_cast<double>(total);
    if (ratio >= 0.7) {
        return ProtectionLevel::HIGH;
    }
    if (ratio >= 0.4) {
        return ProtectionLevel::MEDIUM;
    }
    return ProtectionLevel::LOW;
}

bool CircuitBreakerManager::validateConfig(const CircuitBreakerConfig& config, std::vector<std::string>& errors) {
    const size_t before = errors.size();
    if (config.failure_threshold < 1) {
        errors.push_back("circuit_breaker.failure_threshold must be at least 1");
    }
    if (config.recovery_timeout.count() <= 0) {
        errors.push_back("circuit_breaker.recovery_timeout_ms must be positive");
    }
    if (config.half_open_max_calls < 1) {
        errors.push_back("circuit_breaker.half_open_max_calls must be at least 1");
    }
    if (config.success_threshold < 1) {
        errors.push_back("circuit_breaker.success_threshold must be at least 1");
    }
    return errors.size() == before;
}

CircuitState CircuitBreakerManager::stateOf(const std::string& service, const Breaker& breaker) {
    CircuitState state;
    state.service_name = service;
    state.state = static_cast<BreakerState>(breaker.state.load());
    state.failure_count = breaker.failure_count.load();
    int64_t last_failure = breaker.last_failure_ms.load();
    if (last_failure != kNoTimestamp) {
        state.last_failure_at = fromMillis(last_failure);
    }
    int64_t last_change = breaker.last_change_ms.load();
    if (last_change != kNoTimestamp) {
        state.last_state_change = fromMillis(last_change);
    }
    state.total_calls = breaker.total_calls.load();
    state.total_failures = breaker.total_failures.load();
    return state;
}

int64_t CircuitBreakerManager::toMillis(TimePoint tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

TimePoint CircuitBreakerManager::fromMillis(int64_t ms) {
    return TimePoint(std::chrono::duration_cast<std::chrono::system_clock::duration>(std::chrono::milliseconds(ms)));
}

} // namespace Orchestrator
} // namespace OBF
