// EN: Error recovery primitives for OnboardFlow - backoff computation, cancellable waits, classification
// FR: Primitives de récupération d'erreurs pour OnboardFlow - calcul du backoff, attentes annulables, classification

#include "infrastructure/system/error_recovery.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>

namespace OBF {

RetryContext::RetryContext(const std::string& operation_name, const RetryConfig& config)
    : config_(config), operation_name_(operation_name), jitter_generator_(std::random_device{}()) {
    if (config_.max_attempts == 0) {
        throw std::invalid_argument("RetryConfig.max_attempts must be at least 1");
    }
    if (config_.backoff_multiplier < 1.0) {
        throw std::invalid_argument("RetryConfig.backoff_multiplier must be >= 1.0");
    }
}

void RetryContext::recordAttempt(ErrorCategory category, const std::string& error_message) {
    RetryAttempt attempt;
    attempt.attempt_number = ++current_attempt_;
    attempt.timestamp = std::chrono::system_clock::now();
    attempt.error_message = error_message;
    attempt.category = category;
    attempt.delay = getNextDelay();

    attempts_.push_back(attempt);
}

bool RetryContext::canRetry() const {
    return current_attempt_ < config_.max_attempts;
}

std::chrono::milliseconds RetryContext::getNextDelay() const {
    if (current_attempt_ == 0) {
        return std::chrono::milliseconds{0};
    }

    double delay_ms = config_.initial_delay.count() *
                      std::pow(config_.backoff_multiplier, static_cast<double>(current_attempt_ - 1));
    delay_ms = std::min(delay_ms, static_cast<double>(config_.max_delay.count()));

    auto base_delay = std::chrono::milliseconds(static_cast<long long>(delay_ms));
    if (config_.enable_jitter) {
        return calculateDelayWithJitter(base_delay);
    }
    return base_delay;
}

std::chrono::milliseconds RetryContext::calculateDelayWithJitter(std::chrono::milliseconds base_delay) const {
    if (config_.jitter_factor <= 0.0) {
        return base_delay;
    }

    double jitter_range = base_delay.count() * config_.jitter_factor;
    std::uniform_real_distribution<double> jitter_dist(-jitter_range, jitter_range);
    double jittered_delay = std::max(0.0, base_delay.count() + jitter_dist(jitter_generator_));

    return std::chrono::milliseconds(static_cast<long long>(jittered_delay));
}

void RetryContext::reset() {
    current_attempt_ = 0;
    attempts_.clear();
}

void CancellationToken::cancel() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        cancelled_.store(true);
    }
    condition_.notify_all();
}

bool CancellationToken::waitFor(std::chrono::milliseconds duration) const {
    std::unique_lock<std::mutex> lock(mutex_);
    bool cancelled = condition_.wait_for(lock, duration, [this] { return cancelled_.load(); });
    return !cancelled;
}

namespace ErrorRecoveryUtils {

namespace {

bool containsAny(const std::string& haystack, std::initializer_list<const char*> needles) {
    for (const char* needle : needles) {
        if (haystack.find(needle) != std::string::npos) {
            return true;
        }
    }
    return false;
}

// EN: Higher rank means more severe; used to pick a dominant category
// FR: Un rang plus élevé signifie plus grave ; sert à choisir la catégorie dominante
int severityRank(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::TRANSIENT: return 0;
        case ErrorCategory::RESOURCE_EXHAUSTION: return 1;
        case ErrorCategory::QUALITY_VIOLATION: return 2;
        case ErrorCategory::DEPENDENCY_UNAVAILABLE: return 3;
        case ErrorCategory::STATE_INCONSISTENCY: return 4;
        case ErrorCategory::UNRECOVERABLE: return 5;
    }
    return 0;
}

} // namespace

ErrorCategory classifyMessage(const std::string& message) {
    std::string lowered = message;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (containsAny(lowered, {"unrecoverable", "fatal", "permission denied", "not authorized"})) {
        return ErrorCategory::UNRECOVERABLE;
    }
    if (containsAny(lowered, {"inconsistent", "corrupt", "checksum", "invariant", "state mismatch"})) {
        return ErrorCategory::STATE_INCONSISTENCY;
    }
    if (containsAny(lowered, {"circuit open", "connection refused", "service unavailable", "unreachable",
                              "dependency down", "503"})) {
        return ErrorCategory::DEPENDENCY_UNAVAILABLE;
    }
    if (containsAny(lowered, {"rate limit", "429", "too many requests", "quota", "out of memory",
                              "resource exhausted", "overload"})) {
        return ErrorCategory::RESOURCE_EXHAUSTION;
    }
    if (containsAny(lowered, {"quality", "validation failed", "missing field", "threshold"})) {
        return ErrorCategory::QUALITY_VIOLATION;
    }
    return ErrorCategory::TRANSIENT;
}

ErrorCategory classifyException(const std::exception& error) {
    if (const auto* orchestration = dynamic_cast<const OrchestrationError*>(&error)) {
        return orchestration->category();
    }
    return classifyMessage(error.what());
}

ErrorCategory classifyMessages(const std::vector<std::string>& messages) {
    ErrorCategory dominant = ErrorCategory::TRANSIENT;
    for (const auto& message : messages) {
        ErrorCategory category = classifyMessage(message);
        if (severityRank(category) > severityRank(dominant)) {
            dominant = category;
        }
    }
    return dominant;
}

bool isRetryable(ErrorCategory category) {
    return category == ErrorCategory::TRANSIENT || category == ErrorCategory::RESOURCE_EXHAUSTION;
}

std::string categoryToString(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::TRANSIENT: return "transient";
        case ErrorCategory::RESOURCE_EXHAUSTION: return "resource_exhaustion";
        case ErrorCategory::QUALITY_VIOLATION: return "quality_violation";
        case ErrorCategory::DEPENDENCY_UNAVAILABLE: return "dependency_unavailable";
        case ErrorCategory::STATE_INCONSISTENCY: return "state_inconsistency";
        case ErrorCategory::UNRECOVERABLE: return "unrecoverable";
    }
    return "unknown";
}

ErrorCategory categoryFromString(const std::string& value) {
    if (value == "resource_exhaustion") return ErrorCategory::RESOURCE_EXHAUSTION;
    if (value == "quality_violation") return ErrorCategory::QUALITY_VIOLATION;
    if (value == "dependency_unavailable") return ErrorCategory::DEPENDENCY_UNAVAILABLE;
    if (value == "state_inconsistency") return ErrorCategory::STATE_INCONSISTENCY;
    if (value == "unrecoverable") return ErrorCategory::UNRECOVERABLE;
    if (value == "transient") return ErrorCategory::TRANSIENT;
    throw std::invalid_argument("Unknown error category: " + value);
}

RetryConfig createImmediateRetryConfig() {
    RetryConfig config;
    config.max_attempts = 3;
    config.initial_delay = std::chrono::milliseconds(100);
    config.max_delay = std::chrono::milliseconds(100);
    config.backoff_multiplier = 1.0;
    config.enable_jitter = false;
    return config;
}

RetryConfig createBackoffRetryConfig() {
    RetryConfig config;
    config.max_attempts = 3;
    config.initial_delay = std::chrono::seconds(5);
    config.max_delay = std::chrono::seconds(300);
    config.backoff_multiplier = 2.0;
    config.jitter_factor = 0.1;
    config.enable_jitter = true;
    return config;
}

} // namespace ErrorRecoveryUtils

} // namespace OBF
