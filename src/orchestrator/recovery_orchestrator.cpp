// EN: Recovery Orchestrator implementation.
// FR: Implémentation du Recovery Orchestrator.

#include "orchestrator/recovery_orchestrator.hpp"
#include "infrastructure/logging/logger.hpp"

#include <algorithm>
#include <map>
#include <unordered_map>
#include <stdexcept>

namespace OBF {
namespace Orchestrator {

RecoveryOrchestrator::RecoveryOrchestrator(RecoveryConfig config,
                                           MetricsAggregator& metrics,
                                           std::shared_ptr<const Clock> clock,
                                           std::shared_ptr<CircuitBreakerManager> circuits,
                                           std::shared_ptr<EscalationRuleEngine> escalations)
    : config_(config),
      metrics_(metrics),
      clock_(std::move(clock)),
      circuits_(std::move(circuits)),
      escalations_(std::move(escalations)) {
    if (!clock_) {
        throw std::invalid_argument("RecoveryOrchestrator requires a clock");
    }
    std::vector<std::string> errors;
    if (!validateConfig(config_, errors)) {
        throw std::invalid_argument("Invalid recovery configuration: " + errors.front());
    }
}

ErrorCategory RecoveryOrchestrator::categorize(const FailureContext& context) {
    if (context.category) {
        return *context.category;
    }
    return ErrorRecoveryUtils::classifyMessages(context.errors);
}

RecoveryStrategy RecoveryOrchestrator::selectStrategy(const FailureContext& context, ErrorCategory category) const {
    if (category == ErrorCategory::UNRECOVERABLE) {
        return RecoveryStrategy::ESCALATE_TO_HUMAN;
    }
    if (category == ErrorCategory::TRANSIENT && context.error_count < config_.immediate_retry_error_limit) {
        return RecoveryStrategy::IMMEDIATE_RETRY;
    }
    if (category == ErrorCategory::RESOURCE_EXHAUSTION) {
        return RecoveryStrategy::EXPONENTIAL_BACKOFF_RETRY;
    }
    if (category == ErrorCategory::STATE_INCONSISTENCY) {
        return RecoveryStrategy::STATE_RESTORATION;
    }
    if (context.last_completed_stage && !context.last_completed_stage->empty()) {
        return RecoveryStrategy::WORKFLOW_RESUMPTION;
    }
    return RecoveryStrategy::ESCALATE_TO_HUMAN;
}

RecoveryResult RecoveryOrchestrator::recover(const FailureContext& context,
                                             RecoveryActionExecutor& executor,
                                             const CancellationToken& token,
                                             const std::string& subject_id) {
    const TimePoint started = clock_->now();

    RecoveryResult result;
    result.session_id = context.session_id;
    result.stage_id = context.stage_id;
    result.category = categorize(context);
    result.strategy = selectStrategy(context, result.category);

    std::unordered_map<std::string, std::string> meta{
        {"session_id", context.session_id},
        {"stage", context.stage_id},
        {"category", ErrorRecoveryUtils::categoryToString(result.category)},
        {"strategy", OrchestrationUtils::strategyToString(result.strategy)}
    };
    LOG_INFO_META("recovery", "Recovery started", meta);

    switch (result.strategy) {
        case RecoveryStrategy::IMMEDIATE_RETRY:
        case RecoveryStrategy::EXPONENTIAL_BACKOFF_RETRY:
            runRetries(context, executor, token, result.strategy, result.category, result.attempts);
            break;

        case RecoveryStrategy::STATE_RESTORATION:
            if (token.isCancelled()) {
                result.attempts.push_back(cancelledAttempt(RecoveryActionType::STATE_RESTORE, result.strategy, 1));
            } else {
                result.attempts.push_back(runAction(RecoveryActionType::STATE_RESTORE, result.strategy, 1,
                                                    [&]() { return executor.restoreStage(context); }));
            }
            break;

        case RecoveryStrategy::WORKFLOW_RESUMPTION:
            runWorkflowResumption(context, executor, token, result.attempts);
            break;

        case RecoveryStrategy::ESCALATE_TO_HUMAN:
            break;
    }

    result.status = deriveStatus(result.attempts, result.can_resume);
    result.total_duration_seconds = std::chrono::duration<double>(clock_->now() - started).count();

    switch (result.status) {
        case RecoveryStatus::SUCCESS:
            result.message = "Recovered stage " + context.stage_id + " with " +
                             OrchestrationUtils::strategyToString(result.strategy);
            metrics_.increment(Metric::RECOVERY_SUCCESS);
            break;
        case RecoveryStatus::PARTIAL:
            result.message = "Stage " + context.stage_id + " can resume with reduced guarantees";
            metrics_.increment(Metric::RECOVERY_PARTIAL);
            break;
        case RecoveryStatus::CANCELLED:
            result.message = "Recovery cancelled";
            break;
        case RecoveryStatus::FAILED:
            result.message = result.strategy == RecoveryStrategy::ESCALATE_TO_HUMAN
                ? "No automatic strategy applies, human intervention required"
                : "Recovery exhausted without success";
            metrics_.increment(Metric::RECOVERY_FAILED);
            break;
    }

    if (result.status == RecoveryStatus::FAILED && escalations_) {
        EscalationLevel level = result.category == ErrorCategory::UNRECOVERABLE
            ? EscalationLevel::EMERGENCY
            : EscalationLevel::CRITICAL;
        std::string reason = "Recovery of stage " + context.stage_id + " failed (" +
                             ErrorRecoveryUtils::categoryToString(result.category) + ", " +
                             OrchestrationUtils::strategyToString(result.strategy) + ")";
        auto event = escalations_->escalateManually(context.session_id, subject_id, context.stage_id,
                                                    level, reason, clock_->now());
        result.escalation_event_id = event.event_id;
    }

    result.recommendations = recommendationsFor(result, config_.slow_recovery_seconds);

    meta["status"] = OrchestrationUtils::recoveryStatusToString(result.status);
    meta["attempts"] = std::to_string(result.attempts.size());
    if (result.status == RecoveryStatus::FAILED) {
        LOG_ERROR_META("recovery", result.message, meta);
    } else {
        LOG_INFO_META("recovery", result.message, meta);
    }

    {
        std::lock_guard<std::mutex> lock(history_mutex_);
        history_[context.session_id].push_back(result);
    }
    return result;
}

void RecoveryOrchestrator::runRetries(const FailureContext& context, RecoveryActionExecutor& executor,
                                      const CancellationToken& token, RecoveryStrategy strategy,
                                      ErrorCategory category, std::vector<RecoveryAttempt>& attempts) {
    RetryConfig retry;
    retry.max_attempts = static_cast<size_t>(config_.max_retry_attempts);
    if (strategy == RecoveryStrategy::IMMEDIATE_RETRY) {
        retry.initial_delay = config_.immediate_delay;
        retry.max_delay = config_.immediate_delay;
        retry.backoff_multiplier = 1.0;
        retry.enable_jitter = false;
    } else {
        retry.initial_delay = config_.backoff_base;
        retry.max_delay = config_.backoff_cap;
        retry.backoff_multiplier = config_.backoff_factor;
        retry.enable_jitter = config_.backoff_jitter;
    }
    RetryContext retry_context("recover:" + context.session_id + ":" + context.stage_id, retry);

    for (int attempt = 1; attempt <= config_.max_retry_attempts; ++attempt) {
        if (attempt > 1) {
            auto delay = retry_context.getNextDelay();
            if (delay.count() > 0) {
                LOG_DEBUG("recovery", "Waiting " + std::to_string(delay.count()) + "ms before attempt " +
                          std::to_string(attempt) + " on stage " + context.stage_id);
            }
            if (!token.waitFor(delay)) {
                attempts.push_back(cancelledAttempt(RecoveryActionType::RETRY, strategy, attempt));
                return;
            }
        }
        if (token.isCancelled()) {
            attempts.push_back(cancelledAttempt(RecoveryActionType::RETRY, strategy, attempt));
            return;
        }

        // EN: Checked without admission; the redispatch goes through allowRequest itself
        // FR: Vérifié sans admission ; le renvoi passe lui-même par allowRequest
        if (context.failing_service && circuits_ &&
            circuits_->rejectsRequest(*context.failing_service, clock_->now())) {
            RecoveryAttempt rejected;
            rejected.action = RecoveryActionType::RETRY;
            rejected.strategy = strategy;
            rejected.attempt_number = attempt;
            rejected.status = AttemptStatus::REJECTED;
            rejected.message = "Circuit open for " + *context.failing_service;
            rejected.started_at = clock_->now();
            metrics_.increment(Metric::RECOVERY_ATTEMPTS);
            attempts.push_back(rejected);
            return;
        }

        RecoveryAttempt outcome = runAction(RecoveryActionType::RETRY, strategy, attempt,
                                            [&]() { return executor.retryStage(context, attempt); });
        attempts.push_back(outcome);
        if (outcome.status == AttemptStatus::SUCCEEDED || outcome.status == AttemptStatus::DEGRADED) {
            return;
        }
        retry_context.recordAttempt(category, outcome.message);
    }
}

void RecoveryOrchestrator::runWorkflowResumption(const FailureContext& context, RecoveryActionExecutor& executor,
                                                 const CancellationToken& token,
                                                 std::vector<RecoveryAttempt>& attempts) {
    if (context.failing_service && circuits_ &&
        circuits_->getState(*context.failing_service) != BreakerState::CLOSED) {
        if (token.isCancelled()) {
            attempts.push_back(cancelledAttempt(RecoveryActionType::CIRCUIT_RESET,
                                                RecoveryStrategy::WORKFLOW_RESUMPTION, 1));
            return;
        }
        const std::string service = *context.failing_service;
        attempts.push_back(runAction(RecoveryActionType::CIRCUIT_RESET, RecoveryStrategy::WORKFLOW_RESUMPTION, 1,
                                     [&]() { return executor.resetCircuit(service); }));
    }

    if (token.isCancelled()) {
        attempts.push_back(cancelledAttempt(RecoveryActionType::WORKFLOW_RESUME,
                                            RecoveryStrategy::WORKFLOW_RESUMPTION, 1));
        return;
    }
    attempts.push_back(runAction(RecoveryActionType::WORKFLOW_RESUME, RecoveryStrategy::WORKFLOW_RESUMPTION, 1,
                                 [&]() { return executor.resumeWorkflow(context); }));
}

template<typename Action>
RecoveryAttempt RecoveryOrchestrator::runAction(RecoveryActionType type, RecoveryStrategy strategy,
                                                int attempt_number, Action&& action) {
    RecoveryAttempt attempt;
    attempt.action = type;
    attempt.strategy = strategy;
    attempt.attempt_number = attempt_number;
    attempt.started_at = clock_->now();

    try {
        ActionOutcome outcome = action();
        attempt.message = outcome.message;
        attempt.result_payload = outcome.payload;
        if (!outcome.success) {
            attempt.status = AttemptStatus::FAILED;
        } else {
            attempt.status = outcome.degraded ? AttemptStatus::DEGRADED : AttemptStatus::SUCCEEDED;
        }
    } catch (const std::exception& e) {
        attempt.status = AttemptStatus::FAILED;
        attempt.message = e.what();
        LOG_WARN("recovery", "Recovery action " + OrchestrationUtils::recoveryActionToString(type) +
                 " threw: " + e.what());
    }

    attempt.duration_seconds = std::chrono::duration<double>(clock_->now() - attempt.started_at).count();
    metrics_.increment(Metric::RECOVERY_ATTEMPTS);
    return attempt;
}

RecoveryAttempt RecoveryOrchestrator::cancelledAttempt(RecoveryActionType type, RecoveryStrategy strategy,
                                                       int attempt_number) const {
    RecoveryAttempt attempt;
    attempt.action = type;
    attempt.strategy = strategy;
    attempt.attempt_number = attempt_number;
    attempt.status = AttemptStatus::CANCELLED;
    attempt.message = "Cancelled before execution";
    attempt.started_at = clock_->now();
    return attempt;
}

RecoveryStatus RecoveryOrchestrator::deriveStatus(const std::vector<RecoveryAttempt>& attempts, bool& can_resume) {
    can_resume = false;
    if (attempts.empty()) {
        return RecoveryStatus::FAILED;
    }

    const auto& last = attempts.back();
    if (last.status == AttemptStatus::CANCELLED) {
        return RecoveryStatus::CANCELLED;
    }
    can_resume = last.status == AttemptStatus::SUCCEEDED || last.status == AttemptStatus::DEGRADED;

    // EN: Last outcome of each action type decides; one degraded or failed type means not fully recovered
    // FR: Le dernier résultat de chaque type d'action décide ; un type dégradé ou en échec empêche le succès complet
    std::map<RecoveryActionType, AttemptStatus> last_by_type;
    for (const auto& attempt : attempts) {
        last_by_type[attempt.action] = attempt.status;
    }
    bool all_succeeded = std::all_of(last_by_type.begin(), last_by_type.end(), [](const auto& entry) {
        return entry.second == AttemptStatus::SUCCEEDED;
    });

    if (all_succeeded) {
        return RecoveryStatus::SUCCESS;
    }
    return can_resume ? RecoveryStatus::PARTIAL : RecoveryStatus::FAILED;
}

std::vector<std::string> RecoveryOrchestrator::recommendationsFor(const RecoveryResult& result,
                                                                  double slow_recovery_seconds) {
    std::vector<std::string> recommendations;

    if (!result.attempts.empty()) {
        auto successes = std::count_if(result.attempts.begin(), result.attempts.end(), [](const RecoveryAttempt& a) {
            return a.status == AttemptStatus::SUCCEEDED || a.status == AttemptStatus::DEGRADED;
        });
        double success_rate = static_cast<double>(successes) / static_cast<double>(result.attempts.size());
        if (success_rate < 0.3) {
            recommendations.push_back("Low recovery success rate - consider an alternative strategy");
        }
    }
    if (result.strategy == RecoveryStrategy::IMMEDIATE_RETRY && result.attempts.size() > 1) {
        recommendations.push_back("Consider exponential backoff for better success rate");
    }
    if (result.total_duration_seconds > slow_recovery_seconds) {
        recommendations.push_back("High recovery duration - optimize the operation or raise its timeout");
    }
    if (std::any_of(result.attempts.begin(), result.attempts.end(),
                    [](const RecoveryAttempt& a) { return a.status == AttemptStatus::REJECTED; })) {
        recommendations.push_back("Dependency circuit is open - wait for its recovery timeout before retrying");
    }

    switch (result.status) {
        case RecoveryStatus::SUCCESS:
            recommendations.push_back("Document the successful recovery strategy");
            break;
        case RecoveryStatus::PARTIAL:
            recommendations.push_back("Investigate root causes of the partial recovery");
            break;
        case RecoveryStatus::FAILED:
            recommendations.push_back("Conduct a post-mortem of the recovery failure");
            break;
        case RecoveryStatus::CANCELLED:
            break;
    }
    return recommendations;
}

std::vector<RecoveryResult> RecoveryOrchestrator::history(const std::string& session_id) const {
    std::lock_guard<std::mutex> lock(history_mutex_);
    auto it = history_.find(session_id);
    return it == history_.end() ? std::vector<RecoveryResult>{} : it->second;
}

void RecoveryOrchestrator::clearSession(const std::string& session_id) {
    std::lock_guard<std::mutex> lock(history_mutex_);
    history_.erase(session_id);
}

bool RecoveryOrchestrator::validateConfig(const RecoveryConfig& config, std::vector<std::string>& errors) {
    const size_t before = errors.size();
    if (config.max_retry_attempts < 1) {
        errors.push_back("recovery.max_retry_attempts must be at least 1");
    }
    if (config.immediate_retry_error_limit < 1) {
        errors.push_back("recovery.immediate_retry_error_limit must be at least 1");
    }
    if (config.immediate_delay.count() < 0) {
        errors.push_back("recovery.immediate_delay_ms cannot be negative");
    }
    if (config.backoff_base.count() <= 0) {
        errors.push_back("recovery.backoff_base_ms must be positive");
    }
    if (config.backoff_factor < 1.0) {
        errors.push_back("recovery.backoff_factor must be at least 1.0");
    }
    if (config.backoff_cap < config.backoff_base) {
        errors.push_back("recovery.backoff_cap_ms must not be lower than backoff_base_ms");
    }
    return errors.size() == before;
}

} // namespace Orchestrator
} // namespace OBF
