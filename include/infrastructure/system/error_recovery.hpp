// EN: Error taxonomy, retry backoff and cancellable waits for OnboardFlow recovery.
// FR: Taxonomie d'erreurs, backoff de retry et attentes annulables pour la récupération OnboardFlow.

#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <exception>
#include <mutex>
#include <random>
#include <stdexcept>
#include <string>
#include <vector>

namespace OBF {

// EN: Failure categories driving recovery strategy selection
// FR: Catégories d'échec guidant le choix de la stratégie de récupération
enum class ErrorCategory {
    TRANSIENT,               // EN: Retryable, e.g. timeout / FR: Récupérable, ex. timeout
    RESOURCE_EXHAUSTION,     // EN: Rate limit, quota, overload / FR: Limite de débit, quota, surcharge
    QUALITY_VIOLATION,       // EN: Payload fails a quality gate / FR: Le payload échoue un quality gate
    DEPENDENCY_UNAVAILABLE,  // EN: External service down / FR: Service externe indisponible
    STATE_INCONSISTENCY,     // EN: Registry data contradicts invariants / FR: Données du registre incohérentes
    UNRECOVERABLE            // EN: Nothing automatic can fix it / FR: Rien d'automatique ne peut corriger
};

// EN: Base class of every orchestration error, carries its category
// FR: Classe de base de toutes les erreurs d'orchestration, porte sa catégorie
class OrchestrationError : public std::runtime_error {
public:
    OrchestrationError(ErrorCategory category, const std::string& message)
        : std::runtime_error(message), category_(category) {}

    ErrorCategory category() const { return category_; }

private:
    ErrorCategory category_;
};

class TransientError : public OrchestrationError {
public:
    explicit TransientError(const std::string& message)
        : OrchestrationError(ErrorCategory::TRANSIENT, message) {}
};

class ResourceExhaustedError : public OrchestrationError {
public:
    explicit ResourceExhaustedError(const std::string& message)
        : OrchestrationError(ErrorCategory::RESOURCE_EXHAUSTION, message) {}
};

// EN: Thrown when a caller tries to use a dependency whose circuit is open
// FR: Lancée quand un appelant utilise une dépendance dont le circuit est ouvert
class DependencyUnavailableError : public OrchestrationError {
public:
    DependencyUnavailableError(const std::string& service, const std::string& message)
        : OrchestrationError(ErrorCategory::DEPENDENCY_UNAVAILABLE, message), service_(service) {}

    const std::string& service() const { return service_; }

private:
    std::string service_;
};

class StateInconsistencyError : public OrchestrationError {
public:
    explicit StateInconsistencyError(const std::string& message)
        : OrchestrationError(ErrorCategory::STATE_INCONSISTENCY, message) {}
};

class UnrecoverableError : public OrchestrationError {
public:
    explicit UnrecoverableError(const std::string& message)
        : OrchestrationError(ErrorCategory::UNRECOVERABLE, message) {}
};

// EN: Configuration rejected by validation; keeps the full error list
// FR: Configuration rejetée par la validation ; garde la liste complète des erreurs
class ConfigurationError : public std::runtime_error {
public:
    explicit ConfigurationError(const std::vector<std::string>& errors)
        : std::runtime_error(buildMessage(errors)), errors_(errors) {}

    const std::vector<std::string>& errors() const { return errors_; }

private:
    static std::string buildMessage(const std::vector<std::string>& errors) {
        std::string message = "Invalid configuration";
        for (const auto& error : errors) {
            message += "; " + error;
        }
        return message;
    }

    std::vector<std::string> errors_;
};

// EN: Exception for retry exhaustion
// FR: Exception pour l'épuisement des retries
class RetryExhaustedException : public std::runtime_error {
public:
    RetryExhaustedException(const std::string& operation, size_t attempts)
        : std::runtime_error("Retry exhausted for operation '" + operation + "' after " +
                             std::to_string(attempts) + " attempts") {}
};

// EN: Retry strategy configuration
// FR: Configuration de la stratégie de retry
struct RetryConfig {
    size_t max_attempts{3};                          // EN: Maximum number of attempts / FR: Nombre maximum de tentatives
    std::chrono::milliseconds initial_delay{5000};   // EN: Delay before the second attempt / FR: Délai avant la deuxième tentative
    std::chrono::milliseconds max_delay{300000};     // EN: Cap between attempts / FR: Plafond entre tentatives
    double backoff_multiplier{2.0};                  // EN: Exponential factor / FR: Facteur exponentiel
    double jitter_factor{0.1};                       // EN: Jitter ratio (0-1) / FR: Ratio de jitter (0-1)
    bool enable_jitter{true};
};

// EN: One failed attempt, kept for delay computation and reporting
// FR: Une tentative échouée, gardée pour le calcul du délai et le rapport
struct RetryAttempt {
    size_t attempt_number{0};
    std::chrono::milliseconds delay{0};
    std::chrono::system_clock::time_point timestamp;
    std::string error_message;
    ErrorCategory category{ErrorCategory::TRANSIENT};
};

// EN: Retry context for tracking one operation's attempts and backoff
// FR: Contexte de retry pour suivre les tentatives et le backoff d'une opération
class RetryContext {
public:
    explicit RetryContext(const std::string& operation_name, const RetryConfig& config = {});

    // EN: Record a failed attempt
    // FR: Enregistre une tentative échouée
    void recordAttempt(ErrorCategory category, const std::string& error_message);

    size_t getCurrentAttempt() const { return current_attempt_; }

    bool canRetry() const;

    // EN: Delay to wait before the next attempt: initial * multiplier^(n-1), capped, optionally jittered
    // FR: Délai avant la prochaine tentative : initial * multiplicateur^(n-1), plafonné, avec jitter optionnel
    std::chrono::milliseconds getNextDelay() const;

    const std::string& getOperationName() const { return operation_name_; }
    const std::vector<RetryAttempt>& getAttempts() const { return attempts_; }
    const RetryConfig& getConfig() const { return config_; }

    void reset();

private:
    std::chrono::milliseconds calculateDelayWithJitter(std::chrono::milliseconds base_delay) const;

    RetryConfig config_;
    std::string operation_name_;
    size_t current_attempt_{0};
    std::vector<RetryAttempt> attempts_;
    mutable std::mt19937 jitter_generator_;
};

// EN: Cancellation signal shared by a session task and its waits; cancel() wakes every waiter
// FR: Signal d'annulation partagé par une tâche de session et ses attentes ; cancel() réveille chaque attente
class CancellationToken {
public:
    CancellationToken() = default;

    CancellationToken(const CancellationToken&) = delete;
    CancellationToken& operator=(const CancellationToken&) = delete;

    void cancel();
    bool isCancelled() const { return cancelled_.load(); }

    // EN: Wait for the duration; returns false as soon as the token is cancelled
    // FR: Attend la durée ; retourne false dès que le jeton est annulé
    bool waitFor(std::chrono::milliseconds duration) const;

private:
    std::atomic<bool> cancelled_{false};
    mutable std::mutex mutex_;
    mutable std::condition_variable condition_;
};

// EN: Utility functions for error classification
// FR: Fonctions utilitaires pour la classification d'erreurs
namespace ErrorRecoveryUtils {

    // EN: Classify a free-form error message by keyword
    // FR: Classifie un message d'erreur libre par mot-clé
    ErrorCategory classifyMessage(const std::string& message);

    // EN: Classify an exception; orchestration errors carry their own category
    // FR: Classifie une exception ; les erreurs d'orchestration portent leur catégorie
    ErrorCategory classifyException(const std::exception& error);

    // EN: Dominant category of a list of messages (most severe wins)
    // FR: Catégorie dominante d'une liste de messages (la plus grave l'emporte)
    ErrorCategory classifyMessages(const std::vector<std::string>& messages);

    bool isRetryable(ErrorCategory category);

    std::string categoryToString(ErrorCategory category);
    ErrorCategory categoryFromString(const std::string& value);

    // EN: Near-immediate retries for transient failures
    // FR: Retries quasi immédiats pour les échecs transitoires
    RetryConfig createImmediateRetryConfig();

    // EN: Exponential backoff for resource exhaustion
    // FR: Backoff exponentiel pour l'épuisement de ressources
    RetryConfig createBackoffRetryConfig();

} // namespace ErrorRecoveryUtils

} // namespace OBF
