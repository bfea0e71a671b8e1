// EN: Structured NDJSON logger for OnboardFlow - correlation IDs follow the session task that logs.
// FR: Logger NDJSON structuré pour OnboardFlow - les IDs de corrélation suivent la tâche de session.

#pragma once

#include <chrono>
#include <fstream>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace OBF {

// EN: Log levels enumeration.
// FR: Énumération des niveaux de log.
enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARN = 2,
    ERROR = 3
};

// EN: Thread-safe singleton logger with NDJSON output and correlation IDs.
// FR: Logger singleton thread-safe avec sortie NDJSON et IDs de corrélation.
class Logger {
public:
    // EN: Structure representing a log entry.
    // FR: Structure représentant une entrée de log.
    struct LogEntry {
        std::chrono::system_clock::time_point timestamp;
        LogLevel level = LogLevel::INFO;
        std::string message;
        std::string correlation_id;
        std::string module;
        std::string thread_id;
        std::unordered_map<std::string, std::string> metadata;
    };

    // EN: Sink receiving every entry that passes the level filter.
    // FR: Sink recevant chaque entrée qui passe le filtre de niveau.
    using Sink = std::function<void(const LogEntry&)>;

    static Logger& getInstance();

    void setLogLevel(LogLevel level);
    LogLevel getLogLevel() const;

    // EN: Set output file for logging (disables console output).
    // FR: Définit le fichier de sortie (désactive la sortie console).
    void setOutputFile(const std::string& filename);

    // EN: Enable or disable console output; tests turn it off.
    // FR: Active ou désactive la sortie console ; les tests la coupent.
    void setConsoleOutput(bool enabled);

    // EN: Process-wide correlation ID, used when no scoped ID is active on the calling thread.
    // FR: ID de corrélation global, utilisé si aucun ID de portée n'est actif sur le thread appelant.
    void setCorrelationId(const std::string& correlation_id);

    void addGlobalMetadata(const std::string& key, const std::string& value);

    // EN: Register an additional sink, returns its handle for removal.
    // FR: Enregistre un sink supplémentaire, retourne son handle pour suppression.
    size_t addSink(Sink sink);
    void removeSink(size_t handle);

    void log(LogLevel level, const std::string& module, const std::string& message);
    void log(LogLevel level, const std::string& module, const std::string& message,
             const std::unordered_map<std::string, std::string>& metadata);

    void debug(const std::string& module, const std::string& message);
    void info(const std::string& module, const std::string& message);
    void warn(const std::string& module, const std::string& message);
    void error(const std::string& module, const std::string& message);

    void debug(const std::string& module, const std::string& message,
               const std::unordered_map<std::string, std::string>& metadata);
    void info(const std::string& module, const std::string& message,
              const std::unordered_map<std::string, std::string>& metadata);
    void warn(const std::string& module, const std::string& message,
              const std::unordered_map<std::string, std::string>& metadata);
    void error(const std::string& module, const std::string& message,
               const std::unordered_map<std::string, std::string>& metadata);

    void flush();

    // EN: Generate a new correlation ID (UUID-like format).
    // FR: Génère un nouvel ID de corrélation (format UUID).
    std::string generateCorrelationId();

    // EN: Format an entry as one NDJSON line (exposed for sinks and tests).
    // FR: Formate une entrée en une ligne NDJSON (exposé pour les sinks et les tests).
    static std::string formatAsNDJSON(const LogEntry& entry);

    static std::string levelToString(LogLevel level);
    static LogLevel levelFromString(const std::string& level);

private:
    Logger() = default;
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void writeEntry(const LogEntry& entry);
    static std::string timestampToISO8601(const std::chrono::system_clock::time_point& tp);
    static std::string getThreadId();

    LogLevel current_level_ = LogLevel::INFO;
    std::string correlation_id_;
    std::unordered_map<std::string, std::string> global_metadata_;
    std::unique_ptr<std::ofstream> log_file_;
    std::vector<std::pair<size_t, Sink>> sinks_;
    size_t next_sink_handle_ = 1;
    mutable std::mutex mutex_;
    bool console_output_ = true;
};

// EN: RAII guard binding a correlation ID to the current thread (one per session task).
// FR: Garde RAII liant un ID de corrélation au thread courant (une par tâche de session).
class ScopedCorrelation {
public:
    explicit ScopedCorrelation(const std::string& correlation_id);
    ~ScopedCorrelation();

    ScopedCorrelation(const ScopedCorrelation&) = delete;
    ScopedCorrelation& operator=(const ScopedCorrelation&) = delete;

    // EN: Correlation ID active on this thread, empty when none.
    // FR: ID de corrélation actif sur ce thread, vide si aucun.
    static const std::string& current();

private:
    std::string previous_;
};

#define LOG_DEBUG(module, message) OBF::Logger::getInstance().debug(module, message)
#define LOG_INFO(module, message) OBF::Logger::getInstance().info(module, message)
#define LOG_WARN(module, message) OBF::Logger::getInstance().warn(module, message)
#define LOG_ERROR(module, message) OBF::Logger::getInstance().error(module, message)

#define LOG_DEBUG_META(module, message, metadata) OBF::Logger::getInstance().debug(module, message, metadata)
#define LOG_INFO_META(module, message, metadata) OBF::Logger::getInstance().info(module, message, metadata)
#define LOG_WARN_META(module, message, metadata) OBF::Logger::getInstance().warn(module, message, metadata)
#define LOG_ERROR_META(module, message, metadata) OBF::Logger::getInstance().error(module, message, metadata)

} // namespace OBF
