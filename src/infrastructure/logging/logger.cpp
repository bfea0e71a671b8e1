// EN: Implementation of the Logger class. NDJSON lines are built with nlohmann::json so messages are escaped.
// FR: Implémentation de la classe Logger. Les lignes NDJSON sont construites avec nlohmann::json pour échapper les messages.

#include "infrastructure/logging/logger.hpp"

#include <algorithm>
#include <iomanip>
#include <iostream>
#include <random>
#include <sstream>
#include <thread>

#include <nlohmann/json.hpp>

namespace OBF {

namespace {
thread_local std::string tls_correlation_id;
}

Logger& Logger::getInstance() {
    static Logger instance;
    return instance;
}

// EN: Destructor ensures all logs are flushed.
// FR: Le destructeur assure que tous les logs sont vidés.
Logger::~Logger() {
    flush();
}

void Logger::setLogLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    current_level_ = level;
}

LogLevel Logger::getLogLevel() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return current_level_;
}

// EN: Set output file and disable console output.
// FR: Définit le fichier de sortie et désactive la sortie console.
void Logger::setOutputFile(const std::string& filename) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (log_file_) {
        log_file_->close();
    }
    log_file_ = std::make_unique<std::ofstream>(filename, std::ios::app);
    if (!log_file_->is_open()) {
        std::cerr << "Failed to open log file: " << filename << std::endl;
        log_file_.reset();
    } else {
        console_output_ = false;
    }
}

void Logger::setConsoleOutput(bool enabled) {
    std::lock_guard<std::mutex> lock(mutex_);
    console_output_ = enabled;
}

void Logger::setCorrelationId(const std::string& correlation_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    correlation_id_ = correlation_id;
}

void Logger::addGlobalMetadata(const std::string& key, const std::string& value) {
    std::lock_guard<std::mutex> lock(mutex_);
    global_metadata_[key] = value;
}

size_t Logger::addSink(Sink sink) {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t handle = next_sink_handle_++;
    sinks_.emplace_back(handle, std::move(sink));
    return handle;
}

void Logger::removeSink(size_t handle) {
    std::lock_guard<std::mutex> lock(mutex_);
    sinks_.erase(std::remove_if(sinks_.begin(), sinks_.end(),
                                [handle](const auto& entry) { return entry.first == handle; }),
                 sinks_.end());
}

void Logger::log(LogLevel level, const std::string& module, const std::string& message) {
    log(level, module, message, {});
}

void Logger::log(LogLevel level, const std::string& module, const std::string& message,
                 const std::unordered_map<std::string, std::string>& metadata) {
    LogEntry entry;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (level < current_level_) {
            return;
        }

        // EN: A scoped (per-task) correlation ID wins over the process-wide one.
        // FR: Un ID de corrélation de portée (par tâche) l'emporte sur l'ID global.
        entry.correlation_id = tls_correlation_id.empty() ? correlation_id_ : tls_correlation_id;

        entry.metadata = metadata;
        for (const auto& [key, value] : global_metadata_) {
            entry.metadata.emplace(key, value);
        }
    }

    entry.timestamp = std::chrono::system_clock::now();
    entry.level = level;
    entry.message = message;
    entry.module = module;
    entry.thread_id = getThreadId();

    writeEntry(entry);
}

void Logger::debug(const std::string& module, const std::string& message) {
    log(LogLevel::DEBUG, module, message);
}

void Logger::info(const std::string& module, const std::string& message) {
    log(LogLevel::INFO, module, message);
}

void Logger::warn(const std::string& module, const std::string& message) {
    log(LogLevel::WARN, module, message);
}

void Logger::error(const std::string& module, const std::string& message) {
    log(LogLevel::ERROR, module, message);
}

void Logger::debug(const std::string& module, const std::string& message,
                   const std::unordered_map<std::string, std::string>& metadata) {
    log(LogLevel::DEBUG, module, message, metadata);
}

void Logger::info(const std::string& module, const std::string& message,
                  const std::unordered_map<std::string, std::string>& metadata) {
    log(LogLevel::INFO, module, message, metadata);
}

void Logger::warn(const std::string& module, const std::string& message,
                  const std::unordered_map<std::string, std::string>& metadata) {
    log(LogLevel::WARN, module, message, metadata);
}

void Logger::error(const std::string& module, const std::string& message,
                   const std::unordered_map<std::string, std::string>& metadata) {
    log(LogLevel::ERROR, module, message, metadata);
}

void Logger::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (log_file_) {
        log_file_->flush();
    }
    if (console_output_) {
        std::cout.flush();
    }
}

std::string Logger::generateCorrelationId() {
    std::random_device rd;
    std::mt19937 gen(rd());
    std::uniform_int_distribution<> dis(0, 15);

    std::stringstream ss;
    ss << std::hex;
    for (int i = 0; i < 32; ++i) {
        if (i == 8 || i == 12 || i == 16 || i == 20) {
            ss << "-";
        }
        ss << dis(gen);
    }
    return ss.str();
}

// EN: Write the line to file/console under the lock, then fan out to sinks outside it.
// FR: Écrit la ligne vers fichier/console sous verrou, puis diffuse aux sinks hors verrou.
void Logger::writeEntry(const LogEntry& entry) {
    std::vector<Sink> sinks;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (log_file_ || console_output_) {
            std::string ndjson = formatAsNDJSON(entry);
            if (log_file_ && log_file_->is_open()) {
                *log_file_ << ndjson << '\n';
            }
            if (console_output_) {
                std::cout << ndjson << '\n';
            }
        }
        sinks.reserve(sinks_.size());
        for (const auto& [handle, sink] : sinks_) {
            sinks.push_back(sink);
        }
    }

    for (const auto& sink : sinks) {
        sink(entry);
    }
}

std::string Logger::formatAsNDJSON(const LogEntry& entry) {
    nlohmann::json line;
    line["timestamp"] = timestampToISO8601(entry.timestamp);
    line["level"] = levelToString(entry.level);
    line["message"] = entry.message;
    line["module"] = entry.module;
    line["thread_id"] = entry.thread_id;
    if (!entry.correlation_id.empty()) {
        line["correlation_id"] = entry.correlation_id;
    }
    for (const auto& [key, value] : entry.metadata) {
        // EN: Metadata never overwrites the fixed fields.
        // FR: Les métadonnées n'écrasent jamais les champs fixes.
        if (!line.contains(key)) {
            line[key] = value;
        }
    }
    return line.dump();
}

std::string Logger::levelToString(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO:  return "INFO";
        case LogLevel::WARN:  return "WARN";
        case LogLevel::ERROR: return "ERROR";
        default:              return "UNKNOWN";
    }
}

LogLevel Logger::levelFromString(const std::string& level) {
    std::string upper = level;
    std::transform(upper.begin(), upper.end(), upper.begin(), ::toupper);
    if (upper == "DEBUG") return LogLevel::DEBUG;
    if (upper == "WARN" || upper == "WARNING") return LogLevel::WARN;
    if (upper == "ERROR") return LogLevel::ERROR;
    return LogLevel::INFO;
}

std::string Logger::timestampToISO8601(const std::chrono::system_clock::time_point& tp) {
    auto time_t = std::chrono::system_clock::to_time_t(tp);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        tp.time_since_epoch()) % 1000;

    std::tm utc{};
    gmtime_r(&time_t, &utc);

    std::ostringstream ss;
    ss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S");
    ss << "." << std::setfill('0') << std::setw(3) << ms.count() << "Z";
    return ss.str();
}

std::string Logger::getThreadId() {
    std::ostringstream ss;
    ss << std::this_thread::get_id();
    return ss.str();
}

// EN: ScopedCorrelation keeps the previous ID so nested scopes restore correctly.
// FR: ScopedCorrelation garde l'ID précédent pour que les portées imbriquées se restaurent correctement.
ScopedCorrelation::ScopedCorrelation(const std::string& correlation_id)
    : previous_(tls_correlation_id) {
    tls_correlation_id = correlation_id;
}

ScopedCorrelation::~ScopedCorrelation() {
    tls_correlation_id = previous_;
}

const std::string& ScopedCorrelation::current() {
    return tls_correlation_id;
}

} // namespace OBF
