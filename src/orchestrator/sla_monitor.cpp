// EN: SLA Monitor implementation - status bands, breach prediction, extensions and adaptive targets.
// FR: Implémentation du SLA Monitor - bandes de statut, prédiction de violation, extensions et cibles adaptatives.

#include "orchestrator/sla_monitor.hpp"
#include "infrastructure/logging/logger.hpp"

#include <algorithm>
#include <numeric>
#include <stdexcept>

namespace OBF {
namespace Orchestrator {

namespace {

TimePoint addMinutes(TimePoint tp, double minutes) {
    return tp + std::chrono::duration_cast<std::chrono::system_clock::duration>(
                    std::chrono::duration<double, std::ratio<60>>(minutes));
}

double wallMinutes(TimePoint started_at, TimePoint now) {
    if (now <= started_at) {
        return 0.0;
    }
    return std::chrono::duration<double, std::ratio<60>>(now - started_at).count();
}

} // namespace

SlaMonitor::SlaMonitor(std::vector<SlaConfig> configs, BusinessCalendar calendar, MetricsAggregator& metrics)
    : calendar_(std::move(calendar)), metrics_(metrics) {
    for (auto& config : configs) {
        std::string stage_id = config.stage_id;
        if (!configs_.emplace(stage_id, std::move(config)).second) {
            throw std::invalid_argument("Duplicate SLA configuration for stage: " + stage_id);
        }
    }
}

bool SlaMonitor::hasConfig(const std::string& stage_id) const {
    return configs_.count(stage_id) > 0;
}

std::optional<SlaConfig> SlaMonitor::config(const std::string& stage_id) const {
    auto it = configs_.find(stage_id);
    if (it == configs_.end()) {
        return std::nullopt;
    }
    return adaptive(it->second);
}

SlaResult SlaMonitor::evaluate(const std::string& stage_id, TimePoint started_at, TimePoint now,
                               const SlaSignal& signal) const {
    auto effective = config(stage_id);
    if (!effective) {
        throw std::invalid_argument("No SLA configured for stage: " + stage_id);
    }

    SlaResult result = classify(*effective, elapsedMinutes(*effective, started_at, now), now, signal);

    metrics_.increment(Metric::SLA_EVALUATIONS);
    switch (result.status) {
        case SlaStatus::ON_TIME:
        case SlaStatus::EXTENDED:
            metrics_.increment(Metric::SLA_ON_TIME);
            break;
        case SlaStatus::AT_RISK:
            metrics_.increment(Metric::SLA_AT_RISK);
            break;
        case SlaStatus::BREACHED:
            metrics_.increment(Metric::SLA_BREACHED);
            break;
    }
    return result;
}

SlaResult SlaMonitor::evaluateWithConfig(const SlaConfig& config, TimePoint started_at, TimePoint now,
                                         const SlaSignal& signal, const BusinessCalendar& calendar) {
    return classify(config, minutesOn(calendar, config, started_at, now), now, signal);
}

double SlaMonitor::elapsedMinutes(const SlaConfig& config, TimePoint started_at, TimePoint now) const {
    return minutesOn(calendar_, config, started_at, now);
}

double SlaMonitor::minutesOn(const BusinessCalendar& calendar, const SlaConfig& config, TimePoint started_at,
                             TimePoint now) {
    if (config.business_hours_only) {
        return calendar.businessMinutesBetween(started_at, now);
    }
    return wallMinutes(started_at, now);
}

SlaResult SlaMonitor::classify(const SlaConfig& base, double elapsed_minutes, TimePoint now,
                               const SlaSignal& signal) {
    SlaConfig config = applyExtensions(base, signal.extensions_used);
    if (signal.system_load) {
        config = applyLoadAdjustment(config, *signal.system_load);
    }

    SlaResult result;
    result.stage_id = config.stage_id;
    result.elapsed_minutes = elapsed_minutes;
    result.extensions_used = signal.extensions_used;
    result.evaluated_at = now;
    result.remaining_minutes = std::max(0.0, config.target_minutes - elapsed_minutes);

    if (elapsed_minutes >= config.breach_minutes) {
        result.status = SlaStatus::BREACHED;
    } else if (elapsed_minutes >= config.critical_minutes) {
        result.status = SlaStatus::AT_RISK;
    } else if (elapsed_minutes >= config.warning_minutes) {
        result.status = SlaStatus::AT_RISK;
    } else {
        result.status = signal.extensions_used > 0 ? SlaStatus::EXTENDED : SlaStatus::ON_TIME;
    }

    if (signal.completed) {
        result.predicted_total_minutes = elapsed_minutes;
        result.breach_probability = 0.0;
    } else {
        result.predicted_total_minutes = predictTotalMinutes(elapsed_minutes, signal);
        result.breach_probability = result.status == SlaStatus::BREACHED
            ? 1.0
            : breachProbability(result.predicted_total_minutes, config);
    }
    result.predicted_completion = addMinutes(now, std::max(0.0, result.predicted_total_minutes - elapsed_minutes));
    return result;
}

double SlaMonitor::predictTotalMinutes(double elapsed_minutes, const SlaSignal& signal) {
    if (!signal.progress_percent) {
        return 2.0 * elapsed_minutes;
    }
    double progress = std::min(100.0, std::max(*signal.progress_percent, kProgressEpsilon));
    double penalty = 1.0 + kErrorPenalty * static_cast<double>(std::max(0, signal.error_count));
    return elapsed_minutes / progress * 100.0 * penalty;
}

double SlaMonitor::breachProbability(double predicted_total_minutes, const SlaConfig& config) {
    if (predicted_total_minutes > config.breach_minutes) {
        return 0.8;
    }
    if (predicted_total_minutes > config.critical_minutes) {
        return 0.4;
    }
    if (predicted_total_minutes > config.warning_minutes) {
        return 0.1;
    }
    return 0.05;
}

ExtensionDecision SlaMonitor::requestExtension(const std::string& stage_id,
                                               const std::vector<std::string>& consumed_events,
                                               const std::string& event_id) const {
    if (std::find(consumed_events.begin(), consumed_events.end(), event_id) != consumed_events.end()) {
        return ExtensionDecision::ALREADY_GRANTED;
    }

    auto it = configs_.find(stage_id);
    if (it == configs_.end() || event_id.empty()) {
        return ExtensionDecision::DENIED;
    }
    const SlaConfig& config = it->second;
    if (!config.extensions_allowed ||
        static_cast<int>(consumed_events.size()) >= config.max_extensions) {
        LOG_INFO("sla", "Extension " + event_id + " denied for stage " + stage_id);
        return ExtensionDecision::DENIED;
    }

    metrics_.increment(Metric::SLA_EXTENSIONS_GRANTED);
    LOG_INFO("sla", "Extension " + event_id + " granted for stage " + stage_id + " (+" +
             std::to_string(config.extension_duration_minutes) + " min)");
    return ExtensionDecision::GRANTED;
}

void SlaMonitor::recordCompletion(const std::string& stage_id, double minutes) {
    if (minutes < 0.0) {
        return;
    }
    std::lock_guard<std::mutex> lock(history_mutex_);
    auto& history = completions_[stage_id];
    history.push_back(minutes);
    while (history.size() > kHistoryLimit) {
        history.pop_front();
    }
}

size_t SlaMonitor::completionSamples(const std::string& stage_id) const {
    std::lock_guard<std::mutex> lock(history_mutex_);
    auto it = completions_.find(stage_id);
    return it == completions_.end() ? 0 : it->second.size();
}

SlaConfig SlaMonitor::adaptive(const SlaConfig& base) const {
    double mean = 0.0;
    {
        std::lock_guard<std::mutex> lock(history_mutex_);
        auto it = completions_.find(base.stage_id);
        if (it == completions_.end() || it->second.size() < kAdaptiveMinSamples) {
            return base;
        }
        mean = std::accumulate(it->second.begin(), it->second.end(), 0.0) /
               static_cast<double>(it->second.size());
    }

    SlaConfig adjusted = base;
    double target = base.target_minutes + kAdaptiveFactor * (mean - base.target_minutes);
    if (target > 0.0 && target < base.warning_minutes) {
        adjusted.target_minutes = target;
    }
    return adjusted;
}

double SlaMonitor::loadMultiplier(double load) {
    if (load <= 0.3) {
        return 0.8;
    }
    if (load >= 0.8) {
        return 1.3;
    }
    return 0.8 + (load - 0.3) / 0.5 * 0.5;
}

SlaConfig SlaMonitor::applyExtensions(const SlaConfig& config, int extensions) {
    if (extensions <= 0) {
        return config;
    }
    SlaConfig extended = config;
    double extra = config.extension_duration_minutes * static_cast<double>(extensions);
    extended.target_minutes += extra;
    extended.warning_minutes += extra;
    extended.critical_minutes += extra;
    extended.breach_minutes += extra;
    return extended;
}

SlaConfig SlaMonitor::applyLoadAdjustment(const SlaConfig& config, double load) {
    double multiplier = loadMultiplier(load);
    SlaConfig adjusted = config;
    adjusted.target_minutes *= multiplier;
    adjusted.warning_minutes *= multiplier;
    adjusted.critical_minutes *= multiplier;
    adjusted.breach_minutes *= multiplier;
    return adjusted;
}

SlaSummary SlaMonitor::summarize(const std::vector<SlaResult>& results) {
    SlaSummary summary;
    summary.total = results.size();
    for (const auto& result : results) {
        switch (result.status) {
            case SlaStatus::ON_TIME: ++summary.on_time; break;
            case SlaStatus::AT_RISK: ++summary.at_risk; break;
            case SlaStatus::BREACHED: ++summary.breached; break;
            case SlaStatus::EXTENDED: ++summary.extended; break;
        }
    }
    if (summary.total > 0) {
        summary.compliance_percent = 100.0 * static_cast<double>(summary.on_time + summary.extended) /
                                     static_cast<double>(summary.total);
    }
    return summary;
}

bool SlaMonitor::validateSlaConfig(const SlaConfig& config, std::vector<std::string>& errors) {
    const size_t before = errors.size();
    const std::string prefix = "sla." + (config.stage_id.empty() ? std::string("<unnamed>") : config.stage_id) + ": ";

    if (config.stage_id.empty()) {
        errors.push_back(prefix + "stage id is required");
    }
    if (config.target_minutes <= 0.0 || config.warning_minutes <= 0.0 ||
        config.critical_minutes <= 0.0 || config.breach_minutes <= 0.0) {
        errors.push_back(prefix + "thresholds must be positive");
    }
    if (!(config.target_minutes < config.warning_minutes &&
          config.warning_minutes < config.critical_minutes &&
          config.critical_minutes < config.breach_minutes)) {
        errors.push_back(prefix + "thresholds must satisfy target < warning < critical < breach (got " +
                         std::to_string(config.target_minutes) + ", " +
                         std::to_string(config.warning_minutes) + ", " +
                         std::to_string(config.critical_minutes) + ", " +
                         std::to_string(config.breach_minutes) + ")");
    }
    if (config.extensions_allowed) {
        if (config.max_extensions < 1) {
            errors.push_back(prefix + "max_extensions must be at least 1 when extensions are allowed");
        }
        if (config.extension_duration_minutes <= 0.0) {
            errors.push_back(prefix + "extension_duration_minutes must be positive when extensions are allowed");
        }
    } else if (config.max_extensions < 0) {
        errors.push_back(prefix + "max_extensions cannot be negative");
    }
    return errors.size() == before;
}

} // namespace Orchestrator
} // namespace OBF
