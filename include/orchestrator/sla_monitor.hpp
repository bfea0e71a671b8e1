// EN: SLA Monitor - classifies stage elapsed time against graduated thresholds and predicts breaches.
// FR: SLA Monitor - classe le temps écoulé d'une étape selon des seuils gradués et prédit les violations.

#pragma once

#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "infrastructure/metrics/metrics_aggregator.hpp"
#include "orchestrator/business_calendar.hpp"
#include "orchestrator/orchestration_types.hpp"

namespace OBF {
namespace Orchestrator {

// EN: The monitor only classifies; it never blocks nor decides anything
// FR: Le moniteur ne fait que classer ; il ne bloque ni ne décide rien
class SlaMonitor {
public:
    static constexpr double kProgressEpsilon = 1.0;        // EN: Percent / FR: Pourcentage
    static constexpr double kErrorPenalty = 0.2;            // EN: Per reported error / FR: Par erreur signalée
    static constexpr size_t kAdaptiveMinSamples = 10;
    static constexpr double kAdaptiveFactor = 0.1;
    static constexpr size_t kHistoryLimit = 100;

    SlaMonitor(std::vector<SlaConfig> configs, BusinessCalendar calendar, MetricsAggregator& metrics);

    bool hasConfig(const std::string& stage_id) const;

    // EN: Configuration as used for evaluation, with the adaptive target applied
    // FR: Configuration telle qu'utilisée à l'évaluation, cible adaptative appliquée
    std::optional<SlaConfig> config(const std::string& stage_id) const;

    // EN: Throws std::invalid_argument for a stage without SLA
    // FR: Lève std::invalid_argument pour une étape sans SLA
    SlaResult evaluate(const std::string& stage_id, TimePoint started_at, TimePoint now,
                       const SlaSignal& signal = SlaSignal{}) const;

    // EN: Classification against an explicit configuration, no validation.
    //     Business-hours SLAs are measured on the given calendar.
    // FR: Classification contre une configuration explicite, sans validation.
    //     Les SLA en heures ouvrées sont mesurés sur le calendrier fourni.
    static SlaResult evaluateWithConfig(const SlaConfig& config, TimePoint started_at, TimePoint now,
                                        const SlaSignal& signal = SlaSignal{},
                                        const BusinessCalendar& calendar = BusinessCalendar{});

    double elapsedMinutes(const SlaConfig& config, TimePoint started_at, TimePoint now) const;

    // EN: Idempotent per event id; the caller records GRANTED ids on the stage
    // FR: Idempotent par id d'événement ; l'appelant enregistre les ids GRANTED sur l'étape
    ExtensionDecision requestExtension(const std::string& stage_id,
                                       const std::vector<std::string>& consumed_events,
                                       const std::string& event_id) const;

    // EN: Feed an observed stage duration into the adaptive target
    // FR: Alimente la cible adaptative avec une durée d'étape observée
    void recordCompletion(const std::string& stage_id, double minutes);
    size_t completionSamples(const std::string& stage_id) const;

    const BusinessCalendar& calendar() const { return calendar_; }

    // EN: 0.8 at load <= 0.3, 1.3 at load >= 0.8, linear in between
    // FR: 0.8 à charge <= 0.3, 1.3 à charge >= 0.8, linéaire entre les deux
    static double loadMultiplier(double load);

    static SlaConfig applyExtensions(const SlaConfig& config, int extensions);
    static SlaConfig applyLoadAdjustment(const SlaConfig& config, double load);
    static double predictTotalMinutes(double elapsed_minutes, const SlaSignal& signal);
    static double breachProbability(double predicted_total_minutes, const SlaConfig& config);
    static SlaSummary summarize(const std::vector<SlaResult>& results);

    // EN: Strict target < warning < critical < breach, positive values, coherent extensions
    // FR: Ordre strict target < warning < critical < breach, valeurs positives, extensions cohérentes
    static bool validateSlaConfig(const SlaConfig& config, std::vector<std::string>& errors);

private:
    static SlaResult classify(const SlaConfig& config, double elapsed_minutes, TimePoint now,
                              const SlaSignal& signal);
    static double minutesOn(const BusinessCalendar& calendar, const SlaConfig& config, TimePoint started_at,
                            TimePoint now);
    SlaConfig adaptive(const SlaConfig& base) const;

    std::unordered_map<std::string, SlaConfig> configs_;
    BusinessCalendar calendar_;
    MetricsAggregator& metrics_;

    mutable std::mutex history_mutex_;
    std::unordered_map<std::string, std::deque<double>> completions_;
};

} // namespace Orchestrator
} // namespace OBF
