// EN: Working-hours calendar used to discount nights and weekends from SLA clocks.
// FR: Calendrier des heures ouvrées utilisé pour exclure nuits et week-ends des horloges SLA.

#pragma once

#include <vector>

#include "orchestrator/orchestration_types.hpp"

namespace OBF {
namespace Orchestrator {

struct BusinessHoursConfig {
    int start_hour = 9;                          // EN: Local hour the working day starts / FR: Heure locale de début
    int end_hour = 17;                           // EN: Local hour the working day ends / FR: Heure locale de fin
    std::vector<int> working_days{1, 2, 3, 4, 5}; // EN: ISO weekdays, Monday = 1 / FR: Jours ISO, lundi = 1
    int utc_offset_minutes = 0;
};

class BusinessCalendar {
public:
    explicit BusinessCalendar(BusinessHoursConfig config = BusinessHoursConfig{});

    const BusinessHoursConfig& config() const { return config_; }

    bool isBusinessTime(TimePoint tp) const;

    // EN: Minutes of working time between two instants (0 when to <= from)
    // FR: Minutes ouvrées entre deux instants (0 si to <= from)
    double businessMinutesBetween(TimePoint from, TimePoint to) const;

    // EN: ISO weekday (1..7) of an instant in the calendar's local time
    // FR: Jour ISO (1..7) d'un instant dans l'heure locale du calendrier
    int isoWeekday(TimePoint tp) const;

    static bool validate(const BusinessHoursConfig& config, std::vector<std::string>& errors);

private:
    bool isWorkingDay(int iso_weekday) const;
    long long localSeconds(TimePoint tp) const;

    BusinessHoursConfig config_;
};

} // namespace Orchestrator
} // namespace OBF
