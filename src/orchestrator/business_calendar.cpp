// EN: BusinessCalendar implementation - day-by-day overlap of an interval with the working window.
// FR: Implémentation de BusinessCalendar - recouvrement jour par jour d'un intervalle avec la fenêtre ouvrée.

#include "orchestrator/business_calendar.hpp"

#include <algorithm>
#include <stdexcept>

namespace OBF {
namespace Orchestrator {

namespace {
constexpr long long kSecondsPerDay = 86400;

long long floorDiv(long long value, long long divisor) {
    long long quotient = value / divisor;
    if ((value % divisor != 0) && ((value < 0) != (divisor < 0))) {
        --quotient;
    }
    return quotient;
}
} // namespace

BusinessCalendar::BusinessCalendar(BusinessHoursConfig config) : config_(std::move(config)) {
    std::vector<std::string> errors;
    if (!validate(config_, errors)) {
        throw std::invalid_argument("Invalid business hours: " + errors.front());
    }
}

long long BusinessCalendar::localSeconds(TimePoint tp) const {
    auto seconds = std::chrono::duration_cast<std::chrono::seconds>(tp.time_since_epoch()).count();
    return seconds + static_cast<long long>(config_.utc_offset_minutes) * 60;
}

int BusinessCalendar::isoWeekday(TimePoint tp) const {
    long long day = floorDiv(localSeconds(tp), kSecondsPerDay);
    // EN: 1970-01-01 was a Thursday (ISO 4).
    // FR: Le 1970-01-01 était un jeudi (ISO 4).
    long long weekday = ((day + 3) % 7 + 7) % 7;
    return static_cast<int>(weekday) + 1;
}

bool BusinessCalendar::isWorkingDay(int iso_weekday) const {
    return std::find(config_.working_days.begin(), config_.working_days.end(), iso_weekday) !=
           config_.working_days.end();
}

bool BusinessCalendar::isBusinessTime(TimePoint tp) const {
    if (!isWorkingDay(isoWeekday(tp))) {
        return false;
    }
    long long local = localSeconds(tp);
    long long second_of_day = local - floorDiv(local, kSecondsPerDay) * kSecondsPerDay;
    return second_of_day >= config_.start_hour * 3600LL && second_of_day < config_.end_hour * 3600LL;
}

double BusinessCalendar::businessMinutesBetween(TimePoint from, TimePoint to) const {
    if (to <= from) {
        return 0.0;
    }

    auto offset = static_cast<long long>(config_.utc_offset_minutes) * 60;
    double from_local = std::chrono::duration<double>(from.time_since_epoch()).count() + offset;
    double to_local = std::chrono::duration<double>(to.time_since_epoch()).count() + offset;

    long long first_day = floorDiv(static_cast<long long>(from_local), kSecondsPerDay);
    long long last_day = floorDiv(static_cast<long long>(to_local), kSecondsPerDay);

    double total_seconds = 0.0;
    for (long long day = first_day; day <= last_day; ++day) {
        int iso = static_cast<int>(((day + 3) % 7 + 7) % 7) + 1;
        if (!isWorkingDay(iso)) {
            continue;
        }
        double window_start = static_cast<double>(day * kSecondsPerDay + config_.start_hour * 3600LL);
        double window_end = static_cast<double>(day * kSecondsPerDay + config_.end_hour * 3600LL);
        double overlap = std::min(window_end, to_local) - std::max(window_start, from_local);
        if (overlap > 0.0) {
            total_seconds += overlap;
        }
    }
    return total_seconds / 60.0;
}

bool BusinessCalendar::validate(const BusinessHoursConfig& config, std::vector<std::string>& errors) {
    const size_t before = errors.size();
    if (config.start_hour < 0 || config.start_hour > 23) {
        errors.push_back("business_hours.start_hour must be in [0, 23]");
    }
    if (config.end_hour < 1 || config.end_hour > 24) {
        errors.push_back("business_hours.end_hour must be in [1, 24]");
    }
    if (config.start_hour >= config.end_hour) {
        errors.push_back("business_hours.start_hour must be before end_hour");
    }
    if (config.working_days.empty()) {
        errors.push_back("business_hours.working_days cannot be empty");
    }
    for (int day : config.working_days) {
        if (day < 1 || day > 7) {
            errors.push_back("business_hours.working_days must use ISO weekdays 1..7");
            break;
        }
    }
    if (config.utc_offset_minutes < -14 * 60 || config.utc_offset_minutes > 14 * 60) {
        errors.push_back("business_hours.utc_offset_minutes out of range");
    }
    return errors.size() == before;
}

} // namespace Orchestrator
} // namespace OBF
