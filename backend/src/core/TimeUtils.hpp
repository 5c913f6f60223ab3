#pragma once
#include <ctime>
#include <string>

// Calendar helpers. All day/hour/weekday math is done in UTC so that
// reports are reproducible regardless of the host timezone.
namespace TimeUtils
{
    constexpr std::time_t SECONDS_PER_DAY = 24 * 60 * 60;

    // Days since the epoch (floor division, also correct before 1970).
    long long dayIndex(std::time_t t);

    std::time_t startOfDay(std::time_t t);

    int hourOfDay(std::time_t t);

    // 0 = Monday ... 6 = Sunday
    int dayOfWeek(std::time_t t);

    int secondsSinceMidnight(std::time_t t);

    // YYYY-MM-DD
    std::string formatDate(std::time_t t);

    const char* weekdayName(int day);

    inline std::time_t addDays(std::time_t t, int days) {
        return t + static_cast<std::time_t>(days) * SECONDS_PER_DAY;
    }
}
