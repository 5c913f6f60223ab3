#include "TimeUtils.hpp"

namespace TimeUtils
{
    long long dayIndex(std::time_t t) {
        long long secs = static_cast<long long>(t);
        long long days = secs / SECONDS_PER_DAY;
        if (secs % SECONDS_PER_DAY < 0) --days;
        return days;
    }

    std::time_t startOfDay(std::time_t t) {
        return static_cast<std::time_t>(dayIndex(t) * SECONDS_PER_DAY);
    }

    int hourOfDay(std::time_t t) {
        return secondsSinceMidnight(t) / 3600;
    }

    int dayOfWeek(std::time_t t) {
        // 1970-01-01 was a Thursday
        long long d = (dayIndex(t) + 3) % 7;
        if (d < 0) d += 7;
        return static_cast<int>(d);
    }

    int secondsSinceMidnight(std::time_t t) {
        return static_cast<int>(static_cast<long long>(t) - dayIndex(t) * SECONDS_PER_DAY);
    }

    std::string formatDate(std::time_t t) {
        std::tm tm{};
        gmtime_r(&t, &tm);
        char buf[16];
        std::strftime(buf, sizeof(buf), "%Y-%m-%d", &tm);
        return std::string(buf);
    }

    const char* weekdayName(int day) {
        static const char* names[] = {
            "Monday", "Tuesday", "Wednesday", "Thursday", "Friday", "Saturday", "Sunday"
        };
        if (day < 0 || day > 6) return "Unknown";
        return names[day];
    }
}
