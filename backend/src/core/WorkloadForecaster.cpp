#include "WorkloadForecaster.hpp"
#include "Errors.hpp"
#include "TimeUtils.hpp"

WorkloadForecaster::WorkloadForecaster(const ItemStore& items)
    : itemStore(items)
{
}

std::vector<DailyWorkload> WorkloadForecaster::forecast(int horizon_days, std::time_t now) const {
    return forecast(itemStore.listAll(), horizon_days, now);
}

std::vector<DailyWorkload> WorkloadForecaster::forecast(const std::vector<Item>& items, int horizon_days, std::time_t now) {
    if (horizon_days < 0) throw ValidationError("horizon_days must be >= 0");

    std::vector<DailyWorkload> days(static_cast<size_t>(horizon_days));
    if (days.empty()) return days;

    long long today = TimeUtils::dayIndex(now);
    for (int i = 0; i < horizon_days; ++i) {
        days[i].day_offset = i;
        days[i].date = TimeUtils::formatDate(static_cast<std::time_t>((today + i) * TimeUtils::SECONDS_PER_DAY));
    }

    for (const auto& item : items) {
        if (!item.next_review_at) continue;
        long long offset = TimeUtils::dayIndex(*item.next_review_at) - today;
        if (offset < 0) offset = 0;
        if (offset >= horizon_days) continue;
        days[static_cast<size_t>(offset)].count += 1;
    }

    int running = 0;
    for (auto& d : days) {
        running += d.count;
        d.cumulative = running;
    }
    double average = static_cast<double>(running) / horizon_days;
    for (auto& d : days) {
        d.above_average = d.count > average;
    }

    spdlog::debug("forecast: {} reviews over {} days", running, horizon_days);
    return days;
}
