#pragma once
#include <ctime>
#include <string>
#include <vector>
#include "Item.hpp"
#include "ItemStore.hpp"

struct DailyWorkload {
    std::string date;           // YYYY-MM-DD (UTC)
    int day_offset = 0;         // 0 = today
    int count = 0;
    int cumulative = 0;
    bool above_average = false;
};

// Projects per-day due counts. Overdue items land on today.
class WorkloadForecaster {
public:
    explicit WorkloadForecaster(const ItemStore& items);

    std::vector<DailyWorkload> forecast(int horizon_days, std::time_t now) const;

    // One entry per day in [today, today + horizon_days)
    static std::vector<DailyWorkload> forecast(const std::vector<Item>& items, int horizon_days, std::time_t now);

private:
    const ItemStore& itemStore;
};
