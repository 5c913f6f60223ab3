#pragma once
#include <ctime>
#include <string>
#include "../src/core/Item.hpp"
#include "../src/core/ReviewEvent.hpp"
#include "../src/core/TimeUtils.hpp"

namespace TestHelpers
{
    // 2024-01-01 00:00:00 UTC, a Monday
    constexpr std::time_t BASE = 1704067200;

    inline std::time_t at(int day, int hour = 0, int minute = 0) {
        return BASE + static_cast<std::time_t>(day) * TimeUtils::SECONDS_PER_DAY + hour * 3600 + minute * 60;
    }

    inline Item reviewedItem(const std::string& id, int interval, double ease, int reps, std::time_t last) {
        Item it;
        it.id = id;
        it.interval_days = interval;
        it.ease_factor = ease;
        it.repetitions = reps;
        it.created_at = last - 30 * TimeUtils::SECONDS_PER_DAY;
        it.last_review_at = last;
        it.next_review_at = TimeUtils::addDays(last, interval);
        it.first_review_at = it.created_at;
        it.total_reviews = reps;
        return it;
    }

    inline Item newItem(const std::string& id, std::time_t created) {
        Item it;
        it.id = id;
        it.created_at = created;
        it.next_review_at = created;
        return it;
    }

    inline ReviewEvent event(const std::string& id, std::time_t when, int quality, int seconds = 30, int interval = 1) {
        ReviewEvent e;
        e.item_id = id;
        e.submitted_at = when;
        e.quality = quality;
        e.time_spent_seconds = seconds;
        e.resulting_interval_days = interval;
        e.resulting_ease_factor = 2.5;
        return e;
    }
}
