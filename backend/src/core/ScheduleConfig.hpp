#pragma once
#include <array>
#include <string>

enum class ReviewOrder {
    URGENCY,
    RANDOM
};

// Per-learner settings. Supplied by the caller on every call, never cached
// by the engine.
class ScheduleConfig {
public:
    int daily_review_limit = 25;
    int new_items_per_day = 10;
    ReviewOrder review_order = ReviewOrder::URGENCY;
    double minimum_ease_factor = 1.3;
    std::array<int, 2> initial_intervals{ {1, 6} };
    int break_interval = 10;             // Suggest a break after every N entries
    double retention_decay_scale = 1.0;  // Forgetting-curve tuning

    // Throws ValidationError on out-of-range values
    void validate() const;

    // "key: value" lines, same layout deserialize() reads
    std::string serialize() const;
    static ScheduleConfig deserialize(const std::string& data);

    static const char* orderName(ReviewOrder order);
};
