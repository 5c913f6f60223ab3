#pragma once
#include <ctime>
#include <optional>
#include <string>
#include <vector>
#include "Item.hpp"
#include "ReviewEvent.hpp"
#include "ScheduleConfig.hpp"

// SM-2 review qualities (0-5)
enum class ReviewQuality {
    BLACKOUT = 0,   // No memory of the answer
    INCORRECT = 1,  // Wrong, but remembered on seeing the answer
    ERROR = 2,      // Wrong, but close
    DIFFICULT = 3,  // Correct with significant difficulty
    GOOD = 4,       // Correct with some hesitation
    PERFECT = 5     // Instant and confident
};

struct ScheduleUpdate {
    double ease_factor = 2.5;
    int interval_days = 0;
    int repetitions = 0;
    std::time_t last_review_at = 0;
    std::time_t next_review_at = 0;
};

struct AdaptiveIntervals {
    int minimum_days = 1;
    int recommended_days = 1;
    int maximum_days = 1;
    double factor = 1.0;
    std::string reason;
};

/*
  Pure SM-2 scheduling. No I/O, no state: safe to call from any thread.
  Persisting the result is the caller's job (ReviewProcessor).
*/
class SchedulingModel {
public:
    static constexpr int MIN_QUALITY = 0;
    static constexpr int MAX_QUALITY = 5;
    static constexpr int PASSING_QUALITY = 3;
    static constexpr int MAX_INTERVAL_DAYS = 365 * 50;

    // Throws ValidationError if quality is outside [0,5]
    static ScheduleUpdate applyReview(const Item& item, int quality, std::time_t now, const ScheduleConfig& cfg);

    static double nextEaseFactor(double ease_factor, int quality, double minimum_ease_factor);

    // Copies an update onto an item (does not touch bookkeeping fields)
    static void apply(Item& item, const ScheduleUpdate& update);

    static bool isValidQuality(int quality) {
        return quality >= MIN_QUALITY && quality <= MAX_QUALITY;
    }

    static const char* describeQuality(int quality);

    // Suggested interval range for an item given overall success rate
    // (empty: assume 0.8) and the item's own review history, oldest first
    static AdaptiveIntervals adaptiveIntervals(const Item& item, std::optional<double> success_rate,
        const std::vector<ReviewEvent>& item_history);
};
