#include "SchedulingModel.hpp"
#include "Errors.hpp"
#include "TimeUtils.hpp"
#include <algorithm>
#include <cmath>
#include <string>
#include <cstdio>

ScheduleUpdate SchedulingModel::applyReview(const Item& item, int quality, std::time_t now, const ScheduleConfig& cfg) {
    if (!isValidQuality(quality)) {
        throw ValidationError("Quality must be between 0 and 5, got " + std::to_string(quality));
    }

    ScheduleUpdate out;

    // EF is updated on both branches; a failed recall can only lower it
    out.ease_factor = nextEaseFactor(item.ease_factor, quality, cfg.minimum_ease_factor);

    if (quality < PASSING_QUALITY) {
        out.repetitions = 0;
        out.interval_days = cfg.initial_intervals[0];
    }
    else {
        out.repetitions = item.repetitions + 1;
        if (out.repetitions == 1) {
            out.interval_days = cfg.initial_intervals[0];
        }
        else if (out.repetitions == 2) {
            out.interval_days = cfg.initial_intervals[1];
        }
        else {
            // I(n) = I(n-1) * EF', capped at 50 years
            double grown = std::round(static_cast<double>(item.interval_days) * out.ease_factor);
            out.interval_days = static_cast<int>(std::clamp(grown, 1.0, static_cast<double>(MAX_INTERVAL_DAYS)));
        }
    }

    out.last_review_at = now;
    out.next_review_at = TimeUtils::addDays(now, out.interval_days);

    spdlog::debug("SM2: item={} q={} ef {:.3f}->{:.3f} reps {}->{} interval {}->{}d",
        item.id, quality, item.ease_factor, out.ease_factor,
        item.repetitions, out.repetitions, item.interval_days, out.interval_days);

    return out;
}

/*
  EF' = EF + (0.1 - (5 - q) * (0.08 + (5 - q) * 0.02))
  Lower clamp only; the formula itself caps growth at +0.1 per review.
*/
double SchedulingModel::nextEaseFactor(double ease_factor, int quality, double minimum_ease_factor) {
    int miss = MAX_QUALITY - quality;
    double delta = 0.1 - miss * (0.08 + miss * 0.02);
    return std::max(ease_factor + delta, minimum_ease_factor);
}

void SchedulingModel::apply(Item& item, const ScheduleUpdate& update) {
    item.ease_factor = update.ease_factor;
    item.interval_days = update.interval_days;
    item.repetitions = update.repetitions;
    item.last_review_at = update.last_review_at;
    item.next_review_at = update.next_review_at;
}

const char* SchedulingModel::describeQuality(int quality) {
    switch (quality) {
    case 0: return "Complete blackout - no memory of the answer";
    case 1: return "Incorrect, but remembered when seeing the answer";
    case 2: return "Incorrect, but the answer was close";
    case 3: return "Correct, but with significant difficulty";
    case 4: return "Correct with some hesitation";
    case 5: return "Perfect response - instant and confident";
    default: return "Unknown quality";
    }
}

/*
  Scales an item's interval by how the learner is doing overall (success
  rate) and on this item (mean of its last three qualities). The bounds are
  0.8x and 1.2x of the recommendation.
*/
AdaptiveIntervals SchedulingModel::adaptiveIntervals(const Item& item, std::optional<double> success_rate,
    const std::vector<ReviewEvent>& item_history)
{
    double rate = success_rate.value_or(0.8);
    double factor = 1.0;
    if (rate < 0.7) factor = 0.8;
    else if (rate > 0.9) factor = 1.2;

    if (item_history.size() >= 3) {
        double recent = 0.0;
        for (size_t i = item_history.size() - 3; i < item_history.size(); ++i) {
            recent += item_history[i].quality;
        }
        recent /= 3.0;
        if (recent < 3.5) factor *= 0.9;
        else if (recent > 4.5) factor *= 1.1;
    }

    double base = static_cast<double>(std::max(item.interval_days, 1));
    auto scaled = [&](double m) {
        double days = std::min(base * factor * m, static_cast<double>(MAX_INTERVAL_DAYS));
        return std::max(1, static_cast<int>(days));
    };

    AdaptiveIntervals out;
    out.factor = factor;
    out.minimum_days = scaled(0.8);
    out.recommended_days = scaled(1.0);
    out.maximum_days = scaled(1.2);

    char buf[96];
    if (factor < 0.9) {
        std::snprintf(buf, sizeof(buf), "Shortened due to lower success rate (%.0f%%)", rate * 100.0);
        out.reason = buf;
    }
    else if (factor > 1.1) {
        std::snprintf(buf, sizeof(buf), "Extended due to high success rate (%.0f%%)", rate * 100.0);
        out.reason = buf;
    }
    else {
        out.reason = "Standard interval based on current performance";
    }
    return out;
}
