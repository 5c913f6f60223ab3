#include "AdaptiveScheduleAdvisor.hpp"
#include "Errors.hpp"
#include "TimeUtils.hpp"
#include <algorithm>
#include <array>
#include <cmath>
#include <cstdio>
#include <map>
#include <spdlog/spdlog.h>

namespace {

struct Bucket {
    int count = 0;
    long long quality_sum = 0;
};

// Qualifying hour buckets, best first (ties: earlier hour)
std::vector<TimeSlot> rankHours(const std::array<Bucket, 24>& hours, int min_samples) {
    std::vector<TimeSlot> out;
    for (int h = 0; h < 24; ++h) {
        const Bucket& b = hours[h];
        if (b.count < min_samples || b.count == 0) continue;
        TimeSlot s;
        s.hour = h;
        s.sample_size = b.count;
        s.average_quality = static_cast<double>(b.quality_sum) / b.count;
        out.push_back(s);
    }
    std::sort(out.begin(), out.end(),
        [](const TimeSlot& a, const TimeSlot& b) {
            if (a.average_quality != b.average_quality) return a.average_quality > b.average_quality;
            return a.hour < b.hour;
        });
    return out;
}

} // namespace

AdaptiveScheduleAdvisor::AdaptiveScheduleAdvisor(const ReviewEventStore& events, AdvisorSettings s)
    : eventStore(events), settings(s)
{
}

ScheduleRecommendations AdaptiveScheduleAdvisor::recommend(int history_days, std::time_t now) const {
    if (history_days < 0) throw ValidationError("history_days must be >= 0");
    return recommendSchedule(eventStore.query(TimeUtils::addDays(now, -history_days), now), settings);
}

ScheduleRecommendations AdaptiveScheduleAdvisor::recommendSchedule(const std::vector<ReviewEvent>& events,
    const AdvisorSettings& settings)
{
    ScheduleRecommendations rec;
    rec.optimal_session_length_minutes = optimalSessionLength(events, settings);
    rec.consistency_score = consistencyScore(events);

    if (events.empty()) {
        spdlog::debug("recommendSchedule: no history");
        return rec;
    }

    std::array<Bucket, 24> hours{};
    std::array<std::array<Bucket, 24>, 7> day_hours{};
    for (const auto& e : events) {
        int h = TimeUtils::hourOfDay(e.submitted_at);
        int d = TimeUtils::dayOfWeek(e.submitted_at);
        hours[h].count += 1;
        hours[h].quality_sum += e.quality;
        day_hours[d][h].count += 1;
        day_hours[d][h].quality_sum += e.quality;
    }

    std::vector<TimeSlot> ranked = rankHours(hours, settings.min_samples);
    size_t top = static_cast<size_t>(std::max(0, settings.top_n));

    for (size_t i = 0; i < ranked.size() && i < top; ++i) {
        rec.best_review_times.push_back(ranked[i]);
    }

    // Worst first, never repeating a slot already recommended
    for (size_t i = 0; i < ranked.size() && rec.avoid_times.size() < top; ++i) {
        size_t idx = ranked.size() - 1 - i;
        if (idx < rec.best_review_times.size()) break;
        if (ranked[idx].average_quality < settings.poor_quality) {
            rec.avoid_times.push_back(ranked[idx]);
        }
    }

    for (int d = 0; d < 7; ++d) {
        std::vector<TimeSlot> day_ranked = rankHours(day_hours[d], settings.min_samples);
        DayPlan plan;
        plan.day_of_week = d;
        plan.duration_minutes = rec.optimal_session_length_minutes;
        if (!day_ranked.empty()) {
            plan.hour = day_ranked.front().hour;
            plan.from_day_data = true;
        }
        else if (!ranked.empty()) {
            plan.hour = ranked.front().hour;
        }
        else {
            continue;
        }
        rec.suggested_schedule.push_back(plan);
    }

    spdlog::debug("recommendSchedule: {} events, {} qualifying hours, session {} min, consistency {:.1f}",
        events.size(), ranked.size(), rec.optimal_session_length_minutes, rec.consistency_score);
    return rec;
}

/*
  Sessions are runs of events with gaps of at most session_gap_seconds.
  Each session's length (sum of time spent) falls in a 10-minute band; the
  answer is the shortest band whose success rate is within 0.05 of the best
  band, i.e. the point past which longer sessions stop paying off.
*/
int AdaptiveScheduleAdvisor::optimalSessionLength(const std::vector<ReviewEvent>& events, const AdvisorSettings& settings) {
    if (events.empty()) return settings.default_session_minutes;

    std::vector<const ReviewEvent*> sorted;
    for (const auto& e : events) sorted.push_back(&e);
    std::stable_sort(sorted.begin(), sorted.end(),
        [](const ReviewEvent* a, const ReviewEvent* b) { return a->submitted_at < b->submitted_at; });

    std::map<int, std::pair<int, int>> bands; // band -> (reviews, successes)
    size_t i = 0;
    while (i < sorted.size()) {
        long long seconds = 0;
        int reviews = 0;
        int successes = 0;
        size_t j = i;
        do {
            seconds += sorted[j]->time_spent_seconds;
            ++reviews;
            if (sorted[j]->successful()) ++successes;
            ++j;
        } while (j < sorted.size() && sorted[j]->submitted_at - sorted[j - 1]->submitted_at <= settings.session_gap_seconds);

        int band = static_cast<int>(seconds / 600);
        bands[band].first += reviews;
        bands[band].second += successes;
        i = j;
    }

    double best = 0.0;
    for (const auto& b : bands) {
        best = std::max(best, static_cast<double>(b.second.second) / b.second.first);
    }
    for (const auto& b : bands) {
        double rate = static_cast<double>(b.second.second) / b.second.first;
        if (rate + 0.05 >= best) {
            return std::clamp((b.first + 1) * 10, 10, 60);
        }
    }
    return settings.default_session_minutes;
}

// 100 / (1 + cv) of submission time-of-day; 0 with fewer than two events
double AdaptiveScheduleAdvisor::consistencyScore(const std::vector<ReviewEvent>& events) {
    if (events.size() < 2) return 0.0;

    double n = static_cast<double>(events.size());
    double mean = 0.0;
    for (const auto& e : events) mean += TimeUtils::secondsSinceMidnight(e.submitted_at);
    mean /= n;

    double var = 0.0;
    for (const auto& e : events) {
        double d = TimeUtils::secondsSinceMidnight(e.submitted_at) - mean;
        var += d * d;
    }
    double stddev = std::sqrt(var / n);

    if (mean <= 0.0) return stddev <= 0.0 ? 100.0 : 0.0;
    double cv = stddev / mean;
    return std::clamp(100.0 / (1.0 + cv), 0.0, 100.0);
}

std::string AdaptiveScheduleAdvisor::formatHour(int hour) {
    char buf[8];
    std::snprintf(buf, sizeof(buf), "%02d:00", hour);
    return std::string(buf);
}
