#pragma once
#include <ctime>
#include <string>
#include <vector>
#include "ReviewEvent.hpp"
#include "ReviewEventStore.hpp"

struct AdvisorSettings {
    int min_samples = 3;            // Events a bucket needs before it counts
    int top_n = 3;
    double poor_quality = 2.5;      // avoid_times only below this mean
    int session_gap_seconds = 2 * 60 * 60;
    int default_session_minutes = 20;
};

struct TimeSlot {
    int hour = 0;                   // 0..23 (UTC)
    double average_quality = 0.0;
    int sample_size = 0;
};

struct DayPlan {
    int day_of_week = 0;            // 0 = Monday
    int hour = 0;
    int duration_minutes = 0;
    bool from_day_data = false;     // false: global best hour fallback
};

struct ScheduleRecommendations {
    std::vector<TimeSlot> best_review_times;
    std::vector<TimeSlot> avoid_times;
    int optimal_session_length_minutes = 20;
    std::vector<DayPlan> suggested_schedule;
    double consistency_score = 0.0; // 0..100
};

/*
  Mines the review log for time-of-day and day-of-week quality patterns.
  Read-only; empty history yields empty recommendations.
*/
class AdaptiveScheduleAdvisor {
public:
    explicit AdaptiveScheduleAdvisor(const ReviewEventStore& events, AdvisorSettings settings = AdvisorSettings());

    // Uses every event from `now - history_days` to now
    ScheduleRecommendations recommend(int history_days, std::time_t now) const;

    static ScheduleRecommendations recommendSchedule(const std::vector<ReviewEvent>& events,
        const AdvisorSettings& settings = AdvisorSettings());

    static int optimalSessionLength(const std::vector<ReviewEvent>& events, const AdvisorSettings& settings);
    static double consistencyScore(const std::vector<ReviewEvent>& events);

    static std::string formatHour(int hour);

private:
    const ReviewEventStore& eventStore;
    AdvisorSettings settings;
};
