#pragma once
#include <array>
#include <ctime>
#include <optional>
#include <string>
#include <vector>
#include "Item.hpp"
#include "ItemStore.hpp"
#include "ReviewEvent.hpp"
#include "ReviewEventStore.hpp"

struct DailyStat {
    std::string date;           // YYYY-MM-DD (UTC)
    int reviews_count = 0;
    double success_rate = 0.0;  // 0..1
};

struct StrugglingItem {
    std::string item_id;
    std::vector<int> recent_qualities;
    double ease_factor = 2.5;
};

// How fast reviewed material moves toward mastery
struct LearningVelocity {
    double items_per_week = 0.0;            // Distinct items reviewed per week of activity
    double mastery_rate = 0.0;              // Percent of those items at mastery
    double average_interval_growth = 0.0;   // Latest / first interval, items with 2+ reviews
};

struct Milestone {
    std::string kind;           // first_success, first_perfect, reviews_<N>
    std::time_t reached_at = 0;
    std::string description;
};

enum class PerformanceTrend {
    STABLE,
    IMPROVING,
    DECLINING
};

struct PerformanceStats {
    int window_days = 0;
    int total_reviews = 0;
    int successful_reviews = 0;
    std::optional<double> success_rate;     // 0..1; empty when there is nothing to rate
    std::optional<double> average_quality;
    long long total_time_seconds = 0;

    std::array<double, 6> quality_distribution{};  // Percent per quality 0..5

    int current_streak = 0;     // Days
    int longest_streak = 0;     // Days

    std::vector<DailyStat> daily_stats;

    int items_in_system_count = 0;
    int mature_items_count = 0;
    std::array<int, 4> mastery_counts{};    // Indexed by MasteryLevel

    std::vector<StrugglingItem> struggling_items;
    PerformanceTrend trend = PerformanceTrend::STABLE;
    std::string grade = "D";

    LearningVelocity velocity;
    std::vector<Milestone> milestones;          // Ascending by reached_at
    std::vector<std::string> insights;
    std::vector<std::string> recommendations;
};

/*
  Read-only aggregation over the review log and the item population.
  Never throws on empty input: no events means zeroed stats.
*/
class PerformanceAnalytics {
public:
    PerformanceAnalytics(const ReviewEventStore& events, const ItemStore& items);

    // Queries the stores for the last window_days days
    PerformanceStats compute(int window_days, std::time_t now) const;

    static PerformanceStats computeStatistics(const std::vector<ReviewEvent>& events,
        const std::vector<Item>& items, int window_days, std::time_t now);

    static const char* trendName(PerformanceTrend trend);

    static constexpr int MASTERY_INTERVAL_DAYS = 21;

private:
    const ReviewEventStore& eventStore;
    const ItemStore& itemStore;

    static void computeStreaks(const std::vector<ReviewEvent>& events, std::time_t now, PerformanceStats& stats);
    static std::vector<StrugglingItem> findStruggling(const std::vector<ReviewEvent>& events);
    static PerformanceTrend computeTrend(const std::vector<ReviewEvent>& events);
    static std::string computeGrade(const PerformanceStats& stats, const std::vector<ReviewEvent>& events);
    static LearningVelocity computeVelocity(const std::vector<ReviewEvent>& events);
    static std::vector<Milestone> findMilestones(const std::vector<ReviewEvent>& events);
    static void writeAdvice(const std::vector<ReviewEvent>& events, PerformanceStats& stats);
};
