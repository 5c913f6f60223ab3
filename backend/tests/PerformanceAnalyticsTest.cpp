#include <gtest/gtest.h>
#include <numeric>
#include "../src/core/PerformanceAnalytics.hpp"
#include "../src/core/Errors.hpp"
#include "../src/storage/MemoryStores.hpp"
#include "TestHelpers.hpp"

using namespace TestHelpers;

TEST(PerformanceAnalyticsTest, EmptyLogGivesZeroedStats) {
    PerformanceStats s = PerformanceAnalytics::computeStatistics({}, {}, 30, at(10));
    EXPECT_EQ(s.window_days, 30);
    EXPECT_EQ(s.total_reviews, 0);
    EXPECT_FALSE(s.success_rate.has_value());
    EXPECT_FALSE(s.average_quality.has_value());
    EXPECT_EQ(s.current_streak, 0);
    EXPECT_TRUE(s.daily_stats.empty());
    for (double pct : s.quality_distribution) EXPECT_EQ(pct, 0.0);
}

TEST(PerformanceAnalyticsTest, RejectsNegativeWindow) {
    EXPECT_THROW(PerformanceAnalytics::computeStatistics({}, {}, -1, at(0)), ValidationError);
}

TEST(PerformanceAnalyticsTest, TotalsAndDistribution) {
    std::vector<ReviewEvent> log = {
        event("a", at(8, 9), 5, 20),
        event("b", at(8, 10), 4, 30),
        event("a", at(9, 9), 2, 40),
        event("c", at(9, 11), 0, 10),
    };
    PerformanceStats s = PerformanceAnalytics::computeStatistics(log, {}, 30, at(10));

    EXPECT_EQ(s.total_reviews, 4);
    EXPECT_EQ(s.successful_reviews, 2);
    EXPECT_DOUBLE_EQ(*s.success_rate, 0.5);
    EXPECT_DOUBLE_EQ(*s.average_quality, 11.0 / 4.0);
    EXPECT_EQ(s.total_time_seconds, 100);

    EXPECT_DOUBLE_EQ(s.quality_distribution[0], 25.0);
    EXPECT_DOUBLE_EQ(s.quality_distribution[1], 0.0);
    EXPECT_DOUBLE_EQ(s.quality_distribution[5], 25.0);
    double sum = std::accumulate(s.quality_distribution.begin(), s.quality_distribution.end(), 0.0);
    EXPECT_NEAR(sum, 100.0, 1e-9);
}

TEST(PerformanceAnalyticsTest, WindowExcludesOldEvents) {
    std::vector<ReviewEvent> log = {
        event("a", at(0), 5),
        event("a", at(20), 4),
    };
    PerformanceStats s = PerformanceAnalytics::computeStatistics(log, {}, 7, at(21));
    EXPECT_EQ(s.total_reviews, 1);
}

TEST(PerformanceAnalyticsTest, DailyStatsAscending) {
    std::vector<ReviewEvent> log = {
        event("a", at(3, 20), 1),
        event("a", at(2, 8), 4),
        event("b", at(3, 7), 5),
    };
    PerformanceStats s = PerformanceAnalytics::computeStatistics(log, {}, 30, at(4));
    ASSERT_EQ(s.daily_stats.size(), 2u);
    EXPECT_EQ(s.daily_stats[0].date, "2024-01-03");
    EXPECT_EQ(s.daily_stats[0].reviews_count, 1);
    EXPECT_EQ(s.daily_stats[1].date, "2024-01-04");
    EXPECT_EQ(s.daily_stats[1].reviews_count, 2);
    EXPECT_DOUBLE_EQ(s.daily_stats[1].success_rate, 0.5);
}

TEST(PerformanceAnalyticsTest, StreakCountsBackFromToday) {
    std::vector<ReviewEvent> log = {
        event("a", at(1, 9), 4),
        event("a", at(3, 9), 4),
        event("a", at(4, 9), 3),
        event("a", at(5, 9), 5),
    };
    PerformanceStats s = PerformanceAnalytics::computeStatistics(log, {}, 30, at(5, 12));
    EXPECT_EQ(s.current_streak, 3);
    EXPECT_EQ(s.longest_streak, 3);

    // Nothing reviewed yet today
    s = PerformanceAnalytics::computeStatistics(log, {}, 30, at(6, 12));
    EXPECT_EQ(s.current_streak, 0);
    EXPECT_EQ(s.longest_streak, 3);
}

TEST(PerformanceAnalyticsTest, FailureOnlyDayBreaksStreak) {
    std::vector<ReviewEvent> log = {
        event("a", at(3, 9), 4),
        event("a", at(4, 9), 1),
        event("b", at(4, 10), 2),
        event("a", at(5, 9), 4),
    };
    PerformanceStats s = PerformanceAnalytics::computeStatistics(log, {}, 30, at(5, 12));
    EXPECT_EQ(s.current_streak, 1);
}

TEST(PerformanceAnalyticsTest, ItemPopulationCounts) {
    std::vector<Item> items = {
        newItem("n", at(0)),
        reviewedItem("l", 3, 2.5, 1, at(0)),
        reviewedItem("y", 10, 2.5, 3, at(0)),
        reviewedItem("m1", 21, 2.5, 4, at(0)),
        reviewedItem("m2", 60, 2.7, 6, at(0)),
    };
    PerformanceStats s = PerformanceAnalytics::computeStatistics({}, items, 30, at(1));
    EXPECT_EQ(s.items_in_system_count, 5);
    EXPECT_EQ(s.mature_items_count, 2);
    EXPECT_EQ(s.mastery_counts[static_cast<size_t>(MasteryLevel::NEW)], 1);
    EXPECT_EQ(s.mastery_counts[static_cast<size_t>(MasteryLevel::LEARNING)], 1);
    EXPECT_EQ(s.mastery_counts[static_cast<size_t>(MasteryLevel::YOUNG)], 1);
    EXPECT_EQ(s.mastery_counts[static_cast<size_t>(MasteryLevel::MATURE)], 2);
}

TEST(PerformanceAnalyticsTest, FindsStrugglingItems) {
    std::vector<ReviewEvent> log = {
        event("hard", at(1), 4),
        event("hard", at(2), 1),
        event("hard", at(3), 5),
        event("hard", at(4), 0),
        event("fine", at(1), 1),
        event("fine", at(2), 2),
        event("fine", at(3), 4),
        event("fine", at(4), 5),
        event("short", at(1), 0),
        event("short", at(2), 0),
    };
    PerformanceStats s = PerformanceAnalytics::computeStatistics(log, {}, 30, at(5));
    ASSERT_EQ(s.struggling_items.size(), 1u);
    EXPECT_EQ(s.struggling_items[0].item_id, "hard");
    EXPECT_EQ(s.struggling_items[0].recent_qualities, (std::vector<int>{ 1, 5, 0 }));
}

TEST(PerformanceAnalyticsTest, DetectsTrend) {
    std::vector<ReviewEvent> rising;
    std::vector<ReviewEvent> falling;
    for (int i = 0; i < 20; ++i) {
        rising.push_back(event("a", at(i), i < 10 ? 1 : 5));
        falling.push_back(event("a", at(i), i < 10 ? 5 : 1));
    }
    EXPECT_EQ(PerformanceAnalytics::computeStatistics(rising, {}, 30, at(20)).trend, PerformanceTrend::IMPROVING);
    EXPECT_EQ(PerformanceAnalytics::computeStatistics(falling, {}, 30, at(20)).trend, PerformanceTrend::DECLINING);

    std::vector<ReviewEvent> flat(6, event("a", at(1), 4));
    EXPECT_EQ(PerformanceAnalytics::computeStatistics(flat, {}, 30, at(2)).trend, PerformanceTrend::STABLE);
}

TEST(PerformanceAnalyticsTest, GradeRewardsConsistentMastery) {
    std::vector<ReviewEvent> strong;
    for (int i = 0; i < 10; ++i) strong.push_back(event("a", at(i), 5, 30, 30));
    EXPECT_EQ(PerformanceAnalytics::computeStatistics(strong, {}, 30, at(10)).grade, "A+");

    std::vector<ReviewEvent> weak = {
        event("a", at(0), 1),
        event("a", at(9), 2),
    };
    EXPECT_EQ(PerformanceAnalytics::computeStatistics(weak, {}, 30, at(10)).grade, "D");
}

TEST(PerformanceAnalyticsTest, ComputeReadsStores) {
    MemoryReviewEventStore events;
    MemoryItemStore items;
    items.insert(reviewedItem("a", 30, 2.5, 5, at(0)));
    events.append(event("a", at(0), 2));
    events.append(event("a", at(9), 5));

    PerformanceAnalytics analytics(events, items);
    PerformanceStats s = analytics.compute(7, at(10));
    EXPECT_EQ(s.total_reviews, 1);
    EXPECT_EQ(s.items_in_system_count, 1);
    EXPECT_EQ(s.mature_items_count, 1);
}

TEST(PerformanceAnalyticsTest, LearningVelocity) {
    std::vector<ReviewEvent> log = {
        event("a", at(0), 4, 30, 1),
        event("b", at(0, 1), 4, 30, 1),
        event("a", at(7), 5, 30, 6),
        event("a", at(14), 5, 30, 24),
    };
    PerformanceStats s = PerformanceAnalytics::computeStatistics(log, {}, 30, at(15));
    EXPECT_DOUBLE_EQ(s.velocity.items_per_week, 1.0);      // 2 items over 14 days
    EXPECT_DOUBLE_EQ(s.velocity.mastery_rate, 50.0);
    EXPECT_DOUBLE_EQ(s.velocity.average_interval_growth, 24.0);
}

TEST(PerformanceAnalyticsTest, MilestonesInOrder) {
    std::vector<ReviewEvent> log;
    for (int i = 0; i < 12; ++i) {
        int quality = i < 2 ? 1 : (i == 6 ? 5 : 4);
        log.push_back(event("a", at(i), quality));
    }
    PerformanceStats s = PerformanceAnalytics::computeStatistics(log, {}, 30, at(12));
    ASSERT_EQ(s.milestones.size(), 3u);
    EXPECT_EQ(s.milestones[0].kind, "first_success");
    EXPECT_EQ(s.milestones[0].reached_at, at(2));
    EXPECT_EQ(s.milestones[1].kind, "first_perfect");
    EXPECT_EQ(s.milestones[1].reached_at, at(6));
    EXPECT_EQ(s.milestones[2].kind, "reviews_10");
    EXPECT_EQ(s.milestones[2].reached_at, at(9));
}

TEST(PerformanceAnalyticsTest, InsightsAndRecommendations) {
    std::vector<ReviewEvent> steady;
    for (int i = 0; i < 10; ++i) steady.push_back(event("a", at(i, 9), 5, 30, 30));
    PerformanceStats good = PerformanceAnalytics::computeStatistics(steady, {}, 30, at(9, 12));

    auto has = [](const std::vector<std::string>& lines, const std::string& fragment) {
        for (const auto& l : lines) {
            if (l.find(fragment) != std::string::npos) return true;
        }
        return false;
    };
    EXPECT_TRUE(has(good.insights, "above 90%"));
    EXPECT_TRUE(has(good.insights, "10-day success streak"));
    EXPECT_TRUE(has(good.insights, "best at 09:00"));
    EXPECT_TRUE(good.recommendations.empty());

    std::vector<ReviewEvent> rough = {
        event("x", at(0, 0, 10), 1, 200, 1),
        event("x", at(1, 0, 10), 2, 200, 1),
        event("x", at(2, 23), 0, 200, 1),
    };
    PerformanceStats bad = PerformanceAnalytics::computeStatistics(rough, {}, 30, at(3));
    EXPECT_TRUE(has(bad.insights, "below 70%"));
    EXPECT_TRUE(has(bad.recommendations, "over 2 minutes"));
    EXPECT_TRUE(has(bad.recommendations, "1 items you're struggling with"));
    EXPECT_TRUE(has(bad.recommendations, "consistency is below 50%"));
    EXPECT_TRUE(has(bad.recommendations, "Less than 20%"));
}
