#include <gtest/gtest.h>
#include "../src/core/AdaptiveScheduleAdvisor.hpp"
#include "../src/core/Errors.hpp"
#include "../src/storage/MemoryStores.hpp"
#include "TestHelpers.hpp"

using namespace TestHelpers;

namespace {

// Sharp mornings (09:00), sloppy nights (22:00), too little data at 14:00
std::vector<ReviewEvent> morningPerson() {
    std::vector<ReviewEvent> log;
    for (int day = 0; day < 3; ++day) {
        log.push_back(event("a", at(day, 9), 5));
        log.push_back(event("b", at(day, 22), 1));
    }
    log.push_back(event("c", at(0, 14), 3));
    log.push_back(event("c", at(1, 14), 3));
    return log;
}

// One session: `count` reviews three minutes apart, each taking `seconds`
void addSession(std::vector<ReviewEvent>& log, int day, int count, int seconds, int failures) {
    for (int i = 0; i < count; ++i) {
        log.push_back(event("s", at(day, 8, i * 3), i < failures ? 1 : 4, seconds));
    }
}

} // namespace

TEST(AdaptiveScheduleAdvisorTest, EmptyHistory) {
    ScheduleRecommendations rec = AdaptiveScheduleAdvisor::recommendSchedule({});
    EXPECT_TRUE(rec.best_review_times.empty());
    EXPECT_TRUE(rec.avoid_times.empty());
    EXPECT_TRUE(rec.suggested_schedule.empty());
    EXPECT_EQ(rec.optimal_session_length_minutes, 20);
    EXPECT_EQ(rec.consistency_score, 0.0);
}

TEST(AdaptiveScheduleAdvisorTest, RanksHoursWithEnoughSamples) {
    ScheduleRecommendations rec = AdaptiveScheduleAdvisor::recommendSchedule(morningPerson());
    ASSERT_EQ(rec.best_review_times.size(), 2u);
    EXPECT_EQ(rec.best_review_times[0].hour, 9);
    EXPECT_DOUBLE_EQ(rec.best_review_times[0].average_quality, 5.0);
    EXPECT_EQ(rec.best_review_times[0].sample_size, 3);
    EXPECT_EQ(rec.best_review_times[1].hour, 22);

    // Every qualifying hour is already recommended
    EXPECT_TRUE(rec.avoid_times.empty());
}

TEST(AdaptiveScheduleAdvisorTest, AvoidTimesNeverOverlapBestTimes) {
    AdvisorSettings settings;
    settings.top_n = 1;
    ScheduleRecommendations rec = AdaptiveScheduleAdvisor::recommendSchedule(morningPerson(), settings);
    ASSERT_EQ(rec.best_review_times.size(), 1u);
    EXPECT_EQ(rec.best_review_times[0].hour, 9);
    ASSERT_EQ(rec.avoid_times.size(), 1u);
    EXPECT_EQ(rec.avoid_times[0].hour, 22);
    EXPECT_DOUBLE_EQ(rec.avoid_times[0].average_quality, 1.0);
}

TEST(AdaptiveScheduleAdvisorTest, MinSamplesIsConfigurable) {
    AdvisorSettings settings;
    settings.min_samples = 2;
    settings.top_n = 5;
    ScheduleRecommendations rec = AdaptiveScheduleAdvisor::recommendSchedule(morningPerson(), settings);
    ASSERT_EQ(rec.best_review_times.size(), 3u);
    EXPECT_EQ(rec.best_review_times[1].hour, 14);
}

TEST(AdaptiveScheduleAdvisorTest, WeeklyPlanFallsBackToBestHour) {
    std::vector<ReviewEvent> log = morningPerson();
    // Fridays at 18:00, enough to stand on their own
    for (int week = 0; week < 3; ++week) {
        log.push_back(event("f", at(4 + 7 * week, 18), 4));
    }

    ScheduleRecommendations rec = AdaptiveScheduleAdvisor::recommendSchedule(log);
    ASSERT_EQ(rec.suggested_schedule.size(), 7u);
    for (const auto& plan : rec.suggested_schedule) {
        EXPECT_EQ(plan.duration_minutes, rec.optimal_session_length_minutes);
        if (plan.day_of_week == 4) {
            EXPECT_TRUE(plan.from_day_data);
            EXPECT_EQ(plan.hour, 18);
        }
        else {
            EXPECT_FALSE(plan.from_day_data);
            EXPECT_EQ(plan.hour, 9);
        }
    }
}

TEST(AdaptiveScheduleAdvisorTest, SessionLengthStopsWhereReturnsLevelOff) {
    std::vector<ReviewEvent> log;
    addSession(log, 0, 2, 60, 1);     // 2 min, half failed
    addSession(log, 1, 10, 150, 0);   // 25 min, clean
    addSession(log, 2, 20, 150, 0);   // 50 min, clean
    EXPECT_EQ(AdaptiveScheduleAdvisor::optimalSessionLength(log, AdvisorSettings()), 30);
}

TEST(AdaptiveScheduleAdvisorTest, SessionLengthIsClamped) {
    std::vector<ReviewEvent> log;
    addSession(log, 0, 30, 300, 0);   // 150 min
    EXPECT_EQ(AdaptiveScheduleAdvisor::optimalSessionLength(log, AdvisorSettings()), 60);

    log.clear();
    addSession(log, 0, 1, 20, 0);
    EXPECT_EQ(AdaptiveScheduleAdvisor::optimalSessionLength(log, AdvisorSettings()), 10);
}

TEST(AdaptiveScheduleAdvisorTest, ConsistencyRewardsFixedTimeOfDay) {
    std::vector<ReviewEvent> regular;
    for (int day = 0; day < 5; ++day) regular.push_back(event("a", at(day, 9), 4));
    EXPECT_DOUBLE_EQ(AdaptiveScheduleAdvisor::consistencyScore(regular), 100.0);

    std::vector<ReviewEvent> erratic = {
        event("a", at(0, 2), 4),
        event("a", at(1, 23), 4),
        event("a", at(2, 7), 4),
        event("a", at(3, 16), 4),
    };
    double score = AdaptiveScheduleAdvisor::consistencyScore(erratic);
    EXPECT_GT(score, 0.0);
    EXPECT_LT(score, 100.0);

    EXPECT_EQ(AdaptiveScheduleAdvisor::consistencyScore({ event("a", at(0, 9), 4) }), 0.0);
}

TEST(AdaptiveScheduleAdvisorTest, RecommendUsesHistoryWindow) {
    MemoryReviewEventStore store;
    for (const auto& e : morningPerson()) store.append(e);
    // Old dawn reviews outside the window would otherwise win the tie with 09:00
    for (int day = 0; day < 3; ++day) store.append(event("old", at(day - 60, 6), 5));

    AdaptiveScheduleAdvisor advisor(store);
    ScheduleRecommendations rec = advisor.recommend(30, at(3));
    ASSERT_FALSE(rec.best_review_times.empty());
    EXPECT_EQ(rec.best_review_times[0].hour, 9);

    EXPECT_THROW(advisor.recommend(-1, at(3)), ValidationError);
}

TEST(AdaptiveScheduleAdvisorTest, FormatsHours) {
    EXPECT_EQ(AdaptiveScheduleAdvisor::formatHour(7), "07:00");
    EXPECT_EQ(AdaptiveScheduleAdvisor::formatHour(21), "21:00");
}
