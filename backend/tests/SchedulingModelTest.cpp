#include <gtest/gtest.h>
#include <cmath>
#include "../src/core/SchedulingModel.hpp"
#include "../src/core/Errors.hpp"
#include "TestHelpers.hpp"

using namespace TestHelpers;

TEST(SchedulingModel, RejectsQualityOutOfRange) {
    Item it = newItem("a", BASE);
    ScheduleConfig cfg;
    EXPECT_THROW(SchedulingModel::applyReview(it, -1, BASE, cfg), ValidationError);
    EXPECT_THROW(SchedulingModel::applyReview(it, 6, BASE, cfg), ValidationError);
}

TEST(SchedulingModel, FailureResetsRepetitionsAndInterval) {
    ScheduleConfig cfg;
    Item it = reviewedItem("a", 40, 2.4, 6, at(0));
    for (int q = 0; q <= 2; ++q) {
        ScheduleUpdate u = SchedulingModel::applyReview(it, q, at(40), cfg);
        EXPECT_EQ(u.repetitions, 0) << "q=" << q;
        EXPECT_EQ(u.interval_days, cfg.initial_intervals[0]) << "q=" << q;
        EXPECT_LT(u.ease_factor, it.ease_factor) << "q=" << q;
    }
}

TEST(SchedulingModel, HigherQualityNeverLowersEase) {
    ScheduleConfig cfg;
    Item it = reviewedItem("a", 10, 2.2, 3, at(0));
    double prev = 0.0;
    for (int q = 3; q <= 5; ++q) {
        double ef = SchedulingModel::applyReview(it, q, at(10), cfg).ease_factor;
        EXPECT_GE(ef, prev);
        prev = ef;
    }
    EXPECT_GE(SchedulingModel::applyReview(it, 5, at(10), cfg).ease_factor,
              SchedulingModel::applyReview(it, 3, at(10), cfg).ease_factor);
}

TEST(SchedulingModel, EaseNeverBelowMinimum) {
    ScheduleConfig cfg;
    cfg.minimum_ease_factor = 1.3;
    Item it = newItem("a", BASE);
    std::time_t now = BASE;
    int qualities[] = { 0, 1, 2, 0, 0, 3, 1, 0, 2, 0, 0, 0 };
    for (int q : qualities) {
        ScheduleUpdate u = SchedulingModel::applyReview(it, q, now, cfg);
        SchedulingModel::apply(it, u);
        EXPECT_GE(it.ease_factor, cfg.minimum_ease_factor);
        now = u.next_review_at;
    }
    EXPECT_DOUBLE_EQ(it.ease_factor, 1.3);
}

TEST(SchedulingModel, NextReviewIsLastReviewPlusInterval) {
    ScheduleConfig cfg;
    Item it = reviewedItem("a", 6, 2.5, 2, at(0));
    ScheduleUpdate u = SchedulingModel::applyReview(it, 4, at(6, 9), cfg);
    EXPECT_EQ(u.last_review_at, at(6, 9));
    EXPECT_EQ(u.next_review_at, u.last_review_at + u.interval_days * TimeUtils::SECONDS_PER_DAY);
}

TEST(SchedulingModel, FollowsInitialIntervalsThenGrows) {
    ScheduleConfig cfg;
    Item it = newItem("a", BASE);

    ScheduleUpdate u1 = SchedulingModel::applyReview(it, 4, at(0), cfg);
    SchedulingModel::apply(it, u1);
    EXPECT_EQ(it.repetitions, 1);
    EXPECT_EQ(it.interval_days, 1);

    ScheduleUpdate u2 = SchedulingModel::applyReview(it, 4, at(6), cfg);
    SchedulingModel::apply(it, u2);
    EXPECT_EQ(it.repetitions, 2);
    EXPECT_EQ(it.interval_days, 6);

    ScheduleUpdate u3 = SchedulingModel::applyReview(it, 5, at(12), cfg);
    SchedulingModel::apply(it, u3);
    EXPECT_EQ(it.repetitions, 3);
    EXPECT_GT(it.ease_factor, 2.5);
    EXPECT_EQ(it.interval_days, static_cast<int>(std::llround(6 * it.ease_factor)));
}

TEST(SchedulingModel, LapseOfMatureItem) {
    ScheduleConfig cfg;
    Item it = reviewedItem("a", 30, 2.6, 5, at(0));
    ScheduleUpdate u = SchedulingModel::applyReview(it, 1, at(30), cfg);
    EXPECT_EQ(u.repetitions, 0);
    EXPECT_EQ(u.interval_days, 1);
    EXPECT_LT(u.ease_factor, 2.6);
}

TEST(SchedulingModel, CustomInitialIntervals) {
    ScheduleConfig cfg;
    cfg.initial_intervals = { {2, 5} };
    Item it = newItem("a", BASE);
    EXPECT_EQ(SchedulingModel::applyReview(it, 0, BASE, cfg).interval_days, 2);
    it.repetitions = 1;
    EXPECT_EQ(SchedulingModel::applyReview(it, 3, BASE, cfg).interval_days, 5);
}

TEST(SchedulingModel, EaseFormulaValues) {
    EXPECT_NEAR(SchedulingModel::nextEaseFactor(2.5, 5, 1.3), 2.6, 1e-9);
    EXPECT_NEAR(SchedulingModel::nextEaseFactor(2.5, 4, 1.3), 2.5, 1e-9);
    EXPECT_NEAR(SchedulingModel::nextEaseFactor(2.5, 3, 1.3), 2.36, 1e-9);
    EXPECT_NEAR(SchedulingModel::nextEaseFactor(1.4, 0, 1.3), 1.3, 1e-9);
}

TEST(SchedulingModel, GrowthIntervalAtLeastOneDay) {
    ScheduleConfig cfg;
    cfg.minimum_ease_factor = 0.1;
    Item it = reviewedItem("a", 0, 0.2, 2, at(0));
    EXPECT_EQ(SchedulingModel::applyReview(it, 3, at(1), cfg).interval_days, 1);
}

TEST(SchedulingModel, MasteryLevelsFromInterval) {
    EXPECT_EQ(Item::masteryFor(0), MasteryLevel::NEW);
    EXPECT_EQ(Item::masteryFor(1), MasteryLevel::LEARNING);
    EXPECT_EQ(Item::masteryFor(6), MasteryLevel::LEARNING);
    EXPECT_EQ(Item::masteryFor(7), MasteryLevel::YOUNG);
    EXPECT_EQ(Item::masteryFor(20), MasteryLevel::YOUNG);
    EXPECT_EQ(Item::masteryFor(21), MasteryLevel::MATURE);
    EXPECT_STREQ(Item::masteryName(MasteryLevel::MATURE), "mature");
}

TEST(SchedulingModel, QualityEnumMatchesScale) {
    EXPECT_EQ(static_cast<int>(ReviewQuality::BLACKOUT), SchedulingModel::MIN_QUALITY);
    EXPECT_EQ(static_cast<int>(ReviewQuality::DIFFICULT), SchedulingModel::PASSING_QUALITY);
    EXPECT_EQ(static_cast<int>(ReviewQuality::PERFECT), SchedulingModel::MAX_QUALITY);
}

TEST(SchedulingModel, GrowthIsCappedAtFiftyYears) {
    ScheduleConfig cfg;
    Item veteran = reviewedItem("a", 18000, 2.5, 10, at(0));
    EXPECT_EQ(SchedulingModel::applyReview(veteran, 5, at(18000), cfg).interval_days, SchedulingModel::MAX_INTERVAL_DAYS);

    // Would overflow int without the cap
    Item huge = reviewedItem("b", 1000000000, 2.5, 40, at(0));
    ScheduleUpdate u = SchedulingModel::applyReview(huge, 5, at(1), cfg);
    EXPECT_EQ(u.interval_days, 365 * 50);
    EXPECT_GT(u.next_review_at, at(1));
}

TEST(SchedulingModel, AdaptiveIntervalsFollowPerformance) {
    Item it = reviewedItem("a", 10, 2.5, 3, at(0));

    AdaptiveIntervals standard = SchedulingModel::adaptiveIntervals(it, std::nullopt, {});
    EXPECT_EQ(standard.minimum_days, 8);
    EXPECT_EQ(standard.recommended_days, 10);
    EXPECT_EQ(standard.maximum_days, 12);
    EXPECT_EQ(standard.reason, "Standard interval based on current performance");

    std::vector<ReviewEvent> strong = { event("a", at(0), 5), event("a", at(1), 5), event("a", at(2), 5) };
    AdaptiveIntervals extended = SchedulingModel::adaptiveIntervals(it, 0.95, strong);
    EXPECT_EQ(extended.minimum_days, 10);
    EXPECT_EQ(extended.recommended_days, 13);
    EXPECT_EQ(extended.maximum_days, 15);
    EXPECT_EQ(extended.reason, "Extended due to high success rate (95%)");

    std::vector<ReviewEvent> weak = { event("a", at(0), 2), event("a", at(1), 3), event("a", at(2), 3) };
    AdaptiveIntervals shortened = SchedulingModel::adaptiveIntervals(it, 0.5, weak);
    EXPECT_EQ(shortened.minimum_days, 5);
    EXPECT_EQ(shortened.recommended_days, 7);
    EXPECT_EQ(shortened.maximum_days, 8);
    EXPECT_EQ(shortened.reason, "Shortened due to lower success rate (50%)");
}

TEST(SchedulingModel, AdaptiveIntervalsNeverBelowOneDay) {
    AdaptiveIntervals fresh = SchedulingModel::adaptiveIntervals(newItem("n", at(0)), 0.1, {});
    EXPECT_EQ(fresh.minimum_days, 1);
    EXPECT_EQ(fresh.recommended_days, 1);
}
