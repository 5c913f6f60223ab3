#include "PerformanceAnalytics.hpp"
#include "AdaptiveScheduleAdvisor.hpp"
#include "Errors.hpp"
#include "TimeUtils.hpp"
#include <algorithm>
#include <cstdio>
#include <map>
#include <numeric>

PerformanceAnalytics::PerformanceAnalytics(const ReviewEventStore& events, const ItemStore& items)
    : eventStore(events), itemStore(items)
{
}

PerformanceStats PerformanceAnalytics::compute(int window_days, std::time_t now) const {
    if (window_days < 0) throw ValidationError("window_days must be >= 0");
    std::time_t from = TimeUtils::addDays(now, -window_days);
    return computeStatistics(eventStore.query(from, now), itemStore.listAll(), window_days, now);
}

PerformanceStats PerformanceAnalytics::computeStatistics(const std::vector<ReviewEvent>& all,
    const std::vector<Item>& items, int window_days, std::time_t now)
{
    if (window_days < 0) throw ValidationError("window_days must be >= 0");

    PerformanceStats stats;
    stats.window_days = window_days;

    // Item population does not depend on the window
    stats.items_in_system_count = static_cast<int>(items.size());
    for (const auto& item : items) {
        MasteryLevel level = item.masteryLevel();
        stats.mastery_counts[static_cast<size_t>(level)] += 1;
        if (item.interval_days >= MASTERY_INTERVAL_DAYS) ++stats.mature_items_count;
    }

    std::time_t from = TimeUtils::addDays(now, -window_days);
    std::vector<ReviewEvent> events;
    for (const auto& e : all) {
        if (e.submitted_at >= from && e.submitted_at <= now) events.push_back(e);
    }
    std::stable_sort(events.begin(), events.end(),
        [](const ReviewEvent& a, const ReviewEvent& b) { return a.submitted_at < b.submitted_at; });

    if (events.empty()) {
        spdlog::debug("computeStatistics: no events in the last {} days", window_days);
        return stats;
    }

    std::array<int, 6> buckets{};
    long long quality_sum = 0;
    for (const auto& e : events) {
        ++stats.total_reviews;
        if (e.successful()) ++stats.successful_reviews;
        quality_sum += e.quality;
        stats.total_time_seconds += e.time_spent_seconds;
        if (e.quality >= 0 && e.quality <= 5) buckets[static_cast<size_t>(e.quality)] += 1;
    }

    double total = static_cast<double>(stats.total_reviews);
    stats.success_rate = stats.successful_reviews / total;
    stats.average_quality = quality_sum / total;
    for (size_t q = 0; q < buckets.size(); ++q) {
        stats.quality_distribution[q] = buckets[q] * 100.0 / total;
    }

    // Per-day breakdown, ascending by date
    std::map<long long, std::pair<int, int>> per_day; // day -> (count, successes)
    for (const auto& e : events) {
        auto& d = per_day[TimeUtils::dayIndex(e.submitted_at)];
        d.first += 1;
        if (e.successful()) d.second += 1;
    }
    for (const auto& p : per_day) {
        DailyStat ds;
        ds.date = TimeUtils::formatDate(static_cast<std::time_t>(p.first * TimeUtils::SECONDS_PER_DAY));
        ds.reviews_count = p.second.first;
        ds.success_rate = static_cast<double>(p.second.second) / p.second.first;
        stats.daily_stats.push_back(ds);
    }

    computeStreaks(events, now, stats);
    stats.struggling_items = findStruggling(events);
    stats.trend = computeTrend(events);
    stats.grade = computeGrade(stats, events);
    stats.velocity = computeVelocity(events);
    stats.milestones = findMilestones(events);
    writeAdvice(events, stats);

    spdlog::debug("computeStatistics: {} reviews, success {:.1f}%, streak {}d",
        stats.total_reviews, *stats.success_rate * 100.0, stats.current_streak);
    return stats;
}

/*
  A streak day has at least one successful review. Walking back from today,
  the first day without one (no reviews, or only failures) ends the current
  streak.
*/
void PerformanceAnalytics::computeStreaks(const std::vector<ReviewEvent>& events, std::time_t now, PerformanceStats& stats) {
    std::vector<long long> good_days;
    for (const auto& e : events) {
        if (e.successful()) good_days.push_back(TimeUtils::dayIndex(e.submitted_at));
    }
    std::sort(good_days.begin(), good_days.end());
    good_days.erase(std::unique(good_days.begin(), good_days.end()), good_days.end());

    int run = 0;
    long long prev = 0;
    for (size_t i = 0; i < good_days.size(); ++i) {
        run = (i > 0 && good_days[i] == prev + 1) ? run + 1 : 1;
        prev = good_days[i];
        stats.longest_streak = std::max(stats.longest_streak, run);
    }

    long long day = TimeUtils::dayIndex(now);
    int current = 0;
    while (std::binary_search(good_days.begin(), good_days.end(), day)) {
        ++current;
        --day;
    }
    stats.current_streak = current;
}

// At least 3 reviews and 2 or more failures among the last 3
std::vector<StrugglingItem> PerformanceAnalytics::findStruggling(const std::vector<ReviewEvent>& events) {
    std::map<std::string, std::vector<const ReviewEvent*>> by_item;
    for (const auto& e : events) by_item[e.item_id].push_back(&e);

    std::vector<StrugglingItem> out;
    for (const auto& p : by_item) {
        const auto& reviews = p.second;
        if (reviews.size() < 3) continue;

        StrugglingItem s;
        s.item_id = p.first;
        int failures = 0;
        for (size_t i = reviews.size() - 3; i < reviews.size(); ++i) {
            s.recent_qualities.push_back(reviews[i]->quality);
            if (!reviews[i]->successful()) ++failures;
        }
        if (failures < 2) continue;

        s.ease_factor = reviews.back()->resulting_ease_factor;
        out.push_back(s);
    }
    return out;
}

// 10-review moving average of quality; compare the first and last five points
PerformanceTrend PerformanceAnalytics::computeTrend(const std::vector<ReviewEvent>& events) {
    if (events.size() < 2) return PerformanceTrend::STABLE;

    const size_t window = 10;
    std::vector<double> moving;
    for (size_t i = 0; i < events.size(); ++i) {
        size_t start = i + 1 >= window ? i + 1 - window : 0;
        double sum = 0.0;
        for (size_t j = start; j <= i; ++j) sum += events[j].quality;
        moving.push_back(sum / static_cast<double>(i - start + 1));
    }

    size_t n = std::min<size_t>(5, moving.size());
    double older = std::accumulate(moving.begin(), moving.begin() + n, 0.0) / n;
    double recent = std::accumulate(moving.end() - n, moving.end(), 0.0) / n;

    if (recent > older) return PerformanceTrend::IMPROVING;
    if (recent < older) return PerformanceTrend::DECLINING;
    return PerformanceTrend::STABLE;
}

/*
  success 40%, consistency 30% (active days / span of days), mastery 30%
  (share of reviewed items whose latest interval reached maturity).
*/
std::string PerformanceAnalytics::computeGrade(const PerformanceStats& stats, const std::vector<ReviewEvent>& events) {
    double success = stats.success_rate.value_or(0.0);

    double consistency = 0.0;
    if (!stats.daily_stats.empty()) {
        long long first = TimeUtils::dayIndex(events.front().submitted_at);
        long long last = TimeUtils::dayIndex(events.back().submitted_at);
        consistency = static_cast<double>(stats.daily_stats.size()) / static_cast<double>(last - first + 1);
    }

    std::map<std::string, int> latest_interval;
    for (const auto& e : events) latest_interval[e.item_id] = e.resulting_interval_days;
    int mastered = 0;
    for (const auto& p : latest_interval) {
        if (p.second >= MASTERY_INTERVAL_DAYS) ++mastered;
    }
    double mastery = latest_interval.empty() ? 0.0 : static_cast<double>(mastered) / latest_interval.size();

    double score = success * 0.4 + consistency * 0.3 + mastery * 0.3;
    if (score >= 0.9) return "A+";
    if (score >= 0.8) return "A";
    if (score >= 0.7) return "B";
    if (score >= 0.6) return "C";
    return "D";
}

LearningVelocity PerformanceAnalytics::computeVelocity(const std::vector<ReviewEvent>& events) {
    LearningVelocity v;
    if (events.empty()) return v;

    std::map<std::string, std::pair<int, int>> by_item; // id -> (first interval, latest interval)
    std::map<std::string, int> review_counts;
    for (const auto& e : events) {
        auto found = by_item.find(e.item_id);
        if (found == by_item.end()) by_item[e.item_id] = { e.resulting_interval_days, e.resulting_interval_days };
        else found->second.second = e.resulting_interval_days;
        review_counts[e.item_id] += 1;
    }

    int mastered = 0;
    double growth_sum = 0.0;
    int growth_count = 0;
    for (const auto& p : by_item) {
        if (p.second.second >= MASTERY_INTERVAL_DAYS) ++mastered;
        if (review_counts[p.first] >= 2) {
            growth_sum += p.second.first > 0 ? static_cast<double>(p.second.second) / p.second.first : 0.0;
            ++growth_count;
        }
    }

    long long span_days = (events.back().submitted_at - events.front().submitted_at) / TimeUtils::SECONDS_PER_DAY;
    if (span_days <= 0) span_days = 1;

    double total_items = static_cast<double>(by_item.size());
    v.items_per_week = total_items / (static_cast<double>(span_days) / 7.0);
    v.mastery_rate = mastered * 100.0 / total_items;
    v.average_interval_growth = growth_count > 0 ? growth_sum / growth_count : 0.0;
    return v;
}

std::vector<Milestone> PerformanceAnalytics::findMilestones(const std::vector<ReviewEvent>& events) {
    std::vector<Milestone> out;

    auto success = std::find_if(events.begin(), events.end(),
        [](const ReviewEvent& e) { return e.successful(); });
    if (success != events.end()) {
        out.push_back({ "first_success", success->submitted_at, "First successful review" });
    }

    auto perfect = std::find_if(events.begin(), events.end(),
        [](const ReviewEvent& e) { return e.quality == 5; });
    if (perfect != events.end()) {
        out.push_back({ "first_perfect", perfect->submitted_at, "First perfect recall" });
    }

    for (size_t count : { 10, 50, 100, 500, 1000 }) {
        if (events.size() < count) break;
        out.push_back({ "reviews_" + std::to_string(count), events[count - 1].submitted_at,
            "Completed " + std::to_string(count) + " reviews" });
    }

    std::stable_sort(out.begin(), out.end(),
        [](const Milestone& a, const Milestone& b) { return a.reached_at < b.reached_at; });
    return out;
}

void PerformanceAnalytics::writeAdvice(const std::vector<ReviewEvent>& events, PerformanceStats& stats) {
    double success = stats.success_rate.value_or(0.0);
    if (success > 0.9) {
        stats.insights.push_back("Excellent performance! Your success rate is above 90%.");
    }
    else if (success < 0.7) {
        stats.insights.push_back("Your success rate is below 70%. Consider reviewing items more frequently.");
    }

    if (stats.current_streak >= 7) {
        stats.insights.push_back("Great job! You're on a " + std::to_string(stats.current_streak) + "-day success streak.");
    }

    ScheduleRecommendations times = AdaptiveScheduleAdvisor::recommendSchedule(events);
    if (!times.best_review_times.empty()) {
        const TimeSlot& best = times.best_review_times.front();
        char buf[96];
        std::snprintf(buf, sizeof(buf), "You perform best at %s (avg quality: %.2f)",
            AdaptiveScheduleAdvisor::formatHour(best.hour).c_str(), best.average_quality);
        stats.insights.push_back(buf);
    }

    if (stats.trend == PerformanceTrend::IMPROVING) {
        stats.insights.push_back("Your performance is improving over time!");
    }
    else if (stats.trend == PerformanceTrend::DECLINING) {
        stats.insights.push_back("Your performance has been declining. Consider adjusting your review schedule.");
    }

    if (stats.total_reviews > 0 && stats.total_time_seconds / stats.total_reviews > 120) {
        stats.recommendations.push_back("Your reviews are taking over 2 minutes on average. "
            "Consider breaking down complex items into smaller pieces.");
    }
    if (!stats.struggling_items.empty()) {
        stats.recommendations.push_back("You have " + std::to_string(stats.struggling_items.size())
            + " items you're struggling with. Consider creating additional notes or examples for these.");
    }
    if (times.consistency_score < 50.0) {
        stats.recommendations.push_back("Your review consistency is below 50%. Try to establish a daily review routine.");
    }
    if (stats.velocity.mastery_rate < 20.0) {
        stats.recommendations.push_back("Less than 20% of your items have reached mastery level. "
            "Focus on quality over quantity when learning new material.");
    }
}

const char* PerformanceAnalytics::trendName(PerformanceTrend trend) {
    switch (trend) {
    case PerformanceTrend::STABLE: return "stable";
    case PerformanceTrend::IMPROVING: return "improving";
    case PerformanceTrend::DECLINING: return "declining";
    }
    return "unknown";
}
