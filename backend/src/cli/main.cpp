#include <iostream>
#include <fstream>
#include <sstream>
#include <vector>
#include <string>
#include <memory>
#include <chrono>
#include <ctime>
#include <cstdlib>
#include <iomanip>
#include <limits>
#include <optional>
#include <sodium.h>

#include "../utils/logging.hpp"
#include "../core/Errors.hpp"
#include "../core/ScheduleConfig.hpp"
#include "../core/SchedulingModel.hpp"
#include "../core/RetentionEstimator.hpp"
#include "../core/QueueManager.hpp"
#include "../core/ReviewProcessor.hpp"
#include "../core/PerformanceAnalytics.hpp"
#include "../core/AdaptiveScheduleAdvisor.hpp"
#include "../core/WorkloadForecaster.hpp"
#include "../core/TimeUtils.hpp"
#include "../storage/EncryptedStores.hpp"
#include "../storage/LearnerKey.hpp"
#include "../storage/LearnerFiles.hpp"

ScheduleConfig loadConfig(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        spdlog::info("No config at '{}'; using defaults", path);
        return ScheduleConfig();
    }
    std::stringstream ss;
    ss << in.rdbuf();
    return ScheduleConfig::deserialize(ss.str());
}

std::string formatTime(const std::optional<std::time_t>& t) {
    if (!t) return "-";
    std::tm tm{};
    gmtime_r(&*t, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%d %H:%M");
    return oss.str();
}

void listAllItems(const std::vector<Item>& items, const ScheduleConfig& cfg, std::time_t now) {
    std::cout << "\n===== ALL ITEMS =====\n";

    if (items.empty()) {
        std::cout << "No items stored.\n";
        return;
    }

    for (size_t i = 0; i < items.size(); i++) {
        const Item& it = items[i];
        double r = RetentionEstimator::estimateRetention(it, now, cfg.retention_decay_scale);

        std::cout << i + 1 << ". " << it.id;
        if (!it.item_type.empty()) std::cout << " [" << it.item_type << "]";
        std::cout << "\n";
        std::cout << "   Mastery: " << Item::masteryName(it.masteryLevel())
            << " | Urgency: " << QueueManager::urgencyName(QueueManager::urgencyLevel(it, now)) << "\n";
        std::cout << "   Interval: " << it.interval_days << " days | Ease: "
            << std::fixed << std::setprecision(2) << it.ease_factor
            << " | Repetitions: " << it.repetitions << "\n";
        std::cout << "   Retention: " << std::setprecision(0) << r * 100.0 << "%"
            << " | Last review: " << formatTime(it.last_review_at)
            << " | Next review: " << formatTime(it.next_review_at) << "\n";
        std::cout << "-----------------------------\n";
    }
}

int askInt(const std::string& prompt, int lo, int hi) {
    while (true) {
        std::cout << prompt;
        int v;
        if (std::cin >> v && v >= lo && v <= hi) {
            std::cin.ignore(std::numeric_limits<std::streamsize>::max(), '\n');
            return v;
        }
        if (std::cin.eof()) std::exit(0);
        std::cin.clear();
        std::cin.ignore(std::numeric_limits<std::streamsize>::max(), '\n');
        std::cout << "Invalid input.\n";
    }
}

int askQuality() {
    std::cout << "\nHow well did you recall it?\n";
    for (int q = SchedulingModel::MIN_QUALITY; q <= SchedulingModel::MAX_QUALITY; ++q) {
        std::cout << " " << q << " = " << SchedulingModel::describeQuality(q) << "\n";
    }
    return askInt("> ", SchedulingModel::MIN_QUALITY, SchedulingModel::MAX_QUALITY);
}

// Suggested range for the item's next gap, from its own review history
void showIntervalRange(const Item& item, const ReviewEventStore& events, std::time_t now) {
    std::vector<ReviewEvent> history;
    int successes = 0;
    for (const auto& e : events.query(0, now)) {
        if (e.item_id != item.id) continue;
        history.push_back(e);
        if (e.successful()) ++successes;
    }
    std::optional<double> rate;
    if (!history.empty()) rate = static_cast<double>(successes) / history.size();

    AdaptiveIntervals range = SchedulingModel::adaptiveIntervals(item, rate, history);
    std::cout << "Suggested range: " << range.minimum_days << "-" << range.maximum_days
        << " day(s). " << range.reason << "\n";
}

void reviewSession(ItemStore& items, const ReviewEventStore& events, ReviewProcessor& processor, const ScheduleConfig& cfg) {
    std::time_t now = std::time(nullptr);
    QueueManager queue(&items);
    SessionPlan plan = queue.planSession(cfg, now);

    if (plan.entries.empty()) {
        std::cout << "All caught up. Nothing due.\n";
        return;
    }

    std::cout << "\nSession: " << plan.entries.size() << " items (" << plan.new_count << " new), about "
        << (plan.total_estimated_seconds + 59) / 60 << " min\n";

    for (const auto& entry : plan.entries) {
        Item item;
        try {
            item = items.get(entry.item_id);
        }
        catch (const NotFoundError&) {
            std::cout << "Item " << entry.item_id << " is gone; skipping.\n";
            continue;
        }

        std::cout << "\n[" << entry.position << "/" << plan.entries.size() << "] " << item.id;
        if (!item.item_type.empty()) std::cout << " (" << item.item_type << ")";
        std::cout << "\n   " << (entry.is_new ? "New item" : "Retention ")
            << (entry.is_new ? "" : std::to_string(static_cast<int>(entry.retention * 100.0)) + "%") << "\n";

        auto started = std::chrono::steady_clock::now();
        int q = askQuality();
        auto spent = std::chrono::duration_cast<std::chrono::seconds>(std::chrono::steady_clock::now() - started);

        ReviewRequest req;
        req.item_id = item.id;
        req.quality = q;
        req.time_spent_seconds = static_cast<int>(spent.count());
        req.submitted_at = std::time(nullptr);
        req.expected_version = item.version();

        try {
            ReviewResult res = processor.submitReview(req, cfg);
            std::cout << "Next review in " << res.item.interval_days << " day(s).\n";
            showIntervalRange(res.item, events, req.submitted_at);
            if (res.mastery_changed) {
                std::cout << "Mastery: " << Item::masteryName(res.previous_mastery)
                    << " -> " << Item::masteryName(res.new_mastery) << "\n";
            }
        }
        catch (const ConflictError& e) {
            std::cout << "Item changed elsewhere; review not recorded (" << e.what() << ").\n";
        }

        if (entry.break_after) {
            std::cout << "\nTime for a short break. Stand up and stretch.\n";
        }
    }
}

void showPerformance(const PerformanceAnalytics& analytics) {
    int days = askInt("Window in days (1-365): ", 1, 365);
    PerformanceStats s = analytics.compute(days, std::time(nullptr));

    std::cout << "\n===== PERFORMANCE (last " << days << " days) =====\n";
    std::cout << "Reviews: " << s.total_reviews << " (" << s.successful_reviews << " successful)\n";
    if (s.success_rate) {
        std::cout << "Success rate: " << std::fixed << std::setprecision(1) << *s.success_rate * 100.0 << "%\n";
        std::cout << "Average quality: " << std::setprecision(2) << *s.average_quality << "\n";
    }
    else {
        std::cout << "Success rate: n/a\n";
    }
    std::cout << "Streak: " << s.current_streak << " day(s), longest " << s.longest_streak << "\n";
    std::cout << "Items: " << s.items_in_system_count << " (" << s.mature_items_count << " mature)\n";
    std::cout << "Trend: " << PerformanceAnalytics::trendName(s.trend) << " | Grade: " << s.grade << "\n";

    std::cout << "Quality distribution:";
    for (size_t q = 0; q < s.quality_distribution.size(); ++q) {
        std::cout << " " << q << "=" << std::setprecision(0) << s.quality_distribution[q] << "%";
    }
    std::cout << "\n";

    for (const auto& d : s.daily_stats) {
        std::cout << "  " << d.date << ": " << d.reviews_count << " reviews, "
            << std::setprecision(0) << d.success_rate * 100.0 << "% ok\n";
    }
    for (const auto& st : s.struggling_items) {
        std::cout << "  Struggling: " << st.item_id << "\n";
    }

    std::cout << "Velocity: " << std::setprecision(1) << s.velocity.items_per_week << " items/week, "
        << s.velocity.mastery_rate << "% mastered, interval growth x" << s.velocity.average_interval_growth << "\n";
    for (const auto& m : s.milestones) {
        std::cout << "  " << TimeUtils::formatDate(m.reached_at) << ": " << m.description << "\n";
    }
    for (const auto& line : s.insights) std::cout << "* " << line << "\n";
    for (const auto& line : s.recommendations) std::cout << "> " << line << "\n";
}

void showAdvice(const AdaptiveScheduleAdvisor& advisor) {
    ScheduleRecommendations rec = advisor.recommend(90, std::time(nullptr));

    std::cout << "\n===== SCHEDULE ADVICE (UTC) =====\n";
    if (rec.best_review_times.empty()) {
        std::cout << "Not enough history yet.\n";
    }
    for (const auto& t : rec.best_review_times) {
        std::cout << "Best: " << AdaptiveScheduleAdvisor::formatHour(t.hour)
            << " (avg quality " << std::fixed << std::setprecision(2) << t.average_quality << ")\n";
    }
    for (const auto& t : rec.avoid_times) {
        std::cout << "Avoid: " << AdaptiveScheduleAdvisor::formatHour(t.hour)
            << " (avg quality " << std::setprecision(2) << t.average_quality << ")\n";
    }
    std::cout << "Session length: " << rec.optimal_session_length_minutes << " min\n";
    std::cout << "Consistency: " << std::setprecision(0) << rec.consistency_score << "/100\n";
    for (const auto& p : rec.suggested_schedule) {
        std::cout << "  " << TimeUtils::weekdayName(p.day_of_week) << " "
            << AdaptiveScheduleAdvisor::formatHour(p.hour) << " for " << p.duration_minutes << " min\n";
    }
}

void showForecast(const WorkloadForecaster& forecaster) {
    int days = askInt("Days ahead (1-90): ", 1, 90);
    auto workload = forecaster.forecast(days, std::time(nullptr));

    std::cout << "\n===== WORKLOAD =====\n";
    for (const auto& d : workload) {
        std::cout << d.date << "  " << std::setw(4) << d.count << "  (total " << d.cumulative << ")"
            << (d.above_average ? "  *" : "") << "\n";
    }
}

void showAtRisk(const ItemStore& items, const ScheduleConfig& cfg) {
    auto alerts = RetentionEstimator::itemsAtRisk(items.listAll(), std::time(nullptr), 0.8, cfg.retention_decay_scale);

    std::cout << "\n===== AT RISK =====\n";
    if (alerts.empty()) std::cout << "Nothing at risk.\n";
    for (const auto& a : alerts) {
        std::cout << a.item_id << ": " << std::fixed << std::setprecision(0) << a.retention * 100.0
            << "% (" << RetentionEstimator::riskName(a.risk) << ", " << a.days_overdue << " day(s) overdue)\n";
    }
}

int main() {
    if (sodium_init() < 0) {
        std::cerr << "Failed to initialize libsodium\n";
        return 1;
    }

    const char* lvl = std::getenv("RECALL_LOG_LEVEL");
    Log::init("recall.log", lvl ? Log::levelFromName(lvl) : spdlog::level::debug);

    std::string learner, passphrase;
    std::cout << "Learner: "; std::getline(std::cin, learner);
    std::cout << "Passphrase: "; std::getline(std::cin, passphrase);
    if (learner.empty() || passphrase.empty()) {
        std::cout << "Empty fields.\n";
        return 1;
    }
    if (!LearnerFiles::isValidName(learner)) {
        std::cout << "Learner name may only use letters, digits, '-', '_' and '.'.\n";
        return 1;
    }

    LearnerKey key(LearnerFiles::saltFile(learner));
    bool unlocked = key.unlock(passphrase);
    sodium_memzero(&passphrase[0], passphrase.size());
    if (!unlocked) {
        std::cout << "Could not derive key.\n";
        return 1;
    }

    ScheduleConfig cfg;
    std::unique_ptr<EncryptedItemStore> items;
    std::unique_ptr<EncryptedReviewEventStore> events;
    try {
        cfg = loadConfig(LearnerFiles::configFile(learner));
        items = std::make_unique<EncryptedItemStore>(LearnerFiles::itemFile(learner), key);
        events = std::make_unique<EncryptedReviewEventStore>(LearnerFiles::reviewFile(learner), key);
    }
    catch (const ValidationError& e) {
        std::cout << "Invalid settings: " << e.what() << "\n";
        return 1;
    }
    catch (const StorageError& e) {
        std::cout << "Cannot open data (wrong passphrase?): " << e.what() << "\n";
        return 1;
    }

    ReviewProcessor processor(*items, *events);
    PerformanceAnalytics analytics(*events, *items);
    AdaptiveScheduleAdvisor advisor(*events);
    WorkloadForecaster forecaster(*items);

    // MAIN LOOP
    while (true) {
        std::cout << "\n===== MAIN MENU =====\n"
            "Learner: " << learner << "\n"
            "1. Add Item\n"
            "2. Review Session\n"
            "3. List All Items\n"
            "4. Performance\n"
            "5. Schedule Advice\n"
            "6. Workload Forecast\n"
            "7. Items At Risk\n"
            "8. Reset Item\n"
            "9. Save & Exit\n";
        int choice = askInt("> ", 1, 9);

        try {
            if (choice == 1) {
                std::string id, type;
                std::cout << "Item id (blank = generate): "; std::getline(std::cin, id);
                std::cout << "Item type (optional): "; std::getline(std::cin, type);
                Item it = processor.enroll(id, type, std::time(nullptr));
                std::cout << "Item " << it.id << " added.\n";
            }
            else if (choice == 2) {
                reviewSession(*items, *events, processor, cfg);
            }
            else if (choice == 3) {
                listAllItems(items->listAll(), cfg, std::time(nullptr));
            }
            else if (choice == 4) {
                showPerformance(analytics);
            }
            else if (choice == 5) {
                showAdvice(advisor);
            }
            else if (choice == 6) {
                showForecast(forecaster);
            }
            else if (choice == 7) {
                showAtRisk(*items, cfg);
            }
            else if (choice == 8) {
                std::string id;
                std::cout << "Item id: "; std::getline(std::cin, id);
                processor.resetItem(id, std::time(nullptr));
                std::cout << "Reset.\n";
            }
            else if (choice == 9) {
                items->flush();
                events->flush();
                key.lock();
                std::cout << "Goodbye!\n";
                break;
            }
        }
        catch (const ValidationError& e) {
            std::cout << "Invalid: " << e.what() << "\n";
        }
        catch (const NotFoundError& e) {
            std::cout << "Not found: " << e.what() << "\n";
        }
        catch (const ConflictError& e) {
            std::cout << "Conflict: " << e.what() << "\n";
        }
        catch (const StorageError& e) {
            std::cout << "Storage error: " << e.what() << "\n";
            spdlog::error("Storage failure: {}", e.what());
        }
    }

    return 0;
}
