#include "QueueManager.hpp"
#include "Errors.hpp"
#include "RetentionEstimator.hpp"
#include "TimeUtils.hpp"
#include <algorithm>
#include <random>

QueueManager::QueueManager(const ItemStore* itemStore)
    : store(itemStore)
{
}

int QueueManager::newItemsStartedToday(const std::vector<Item>& items, std::time_t now) {
    long long today = TimeUtils::dayIndex(now);
    int count = 0;
    for (const auto& item : items) {
        if (item.first_review_at && TimeUtils::dayIndex(*item.first_review_at) == today) ++count;
    }
    return count;
}

std::vector<const Item*> QueueManager::select(const ScheduleConfig& cfg, const std::vector<Item>& items, std::time_t now) {
    cfg.validate();

    struct Ranked {
        const Item* item;
        double retention;
    };

    std::vector<Ranked> due;
    std::vector<const Item*> fresh;

    for (const auto& item : items) {
        if (item.isNew()) {
            if (!item.next_review_at || *item.next_review_at <= now) fresh.push_back(&item);
        }
        else if (item.isDue(now)) {
            due.push_back({ &item, RetentionEstimator::estimateRetention(item, now, cfg.retention_decay_scale) });
        }
    }

    if (cfg.review_order == ReviewOrder::RANDOM) {
        std::random_device rd;
        std::mt19937_64 eng(rd());
        std::shuffle(due.begin(), due.end(), eng);
    }
    else {
        // Most at risk of being forgotten first
        std::sort(due.begin(), due.end(),
            [](const Ranked& a, const Ranked& b) {
                if (a.retention != b.retention) return a.retention < b.retention;
                if (*a.item->next_review_at != *b.item->next_review_at)
                    return *a.item->next_review_at < *b.item->next_review_at;
                return a.item->id < b.item->id;
            });
    }

    // Oldest first so no new item waits forever
    std::sort(fresh.begin(), fresh.end(),
        [](const Item* a, const Item* b) {
            if (a->created_at != b->created_at) return a->created_at < b->created_at;
            return a->id < b->id;
        });

    size_t limit = static_cast<size_t>(cfg.daily_review_limit);
    int quota = std::max(0, cfg.new_items_per_day - newItemsStartedToday(items, now));

    std::vector<const Item*> out;
    out.reserve(std::min(limit, due.size() + fresh.size()));

    for (const auto& r : due) {
        if (out.size() >= limit) break;
        out.push_back(r.item);
    }
    for (const auto* item : fresh) {
        if (out.size() >= limit || quota <= 0) break;
        out.push_back(item);
        --quota;
    }

    spdlog::debug("Session: {} due, {} new candidates, {} selected (limit {}, order {})",
        due.size(), fresh.size(), out.size(), limit, ScheduleConfig::orderName(cfg.review_order));
    return out;
}

std::vector<std::string> QueueManager::buildSession(const ScheduleConfig& cfg, const std::vector<Item>& items, std::time_t now) {
    std::vector<std::string> ids;
    for (const auto* item : select(cfg, items, now)) {
        ids.push_back(item->id);
    }
    return ids;
}

SessionPlan QueueManager::planSession(const ScheduleConfig& cfg, const std::vector<Item>& items, std::time_t now) {
    SessionPlan plan;
    auto selected = select(cfg, items, now);

    for (size_t i = 0; i < selected.size(); ++i) {
        const Item& item = *selected[i];

        SessionEntry e;
        e.item_id = item.id;
        e.position = static_cast<int>(i) + 1;
        e.estimated_seconds = estimateReviewSeconds(item);
        e.break_after = (e.position % cfg.break_interval == 0) && (i + 1 < selected.size());
        e.is_new = item.isNew();
        e.retention = RetentionEstimator::estimateRetention(item, now, cfg.retention_decay_scale);

        plan.total_estimated_seconds += e.estimated_seconds;
        if (e.is_new) ++plan.new_count;
        else ++plan.review_count;

        plan.entries.push_back(e);
    }

    spdlog::info("Planned session: {} entries ({} new), ~{} min",
        plan.entries.size(), plan.new_count, plan.total_estimated_seconds / 60);
    return plan;
}

std::vector<std::string> QueueManager::buildSession(const ScheduleConfig& cfg, std::time_t now) const {
    if (!store) throw ValidationError("QueueManager has no ItemStore bound");
    return buildSession(cfg, store->listAll(), now);
}

SessionPlan QueueManager::planSession(const ScheduleConfig& cfg, std::time_t now) const {
    if (!store) throw ValidationError("QueueManager has no ItemStore bound");
    return planSession(cfg, store->listAll(), now);
}

// Harder items take longer; base is one minute
int QueueManager::estimateReviewSeconds(const Item& item) {
    double seconds = 60.0;
    if (item.ease_factor < 2.0) seconds *= 1.5;
    else if (item.ease_factor > 2.3) seconds *= 0.8;
    return static_cast<int>(seconds);
}

UrgencyLevel QueueManager::urgencyLevel(const Item& item, std::time_t now) {
    if (item.isNew()) {
        if (!item.next_review_at || *item.next_review_at <= now) return UrgencyLevel::NEW;
        return UrgencyLevel::NOT_DUE;
    }
    if (!item.isDue(now)) return UrgencyLevel::NOT_DUE;

    long long overdue = TimeUtils::dayIndex(now) - TimeUtils::dayIndex(*item.next_review_at);
    if (overdue <= 0) return UrgencyLevel::DUE_TODAY;
    if (overdue <= 3) return UrgencyLevel::OVERDUE;
    return UrgencyLevel::VERY_OVERDUE;
}

const char* QueueManager::urgencyName(UrgencyLevel level) {
    switch (level) {
    case UrgencyLevel::NOT_DUE: return "not_due";
    case UrgencyLevel::NEW: return "new";
    case UrgencyLevel::DUE_TODAY: return "due_today";
    case UrgencyLevel::OVERDUE: return "overdue";
    case UrgencyLevel::VERY_OVERDUE: return "very_overdue";
    }
    return "unknown";
}
