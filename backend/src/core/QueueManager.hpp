#pragma once
#include <ctime>
#include <string>
#include <vector>
#include "Item.hpp"
#include "ItemStore.hpp"
#include "ScheduleConfig.hpp"

enum class UrgencyLevel {
    NOT_DUE,
    NEW,
    DUE_TODAY,
    OVERDUE,        // 1-3 days late
    VERY_OVERDUE
};

struct SessionEntry {
    std::string item_id;
    int position = 0;               // 1-based
    int estimated_seconds = 0;
    bool break_after = false;
    bool is_new = false;
    double retention = 1.0;
};

struct SessionPlan {
    std::vector<SessionEntry> entries;
    int total_estimated_seconds = 0;
    int new_count = 0;
    int review_count = 0;
};

/*
  Builds today's review session:
    - due (already reviewed, next_review_at <= now) items always come first,
    - then never-reviewed items, oldest created first, up to what is left of
      today's new-item quota,
    - never more than daily_review_limit entries in total.
  An empty session is the normal "caught up" result.
*/
class QueueManager {
public:
    explicit QueueManager(const ItemStore* store = nullptr);

    static std::vector<std::string> buildSession(const ScheduleConfig& cfg, const std::vector<Item>& items, std::time_t now);
    static SessionPlan planSession(const ScheduleConfig& cfg, const std::vector<Item>& items, std::time_t now);

    // Same, over the bound store's current contents
    std::vector<std::string> buildSession(const ScheduleConfig& cfg, std::time_t now) const;
    SessionPlan planSession(const ScheduleConfig& cfg, std::time_t now) const;

    static UrgencyLevel urgencyLevel(const Item& item, std::time_t now);
    static const char* urgencyName(UrgencyLevel level);

    static int estimateReviewSeconds(const Item& item);

    // New items already started today (first review on today's date)
    static int newItemsStartedToday(const std::vector<Item>& items, std::time_t now);

private:
    const ItemStore* store;

    static std::vector<const Item*> select(const ScheduleConfig& cfg, const std::vector<Item>& items, std::time_t now);
};
