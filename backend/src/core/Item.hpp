#pragma once
#include <string>
#include <ctime>
#include <optional>
#include <spdlog/spdlog.h>

enum class MasteryLevel {
    NEW,
    LEARNING,
    YOUNG,
    MATURE
};

// Optimistic-concurrency marker. Any applied review changes at least one of
// these two fields, so equality means "nobody reviewed this item since".
struct ItemVersion {
    int repetitions = 0;
    std::optional<std::time_t> next_review_at;

    bool operator==(const ItemVersion& other) const {
        return repetitions == other.repetitions && next_review_at == other.next_review_at;
    }
    bool operator!=(const ItemVersion& other) const { return !(*this == other); }
};

class Item {
public:
    Item() = default;
    Item(const std::string& id, const std::string& item_type, std::time_t now);

    std::string id;
    std::string item_type;        // Reporting only

    // Scheduler state
    double ease_factor = 2.5;
    int interval_days = 0;        // 0 = never reviewed
    int repetitions = 0;          // Consecutive successes since last failure
    std::time_t created_at = 0;
    std::optional<std::time_t> last_review_at;
    std::optional<std::time_t> next_review_at;

    // Bookkeeping
    std::optional<std::time_t> first_review_at;
    int total_reviews = 0;

    bool isNew() const { return !last_review_at.has_value(); }
    bool isDue(std::time_t now) const;

    MasteryLevel masteryLevel() const;
    ItemVersion version() const;

    // Back to the freshly-enrolled state, keeping id/type/created_at
    void resetSchedule(std::time_t now);

    // Utility
    static std::string generateID();
    static MasteryLevel masteryFor(int interval_days);
    static const char* masteryName(MasteryLevel level);
};
