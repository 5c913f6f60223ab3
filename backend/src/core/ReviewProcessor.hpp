#pragma once
#include <ctime>
#include <optional>
#include <string>
#include "Item.hpp"
#include "ItemStore.hpp"
#include "ReviewEvent.hpp"
#include "ReviewEventStore.hpp"
#include "ScheduleConfig.hpp"

struct ReviewRequest {
    std::string item_id;
    int quality = 0;
    int time_spent_seconds = 0;
    std::time_t submitted_at = 0;           // Together with item_id, the submission identity
    std::optional<ItemVersion> expected_version; // Version the learner saw; defaults to current
};

struct ReviewResult {
    Item item;                  // State after the review
    ReviewEvent event;
    bool duplicate = false;     // Submission had already been applied; nothing changed
    MasteryLevel previous_mastery = MasteryLevel::NEW;
    MasteryLevel new_mastery = MasteryLevel::NEW;
    bool mastery_changed = false;
};

/*
  Applies review submissions to stored items.

  Same-item submissions are serialized with optimistic concurrency: the new
  state is written with ItemStore::compareAndSwap against the version that
  was read (or supplied by the caller). Losers get ConflictError and must
  re-read; nothing is merged or retried here.

  A retried submission (same item_id and submitted_at) that finds its event
  already logged is a no-op.
*/
class ReviewProcessor {
public:
    ReviewProcessor(ItemStore& items, ReviewEventStore& events);

    ReviewResult submitReview(const ReviewRequest& request, const ScheduleConfig& cfg);

    // Adds a new item, immediately due. An empty id gets a generated one.
    Item enroll(const std::string& id, const std::string& item_type, std::time_t now);

    // Back to the freshly-enrolled state (history is kept)
    Item resetItem(const std::string& id, std::time_t now);

private:
    ItemStore& itemStore;
    ReviewEventStore& eventStore;

    std::optional<ReviewEvent> findExisting(const std::string& item_id, std::time_t submitted_at) const;
};
