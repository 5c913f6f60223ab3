#include "ReviewProcessor.hpp"
#include "Errors.hpp"
#include "SchedulingModel.hpp"
#include <string>

ReviewProcessor::ReviewProcessor(ItemStore& items, ReviewEventStore& events)
    : itemStore(items), eventStore(events)
{
}

std::optional<ReviewEvent> ReviewProcessor::findExisting(const std::string& item_id, std::time_t submitted_at) const {
    for (const auto& e : eventStore.query(submitted_at, submitted_at)) {
        if (e.item_id == item_id) return e;
    }
    return std::nullopt;
}

ReviewResult ReviewProcessor::submitReview(const ReviewRequest& request, const ScheduleConfig& cfg) {
    spdlog::info("Review submitted: item={} q={} t={}s", request.item_id, request.quality, request.time_spent_seconds);

    if (!SchedulingModel::isValidQuality(request.quality)) {
        spdlog::warn("Rejected review for {}: quality {} out of range", request.item_id, request.quality);
        throw ValidationError("Quality must be between 0 and 5, got " + std::to_string(request.quality));
    }
    if (request.time_spent_seconds < 0) {
        spdlog::warn("Rejected review for {}: negative time spent", request.item_id);
        throw ValidationError("time_spent_seconds must be >= 0");
    }
    cfg.validate();

    Item current = itemStore.get(request.item_id);
    ItemVersion expected = request.expected_version.value_or(current.version());

    if (expected != current.version()) {
        spdlog::warn("Review for {} based on stale state (repetitions {} vs {})",
            request.item_id, expected.repetitions, current.repetitions);
        throw ConflictError("Item '" + request.item_id + "' changed since it was read");
    }

    ReviewResult result;
    result.previous_mastery = current.masteryLevel();

    if (auto existing = findExisting(request.item_id, request.submitted_at)) {
        spdlog::info("Duplicate submission for {} at {}; already applied", request.item_id, request.submitted_at);
        result.item = current;
        result.event = *existing;
        result.duplicate = true;
        result.new_mastery = result.previous_mastery;
        return result;
    }

    ScheduleUpdate update = SchedulingModel::applyReview(current, request.quality, request.submitted_at, cfg);

    Item next = current;
    SchedulingModel::apply(next, update);
    next.total_reviews += 1;
    if (!next.first_review_at) next.first_review_at = request.submitted_at;

    Item stored = itemStore.compareAndSwap(request.item_id, expected, next);

    ReviewEvent event;
    event.item_id = stored.id;
    event.item_type = stored.item_type;
    event.submitted_at = request.submitted_at;
    event.quality = request.quality;
    event.time_spent_seconds = request.time_spent_seconds;
    event.resulting_interval_days = stored.interval_days;
    event.resulting_ease_factor = stored.ease_factor;
    try {
        eventStore.append(event);
    }
    catch (const StorageError& e) {
        // Without its event the new schedule would be applied again on retry
        spdlog::error("Review log append failed for {}: {}; restoring previous schedule", stored.id, e.what());
        try {
            itemStore.compareAndSwap(stored.id, stored.version(), current);
        }
        catch (const std::runtime_error& rollback) {
            spdlog::error("Could not restore item {}: {}", stored.id, rollback.what());
        }
        throw;
    }

    result.item = stored;
    result.event = event;
    result.new_mastery = stored.masteryLevel();
    result.mastery_changed = result.new_mastery != result.previous_mastery;

    if (result.mastery_changed) {
        spdlog::info("Item {} mastery {} -> {}", stored.id,
            Item::masteryName(result.previous_mastery), Item::masteryName(result.new_mastery));
    }
    if (request.quality < SchedulingModel::PASSING_QUALITY) {
        spdlog::warn("Item {} lapsed (q={}), ease now {:.2f}", stored.id, request.quality, stored.ease_factor);
    }

    return result;
}

Item ReviewProcessor::enroll(const std::string& id, const std::string& item_type, std::time_t now) {
    Item item(id, item_type, now);
    itemStore.insert(item);
    return item;
}

Item ReviewProcessor::resetItem(const std::string& id, std::time_t now) {
    Item current = itemStore.get(id);
    Item fresh = current;
    fresh.resetSchedule(now);
    return itemStore.compareAndSwap(id, current.version(), fresh);
}
