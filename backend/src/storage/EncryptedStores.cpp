#include "EncryptedStores.hpp"
#include "Storage.hpp"
#include "../core/Errors.hpp"
#include <algorithm>
#include <spdlog/spdlog.h>

EncryptedItemStore::EncryptedItemStore(const std::string& file, const LearnerKey& k)
    : filename(file), learnerKey(k)
{
    if (!learnerKey.isUnlocked()) {
        throw StorageError("Learner key is locked; cannot open '" + filename + "'");
    }

    std::vector<Item> loaded;
    if (!Storage::loadItems(loaded, filename, learnerKey.key())) {
        throw StorageError("Cannot read item file '" + filename + "'");
    }
    for (const auto& it : loaded) {
        items[it.id] = it;
    }
    spdlog::info("EncryptedItemStore opened '{}' with {} items", filename, items.size());
}

void EncryptedItemStore::flush() {
    std::lock_guard<std::mutex> lock(mtx);
    if (!Storage::saveItems(snapshotLocked(), filename, learnerKey.key())) {
        throw StorageError("Cannot write item file '" + filename + "'");
    }
}

bool EncryptedItemStore::onChanged(const std::vector<Item>& snapshot) {
    if (!learnerKey.isUnlocked()) {
        spdlog::error("Refusing to write '{}': learner key is locked", filename);
        return false;
    }
    return Storage::saveItems(snapshot, filename, learnerKey.key());
}

EncryptedReviewEventStore::EncryptedReviewEventStore(const std::string& file, const LearnerKey& k)
    : filename(file), learnerKey(k)
{
    if (!learnerKey.isUnlocked()) {
        throw StorageError("Learner key is locked; cannot open '" + filename + "'");
    }

    std::vector<ReviewEvent> loaded;
    if (!Storage::loadEvents(loaded, filename, learnerKey.key())) {
        throw StorageError("Cannot read review log '" + filename + "'");
    }
    events = std::move(loaded);
    std::stable_sort(events.begin(), events.end(),
        [](const ReviewEvent& a, const ReviewEvent& b) { return a.submitted_at < b.submitted_at; });
    spdlog::info("EncryptedReviewEventStore opened '{}' with {} events", filename, events.size());
}

void EncryptedReviewEventStore::flush() {
    std::lock_guard<std::mutex> lock(mtx);
    if (!Storage::saveEvents(events, filename, learnerKey.key())) {
        throw StorageError("Cannot write review log '" + filename + "'");
    }
}

bool EncryptedReviewEventStore::onChanged(const std::vector<ReviewEvent>& all) {
    if (!learnerKey.isUnlocked()) {
        spdlog::error("Refusing to write '{}': learner key is locked", filename);
        return false;
    }
    return Storage::saveEvents(all, filename, learnerKey.key());
}
