#include "MemoryStores.hpp"
#include "../core/Errors.hpp"
#include <algorithm>
#include <spdlog/spdlog.h>

namespace {

bool isMultiLine(const std::string& s) {
    return s.find_first_of("\r\n") != std::string::npos;
}

// Record files hold ids and types one per line
void checkRecordFields(const std::string& id, const std::string& item_type) {
    if (id.empty()) {
        throw ValidationError("Item id must not be empty");
    }
    if (isMultiLine(id) || isMultiLine(item_type)) {
        spdlog::warn("Rejected item with line break in id or type");
        throw ValidationError("Item id and type must not contain line breaks");
    }
}

} // namespace

MemoryItemStore::MemoryItemStore(const std::vector<Item>& initial) {
    for (const auto& it : initial) {
        items[it.id] = it;
    }
}

Item MemoryItemStore::get(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mtx);
    auto it = items.find(id);
    if (it == items.end()) {
        throw NotFoundError("Item '" + id + "' not found");
    }
    return it->second;
}

Item MemoryItemStore::compareAndSwap(const std::string& id, const ItemVersion& expected, const Item& updated) {
    std::lock_guard<std::mutex> lock(mtx);
    auto it = items.find(id);
    if (it == items.end()) {
        throw NotFoundError("Item '" + id + "' not found");
    }
    checkRecordFields(id, updated.item_type);
    if (it->second.version() != expected) {
        spdlog::warn("CAS conflict on item {}: repetitions {} (expected {})",
            id, it->second.repetitions, expected.repetitions);
        throw ConflictError("Item '" + id + "' was modified concurrently");
    }

    Item previous = it->second;
    it->second = updated;
    it->second.id = id;

    if (!onChanged(snapshotLocked())) {
        it->second = previous;
        throw StorageError("Failed to persist item '" + id + "'");
    }
    return it->second;
}

std::vector<Item> MemoryItemStore::listAll() const {
    std::lock_guard<std::mutex> lock(mtx);
    return snapshotLocked();
}

void MemoryItemStore::insert(const Item& item) {
    checkRecordFields(item.id, item.item_type);
    std::lock_guard<std::mutex> lock(mtx);
    if (items.count(item.id)) {
        throw ConflictError("Item '" + item.id + "' already exists");
    }
    items[item.id] = item;

    if (!onChanged(snapshotLocked())) {
        items.erase(item.id);
        throw StorageError("Failed to persist new item '" + item.id + "'");
    }
}

size_t MemoryItemStore::size() const {
    std::lock_guard<std::mutex> lock(mtx);
    return items.size();
}

bool MemoryItemStore::onChanged(const std::vector<Item>&) {
    return true;
}

std::vector<Item> MemoryItemStore::snapshotLocked() const {
    std::vector<Item> out;
    out.reserve(items.size());
    for (const auto& p : items) out.push_back(p.second);
    return out;
}

MemoryReviewEventStore::MemoryReviewEventStore(const std::vector<ReviewEvent>& initial)
    : events(initial)
{
    std::stable_sort(events.begin(), events.end(),
        [](const ReviewEvent& a, const ReviewEvent& b) { return a.submitted_at < b.submitted_at; });
}

void MemoryReviewEventStore::append(const ReviewEvent& event) {
    checkRecordFields(event.item_id, event.item_type);
    std::lock_guard<std::mutex> lock(mtx);

    // Insert after any event with the same timestamp to keep arrival order
    auto pos = std::upper_bound(events.begin(), events.end(), event.submitted_at,
        [](std::time_t t, const ReviewEvent& e) { return t < e.submitted_at; });
    auto inserted = events.insert(pos, event);

    if (!onChanged(events)) {
        events.erase(inserted);
        throw StorageError("Failed to persist review event for item '" + event.item_id + "'");
    }
}

std::vector<ReviewEvent> MemoryReviewEventStore::query(std::time_t from, std::time_t to) const {
    std::lock_guard<std::mutex> lock(mtx);
    std::vector<ReviewEvent> out;
    if (from > to) return out;

    auto lo = std::lower_bound(events.begin(), events.end(), from,
        [](const ReviewEvent& e, std::time_t t) { return e.submitted_at < t; });
    for (auto it = lo; it != events.end() && it->submitted_at <= to; ++it) {
        out.push_back(*it);
    }
    return out;
}

size_t MemoryReviewEventStore::size() const {
    std::lock_guard<std::mutex> lock(mtx);
    return events.size();
}

bool MemoryReviewEventStore::onChanged(const std::vector<ReviewEvent>&) {
    return true;
}
