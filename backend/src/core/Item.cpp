#include "Item.hpp"
#include <chrono>
#include <random>
#include <sstream>
#include <iomanip>

Item::Item(const std::string& item_id, const std::string& type, std::time_t now)
    : id(item_id), item_type(type)
{
    if (id.empty()) id = generateID();
    created_at = now;
    next_review_at = now; // Immediately due
    spdlog::info("Created Item: ID={}, type={}", id, item_type.empty() ? "-" : item_type);
}

bool Item::isDue(std::time_t now) const {
    return next_review_at.has_value() && *next_review_at <= now;
}

MasteryLevel Item::masteryLevel() const {
    return masteryFor(interval_days);
}

ItemVersion Item::version() const {
    ItemVersion v;
    v.repetitions = repetitions;
    v.next_review_at = next_review_at;
    return v;
}

void Item::resetSchedule(std::time_t now) {
    ease_factor = 2.5;
    interval_days = 0;
    repetitions = 0;
    last_review_at.reset();
    next_review_at = now;
    first_review_at.reset();
    total_reviews = 0;
    spdlog::info("Item ID={} schedule reset", id);
}

MasteryLevel Item::masteryFor(int interval_days) {
    if (interval_days <= 0) return MasteryLevel::NEW;
    if (interval_days < 7) return MasteryLevel::LEARNING;
    if (interval_days < 21) return MasteryLevel::YOUNG;
    return MasteryLevel::MATURE;
}

const char* Item::masteryName(MasteryLevel level) {
    switch (level) {
    case MasteryLevel::NEW: return "new";
    case MasteryLevel::LEARNING: return "learning";
    case MasteryLevel::YOUNG: return "young";
    case MasteryLevel::MATURE: return "mature";
    }
    return "unknown";
}

// Simple unique ID generator (timestamp + random bits)
std::string Item::generateID() {
    using namespace std::chrono;

    auto now = system_clock::now();
    auto millis = duration_cast<milliseconds>(now.time_since_epoch()).count();

    std::random_device rd;
    std::mt19937_64 eng(rd());
    std::uniform_int_distribution<uint64_t> dist;

    uint64_t randPart = dist(eng);

    std::stringstream ss;
    ss << std::hex << millis << "-" << std::setw(16) << std::setfill('0') << randPart;
    return ss.str();
}
