#pragma once
#include <string>
#include <ctime>

// One submitted review. Written once by ReviewProcessor, never modified.
struct ReviewEvent {
    std::string item_id;
    std::string item_type;
    std::time_t submitted_at = 0;
    int quality = 0;                 // 0..5
    int time_spent_seconds = 0;

    // Snapshot after processing
    int resulting_interval_days = 0;
    double resulting_ease_factor = 2.5;

    bool successful() const { return quality >= 3; }
};
