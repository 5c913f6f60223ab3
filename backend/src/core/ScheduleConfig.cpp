#include "ScheduleConfig.hpp"
#include "Errors.hpp"
#include <sstream>
#include <cctype>
#include <spdlog/spdlog.h>

namespace {

std::string trim(const std::string& s) {
    std::string t = s;
    while (!t.empty() && std::isspace((unsigned char)t.front())) t.erase(t.begin());
    while (!t.empty() && std::isspace((unsigned char)t.back())) t.pop_back();
    return t;
}

int parseInt(const std::string& key, const std::string& value) {
    try {
        size_t used = 0;
        int v = std::stoi(value, &used);
        if (used != value.size()) throw std::invalid_argument(value);
        return v;
    }
    catch (const std::exception&) {
        throw ValidationError("Config key '" + key + "' expects an integer, got '" + value + "'");
    }
}

double parseDouble(const std::string& key, const std::string& value) {
    try {
        size_t used = 0;
        double v = std::stod(value, &used);
        if (used != value.size()) throw std::invalid_argument(value);
        return v;
    }
    catch (const std::exception&) {
        throw ValidationError("Config key '" + key + "' expects a number, got '" + value + "'");
    }
}

} // namespace

void ScheduleConfig::validate() const {
    if (daily_review_limit < 0)
        throw ValidationError("daily_review_limit must be >= 0");
    if (new_items_per_day < 0)
        throw ValidationError("new_items_per_day must be >= 0");
    if (minimum_ease_factor <= 0.0)
        throw ValidationError("minimum_ease_factor must be > 0");
    if (initial_intervals[0] < 1 || initial_intervals[1] < initial_intervals[0])
        throw ValidationError("initial_intervals must satisfy 1 <= first <= second");
    if (break_interval < 1)
        throw ValidationError("break_interval must be >= 1");
    if (retention_decay_scale <= 0.0)
        throw ValidationError("retention_decay_scale must be > 0");
}

const char* ScheduleConfig::orderName(ReviewOrder order) {
    return order == ReviewOrder::RANDOM ? "random" : "urgency";
}

std::string ScheduleConfig::serialize() const {
    std::ostringstream oss;
    oss << "daily_review_limit: " << daily_review_limit << "\n"
        << "new_items_per_day: " << new_items_per_day << "\n"
        << "review_order: " << orderName(review_order) << "\n"
        << "minimum_ease_factor: " << minimum_ease_factor << "\n"
        << "initial_intervals: " << initial_intervals[0] << "," << initial_intervals[1] << "\n"
        << "break_interval: " << break_interval << "\n"
        << "retention_decay_scale: " << retention_decay_scale << "\n";
    return oss.str();
}

ScheduleConfig ScheduleConfig::deserialize(const std::string& data) {
    ScheduleConfig cfg;
    std::istringstream iss(data);
    std::string line;

    while (std::getline(iss, line)) {
        auto hash = line.find('#');
        if (hash != std::string::npos) line.erase(hash);
        line = trim(line);
        if (line.empty()) continue;

        auto pos = line.find(':');
        if (pos == std::string::npos) {
            spdlog::warn("Config line without ':' ignored: '{}'", line);
            continue;
        }

        std::string key = trim(line.substr(0, pos));
        std::string value = trim(line.substr(pos + 1));

        if (key == "daily_review_limit") cfg.daily_review_limit = parseInt(key, value);
        else if (key == "new_items_per_day") cfg.new_items_per_day = parseInt(key, value);
        else if (key == "minimum_ease_factor") cfg.minimum_ease_factor = parseDouble(key, value);
        else if (key == "break_interval") cfg.break_interval = parseInt(key, value);
        else if (key == "retention_decay_scale") cfg.retention_decay_scale = parseDouble(key, value);
        else if (key == "review_order") {
            if (value == "urgency") cfg.review_order = ReviewOrder::URGENCY;
            else if (value == "random") cfg.review_order = ReviewOrder::RANDOM;
            else throw ValidationError("review_order must be 'urgency' or 'random', got '" + value + "'");
        }
        else if (key == "initial_intervals") {
            auto comma = value.find(',');
            if (comma == std::string::npos)
                throw ValidationError("initial_intervals expects two comma-separated values");
            cfg.initial_intervals[0] = parseInt(key, trim(value.substr(0, comma)));
            cfg.initial_intervals[1] = parseInt(key, trim(value.substr(comma + 1)));
        }
        else {
            spdlog::warn("Unknown config key '{}' ignored", key);
        }
    }

    cfg.validate();
    spdlog::debug("Config loaded: limit={} new/day={} order={}",
        cfg.daily_review_limit, cfg.new_items_per_day, orderName(cfg.review_order));
    return cfg;
}
