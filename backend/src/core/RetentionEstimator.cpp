#include "RetentionEstimator.hpp"
#include "Errors.hpp"
#include "TimeUtils.hpp"
#include <algorithm>
#include <cmath>

double RetentionEstimator::stability(const Item& item, double decay_scale) {
    double base = static_cast<double>(std::max(item.interval_days, 1));
    return base * (item.ease_factor / REFERENCE_EASE) * decay_scale;
}

double RetentionEstimator::estimateRetention(const Item& item, std::time_t now, double decay_scale) {
    if (!item.last_review_at) return 1.0;

    double elapsed = static_cast<double>(now - *item.last_review_at) / TimeUtils::SECONDS_PER_DAY;
    if (elapsed <= 0.0) return 1.0;

    double s = stability(item, decay_scale);
    if (s <= 0.0) return 0.0;

    return std::clamp(std::exp(-elapsed / s), 0.0, 1.0);
}

RiskLevel RetentionEstimator::riskLevel(double retention) {
    if (retention >= 0.8) return RiskLevel::LOW;
    if (retention >= 0.5) return RiskLevel::MEDIUM;
    if (retention >= 0.2) return RiskLevel::HIGH;
    return RiskLevel::CRITICAL;
}

const char* RetentionEstimator::riskName(RiskLevel level) {
    switch (level) {
    case RiskLevel::LOW: return "low";
    case RiskLevel::MEDIUM: return "medium";
    case RiskLevel::HIGH: return "high";
    case RiskLevel::CRITICAL: return "critical";
    }
    return "unknown";
}

int RetentionEstimator::optimalReviewDay(const Item& item, double target_retention, double decay_scale) {
    if (target_retention <= 0.0 || target_retention >= 1.0) {
        throw ValidationError("Target retention must be strictly between 0 and 1");
    }
    // R = e^(-t/S)  =>  t = -S * ln(R)
    double t = -stability(item, decay_scale) * std::log(target_retention);
    return static_cast<int>(std::max(1LL, std::llround(t)));
}

std::vector<CurvePoint> RetentionEstimator::forgettingCurve(const Item& item, int days_ahead, double decay_scale) {
    if (days_ahead < 0) days_ahead = std::max(item.interval_days * 2, 30);

    double s = stability(item, decay_scale);
    std::vector<CurvePoint> points;
    points.reserve(days_ahead + 1);
    for (int day = 0; day <= days_ahead; ++day) {
        CurvePoint p;
        p.day = day;
        p.retention = std::clamp(std::exp(-static_cast<double>(day) / s), 0.0, 1.0);
        points.push_back(p);
    }
    return points;
}

std::vector<RiskAlert> RetentionEstimator::itemsAtRisk(const std::vector<Item>& items, std::time_t now,
    double threshold, double decay_scale)
{
    std::vector<RiskAlert> alerts;

    for (const auto& item : items) {
        if (item.isNew()) continue;

        double r = estimateRetention(item, now, decay_scale);
        if (r >= threshold) continue;

        RiskAlert a;
        a.item_id = item.id;
        a.retention = r;
        a.risk = riskLevel(r);
        long long elapsed = TimeUtils::dayIndex(now) - TimeUtils::dayIndex(*item.last_review_at);
        a.days_overdue = static_cast<int>(elapsed) - item.interval_days;
        alerts.push_back(a);
    }

    std::sort(alerts.begin(), alerts.end(),
        [](const RiskAlert& a, const RiskAlert& b) {
            if (a.retention != b.retention) return a.retention < b.retention;
            return a.item_id < b.item_id;
        });

    spdlog::debug("itemsAtRisk: {} of {} items below {:.2f}", alerts.size(), items.size(), threshold);
    return alerts;
}
