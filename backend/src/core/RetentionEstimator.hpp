#pragma once
#include <ctime>
#include <string>
#include <vector>
#include "Item.hpp"

enum class RiskLevel {
    LOW,
    MEDIUM,
    HIGH,
    CRITICAL
};

struct CurvePoint {
    int day = 0;
    double retention = 1.0;
};

struct RiskAlert {
    std::string item_id;
    double retention = 1.0;
    int days_overdue = 0;
    RiskLevel risk = RiskLevel::LOW;
};

/*
  Forgetting curve: R(t) = exp(-t / S), t in days since the last review.
  Stability S grows with the interval and scales with ease (EF / 2.5), so for
  the same elapsed time an easier item retains better.
  decay_scale stretches S; it is the tunable constant of the model.
*/
class RetentionEstimator {
public:
    static constexpr double REFERENCE_EASE = 2.5;

    // 1.0 for never-reviewed items
    static double estimateRetention(const Item& item, std::time_t now, double decay_scale = 1.0);

    static double stability(const Item& item, double decay_scale = 1.0);

    static RiskLevel riskLevel(double retention);
    static const char* riskName(RiskLevel level);

    // Days after the last review at which retention drops to target
    static int optimalReviewDay(const Item& item, double target_retention = 0.9, double decay_scale = 1.0);

    // days_ahead < 0 selects max(2 * interval, 30)
    static std::vector<CurvePoint> forgettingCurve(const Item& item, int days_ahead = -1, double decay_scale = 1.0);

    // Reviewed items below threshold, lowest retention first
    static std::vector<RiskAlert> itemsAtRisk(const std::vector<Item>& items, std::time_t now,
        double threshold = 0.8, double decay_scale = 1.0);
};
