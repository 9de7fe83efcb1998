#pragma once

#include <optional>
#include <string>
#include "common/Types.h"

namespace quantsim {
namespace backtest {

// Rebalance period granularity (UTC calendar)
enum class RebalanceFrequency {
    DAILY,
    WEEKLY,     // Monday..Sunday
    MONTHLY,
    QUARTERLY
};

// Single-asset simulator settings, captured by value at construction
struct SimulatorConfig {
    double max_position = 1.0;      // |position| bound, > 0
    double commission_rate = 0.0;   // cost per unit turnover, >= 0
};

// Portfolio simulator settings
struct PortfolioConfig {
    std::optional<TargetWeights> weights;   // none -> equal weight
    RebalanceFrequency rebalance_frequency = RebalanceFrequency::MONTHLY;
    double commission_rate = 0.0;
};

} // namespace backtest
} // namespace quantsim
