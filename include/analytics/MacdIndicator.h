#pragma once

#include <vector>
#include "common/Types.h"

namespace quantsim {
namespace analytics {

// MACD (Moving Average Convergence Divergence)
struct MACDResult {
    Series line;        // fast EMA - slow EMA
    Series signal;      // EMA of line
    Series histogram;   // line - signal
};

// Three outputs, so not an IFactor. Use `histogram` when a single
// backtest signal is needed.
class MacdIndicator {
public:
    MacdIndicator(int fast = 12, int slow = 26, int signal_period = 9);

    // line is NaN for the first slow-1 rows; signal/histogram for the first
    // slow+signal_period-2 rows
    MACDResult compute(const std::vector<Candle>& candles) const;

    int fast() const { return fast_; }
    int slow() const { return slow_; }
    int signalPeriod() const { return signal_period_; }

private:
    int fast_;
    int slow_;
    int signal_period_;
};

} // namespace analytics
} // namespace quantsim
