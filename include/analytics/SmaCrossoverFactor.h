#pragma once

#include "analytics/IFactor.h"

namespace quantsim {
namespace analytics {

// SMA(fast) - SMA(slow) of close. Positive while the fast average is above
// the slow one. The raw difference scales with price level.
class SmaCrossoverFactor : public IFactor {
public:
    SmaCrossoverFactor(int fast = 10, int slow = 30);

    Series compute(const std::vector<Candle>& candles) const override;
    std::string name() const override { return "sma_crossover"; }

    int fast() const { return fast_; }
    int slow() const { return slow_; }

private:
    int fast_;
    int slow_;
};

} // namespace analytics
} // namespace quantsim
