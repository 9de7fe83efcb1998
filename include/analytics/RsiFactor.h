#pragma once

#include "analytics/IFactor.h"

namespace quantsim {
namespace analytics {

// RSI with Wilder smoothing (alpha = 1/period), range [0, 100].
// 70+ overbought, 30- oversold. A flat window reads 50.
class RsiFactor : public IFactor {
public:
    explicit RsiFactor(int period = 14);

    Series compute(const std::vector<Candle>& candles) const override;
    std::string name() const override { return "rsi"; }

    int period() const { return period_; }

private:
    int period_;
};

} // namespace analytics
} // namespace quantsim
