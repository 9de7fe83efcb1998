#pragma once

#include "analytics/IFactor.h"

namespace quantsim {
namespace analytics {

// close[t] / close[t - lookback] - 1
class MomentumFactor : public IFactor {
public:
    explicit MomentumFactor(int lookback = 20);

    Series compute(const std::vector<Candle>& candles) const override;
    std::string name() const override { return "momentum"; }

    int lookback() const { return lookback_; }

private:
    int lookback_;
};

} // namespace analytics
} // namespace quantsim
