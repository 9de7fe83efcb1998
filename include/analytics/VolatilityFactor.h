#pragma once

#include "analytics/IFactor.h"

namespace quantsim {
namespace analytics {

// Rolling sample standard deviation of simple (or log) returns.
// Not annualized.
class VolatilityFactor : public IFactor {
public:
    explicit VolatilityFactor(int window = 20, bool use_log_returns = false);

    Series compute(const std::vector<Candle>& candles) const override;
    std::string name() const override { return "volatility"; }

    int window() const { return window_; }
    bool usesLogReturns() const { return use_log_returns_; }

private:
    int window_;
    bool use_log_returns_;
};

} // namespace analytics
} // namespace quantsim
