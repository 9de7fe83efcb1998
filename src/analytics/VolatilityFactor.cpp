#include "analytics/VolatilityFactor.h"
#include "analytics/TechnicalIndicators.h"
#include "common/Errors.h"

namespace quantsim {
namespace analytics {

VolatilityFactor::VolatilityFactor(int window, bool use_log_returns)
    : window_(window)
    , use_log_returns_(use_log_returns)
{
    if (window <= 0) {
        throw ValidationError("window must be a positive integer");
    }
}

Series VolatilityFactor::compute(const std::vector<Candle>& candles) const {
    const auto close = TechnicalIndicators::extractClosePrices(candles);
    const auto returns = use_log_returns_
        ? TechnicalIndicators::logReturns(close)
        : TechnicalIndicators::pctChange(close, 1);
    return Series(TechnicalIndicators::extractTimestamps(candles),
                  TechnicalIndicators::rollingStd(returns, window_),
                  name());
}

} // namespace analytics
} // namespace quantsim
