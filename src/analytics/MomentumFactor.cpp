#include "analytics/MomentumFactor.h"
#include "analytics/TechnicalIndicators.h"
#include "common/Errors.h"

namespace quantsim {
namespace analytics {

MomentumFactor::MomentumFactor(int lookback)
    : lookback_(lookback)
{
    if (lookback <= 0) {
        throw ValidationError("lookback must be a positive integer");
    }
}

Series MomentumFactor::compute(const std::vector<Candle>& candles) const {
    const auto close = TechnicalIndicators::extractClosePrices(candles);
    return Series(TechnicalIndicators::extractTimestamps(candles),
                  TechnicalIndicators::pctChange(close, lookback_),
                  name());
}

} // namespace analytics
} // namespace quantsim
