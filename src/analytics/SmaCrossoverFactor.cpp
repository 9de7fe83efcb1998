#include "analytics/SmaCrossoverFactor.h"
#include "analytics/TechnicalIndicators.h"
#include "common/Errors.h"

namespace quantsim {
namespace analytics {

SmaCrossoverFactor::SmaCrossoverFactor(int fast, int slow)
    : fast_(fast)
    , slow_(slow)
{
    if (fast <= 0 || slow <= 0) {
        throw ValidationError("fast and slow windows must be positive integers");
    }
    if (fast >= slow) {
        throw ValidationError("fast window must be smaller than slow window");
    }
}

Series SmaCrossoverFactor::compute(const std::vector<Candle>& candles) const {
    const auto close = TechnicalIndicators::extractClosePrices(candles);
    const auto fast_ma = TechnicalIndicators::rollingMean(close, fast_);
    const auto slow_ma = TechnicalIndicators::rollingMean(close, slow_);

    std::vector<double> signal(close.size());
    for (size_t i = 0; i < close.size(); ++i) {
        signal[i] = fast_ma[i] - slow_ma[i];
    }
    return Series(TechnicalIndicators::extractTimestamps(candles), std::move(signal), name());
}

} // namespace analytics
} // namespace quantsim
