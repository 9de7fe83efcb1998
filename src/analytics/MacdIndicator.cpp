#include "analytics/MacdIndicator.h"
#include "analytics/TechnicalIndicators.h"
#include "common/Errors.h"

namespace quantsim {
namespace analytics {

MacdIndicator::MacdIndicator(int fast, int slow, int signal_period)
    : fast_(fast)
    , slow_(slow)
    , signal_period_(signal_period)
{
    if (fast <= 0 || slow <= 0 || signal_period <= 0) {
        throw ValidationError("all periods must be positive integers");
    }
    if (fast >= slow) {
        throw ValidationError("fast period must be smaller than slow period");
    }
}

MACDResult MacdIndicator::compute(const std::vector<Candle>& candles) const {
    const auto close = TechnicalIndicators::extractClosePrices(candles);
    const auto index = TechnicalIndicators::extractTimestamps(candles);

    const auto fast_ema = TechnicalIndicators::emaSpan(close, fast_);
    const auto slow_ema = TechnicalIndicators::emaSpan(close, slow_);

    std::vector<double> line(close.size());
    for (size_t i = 0; i < close.size(); ++i) {
        line[i] = fast_ema[i] - slow_ema[i];
    }

    const auto signal = TechnicalIndicators::emaSpan(line, signal_period_);

    std::vector<double> histogram(close.size());
    for (size_t i = 0; i < close.size(); ++i) {
        histogram[i] = line[i] - signal[i];
    }

    MACDResult result;
    result.line = Series(index, std::move(line), "macd");
    result.signal = Series(index, signal, "signal");
    result.histogram = Series(index, std::move(histogram), "histogram");
    return result;
}

} // namespace analytics
} // namespace quantsim
