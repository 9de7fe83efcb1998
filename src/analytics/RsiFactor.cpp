#include "analytics/RsiFactor.h"
#include "analytics/TechnicalIndicators.h"
#include "common/Errors.h"
#include <cmath>
#include <limits>

namespace quantsim {
namespace analytics {

RsiFactor::RsiFactor(int period)
    : period_(period)
{
    if (period <= 0) {
        throw ValidationError("period must be a positive integer");
    }
}

Series RsiFactor::compute(const std::vector<Candle>& candles) const {
    const auto close = TechnicalIndicators::extractClosePrices(candles);
    const auto delta = TechnicalIndicators::diff(close);

    // The undefined first change counts as neither gain nor loss
    std::vector<double> gains(delta.size(), 0.0);
    std::vector<double> losses(delta.size(), 0.0);
    for (size_t i = 0; i < delta.size(); ++i) {
        if (delta[i] > 0.0) gains[i] = delta[i];
        else if (delta[i] < 0.0) losses[i] = -delta[i];
    }

    const double alpha = 1.0 / static_cast<double>(period_);
    const auto avg_gain = TechnicalIndicators::ewmMean(gains, alpha, period_);
    const auto avg_loss = TechnicalIndicators::ewmMean(losses, alpha, period_);

    std::vector<double> rsi(close.size(), std::numeric_limits<double>::quiet_NaN());
    for (size_t i = 0; i < close.size(); ++i) {
        if (std::isnan(avg_gain[i]) || std::isnan(avg_loss[i])) {
            continue;
        }
        if (avg_gain[i] == 0.0 && avg_loss[i] == 0.0) {
            rsi[i] = 50.0;
        } else if (avg_loss[i] == 0.0) {
            rsi[i] = 100.0;
        } else {
            const double rs = avg_gain[i] / avg_loss[i];
            rsi[i] = 100.0 - (100.0 / (1.0 + rs));
        }
    }
    return Series(TechnicalIndicators::extractTimestamps(candles), std::move(rsi), name());
}

} // namespace analytics
} // namespace quantsim
