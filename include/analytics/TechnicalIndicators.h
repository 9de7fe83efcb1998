#pragma once

#include <vector>
#include "common/Types.h"

namespace quantsim {
namespace analytics {

// Vectorised indicator building blocks. Output has the input's length;
// positions without enough history are NaN.
class TechnicalIndicators {
public:
    // x[t] - x[t-1]
    static std::vector<double> diff(const std::vector<double>& values);

    // x[t] / x[t-periods] - 1
    static std::vector<double> pctChange(const std::vector<double>& values, int periods = 1);

    // ln(x[t]) - ln(x[t-1])
    static std::vector<double> logReturns(const std::vector<double>& values);

    // Mean of the last `window` values; NaN unless the whole window is defined
    static std::vector<double> rollingMean(const std::vector<double>& values, int window);

    // Sample standard deviation (n-1) of the last `window` values
    static std::vector<double> rollingStd(const std::vector<double>& values, int window);

    // Recursive EMA: y = (1-alpha)*y + alpha*x, seeded with the first defined value.
    // NaN until `min_periods` defined values have been seen; NaN inputs hold y.
    static std::vector<double> ewmMean(const std::vector<double>& values, double alpha, int min_periods);

    // ewmMean with alpha = 2/(span+1) and min_periods = span
    static std::vector<double> emaSpan(const std::vector<double>& values, int span);

    static std::vector<double> extractClosePrices(const std::vector<Candle>& candles);
    static Timeline extractTimestamps(const std::vector<Candle>& candles);
};

} // namespace analytics
} // namespace quantsim
