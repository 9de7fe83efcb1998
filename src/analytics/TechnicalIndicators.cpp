#include "analytics/TechnicalIndicators.h"
#include <cmath>
#include <limits>

namespace quantsim {
namespace analytics {

namespace {
constexpr double NaN = std::numeric_limits<double>::quiet_NaN();
}

std::vector<double> TechnicalIndicators::diff(const std::vector<double>& values) {
    std::vector<double> out(values.size(), NaN);
    for (size_t i = 1; i < values.size(); ++i) {
        out[i] = values[i] - values[i - 1];
    }
    return out;
}

std::vector<double> TechnicalIndicators::pctChange(const std::vector<double>& values, int periods) {
    std::vector<double> out(values.size(), NaN);
    if (periods <= 0) {
        return out;
    }
    const size_t lag = static_cast<size_t>(periods);
    for (size_t i = lag; i < values.size(); ++i) {
        out[i] = values[i] / values[i - lag] - 1.0;
    }
    return out;
}

std::vector<double> TechnicalIndicators::logReturns(const std::vector<double>& values) {
    std::vector<double> out(values.size(), NaN);
    for (size_t i = 1; i < values.size(); ++i) {
        out[i] = std::log(values[i]) - std::log(values[i - 1]);
    }
    return out;
}

std::vector<double> TechnicalIndicators::rollingMean(const std::vector<double>& values, int window) {
    std::vector<double> out(values.size(), NaN);
    if (window <= 0) {
        return out;
    }
    const size_t w = static_cast<size_t>(window);
    for (size_t i = w - 1; i < values.size(); ++i) {
        double sum = 0.0;
        for (size_t k = i + 1 - w; k <= i; ++k) {
            sum += values[k];
        }
        out[i] = sum / static_cast<double>(w);
    }
    return out;
}

std::vector<double> TechnicalIndicators::rollingStd(const std::vector<double>& values, int window) {
    std::vector<double> out(values.size(), NaN);
    if (window <= 1) {
        return out;
    }
    const size_t w = static_cast<size_t>(window);
    for (size_t i = w - 1; i < values.size(); ++i) {
        double mean = 0.0;
        for (size_t k = i + 1 - w; k <= i; ++k) {
            mean += values[k];
        }
        mean /= static_cast<double>(w);

        double sq_sum = 0.0;
        for (size_t k = i + 1 - w; k <= i; ++k) {
            sq_sum += (values[k] - mean) * (values[k] - mean);
        }
        out[i] = std::sqrt(sq_sum / static_cast<double>(w - 1));
    }
    return out;
}

std::vector<double> TechnicalIndicators::ewmMean(const std::vector<double>& values, double alpha, int min_periods) {
    std::vector<double> out(values.size(), NaN);
    double ema = NaN;
    int seen = 0;
    for (size_t i = 0; i < values.size(); ++i) {
        const double x = values[i];
        if (!std::isnan(x)) {
            ema = (seen == 0) ? x : (1.0 - alpha) * ema + alpha * x;
            ++seen;
        }
        if (seen > 0 && seen >= min_periods) {
            out[i] = ema;
        }
    }
    return out;
}

std::vector<double> TechnicalIndicators::emaSpan(const std::vector<double>& values, int span) {
    return ewmMean(values, 2.0 / (static_cast<double>(span) + 1.0), span);
}

std::vector<double> TechnicalIndicators::extractClosePrices(const std::vector<Candle>& candles) {
    std::vector<double> prices;
    prices.reserve(candles.size());
    for (const auto& candle : candles) {
        prices.push_back(candle.close);
    }
    return prices;
}

Timeline TechnicalIndicators::extractTimestamps(const std::vector<Candle>& candles) {
    Timeline index;
    index.reserve(candles.size());
    for (const auto& candle : candles) {
        index.push_back(candle.timestamp);
    }
    return index;
}

} // namespace analytics
} // namespace quantsim
