#include "analytics/PerformanceMetrics.h"
#include <algorithm>
#include <cmath>
#include <limits>
#include <numeric>

namespace quantsim {
namespace analytics {

namespace {
constexpr double NaN = std::numeric_limits<double>::quiet_NaN();

double mean(const std::vector<double>& values) {
    return std::accumulate(values.begin(), values.end(), 0.0) / static_cast<double>(values.size());
}
}

std::vector<double> PerformanceMetrics::dropUndefined(const std::vector<double>& values) {
    std::vector<double> clean;
    clean.reserve(values.size());
    for (double v : values) {
        if (!std::isnan(v)) clean.push_back(v);
    }
    return clean;
}

double PerformanceMetrics::sharpe(const std::vector<double>& returns, int annualization) {
    const auto clean = dropUndefined(returns);
    if (clean.size() < 2) {
        return NaN;
    }
    const double m = mean(clean);
    double sq_sum = 0.0;
    for (double r : clean) {
        sq_sum += (r - m) * (r - m);
    }
    const double vol = std::sqrt(sq_sum / static_cast<double>(clean.size() - 1));
    if (vol == 0.0) {
        return NaN;
    }
    return (m / vol) * std::sqrt(static_cast<double>(annualization));
}

double PerformanceMetrics::sortino(const std::vector<double>& returns, int annualization) {
    const auto clean = dropUndefined(returns);
    if (clean.empty()) {
        return NaN;
    }
    double downside_sq = 0.0;
    for (double r : clean) {
        const double d = std::min(r, 0.0);
        downside_sq += d * d;
    }
    const double downside_variance = downside_sq / static_cast<double>(clean.size());
    if (downside_variance == 0.0) {
        return NaN;
    }
    return (mean(clean) / std::sqrt(downside_variance)) * std::sqrt(static_cast<double>(annualization));
}

double PerformanceMetrics::maxDrawdown(const std::vector<double>& returns) {
    const auto clean = dropUndefined(returns);
    if (clean.empty()) {
        return NaN;
    }
    double equity = 1.0;
    double peak = 1.0;
    double worst = 0.0;
    bool first = true;
    for (double r : clean) {
        equity *= (1.0 + r);
        // the curve starts at the first compounded value, not at 1.0
        peak = first ? equity : std::max(peak, equity);
        first = false;
        worst = std::min(worst, (equity - peak) / peak);
    }
    return worst;
}

double PerformanceMetrics::cumulativeReturn(const std::vector<double>& returns) {
    double equity = 1.0;
    for (double r : returns) {
        if (!std::isnan(r)) equity *= (1.0 + r);
    }
    return equity - 1.0;
}

PerformanceMetrics::Summary PerformanceMetrics::summarize(const Series& returns, int annualization) {
    Summary s;
    s.sharpe = sharpe(returns.values, annualization);
    s.sortino = sortino(returns.values, annualization);
    s.max_drawdown = maxDrawdown(returns.values);
    s.cumulative_return = cumulativeReturn(returns.values);
    s.periods = dropUndefined(returns.values).size();
    return s;
}

} // namespace analytics
} // namespace quantsim
