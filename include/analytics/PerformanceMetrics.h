#pragma once

#include <vector>
#include "common/Types.h"

namespace quantsim {
namespace analytics {

// Reducers over a returns series. NaN entries are ignored; a degenerate
// input (empty, zero dispersion) yields NaN rather than an error.
class PerformanceMetrics {
public:
    struct Summary {
        double sharpe;
        double sortino;
        double max_drawdown;
        double cumulative_return;
        size_t periods;
    };

    // mean / sample std * sqrt(annualization)
    static double sharpe(const std::vector<double>& returns, int annualization = 252);

    // mean / sqrt(mean(min(r, 0)^2)) * sqrt(annualization), zero target return
    static double sortino(const std::vector<double>& returns, int annualization = 252);

    // Most negative (equity - running peak) / running peak; <= 0
    static double maxDrawdown(const std::vector<double>& returns);

    // prod(1 + r) - 1; 0 for an empty series
    static double cumulativeReturn(const std::vector<double>& returns);

    static Summary summarize(const Series& returns, int annualization = 252);

private:
    static std::vector<double> dropUndefined(const std::vector<double>& values);
};

} // namespace analytics
} // namespace quantsim
