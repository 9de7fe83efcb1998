#include "analytics/PerformanceMetrics.h"

#include <cassert>
#include <cmath>
#include <iostream>
#include <limits>

using namespace quantsim;
using quantsim::analytics::PerformanceMetrics;

namespace {
constexpr double NaN = std::numeric_limits<double>::quiet_NaN();

bool near(double a, double b, double tol = 1e-6) {
    return std::abs(a - b) < tol;
}
}

int main() {
    {
        const std::vector<double> r{0.01, -0.01, 0.02};
        assert(near(PerformanceMetrics::sharpe(r, 1), 0.436436));
        assert(near(PerformanceMetrics::sharpe(r, 252), 0.436436 * std::sqrt(252.0), 1e-4));
        // undefined rows are ignored
        assert(near(PerformanceMetrics::sharpe({NaN, 0.01, -0.01, 0.02}, 1), 0.436436));
    }

    {
        assert(std::isnan(PerformanceMetrics::sharpe({0.01, 0.01, 0.01})));
        assert(std::isnan(PerformanceMetrics::sharpe({0.01})));
        assert(std::isnan(PerformanceMetrics::sortino({0.01, 0.02})));
    }

    {
        assert(near(PerformanceMetrics::sortino({0.02, -0.01}, 1), 0.707107));
    }

    {
        assert(near(PerformanceMetrics::maxDrawdown({0.1, -0.5, 0.2}), -0.5));
        assert(PerformanceMetrics::maxDrawdown({-0.1}) == 0.0);
        assert(near(PerformanceMetrics::maxDrawdown({0.1, -0.1, -0.1}), 0.81 - 1.0));
        assert(std::isnan(PerformanceMetrics::maxDrawdown({})));
    }

    {
        assert(near(PerformanceMetrics::cumulativeReturn({0.1, -0.5, 0.2}), -0.34));
        assert(PerformanceMetrics::cumulativeReturn({}) == 0.0);
    }

    {
        Series returns(Timeline{1, 2, 3, 4}, {NaN, 0.1, -0.5, 0.2}, "strategy_returns");
        const auto s = PerformanceMetrics::summarize(returns, 252);
        assert(s.periods == 3);
        assert(near(s.cumulative_return, -0.34));
        assert(near(s.max_drawdown, -0.5));
        assert(!std::isnan(s.sharpe));
    }

    std::cout << "[TEST] PerformanceMetrics PASSED\n";
    return 0;
}
