#include "backtest/CostModel.h"
#include "common/Errors.h"

#include <cassert>
#include <cmath>
#include <iostream>
#include <limits>

using namespace quantsim;
using backtest::CostModel;

namespace {
constexpr double NaN = std::numeric_limits<double>::quiet_NaN();

bool near(double a, double b) {
    return std::abs(a - b) < 1e-12;
}
}

int main() {
    {
        assert(near(CostModel::rateFromBps(10.0), 0.001));
        CostModel none;
        assert(!none.enabled());
        CostModel model(0.001);
        assert(model.enabled());
        assert(near(model.commissionRate(), 0.001));
    }

    {
        bool threw = false;
        try {
            CostModel bad(-0.0001);
        } catch (const ValidationError&) {
            threw = true;
        }
        assert(threw);
    }

    // Single series: row 0 and the step out of an undefined position are 0
    {
        const auto t = CostModel::turnover(std::vector<double>{NaN, 0.0, 1.0, -1.0, 1.0});
        assert(t.size() == 5);
        assert(t[0] == 0.0 && t[1] == 0.0);
        assert(near(t[2], 1.0) && near(t[3], 2.0) && near(t[4], 2.0));
    }

    // Matrix: sum over symbols, undefined terms skipped
    {
        WeightMatrix positions({1, 2, 3}, {"A", "B"}, NaN);
        positions.at(1, 0) = 0.5;
        positions.at(2, 0) = -0.5;
        positions.at(2, 1) = 0.25;
        const auto t = CostModel::turnover(positions);
        assert(t[0] == 0.0 && t[1] == 0.0);
        assert(near(t[2], 1.0));
    }

    {
        CostModel model(0.01);
        std::vector<double> returns{NaN, 0.02, -0.01};
        model.applyCosts(returns, {0.0, 1.0, 2.0});
        assert(std::isnan(returns[0]));
        assert(near(returns[1], 0.01));
        assert(near(returns[2], -0.03));

        bool threw = false;
        try {
            model.applyCosts(returns, {1.0});
        } catch (const ShapeError&) {
            threw = true;
        }
        assert(threw);
    }

    std::cout << "[TEST] CostModel PASSED\n";
    return 0;
}
