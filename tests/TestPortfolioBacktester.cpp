#include "backtest/PortfolioBacktester.h"
#include "common/Config.h"
#include "common/Errors.h"
#include "common/TimeUtils.h"

#include <cassert>
#include <cmath>
#include <iostream>
#include <limits>

using namespace quantsim;
using backtest::PortfolioBacktester;
using backtest::PortfolioConfig;
using backtest::RebalanceFrequency;
using utils::TimeUtils;

namespace {
constexpr double NaN = std::numeric_limits<double>::quiet_NaN();

bool near(double a, double b) {
    return std::abs(a - b) < 1e-9;
}

// 10 daily rows from 2024-01-25 to 2024-02-03
Timeline timeline() {
    Timeline out;
    for (int d = 25; d <= 31; ++d) out.push_back(TimeUtils::fromCivil(2024, 1, d));
    for (int d = 1; d <= 3; ++d) out.push_back(TimeUtils::fromCivil(2024, 2, d));
    return out;
}

std::vector<double> spyClose() { return {100, 101, 102, 101, 103, 104, 103, 105, 106, 107}; }
std::vector<double> bndClose() { return {50, 50, 50.5, 50.5, 50.2, 50.4, 50.6, 50.5, 50.7, 50.8}; }
std::vector<double> gldClose() { return {200, 198, 199, 202, 203, 201, 204, 206, 205, 207}; }

PriceTable makePrices() {
    PriceTable table(timeline());
    table.addColumn("SPY", "close", spyClose());
    table.addColumn("SPY", "volume", std::vector<double>(10, 1e6));
    table.addColumn("BND", "close", bndClose());
    table.addColumn("GLD", "close", gldClose());
    return table;
}

double ret(const std::vector<double>& close, size_t t) {
    return close[t] / close[t - 1] - 1.0;
}
}

int main() {
    const PriceTable prices = makePrices();

    // Equal weight by default, monthly rebalance
    {
        PortfolioBacktester bt(prices);
        assert(bt.symbols() == (std::vector<std::string>{"SPY", "BND", "GLD"}));
        for (const auto& kv : bt.weights()) {
            assert(near(kv.second, 1.0 / 3.0));
        }

        const auto dates = bt.rebalanceDates();
        assert(dates.size() == 2);
        assert(dates[0] == TimeUtils::fromCivil(2024, 1, 25));
        assert(dates[1] == TimeUtils::fromCivil(2024, 2, 1));

        const Series out = bt.run();
        assert(out.name == "portfolio_returns");
        assert(out.size() == 10);
        // nothing is held on the first day
        assert(out.values[0] == 0.0);
        for (size_t t = 1; t < 10; ++t) {
            const double expected = (ret(spyClose(), t) + ret(bndClose(), t) + ret(gldClose(), t)) / 3.0;
            assert(near(out.values[t], expected));
        }

        const auto& r = bt.assetReturns();
        assert(std::isnan(r.at(0, 0)));
        assert(near(r.at(1, 0), 0.01));
    }

    // Custom targets; untargeted weight is zero
    {
        PortfolioConfig config;
        config.weights = TargetWeights{{"SPY", 0.6}, {"BND", 0.4}, {"GLD", 0.0}};
        PortfolioBacktester bt(prices, config);

        const auto w = bt.targetWeightMatrix();
        for (size_t r = 0; r < w.rows(); ++r) {
            assert(near(w.at(r, 0), 0.6));
            assert(near(w.at(r, 1), 0.4));
            assert(w.at(r, 2) == 0.0);
        }

        const Series out = bt.run();
        assert(near(out.values[4], 0.6 * ret(spyClose(), 4) + 0.4 * ret(bndClose(), 4)));
    }

    // Daily and quarterly calendars on the same data
    {
        PortfolioConfig config;
        config.rebalance_frequency = RebalanceFrequency::DAILY;
        assert(PortfolioBacktester(prices, config).rebalanceDates().size() == 10);
        config.rebalance_frequency = RebalanceFrequency::QUARTERLY;
        assert(PortfolioBacktester(prices, config).rebalanceDates().size() == 1);
    }

    // Signal override: normalized by absolute sum, NaN treated as 0
    SignalTable signals(timeline(), {"SPY", "BND", "GLD"}, 0.0);
    for (size_t r = 0; r < 10; ++r) {
        signals.at(r, 0) = (r % 2 == 0) ? 1.0 : -1.0;
        signals.at(r, 1) = -1.0;
        signals.at(r, 2) = NaN;
    }
    {
        PortfolioBacktester bt(prices);
        const Series out = bt.run(signals);
        assert(out.values[0] == 0.0);
        // row 2 holds the weights decided on row 1: SPY -0.5, BND -0.5
        assert(near(out.values[2], -0.5 * ret(spyClose(), 2) - 0.5 * ret(bndClose(), 2)));
        // row 3 holds row 2: SPY 0.5, BND -0.5
        assert(near(out.values[3], 0.5 * ret(spyClose(), 3) - 0.5 * ret(bndClose(), 3)));
    }

    // Costs only ever lower returns
    {
        PortfolioConfig config;
        config.commission_rate = 0.001;
        const Series gross = PortfolioBacktester(prices).run(signals);
        const Series net = PortfolioBacktester(prices, config).run(signals);
        bool any_cost = false;
        for (size_t t = 0; t < gross.size(); ++t) {
            assert(net.values[t] <= gross.values[t] + 1e-15);
            if (net.values[t] < gross.values[t] - 1e-12) any_cost = true;
        }
        assert(any_cost);
        // SPY flips +-0.5 each row: turnover 1.0
        assert(near(gross.values[3] - net.values[3], 0.001));
    }

    // Signals naming an unknown symbol
    {
        SignalTable bad(timeline(), {"SPY", "QQQ"}, 1.0);
        bool threw = false;
        try {
            PortfolioBacktester(prices).run(bad);
        } catch (const ValidationError& e) {
            threw = std::string(e.what()).find("QQQ") != std::string::npos;
        }
        assert(threw);
    }

    // Weight validation message lists both directions
    {
        PortfolioConfig config;
        config.weights = TargetWeights{{"SPY", 0.4}, {"BND", 0.4}, {"QQQ", 0.2}};
        bool threw = false;
        try {
            PortfolioBacktester bt(prices, config);
        } catch (const ValidationError& e) {
            threw = std::string(e.what()) ==
                "weights do not match price symbols: missing weights for GLD; weights for symbols not in data: QQQ";
        }
        assert(threw);
    }

    // Configured weights naming a symbol that was not loaded are rejected, not trimmed
    {
        Config& config = Config::getInstance();
        config.reset();
        config.loadFromJson(nlohmann::json::parse(
            R"({"portfolio": {"weights": {"SPY": 0.6, "BND": 0.3, "GLD": 0.1}}})"));

        PriceTable two(timeline());
        two.addColumn("SPY", "close", spyClose());
        two.addColumn("BND", "close", bndClose());

        bool threw = false;
        try {
            PortfolioBacktester bt(two, config.getPortfolioConfig());
        } catch (const ValidationError& e) {
            threw = std::string(e.what()) ==
                "weights do not match price symbols: weights for symbols not in data: GLD";
        }
        assert(threw);

        // the same weights pass against the full table
        PortfolioBacktester bt(prices, config.getPortfolioConfig());
        assert(near(bt.weights().at("GLD"), 0.1));
        config.reset();
    }

    // Input errors
    {
        bool threw = false;
        try {
            PortfolioBacktester bt{PriceTable()};
        } catch (const ValidationError&) {
            threw = true;
        }
        assert(threw);

        threw = false;
        try {
            PriceTable flat(timeline());
            flat.addColumn("close", spyClose());
            PortfolioBacktester bt(flat);
        } catch (const ShapeError& e) {
            threw = std::string(e.what()).find("two-level") != std::string::npos;
        }
        assert(threw);

        threw = false;
        try {
            PriceTable no_close(timeline());
            no_close.addColumn("SPY", "close", spyClose());
            no_close.addColumn("BND", "open", bndClose());
            PortfolioBacktester bt(no_close);
        } catch (const ValidationError& e) {
            threw = std::string(e.what()).find("BND") != std::string::npos;
        }
        assert(threw);

        threw = false;
        try {
            PortfolioConfig config;
            config.commission_rate = -1.0;
            PortfolioBacktester bt(prices, config);
        } catch (const ValidationError&) {
            threw = true;
        }
        assert(threw);
    }

    std::cout << "[TEST] PortfolioBacktester PASSED\n";
    return 0;
}
