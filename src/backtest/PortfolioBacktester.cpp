#include "backtest/PortfolioBacktester.h"
#include "backtest/RebalanceCalendar.h"
#include "backtest/WeightMatrixBuilder.h"
#include "common/Errors.h"
#include "common/Logger.h"

#include <algorithm>
#include <cmath>
#include <limits>

namespace quantsim {
namespace backtest {

namespace {
constexpr double NaN = std::numeric_limits<double>::quiet_NaN();

SymbolTable pctChange(const SymbolTable& close) {
    SymbolTable out(close.index, close.symbols, NaN);
    for (size_t c = 0; c < close.cols(); ++c) {
        for (size_t r = 1; r < close.rows(); ++r) {
            out.at(r, c) = close.at(r, c) / close.at(r - 1, c) - 1.0;
        }
    }
    return out;
}
}

PortfolioBacktester::PortfolioBacktester(const PriceTable& prices, const PortfolioConfig& config)
    : config_(config)
{
    if (prices.empty()) {
        throw ValidationError("prices must contain at least one observation");
    }
    if (!prices.hasTwoLevelColumns()) {
        throw ShapeError("prices must have two-level (symbol, field) columns");
    }
    if (!(config.commission_rate >= 0.0)) {
        throw ValidationError("commission_rate cannot be negative (got " +
                              std::to_string(config.commission_rate) + ")");
    }
    cost_model_ = CostModel(config.commission_rate);

    prices_ = prices.sortedByIndex();
    symbols_ = prices_.symbols();
    asset_returns_ = pctChange(prices_.field("close"));

    if (config.weights) {
        validateWeights(*config.weights);
        weights_ = *config.weights;
    } else {
        const double equal = 1.0 / static_cast<double>(symbols_.size());
        for (const auto& s : symbols_) {
            weights_[s] = equal;
        }
    }

    LOG_INFO("PortfolioBacktester ready: {} symbols x {} rows, rebalance={}, commission_rate={}",
             symbols_.size(), prices_.rows(), toString(config_.rebalance_frequency),
             config_.commission_rate);
}

void PortfolioBacktester::validateWeights(const TargetWeights& weights) const {
    std::vector<std::string> missing;
    for (const auto& s : symbols_) {
        if (weights.find(s) == weights.end()) {
            missing.push_back(s);
        }
    }
    std::vector<std::string> extra;
    for (const auto& kv : weights) {
        if (std::find(symbols_.begin(), symbols_.end(), kv.first) == symbols_.end()) {
            extra.push_back(kv.first);
        }
    }

    if (missing.empty() && extra.empty()) {
        return;
    }
    std::string message = "weights do not match price symbols:";
    if (!missing.empty()) {
        message += " missing weights for " + joinNames(missing) + ";";
    }
    if (!extra.empty()) {
        message += " weights for symbols not in data: " + joinNames(extra) + ";";
    }
    message.pop_back();
    throw ValidationError(message);
}

Timeline PortfolioBacktester::rebalanceDates() const {
    return RebalanceCalendar::build(prices_.index(), config_.rebalance_frequency);
}

WeightMatrix PortfolioBacktester::targetWeightMatrix() const {
    return WeightMatrixBuilder::fromTargets(prices_.index(), symbols_, weights_, rebalanceDates());
}

WeightMatrix PortfolioBacktester::signalWeightMatrix(const SignalTable& signals) const {
    return WeightMatrixBuilder::fromSignals(prices_.index(), symbols_, signals);
}

Series PortfolioBacktester::run() const {
    return simulate(targetWeightMatrix());
}

Series PortfolioBacktester::run(const SignalTable& signals) const {
    return simulate(signalWeightMatrix(signals));
}

Series PortfolioBacktester::simulate(const WeightMatrix& weights) const {
    const WeightMatrix positions = WeightMatrixBuilder::lag(weights);

    // Undefined terms are skipped; a row with none defined sums to 0
    std::vector<double> pnl(prices_.rows(), 0.0);
    for (size_t c = 0; c < symbols_.size(); ++c) {
        for (size_t r = 0; r < prices_.rows(); ++r) {
            const double term = positions.at(r, c) * asset_returns_.at(r, c);
            if (!std::isnan(term)) {
                pnl[r] += term;
            }
        }
    }

    if (cost_model_.enabled()) {
        cost_model_.applyCosts(pnl, CostModel::turnover(positions));
    }

    LOG_DEBUG("PortfolioBacktester run: {} rows, {} symbols", pnl.size(), symbols_.size());
    return Series(prices_.index(), std::move(pnl), OUTPUT_NAME);
}

} // namespace backtest
} // namespace quantsim
