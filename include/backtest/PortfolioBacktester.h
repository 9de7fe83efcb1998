#pragma once

#include <string>
#include <vector>
#include "common/Types.h"
#include "common/PriceTable.h"
#include "backtest/BacktestConfig.h"
#include "backtest/CostModel.h"

namespace quantsim {
namespace backtest {

// Multi-asset backtester with calendar rebalancing.
//
// Weights come either from static targets reapplied on each rebalance date or
// from a per-symbol signal table normalized row by row. Weights decided at t
// are held from t+1; portfolio return is the position-weighted sum of asset
// close-to-close returns, less commission on total turnover.
class PortfolioBacktester {
public:
    static constexpr const char* OUTPUT_NAME = "portfolio_returns";

    // Throws ShapeError if the table lacks (symbol, field) columns or is ragged;
    // ValidationError if it is empty, a symbol has no close, the commission is
    // negative, or the target weights do not cover exactly the table's symbols.
    explicit PortfolioBacktester(const PriceTable& prices,
                                 const PortfolioConfig& config = PortfolioConfig());

    // Static target mode
    Series run() const;

    // Signal-override mode
    Series run(const SignalTable& signals) const;

    // Weights before the one-period lag
    WeightMatrix targetWeightMatrix() const;
    WeightMatrix signalWeightMatrix(const SignalTable& signals) const;

    Timeline rebalanceDates() const;

    // Per-symbol simple returns of close; row 0 undefined
    const SymbolTable& assetReturns() const { return asset_returns_; }

    const std::vector<std::string>& symbols() const { return symbols_; }
    const TargetWeights& weights() const { return weights_; }
    const PortfolioConfig& config() const { return config_; }

private:
    Series simulate(const WeightMatrix& weights) const;
    void validateWeights(const TargetWeights& weights) const;

    PriceTable prices_;
    PortfolioConfig config_;
    CostModel cost_model_;
    std::vector<std::string> symbols_;
    TargetWeights weights_;
    SymbolTable asset_returns_;
};

} // namespace backtest
} // namespace quantsim
