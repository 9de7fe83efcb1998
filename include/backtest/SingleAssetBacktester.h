#pragma once

#include "common/Types.h"
#include "backtest/BacktestConfig.h"
#include "backtest/CostModel.h"

namespace quantsim {
namespace backtest {

// Daily-close backtester for one instrument driven by a scalar signal.
//
// run() joins the signal with the prices on shared timestamps, takes the
// position at t as the signal at t-1 clamped to +-max_position, and earns
// position * simple return. With a commission, |delta position| * rate is
// deducted each period.
class SingleAssetBacktester {
public:
    static constexpr const char* OUTPUT_NAME = "strategy_returns";

    // Throws ValidationError for empty prices or out-of-range config,
    // ShapeError for a malformed price series.
    explicit SingleAssetBacktester(const Series& prices,
                                   const SimulatorConfig& config = SimulatorConfig());

    // Returns on the joined timeline; row 0 is undefined (NaN).
    // Throws ValidationError when signal and prices share no timestamp.
    Series run(const Series& signal) const;

    // Clamped, one-period-lagged positions on the joined timeline
    Series positions(const Series& signal) const;

    const Series& prices() const { return prices_; }
    const SimulatorConfig& config() const { return config_; }

private:
    struct Aligned {
        Timeline index;
        std::vector<double> signal;
        std::vector<double> prices;
    };

    Aligned align(const Series& signal) const;
    std::vector<double> lagAndClamp(const std::vector<double>& signal) const;

    Series prices_;
    SimulatorConfig config_;
    CostModel cost_model_;
};

} // namespace backtest
} // namespace quantsim
