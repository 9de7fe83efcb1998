#pragma once

#include <string>
#include <vector>
#include "common/Types.h"

namespace quantsim {
namespace backtest {

class WeightMatrixBuilder {
public:
    // Static target mode. Rows before the first rebalance date are 0; a rebalance
    // row is set to the targets (symbols without a target get 0) and held until
    // the next rebalance row. Rebalance dates outside the timeline are ignored.
    static WeightMatrix fromTargets(const Timeline& timeline,
                                    const std::vector<std::string>& symbols,
                                    const TargetWeights& targets,
                                    const Timeline& rebalance_dates);

    // Signal-override mode. Rows are normalized by their absolute sum, matched
    // onto the timeline by exact timestamp, forward-filled, then 0-filled.
    // Throws ValidationError if the signals name a symbol not in `symbols`.
    static WeightMatrix fromSignals(const Timeline& timeline,
                                    const std::vector<std::string>& symbols,
                                    const SignalTable& signals);

    // Each row divided by its sum of |value|; NaN cells count as 0 and come out 0;
    // an all-zero row stays all-zero.
    static SignalTable normalizeRows(const SignalTable& signals);

    // Position(t) = weights(t-1); row 0 is undefined (NaN)
    static WeightMatrix lag(const WeightMatrix& weights);
};

} // namespace backtest
} // namespace quantsim
