#include "backtest/WeightMatrixBuilder.h"
#include "backtest/RebalanceCalendar.h"
#include "common/Errors.h"

#include <algorithm>
#include <cmath>
#include <limits>

namespace quantsim {
namespace backtest {

WeightMatrix WeightMatrixBuilder::fromTargets(const Timeline& timeline,
                                              const std::vector<std::string>& symbols,
                                              const TargetWeights& targets,
                                              const Timeline& rebalance_dates) {
    WeightMatrix weights(timeline, symbols, 0.0);

    std::vector<double> target_row(symbols.size(), 0.0);
    for (size_t c = 0; c < symbols.size(); ++c) {
        auto it = targets.find(symbols[c]);
        if (it != targets.end()) {
            target_row[c] = it->second;
        }
    }

    // Explicit marker: a zero target resets the symbol instead of inheriting the old weight
    const auto is_rebalance = RebalanceCalendar::markRows(timeline, rebalance_dates);
    std::vector<double> current(symbols.size(), 0.0);
    for (size_t r = 0; r < timeline.size(); ++r) {
        if (is_rebalance[r]) {
            current = target_row;
        }
        for (size_t c = 0; c < symbols.size(); ++c) {
            weights.at(r, c) = current[c];
        }
    }
    return weights;
}

SignalTable WeightMatrixBuilder::normalizeRows(const SignalTable& signals) {
    SignalTable out(signals.index, signals.symbols, 0.0);
    for (size_t r = 0; r < signals.rows(); ++r) {
        double abs_sum = 0.0;
        for (size_t c = 0; c < signals.cols(); ++c) {
            const double v = signals.at(r, c);
            if (!std::isnan(v)) {
                abs_sum += std::abs(v);
            }
        }
        if (abs_sum == 0.0 || !std::isfinite(abs_sum)) {
            continue;
        }
        for (size_t c = 0; c < signals.cols(); ++c) {
            const double v = signals.at(r, c);
            out.at(r, c) = std::isnan(v) ? 0.0 : v / abs_sum;
        }
    }
    return out;
}

WeightMatrix WeightMatrixBuilder::fromSignals(const Timeline& timeline,
                                              const std::vector<std::string>& symbols,
                                              const SignalTable& signals) {
    std::vector<std::string> unknown;
    for (const auto& s : signals.symbols) {
        if (std::find(symbols.begin(), symbols.end(), s) == symbols.end()) {
            unknown.push_back(s);
        }
    }
    if (!unknown.empty()) {
        throw ValidationError("signals contain symbols not in data: " + joinNames(unknown));
    }

    const SignalTable normalized = normalizeRows(signals.sortedByIndex());

    WeightMatrix weights(timeline, symbols, 0.0);
    std::vector<int> signal_col(symbols.size(), -1);
    for (size_t c = 0; c < symbols.size(); ++c) {
        signal_col[c] = normalized.columnOf(symbols[c]);
    }

    // Exact-timestamp reindex with forward fill; rows before the first match stay 0
    std::vector<double> current(symbols.size(), 0.0);
    size_t s = 0;
    for (size_t r = 0; r < timeline.size(); ++r) {
        while (s < normalized.rows() && normalized.index[s] < timeline[r]) {
            ++s;
        }
        if (s < normalized.rows() && normalized.index[s] == timeline[r]) {
            for (size_t c = 0; c < symbols.size(); ++c) {
                current[c] = signal_col[c] >= 0
                    ? normalized.at(s, static_cast<size_t>(signal_col[c]))
                    : 0.0;
            }
        }
        for (size_t c = 0; c < symbols.size(); ++c) {
            weights.at(r, c) = current[c];
        }
    }
    return weights;
}

WeightMatrix WeightMatrixBuilder::lag(const WeightMatrix& weights) {
    WeightMatrix positions(weights.index, weights.symbols, std::numeric_limits<double>::quiet_NaN());
    for (size_t c = 0; c < weights.cols(); ++c) {
        for (size_t r = 1; r < weights.rows(); ++r) {
            positions.at(r, c) = weights.at(r - 1, c);
        }
    }
    return positions;
}

} // namespace backtest
} // namespace quantsim
