#include "backtest/SingleAssetBacktester.h"
#include "common/Errors.h"
#include "common/Logger.h"

#include <algorithm>
#include <cmath>
#include <limits>
#include <string>

namespace quantsim {
namespace backtest {

namespace {
constexpr double NaN = std::numeric_limits<double>::quiet_NaN();

SimulatorConfig validated(const SimulatorConfig& config) {
    if (!(config.max_position > 0.0)) {
        throw ValidationError("max_position must be positive (got " +
                              std::to_string(config.max_position) + ")");
    }
    if (!(config.commission_rate >= 0.0)) {
        throw ValidationError("commission_rate cannot be negative (got " +
                              std::to_string(config.commission_rate) + ")");
    }
    return config;
}
}

SingleAssetBacktester::SingleAssetBacktester(const Series& prices, const SimulatorConfig& config)
    : config_(validated(config))
    , cost_model_(config.commission_rate)
{
    if (prices.index.size() != prices.values.size()) {
        throw ShapeError("prices must be a series with one value per timestamp");
    }
    if (prices.empty()) {
        throw ValidationError("prices must contain at least one observation");
    }
    prices_ = prices.sortedByIndex();

    LOG_INFO("SingleAssetBacktester ready: {} prices, max_position={}, commission_rate={}",
             prices_.size(), config_.max_position, config_.commission_rate);
}

SingleAssetBacktester::Aligned SingleAssetBacktester::align(const Series& signal) const {
    const Series sorted = signal.sortedByIndex();

    Aligned out;
    size_t i = 0;
    size_t j = 0;
    while (i < sorted.size() && j < prices_.size()) {
        if (sorted.index[i] < prices_.index[j]) {
            ++i;
        } else if (prices_.index[j] < sorted.index[i]) {
            ++j;
        } else {
            if (!std::isnan(sorted.values[i])) {
                out.index.push_back(prices_.index[j]);
                out.signal.push_back(sorted.values[i]);
                out.prices.push_back(prices_.values[j]);
            }
            ++i;
            ++j;
        }
    }

    if (out.index.empty()) {
        throw ValidationError("signal and prices do not share any timestamps");
    }
    return out;
}

std::vector<double> SingleAssetBacktester::lagAndClamp(const std::vector<double>& signal) const {
    std::vector<double> positions(signal.size(), NaN);
    for (size_t t = 1; t < signal.size(); ++t) {
        positions[t] = std::clamp(signal[t - 1], -config_.max_position, config_.max_position);
    }
    return positions;
}

Series SingleAssetBacktester::positions(const Series& signal) const {
    const Aligned aligned = align(signal);
    return Series(aligned.index, lagAndClamp(aligned.signal), "positions");
}

Series SingleAssetBacktester::run(const Series& signal) const {
    const Aligned aligned = align(signal);
    const auto positions = lagAndClamp(aligned.signal);

    std::vector<double> pnl(aligned.index.size(), NaN);
    for (size_t t = 1; t < pnl.size(); ++t) {
        const double asset_return = aligned.prices[t] / aligned.prices[t - 1] - 1.0;
        pnl[t] = positions[t] * asset_return;
    }

    if (cost_model_.enabled()) {
        cost_model_.applyCosts(pnl, CostModel::turnover(positions));
    }

    LOG_DEBUG("SingleAssetBacktester run: {} aligned rows of {} signal values",
              aligned.index.size(), signal.size());
    return Series(aligned.index, std::move(pnl), OUTPUT_NAME);
}

} // namespace backtest
} // namespace quantsim
