#include "backtest/CostModel.h"
#include "common/Errors.h"

#include <cmath>
#include <string>

namespace quantsim {
namespace backtest {

CostModel::CostModel(double commission_rate)
    : commission_rate_(commission_rate)
{
    if (!std::isfinite(commission_rate) || commission_rate < 0.0) {
        throw ValidationError("commission_rate cannot be negative (got " +
                              std::to_string(commission_rate) + ")");
    }
}

std::vector<double> CostModel::turnover(const std::vector<double>& positions) {
    std::vector<double> out(positions.size(), 0.0);
    for (size_t t = 1; t < positions.size(); ++t) {
        const double delta = positions[t] - positions[t - 1];
        if (!std::isnan(delta)) {
            out[t] = std::abs(delta);
        }
    }
    return out;
}

std::vector<double> CostModel::turnover(const WeightMatrix& positions) {
    std::vector<double> out(positions.rows(), 0.0);
    for (size_t c = 0; c < positions.cols(); ++c) {
        const auto& column = positions.columns[c];
        for (size_t t = 1; t < positions.rows(); ++t) {
            const double delta = column[t] - column[t - 1];
            if (!std::isnan(delta)) {
                out[t] += std::abs(delta);
            }
        }
    }
    return out;
}

std::vector<double> CostModel::costs(const std::vector<double>& turnover) const {
    std::vector<double> out(turnover.size(), 0.0);
    for (size_t t = 0; t < turnover.size(); ++t) {
        out[t] = turnover[t] * commission_rate_;
    }
    return out;
}

void CostModel::applyCosts(std::vector<double>& returns, const std::vector<double>& turnover) const {
    if (returns.size() != turnover.size()) {
        throw ShapeError("turnover has " + std::to_string(turnover.size()) +
                         " rows, returns have " + std::to_string(returns.size()));
    }
    const auto cost = costs(turnover);
    for (size_t t = 0; t < returns.size(); ++t) {
        returns[t] -= cost[t];
    }
}

} // namespace backtest
} // namespace quantsim
