#pragma once

#include <vector>
#include "common/Types.h"

namespace quantsim {
namespace backtest {

// Flat linear commission on turnover: cost(t) = turnover(t) * commission_rate
class CostModel {
public:
    CostModel() = default;

    // Throws ValidationError if commission_rate < 0 or not finite
    explicit CostModel(double commission_rate);

    static double rateFromBps(double commission_bps) { return commission_bps / 10000.0; }

    double commissionRate() const { return commission_rate_; }
    bool enabled() const { return commission_rate_ > 0.0; }

    // |p(t) - p(t-1)|; row 0 and undefined differences are 0
    static std::vector<double> turnover(const std::vector<double>& positions);

    // Sum over symbols of |p(t, s) - p(t-1, s)|, undefined terms skipped
    static std::vector<double> turnover(const WeightMatrix& positions);

    std::vector<double> costs(const std::vector<double>& turnover) const;

    // returns[t] -= cost[t]; an undefined return stays undefined
    void applyCosts(std::vector<double>& returns, const std::vector<double>& turnover) const;

private:
    double commission_rate_ = 0.0;
};

} // namespace backtest
} // namespace quantsim
