#pragma once

#include <string>
#include <vector>
#include "common/Types.h"
#include "backtest/BacktestConfig.h"

namespace quantsim {
namespace backtest {

// "D"/"daily", "W"/"weekly", "M"/"ME"/"monthly", "Q"/"QE"/"quarterly" (case-insensitive).
// Throws ValidationError on anything else.
RebalanceFrequency parseRebalanceFrequency(const std::string& token);
std::string toString(RebalanceFrequency frequency);

class RebalanceCalendar {
public:
    // First observed timestamp of every calendar period present in the timeline,
    // ascending. Input order does not matter.
    static Timeline build(const Timeline& timeline, RebalanceFrequency frequency);

    // One flag per timeline row: true where build() would emit that row
    static std::vector<bool> markRows(const Timeline& timeline, const Timeline& rebalance_dates);

    // Monotone period number: equal for two timestamps iff they share a period
    static long long periodKey(Timestamp ts_ms, RebalanceFrequency frequency);
};

} // namespace backtest
} // namespace quantsim
