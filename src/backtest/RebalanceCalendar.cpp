#include "backtest/RebalanceCalendar.h"
#include "common/Errors.h"
#include "common/TimeUtils.h"

#include <algorithm>
#include <cctype>
#include <map>

namespace quantsim {
namespace backtest {

namespace {
std::string toLowerCopy(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

long long floorDiv(long long a, long long b) {
    long long q = a / b;
    if ((a % b != 0) && ((a < 0) != (b < 0))) {
        --q;
    }
    return q;
}
}

RebalanceFrequency parseRebalanceFrequency(const std::string& token) {
    const auto s = toLowerCopy(token);
    if (s == "d" || s == "daily") return RebalanceFrequency::DAILY;
    if (s == "w" || s == "weekly") return RebalanceFrequency::WEEKLY;
    if (s == "m" || s == "me" || s == "monthly") return RebalanceFrequency::MONTHLY;
    if (s == "q" || s == "qe" || s == "quarterly") return RebalanceFrequency::QUARTERLY;
    throw ValidationError("Invalid rebalance frequency: '" + token + "'");
}

std::string toString(RebalanceFrequency frequency) {
    switch (frequency) {
        case RebalanceFrequency::DAILY: return "daily";
        case RebalanceFrequency::WEEKLY: return "weekly";
        case RebalanceFrequency::MONTHLY: return "monthly";
        case RebalanceFrequency::QUARTERLY: return "quarterly";
    }
    return "unknown";
}

long long RebalanceCalendar::periodKey(Timestamp ts_ms, RebalanceFrequency frequency) {
    const long long days = utils::TimeUtils::daysSinceEpoch(ts_ms);
    switch (frequency) {
        case RebalanceFrequency::DAILY:
            return days;
        case RebalanceFrequency::WEEKLY:
            // 1970-01-01 was a Thursday; shift so weeks start on Monday
            return floorDiv(days + 3, 7);
        case RebalanceFrequency::MONTHLY: {
            const auto d = utils::TimeUtils::toCivilDate(ts_ms);
            return static_cast<long long>(d.year) * 12 + (d.month - 1);
        }
        case RebalanceFrequency::QUARTERLY: {
            const auto d = utils::TimeUtils::toCivilDate(ts_ms);
            return static_cast<long long>(d.year) * 4 + (d.month - 1) / 3;
        }
    }
    return days;
}

Timeline RebalanceCalendar::build(const Timeline& timeline, RebalanceFrequency frequency) {
    std::map<long long, Timestamp> first_in_period;
    for (Timestamp ts : timeline) {
        const long long key = periodKey(ts, frequency);
        auto it = first_in_period.find(key);
        if (it == first_in_period.end()) {
            first_in_period.emplace(key, ts);
        } else if (ts < it->second) {
            it->second = ts;
        }
    }

    Timeline dates;
    dates.reserve(first_in_period.size());
    for (const auto& kv : first_in_period) {
        dates.push_back(kv.second);
    }
    return dates;
}

std::vector<bool> RebalanceCalendar::markRows(const Timeline& timeline, const Timeline& rebalance_dates) {
    Timeline sorted_dates = rebalance_dates;
    std::sort(sorted_dates.begin(), sorted_dates.end());

    std::vector<bool> marks(timeline.size(), false);
    for (size_t i = 0; i < timeline.size(); ++i) {
        marks[i] = std::binary_search(sorted_dates.begin(), sorted_dates.end(), timeline[i]);
    }
    return marks;
}

} // namespace backtest
} // namespace quantsim
