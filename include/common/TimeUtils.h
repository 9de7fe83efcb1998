#pragma once

#include <optional>
#include <string>
#include "common/Types.h"

namespace quantsim {
namespace utils {

struct CivilDate {
    int year = 1970;
    int month = 1;   // 1..12
    int day = 1;     // 1..31
};

class TimeUtils {
public:
    static constexpr long long MS_PER_DAY = 86400000LL;

    // Days since 1970-01-01, floored for pre-epoch timestamps
    static long long daysSinceEpoch(Timestamp ts_ms);

    static CivilDate toCivilDate(Timestamp ts_ms);
    static long long daysFromCivil(int year, int month, int day);

    // 28..31; month is 1..12
    static int daysInMonth(int year, int month);

    static Timestamp fromCivil(int year, int month, int day,
                               int hour = 0, int minute = 0, int second = 0);

    // Accepts "YYYY-MM-DD", "YYYY-MM-DD HH:MM:SS", "YYYY-MM-DDTHH:MM:SS[Z]",
    // or a plain integer (epoch seconds below 1e11, epoch milliseconds otherwise).
    static std::optional<Timestamp> parse(const std::string& text);

    // "YYYY-MM-DD"
    static std::string formatDate(Timestamp ts_ms);

    // 1e11 is year 5138 in seconds and 1973 in milliseconds
    static long long toMsTimestamp(long long ts);
};

} // namespace utils
} // namespace quantsim
