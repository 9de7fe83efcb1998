#include "common/TimeUtils.h"

#include <cctype>
#include <cstdio>
#include <stdexcept>

namespace quantsim {
namespace utils {

namespace {
long long floorDiv(long long a, long long b) {
    long long q = a / b;
    if ((a % b != 0) && ((a < 0) != (b < 0))) {
        --q;
    }
    return q;
}

bool allDigits(const std::string& s, size_t from) {
    if (from >= s.size()) return false;
    for (size_t i = from; i < s.size(); ++i) {
        if (!std::isdigit(static_cast<unsigned char>(s[i]))) return false;
    }
    return true;
}
}

long long TimeUtils::daysSinceEpoch(Timestamp ts_ms) {
    return floorDiv(ts_ms, MS_PER_DAY);
}

// Howard Hinnant's civil_from_days / days_from_civil
CivilDate TimeUtils::toCivilDate(Timestamp ts_ms) {
    long long z = daysSinceEpoch(ts_ms) + 719468;
    const long long era = floorDiv(z, 146097);
    const long long doe = z - era * 146097;
    const long long yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const long long doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const long long mp = (5 * doy + 2) / 153;
    const long long d = doy - (153 * mp + 2) / 5 + 1;
    const long long m = mp < 10 ? mp + 3 : mp - 9;
    const long long y = yoe + era * 400 + (m <= 2 ? 1 : 0);

    CivilDate out;
    out.year = static_cast<int>(y);
    out.month = static_cast<int>(m);
    out.day = static_cast<int>(d);
    return out;
}

long long TimeUtils::daysFromCivil(int year, int month, int day) {
    const long long y = static_cast<long long>(year) - (month <= 2 ? 1 : 0);
    const long long era = floorDiv(y, 400);
    const long long yoe = y - era * 400;
    const long long mp = month > 2 ? month - 3 : month + 9;
    const long long doy = (153 * mp + 2) / 5 + day - 1;
    const long long doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + doe - 719468;
}

Timestamp TimeUtils::fromCivil(int year, int month, int day, int hour, int minute, int second) {
    const long long days = daysFromCivil(year, month, day);
    return days * MS_PER_DAY + (hour * 3600LL + minute * 60LL + second) * 1000LL;
}

long long TimeUtils::toMsTimestamp(long long ts) {
    if (ts > -100000000000LL && ts < 100000000000LL) {
        return ts * 1000LL;
    }
    return ts;
}

std::optional<Timestamp> TimeUtils::parse(const std::string& raw) {
    std::string text = raw;
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) text.pop_back();
    size_t start = 0;
    while (start < text.size() && std::isspace(static_cast<unsigned char>(text[start]))) ++start;
    text = text.substr(start);
    if (text.empty()) {
        return std::nullopt;
    }

    if (allDigits(text, text[0] == '-' ? 1 : 0)) {
        try {
            return toMsTimestamp(std::stoll(text));
        } catch (const std::exception&) {
            return std::nullopt;
        }
    }

    int year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0;
    if (std::sscanf(text.c_str(), "%4d-%2d-%2d", &year, &month, &day) != 3) {
        return std::nullopt;
    }
    if (text.size() > 10) {
        const char sep = text[10];
        if (sep != 'T' && sep != ' ') {
            return std::nullopt;
        }
        if (std::sscanf(text.c_str() + 11, "%2d:%2d:%2d", &hour, &minute, &second) < 2) {
            return std::nullopt;
        }
    }
    if (month < 1 || month > 12 || day < 1 || day > daysInMonth(year, month) ||
        hour < 0 || hour > 23 || minute < 0 || minute > 59 || second < 0 || second > 60) {
        return std::nullopt;
    }
    return fromCivil(year, month, day, hour, minute, second);
}

int TimeUtils::daysInMonth(int year, int month) {
    const int next_year = month == 12 ? year + 1 : year;
    const int next_month = month == 12 ? 1 : month + 1;
    return static_cast<int>(daysFromCivil(next_year, next_month, 1) - daysFromCivil(year, month, 1));
}

std::string TimeUtils::formatDate(Timestamp ts_ms) {
    const CivilDate d = toCivilDate(ts_ms);
    char buffer[16];
    std::snprintf(buffer, sizeof(buffer), "%04d-%02d-%02d", d.year, d.month, d.day);
    return buffer;
}

} // namespace utils
} // namespace quantsim
