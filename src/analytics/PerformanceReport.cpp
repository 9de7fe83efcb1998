#include "analytics/PerformanceReport.h"
#include "analytics/PerformanceMetrics.h"
#include "common/TimeUtils.h"

#include <cmath>
#include <iomanip>

namespace quantsim {
namespace analytics {

namespace {
nlohmann::json jsonNumber(double v) {
    return std::isnan(v) ? nlohmann::json() : nlohmann::json(v);
}
}

nlohmann::json PerformanceReport::toJson(const std::string& title, const Series& returns, int annualization) {
    const auto summary = PerformanceMetrics::summarize(returns, annualization);

    nlohmann::json j;
    j["run"] = title;
    j["series"] = returns.name;
    j["periods"] = summary.periods;
    j["sharpe"] = jsonNumber(summary.sharpe);
    j["sortino"] = jsonNumber(summary.sortino);
    j["max_drawdown"] = jsonNumber(summary.max_drawdown);
    j["cumulative_return"] = summary.cumulative_return;
    if (!returns.index.empty()) {
        j["start"] = utils::TimeUtils::formatDate(returns.index.front());
        j["end"] = utils::TimeUtils::formatDate(returns.index.back());
    }
    return j;
}

void PerformanceReport::print(std::ostream& out, const std::string& title, const Series& returns,
                              int annualization, bool json_mode) {
    if (json_mode) {
        out << toJson(title, returns, annualization).dump(2) << std::endl;
        return;
    }

    const auto summary = PerformanceMetrics::summarize(returns, annualization);
    out << "\n=============================================\n";
    out << "  " << title << "\n";
    out << "=============================================\n";
    if (!returns.index.empty()) {
        out << "Period        : " << utils::TimeUtils::formatDate(returns.index.front())
            << " ~ " << utils::TimeUtils::formatDate(returns.index.back()) << "\n";
    }
    out << std::fixed << std::setprecision(4);
    out << "Periods       : " << summary.periods << "\n";
    out << "Sharpe        : " << summary.sharpe << "\n";
    out << "Sortino       : " << summary.sortino << "\n";
    out << "Max drawdown  : " << summary.max_drawdown * 100.0 << "%\n";
    out << "Total return  : " << summary.cumulative_return * 100.0 << "%\n";
}

} // namespace analytics
} // namespace quantsim
