#include "analytics/PerformanceReport.h"
#include "common/Logger.h"

#include <cassert>
#include <cmath>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <limits>
#include <sstream>

using namespace quantsim;
using quantsim::analytics::PerformanceReport;

namespace {
constexpr double NaN = std::numeric_limits<double>::quiet_NaN();
}

int main() {
    const Series returns(Timeline{1704067200000LL, 1704153600000LL, 1704240000000LL},
                         {NaN, 0.01, -0.02}, "strategy_returns");

    // Undefined metrics become null
    {
        const Series flat(Timeline{1, 2}, {NaN, 0.0}, "strategy_returns");
        const auto j = PerformanceReport::toJson("flat", flat, 252);
        assert(j["sharpe"].is_null());
        assert(j["periods"] == 1);
    }

    // Text mode
    {
        std::ostringstream out;
        PerformanceReport::print(out, "Single asset (momentum)", returns, 252, false);
        assert(out.str().find("Single asset (momentum)") != std::string::npos);
        assert(out.str().find("2024-01-01 ~ 2024-01-03") != std::string::npos);
    }

    // JSON mode: with logging active, stdout carries nothing but the report
    const auto dir = std::filesystem::temp_directory_path() / "quantsim_test_report";
    std::filesystem::create_directories(dir);
    const auto captured = dir / "stdout.txt";

    std::fflush(stdout);
    if (!std::freopen(captured.string().c_str(), "w", stdout)) {
        std::cerr << "[TEST] PerformanceReport could not redirect stdout\n";
        return 1;
    }

    Logger::getInstance().initialize((dir / "logs").string(), true);
    LOG_INFO("QuantSim starting in {} mode", "single");
    PerformanceReport::print(std::cout, "Single asset (momentum)", returns, 252, true);
    LOG_INFO("done");
    std::cout.flush();
    std::fflush(stdout);

    std::ifstream in(captured);
    std::stringstream text;
    text << in.rdbuf();

    const auto j = nlohmann::json::parse(text.str());
    assert(j["run"] == "Single asset (momentum)");
    assert(j["series"] == "strategy_returns");
    assert(j["periods"] == 2);
    assert(j["start"] == "2024-01-01");
    assert(j["end"] == "2024-01-03");
    assert(std::abs(j["cumulative_return"].get<double>() - (1.01 * 0.98 - 1.0)) < 1e-12);
    assert(j["max_drawdown"].is_number());

    std::filesystem::remove_all(dir);
    std::cerr << "[TEST] PerformanceReport PASSED\n";
    return 0;
}
