#include "common/Config.h"
#include "backtest/CostModel.h"
#include "common/Errors.h"

#include <cassert>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>

using namespace quantsim;
using backtest::RebalanceFrequency;

namespace {
bool rejects(const nlohmann::json& j) {
    Config::getInstance().reset();
    try {
        Config::getInstance().loadFromJson(j);
    } catch (const ValidationError&) {
        return true;
    }
    return false;
}
}

int main() {
    Config& config = Config::getInstance();

    // Defaults, also kept when the file does not exist
    {
        config.reset();
        config.load("/nonexistent/quantsim/config.json");
        assert(config.getLogLevel() == "info");
        assert(config.getAnnualization() == 252);
        assert(config.getSimulatorConfig().max_position == 1.0);
        assert(config.getSimulatorConfig().commission_rate == 0.0);
        assert(config.getPortfolioConfig().rebalance_frequency == RebalanceFrequency::MONTHLY);
        assert(!config.getPortfolioConfig().weights);
    }

    // Full document from disk
    {
        const auto path = std::filesystem::temp_directory_path() / "quantsim_test_config.json";
        {
            std::ofstream out(path);
            out << R"({
                "logging": { "level": "debug" },
                "backtest": { "max_position": 0.5, "commission_rate": 0.002 },
                "portfolio": {
                    "rebalance_frequency": "W",
                    "commission_bps": 10,
                    "weights": { "SPY": 0.6, "BND": 0.4 }
                },
                "metrics": { "annualization": 52 }
            })";
        }
        config.reset();
        config.load(path.string());
        std::filesystem::remove(path);

        assert(config.getLogLevel() == "debug");
        assert(config.getAnnualization() == 52);
        assert(config.getSimulatorConfig().max_position == 0.5);
        assert(std::abs(config.getSimulatorConfig().commission_rate - 0.002) < 1e-12);

        const auto portfolio = config.getPortfolioConfig();
        assert(portfolio.rebalance_frequency == RebalanceFrequency::WEEKLY);
        assert(std::abs(portfolio.commission_rate - 0.001) < 1e-12);
        assert(portfolio.weights && portfolio.weights->size() == 2);
        assert(portfolio.weights->at("SPY") == 0.6);
    }

    // Broken JSON on disk
    {
        const auto path = std::filesystem::temp_directory_path() / "quantsim_test_broken.json";
        {
            std::ofstream out(path);
            out << "{ \"backtest\": ";
        }
        bool threw = false;
        try {
            config.load(path.string());
        } catch (const ValidationError&) {
            threw = true;
        }
        std::filesystem::remove(path);
        assert(threw);
    }

    // Out-of-range and mistyped values
    {
        assert(rejects(nlohmann::json::parse(R"({"backtest": {"max_position": 0}})")));
        assert(rejects(nlohmann::json::parse(R"({"backtest": {"commission_rate": -0.1}})")));
        assert(rejects(nlohmann::json::parse(R"({"portfolio": {"commission_bps": -5}})")));
        assert(rejects(nlohmann::json::parse(R"({"portfolio": {"rebalance_frequency": "yearly"}})")));
        assert(rejects(nlohmann::json::parse(R"({"metrics": {"annualization": 0}})")));
        assert(rejects(nlohmann::json::parse(R"({"backtest": {"max_position": "big"}})")));
    }

    // Command-line override
    {
        config.reset();
        config.setCommissionRate(0.0005);
        assert(config.getSimulatorConfig().commission_rate == 0.0005);
        assert(config.getPortfolioConfig().commission_rate == 0.0005);

        // a rejected override leaves the previous rate in place
        bool threw = false;
        try {
            config.setCommissionRate(backtest::CostModel::rateFromBps(-5.0));
        } catch (const ValidationError&) {
            threw = true;
        }
        assert(threw);

        threw = false;
        try {
            config.setCommissionRate(backtest::CostModel::rateFromBps(std::stod("nan")));
        } catch (const ValidationError&) {
            threw = true;
        }
        assert(threw);
        assert(config.getSimulatorConfig().commission_rate == 0.0005);
    }

    config.reset();
    std::cout << "[TEST] Config PASSED\n";
    return 0;
}
