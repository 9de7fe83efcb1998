#pragma once

#include <string>
#include <nlohmann/json.hpp>
#include "backtest/BacktestConfig.h"

namespace quantsim {

class Config {
public:
    static Config& getInstance();

    // Missing file keeps defaults. Out-of-range values throw ValidationError.
    void load(const std::string& config_path);

    // Same rules as load(), from an already parsed document
    void loadFromJson(const nlohmann::json& j);

    // Back to built-in defaults
    void reset();

    std::string getLogLevel() const { return log_level_; }
    int getAnnualization() const { return annualization_; }

    backtest::SimulatorConfig getSimulatorConfig() const { return simulator_config_; }
    backtest::PortfolioConfig getPortfolioConfig() const { return portfolio_config_; }

    void setCommissionRate(double rate);

private:
    Config() = default;

    std::string log_level_ = "info";
    int annualization_ = 252;

    backtest::SimulatorConfig simulator_config_;
    backtest::PortfolioConfig portfolio_config_;
};

} // namespace quantsim
