#include "common/Config.h"
#include "common/Errors.h"
#include "common/Logger.h"
#include "common/PathUtils.h"
#include "backtest/CostModel.h"
#include "backtest/RebalanceCalendar.h"

#include <cmath>
#include <filesystem>
#include <fstream>

namespace quantsim {

namespace {
double readCommission(const nlohmann::json& section, double fallback) {
    // commission_bps wins over commission_rate when both are set
    double rate = section.value("commission_rate", fallback);
    const double bps = section.value("commission_bps", 0.0);
    if (bps != 0.0) {
        rate = backtest::CostModel::rateFromBps(bps);
    }
    if (!std::isfinite(rate) || rate < 0.0) {
        throw ValidationError("commission cannot be negative (got rate " + std::to_string(rate) + ")");
    }
    return rate;
}
}

Config& Config::getInstance() {
    static Config instance;
    return instance;
}

void Config::reset() {
    log_level_ = "info";
    annualization_ = 252;
    simulator_config_ = backtest::SimulatorConfig();
    portfolio_config_ = backtest::PortfolioConfig();
}

void Config::setCommissionRate(double rate) {
    if (!std::isfinite(rate) || rate < 0.0) {
        throw ValidationError("commission_rate cannot be negative (got " + std::to_string(rate) + ")");
    }
    simulator_config_.commission_rate = rate;
    portfolio_config_.commission_rate = rate;
}

void Config::load(const std::string& path) {
    const std::filesystem::path config_path = utils::PathUtils::resolveInputPath(path);

    LOG_INFO("Config path: {}", config_path.string());

    if (!std::filesystem::exists(config_path)) {
        LOG_WARN("Config file not found: {} (using defaults)", config_path.string());
        return;
    }

    std::ifstream file(config_path);
    if (!file.is_open()) {
        LOG_WARN("Config file could not be opened: {} (using defaults)", config_path.string());
        return;
    }

    nlohmann::json j;
    try {
        file >> j;
    } catch (const nlohmann::json::parse_error& e) {
        throw ValidationError("config file is not valid JSON: " + config_path.string() + " - " + e.what());
    }

    loadFromJson(j);
    LOG_INFO("Config loaded: commission_rate={}, rebalance={}, max_position={}",
             portfolio_config_.commission_rate,
             backtest::toString(portfolio_config_.rebalance_frequency),
             simulator_config_.max_position);
}

void Config::loadFromJson(const nlohmann::json& j) {
    try {
        if (j.contains("logging")) {
            log_level_ = j["logging"].value("level", log_level_);
        }

        if (j.contains("backtest")) {
            const auto& b = j["backtest"];
            const double max_position = b.value("max_position", simulator_config_.max_position);
            if (!(max_position > 0.0)) {
                throw ValidationError("backtest.max_position must be positive (got " +
                                      std::to_string(max_position) + ")");
            }
            simulator_config_.max_position = max_position;
            simulator_config_.commission_rate = readCommission(b, simulator_config_.commission_rate);
        }

        if (j.contains("portfolio")) {
            const auto& p = j["portfolio"];
            if (p.contains("rebalance_frequency")) {
                portfolio_config_.rebalance_frequency =
                    backtest::parseRebalanceFrequency(p["rebalance_frequency"].get<std::string>());
            }
            portfolio_config_.commission_rate = readCommission(p, portfolio_config_.commission_rate);
            if (p.contains("weights") && !p["weights"].is_null()) {
                portfolio_config_.weights = p["weights"].get<TargetWeights>();
            }
        }

        if (j.contains("metrics")) {
            const int annualization = j["metrics"].value("annualization", annualization_);
            if (annualization <= 0) {
                throw ValidationError("metrics.annualization must be positive (got " +
                                      std::to_string(annualization) + ")");
            }
            annualization_ = annualization;
        }
    } catch (const nlohmann::json::type_error& e) {
        throw ValidationError(std::string("config value has the wrong type: ") + e.what());
    }
}

} // namespace quantsim
