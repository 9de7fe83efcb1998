#include "common/Logger.h"
#include "common/Config.h"
#include "common/Errors.h"
#include "common/PathUtils.h"
#include "common/TimeUtils.h"
#include "analytics/FactorFactory.h"
#include "analytics/MacdIndicator.h"
#include "analytics/PerformanceReport.h"
#include "backtest/DataHistory.h"
#include "backtest/PortfolioBacktester.h"
#include "backtest/RebalanceCalendar.h"
#include "backtest/SingleAssetBacktester.h"

#include <cmath>
#include <iostream>
#include <map>
#include <optional>
#include <string>
#include <vector>

using namespace quantsim;

namespace {

struct CliOptions {
    std::string mode;                               // "single" | "portfolio"
    std::string single_path;
    std::map<std::string, std::string> portfolio_paths;
    std::string factor = "momentum";
    std::string signals_factor;
    std::string config_path = "config/config.json";
    std::string start_date;
    std::string end_date;
    std::optional<double> commission_bps;
    bool json_mode = false;
};

void printUsage() {
    std::cout << "Usage:\n"
              << "  quantsim --single <prices.csv> [--factor momentum|sma|rsi|volatility|macd]\n"
              << "  quantsim --portfolio SYMBOL=<prices.csv> [SYMBOL=<prices.csv> ...] [--signals-factor <name>]\n"
              << "Price sources may be local CSV or JSON files, or http(s):// / file:// URLs serving CSV.\n"
              << "Options:\n"
              << "  --config <path>          JSON config (default config/config.json)\n"
              << "  --start <YYYY-MM-DD>     first date to simulate\n"
              << "  --end <YYYY-MM-DD>       last date to simulate\n"
              << "  --commission-bps <bps>   override the configured commission\n"
              << "  --json                   print the report as JSON\n";
}

bool parseArgs(int argc, char* argv[], CliOptions& opts) {
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--single" && i + 1 < argc) {
            opts.mode = "single";
            opts.single_path = argv[++i];
        } else if (arg == "--portfolio") {
            opts.mode = "portfolio";
            while (i + 1 < argc && std::string(argv[i + 1]).rfind("--", 0) != 0) {
                const std::string spec = argv[++i];
                const auto eq = spec.find('=');
                if (eq == std::string::npos || eq == 0 || eq + 1 == spec.size()) {
                    std::cerr << "Invalid portfolio entry (expected SYMBOL=path): " << spec << "\n";
                    return false;
                }
                opts.portfolio_paths[spec.substr(0, eq)] = spec.substr(eq + 1);
            }
        } else if (arg == "--factor" && i + 1 < argc) {
            opts.factor = argv[++i];
        } else if (arg == "--signals-factor" && i + 1 < argc) {
            opts.signals_factor = argv[++i];
        } else if (arg == "--config" && i + 1 < argc) {
            opts.config_path = argv[++i];
        } else if (arg == "--start" && i + 1 < argc) {
            opts.start_date = argv[++i];
        } else if (arg == "--end" && i + 1 < argc) {
            opts.end_date = argv[++i];
        } else if (arg == "--commission-bps" && i + 1 < argc) {
            try {
                opts.commission_bps = std::stod(argv[++i]);
            } catch (const std::exception&) {
                std::cerr << "Invalid --commission-bps value: " << argv[i] << "\n";
                return false;
            }
        } else if (arg == "--json") {
            opts.json_mode = true;
        } else {
            std::cerr << "Unknown or incomplete argument: " << arg << "\n";
            return false;
        }
    }
    if (opts.mode == "single") return !opts.single_path.empty();
    if (opts.mode == "portfolio") return !opts.portfolio_paths.empty();
    return false;
}

std::vector<Candle> loadCandles(const std::string& symbol, const std::string& path, const CliOptions& opts) {
    std::vector<Candle> candles;
    if (path.find("://") != std::string::npos) {
        candles = backtest::DataHistory::load(symbol, "", path);
    } else {
        const auto resolved = utils::PathUtils::resolveInputPath(path).string();
        const bool is_json = resolved.size() >= 5 && resolved.compare(resolved.size() - 5, 5, ".json") == 0;
        candles = is_json
            ? backtest::DataHistory::load(symbol, "", "", resolved)
            : backtest::DataHistory::load(symbol, resolved);
    }
    return backtest::DataHistory::filterByDate(candles, opts.start_date, opts.end_date);
}

Series computeSignal(const std::string& factor_name, const std::vector<Candle>& candles) {
    if (factor_name == "macd") {
        return analytics::MacdIndicator().compute(candles).histogram;
    }
    return analytics::createFactor(factor_name)->compute(candles);
}

int runSingle(const CliOptions& opts, const Config& config) {
    const auto candles = loadCandles("single", opts.single_path, opts);
    const Series prices = backtest::DataHistory::toPriceSeries(candles);
    const Series signal = computeSignal(opts.factor, candles);

    backtest::SingleAssetBacktester backtester(prices, config.getSimulatorConfig());
    const Series returns = backtester.run(signal);

    analytics::PerformanceReport::print(std::cout, "Single asset (" + opts.factor + ")", returns,
                                        config.getAnnualization(), opts.json_mode);
    return 0;
}

int runPortfolio(const CliOptions& opts, const Config& config) {
    std::map<std::string, std::vector<Candle>> candles_by_symbol;
    for (const auto& kv : opts.portfolio_paths) {
        candles_by_symbol[kv.first] = loadCandles(kv.first, kv.second, opts);
    }
    const PriceTable table = backtest::DataHistory::buildPriceTable(candles_by_symbol);

    const auto portfolio_config = config.getPortfolioConfig();
    backtest::PortfolioBacktester backtester(table, portfolio_config);

    Series returns;
    std::string title = "Portfolio (" + backtest::toString(portfolio_config.rebalance_frequency) + " rebalance)";
    if (opts.signals_factor.empty()) {
        returns = backtester.run();
    } else {
        SignalTable signals(table.index(), {}, 0.0);
        for (const auto& kv : candles_by_symbol) {
            const Series s = computeSignal(opts.signals_factor, kv.second);
            std::map<Timestamp, double> by_ts;
            for (size_t i = 0; i < s.size(); ++i) by_ts[s.index[i]] = s.values[i];

            std::vector<double> column;
            column.reserve(table.rows());
            for (Timestamp ts : table.index()) {
                column.push_back(by_ts.at(ts));
            }
            signals.addColumn(kv.first, std::move(column));
        }
        returns = backtester.run(signals);
        title = "Portfolio (" + opts.signals_factor + " signals)";
    }

    analytics::PerformanceReport::print(std::cout, title, returns, config.getAnnualization(), opts.json_mode);
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    CliOptions opts;
    if (!parseArgs(argc, argv, opts)) {
        printUsage();
        return 1;
    }

    try {
        Logger::getInstance().initialize("logs", opts.json_mode);

        auto& config = Config::getInstance();
        config.load(opts.config_path);
        Logger::getInstance().setLevel(config.getLogLevel());

        if (opts.commission_bps) {
            config.setCommissionRate(backtest::CostModel::rateFromBps(*opts.commission_bps));
        }

        LOG_INFO("QuantSim starting in {} mode", opts.mode);
        return opts.mode == "single" ? runSingle(opts, config) : runPortfolio(opts, config);

    } catch (const ShapeError& e) {
        LOG_ERROR("Input shape error: {}", e.what());
        std::cerr << "Input shape error: " << e.what() << "\n";
    } catch (const ValidationError& e) {
        LOG_ERROR("Validation error: {}", e.what());
        std::cerr << "Validation error: " << e.what() << "\n";
    } catch (const std::exception& e) {
        LOG_ERROR("Fatal error: {}", e.what());
        std::cerr << "Fatal error: " << e.what() << "\n";
    }
    return 1;
}
