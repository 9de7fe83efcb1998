#include "analytics/FactorFactory.h"
#include "analytics/MacdIndicator.h"
#include "analytics/MomentumFactor.h"
#include "analytics/RsiFactor.h"
#include "analytics/SmaCrossoverFactor.h"
#include "analytics/TechnicalIndicators.h"
#include "analytics/VolatilityFactor.h"
#include "common/Errors.h"

#include <cassert>
#include <cmath>
#include <functional>
#include <iostream>

using namespace quantsim;
using namespace quantsim::analytics;

namespace {
bool near(double a, double b) {
    return std::abs(a - b) < 1e-9;
}

std::vector<Candle> candlesFrom(const std::vector<double>& closes) {
    std::vector<Candle> candles;
    long long ts = 1704067200000LL;
    for (double c : closes) {
        candles.emplace_back(c, c, c, c, 1000.0, ts);
        ts += 86400000LL;
    }
    return candles;
}

bool throwsValidation(const std::function<void()>& fn) {
    try {
        fn();
    } catch (const ValidationError&) {
        return true;
    }
    return false;
}
}

int main() {
    // Momentum
    {
        const auto out = MomentumFactor(2).compute(candlesFrom({100, 110, 121, 133.1}));
        assert(out.name == "momentum");
        assert(out.size() == 4);
        assert(std::isnan(out.values[0]) && std::isnan(out.values[1]));
        assert(near(out.values[2], 0.21));
        assert(near(out.values[3], 0.21));
        assert(throwsValidation([] { MomentumFactor(0); }));
    }

    // SMA crossover
    {
        const auto out = SmaCrossoverFactor(2, 3).compute(candlesFrom({1, 2, 3, 4}));
        assert(std::isnan(out.values[0]) && std::isnan(out.values[1]));
        assert(near(out.values[2], 0.5));
        assert(near(out.values[3], 0.5));
        assert(throwsValidation([] { SmaCrossoverFactor(3, 3); }));
        assert(throwsValidation([] { SmaCrossoverFactor(0, 3); }));
    }

    // Volatility: sample std of returns
    {
        const auto out = VolatilityFactor(2).compute(candlesFrom({100, 110, 99}));
        assert(std::isnan(out.values[0]) && std::isnan(out.values[1]));
        assert(near(out.values[2], std::sqrt(0.02)));

        const auto logged = VolatilityFactor(2, true).compute(candlesFrom({100, 110, 99}));
        const double a = std::log(1.1);
        const double b = std::log(0.9);
        assert(near(logged.values[2], std::abs(a - b) / std::sqrt(2.0)));
        assert(throwsValidation([] { VolatilityFactor(-1); }));
    }

    // RSI: period-1 warm-up rows, then bounded
    {
        std::vector<double> up, down, flat;
        for (int i = 0; i < 20; ++i) {
            up.push_back(100.0 + i);
            down.push_back(100.0 - i);
            flat.push_back(100.0);
        }
        const auto rsi_up = RsiFactor(14).compute(candlesFrom(up));
        for (size_t i = 0; i < 13; ++i) {
            assert(std::isnan(rsi_up.values[i]));
        }
        for (size_t i = 13; i < 20; ++i) {
            assert(rsi_up.values[i] == 100.0);
        }

        const auto rsi_down = RsiFactor(14).compute(candlesFrom(down));
        assert(rsi_down.values[19] == 0.0);

        const auto rsi_flat = RsiFactor(14).compute(candlesFrom(flat));
        assert(rsi_flat.values[19] == 50.0);

        const auto mixed = RsiFactor(3).compute(candlesFrom({10, 11, 10.5, 11.5, 11, 12}));
        for (size_t i = 2; i < mixed.size(); ++i) {
            assert(mixed.values[i] > 0.0 && mixed.values[i] < 100.0);
        }
        assert(throwsValidation([] { RsiFactor(0); }));
    }

    // MACD warm-up and relations
    {
        std::vector<double> closes;
        for (int i = 0; i < 15; ++i) closes.push_back(100.0 + std::sin(i) * 5.0);
        const auto macd = MacdIndicator(3, 6, 3).compute(candlesFrom(closes));

        for (size_t i = 0; i < 5; ++i) assert(std::isnan(macd.line.values[i]));
        assert(!std::isnan(macd.line.values[5]));
        for (size_t i = 0; i < 7; ++i) assert(std::isnan(macd.histogram.values[i]));
        for (size_t i = 7; i < closes.size(); ++i) {
            assert(near(macd.histogram.values[i], macd.line.values[i] - macd.signal.values[i]));
        }
        assert(macd.line.name == "macd" && macd.histogram.name == "histogram");

        assert(throwsValidation([] { MacdIndicator(26, 12, 9); }));
        assert(throwsValidation([] { MacdIndicator(12, 26, 0); }));
    }

    // EMA seeding
    {
        const auto ema = TechnicalIndicators::ewmMean({1.0, 2.0, 3.0}, 0.5, 1);
        assert(ema[0] == 1.0 && near(ema[1], 1.5) && near(ema[2], 2.25));
    }

    // Factory
    {
        assert(createFactor("sma")->name() == "sma_crossover");
        assert(createFactor("RSI")->name() == "rsi");
        assert(availableFactors().size() == 4);
        assert(throwsValidation([] { createFactor("bogus"); }));
    }

    std::cout << "[TEST] Factors PASSED\n";
    return 0;
}
