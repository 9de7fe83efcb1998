#include "analytics/FactorFactory.h"
#include "analytics/MomentumFactor.h"
#include "analytics/RsiFactor.h"
#include "analytics/SmaCrossoverFactor.h"
#include "analytics/VolatilityFactor.h"
#include "common/Errors.h"

#include <algorithm>
#include <cctype>

namespace quantsim {
namespace analytics {

std::unique_ptr<IFactor> createFactor(const std::string& name) {
    std::string key = name;
    std::transform(key.begin(), key.end(), key.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (key == "momentum") return std::make_unique<MomentumFactor>();
    if (key == "sma" || key == "sma_crossover") return std::make_unique<SmaCrossoverFactor>();
    if (key == "rsi") return std::make_unique<RsiFactor>();
    if (key == "volatility") return std::make_unique<VolatilityFactor>();

    throw ValidationError("unknown factor '" + name + "' (available: " +
                          joinNames(availableFactors()) + ")");
}

std::vector<std::string> availableFactors() {
    return {"momentum", "sma_crossover", "rsi", "volatility"};
}

} // namespace analytics
} // namespace quantsim
