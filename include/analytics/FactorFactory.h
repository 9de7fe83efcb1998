#pragma once

#include <memory>
#include <string>
#include <vector>
#include "analytics/IFactor.h"

namespace quantsim {
namespace analytics {

// Default-parameter factor by name: "momentum", "sma" / "sma_crossover",
// "rsi", "volatility". Throws ValidationError for any other name.
std::unique_ptr<IFactor> createFactor(const std::string& name);

std::vector<std::string> availableFactors();

} // namespace analytics
} // namespace quantsim
