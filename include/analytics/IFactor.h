#pragma once

#include <string>
#include <vector>
#include "common/Types.h"

namespace quantsim {
namespace analytics {

// Signal generator: candles (ascending) -> one value per candle.
// Warm-up rows are NaN.
class IFactor {
public:
    virtual ~IFactor() = default;

    virtual Series compute(const std::vector<Candle>& candles) const = 0;
    virtual std::string name() const = 0;
};

} // namespace analytics
} // namespace quantsim
