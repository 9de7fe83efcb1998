#pragma once

#include <nlohmann/json.hpp>
#include <ostream>
#include <string>
#include "common/Types.h"

namespace quantsim {
namespace analytics {

// Run summary for the command line: a text block, or one JSON object where
// undefined metrics are null.
class PerformanceReport {
public:
    static nlohmann::json toJson(const std::string& title, const Series& returns, int annualization);

    static void print(std::ostream& out, const std::string& title, const Series& returns,
                      int annualization, bool json_mode);
};

} // namespace analytics
} // namespace quantsim
