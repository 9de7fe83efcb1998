#pragma once

#include <stdexcept>
#include <string>
#include <vector>

namespace quantsim {

// Wrong input kind or layout (ragged columns, single-level price columns, ...)
class ShapeError : public std::invalid_argument {
public:
    explicit ShapeError(const std::string& what) : std::invalid_argument(what) {}
};

// Bad value: empty input, out-of-range parameter, no overlap, symbol mismatch
class ValidationError : public std::invalid_argument {
public:
    explicit ValidationError(const std::string& what) : std::invalid_argument(what) {}
};

// "A, B, C" for error messages
std::string joinNames(const std::vector<std::string>& names);

} // namespace quantsim
