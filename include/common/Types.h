#pragma once

#include <string>
#include <vector>
#include <map>
#include <cstddef>

namespace quantsim {

// epoch milliseconds (UTC)
using Timestamp = long long;
using Timeline = std::vector<Timestamp>;

// Symbol -> target fraction of capital
using TargetWeights = std::map<std::string, double>;

struct Candle {
    double open;
    double high;
    double low;
    double close;
    double volume;
    long long timestamp;

    Candle() : open(0), high(0), low(0), close(0), volume(0), timestamp(0) {}

    Candle(double o, double h, double l, double c, double v, long long t)
        : open(o), high(h), low(l), close(c), volume(v), timestamp(t) {}
};

// Timestamp -> scalar. NaN marks an undefined value (warm-up, first lag row).
struct Series {
    std::string name;
    Timeline index;
    std::vector<double> values;

    Series() = default;
    Series(Timeline idx, std::vector<double> vals, std::string series_name = "");

    size_t size() const { return values.size(); }
    bool empty() const { return values.empty(); }

    // Ascending copy. Throws ShapeError on length mismatch or duplicate timestamps.
    Series sortedByIndex() const;
};

// Timeline x Symbol -> scalar, stored column-major.
struct SymbolTable {
    Timeline index;
    std::vector<std::string> symbols;
    std::vector<std::vector<double>> columns;

    SymbolTable() = default;
    SymbolTable(Timeline idx, std::vector<std::string> column_symbols, double fill);

    size_t rows() const { return index.size(); }
    size_t cols() const { return symbols.size(); }
    bool empty() const { return index.empty() || symbols.empty(); }

    double at(size_t row, size_t col) const { return columns[col][row]; }
    double& at(size_t row, size_t col) { return columns[col][row]; }

    // -1 when the symbol has no column
    int columnOf(const std::string& symbol) const;

    void addColumn(const std::string& symbol, std::vector<double> values);

    // Row-wise ascending copy. Throws ShapeError on ragged columns or duplicate timestamps.
    SymbolTable sortedByIndex() const;
};

using SignalTable = SymbolTable;
using WeightMatrix = SymbolTable;

} // namespace quantsim
