#include "common/Types.h"
#include "common/Errors.h"

#include <algorithm>
#include <numeric>

namespace quantsim {

namespace {
std::vector<size_t> ascendingOrder(const Timeline& index) {
    std::vector<size_t> order(index.size());
    std::iota(order.begin(), order.end(), 0);
    std::stable_sort(order.begin(), order.end(), [&](size_t a, size_t b) {
        return index[a] < index[b];
    });
    return order;
}

void requireUnique(const Timeline& sorted_index, const std::string& what) {
    auto dup = std::adjacent_find(sorted_index.begin(), sorted_index.end());
    if (dup != sorted_index.end()) {
        throw ShapeError(what + " contains duplicate timestamp " + std::to_string(*dup));
    }
}
}

std::string joinNames(const std::vector<std::string>& names) {
    std::string out;
    for (size_t i = 0; i < names.size(); ++i) {
        if (i > 0) out += ", ";
        out += names[i];
    }
    return out;
}

Series::Series(Timeline idx, std::vector<double> vals, std::string series_name)
    : name(std::move(series_name))
    , index(std::move(idx))
    , values(std::move(vals))
{}

Series Series::sortedByIndex() const {
    if (index.size() != values.size()) {
        throw ShapeError("series '" + name + "' has " + std::to_string(index.size()) +
                         " timestamps but " + std::to_string(values.size()) + " values");
    }

    const auto order = ascendingOrder(index);
    Series out;
    out.name = name;
    out.index.reserve(order.size());
    out.values.reserve(order.size());
    for (size_t i : order) {
        out.index.push_back(index[i]);
        out.values.push_back(values[i]);
    }
    requireUnique(out.index, "series '" + name + "'");
    return out;
}

SymbolTable::SymbolTable(Timeline idx, std::vector<std::string> column_symbols, double fill)
    : index(std::move(idx))
    , symbols(std::move(column_symbols))
{
    columns.assign(symbols.size(), std::vector<double>(index.size(), fill));
}

int SymbolTable::columnOf(const std::string& symbol) const {
    auto it = std::find(symbols.begin(), symbols.end(), symbol);
    if (it == symbols.end()) {
        return -1;
    }
    return static_cast<int>(std::distance(symbols.begin(), it));
}

void SymbolTable::addColumn(const std::string& symbol, std::vector<double> values) {
    if (values.size() != index.size()) {
        throw ShapeError("column '" + symbol + "' has " + std::to_string(values.size()) +
                         " rows, table has " + std::to_string(index.size()));
    }
    if (columnOf(symbol) >= 0) {
        throw ShapeError("duplicate column '" + symbol + "'");
    }
    symbols.push_back(symbol);
    columns.push_back(std::move(values));
}

SymbolTable SymbolTable::sortedByIndex() const {
    if (columns.size() != symbols.size()) {
        throw ShapeError("table has " + std::to_string(symbols.size()) + " symbols but " +
                         std::to_string(columns.size()) + " columns");
    }
    for (size_t c = 0; c < columns.size(); ++c) {
        if (columns[c].size() != index.size()) {
            throw ShapeError("column '" + symbols[c] + "' is not aligned with the table index");
        }
    }

    const auto order = ascendingOrder(index);
    SymbolTable out;
    out.symbols = symbols;
    out.index.reserve(order.size());
    for (size_t i : order) {
        out.index.push_back(index[i]);
    }
    requireUnique(out.index, "table");

    out.columns.resize(columns.size());
    for (size_t c = 0; c < columns.size(); ++c) {
        out.columns[c].reserve(order.size());
        for (size_t i : order) {
            out.columns[c].push_back(columns[c][i]);
        }
    }
    return out;
}

} // namespace quantsim
