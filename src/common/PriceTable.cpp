#include "common/PriceTable.h"
#include "common/Errors.h"

#include <algorithm>
#include <numeric>

namespace quantsim {

PriceTable::PriceTable(Timeline index)
    : index_(std::move(index))
{}

void PriceTable::addColumn(const std::string& symbol, const std::string& field, std::vector<double> values) {
    if (values.size() != index_.size()) {
        throw ShapeError("column (" + symbol + ", " + field + ") has " + std::to_string(values.size()) +
                         " rows, table has " + std::to_string(index_.size()));
    }
    if (findColumn(symbol, field) >= 0) {
        throw ShapeError("duplicate column (" + symbol + ", " + field + ")");
    }
    labels_.push_back({symbol, field});
    data_.push_back(std::move(values));
}

void PriceTable::addColumn(const std::string& label, std::vector<double> values) {
    if (values.size() != index_.size()) {
        throw ShapeError("column '" + label + "' has " + std::to_string(values.size()) +
                         " rows, table has " + std::to_string(index_.size()));
    }
    labels_.push_back({label});
    data_.push_back(std::move(values));
}

bool PriceTable::hasTwoLevelColumns() const {
    if (labels_.empty()) {
        return false;
    }
    return std::all_of(labels_.begin(), labels_.end(),
                       [](const std::vector<std::string>& l) { return l.size() == 2; });
}

std::vector<std::string> PriceTable::symbols() const {
    std::vector<std::string> out;
    for (const auto& label : labels_) {
        if (label.size() != 2) continue;
        if (std::find(out.begin(), out.end(), label[0]) == out.end()) {
            out.push_back(label[0]);
        }
    }
    return out;
}

int PriceTable::findColumn(const std::string& symbol, const std::string& field) const {
    for (size_t i = 0; i < labels_.size(); ++i) {
        if (labels_[i].size() == 2 && labels_[i][0] == symbol && labels_[i][1] == field) {
            return static_cast<int>(i);
        }
    }
    return -1;
}

bool PriceTable::hasField(const std::string& symbol, const std::string& field) const {
    return findColumn(symbol, field) >= 0;
}

const std::vector<double>& PriceTable::column(const std::string& symbol, const std::string& field) const {
    const int idx = findColumn(symbol, field);
    if (idx < 0) {
        throw ValidationError("price table has no '" + field + "' column for symbol " + symbol);
    }
    return data_[static_cast<size_t>(idx)];
}

SymbolTable PriceTable::field(const std::string& field) const {
    std::vector<std::string> missing;
    SymbolTable out;
    out.index = index_;
    for (const auto& symbol : symbols()) {
        const int idx = findColumn(symbol, field);
        if (idx < 0) {
            missing.push_back(symbol);
            continue;
        }
        out.addColumn(symbol, data_[static_cast<size_t>(idx)]);
    }
    if (!missing.empty()) {
        throw ValidationError("price table is missing the '" + field + "' field for symbols: " +
                              joinNames(missing));
    }
    return out;
}

PriceTable PriceTable::sortedByIndex() const {
    std::vector<size_t> order(index_.size());
    std::iota(order.begin(), order.end(), 0);
    std::stable_sort(order.begin(), order.end(), [&](size_t a, size_t b) {
        return index_[a] < index_[b];
    });

    PriceTable out;
    out.labels_ = labels_;
    out.index_.reserve(order.size());
    for (size_t i : order) {
        out.index_.push_back(index_[i]);
    }
    auto dup = std::adjacent_find(out.index_.begin(), out.index_.end());
    if (dup != out.index_.end()) {
        throw ShapeError("price table contains duplicate timestamp " + std::to_string(*dup));
    }

    out.data_.resize(data_.size());
    for (size_t c = 0; c < data_.size(); ++c) {
        out.data_[c].reserve(order.size());
        for (size_t i : order) {
            out.data_[c].push_back(data_[c][i]);
        }
    }
    return out;
}

} // namespace quantsim
