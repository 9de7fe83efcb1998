#pragma once

#include <string>
#include <vector>
#include "common/Types.h"

namespace quantsim {

// Timeline x (Symbol, Field) -> value.
// Columns added through the single-label overload have no symbol level; such a
// table is rejected by PortfolioBacktester.
class PriceTable {
public:
    PriceTable() = default;
    explicit PriceTable(Timeline index);

    void addColumn(const std::string& symbol, const std::string& field, std::vector<double> values);
    void addColumn(const std::string& label, std::vector<double> values);

    const Timeline& index() const { return index_; }
    size_t rows() const { return index_.size(); }
    size_t columnCount() const { return labels_.size(); }
    bool empty() const { return index_.empty() || labels_.empty(); }

    // true when every column is labelled (symbol, field)
    bool hasTwoLevelColumns() const;

    // Distinct first-level labels in first-appearance order
    std::vector<std::string> symbols() const;

    bool hasField(const std::string& symbol, const std::string& field) const;

    // Throws ValidationError when the column is absent
    const std::vector<double>& column(const std::string& symbol, const std::string& field) const;

    // Timeline x Symbol slice of one field; throws ValidationError naming symbols without it
    SymbolTable field(const std::string& field) const;

    // Row-wise ascending copy; throws ShapeError on ragged columns or duplicate timestamps
    PriceTable sortedByIndex() const;

private:
    Timeline index_;
    std::vector<std::vector<std::string>> labels_;
    std::vector<std::vector<double>> data_;

    int findColumn(const std::string& symbol, const std::string& field) const;
};

} // namespace quantsim
