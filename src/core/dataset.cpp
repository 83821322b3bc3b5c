#include "covec/dataset.hpp"
#include "covec/error.hpp"

#include <algorithm>

namespace covec {

void Dataset::add_column(const std::string& name, CategoricalColumn values) {
    COVEC_CHECK_SCHEMA(!name.empty(), "column name must not be empty");
    COVEC_CHECK_SCHEMA(!has_column(name), "duplicate column '" + name + "'");

    if (!names_.empty() && values.size() != rows_) {
        throw SchemaError("column '" + name + "' has " + std::to_string(values.size()) +
                          " rows, expected " + std::to_string(rows_), __func__);
    }

    auto negative = std::find_if(values.begin(), values.end(),
                                 [](CategoryValue v) { return v < 0; });
    if (negative != values.end()) {
        throw SchemaError("column '" + name + "' has negative value " + std::to_string(*negative) +
                          " at row " + std::to_string(negative - values.begin()), __func__,
                          "categorical columns must be label-encoded to non-negative ids");
    }

    rows_ = values.size();
    names_.push_back(name);
    columns_.emplace(name, std::move(values));
}

bool Dataset::has_column(const std::string& name) const {
    return columns_.find(name) != columns_.end();
}

const CategoricalColumn& Dataset::column(const std::string& name) const {
    auto it = columns_.find(name);
    if (it == columns_.end()) {
        throw SchemaError("missing categorical column '" + name + "'", __func__);
    }
    return it->second;
}

void Dataset::require_columns(const std::vector<std::string>& names) const {
    for (const auto& name : names) {
        if (!has_column(name)) {
            throw SchemaError("missing categorical column '" + name + "'", __func__);
        }
    }
}

CategoryValue Dataset::max_value(const std::string& name) const {
    const auto& values = column(name);
    if (values.empty()) return -1;
    return *std::max_element(values.begin(), values.end());
}

Dataset Dataset::concat(const Dataset& head, const Dataset& tail,
                        const std::vector<std::string>& columns) {
    head.require_columns(columns);
    tail.require_columns(columns);

    Dataset result;
    for (const auto& name : columns) {
        const auto& a = head.column(name);
        const auto& b = tail.column(name);
        CategoricalColumn merged;
        merged.reserve(a.size() + b.size());
        merged.insert(merged.end(), a.begin(), a.end());
        merged.insert(merged.end(), b.begin(), b.end());
        result.add_column(name, std::move(merged));
    }
    return result;
}

} // namespace covec
