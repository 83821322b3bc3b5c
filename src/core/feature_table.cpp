#include "covec/feature_table.hpp"
#include "covec/error.hpp"

#include <algorithm>

namespace covec {

FeatureTable::FeatureTable(std::vector<std::string> columns, FeatureMatrix values)
    : columns_(std::move(columns)), values_(std::move(values)) {
    COVEC_CHECK_ARGUMENT(static_cast<Eigen::Index>(columns_.size()) == values_.cols(),
                         "feature table has " + std::to_string(columns_.size()) + " names for " +
                         std::to_string(values_.cols()) + " columns");
}

FeatureTable::FeatureTable(std::vector<std::string> columns, size_t rows)
    : columns_(std::move(columns))
    , values_(FeatureMatrix::Zero(static_cast<Eigen::Index>(rows),
                                  static_cast<Eigen::Index>(columns_.size()))) {}

size_t FeatureTable::column_index(const std::string& name) const {
    auto it = std::find(columns_.begin(), columns_.end(), name);
    if (it == columns_.end()) {
        throw SchemaError("no feature column '" + name + "'", __func__);
    }
    return static_cast<size_t>(it - columns_.begin());
}

} // namespace covec
