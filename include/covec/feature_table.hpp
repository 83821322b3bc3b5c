#pragma once

#include <Eigen/Dense>

#include <cstddef>
#include <string>
#include <vector>

namespace covec {

using FeatureMatrix = Eigen::Matrix<float, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;

/**
 * Dense float features, one row per input record, with named columns.
 * Owns its values; nothing refers back to the matrices it was built from.
 */
class FeatureTable {
public:
    FeatureTable() = default;
    FeatureTable(std::vector<std::string> columns, FeatureMatrix values);

    // Zero-filled table
    FeatureTable(std::vector<std::string> columns, size_t rows);

    size_t rows() const { return static_cast<size_t>(values_.rows()); }
    size_t cols() const { return static_cast<size_t>(values_.cols()); }

    const std::vector<std::string>& column_names() const { return columns_; }

    // Throws SchemaError for an unknown name
    size_t column_index(const std::string& name) const;

    float at(size_t row, size_t col) const { return values_(static_cast<Eigen::Index>(row), static_cast<Eigen::Index>(col)); }

    const FeatureMatrix& values() const { return values_; }
    FeatureMatrix& values() { return values_; }

private:
    std::vector<std::string> columns_;
    FeatureMatrix values_;
};

// Train and test features built from the same fitted latent vectors
struct FeatureTables {
    FeatureTable train;
    FeatureTable test;
};

} // namespace covec
