#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

namespace covec {

// Label-encoded categorical value; always >= 0 once inside a Dataset
using CategoryValue = int64_t;
using CategoricalColumn = std::vector<CategoryValue>;

// The categorical schema every feature generator consumes
inline const std::vector<std::string>& default_categorical_columns() {
    static const std::vector<std::string> columns = {"ip", "app", "os", "device", "channel"};
    return columns;
}

/**
 * Row-aligned, named categorical columns.
 *
 * Columns are validated when added: values must be non-negative and every
 * column must have the same number of rows. The dataset is read-only once
 * built and is shared by const reference across pipeline jobs.
 */
class Dataset {
public:
    Dataset() = default;

    // Throws SchemaError on a negative value or a row-count mismatch
    void add_column(const std::string& name, CategoricalColumn values);

    bool has_column(const std::string& name) const;

    // Throws SchemaError if the column does not exist
    const CategoricalColumn& column(const std::string& name) const;

    // Throws SchemaError naming the first missing column
    void require_columns(const std::vector<std::string>& names) const;

    const std::vector<std::string>& column_names() const { return names_; }
    size_t rows() const { return rows_; }
    size_t num_columns() const { return names_.size(); }
    bool empty() const { return rows_ == 0; }

    // Largest value of a column, -1 for an empty column
    CategoryValue max_value(const std::string& name) const;

    /**
     * Stack `tail` under `head`, keeping only `columns` (both inputs must
     * carry all of them). The first head.rows() rows of the result are head.
     */
    static Dataset concat(const Dataset& head, const Dataset& tail,
                          const std::vector<std::string>& columns);

private:
    std::vector<std::string> names_;
    std::unordered_map<std::string, CategoricalColumn> columns_;
    size_t rows_ = 0;
};

/**
 * Supplier of a row-level split. Pipelines receive their inputs through this
 * interface instead of reaching for files themselves.
 */
class DatasetSource {
public:
    virtual ~DatasetSource() = default;

    // Load at least `columns`; throws SchemaError if any is missing
    virtual Dataset load(const std::vector<std::string>& columns) const = 0;

    // Human-readable origin for log messages
    virtual std::string describe() const = 0;
};

} // namespace covec
