#pragma once

/**
 * CSV input and output for datasets and feature tables.
 *
 * Input: a header row of column names followed by comma-separated
 * non-negative integers. Columns that are not requested are skipped without
 * being parsed. Output: a header row of feature names, then one row of
 * float values per record.
 */

#include "covec/dataset.hpp"
#include "covec/feature_generator.hpp"
#include "covec/feature_table.hpp"

#include <filesystem>
#include <istream>
#include <ostream>
#include <string>
#include <vector>

namespace covec {
namespace io {

// Throws SchemaError on a missing column, a ragged row, or a non-integer cell
Dataset read_csv_dataset(std::istream& in, const std::vector<std::string>& columns,
                         const std::string& origin = "<stream>");

// Throws IOError if the file cannot be opened
Dataset read_csv_dataset(const std::string& path, const std::vector<std::string>& columns);

void write_feature_table_csv(std::ostream& out, const FeatureTable& table);

// Throws IOError if the file cannot be written
void write_feature_table_csv(const std::string& path, const FeatureTable& table);

class CsvDatasetSource : public DatasetSource {
public:
    explicit CsvDatasetSource(std::string path) : path_(std::move(path)) {}

    Dataset load(const std::vector<std::string>& columns) const override {
        return read_csv_dataset(path_, columns);
    }

    std::string describe() const override { return path_; }

private:
    std::string path_;
};

/**
 * Build the named feature from two sources and write
 * <output_dir>/<feature>_train.csv and <output_dir>/<feature>_test.csv.
 *
 * The output directory is created if missing. Throws ConfigurationError for
 * an unknown feature name, IOError when the directory or a file cannot be
 * written, and whatever the generator raises. Nothing is written unless both
 * tables were built.
 */
FeatureTables run_features(const std::string& feature, const DatasetSource& train,
                           const DatasetSource& test, const std::filesystem::path& output_dir);

} // namespace io
} // namespace covec
