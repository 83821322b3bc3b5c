#include "covec/table_io.hpp"
#include "covec/error.hpp"
#include "covec/logging.hpp"

#include <charconv>
#include <fstream>
#include <iomanip>
#include <limits>
#include <string_view>
#include <unordered_map>

namespace covec {
namespace io {

namespace {

std::string_view trim(std::string_view s) {
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) s.remove_prefix(1);
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t' || s.back() == '\r')) s.remove_suffix(1);
    return s;
}

std::vector<std::string_view> split_fields(std::string_view line) {
    std::vector<std::string_view> fields;
    size_t start = 0;
    while (true) {
        size_t comma = line.find(',', start);
        if (comma == std::string_view::npos) {
            fields.push_back(trim(line.substr(start)));
            break;
        }
        fields.push_back(trim(line.substr(start, comma - start)));
        start = comma + 1;
    }
    return fields;
}

} // namespace

Dataset read_csv_dataset(std::istream& in, const std::vector<std::string>& columns,
                         const std::string& origin) {
    std::string line;
    if (!std::getline(in, line)) {
        throw SchemaError("'" + origin + "' has no header row", __func__);
    }

    const auto header = split_fields(line);
    std::unordered_map<std::string, size_t> position;
    for (size_t i = 0; i < header.size(); ++i) {
        position.emplace(std::string(header[i]), i);
    }

    std::vector<size_t> source_index;
    source_index.reserve(columns.size());
    for (const auto& name : columns) {
        auto it = position.find(name);
        if (it == position.end()) {
            throw SchemaError("'" + origin + "' has no column '" + name + "'", __func__);
        }
        source_index.push_back(it->second);
    }

    std::vector<CategoricalColumn> values(columns.size());
    size_t line_number = 1;
    while (std::getline(in, line)) {
        ++line_number;
        if (trim(line).empty()) continue;

        const auto fields = split_fields(line);
        if (fields.size() != header.size()) {
            throw SchemaError("'" + origin + "' line " + std::to_string(line_number) + " has " +
                              std::to_string(fields.size()) + " fields, header has " +
                              std::to_string(header.size()), __func__);
        }

        for (size_t c = 0; c < columns.size(); ++c) {
            std::string_view cell = fields[source_index[c]];
            CategoryValue value = 0;
            auto [end, ec] = std::from_chars(cell.data(), cell.data() + cell.size(), value);
            if (ec != std::errc() || end != cell.data() + cell.size() || cell.empty()) {
                throw SchemaError("'" + origin + "' line " + std::to_string(line_number) +
                                  " column '" + columns[c] + "': '" + std::string(cell) +
                                  "' is not an integer", __func__,
                                  "categorical columns must be label-encoded upstream");
            }
            values[c].push_back(value);
        }
    }

    Dataset dataset;
    for (size_t c = 0; c < columns.size(); ++c) {
        dataset.add_column(columns[c], std::move(values[c]));
    }
    return dataset;
}

Dataset read_csv_dataset(const std::string& path, const std::vector<std::string>& columns) {
    std::ifstream in(path);
    if (!in.is_open()) {
        throw IOError("cannot open '" + path + "'", __func__);
    }
    ScopedTimer timer("load " + path);
    Dataset dataset = read_csv_dataset(in, columns, path);
    LOG_INFO("loaded ", dataset.rows(), " rows x ", dataset.num_columns(), " columns from ", path);
    return dataset;
}

void write_feature_table_csv(std::ostream& out, const FeatureTable& table) {
    const auto& names = table.column_names();
    for (size_t c = 0; c < names.size(); ++c) {
        if (c > 0) out << ',';
        out << names[c];
    }
    out << '\n';

    out << std::setprecision(std::numeric_limits<float>::max_digits10);
    const FeatureMatrix& values = table.values();
    for (Eigen::Index r = 0; r < values.rows(); ++r) {
        for (Eigen::Index c = 0; c < values.cols(); ++c) {
            if (c > 0) out << ',';
            out << values(r, c);
        }
        out << '\n';
    }
}

void write_feature_table_csv(const std::string& path, const FeatureTable& table) {
    std::ofstream out(path, std::ios::trunc);
    if (!out.is_open()) {
        throw IOError("cannot write '" + path + "'", __func__);
    }
    write_feature_table_csv(out, table);
    out.flush();
    if (!out) {
        throw IOError("write to '" + path + "' failed", __func__);
    }
    LOG_INFO("wrote ", table.rows(), " x ", table.cols(), " features to ", path);
}

FeatureTables run_features(const std::string& feature, const DatasetSource& train,
                           const DatasetSource& test, const std::filesystem::path& output_dir) {
    auto generator = make_feature_generator(feature);

    FeatureTables tables;
    {
        ScopedTimer timer(feature + ": total");
        tables = generate_features(*generator, train, test);
    }

    std::error_code ec;
    std::filesystem::create_directories(output_dir, ec);
    if (ec) {
        throw IOError("cannot create output directory '" + output_dir.string() + "': " + ec.message(),
                      __func__);
    }

    write_feature_table_csv((output_dir / (feature + "_train.csv")).string(), tables.train);
    write_feature_table_csv((output_dir / (feature + "_test.csv")).string(), tables.test);
    return tables;
}

} // namespace io
} // namespace covec
