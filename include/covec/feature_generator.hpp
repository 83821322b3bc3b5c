#pragma once

/**
 * Feature Generators
 *
 * A feature generator turns a train split and a test split with the same
 * categorical schema into two row-aligned feature tables. All generators fit
 * on the concatenation train + test and never refit for the second table.
 *
 * Registered generators:
 *   cooc_lda5           pairwise co-occurrence, counts (min_df 2), LDA, width 5
 *   cooc_svd5           pairwise co-occurrence, TF-IDF (min_df 2), truncated SVD, width 5
 *   cooc_nmf5           pairwise co-occurrence, TF-IDF (min_df 2), NMF, width 5
 *   keyed_lda30         app tokens per (ip, device, os, channel) key, LDA, width 30
 *   onehot_svd30        one-hot rows, truncated SVD, width 30
 *   onehot_tfidf_svd30  one-hot rows reweighted by TF-IDF, truncated SVD, width 30
 */

#include "covec/composite_key.hpp"
#include "covec/dataset.hpp"
#include "covec/factorizer.hpp"
#include "covec/feature_table.hpp"
#include "covec/pair_job_runner.hpp"

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace covec {

class FeatureGenerator {
public:
    virtual ~FeatureGenerator() = default;

    virtual std::string name() const = 0;

    // Throws SchemaError when either split lacks a required column
    virtual FeatureTables create_features(const Dataset& train, const Dataset& test) const = 0;

    // Columns each split must provide
    virtual std::vector<std::string> required_columns() const = 0;
};

// Load both splits from their sources and run `generator` on them
FeatureTables generate_features(const FeatureGenerator& generator,
                                const DatasetSource& train, const DatasetSource& test);

/**
 * Latent vectors of every ordered column pair, broadcast by the first column.
 * Output width: pairs * factorizer width, named "{name}-{col1}-{col2}-{j}".
 */
class PairCoOccurrenceFeature : public FeatureGenerator {
public:
    PairCoOccurrenceFeature(std::string name, PairPipelineConfig config,
                            std::vector<std::string> columns = default_categorical_columns(),
                            size_t workers = DEFAULT_WORKERS);

    std::string name() const override { return name_; }
    FeatureTables create_features(const Dataset& train, const Dataset& test) const override;

    std::vector<std::string> required_columns() const override { return columns_; }

    const PairPipelineConfig& config() const { return config_; }
    size_t width() const { return config_.factorizer.width; }
    std::vector<ColumnPair> column_pairs() const { return enumerate_column_pairs(columns_); }

private:
    std::string name_;
    PairPipelineConfig config_;
    std::vector<std::string> columns_;
    size_t workers_;
};

/**
 * LDA over target-column tokens grouped by a packed composite key. Keys with
 * fewer than min_frequency rows are dropped; their rows get zero vectors.
 */
class CompositeKeyFeature : public FeatureGenerator {
public:
    struct Options {
        std::string target_column = "app";
        size_t width = 30;
        size_t min_frequency = 3;
        // min_df is 1 below this many fitted rows, 2 from it on
        size_t large_data_rows = 1000 * 1000;
        uint32_t seed = DEFAULT_SEED;
    };

    CompositeKeyFeature(std::string name, CompositeKeyLayout layout, Options options);

    std::string name() const override { return name_; }
    FeatureTables create_features(const Dataset& train, const Dataset& test) const override;

    std::vector<std::string> required_columns() const override;

    const Options& options() const { return options_; }

private:
    std::string name_;
    CompositeKeyLayout layout_;
    Options options_;
};

/**
 * One-hot rows of the categorical columns, optionally TF-IDF weighted,
 * reduced by truncated SVD. Named "{name}_{j}".
 */
class OneHotSvdFeature : public FeatureGenerator {
public:
    OneHotSvdFeature(std::string name, bool tfidf, size_t width = 30,
                     std::vector<std::string> columns = default_categorical_columns(),
                     uint32_t seed = DEFAULT_SEED);

    std::string name() const override { return name_; }
    FeatureTables create_features(const Dataset& train, const Dataset& test) const override;
    std::vector<std::string> required_columns() const override { return columns_; }

private:
    std::string name_;
    bool tfidf_;
    size_t width_;
    std::vector<std::string> columns_;
    uint32_t seed_;
};

// Pipeline presets of the pairwise generators
PairPipelineConfig cooc_lda5_config();
PairPipelineConfig cooc_svd5_config();
PairPipelineConfig cooc_nmf5_config();

// Throws ConfigurationError for an unknown name
std::unique_ptr<FeatureGenerator> make_feature_generator(const std::string& name);

struct FeatureGeneratorInfo {
    std::string name;
    std::string description;
};

// Registered generators in a fixed order
const std::vector<FeatureGeneratorInfo>& feature_generator_catalog();

std::vector<std::string> feature_generator_names();

} // namespace covec
