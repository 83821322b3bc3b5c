#include "covec/feature_generator.hpp"
#include "covec/assembler.hpp"
#include "covec/error.hpp"
#include "covec/logging.hpp"
#include "covec/one_hot.hpp"
#include "covec/vectorizer.hpp"

#include <functional>

namespace covec {

// =============================================================================
// Presets
// =============================================================================

PairPipelineConfig cooc_lda5_config() {
    PairPipelineConfig config;
    config.vectorizer = {VectorizerMode::COUNT, 2};
    config.factorizer.kind = FactorizerKind::LDA;
    config.factorizer.width = 5;
    return config;
}

PairPipelineConfig cooc_svd5_config() {
    PairPipelineConfig config;
    config.vectorizer = {VectorizerMode::TFIDF, 2};
    config.factorizer.kind = FactorizerKind::TRUNCATED_SVD;
    config.factorizer.width = 5;
    return config;
}

PairPipelineConfig cooc_nmf5_config() {
    PairPipelineConfig config;
    config.vectorizer = {VectorizerMode::TFIDF, 2};
    config.factorizer.kind = FactorizerKind::NMF;
    config.factorizer.width = 5;
    return config;
}

// =============================================================================
// PairCoOccurrenceFeature
// =============================================================================

PairCoOccurrenceFeature::PairCoOccurrenceFeature(std::string name, PairPipelineConfig config,
                                                 std::vector<std::string> columns, size_t workers)
    : name_(std::move(name))
    , config_(std::move(config))
    , columns_(std::move(columns))
    , workers_(workers) {
    COVEC_CHECK_ARGUMENT(columns_.size() >= 2, "pairwise features need at least two columns");
    COVEC_CHECK_ARGUMENT(config_.factorizer.width > 0, "embedding width must be positive");
}

FeatureTables PairCoOccurrenceFeature::create_features(const Dataset& train, const Dataset& test) const {
    const Dataset fit = Dataset::concat(train, test, columns_);
    const auto pairs = column_pairs();

    std::vector<PairLatent> latents;
    {
        ScopedTimer timer(name_ + ": fit " + std::to_string(pairs.size()) + " column pairs");
        PairJobRunner runner(config_, workers_);
        latents = runner.run(fit, pairs);
    }

    FeatureTables tables;
    {
        ScopedTimer timer(name_ + ": create feature matrix");
        tables.train = broadcast_pair_latents(name_, width(), latents, train);
        tables.test = broadcast_pair_latents(name_, width(), latents, test);
    }
    return tables;
}

// =============================================================================
// CompositeKeyFeature
// =============================================================================

CompositeKeyFeature::CompositeKeyFeature(std::string name, CompositeKeyLayout layout, Options options)
    : name_(std::move(name))
    , layout_(std::move(layout))
    , options_(std::move(options)) {
    COVEC_CHECK_ARGUMENT(options_.width > 0, "embedding width must be positive");
    COVEC_CHECK_ARGUMENT(!options_.target_column.empty(), "composite feature needs a target column");
}

std::vector<std::string> CompositeKeyFeature::required_columns() const {
    std::vector<std::string> columns = layout_.column_names();
    columns.push_back(options_.target_column);
    return columns;
}

FeatureTables CompositeKeyFeature::create_features(const Dataset& train, const Dataset& test) const {
    const std::vector<std::string> columns = required_columns();
    const Dataset fit = Dataset::concat(train, test, columns);

    CompositeDocuments documents = build_composite_documents(fit, layout_, options_.target_column,
                                                             options_.min_frequency);

    VectorizerConfig vectorizer_config;
    vectorizer_config.mode = VectorizerMode::COUNT;
    vectorizer_config.min_df = fit.rows() < options_.large_data_rows ? 1 : 2;

    DocumentTermMatrix dtm;
    {
        ScopedTimer timer(name_ + ": vectorize documents");
        Vectorizer vectorizer(vectorizer_config);
        dtm = vectorizer.fit_transform(documents.documents);
    }
    std::vector<std::string>().swap(documents.documents);

    FactorizerConfig factorizer_config;
    factorizer_config.kind = FactorizerKind::LDA;
    factorizer_config.width = options_.width;
    factorizer_config.seed = options_.seed;

    LatentMatrix latent;
    {
        ScopedTimer timer(name_ + ": run LDA");
        latent = factorize(dtm, factorizer_config);
    }
    dtm.release();

    ScopedTimer timer(name_ + ": create feature matrix");
    FeatureTable all = broadcast_composite_latent(name_, latent, documents, layout_, fit);
    return split_rows(all, train.rows());
}

// =============================================================================
// OneHotSvdFeature
// =============================================================================

OneHotSvdFeature::OneHotSvdFeature(std::string name, bool tfidf, size_t width,
                                   std::vector<std::string> columns, uint32_t seed)
    : name_(std::move(name))
    , tfidf_(tfidf)
    , width_(width)
    , columns_(std::move(columns))
    , seed_(seed) {
    COVEC_CHECK_ARGUMENT(width_ > 0, "embedding width must be positive");
}

FeatureTables OneHotSvdFeature::create_features(const Dataset& train, const Dataset& test) const {
    const Dataset fit = Dataset::concat(train, test, columns_);

    DocumentTermMatrix encoded;
    {
        ScopedTimer timer(name_ + ": one-hot encode");
        CountMatrix counts = one_hot_encode(fit, columns_);
        encoded = tfidf_ ? DocumentTermMatrix(tfidf_transform(counts))
                         : DocumentTermMatrix(std::move(counts));
    }

    FactorizerConfig config;
    config.kind = FactorizerKind::TRUNCATED_SVD;
    config.width = width_;
    config.seed = seed_;

    LatentMatrix latent;
    {
        ScopedTimer timer(name_ + ": truncated SVD");
        latent = factorize(encoded, config);
    }
    encoded.release();

    FeatureTable all(indexed_feature_columns(name_, width_), std::move(latent));
    return split_rows(all, train.rows());
}

// =============================================================================
// Source-driven entry point
// =============================================================================

FeatureTables generate_features(const FeatureGenerator& generator,
                                const DatasetSource& train, const DatasetSource& test) {
    const auto columns = generator.required_columns();
    LOG_INFO(generator.name(), ": train from ", train.describe(), ", test from ", test.describe());
    const Dataset train_data = train.load(columns);
    const Dataset test_data = test.load(columns);
    return generator.create_features(train_data, test_data);
}

// =============================================================================
// Registry
// =============================================================================

namespace {

struct RegistryEntry {
    FeatureGeneratorInfo info;
    std::function<std::unique_ptr<FeatureGenerator>()> create;
};

const std::vector<RegistryEntry>& registry() {
    static const std::vector<RegistryEntry> entries = {
        {{"cooc_lda5", "pairwise co-occurrence counts, LDA, 5 components per pair"},
         [] { return std::make_unique<PairCoOccurrenceFeature>("cooc_lda5", cooc_lda5_config()); }},
        {{"cooc_svd5", "pairwise co-occurrence TF-IDF, truncated SVD, 5 components per pair"},
         [] { return std::make_unique<PairCoOccurrenceFeature>("cooc_svd5", cooc_svd5_config()); }},
        {{"cooc_nmf5", "pairwise co-occurrence TF-IDF, NMF, 5 components per pair"},
         [] { return std::make_unique<PairCoOccurrenceFeature>("cooc_nmf5", cooc_nmf5_config()); }},
        {{"keyed_lda30", "app tokens per (ip, device, os, channel) key, LDA, 30 components"},
         [] {
             return std::make_unique<CompositeKeyFeature>("keyed_lda30",
                                                          CompositeKeyLayout::ip_device_os_channel(),
                                                          CompositeKeyFeature::Options{});
         }},
        {{"onehot_svd30", "one-hot categorical rows, truncated SVD, 30 components"},
         [] { return std::make_unique<OneHotSvdFeature>("onehot_svd30", false); }},
        {{"onehot_tfidf_svd30", "one-hot categorical rows with TF-IDF, truncated SVD, 30 components"},
         [] { return std::make_unique<OneHotSvdFeature>("onehot_tfidf_svd30", true); }},
    };
    return entries;
}

} // namespace

const std::vector<FeatureGeneratorInfo>& feature_generator_catalog() {
    static const std::vector<FeatureGeneratorInfo> catalog = [] {
        std::vector<FeatureGeneratorInfo> infos;
        for (const auto& entry : registry()) infos.push_back(entry.info);
        return infos;
    }();
    return catalog;
}

std::vector<std::string> feature_generator_names() {
    std::vector<std::string> names;
    for (const auto& entry : registry()) names.push_back(entry.info.name);
    return names;
}

std::unique_ptr<FeatureGenerator> make_feature_generator(const std::string& name) {
    for (const auto& entry : registry()) {
        if (entry.info.name == name) return entry.create();
    }
    throw ConfigurationError("unknown feature generator '" + name + "'", __func__,
                             "run 'covec list' to see the registered generators");
}

} // namespace covec
