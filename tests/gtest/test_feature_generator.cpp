// =============================================================================
// Feature Generator Tests
// =============================================================================

#include <gtest/gtest.h>
#include "covec/error.hpp"
#include "covec/feature_generator.hpp"

#include <string>
#include <vector>

using namespace covec;

namespace {

class InMemorySource : public DatasetSource {
public:
    explicit InMemorySource(Dataset data) : data_(std::move(data)) {}

    Dataset load(const std::vector<std::string>& columns) const override {
        Dataset subset;
        for (const auto& name : columns) {
            subset.add_column(name, data_.column(name));
        }
        return subset;
    }

    std::string describe() const override { return "memory"; }

private:
    Dataset data_;
};

} // namespace

class FeatureGeneratorTest : public ::testing::Test {
protected:
    void SetUp() override {
        train = make_split(0, 24);
        test = make_split(24, 8);
    }

    // Deterministic columns: every value of each range appears in train
    static Dataset make_split(int first_row, int rows) {
        CategoricalColumn a, b, c;
        for (int r = first_row; r < first_row + rows; ++r) {
            a.push_back(r % 4);
            b.push_back((r * 3 + 1) % 5);
            c.push_back((r / 2) % 3);
        }
        Dataset data;
        data.add_column("a", a);
        data.add_column("b", b);
        data.add_column("c", c);
        return data;
    }

    static PairPipelineConfig small_config(VectorizerMode mode, FactorizerKind kind) {
        PairPipelineConfig config;
        config.vectorizer = {mode, 1};
        config.factorizer.kind = kind;
        config.factorizer.width = 2;
        return config;
    }

    Dataset train;
    Dataset test;
};

TEST_F(FeatureGeneratorTest, CatalogListsEveryVariant) {
    const std::vector<std::string> expected = {
        "cooc_lda5", "cooc_svd5", "cooc_nmf5", "keyed_lda30", "onehot_svd30", "onehot_tfidf_svd30"};
    EXPECT_EQ(feature_generator_names(), expected);
    ASSERT_EQ(feature_generator_catalog().size(), expected.size());
    for (const auto& info : feature_generator_catalog()) {
        EXPECT_FALSE(info.description.empty()) << info.name;
        EXPECT_EQ(make_feature_generator(info.name)->name(), info.name);
    }
}

TEST_F(FeatureGeneratorTest, UnknownNameThrows) {
    EXPECT_THROW(make_feature_generator("cooc_pca5"), ConfigurationError);
}

TEST_F(FeatureGeneratorTest, PairPresets) {
    auto lda = cooc_lda5_config();
    EXPECT_EQ(lda.vectorizer.mode, VectorizerMode::COUNT);
    EXPECT_EQ(lda.vectorizer.min_df, 2u);
    EXPECT_EQ(lda.factorizer.kind, FactorizerKind::LDA);
    EXPECT_EQ(lda.factorizer.width, 5u);
    EXPECT_EQ(lda.factorizer.seed, DEFAULT_SEED);

    auto svd = cooc_svd5_config();
    EXPECT_EQ(svd.vectorizer.mode, VectorizerMode::TFIDF);
    EXPECT_EQ(svd.factorizer.kind, FactorizerKind::TRUNCATED_SVD);

    auto nmf = cooc_nmf5_config();
    EXPECT_EQ(nmf.vectorizer.mode, VectorizerMode::TFIDF);
    EXPECT_EQ(nmf.factorizer.kind, FactorizerKind::NMF);

    PairCoOccurrenceFeature feature("cooc_lda5", lda);
    EXPECT_EQ(feature.column_pairs().size(), 20u);
    EXPECT_EQ(feature.required_columns(), default_categorical_columns());
}

TEST_F(FeatureGeneratorTest, PairFeatureShapesAndNames) {
    PairCoOccurrenceFeature feature("pc", small_config(VectorizerMode::TFIDF, FactorizerKind::TRUNCATED_SVD),
                                    {"a", "b", "c"}, 2);
    FeatureTables tables = feature.create_features(train, test);

    EXPECT_EQ(tables.train.rows(), 24u);
    EXPECT_EQ(tables.test.rows(), 8u);
    EXPECT_EQ(tables.train.cols(), 12u);
    EXPECT_EQ(tables.train.column_names(), tables.test.column_names());
    EXPECT_EQ(tables.train.column_names().front(), "pc-a-b-0");
    EXPECT_EQ(tables.train.column_names().back(), "pc-c-b-1");
}

TEST_F(FeatureGeneratorTest, TrainAndTestShareFittedVectors) {
    PairCoOccurrenceFeature feature("pc", small_config(VectorizerMode::COUNT, FactorizerKind::LDA),
                                    {"a", "b", "c"}, 4);
    FeatureTables tables = feature.create_features(train, test);

    // Rows with the same value of "a" carry the same a-b slice in both tables
    const size_t slice = tables.train.column_index("pc-a-b-0");
    const auto& train_a = train.column("a");
    const auto& test_a = test.column("a");
    for (size_t t = 0; t < test.rows(); ++t) {
        for (size_t r = 0; r < train.rows(); ++r) {
            if (train_a[r] != test_a[t]) continue;
            EXPECT_EQ(tables.test.at(t, slice), tables.train.at(r, slice));
            EXPECT_EQ(tables.test.at(t, slice + 1), tables.train.at(r, slice + 1));
            break;
        }
    }
}

TEST_F(FeatureGeneratorTest, PairFeatureNeedsEveryColumn) {
    PairCoOccurrenceFeature feature("pc", small_config(VectorizerMode::COUNT, FactorizerKind::NMF),
                                    {"a", "b", "device"}, 2);
    EXPECT_THROW(feature.create_features(train, test), SchemaError);
}

TEST_F(FeatureGeneratorTest, CompositeFeatureZeroesRareKeys) {
    auto build = [](int first_row, int rows, bool add_rare) {
        CategoricalColumn ip, device, os, channel, app;
        for (int r = first_row; r < first_row + rows; ++r) {
            ip.push_back(r % 3);
            device.push_back(1);
            os.push_back(2);
            channel.push_back(3);
            app.push_back(r % 5);
        }
        if (add_rare) {
            ip.push_back(9);
            device.push_back(1);
            os.push_back(2);
            channel.push_back(3);
            app.push_back(4);
        }
        Dataset data;
        data.add_column("ip", ip);
        data.add_column("app", app);
        data.add_column("os", os);
        data.add_column("device", device);
        data.add_column("channel", channel);
        return data;
    };
    Dataset keyed_train = build(0, 30, false);
    Dataset keyed_test = build(30, 9, true);

    CompositeKeyFeature::Options options;
    options.width = 3;
    CompositeKeyFeature feature("kf", CompositeKeyLayout::ip_device_os_channel(), options);

    const std::vector<std::string> columns = {"ip", "device", "os", "channel", "app"};
    EXPECT_EQ(feature.required_columns(), columns);

    FeatureTables tables = feature.create_features(keyed_train, keyed_test);
    ASSERT_EQ(tables.train.rows(), 30u);
    ASSERT_EQ(tables.test.rows(), 10u);
    ASSERT_EQ(tables.test.cols(), 3u);
    EXPECT_EQ(tables.test.column_names()[2], "kf_2");

    // Frequent keys carry LDA topic distributions; the single rare row is zero
    for (size_t r = 0; r < 9; ++r) {
        EXPECT_NEAR(tables.test.values().row(static_cast<Eigen::Index>(r)).sum(), 1.0f, 1e-4f);
    }
    EXPECT_EQ(tables.test.values().row(9).cwiseAbs().sum(), 0.0f);

    // Same key, same vector across the splits
    for (Eigen::Index j = 0; j < 3; ++j) {
        EXPECT_EQ(tables.test.values()(0, j), tables.train.values()(0, j));
    }
}

TEST_F(FeatureGeneratorTest, OneHotSvdShapes) {
    OneHotSvdFeature plain("oh", false, 3, {"a", "b"});
    OneHotSvdFeature weighted("oht", true, 3, {"a", "b"});

    FeatureTables p = plain.create_features(train, test);
    FeatureTables w = weighted.create_features(train, test);

    EXPECT_EQ(p.train.rows(), 24u);
    EXPECT_EQ(p.test.rows(), 8u);
    EXPECT_EQ(p.train.cols(), 3u);
    EXPECT_EQ(p.train.column_names()[1], "oh_1");
    EXPECT_EQ(w.test.column_names()[0], "oht_0");
    EXPECT_TRUE(p.train.values().allFinite());
    EXPECT_TRUE(w.train.values().allFinite());
    EXPECT_GT(p.train.values().cwiseAbs().sum(), 0.0f);
}

TEST_F(FeatureGeneratorTest, GenerateFromSources) {
    InMemorySource train_source(train);
    InMemorySource test_source(test);
    OneHotSvdFeature feature("oh", false, 2, {"a", "c"});

    FeatureTables tables = generate_features(feature, train_source, test_source);
    EXPECT_EQ(tables.train.rows(), train.rows());
    EXPECT_EQ(tables.test.rows(), test.rows());

    OneHotSvdFeature missing("oh", false, 2, {"a", "os"});
    EXPECT_THROW(generate_features(missing, train_source, test_source), SchemaError);
}

TEST_F(FeatureGeneratorTest, InvalidConstruction) {
    PairPipelineConfig zero_width = cooc_svd5_config();
    zero_width.factorizer.width = 0;
    EXPECT_THROW(PairCoOccurrenceFeature("x", zero_width), InvalidArgumentError);
    EXPECT_THROW(PairCoOccurrenceFeature("x", cooc_svd5_config(), {"a"}), InvalidArgumentError);
    EXPECT_THROW(OneHotSvdFeature("x", false, 0), InvalidArgumentError);
}
