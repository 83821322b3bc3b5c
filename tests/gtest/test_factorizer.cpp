// =============================================================================
// Factorizer Tests
// =============================================================================

#include <gtest/gtest.h>
#include "covec/document_builder.hpp"
#include "covec/error.hpp"
#include "covec/factorizer.hpp"

#include <Eigen/SVD>

#include <algorithm>
#include <cmath>
#include <random>
#include <vector>

using namespace covec;

class FactorizerTest : public ::testing::Test {
protected:
    void SetUp() override {
        rng.seed(42);
        std::uniform_int_distribution<int> group(0, 19);
        std::uniform_int_distribution<int> token(0, 14);

        CategoricalColumn col1, col2;
        for (int i = 0; i < 400; ++i) {
            col1.push_back(group(rng));
            col2.push_back(token(rng));
        }
        documents = build_documents(col1, col2);
    }

    DocumentTermMatrix vectorize(VectorizerMode mode) {
        Vectorizer vectorizer({mode, 1});
        return vectorizer.fit_transform(documents);
    }

    static FactorizerConfig config_for(FactorizerKind kind, size_t width) {
        FactorizerConfig config;
        config.kind = kind;
        config.width = width;
        return config;
    }

    std::mt19937 rng;
    std::vector<std::string> documents;
};

TEST_F(FactorizerTest, EveryAlgorithmReturnsDocumentsByWidth) {
    auto counts = vectorize(VectorizerMode::COUNT);
    auto weights = vectorize(VectorizerMode::TFIDF);

    for (auto kind : {FactorizerKind::LDA, FactorizerKind::TRUNCATED_SVD, FactorizerKind::NMF}) {
        const auto& dtm = kind == FactorizerKind::LDA ? counts : weights;
        LatentMatrix latent = factorize(dtm, config_for(kind, 5));
        EXPECT_EQ(latent.rows(), static_cast<Eigen::Index>(documents.size()))
            << factorizer_kind_name(kind);
        EXPECT_EQ(latent.cols(), 5) << factorizer_kind_name(kind);
        EXPECT_TRUE(latent.allFinite()) << factorizer_kind_name(kind);
    }
}

TEST_F(FactorizerTest, SameSeedSameResult) {
    auto counts = vectorize(VectorizerMode::COUNT);
    auto weights = vectorize(VectorizerMode::TFIDF);

    for (auto kind : {FactorizerKind::LDA, FactorizerKind::TRUNCATED_SVD, FactorizerKind::NMF}) {
        const auto& dtm = kind == FactorizerKind::LDA ? counts : weights;
        LatentMatrix a = factorize(dtm, config_for(kind, 4));
        LatentMatrix b = factorize(dtm, config_for(kind, 4));
        EXPECT_EQ((a - b).cwiseAbs().maxCoeff(), 0.0f) << factorizer_kind_name(kind);
    }
}

TEST_F(FactorizerTest, LdaRowsAreTopicDistributions) {
    LatentMatrix theta = factorize(vectorize(VectorizerMode::COUNT),
                                   config_for(FactorizerKind::LDA, 5));
    EXPECT_GE(theta.minCoeff(), 0.0f);
    for (Eigen::Index r = 0; r < theta.rows(); ++r) {
        EXPECT_NEAR(theta.row(r).sum(), 1.0f, 1e-4f) << "row " << r;
    }
}

TEST_F(FactorizerTest, LdaLeavesEmptyDocumentsUniform) {
    std::vector<std::string> docs = documents;
    docs.push_back("");
    Vectorizer vectorizer;
    LatentMatrix theta = factorize(vectorizer.fit_transform(docs), config_for(FactorizerKind::LDA, 4));

    const auto last = theta.row(theta.rows() - 1);
    for (Eigen::Index j = 0; j < last.size(); ++j) {
        EXPECT_NEAR(last(j), 0.25f, 1e-5f);
    }
}

TEST_F(FactorizerTest, NmfIsNonNegative) {
    LatentMatrix w = factorize(vectorize(VectorizerMode::TFIDF), config_for(FactorizerKind::NMF, 5));
    EXPECT_GE(w.minCoeff(), 0.0f);
    EXPECT_GT(w.maxCoeff(), 0.0f);
}

TEST_F(FactorizerTest, SvdComponentNormsMatchSingularValues) {
    auto dtm = vectorize(VectorizerMode::TFIDF);
    LatentMatrix projected = factorize(dtm, config_for(FactorizerKind::TRUNCATED_SVD, 5));

    Eigen::MatrixXd dense = Eigen::MatrixXd(dtm.to_double());
    Eigen::JacobiSVD<Eigen::MatrixXd> exact(dense);
    const Eigen::VectorXd& sigma = exact.singularValues();

    for (Eigen::Index j = 0; j < 5; ++j) {
        EXPECT_NEAR(projected.col(j).norm(), sigma(j), 1e-3 * sigma(0)) << "component " << j;
    }
}

TEST_F(FactorizerTest, SvdSignsAreFixed) {
    LatentMatrix projected = factorize(vectorize(VectorizerMode::TFIDF),
                                       config_for(FactorizerKind::TRUNCATED_SVD, 3));
    for (Eigen::Index j = 0; j < projected.cols(); ++j) {
        Eigen::Index argmax = 0;
        projected.col(j).cwiseAbs().maxCoeff(&argmax);
        EXPECT_GT(projected(argmax, j), 0.0f);
    }
}

TEST_F(FactorizerTest, SvdWidthBeyondVocabularyThrows) {
    Vectorizer vectorizer;
    auto dtm = vectorizer.fit_transform({"1 2", "2 3", "1"});
    EXPECT_THROW(factorize(dtm, config_for(FactorizerKind::TRUNCATED_SVD, 5)), NumericalError);
    EXPECT_NO_THROW(factorize(dtm, config_for(FactorizerKind::TRUNCATED_SVD, 3)));
}

TEST_F(FactorizerTest, SvdPadsComponentsPastTheDocumentCount) {
    Vectorizer vectorizer;
    auto dtm = vectorizer.fit_transform({"1 2 3 4", "4 5"});
    LatentMatrix projected = factorize(dtm, config_for(FactorizerKind::TRUNCATED_SVD, 4));
    ASSERT_EQ(projected.rows(), 2);
    ASSERT_EQ(projected.cols(), 4);
    EXPECT_GT(projected.col(0).norm(), 0.0f);
    EXPECT_EQ(projected.col(2).norm(), 0.0f);
    EXPECT_EQ(projected.col(3).norm(), 0.0f);
}

TEST_F(FactorizerTest, EmptyMatrixThrowsVocabularyError) {
    DocumentTermMatrix empty;
    for (auto kind : {FactorizerKind::LDA, FactorizerKind::TRUNCATED_SVD, FactorizerKind::NMF}) {
        EXPECT_THROW(factorize(empty, config_for(kind, 5)), VocabularyError);
    }
}

TEST_F(FactorizerTest, ZeroWidthIsRejected) {
    EXPECT_THROW(factorize(vectorize(VectorizerMode::COUNT), config_for(FactorizerKind::LDA, 0)),
                 InvalidArgumentError);
}

TEST(DigammaTest, KnownValues) {
    constexpr double euler_gamma = 0.57721566490153286;
    EXPECT_NEAR(algorithms::digamma(1.0), -euler_gamma, 1e-10);
    EXPECT_NEAR(algorithms::digamma(0.5), -euler_gamma - 2.0 * std::log(2.0), 1e-10);
    for (double x : {0.1, 0.7, 3.2, 25.0}) {
        EXPECT_NEAR(algorithms::digamma(x + 1.0), algorithms::digamma(x) + 1.0 / x, 1e-10);
    }
    EXPECT_THROW(algorithms::digamma(0.0), InvalidArgumentError);
}
