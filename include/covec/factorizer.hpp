#pragma once

/**
 * Latent Factorization of Document-Term Matrices
 *
 * One capability: document-term matrix + width -> dense latent matrix with one
 * row per document and exactly `width` columns. The algorithm is a
 * configuration choice; every algorithm takes the same input and produces the
 * same shape, so feature variants swap them freely.
 *
 * Randomness is seeded from FactorizerConfig::seed only. Two calls with the
 * same matrix and config return identical matrices, whatever thread runs them.
 */

#include "covec/vectorizer.hpp"

#include <Eigen/Dense>

#include <cstddef>
#include <cstdint>

namespace covec {

using LatentMatrix = Eigen::Matrix<float, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;

enum class FactorizerKind {
    LDA,            // online variational Bayes latent Dirichlet allocation
    TRUNCATED_SVD,  // randomized truncated singular value decomposition
    NMF             // non-negative matrix factorization (Frobenius loss)
};

const char* factorizer_kind_name(FactorizerKind kind);

constexpr uint32_t DEFAULT_SEED = 71;

struct LdaParams {
    size_t batch_size = 128;
    size_t max_iter = 10;              // passes over the corpus
    double learning_decay = 0.7;
    double learning_offset = 10.0;
    double total_samples = 1e6;
    size_t max_doc_update_iter = 100;
    double mean_change_tol = 1e-3;
    double doc_topic_prior = 0.0;      // 0 = 1 / width
    double topic_word_prior = 0.0;     // 0 = 1 / width
};

struct SvdParams {
    size_t oversamples = 10;
    size_t power_iterations = 5;
};

struct NmfParams {
    size_t max_iter = 200;
    double tol = 1e-4;
};

struct FactorizerConfig {
    FactorizerKind kind = FactorizerKind::TRUNCATED_SVD;
    size_t width = 5;
    uint32_t seed = DEFAULT_SEED;

    LdaParams lda;
    SvdParams svd;
    NmfParams nmf;
};

/**
 * Fit the configured algorithm and return the latent rows as float.
 *
 * Throws InvalidArgumentError for width 0, VocabularyError for a matrix
 * without rows or columns, NumericalError if the algorithm cannot produce
 * `width` finite components.
 */
LatentMatrix factorize(const DocumentTermMatrix& dtm, const FactorizerConfig& config);

namespace algorithms {

// Row-normalized document-topic distributions (n_docs x width)
Eigen::MatrixXd lda_fit_transform(const SparseMatrixD& X, size_t width,
                                  uint32_t seed, const LdaParams& params);

// U * Sigma (n_docs x width); columns past the matrix rank are zero
Eigen::MatrixXd truncated_svd_fit_transform(const SparseMatrixD& X, size_t width,
                                            uint32_t seed, const SvdParams& params);

// W of X ~ W H with W, H >= 0 (n_docs x width)
Eigen::MatrixXd nmf_fit_transform(const SparseMatrixD& X, size_t width,
                                  uint32_t seed, const NmfParams& params);

// Digamma function for x > 0
double digamma(double x);

} // namespace algorithms

} // namespace covec
