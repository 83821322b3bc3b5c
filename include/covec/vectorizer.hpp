#pragma once

/**
 * Sparse Document-Term Vectorization
 *
 * Turns synthetic documents (space-separated integer tokens) into a sparse
 * row-major document-term matrix. Rows follow document order; columns follow
 * the lexicographically sorted vocabulary of tokens that appear in at least
 * min_df documents.
 *
 * COUNT keeps raw integer term counts. TFIDF stores float weights
 *   w = count * (ln((1 + n) / (1 + df)) + 1)
 * with every non-empty row scaled to unit L2 norm.
 */

#include <Eigen/Sparse>

#include <cstddef>
#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace covec {

using CountMatrix = Eigen::SparseMatrix<int32_t, Eigen::RowMajor>;
using WeightMatrix = Eigen::SparseMatrix<float, Eigen::RowMajor>;
using SparseMatrixD = Eigen::SparseMatrix<double, Eigen::RowMajor>;

enum class VectorizerMode {
    COUNT,
    TFIDF
};

const char* vectorizer_mode_name(VectorizerMode mode);

struct VectorizerConfig {
    VectorizerMode mode = VectorizerMode::COUNT;
    size_t min_df = 1;  // minimum number of documents a token must appear in
};

/**
 * Counts or weights, depending on how the matrix was produced.
 */
class DocumentTermMatrix {
public:
    DocumentTermMatrix() = default;
    explicit DocumentTermMatrix(CountMatrix counts) : data_(std::move(counts)) {}
    explicit DocumentTermMatrix(WeightMatrix weights) : data_(std::move(weights)) {}

    bool is_weighted() const { return std::holds_alternative<WeightMatrix>(data_); }

    Eigen::Index rows() const;
    Eigen::Index cols() const;
    Eigen::Index nonZeros() const;
    bool empty() const { return rows() == 0 || cols() == 0; }

    // Throw InvalidArgumentError when the other representation is held
    const CountMatrix& counts() const;
    const WeightMatrix& weights() const;

    // Working copy for the factorizers
    SparseMatrixD to_double() const;

    // Free the storage; the matrix becomes 0 x 0
    void release();

private:
    std::variant<CountMatrix, WeightMatrix> data_;
};

class Vectorizer {
public:
    explicit Vectorizer(const VectorizerConfig& config = VectorizerConfig{});

    /**
     * Learn the vocabulary and build the matrix.
     * Throws VocabularyError if no token survives the min_df cutoff.
     */
    DocumentTermMatrix fit_transform(const std::vector<std::string>& documents);

    const std::vector<std::string>& vocabulary() const { return vocabulary_; }
    const VectorizerConfig& config() const { return config_; }

    void release_vocabulary();

private:
    VectorizerConfig config_;
    std::vector<std::string> vocabulary_;
};

/**
 * Reweight a count matrix with smooth idf and L2 row normalization.
 */
WeightMatrix tfidf_transform(const CountMatrix& counts);

// Whitespace tokenization used by the vectorizer
std::vector<std::string> tokenize(const std::string& document);

} // namespace covec
