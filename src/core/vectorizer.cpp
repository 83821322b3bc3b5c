#include "covec/vectorizer.hpp"
#include "covec/error.hpp"
#include "covec/logging.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <unordered_map>

namespace covec {

const char* vectorizer_mode_name(VectorizerMode mode) {
    switch (mode) {
        case VectorizerMode::COUNT: return "count";
        case VectorizerMode::TFIDF: return "tfidf";
    }
    return "unknown";
}

// =============================================================================
// DocumentTermMatrix
// =============================================================================

Eigen::Index DocumentTermMatrix::rows() const {
    return std::visit([](const auto& m) { return m.rows(); }, data_);
}

Eigen::Index DocumentTermMatrix::cols() const {
    return std::visit([](const auto& m) { return m.cols(); }, data_);
}

Eigen::Index DocumentTermMatrix::nonZeros() const {
    return std::visit([](const auto& m) { return m.nonZeros(); }, data_);
}

const CountMatrix& DocumentTermMatrix::counts() const {
    if (const auto* m = std::get_if<CountMatrix>(&data_)) return *m;
    throw InvalidArgumentError("document-term matrix holds weights, not counts", __func__);
}

const WeightMatrix& DocumentTermMatrix::weights() const {
    if (const auto* m = std::get_if<WeightMatrix>(&data_)) return *m;
    throw InvalidArgumentError("document-term matrix holds counts, not weights", __func__);
}

SparseMatrixD DocumentTermMatrix::to_double() const {
    return std::visit([](const auto& m) -> SparseMatrixD { return m.template cast<double>(); }, data_);
}

void DocumentTermMatrix::release() {
    data_ = CountMatrix();
}

// =============================================================================
// Vectorizer
// =============================================================================

std::vector<std::string> tokenize(const std::string& document) {
    std::vector<std::string> tokens;
    size_t i = 0;
    const size_t n = document.size();
    while (i < n) {
        while (i < n && std::isspace(static_cast<unsigned char>(document[i]))) ++i;
        size_t start = i;
        while (i < n && !std::isspace(static_cast<unsigned char>(document[i]))) ++i;
        if (i > start) tokens.emplace_back(document, start, i - start);
    }
    return tokens;
}

Vectorizer::Vectorizer(const VectorizerConfig& config) : config_(config) {
    COVEC_CHECK_ARGUMENT(config_.min_df >= 1, "min_df must be at least 1");
}

void Vectorizer::release_vocabulary() {
    std::vector<std::string>().swap(vocabulary_);
}

DocumentTermMatrix Vectorizer::fit_transform(const std::vector<std::string>& documents) {
    std::vector<std::vector<std::string>> tokenized;
    tokenized.reserve(documents.size());
    for (const auto& doc : documents) {
        tokenized.push_back(tokenize(doc));
    }

    // Document frequency of every token
    std::unordered_map<std::string, size_t> document_frequency;
    for (const auto& tokens : tokenized) {
        std::vector<const std::string*> unique;
        unique.reserve(tokens.size());
        for (const auto& t : tokens) unique.push_back(&t);
        std::sort(unique.begin(), unique.end(),
                  [](const std::string* a, const std::string* b) { return *a < *b; });
        unique.erase(std::unique(unique.begin(), unique.end(),
                                 [](const std::string* a, const std::string* b) { return *a == *b; }),
                     unique.end());
        for (const auto* t : unique) {
            ++document_frequency[*t];
        }
    }

    vocabulary_.clear();
    for (const auto& [token, df] : document_frequency) {
        if (df >= config_.min_df) vocabulary_.push_back(token);
    }
    std::sort(vocabulary_.begin(), vocabulary_.end());

    if (vocabulary_.empty()) {
        throw VocabularyError("no token appears in at least " + std::to_string(config_.min_df) +
                              " of " + std::to_string(documents.size()) + " documents", __func__,
                              "lower min_df or provide more co-occurrence data");
    }

    std::unordered_map<std::string, int32_t> column_of;
    column_of.reserve(vocabulary_.size());
    for (size_t c = 0; c < vocabulary_.size(); ++c) {
        column_of.emplace(vocabulary_[c], static_cast<int32_t>(c));
    }

    // Duplicate (row, col) triplets are summed into term counts
    std::vector<Eigen::Triplet<int32_t>> triplets;
    for (size_t row = 0; row < tokenized.size(); ++row) {
        for (const auto& token : tokenized[row]) {
            auto it = column_of.find(token);
            if (it != column_of.end()) {
                triplets.emplace_back(static_cast<int>(row), it->second, 1);
            }
        }
        std::vector<std::string>().swap(tokenized[row]);
    }

    CountMatrix counts(static_cast<Eigen::Index>(documents.size()),
                       static_cast<Eigen::Index>(vocabulary_.size()));
    counts.setFromTriplets(triplets.begin(), triplets.end());
    counts.makeCompressed();

    LOG_DEBUG("vectorized ", counts.rows(), " documents x ", counts.cols(), " terms (",
              counts.nonZeros(), " nnz, ", vectorizer_mode_name(config_.mode), ")");

    if (config_.mode == VectorizerMode::TFIDF) {
        return DocumentTermMatrix(tfidf_transform(counts));
    }
    return DocumentTermMatrix(std::move(counts));
}

WeightMatrix tfidf_transform(const CountMatrix& counts) {
    const double n = static_cast<double>(counts.rows());

    std::vector<double> df(static_cast<size_t>(counts.cols()), 0.0);
    for (Eigen::Index row = 0; row < counts.outerSize(); ++row) {
        for (CountMatrix::InnerIterator it(counts, row); it; ++it) {
            if (it.value() != 0) df[static_cast<size_t>(it.col())] += 1.0;
        }
    }

    std::vector<double> idf(df.size());
    for (size_t c = 0; c < df.size(); ++c) {
        idf[c] = std::log((1.0 + n) / (1.0 + df[c])) + 1.0;
    }

    std::vector<Eigen::Triplet<float>> triplets;
    triplets.reserve(static_cast<size_t>(counts.nonZeros()));
    std::vector<std::pair<Eigen::Index, double>> row_values;
    for (Eigen::Index row = 0; row < counts.outerSize(); ++row) {
        row_values.clear();
        double norm_sq = 0.0;
        for (CountMatrix::InnerIterator it(counts, row); it; ++it) {
            double w = static_cast<double>(it.value()) * idf[static_cast<size_t>(it.col())];
            row_values.emplace_back(it.col(), w);
            norm_sq += w * w;
        }
        if (norm_sq <= 0.0) continue;
        const double inv_norm = 1.0 / std::sqrt(norm_sq);
        for (const auto& [col, w] : row_values) {
            triplets.emplace_back(static_cast<int>(row), static_cast<int>(col),
                                  static_cast<float>(w * inv_norm));
        }
    }

    WeightMatrix weights(counts.rows(), counts.cols());
    weights.setFromTriplets(triplets.begin(), triplets.end());
    weights.makeCompressed();
    return weights;
}

} // namespace covec
