#include "covec/factorizer.hpp"
#include "covec/error.hpp"
#include "covec/logging.hpp"

namespace covec {

const char* factorizer_kind_name(FactorizerKind kind) {
    switch (kind) {
        case FactorizerKind::LDA:           return "lda";
        case FactorizerKind::TRUNCATED_SVD: return "truncated_svd";
        case FactorizerKind::NMF:           return "nmf";
    }
    return "unknown";
}

LatentMatrix factorize(const DocumentTermMatrix& dtm, const FactorizerConfig& config) {
    COVEC_CHECK_ARGUMENT(config.width > 0, "embedding width must be positive");

    if (dtm.empty()) {
        throw VocabularyError("cannot factorize an empty " + std::to_string(dtm.rows()) + " x " +
                              std::to_string(dtm.cols()) + " document-term matrix", __func__);
    }

    const SparseMatrixD X = dtm.to_double();

    Eigen::MatrixXd latent;
    switch (config.kind) {
        case FactorizerKind::LDA:
            latent = algorithms::lda_fit_transform(X, config.width, config.seed, config.lda);
            break;
        case FactorizerKind::TRUNCATED_SVD:
            latent = algorithms::truncated_svd_fit_transform(X, config.width, config.seed, config.svd);
            break;
        case FactorizerKind::NMF:
            latent = algorithms::nmf_fit_transform(X, config.width, config.seed, config.nmf);
            break;
    }

    if (latent.rows() != X.rows() || latent.cols() != static_cast<Eigen::Index>(config.width)) {
        throw CovecException(ErrorCode::INTERNAL_ERROR,
                             std::string(factorizer_kind_name(config.kind)) + " returned a " +
                             std::to_string(latent.rows()) + " x " + std::to_string(latent.cols()) +
                             " matrix", __func__);
    }
    if (!latent.allFinite()) {
        throw NumericalError(std::string(factorizer_kind_name(config.kind)) +
                             " produced non-finite components", __func__);
    }

    LOG_DEBUG(factorizer_kind_name(config.kind), ": ", X.rows(), " x ", X.cols(),
              " -> width ", config.width);

    return latent.cast<float>();
}

} // namespace covec
