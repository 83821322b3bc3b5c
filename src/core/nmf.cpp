/**
 * Non-negative Matrix Factorization, X ~ W H
 *
 * Frobenius loss minimized by cyclic coordinate descent (HALS): each sweep
 * updates every W entry then every H entry in closed form, clamped at zero.
 * Initialization draws |N(0, 1)| scaled by sqrt(mean(X) / width), H first.
 * Stops when the projected-gradient violation falls below tol times its
 * first-sweep value.
 */

#include "covec/factorizer.hpp"
#include "covec/error.hpp"
#include "covec/logging.hpp"

#include <algorithm>
#include <cmath>
#include <random>

namespace covec {
namespace algorithms {

namespace {

/**
 * One coordinate-descent sweep over W (rows x k) given
 * HHt = H H^T (k x k) and XHt = X H^T (rows x k).
 * Returns the summed projected-gradient violation.
 */
double update_coordinate_descent(Eigen::MatrixXd& W,
                                 const Eigen::MatrixXd& HHt,
                                 const Eigen::MatrixXd& XHt) {
    const Eigen::Index rows = W.rows();
    const Eigen::Index k = W.cols();
    double violation = 0.0;

    for (Eigen::Index t = 0; t < k; ++t) {
        const double hess = HHt(t, t);
        for (Eigen::Index i = 0; i < rows; ++i) {
            double grad = -XHt(i, t);
            for (Eigen::Index r = 0; r < k; ++r) {
                grad += W(i, r) * HHt(r, t);
            }

            const double pg = W(i, t) == 0.0 ? std::min(0.0, grad) : grad;
            violation += std::abs(pg);

            if (hess != 0.0) {
                W(i, t) = std::max(W(i, t) - grad / hess, 0.0);
            }
        }
    }
    return violation;
}

} // namespace

Eigen::MatrixXd nmf_fit_transform(const SparseMatrixD& X, size_t width,
                                  uint32_t seed, const NmfParams& params) {
    const Eigen::Index n_docs = X.rows();
    const Eigen::Index n_terms = X.cols();
    const Eigen::Index k = static_cast<Eigen::Index>(width);

    for (Eigen::Index row = 0; row < X.outerSize(); ++row) {
        for (SparseMatrixD::InnerIterator it(X, row); it; ++it) {
            if (it.value() < 0.0) {
                throw NumericalError("NMF requires a non-negative document-term matrix", __func__);
            }
        }
    }

    const double mean = X.sum() / (static_cast<double>(n_docs) * static_cast<double>(n_terms));
    const double scale = std::sqrt(mean / static_cast<double>(width));

    std::mt19937 rng(seed);
    std::normal_distribution<double> normal(0.0, 1.0);

    // H is kept transposed (n_terms x k) so both halves use the same sweep
    Eigen::MatrixXd Ht(n_terms, k);
    for (Eigen::Index t = 0; t < k; ++t) {
        for (Eigen::Index w = 0; w < n_terms; ++w) {
            Ht(w, t) = scale * std::abs(normal(rng));
        }
    }
    Eigen::MatrixXd W(n_docs, k);
    for (Eigen::Index d = 0; d < n_docs; ++d) {
        for (Eigen::Index t = 0; t < k; ++t) {
            W(d, t) = scale * std::abs(normal(rng));
        }
    }

    double violation_init = 0.0;
    size_t iterations = 0;
    for (size_t iter = 1; iter <= params.max_iter; ++iter) {
        iterations = iter;
        double violation = 0.0;

        {
            const Eigen::MatrixXd HHt = Ht.transpose() * Ht;
            const Eigen::MatrixXd XHt = X * Ht;
            violation += update_coordinate_descent(W, HHt, XHt);
        }
        {
            const Eigen::MatrixXd WtW = W.transpose() * W;
            const Eigen::MatrixXd XtW = X.transpose() * W;
            violation += update_coordinate_descent(Ht, WtW, XtW);
        }

        if (iter == 1) {
            violation_init = violation;
        }
        if (violation_init == 0.0) break;
        if (violation / violation_init <= params.tol) break;
    }

    if (iterations == params.max_iter) {
        LOG_DEBUG("NMF reached max_iter=", params.max_iter, " before converging");
    }
    return W;
}

} // namespace algorithms
} // namespace covec
