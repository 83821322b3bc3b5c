/**
 * Randomized Truncated SVD
 *
 * Halko, Martinsson & Tropp range finder on the sparse document-term matrix:
 * 1. Gaussian test matrix Omega (n_terms x (width + oversamples)), seeded
 * 2. Y = X Omega, re-orthonormalized by thin QR after every power iteration
 *    (X^T Q, then X Q) so small singular values are not swamped
 * 3. B = Q^T X is small; its dense SVD gives U = Q U_B and Sigma
 * 4. Signs fixed so each U column's largest-magnitude entry is positive
 *
 * Returns the projection U * Sigma of the fitted documents.
 */

#include "covec/factorizer.hpp"
#include "covec/error.hpp"

#include <Eigen/QR>
#include <Eigen/SVD>

#include <algorithm>
#include <random>

namespace covec {
namespace algorithms {

namespace {

// Orthonormal basis of the column space of Y (thin Q)
Eigen::MatrixXd orthonormalize(const Eigen::MatrixXd& Y) {
    const Eigen::Index cols = std::min(Y.rows(), Y.cols());
    Eigen::HouseholderQR<Eigen::MatrixXd> qr(Y);
    return qr.householderQ() * Eigen::MatrixXd::Identity(Y.rows(), cols);
}

void flip_signs(Eigen::MatrixXd& U) {
    for (Eigen::Index j = 0; j < U.cols(); ++j) {
        Eigen::Index argmax = 0;
        U.col(j).cwiseAbs().maxCoeff(&argmax);
        if (U(argmax, j) < 0.0) {
            U.col(j) = -U.col(j);
        }
    }
}

} // namespace

Eigen::MatrixXd truncated_svd_fit_transform(const SparseMatrixD& X, size_t width,
                                            uint32_t seed, const SvdParams& params) {
    const Eigen::Index n_docs = X.rows();
    const Eigen::Index n_terms = X.cols();
    const Eigen::Index k = static_cast<Eigen::Index>(width);

    if (k > n_terms) {
        throw NumericalError("truncated SVD width " + std::to_string(width) +
                             " exceeds the vocabulary size " + std::to_string(n_terms), __func__,
                             "lower the width or the min_df cutoff");
    }

    const Eigen::Index n_random = std::min<Eigen::Index>(
        k + static_cast<Eigen::Index>(params.oversamples), n_terms);

    std::mt19937 rng(seed);
    std::normal_distribution<double> normal(0.0, 1.0);
    Eigen::MatrixXd omega(n_terms, n_random);
    for (Eigen::Index j = 0; j < n_random; ++j) {
        for (Eigen::Index i = 0; i < n_terms; ++i) {
            omega(i, j) = normal(rng);
        }
    }

    Eigen::MatrixXd Q = orthonormalize(X * omega);
    for (size_t iter = 0; iter < params.power_iterations; ++iter) {
        Eigen::MatrixXd Z = orthonormalize(X.transpose() * Q);
        Q = orthonormalize(X * Z);
    }

    const Eigen::MatrixXd B = Q.transpose() * X;
    Eigen::BDCSVD<Eigen::MatrixXd> svd(B, Eigen::ComputeThinU | Eigen::ComputeThinV);
    if (svd.info() != Eigen::Success) {
        throw NumericalError("dense SVD of the projected matrix failed", __func__);
    }

    Eigen::MatrixXd U = Q * svd.matrixU();
    flip_signs(U);
    const Eigen::VectorXd& sigma = svd.singularValues();

    // Fewer documents than width leaves the trailing components at zero
    Eigen::MatrixXd result = Eigen::MatrixXd::Zero(n_docs, k);
    const Eigen::Index available = std::min<Eigen::Index>(k, sigma.size());
    for (Eigen::Index j = 0; j < available; ++j) {
        result.col(j) = U.col(j) * sigma(j);
    }
    return result;
}

} // namespace algorithms
} // namespace covec
