/**
 * Online Variational Bayes LDA
 *
 * Mini-batch variational inference for latent Dirichlet allocation
 * (Hoffman, Blei & Bach, 2010):
 * 1. Topic-word variational parameters lambda ~ Gamma(100, 1/100)
 * 2. E-step per document: fixed-point iteration on gamma_d until the mean
 *    absolute change drops below mean_change_tol
 * 3. M-step per mini-batch: lambda <- (1 - rho) lambda + rho (eta + D/|B| * sstats)
 *    with rho = (tau0 + t)^-kappa
 * 4. Final pass: E-step from gamma = 1 for every document, rows normalized
 */

#include "covec/factorizer.hpp"
#include "covec/error.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <random>
#include <vector>

namespace covec {
namespace algorithms {

double digamma(double x) {
    COVEC_CHECK_ARGUMENT(x > 0.0, "digamma is only defined here for x > 0");

    double result = 0.0;
    // Recurrence psi(x) = psi(x + 1) - 1/x until the asymptotic series is accurate
    while (x < 6.0) {
        result -= 1.0 / x;
        x += 1.0;
    }
    const double inv = 1.0 / x;
    const double inv2 = inv * inv;
    result += std::log(x) - 0.5 * inv
            - inv2 * (1.0 / 12.0
            - inv2 * (1.0 / 120.0
            - inv2 * (1.0 / 252.0
            - inv2 * (1.0 / 240.0
            - inv2 * (1.0 / 132.0)))));
    return result;
}

namespace {

constexpr double EPS = std::numeric_limits<double>::epsilon();

// exp(E[log theta]) for theta ~ Dir(alpha)
void exp_dirichlet_expectation(const Eigen::VectorXd& alpha, Eigen::VectorXd& out) {
    const double psi_total = digamma(alpha.sum());
    out.resize(alpha.size());
    for (Eigen::Index i = 0; i < alpha.size(); ++i) {
        out(i) = std::exp(digamma(alpha(i)) - psi_total);
    }
}

// Row-wise exp(E[log beta_k]) for beta_k ~ Dir(lambda_k)
Eigen::MatrixXd exp_dirichlet_expectation_rows(const Eigen::MatrixXd& lambda) {
    Eigen::MatrixXd out(lambda.rows(), lambda.cols());
    for (Eigen::Index k = 0; k < lambda.rows(); ++k) {
        const double psi_total = digamma(lambda.row(k).sum());
        for (Eigen::Index w = 0; w < lambda.cols(); ++w) {
            out(k, w) = std::exp(digamma(lambda(k, w)) - psi_total);
        }
    }
    return out;
}

struct DocumentView {
    std::vector<Eigen::Index> ids;
    Eigen::VectorXd counts;
};

DocumentView document_view(const SparseMatrixD& X, Eigen::Index row) {
    DocumentView doc;
    std::vector<double> values;
    for (SparseMatrixD::InnerIterator it(X, row); it; ++it) {
        if (it.value() == 0.0) continue;
        doc.ids.push_back(it.col());
        values.push_back(it.value());
    }
    doc.counts = Eigen::Map<const Eigen::VectorXd>(values.data(), static_cast<Eigen::Index>(values.size()));
    return doc;
}

/**
 * Variational E-step for the documents [begin, end).
 * Writes gamma rows into doc_topic; accumulates sufficient statistics when
 * sstats is non-null. With rng set, gamma starts from Gamma(100, 1/100).
 */
void e_step(const SparseMatrixD& X, Eigen::Index begin, Eigen::Index end,
            const Eigen::MatrixXd& exp_dirichlet_component,
            const LdaParams& params, double alpha,
            std::mt19937* rng,
            Eigen::MatrixXd& doc_topic,
            Eigen::MatrixXd* sstats) {
    const Eigen::Index k = exp_dirichlet_component.rows();
    std::gamma_distribution<double> init_dist(100.0, 0.01);

    Eigen::VectorXd gamma(k), last_gamma(k), exp_doc_topic(k);
    for (Eigen::Index d = begin; d < end; ++d) {
        if (rng) {
            for (Eigen::Index t = 0; t < k; ++t) gamma(t) = init_dist(*rng);
        } else {
            gamma.setOnes();
        }
        exp_dirichlet_expectation(gamma, exp_doc_topic);

        DocumentView doc = document_view(X, d);
        const Eigen::Index nids = static_cast<Eigen::Index>(doc.ids.size());

        Eigen::MatrixXd exp_topic_word(k, nids);
        for (Eigen::Index j = 0; j < nids; ++j) {
            exp_topic_word.col(j) = exp_dirichlet_component.col(doc.ids[static_cast<size_t>(j)]);
        }

        Eigen::VectorXd norm_phi = (exp_doc_topic.transpose() * exp_topic_word).transpose();
        norm_phi.array() += EPS;

        for (size_t iter = 0; iter < params.max_doc_update_iter; ++iter) {
            last_gamma = gamma;
            Eigen::VectorXd ratio = doc.counts.array() / norm_phi.array();
            gamma = (exp_doc_topic.array() * (exp_topic_word * ratio).array()).matrix();
            gamma.array() += alpha;
            exp_dirichlet_expectation(gamma, exp_doc_topic);
            norm_phi = (exp_doc_topic.transpose() * exp_topic_word).transpose();
            norm_phi.array() += EPS;

            if ((last_gamma - gamma).cwiseAbs().mean() < params.mean_change_tol) break;
        }

        doc_topic.row(d - begin) = gamma.transpose();

        if (sstats && nids > 0) {
            Eigen::VectorXd ratio = doc.counts.array() / norm_phi.array();
            for (Eigen::Index j = 0; j < nids; ++j) {
                sstats->col(doc.ids[static_cast<size_t>(j)]) += exp_doc_topic * ratio(j);
            }
        }
    }
}

} // namespace

Eigen::MatrixXd lda_fit_transform(const SparseMatrixD& X, size_t width,
                                  uint32_t seed, const LdaParams& params) {
    COVEC_CHECK_ARGUMENT(params.batch_size > 0, "LDA batch size must be positive");

    const Eigen::Index n_docs = X.rows();
    const Eigen::Index n_words = X.cols();
    const Eigen::Index k = static_cast<Eigen::Index>(width);
    const double alpha = params.doc_topic_prior > 0.0 ? params.doc_topic_prior : 1.0 / static_cast<double>(width);
    const double eta = params.topic_word_prior > 0.0 ? params.topic_word_prior : 1.0 / static_cast<double>(width);

    std::mt19937 rng(seed);
    std::gamma_distribution<double> init_dist(100.0, 0.01);

    Eigen::MatrixXd lambda(k, n_words);
    for (Eigen::Index t = 0; t < k; ++t) {
        for (Eigen::Index w = 0; w < n_words; ++w) {
            lambda(t, w) = init_dist(rng);
        }
    }
    Eigen::MatrixXd exp_dirichlet_component = exp_dirichlet_expectation_rows(lambda);

    const Eigen::Index batch = static_cast<Eigen::Index>(params.batch_size);
    double n_batch_iter = 1.0;
    Eigen::MatrixXd sstats(k, n_words);
    Eigen::MatrixXd batch_topics;

    for (size_t pass = 0; pass < params.max_iter; ++pass) {
        for (Eigen::Index begin = 0; begin < n_docs; begin += batch) {
            const Eigen::Index end = std::min(begin + batch, n_docs);
            batch_topics.resize(end - begin, k);
            sstats.setZero();

            e_step(X, begin, end, exp_dirichlet_component, params, alpha, &rng, batch_topics, &sstats);
            sstats.array() *= exp_dirichlet_component.array();

            const double rho = std::pow(params.learning_offset + n_batch_iter, -params.learning_decay);
            const double doc_ratio = params.total_samples / static_cast<double>(end - begin);
            lambda = (1.0 - rho) * lambda + rho * ((sstats.array() * doc_ratio + eta).matrix());
            exp_dirichlet_component = exp_dirichlet_expectation_rows(lambda);
            n_batch_iter += 1.0;
        }
    }

    Eigen::MatrixXd doc_topic(n_docs, k);
    e_step(X, 0, n_docs, exp_dirichlet_component, params, alpha, nullptr, doc_topic, nullptr);

    for (Eigen::Index d = 0; d < n_docs; ++d) {
        const double total = doc_topic.row(d).sum();
        if (total > 0.0) doc_topic.row(d) /= total;
    }
    return doc_topic;
}

} // namespace algorithms
} // namespace covec
