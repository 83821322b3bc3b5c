#include "covec/pair_job_runner.hpp"
#include "covec/document_builder.hpp"
#include "covec/error.hpp"
#include "covec/logging.hpp"
#include "covec/thread_pool.hpp"

#include <future>

namespace covec {

std::vector<ColumnPair> enumerate_column_pairs(const std::vector<std::string>& columns) {
    std::vector<ColumnPair> pairs;
    if (columns.size() > 1) {
        pairs.reserve(columns.size() * (columns.size() - 1));
    }
    for (const auto& col1 : columns) {
        for (const auto& col2 : columns) {
            if (col1 != col2) {
                pairs.push_back({col1, col2});
            }
        }
    }
    return pairs;
}

PairLatent compute_pair_latent(const Dataset& data, const ColumnPair& pair,
                               const PairPipelineConfig& config) {
    PairLatent result{pair.col1, pair.col2, {}};

    DocumentTermMatrix dtm;
    {
        Vectorizer vectorizer(config.vectorizer);
        dtm = vectorizer.fit_transform(build_documents(data, pair.col1, pair.col2));
    }
    result.latent = factorize(dtm, config.factorizer);
    dtm.release();

    LOG_DEBUG("pair ", pair.col1, "-", pair.col2, ": ", result.latent.rows(), " x ",
              result.latent.cols());
    return result;
}

PairJobRunner::PairJobRunner(const PairPipelineConfig& config, size_t workers)
    : job_([config](const Dataset& data, const ColumnPair& pair) {
          return compute_pair_latent(data, pair, config);
      })
    , workers_(workers) {
    COVEC_CHECK_ARGUMENT(workers_ > 0, "pair job runner needs at least one worker");
}

PairJobRunner::PairJobRunner(JobFunction job, size_t workers)
    : job_(std::move(job)), workers_(workers) {
    COVEC_CHECK_ARGUMENT(static_cast<bool>(job_), "pair job runner needs a job function");
    COVEC_CHECK_ARGUMENT(workers_ > 0, "pair job runner needs at least one worker");
}

std::vector<PairLatent> PairJobRunner::run(const Dataset& data,
                                           const std::vector<ColumnPair>& pairs) const {
    for (const auto& pair : pairs) {
        data.require_columns({pair.col1, pair.col2});
    }

    std::vector<PairLatent> results;
    results.reserve(pairs.size());

    ThreadPool pool(workers_);
    std::vector<std::future<PairLatent>> futures;
    futures.reserve(pairs.size());
    for (const auto& pair : pairs) {
        futures.push_back(pool.submit([this, &data, pair]() { return job_(data, pair); }));
    }
    LOG_INFO("submitted ", pairs.size(), " pair jobs to ", workers_, " workers");

    for (size_t i = 0; i < futures.size(); ++i) {
        try {
            results.push_back(futures[i].get());
        } catch (const std::exception& e) {
            pool.shutdown(false);
            LOG_ERROR("pair job ", pairs[i].col1, "-", pairs[i].col2, " failed: ", e.what());
            throw JobError("pair job " + pairs[i].col1 + "-" + pairs[i].col2 + " failed: " + e.what(),
                           __func__);
        }
        LOG_DEBUG("collected pair ", i + 1, "/", pairs.size());
    }

    futures.clear();
    pool.shutdown();
    return results;
}

} // namespace covec
