#pragma once

#include "covec/dataset.hpp"
#include "covec/factorizer.hpp"
#include "covec/vectorizer.hpp"

#include <cstddef>
#include <functional>
#include <string>
#include <vector>

namespace covec {

constexpr size_t DEFAULT_WORKERS = 4;

struct ColumnPair {
    std::string col1;  // grouping column; one document per value
    std::string col2;  // token column

    bool operator==(const ColumnPair& other) const {
        return col1 == other.col1 && col2 == other.col2;
    }
};

// Every ordered pair of distinct columns, col1-major: n * (n - 1) pairs
std::vector<ColumnPair> enumerate_column_pairs(const std::vector<std::string>& columns);

struct PairPipelineConfig {
    VectorizerConfig vectorizer;
    FactorizerConfig factorizer;
};

struct PairLatent {
    std::string col1;
    std::string col2;
    LatentMatrix latent;  // row i = document of col1 value i
};

/**
 * One pair job: build documents, vectorize, factorize.
 * The document-term matrix and vocabulary are released before returning.
 */
PairLatent compute_pair_latent(const Dataset& data, const ColumnPair& pair,
                               const PairPipelineConfig& config);

/**
 * Runs independent pair jobs on a fixed pool of workers.
 *
 * Results come back in the order the pairs were given. The first job (in that
 * order) that throws aborts the batch: queued jobs are dropped, running jobs
 * finish, and a JobError naming the pair is raised. Nothing is retried.
 */
class PairJobRunner {
public:
    using JobFunction = std::function<PairLatent(const Dataset&, const ColumnPair&)>;

    explicit PairJobRunner(const PairPipelineConfig& config, size_t workers = DEFAULT_WORKERS);
    PairJobRunner(JobFunction job, size_t workers = DEFAULT_WORKERS);

    std::vector<PairLatent> run(const Dataset& data, const std::vector<ColumnPair>& pairs) const;

    size_t workers() const { return workers_; }

private:
    JobFunction job_;
    size_t workers_;
};

} // namespace covec
