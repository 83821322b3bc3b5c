#pragma once

/**
 * Broadcast of per-document latent vectors onto row-level records.
 */

#include "covec/composite_key.hpp"
#include "covec/dataset.hpp"
#include "covec/factorizer.hpp"
#include "covec/feature_table.hpp"
#include "covec/pair_job_runner.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace covec {

// "{feature}-{col1}-{col2}-{j}" for every pair, j in [0, width)
std::vector<std::string> pair_feature_columns(const std::string& feature,
                                              const std::vector<PairLatent>& latents,
                                              size_t width);

// "{feature}_{j}" for j in [0, width)
std::vector<std::string> indexed_feature_columns(const std::string& feature, size_t width);

/**
 * Pairwise broadcast. Pair i fills columns [i * width, (i + 1) * width) of row
 * r with latents[i].latent.row(data[r][col1]).
 *
 * Throws SchemaError when a col1 value has no latent row, and
 * InvalidArgumentError when a latent matrix is not `width` wide.
 */
FeatureTable broadcast_pair_latents(const std::string& feature, size_t width,
                                    const std::vector<PairLatent>& latents,
                                    const Dataset& data);

/**
 * Composite-key broadcast. Rows whose packed key survived the frequency
 * filter get that key's latent row; all other rows stay zero.
 */
FeatureTable broadcast_composite_latent(const std::string& feature,
                                        const LatentMatrix& latent,
                                        const CompositeDocuments& documents,
                                        const CompositeKeyLayout& layout,
                                        const Dataset& data);

/**
 * Split a table fitted on concat(train, test) back into the two parts.
 */
FeatureTables split_rows(const FeatureTable& all, size_t train_rows);

} // namespace covec
