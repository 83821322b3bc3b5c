#pragma once

#include "covec/dataset.hpp"
#include "covec/vectorizer.hpp"

#include <string>
#include <vector>

namespace covec {

/**
 * One-hot encoding of several categorical columns.
 *
 * Each column contributes one indicator per distinct value present in `data`,
 * in ascending value order; column blocks follow the order of `columns`.
 * Every row therefore has exactly columns.size() ones.
 */
CountMatrix one_hot_encode(const Dataset& data, const std::vector<std::string>& columns);

} // namespace covec
