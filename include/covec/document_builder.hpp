#pragma once

#include "covec/dataset.hpp"

#include <string>
#include <vector>

namespace covec {

/**
 * Co-occurrence documents for a column pair.
 *
 * Document i holds every col2 value seen on rows where col1 == i, in row order,
 * joined by single spaces. There is one document per id in [0, max(col1)], so
 * ids that never occur produce an empty string.
 *
 * Throws SchemaError if the columns differ in length or col1 holds a negative id.
 */
std::vector<std::string> build_documents(const CategoricalColumn& col1,
                                         const CategoricalColumn& col2);

// Same as above, columns looked up by name
std::vector<std::string> build_documents(const Dataset& data,
                                         const std::string& col1,
                                         const std::string& col2);

// Space-joined decimal tokens
std::string join_tokens(const std::vector<CategoryValue>& tokens);

} // namespace covec
