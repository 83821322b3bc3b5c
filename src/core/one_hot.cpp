#include "covec/one_hot.hpp"
#include "covec/error.hpp"

#include <algorithm>
#include <unordered_map>

namespace covec {

CountMatrix one_hot_encode(const Dataset& data, const std::vector<std::string>& columns) {
    COVEC_CHECK_ARGUMENT(!columns.empty(), "one-hot encoding needs at least one column");
    data.require_columns(columns);

    std::vector<Eigen::Triplet<int32_t>> triplets;
    triplets.reserve(data.rows() * columns.size());

    int32_t offset = 0;
    for (const auto& name : columns) {
        const auto& values = data.column(name);

        std::vector<CategoryValue> categories(values.begin(), values.end());
        std::sort(categories.begin(), categories.end());
        categories.erase(std::unique(categories.begin(), categories.end()), categories.end());

        std::unordered_map<CategoryValue, int32_t> index;
        index.reserve(categories.size());
        for (size_t i = 0; i < categories.size(); ++i) {
            index.emplace(categories[i], offset + static_cast<int32_t>(i));
        }

        for (size_t row = 0; row < values.size(); ++row) {
            triplets.emplace_back(static_cast<int>(row), index.at(values[row]), 1);
        }
        offset += static_cast<int32_t>(categories.size());
    }

    CountMatrix encoded(static_cast<Eigen::Index>(data.rows()), offset);
    encoded.setFromTriplets(triplets.begin(), triplets.end());
    encoded.makeCompressed();
    return encoded;
}

} // namespace covec
