#include "covec/document_builder.hpp"
#include "covec/error.hpp"

#include <algorithm>

namespace covec {

std::string join_tokens(const std::vector<CategoryValue>& tokens) {
    std::string doc;
    // ~4 characters per label-encoded id is typical
    doc.reserve(tokens.size() * 4);
    for (size_t i = 0; i < tokens.size(); ++i) {
        if (i > 0) doc.push_back(' ');
        doc += std::to_string(tokens[i]);
    }
    return doc;
}

std::vector<std::string> build_documents(const CategoricalColumn& col1,
                                         const CategoricalColumn& col2) {
    COVEC_CHECK_SCHEMA(col1.size() == col2.size(), "co-occurrence columns must be row-aligned");
    if (col1.empty()) return {};

    const CategoryValue max_id = *std::max_element(col1.begin(), col1.end());
    const CategoryValue min_id = *std::min_element(col1.begin(), col1.end());
    COVEC_CHECK_SCHEMA(min_id >= 0, "grouping column holds a negative id");

    std::vector<std::vector<CategoryValue>> groups(static_cast<size_t>(max_id) + 1);
    for (size_t row = 0; row < col1.size(); ++row) {
        groups[static_cast<size_t>(col1[row])].push_back(col2[row]);
    }

    std::vector<std::string> documents;
    documents.reserve(groups.size());
    for (auto& group : groups) {
        documents.push_back(join_tokens(group));
        // Release each token list as soon as its document exists
        std::vector<CategoryValue>().swap(group);
    }
    return documents;
}

std::vector<std::string> build_documents(const Dataset& data,
                                         const std::string& col1,
                                         const std::string& col2) {
    return build_documents(data.column(col1), data.column(col2));
}

} // namespace covec
