#include "covec/composite_key.hpp"
#include "covec/document_builder.hpp"
#include "covec/error.hpp"
#include "covec/logging.hpp"

#include <algorithm>

namespace covec {

CompositeKeyLayout::CompositeKeyLayout(std::vector<KeyField> fields)
    : fields_(std::move(fields)) {
    COVEC_CHECK_CONFIG(!fields_.empty(), "composite key needs at least one field");

    for (const auto& field : fields_) {
        COVEC_CHECK_CONFIG(!field.column.empty(), "composite key field without a column name");
        COVEC_CHECK_CONFIG(field.width > 0,
                           "composite key field '" + field.column + "' has zero width");
        COVEC_CHECK_CONFIG(field.shift < 64 && field.width <= 64 - field.shift,
                           "composite key field '" + field.column + "' extends past bit 63");
    }

    // Fields sorted by shift must leave each other alone
    std::vector<const KeyField*> by_shift;
    for (const auto& field : fields_) by_shift.push_back(&field);
    std::sort(by_shift.begin(), by_shift.end(),
              [](const KeyField* a, const KeyField* b) { return a->shift < b->shift; });
    for (size_t i = 1; i < by_shift.size(); ++i) {
        const KeyField& lower = *by_shift[i - 1];
        const KeyField& upper = *by_shift[i];
        if (lower.shift + lower.width > upper.shift) {
            throw ConfigurationError("composite key fields '" + lower.column + "' and '" +
                                     upper.column + "' overlap", __func__,
                                     "increase the shift of '" + upper.column + "'");
        }
    }
}

CompositeKeyLayout CompositeKeyLayout::ip_device_os_channel() {
    return CompositeKeyLayout({
        {"ip",      44, 20},
        {"device",  20, 24},
        {"os",      10, 10},
        {"channel",  0, 10},
    });
}

std::vector<std::string> CompositeKeyLayout::column_names() const {
    std::vector<std::string> names;
    names.reserve(fields_.size());
    for (const auto& field : fields_) names.push_back(field.column);
    return names;
}

uint64_t CompositeKeyLayout::pack_field(const KeyField& field, CategoryValue value) const {
    if (value < 0 || static_cast<uint64_t>(value) >= field.capacity()) {
        throw ConfigurationError("value " + std::to_string(value) + " of column '" + field.column +
                                 "' does not fit in " + std::to_string(field.width) + " bits",
                                 __func__, "widen the composite key field to avoid key collisions");
    }
    return static_cast<uint64_t>(value) << field.shift;
}

uint64_t CompositeKeyLayout::pack(const std::vector<CategoryValue>& values) const {
    COVEC_CHECK_ARGUMENT(values.size() == fields_.size(),
                         "expected " + std::to_string(fields_.size()) + " key values");
    uint64_t key = 0;
    for (size_t i = 0; i < fields_.size(); ++i) {
        key |= pack_field(fields_[i], values[i]);
    }
    return key;
}

std::vector<uint64_t> CompositeKeyLayout::pack_rows(const Dataset& data) const {
    std::vector<const CategoricalColumn*> columns;
    columns.reserve(fields_.size());
    for (const auto& field : fields_) {
        columns.push_back(&data.column(field.column));
    }

    std::vector<uint64_t> keys(data.rows(), 0);
    for (size_t f = 0; f < fields_.size(); ++f) {
        const auto& values = *columns[f];
        for (size_t row = 0; row < keys.size(); ++row) {
            keys[row] |= pack_field(fields_[f], values[row]);
        }
    }
    return keys;
}

CompositeDocuments build_composite_documents(const Dataset& data,
                                             const CompositeKeyLayout& layout,
                                             const std::string& target_column,
                                             size_t min_frequency) {
    const auto& target = data.column(target_column);
    const std::vector<uint64_t> keys = layout.pack_rows(data);

    std::unordered_map<uint64_t, size_t> key_to_id;
    std::vector<uint64_t> id_to_key;
    std::vector<std::vector<CategoryValue>> tokens;
    {
        ScopedTimer timer("Group tokens by composite key");
        for (size_t row = 0; row < keys.size(); ++row) {
            auto [it, inserted] = key_to_id.try_emplace(keys[row], id_to_key.size());
            if (inserted) {
                id_to_key.push_back(keys[row]);
                tokens.emplace_back();
            }
            tokens[it->second].push_back(target[row]);
        }
    }

    CompositeDocuments result;
    result.distinct_keys = id_to_key.size();
    {
        ScopedTimer timer("Filter rare composite keys");
        for (size_t id = 0; id < id_to_key.size(); ++id) {
            if (tokens[id].size() < min_frequency) continue;
            result.key_to_id.emplace(id_to_key[id], result.documents.size());
            result.documents.push_back(join_tokens(tokens[id]));
            std::vector<CategoryValue>().swap(tokens[id]);
        }
    }

    LOG_INFO("Number of documents ", result.documents.size(), " (", result.distinct_keys,
             " distinct keys, min frequency ", min_frequency, ")");
    return result;
}

} // namespace covec
