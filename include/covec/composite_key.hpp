#pragma once

#include "covec/dataset.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace covec {

/**
 * One categorical column placed in bits [shift, shift + width) of a packed key.
 */
struct KeyField {
    std::string column;
    unsigned shift = 0;
    unsigned width = 0;

    uint64_t capacity() const { return width >= 64 ? UINT64_MAX : (uint64_t{1} << width); }
};

/**
 * Bit layout of a composite grouping key.
 *
 * Fields must fit in 64 bits and must not overlap; the constructor throws
 * ConfigurationError otherwise. Packing checks each value against its field
 * width, so two distinct tuples can never share a key.
 */
class CompositeKeyLayout {
public:
    explicit CompositeKeyLayout(std::vector<KeyField> fields);

    // ip << 44 | device << 20 | os << 10 | channel
    static CompositeKeyLayout ip_device_os_channel();

    // values[i] goes into fields()[i]; throws ConfigurationError on overflow
    uint64_t pack(const std::vector<CategoryValue>& values) const;

    // Packed key of every row of `data`
    std::vector<uint64_t> pack_rows(const Dataset& data) const;

    const std::vector<KeyField>& fields() const { return fields_; }
    std::vector<std::string> column_names() const;

private:
    uint64_t pack_field(const KeyField& field, CategoryValue value) const;

    std::vector<KeyField> fields_;
};

/**
 * Documents grouped by composite key, after the minimum-frequency filter.
 * documents[id] belongs to the key mapped to id in key_to_id.
 */
struct CompositeDocuments {
    std::vector<std::string> documents;
    std::unordered_map<uint64_t, size_t> key_to_id;
    size_t distinct_keys = 0;  // before filtering

    std::optional<size_t> lookup(uint64_t key) const {
        auto it = key_to_id.find(key);
        if (it == key_to_id.end()) return std::nullopt;
        return it->second;
    }
};

/**
 * Group the target column by packed key.
 *
 * Keys get dense ids in first-seen row order. Keys contributing fewer than
 * min_frequency tokens are dropped and the survivors renumbered 0..n-1,
 * keeping their relative order.
 */
CompositeDocuments build_composite_documents(const Dataset& data,
                                             const CompositeKeyLayout& layout,
                                             const std::string& target_column,
                                             size_t min_frequency = 3);

} // namespace covec
