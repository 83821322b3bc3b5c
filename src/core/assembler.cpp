#include "covec/assembler.hpp"
#include "covec/error.hpp"
#include "covec/logging.hpp"

namespace covec {

std::vector<std::string> pair_feature_columns(const std::string& feature,
                                              const std::vector<PairLatent>& latents,
                                              size_t width) {
    std::vector<std::string> columns;
    columns.reserve(latents.size() * width);
    for (const auto& pair : latents) {
        for (size_t j = 0; j < width; ++j) {
            columns.push_back(feature + "-" + pair.col1 + "-" + pair.col2 + "-" + std::to_string(j));
        }
    }
    return columns;
}

std::vector<std::string> indexed_feature_columns(const std::string& feature, size_t width) {
    std::vector<std::string> columns;
    columns.reserve(width);
    for (size_t j = 0; j < width; ++j) {
        columns.push_back(feature + "_" + std::to_string(j));
    }
    return columns;
}

FeatureTable broadcast_pair_latents(const std::string& feature, size_t width,
                                    const std::vector<PairLatent>& latents,
                                    const Dataset& data) {
    FeatureTable table(pair_feature_columns(feature, latents, width), data.rows());
    FeatureMatrix& values = table.values();
    const Eigen::Index w = static_cast<Eigen::Index>(width);

    for (size_t i = 0; i < latents.size(); ++i) {
        const auto& pair = latents[i];
        if (pair.latent.cols() != w) {
            throw InvalidArgumentError("latent matrix for " + pair.col1 + "-" + pair.col2 + " has " +
                                       std::to_string(pair.latent.cols()) + " columns, expected " +
                                       std::to_string(width), __func__);
        }

        const auto& ids = data.column(pair.col1);
        const Eigen::Index offset = static_cast<Eigen::Index>(i) * w;
        for (size_t r = 0; r < ids.size(); ++r) {
            const CategoryValue id = ids[r];
            if (id >= pair.latent.rows()) {
                throw SchemaError("value " + std::to_string(id) + " of column '" + pair.col1 +
                                  "' at row " + std::to_string(r) + " has no latent vector (" +
                                  std::to_string(pair.latent.rows()) + " documents)", __func__,
                                  "fit on data that covers every id of both splits");
            }
            values.block(static_cast<Eigen::Index>(r), offset, 1, w) = pair.latent.row(id);
        }
    }
    return table;
}

FeatureTable broadcast_composite_latent(const std::string& feature,
                                        const LatentMatrix& latent,
                                        const CompositeDocuments& documents,
                                        const CompositeKeyLayout& layout,
                                        const Dataset& data) {
    COVEC_CHECK_ARGUMENT(latent.rows() == static_cast<Eigen::Index>(documents.key_to_id.size()),
                         "latent matrix and composite key map disagree on the document count");

    const size_t width = static_cast<size_t>(latent.cols());
    FeatureTable table(indexed_feature_columns(feature, width), data.rows());
    FeatureMatrix& values = table.values();

    const std::vector<uint64_t> keys = layout.pack_rows(data);
    size_t matched = 0;
    for (size_t r = 0; r < keys.size(); ++r) {
        if (auto id = documents.lookup(keys[r])) {
            values.row(static_cast<Eigen::Index>(r)) = latent.row(static_cast<Eigen::Index>(*id));
            ++matched;
        }
    }
    LOG_DEBUG(feature, ": ", matched, "/", keys.size(), " rows matched a frequent key");
    return table;
}

FeatureTables split_rows(const FeatureTable& all, size_t train_rows) {
    COVEC_CHECK_ARGUMENT(train_rows <= all.rows(), "train split is larger than the table");
    const Eigen::Index head = static_cast<Eigen::Index>(train_rows);
    const Eigen::Index tail = static_cast<Eigen::Index>(all.rows() - train_rows);

    FeatureTables tables;
    tables.train = FeatureTable(all.column_names(), FeatureMatrix(all.values().topRows(head)));
    tables.test = FeatureTable(all.column_names(), FeatureMatrix(all.values().bottomRows(tail)));
    return tables;
}

} // namespace covec
