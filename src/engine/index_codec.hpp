#pragma once

#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "scry/types.hpp"

namespace scry::engine {

    /**
     * @brief In-memory image of index.json.
     */
    struct IndexSnapshot {
        std::vector<IndexEntry> entries; // Insertion order
        std::string last_indexed;
    };

    /**
     * @brief {"index": [[id, {"embedding", "metadata"}], ...], "count", "last_indexed"}
     */
    nlohmann::json encode_index(const std::vector<IndexEntry>& entries, const std::string& last_indexed);

    /**
     * @throws PersistenceError if the document does not follow the schema.
     */
    IndexSnapshot decode_index(const nlohmann::json& j);

    std::string iso_timestamp();

}
