#pragma once

#include <string>
#include "scry/types.hpp"

namespace scry::engine {

    /**
     * @brief dot(a, b) / (|a| |b|), clamped to [-1, 1].
     * @return 0 if either vector has zero norm or the sizes differ.
     */
    double cosine_similarity(const EmbeddingVector& a, const EmbeddingVector& b);

    constexpr size_t kMaxIdLength = 64;

    /**
     * @brief Maps an id onto [A-Za-z0-9_-] with at most @p max_length chars.
     *
     * Characters outside the set become '_'. Longer ids keep a prefix and end
     * in '_' plus eight hex digits of an FNV-1a digest of the original id, so
     * ids that only differ in their tail stay distinct.
     */
    std::string sanitize_id(const std::string& id, size_t max_length = kMaxIdLength);

}
