#pragma once

#include <vector>
#include <memory>
#include "scry/types.hpp"

namespace scry::engine {

    /**
     * @brief HNSW graph over the local index, used to shortlist candidates
     * before exact cosine scoring. Labels are arena slots.
     */
    class Librarian {
    public:
        Librarian(size_t dim, size_t max_elements);
        ~Librarian();

        /**
         * @brief Adds a vector under the given arena slot. The vector is
         * normalized first so inner product equals cosine similarity.
         */
        void add_item(size_t slot, const EmbeddingVector& vector);

        /**
         * @brief Searches for the approximate nearest neighbors.
         * @param query_vector The query vector.
         * @param k Number of candidates wanted.
         * @return Arena slots, nearest first.
         */
        std::vector<size_t> search(const EmbeddingVector& query_vector, size_t k) const;

        size_t count() const;

    private:
        struct Impl;
        std::unique_ptr<Impl> m_impl;
        size_t m_dim;
    };

}
