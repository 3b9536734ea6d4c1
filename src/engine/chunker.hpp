#pragma once

#include <vector>
#include "scry/types.hpp"

namespace scry::engine {

    class Chunker {
    public:
        /**
         * @throws ConfigError unless 0 <= overlap < chunk_size.
         */
        Chunker(size_t chunk_size = 500, size_t overlap = 50);

        /**
         * @brief Splits one document into overlapping line windows.
         *
         * Each full window holds chunk_size lines; the next window starts with
         * the last `overlap` lines of the previous one. Whatever is left in the
         * buffer at end of document is emitted as a final chunk, even when it
         * holds only overlap lines. An empty document yields one empty chunk.
         */
        std::vector<Chunk> chunk_document(const Document& doc) const;

        std::vector<Chunk> chunk_documents(const std::vector<Document>& documents) const;

        size_t chunk_size() const { return m_chunk_size; }
        size_t overlap() const { return m_overlap; }

    private:
        size_t m_chunk_size;
        size_t m_overlap;
    };

}
