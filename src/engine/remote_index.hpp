#pragma once

#include <string>
#include <vector>
#include "scry/types.hpp"

namespace scry::engine {

    /**
     * @brief Client for a Pinecone-style REST vector index.
     * Every call throws RemoteBackendError on transport, status or payload errors.
     */
    class RemoteIndex {
    public:
        struct Description {
            size_t total_vectors = 0;
            size_t dimension = 0;
        };

        static constexpr size_t kUpsertBatch = 100;
        static constexpr size_t kPreviewBytes = 1000;

        /**
         * @throws BackendInitError if the key or host is missing.
         */
        RemoteIndex(const std::string& api_key, const std::string& host,
                    const std::string& index_name, long timeout_ms);

        Description describe();

        /**
         * @brief Upserts entries in batches of kUpsertBatch. Content is cut to a
         * kPreviewBytes preview to stay under metadata limits.
         */
        void upsert(const std::vector<IndexEntry>& entries);

        std::vector<RetrievalResult> query(const EmbeddingVector& vector, size_t top_k);

        void delete_all();

        const std::string& index_name() const { return m_index_name; }

    private:
        std::string call(const std::string& path, const std::string& body);

        std::string m_api_key;
        std::string m_base_url;
        std::string m_index_name;
        long m_timeout_ms;
    };

}
