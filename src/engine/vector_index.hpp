#pragma once

#include <string>
#include <vector>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <unordered_map>
#include <filesystem>
#include <cstdint>
#include <nlohmann/json.hpp>
#include "config.hpp"
#include "scry/types.hpp"

namespace scry::engine {

    class RemoteIndex;
    class Librarian;

    struct IndexStats {
        size_t total_documents = 0;
        std::string last_indexed;   // ISO-8601, empty if never stored
        uint64_t retrievals = 0;
        double average_score = 0.0; // Mean score of the latest non-empty retrieval
        std::string provider;
        bool initialized = false;
        size_t dimension = 0;
    };

    void to_json(nlohmann::json& j, const IndexStats& stats);

    /**
     * @brief Stores embeddings with metadata and ranks them against a query.
     *
     * Local mode keeps an insertion-ordered arena of IndexEntry and rewrites
     * index.json after every store. Remote mode forwards to a Pinecone-style
     * service and falls back to local if it cannot be reached at initialize().
     */
    class VectorIndex {
    public:
        explicit VectorIndex(const Config& config);
        ~VectorIndex();

        VectorIndex(const VectorIndex&) = delete;
        VectorIndex& operator=(const VectorIndex&) = delete;

        /**
         * @brief Connects to the remote index or loads the local one.
         * Remote failures are logged and downgrade to local.
         * @throws PersistenceError if a local index.json exists but cannot be read.
         */
        void initialize();

        /**
         * @brief Writes one entry per (chunk, embedding) pair.
         * @throws std::invalid_argument if the lists differ in length.
         * @throws DimensionMismatchError if an embedding has the wrong length; nothing is written.
         * @throws PersistenceError / RemoteBackendError from the active backend.
         */
        void store(const std::vector<Chunk>& chunks, const std::vector<EmbeddingVector>& embeddings);

        /**
         * @brief Returns at most top_k entries scoring >= score_threshold,
         * best first, ties in insertion order.
         */
        std::vector<RetrievalResult> retrieve(const EmbeddingVector& query, size_t top_k, double score_threshold);

        /**
         * @brief retrieve() with the configured top_k and score_threshold.
         */
        std::vector<RetrievalResult> retrieve(const EmbeddingVector& query);

        /**
         * @brief Drops every entry (and index.json in local mode).
         */
        void clear();

        IndexStats get_stats() const;

        bool is_remote() const;
        bool initialized() const;

    private:
        void ensure_initialized();
        void load_local();
        void persist_locked();
        void rebuild_librarian_locked();
        std::vector<RetrievalResult> retrieve_local(const EmbeddingVector& query, size_t top_k, double score_threshold) const;
        void record_retrieval(const std::vector<RetrievalResult>& results);

        Config m_config;

        std::shared_ptr<RemoteIndex> m_remote;  // retrieve() holds its own copy; initialize() may replace it

        mutable std::shared_mutex m_mutex;  // Arena, slots, dimension, librarian
        bool m_initialized = false;
        std::vector<IndexEntry> m_entries;
        std::unordered_map<std::string, size_t> m_slots;
        size_t m_dimension = 0;
        std::unique_ptr<Librarian> m_librarian;

        mutable std::mutex m_stats_mutex;
        IndexStats m_stats;
    };

}
