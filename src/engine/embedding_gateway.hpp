#pragma once

#include <string>
#include <vector>
#include <memory>
#include <mutex>
#include <atomic>
#include <cstdint>
#include <nlohmann/json.hpp>
#include "config.hpp"
#include "embedder.hpp"
#include "scry/types.hpp"

namespace scry::engine {

    struct EmbeddingStats {
        uint64_t tokens_used = 0;
        double cost_estimate = 0.0;
        uint64_t queries_processed = 0;
        uint64_t fallbacks = 0;     // Calls answered by the mock after a backend failure
        std::string provider;
        std::string model;
        size_t dimension = 0;
    };

    void to_json(nlohmann::json& j, const EmbeddingStats& stats);

    /**
     * @brief Front door for embeddings. Dispatches to the configured backend
     * and owns fallback and usage accounting.
     *
     * Mock is always available. Local is created on first use, exactly once;
     * if that fails the gateway answers from the mock for the rest of its
     * life. Remote failures fall back to the mock per call when
     * fallback_to_mock is set, and propagate otherwise.
     */
    class EmbeddingGateway {
    public:
        explicit EmbeddingGateway(const Config& config);

        /**
         * @brief Uses @p backend in place of the one the config would create
         * for its provider (LOCAL or REMOTE).
         */
        EmbeddingGateway(const Config& config, std::unique_ptr<Embedder> backend);

        EmbeddingGateway(const EmbeddingGateway&) = delete;
        EmbeddingGateway& operator=(const EmbeddingGateway&) = delete;

        /**
         * @brief Embeds one text.
         * @throws RemoteBackendError / BackendInitError when fallback is disabled.
         * @throws DimensionMismatchError if a backend returns a vector of the wrong length.
         */
        EmbeddingVector embed(const std::string& text);

        /**
         * @brief Embeds texts in groups of batch_size, one group after the other.
         * Result i belongs to texts[i].
         */
        std::vector<EmbeddingVector> embed_batch(const std::vector<std::string>& texts);

        EmbeddingStats get_stats() const;

        Config::Provider provider() const { return m_provider; }
        size_t dimension() const { return m_dimension; }
        const std::string& model() const { return m_model; }

        /**
         * @brief True once the local backend failed to initialize.
         */
        bool degraded() const;

    private:
        Embedding dispatch(const std::string& text);
        Embedding fall_back(const std::string& text, const std::exception& cause);
        Embedder* local_backend();
        void embed_group_parallel(const std::vector<std::string>& texts, size_t begin, size_t end,
                                  std::vector<EmbeddingVector>& out);
        void record(uint64_t tokens, bool fallback);

        Config::Provider m_provider;
        std::string m_model;
        size_t m_dimension;
        size_t m_batch_size;
        size_t m_concurrency;
        bool m_fallback_to_mock;
        double m_price_per_million;
        std::string m_model_path;
        std::string m_vocab_path;

        std::unique_ptr<Embedder> m_mock;
        std::unique_ptr<Embedder> m_remote;
        std::string m_remote_error;

        std::once_flag m_local_once;
        std::unique_ptr<Embedder> m_local;
        std::string m_local_error;
        std::atomic<bool> m_local_failed{false};

        mutable std::mutex m_stats_mutex;
        EmbeddingStats m_stats;
    };

}
