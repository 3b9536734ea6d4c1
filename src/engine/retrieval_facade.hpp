#pragma once

#include <string>
#include <vector>
#include <mutex>
#include <cstdint>
#include <nlohmann/json.hpp>
#include "config.hpp"
#include "embedding_gateway.hpp"
#include "vector_index.hpp"

namespace scry::engine {

    struct ContextSnippet {
        std::string source;
        std::string relevance;  // Score as a percentage, e.g. "87.3%"
        std::string preview;    // First 200 bytes of the chunk
    };

    struct Decision {
        std::string decision;
        nlohmann::json details = nlohmann::json::object(); // Decider-specific payload, passed through
        std::vector<ContextSnippet> context;
        bool rag_enhanced = false;
        double latency_ms = 0.0;
    };

    /**
     * @brief A decision maker that can be augmented with retrieved context.
     */
    class Decider {
    public:
        virtual ~Decider() = default;
        virtual Decision decide(const std::string& query) = 0;
    };

    struct FacadeStats {
        bool enabled = false;
        uint64_t queries_processed = 0;
        uint64_t successful_retrievals = 0;
        uint64_t failed_retrievals = 0;
        double average_latency_ms = 0.0;
        IndexStats index;
        EmbeddingStats embedding;
    };

    void to_json(nlohmann::json& j, const FacadeStats& stats);

    /**
     * @brief Wraps a Decider and attaches relevant codebase context to its answers.
     *
     * Retrieval problems never reach the caller: they are logged, counted as a
     * failed retrieval, and the base decision is returned unchanged. Errors
     * thrown by the wrapped Decider itself propagate.
     */
    class RetrievalFacade : public Decider {
    public:
        static constexpr size_t kTopK = 5;
        static constexpr double kScoreThreshold = 0.5;
        static constexpr size_t kPreviewBytes = 200;
        static constexpr const char* kContextSuffix = " [Based on analysis of relevant codebase context]";

        /**
         * All three collaborators are borrowed and must outlive the facade.
         */
        RetrievalFacade(Decider& base, EmbeddingGateway& gateway, VectorIndex& index, const Config& config);

        /**
         * @brief Initializes the index if RAG is enabled. On failure RAG is
         * switched off for this facade.
         */
        void initialize();

        Decision decide(const std::string& query) override;

        FacadeStats get_stats() const;

        bool enabled() const;

    private:
        std::vector<RetrievalResult> retrieve_context(const std::string& query);
        void record(bool retrieved, double latency_ms);

        Decider& m_base;
        EmbeddingGateway& m_gateway;
        VectorIndex& m_index;

        mutable std::mutex m_mutex;
        bool m_enabled;
        uint64_t m_queries = 0;
        uint64_t m_successful = 0;
        uint64_t m_failed = 0;
        double m_total_latency_ms = 0.0;
    };

}
