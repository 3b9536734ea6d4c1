#include "retrieval_facade.hpp"
#include "text.hpp"
#include <chrono>
#include <cstdio>
#include <iostream>

using json = nlohmann::json;

namespace scry::engine {

    namespace {
        std::string format_relevance(double score) {
            char buf[32];
            std::snprintf(buf, sizeof(buf), "%.1f%%", score * 100.0);
            return buf;
        }
    }

    void to_json(json& j, const FacadeStats& stats) {
        j = {
            {"enabled", stats.enabled},
            {"queries_processed", stats.queries_processed},
            {"successful_retrievals", stats.successful_retrievals},
            {"failed_retrievals", stats.failed_retrievals},
            {"average_latency_ms", stats.average_latency_ms},
            {"vector_store_stats", stats.index},
            {"embedder_stats", stats.embedding}
        };
    }

    RetrievalFacade::RetrievalFacade(Decider& base, EmbeddingGateway& gateway, VectorIndex& index, const Config& config)
        : m_base(base), m_gateway(gateway), m_index(index), m_enabled(config.rag_enabled) {}

    bool RetrievalFacade::enabled() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_enabled;
    }

    void RetrievalFacade::initialize() {
        if (!enabled()) {
            std::cout << "[RetrievalFacade] RAG disabled by configuration\n";
            return;
        }
        try {
            m_index.initialize();
            std::cout << "[RetrievalFacade] RAG initialized\n";
        } catch (const std::exception& e) {
            std::cerr << "[RetrievalFacade] Warning: RAG initialization failed, continuing without context: "
                      << e.what() << "\n";
            std::lock_guard<std::mutex> lock(m_mutex);
            m_enabled = false;
        }
    }

    std::vector<RetrievalResult> RetrievalFacade::retrieve_context(const std::string& query) {
        EmbeddingVector embedding = m_gateway.embed(query);
        return m_index.retrieve(embedding, kTopK, kScoreThreshold);
    }

    Decision RetrievalFacade::decide(const std::string& query) {
        auto start = std::chrono::steady_clock::now();

        Decision decision = m_base.decide(query);
        const bool rag = enabled();

        bool retrieved = false;
        if (rag) {
            try {
                auto results = retrieve_context(query);
                if (!results.empty()) {
                    decision.context.clear();
                    for (const auto& r : results) {
                        decision.context.push_back({r.source, format_relevance(r.score),
                                                    text::utf8_truncate(r.content, kPreviewBytes)});
                    }
                    decision.decision += kContextSuffix;
                    retrieved = true;
                }
            } catch (const std::exception& e) {
                std::cerr << "[RetrievalFacade] Warning: context retrieval failed: " << e.what() << "\n";
            }
        }

        decision.rag_enhanced = rag;
        decision.latency_ms = std::chrono::duration<double, std::milli>(
            std::chrono::steady_clock::now() - start).count();
        record(retrieved, decision.latency_ms);
        return decision;
    }

    void RetrievalFacade::record(bool retrieved, double latency_ms) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_queries++;
        if (retrieved) m_successful++;
        else m_failed++;
        m_total_latency_ms += latency_ms;
    }

    FacadeStats RetrievalFacade::get_stats() const {
        FacadeStats stats;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            stats.enabled = m_enabled;
            stats.queries_processed = m_queries;
            stats.successful_retrievals = m_successful;
            stats.failed_retrievals = m_failed;
            stats.average_latency_ms = m_queries > 0 ? m_total_latency_ms / m_queries : 0.0;
        }
        stats.index = m_index.get_stats();
        stats.embedding = m_gateway.get_stats();
        return stats;
    }

}
