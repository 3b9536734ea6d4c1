#include "embedding_gateway.hpp"
#include "job_queue.hpp"
#include "scry/errors.hpp"
#include <algorithm>
#include <exception>
#include <iostream>
#include <thread>

namespace scry::engine {

    void to_json(nlohmann::json& j, const EmbeddingStats& stats) {
        j = {
            {"tokens_used", stats.tokens_used},
            {"cost_estimate", stats.cost_estimate},
            {"queries_processed", stats.queries_processed},
            {"fallbacks", stats.fallbacks},
            {"provider", stats.provider},
            {"model", stats.model},
            {"dimension", stats.dimension}
        };
    }

    EmbeddingGateway::EmbeddingGateway(const Config& config)
        : EmbeddingGateway(config, nullptr) {}

    EmbeddingGateway::EmbeddingGateway(const Config& config, std::unique_ptr<Embedder> backend)
        : m_provider(config.provider),
          m_model(config.model),
          m_dimension(config.dimension),
          m_batch_size(std::max<size_t>(1, config.batch_size)),
          m_concurrency(std::max<size_t>(1, config.embed_concurrency)),
          m_fallback_to_mock(config.fallback_to_mock),
          m_price_per_million(config.price_per_million),
          m_model_path(config.local_model_path),
          m_vocab_path(config.local_vocab_path),
          m_mock(create_mock_embedder(config.dimension)) {
        m_stats.provider = to_string(m_provider);
        m_stats.model = m_model;
        m_stats.dimension = m_dimension;

        switch (m_provider) {
            case Config::Provider::MOCK:
                break;
            case Config::Provider::LOCAL:
                m_local = std::move(backend);
                break;
            case Config::Provider::REMOTE:
                if (backend) {
                    m_remote = std::move(backend);
                    break;
                }
                try {
                    m_remote = create_openai_embedder(config.api_key, config.model, config.dimension,
                                                      config.embedding_endpoint, config.request_timeout_ms);
                } catch (const BackendInitError& e) {
                    m_remote_error = e.what();
                    std::cerr << "[EmbeddingGateway] Warning: remote backend unavailable: " << e.what() << "\n";
                }
                break;
        }
    }

    Embedder* EmbeddingGateway::local_backend() {
        std::call_once(m_local_once, [this] {
            if (m_local) return;
            try {
                m_local = create_onnx_embedder(m_model_path, m_vocab_path, m_dimension);
            } catch (const BackendInitError& e) {
                m_local_error = e.what();
                m_local_failed = true;
                std::cerr << "[EmbeddingGateway] Warning: local model unavailable (" << e.what()
                          << "), using mock embeddings for the rest of this process\n";
            }
        });
        return m_local.get();
    }

    bool EmbeddingGateway::degraded() const {
        return m_local_failed;
    }

    Embedding EmbeddingGateway::fall_back(const std::string& text, const std::exception& cause) {
        std::cerr << "[EmbeddingGateway] Warning: " << to_string(m_provider)
                  << " embedding failed, using mock: " << cause.what() << "\n";
        return m_mock->embed(text);
    }

    Embedding EmbeddingGateway::dispatch(const std::string& text) {
        switch (m_provider) {
            case Config::Provider::MOCK:
                return m_mock->embed(text);

            case Config::Provider::LOCAL: {
                Embedder* local = local_backend();
                if (!local) {
                    if (!m_fallback_to_mock) throw BackendInitError(m_local_error);
                    Embedding e = m_mock->embed(text);
                    record(0, true);
                    return e;
                }
                return local->embed(text);
            }

            case Config::Provider::REMOTE: {
                if (!m_remote) {
                    BackendInitError err(m_remote_error);
                    if (!m_fallback_to_mock) throw err;
                    Embedding e = fall_back(text, err);
                    record(0, true);
                    return e;
                }
                try {
                    Embedding e = m_remote->embed(text);
                    normalize(e.vector);
                    return e;
                } catch (const RemoteBackendError& err) {
                    if (!m_fallback_to_mock) throw;
                    Embedding e = fall_back(text, err);
                    record(0, true);
                    return e;
                }
            }
        }
        return m_mock->embed(text);
    }

    EmbeddingVector EmbeddingGateway::embed(const std::string& text) {
        {
            std::lock_guard<std::mutex> lock(m_stats_mutex);
            m_stats.queries_processed++;
        }

        Embedding e = dispatch(text);
        if (e.vector.size() != m_dimension) {
            throw DimensionMismatchError(m_dimension, e.vector.size());
        }
        if (e.tokens > 0) record(e.tokens, false);
        return std::move(e.vector);
    }

    void EmbeddingGateway::record(uint64_t tokens, bool fallback) {
        std::lock_guard<std::mutex> lock(m_stats_mutex);
        if (fallback) m_stats.fallbacks++;
        if (tokens > 0) {
            m_stats.tokens_used += tokens;
            m_stats.cost_estimate = (static_cast<double>(m_stats.tokens_used) / 1000000.0) * m_price_per_million;
        }
    }

    std::vector<EmbeddingVector> EmbeddingGateway::embed_batch(const std::vector<std::string>& texts) {
        std::vector<EmbeddingVector> out(texts.size());
        if (texts.empty()) return out;

        const bool parallel = m_provider == Config::Provider::REMOTE && m_remote && m_concurrency > 1;
        const size_t groups = (texts.size() + m_batch_size - 1) / m_batch_size;

        for (size_t g = 0; g < groups; ++g) {
            size_t begin = g * m_batch_size;
            size_t end = std::min(begin + m_batch_size, texts.size());

            if (parallel) {
                embed_group_parallel(texts, begin, end, out);
            } else {
                for (size_t i = begin; i < end; ++i) out[i] = embed(texts[i]);
            }

            std::cout << "[EmbeddingGateway] Embedded batch " << (g + 1) << "/" << groups << "\n";
        }
        return out;
    }

    void EmbeddingGateway::embed_group_parallel(const std::vector<std::string>& texts, size_t begin, size_t end,
                                                std::vector<EmbeddingVector>& out) {
        JobQueue<size_t> queue;
        for (size_t i = begin; i < end; ++i) queue.push(i);
        queue.stop();

        std::mutex error_mutex;
        std::exception_ptr first_error;

        size_t workers = std::min(m_concurrency, end - begin);
        std::vector<std::thread> threads;
        threads.reserve(workers);
        for (size_t w = 0; w < workers; ++w) {
            threads.emplace_back([&] {
                size_t i;
                while (queue.pop(i)) {
                    try {
                        out[i] = embed(texts[i]);
                    } catch (...) {
                        std::lock_guard<std::mutex> lock(error_mutex);
                        if (!first_error) first_error = std::current_exception();
                    }
                }
            });
        }
        for (auto& t : threads) t.join();

        if (first_error) std::rethrow_exception(first_error);
    }

    EmbeddingStats EmbeddingGateway::get_stats() const {
        std::lock_guard<std::mutex> lock(m_stats_mutex);
        return m_stats;
    }

}
