#include "vector_index.hpp"
#include "remote_index.hpp"
#include "librarian.hpp"
#include "index_codec.hpp"
#include "similarity.hpp"
#include "scry/errors.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <fstream>
#include <iostream>
#include <limits>
#include <stdexcept>

using json = nlohmann::json;

namespace scry::engine {

    void to_json(json& j, const IndexStats& stats) {
        j = {
            {"total_documents", stats.total_documents},
            {"last_indexed", stats.last_indexed.empty() ? json(nullptr) : json(stats.last_indexed)},
            {"retrievals", stats.retrievals},
            {"average_score", stats.average_score},
            {"provider", stats.provider},
            {"initialized", stats.initialized},
            {"dimension", stats.dimension}
        };
    }

    VectorIndex::VectorIndex(const Config& config) : m_config(config) {
        m_stats.provider = to_string(Config::StoreProvider::LOCAL_FILE);
    }

    VectorIndex::~VectorIndex() = default;

    bool VectorIndex::is_remote() const {
        std::shared_lock<std::shared_mutex> lock(m_mutex);
        return m_remote != nullptr;
    }

    bool VectorIndex::initialized() const {
        std::shared_lock<std::shared_mutex> lock(m_mutex);
        return m_initialized;
    }

    void VectorIndex::initialize() {
        std::unique_lock<std::shared_mutex> lock(m_mutex);
        std::cout << "[VectorIndex] Initializing (" << to_string(m_config.rag_provider) << ")...\n";

        m_remote.reset();
        if (m_config.rag_provider == Config::StoreProvider::REMOTE_CLOUD) {
            try {
                auto remote = std::make_shared<RemoteIndex>(m_config.vector_api_key, m_config.index_host,
                                                            m_config.index_name, m_config.request_timeout_ms);
                auto description = remote->describe();
                m_remote = std::move(remote);
                m_dimension = description.dimension;
                {
                    std::lock_guard<std::mutex> stats_lock(m_stats_mutex);
                    m_stats.total_documents = description.total_vectors;
                    m_stats.provider = to_string(Config::StoreProvider::REMOTE_CLOUD);
                }
                std::cout << "[VectorIndex] Connected to remote index \"" << m_config.index_name << "\" ("
                          << description.total_vectors << " vectors)\n";
            } catch (const BackendInitError& e) {
                std::cerr << "[VectorIndex] Warning: remote index unavailable, falling back to local storage: " << e.what() << "\n";
            } catch (const RemoteBackendError& e) {
                std::cerr << "[VectorIndex] Warning: remote index unavailable, falling back to local storage: " << e.what() << "\n";
            }
        }

        if (!m_remote) load_local();
        m_initialized = true;
    }

    void VectorIndex::ensure_initialized() {
        {
            std::shared_lock<std::shared_mutex> lock(m_mutex);
            if (m_initialized) return;
        }
        initialize();
    }

    void VectorIndex::load_local() {
        std::error_code ec;
        std::filesystem::create_directories(m_config.index_dir, ec);
        if (ec) {
            throw PersistenceError("cannot create index directory " + m_config.index_dir.string() + ": " + ec.message());
        }

        m_entries.clear();
        m_slots.clear();
        m_dimension = 0;

        std::string last_indexed;
        auto index_file = m_config.index_file();
        if (std::filesystem::exists(index_file)) {
            std::ifstream f(index_file);
            if (!f.is_open()) throw PersistenceError("cannot open " + index_file.string());

            json j;
            try {
                j = json::parse(f);
            } catch (const json::parse_error& e) {
                throw PersistenceError("corrupt " + index_file.string() + ": " + e.what());
            }

            IndexSnapshot snapshot = decode_index(j);
            for (auto& entry : snapshot.entries) {
                if (m_dimension == 0) m_dimension = entry.embedding.size();
                if (entry.embedding.size() != m_dimension) {
                    throw PersistenceError("mixed dimensions in " + index_file.string() + ": entry " + entry.id);
                }
                auto it = m_slots.find(entry.id);
                if (it != m_slots.end()) {
                    m_entries[it->second] = std::move(entry);
                } else {
                    m_slots.emplace(entry.id, m_entries.size());
                    m_entries.push_back(std::move(entry));
                }
            }
            last_indexed = snapshot.last_indexed;
        }
        rebuild_librarian_locked();

        {
            std::lock_guard<std::mutex> stats_lock(m_stats_mutex);
            m_stats.total_documents = m_entries.size();
            m_stats.last_indexed = last_indexed;
            m_stats.provider = to_string(Config::StoreProvider::LOCAL_FILE);
        }
        std::cout << "[VectorIndex] Using local index at " << m_config.index_dir << " ("
                  << m_entries.size() << " entries)\n";
    }

    void VectorIndex::persist_locked() {
        std::string last_indexed;
        {
            std::lock_guard<std::mutex> stats_lock(m_stats_mutex);
            last_indexed = m_stats.last_indexed;
        }

        auto index_file = m_config.index_file();
        auto tmp_file = index_file;
        tmp_file += ".tmp";
        {
            std::ofstream f(tmp_file, std::ios::trunc);
            if (!f.is_open()) throw PersistenceError("cannot write " + tmp_file.string());
            f << encode_index(m_entries, last_indexed).dump(2, ' ', false, json::error_handler_t::replace);
            f.flush();
            if (!f) throw PersistenceError("write failed for " + tmp_file.string());
        }

        std::error_code ec;
        std::filesystem::rename(tmp_file, index_file, ec);
        if (ec) throw PersistenceError("cannot replace " + index_file.string() + ": " + ec.message());
    }

    void VectorIndex::rebuild_librarian_locked() {
        m_librarian.reset();
        if (m_config.ann_min_entries == 0 || m_entries.size() < m_config.ann_min_entries || m_dimension == 0) return;

        auto librarian = std::make_unique<Librarian>(m_dimension, m_entries.size());
        for (size_t slot = 0; slot < m_entries.size(); ++slot) {
            librarian->add_item(slot, m_entries[slot].embedding);
        }
        m_librarian = std::move(librarian);
        std::cout << "[Librarian] HNSW graph ready with " << m_librarian->count() << " items\n";
    }

    void VectorIndex::store(const std::vector<Chunk>& chunks, const std::vector<EmbeddingVector>& embeddings) {
        if (chunks.size() != embeddings.size()) {
            throw std::invalid_argument("store: " + std::to_string(chunks.size()) + " chunks but " +
                                        std::to_string(embeddings.size()) + " embeddings");
        }
        ensure_initialized();

        std::unique_lock<std::shared_mutex> lock(m_mutex);
        std::cout << "[VectorIndex] Storing " << chunks.size() << " embeddings...\n";

        size_t dimension = m_dimension;
        for (const auto& e : embeddings) {
            if (dimension == 0) dimension = e.size();
            if (e.size() != dimension || e.empty()) throw DimensionMismatchError(dimension, e.size());
        }

        std::vector<IndexEntry> entries;
        entries.reserve(chunks.size());
        for (size_t i = 0; i < chunks.size(); ++i) {
            IndexEntry entry;
            entry.id = sanitize_id(chunks[i].id);
            entry.embedding = embeddings[i];
            entry.metadata.source = chunks[i].source;
            entry.metadata.type = chunks[i].type;
            entry.metadata.chunk_index = chunks[i].chunk_index;
            entry.metadata.content = chunks[i].content;
            entries.push_back(std::move(entry));
        }

        std::string now = iso_timestamp();
        size_t total;
        if (m_remote) {
            m_remote->upsert(entries);
            m_dimension = dimension;
            total = entries.size();
        } else {
            for (auto& entry : entries) {
                auto it = m_slots.find(entry.id);
                if (it != m_slots.end()) {
                    m_entries[it->second] = std::move(entry);
                } else {
                    m_slots.emplace(entry.id, m_entries.size());
                    m_entries.push_back(std::move(entry));
                }
            }
            m_dimension = dimension;
            {
                std::lock_guard<std::mutex> stats_lock(m_stats_mutex);
                m_stats.last_indexed = now;
            }
            persist_locked();
            rebuild_librarian_locked();
            total = m_entries.size();
        }

        std::lock_guard<std::mutex> stats_lock(m_stats_mutex);
        m_stats.total_documents = total;
        m_stats.last_indexed = now;
        std::cout << "[VectorIndex] Stored successfully (" << total << " entries)\n";
    }

    std::vector<RetrievalResult> VectorIndex::retrieve(const EmbeddingVector& query) {
        return retrieve(query, m_config.top_k, m_config.score_threshold);
    }

    std::vector<RetrievalResult> VectorIndex::retrieve(const EmbeddingVector& query, size_t top_k, double score_threshold) {
        ensure_initialized();

        std::shared_ptr<RemoteIndex> remote;
        size_t dimension;
        {
            std::shared_lock<std::shared_mutex> lock(m_mutex);
            remote = m_remote;
            dimension = m_dimension;
        }

        std::vector<RetrievalResult> results;
        if (remote) {
            if (dimension != 0 && query.size() != dimension) throw DimensionMismatchError(dimension, query.size());
            if (top_k > 0) {
                for (auto& r : remote->query(query, top_k)) {
                    if (r.score >= score_threshold) results.push_back(std::move(r));
                }
                std::stable_sort(results.begin(), results.end(),
                    [](const RetrievalResult& a, const RetrievalResult& b) { return a.score > b.score; });
                if (results.size() > top_k) results.resize(top_k);
            }
        } else {
            results = retrieve_local(query, top_k, score_threshold);
        }

        record_retrieval(results);
        return results;
    }

    std::vector<RetrievalResult> VectorIndex::retrieve_local(const EmbeddingVector& query, size_t top_k, double score_threshold) const {
        std::shared_lock<std::shared_mutex> lock(m_mutex);

        std::vector<RetrievalResult> results;
        if (m_entries.empty() || top_k == 0) return results;
        if (query.size() != m_dimension) throw DimensionMismatchError(m_dimension, query.size());

        // Best first; equal scores keep insertion order.
        auto better = [](const std::pair<double, size_t>& a, const std::pair<double, size_t>& b) {
            if (a.first != b.first) return a.first > b.first;
            return a.second < b.second;
        };
        auto keep_best = [&](std::vector<std::pair<double, size_t>>& scored) {
            if (scored.size() > top_k) {
                std::partial_sort(scored.begin(), scored.begin() + top_k, scored.end(), better);
                scored.resize(top_k);
            } else {
                std::sort(scored.begin(), scored.end(), better);
            }
        };

        std::vector<std::pair<double, size_t>> scored;
        bool exact = true;
        if (m_librarian) {
            auto candidates = m_librarian->search(query, std::max<size_t>(top_k * 4, 64));
            double lowest = std::numeric_limits<double>::infinity();
            for (size_t slot : candidates) {
                double score = cosine_similarity(query, m_entries[slot].embedding);
                lowest = std::min(lowest, score);
                if (score >= score_threshold) scored.emplace_back(score, slot);
            }
            keep_best(scored);

            // A short list, or a k-th score tied with the weakest candidate,
            // may hide better or earlier entries outside the shortlist.
            exact = candidates.size() < m_entries.size() &&
                    (scored.size() < top_k || scored.back().first <= lowest);
            if (exact) scored.clear();
        }

        if (exact) {
            for (size_t slot = 0; slot < m_entries.size(); ++slot) {
                double score = cosine_similarity(query, m_entries[slot].embedding);
                if (score >= score_threshold) scored.emplace_back(score, slot);
            }
            keep_best(scored);
        }

        results.reserve(scored.size());
        for (const auto& [score, slot] : scored) {
            const auto& entry = m_entries[slot];
            RetrievalResult r;
            r.id = entry.id;
            r.source = entry.metadata.source;
            r.content = entry.metadata.content;
            r.type = entry.metadata.type;
            r.score = score;
            r.chunk_index = entry.metadata.chunk_index;
            results.push_back(std::move(r));
        }
        return results;
    }

    void VectorIndex::record_retrieval(const std::vector<RetrievalResult>& results) {
        std::lock_guard<std::mutex> lock(m_stats_mutex);
        m_stats.retrievals++;
        if (!results.empty()) {
            double sum = 0.0;
            for (const auto& r : results) sum += r.score;
            m_stats.average_score = sum / results.size();
        }
    }

    void VectorIndex::clear() {
        ensure_initialized();

        std::unique_lock<std::shared_mutex> lock(m_mutex);
        if (m_remote) {
            m_remote->delete_all();
        } else {
            m_entries.clear();
            m_slots.clear();
            m_librarian.reset();

            std::error_code ec;
            std::filesystem::remove(m_config.index_file(), ec);
            if (ec) throw PersistenceError("cannot remove " + m_config.index_file().string() + ": " + ec.message());
        }
        m_dimension = 0;

        std::lock_guard<std::mutex> stats_lock(m_stats_mutex);
        m_stats.total_documents = 0;
        std::cout << "[VectorIndex] Index cleared\n";
    }

    IndexStats VectorIndex::get_stats() const {
        IndexStats stats;
        {
            std::lock_guard<std::mutex> lock(m_stats_mutex);
            stats = m_stats;
        }
        std::shared_lock<std::shared_mutex> lock(m_mutex);
        stats.initialized = m_initialized;
        stats.dimension = m_dimension;
        return stats;
    }

}
