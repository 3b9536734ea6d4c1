#include "remote_index.hpp"
#include "http.hpp"
#include "text.hpp"
#include "scry/errors.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <iostream>

using json = nlohmann::json;

namespace scry::engine {

    RemoteIndex::RemoteIndex(const std::string& api_key, const std::string& host,
                             const std::string& index_name, long timeout_ms)
        : m_api_key(api_key), m_index_name(index_name), m_timeout_ms(timeout_ms) {
        if (m_api_key.empty()) throw BackendInitError("no API key configured for the remote index");
        if (host.empty()) throw BackendInitError("no host configured for remote index \"" + index_name + "\"");

        m_base_url = host;
        if (m_base_url.find("://") == std::string::npos) m_base_url = "https://" + m_base_url;
        while (!m_base_url.empty() && m_base_url.back() == '/') m_base_url.pop_back();
    }

    std::string RemoteIndex::call(const std::string& path, const std::string& body) {
        auto response = http::post_json(m_base_url + path, body,
                                        {"Api-Key: " + m_api_key, "X-Pinecone-API-Version: 2024-07"},
                                        m_timeout_ms);
        if (!response.ok()) {
            std::string detail = response.body.empty() ? "" : ": " + text::utf8_truncate(response.body, 200);
            throw RemoteBackendError(path + " returned HTTP " + std::to_string(response.status) + detail, response.status);
        }
        return response.body;
    }

    RemoteIndex::Description RemoteIndex::describe() {
        std::string body = call("/describe_index_stats", "{}");
        try {
            json j = json::parse(body);
            Description d;
            d.total_vectors = j.value("totalVectorCount", size_t{0});
            if (j.contains("totalRecordCount")) d.total_vectors = j["totalRecordCount"].get<size_t>();
            d.dimension = j.value("dimension", size_t{0});
            return d;
        } catch (const json::exception& e) {
            throw RemoteBackendError(std::string("malformed index stats: ") + e.what());
        }
    }

    void RemoteIndex::upsert(const std::vector<IndexEntry>& entries) {
        size_t batches = (entries.size() + kUpsertBatch - 1) / kUpsertBatch;
        for (size_t b = 0; b < batches; ++b) {
            json vectors = json::array();
            size_t end = std::min((b + 1) * kUpsertBatch, entries.size());
            for (size_t i = b * kUpsertBatch; i < end; ++i) {
                const auto& e = entries[i];
                vectors.push_back({
                    {"id", e.id},
                    {"values", e.embedding},
                    {"metadata", {
                        {"source", e.metadata.source},
                        {"type", e.metadata.type},
                        {"chunk_index", e.metadata.chunk_index},
                        {"content", text::utf8_truncate(e.metadata.content, kPreviewBytes)}
                    }}
                });
            }
            json body = {{"vectors", std::move(vectors)}};
            call("/vectors/upsert", body.dump(-1, ' ', false, json::error_handler_t::replace));
            std::cout << "[RemoteIndex] Upserted batch " << (b + 1) << "/" << batches << "\n";
        }
    }

    std::vector<RetrievalResult> RemoteIndex::query(const EmbeddingVector& vector, size_t top_k) {
        json body = {
            {"vector", vector},
            {"topK", top_k},
            {"includeMetadata", true}
        };
        std::string reply = call("/query", body.dump());

        std::vector<RetrievalResult> results;
        try {
            json j = json::parse(reply);
            for (const auto& m : j.value("matches", json::array())) {
                RetrievalResult r;
                r.id = m.value("id", "");
                r.score = m.value("score", 0.0);
                if (m.contains("metadata")) {
                    const auto& meta = m["metadata"];
                    r.source = meta.value("source", "");
                    r.type = meta.value("type", "");
                    r.content = meta.value("content", "");
                    r.chunk_index = static_cast<size_t>(meta.value("chunk_index", 0.0));
                }
                results.push_back(std::move(r));
            }
        } catch (const json::exception& e) {
            throw RemoteBackendError(std::string("malformed query response: ") + e.what());
        }
        return results;
    }

    void RemoteIndex::delete_all() {
        call("/vectors/delete", json({{"deleteAll", true}}).dump());
    }

}
