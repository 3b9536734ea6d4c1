#include "pipeline.hpp"
#include "scanner.hpp"
#include "chunker.hpp"
#include "manifest.hpp"
#include "index_codec.hpp"
#include <nlohmann/json.hpp>
#include <cmath>
#include <iostream>

using json = nlohmann::json;

namespace scry::engine {

    Manifest build_manifest(const Config& config, const std::vector<Document>& documents,
                            const std::vector<Chunk>& chunks, const EmbeddingStats& embedding_stats,
                            const IndexStats& index_stats) {
        Manifest m;
        m.timestamp = iso_timestamp();

        std::error_code ec;
        auto root = std::filesystem::absolute(config.root_dir, ec);
        m.root_directory = (ec ? config.root_dir : root.lexically_normal()).generic_string();

        auto& s = m.statistics;
        s.documents_loaded = documents.size();
        s.chunks_created = chunks.size();
        if (!chunks.empty()) {
            size_t total = 0;
            for (const auto& c : chunks) total += c.content.size();
            s.average_chunk_size = static_cast<size_t>(
                std::llround(static_cast<double>(total) / static_cast<double>(chunks.size())));
            s.vector_dimension = embedding_stats.dimension;
        }
        s.embedding_model = embedding_stats.model;
        s.embedding_provider = embedding_stats.provider;
        s.vector_store_provider = index_stats.provider;
        s.tokens_used = embedding_stats.tokens_used;
        s.estimated_cost = embedding_stats.cost_estimate;

        for (const auto& doc : documents) m.file_breakdown[doc.type]++;
        m.index_ready = !chunks.empty();
        return m;
    }

    IndexingPipeline::IndexingPipeline(const Config& config, EmbeddingGateway& gateway, VectorIndex& index)
        : m_config(config), m_gateway(gateway), m_index(index) {}

    PipelineReport IndexingPipeline::run(bool clear_first) {
        std::cout << "[Pipeline] Indexing " << m_config.root_dir << "\n";
        Scanner scanner(m_config);
        return index_documents(scanner.load_codebase(), clear_first);
    }

    PipelineReport IndexingPipeline::run_files(const std::vector<std::filesystem::path>& relative_paths) {
        std::cout << "[Pipeline] Re-indexing " << relative_paths.size() << " files\n";
        Scanner scanner(m_config);
        return index_documents(scanner.load_files(relative_paths), false);
    }

    PipelineReport IndexingPipeline::run_documentation(const std::filesystem::path& doc_dir) {
        std::cout << "[Pipeline] Indexing documentation in " << doc_dir << "\n";
        Scanner scanner(m_config);
        return index_documents(scanner.load_documentation(doc_dir), false);
    }

    PipelineReport IndexingPipeline::index_documents(const std::vector<Document>& documents, bool clear_first) {
        std::cout << "[Pipeline] Loaded " << documents.size() << " documents\n";

        Chunker chunker(m_config.chunk_size, m_config.overlap_size);
        std::vector<Chunk> chunks = chunker.chunk_documents(documents);

        PipelineReport report;
        if (!chunks.empty()) {
            std::vector<std::string> texts;
            texts.reserve(chunks.size());
            for (const auto& c : chunks) texts.push_back(c.content);

            std::cout << "[Pipeline] Embedding " << texts.size() << " chunks with "
                      << to_string(m_gateway.provider()) << "...\n";
            std::vector<EmbeddingVector> embeddings = m_gateway.embed_batch(texts);
            report.embeddings = embeddings.size();

            m_index.initialize();
            if (clear_first) m_index.clear();
            m_index.store(chunks, embeddings);
        } else {
            std::cerr << "[Pipeline] Warning: no chunks to index under " << m_config.root_dir << "\n";
            if (clear_first) {
                m_index.initialize();
                m_index.clear();
            }
        }

        report.embedding_stats = m_gateway.get_stats();
        report.index_stats = m_index.get_stats();
        report.manifest = build_manifest(m_config, documents, chunks, report.embedding_stats, report.index_stats);

        json extra;
        extra["vector_store_stats"] = report.index_stats;
        write_manifest(m_config.manifest_file(), report.manifest, extra);
        std::cout << "[Pipeline] Manifest written to " << m_config.manifest_file() << "\n";
        return report;
    }

}
