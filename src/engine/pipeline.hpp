#pragma once

#include <filesystem>
#include <vector>
#include "config.hpp"
#include "embedding_gateway.hpp"
#include "vector_index.hpp"
#include "scry/types.hpp"

namespace scry::engine {

    struct PipelineReport {
        Manifest manifest;
        size_t embeddings = 0;
        EmbeddingStats embedding_stats;
        IndexStats index_stats;
    };

    /**
     * @brief One indexing run: load, chunk, embed, store, write the manifest.
     *
     * The gateway and index are borrowed; they must outlive the pipeline.
     */
    class IndexingPipeline {
    public:
        IndexingPipeline(const Config& config, EmbeddingGateway& gateway, VectorIndex& index);

        /**
         * @brief Indexes the whole root directory.
         * @param clear_first Wipe the index before storing.
         * @throws Any error from the store or manifest steps; nothing is retried.
         */
        PipelineReport run(bool clear_first = false);

        /**
         * @brief Indexes only the given root-relative files. Existing entries
         * for other files are kept.
         */
        PipelineReport run_files(const std::vector<std::filesystem::path>& relative_paths);

        /**
         * @brief Indexes the markdown under root/doc_dir, keeping other entries.
         */
        PipelineReport run_documentation(const std::filesystem::path& doc_dir = "docs");

    private:
        PipelineReport index_documents(const std::vector<Document>& documents, bool clear_first);

        Config m_config;
        EmbeddingGateway& m_gateway;
        VectorIndex& m_index;
    };

    /**
     * @brief Builds the manifest for a finished run.
     */
    Manifest build_manifest(const Config& config, const std::vector<Document>& documents,
                            const std::vector<Chunk>& chunks, const EmbeddingStats& embedding_stats,
                            const IndexStats& index_stats);

}
