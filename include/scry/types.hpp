#pragma once
#include <string>
#include <vector>
#include <map>
#include <cstdint>
#include <cstddef>

namespace scry::engine {

    using EmbeddingVector = std::vector<float>;

    struct Document {
        std::string id;       // root-relative generic path
        std::string source;
        std::string type;     // extension including the dot
        std::string content;
        std::uintmax_t size = 0;
        bool is_documentation = false;
    };

    struct Chunk {
        std::string id;       // "{document.id}#chunk{n}"
        std::string source;
        std::string type;
        size_t chunk_index = 0;
        std::string content;
        int start_line = 0;   // 1-based, inclusive
        int end_line = 0;
    };

    struct EntryMetadata {
        std::string source;
        std::string type;
        size_t chunk_index = 0;
        std::string content;
    };

    struct IndexEntry {
        std::string id;
        EmbeddingVector embedding;
        EntryMetadata metadata;
    };

    struct RetrievalResult {
        std::string id;
        std::string source;
        std::string content;
        std::string type;
        double score = 0.0;
        size_t chunk_index = 0;
    };

    struct ManifestStatistics {
        size_t documents_loaded = 0;
        size_t chunks_created = 0;
        size_t average_chunk_size = 0;
        std::string embedding_model;
        size_t vector_dimension = 0;
        std::string embedding_provider;
        std::string vector_store_provider;
        uint64_t tokens_used = 0;
        double estimated_cost = 0.0;
    };

    struct Manifest {
        std::string timestamp;
        std::string root_directory;
        ManifestStatistics statistics;
        std::map<std::string, size_t> file_breakdown;
        bool index_ready = false;
    };

}
