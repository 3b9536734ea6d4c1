#pragma once

#include <string>
#include <vector>
#include <filesystem>
#include <cstdint>

namespace scry::engine {

    struct Config {
        enum class Provider {
            MOCK,   // Deterministic hash vectors, no dependencies
            LOCAL,  // In-process ONNX model, degrades to MOCK
            REMOTE  // OpenAI-style HTTPS embeddings
        };

        enum class StoreProvider {
            LOCAL_FILE,   // index.json under index_dir
            REMOTE_CLOUD  // Pinecone-style REST index
        };

        // Embeddings
        Provider provider = Provider::MOCK;
        std::string model = "text-embedding-3-small";
        size_t dimension = 1536;
        size_t batch_size = 10;
        size_t embed_concurrency = 1; // Worker cap for remote groups
        bool fallback_to_mock = true;
        double price_per_million = 0.02;
        long request_timeout_ms = 30000;
        std::string embedding_endpoint = "https://api.openai.com/v1/embeddings";
        std::string api_key = "";
        std::string local_model_path = "model.onnx";
        std::string local_vocab_path = "vocab.txt";

        // Vector store
        StoreProvider rag_provider = StoreProvider::LOCAL_FILE;
        std::string vector_api_key = "";
        std::string index_name = "agenticqa";
        std::string index_host = "";
        std::filesystem::path index_dir = ".rag-index";
        size_t top_k = 5;
        double score_threshold = 0.5;
        bool rag_enabled = true;
        size_t ann_min_entries = 50000; // 0 disables the HNSW candidate pass

        // Loader
        std::filesystem::path root_dir = ".";
        std::vector<std::string> extensions = {".js", ".md", ".json", ".ts"};
        std::vector<std::string> ignore_patterns = {
            "node_modules", ".git", "coverage", "build", "dist", ".env", ".rag-index"
        };
        size_t chunk_size = 500;
        size_t overlap_size = 50;
        std::uintmax_t max_file_size = 1000000;

        /**
         * @brief Loads a JSON config file. A missing file yields defaults.
         * @throws ConfigError if the file is not valid JSON or a value has the wrong type.
         */
        static Config load(const std::filesystem::path& path);

        /**
         * @brief Overlays recognized environment variables onto this config.
         */
        void apply_env();

        /**
         * @brief Checks cross-field constraints.
         * @throws ConfigError on the first violation.
         */
        void validate() const;

        void save(const std::filesystem::path& path) const;

        std::filesystem::path index_file() const { return index_dir / "index.json"; }
        std::filesystem::path manifest_file() const { return index_dir / "manifest.json"; }
    };

    std::string to_string(Config::Provider provider);
    std::string to_string(Config::StoreProvider provider);
    Config::Provider parse_provider(const std::string& name);
    Config::StoreProvider parse_store_provider(const std::string& name);

}
