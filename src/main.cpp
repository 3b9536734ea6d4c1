#include <iostream>
#include <string>
#include <vector>
#include <filesystem>
#include <cstdio>

#include "engine/config.hpp"
#include "engine/embedding_gateway.hpp"
#include "engine/vector_index.hpp"
#include "engine/pipeline.hpp"
#include "scry/errors.hpp"

namespace {

    void print_usage() {
        std::cerr << "Usage: scry-index [--root DIR] [--config FILE] [--clear] [--files PATH...] [--docs [DIR]]\n";
        std::cerr << "  --root DIR     Directory to index (overrides root_dir)\n";
        std::cerr << "  --config FILE  JSON configuration (default: .scry.json)\n";
        std::cerr << "  --clear        Wipe the index before storing\n";
        std::cerr << "  --files PATH   Re-index only these root-relative files\n";
        std::cerr << "  --docs [DIR]   Index only the markdown under DIR (default: docs)\n";
    }

}

int main(int argc, char* argv[]) {
    std::filesystem::path config_path = ".scry.json";
    std::string root_override;
    bool clear_first = false;
    std::vector<std::filesystem::path> files;
    std::filesystem::path doc_dir;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--root" && i + 1 < argc) {
            root_override = argv[++i];
        } else if (arg == "--config" && i + 1 < argc) {
            config_path = argv[++i];
        } else if (arg == "--clear") {
            clear_first = true;
        } else if (arg == "--files") {
            while (i + 1 < argc && std::string(argv[i + 1]).rfind("--", 0) != 0) files.emplace_back(argv[++i]);
        } else if (arg == "--docs") {
            doc_dir = "docs";
            if (i + 1 < argc && std::string(argv[i + 1]).rfind("--", 0) != 0) doc_dir = argv[++i];
        } else if (arg == "--help" || arg == "-h") {
            print_usage();
            return 0;
        } else {
            std::cerr << "[Scry] Unknown argument: " << arg << "\n";
            print_usage();
            return 1;
        }
    }

    std::cout << "[Scry] Starting indexer (v0.1.0)...\n";

    try {
        auto config = scry::engine::Config::load(config_path);
        config.apply_env();
        if (!root_override.empty()) config.root_dir = root_override;
        config.validate();

        std::cout << "[Scry] Root: " << config.root_dir << "\n";
        std::cout << "[Scry] Index: " << config.index_dir << "\n";

        scry::engine::EmbeddingGateway gateway(config);
        scry::engine::VectorIndex index(config);
        scry::engine::IndexingPipeline pipeline(config, gateway, index);

        scry::engine::PipelineReport report;
        if (!doc_dir.empty()) {
            report = pipeline.run_documentation(doc_dir);
        } else if (!files.empty()) {
            report = pipeline.run_files(files);
        } else {
            report = pipeline.run(clear_first);
        }
        const auto& s = report.manifest.statistics;

        char cost[32];
        std::snprintf(cost, sizeof(cost), "%.6f", s.estimated_cost);

        std::cout << "\n[Pipeline] Indexing complete\n";
        std::cout << "  Documents:  " << s.documents_loaded << "\n";
        std::cout << "  Chunks:     " << s.chunks_created << "\n";
        std::cout << "  Embeddings: " << report.embeddings << "\n";
        std::cout << "  Tokens:     " << s.tokens_used << "\n";
        std::cout << "  Cost:       $" << cost << "\n";
        std::cout << "  Provider:   " << s.embedding_provider << " / " << s.vector_store_provider << "\n";
        if (!report.manifest.index_ready) {
            std::cout << "  Index is empty; nothing matched the configured extensions.\n";
        }
    } catch (const std::exception& e) {
        std::cerr << "[Pipeline] Indexing failed: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
