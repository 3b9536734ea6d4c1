#include <iostream>
#include <string>
#include <vector>
#include <filesystem>
#include <cstdio>

#include "engine/config.hpp"
#include "engine/embedding_gateway.hpp"
#include "engine/vector_index.hpp"
#include "engine/manifest.hpp"
#include "engine/text.hpp"
#include "scry/errors.hpp"

namespace {

    const std::vector<std::string> kQueries = {
        "How do agents coordinate?",
        "What is data validation?",
        "Testing and compliance checks",
        "Error recovery and monitoring"
    };

    constexpr size_t kTopK = 3;
    constexpr double kThreshold = 0.3;
    constexpr size_t kPreviewBytes = 100;

    std::string percent(double score) {
        char buf[32];
        std::snprintf(buf, sizeof(buf), "%.1f%%", score * 100.0);
        return buf;
    }

}

int main(int argc, char* argv[]) {
    std::filesystem::path config_path = ".scry.json";
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            config_path = argv[++i];
        } else {
            std::cerr << "Usage: scry-verify [--config FILE]\n";
            return 1;
        }
    }

    scry::engine::Config config;
    try {
        config = scry::engine::Config::load(config_path);
        config.apply_env();
        config.validate();
    } catch (const std::exception& e) {
        std::cerr << "[Scry] Invalid configuration: " << e.what() << "\n";
        return 1;
    }

    scry::engine::Manifest manifest;
    try {
        manifest = scry::engine::read_manifest(config.manifest_file());
    } catch (const scry::ManifestMissingError& e) {
        std::cerr << "[Scry] " << e.what() << "\n";
        return 1;
    } catch (const scry::PersistenceError& e) {
        std::cerr << "[Scry] " << e.what() << "\n";
        return 1;
    }

    const auto& s = manifest.statistics;
    std::cout << "[Scry] Index manifest\n";
    std::cout << "  Indexed at:  " << manifest.timestamp << "\n";
    std::cout << "  Root:        " << manifest.root_directory << "\n";
    std::cout << "  Documents:   " << s.documents_loaded << "\n";
    std::cout << "  Chunks:      " << s.chunks_created << "\n";
    std::cout << "  Model:       " << s.embedding_model << " (" << s.embedding_provider << ", "
              << s.vector_dimension << " dims)\n";
    std::cout << "  Store:       " << s.vector_store_provider << "\n";
    std::cout << "  Ready:       " << (manifest.index_ready ? "yes" : "no") << "\n";
    for (const auto& [type, count] : manifest.file_breakdown) {
        std::cout << "    " << type << ": " << count << "\n";
    }

    try {
        scry::engine::EmbeddingGateway gateway(config);
        scry::engine::VectorIndex index(config);
        index.initialize();

        for (const auto& query : kQueries) {
            std::cout << "\n[Scry] Query: \"" << query << "\"\n";
            auto results = index.retrieve(gateway.embed(query), kTopK, kThreshold);
            if (results.empty()) {
                std::cout << "  (no results above " << percent(kThreshold) << ")\n";
                continue;
            }
            for (size_t i = 0; i < results.size(); ++i) {
                const auto& r = results[i];
                std::cout << "  " << (i + 1) << ". " << r.source << " [chunk " << r.chunk_index << "] "
                          << percent(r.score) << "\n";
                std::cout << "     " << scry::engine::text::utf8_truncate(r.content, kPreviewBytes) << "...\n";
            }
        }

        auto stats = index.get_stats();
        std::cout << "\n[Scry] Retrieval statistics\n";
        std::cout << "  Provider:      " << stats.provider << "\n";
        std::cout << "  Entries:       " << stats.total_documents << "\n";
        std::cout << "  Retrievals:    " << stats.retrievals << "\n";
        std::cout << "  Average score: " << percent(stats.average_score) << "\n";
    } catch (const std::exception& e) {
        std::cerr << "[Scry] Verification failed: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
