#include "manifest.hpp"
#include "scry/errors.hpp"
#include <fstream>

using json = nlohmann::json;

namespace scry::engine {

    json manifest_to_json(const Manifest& m) {
        const auto& s = m.statistics;
        return {
            {"timestamp", m.timestamp},
            {"root_directory", m.root_directory},
            {"statistics", {
                {"documents_loaded", s.documents_loaded},
                {"chunks_created", s.chunks_created},
                {"average_chunk_size", s.average_chunk_size},
                {"embedding_model", s.embedding_model},
                {"vector_dimension", s.vector_dimension},
                {"embedding_provider", s.embedding_provider},
                {"vector_store_provider", s.vector_store_provider},
                {"tokens_used", s.tokens_used},
                {"estimated_cost", s.estimated_cost}
            }},
            {"file_breakdown", m.file_breakdown},
            {"index_ready", m.index_ready}
        };
    }

    Manifest manifest_from_json(const json& j) {
        Manifest m;
        m.timestamp = j.value("timestamp", "");
        m.root_directory = j.value("root_directory", "");
        m.index_ready = j.value("index_ready", false);
        if (j.contains("file_breakdown")) {
            m.file_breakdown = j["file_breakdown"].get<std::map<std::string, size_t>>();
        }
        if (j.contains("statistics")) {
            const auto& s = j["statistics"];
            auto& out = m.statistics;
            out.documents_loaded = s.value("documents_loaded", size_t{0});
            out.chunks_created = s.value("chunks_created", size_t{0});
            out.average_chunk_size = s.value("average_chunk_size", size_t{0});
            out.embedding_model = s.value("embedding_model", "");
            out.vector_dimension = s.value("vector_dimension", size_t{0});
            out.embedding_provider = s.value("embedding_provider", "");
            out.vector_store_provider = s.value("vector_store_provider", "");
            out.tokens_used = s.value("tokens_used", uint64_t{0});
            out.estimated_cost = s.value("estimated_cost", 0.0);
        }
        return m;
    }

    void write_manifest(const std::filesystem::path& path, const Manifest& manifest, const json& extra) {
        std::error_code ec;
        if (path.has_parent_path()) std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) throw PersistenceError("cannot create " + path.parent_path().string() + ": " + ec.message());

        json j = manifest_to_json(manifest);
        for (auto it = extra.begin(); it != extra.end(); ++it) j[it.key()] = it.value();

        std::ofstream f(path, std::ios::trunc);
        if (!f.is_open()) throw PersistenceError("cannot write " + path.string());
        f << j.dump(2, ' ', false, json::error_handler_t::replace) << "\n";
        if (!f) throw PersistenceError("write failed for " + path.string());
    }

    Manifest read_manifest(const std::filesystem::path& path) {
        if (!std::filesystem::exists(path)) {
            throw ManifestMissingError("index manifest not found at " + path.string() + "; run scry-index first");
        }
        std::ifstream f(path);
        if (!f.is_open()) throw PersistenceError("cannot open " + path.string());
        try {
            return manifest_from_json(json::parse(f));
        } catch (const json::exception& e) {
            throw PersistenceError("corrupt manifest " + path.string() + ": " + e.what());
        }
    }

}
