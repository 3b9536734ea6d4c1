#include "config.hpp"
#include "scry/errors.hpp"
#include <nlohmann/json.hpp>
#include <fstream>
#include <cstdlib>
#include <algorithm>
#include <cctype>

using json = nlohmann::json;

namespace scry::engine {

    namespace {

        std::string lower(std::string s) {
            std::transform(s.begin(), s.end(), s.begin(),
                [](unsigned char c){ return std::tolower(c); });
            return s;
        }

        const char* env(const char* name) {
            const char* value = std::getenv(name);
            return (value && *value) ? value : nullptr;
        }

        size_t env_size(const char* name, size_t fallback) {
            const char* value = env(name);
            if (!value) return fallback;
            try {
                return static_cast<size_t>(std::stoull(value));
            } catch (const std::exception&) {
                throw ConfigError(std::string(name) + " is not a number: " + value);
            }
        }

        double env_double(const char* name, double fallback) {
            const char* value = env(name);
            if (!value) return fallback;
            try {
                return std::stod(value);
            } catch (const std::exception&) {
                throw ConfigError(std::string(name) + " is not a number: " + value);
            }
        }

        bool env_bool(const char* name, bool fallback) {
            const char* value = env(name);
            if (!value) return fallback;
            std::string v = lower(value);
            return v == "1" || v == "true" || v == "yes" || v == "on";
        }

        template <typename T>
        void read(const json& j, const char* key, T& out) {
            if (j.contains(key)) out = j.at(key).get<T>();
        }

    }

    std::string to_string(Config::Provider provider) {
        switch (provider) {
            case Config::Provider::LOCAL: return "local";
            case Config::Provider::REMOTE: return "openai";
            case Config::Provider::MOCK: break;
        }
        return "mock";
    }

    std::string to_string(Config::StoreProvider provider) {
        return provider == Config::StoreProvider::REMOTE_CLOUD ? "remote-cloud" : "local-file";
    }

    Config::Provider parse_provider(const std::string& name) {
        std::string n = lower(name);
        if (n == "mock") return Config::Provider::MOCK;
        if (n == "local") return Config::Provider::LOCAL;
        if (n == "openai" || n == "remote") return Config::Provider::REMOTE;
        throw ConfigError("unknown embedding provider: " + name);
    }

    Config::StoreProvider parse_store_provider(const std::string& name) {
        std::string n = lower(name);
        if (n == "local-file" || n == "local" || n == "chroma") return Config::StoreProvider::LOCAL_FILE;
        if (n == "remote-cloud" || n == "remote" || n == "pinecone") return Config::StoreProvider::REMOTE_CLOUD;
        throw ConfigError("unknown vector store provider: " + name);
    }

    Config Config::load(const std::filesystem::path& path) {
        Config cfg;
        if (!std::filesystem::exists(path)) return cfg;

        std::ifstream f(path);
        if (!f.is_open()) throw ConfigError("cannot open config file " + path.string());

        try {
            json j = json::parse(f);

            if (j.contains("provider")) cfg.provider = parse_provider(j.at("provider").get<std::string>());
            read(j, "model", cfg.model);
            read(j, "dimension", cfg.dimension);
            read(j, "batch_size", cfg.batch_size);
            read(j, "embed_concurrency", cfg.embed_concurrency);
            read(j, "fallback_to_mock", cfg.fallback_to_mock);
            read(j, "price_per_million", cfg.price_per_million);
            read(j, "request_timeout_ms", cfg.request_timeout_ms);
            read(j, "embedding_endpoint", cfg.embedding_endpoint);
            read(j, "api_key", cfg.api_key);
            read(j, "local_model_path", cfg.local_model_path);
            read(j, "local_vocab_path", cfg.local_vocab_path);

            if (j.contains("rag_provider")) cfg.rag_provider = parse_store_provider(j.at("rag_provider").get<std::string>());
            read(j, "vector_api_key", cfg.vector_api_key);
            read(j, "index_name", cfg.index_name);
            read(j, "index_host", cfg.index_host);
            if (j.contains("index_dir")) cfg.index_dir = j.at("index_dir").get<std::string>();
            read(j, "top_k", cfg.top_k);
            read(j, "score_threshold", cfg.score_threshold);
            read(j, "rag_enabled", cfg.rag_enabled);
            read(j, "ann_min_entries", cfg.ann_min_entries);

            if (j.contains("root_dir")) cfg.root_dir = j.at("root_dir").get<std::string>();
            read(j, "extensions", cfg.extensions);
            read(j, "ignore_patterns", cfg.ignore_patterns);
            read(j, "chunk_size", cfg.chunk_size);
            read(j, "overlap_size", cfg.overlap_size);
            read(j, "max_file_size", cfg.max_file_size);
        } catch (const json::exception& e) {
            throw ConfigError("invalid config " + path.string() + ": " + e.what());
        }
        return cfg;
    }

    void Config::apply_env() {
        if (const char* v = env("EMBEDDING_PROVIDER")) provider = parse_provider(v);
        if (const char* v = env("EMBEDDING_MODEL")) model = v;
        dimension = env_size("EMBEDDING_DIMENSION", dimension);
        batch_size = env_size("EMBEDDING_BATCH_SIZE", batch_size);
        if (const char* v = env("EMBEDDING_ENDPOINT")) embedding_endpoint = v;
        if (const char* v = env("OPENAI_API_KEY")) api_key = v;
        if (const char* v = env("SCRY_LOCAL_MODEL")) local_model_path = v;
        if (const char* v = env("SCRY_LOCAL_VOCAB")) local_vocab_path = v;

        if (const char* v = env("RAG_PROVIDER")) rag_provider = parse_store_provider(v);
        if (const char* v = env("PINECONE_API_KEY")) vector_api_key = v;
        if (const char* v = env("PINECONE_INDEX")) index_name = v;
        if (const char* v = env("PINECONE_HOST")) index_host = v;
        top_k = env_size("RAG_TOP_K", top_k);
        score_threshold = env_double("RAG_SCORE_THRESHOLD", score_threshold);
        rag_enabled = env_bool("RAG_ENABLED", rag_enabled);
        if (const char* v = env("RAG_ROOT_DIR")) root_dir = v;
        if (const char* v = env("RAG_INDEX_DIR")) index_dir = v;
    }

    void Config::validate() const {
        if (dimension == 0) throw ConfigError("dimension must be positive");
        if (batch_size == 0) throw ConfigError("batch_size must be positive");
        if (embed_concurrency == 0) throw ConfigError("embed_concurrency must be positive");
        if (chunk_size == 0) throw ConfigError("chunk_size must be positive");
        if (overlap_size >= chunk_size) {
            throw ConfigError("overlap_size (" + std::to_string(overlap_size) +
                              ") must be smaller than chunk_size (" + std::to_string(chunk_size) + ")");
        }
        if (top_k == 0) throw ConfigError("top_k must be positive");
        if (extensions.empty()) throw ConfigError("extensions must not be empty");
    }

    void Config::save(const std::filesystem::path& path) const {
        json j;
        j["provider"] = to_string(provider);
        j["model"] = model;
        j["dimension"] = dimension;
        j["batch_size"] = batch_size;
        j["embed_concurrency"] = embed_concurrency;
        j["fallback_to_mock"] = fallback_to_mock;
        j["request_timeout_ms"] = request_timeout_ms;
        j["embedding_endpoint"] = embedding_endpoint;
        j["price_per_million"] = price_per_million;
        j["local_model_path"] = local_model_path;
        j["local_vocab_path"] = local_vocab_path;
        j["rag_provider"] = to_string(rag_provider);
        j["index_name"] = index_name;
        if (!index_host.empty()) j["index_host"] = index_host;
        j["index_dir"] = index_dir.generic_string();
        j["top_k"] = top_k;
        j["score_threshold"] = score_threshold;
        j["rag_enabled"] = rag_enabled;
        j["ann_min_entries"] = ann_min_entries;
        j["root_dir"] = root_dir.generic_string();
        j["extensions"] = extensions;
        j["ignore_patterns"] = ignore_patterns;
        j["chunk_size"] = chunk_size;
        j["overlap_size"] = overlap_size;
        j["max_file_size"] = max_file_size;
        // Credentials stay in the environment.

        std::ofstream f(path);
        if (!f.is_open()) throw ConfigError("cannot write config file " + path.string());
        f << j.dump(4);
    }

}
