#include <gtest/gtest.h>
#include <cstdlib>
#include "engine/config.hpp"
#include "scry/errors.hpp"
#include "test_helpers.hpp"

using namespace scry;
using namespace scry::engine;

TEST(ConfigTest, MissingFileYieldsDefaults) {
    test::TempDir dir;
    auto config = Config::load(dir.path() / "absent.json");

    EXPECT_EQ(config.provider, Config::Provider::MOCK);
    EXPECT_EQ(config.dimension, 1536u);
    EXPECT_EQ(config.batch_size, 10u);
    EXPECT_EQ(config.chunk_size, 500u);
    EXPECT_EQ(config.overlap_size, 50u);
    EXPECT_EQ(config.max_file_size, 1000000u);
    EXPECT_EQ(config.top_k, 5u);
    EXPECT_DOUBLE_EQ(config.score_threshold, 0.5);
    EXPECT_EQ(config.index_name, "agenticqa");
    EXPECT_EQ(config.extensions, (std::vector<std::string>{".js", ".md", ".json", ".ts"}));
    EXPECT_TRUE(config.fallback_to_mock);
    EXPECT_NO_THROW(config.validate());
}

TEST(ConfigTest, LoadsValuesFromFile) {
    test::TempDir dir;
    auto path = dir.path() / "scry.json";
    test::write_file(path, R"({
        "provider": "openai",
        "dimension": 384,
        "rag_provider": "pinecone",
        "index_dir": "/tmp/idx",
        "extensions": [".cpp", ".hpp"],
        "chunk_size": 40,
        "overlap_size": 4
    })");

    auto config = Config::load(path);
    EXPECT_EQ(config.provider, Config::Provider::REMOTE);
    EXPECT_EQ(config.dimension, 384u);
    EXPECT_EQ(config.rag_provider, Config::StoreProvider::REMOTE_CLOUD);
    EXPECT_EQ(config.index_dir, std::filesystem::path("/tmp/idx"));
    EXPECT_EQ(config.manifest_file(), std::filesystem::path("/tmp/idx/manifest.json"));
    EXPECT_EQ(config.extensions.size(), 2u);
    EXPECT_EQ(config.chunk_size, 40u);
    EXPECT_EQ(config.overlap_size, 4u);
}

TEST(ConfigTest, MalformedFileThrowsConfigError) {
    test::TempDir dir;
    auto path = dir.path() / "scry.json";

    test::write_file(path, "{ not json");
    EXPECT_THROW(Config::load(path), ConfigError);

    test::write_file(path, R"({"dimension": "wide"})");
    EXPECT_THROW(Config::load(path), ConfigError);

    test::write_file(path, R"({"provider": "carrier-pigeon"})");
    EXPECT_THROW(Config::load(path), ConfigError);
}

TEST(ConfigTest, SaveThenLoadKeepsSettings) {
    test::TempDir dir;
    Config config;
    config.provider = Config::Provider::LOCAL;
    config.dimension = 384;
    config.top_k = 7;
    config.price_per_million = 0.13;
    config.local_model_path = "models/minilm.onnx";
    config.local_vocab_path = "models/vocab.txt";
    config.ann_min_entries = 0;
    config.api_key = "sk-secret";

    auto path = dir.path() / "saved.json";
    config.save(path);

    auto loaded = Config::load(path);
    EXPECT_EQ(loaded.provider, Config::Provider::LOCAL);
    EXPECT_EQ(loaded.dimension, 384u);
    EXPECT_EQ(loaded.top_k, 7u);
    EXPECT_DOUBLE_EQ(loaded.price_per_million, 0.13);
    EXPECT_EQ(loaded.local_model_path, "models/minilm.onnx");
    EXPECT_EQ(loaded.local_vocab_path, "models/vocab.txt");
    EXPECT_EQ(loaded.ann_min_entries, 0u);
    EXPECT_TRUE(loaded.api_key.empty());
    EXPECT_EQ(test::read_file(path).find("sk-secret"), std::string::npos);
}

TEST(ConfigTest, EnvironmentOverridesFile) {
    setenv("EMBEDDING_PROVIDER", "local", 1);
    setenv("RAG_TOP_K", "9", 1);
    setenv("RAG_ENABLED", "false", 1);

    Config config;
    config.apply_env();

    unsetenv("EMBEDDING_PROVIDER");
    unsetenv("RAG_TOP_K");
    unsetenv("RAG_ENABLED");

    EXPECT_EQ(config.provider, Config::Provider::LOCAL);
    EXPECT_EQ(config.top_k, 9u);
    EXPECT_FALSE(config.rag_enabled);
}

TEST(ConfigTest, NonNumericEnvironmentValueThrows) {
    setenv("EMBEDDING_DIMENSION", "lots", 1);
    Config config;
    EXPECT_THROW(config.apply_env(), ConfigError);
    unsetenv("EMBEDDING_DIMENSION");
}

TEST(ConfigTest, ValidateRejectsBadChunking) {
    Config config;
    config.overlap_size = config.chunk_size;
    EXPECT_THROW(config.validate(), ConfigError);

    config = Config{};
    config.chunk_size = 0;
    EXPECT_THROW(config.validate(), ConfigError);

    config = Config{};
    config.dimension = 0;
    EXPECT_THROW(config.validate(), ConfigError);
}

TEST(ConfigTest, ProviderNames) {
    EXPECT_EQ(to_string(Config::Provider::MOCK), "mock");
    EXPECT_EQ(to_string(Config::Provider::REMOTE), "openai");
    EXPECT_EQ(parse_provider("OpenAI"), Config::Provider::REMOTE);
    EXPECT_EQ(parse_store_provider("chroma"), Config::StoreProvider::LOCAL_FILE);
    EXPECT_EQ(to_string(Config::StoreProvider::REMOTE_CLOUD), "remote-cloud");
    EXPECT_THROW(parse_store_provider("s3"), ConfigError);
}
