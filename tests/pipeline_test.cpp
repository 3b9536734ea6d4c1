#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "engine/pipeline.hpp"
#include "engine/manifest.hpp"
#include "engine/embedder.hpp"
#include "scry/errors.hpp"
#include "test_helpers.hpp"

using namespace scry;
using namespace scry::engine;

class PipelineTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_ = test::make_config(dir_.path(), 32);
        config_.chunk_size = 10;
        config_.overlap_size = 2;
    }

    test::TempDir dir_;
    Config config_;
};

TEST_F(PipelineTest, IndexesRootAndWritesManifest) {
    test::write_file(config_.root_dir / "guide.md", test::numbered_lines(25));
    test::write_file(config_.root_dir / "src" / "app.js", "console.log('hi');\n");
    test::write_file(config_.root_dir / "src" / "types.ts", "type A = 1;\n");

    EmbeddingGateway gateway(config_);
    VectorIndex index(config_);
    IndexingPipeline pipeline(config_, gateway, index);
    auto report = pipeline.run();

    const auto& s = report.manifest.statistics;
    EXPECT_EQ(s.documents_loaded, 3u);
    EXPECT_EQ(s.chunks_created, 6u);  // 26 lines at 10/2 -> 3 full chunks and a tail, plus one each
    EXPECT_EQ(report.embeddings, 6u);
    EXPECT_EQ(s.vector_dimension, 32u);
    EXPECT_EQ(s.embedding_provider, "mock");
    EXPECT_EQ(s.vector_store_provider, "local-file");
    EXPECT_GT(s.average_chunk_size, 0u);
    EXPECT_TRUE(report.manifest.index_ready);
    EXPECT_EQ(report.manifest.file_breakdown.at(".md"), 1u);
    EXPECT_EQ(report.manifest.file_breakdown.at(".js"), 1u);
    EXPECT_EQ(report.manifest.file_breakdown.at(".ts"), 1u);
    EXPECT_EQ(index.get_stats().total_documents, 6u);

    auto on_disk = read_manifest(config_.manifest_file());
    EXPECT_EQ(on_disk.statistics.chunks_created, 6u);
    EXPECT_EQ(on_disk.timestamp, report.manifest.timestamp);
    EXPECT_TRUE(on_disk.index_ready);

    auto raw = nlohmann::json::parse(test::read_file(config_.manifest_file()));
    EXPECT_EQ(raw["vector_store_stats"]["total_documents"], 6);
    EXPECT_EQ(raw["statistics"]["embedding_model"], config_.model);
}

TEST_F(PipelineTest, IndexedContentIsRetrievable) {
    test::write_file(config_.root_dir / "fox.md", "the quick brown fox");

    EmbeddingGateway gateway(config_);
    VectorIndex index(config_);
    IndexingPipeline(config_, gateway, index).run();

    auto results = index.retrieve(gateway.embed("the quick brown fox"), 5, 0.999);
    ASSERT_EQ(results.size(), 1u);
    EXPECT_EQ(results[0].source, "fox.md");
    EXPECT_EQ(results[0].chunk_index, 0u);
}

TEST_F(PipelineTest, EmptyRootWritesEmptyManifest) {
    EmbeddingGateway gateway(config_);
    VectorIndex index(config_);
    test::StreamCapture err(std::cerr);
    auto report = IndexingPipeline(config_, gateway, index).run();

    const auto& s = report.manifest.statistics;
    EXPECT_EQ(s.documents_loaded, 0u);
    EXPECT_EQ(s.chunks_created, 0u);
    EXPECT_EQ(s.average_chunk_size, 0u);
    EXPECT_EQ(s.vector_dimension, 0u);
    EXPECT_FALSE(report.manifest.index_ready);
    EXPECT_TRUE(std::filesystem::exists(config_.manifest_file()));
    EXPECT_FALSE(std::filesystem::exists(config_.index_file()));
}

TEST_F(PipelineTest, ClearDropsStaleEntries) {
    test::write_file(config_.root_dir / "old.md", "old content");
    EmbeddingGateway gateway(config_);
    VectorIndex index(config_);
    IndexingPipeline pipeline(config_, gateway, index);
    pipeline.run();

    std::filesystem::remove(config_.root_dir / "old.md");
    test::write_file(config_.root_dir / "new.md", "new content");

    pipeline.run();
    EXPECT_EQ(index.get_stats().total_documents, 2u);

    pipeline.run(true);
    EXPECT_EQ(index.get_stats().total_documents, 1u);
    auto results = index.retrieve(gateway.embed("new content"), 5, -1.0);
    ASSERT_EQ(results.size(), 1u);
    EXPECT_EQ(results[0].source, "new.md");
}

TEST_F(PipelineTest, RunFilesAddsOnlyNamedFiles) {
    test::write_file(config_.root_dir / "a.md", "alpha");
    test::write_file(config_.root_dir / "b.md", "beta");

    EmbeddingGateway gateway(config_);
    VectorIndex index(config_);
    auto report = IndexingPipeline(config_, gateway, index).run_files({"b.md"});

    EXPECT_EQ(report.manifest.statistics.documents_loaded, 1u);
    EXPECT_EQ(index.get_stats().total_documents, 1u);
    EXPECT_EQ(index.retrieve(gateway.embed("beta"), 1, 0.999).size(), 1u);
}

TEST_F(PipelineTest, RunDocumentationIndexesOnlyDocs) {
    test::write_file(config_.root_dir / "docs" / "setup.md", "install the agent");
    test::write_file(config_.root_dir / "src" / "app.js", "console.log('hi');");

    EmbeddingGateway gateway(config_);
    VectorIndex index(config_);
    auto report = IndexingPipeline(config_, gateway, index).run_documentation();

    EXPECT_EQ(report.manifest.statistics.documents_loaded, 1u);
    EXPECT_EQ(report.manifest.file_breakdown.at(".md"), 1u);
    EXPECT_EQ(index.get_stats().total_documents, 1u);
    auto results = index.retrieve(gateway.embed("install the agent"), 5, 0.999);
    ASSERT_EQ(results.size(), 1u);
    EXPECT_EQ(results[0].source, "docs/setup.md");
}

TEST_F(PipelineTest, MissingRootFails) {
    config_.root_dir = dir_.path() / "absent";
    EmbeddingGateway gateway(config_);
    VectorIndex index(config_);
    test::StreamCapture err(std::cerr);
    EXPECT_THROW(IndexingPipeline(config_, gateway, index).run(), LoadError);
}

TEST(ManifestTest, MissingManifestThrows) {
    test::TempDir dir;
    EXPECT_THROW(read_manifest(dir.path() / "manifest.json"), ManifestMissingError);

    test::write_file(dir.path() / "manifest.json", "not json");
    EXPECT_THROW(read_manifest(dir.path() / "manifest.json"), PersistenceError);
}

TEST(ManifestTest, WriteThenRead) {
    test::TempDir dir;
    Manifest m;
    m.timestamp = "2024-01-01T00:00:00.000Z";
    m.root_directory = "/code";
    m.statistics.documents_loaded = 4;
    m.statistics.estimated_cost = 0.5;
    m.file_breakdown[".md"] = 4;
    m.index_ready = true;

    auto path = dir.path() / "nested" / "manifest.json";
    write_manifest(path, m, {{"vector_store_stats", {{"total_documents", 9}}}});

    auto back = read_manifest(path);
    EXPECT_EQ(back.timestamp, m.timestamp);
    EXPECT_EQ(back.statistics.documents_loaded, 4u);
    EXPECT_DOUBLE_EQ(back.statistics.estimated_cost, 0.5);
    EXPECT_EQ(back.file_breakdown, m.file_breakdown);
    EXPECT_TRUE(back.index_ready);

    auto raw = nlohmann::json::parse(test::read_file(path));
    EXPECT_EQ(raw["vector_store_stats"]["total_documents"], 9);
}

TEST(ManifestTest, AverageChunkSizeIsRounded) {
    test::TempDir dir;
    Config config = test::make_config(dir.path(), 8);

    Document doc;
    doc.type = ".md";
    std::vector<Chunk> chunks(2);
    chunks[0].content = "a";
    chunks[1].content = "bb";

    EmbeddingStats embedding_stats;
    embedding_stats.dimension = 8;
    auto m = build_manifest(config, {doc}, chunks, embedding_stats, IndexStats{});
    EXPECT_EQ(m.statistics.average_chunk_size, 2u);  // 1.5

    chunks.push_back(chunks[0]);
    m = build_manifest(config, {doc}, chunks, embedding_stats, IndexStats{});
    EXPECT_EQ(m.statistics.average_chunk_size, 1u);  // 1.33
}
