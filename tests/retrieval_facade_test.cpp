#include <gtest/gtest.h>
#include <stdexcept>
#include <thread>
#include "engine/retrieval_facade.hpp"
#include "engine/embedder.hpp"
#include "test_helpers.hpp"

using namespace scry;
using namespace scry::engine;

namespace {

    class EchoDecider : public Decider {
    public:
        Decision decide(const std::string& query) override {
            if (query == "explode") throw std::runtime_error("decider failed");
            Decision d;
            d.decision = "Proceed with " + query;
            d.details = {{"confidence", 0.8}};
            return d;
        }
    };

    Chunk make_chunk(const std::string& source, const std::string& content) {
        Chunk c;
        c.id = source + "#chunk0";
        c.source = source;
        c.type = ".md";
        c.content = content;
        return c;
    }

}

class RetrievalFacadeTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_ = test::make_config(dir_.path(), 32);
        gateway_ = std::make_unique<EmbeddingGateway>(config_);
        index_ = std::make_unique<VectorIndex>(config_);
        index_->store({make_chunk("agents.md", "How do agents coordinate?"),
                       make_chunk("notes.md", "unrelated notes")},
                      {mock_embedding("How do agents coordinate?", 32),
                       test::axis(0, 32)});
    }

    test::TempDir dir_;
    Config config_;
    EchoDecider base_;
    std::unique_ptr<EmbeddingGateway> gateway_;
    std::unique_ptr<VectorIndex> index_;
};

TEST_F(RetrievalFacadeTest, AttachesContextOnMatch) {
    RetrievalFacade facade(base_, *gateway_, *index_, config_);
    facade.initialize();

    auto d = facade.decide("How do agents coordinate?");
    EXPECT_EQ(d.decision, "Proceed with How do agents coordinate? [Based on analysis of relevant codebase context]");
    ASSERT_EQ(d.context.size(), 1u);
    EXPECT_EQ(d.context[0].source, "agents.md");
    EXPECT_EQ(d.context[0].relevance, "100.0%");
    EXPECT_EQ(d.context[0].preview, "How do agents coordinate?");
    EXPECT_TRUE(d.rag_enhanced);
    EXPECT_GE(d.latency_ms, 0.0);
    EXPECT_DOUBLE_EQ(d.details["confidence"].get<double>(), 0.8);

    auto stats = facade.get_stats();
    EXPECT_TRUE(stats.enabled);
    EXPECT_EQ(stats.queries_processed, 1u);
    EXPECT_EQ(stats.successful_retrievals, 1u);
    EXPECT_EQ(stats.failed_retrievals, 0u);
}

TEST_F(RetrievalFacadeTest, PreviewIsCappedAt200Bytes) {
    const std::string long_text(300, 'x');
    index_->store({make_chunk("long.md", long_text)}, {mock_embedding(long_text, 32)});

    RetrievalFacade facade(base_, *gateway_, *index_, config_);
    auto d = facade.decide(long_text);

    bool found = false;
    for (const auto& c : d.context) {
        EXPECT_LE(c.preview.size(), RetrievalFacade::kPreviewBytes);
        if (c.source == "long.md") {
            found = true;
            EXPECT_EQ(c.preview, std::string(RetrievalFacade::kPreviewBytes, 'x'));
        }
    }
    EXPECT_TRUE(found);
}

TEST_F(RetrievalFacadeTest, NoMatchReturnsBaseDecision) {
    // Axis vectors sit far below the 0.5 threshold for any mock query.
    Config sparse = config_;
    sparse.index_dir = dir_.path() / "sparse";
    VectorIndex sparse_index(sparse);
    sparse_index.store({make_chunk("a.md", "a"), make_chunk("b.md", "b")}, {test::axis(0, 32), test::axis(1, 32)});

    RetrievalFacade facade(base_, *gateway_, sparse_index, sparse);
    auto d = facade.decide("something unrelated entirely");

    EXPECT_EQ(d.decision, "Proceed with something unrelated entirely");
    EXPECT_TRUE(d.context.empty());
    EXPECT_TRUE(d.rag_enhanced);
    EXPECT_EQ(facade.get_stats().failed_retrievals, 1u);
}

TEST_F(RetrievalFacadeTest, DisabledRagSkipsRetrieval) {
    config_.rag_enabled = false;
    RetrievalFacade facade(base_, *gateway_, *index_, config_);
    facade.initialize();

    auto d = facade.decide("How do agents coordinate?");
    EXPECT_EQ(d.decision, "Proceed with How do agents coordinate?");
    EXPECT_FALSE(d.rag_enhanced);

    auto stats = facade.get_stats();
    EXPECT_FALSE(stats.enabled);
    EXPECT_EQ(stats.failed_retrievals, 1u);
    EXPECT_EQ(gateway_->get_stats().queries_processed, 0u);
}

TEST_F(RetrievalFacadeTest, RetrievalErrorIsSwallowedAndCounted) {
    // Query vectors of a different width than the stored ones make retrieve throw.
    Config narrow = config_;
    narrow.dimension = 16;
    EmbeddingGateway narrow_gateway(narrow);
    RetrievalFacade facade(base_, narrow_gateway, *index_, config_);

    test::StreamCapture err(std::cerr);
    auto d = facade.decide("How do agents coordinate?");

    EXPECT_EQ(d.decision, "Proceed with How do agents coordinate?");
    EXPECT_TRUE(d.context.empty());
    EXPECT_NE(err.str().find("[RetrievalFacade] Warning"), std::string::npos);
    EXPECT_EQ(facade.get_stats().failed_retrievals, 1u);
}

TEST_F(RetrievalFacadeTest, InitializeFailureDisablesRag) {
    Config broken = config_;
    broken.index_dir = dir_.path() / "broken";
    test::write_file(broken.index_file(), "{ corrupt");
    VectorIndex broken_index(broken);
    RetrievalFacade facade(base_, *gateway_, broken_index, broken);

    test::StreamCapture err(std::cerr);
    facade.initialize();

    EXPECT_FALSE(facade.enabled());
    EXPECT_FALSE(facade.decide("anything").rag_enhanced);
}

TEST_F(RetrievalFacadeTest, DeciderErrorsPropagate) {
    RetrievalFacade facade(base_, *gateway_, *index_, config_);
    EXPECT_THROW(facade.decide("explode"), std::runtime_error);
    EXPECT_EQ(facade.get_stats().queries_processed, 0u);
}

TEST_F(RetrievalFacadeTest, CountersSurviveConcurrentCallers) {
    RetrievalFacade facade(base_, *gateway_, *index_, config_);

    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&facade] {
            for (int i = 0; i < 25; ++i) facade.decide("How do agents coordinate?");
        });
    }
    for (auto& t : threads) t.join();

    auto stats = facade.get_stats();
    EXPECT_EQ(stats.queries_processed, 100u);
    EXPECT_EQ(stats.successful_retrievals, 100u);
    EXPECT_EQ(stats.index.retrievals, 100u);

    nlohmann::json j = stats;
    EXPECT_EQ(j["queries_processed"], 100);
    EXPECT_TRUE(j.contains("vector_store_stats"));
    EXPECT_TRUE(j.contains("embedder_stats"));
}
