#include <gtest/gtest.h>
#include <atomic>
#include <cmath>
#include "engine/embedding_gateway.hpp"
#include "scry/errors.hpp"
#include "test_helpers.hpp"

using namespace scry;
using namespace scry::engine;

namespace {

    EmbeddingVector scaled_and_normalized(const std::string& text, size_t dimension) {
        auto v = mock_embedding(text, dimension);
        for (float& x : v) x *= 3.0f;
        normalize(v);
        return v;
    }

    double norm(const EmbeddingVector& v) {
        double sum = 0.0;
        for (float x : v) sum += static_cast<double>(x) * x;
        return std::sqrt(sum);
    }

    // Stands in for a remote service: unnormalized vectors, billed tokens.
    class ScaledEmbedder : public Embedder {
    public:
        ScaledEmbedder(size_t dimension, uint64_t tokens) : m_dimension(dimension), m_tokens(tokens) {}

        Embedding embed(const std::string& text) override {
            calls++;
            auto v = mock_embedding(text, m_dimension);
            for (float& x : v) x *= 3.0f;
            return {v, m_tokens};
        }
        size_t dimension() const override { return m_dimension; }
        std::string name() const override { return "scaled"; }

        std::atomic<int> calls{0};

    private:
        size_t m_dimension;
        uint64_t m_tokens;
    };

    class FailingEmbedder : public Embedder {
    public:
        explicit FailingEmbedder(size_t dimension) : m_dimension(dimension) {}

        Embedding embed(const std::string&) override {
            throw RemoteBackendError("service unavailable", 503);
        }
        size_t dimension() const override { return m_dimension; }
        std::string name() const override { return "failing"; }

    private:
        size_t m_dimension;
    };

    class WrongWidthEmbedder : public Embedder {
    public:
        Embedding embed(const std::string&) override { return {EmbeddingVector(7, 1.0f), 0}; }
        size_t dimension() const override { return 7; }
        std::string name() const override { return "wrong"; }
    };

}

class GatewayTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_ = test::make_config(dir_.path(), 32);
    }

    test::TempDir dir_;
    Config config_;
};

TEST_F(GatewayTest, MockProviderMatchesMockEmbedding) {
    EmbeddingGateway gateway(config_);
    EXPECT_EQ(gateway.embed("hello"), mock_embedding("hello", 32));

    auto stats = gateway.get_stats();
    EXPECT_EQ(stats.provider, "mock");
    EXPECT_EQ(stats.queries_processed, 1u);
    EXPECT_EQ(stats.tokens_used, 0u);
    EXPECT_EQ(stats.fallbacks, 0u);
}

TEST_F(GatewayTest, RemoteVectorsAreNormalizedAndTokensCounted) {
    config_.provider = Config::Provider::REMOTE;
    EmbeddingGateway gateway(config_, std::make_unique<ScaledEmbedder>(32, 500));

    auto v = gateway.embed("alpha");
    gateway.embed("beta");

    EXPECT_NEAR(norm(v), 1.0, 1e-6);
    EXPECT_EQ(v, scaled_and_normalized("alpha", 32));

    auto stats = gateway.get_stats();
    EXPECT_EQ(stats.provider, "openai");
    EXPECT_EQ(stats.queries_processed, 2u);
    EXPECT_EQ(stats.tokens_used, 1000u);
    EXPECT_NEAR(stats.cost_estimate, 1000.0 / 1000000.0 * 0.02, 1e-12);
}

TEST_F(GatewayTest, RemoteFailureFallsBackToMock) {
    config_.provider = Config::Provider::REMOTE;
    EmbeddingGateway gateway(config_, std::make_unique<FailingEmbedder>(32));

    test::StreamCapture err(std::cerr);
    auto v = gateway.embed("query");

    EXPECT_EQ(v, mock_embedding("query", 32));
    EXPECT_NE(err.str().find("[EmbeddingGateway] Warning"), std::string::npos);
    EXPECT_EQ(gateway.get_stats().fallbacks, 1u);
}

TEST_F(GatewayTest, RemoteFailurePropagatesWithoutFallback) {
    config_.provider = Config::Provider::REMOTE;
    config_.fallback_to_mock = false;
    EmbeddingGateway gateway(config_, std::make_unique<FailingEmbedder>(32));

    try {
        gateway.embed("query");
        FAIL() << "expected RemoteBackendError";
    } catch (const RemoteBackendError& e) {
        EXPECT_EQ(e.status(), 503);
    }
}

TEST_F(GatewayTest, InvalidCredentialYieldsUnitVectorAndWarning) {
    config_.provider = Config::Provider::REMOTE;
    config_.api_key = "sk-invalid";
    config_.embedding_endpoint = "http://127.0.0.1:9/v1/embeddings";
    config_.request_timeout_ms = 2000;
    EmbeddingGateway gateway(config_);

    test::StreamCapture err(std::cerr);
    auto v = gateway.embed("the quick brown fox");

    ASSERT_EQ(v.size(), 32u);
    EXPECT_NEAR(norm(v), 1.0, 1e-6);
    EXPECT_NE(err.str().find("Warning"), std::string::npos);
}

TEST_F(GatewayTest, MissingKeyFallsBackToMock) {
    config_.provider = Config::Provider::REMOTE;
    config_.api_key.clear();

    test::StreamCapture err(std::cerr);
    EmbeddingGateway gateway(config_);
    EXPECT_EQ(gateway.embed("x"), mock_embedding("x", 32));
    EXPECT_EQ(gateway.get_stats().fallbacks, 1u);
}

TEST_F(GatewayTest, LocalWithoutModelDegradesOnce) {
    config_.provider = Config::Provider::LOCAL;
    config_.local_model_path = (dir_.path() / "missing.onnx").string();
    config_.local_vocab_path = (dir_.path() / "missing.txt").string();
    EmbeddingGateway gateway(config_);

    test::StreamCapture err(std::cerr);
    auto a = gateway.embed("one");
    auto b = gateway.embed("two");

    EXPECT_TRUE(gateway.degraded());
    EXPECT_EQ(a, mock_embedding("one", 32));
    EXPECT_EQ(b, mock_embedding("two", 32));
    EXPECT_EQ(gateway.get_stats().fallbacks, 2u);

    // The init warning is logged once, not per call.
    const std::string log = err.str();
    auto first = log.find("local model unavailable");
    ASSERT_NE(first, std::string::npos);
    EXPECT_EQ(log.find("local model unavailable", first + 1), std::string::npos);
}

TEST_F(GatewayTest, LocalWithoutModelThrowsWhenFallbackDisabled) {
    config_.provider = Config::Provider::LOCAL;
    config_.local_model_path = (dir_.path() / "missing.onnx").string();
    config_.fallback_to_mock = false;
    EmbeddingGateway gateway(config_);

    test::StreamCapture err(std::cerr);
    EXPECT_THROW(gateway.embed("x"), BackendInitError);
}

TEST_F(GatewayTest, WrongWidthIsRejected) {
    config_.provider = Config::Provider::LOCAL;
    EmbeddingGateway gateway(config_, std::make_unique<WrongWidthEmbedder>());
    EXPECT_THROW(gateway.embed("x"), DimensionMismatchError);
}

TEST_F(GatewayTest, BatchKeepsInputOrder) {
    config_.batch_size = 3;
    EmbeddingGateway gateway(config_);

    std::vector<std::string> texts;
    for (int i = 0; i < 10; ++i) texts.push_back("text " + std::to_string(i));

    auto out = gateway.embed_batch(texts);
    ASSERT_EQ(out.size(), texts.size());
    for (size_t i = 0; i < texts.size(); ++i) EXPECT_EQ(out[i], mock_embedding(texts[i], 32));
    EXPECT_TRUE(gateway.embed_batch({}).empty());
}

TEST_F(GatewayTest, ParallelRemoteBatchKeepsInputOrder) {
    config_.provider = Config::Provider::REMOTE;
    config_.batch_size = 4;
    config_.embed_concurrency = 3;
    auto backend = std::make_unique<ScaledEmbedder>(32, 10);
    auto* raw = backend.get();
    EmbeddingGateway gateway(config_, std::move(backend));

    std::vector<std::string> texts;
    for (int i = 0; i < 11; ++i) texts.push_back("chunk " + std::to_string(i));

    auto out = gateway.embed_batch(texts);
    ASSERT_EQ(out.size(), texts.size());
    for (size_t i = 0; i < texts.size(); ++i) {
        EXPECT_EQ(out[i], scaled_and_normalized(texts[i], 32)) << i;
    }
    EXPECT_EQ(raw->calls.load(), 11);
    EXPECT_EQ(gateway.get_stats().tokens_used, 110u);
}
