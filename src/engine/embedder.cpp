#include "embedder.hpp"
#include "text.hpp"
#include <cmath>
#include <cstdlib>

namespace scry::engine {

    int64_t mock_hash(const std::string& text) {
        int32_t hash = 0;
        for (uint16_t unit : text::utf16_units(text)) {
            // Wrapping int32 arithmetic, done unsigned to stay defined.
            hash = static_cast<int32_t>(static_cast<uint32_t>(hash) * 31u + unit);
        }
        return std::llabs(static_cast<int64_t>(hash));
    }

    EmbeddingVector mock_embedding(const std::string& text, size_t dimension) {
        constexpr int64_t kModulus = 2147483647;
        const int64_t hash = mock_hash(text);

        std::vector<double> raw(dimension);
        double norm = 0.0;
        for (size_t i = 0; i < dimension; ++i) {
            int64_t seed = ((hash + static_cast<int64_t>(i)) * 16807) % kModulus;
            raw[i] = (static_cast<double>(seed) / kModulus) * 2.0 - 1.0;
            norm += raw[i] * raw[i];
        }
        norm = std::sqrt(norm);

        EmbeddingVector embedding(dimension);
        for (size_t i = 0; i < dimension; ++i) {
            embedding[i] = static_cast<float>(norm > 0.0 ? raw[i] / norm : raw[i]);
        }
        return embedding;
    }

    void normalize(EmbeddingVector& v) {
        double norm = 0.0;
        for (float x : v) norm += static_cast<double>(x) * x;
        norm = std::sqrt(norm);
        if (norm == 0.0) return;
        for (float& x : v) x = static_cast<float>(x / norm);
    }

    class MockEmbedder : public Embedder {
    public:
        explicit MockEmbedder(size_t dimension) : m_dimension(dimension) {}

        Embedding embed(const std::string& text) override {
            return {mock_embedding(text, m_dimension), 0};
        }

        size_t dimension() const override { return m_dimension; }
        std::string name() const override { return "mock"; }

    private:
        size_t m_dimension;
    };

    std::unique_ptr<Embedder> create_mock_embedder(size_t dimension) {
        return std::make_unique<MockEmbedder>(dimension);
    }

}
