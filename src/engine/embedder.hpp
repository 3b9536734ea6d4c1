#pragma once

#include <string>
#include <vector>
#include <memory>
#include <cstdint>
#include "scry/types.hpp"

namespace scry::engine {

    struct Embedding {
        EmbeddingVector vector;
        uint64_t tokens = 0; // Billed tokens reported by the backend
    };

    /**
     * @brief Abstract base class for embedding generation.
     */
    class Embedder {
    public:
        virtual ~Embedder() = default;

        /**
         * @brief Generates an embedding vector for the given text.
         * @param text The input text chunk.
         * @return The vector plus any token usage the backend reported.
         */
        virtual Embedding embed(const std::string& text) = 0;

        /**
         * @brief Returns the dimension of the vectors produced by this embedder.
         */
        virtual size_t dimension() const = 0;

        virtual std::string name() const = 0;
    };

    /**
     * @brief Rolling hash used by the mock backend: h = h*31 + unit over the
     * UTF-16 code units, wrapped to int32, absolute value.
     */
    int64_t mock_hash(const std::string& text);

    /**
     * @brief Deterministic unit vector derived from mock_hash(text).
     */
    EmbeddingVector mock_embedding(const std::string& text, size_t dimension);

    /**
     * @brief Scales @p v to unit length in place. Zero vectors are left alone.
     */
    void normalize(EmbeddingVector& v);

    std::unique_ptr<Embedder> create_mock_embedder(size_t dimension);

    /**
     * @throws BackendInitError if the model cannot be loaded or its width differs from @p dimension.
     */
    std::unique_ptr<Embedder> create_onnx_embedder(const std::string& model_path, const std::string& vocab_path, size_t dimension);

    /**
     * @throws BackendInitError if @p api_key is empty.
     */
    std::unique_ptr<Embedder> create_openai_embedder(const std::string& api_key,
                                                     const std::string& model,
                                                     size_t dimension,
                                                     const std::string& endpoint,
                                                     long timeout_ms);

}
