#include "embedder.hpp"
#include "tokenizer.hpp"
#include "scry/errors.hpp"
#include <iostream>
#include <vector>
#include <filesystem>

#ifdef SCRY_WITH_ONNX
#include <onnxruntime_cxx_api.h>
#endif

namespace scry::engine {

    class OnnxEmbedder : public Embedder {
    public:
        OnnxEmbedder(const std::string& model_path, const std::string& vocab_path, size_t dimension)
            : m_dimension(dimension) {
#ifdef SCRY_WITH_ONNX
            if (!std::filesystem::exists(model_path)) {
                throw BackendInitError("model file not found: " + model_path);
            }
            m_tokenizer = std::make_unique<Tokenizer>(vocab_path);

            try {
                m_env = std::make_unique<Ort::Env>(ORT_LOGGING_LEVEL_WARNING, "scry");

                Ort::SessionOptions session_options;
                session_options.SetIntraOpNumThreads(1);
                session_options.SetGraphOptimizationLevel(GraphOptimizationLevel::ORT_ENABLE_ALL);

                m_session = std::make_unique<Ort::Session>(*m_env, model_path.c_str(), session_options);
            } catch (const Ort::Exception& e) {
                throw BackendInitError(std::string("ONNX session failed: ") + e.what());
            }

            // Probe once so a model of the wrong width is rejected up front.
            size_t width = run("dimension probe").size();
            if (width != m_dimension) {
                throw BackendInitError("model produces " + std::to_string(width) +
                                       "-d vectors, configured dimension is " + std::to_string(m_dimension));
            }
            std::cout << "[OnnxEmbedder] Loaded: " << model_path << " (" << width << "-d)\n";
#else
            (void)model_path;
            (void)vocab_path;
            throw BackendInitError("compiled without ONNX Runtime support");
#endif
        }

        Embedding embed(const std::string& text) override {
#ifdef SCRY_WITH_ONNX
            return {run(text), 0};
#else
            (void)text;
            throw BackendInitError("compiled without ONNX Runtime support");
#endif
        }

        size_t dimension() const override { return m_dimension; }
        std::string name() const override { return "local"; }

    private:
        size_t m_dimension;

#ifdef SCRY_WITH_ONNX
        std::unique_ptr<Ort::Env> m_env;
        std::unique_ptr<Ort::Session> m_session;
        std::unique_ptr<Tokenizer> m_tokenizer;

        EmbeddingVector run(const std::string& text) {
            auto input_ids = m_tokenizer->encode(text);
            size_t seq_length = input_ids.size();

            std::vector<int64_t> token_type_ids(seq_length, 0);
            std::vector<int64_t> attention_mask(seq_length, 1);
            std::vector<int64_t> input_shape = { 1, static_cast<int64_t>(seq_length) };

            auto memory_info = Ort::MemoryInfo::CreateCpu(OrtArenaAllocator, OrtMemTypeDefault);

            std::vector<Ort::Value> input_tensors;
            input_tensors.push_back(Ort::Value::CreateTensor<int64_t>(memory_info, input_ids.data(), input_ids.size(), input_shape.data(), input_shape.size()));
            input_tensors.push_back(Ort::Value::CreateTensor<int64_t>(memory_info, attention_mask.data(), attention_mask.size(), input_shape.data(), input_shape.size()));
            input_tensors.push_back(Ort::Value::CreateTensor<int64_t>(memory_info, token_type_ids.data(), token_type_ids.size(), input_shape.data(), input_shape.size()));

            const char* input_names[] = { "input_ids", "attention_mask", "token_type_ids" };
            const char* output_names[] = { "last_hidden_state" };

            EmbeddingVector embedding;
            try {
                auto output_tensors = m_session->Run(Ort::RunOptions{nullptr}, input_names, input_tensors.data(), 3, output_names, 1);

                // Output shape: [batch, seq, hidden]
                const float* data = output_tensors[0].GetTensorData<float>();
                auto shape = output_tensors[0].GetTensorTypeAndShapeInfo().GetShape();
                size_t hidden_size = static_cast<size_t>(shape[2]);

                // Mean pooling over the (all-ones) attention mask.
                embedding.assign(hidden_size, 0.0f);
                for (size_t i = 0; i < seq_length; ++i) {
                    for (size_t j = 0; j < hidden_size; ++j) {
                        embedding[j] += data[i * hidden_size + j];
                    }
                }
                for (float& val : embedding) val /= static_cast<float>(seq_length);
            } catch (const Ort::Exception& e) {
                throw Error(std::string("ONNX inference failed: ") + e.what());
            }

            normalize(embedding);
            return embedding;
        }
#endif
    };

    std::unique_ptr<Embedder> create_onnx_embedder(const std::string& model_path, const std::string& vocab_path, size_t dimension) {
        return std::make_unique<OnnxEmbedder>(model_path, vocab_path, dimension);
    }

}
