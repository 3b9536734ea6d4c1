#include "embedder.hpp"
#include "http.hpp"
#include "scry/errors.hpp"
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace scry::engine {

    class OpenAIEmbedder : public Embedder {
    public:
        OpenAIEmbedder(const std::string& api_key, const std::string& model, size_t dimension,
                       const std::string& endpoint, long timeout_ms)
            : m_api_key(api_key), m_model(model), m_dimension(dimension),
              m_endpoint(endpoint), m_timeout_ms(timeout_ms) {
            if (m_api_key.empty()) {
                throw BackendInitError("no API key configured for the remote embedding backend");
            }
        }

        Embedding embed(const std::string& text) override {
            json body = {
                {"model", m_model},
                {"input", text},
                {"dimensions", m_dimension}
            };
            std::string payload = body.dump(-1, ' ', false, json::error_handler_t::replace);

            auto response = http::post_json(m_endpoint, payload,
                                             {"Authorization: Bearer " + m_api_key}, m_timeout_ms);

            json resp_json;
            try {
                resp_json = json::parse(response.body);
            } catch (const json::parse_error& e) {
                throw RemoteBackendError(std::string("embedding API returned malformed JSON: ") + e.what(), response.status);
            }

            if (resp_json.contains("error")) {
                const auto& err = resp_json["error"];
                std::string message = err.is_object() ? err.value("message", err.dump()) : err.dump();
                throw RemoteBackendError("embedding API error: " + message, response.status);
            }
            if (!response.ok()) {
                throw RemoteBackendError("embedding API returned HTTP " + std::to_string(response.status), response.status);
            }

            Embedding result;
            try {
                result.vector = resp_json.at("data").at(0).at("embedding").get<EmbeddingVector>();
                if (resp_json.contains("usage") && resp_json["usage"].contains("total_tokens")) {
                    result.tokens = resp_json["usage"]["total_tokens"].get<uint64_t>();
                }
            } catch (const json::exception& e) {
                throw RemoteBackendError(std::string("unexpected embedding response: ") + e.what(), response.status);
            }
            return result;
        }

        size_t dimension() const override { return m_dimension; }
        std::string name() const override { return "openai"; }

    private:
        std::string m_api_key;
        std::string m_model;
        size_t m_dimension;
        std::string m_endpoint;
        long m_timeout_ms;
    };

    std::unique_ptr<Embedder> create_openai_embedder(const std::string& api_key,
                                                     const std::string& model,
                                                     size_t dimension,
                                                     const std::string& endpoint,
                                                     long timeout_ms) {
        return std::make_unique<OpenAIEmbedder>(api_key, model, dimension, endpoint, timeout_ms);
    }

}
