#pragma once

#include "hybridrag/clients/http_client.hpp"
#include "hybridrag/collaborators.hpp"

#include <memory>
#include <string>
#include <vector>

namespace hybridrag {

/**
 * OpenAI-compatible embedding service client (POST /v1/embeddings).
 * Vectors are returned in input order and checked against the configured
 * dimension.
 */
class EmbeddingClient : public Embedder {
public:
    EmbeddingClient(std::shared_ptr<HttpClient> http_client, std::string model, std::size_t dimension,
                    std::string api_key = "");

    std::vector<std::vector<float>> embed(const std::vector<std::string>& texts,
                                          const CancellationToken& token) override;

    std::vector<float> embed_one(const std::string& text, const CancellationToken& token = {});

    std::size_t dimension() const override { return dimension_; }
    const std::string& model() const { return model_; }

    std::string build_request(const std::vector<std::string>& texts) const;
    std::vector<std::vector<float>> parse_response(const std::string& body, std::size_t expected) const;

private:
    std::shared_ptr<HttpClient> http_client_;
    std::string model_;
    std::size_t dimension_;
    std::string api_key_;
};

} // namespace hybridrag
