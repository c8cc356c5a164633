#include "hybridrag/clients/embedding_client.hpp"
#include "hybridrag/clients/json_util.hpp"
#include "hybridrag/error.hpp"
#include "hybridrag/logging.hpp"

#include <boost/json.hpp>

namespace json = boost::json;

namespace hybridrag {

EmbeddingClient::EmbeddingClient(std::shared_ptr<HttpClient> http_client, std::string model,
                                 std::size_t dimension, std::string api_key)
    : http_client_(std::move(http_client))
    , model_(std::move(model))
    , dimension_(dimension)
    , api_key_(std::move(api_key)) {
    HYBRIDRAG_CHECK_ARGUMENT(http_client_, "http client is required");
    HYBRIDRAG_CHECK_ARGUMENT(dimension_ > 0, "embedding dimension must be positive");
}

std::string EmbeddingClient::build_request(const std::vector<std::string>& texts) const {
    json::object root;

    json::array input;
    for (const auto& text : texts) {
        input.emplace_back(text);
    }
    root["input"] = std::move(input);
    root["model"] = model_;
    root["encoding_format"] = "float";

    return json::serialize(root);
}

std::vector<std::vector<float>> EmbeddingClient::parse_response(const std::string& body,
                                                                std::size_t expected) const {
    const json::value root = json_util::parse(body, "embedding response");
    const auto& data = json_util::array_at(
        json_util::field(json_util::object_at(root, "embedding response"), "data", "embedding response"),
        "embedding data");

    if (data.size() != expected) {
        throw ProtocolError("embedding service returned " + std::to_string(data.size()) +
                            " vectors for " + std::to_string(expected) + " inputs");
    }

    std::vector<std::vector<float>> vectors(expected);
    for (std::size_t i = 0; i < data.size(); ++i) {
        const auto& item = json_util::object_at(data[i], "embedding item");
        // Entries carry their input position; fall back to array order.
        std::size_t index = i;
        if (auto it = item.find("index"); it != item.end()) {
            index = static_cast<std::size_t>(json_util::number(it->value(), "embedding index"));
        }
        if (index >= expected || !vectors[index].empty()) {
            throw ProtocolError("embedding index out of range or repeated: " + std::to_string(index));
        }

        const auto& values = json_util::array_at(json_util::field(item, "embedding", "embedding item"), "embedding");
        auto& vector = vectors[index];
        vector.reserve(values.size());
        for (const auto& value : values) {
            vector.push_back(static_cast<float>(json_util::number(value, "embedding component")));
        }
        if (vector.size() != dimension_) {
            throw ProtocolError("embedding dimension " + std::to_string(vector.size()) +
                                " does not match configured " + std::to_string(dimension_));
        }
    }
    return vectors;
}

std::vector<std::vector<float>> EmbeddingClient::embed(const std::vector<std::string>& texts,
                                                       const CancellationToken& token) {
    if (texts.empty()) {
        return {};
    }
    HYBRIDRAG_LOG_DEBUG("embedding {} texts with {}", texts.size(), model_);

    HttpRequest request;
    request.method = "POST";
    request.target = "/v1/embeddings";
    request.body = build_request(texts);
    if (!api_key_.empty()) {
        request.headers["Authorization"] = "Bearer " + api_key_;
    }

    HttpResponse response = http_client_->send(request, token);
    if (!response.ok()) {
        throw TransportError(ErrorCode::HTTP_STATUS,
                             "embedding service returned HTTP " + std::to_string(response.status),
                             response.body.substr(0, 256));
    }
    return parse_response(response.body, texts.size());
}

std::vector<float> EmbeddingClient::embed_one(const std::string& text, const CancellationToken& token) {
    auto vectors = embed({text}, token);
    return std::move(vectors.front());
}

} // namespace hybridrag
