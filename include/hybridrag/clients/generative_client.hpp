#pragma once

#include "hybridrag/clients/http_client.hpp"
#include "hybridrag/collaborators.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace hybridrag {

/**
 * Incremental decoder for a text/event-stream body. Bytes arrive in
 * arbitrary pieces; complete events come out. Only the data field is kept,
 * multi-line data is joined with '\n'. The "[DONE]" sentinel ends the
 * stream and is not returned as an event.
 */
class SseDecoder {
public:
    std::vector<std::string> feed(std::string_view chunk);

    bool done() const { return done_; }

private:
    void take_line(std::string_view line, std::vector<std::string>& events);

    std::string pending_;
    std::string data_;
    bool has_data_ = false;
    bool done_ = false;
};

/**
 * OpenAI-compatible streaming chat completions client. Works against
 * OpenAI, Groq and Ollama; the provider only changes the endpoint, base
 * path and key.
 */
class GenerativeClient : public GenerativeBackend {
public:
    GenerativeClient(std::shared_ptr<HttpClient> http_client,
                     std::string model,
                     std::string api_key,
                     std::string base_path = "/v1",
                     std::uint32_t max_tokens = 200,
                     double temperature = 0.7);

    void generate(const GenerationPrompt& prompt, FragmentChannel& channel,
                  const CancellationToken& token) override;

    std::string build_request(const GenerationPrompt& prompt) const;

    // Content delta of one streamed chunk; empty when the chunk carries none.
    static std::string parse_delta(const std::string& event_data);

    const std::string& model() const { return model_; }

private:
    std::shared_ptr<HttpClient> http_client_;
    std::string model_;
    std::string api_key_;
    std::string base_path_;
    std::uint32_t max_tokens_;
    double temperature_;
};

} // namespace hybridrag
