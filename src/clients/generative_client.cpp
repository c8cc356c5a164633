#include "hybridrag/clients/generative_client.hpp"
#include "hybridrag/clients/json_util.hpp"
#include "hybridrag/error.hpp"
#include "hybridrag/logging.hpp"

#include <boost/json.hpp>

namespace json = boost::json;

namespace hybridrag {

std::vector<std::string> SseDecoder::feed(std::string_view chunk) {
    std::vector<std::string> events;
    if (done_) {
        return events;
    }
    pending_.append(chunk.data(), chunk.size());

    std::size_t start = 0;
    for (;;) {
        const std::size_t end = pending_.find('\n', start);
        if (end == std::string::npos) {
            break;
        }
        std::string_view line(pending_.data() + start, end - start);
        if (!line.empty() && line.back() == '\r') {
            line.remove_suffix(1);
        }
        take_line(line, events);
        start = end + 1;
        if (done_) {
            break;
        }
    }
    pending_.erase(0, start);
    return events;
}

void SseDecoder::take_line(std::string_view line, std::vector<std::string>& events) {
    if (line.empty()) {
        // Blank line dispatches the event.
        if (has_data_) {
            events.push_back(std::move(data_));
            data_.clear();
            has_data_ = false;
        }
        return;
    }
    if (line.front() == ':') {
        return;  // comment / keep-alive
    }

    const std::size_t colon = line.find(':');
    const std::string_view name = line.substr(0, colon);
    std::string_view value;
    if (colon != std::string_view::npos) {
        value = line.substr(colon + 1);
        if (!value.empty() && value.front() == ' ') {
            value.remove_prefix(1);
        }
    }
    if (name != "data") {
        return;
    }

    if (value == "[DONE]") {
        if (has_data_) {
            events.push_back(std::move(data_));
            data_.clear();
            has_data_ = false;
        }
        done_ = true;
        return;
    }
    if (has_data_) {
        data_ += '\n';
    }
    data_.append(value.data(), value.size());
    has_data_ = true;
}

GenerativeClient::GenerativeClient(std::shared_ptr<HttpClient> http_client,
                                   std::string model,
                                   std::string api_key,
                                   std::string base_path,
                                   std::uint32_t max_tokens,
                                   double temperature)
    : http_client_(std::move(http_client))
    , model_(std::move(model))
    , api_key_(std::move(api_key))
    , base_path_(std::move(base_path))
    , max_tokens_(max_tokens)
    , temperature_(temperature) {
    HYBRIDRAG_CHECK_ARGUMENT(http_client_, "http client is required");
    HYBRIDRAG_CHECK_ARGUMENT(!model_.empty(), "model is required");
    while (!base_path_.empty() && base_path_.back() == '/') {
        base_path_.pop_back();
    }
}

std::string GenerativeClient::build_request(const GenerationPrompt& prompt) const {
    json::array messages;
    messages.emplace_back(json::object{{"role", "system"}, {"content", prompt.system}});
    messages.emplace_back(json::object{{"role", "user"}, {"content", prompt.user}});

    json::object root;
    root["model"] = model_;
    root["messages"] = std::move(messages);
    root["max_tokens"] = max_tokens_;
    root["temperature"] = temperature_;
    root["stream"] = true;
    return json::serialize(root);
}

std::string GenerativeClient::parse_delta(const std::string& event_data) {
    const json::value root = json_util::parse(event_data, "completion chunk");
    const auto& chunk = json_util::object_at(root, "completion chunk");

    if (auto it = chunk.find("error"); it != chunk.end()) {
        std::string message = json_util::scalar_to_string(it->value());
        if (it->value().is_object()) {
            message = json_util::string_or(it->value().get_object(), "message", message);
        }
        throw GenerationFailure("provider reported an error mid-stream", message);
    }

    auto choices_it = chunk.find("choices");
    if (choices_it == chunk.end() || !choices_it->value().is_array()) {
        return {};
    }
    const auto& choices = choices_it->value().get_array();
    if (choices.empty() || !choices.front().is_object()) {
        return {};
    }
    const auto& choice = choices.front().get_object();
    auto delta_it = choice.find("delta");
    if (delta_it == choice.end() || !delta_it->value().is_object()) {
        return {};
    }
    return json_util::string_or(delta_it->value().get_object(), "content");
}

void GenerativeClient::generate(const GenerationPrompt& prompt, FragmentChannel& channel,
                                const CancellationToken& token) {
    HttpRequest request;
    request.method = "POST";
    request.target = base_path_ + "/chat/completions";
    request.body = build_request(prompt);
    request.headers["Accept"] = "text/event-stream";
    if (!api_key_.empty()) {
        request.headers["Authorization"] = "Bearer " + api_key_;
    }

    SseDecoder decoder;
    std::size_t fragments = 0;
    bool stopped = false;

    try {
        http_client_->send_streaming(
            request,
            [&](std::string_view bytes) {
                for (const auto& event : decoder.feed(bytes)) {
                    std::string delta = parse_delta(event);
                    if (delta.empty()) {
                        continue;
                    }
                    ++fragments;
                    if (!channel.push(std::move(delta))) {
                        stopped = true;
                        return false;
                    }
                }
                return !decoder.done();
            },
            token);
    } catch (const TransportError& e) {
        throw GenerationFailure(std::string("completion stream failed: ") + e.what(), model_);
    }

    if (stopped) {
        HYBRIDRAG_LOG_DEBUG("generation for {} stopped by consumer after {} fragments", model_, fragments);
        return;
    }
    token.throw_if_cancelled();
    if (!decoder.done()) {
        HYBRIDRAG_LOG_WARN("completion stream from {} ended without [DONE] after {} fragments", model_, fragments);
    }
}

} // namespace hybridrag
