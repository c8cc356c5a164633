#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "hybridrag/clients/generative_client.hpp"
#include "hybridrag/error.hpp"
#include "hybridrag/fragment_channel.hpp"
#include "mock_http_client.hpp"

#include <boost/json.hpp>

#include <chrono>
#include <memory>
#include <string>
#include <vector>

using namespace hybridrag;
using namespace std::chrono_literals;
using hybridrag::test::MockHttpClient;
using ::testing::_;
using ::testing::Invoke;
using ::testing::Throw;

namespace json = boost::json;

namespace {

std::string chunk_event(const std::string& content) {
    json::object delta{{"content", content}};
    json::object choice{{"index", 0}, {"delta", std::move(delta)}};
    json::array choices;
    choices.emplace_back(std::move(choice));
    return "data: " + json::serialize(json::object{{"choices", std::move(choices)}}) + "\n\n";
}

// Drains everything already in the channel.
std::vector<std::string> drain(FragmentChannel& channel, FragmentChannel::EventKind* last = nullptr) {
    std::vector<std::string> fragments;
    for (;;) {
        auto event = channel.pop_until(std::chrono::steady_clock::now() + 100ms);
        if (event.kind != FragmentChannel::EventKind::kFragment) {
            if (last) {
                *last = event.kind;
            }
            return fragments;
        }
        fragments.push_back(event.fragment);
    }
}

// Replays a body to the handler in the given pieces, stopping when it says so.
auto replay(std::vector<std::string> pieces) {
    return [pieces = std::move(pieces)](const HttpRequest&, const HttpClient::ChunkHandler& handler,
                                        const CancellationToken&) -> unsigned {
        for (const auto& piece : pieces) {
            if (!handler(piece)) {
                break;
            }
        }
        return 200u;
    };
}

} // namespace

TEST(SseDecoderTest, EventsSplitAcrossChunks) {
    SseDecoder decoder;
    EXPECT_TRUE(decoder.feed("data: {\"a\"").empty());
    EXPECT_TRUE(decoder.feed(":1}\r\n").empty());
    auto events = decoder.feed("\r\ndata: second\n\n");
    EXPECT_EQ(events, (std::vector<std::string>{"{\"a\":1}", "second"}));
    EXPECT_FALSE(decoder.done());
}

TEST(SseDecoderTest, IgnoresCommentsAndOtherFields) {
    SseDecoder decoder;
    auto events = decoder.feed(": keep-alive\n\nevent: message\nid: 7\ndata: payload\n\n");
    EXPECT_EQ(events, (std::vector<std::string>{"payload"}));
}

TEST(SseDecoderTest, JoinsMultiLineData) {
    SseDecoder decoder;
    auto events = decoder.feed("data: line one\ndata: line two\n\n");
    EXPECT_EQ(events, (std::vector<std::string>{"line one\nline two"}));
}

TEST(SseDecoderTest, DoneEndsTheStream) {
    SseDecoder decoder;
    auto events = decoder.feed("data: last\n\ndata: [DONE]\n\ndata: ignored\n\n");
    EXPECT_EQ(events, (std::vector<std::string>{"last"}));
    EXPECT_TRUE(decoder.done());
    EXPECT_TRUE(decoder.feed("data: more\n\n").empty());
}

TEST(GenerativeClientTest, RequestAsksForStreaming) {
    GenerativeClient client(std::make_shared<MockHttpClient>(), "llama-3.1-8b-instant", "k", "/openai/v1/", 150, 0.2);
    const auto root = json::parse(client.build_request({"sys", "usr"})).as_object();

    EXPECT_EQ(root.at("model").as_string(), "llama-3.1-8b-instant");
    EXPECT_TRUE(root.at("stream").as_bool());
    EXPECT_EQ(root.at("max_tokens").to_number<std::int64_t>(), 150);
    EXPECT_DOUBLE_EQ(root.at("temperature").to_number<double>(), 0.2);

    const auto& messages = root.at("messages").as_array();
    ASSERT_EQ(messages.size(), 2u);
    EXPECT_EQ(messages[0].as_object().at("role").as_string(), "system");
    EXPECT_EQ(messages[1].as_object().at("content").as_string(), "usr");
}

TEST(GenerativeClientTest, ParseDelta) {
    EXPECT_EQ(GenerativeClient::parse_delta(R"({"choices":[{"delta":{"content":"Hi"}}]})"), "Hi");
    EXPECT_EQ(GenerativeClient::parse_delta(R"({"choices":[{"delta":{"role":"assistant"}}]})"), "");
    EXPECT_EQ(GenerativeClient::parse_delta(R"({"choices":[]})"), "");
    EXPECT_THROW(GenerativeClient::parse_delta(R"({"error":{"message":"quota exceeded"}})"), GenerationFailure);
    EXPECT_THROW(GenerativeClient::parse_delta("not json"), ProtocolError);
}

TEST(GenerativeClientTest, StreamsDeltasIntoChannel) {
    auto http = std::make_shared<MockHttpClient>();
    HttpRequest sent;
    EXPECT_CALL(*http, send_streaming(_, _, _))
        .WillOnce(Invoke([&sent](const HttpRequest& request, const HttpClient::ChunkHandler& handler,
                                 const CancellationToken& token) {
            sent = request;
            return replay({chunk_event("Hybrid "), chunk_event("search") + "data: [DONE]\n\n"})(request, handler,
                                                                                             token);
        }));

    GenerativeClient client(http, "gpt-4o-mini", "sk-test", "/v1");
    FragmentChannel channel;
    client.generate({"sys", "usr"}, channel, {});
    channel.close();

    FragmentChannel::EventKind last = FragmentChannel::EventKind::kFragment;
    EXPECT_EQ(drain(channel, &last), (std::vector<std::string>{"Hybrid ", "search"}));
    EXPECT_EQ(last, FragmentChannel::EventKind::kClosed);

    EXPECT_EQ(sent.target, "/v1/chat/completions");
    EXPECT_EQ(sent.headers.at("Authorization"), "Bearer sk-test");
    EXPECT_EQ(sent.headers.at("Accept"), "text/event-stream");
}

TEST(GenerativeClientTest, StopsWhenConsumerCancels) {
    auto http = std::make_shared<MockHttpClient>();
    int delivered = 0;
    EXPECT_CALL(*http, send_streaming(_, _, _))
        .WillOnce(Invoke([&delivered](const HttpRequest&, const HttpClient::ChunkHandler& handler,
                                      const CancellationToken&) -> unsigned {
            for (const auto& word : {"a", "b", "c"}) {
                ++delivered;
                if (!handler(chunk_event(word))) {
                    break;
                }
            }
            return 200u;
        }));

    GenerativeClient client(http, "m", "");
    FragmentChannel channel;
    channel.cancel();
    EXPECT_NO_THROW(client.generate({"s", "u"}, channel, {}));
    EXPECT_EQ(delivered, 1);
}

TEST(GenerativeClientTest, TransportErrorBecomesGenerationFailure) {
    auto http = std::make_shared<MockHttpClient>();
    EXPECT_CALL(*http, send_streaming(_, _, _))
        .WillOnce(Throw(TransportError(ErrorCode::HTTP_STATUS, "HTTP 500")));

    GenerativeClient client(http, "m", "");
    FragmentChannel channel;
    EXPECT_THROW(client.generate({"s", "u"}, channel, {}), GenerationFailure);
}

TEST(GenerativeClientTest, ProviderErrorMidStreamIsGenerationFailure) {
    auto http = std::make_shared<MockHttpClient>();
    EXPECT_CALL(*http, send_streaming(_, _, _))
        .WillOnce(Invoke(replay({chunk_event("partial"), "data: {\"error\":{\"message\":\"overloaded\"}}\n\n"})));

    GenerativeClient client(http, "m", "");
    FragmentChannel channel;
    EXPECT_THROW(client.generate({"s", "u"}, channel, {}), GenerationFailure);
    EXPECT_EQ(drain(channel), (std::vector<std::string>{"partial"}));
}

TEST(GenerativeClientTest, StreamEndingWithoutDoneStillSucceeds) {
    auto http = std::make_shared<MockHttpClient>();
    EXPECT_CALL(*http, send_streaming(_, _, _)).WillOnce(Invoke(replay({chunk_event("only")})));

    GenerativeClient client(http, "m", "");
    FragmentChannel channel;
    EXPECT_NO_THROW(client.generate({"s", "u"}, channel, {}));
    EXPECT_EQ(drain(channel), (std::vector<std::string>{"only"}));
}
