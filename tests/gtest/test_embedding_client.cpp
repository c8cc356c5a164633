#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "hybridrag/clients/embedding_client.hpp"
#include "hybridrag/error.hpp"
#include "mock_http_client.hpp"

#include <boost/json.hpp>

#include <memory>

using namespace hybridrag;
using hybridrag::test::http_response;
using hybridrag::test::MockHttpClient;
using ::testing::_;
using ::testing::DoAll;
using ::testing::Return;
using ::testing::SaveArg;

namespace json = boost::json;

namespace {

class EmbeddingClientTest : public ::testing::Test {
protected:
    void SetUp() override {
        http_ = std::make_shared<MockHttpClient>();
        client_ = std::make_unique<EmbeddingClient>(http_, "all-minilm", 2, "key-1");
    }

    std::shared_ptr<MockHttpClient> http_;
    std::unique_ptr<EmbeddingClient> client_;
};

} // namespace

TEST_F(EmbeddingClientTest, RequestListsInputsAndModel) {
    const auto root = json::parse(client_->build_request({"one", "two"})).as_object();
    EXPECT_EQ(root.at("model").as_string(), "all-minilm");
    EXPECT_EQ(root.at("input").as_array().size(), 2u);
    EXPECT_EQ(root.at("input").as_array()[1].as_string(), "two");
    EXPECT_EQ(root.at("encoding_format").as_string(), "float");
}

TEST_F(EmbeddingClientTest, ResponseIsReorderedByIndex) {
    auto vectors = client_->parse_response(R"({"data":[
        {"index":1,"embedding":[3.0,4.0]},
        {"index":0,"embedding":[1.0,2]}
    ]})", 2);

    ASSERT_EQ(vectors.size(), 2u);
    EXPECT_EQ(vectors[0], (std::vector<float>{1.0f, 2.0f}));
    EXPECT_EQ(vectors[1], (std::vector<float>{3.0f, 4.0f}));
}

TEST_F(EmbeddingClientTest, RejectsMismatchedResponses) {
    // Wrong count.
    EXPECT_THROW(client_->parse_response(R"({"data":[{"embedding":[1,2]}]})", 2), ProtocolError);
    // Wrong dimension.
    EXPECT_THROW(client_->parse_response(R"({"data":[{"embedding":[1,2,3]}]})", 1), ProtocolError);
    // Repeated index.
    EXPECT_THROW(client_->parse_response(
                     R"({"data":[{"index":0,"embedding":[1,2]},{"index":0,"embedding":[1,2]}]})", 2),
                 ProtocolError);
    EXPECT_THROW(client_->parse_response("[]", 1), ProtocolError);
}

TEST_F(EmbeddingClientTest, EmbedPostsWithBearerKey) {
    HttpRequest sent;
    EXPECT_CALL(*http_, send(_, _))
        .WillOnce(DoAll(SaveArg<0>(&sent), Return(http_response(200, R"({"data":[{"embedding":[0.5,0.5]}]})"))));

    auto vector = client_->embed_one("hello");
    EXPECT_EQ(vector, (std::vector<float>{0.5f, 0.5f}));
    EXPECT_EQ(sent.method, "POST");
    EXPECT_EQ(sent.target, "/v1/embeddings");
    EXPECT_EQ(sent.headers.at("Authorization"), "Bearer key-1");
}

TEST_F(EmbeddingClientTest, EmptyInputMakesNoCall) {
    EXPECT_CALL(*http_, send(_, _)).Times(0);
    EXPECT_TRUE(client_->embed({}, {}).empty());
}

TEST_F(EmbeddingClientTest, ErrorStatusIsTransportError) {
    EXPECT_CALL(*http_, send(_, _)).WillOnce(Return(http_response(429, "rate limited")));
    EXPECT_THROW(client_->embed_one("hello"), TransportError);
}

TEST(EmbeddingClientConstructionTest, RequiresTransportAndDimension) {
    EXPECT_THROW(EmbeddingClient(nullptr, "m", 4), InvalidArgumentError);
    EXPECT_THROW(EmbeddingClient(std::make_shared<MockHttpClient>(), "m", 0), InvalidArgumentError);
}
