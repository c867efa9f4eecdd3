#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <nlohmann/json.hpp>
#include "relevance_model.hpp"
#include "errors.hpp"

using namespace hsn_assistance;
using ::testing::ElementsAre;
using ::testing::DoubleEq;

TEST(CrossEncoderClientTest, BuildsRequestWithQueryDocumentsAndModel) {
    auto body = CrossEncoderClient::build_request("natural rubber latex", {"doc a", "doc b"}, "bge-reranker-base");
    auto j = nlohmann::json::parse(body);
    EXPECT_EQ(j["query"], "natural rubber latex");
    ASSERT_EQ(j["documents"].size(), 2u);
    EXPECT_EQ(j["documents"][1], "doc b");
    EXPECT_EQ(j["model"], "bge-reranker-base");
}

TEST(CrossEncoderClientTest, ParseResponseRestoresInputOrder) {
    std::string body = R"({"results": [
        {"index": 2, "relevance_score": 0.9},
        {"index": 0, "relevance_score": 0.1},
        {"index": 1, "relevance_score": 0.5}
    ]})";
    auto scores = CrossEncoderClient::parse_response(body, 3);
    EXPECT_THAT(scores, ElementsAre(DoubleEq(0.1), DoubleEq(0.5), DoubleEq(0.9)));
}

TEST(CrossEncoderClientTest, ParseResponseRejectsOutOfRangeIndex) {
    std::string body = R"({"results": [{"index": 3, "relevance_score": 0.9}]})";
    EXPECT_THROW(CrossEncoderClient::parse_response(body, 3), RerankError);
}

TEST(CrossEncoderClientTest, ParseResponseRejectsMissingScores) {
    std::string body = R"({"results": [{"index": 0, "relevance_score": 0.9}]})";
    EXPECT_THROW(CrossEncoderClient::parse_response(body, 2), RerankError);
}

TEST(CrossEncoderClientTest, ParseResponseRejectsMalformedBody) {
    EXPECT_THROW(CrossEncoderClient::parse_response("not json", 1), RerankError);
    EXPECT_THROW(CrossEncoderClient::parse_response(R"({"scores": []})", 1), RerankError);
    EXPECT_THROW(CrossEncoderClient::parse_response(R"({"results": [{"index": 0}]})", 1), UpstreamError);
}

TEST(CrossEncoderClientTest, EmptyCandidateListNeedsNoCall) {
    CrossEncoderClient client("http://127.0.0.1:1/rerank", "m", 100);
    EXPECT_TRUE(client.score("query", {}).empty());
}

TEST(LexicalRelevanceModelTest, TokenizesLowercaseAlphanumerics) {
    EXPECT_THAT(LexicalRelevanceModel::tokenize("Natural-Rubber latex, 4001!"),
                ElementsAre("natural", "rubber", "latex", "4001"));
    EXPECT_TRUE(LexicalRelevanceModel::tokenize("  ,;- ").empty());
}

TEST(LexicalRelevanceModelTest, ScoresFractionOfDistinctQueryTokens) {
    LexicalRelevanceModel model;
    auto scores = model.score("rubber latex rubber",
                              {"Natural rubber latex", "Smoked sheets of rubber", "Balata"});
    EXPECT_THAT(scores, ElementsAre(DoubleEq(1.0), DoubleEq(0.5), DoubleEq(0.0)));
}

TEST(LexicalRelevanceModelTest, EmptyQueryScoresZero) {
    LexicalRelevanceModel model;
    EXPECT_THAT(model.score("", {"anything"}), ElementsAre(DoubleEq(0.0)));
}
