#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "retrieval_strategies.hpp"
#include "graph/graph_builder.hpp"
#include "graph/in_memory_graph.hpp"
#include "graph/neo4j_graph.hpp"
#include "errors.hpp"
#include "test_helpers.hpp"

using namespace hsn_assistance;
using hsn_assistance::testing::MockRelevanceModel;
using hsn_assistance::testing::MockVectorStore;
using hsn_assistance::testing::make_doc;
using hsn_assistance::testing::make_record;
using ::testing::_;
using ::testing::ElementsAre;
using ::testing::Return;

namespace {

std::vector<std::string> codes_of(const std::vector<RetrievedDocument>& docs) {
    std::vector<std::string> codes;
    for (const auto& d : docs) codes.push_back(d.metadata.hsn_code);
    return codes;
}

const char* kLatexPath =
    "Chapter: Rubber and articles thereof. "
    "Heading: Natural rubber, balata, gutta-percha. "
    "Subheading: Natural rubber latex";

} // namespace

TEST(VectorOnlyStrategyTest, ReturnsStoreOrderTruncatedToTopK) {
    MockVectorStore store;
    EXPECT_CALL(store, query("latex", 2))
        .WillOnce(Return(std::vector<RetrievedDocument>{
            make_doc("40011010", 0.9), make_doc("40011020", 0.8), make_doc("40011030", 0.7)}));

    VectorOnlyStrategy strategy(2);
    auto results = strategy.retrieve("latex", store);
    EXPECT_THAT(codes_of(results), ElementsAre("40011010", "40011020"));
    EXPECT_EQ(strategy.name(), "vector");
}

TEST(ReRankStrategyTest, OverFetchesAndReordersByRelevance) {
    MockVectorStore store;
    auto relevance = std::make_shared<MockRelevanceModel>();

    EXPECT_CALL(store, query("latex", 8))
        .WillOnce(Return(std::vector<RetrievedDocument>{
            make_doc("40011010", 0.9, "a"), make_doc("40011020", 0.8, "b"), make_doc("40011030", 0.7, "c")}));
    EXPECT_CALL(*relevance, score("latex", std::vector<std::string>{"a", "b", "c"}))
        .WillOnce(Return(std::vector<double>{0.2, 0.1, 0.95}));

    ReRankStrategy strategy(2, 4, relevance);
    auto results = strategy.retrieve("latex", store);

    ASSERT_EQ(results.size(), 2u);
    EXPECT_EQ(results[0].metadata.hsn_code, "40011030");
    EXPECT_DOUBLE_EQ(results[0].score, 0.95);
    EXPECT_EQ(results[1].metadata.hsn_code, "40011010");
    EXPECT_DOUBLE_EQ(results[1].score, 0.2);
}

TEST(ReRankStrategyTest, TiesKeepFirstStageOrder) {
    MockVectorStore store;
    auto relevance = std::make_shared<MockRelevanceModel>();
    EXPECT_CALL(store, query(_, _))
        .WillOnce(Return(std::vector<RetrievedDocument>{
            make_doc("40011010", 0.9), make_doc("40011020", 0.8), make_doc("40011030", 0.7)}));
    EXPECT_CALL(*relevance, score(_, _)).WillOnce(Return(std::vector<double>{0.5, 0.5, 0.5}));

    ReRankStrategy strategy(3, 4, relevance);
    EXPECT_THAT(codes_of(strategy.retrieve("q", store)), ElementsAre("40011010", "40011020", "40011030"));
}

TEST(ReRankStrategyTest, EmptyCandidatesSkipRelevanceModel) {
    MockVectorStore store;
    auto relevance = std::make_shared<MockRelevanceModel>();
    EXPECT_CALL(store, query(_, _)).WillOnce(Return(std::vector<RetrievedDocument>{}));
    EXPECT_CALL(*relevance, score(_, _)).Times(0);

    ReRankStrategy strategy(5, 4, relevance);
    EXPECT_TRUE(strategy.retrieve("q", store).empty());
}

TEST(ReRankStrategyTest, ScoreCountMismatchIsUpstreamFailure) {
    MockVectorStore store;
    auto relevance = std::make_shared<MockRelevanceModel>();
    EXPECT_CALL(store, query(_, _))
        .WillOnce(Return(std::vector<RetrievedDocument>{make_doc("40011010", 0.9), make_doc("40011020", 0.8)}));
    EXPECT_CALL(*relevance, score(_, _)).WillOnce(Return(std::vector<double>{0.5}));

    ReRankStrategy strategy(5, 4, relevance);
    EXPECT_THROW(strategy.retrieve("q", store), RerankError);
}

TEST(ReRankStrategyTest, RequiresRelevanceModel) {
    EXPECT_THROW(ReRankStrategy(5, 4, nullptr), ConfigError);
}

class GraphContextualStrategyTest : public ::testing::Test {
protected:
    void SetUp() override {
        graph_ = std::make_shared<InMemoryGraphBackend>();
        KnowledgeGraphBuilder builder(graph_);
        builder.build({
            make_record("40011010", "400110", "Prevulcanised latex"),
            make_record("40011020", "400110", "Other latex"),
        });
        builder.enrich_siblings();
    }

    std::shared_ptr<InMemoryGraphBackend> graph_;
};

TEST_F(GraphContextualStrategyTest, AttachesHierarchyPathToEachResult) {
    MockVectorStore store;
    EXPECT_CALL(store, query("latex", 2))
        .WillOnce(Return(std::vector<RetrievedDocument>{make_doc("40011010", 0.9), make_doc("99999999", 0.5)}));

    GraphContextualStrategy strategy(std::make_unique<VectorOnlyStrategy>(2), graph_);
    auto results = strategy.retrieve("latex", store);

    ASSERT_EQ(results.size(), 2u);
    ASSERT_TRUE(results[0].graph_context.has_value());
    EXPECT_EQ(*results[0].graph_context, kLatexPath);
    EXPECT_EQ(*results[1].graph_context, GraphContextualStrategy::kCodeNotFound);
    EXPECT_DOUBLE_EQ(results[0].score, 0.9);
    EXPECT_EQ(strategy.name(), "graph_contextual");
}

TEST_F(GraphContextualStrategyTest, SiblingEdgesDoNotLeakIntoPath) {
    GraphContextualStrategy strategy(std::make_unique<VectorOnlyStrategy>(1), graph_);
    EXPECT_EQ(strategy.graph_context("40011020"), kLatexPath);
}

TEST_F(GraphContextualStrategyTest, CachesContextPerCode) {
    GraphContextualStrategy strategy(std::make_unique<VectorOnlyStrategy>(1), graph_);
    EXPECT_EQ(strategy.cache_size(), 0u);

    auto first = strategy.graph_context("40011010");
    auto second = strategy.graph_context("40011010");
    EXPECT_EQ(first, second);
    EXPECT_EQ(strategy.cache_size(), 1u);
}

TEST_F(GraphContextualStrategyTest, CacheCapacityHasFloor) {
    GraphContextualStrategy small(std::make_unique<VectorOnlyStrategy>(1), graph_, 4);
    EXPECT_EQ(small.cache_capacity(), GraphContextualStrategy::kMinCacheSize);

    GraphContextualStrategy large(std::make_unique<VectorOnlyStrategy>(1), graph_, 1024);
    EXPECT_EQ(large.cache_capacity(), 1024u);
}

TEST(GraphContextualFallbackTest, RemoteBackendGetsPlaceholder) {
    auto remote = std::make_shared<Neo4jGraphBackend>(Neo4jSettings{});
    GraphContextualStrategy strategy(std::make_unique<VectorOnlyStrategy>(1), remote);
    EXPECT_EQ(strategy.graph_context("40011010"), GraphContextualStrategy::kNotAvailable);
    EXPECT_EQ(strategy.cache_size(), 0u);

    GraphContextualStrategy without_graph(std::make_unique<VectorOnlyStrategy>(1), nullptr);
    EXPECT_EQ(without_graph.graph_context("40011010"), GraphContextualStrategy::kNotAvailable);
}

TEST(MakeStrategyTest, BuildsConfiguredStrategy) {
    auto relevance = std::make_shared<MockRelevanceModel>();
    auto graph = std::make_shared<InMemoryGraphBackend>();

    RetrievalSettings settings;
    settings.strategy = "vector";
    EXPECT_EQ(make_strategy(settings, relevance, graph)->name(), "vector");
    settings.strategy = "rerank";
    EXPECT_EQ(make_strategy(settings, relevance, graph)->name(), "rerank");
    settings.strategy = "graph_contextual";
    EXPECT_EQ(make_strategy(settings, relevance, graph)->name(), "graph_contextual");
}

TEST(MakeStrategyTest, RejectsUnknownNameAndBadTopK) {
    auto relevance = std::make_shared<MockRelevanceModel>();
    RetrievalSettings settings;
    settings.strategy = "bm25";
    EXPECT_THROW(make_strategy(settings, relevance, nullptr), ConfigError);

    settings.strategy = "vector";
    settings.top_k = 0;
    EXPECT_THROW(make_strategy(settings, relevance, nullptr), ConfigError);
}
