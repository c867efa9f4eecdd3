#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "retrieval_engine.hpp"
#include "errors.hpp"
#include "SystemMonitor.hpp"
#include "test_helpers.hpp"

using namespace hsn_assistance;
using hsn_assistance::testing::MockGeneratorBackend;
using hsn_assistance::testing::MockVectorStore;
using hsn_assistance::testing::make_doc;
using hsn_assistance::testing::make_hsn_document;
using hsn_assistance::testing::make_record;
using ::testing::_;
using ::testing::AllOf;
using ::testing::HasSubstr;
using ::testing::Return;

class RetrievalEngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        store_ = std::make_shared<MockVectorStore>();
        generator_ = std::make_shared<MockGeneratorBackend>();
        engine_ = std::make_unique<RetrievalEngine>(store_, generator_, std::make_unique<VectorOnlyStrategy>(3));
    }

    std::shared_ptr<MockVectorStore> store_;
    std::shared_ptr<MockGeneratorBackend> generator_;
    std::unique_ptr<RetrievalEngine> engine_;
};

TEST_F(RetrievalEngineTest, PromptListsEveryCandidateWithContext) {
    auto a = make_doc("40011010", 0.9, "Prevulcanised latex");
    a.graph_context = "Chapter: Rubber";
    auto b = make_doc("40011020", 0.8, "Other latex");

    std::string prompt = RetrievalEngine::build_prompt("rubber latex", {a, b});
    EXPECT_THAT(prompt, HasSubstr("User query: \"rubber latex\""));
    EXPECT_THAT(prompt, HasSubstr("HSN Code: 40011010\nDescription: Prevulcanised latex\nGraph Context: Chapter: Rubber"));
    EXPECT_THAT(prompt, HasSubstr("\n---\nHSN Code: 40011020"));
    EXPECT_THAT(prompt, HasSubstr("Graph Context: N/A"));
    EXPECT_THAT(prompt, HasSubstr("List the top 3 potential matches"));
}

TEST_F(RetrievalEngineTest, ConfidenceIsHighOnlyAboveThreshold) {
    auto high = RetrievalEngine::generate_structured_response("text", {make_doc("40011010", 0.86)});
    EXPECT_EQ(high.confidence, "High");
    EXPECT_EQ(high.type, ResponseType::CLASSIFICATION_RESULT);
    EXPECT_EQ(high.trade_policy, "Free");

    auto medium = RetrievalEngine::generate_structured_response("text", {make_doc("40011010", 0.85)});
    EXPECT_EQ(medium.confidence, "Medium");
}

TEST_F(RetrievalEngineTest, GenerateFromDocsWrapsGeneratorOutput) {
    std::vector<RetrievedDocument> docs = {make_doc("40011010", 0.9), make_doc("40011020", 0.7)};
    EXPECT_CALL(*generator_, generate(AllOf(HasSubstr("40011010"), HasSubstr("40011020"))))
        .WillOnce(Return("Classified as 40011010"));

    auto response = engine_->generate_from_docs("latex", docs);
    EXPECT_EQ(response.summary, "Classified as 40011010");
    ASSERT_EQ(response.top_matches.size(), 2u);
    EXPECT_EQ(response.top_matches[0].hsn_code, "40011010");
    EXPECT_DOUBLE_EQ(response.top_matches[0].retrieval_score.value(), 0.9);
}

TEST_F(RetrievalEngineTest, RetrieveDelegatesToStrategy) {
    EXPECT_CALL(*store_, query("latex", 3))
        .WillOnce(Return(std::vector<RetrievedDocument>{make_doc("40011010", 0.9)}));
    auto docs = engine_->retrieve_documents("latex");
    ASSERT_EQ(docs.size(), 1u);
    EXPECT_EQ(engine_->strategy().name(), "vector");
}

TEST_F(RetrievalEngineTest, RecordsRetrievalAndGenerationLatency) {
    SystemMonitor::global_retrieval_latency_ms.store(-1.0);
    SystemMonitor::global_llm_generation_ms.store(-1.0);

    EXPECT_CALL(*store_, query("latex", 3))
        .WillOnce(Return(std::vector<RetrievedDocument>{make_doc("40011010", 0.9)}));
    EXPECT_CALL(*generator_, generate(_)).WillOnce(Return("Classified"));

    auto docs = engine_->retrieve_documents("latex");
    engine_->generate_from_docs("latex", docs);

    auto snapshot = SystemMonitor().get_latest_snapshot();
    EXPECT_GE(snapshot.retrieval_latency_ms, 0.0);
    EXPECT_GE(snapshot.llm_generation_ms, 0.0);
    EXPECT_TRUE(snapshot.to_json().contains("retrieval_latency_ms"));
}

TEST_F(RetrievalEngineTest, LookupUsesDocumentId) {
    auto doc = make_hsn_document(make_record("40011010", "400110", "Prevulcanised latex"));
    EXPECT_CALL(*store_, get_document("hsn_40011010")).WillOnce(Return(doc));
    EXPECT_CALL(*store_, get_document("hsn_12345678")).WillOnce(Return(std::nullopt));

    auto found = engine_->lookup_code("40011010");
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(found->metadata.item_description, "Prevulcanised latex");
    EXPECT_FALSE(engine_->lookup_code("12345678").has_value());
}

TEST_F(RetrievalEngineTest, InitializeForwardsDocuments) {
    std::vector<HsnDocument> docs = {make_hsn_document(make_record("40011010", "400110", "x"))};
    EXPECT_CALL(*store_, initialize(_)).Times(1);
    engine_->initialize_vector_store(docs);
}

TEST(RetrievalEngineConstructionTest, RequiresAllCollaborators) {
    EXPECT_THROW(RetrievalEngine(nullptr, std::make_shared<MockGeneratorBackend>(), std::make_unique<VectorOnlyStrategy>(1)),
                 ConfigError);
}
