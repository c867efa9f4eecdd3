#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <filesystem>
#include <fstream>
#include "graph/graph_builder.hpp"
#include "graph/in_memory_graph.hpp"
#include "test_helpers.hpp"

using namespace hsn_assistance;
using hsn_assistance::testing::make_record;
using ::testing::HasSubstr;

namespace fs = std::filesystem;

class GraphBuilderTest : public ::testing::Test {
protected:
    void SetUp() override {
        graph_ = std::make_shared<InMemoryGraphBackend>();
        builder_ = std::make_unique<KnowledgeGraphBuilder>(graph_);

        records_ = {
            make_record("40011010", "400110", "Prevulcanised natural rubber latex"),
            make_record("40011020", "400110", "Other natural rubber latex"),
            make_record("40011030", "400110", "Centrifuged latex"),
            make_record("40012100", "400121", "Smoked sheets"),
        };
    }

    std::shared_ptr<InMemoryGraphBackend> graph_;
    std::unique_ptr<KnowledgeGraphBuilder> builder_;
    std::vector<HsnRecord> records_;
};

TEST_F(GraphBuilderTest, BuildCreatesPrefixedHierarchy) {
    builder_->build(records_);

    EXPECT_TRUE(graph_->has_node("chap_40"));
    EXPECT_TRUE(graph_->has_node("head_4001"));
    EXPECT_TRUE(graph_->has_node("sub_400110"));
    EXPECT_TRUE(graph_->has_node("code_40011010"));
    EXPECT_TRUE(graph_->has_edge("chap_40", "head_4001", Relation::HAS_HEADING));
    EXPECT_TRUE(graph_->has_edge("head_4001", "sub_400110", Relation::HAS_SUBHEADING));
    EXPECT_TRUE(graph_->has_edge("sub_400110", "code_40011010", Relation::HAS_CODE));

    auto code = graph_->get_node("code_40011010");
    ASSERT_TRUE(code.has_value());
    EXPECT_EQ(code->label, NodeLabel::CODE);
    EXPECT_EQ(code->description, "Prevulcanised natural rubber latex");

    auto stats = graph_->get_statistics();
    // 1 chapter, 1 heading, 2 subheadings, 4 codes
    EXPECT_EQ(stats.node_count, 8u);
    EXPECT_EQ(stats.edge_count, 7u);
}

TEST_F(GraphBuilderTest, BuildingTwiceIsIdempotent) {
    builder_->build(records_);
    auto once = graph_->get_statistics();

    builder_->build(records_);
    auto twice = graph_->get_statistics();

    EXPECT_EQ(once.node_count, twice.node_count);
    EXPECT_EQ(once.edge_count, twice.edge_count);
}

TEST_F(GraphBuilderTest, BuildWithoutDocumentsThrows) {
    EXPECT_THROW(builder_->build(), std::runtime_error);
}

TEST_F(GraphBuilderTest, ValidRecordSetHasNoIntegrityViolations) {
    builder_->build(records_);
    builder_->enrich_siblings();

    auto report = builder_->validate_integrity();
    EXPECT_TRUE(report.ok());
    EXPECT_EQ(report.codes_checked, 4u);
}

TEST_F(GraphBuilderTest, CodeWithoutSubheadingParentIsReported) {
    // The parent id already exists with the wrong label; add_node keeps the first one.
    graph_->add_node({"sub_400110", NodeLabel::HEADING, "Misfiled"});
    builder_->build({records_[0]});

    auto report = builder_->validate_integrity();
    ASSERT_EQ(report.violations.size(), 1u);
    EXPECT_EQ(report.violations[0], "code_40011010 has no Subheading parent");
}

TEST_F(GraphBuilderTest, MultipleHierarchyParentsAreAViolation) {
    builder_->build(records_);
    graph_->add_node({"sub_400199", NodeLabel::SUBHEADING, "Second parent"});
    graph_->add_edge("head_4001", "sub_400199", Relation::HAS_SUBHEADING);
    graph_->add_edge("sub_400199", "code_40011010", Relation::HAS_CODE);

    auto report = builder_->validate_integrity();
    ASSERT_EQ(report.violations.size(), 1u);
    EXPECT_THAT(report.violations[0], HasSubstr("code_40011010"));
    EXPECT_THAT(report.violations[0], HasSubstr("2 hierarchy parents"));
}

TEST_F(GraphBuilderTest, SiblingEdgesAreSymmetricWithinSubheading) {
    builder_->build(records_);
    size_t created = builder_->enrich_siblings();

    // 3 codes under 400110 -> 3 pairs -> 6 directed edges; 400121 has one code.
    EXPECT_EQ(created, 6u);
    EXPECT_TRUE(graph_->has_edge("code_40011010", "code_40011020", Relation::SIBLING_OF));
    EXPECT_TRUE(graph_->has_edge("code_40011020", "code_40011010", Relation::SIBLING_OF));
    EXPECT_TRUE(graph_->has_edge("code_40011030", "code_40011010", Relation::SIBLING_OF));
    EXPECT_FALSE(graph_->has_edge("code_40011010", "code_40012100", Relation::SIBLING_OF));
    EXPECT_FALSE(graph_->has_edge("code_40011010", "code_40011010", Relation::SIBLING_OF));

    EXPECT_EQ(builder_->enrich_siblings(), 0u);
}

TEST_F(GraphBuilderTest, DuplicateRecordsDoNotCreateSelfLoops) {
    auto records = records_;
    records.push_back(records_[0]);
    builder_->build(records);
    EXPECT_EQ(builder_->enrich_siblings(), 6u);
    EXPECT_FALSE(graph_->has_edge("code_40011010", "code_40011010", Relation::SIBLING_OF));
}

TEST_F(GraphBuilderTest, SimilarityLinksPairsAboveThresholdWithScore) {
    builder_->build(records_);

    // cos(a,b) = 0.8, cos(a,c) = 0.6, cos(b,c) = 0.96, d orthogonal to all.
    auto embed = [](const std::vector<std::string>& texts) {
        EXPECT_EQ(texts.size(), 4u);
        return std::vector<std::vector<float>>{
            {1.0f, 0.0f, 0.0f},
            {0.8f, 0.6f, 0.0f},
            {0.6f, 0.8f, 0.0f},
            {0.0f, 0.0f, 1.0f},
        };
    };

    size_t created = builder_->enrich_similarity(embed, 0.9);
    EXPECT_EQ(created, 1u);
    EXPECT_FALSE(graph_->has_edge("code_40011010", "code_40011020", Relation::SIMILAR_TO));
    EXPECT_TRUE(graph_->has_edge("code_40011020", "code_40011030", Relation::SIMILAR_TO));

    auto edges = graph_->get_edges("code_40011030", Direction::IN);
    bool found = false;
    for (const auto& e : edges) {
        if (e.relation == Relation::SIMILAR_TO) {
            EXPECT_NEAR(e.properties.at("score"), 0.96, 1e-5);
            found = true;
        }
    }
    EXPECT_TRUE(found);
}

TEST_F(GraphBuilderTest, SimilarityThresholdIsStrict) {
    builder_->build({records_[0], records_[1]});
    auto embed = [](const std::vector<std::string>&) {
        return std::vector<std::vector<float>>{{1.0f, 0.0f}, {1.0f, 0.0f}};
    };
    EXPECT_EQ(builder_->enrich_similarity(embed, 1.0), 0u);
}

TEST_F(GraphBuilderTest, SimilarityNormalisesVectors) {
    builder_->build({records_[0], records_[1]});
    auto embed = [](const std::vector<std::string>&) {
        return std::vector<std::vector<float>>{{2.0f, 0.0f}, {10.0f, 0.0f}};
    };
    EXPECT_EQ(builder_->enrich_similarity(embed, 0.99), 1u);
}

TEST_F(GraphBuilderTest, SimilarityIsSkippedWithoutEmbeddingFunction) {
    builder_->build(records_);
    auto before = graph_->get_statistics().edge_count;
    EXPECT_EQ(builder_->enrich_similarity(EmbeddingFn{}, 0.5), 0u);
    EXPECT_EQ(graph_->get_statistics().edge_count, before);
}

TEST_F(GraphBuilderTest, SimilarityRejectsMismatchedEmbeddingCount) {
    builder_->build(records_);
    auto embed = [](const std::vector<std::string>&) { return std::vector<std::vector<float>>{{1.0f}}; };
    EXPECT_THROW(builder_->enrich_similarity(embed, 0.5), std::runtime_error);
}

TEST_F(GraphBuilderTest, TraverseHierarchyUpAndDown) {
    builder_->build(records_);
    builder_->enrich_siblings();

    auto up = builder_->traverse_hierarchy("40011010", TraversalDirection::UP);
    ASSERT_FALSE(up.empty());
    EXPECT_EQ(up.front().id, "sub_400110");

    auto down = builder_->traverse_hierarchy("40011010", TraversalDirection::DOWN);
    EXPECT_EQ(down.size(), 2u);
}

TEST_F(GraphBuilderTest, ContextSubgraphCentresOnCode) {
    builder_->build(records_);
    auto sub = builder_->context_subgraph("40012100", 1);
    ASSERT_EQ(sub.nodes.size(), 2u);
    EXPECT_EQ(sub.edges.size(), 1u);
}

TEST_F(GraphBuilderTest, LoadsDocumentsAndExportsArtifacts) {
    fs::path dir = fs::temp_directory_path() / "hsn_builder_test";
    fs::create_directories(dir);
    fs::path docs = dir / "docs.json";
    {
        nlohmann::json arr = nlohmann::json::array();
        for (const auto& r : records_) {
            arr.push_back(hsn_assistance::testing::make_hsn_document(r).to_json());
        }
        std::ofstream(docs) << arr.dump();
    }

    builder_->load_documents(docs.string());
    ASSERT_EQ(builder_->documents().size(), 4u);
    builder_->build();
    EXPECT_EQ(graph_->get_statistics().node_count, 8u);

    fs::path graphml = dir / "out" / "graph.graphml";
    builder_->export_graph(graphml.string());
    EXPECT_TRUE(fs::exists(graphml));

    fs::path html = dir / "out" / "graph.html";
    EXPECT_TRUE(builder_->write_visualization(html.string()));
    EXPECT_TRUE(fs::exists(html));

    fs::remove_all(dir);
}

TEST_F(GraphBuilderTest, ValidationChecksLoadedDocumentsWithoutBuild) {
    // A separate builder filled the backend; this one only loads the documents.
    KnowledgeGraphBuilder(graph_).build({records_[0], records_[1]});

    std::vector<HsnDocument> docs;
    for (const auto& r : records_) docs.push_back(hsn_assistance::testing::make_hsn_document(r));
    builder_->set_documents(docs);

    auto report = builder_->validate_integrity();
    EXPECT_EQ(report.codes_checked, 4u);
    EXPECT_FALSE(report.ok());
    EXPECT_THAT(report.violations, ::testing::Contains("code_40011030 has no Subheading parent"));
    EXPECT_THAT(report.violations, ::testing::Contains("code_40012100 has no Subheading parent"));
}

TEST_F(GraphBuilderTest, NodeIdHelpersUseStablePrefixes) {
    EXPECT_EQ(KnowledgeGraphBuilder::chapter_node_id("40"), "chap_40");
    EXPECT_EQ(KnowledgeGraphBuilder::heading_node_id("4001"), "head_4001");
    EXPECT_EQ(KnowledgeGraphBuilder::subheading_node_id("400110"), "sub_400110");
    EXPECT_EQ(KnowledgeGraphBuilder::code_node_id("40011010"), "code_40011010");
}
