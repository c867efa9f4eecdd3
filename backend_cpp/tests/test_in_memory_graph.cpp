#include <gtest/gtest.h>
#include <algorithm>
#include <thread>
#include <vector>
#include "graph/in_memory_graph.hpp"

using namespace hsn_assistance;

namespace {

std::vector<std::string> ids_of(const std::vector<GraphNode>& nodes) {
    std::vector<std::string> ids;
    for (const auto& n : nodes) ids.push_back(n.id);
    return ids;
}

} // namespace

class InMemoryGraphTest : public ::testing::Test {
protected:
    void SetUp() override {
        graph_.add_node({"chap_40", NodeLabel::CHAPTER, "Rubber"});
        graph_.add_node({"head_4001", NodeLabel::HEADING, "Natural rubber"});
        graph_.add_node({"sub_400110", NodeLabel::SUBHEADING, "Latex"});
        graph_.add_node({"code_40011010", NodeLabel::CODE, "Prevulcanised latex"});
        graph_.add_node({"code_40011020", NodeLabel::CODE, "Other latex"});

        graph_.add_edge("chap_40", "head_4001", Relation::HAS_HEADING);
        graph_.add_edge("head_4001", "sub_400110", Relation::HAS_SUBHEADING);
        graph_.add_edge("sub_400110", "code_40011010", Relation::HAS_CODE);
        graph_.add_edge("sub_400110", "code_40011020", Relation::HAS_CODE);
    }

    InMemoryGraphBackend graph_;
};

TEST_F(InMemoryGraphTest, AddNodeIsIdempotent) {
    EXPECT_FALSE(graph_.add_node({"chap_40", NodeLabel::CHAPTER, "Something else"}));
    auto node = graph_.get_node("chap_40");
    ASSERT_TRUE(node.has_value());
    EXPECT_EQ(node->description, "Rubber");
    EXPECT_EQ(graph_.get_statistics().node_count, 5u);
}

TEST_F(InMemoryGraphTest, AddEdgeIsIdempotentPerRelation) {
    EXPECT_FALSE(graph_.add_edge("chap_40", "head_4001", Relation::HAS_HEADING));
    // Same endpoints, different relation is a distinct edge.
    EXPECT_TRUE(graph_.add_edge("code_40011010", "code_40011020", Relation::SIBLING_OF));
    EXPECT_TRUE(graph_.add_edge("code_40011010", "code_40011020", Relation::SIMILAR_TO, {{"score", 0.9}}));
    EXPECT_EQ(graph_.get_statistics().edge_count, 6u);
}

TEST_F(InMemoryGraphTest, AddEdgeWithMissingEndpointIsRejected) {
    EXPECT_FALSE(graph_.add_edge("chap_40", "head_9999", Relation::HAS_HEADING));
    EXPECT_FALSE(graph_.has_edge("chap_40", "head_9999", Relation::HAS_HEADING));
    EXPECT_EQ(graph_.get_statistics().edge_count, 4u);
}

TEST_F(InMemoryGraphTest, NeighborsFollowDirection) {
    EXPECT_EQ(ids_of(graph_.get_neighbors("sub_400110", Direction::OUT)),
              (std::vector<std::string>{"code_40011010", "code_40011020"}));
    EXPECT_EQ(ids_of(graph_.get_neighbors("sub_400110", Direction::IN)),
              (std::vector<std::string>{"head_4001"}));
    EXPECT_TRUE(graph_.get_neighbors("chap_40", Direction::IN).empty());
    EXPECT_TRUE(graph_.get_neighbors("missing", Direction::OUT).empty());
}

TEST_F(InMemoryGraphTest, NeighborOrderIsStableAcrossCalls) {
    graph_.add_edge("code_40011020", "code_40011010", Relation::SIBLING_OF);
    auto first = ids_of(graph_.get_neighbors("code_40011010", Direction::IN));
    for (int i = 0; i < 5; ++i) {
        EXPECT_EQ(ids_of(graph_.get_neighbors("code_40011010", Direction::IN)), first);
    }
    EXPECT_EQ(first.front(), "sub_400110");
}

TEST_F(InMemoryGraphTest, ParallelEdgesCollapseToOneNeighbor) {
    graph_.add_edge("code_40011010", "code_40011020", Relation::SIBLING_OF);
    graph_.add_edge("code_40011010", "code_40011020", Relation::SIMILAR_TO);
    EXPECT_EQ(graph_.get_neighbors("code_40011010", Direction::OUT).size(), 1u);
    EXPECT_EQ(graph_.get_edges("code_40011010", Direction::OUT).size(), 2u);
}

TEST_F(InMemoryGraphTest, SubgraphIsUndirectedBfsToDepth) {
    auto depth0 = graph_.get_subgraph("sub_400110", 0);
    EXPECT_EQ(depth0.nodes.size(), 1u);
    EXPECT_TRUE(depth0.edges.empty());

    auto depth1 = graph_.get_subgraph("sub_400110", 1);
    EXPECT_EQ(ids_of(depth1.nodes),
              (std::vector<std::string>{"head_4001", "sub_400110", "code_40011010", "code_40011020"}));
    EXPECT_EQ(depth1.edges.size(), 3u);

    auto depth3 = graph_.get_subgraph("code_40011010", 3);
    EXPECT_EQ(depth3.nodes.size(), 5u);
    EXPECT_EQ(depth3.edges.size(), 4u);

    EXPECT_TRUE(graph_.get_subgraph("missing", 2).nodes.empty());
}

TEST_F(InMemoryGraphTest, StatisticsBreakDownByLabelAndRelation) {
    graph_.add_edge("code_40011010", "code_40011020", Relation::SIBLING_OF);
    auto stats = graph_.get_statistics();
    EXPECT_EQ(stats.nodes_by_label.at("HSNCode"), 2u);
    EXPECT_EQ(stats.nodes_by_label.at("Chapter"), 1u);
    EXPECT_EQ(stats.edges_by_relation.at("HAS_CODE"), 2u);
    EXPECT_EQ(stats.edges_by_relation.at("SIBLING_OF"), 1u);

    auto j = stats.to_json();
    EXPECT_EQ(j["node_count"], 5);
    EXPECT_EQ(j["edge_count"], 5);
}

TEST_F(InMemoryGraphTest, EdgePropertiesArePreserved) {
    graph_.add_edge("code_40011010", "code_40011020", Relation::SIMILAR_TO, {{"score", 0.91}});
    auto edges = graph_.get_edges("code_40011020", Direction::IN);
    auto it = std::find_if(edges.begin(), edges.end(),
                           [](const GraphEdge& e) { return e.relation == Relation::SIMILAR_TO; });
    ASSERT_NE(it, edges.end());
    EXPECT_DOUBLE_EQ(it->properties.at("score"), 0.91);
}

TEST_F(InMemoryGraphTest, ReportsDirectTraversalCapability) {
    EXPECT_TRUE(graph_.supports_direct_traversal());
    EXPECT_EQ(graph_.name(), "in_memory");
}

TEST_F(InMemoryGraphTest, ConcurrentReadsSeeConsistentGraph) {
    std::vector<std::thread> readers;
    std::vector<size_t> counts(8, 0);
    for (size_t t = 0; t < counts.size(); ++t) {
        readers.emplace_back([this, t, &counts] {
            for (int i = 0; i < 200; ++i) {
                counts[t] = graph_.get_neighbors("sub_400110", Direction::OUT).size();
            }
        });
    }
    for (auto& r : readers) r.join();
    for (size_t c : counts) EXPECT_EQ(c, 2u);
}
