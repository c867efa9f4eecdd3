#pragma once
#include <string>
#include <vector>
#include <unordered_map>
#include <unordered_set>
#include <shared_mutex>
#include "graph/graph_backend.hpp"

namespace hsn_assistance {

// Arena of nodes/edges keyed by stable string ids. Adjacency lists hold edge
// indices in insertion order, which keeps neighbor order deterministic.
class InMemoryGraphBackend : public GraphBackend {
public:
    InMemoryGraphBackend();

    bool add_node(const GraphNode& node) override;
    bool add_edge(const std::string& source_id,
                  const std::string& target_id,
                  Relation relation,
                  const std::unordered_map<std::string, double>& properties = {}) override;

    void create_indexes() override;

    std::optional<GraphNode> get_node(const std::string& node_id) const override;
    std::vector<GraphNode> get_neighbors(const std::string& node_id, Direction direction) const override;
    std::vector<GraphEdge> get_edges(const std::string& node_id, Direction direction) const override;
    Subgraph get_subgraph(const std::string& node_id, int depth) const override;
    GraphStatistics get_statistics() const override;
    void export_graphml(const std::string& file_path) const override;
    Subgraph snapshot() const override;

    bool supports_direct_traversal() const override { return true; }
    std::string name() const override { return "in_memory"; }
    void close() override;

    bool has_node(const std::string& node_id) const;
    bool has_edge(const std::string& source_id, const std::string& target_id, Relation relation) const;


private:
    std::vector<GraphNode> nodes_;
    std::vector<GraphEdge> edges_;
    std::unordered_map<std::string, size_t> node_index_;
    std::unordered_set<std::string> edge_keys_;
    std::vector<std::vector<size_t>> out_edges_;
    std::vector<std::vector<size_t>> in_edges_;

    mutable std::shared_mutex data_mutex_;

    static std::string edge_key(const std::string& source_id, const std::string& target_id, Relation relation);
    Subgraph induced_subgraph_locked(const std::unordered_set<size_t>& members) const;
};

} // namespace hsn_assistance
