#pragma once
#include <string>
#include <vector>
#include <optional>
#include <unordered_map>
#include "graph/graph_types.hpp"

namespace hsn_assistance {

/**
 * Storage contract for the HSN knowledge graph.
 *
 * Writes are idempotent: add_node/add_edge return true only when the entity
 * was newly created and false for a duplicate (never an error).
 * Reads must be safe from concurrent sessions once the build has finished.
 */
class GraphBackend {
public:
    virtual ~GraphBackend() = default;

    virtual bool add_node(const GraphNode& node) = 0;

    virtual bool add_edge(const std::string& source_id,
                          const std::string& target_id,
                          Relation relation,
                          const std::unordered_map<std::string, double>& properties = {}) = 0;

    virtual void create_indexes() = 0;

    virtual std::optional<GraphNode> get_node(const std::string& node_id) const = 0;

    // One hop. Order is insertion order, stable for the lifetime of the process.
    virtual std::vector<GraphNode> get_neighbors(const std::string& node_id, Direction direction) const = 0;

    virtual std::vector<GraphEdge> get_edges(const std::string& node_id, Direction direction) const = 0;

    // Undirected BFS over the directed graph, up to depth hops.
    virtual Subgraph get_subgraph(const std::string& node_id, int depth) const = 0;

    virtual GraphStatistics get_statistics() const = 0;

    virtual void export_graphml(const std::string& file_path) const = 0;

    // Every node and edge currently stored.
    virtual Subgraph snapshot() const = 0;

    // Capability query: can callers walk the graph locally without a round trip?
    virtual bool supports_direct_traversal() const = 0;

    virtual std::string name() const = 0;

    virtual void close() = 0;
};

} // namespace hsn_assistance
