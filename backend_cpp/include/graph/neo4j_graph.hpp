#pragma once
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "graph/graph_backend.hpp"

namespace hsn_assistance {

struct Neo4jSettings {
    std::string uri = "http://localhost:7474";
    std::string user = "neo4j";
    std::string password;
    std::string database = "neo4j";
    int timeout_ms = 10000;
};

// Talks Cypher to Neo4j over the HTTP transactional endpoint. Every call is
// one auto-committed transaction; failures raise GraphBackendError.
class Neo4jGraphBackend : public GraphBackend {
public:
    explicit Neo4jGraphBackend(Neo4jSettings settings);

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

    bool supports_direct_traversal() const override { return false; }
    std::string name() const override { return "neo4j"; }
    void close() override;

    static nlohmann::json make_statement(const std::string& cypher, const nlohmann::json& parameters = nlohmann::json::object());

    // Parses a tx/commit response body; throws GraphBackendError on reported errors.
    static nlohmann::json extract_results(const std::string& body);

    // Row arrays of the i-th statement result.
    static std::vector<nlohmann::json> rows_of(const nlohmann::json& results, size_t statement_index);

private:
    Neo4jSettings settings_;
    std::string commit_url_;
    bool closed_ = false;

    nlohmann::json run(const std::vector<nlohmann::json>& statements) const;
    std::vector<nlohmann::json> run_single(const std::string& cypher, const nlohmann::json& parameters) const;

    static GraphNode node_from_row(const nlohmann::json& row, size_t offset = 0);
    static GraphEdge edge_from_row(const nlohmann::json& row, size_t offset = 0);
};

} // namespace hsn_assistance
