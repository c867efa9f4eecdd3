#include "graph/neo4j_graph.hpp"
#include "graph/graph_export.hpp"
#include "errors.hpp"
#include <cpr/cpr.h>
#include <spdlog/spdlog.h>

namespace hsn_assistance {

using json = nlohmann::json;

namespace {

const char* kReturnNode = "m.id, coalesce(m.label, 'Unknown'), coalesce(m.description, '')";

} // namespace

Neo4jGraphBackend::Neo4jGraphBackend(Neo4jSettings settings)
    : settings_(std::move(settings)) {
    std::string base = settings_.uri;
    if (!base.empty() && base.back() == '/') base.pop_back();
    commit_url_ = base + "/db/" + settings_.database + "/tx/commit";
    spdlog::info("Initializing Neo4j backend for URI: {}", settings_.uri);
}

json Neo4jGraphBackend::make_statement(const std::string& cypher, const json& parameters) {
    return json{{"statement", cypher}, {"parameters", parameters}};
}

json Neo4jGraphBackend::extract_results(const std::string& body) {
    json response;
    try {
        response = json::parse(body);
    } catch (const json::parse_error& e) {
        throw GraphBackendError(std::string("Malformed Neo4j response: ") + e.what());
    }

    if (response.contains("errors") && !response["errors"].empty()) {
        const auto& err = response["errors"][0];
        throw GraphBackendError("Neo4j error " + err.value("code", "?") + ": " + err.value("message", ""));
    }
    return response.value("results", json::array());
}

std::vector<json> Neo4jGraphBackend::rows_of(const json& results, size_t statement_index) {
    std::vector<json> rows;
    if (statement_index >= results.size()) return rows;
    for (const auto& entry : results[statement_index].value("data", json::array())) {
        rows.push_back(entry.value("row", json::array()));
    }
    return rows;
}

json Neo4jGraphBackend::run(const std::vector<json>& statements) const {
    if (closed_) throw GraphBackendError("Neo4j backend already closed");

    json payload = {{"statements", statements}};
    auto r = cpr::Post(cpr::Url{commit_url_},
                       cpr::Authentication{settings_.user, settings_.password, cpr::AuthMode::BASIC},
                       cpr::Body{payload.dump()},
                       cpr::Header{{"Content-Type", "application/json"}, {"Accept", "application/json"}},
                       cpr::Timeout{settings_.timeout_ms});

    if (r.error) {
        throw GraphBackendError("Neo4j unreachable at " + settings_.uri + ": " + r.error.message);
    }
    if (r.status_code != 200) {
        spdlog::error("❌ Neo4j HTTP error [{}]: {}", r.status_code, r.text);
        throw GraphBackendError("Neo4j returned HTTP " + std::to_string(r.status_code));
    }
    return extract_results(r.text);
}

std::vector<json> Neo4jGraphBackend::run_single(const std::string& cypher, const json& parameters) const {
    return rows_of(run({make_statement(cypher, parameters)}), 0);
}

GraphNode Neo4jGraphBackend::node_from_row(const json& row, size_t offset) {
    GraphNode node;
    node.id = row.at(offset).get<std::string>();
    node.label = string_to_node_label(row.at(offset + 1).get<std::string>());
    node.description = row.at(offset + 2).get<std::string>();
    return node;
}

GraphEdge Neo4jGraphBackend::edge_from_row(const json& row, size_t offset) {
    GraphEdge edge;
    edge.source_id = row.at(offset).get<std::string>();
    edge.target_id = row.at(offset + 1).get<std::string>();
    edge.relation = string_to_relation(row.at(offset + 2).get<std::string>());
    for (const auto& [key, value] : row.at(offset + 3).items()) {
        if (value.is_number()) edge.properties[key] = value.get<double>();
    }
    return edge;
}

bool Neo4jGraphBackend::add_node(const GraphNode& node) {
    // Label comes from the enum, never from user input.
    std::string label = node_label_to_string(node.label);
    std::string cypher =
        "MERGE (n:" + label + " {id: $id}) "
        "ON CREATE SET n.description = $description, n.label = $label, n._created = true "
        "WITH n, coalesce(n._created, false) AS created "
        "REMOVE n._created "
        "RETURN created";

    auto rows = run_single(cypher, {{"id", node.id}, {"description", node.description}, {"label", label}});
    return !rows.empty() && rows[0].at(0).get<bool>();
}

bool Neo4jGraphBackend::add_edge(const std::string& source_id,
                                 const std::string& target_id,
                                 Relation relation,
                                 const std::unordered_map<std::string, double>& properties) {
    std::string cypher =
        "MATCH (a {id: $source_id}), (b {id: $target_id}) "
        "MERGE (a)-[r:" + relation_to_string(relation) + "]->(b) "
        "ON CREATE SET r += $properties, r._created = true "
        "WITH r, coalesce(r._created, false) AS created "
        "REMOVE r._created "
        "RETURN created";

    json props = properties.empty() ? json::object() : json(properties);
    auto rows = run_single(cypher, {{"source_id", source_id}, {"target_id", target_id}, {"properties", props}});
    // No row means an endpoint was missing; MATCH produced nothing to merge.
    return !rows.empty() && rows[0].at(0).get<bool>();
}

void Neo4jGraphBackend::create_indexes() {
    spdlog::info("Creating indexes in Neo4j for performance optimization...");
    std::vector<json> statements;
    for (auto label : {NodeLabel::CHAPTER, NodeLabel::HEADING, NodeLabel::SUBHEADING, NodeLabel::CODE}) {
        statements.push_back(make_statement(
            "CREATE INDEX IF NOT EXISTS FOR (n:" + node_label_to_string(label) + ") ON (n.id)"));
    }
    run(statements);
    spdlog::info("✅ Neo4j indexes created successfully.");
}

std::optional<GraphNode> Neo4jGraphBackend::get_node(const std::string& node_id) const {
    auto rows = run_single(std::string("MATCH (m {id: $id}) RETURN ") + kReturnNode + " LIMIT 1", {{"id", node_id}});
    if (rows.empty()) return std::nullopt;
    return node_from_row(rows[0]);
}

std::vector<GraphNode> Neo4jGraphBackend::get_neighbors(const std::string& node_id, Direction direction) const {
    std::string pattern = (direction == Direction::OUT) ? "(a {id: $id})-[r]->(m)" : "(a {id: $id})<-[r]-(m)";
    auto rows = run_single(
        "MATCH " + pattern + " WITH m, min(id(r)) AS first_edge ORDER BY first_edge RETURN " + kReturnNode,
        {{"id", node_id}});

    std::vector<GraphNode> result;
    for (const auto& row : rows) result.push_back(node_from_row(row));
    return result;
}

std::vector<GraphEdge> Neo4jGraphBackend::get_edges(const std::string& node_id, Direction direction) const {
    std::string pattern = (direction == Direction::OUT) ? "(s {id: $id})-[r]->(t)" : "(s)-[r]->(t {id: $id})";
    auto rows = run_single(
        "MATCH " + pattern + " RETURN s.id, t.id, type(r), properties(r) ORDER BY id(r)",
        {{"id", node_id}});

    std::vector<GraphEdge> result;
    for (const auto& row : rows) result.push_back(edge_from_row(row));
    return result;
}

Subgraph Neo4jGraphBackend::get_subgraph(const std::string& node_id, int depth) const {
    if (depth < 0) depth = 0;
    std::string reach = "MATCH (n {id: $id})-[*0.." + std::to_string(depth) + "]-(m) ";

    auto results = run({
        make_statement(reach + "RETURN DISTINCT " + kReturnNode, {{"id", node_id}}),
        make_statement(reach +
            "WITH collect(DISTINCT m) AS members "
            "UNWIND members AS s MATCH (s)-[r]->(t) WHERE t IN members "
            "RETURN s.id, t.id, type(r), properties(r)", {{"id", node_id}})
    });

    Subgraph sub;
    for (const auto& row : rows_of(results, 0)) sub.nodes.push_back(node_from_row(row));
    for (const auto& row : rows_of(results, 1)) sub.edges.push_back(edge_from_row(row));
    return sub;
}

GraphStatistics Neo4jGraphBackend::get_statistics() const {
    auto results = run({
        make_statement("MATCH (n) RETURN coalesce(n.label, 'Unknown'), count(n)"),
        make_statement("MATCH ()-[r]->() RETURN type(r), count(r)")
    });

    GraphStatistics stats;
    for (const auto& row : rows_of(results, 0)) {
        size_t count = row.at(1).get<size_t>();
        stats.nodes_by_label[row.at(0).get<std::string>()] += count;
        stats.node_count += count;
    }
    for (const auto& row : rows_of(results, 1)) {
        size_t count = row.at(1).get<size_t>();
        stats.edges_by_relation[row.at(0).get<std::string>()] += count;
        stats.edge_count += count;
    }
    return stats;
}

Subgraph Neo4jGraphBackend::snapshot() const {
    auto results = run({
        make_statement(std::string("MATCH (m) RETURN ") + kReturnNode),
        make_statement("MATCH (s)-[r]->(t) RETURN s.id, t.id, type(r), properties(r)")
    });

    Subgraph all;
    for (const auto& row : rows_of(results, 0)) all.nodes.push_back(node_from_row(row));
    for (const auto& row : rows_of(results, 1)) all.edges.push_back(edge_from_row(row));
    return all;
}

void Neo4jGraphBackend::export_graphml(const std::string& file_path) const {
    spdlog::info("Pulling full graph from Neo4j for GraphML export...");
    write_graphml(file_path, snapshot());
}

void Neo4jGraphBackend::close() {
    // HTTP transport is stateless; just refuse further calls.
    spdlog::info("Closing Neo4j backend connection.");
    closed_ = true;
}

} // namespace hsn_assistance
