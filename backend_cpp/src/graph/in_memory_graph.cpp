#include "graph/in_memory_graph.hpp"
#include "graph/graph_export.hpp"
#include <deque>
#include <algorithm>
#include <mutex>
#include <spdlog/spdlog.h>

namespace hsn_assistance {

InMemoryGraphBackend::InMemoryGraphBackend() {
    spdlog::info("Initializing in-memory graph backend.");
}

std::string InMemoryGraphBackend::edge_key(const std::string& source_id,
                                           const std::string& target_id,
                                           Relation relation) {
    return source_id + '\x1f' + target_id + '\x1f' + relation_to_string(relation);
}

bool InMemoryGraphBackend::add_node(const GraphNode& node) {
    std::unique_lock lock(data_mutex_);
    if (node_index_.count(node.id)) return false;

    node_index_[node.id] = nodes_.size();
    nodes_.push_back(node);
    out_edges_.emplace_back();
    in_edges_.emplace_back();
    return true;
}

bool InMemoryGraphBackend::add_edge(const std::string& source_id,
                                    const std::string& target_id,
                                    Relation relation,
                                    const std::unordered_map<std::string, double>& properties) {
    std::unique_lock lock(data_mutex_);

    auto src = node_index_.find(source_id);
    auto dst = node_index_.find(target_id);
    if (src == node_index_.end() || dst == node_index_.end()) {
        spdlog::warn("⚠️ Skipping {} edge {} -> {}: endpoint missing",
                     relation_to_string(relation), source_id, target_id);
        return false;
    }

    auto key = edge_key(source_id, target_id, relation);
    if (!edge_keys_.insert(key).second) return false;

    size_t edge_idx = edges_.size();
    edges_.push_back({source_id, target_id, relation, properties});
    out_edges_[src->second].push_back(edge_idx);
    in_edges_[dst->second].push_back(edge_idx);
    return true;
}

void InMemoryGraphBackend::create_indexes() {
    spdlog::info("In-memory backend keeps a hash index on node ids; nothing to create.");
}

bool InMemoryGraphBackend::has_node(const std::string& node_id) const {
    std::shared_lock lock(data_mutex_);
    return node_index_.count(node_id) > 0;
}

bool InMemoryGraphBackend::has_edge(const std::string& source_id, const std::string& target_id, Relation relation) const {
    std::shared_lock lock(data_mutex_);
    return edge_keys_.count(edge_key(source_id, target_id, relation)) > 0;
}

std::optional<GraphNode> InMemoryGraphBackend::get_node(const std::string& node_id) const {
    std::shared_lock lock(data_mutex_);
    auto it = node_index_.find(node_id);
    if (it == node_index_.end()) return std::nullopt;
    return nodes_[it->second];
}

std::vector<GraphEdge> InMemoryGraphBackend::get_edges(const std::string& node_id, Direction direction) const {
    std::shared_lock lock(data_mutex_);
    auto it = node_index_.find(node_id);
    if (it == node_index_.end()) return {};

    const auto& adjacency = (direction == Direction::OUT) ? out_edges_[it->second] : in_edges_[it->second];
    std::vector<GraphEdge> result;
    result.reserve(adjacency.size());
    for (size_t edge_idx : adjacency) {
        result.push_back(edges_[edge_idx]);
    }
    return result;
}

std::vector<GraphNode> InMemoryGraphBackend::get_neighbors(const std::string& node_id, Direction direction) const {
    std::shared_lock lock(data_mutex_);
    auto it = node_index_.find(node_id);
    if (it == node_index_.end()) return {};

    const auto& adjacency = (direction == Direction::OUT) ? out_edges_[it->second] : in_edges_[it->second];

    // Parallel edges with different relations collapse to one neighbor.
    std::vector<GraphNode> result;
    std::unordered_set<size_t> seen;
    for (size_t edge_idx : adjacency) {
        const auto& edge = edges_[edge_idx];
        const auto& other = (direction == Direction::OUT) ? edge.target_id : edge.source_id;
        size_t other_idx = node_index_.at(other);
        if (seen.insert(other_idx).second) {
            result.push_back(nodes_[other_idx]);
        }
    }
    return result;
}

Subgraph InMemoryGraphBackend::get_subgraph(const std::string& node_id, int depth) const {
    std::shared_lock lock(data_mutex_);
    auto it = node_index_.find(node_id);
    if (it == node_index_.end()) return {};

    std::unordered_set<size_t> members{it->second};
    std::deque<std::pair<size_t, int>> queue{{it->second, 0}};

    while (!queue.empty()) {
        size_t curr = queue.front().first;
        int dist = queue.front().second;
        queue.pop_front();
        if (dist >= depth) continue;

        auto visit = [&](const std::string& other_id) {
            size_t other_idx = node_index_.at(other_id);
            if (members.insert(other_idx).second) {
                queue.emplace_back(other_idx, dist + 1);
            }
        };
        for (size_t e : out_edges_[curr]) visit(edges_[e].target_id);
        for (size_t e : in_edges_[curr]) visit(edges_[e].source_id);
    }

    return induced_subgraph_locked(members);
}

Subgraph InMemoryGraphBackend::induced_subgraph_locked(const std::unordered_set<size_t>& members) const {
    // Keep arena order so the output is stable.
    std::vector<size_t> ordered(members.begin(), members.end());
    std::sort(ordered.begin(), ordered.end());

    Subgraph sub;
    for (size_t idx : ordered) {
        sub.nodes.push_back(nodes_[idx]);
    }
    for (const auto& edge : edges_) {
        if (members.count(node_index_.at(edge.source_id)) && members.count(node_index_.at(edge.target_id))) {
            sub.edges.push_back(edge);
        }
    }
    return sub;
}

GraphStatistics InMemoryGraphBackend::get_statistics() const {
    std::shared_lock lock(data_mutex_);
    GraphStatistics stats;
    stats.node_count = nodes_.size();
    stats.edge_count = edges_.size();
    for (const auto& node : nodes_) stats.nodes_by_label[node_label_to_string(node.label)]++;
    for (const auto& edge : edges_) stats.edges_by_relation[relation_to_string(edge.relation)]++;
    return stats;
}

Subgraph InMemoryGraphBackend::snapshot() const {
    std::shared_lock lock(data_mutex_);
    return {nodes_, edges_};
}

void InMemoryGraphBackend::export_graphml(const std::string& file_path) const {
    spdlog::info("Exporting graph to GraphML at {}", file_path);
    write_graphml(file_path, snapshot());
}

void InMemoryGraphBackend::close() {
    spdlog::info("Closing in-memory graph backend (no action needed).");
}

} // namespace hsn_assistance
