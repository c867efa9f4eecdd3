#pragma once
#include <string>
#include <vector>
#include <map>
#include <unordered_map>
#include <nlohmann/json.hpp>

namespace hsn_assistance {

enum class NodeLabel {
    CHAPTER,
    HEADING,
    SUBHEADING,
    CODE,
    UNKNOWN
};

enum class Relation {
    HAS_HEADING,
    HAS_SUBHEADING,
    HAS_CODE,
    SIBLING_OF,
    SIMILAR_TO,
    UNKNOWN
};

// in = predecessors, out = successors
enum class Direction {
    IN,
    OUT
};

inline std::string node_label_to_string(NodeLabel l) {
    switch (l) {
        case NodeLabel::CHAPTER: return "Chapter";
        case NodeLabel::HEADING: return "Heading";
        case NodeLabel::SUBHEADING: return "Subheading";
        case NodeLabel::CODE: return "HSNCode";
        default: return "Unknown";
    }
}

inline NodeLabel string_to_node_label(const std::string& s) {
    if (s == "Chapter") return NodeLabel::CHAPTER;
    if (s == "Heading") return NodeLabel::HEADING;
    if (s == "Subheading") return NodeLabel::SUBHEADING;
    if (s == "HSNCode") return NodeLabel::CODE;
    return NodeLabel::UNKNOWN;
}

inline std::string relation_to_string(Relation r) {
    switch (r) {
        case Relation::HAS_HEADING: return "HAS_HEADING";
        case Relation::HAS_SUBHEADING: return "HAS_SUBHEADING";
        case Relation::HAS_CODE: return "HAS_CODE";
        case Relation::SIBLING_OF: return "SIBLING_OF";
        case Relation::SIMILAR_TO: return "SIMILAR_TO";
        default: return "UNKNOWN";
    }
}

inline Relation string_to_relation(const std::string& s) {
    if (s == "HAS_HEADING") return Relation::HAS_HEADING;
    if (s == "HAS_SUBHEADING") return Relation::HAS_SUBHEADING;
    if (s == "HAS_CODE") return Relation::HAS_CODE;
    if (s == "SIBLING_OF") return Relation::SIBLING_OF;
    if (s == "SIMILAR_TO") return Relation::SIMILAR_TO;
    return Relation::UNKNOWN;
}

// HAS_* edges define the taxonomy tree; everything else is enrichment.
inline bool is_hierarchy_relation(Relation r) {
    return r == Relation::HAS_HEADING || r == Relation::HAS_SUBHEADING || r == Relation::HAS_CODE;
}

struct GraphNode {
    std::string id;
    NodeLabel label = NodeLabel::UNKNOWN;
    std::string description;

    nlohmann::json to_json() const {
        return {
            {"id", id},
            {"label", node_label_to_string(label)},
            {"description", description}
        };
    }
};

struct GraphEdge {
    std::string source_id;
    std::string target_id;
    Relation relation = Relation::UNKNOWN;
    // e.g. {"score": 0.93} on SIMILAR_TO
    std::unordered_map<std::string, double> properties;

    nlohmann::json to_json() const {
        return {
            {"source", source_id},
            {"target", target_id},
            {"type", relation_to_string(relation)},
            {"properties", properties}
        };
    }
};

struct Subgraph {
    std::vector<GraphNode> nodes;
    std::vector<GraphEdge> edges;

    nlohmann::json to_json() const {
        nlohmann::json j = {{"nodes", nlohmann::json::array()}, {"edges", nlohmann::json::array()}};
        for (const auto& n : nodes) j["nodes"].push_back(n.to_json());
        for (const auto& e : edges) j["edges"].push_back(e.to_json());
        return j;
    }
};

struct GraphStatistics {
    size_t node_count = 0;
    size_t edge_count = 0;
    std::map<std::string, size_t> nodes_by_label;
    std::map<std::string, size_t> edges_by_relation;

    nlohmann::json to_json() const {
        return {
            {"node_count", node_count},
            {"edge_count", edge_count},
            {"nodes_by_label", nodes_by_label},
            {"edges_by_relation", edges_by_relation}
        };
    }
};

} // namespace hsn_assistance
