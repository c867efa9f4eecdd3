#include "graph/graph_export.hpp"
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <limits>
#include <stdexcept>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace hsn_assistance {

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

std::ofstream open_output(const std::string& file_path) {
    fs::path p(file_path);
    if (p.has_parent_path()) fs::create_directories(p.parent_path());
    std::ofstream out(p);
    if (!out.is_open()) {
        throw std::runtime_error("Cannot open " + file_path + " for writing");
    }
    return out;
}

std::string group_color(NodeLabel label) {
    switch (label) {
        case NodeLabel::CHAPTER: return "#e4572e";
        case NodeLabel::HEADING: return "#f3a712";
        case NodeLabel::SUBHEADING: return "#29335c";
        case NodeLabel::CODE: return "#669bbc";
        default: return "#999999";
    }
}

// "</" inside an inline script would close the element early.
std::string script_safe(std::string text) {
    for (size_t pos = text.find("</"); pos != std::string::npos; pos = text.find("</", pos + 3)) {
        text.replace(pos, 2, "<\\/");
    }
    return text;
}

} // namespace

std::string xml_escape(const std::string& raw) {
    std::string out;
    out.reserve(raw.size());
    for (char c : raw) {
        switch (c) {
            case '&': out += "&amp;"; break;
            case '<': out += "&lt;"; break;
            case '>': out += "&gt;"; break;
            case '"': out += "&quot;"; break;
            case '\'': out += "&apos;"; break;
            default: out += c;
        }
    }
    return out;
}

void write_graphml(const std::string& file_path, const Subgraph& graph) {
    auto out = open_output(file_path);

    out << "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n"
        << "<graphml xmlns=\"http://graphml.graphdrawing.org/xmlns\">\n"
        << "  <key id=\"d0\" for=\"node\" attr.name=\"label\" attr.type=\"string\"/>\n"
        << "  <key id=\"d1\" for=\"node\" attr.name=\"description\" attr.type=\"string\"/>\n"
        << "  <key id=\"d2\" for=\"edge\" attr.name=\"type\" attr.type=\"string\"/>\n"
        << "  <key id=\"d3\" for=\"edge\" attr.name=\"score\" attr.type=\"double\"/>\n"
        << "  <graph edgedefault=\"directed\">\n";
    out << std::setprecision(std::numeric_limits<double>::max_digits10);

    for (const auto& node : graph.nodes) {
        out << "    <node id=\"" << xml_escape(node.id) << "\">\n"
            << "      <data key=\"d0\">" << xml_escape(node_label_to_string(node.label)) << "</data>\n"
            << "      <data key=\"d1\">" << xml_escape(node.description) << "</data>\n"
            << "    </node>\n";
    }

    for (const auto& edge : graph.edges) {
        out << "    <edge source=\"" << xml_escape(edge.source_id)
            << "\" target=\"" << xml_escape(edge.target_id) << "\">\n"
            << "      <data key=\"d2\">" << relation_to_string(edge.relation) << "</data>\n";
        auto score = edge.properties.find("score");
        if (score != edge.properties.end()) {
            out << "      <data key=\"d3\">" << score->second << "</data>\n";
        }
        out << "    </edge>\n";
    }

    out << "  </graph>\n</graphml>\n";
    spdlog::info("✅ GraphML written to {} ({} nodes, {} edges)", file_path, graph.nodes.size(), graph.edges.size());
}

void write_visualization_html(const std::string& file_path, const Subgraph& graph) {
    json nodes = json::array();
    for (const auto& node : graph.nodes) {
        nodes.push_back({
            {"id", node.id},
            {"label", node.id},
            {"title", node_label_to_string(node.label) + ": " + node.description},
            {"color", group_color(node.label)}
        });
    }

    json edges = json::array();
    for (const auto& edge : graph.edges) {
        edges.push_back({
            {"from", edge.source_id},
            {"to", edge.target_id},
            {"title", relation_to_string(edge.relation)},
            {"dashes", !is_hierarchy_relation(edge.relation)}
        });
    }

    auto out = open_output(file_path);
    out << "<!DOCTYPE html>\n<html>\n<head>\n<meta charset=\"utf-8\">\n"
        << "<title>HSN Knowledge Graph</title>\n"
        << "<script src=\"https://unpkg.com/vis-network/standalone/umd/vis-network.min.js\"></script>\n"
        << "<style>#graph { width: 100%; height: 800px; border: 1px solid #ddd; }</style>\n"
        << "</head>\n<body>\n<div id=\"graph\"></div>\n<script>\n"
        << "const nodes = new vis.DataSet(" << script_safe(nodes.dump(-1, ' ', false, json::error_handler_t::replace)) << ");\n"
        << "const edges = new vis.DataSet(" << script_safe(edges.dump(-1, ' ', false, json::error_handler_t::replace)) << ");\n"
        << "new vis.Network(document.getElementById('graph'), { nodes, edges },\n"
        << "  { edges: { arrows: 'to' }, physics: { stabilization: true } });\n"
        << "</script>\n</body>\n</html>\n";

    spdlog::info("✅ Visualization saved to {}", file_path);
}

} // namespace hsn_assistance
