#pragma once
#include <string>
#include "graph/graph_types.hpp"

namespace hsn_assistance {

// GraphML 1.0 with label/description node keys and type/score edge keys.
void write_graphml(const std::string& file_path, const Subgraph& graph);

// Standalone HTML page rendering the graph with vis-network.
void write_visualization_html(const std::string& file_path, const Subgraph& graph);

std::string xml_escape(const std::string& raw);

} // namespace hsn_assistance
