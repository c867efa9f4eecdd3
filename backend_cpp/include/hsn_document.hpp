#pragma once

#include <string>
#include <vector>
#include <optional>
#include <nlohmann/json.hpp>

namespace hsn_assistance {

// Flat taxonomy record produced by the ingestion pipeline.
struct HsnRecord {
    std::string hsn_code;
    std::string chapter;
    std::string heading;
    std::string subheading;
    std::string item_description = "N/A";
    std::string chapter_description = "N/A";
    std::string heading_description = "N/A";
    std::string subheading_description = "N/A";

    nlohmann::json to_json() const;
    static HsnRecord from_json(const nlohmann::json& j);
};

// Unit fed to both the graph builder and the vector store.
struct HsnDocument {
    std::string document_id;
    std::string text;
    HsnRecord metadata;

    nlohmann::json to_json() const;
    static HsnDocument from_json(const nlohmann::json& j);
};

struct RetrievedDocument {
    std::string id;
    std::string text;
    HsnRecord metadata;
    double score = 0.0;
    std::optional<std::string> graph_context;

    nlohmann::json to_json() const;
};

std::vector<HsnDocument> load_documents_file(const std::string& path);

std::string document_id_for_code(const std::string& hsn_code);

} // namespace hsn_assistance
