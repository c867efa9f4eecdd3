#include "hsn_document.hpp"
#include <fstream>
#include <stdexcept>
#include <spdlog/spdlog.h>

namespace hsn_assistance {

using json = nlohmann::json;

namespace {

// Ids sometimes arrive as numbers from the upstream extractor.
std::string field_as_string(const json& j, const std::string& key, const std::string& fallback) {
    if (!j.contains(key) || j[key].is_null()) return fallback;
    const auto& v = j[key];
    if (v.is_string()) return v.get<std::string>();
    if (v.is_number_integer()) return std::to_string(v.get<long long>());
    return v.dump();
}

} // namespace

json HsnRecord::to_json() const {
    return json{
        {"hsn_code", hsn_code},
        {"chapter", chapter},
        {"heading", heading},
        {"subheading", subheading},
        {"item_description", item_description},
        {"chapter_description", chapter_description},
        {"heading_description", heading_description},
        {"subheading_description", subheading_description}
    };
}

HsnRecord HsnRecord::from_json(const json& j) {
    HsnRecord r;
    r.hsn_code = field_as_string(j, "hsn_code", "");
    r.chapter = field_as_string(j, "chapter", "");
    r.heading = field_as_string(j, "heading", "");
    r.subheading = field_as_string(j, "subheading", "");
    r.item_description = field_as_string(j, "item_description", "N/A");
    r.chapter_description = field_as_string(j, "chapter_description", "N/A");
    r.heading_description = field_as_string(j, "heading_description", "N/A");
    r.subheading_description = field_as_string(j, "subheading_description", "N/A");
    return r;
}

json HsnDocument::to_json() const {
    return json{{"document_id", document_id}, {"text", text}, {"metadata", metadata.to_json()}};
}

HsnDocument HsnDocument::from_json(const json& j) {
    HsnDocument doc;
    doc.metadata = HsnRecord::from_json(j.value("metadata", json::object()));
    doc.document_id = j.value("document_id", document_id_for_code(doc.metadata.hsn_code));
    doc.text = j.value("text", "");
    return doc;
}

json RetrievedDocument::to_json() const {
    json j = {
        {"id", id},
        {"text", text},
        {"metadata", metadata.to_json()},
        {"score", score}
    };
    if (graph_context) j["graph_context"] = *graph_context;
    return j;
}

std::vector<HsnDocument> load_documents_file(const std::string& path) {
    std::ifstream f(path);
    if (!f.is_open()) {
        throw std::runtime_error("Documents file not found: " + path);
    }

    json data = json::parse(f);
    if (!data.is_array()) {
        throw std::runtime_error("Documents file must contain a JSON array: " + path);
    }

    std::vector<HsnDocument> docs;
    docs.reserve(data.size());
    for (const auto& j_doc : data) {
        docs.push_back(HsnDocument::from_json(j_doc));
    }
    spdlog::info("Loaded {} documents from {}", docs.size(), path);
    return docs;
}

std::string document_id_for_code(const std::string& hsn_code) {
    return "hsn_" + hsn_code;
}

} // namespace hsn_assistance
