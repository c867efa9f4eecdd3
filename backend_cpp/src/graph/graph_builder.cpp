#include "graph/graph_builder.hpp"
#include "graph/graph_export.hpp"
#include <chrono>
#include <cmath>
#include <map>
#include <stdexcept>
#include <spdlog/spdlog.h>

namespace hsn_assistance {

namespace {

double elapsed_ms(std::chrono::high_resolution_clock::time_point start) {
    return std::chrono::duration<double, std::milli>(std::chrono::high_resolution_clock::now() - start).count();
}

void normalize(std::vector<float>& v) {
    double norm = 0.0;
    for (float x : v) norm += static_cast<double>(x) * x;
    norm = std::sqrt(norm);
    if (norm == 0.0) return;
    for (float& x : v) x = static_cast<float>(x / norm);
}

double dot(const std::vector<float>& a, const std::vector<float>& b) {
    double sum = 0.0;
    size_t n = std::min(a.size(), b.size());
    for (size_t i = 0; i < n; ++i) sum += static_cast<double>(a[i]) * b[i];
    return sum;
}

} // namespace

KnowledgeGraphBuilder::KnowledgeGraphBuilder(std::shared_ptr<GraphBackend> backend)
    : backend_(std::move(backend)) {
    if (!backend_) throw std::invalid_argument("KnowledgeGraphBuilder requires a graph backend");
}

void KnowledgeGraphBuilder::load_documents(const std::string& path) {
    spdlog::info("Loading structured documents from {}...", path);
    documents_ = load_documents_file(path);
}

void KnowledgeGraphBuilder::set_documents(std::vector<HsnDocument> documents) {
    documents_ = std::move(documents);
}

void KnowledgeGraphBuilder::build() {
    if (documents_.empty()) {
        throw std::runtime_error("Documents not loaded. Call load_documents() first.");
    }
    std::vector<HsnRecord> records;
    records.reserve(documents_.size());
    for (const auto& doc : documents_) records.push_back(doc.metadata);
    build(records);
}

void KnowledgeGraphBuilder::build(const std::vector<HsnRecord>& records) {
    auto start = std::chrono::high_resolution_clock::now();
    spdlog::info("Building the hierarchical HSN knowledge graph from {} records...", records.size());

    for (const auto& record : records) {
        add_entity_relationships(record);
    }

    spdlog::info("⏱️ Hierarchy construction took {:.2f} ms", elapsed_ms(start));
}

void KnowledgeGraphBuilder::add_entity_relationships(const HsnRecord& record) {
    const std::string chapter_id = chapter_node_id(record.chapter);
    const std::string heading_id = heading_node_id(record.heading);
    const std::string subheading_id = subheading_node_id(record.subheading);
    const std::string code_id = code_node_id(record.hsn_code);

    // Hierarchy order: Chapter -> Heading -> Subheading -> Code
    backend_->add_node({chapter_id, NodeLabel::CHAPTER, record.chapter_description});
    backend_->add_node({heading_id, NodeLabel::HEADING, record.heading_description});
    backend_->add_node({subheading_id, NodeLabel::SUBHEADING, record.subheading_description});
    backend_->add_node({code_id, NodeLabel::CODE, record.item_description});

    backend_->add_edge(chapter_id, heading_id, Relation::HAS_HEADING);
    backend_->add_edge(heading_id, subheading_id, Relation::HAS_SUBHEADING);
    backend_->add_edge(subheading_id, code_id, Relation::HAS_CODE);

    std::string key = record.hsn_code + '\x1f' + record.subheading + '\x1f' + record.heading + '\x1f' + record.chapter;
    if (record_keys_.insert(key).second) {
        records_.push_back(record);
    }
}

size_t KnowledgeGraphBuilder::enrich_siblings() {
    auto start = std::chrono::high_resolution_clock::now();
    spdlog::info("Enriching graph with rule-based SIBLING_OF relationships...");

    // std::map keeps group iteration order deterministic.
    std::map<std::string, std::vector<std::string>> codes_by_subheading;
    std::map<std::string, std::unordered_set<std::string>> seen;
    for (const auto& record : records_) {
        auto sub_id = subheading_node_id(record.subheading);
        auto code_id = code_node_id(record.hsn_code);
        if (seen[sub_id].insert(code_id).second) {
            codes_by_subheading[sub_id].push_back(code_id);
        }
    }

    size_t created = 0;
    for (const auto& [sub_id, codes] : codes_by_subheading) {
        for (size_t i = 0; i < codes.size(); ++i) {
            for (size_t j = i + 1; j < codes.size(); ++j) {
                if (backend_->add_edge(codes[i], codes[j], Relation::SIBLING_OF)) ++created;
                if (backend_->add_edge(codes[j], codes[i], Relation::SIBLING_OF)) ++created;
            }
        }
    }

    spdlog::info("✅ Added {} SIBLING_OF edges across {} subheadings ({:.2f} ms)",
                 created, codes_by_subheading.size(), elapsed_ms(start));
    return created;
}

size_t KnowledgeGraphBuilder::enrich_similarity(const EmbeddingFn& embedding_fn, double threshold) {
    if (!embedding_fn) {
        spdlog::info("Similarity enrichment skipped: no embedding function configured.");
        return 0;
    }

    auto start = std::chrono::high_resolution_clock::now();
    spdlog::info("Starting embedding-based SIMILAR_TO enrichment (threshold {:.2f})...", threshold);

    std::vector<std::string> ids;
    std::vector<std::string> descriptions;
    std::unordered_set<std::string> seen;
    for (const auto& record : records_) {
        if (record.hsn_code.empty()) continue;
        auto code_id = code_node_id(record.hsn_code);
        if (!seen.insert(code_id).second) continue;
        ids.push_back(code_id);
        descriptions.push_back(record.item_description);
    }

    if (ids.empty()) {
        spdlog::warn("⚠️ No code nodes found for similarity enrichment.");
        return 0;
    }

    spdlog::info("Generating embeddings for {} descriptions...", descriptions.size());
    auto embeddings = embedding_fn(descriptions);
    if (embeddings.size() != ids.size()) {
        throw std::runtime_error("Embedding collaborator returned " + std::to_string(embeddings.size()) +
                                 " vectors for " + std::to_string(ids.size()) + " descriptions");
    }
    for (auto& e : embeddings) normalize(e);

    size_t created = 0;
    for (size_t i = 0; i < ids.size(); ++i) {
        for (size_t j = i + 1; j < ids.size(); ++j) {
            double sim = dot(embeddings[i], embeddings[j]);
            if (sim > threshold) {
                spdlog::debug("Found similarity between {} and {}: {:.4f}", ids[i], ids[j], sim);
                if (backend_->add_edge(ids[i], ids[j], Relation::SIMILAR_TO, {{"score", sim}})) ++created;
            }
        }
    }

    spdlog::info("✅ Similarity enrichment complete: {} SIMILAR_TO edges ({:.2f} ms)", created, elapsed_ms(start));
    return created;
}

void KnowledgeGraphBuilder::optimize() {
    backend_->create_indexes();
}

IntegrityReport KnowledgeGraphBuilder::validate_integrity() const {
    spdlog::info("Validating graph integrity...");
    IntegrityReport report;

    std::unordered_set<std::string> checked;
    std::vector<std::string> upper_levels;

    auto check_single_parent = [&](const std::string& node_id) {
        size_t parents = 0;
        for (const auto& edge : backend_->get_edges(node_id, Direction::IN)) {
            if (is_hierarchy_relation(edge.relation)) ++parents;
        }
        if (parents > 1) {
            report.violations.push_back(node_id + " has " + std::to_string(parents) + " hierarchy parents");
        }
    };

    // Without a build() on this instance, check the loaded documents against
    // whatever the backend already holds.
    std::vector<HsnRecord> loaded;
    if (records_.empty()) {
        loaded.reserve(documents_.size());
        for (const auto& doc : documents_) loaded.push_back(doc.metadata);
    }
    const auto& records = records_.empty() ? loaded : records_;

    for (const auto& record : records) {
        auto code_id = code_node_id(record.hsn_code);
        if (checked.insert(code_id).second) {
            ++report.codes_checked;

            auto parents = backend_->get_neighbors(code_id, Direction::IN);
            bool has_subheading = false;
            for (const auto& p : parents) {
                if (p.label == NodeLabel::SUBHEADING) {
                    has_subheading = true;
                    break;
                }
            }
            if (!has_subheading) {
                report.violations.push_back(code_id + " has no Subheading parent");
            }
            check_single_parent(code_id);
        }

        for (const auto& id : {subheading_node_id(record.subheading), heading_node_id(record.heading)}) {
            if (checked.insert(id).second) upper_levels.push_back(id);
        }
    }

    for (const auto& id : upper_levels) check_single_parent(id);

    for (const auto& v : report.violations) {
        spdlog::warn("⚠️ Integrity check failed: {}", v);
    }
    if (report.ok()) {
        spdlog::info("✅ Graph integrity validation passed ({} codes).", report.codes_checked);
    }
    return report;
}

std::vector<GraphNode> KnowledgeGraphBuilder::traverse_hierarchy(const std::string& hsn_code,
                                                                 TraversalDirection direction) const {
    auto dir = (direction == TraversalDirection::UP) ? Direction::IN : Direction::OUT;
    return backend_->get_neighbors(code_node_id(hsn_code), dir);
}

Subgraph KnowledgeGraphBuilder::context_subgraph(const std::string& hsn_code, int depth) const {
    return backend_->get_subgraph(code_node_id(hsn_code), depth);
}

GraphStatistics KnowledgeGraphBuilder::statistics() const {
    return backend_->get_statistics();
}

void KnowledgeGraphBuilder::export_graph(const std::string& file_path) const {
    backend_->export_graphml(file_path);
}

bool KnowledgeGraphBuilder::write_visualization(const std::string& file_path) const {
    if (!backend_->supports_direct_traversal()) {
        spdlog::warn("⚠️ Visualization is only supported for backends with direct traversal ({} has none).",
                     backend_->name());
        return false;
    }
    spdlog::info("Generating interactive visualization at {}...", file_path);
    write_visualization_html(file_path, backend_->snapshot());
    return true;
}

} // namespace hsn_assistance
