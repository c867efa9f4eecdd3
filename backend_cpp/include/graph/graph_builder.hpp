#pragma once
#include <string>
#include <vector>
#include <memory>
#include <functional>
#include <unordered_set>
#include "graph/graph_backend.hpp"
#include "hsn_document.hpp"

namespace hsn_assistance {

// Batch embedding collaborator: one vector per input text, same order.
using EmbeddingFn = std::function<std::vector<std::vector<float>>(const std::vector<std::string>&)>;

struct IntegrityReport {
    size_t codes_checked = 0;
    std::vector<std::string> violations;

    bool ok() const { return violations.empty(); }
};

enum class TraversalDirection {
    UP,
    DOWN
};

/**
 * Builds and enriches the HSN knowledge graph on top of any GraphBackend.
 * Every write goes through the backend's idempotent add_node/add_edge, so
 * build() may be re-run over the same records without changing the graph.
 */
class KnowledgeGraphBuilder {
public:
    explicit KnowledgeGraphBuilder(std::shared_ptr<GraphBackend> backend);

    void load_documents(const std::string& path);
    void set_documents(std::vector<HsnDocument> documents);
    const std::vector<HsnDocument>& documents() const { return documents_; }

    // Builds from the loaded documents. Throws if none are loaded.
    void build();
    void build(const std::vector<HsnRecord>& records);

    void add_entity_relationships(const HsnRecord& record);

    // SIBLING_OF both ways between codes sharing a subheading. Returns edges created.
    size_t enrich_siblings();

    // SIMILAR_TO for every code pair with cosine similarity strictly above threshold.
    size_t enrich_similarity(const EmbeddingFn& embedding_fn, double threshold);

    void optimize();

    IntegrityReport validate_integrity() const;

    std::vector<GraphNode> traverse_hierarchy(const std::string& hsn_code, TraversalDirection direction) const;
    Subgraph context_subgraph(const std::string& hsn_code, int depth = 1) const;

    GraphStatistics statistics() const;
    void export_graph(const std::string& file_path) const;

    // Interactive HTML view; only for backends with direct traversal. Returns false when skipped.
    bool write_visualization(const std::string& file_path) const;

    std::shared_ptr<GraphBackend> backend() const { return backend_; }

    static std::string chapter_node_id(const std::string& chapter) { return "chap_" + chapter; }
    static std::string heading_node_id(const std::string& heading) { return "head_" + heading; }
    static std::string subheading_node_id(const std::string& subheading) { return "sub_" + subheading; }
    static std::string code_node_id(const std::string& hsn_code) { return "code_" + hsn_code; }

private:
    std::shared_ptr<GraphBackend> backend_;
    std::vector<HsnDocument> documents_;

    // Distinct records seen across all build() calls, in first-seen order.
    std::vector<HsnRecord> records_;
    std::unordered_set<std::string> record_keys_;
};

} // namespace hsn_assistance
