#pragma once
#include <string>
#include <vector>
#include <memory>
#include "cache_manager.hpp"
#include "hsn_document.hpp"
#include "vector_store.hpp"
#include "relevance_model.hpp"
#include "graph/graph_backend.hpp"

namespace hsn_assistance {

struct RetrievalSettings {
    std::string strategy = "graph_contextual";
    int top_k = 5;
    int candidate_multiplier = 4;
    size_t graph_context_cache_size = 256;
};

// Output is ordered by descending score and holds at most top_k documents.
class RetrievalStrategy {
public:
    virtual ~RetrievalStrategy() = default;

    virtual std::vector<RetrievedDocument> retrieve(const std::string& query, VectorStore& vector_store) = 0;
    virtual std::string name() const = 0;
};

class VectorOnlyStrategy : public RetrievalStrategy {
public:
    explicit VectorOnlyStrategy(int top_k);

    std::vector<RetrievedDocument> retrieve(const std::string& query, VectorStore& vector_store) override;
    std::string name() const override { return "vector"; }

private:
    int top_k_;
};

// Over-fetches top_k * multiplier candidates, re-scores each (query, text)
// pair with the relevance model and keeps the best top_k.
class ReRankStrategy : public RetrievalStrategy {
public:
    ReRankStrategy(int top_k, int candidate_multiplier, std::shared_ptr<RelevanceModel> relevance_model);

    std::vector<RetrievedDocument> retrieve(const std::string& query, VectorStore& vector_store) override;
    std::string name() const override { return "rerank"; }

private:
    int top_k_;
    int candidate_multiplier_;
    std::shared_ptr<RelevanceModel> relevance_model_;
};

// Decorates an inner strategy, attaching the root-to-leaf hierarchy path of
// every candidate as graph_context.
class GraphContextualStrategy : public RetrievalStrategy {
public:
    static constexpr const char* kNotAvailable = "Graph context not available for this backend.";
    static constexpr const char* kCodeNotFound = "HSN code not found in graph.";
    static constexpr size_t kMinCacheSize = 128;

    GraphContextualStrategy(std::unique_ptr<RetrievalStrategy> inner,
                            std::shared_ptr<GraphBackend> graph,
                            size_t cache_size = 256);

    std::vector<RetrievedDocument> retrieve(const std::string& query, VectorStore& vector_store) override;
    std::string name() const override { return "graph_contextual"; }

    // Cached per code; paths never change once the graph is built.
    std::string graph_context(const std::string& hsn_code);

    size_t cache_size() const { return context_cache_.size(); }
    size_t cache_capacity() const { return context_cache_.capacity(); }

private:
    std::unique_ptr<RetrievalStrategy> inner_;
    std::shared_ptr<GraphBackend> graph_;
    LRUCache<std::string, std::string> context_cache_;

    std::string walk_ancestors(const std::string& hsn_code) const;
};

// Builds the configured strategy. Throws ConfigError for unknown names or a
// missing collaborator.
std::unique_ptr<RetrievalStrategy> make_strategy(const RetrievalSettings& settings,
                                                 std::shared_ptr<RelevanceModel> relevance_model,
                                                 std::shared_ptr<GraphBackend> graph);

} // namespace hsn_assistance
