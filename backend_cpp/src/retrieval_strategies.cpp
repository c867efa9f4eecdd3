#include "retrieval_strategies.hpp"
#include "errors.hpp"
#include "SystemMonitor.hpp"
#include "graph/graph_builder.hpp"
#include <algorithm>
#include <chrono>
#include <unordered_set>
#include <spdlog/spdlog.h>

namespace hsn_assistance {

VectorOnlyStrategy::VectorOnlyStrategy(int top_k) : top_k_(top_k) {}

std::vector<RetrievedDocument> VectorOnlyStrategy::retrieve(const std::string& query, VectorStore& vector_store) {
    auto results = vector_store.query(query, top_k_);
    if (results.size() > static_cast<size_t>(top_k_)) results.resize(top_k_);
    return results;
}

ReRankStrategy::ReRankStrategy(int top_k, int candidate_multiplier, std::shared_ptr<RelevanceModel> relevance_model)
    : top_k_(top_k),
      candidate_multiplier_(candidate_multiplier < 1 ? 1 : candidate_multiplier),
      relevance_model_(std::move(relevance_model)) {
    if (!relevance_model_) throw ConfigError("ReRankStrategy requires a relevance model");
}

std::vector<RetrievedDocument> ReRankStrategy::retrieve(const std::string& query, VectorStore& vector_store) {
    auto candidates = vector_store.query(query, top_k_ * candidate_multiplier_);
    if (candidates.empty()) return {};

    std::vector<std::string> texts;
    texts.reserve(candidates.size());
    for (const auto& doc : candidates) texts.push_back(doc.text);

    auto scores = relevance_model_->score(query, texts);
    if (scores.size() != candidates.size()) {
        throw RerankError("Relevance model returned " + std::to_string(scores.size()) +
                          " scores for " + std::to_string(candidates.size()) + " candidates");
    }
    for (size_t i = 0; i < candidates.size(); ++i) {
        candidates[i].score = scores[i];
    }

    // Stable so equal scores keep first-stage order.
    std::stable_sort(candidates.begin(), candidates.end(),
                     [](const RetrievedDocument& a, const RetrievedDocument& b) { return a.score > b.score; });

    if (candidates.size() > static_cast<size_t>(top_k_)) candidates.resize(top_k_);
    spdlog::debug("Re-ranked to {} documents", candidates.size());
    return candidates;
}

GraphContextualStrategy::GraphContextualStrategy(std::unique_ptr<RetrievalStrategy> inner,
                                                 std::shared_ptr<GraphBackend> graph,
                                                 size_t cache_size)
    : inner_(std::move(inner)),
      graph_(std::move(graph)),
      context_cache_(std::max(cache_size, kMinCacheSize)) {
    if (!inner_) throw ConfigError("GraphContextualStrategy requires an inner strategy");
}

std::string GraphContextualStrategy::walk_ancestors(const std::string& hsn_code) const {
    const std::string node_id = KnowledgeGraphBuilder::code_node_id(hsn_code);
    if (!graph_->get_node(node_id)) return kCodeNotFound;

    // Follows the first incoming hierarchy edge at each level.
    std::vector<GraphNode> path;
    std::unordered_set<std::string> visited;
    std::string current = node_id;
    while (visited.insert(current).second) {
        auto node = graph_->get_node(current);
        if (!node) break;
        path.push_back(*node);

        std::string parent;
        for (const auto& edge : graph_->get_edges(current, Direction::IN)) {
            if (is_hierarchy_relation(edge.relation)) {
                parent = edge.source_id;
                break;
            }
        }
        if (parent.empty()) break;
        current = parent;
    }

    std::string context;
    for (auto it = path.rbegin(); it != path.rend(); ++it) {
        if (it->label == NodeLabel::CODE) continue;
        if (!context.empty()) context += ". ";
        context += node_label_to_string(it->label) + ": " + it->description;
    }
    return context;
}

std::string GraphContextualStrategy::graph_context(const std::string& hsn_code) {
    if (!graph_ || !graph_->supports_direct_traversal()) return kNotAvailable;

    if (auto cached = context_cache_.get(hsn_code)) {
        SystemMonitor::global_graph_context_cache_hits.fetch_add(1);
        return *cached;
    }

    std::string context = walk_ancestors(hsn_code);
    context_cache_.set(hsn_code, context);
    return context;
}

std::vector<RetrievedDocument> GraphContextualStrategy::retrieve(const std::string& query, VectorStore& vector_store) {
    auto results = inner_->retrieve(query, vector_store);

    auto start = std::chrono::high_resolution_clock::now();
    for (auto& doc : results) {
        if (!doc.metadata.hsn_code.empty()) {
            doc.graph_context = graph_context(doc.metadata.hsn_code);
        }
    }
    SystemMonitor::global_graph_context_latency_ms.store(
        std::chrono::duration<double, std::milli>(std::chrono::high_resolution_clock::now() - start).count());
    return results;
}

std::unique_ptr<RetrievalStrategy> make_strategy(const RetrievalSettings& settings,
                                                 std::shared_ptr<RelevanceModel> relevance_model,
                                                 std::shared_ptr<GraphBackend> graph) {
    if (settings.top_k <= 0) throw ConfigError("rag_system.retrieval.top_k must be positive");

    if (settings.strategy == "vector") {
        return std::make_unique<VectorOnlyStrategy>(settings.top_k);
    }
    if (settings.strategy == "rerank") {
        return std::make_unique<ReRankStrategy>(settings.top_k, settings.candidate_multiplier, std::move(relevance_model));
    }
    if (settings.strategy == "graph_contextual") {
        auto inner = std::make_unique<ReRankStrategy>(settings.top_k, settings.candidate_multiplier, std::move(relevance_model));
        return std::make_unique<GraphContextualStrategy>(std::move(inner), std::move(graph), settings.graph_context_cache_size);
    }
    throw ConfigError("Unknown retrieval strategy: " + settings.strategy);
}

} // namespace hsn_assistance
