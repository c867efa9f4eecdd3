#pragma once
#include <memory>
#include <vector>
#include "app_config.hpp"
#include "KeyManager.hpp"
#include "embedding_service.hpp"
#include "faiss_vector_store.hpp"
#include "generation_service.hpp"
#include "relevance_model.hpp"
#include "retrieval_engine.hpp"
#include "graph/graph_builder.hpp"
#include "agent/QueryProcessor.hpp"

namespace hsn_assistance {

// Factories for the configured backends. Unknown names raise ConfigError.
std::shared_ptr<GraphBackend> make_graph_backend(const KnowledgeGraphSettings& settings);
std::shared_ptr<RelevanceModel> make_relevance_model(const RerankerSettings& settings);
std::shared_ptr<GeneratorBackend> make_generator(const GeneratorSettings& settings,
                                                 const CircuitBreakerSettings& breaker,
                                                 std::shared_ptr<KeyManager> key_manager);

// Everything one serving process needs, wired from an AppConfig.
class AppContext {
public:
    explicit AppContext(AppConfig config);
    ~AppContext();

    // Loads documents, builds the in-memory graph when that backend is
    // selected, and loads or builds the vector index. Must finish before
    // any query is processed.
    void bootstrap();

    const AppConfig& config() const { return config_; }
    std::shared_ptr<GraphBackend> graph() const { return graph_; }
    KnowledgeGraphBuilder& builder() { return *builder_; }
    std::shared_ptr<QueryProcessor> processor() const { return processor_; }

private:
    AppConfig config_;
    std::shared_ptr<KeyManager> key_manager_;
    std::shared_ptr<GraphBackend> graph_;
    std::unique_ptr<KnowledgeGraphBuilder> builder_;
    std::shared_ptr<EmbeddingProvider> embedder_;
    std::shared_ptr<FaissVectorStore> vector_store_;
    std::shared_ptr<RetrievalEngine> engine_;
    std::shared_ptr<QueryProcessor> processor_;
};

} // namespace hsn_assistance
