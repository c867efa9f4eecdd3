#include "app_context.hpp"
#include "errors.hpp"
#include "graph/in_memory_graph.hpp"
#include "graph/neo4j_graph.hpp"
#include <chrono>
#include <spdlog/spdlog.h>

namespace hsn_assistance {

std::shared_ptr<GraphBackend> make_graph_backend(const KnowledgeGraphSettings& settings) {
    if (settings.backend == "in_memory") {
        return std::make_shared<InMemoryGraphBackend>();
    }
    if (settings.backend == "neo4j") {
        return std::make_shared<Neo4jGraphBackend>(settings.neo4j);
    }
    throw ConfigError("Unsupported graph backend: " + settings.backend);
}

std::shared_ptr<RelevanceModel> make_relevance_model(const RerankerSettings& settings) {
    if (settings.backend == "http") {
        return std::make_shared<CrossEncoderClient>(settings.url, settings.model, settings.timeout_ms);
    }
    if (settings.backend == "lexical") {
        return std::make_shared<LexicalRelevanceModel>();
    }
    throw ConfigError("Unsupported reranker backend: " + settings.backend);
}

std::shared_ptr<GeneratorBackend> make_generator(const GeneratorSettings& settings,
                                                 const CircuitBreakerSettings& breaker,
                                                 std::shared_ptr<KeyManager> key_manager) {
    if (settings.backend == "mock") {
        return std::make_shared<MockGenerator>();
    }
    if (settings.backend == "gemini") {
        if (!key_manager || key_manager->get_active_key_count() == 0) {
            throw ConfigError("Gemini generator selected but no API key is configured (keys.json or GEMINI_API_KEY)");
        }
        GeminiSettings gs;
        gs.temperature = settings.temperature;
        gs.timeout_seconds = settings.timeout_seconds;
        gs.max_retries = settings.max_retries;
        auto cb = std::make_shared<CircuitBreaker>(breaker.fail_max, std::chrono::seconds(breaker.reset_timeout_seconds));
        return std::make_shared<GeminiGenerator>(std::move(key_manager), gs, std::move(cb));
    }
    throw ConfigError("Unsupported generator backend: " + settings.backend);
}

AppContext::AppContext(AppConfig config) : config_(std::move(config)) {
    key_manager_ = std::make_shared<KeyManager>();
    key_manager_->set_models(config_.rag_system.generator.model, config_.rag_system.embedding.model);

    graph_ = make_graph_backend(config_.knowledge_graph);
    builder_ = std::make_unique<KnowledgeGraphBuilder>(graph_);

    embedder_ = std::make_shared<EmbeddingService>(key_manager_, config_.rag_system.embedding.base_url);
    vector_store_ = std::make_shared<FaissVectorStore>(config_.rag_system.vector_store.dimension, embedder_);

    auto strategy = make_strategy(config_.rag_system.retrieval,
                                  make_relevance_model(config_.rag_system.reranker),
                                  graph_);
    auto generator = make_generator(config_.rag_system.generator, config_.rag_system.circuit_breaker, key_manager_);

    engine_ = std::make_shared<RetrievalEngine>(vector_store_, generator, std::move(strategy));
    processor_ = std::make_shared<QueryProcessor>(engine_, config_.query_processor);

    spdlog::info("🚀 Context ready: graph={}, strategy={}, generator={}",
                 graph_->name(), config_.rag_system.retrieval.strategy, config_.rag_system.generator.backend);
}

AppContext::~AppContext() {
    try {
        if (graph_) graph_->close();
    } catch (const std::exception& e) {
        spdlog::warn("⚠️ Graph backend did not close cleanly: {}", e.what());
    }
}

void AppContext::bootstrap() {
    auto start = std::chrono::high_resolution_clock::now();

    builder_->load_documents(config_.data_paths.processed_docs);

    // The in-memory graph lives only as long as the process.
    if (graph_->supports_direct_traversal()) {
        builder_->build();
        builder_->enrich_siblings();
    }

    // A persisted database graph is checked against the loaded documents as-is.
    auto report = builder_->validate_integrity();
    if (!report.ok()) {
        spdlog::warn("⚠️ Serving with {} graph integrity violations", report.violations.size());
    }

    const auto& vs_path = config_.rag_system.vector_store.path;
    if (FaissVectorStore::exists(vs_path)) {
        vector_store_->load(vs_path);
    } else {
        spdlog::info("No persisted vector store at {}; indexing documents...", vs_path);
        engine_->initialize_vector_store(builder_->documents());
        vector_store_->save(vs_path);
    }

    spdlog::info("✅ Bootstrap complete in {:.2f} ms",
                 std::chrono::duration<double, std::milli>(std::chrono::high_resolution_clock::now() - start).count());
}

} // namespace hsn_assistance
