#pragma once
#include <string>
#include <optional>
#include <nlohmann/json.hpp>
#include "graph/neo4j_graph.hpp"
#include "retrieval_strategies.hpp"
#include "agent/QueryProcessor.hpp"

namespace hsn_assistance {

struct DataPaths {
    std::string processed_docs = "data/processed/hsn_documents.json";
};

struct LoggingSettings {
    std::string level = "info";
    std::string log_file;   // empty: console only
    int max_size_mb = 5;
    int max_files = 3;
};

struct SimilarityEnrichmentSettings {
    bool enabled = false;
    double similarity_threshold = 0.85;
};

struct KnowledgeGraphSettings {
    std::string backend = "in_memory";
    std::string export_path = "output/hsn_knowledge_graph.graphml";
    std::string visualization_path = "output/hsn_knowledge_graph.html";
    Neo4jSettings neo4j;
    SimilarityEnrichmentSettings similarity_enrichment;
};

struct VectorStoreSettings {
    std::string backend = "faiss";
    std::string path = "data/vector_store";
    int dimension = 768;
};

struct EmbeddingSettings {
    std::string model = "text-embedding-004";
    std::string base_url = "https://generativelanguage.googleapis.com/v1beta/models/";
};

struct RerankerSettings {
    std::string backend = "lexical";
    std::string url = "http://localhost:8711/rerank";
    std::string model = "cross-encoder/ms-marco-MiniLM-L-6-v2";
    int timeout_ms = 10000;
};

struct GeneratorSettings {
    std::string backend = "mock";
    std::string model = "gemini-1.5-flash";
    double temperature = 0.1;
    int timeout_seconds = 30;
    int max_retries = 3;
};

struct CircuitBreakerSettings {
    int fail_max = 5;
    int reset_timeout_seconds = 60;
};

struct RagSystemSettings {
    VectorStoreSettings vector_store;
    EmbeddingSettings embedding;
    RetrievalSettings retrieval;
    RerankerSettings reranker;
    GeneratorSettings generator;
    CircuitBreakerSettings circuit_breaker;
};

struct ServerSettings {
    std::string host = "0.0.0.0";
    int port = 8080;
    // Idle sessions older than this are dropped; 0 keeps them until closed.
    int session_ttl_seconds = 1800;
};

struct AppConfig {
    std::string environment = "development";
    DataPaths data_paths;
    LoggingSettings logging;
    KnowledgeGraphSettings knowledge_graph;
    RagSystemSettings rag_system;
    QueryProcessorSettings query_processor;
    ServerSettings server;

    // Parses and validates a merged document. Throws ConfigError naming the offending key.
    static AppConfig from_json(const nlohmann::json& j);
};

// base.json deep-merged with <env>.json. config_dir defaults to
// $HSN_CONFIG_DIR, then ./config, then ../config; env defaults to $APP_ENV
// or "development".
nlohmann::json load_merged_config(std::optional<std::string> config_dir = std::nullopt,
                                  std::optional<std::string> env = std::nullopt);

AppConfig load_config(std::optional<std::string> config_dir = std::nullopt,
                      std::optional<std::string> env = std::nullopt);

// Console sink with the standard pattern, plus a rotating file sink when configured.
void setup_logging(const LoggingSettings& settings);

} // namespace hsn_assistance
