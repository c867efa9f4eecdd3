#include "app_config.hpp"
#include "errors.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <set>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace hsn_assistance {

namespace {

const json& section(const json& root, const char* key) {
    static const json empty = json::object();
    auto it = root.find(key);
    if (it == root.end() || it->is_null()) return empty;
    if (!it->is_object()) throw ConfigError(std::string("Configuration section '") + key + "' must be an object");
    return *it;
}

template<typename T>
void read(const json& sec, const std::string& path, const char* key, T& out) {
    auto it = sec.find(key);
    if (it == sec.end() || it->is_null()) return;
    try {
        out = it->get<T>();
    } catch (const json::exception&) {
        throw ConfigError("Invalid value for " + path + "." + key + ": " + it->dump());
    }
}

void require_one_of(const std::string& value, const std::set<std::string>& allowed, const std::string& key) {
    if (!allowed.count(value)) {
        std::string list;
        for (const auto& a : allowed) list += (list.empty() ? "" : ", ") + a;
        throw ConfigError("Invalid " + key + " '" + value + "' (expected one of: " + list + ")");
    }
}

json read_json_file(const fs::path& path) {
    std::ifstream f(path);
    if (!f.is_open()) throw ConfigError("Configuration file not found at: " + path.string());
    try {
        return json::parse(f);
    } catch (const json::parse_error& e) {
        throw ConfigError("Malformed configuration file " + path.string() + ": " + e.what());
    }
}

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

fs::path resolve_config_dir(const std::optional<std::string>& config_dir) {
    if (config_dir) return fs::path(*config_dir);
    if (const char* env_dir = std::getenv("HSN_CONFIG_DIR"); env_dir && *env_dir) return fs::path(env_dir);

    for (const auto& candidate : {fs::path("config"), fs::path("../config"), fs::path("../../config")}) {
        if (fs::exists(candidate / "base.json")) return candidate;
    }
    return fs::path("config");
}

} // namespace

json load_merged_config(std::optional<std::string> config_dir, std::optional<std::string> env) {
    fs::path dir = resolve_config_dir(config_dir);

    std::string environment;
    if (env) {
        environment = *env;
    } else if (const char* app_env = std::getenv("APP_ENV"); app_env && *app_env) {
        environment = app_env;
    } else {
        environment = "development";
    }
    environment = to_lower(environment);

    json merged = read_json_file(dir / "base.json");
    fs::path env_path = dir / (environment + ".json");
    if (fs::exists(env_path)) {
        merged.merge_patch(read_json_file(env_path));
    }
    merged["environment"] = environment;
    return merged;
}

AppConfig load_config(std::optional<std::string> config_dir, std::optional<std::string> env) {
    return AppConfig::from_json(load_merged_config(std::move(config_dir), std::move(env)));
}

AppConfig AppConfig::from_json(const json& j) {
    if (!j.is_object()) throw ConfigError("Configuration root must be an object");

    AppConfig cfg;
    read(j, "", "environment", cfg.environment);

    const auto& data = section(j, "data_paths");
    read(data, "data_paths", "processed_docs", cfg.data_paths.processed_docs);

    const auto& log = section(j, "logging");
    read(log, "logging", "level", cfg.logging.level);
    read(log, "logging", "log_file", cfg.logging.log_file);
    read(log, "logging", "max_size_mb", cfg.logging.max_size_mb);
    read(log, "logging", "max_files", cfg.logging.max_files);
    cfg.logging.level = to_lower(cfg.logging.level);
    require_one_of(cfg.logging.level, {"trace", "debug", "info", "warn", "error", "critical"}, "logging.level");

    const auto& kg = section(j, "knowledge_graph");
    read(kg, "knowledge_graph", "backend", cfg.knowledge_graph.backend);
    read(kg, "knowledge_graph", "export_path", cfg.knowledge_graph.export_path);
    read(kg, "knowledge_graph", "visualization_path", cfg.knowledge_graph.visualization_path);
    require_one_of(cfg.knowledge_graph.backend, {"in_memory", "neo4j"}, "knowledge_graph.backend");

    const auto& neo = section(kg, "neo4j");
    read(neo, "knowledge_graph.neo4j", "uri", cfg.knowledge_graph.neo4j.uri);
    read(neo, "knowledge_graph.neo4j", "user", cfg.knowledge_graph.neo4j.user);
    read(neo, "knowledge_graph.neo4j", "password", cfg.knowledge_graph.neo4j.password);
    read(neo, "knowledge_graph.neo4j", "database", cfg.knowledge_graph.neo4j.database);
    read(neo, "knowledge_graph.neo4j", "timeout_ms", cfg.knowledge_graph.neo4j.timeout_ms);
    if (cfg.knowledge_graph.neo4j.password.empty()) {
        if (const char* pw = std::getenv("NEO4J_PASSWORD"); pw && *pw) cfg.knowledge_graph.neo4j.password = pw;
    }

    const auto& sim = section(kg, "similarity_enrichment");
    read(sim, "knowledge_graph.similarity_enrichment", "enabled", cfg.knowledge_graph.similarity_enrichment.enabled);
    read(sim, "knowledge_graph.similarity_enrichment", "similarity_threshold",
         cfg.knowledge_graph.similarity_enrichment.similarity_threshold);
    double st = cfg.knowledge_graph.similarity_enrichment.similarity_threshold;
    if (st <= 0.0 || st >= 1.0) {
        throw ConfigError("knowledge_graph.similarity_enrichment.similarity_threshold must be in (0, 1)");
    }

    const auto& rag = section(j, "rag_system");

    const auto& vs = section(rag, "vector_store");
    read(vs, "rag_system.vector_store", "backend", cfg.rag_system.vector_store.backend);
    read(vs, "rag_system.vector_store", "path", cfg.rag_system.vector_store.path);
    read(vs, "rag_system.vector_store", "dimension", cfg.rag_system.vector_store.dimension);
    require_one_of(cfg.rag_system.vector_store.backend, {"faiss"}, "rag_system.vector_store.backend");
    if (cfg.rag_system.vector_store.dimension <= 0) {
        throw ConfigError("rag_system.vector_store.dimension must be positive");
    }

    const auto& emb = section(rag, "embedding");
    read(emb, "rag_system.embedding", "model", cfg.rag_system.embedding.model);
    read(emb, "rag_system.embedding", "base_url", cfg.rag_system.embedding.base_url);

    const auto& ret = section(rag, "retrieval");
    auto& retrieval = cfg.rag_system.retrieval;
    read(ret, "rag_system.retrieval", "strategy", retrieval.strategy);
    read(ret, "rag_system.retrieval", "top_k", retrieval.top_k);
    read(ret, "rag_system.retrieval", "candidate_multiplier", retrieval.candidate_multiplier);
    read(ret, "rag_system.retrieval", "graph_context_cache_size", retrieval.graph_context_cache_size);
    require_one_of(retrieval.strategy, {"vector", "rerank", "graph_contextual"}, "rag_system.retrieval.strategy");
    if (retrieval.top_k <= 0) throw ConfigError("rag_system.retrieval.top_k must be positive");
    if (retrieval.candidate_multiplier < 1) throw ConfigError("rag_system.retrieval.candidate_multiplier must be >= 1");
    if (retrieval.graph_context_cache_size < GraphContextualStrategy::kMinCacheSize) {
        spdlog::warn("⚠️ rag_system.retrieval.graph_context_cache_size {} raised to {}",
                     retrieval.graph_context_cache_size, GraphContextualStrategy::kMinCacheSize);
        retrieval.graph_context_cache_size = GraphContextualStrategy::kMinCacheSize;
    }

    const auto& rr = section(ret, "reranker");
    read(rr, "rag_system.retrieval.reranker", "backend", cfg.rag_system.reranker.backend);
    read(rr, "rag_system.retrieval.reranker", "url", cfg.rag_system.reranker.url);
    read(rr, "rag_system.retrieval.reranker", "model", cfg.rag_system.reranker.model);
    read(rr, "rag_system.retrieval.reranker", "timeout_ms", cfg.rag_system.reranker.timeout_ms);
    require_one_of(cfg.rag_system.reranker.backend, {"http", "lexical"}, "rag_system.retrieval.reranker.backend");

    const auto& gen = section(rag, "generator");
    auto& generator = cfg.rag_system.generator;
    read(gen, "rag_system.generator", "backend", generator.backend);
    read(gen, "rag_system.generator", "model", generator.model);
    read(gen, "rag_system.generator", "temperature", generator.temperature);
    read(gen, "rag_system.generator", "timeout_seconds", generator.timeout_seconds);
    read(gen, "rag_system.generator", "max_retries", generator.max_retries);
    require_one_of(generator.backend, {"gemini", "mock"}, "rag_system.generator.backend");
    if (generator.temperature < 0.0 || generator.temperature > 2.0) {
        throw ConfigError("rag_system.generator.temperature must be in [0, 2]");
    }
    if (generator.timeout_seconds <= 0) throw ConfigError("rag_system.generator.timeout_seconds must be positive");
    if (generator.max_retries < 1) throw ConfigError("rag_system.generator.max_retries must be >= 1");

    const auto& cb = section(rag, "circuit_breaker");
    read(cb, "rag_system.circuit_breaker", "fail_max", cfg.rag_system.circuit_breaker.fail_max);
    read(cb, "rag_system.circuit_breaker", "reset_timeout_seconds", cfg.rag_system.circuit_breaker.reset_timeout_seconds);
    if (cfg.rag_system.circuit_breaker.fail_max < 1) throw ConfigError("rag_system.circuit_breaker.fail_max must be >= 1");
    if (cfg.rag_system.circuit_breaker.reset_timeout_seconds < 0) {
        throw ConfigError("rag_system.circuit_breaker.reset_timeout_seconds must be >= 0");
    }

    const auto& qp = section(j, "query_processor");
    read(qp, "query_processor", "disambiguation_threshold", cfg.query_processor.disambiguation_threshold);
    read(qp, "query_processor", "relevance_threshold", cfg.query_processor.relevance_threshold);
    read(qp, "query_processor", "max_options", cfg.query_processor.max_options);
    for (auto [key, value] : {std::make_pair("disambiguation_threshold", cfg.query_processor.disambiguation_threshold),
                              std::make_pair("relevance_threshold", cfg.query_processor.relevance_threshold)}) {
        if (value < 0.0 || value > 1.0) throw ConfigError(std::string("query_processor.") + key + " must be in [0, 1]");
    }
    if (cfg.query_processor.max_options < 1) throw ConfigError("query_processor.max_options must be >= 1");

    const auto& srv = section(j, "server");
    read(srv, "server", "host", cfg.server.host);
    read(srv, "server", "port", cfg.server.port);
    if (cfg.server.port < 1 || cfg.server.port > 65535) throw ConfigError("server.port must be in [1, 65535]");
    read(srv, "server", "session_ttl_seconds", cfg.server.session_ttl_seconds);
    if (cfg.server.session_ttl_seconds < 0) throw ConfigError("server.session_ttl_seconds must be >= 0");

    return cfg;
}

void setup_logging(const LoggingSettings& settings) {
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());

    if (!settings.log_file.empty()) {
        fs::path log_path(settings.log_file);
        if (log_path.has_parent_path()) fs::create_directories(log_path.parent_path());
        sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            settings.log_file,
            static_cast<size_t>(settings.max_size_mb) * 1024 * 1024,
            static_cast<size_t>(settings.max_files)));
    }

    auto logger = std::make_shared<spdlog::logger>("hsn", sinks.begin(), sinks.end());
    spdlog::set_default_logger(logger);
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");
    spdlog::set_level(spdlog::level::from_str(settings.level));
}

} // namespace hsn_assistance
