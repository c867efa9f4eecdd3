#include <spdlog/spdlog.h>
#include <chrono>
#include <memory>

#include "app_config.hpp"
#include "app_context.hpp"
#include "errors.hpp"
#include "graph/graph_builder.hpp"

// Offline pipeline: documents -> hierarchy -> enrichment -> validation -> exports.
int main() {
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");

    try {
        auto config = hsn_assistance::load_config();
        hsn_assistance::setup_logging(config.logging);
        auto start = std::chrono::high_resolution_clock::now();

        spdlog::info("🚀 Starting knowledge graph build ({} backend)", config.knowledge_graph.backend);
        auto graph = hsn_assistance::make_graph_backend(config.knowledge_graph);
        hsn_assistance::KnowledgeGraphBuilder builder(graph);

        builder.load_documents(config.data_paths.processed_docs);
        builder.build();
        builder.enrich_siblings();

        const auto& sim = config.knowledge_graph.similarity_enrichment;
        if (sim.enabled) {
            auto key_manager = std::make_shared<hsn_assistance::KeyManager>();
            key_manager->set_models("", config.rag_system.embedding.model);
            auto embedder = std::make_shared<hsn_assistance::EmbeddingService>(key_manager, config.rag_system.embedding.base_url);
            builder.enrich_similarity(
                [embedder](const std::vector<std::string>& texts) { return embedder->embed_batch(texts); },
                sim.similarity_threshold);
        } else {
            spdlog::info("Similarity enrichment disabled in configuration.");
        }

        builder.optimize();

        auto report = builder.validate_integrity();
        auto stats = builder.statistics();
        spdlog::info("📊 Graph statistics: {}", stats.to_json().dump());
        if (!report.ok()) {
            spdlog::warn("⚠️ {} integrity violations across {} codes", report.violations.size(), report.codes_checked);
        }

        builder.export_graph(config.knowledge_graph.export_path);
        spdlog::info("💾 GraphML exported to {}", config.knowledge_graph.export_path);
        builder.write_visualization(config.knowledge_graph.visualization_path);

        graph->close();
        spdlog::info("✅ Graph build finished in {:.2f} ms",
                     std::chrono::duration<double, std::milli>(std::chrono::high_resolution_clock::now() - start).count());
    } catch (const hsn_assistance::ConfigError& e) {
        spdlog::critical("💥 Configuration error: {}", e.what());
        return 2;
    } catch (const std::exception& e) {
        spdlog::critical("💥 Graph build failed: {}", e.what());
        return 1;
    }
    return 0;
}
