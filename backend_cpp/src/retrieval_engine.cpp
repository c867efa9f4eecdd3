#include "retrieval_engine.hpp"
#include "errors.hpp"
#include "SystemMonitor.hpp"
#include <chrono>
#include <spdlog/spdlog.h>

namespace hsn_assistance {

RetrievalEngine::RetrievalEngine(std::shared_ptr<VectorStore> vector_store,
                                 std::shared_ptr<GeneratorBackend> generator,
                                 std::unique_ptr<RetrievalStrategy> strategy)
    : vector_store_(std::move(vector_store)),
      generator_(std::move(generator)),
      strategy_(std::move(strategy)) {
    if (!vector_store_ || !generator_ || !strategy_) {
        throw ConfigError("RetrievalEngine requires a vector store, a generator and a strategy");
    }
}

void RetrievalEngine::initialize_vector_store(const std::vector<HsnDocument>& documents) {
    vector_store_->initialize(documents);
}

std::vector<RetrievedDocument> RetrievalEngine::retrieve_documents(const std::string& query) {
    auto start = std::chrono::high_resolution_clock::now();

    auto docs = strategy_->retrieve(query, *vector_store_);

    double duration = std::chrono::duration<double, std::milli>(std::chrono::high_resolution_clock::now() - start).count();
    SystemMonitor::global_retrieval_latency_ms.store(duration);
    spdlog::info("⏱️ Retrieval ({}) returned {} documents in {:.2f} ms", strategy_->name(), docs.size(), duration);
    return docs;
}

QueryResponse RetrievalEngine::generate_from_docs(const std::string& query, const std::vector<RetrievedDocument>& docs) {
    std::string prompt = build_prompt(query, docs);

    auto start = std::chrono::high_resolution_clock::now();
    std::string generated = generator_->generate(prompt);
    double duration = std::chrono::duration<double, std::milli>(std::chrono::high_resolution_clock::now() - start).count();
    SystemMonitor::global_llm_generation_ms.store(duration);
    spdlog::info("⏱️ Generation took {:.2f} ms", duration);

    return generate_structured_response(generated, docs);
}

std::optional<HsnDocument> RetrievalEngine::lookup_code(const std::string& hsn_code) const {
    return vector_store_->get_document(document_id_for_code(hsn_code));
}

std::string RetrievalEngine::build_prompt(const std::string& query, const std::vector<RetrievedDocument>& docs) {
    std::string context;
    for (size_t i = 0; i < docs.size(); ++i) {
        if (i > 0) context += "\n---\n";
        const auto& doc = docs[i];
        context += "HSN Code: " + (doc.metadata.hsn_code.empty() ? std::string("N/A") : doc.metadata.hsn_code) + "\n";
        context += "Description: " + doc.text + "\n";
        context += "Graph Context: " + doc.graph_context.value_or("N/A");
    }

    return "User query: \"" + query + "\"\n\n"
           "Based on the following retrieved HSN code information, provide a structured answer.\n"
           "- Classify the user's query with the most likely HSN code.\n"
           "- Provide a confidence score (High, Medium, Low).\n"
           "- Explain your reasoning based on the provided context.\n"
           "- List the top 3 potential matches with their descriptions.\n\n"
           "Context:\n" + context + "\n";
}

QueryResponse RetrievalEngine::generate_structured_response(const std::string& generated_text,
                                                            const std::vector<RetrievedDocument>& docs) {
    QueryResponse response;
    response.type = ResponseType::CLASSIFICATION_RESULT;
    response.summary = generated_text;
    for (const auto& doc : docs) {
        response.top_matches.push_back(Match::from_document(doc));
    }
    response.confidence = (!docs.empty() && docs.front().score > 0.85) ? "High" : "Medium";
    response.trade_policy = "Free";
    return response;
}

} // namespace hsn_assistance
