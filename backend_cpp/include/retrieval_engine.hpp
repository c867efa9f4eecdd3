#pragma once
#include <string>
#include <vector>
#include <memory>
#include <optional>
#include "vector_store.hpp"
#include "generation_service.hpp"
#include "retrieval_strategies.hpp"
#include "agent/AgentTypes.hpp"

namespace hsn_assistance {

// Retrieval-augmented answer pipeline: strategy over the vector store for
// candidates, generation backend for the final narrative.
class RetrievalEngine {
public:
    RetrievalEngine(std::shared_ptr<VectorStore> vector_store,
                    std::shared_ptr<GeneratorBackend> generator,
                    std::unique_ptr<RetrievalStrategy> strategy);

    void initialize_vector_store(const std::vector<HsnDocument>& documents);

    std::vector<RetrievedDocument> retrieve_documents(const std::string& query);

    // Builds the prompt, calls the generator and wraps the answer.
    QueryResponse generate_from_docs(const std::string& query, const std::vector<RetrievedDocument>& docs);

    // Exact lookup by taxonomy code, bypassing retrieval.
    std::optional<HsnDocument> lookup_code(const std::string& hsn_code) const;

    static std::string build_prompt(const std::string& query, const std::vector<RetrievedDocument>& docs);
    static QueryResponse generate_structured_response(const std::string& generated_text,
                                                      const std::vector<RetrievedDocument>& docs);

    const RetrievalStrategy& strategy() const { return *strategy_; }

private:
    std::shared_ptr<VectorStore> vector_store_;
    std::shared_ptr<GeneratorBackend> generator_;
    std::unique_ptr<RetrievalStrategy> strategy_;
};

} // namespace hsn_assistance
