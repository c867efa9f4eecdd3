#pragma once
#include <string>
#include <vector>
#include <memory>
#include <optional>
#include "agent/AgentTypes.hpp"
#include "agent/ConversationState.hpp"
#include "retrieval_engine.hpp"

namespace hsn_assistance {

struct QueryProcessorSettings {
    double disambiguation_threshold = 0.15;
    double relevance_threshold = 0.40;
    size_t max_options = 3;
};

struct ParsedQuery {
    std::string text;
    Intent intent = Intent::CLASSIFICATION;
    std::string hsn_code;   // set for DIRECT_LOOKUP
};

// Rule-based intent classifier plus the Idle/AwaitingSelection dialogue
// state machine. A turn is fully computed before the conversation state is
// touched, so an upstream exception leaves the state as it was.
class QueryProcessor {
public:
    static constexpr const char* kLowConfidenceSummary =
        "I'm sorry, but I couldn't find any relevant HSN codes for your query in my knowledge base.";
    static constexpr const char* kUnparsableSelection = "I'm sorry, I didn't understand that selection.";
    static constexpr const char* kInvalidOption = "That's not a valid option number.";
    static constexpr const char* kUserConfirmed = "Very High (User Confirmed)";

    QueryProcessor(std::shared_ptr<RetrievalEngine> engine, QueryProcessorSettings settings = {});

    QueryResponse process_query(const std::string& query, ConversationState& state);

    ParsedQuery classify_intent(const std::string& query, const ConversationState& state) const;

    // Top max_options documents when the top-1/top-2 gap is below the threshold.
    std::optional<std::vector<RetrievedDocument>> identify_ambiguous_cases(const std::vector<RetrievedDocument>& docs) const;

    const QueryProcessorSettings& settings() const { return settings_; }

    static std::vector<std::string> lemmatize_tokens(const std::string& text);

private:
    std::shared_ptr<RetrievalEngine> engine_;
    QueryProcessorSettings settings_;

    QueryResponse handle_direct_lookup(const std::string& hsn_code) const;
    QueryResponse handle_summarization() const;
    QueryResponse handle_selection(const std::string& query, const std::vector<RetrievedDocument>& options,
                                   bool& accepted) const;
    QueryResponse generate_disambiguation_prompt(const std::vector<RetrievedDocument>& options) const;
};

} // namespace hsn_assistance
