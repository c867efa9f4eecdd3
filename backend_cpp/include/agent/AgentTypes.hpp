#pragma once
#include <string>
#include <vector>
#include <optional>
#include <nlohmann/json.hpp>
#include "hsn_document.hpp"

namespace hsn_assistance {

enum class Intent {
    DIRECT_LOOKUP,
    SELECTION,
    SUMMARIZATION,
    CLASSIFICATION
};

enum class ResponseType {
    CLASSIFICATION_RESULT,
    DISAMBIGUATION,
    CLARIFICATION_PROMPT,
    NO_RESULT,
    INVALID_SELECTION
};

enum class NoResultReason {
    NOT_FOUND,
    LOW_CONFIDENCE
};

inline std::string intent_to_string(Intent i) {
    switch (i) {
        case Intent::DIRECT_LOOKUP: return "direct_lookup";
        case Intent::SELECTION: return "selection";
        case Intent::SUMMARIZATION: return "summarization";
        case Intent::CLASSIFICATION: return "classification";
    }
    return "classification";
}

inline std::string response_type_to_string(ResponseType t) {
    switch (t) {
        case ResponseType::CLASSIFICATION_RESULT: return "classification_result";
        case ResponseType::DISAMBIGUATION: return "disambiguation";
        case ResponseType::CLARIFICATION_PROMPT: return "clarification_prompt";
        case ResponseType::NO_RESULT: return "no_result";
        case ResponseType::INVALID_SELECTION: return "invalid_selection";
    }
    return "no_result";
}

inline std::string no_result_reason_to_string(NoResultReason r) {
    return r == NoResultReason::NOT_FOUND ? "not_found" : "low_confidence";
}

// One entry of top_matches in a final answer.
struct Match {
    std::string hsn_code;
    std::string description;
    std::string full_context;
    std::optional<double> retrieval_score;
    std::optional<std::string> graph_context;
    HsnRecord metadata;

    static Match from_document(const RetrievedDocument& doc) {
        Match m;
        m.hsn_code = doc.metadata.hsn_code;
        m.description = doc.metadata.item_description;
        m.full_context = doc.text;
        m.retrieval_score = doc.score;
        m.graph_context = doc.graph_context;
        m.metadata = doc.metadata;
        return m;
    }

    nlohmann::json to_json() const {
        nlohmann::json j = {
            {"hsn_code", hsn_code},
            {"description", description},
            {"metadata", metadata.to_json()}
        };
        if (!full_context.empty()) j["full_context"] = full_context;
        if (retrieval_score) j["retrieval_score"] = *retrieval_score;
        if (graph_context) j["graph_context"] = *graph_context;
        return j;
    }
};

struct QueryResponse {
    ResponseType type = ResponseType::NO_RESULT;
    std::string summary;
    std::vector<Match> top_matches;
    // Disambiguation candidates, in the order they were offered (1-based for the user).
    std::vector<RetrievedDocument> options;
    std::string confidence;
    std::string trade_policy;
    std::optional<NoResultReason> reason;

    nlohmann::json to_json() const {
        nlohmann::json j = {
            {"type", response_type_to_string(type)},
            {"summary", summary}
        };
        if (!top_matches.empty()) {
            j["top_matches"] = nlohmann::json::array();
            for (const auto& m : top_matches) j["top_matches"].push_back(m.to_json());
        }
        if (!options.empty()) {
            j["options"] = nlohmann::json::array();
            for (const auto& o : options) j["options"].push_back(o.to_json());
        }
        if (!confidence.empty()) j["confidence"] = confidence;
        if (!trade_policy.empty()) j["trade_policy"] = trade_policy;
        if (reason) j["reason"] = no_result_reason_to_string(*reason);
        return j;
    }
};

} // namespace hsn_assistance
