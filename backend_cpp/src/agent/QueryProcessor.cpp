#include "agent/QueryProcessor.hpp"
#include "LogManager.hpp"
#include "SystemMonitor.hpp"
#include "embedding_service.hpp"
#include "errors.hpp"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <regex>
#include <unordered_set>
#include <spdlog/spdlog.h>

namespace hsn_assistance {

namespace {

const std::regex& hsn_code_regex() {
    static const std::regex re(R"(\b(\d{8})\b)");
    return re;
}

const std::unordered_set<std::string>& selection_keywords() {
    static const std::unordered_set<std::string> kw = {"select", "choose", "option", "first", "second", "third"};
    return kw;
}

const std::unordered_set<std::string>& summary_keywords() {
    static const std::unordered_set<std::string> kw = {"overview", "category", "type", "kind", "classification"};
    return kw;
}

std::string trim(const std::string& s) {
    auto begin = std::find_if_not(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c); });
    auto end = std::find_if_not(s.rbegin(), s.rend(), [](unsigned char c) { return std::isspace(c); }).base();
    return begin < end ? std::string(begin, end) : std::string();
}

bool is_bare_integer(const std::string& s) {
    std::string t = trim(s);
    return !t.empty() && std::all_of(t.begin(), t.end(), [](unsigned char c) { return std::isdigit(c); });
}

// Plural stripping: "categories" -> "category", "types" -> "type".
std::string lemma(const std::string& word) {
    if (word.size() > 4 && word.compare(word.size() - 3, 3, "ies") == 0) {
        return word.substr(0, word.size() - 3) + "y";
    }
    if (word.size() > 3 && word.back() == 's' && word[word.size() - 2] != 's') {
        return word.substr(0, word.size() - 1);
    }
    return word;
}

long long now_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

} // namespace

QueryProcessor::QueryProcessor(std::shared_ptr<RetrievalEngine> engine, QueryProcessorSettings settings)
    : engine_(std::move(engine)), settings_(settings) {
    if (!engine_) throw ConfigError("QueryProcessor requires a retrieval engine");
    if (settings_.max_options < 1) settings_.max_options = 1;
}

std::vector<std::string> QueryProcessor::lemmatize_tokens(const std::string& text) {
    std::vector<std::string> tokens;
    std::string current;
    auto flush = [&]() {
        if (!current.empty()) {
            tokens.push_back(lemma(current));
            current.clear();
        }
    };
    for (char ch : text) {
        unsigned char c = static_cast<unsigned char>(ch);
        if (std::isalpha(c)) {
            current.push_back(static_cast<char>(std::tolower(c)));
        } else {
            flush();
        }
    }
    flush();
    return tokens;
}

ParsedQuery QueryProcessor::classify_intent(const std::string& query, const ConversationState& state) const {
    ParsedQuery parsed;
    parsed.text = query;

    std::smatch match;
    if (std::regex_search(query, match, hsn_code_regex())) {
        parsed.intent = Intent::DIRECT_LOOKUP;
        parsed.hsn_code = match.str(1);
        return parsed;
    }

    auto tokens = lemmatize_tokens(query);
    auto contains_any = [&tokens](const std::unordered_set<std::string>& keywords) {
        return std::any_of(tokens.begin(), tokens.end(),
                           [&keywords](const std::string& t) { return keywords.count(t) > 0; });
    };

    if (state.awaiting_selection() && (is_bare_integer(query) || contains_any(selection_keywords()))) {
        parsed.intent = Intent::SELECTION;
    } else if (contains_any(summary_keywords())) {
        parsed.intent = Intent::SUMMARIZATION;
    }

    spdlog::debug("Query '{}' parsed with intent: {}", query, intent_to_string(parsed.intent));
    return parsed;
}

std::optional<std::vector<RetrievedDocument>> QueryProcessor::identify_ambiguous_cases(
    const std::vector<RetrievedDocument>& docs) const {
    if (docs.size() < 2) return std::nullopt;

    double gap = docs[0].score - docs[1].score;
    spdlog::info("Ambiguity check. Scores: {:.4f} vs {:.4f} (gap {:.4f})", docs[0].score, docs[1].score, gap);

    if (gap < settings_.disambiguation_threshold) {
        size_t n = std::min(settings_.max_options, docs.size());
        return std::vector<RetrievedDocument>(docs.begin(), docs.begin() + n);
    }
    return std::nullopt;
}

QueryResponse QueryProcessor::process_query(const std::string& query, ConversationState& state) {
    auto start = std::chrono::high_resolution_clock::now();
    ParsedQuery parsed = classify_intent(query, state);

    QueryResponse response;
    DialogueState next_state = Idle{};
    bool preserve_state = false;

    switch (parsed.intent) {
        case Intent::SELECTION: {
            bool accepted = false;
            response = handle_selection(query, *state.disambiguation_options(), accepted);
            // A rejected choice keeps the options for a retry.
            preserve_state = !accepted;
            break;
        }
        case Intent::DIRECT_LOOKUP:
            response = handle_direct_lookup(parsed.hsn_code);
            break;
        case Intent::SUMMARIZATION:
            response = handle_summarization();
            break;
        case Intent::CLASSIFICATION: {
            auto docs = engine_->retrieve_documents(query);
            double top_score = docs.empty() ? 0.0 : docs.front().score;

            if (top_score < settings_.relevance_threshold) {
                response.type = ResponseType::NO_RESULT;
                response.reason = NoResultReason::LOW_CONFIDENCE;
                response.summary = kLowConfidenceSummary;
                response.confidence = "Very Low";
            } else if (auto options = identify_ambiguous_cases(docs)) {
                response = generate_disambiguation_prompt(*options);
                next_state = AwaitingSelection{*options};
            } else {
                response = engine_->generate_from_docs(query, docs);
            }
            break;
        }
    }

    // Commit only after the whole turn has succeeded.
    if (!preserve_state) {
        state.clear_context();
        state.set_dialogue_state(std::move(next_state));
    }
    state.add_turn(query, response);

    double duration = std::chrono::duration<double, std::milli>(std::chrono::high_resolution_clock::now() - start).count();
    SystemMonitor::global_queries_served.fetch_add(1);
    LogManager::instance().add_log({now_ms(), state.session_id(), query,
                                    response_type_to_string(response.type),
                                    utf8_safe_substr(response.summary, 200), duration});
    spdlog::info("✅ [{}] {} -> {} ({:.2f} ms)", state.session_id(), intent_to_string(parsed.intent),
                 response_type_to_string(response.type), duration);
    return response;
}

QueryResponse QueryProcessor::handle_direct_lookup(const std::string& hsn_code) const {
    QueryResponse response;
    auto doc = engine_->lookup_code(hsn_code);
    if (!doc) {
        response.type = ResponseType::NO_RESULT;
        response.reason = NoResultReason::NOT_FOUND;
        response.summary = "HSN Code " + hsn_code + " was not found in our database.";
        return response;
    }

    const auto& meta = doc->metadata;
    response.type = ResponseType::CLASSIFICATION_RESULT;
    response.summary =
        "**Information for HSN Code " + hsn_code + ":**\n\n"
        "- **Description:** " + meta.item_description + "\n"
        "- **Trade Status:** Free\n\n"
        "**Hierarchy:**\n"
        "- **Chapter (" + meta.chapter + "):** " + meta.chapter_description + "\n"
        "- **Heading (" + meta.heading + "):** " + meta.heading_description + "\n"
        "- **Subheading (" + meta.subheading + "):** " + meta.subheading_description;

    Match match;
    match.hsn_code = hsn_code;
    match.description = meta.item_description;
    match.full_context = doc->text;
    match.metadata = meta;
    response.top_matches.push_back(std::move(match));
    response.trade_policy = "Free";
    return response;
}

QueryResponse QueryProcessor::handle_summarization() const {
    QueryResponse response;
    response.type = ResponseType::CLARIFICATION_PROMPT;
    response.summary =
        "Chapter 40 covers 'Rubber and Articles Thereof'. This includes a wide range of products from raw materials to finished goods.\n\n"
        "To help me find the correct code, could you specify the product? For example, are you looking for:\n"
        "- Raw materials like **natural rubber latex**?\n"
        "- Intermediate products like **vulcanised rubber sheets**?\n"
        "- Finished articles like **rubber tyres** or **conveyor belts**?";
    return response;
}

QueryResponse QueryProcessor::generate_disambiguation_prompt(const std::vector<RetrievedDocument>& options) const {
    std::string prompt_text =
        "I found a few possible matches. To give you the most accurate HSN code, please help me clarify:\n\n";
    for (size_t i = 0; i < options.size(); ++i) {
        const auto& option = options[i];
        const std::string hsn = option.metadata.hsn_code.empty() ? "N/A" : option.metadata.hsn_code;
        prompt_text += "**Option " + std::to_string(i + 1) + ": HSN Code " + hsn + "**\n"
                       "- Description: " + option.metadata.item_description + "\n"
                       "- Context: This code is for products under the category of '" +
                       option.graph_context.value_or("No additional context.") + "'.\n\n";
    }
    prompt_text += "Which option best describes your product? Please enter the option number (e.g., '1').";

    QueryResponse response;
    response.type = ResponseType::DISAMBIGUATION;
    response.summary = prompt_text;
    response.options = options;
    return response;
}

QueryResponse QueryProcessor::handle_selection(const std::string& query,
                                               const std::vector<RetrievedDocument>& options,
                                               bool& accepted) const {
    accepted = false;
    QueryResponse response;
    response.type = ResponseType::INVALID_SELECTION;

    static const std::regex number_re(R"(\d+)");
    std::smatch match;
    if (!std::regex_search(query, match, number_re)) {
        response.summary = kUnparsableSelection;
        return response;
    }

    size_t selection = 0;
    try {
        selection = std::stoul(match.str());
    } catch (const std::exception&) {
        // Too many digits to be an option number.
        response.summary = kInvalidOption;
        return response;
    }

    if (selection < 1 || selection > options.size()) {
        response.summary = kInvalidOption;
        return response;
    }

    const auto& chosen = options[selection - 1];
    response.type = ResponseType::CLASSIFICATION_RESULT;
    response.summary = "Thank you for clarifying. Based on your selection, the correct classification is HSN Code " +
                       chosen.metadata.hsn_code + ".";
    response.top_matches.push_back(Match::from_document(chosen));
    response.confidence = kUserConfirmed;
    response.trade_policy = "Free";
    accepted = true;
    return response;
}

} // namespace hsn_assistance
