#include "agent/ConversationState.hpp"
#include <cstdio>
#include <random>

namespace hsn_assistance {

using json = nlohmann::json;

ConversationState::ConversationState(std::optional<std::string> session_id)
    : session_id_(session_id && !session_id->empty() ? *session_id : generate_session_id()) {}

std::string ConversationState::generate_session_id() {
    // Random (version 4) UUID
    static thread_local std::mt19937_64 rng{std::random_device{}()};
    std::uniform_int_distribution<unsigned int> byte(0, 255);

    unsigned char b[16];
    for (auto& x : b) x = static_cast<unsigned char>(byte(rng));
    b[6] = static_cast<unsigned char>((b[6] & 0x0F) | 0x40);
    b[8] = static_cast<unsigned char>((b[8] & 0x3F) | 0x80);

    char buf[37];
    std::snprintf(buf, sizeof(buf),
                  "%02x%02x%02x%02x-%02x%02x-%02x%02x-%02x%02x-%02x%02x%02x%02x%02x%02x",
                  b[0], b[1], b[2], b[3], b[4], b[5], b[6], b[7],
                  b[8], b[9], b[10], b[11], b[12], b[13], b[14], b[15]);
    return std::string(buf);
}

void ConversationState::add_turn(const std::string& user_query, const QueryResponse& response) {
    turns_.push_back({user_query, response});
}

void ConversationState::set_context(const std::string& key, json value) {
    context_[key] = std::move(value);
}

std::optional<json> ConversationState::get_context(const std::string& key) const {
    auto it = context_.find(key);
    if (it == context_.end()) return std::nullopt;
    return *it;
}

void ConversationState::clear_context() {
    context_ = json::object();
    state_ = Idle{};
}

const std::vector<RetrievedDocument>* ConversationState::disambiguation_options() const {
    if (auto* awaiting = std::get_if<AwaitingSelection>(&state_)) {
        return &awaiting->options;
    }
    return nullptr;
}

std::string ConversationState::full_history() const {
    std::string history;
    for (const auto& turn : turns_) {
        history += "User: " + turn.user_query + "\n";
        const auto& summary = turn.system_response.summary;
        history += "System: " + (summary.empty() ? std::string("No summary.") : summary) + "\n";
    }
    return history;
}

json ConversationState::to_json() const {
    json turns = json::array();
    for (const auto& t : turns_) {
        turns.push_back({{"user_query", t.user_query}, {"system_response", t.system_response.to_json()}});
    }

    json context = context_;
    if (const auto* options = disambiguation_options()) {
        json opts = json::array();
        for (const auto& o : *options) opts.push_back(o.to_json());
        context["disambiguation_options"] = opts;
    }

    return {
        {"session_id", session_id_},
        {"state", awaiting_selection() ? "awaiting_selection" : "idle"},
        {"turn_history", turns},
        {"context", context},
        {"user_preferences", user_preferences_}
    };
}

} // namespace hsn_assistance
