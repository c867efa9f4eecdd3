#pragma once
#include <string>
#include <vector>
#include <variant>
#include <optional>
#include <nlohmann/json.hpp>
#include "agent/AgentTypes.hpp"

namespace hsn_assistance {

struct Idle {};

struct AwaitingSelection {
    std::vector<RetrievedDocument> options;
};

using DialogueState = std::variant<Idle, AwaitingSelection>;

struct Turn {
    std::string user_query;
    QueryResponse system_response;
};

// Per-session dialogue memory. Not internally synchronised: callers must
// serialise turns on one instance.
class ConversationState {
public:
    explicit ConversationState(std::optional<std::string> session_id = std::nullopt);

    const std::string& session_id() const { return session_id_; }

    void add_turn(const std::string& user_query, const QueryResponse& response);
    const std::vector<Turn>& turn_history() const { return turns_; }

    void set_context(const std::string& key, nlohmann::json value);
    std::optional<nlohmann::json> get_context(const std::string& key) const;

    // Drops generic context and any pending disambiguation.
    void clear_context();

    const DialogueState& dialogue_state() const { return state_; }
    void set_dialogue_state(DialogueState state) { state_ = std::move(state); }

    bool awaiting_selection() const { return std::holds_alternative<AwaitingSelection>(state_); }
    // Null unless awaiting a selection.
    const std::vector<RetrievedDocument>* disambiguation_options() const;

    nlohmann::json& user_preferences() { return user_preferences_; }
    const nlohmann::json& user_preferences() const { return user_preferences_; }

    // "User: ...\nSystem: ...\n" per turn.
    std::string full_history() const;

    nlohmann::json to_json() const;

    static std::string generate_session_id();

private:
    std::string session_id_;
    std::vector<Turn> turns_;
    nlohmann::json context_ = nlohmann::json::object();
    nlohmann::json user_preferences_ = {{"expertise_level", "novice"}};
    DialogueState state_ = Idle{};
};

} // namespace hsn_assistance
