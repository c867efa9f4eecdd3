#pragma once
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include "agent/ConversationState.hpp"

namespace hsn_assistance {

struct Session {
    ConversationState state;
    // One in-flight turn per session.
    std::mutex turn_mutex;

    explicit Session(std::optional<std::string> id) : state(std::move(id)) {}
};

// Open sessions keyed by id. Sessions idle for longer than the TTL are
// dropped on the next registry access; a TTL of zero disables expiry.
class SessionRegistry {
public:
    using Clock = std::chrono::steady_clock;

    explicit SessionRegistry(std::chrono::seconds idle_ttl);

    // Null when unknown or expired. Refreshes the last-used time.
    std::shared_ptr<Session> find(const std::string& id);

    // Returns the existing session when the id is already open.
    std::shared_ptr<Session> open(std::optional<std::string> id);

    bool close(const std::string& id);

    size_t size();

    // Removes every session last used before now - ttl. Returns the count removed.
    size_t evict_idle(Clock::time_point now);

private:
    struct Entry {
        std::shared_ptr<Session> session;
        Clock::time_point last_used;
    };

    size_t evict_idle_locked(Clock::time_point now);

    std::chrono::seconds idle_ttl_;
    std::mutex mutex_;
    std::unordered_map<std::string, Entry> sessions_;
};

} // namespace hsn_assistance
