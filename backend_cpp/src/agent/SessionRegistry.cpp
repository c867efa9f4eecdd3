#include "agent/SessionRegistry.hpp"
#include <spdlog/spdlog.h>

namespace hsn_assistance {

SessionRegistry::SessionRegistry(std::chrono::seconds idle_ttl) : idle_ttl_(idle_ttl) {}

std::shared_ptr<Session> SessionRegistry::find(const std::string& id) {
    auto now = Clock::now();
    std::lock_guard<std::mutex> lock(mutex_);
    evict_idle_locked(now);
    auto it = sessions_.find(id);
    if (it == sessions_.end()) return nullptr;
    it->second.last_used = now;
    return it->second.session;
}

std::shared_ptr<Session> SessionRegistry::open(std::optional<std::string> id) {
    auto session = std::make_shared<Session>(std::move(id));
    auto now = Clock::now();
    std::lock_guard<std::mutex> lock(mutex_);
    evict_idle_locked(now);
    auto [it, inserted] = sessions_.emplace(session->state.session_id(), Entry{session, now});
    if (inserted) {
        spdlog::info("🆕 Session {} opened", it->first);
    } else {
        it->second.last_used = now;
    }
    return it->second.session;
}

bool SessionRegistry::close(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    return sessions_.erase(id) > 0;
}

size_t SessionRegistry::size() {
    std::lock_guard<std::mutex> lock(mutex_);
    return sessions_.size();
}

size_t SessionRegistry::evict_idle(Clock::time_point now) {
    std::lock_guard<std::mutex> lock(mutex_);
    return evict_idle_locked(now);
}

size_t SessionRegistry::evict_idle_locked(Clock::time_point now) {
    if (idle_ttl_.count() <= 0) return 0;
    size_t removed = 0;
    for (auto it = sessions_.begin(); it != sessions_.end();) {
        if (now - it->second.last_used > idle_ttl_) {
            spdlog::info("⌛ Session {} expired after {}s idle", it->first, idle_ttl_.count());
            it = sessions_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    return removed;
}

} // namespace hsn_assistance
