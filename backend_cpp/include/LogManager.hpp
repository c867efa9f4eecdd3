#pragma once
#include <deque>
#include <mutex>
#include <vector>
#include <string>
#include <nlohmann/json.hpp>

namespace hsn_assistance {

struct InteractionLog {
    long long timestamp;
    std::string session_id;
    std::string user_query;
    std::string response_type;
    std::string summary;
    double duration_ms;
};

// Ring buffer of the most recent dialogue turns, served by the admin telemetry route.
class LogManager {
public:
    static constexpr size_t kMaxEntries = 50;

    static LogManager& instance() {
        static LogManager instance;
        return instance;
    }

    void add_log(const InteractionLog& log) {
        std::lock_guard<std::mutex> lock(mtx_);
        logs_.push_back(log);
        if (logs_.size() > kMaxEntries) {
            logs_.pop_front();
        }
    }

    size_t size() {
        std::lock_guard<std::mutex> lock(mtx_);
        return logs_.size();
    }

    void clear() {
        std::lock_guard<std::mutex> lock(mtx_);
        logs_.clear();
    }

    nlohmann::json get_logs_json() {
        std::lock_guard<std::mutex> lock(mtx_);
        nlohmann::json j_list = nlohmann::json::array();
        // Newest first
        for (auto it = logs_.rbegin(); it != logs_.rend(); ++it) {
            j_list.push_back({
                {"timestamp", it->timestamp},
                {"session_id", it->session_id},
                {"user_query", it->user_query},
                {"response_type", it->response_type},
                {"summary", it->summary},
                {"duration_ms", it->duration_ms}
            });
        }
        return j_list;
    }

private:
    LogManager() {}
    std::deque<InteractionLog> logs_;
    std::mutex mtx_;
};

} // namespace hsn_assistance
