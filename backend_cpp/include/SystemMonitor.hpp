#pragma once
#include <atomic>
#include <chrono>
#include <fstream>
#include <string>
#include <nlohmann/json.hpp>

namespace hsn_assistance {

struct TelemetryData {
    size_t ram_usage_mb = 0;

    double vector_latency_ms = 0.0;
    double retrieval_latency_ms = 0.0;
    double embedding_latency_ms = 0.0;
    double rerank_latency_ms = 0.0;
    double graph_context_latency_ms = 0.0;
    double llm_generation_ms = 0.0;

    long long queries_served = 0;
    long long graph_context_cache_hits = 0;
    long long circuit_breaker_trips = 0;
    double uptime_s = 0.0;

    nlohmann::json to_json() const {
        return {
            {"ram_usage_mb", ram_usage_mb},
            {"vector_latency_ms", vector_latency_ms},
            {"retrieval_latency_ms", retrieval_latency_ms},
            {"embedding_latency_ms", embedding_latency_ms},
            {"rerank_latency_ms", rerank_latency_ms},
            {"graph_context_latency_ms", graph_context_latency_ms},
            {"llm_generation_ms", llm_generation_ms},
            {"queries_served", queries_served},
            {"graph_context_cache_hits", graph_context_cache_hits},
            {"circuit_breaker_trips", circuit_breaker_trips},
            {"uptime_s", uptime_s}
        };
    }
};

// Process-wide latency gauges and counters. Writers store into the atomics
// directly; readers take a snapshot.
class SystemMonitor {
public:
    inline static std::atomic<double> global_vector_latency_ms{0.0};
    inline static std::atomic<double> global_retrieval_latency_ms{0.0};
    inline static std::atomic<double> global_embedding_latency_ms{0.0};
    inline static std::atomic<double> global_rerank_latency_ms{0.0};
    inline static std::atomic<double> global_graph_context_latency_ms{0.0};
    inline static std::atomic<double> global_llm_generation_ms{0.0};
    inline static std::atomic<long long> global_queries_served{0};
    inline static std::atomic<long long> global_graph_context_cache_hits{0};
    inline static std::atomic<long long> global_circuit_breaker_trips{0};

    SystemMonitor() : started_(std::chrono::steady_clock::now()) {}

    TelemetryData get_latest_snapshot() const {
        TelemetryData snapshot;
        snapshot.ram_usage_mb = read_resident_mb();
        snapshot.vector_latency_ms = global_vector_latency_ms.load();
        snapshot.retrieval_latency_ms = global_retrieval_latency_ms.load();
        snapshot.embedding_latency_ms = global_embedding_latency_ms.load();
        snapshot.rerank_latency_ms = global_rerank_latency_ms.load();
        snapshot.graph_context_latency_ms = global_graph_context_latency_ms.load();
        snapshot.llm_generation_ms = global_llm_generation_ms.load();
        snapshot.queries_served = global_queries_served.load();
        snapshot.graph_context_cache_hits = global_graph_context_cache_hits.load();
        snapshot.circuit_breaker_trips = global_circuit_breaker_trips.load();
        snapshot.uptime_s = std::chrono::duration<double>(std::chrono::steady_clock::now() - started_).count();
        return snapshot;
    }

private:
    std::chrono::steady_clock::time_point started_;

    // VmRSS from /proc; 0 where procfs is unavailable.
    static size_t read_resident_mb() {
        std::ifstream status("/proc/self/status");
        std::string line;
        while (std::getline(status, line)) {
            if (line.rfind("VmRSS:", 0) == 0) {
                try {
                    return std::stoul(line.substr(6)) / 1024;
                } catch (const std::exception&) {
                    return 0;
                }
            }
        }
        return 0;
    }
};

} // namespace hsn_assistance
