#pragma once
#include <vector>
#include <string>
#include <cstdlib>
#include <shared_mutex>
#include <nlohmann/json.hpp>
#include <fstream>
#include <spdlog/spdlog.h>

namespace hsn_assistance {

// Rotating pool of model API keys. Loaded from keys.json, falling back to
// the GEMINI_API_KEY environment variable.
class KeyManager {
private:
    struct ApiKey {
        std::string key;
        bool is_active = true;
        int fail_count = 0;
    };

    std::vector<ApiKey> key_pool;
    mutable std::shared_mutex pool_mutex;
    size_t current_index = 0;
    std::string primary_model = "gemini-1.5-flash";
    std::string embedding_model = "text-embedding-004";

public:
    KeyManager() {
        refresh_key_pool();
    }

    // Explicit pool, used by tests and by callers that already hold keys.
    explicit KeyManager(const std::vector<std::string>& keys) {
        for (const auto& k : keys) key_pool.push_back({k, true, 0});
    }

    void refresh_key_pool() {
        std::unique_lock lock(pool_mutex);

        std::vector<std::string> search_paths = {
            "keys.json",
            "../keys.json",
            "config/keys.json",
            "../config/keys.json",
            "build/keys.json"
        };

        std::ifstream f;
        std::string found_path;

        for (const auto& path : search_paths) {
            f.open(path);
            if (f.is_open()) {
                found_path = path;
                break;
            }
        }

        key_pool.clear();

        if (found_path.empty()) {
            if (const char* env_key = std::getenv("GEMINI_API_KEY"); env_key && *env_key) {
                key_pool.push_back({env_key, true, 0});
                spdlog::info("🔑 Key pool loaded from GEMINI_API_KEY (1 key)");
            } else {
                spdlog::warn("⚠️ No keys.json found and GEMINI_API_KEY is unset; remote model calls will fail.");
            }
            return;
        }

        try {
            auto j = nlohmann::json::parse(f);

            for (auto& k : j.value("keys", nlohmann::json::array())) {
                key_pool.push_back({k.get<std::string>(), true, 0});
            }

            primary_model = j.value("primary", primary_model);
            embedding_model = j.value("embedding", embedding_model);

            spdlog::info("🔑 Key pool synchronized from {}: {} keys, model {}",
                         found_path, key_pool.size(), primary_model);
        } catch (const std::exception& e) {
            spdlog::error("💥 Failed to parse key pool {}: {}", found_path, e.what());
        }
    }

    size_t get_active_key_count() const {
        std::shared_lock lock(pool_mutex);
        size_t count = 0;
        for (const auto& k : key_pool) {
            if (k.is_active) count++;
        }
        return count;
    }

    std::string get_current_key() const {
        std::shared_lock lock(pool_mutex);
        if (key_pool.empty()) return "";
        return key_pool[current_index % key_pool.size()].key;
    }

    std::string get_current_model() const {
        std::shared_lock lock(pool_mutex);
        return primary_model;
    }

    std::string get_embedding_model() const {
        std::shared_lock lock(pool_mutex);
        return embedding_model;
    }

    void set_models(const std::string& generation, const std::string& embedding) {
        std::unique_lock lock(pool_mutex);
        if (!generation.empty()) primary_model = generation;
        if (!embedding.empty()) embedding_model = embedding;
    }

    void report_rate_limit() {
        std::unique_lock lock(pool_mutex);
        if (key_pool.empty()) return;

        auto& current = key_pool[current_index % key_pool.size()];
        current.fail_count++;
        if (current.fail_count > 2) {
            current.is_active = false;
            spdlog::warn("⚠️ Key #{} decommissioned after repeated rate limits", current_index);
        }
        current_index = (current_index + 1) % key_pool.size();
    }
};

} // namespace hsn_assistance
