#include "generation_service.hpp"
#include "embedding_service.hpp"
#include "errors.hpp"
#include "SystemMonitor.hpp"
#include <chrono>
#include <thread>
#include <tuple>
#include <cpr/cpr.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace hsn_assistance {

using json = nlohmann::json;

GeminiGenerator::GeminiGenerator(std::shared_ptr<KeyManager> key_manager,
                                 GeminiSettings settings,
                                 std::shared_ptr<CircuitBreaker> breaker)
    : key_manager_(std::move(key_manager)),
      settings_(std::move(settings)),
      breaker_(std::move(breaker)) {
    if (!breaker_) breaker_ = std::make_shared<CircuitBreaker>(5, std::chrono::seconds(60));

    int timeout_ms = settings_.timeout_seconds * 1000;
    transport_ = [timeout_ms](const std::string& url, const std::string& body) {
        auto r = cpr::Post(cpr::Url{url},
                           cpr::Body{body},
                           cpr::Header{{"Content-Type", "application/json"}},
                           cpr::Timeout{timeout_ms});
        if (r.error) {
            return std::make_pair(0L, r.error.message);
        }
        return std::make_pair(static_cast<long>(r.status_code), r.text);
    };
}

std::string GeminiGenerator::parse_response(const std::string& body) {
    try {
        auto response_json = json::parse(body);
        return response_json.at("candidates").at(0).at("content").at("parts").at(0).at("text").get<std::string>();
    } catch (const json::exception& e) {
        throw GenerationError(std::string("Malformed generation response: ") + e.what());
    }
}

std::string GeminiGenerator::call_api(const std::string& prompt) {
    json payload = {
        {"contents", {{{"parts", {{{"text", prompt}}}}}}},
        {"generationConfig", {{"temperature", settings_.temperature}}}
    };
    const std::string body = payload.dump(-1, ' ', false, json::error_handler_t::replace);

    long status = 0;
    std::string text;
    for (int i = 0; i < settings_.max_retries; ++i) {
        // Rebuilt per attempt so a rotated key is used.
        std::string url = settings_.base_url + key_manager_->get_current_model() +
                          ":generateContent?key=" + key_manager_->get_current_key();

        std::tie(status, text) = transport_(url, body);
        if (status == 200) return parse_response(text);

        if (status == 429 || status == 503) {
            spdlog::warn("⚠️ Generation API {} (Attempt {}/{}). Rotating key...", status, i + 1, settings_.max_retries);
            key_manager_->report_rate_limit();
            if (i + 1 < settings_.max_retries) {
                std::this_thread::sleep_for(std::chrono::milliseconds(1000 * (i + 1)));
            }
            continue;
        }
        break;
    }

    spdlog::error("❌ Generation API error [{}]: {}", status, utf8_safe_substr(text, 300));
    throw GenerationError("Generation backend failed (HTTP " + std::to_string(status) + ")");
}

std::string GeminiGenerator::generate(const std::string& prompt) {
    if (!breaker_->allow_request()) {
        spdlog::error("Circuit breaker is open for LLM calls.");
        return kFallbackText;
    }

    spdlog::info("Calling generation API with model {}...", key_manager_->get_current_model());
    auto start = std::chrono::high_resolution_clock::now();
    try {
        std::string result = call_api(prompt);
        breaker_->record_success();
        SystemMonitor::global_llm_generation_ms.store(
            std::chrono::duration<double, std::milli>(std::chrono::high_resolution_clock::now() - start).count());
        return result;
    } catch (const GenerationError&) {
        if (breaker_->record_failure()) {
            SystemMonitor::global_circuit_breaker_trips.fetch_add(1);
            spdlog::error("🚨 Generation circuit breaker opened after repeated failures.");
        }
        throw;
    }
}

std::string MockGenerator::generate(const std::string& prompt) {
    spdlog::info("Using MockGenerator.");
    return "Mock response based on the following context:\n---\n" + utf8_safe_substr(prompt, 500) + "...\n---";
}

} // namespace hsn_assistance
