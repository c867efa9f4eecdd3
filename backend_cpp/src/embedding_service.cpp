#include "embedding_service.hpp"
#include "errors.hpp"
#include "SystemMonitor.hpp"
#include <cpr/cpr.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <thread>
#include <chrono>

namespace hsn_assistance {

using json = nlohmann::json;

std::string utf8_safe_substr(const std::string& str, size_t length) {
    if (str.length() <= length) return str;
    std::string sub = str.substr(0, length);
    while (!sub.empty()) {
        unsigned char c = static_cast<unsigned char>(sub.back());
        if (c < 0x80) break;
        if (c >= 0xC0) { sub.pop_back(); break; }
        sub.pop_back();
    }
    return sub;
}

namespace {

template<typename Func>
cpr::Response perform_request_with_retry(Func request_factory, const std::shared_ptr<KeyManager>& km, int max_retries) {
    cpr::Response r;
    for (int i = 0; i < max_retries; ++i) {
        r = request_factory();
        if (r.status_code == 200) return r;
        if ((r.status_code == 429 || r.status_code == 503) && km) {
            spdlog::warn("⚠️ Embedding API {} ({}). Rotating key and cooling down (Attempt {}/{})...",
                         r.status_code, (r.status_code == 429 ? "Quota" : "Overload"), i + 1, max_retries);
            km->report_rate_limit();
            std::this_thread::sleep_for(std::chrono::milliseconds(1000 + (i * 1000)));
            continue;
        }
        break;
    }
    return r;
}

} // namespace

EmbeddingService::EmbeddingService(std::shared_ptr<KeyManager> key_manager, std::string base_url, int max_retries)
    : key_manager_(std::move(key_manager)),
      cache_manager_(std::make_shared<CacheManager>()),
      base_url_(std::move(base_url)),
      max_retries_(max_retries < 1 ? 1 : max_retries) {}

std::string EmbeddingService::get_endpoint_url(const std::string& action) const {
    return base_url_ + key_manager_->get_embedding_model() + ":" + action + "?key=" + key_manager_->get_current_key();
}

std::vector<float> EmbeddingService::embed(const std::string& text) {
    if (auto cached = cache_manager_->get_embedding(text)) return *cached;

    auto start = std::chrono::high_resolution_clock::now();
    const std::string model = "models/" + key_manager_->get_embedding_model();

    auto r = perform_request_with_retry([&]() {
        // URL is rebuilt per attempt so a rotated key is picked up.
        return cpr::Post(cpr::Url{get_endpoint_url("embedContent")},
                         cpr::Body(json{
                             {"model", model},
                             {"content", {{"parts", {{{"text", text}}}}}}
                         }.dump(-1, ' ', false, json::error_handler_t::replace)),
                         cpr::Header{{"Content-Type", "application/json"}});
    }, key_manager_, max_retries_);

    double duration = std::chrono::duration<double, std::milli>(std::chrono::high_resolution_clock::now() - start).count();
    SystemMonitor::global_embedding_latency_ms.store(duration);

    if (r.status_code != 200) {
        spdlog::error("❌ Embedding API error [{}]: {}", r.status_code, utf8_safe_substr(r.text, 300));
        throw EmbeddingError("Failed to generate embedding (HTTP " + std::to_string(r.status_code) + ")");
    }

    std::vector<float> embedding;
    try {
        embedding = json::parse(r.text).at("embedding").at("values").get<std::vector<float>>();
    } catch (const json::exception& e) {
        throw EmbeddingError(std::string("Malformed embedding response: ") + e.what());
    }
    cache_manager_->set_embedding(text, embedding);
    return embedding;
}

std::vector<std::vector<float>> EmbeddingService::embed_batch(const std::vector<std::string>& texts) {
    std::vector<std::vector<float>> embeddings;
    embeddings.reserve(texts.size());

    auto start = std::chrono::high_resolution_clock::now();
    for (size_t offset = 0; offset < texts.size(); offset += kBatchLimit) {
        size_t end = std::min(texts.size(), offset + kBatchLimit);
        std::vector<std::string> chunk(texts.begin() + offset, texts.begin() + end);
        auto vectors = embed_chunk(chunk);
        for (auto& v : vectors) embeddings.push_back(std::move(v));
    }

    spdlog::info("⏱️ Embedded {} texts in {:.2f} ms", texts.size(),
                 std::chrono::duration<double, std::milli>(std::chrono::high_resolution_clock::now() - start).count());
    return embeddings;
}

std::vector<std::vector<float>> EmbeddingService::embed_chunk(const std::vector<std::string>& texts) {
    const std::string model = "models/" + key_manager_->get_embedding_model();
    json requests = json::array();
    for (const auto& raw_text : texts) {
        requests.push_back({
            {"model", model},
            {"content", {{"parts", {{{"text", raw_text}}}}}}
        });
    }

    std::string payload_str = json{{"requests", requests}}.dump(-1, ' ', false, json::error_handler_t::replace);

    auto r = perform_request_with_retry([&]() {
        return cpr::Post(cpr::Url{get_endpoint_url("batchEmbedContents")},
                         cpr::Body{payload_str},
                         cpr::Header{{"Content-Type", "application/json"}});
    }, key_manager_, max_retries_);

    if (r.status_code != 200) {
        spdlog::error("❌ Batch embedding API error [{}]: {}", r.status_code, utf8_safe_substr(r.text, 300));
        throw EmbeddingError("Failed to generate batch embeddings (HTTP " + std::to_string(r.status_code) + ")");
    }

    std::vector<std::vector<float>> embeddings;
    try {
        auto response_json = json::parse(r.text);
        for (const auto& emb : response_json.at("embeddings")) {
            embeddings.push_back(emb.at("values").get<std::vector<float>>());
        }
    } catch (const json::exception& e) {
        throw EmbeddingError(std::string("Malformed batch embedding response: ") + e.what());
    }

    if (embeddings.size() != texts.size()) {
        throw EmbeddingError("Batch embedding returned " + std::to_string(embeddings.size()) +
                             " vectors for " + std::to_string(texts.size()) + " texts");
    }
    for (size_t i = 0; i < texts.size(); ++i) {
        cache_manager_->set_embedding(texts[i], embeddings[i]);
    }
    return embeddings;
}

} // namespace hsn_assistance
