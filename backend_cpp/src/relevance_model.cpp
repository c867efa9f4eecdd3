#include "relevance_model.hpp"
#include "errors.hpp"
#include "SystemMonitor.hpp"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <unordered_set>
#include <cpr/cpr.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace hsn_assistance {

using json = nlohmann::json;

CrossEncoderClient::CrossEncoderClient(std::string url, std::string model, int timeout_ms)
    : url_(std::move(url)), model_(std::move(model)), timeout_ms_(timeout_ms) {}

std::string CrossEncoderClient::build_request(const std::string& query,
                                              const std::vector<std::string>& texts,
                                              const std::string& model) {
    json root = {
        {"query", query},
        {"documents", texts},
        {"model", model}
    };
    return root.dump(-1, ' ', false, json::error_handler_t::replace);
}

std::vector<double> CrossEncoderClient::parse_response(const std::string& body, size_t expected) {
    std::vector<double> scores(expected, 0.0);
    std::vector<bool> seen(expected, false);

    try {
        auto val = json::parse(body);
        for (const auto& item : val.at("results")) {
            long long index = item.at("index").get<long long>();
            if (index < 0 || static_cast<size_t>(index) >= expected) {
                throw RerankError("Reranker returned out-of-range index " + std::to_string(index));
            }
            scores[index] = item.at("relevance_score").get<double>();
            seen[index] = true;
        }
    } catch (const json::exception& e) {
        throw RerankError(std::string("Invalid reranking response: ") + e.what());
    }

    if (std::find(seen.begin(), seen.end(), false) != seen.end()) {
        throw RerankError("Reranker omitted scores for some candidates");
    }
    return scores;
}

std::vector<double> CrossEncoderClient::score(const std::string& query, const std::vector<std::string>& texts) {
    if (texts.empty()) return {};

    spdlog::debug("Reranking {} documents for query: {}...", texts.size(), query.substr(0, 50));
    auto start = std::chrono::high_resolution_clock::now();

    auto r = cpr::Post(cpr::Url{url_},
                       cpr::Body{build_request(query, texts, model_)},
                       cpr::Header{{"Content-Type", "application/json"}},
                       cpr::Timeout{timeout_ms_});

    if (r.error) {
        throw RerankError("Reranker unreachable at " + url_ + ": " + r.error.message);
    }
    if (r.status_code != 200) {
        spdlog::error("❌ Reranker error [{}]: {}", r.status_code, r.text.substr(0, 300));
        throw RerankError("Reranker returned HTTP " + std::to_string(r.status_code));
    }

    auto scores = parse_response(r.text, texts.size());
    SystemMonitor::global_rerank_latency_ms.store(
        std::chrono::duration<double, std::milli>(std::chrono::high_resolution_clock::now() - start).count());
    return scores;
}

std::vector<std::string> LexicalRelevanceModel::tokenize(const std::string& text) {
    std::vector<std::string> tokens;
    std::string current;
    for (char ch : text) {
        unsigned char c = static_cast<unsigned char>(ch);
        if (std::isalnum(c)) {
            current.push_back(static_cast<char>(std::tolower(c)));
        } else if (!current.empty()) {
            tokens.push_back(current);
            current.clear();
        }
    }
    if (!current.empty()) tokens.push_back(current);
    return tokens;
}

std::vector<double> LexicalRelevanceModel::score(const std::string& query, const std::vector<std::string>& texts) {
    auto start = std::chrono::high_resolution_clock::now();

    auto query_tokens = tokenize(query);
    std::unordered_set<std::string> distinct(query_tokens.begin(), query_tokens.end());

    std::vector<double> scores;
    scores.reserve(texts.size());
    for (const auto& text : texts) {
        if (distinct.empty()) {
            scores.push_back(0.0);
            continue;
        }
        auto doc_tokens = tokenize(text);
        std::unordered_set<std::string> doc_set(doc_tokens.begin(), doc_tokens.end());
        size_t overlap = 0;
        for (const auto& t : distinct) {
            if (doc_set.count(t)) ++overlap;
        }
        scores.push_back(static_cast<double>(overlap) / static_cast<double>(distinct.size()));
    }

    SystemMonitor::global_rerank_latency_ms.store(
        std::chrono::duration<double, std::milli>(std::chrono::high_resolution_clock::now() - start).count());
    return scores;
}

} // namespace hsn_assistance
