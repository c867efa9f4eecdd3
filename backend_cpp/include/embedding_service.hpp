#pragma once
#include <string>
#include <vector>
#include <memory>
#include "cache_manager.hpp"
#include "KeyManager.hpp"

namespace hsn_assistance {

// Truncates without splitting a UTF-8 sequence.
std::string utf8_safe_substr(const std::string& str, size_t length);

class EmbeddingProvider {
public:
    virtual ~EmbeddingProvider() = default;

    virtual std::vector<float> embed(const std::string& text) = 0;
    // One vector per input, same order.
    virtual std::vector<std::vector<float>> embed_batch(const std::vector<std::string>& texts) = 0;
};

// Hosted embedding model over HTTPS. Rotates keys on 429/503 and throws
// EmbeddingError once retries are exhausted.
class EmbeddingService : public EmbeddingProvider {
public:
    EmbeddingService(std::shared_ptr<KeyManager> key_manager,
                     std::string base_url = "https://generativelanguage.googleapis.com/v1beta/models/",
                     int max_retries = 4);

    std::vector<float> embed(const std::string& text) override;
    std::vector<std::vector<float>> embed_batch(const std::vector<std::string>& texts) override;

private:
    std::shared_ptr<KeyManager> key_manager_;
    std::shared_ptr<CacheManager> cache_manager_;
    std::string base_url_;
    int max_retries_;

    // Batch endpoint limit per request.
    static constexpr size_t kBatchLimit = 100;

    std::string get_endpoint_url(const std::string& action) const;
    std::vector<std::vector<float>> embed_chunk(const std::vector<std::string>& texts);
};

} // namespace hsn_assistance
