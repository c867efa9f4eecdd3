#pragma once
#include <string>
#include <memory>
#include <functional>
#include <utility>
#include "circuit_breaker.hpp"
#include "KeyManager.hpp"

namespace hsn_assistance {

class GeneratorBackend {
public:
    virtual ~GeneratorBackend() = default;

    // Throws GenerationError on failure.
    virtual std::string generate(const std::string& prompt) = 0;
};

struct GeminiSettings {
    std::string base_url = "https://generativelanguage.googleapis.com/v1beta/models/";
    double temperature = 0.1;
    int timeout_seconds = 30;
    int max_retries = 3;
};

// Hosted generation model behind a circuit breaker. While the breaker is
// open, generate() answers with kFallbackText without calling the API.
class GeminiGenerator : public GeneratorBackend {
public:
    static constexpr const char* kFallbackText =
        "The system is currently experiencing high load. Please try again later.";

    // Performs one HTTP attempt; returns {status_code, body}.
    using Transport = std::function<std::pair<long, std::string>(const std::string& url, const std::string& body)>;

    GeminiGenerator(std::shared_ptr<KeyManager> key_manager,
                    GeminiSettings settings,
                    std::shared_ptr<CircuitBreaker> breaker);

    std::string generate(const std::string& prompt) override;

    // Replaces the cpr transport, mainly for tests.
    void set_transport(Transport transport) { transport_ = std::move(transport); }

    static std::string parse_response(const std::string& body);

    const CircuitBreaker& breaker() const { return *breaker_; }

private:
    std::shared_ptr<KeyManager> key_manager_;
    GeminiSettings settings_;
    std::shared_ptr<CircuitBreaker> breaker_;
    Transport transport_;

    std::string call_api(const std::string& prompt);
};

// Deterministic echo of the prompt for development and tests.
class MockGenerator : public GeneratorBackend {
public:
    std::string generate(const std::string& prompt) override;
};

} // namespace hsn_assistance
