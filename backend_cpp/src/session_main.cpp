#include <spdlog/spdlog.h>
#include <iostream>
#include <memory>
#include <string>

#include "app_config.hpp"
#include "app_context.hpp"
#include "errors.hpp"
#include "agent/ConversationState.hpp"

namespace {

void print_response(const hsn_assistance::QueryResponse& response) {
    std::cout << "\n" << response.summary << "\n";
    if (!response.confidence.empty()) {
        std::cout << "[confidence: " << response.confidence << "]\n";
    }
    if (response.type == hsn_assistance::ResponseType::CLASSIFICATION_RESULT && response.top_matches.size() > 1) {
        std::cout << "Other candidates:\n";
        for (size_t i = 1; i < response.top_matches.size() && i < 3; ++i) {
            const auto& m = response.top_matches[i];
            std::cout << "  - " << m.hsn_code << ": " << m.description << "\n";
        }
    }
    std::cout << std::endl;
}

} // namespace

int main() {
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");

    std::shared_ptr<hsn_assistance::AppContext> context;
    try {
        auto config = hsn_assistance::load_config();
        hsn_assistance::setup_logging(config.logging);
        context = std::make_shared<hsn_assistance::AppContext>(config);
        context->bootstrap();
    } catch (const hsn_assistance::ConfigError& e) {
        spdlog::critical("💥 Configuration error: {}", e.what());
        return 2;
    } catch (const std::exception& e) {
        spdlog::critical("💥 Startup failed: {}", e.what());
        return 1;
    }

    hsn_assistance::ConversationState state;
    spdlog::info("🗣️ Session {} started. Type 'exit' to quit.", state.session_id());

    std::string line;
    while (true) {
        std::cout << "You: " << std::flush;
        if (!std::getline(std::cin, line)) break;
        if (line == "exit" || line == "quit") break;
        if (line.empty()) continue;

        try {
            print_response(context->processor()->process_query(line, state));
        } catch (const hsn_assistance::UpstreamError& e) {
            // The turn was not recorded; the user can simply retry.
            spdlog::error("❌ {}", e.what());
            std::cout << "\nA backend service is unavailable right now. Please try again.\n" << std::endl;
        }
    }

    spdlog::info("Session {} ended after {} turns.", state.session_id(), state.turn_history().size());
    return 0;
}
