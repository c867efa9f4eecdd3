#include <httplib.h>
#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>
#include <memory>
#include <mutex>

#include "app_config.hpp"
#include "app_context.hpp"
#include "errors.hpp"
#include "SystemMonitor.hpp"
#include "LogManager.hpp"
#include "agent/SessionRegistry.hpp"

using json = nlohmann::json;

namespace {

void send_json(httplib::Response& res, const json& body, int status = 200) {
    res.status = status;
    res.set_content(body.dump(), "application/json");
}

// Uniform error mapping for every route.
template<typename Handler>
void guarded(httplib::Response& res, Handler&& handler) {
    try {
        handler();
    } catch (const json::exception& e) {
        send_json(res, {{"error", std::string("Malformed JSON: ") + e.what()}}, 400);
    } catch (const hsn_assistance::ConfigError& e) {
        send_json(res, {{"error", e.what()}}, 400);
    } catch (const hsn_assistance::UpstreamError& e) {
        spdlog::error("❌ Upstream failure: {}", e.what());
        send_json(res, {{"error", e.what()}}, 502);
    } catch (const std::exception& e) {
        spdlog::error("❌ Internal error: {}", e.what());
        send_json(res, {{"error", e.what()}}, 500);
    }
}

} // namespace

class HsnAssistanceServer {
public:
    explicit HsnAssistanceServer(std::shared_ptr<hsn_assistance::AppContext> context)
        : context_(std::move(context)),
          sessions_(std::chrono::seconds(context_->config().server.session_ttl_seconds)) {
        setup_routes();
    }

    void run() {
        const auto& srv = context_->config().server;
        spdlog::info("🚀 Starting HSN classification API on {}:{}", srv.host, srv.port);
        if (!server_.listen(srv.host, srv.port)) {
            throw std::runtime_error("Failed to bind " + srv.host + ":" + std::to_string(srv.port));
        }
    }

private:
    std::shared_ptr<hsn_assistance::AppContext> context_;
    httplib::Server server_;
    hsn_assistance::SystemMonitor system_monitor_;

    hsn_assistance::SessionRegistry sessions_;

    void setup_routes() {
        server_.set_pre_routing_handler([](const httplib::Request&, httplib::Response& res) {
            res.set_header("Access-Control-Allow-Origin", "*");
            return httplib::Server::HandlerResponse::Unhandled;
        });

        server_.Options("/(.*)", [](const httplib::Request&, httplib::Response& res) {
            res.set_header("Access-Control-Allow-Methods", "GET, POST, DELETE, OPTIONS");
            res.set_header("Access-Control-Allow-Headers", "Content-Type");
            res.status = 204;
        });

        server_.Post("/session", [this](const httplib::Request& req, httplib::Response& res) {
            guarded(res, [&] {
                std::optional<std::string> id;
                if (!req.body.empty()) {
                    auto body = json::parse(req.body);
                    if (body.contains("session_id") && body["session_id"].is_string()) {
                        id = body["session_id"].get<std::string>();
                    }
                }
                auto session = sessions_.open(id);
                send_json(res, {{"session_id", session->state.session_id()}}, 201);
            });
        });

        server_.Delete("/session/:id", [this](const httplib::Request& req, httplib::Response& res) {
            guarded(res, [&] {
                const auto& id = req.path_params.at("id");
                if (!sessions_.close(id)) {
                    send_json(res, {{"error", "Unknown session: " + id}}, 404);
                    return;
                }
                spdlog::info("👋 Session {} closed", id);
                send_json(res, {{"deleted", true}});
            });
        });

        server_.Get("/session/:id/history", [this](const httplib::Request& req, httplib::Response& res) {
            guarded(res, [&] {
                const auto& id = req.path_params.at("id");
                auto session = sessions_.find(id);
                if (!session) {
                    send_json(res, {{"error", "Unknown session: " + id}}, 404);
                    return;
                }
                std::lock_guard<std::mutex> turn_lock(session->turn_mutex);
                json body = session->state.to_json();
                body["full_history"] = session->state.full_history();
                send_json(res, body);
            });
        });

        server_.Post("/query", [this](const httplib::Request& req, httplib::Response& res) {
            guarded(res, [&] {
                auto body = json::parse(req.body);
                std::string query = body.value("query", "");
                if (query.empty()) {
                    send_json(res, {{"error", "Missing 'query'"}}, 400);
                    return;
                }

                std::shared_ptr<hsn_assistance::Session> session;
                std::string id = body.value("session_id", "");
                if (!id.empty()) session = sessions_.find(id);
                if (!session) session = sessions_.open(id.empty() ? std::nullopt : std::optional<std::string>(id));

                std::lock_guard<std::mutex> turn_lock(session->turn_mutex);
                auto response = context_->processor()->process_query(query, session->state);
                send_json(res, {{"session_id", session->state.session_id()}, {"response", response.to_json()}});
            });
        });

        server_.Get("/graph/stats", [this](const httplib::Request&, httplib::Response& res) {
            guarded(res, [&] {
                send_json(res, context_->graph()->get_statistics().to_json());
            });
        });

        server_.Post("/graph/subgraph", [this](const httplib::Request& req, httplib::Response& res) {
            guarded(res, [&] {
                auto body = json::parse(req.body);
                std::string code = body.value("hsn_code", "");
                int depth = body.value("depth", 1);
                if (code.empty()) {
                    send_json(res, {{"error", "Missing 'hsn_code'"}}, 400);
                    return;
                }
                if (depth < 0 || depth > 4) {
                    send_json(res, {{"error", "'depth' must be between 0 and 4"}}, 400);
                    return;
                }
                send_json(res, context_->builder().context_subgraph(code, depth).to_json());
            });
        });

        server_.Get("/api/admin/telemetry", [this](const httplib::Request&, httplib::Response& res) {
            sessions_.evict_idle(hsn_assistance::SessionRegistry::Clock::now());
            size_t open_sessions = sessions_.size();
            json metrics = system_monitor_.get_latest_snapshot().to_json();
            metrics["open_sessions"] = open_sessions;
            send_json(res, {
                {"metrics", metrics},
                {"logs", hsn_assistance::LogManager::instance().get_logs_json()}
            });
        });
    }
};

int main() {
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");
    spdlog::set_level(spdlog::level::info);

    try {
        auto config = hsn_assistance::load_config();
        hsn_assistance::setup_logging(config.logging);

        auto context = std::make_shared<hsn_assistance::AppContext>(config);
        context->bootstrap();

        HsnAssistanceServer server(context);
        server.run();
    } catch (const hsn_assistance::ConfigError& e) {
        spdlog::critical("💥 Configuration error: {}", e.what());
        return 2;
    } catch (const std::exception& e) {
        spdlog::critical("💥 Fatal: {}", e.what());
        return 1;
    }
    return 0;
}
