#include <httplib.h>
#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>
#include <memory>
#include <optional>
#include <string>

#include "engine_config.hpp"
#include "embedding_service.hpp"
#include "rag_session.hpp"

using json = nlohmann::json;

class ComparablesRagServer {
public:
    explicit ComparablesRagServer(const comparables_rag::EngineConfig& config)
        : config_(config),
          session_(std::make_shared<comparables_rag::RagSession>(
              comparables_rag::create_embedding_provider(config)))
    {
        setup_routes();
    }

    bool run() {
        spdlog::info("🚀 Starting comparables RAG backend on {}:{}", config_.host, config_.port);
        return server_.listen(config_.host, config_.port);
    }

private:
    comparables_rag::EngineConfig config_;
    httplib::Server server_;
    std::shared_ptr<comparables_rag::RagSession> session_;

    static void send_json(httplib::Response& res, const json& body, int status = 200) {
        res.status = status;
        res.set_content(body.dump(-1, ' ', false, json::error_handler_t::replace), "application/json");
    }

    void setup_routes() {
        server_.Options("/(.*)", [](const httplib::Request&, httplib::Response& res) {
            res.set_header("Access-Control-Allow-Origin", "*");
            res.set_header("Access-Control-Allow-Methods", "GET, POST, OPTIONS");
            res.set_header("Access-Control-Allow-Headers", "Content-Type");
            res.status = 204;
        });

        server_.set_pre_routing_handler([](const httplib::Request&, httplib::Response& res) {
            res.set_header("Access-Control-Allow-Origin", "*");
            return httplib::Server::HandlerResponse::Unhandled;
        });

        server_.Get("/api/rag/health", [](const httplib::Request&, httplib::Response& res) {
            send_json(res, {{"status", "ok"}});
        });

        server_.Post("/api/rag/chat", [this](const httplib::Request& req, httplib::Response& res) {
            this->handle_chat(req, res);
        });

        server_.Post("/api/rag/update-context", [this](const httplib::Request& req, httplib::Response& res) {
            this->handle_update_context(req, res);
        });

        server_.Get("/api/rag/context-info", [this](const httplib::Request&, httplib::Response& res) {
            send_json(res, session_->context_info().to_json());
        });

        server_.Post("/api/rag/clear-conversation", [this](const httplib::Request&, httplib::Response& res) {
            session_->clear_conversation();
            send_json(res, {{"success", true}, {"message", "Conversation history cleared"}});
        });

        server_.Get("/api/rag/conversation-history", [this](const httplib::Request&, httplib::Response& res) {
            json history = json::array();
            for (const auto& turn : session_->conversation_history()) history.push_back(turn.to_json());
            send_json(res, {{"conversation_history", history}});
        });

        server_.set_exception_handler([](const httplib::Request& req, httplib::Response& res, std::exception_ptr ep) {
            std::string what = "unknown error";
            try {
                if (ep) std::rethrow_exception(ep);
            } catch (const std::exception& e) {
                what = e.what();
            }
            spdlog::error("❌ Unhandled error on {}: {}", req.path, what);
            send_json(res, {{"error", what}}, 500);
        });
    }

    void handle_chat(const httplib::Request& req, httplib::Response& res) {
        json body;
        try {
            body = json::parse(req.body);
        } catch (const json::parse_error& e) {
            send_json(res, {{"error", std::string("Invalid JSON: ") + e.what()}}, 400);
            return;
        }
        if (!body.is_object() || !body.contains("message") || !body["message"].is_string()) {
            send_json(res, {{"error", "Missing string field 'message'"}}, 400);
            return;
        }

        auto result = session_->query(body["message"].get<std::string>());
        send_json(res, result.to_json());
    }

    void handle_update_context(const httplib::Request& req, httplib::Response& res) {
        json body;
        try {
            body = json::parse(req.body);
        } catch (const json::parse_error& e) {
            send_json(res, {{"error", std::string("Invalid JSON: ") + e.what()}}, 400);
            return;
        }
        if (!body.is_object() || !body.contains("comparison_data")) {
            send_json(res, {{"error", "Missing field 'comparison_data'"}}, 400);
            return;
        }

        auto result = session_->set_context(body["comparison_data"]);
        send_json(res, result.to_json(), result.success ? 200 : 400);
    }
};

int main(int argc, char* argv[]) {
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");
    spdlog::set_level(spdlog::level::info);

    std::optional<std::string> config_path;
    if (argc > 1) config_path = argv[1];

    auto config = comparables_rag::load_engine_config(config_path);
    spdlog::set_level(spdlog::level::from_str(config.log_level));

    ComparablesRagServer server(config);
    if (!server.run()) {
        spdlog::error("💥 Failed to bind {}:{}", config.host, config.port);
        return 1;
    }
    return 0;
}
