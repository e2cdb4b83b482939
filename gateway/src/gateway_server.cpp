
#include "gateway_server.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>

namespace {

void send_json(httplib::Response& res, int status, const nlohmann::json& body) {
    res.status = status;
    res.set_content(body.dump(), "application/json");
}

void send_detail(httplib::Response& res, int status, const std::string& detail) {
    send_json(res, status, nlohmann::json{{"detail", detail}});
}

}

GatewayServer::GatewayServer(const Config& config, Gateway& gateway)
    : config_(config)
    , gateway_(gateway)
    , auth_(config)
    , server_(std::make_unique<httplib::Server>())
    , running_(false)
    , listen_failed_(false) {
    setup_routes();
}

GatewayServer::~GatewayServer() {
    stop();
}

void GatewayServer::start() {
    running_ = true;

    server_thread_ = std::thread([this]() {
        spdlog::info("Starting gateway HTTP server on {}:{}", config_.listen_addr, config_.listen_port);
        if (!server_->listen(config_.listen_addr, config_.listen_port)) {
            spdlog::error("HTTP server failed to listen on {}:{}", config_.listen_addr, config_.listen_port);
            listen_failed_ = true;
        }
        running_ = false;
    });
}

void GatewayServer::stop() {
    server_->stop();
    if (server_thread_.joinable()) {
        server_thread_.join();
    }
    running_ = false;
}

bool GatewayServer::is_running() const {
    return running_;
}

bool GatewayServer::listen_failed() const {
    return listen_failed_;
}

bool GatewayServer::authorize(const httplib::Request& req, httplib::Response& res) const {
    switch (auth_.check(req.get_header_value("X-API-Key"))) {
        case AuthResult::OK:
            return true;
        case AuthResult::MISSING_KEY:
            send_detail(res, 401, "Missing API Key");
            return false;
        case AuthResult::INVALID_KEY:
            send_detail(res, 403, "Invalid API Key");
            return false;
    }
    return false;
}

void GatewayServer::apply_cors(const httplib::Request& req, httplib::Response& res) const {
    const auto& origins = config_.cors_origins;
    if (std::find(origins.begin(), origins.end(), "*") != origins.end()) {
        res.set_header("Access-Control-Allow-Origin", "*");
    } else {
        std::string origin = req.get_header_value("Origin");
        if (origin.empty() || std::find(origins.begin(), origins.end(), origin) == origins.end()) {
            return;
        }
        res.set_header("Access-Control-Allow-Origin", origin);
        res.set_header("Access-Control-Allow-Credentials", "true");
        res.set_header("Vary", "Origin");
    }
    res.set_header("Access-Control-Allow-Methods", "POST, GET");
    res.set_header("Access-Control-Allow-Headers", "*");
}

std::optional<nlohmann::json> GatewayServer::parse_body(const httplib::Request& req, httplib::Response& res) const {
    if (req.body.empty()) {
        spdlog::warn("Received empty request body on {}", req.path);
        send_detail(res, 400, "Empty body");
        return std::nullopt;
    }
    try {
        return nlohmann::json::parse(req.body);
    } catch (const nlohmann::json::parse_error& e) {
        spdlog::warn("Failed to parse JSON on {}: {}", req.path, e.what());
        send_detail(res, 400, "Invalid JSON");
        return std::nullopt;
    }
}

void GatewayServer::setup_routes() {
    server_->set_post_routing_handler([this](const httplib::Request& req, httplib::Response& res) {
        apply_cors(req, res);
    });

    server_->Options(R"(.*)", [](const httplib::Request&, httplib::Response& res) {
        res.status = 204;
    });

    // Unified endpoint for every client type
    server_->Post("/message", [this](const httplib::Request& req, httplib::Response& res) {
        if (!authorize(req, res)) {
            return;
        }
        auto body = parse_body(req, res);
        if (!body) {
            return;
        }

        try {
            RouteReply reply = gateway_.router().route(*body);
            int status = 200;
            if (reply.error == ErrorKind::VALIDATION) {
                status = 422;
            } else if (reply.error == ErrorKind::ADAPTER_NOT_READY) {
                status = 503;
            }
            send_json(res, status, reply.to_json());
        } catch (const UnsupportedClientType&) {
            send_detail(res, 400, "Unsupported client type");
        } catch (const std::exception& e) {
            spdlog::error("Failed to route message: {}", e.what());
            send_detail(res, 500, "Internal server error");
        }
    });

    server_->Post("/telegram/message", [this](const httplib::Request& req, httplib::Response& res) {
        if (!authorize(req, res)) {
            return;
        }
        auto body = parse_body(req, res);
        if (body) {
            send_json(res, 200, gateway_.telegram().dispatch(*body).to_json());
        }
    });

    server_->Post("/web/message", [this](const httplib::Request& req, httplib::Response& res) {
        if (!authorize(req, res)) {
            return;
        }
        auto body = parse_body(req, res);
        if (body) {
            send_json(res, 200, gateway_.web().dispatch(*body).to_json());
        }
    });

    server_->Post("/cli/execute", [this](const httplib::Request& req, httplib::Response& res) {
        if (!authorize(req, res)) {
            return;
        }
        auto body = parse_body(req, res);
        if (body) {
            send_json(res, 200, gateway_.cli().dispatch(*body).to_json());
        }
    });

    server_->Get("/cli/help", [this](const httplib::Request&, httplib::Response& res) {
        send_json(res, 200, gateway_.cli().help_document());
    });

    server_->Get("/web/status", [this](const httplib::Request&, httplib::Response& res) {
        send_json(res, 200, gateway_.web().sessions_status());
    });

    server_->Get("/health", [this](const httplib::Request&, httplib::Response& res) {
        send_json(res, 200, gateway_.health());
    });

    server_->Get("/stats", [this](const httplib::Request&, httplib::Response& res) {
        send_json(res, 200, gateway_.stats());
    });

    server_->Get("/", [this](const httplib::Request&, httplib::Response& res) {
        send_json(res, 200, nlohmann::json{{"service", config_.service_name}, {"status", "running"}});
    });

    server_->set_error_handler([](const httplib::Request&, httplib::Response& res) {
        if (res.body.empty()) {
            send_detail(res, res.status, res.status == 404 ? "Not Found" : "Error");
        }
    });
}
