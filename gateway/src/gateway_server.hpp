
#pragma once
#include "auth.hpp"
#include "config.hpp"
#include "gateway.hpp"
#include <httplib.h>
#include <atomic>
#include <memory>
#include <optional>
#include <thread>
#include <nlohmann/json.hpp>

// HTTP surface of the gateway. Authenticates, parses JSON bodies and hands
// them to the router / adapters; carries no message logic of its own.
class GatewayServer {
public:
    GatewayServer(const Config& config, Gateway& gateway);
    ~GatewayServer();

    void start();
    void stop();
    bool is_running() const;
    // Set once the listener thread gave up without serving
    bool listen_failed() const;

private:
    void setup_routes();
    bool authorize(const httplib::Request& req, httplib::Response& res) const;
    void apply_cors(const httplib::Request& req, httplib::Response& res) const;
    std::optional<nlohmann::json> parse_body(const httplib::Request& req, httplib::Response& res) const;

    const Config& config_;
    Gateway& gateway_;
    ApiKeyAuth auth_;
    std::unique_ptr<httplib::Server> server_;
    std::thread server_thread_;
    std::atomic<bool> running_;
    std::atomic<bool> listen_failed_;
};
