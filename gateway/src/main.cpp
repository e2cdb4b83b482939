#include "config.hpp"
#include "gateway.hpp"
#include "gateway_server.hpp"
#include "response_generator.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <atomic>
#include <chrono>
#include <csignal>
#include <memory>
#include <thread>

// Set from the signal handler; polled by main
std::atomic<bool> shutdown_requested{false};

void signal_handler(int) {
    shutdown_requested = true;
}

int main() {
    try {
        // 1. Load configuration
        Config config = Config::from_env();

        // 2. Setup logging
        util::setup_logging(config.service_name, config.log_level);
        config.validate();
        spdlog::info("Starting {}...", config.service_name);

        // 3. Setup signal handling for graceful shutdown
        signal(SIGINT, signal_handler);
        signal(SIGTERM, signal_handler);

        // 4. Wire the gateway and bring the adapters up
        Gateway gateway(config, std::make_unique<EchoResponseGenerator>());
        gateway.start();

        GatewayServer server(config, gateway);
        server.start();

        // Block until a signal arrives or the listener dies
        while (!shutdown_requested && server.is_running()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }

        if (server.listen_failed()) {
            spdlog::critical("HTTP server could not listen on {}:{}", config.listen_addr, config.listen_port);
            server.stop();
            gateway.stop();
            return 1;
        }

        spdlog::info("Shutting down...");
        server.stop();
        gateway.stop();

        spdlog::info("{} has shut down.", config.service_name);

    } catch (const std::exception& e) {
        spdlog::critical("Fatal error during initialization or runtime: {}", e.what());
        return 1;
    }

    return 0;
}
