
#pragma once
#include "config.hpp"
#include "dispatch_router.hpp"
#include "message_processor.hpp"
#include "response_generator.hpp"
#include <memory>
#include <nlohmann/json.hpp>

// Composition root: owns the processor, the three adapters and the router.
class Gateway {
public:
    Gateway(const Config& config, std::unique_ptr<ResponseGenerator> generator);
    ~Gateway();

    // Initializes / stops every adapter concurrently and waits for all of them.
    void start();
    void stop();

    DispatchRouter& router() { return router_; }
    MessageProcessor& processor() { return processor_; }
    TelegramAdapter& telegram() { return telegram_; }
    WebAdapter& web() { return web_; }
    CliAdapter& cli() { return cli_; }

    nlohmann::json health() const;
    nlohmann::json stats() const;

private:
    void fan_out(void (Adapter::*step)());

    std::unique_ptr<ResponseGenerator> generator_;
    MessageProcessor processor_;
    TelegramAdapter telegram_;
    WebAdapter web_;
    CliAdapter cli_;
    DispatchRouter router_;
};
