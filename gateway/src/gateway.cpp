
#include "gateway.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <future>
#include <stdexcept>
#include <vector>

namespace {

ResponseGenerator& require_generator(const std::unique_ptr<ResponseGenerator>& generator) {
    if (!generator) {
        throw std::invalid_argument("Gateway requires a response generator");
    }
    return *generator;
}

}

Gateway::Gateway(const Config& config, std::unique_ptr<ResponseGenerator> generator)
    : generator_(std::move(generator))
    , processor_(require_generator(generator_))
    , telegram_(processor_)
    , web_(processor_, static_cast<size_t>(config.max_web_sessions))
    , cli_(processor_, static_cast<size_t>(config.cli_history_capacity))
    , router_(telegram_, web_, cli_) {
    processor_.set_session_counter([this]() { return web_.active_session_count(); });
}

Gateway::~Gateway() {
    processor_.set_session_counter(nullptr);
}

void Gateway::start() {
    spdlog::info("Starting multi-protocol gateway...");
    fan_out(&Adapter::initialize);
    spdlog::info("Gateway started");
}

void Gateway::stop() {
    spdlog::info("Stopping gateway...");
    fan_out(&Adapter::shutdown);
    spdlog::info("Gateway stopped");
}

nlohmann::json Gateway::health() const {
    return {
        {"status", "healthy"},
        {"timestamp", util::current_iso8601()},
        {"adapters", {
            {"telegram", telegram_.health_check()},
            {"web", web_.health_check()},
            {"cli", cli_.health_check()}
        }}
    };
}

nlohmann::json Gateway::stats() const {
    return processor_.get_stats().to_json();
}

void Gateway::fan_out(void (Adapter::*step)()) {
    std::vector<Adapter*> adapters = {&telegram_, &web_, &cli_};
    std::vector<std::future<void>> pending;
    pending.reserve(adapters.size());

    for (Adapter* adapter : adapters) {
        pending.push_back(std::async(std::launch::async, [adapter, step]() {
            (adapter->*step)();
        }));
    }

    // Each adapter handles its own failure, so waiting on all is safe
    for (auto& result : pending) {
        result.get();
    }
}
