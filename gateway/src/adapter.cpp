
#include "adapter.hpp"
#include <spdlog/spdlog.h>

DispatchOutcome DispatchOutcome::ok(CanonicalResponse response) {
    DispatchOutcome outcome;
    outcome.success = true;
    outcome.response = std::move(response);
    return outcome;
}

DispatchOutcome DispatchOutcome::failure(ErrorKind kind, const std::string& message) {
    DispatchOutcome outcome;
    outcome.success = false;
    outcome.error = kind;
    outcome.error_message = message;
    return outcome;
}

Adapter::Adapter(std::string name, ClientType client_type, MessageProcessor& processor)
    : processor_(processor), name_(std::move(name)), client_type_(client_type) {}

void Adapter::initialize() {
    try {
        on_initialize();
        std::lock_guard<std::mutex> lock(status_mutex_);
        status_.is_healthy = true;
        spdlog::info("{} adapter initialized", name_);
    } catch (const std::exception& e) {
        spdlog::error("Failed to initialize {} adapter: {}", name_, e.what());
        std::lock_guard<std::mutex> lock(status_mutex_);
        status_.is_healthy = false;
    }
}

void Adapter::shutdown() {
    try {
        on_shutdown();
        spdlog::info("{} adapter stopped", name_);
    } catch (const std::exception& e) {
        spdlog::error("Error while stopping {} adapter: {}", name_, e.what());
    }
}

DispatchOutcome Adapter::handle_canonical(const CanonicalMessage& message) {
    if (!is_ready()) {
        spdlog::warn("{} adapter is not ready, rejecting message {}", name_, message.id());
        AdapterNotReady error(name_);
        return DispatchOutcome::failure(error.kind(), error.what());
    }

    try {
        CanonicalResponse response = processor_.process(message);
        after_process(message);
        record_success(message.timestamp());
        return DispatchOutcome::ok(std::move(response));
    } catch (const GatewayError& e) {
        spdlog::error("{} adapter failed on message {}: {}", name_, message.id(), e.what());
        record_error();
        return DispatchOutcome::failure(e.kind(), e.what());
    } catch (const std::exception& e) {
        spdlog::error("{} adapter failed on message {}: {}", name_, message.id(), e.what());
        record_error();
        return DispatchOutcome::failure(ErrorKind::PROCESSING_FAILURE, e.what());
    }
}

nlohmann::json Adapter::health_check() const {
    nlohmann::json health = status().to_json();
    add_health_extras(health);
    return health;
}

AdapterStatus Adapter::status() const {
    std::lock_guard<std::mutex> lock(status_mutex_);
    return status_;
}

bool Adapter::is_ready() const {
    std::lock_guard<std::mutex> lock(status_mutex_);
    return status_.is_healthy;
}

void Adapter::record_success(TimePoint activity) {
    std::lock_guard<std::mutex> lock(status_mutex_);
    status_.message_count++;
    status_.last_activity = activity;
}

void Adapter::record_error() {
    std::lock_guard<std::mutex> lock(status_mutex_);
    status_.error_count++;
}
