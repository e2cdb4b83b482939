
#pragma once
#include "message_processor.hpp"
#include "models.hpp"
#include <mutex>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

// Result of handing a canonical message to an adapter.
struct DispatchOutcome {
    bool success = false;
    std::optional<CanonicalResponse> response;
    std::optional<ErrorKind> error;
    std::string error_message;

    static DispatchOutcome ok(CanonicalResponse response);
    static DispatchOutcome failure(ErrorKind kind, const std::string& message);
};

// Protocol adapter base: lifecycle, health and activity counters.
// Variants add normalization/translation and their own local state.
class Adapter {
public:
    Adapter(std::string name, ClientType client_type, MessageProcessor& processor);
    virtual ~Adapter() = default;

    Adapter(const Adapter&) = delete;
    Adapter& operator=(const Adapter&) = delete;

    // Never throws; a failed initialization leaves the adapter unhealthy.
    void initialize();
    // Clears adapter-local state. Health flag and counters are kept.
    void shutdown();

    DispatchOutcome handle_canonical(const CanonicalMessage& message);

    nlohmann::json health_check() const;
    AdapterStatus status() const;
    bool is_ready() const;

    const std::string& name() const { return name_; }
    ClientType client_type() const { return client_type_; }

protected:
    virtual void on_initialize() {}
    virtual void on_shutdown() {}
    // Runs after the processor answered a canonical message.
    virtual void after_process(const CanonicalMessage&) {}
    virtual void add_health_extras(nlohmann::json&) const {}

    void record_success(TimePoint activity);
    void record_error();

    MessageProcessor& processor_;

private:
    std::string name_;
    ClientType client_type_;
    mutable std::mutex status_mutex_;
    AdapterStatus status_;
};
