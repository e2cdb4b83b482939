
#pragma once
#include "models.hpp"
#include "response_generator.hpp"
#include <functional>
#include <mutex>
#include <string>

// Single point every canonical message flows through. Owns the aggregate
// statistics; process() never throws.
class MessageProcessor {
public:
    using SessionCounter = std::function<size_t()>;

    explicit MessageProcessor(ResponseGenerator& generator);

    CanonicalResponse process(const CanonicalMessage& message);

    GatewayStats get_stats() const;

    // The session table lives in the web adapter; it reports its size here.
    void set_session_counter(SessionCounter counter);

    static std::string help_text();
    std::string status_text() const;

private:
    std::string generate_content(const CanonicalMessage& message);
    std::string handle_command(const CanonicalMessage& message) const;
    void record_error();

    ResponseGenerator& generator_;

    mutable std::mutex stats_mutex_;
    GatewayStats stats_;

    mutable std::mutex counter_mutex_;
    SessionCounter session_counter_;
};
