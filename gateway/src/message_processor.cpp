
#include "message_processor.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <fmt/format.h>

namespace {

constexpr size_t kLogPreviewChars = 50;

std::string format_uptime(double seconds) {
    auto total = static_cast<long long>(seconds);
    return fmt::format("{}h {:02}m {:02}s", total / 3600, (total / 60) % 60, total % 60);
}

}

MessageProcessor::MessageProcessor(ResponseGenerator& generator)
    : generator_(generator) {
    stats_.start_time = Clock::now();
}

CanonicalResponse MessageProcessor::process(const CanonicalMessage& message) {
    // Counted before anything can fail so stats reflect attempted work
    {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        stats_.total_messages++;
        stats_.messages_by_client[static_cast<size_t>(message.client_type())]++;
    }

    spdlog::info("Processing message {} from {}: {}", message.id(), to_string(message.client_type()),
                 message.content().substr(0, kLogPreviewChars));

    CanonicalResponse response;
    response.message_id = message.id();
    response.client_type = message.client_type();
    response.response_type = MessageType::TEXT;

    try {
        response.content = generate_content(message);
    } catch (const std::exception& e) {
        spdlog::error("Failed to process message {}: {}", message.id(), e.what());
        record_error();
        response.content = fmt::format("An error occurred while processing the message: {}", e.what());
        response.error = ErrorKind::PROCESSING_FAILURE;
    } catch (...) {
        spdlog::error("Failed to process message {}: non-standard exception", message.id());
        record_error();
        response.content = "An error occurred while processing the message: unknown error";
        response.error = ErrorKind::PROCESSING_FAILURE;
    }

    return response;
}

GatewayStats MessageProcessor::get_stats() const {
    GatewayStats snapshot;
    {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        snapshot = stats_;
    }

    auto uptime = Clock::now() - snapshot.start_time;
    snapshot.uptime_seconds = std::chrono::duration<double>(uptime).count();

    SessionCounter counter;
    {
        std::lock_guard<std::mutex> lock(counter_mutex_);
        counter = session_counter_;
    }
    snapshot.active_sessions = counter ? counter() : 0;

    return snapshot;
}

void MessageProcessor::set_session_counter(SessionCounter counter) {
    std::lock_guard<std::mutex> lock(counter_mutex_);
    session_counter_ = std::move(counter);
}

std::string MessageProcessor::help_text() {
    return "Available commands:\n"
           "/help - show this help\n"
           "/start - greeting\n"
           "/status - system status\n"
           "/stats - gateway statistics\n"
           "\n"
           "Any other text message is forwarded for processing.";
}

std::string MessageProcessor::status_text() const {
    GatewayStats stats = get_stats();
    return fmt::format(
        "Gateway status:\n"
        "• Uptime: {}\n"
        "• Total messages: {}\n"
        "• Errors: {}\n"
        "• Messages by client:\n"
        "  - Telegram: {}\n"
        "  - Web: {}\n"
        "  - CLI: {}",
        format_uptime(stats.uptime_seconds),
        stats.total_messages,
        stats.errors,
        stats.messages_for(ClientType::TELEGRAM),
        stats.messages_for(ClientType::WEB),
        stats.messages_for(ClientType::CLI));
}

std::string MessageProcessor::generate_content(const CanonicalMessage& message) {
    if (message.message_type() == MessageType::COMMAND) {
        return handle_command(message);
    }

    std::string lowered = util::to_lower(message.content());
    if (lowered.rfind("/help", 0) == 0) {
        return help_text();
    }
    if (lowered.rfind("/status", 0) == 0) {
        return status_text();
    }

    try {
        return generator_.generate(message);
    } catch (const GatewayError&) {
        throw;
    } catch (const std::exception& e) {
        throw ProcessingFailure(e.what());
    }
}

std::string MessageProcessor::handle_command(const CanonicalMessage& message) const {
    std::string command = message.content();
    auto first = command.find_first_not_of(" \t\r\n");
    auto last = command.find_last_not_of(" \t\r\n");
    command = first == std::string::npos ? "" : command.substr(first, last - first + 1);

    if (command == "/start") {
        return fmt::format("Hello, {}! I am the gateway bot that unifies the CLI, Web and Telegram interfaces.",
                           message.user_name().value_or(message.user_id()));
    }
    if (command == "/stats") {
        return status_text();
    }
    return fmt::format("Unknown command: {}", command);
}

void MessageProcessor::record_error() {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    stats_.errors++;
}
