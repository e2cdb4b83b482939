
#pragma once
#include "errors.hpp"
#include <array>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;

enum class ClientType {
    TELEGRAM,
    WEB,
    CLI
};

inline constexpr std::array<ClientType, 3> kAllClientTypes = {
    ClientType::TELEGRAM, ClientType::WEB, ClientType::CLI
};

enum class MessageType {
    TEXT,
    COMMAND,
    FILE,
    IMAGE,
    AUDIO,
    VIDEO
};

std::string to_string(ClientType type);
std::string to_string(MessageType type);
std::optional<ClientType> parse_client_type(const std::string& value);
std::optional<MessageType> parse_message_type(const std::string& value);

// Client-type-agnostic inbound message. Immutable once constructed.
class CanonicalMessage {
public:
    CanonicalMessage(std::string id,
                     ClientType client_type,
                     MessageType message_type,
                     std::string content,
                     std::string user_id,
                     std::optional<std::string> user_name,
                     TimePoint timestamp,
                     nlohmann::json metadata = nlohmann::json::object());

    const std::string& id() const { return id_; }
    ClientType client_type() const { return client_type_; }
    MessageType message_type() const { return message_type_; }
    const std::string& content() const { return content_; }
    const std::string& user_id() const { return user_id_; }
    const std::optional<std::string>& user_name() const { return user_name_; }
    TimePoint timestamp() const { return timestamp_; }
    const nlohmann::json& metadata() const { return metadata_; }

    nlohmann::json to_json() const;
    static CanonicalMessage from_json(const nlohmann::json& j);

private:
    std::string id_;
    ClientType client_type_;
    MessageType message_type_;
    std::string content_;
    std::string user_id_;
    std::optional<std::string> user_name_;
    TimePoint timestamp_;
    nlohmann::json metadata_;
};

struct CanonicalResponse {
    std::string message_id;
    ClientType client_type = ClientType::TELEGRAM;
    std::string content;
    MessageType response_type = MessageType::TEXT;
    nlohmann::json metadata = nlohmann::json::object();
    // Set when the processor synthesised this response from a failure
    std::optional<ErrorKind> error;

    nlohmann::json to_json() const;
};

struct AdapterStatus {
    bool is_healthy = false;
    std::optional<TimePoint> last_activity;
    uint64_t error_count = 0;
    uint64_t message_count = 0;

    nlohmann::json to_json() const;
};

struct GatewayStats {
    uint64_t total_messages = 0;
    std::array<uint64_t, kAllClientTypes.size()> messages_by_client{};
    uint64_t errors = 0;
    TimePoint start_time;
    double uptime_seconds = 0.0;
    size_t active_sessions = 0;

    uint64_t messages_for(ClientType type) const;
    nlohmann::json to_json() const;
};
