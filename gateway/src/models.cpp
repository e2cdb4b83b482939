
#include "models.hpp"
#include "util.hpp"

namespace {

std::string required_string(const nlohmann::json& j, const std::string& key) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        throw ValidationError("Missing required field: " + key);
    }
    if (!it->is_string()) {
        throw ValidationError("Field '" + key + "' must be a string");
    }
    return it->get<std::string>();
}

size_t client_index(ClientType type) {
    return static_cast<size_t>(type);
}

}

std::string to_string(ClientType type) {
    switch (type) {
        case ClientType::TELEGRAM:
            return "telegram";
        case ClientType::WEB:
            return "web";
        case ClientType::CLI:
            return "cli";
    }
    return "unknown";
}

std::string to_string(MessageType type) {
    switch (type) {
        case MessageType::TEXT:
            return "text";
        case MessageType::COMMAND:
            return "command";
        case MessageType::FILE:
            return "file";
        case MessageType::IMAGE:
            return "image";
        case MessageType::AUDIO:
            return "audio";
        case MessageType::VIDEO:
            return "video";
    }
    return "unknown";
}

std::optional<ClientType> parse_client_type(const std::string& value) {
    for (auto type : kAllClientTypes) {
        if (to_string(type) == value) {
            return type;
        }
    }
    return std::nullopt;
}

std::optional<MessageType> parse_message_type(const std::string& value) {
    if (value == "text") return MessageType::TEXT;
    if (value == "command") return MessageType::COMMAND;
    if (value == "file") return MessageType::FILE;
    if (value == "image") return MessageType::IMAGE;
    if (value == "audio") return MessageType::AUDIO;
    if (value == "video") return MessageType::VIDEO;
    return std::nullopt;
}

CanonicalMessage::CanonicalMessage(std::string id,
                                   ClientType client_type,
                                   MessageType message_type,
                                   std::string content,
                                   std::string user_id,
                                   std::optional<std::string> user_name,
                                   TimePoint timestamp,
                                   nlohmann::json metadata)
    : id_(std::move(id))
    , client_type_(client_type)
    , message_type_(message_type)
    , content_(std::move(content))
    , user_id_(std::move(user_id))
    , user_name_(std::move(user_name))
    , timestamp_(timestamp)
    , metadata_(std::move(metadata)) {
    if (id_.empty()) {
        throw ValidationError("Message id must not be empty");
    }
    if (user_id_.empty()) {
        throw ValidationError("user_id must not be empty");
    }
    if (metadata_.is_null()) {
        metadata_ = nlohmann::json::object();
    }
    if (!metadata_.is_object()) {
        throw ValidationError("metadata must be an object");
    }
}

nlohmann::json CanonicalMessage::to_json() const {
    nlohmann::json j = {
        {"id", id_},
        {"client_type", to_string(client_type_)},
        {"message_type", to_string(message_type_)},
        {"content", content_},
        {"user_id", user_id_},
        {"timestamp", util::format_iso8601(timestamp_)},
        {"metadata", metadata_}
    };
    if (user_name_) {
        j["user_name"] = *user_name_;
    } else {
        j["user_name"] = nullptr;
    }
    return j;
}

CanonicalMessage CanonicalMessage::from_json(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw ValidationError("Message body must be a JSON object");
    }

    std::string client_tag = required_string(j, "client_type");
    auto client_type = parse_client_type(client_tag);
    if (!client_type) {
        throw ValidationError("Unrecognized client_type: " + client_tag);
    }

    std::string message_tag = required_string(j, "message_type");
    auto message_type = parse_message_type(message_tag);
    if (!message_type) {
        throw ValidationError("Unrecognized message_type: " + message_tag);
    }

    std::string ts = required_string(j, "timestamp");
    auto timestamp = util::parse_iso8601(ts);
    if (!timestamp) {
        throw ValidationError("Invalid timestamp: " + ts);
    }

    std::optional<std::string> user_name;
    auto name_it = j.find("user_name");
    if (name_it != j.end() && !name_it->is_null()) {
        if (!name_it->is_string()) {
            throw ValidationError("Field 'user_name' must be a string");
        }
        user_name = name_it->get<std::string>();
    }

    nlohmann::json metadata = j.value("metadata", nlohmann::json::object());

    return CanonicalMessage(
        required_string(j, "id"),
        *client_type,
        *message_type,
        required_string(j, "content"),
        required_string(j, "user_id"),
        user_name,
        *timestamp,
        metadata);
}

nlohmann::json CanonicalResponse::to_json() const {
    nlohmann::json j = {
        {"message_id", message_id},
        {"client_type", to_string(client_type)},
        {"content", content},
        {"response_type", to_string(response_type)},
        {"metadata", metadata}
    };
    if (error) {
        j["error"] = to_string(*error);
    }
    return j;
}

nlohmann::json AdapterStatus::to_json() const {
    return {
        {"healthy", is_healthy},
        {"last_activity", last_activity ? nlohmann::json(util::format_iso8601(*last_activity)) : nlohmann::json(nullptr)},
        {"message_count", message_count},
        {"error_count", error_count}
    };
}

uint64_t GatewayStats::messages_for(ClientType type) const {
    return messages_by_client[client_index(type)];
}

nlohmann::json GatewayStats::to_json() const {
    nlohmann::json by_client = nlohmann::json::object();
    for (auto type : kAllClientTypes) {
        by_client[to_string(type)] = messages_for(type);
    }

    return {
        {"total_messages", total_messages},
        {"messages_by_client", by_client},
        {"errors", errors},
        {"start_time", util::format_iso8601(start_time)},
        {"uptime_seconds", uptime_seconds},
        {"active_sessions", active_sessions}
    };
}
