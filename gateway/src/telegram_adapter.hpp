
#pragma once
#include "adapter.hpp"
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

// Plain-text reply handed back to the bot transport.
struct BotReply {
    bool success = false;
    std::string text;
    std::string message_id;
    nlohmann::json chat_id;  // from inbound metadata, null when absent
    std::optional<ErrorKind> error;

    nlohmann::json to_json() const;
};

// Bot surface. The bot transport already produces canonical message JSON,
// so normalization is validation only.
class TelegramAdapter : public Adapter {
public:
    explicit TelegramAdapter(MessageProcessor& processor);

    BotReply dispatch(const nlohmann::json& payload);
};
