
#include "telegram_adapter.hpp"
#include <spdlog/spdlog.h>

nlohmann::json BotReply::to_json() const {
    nlohmann::json j = {
        {"success", success},
        {"text", text},
        {"message_id", message_id},
        {"chat_id", chat_id}
    };
    if (error) {
        j["error"] = to_string(*error);
    }
    return j;
}

TelegramAdapter::TelegramAdapter(MessageProcessor& processor)
    : Adapter("Telegram", ClientType::TELEGRAM, processor) {}

BotReply TelegramAdapter::dispatch(const nlohmann::json& payload) {
    BotReply reply;
    if (payload.is_object()) {
        auto id_it = payload.find("id");
        if (id_it != payload.end() && id_it->is_string()) {
            reply.message_id = id_it->get<std::string>();
        }
        auto meta_it = payload.find("metadata");
        if (meta_it != payload.end() && meta_it->is_object() && meta_it->contains("chat_id")) {
            reply.chat_id = meta_it->at("chat_id");
        }
    }

    if (!is_ready()) {
        spdlog::warn("Telegram adapter is not ready");
        reply.error = ErrorKind::ADAPTER_NOT_READY;
        reply.text = AdapterNotReady(name()).what();
        return reply;
    }

    std::optional<CanonicalMessage> message;
    try {
        message = CanonicalMessage::from_json(payload);
        if (message->client_type() != ClientType::TELEGRAM) {
            throw ValidationError("Expected client_type 'telegram', got '" + to_string(message->client_type()) + "'");
        }
    } catch (const ValidationError& e) {
        spdlog::warn("Rejected Telegram payload: {}", e.what());
        record_error();
        reply.error = e.kind();
        reply.text = e.what();
        return reply;
    }

    DispatchOutcome outcome = handle_canonical(*message);
    reply.success = outcome.success;
    if (outcome.success) {
        reply.text = outcome.response->content;
        reply.message_id = outcome.response->message_id;
    } else {
        reply.error = outcome.error;
        reply.text = "An error occurred while processing the message: " + outcome.error_message;
    }
    return reply;
}
