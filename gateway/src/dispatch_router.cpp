
#include "dispatch_router.hpp"
#include <spdlog/spdlog.h>

nlohmann::json RouteReply::to_json() const {
    nlohmann::json j = {
        {"status", status},
        {"response", response}
    };
    if (error) {
        j["error"] = to_string(*error);
    }
    return j;
}

DispatchRouter::DispatchRouter(TelegramAdapter& telegram, WebAdapter& web, CliAdapter& cli)
    : telegram_(telegram), web_(web), cli_(cli) {}

RouteReply DispatchRouter::route(const nlohmann::json& body) {
    if (body.is_object()) {
        auto tag = body.find("client_type");
        if (tag != body.end() && tag->is_string() && !parse_client_type(tag->get<std::string>())) {
            spdlog::warn("Rejecting message with unsupported client type '{}'", tag->get<std::string>());
            throw UnsupportedClientType(tag->get<std::string>());
        }
    }

    std::optional<CanonicalMessage> message;
    try {
        message = CanonicalMessage::from_json(body);
    } catch (const ValidationError& e) {
        spdlog::warn("Rejecting malformed message: {}", e.what());
        return RouteReply{"error", e.what(), e.kind()};
    }

    return route(*message);
}

RouteReply DispatchRouter::route(const CanonicalMessage& message) {
    switch (message.client_type()) {
        case ClientType::TELEGRAM:
            return to_reply(telegram_.handle_canonical(message));
        case ClientType::WEB:
            return to_reply(web_.handle_canonical(message));
        case ClientType::CLI:
            return to_reply(cli_.handle_routed(message));
    }
    throw UnsupportedClientType(std::to_string(static_cast<int>(message.client_type())));
}

RouteReply DispatchRouter::to_reply(const DispatchOutcome& outcome) {
    if (outcome.success) {
        return RouteReply{"ok", outcome.response->content, std::nullopt};
    }
    return RouteReply{"error", outcome.error_message, outcome.error};
}
