
#pragma once
#include "cli_adapter.hpp"
#include "telegram_adapter.hpp"
#include "web_adapter.hpp"
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

struct RouteReply {
    std::string status;    // "ok" or "error"
    std::string response;  // reply content, or the error description
    std::optional<ErrorKind> error;

    nlohmann::json to_json() const;
};

// Maps a canonical message's client type onto the owning adapter.
class DispatchRouter {
public:
    DispatchRouter(TelegramAdapter& telegram, WebAdapter& web, CliAdapter& cli);

    // Throws UnsupportedClientType when client_type is not a known tag.
    RouteReply route(const nlohmann::json& body);
    RouteReply route(const CanonicalMessage& message);

private:
    static RouteReply to_reply(const DispatchOutcome& outcome);

    TelegramAdapter& telegram_;
    WebAdapter& web_;
    CliAdapter& cli_;
};
