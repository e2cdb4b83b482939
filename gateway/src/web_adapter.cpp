
#include "web_adapter.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>

WebRequest WebRequest::from_json(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw ValidationError("Web message body must be a JSON object");
    }

    WebRequest req;

    auto content = j.find("content");
    if (content == j.end() || !content->is_string()) {
        throw ValidationError("Field 'content' is required and must be a string");
    }
    req.content = content->get<std::string>();

    auto user_id = j.find("user_id");
    if (user_id == j.end() || !user_id->is_string() || user_id->get<std::string>().empty()) {
        throw ValidationError("Field 'user_id' is required and must be a non-empty string");
    }
    req.user_id = user_id->get<std::string>();

    auto session_id = j.find("session_id");
    if (session_id != j.end() && !session_id->is_null()) {
        if (!session_id->is_string()) {
            throw ValidationError("Field 'session_id' must be a string");
        }
        if (!session_id->get<std::string>().empty()) {
            req.session_id = session_id->get<std::string>();
        }
    }

    auto message_type = j.find("message_type");
    if (message_type != j.end() && !message_type->is_null()) {
        if (!message_type->is_string()) {
            throw ValidationError("Field 'message_type' must be a string");
        }
        auto parsed = parse_message_type(message_type->get<std::string>());
        if (!parsed) {
            throw ValidationError("Unrecognized message_type: " + message_type->get<std::string>());
        }
        req.message_type = *parsed;
    }

    return req;
}

nlohmann::json WebReply::to_json() const {
    if (!success) {
        nlohmann::json j = {
            {"success", false},
            {"error", error}
        };
        if (error_kind) {
            j["error_kind"] = to_string(*error_kind);
        }
        return j;
    }
    return {
        {"success", true},
        {"response", {
            {"content", content},
            {"type", to_string(type)},
            {"timestamp", util::format_iso8601(timestamp)}
        }}
    };
}

WebAdapter::WebAdapter(MessageProcessor& processor, size_t max_sessions)
    : Adapter("Web", ClientType::WEB, processor), sessions_(max_sessions) {}

WebReply WebAdapter::dispatch(const nlohmann::json& payload) {
    WebReply reply;
    reply.timestamp = Clock::now();

    if (!is_ready()) {
        spdlog::warn("Web adapter is not ready");
        reply.error = AdapterNotReady(name()).what();
        reply.error_kind = ErrorKind::ADAPTER_NOT_READY;
        return reply;
    }

    std::optional<CanonicalMessage> message;
    try {
        WebRequest req = WebRequest::from_json(payload);
        message.emplace(
            util::generate_uuid(),
            ClientType::WEB,
            req.message_type,
            req.content,
            req.user_id,
            std::nullopt,
            Clock::now(),
            nlohmann::json{
                {"session_id", req.session_id ? nlohmann::json(*req.session_id) : nlohmann::json(nullptr)},
                {"user_agent", "web_client"}
            });
    } catch (const ValidationError& e) {
        spdlog::warn("Rejected web message: {}", e.what());
        record_error();
        reply.error = e.what();
        reply.error_kind = e.kind();
        return reply;
    }

    DispatchOutcome outcome = handle_canonical(*message);
    reply.timestamp = Clock::now();
    if (!outcome.success) {
        reply.error = outcome.error_message;
        reply.error_kind = outcome.error;
        return reply;
    }

    reply.success = true;
    reply.content = outcome.response->content;
    reply.type = outcome.response->response_type;
    return reply;
}

size_t WebAdapter::active_session_count() const {
    return sessions_.size();
}

std::optional<WebSession> WebAdapter::find_session(const std::string& session_id) const {
    return sessions_.find(session_id);
}

nlohmann::json WebAdapter::sessions_status() const {
    nlohmann::json status = health_check();
    nlohmann::json listing = nlohmann::json::object();
    for (const auto& session : sessions_.snapshot()) {
        listing[session.session_id] = {
            {"user_id", session.user_id},
            {"last_activity", util::format_iso8601(session.last_activity)}
        };
    }
    status["sessions"] = listing;
    return status;
}

void WebAdapter::on_shutdown() {
    sessions_.clear();
}

void WebAdapter::after_process(const CanonicalMessage& message) {
    auto it = message.metadata().find("session_id");
    if (it == message.metadata().end() || !it->is_string()) {
        return;
    }
    const std::string session_id = it->get<std::string>();
    if (session_id.empty()) {
        return;
    }
    sessions_.touch(session_id, message.user_id(), message.timestamp());
}

void WebAdapter::add_health_extras(nlohmann::json& health) const {
    health["active_sessions"] = sessions_.size();
}
