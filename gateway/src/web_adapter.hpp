
#pragma once
#include "adapter.hpp"
#include "session_table.hpp"
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

struct WebRequest {
    std::string content;
    std::string user_id;
    std::optional<std::string> session_id;
    MessageType message_type = MessageType::TEXT;

    static WebRequest from_json(const nlohmann::json& j);
};

struct WebReply {
    bool success = false;
    std::string content;
    MessageType type = MessageType::TEXT;
    TimePoint timestamp;
    std::string error;
    std::optional<ErrorKind> error_kind;

    // {success, response:{content, type, timestamp}} or {success:false, error}
    nlohmann::json to_json() const;
};

class WebAdapter : public Adapter {
public:
    WebAdapter(MessageProcessor& processor, size_t max_sessions);

    WebReply dispatch(const nlohmann::json& payload);

    size_t active_session_count() const;
    std::optional<WebSession> find_session(const std::string& session_id) const;
    // Health plus the full session listing
    nlohmann::json sessions_status() const;

protected:
    void on_shutdown() override;
    void after_process(const CanonicalMessage& message) override;
    void add_health_extras(nlohmann::json& health) const override;

private:
    SessionTable sessions_;
};
