
#pragma once
#include "adapter.hpp"
#include "command_history.hpp"
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>

struct CliRequest {
    std::string command;
    std::vector<std::string> args;
    std::string user_id;
    nlohmann::json options = nlohmann::json::object();

    static CliRequest from_json(const nlohmann::json& j);
};

struct CliReply {
    bool success = false;
    std::string output;
    std::string error;
    std::optional<std::string> command;
    std::optional<TimePoint> timestamp;
    std::optional<ErrorKind> error_kind;

    // {success, output|error, command?, timestamp?}
    nlohmann::json to_json() const;
};

class CliAdapter : public Adapter {
public:
    static constexpr size_t kRenderedHistory = 10;

    CliAdapter(MessageProcessor& processor, size_t history_capacity);

    CliReply dispatch(const nlohmann::json& payload);

    // Canonical messages routed here directly; recorded in history like commands.
    DispatchOutcome handle_routed(const CanonicalMessage& message);

    size_t history_size() const;
    std::vector<CommandHistoryEntry> recent_history() const;

    // Usage document: commands, request shape, examples
    nlohmann::json help_document() const;

    static const std::vector<std::pair<std::string, std::string>>& builtin_commands();
    static bool is_builtin(const std::string& command);

protected:
    void on_shutdown() override;
    void add_health_extras(nlohmann::json& health) const override;

private:
    CliReply handle_builtin(const CliRequest& req);
    CliReply forward_command(const CliRequest& req);
    CliReply send_text(const CliRequest& req);

    std::string format_help() const;
    std::string format_status(const GatewayStats& stats) const;
    std::string format_stats(const GatewayStats& stats) const;
    std::string format_history() const;

    CommandHistory history_;
};
