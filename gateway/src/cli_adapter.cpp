
#include "cli_adapter.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <fmt/format.h>

namespace {

constexpr const char* kDefaultCliUser = "cli";

CliReply failure_reply(ErrorKind kind, const std::string& message) {
    CliReply reply;
    reply.success = false;
    reply.error = message;
    reply.error_kind = kind;
    return reply;
}

CliReply output_reply(const std::string& output) {
    CliReply reply;
    reply.success = true;
    reply.output = output;
    return reply;
}

}

CliRequest CliRequest::from_json(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw ValidationError("CLI request body must be a JSON object");
    }

    CliRequest req;

    auto command = j.find("command");
    if (command == j.end() || !command->is_string()) {
        throw ValidationError("Field 'command' is required and must be a string");
    }
    req.command = command->get<std::string>();
    if (req.command.empty()) {
        throw ValidationError("Field 'command' must not be empty");
    }

    auto args = j.find("args");
    if (args != j.end() && !args->is_null()) {
        if (!args->is_array()) {
            throw ValidationError("Field 'args' must be an array of strings");
        }
        for (const auto& arg : *args) {
            if (!arg.is_string()) {
                throw ValidationError("Field 'args' must be an array of strings");
            }
            req.args.push_back(arg.get<std::string>());
        }
    }

    req.user_id = kDefaultCliUser;
    auto user_id = j.find("user_id");
    if (user_id != j.end() && !user_id->is_null()) {
        if (!user_id->is_string()) {
            throw ValidationError("Field 'user_id' must be a string");
        }
        if (!user_id->get<std::string>().empty()) {
            req.user_id = user_id->get<std::string>();
        }
    }

    auto options = j.find("options");
    if (options != j.end() && !options->is_null()) {
        if (!options->is_object()) {
            throw ValidationError("Field 'options' must be an object");
        }
        req.options = *options;
    }

    return req;
}

nlohmann::json CliReply::to_json() const {
    nlohmann::json j = {{"success", success}};
    if (success) {
        j["output"] = output;
    } else {
        j["error"] = error;
        if (error_kind) {
            j["error_kind"] = to_string(*error_kind);
        }
    }
    if (command) {
        j["command"] = *command;
    }
    if (timestamp) {
        j["timestamp"] = util::format_iso8601(*timestamp);
    }
    return j;
}

CliAdapter::CliAdapter(MessageProcessor& processor, size_t history_capacity)
    : Adapter("CLI", ClientType::CLI, processor), history_(history_capacity) {}

const std::vector<std::pair<std::string, std::string>>& CliAdapter::builtin_commands() {
    static const std::vector<std::pair<std::string, std::string>> commands = {
        {"help", "Show command help"},
        {"status", "Show system status"},
        {"stats", "Show gateway statistics"},
        {"send", "Send a message for processing"},
        {"history", "Show command history"},
        {"clear", "Clear command history"}
    };
    return commands;
}

bool CliAdapter::is_builtin(const std::string& command) {
    for (const auto& [name, description] : builtin_commands()) {
        if (name == command) {
            return true;
        }
    }
    return false;
}

CliReply CliAdapter::dispatch(const nlohmann::json& payload) {
    if (!is_ready()) {
        spdlog::warn("CLI adapter is not ready");
        return failure_reply(ErrorKind::ADAPTER_NOT_READY, AdapterNotReady(name()).what());
    }

    CliRequest req;
    try {
        req = CliRequest::from_json(payload);
    } catch (const ValidationError& e) {
        spdlog::warn("Rejected CLI command: {}", e.what());
        record_error();
        return failure_reply(e.kind(), e.what());
    }

    history_.append(CommandHistoryEntry{req.command, req.args, Clock::now(), req.user_id});

    try {
        if (is_builtin(req.command)) {
            return handle_builtin(req);
        }
        return forward_command(req);
    } catch (const GatewayError& e) {
        spdlog::warn("CLI command '{}' failed: {}", req.command, e.what());
        record_error();
        return failure_reply(e.kind(), e.what());
    } catch (const std::exception& e) {
        spdlog::error("CLI command '{}' failed: {}", req.command, e.what());
        record_error();
        return failure_reply(ErrorKind::PROCESSING_FAILURE, e.what());
    }
}

DispatchOutcome CliAdapter::handle_routed(const CanonicalMessage& message) {
    auto tokens = util::split_tokens(message.content());
    if (!tokens.empty() && is_ready()) {
        std::vector<std::string> args(tokens.begin() + 1, tokens.end());
        history_.append(CommandHistoryEntry{tokens.front(), args, message.timestamp(), message.user_id()});
    }
    return handle_canonical(message);
}

size_t CliAdapter::history_size() const {
    return history_.size();
}

std::vector<CommandHistoryEntry> CliAdapter::recent_history() const {
    return history_.recent(kRenderedHistory);
}

nlohmann::json CliAdapter::help_document() const {
    nlohmann::json commands = nlohmann::json::object();
    for (const auto& [command, description] : builtin_commands()) {
        commands[command] = description;
    }

    return {
        {"commands", commands},
        {"usage", "POST /cli/execute with JSON: {\"command\": \"<command>\", \"args\": [\"<arguments>\"], \"user_id\": \"<id>\"}"},
        {"examples", nlohmann::json::array({
            {{"command", "help"}, {"args", nlohmann::json::array()}, {"description", "Show help"}},
            {{"command", "send"}, {"args", nlohmann::json::array({"Hello", "world"})}, {"description", "Send a message"}},
            {{"command", "status"}, {"args", nlohmann::json::array()}, {"description", "Show status"}}
        })}
    };
}

void CliAdapter::on_shutdown() {
    history_.clear();
}

void CliAdapter::add_health_extras(nlohmann::json& health) const {
    health["command_history_size"] = history_.size();
}

CliReply CliAdapter::handle_builtin(const CliRequest& req) {
    if (req.command == "send") {
        return send_text(req);
    }

    CliReply reply;
    if (req.command == "help") {
        reply = output_reply(format_help());
    } else if (req.command == "status") {
        reply = output_reply(format_status(processor_.get_stats()));
    } else if (req.command == "stats") {
        reply = output_reply(format_stats(processor_.get_stats()));
    } else if (req.command == "history") {
        reply = output_reply(format_history());
    } else if (req.command == "clear") {
        history_.clear();
        reply = output_reply("Command history cleared");
    } else {
        throw ValidationError("Unknown command: " + req.command);
    }

    record_success(Clock::now());
    return reply;
}

CliReply CliAdapter::forward_command(const CliRequest& req) {
    std::string content = req.args.empty() ? req.command : req.command + " " + util::join(req.args, " ");

    CanonicalMessage message(
        util::generate_uuid(),
        ClientType::CLI,
        MessageType::COMMAND,
        content,
        req.user_id,
        std::nullopt,
        Clock::now(),
        nlohmann::json{
            {"command", req.command},
            {"args", req.args},
            {"options", req.options}
        });

    DispatchOutcome outcome = handle_canonical(message);
    if (!outcome.success) {
        return failure_reply(*outcome.error, outcome.error_message);
    }

    CliReply reply = output_reply(outcome.response->content);
    reply.command = req.command;
    reply.timestamp = Clock::now();
    return reply;
}

CliReply CliAdapter::send_text(const CliRequest& req) {
    if (req.args.empty()) {
        throw ValidationError("Usage: send <message>");
    }

    CanonicalMessage message(
        util::generate_uuid(),
        ClientType::CLI,
        MessageType::TEXT,
        util::join(req.args, " "),
        req.user_id,
        std::nullopt,
        Clock::now(),
        nlohmann::json{{"via_cli", true}});

    DispatchOutcome outcome = handle_canonical(message);
    if (!outcome.success) {
        return failure_reply(*outcome.error, outcome.error_message);
    }
    return output_reply(outcome.response->content);
}

std::string CliAdapter::format_help() const {
    std::string text = "Available commands:\n\n";
    for (const auto& [command, description] : builtin_commands()) {
        text += fmt::format("  {:<12} - {}\n", command, description);
    }

    text += "\nExamples:\n";
    text += "  send Hello, how are you?\n";
    text += "  status\n";
    text += "  history\n";
    return text;
}

std::string CliAdapter::format_status(const GatewayStats& stats) const {
    return fmt::format(
        "Gateway status:\n"
        "  Uptime: {:.1f} hours\n"
        "  Total messages: {}\n"
        "  Active sessions: {}\n"
        "  Errors: {}",
        stats.uptime_seconds / 3600.0,
        stats.total_messages,
        stats.active_sessions,
        stats.errors);
}

std::string CliAdapter::format_stats(const GatewayStats& stats) const {
    return fmt::format(
        "Detailed gateway statistics:\n"
        "  Total messages: {}\n"
        "\n"
        "  By client type:\n"
        "    Telegram: {}\n"
        "    Web: {}\n"
        "    CLI: {}\n"
        "\n"
        "  Active sessions: {}\n"
        "  Errors: {}\n"
        "  Uptime: {:.1f} seconds",
        stats.total_messages,
        stats.messages_for(ClientType::TELEGRAM),
        stats.messages_for(ClientType::WEB),
        stats.messages_for(ClientType::CLI),
        stats.active_sessions,
        stats.errors,
        stats.uptime_seconds);
}

std::string CliAdapter::format_history() const {
    auto entries = history_.recent(kRenderedHistory);
    if (entries.empty()) {
        return "Command history is empty";
    }

    std::string text = "Command history:\n\n";
    int index = 1;
    for (const auto& entry : entries) {
        text += fmt::format("  {:2d}. [{}] {} {}\n",
                            index++,
                            util::format_clock_time(entry.timestamp),
                            entry.command,
                            util::join(entry.args, " "));
    }
    return text;
}
