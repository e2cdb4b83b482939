
#include "config.hpp"
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <spdlog/spdlog.h>
#include <fmt/format.h>

namespace {

std::string get_env(const std::string& name, const std::string& default_val) {
    const char* value = std::getenv(name.c_str());
    return value ? std::string(value) : default_val;
}

int get_env_int(const std::string& name, int default_val) {
    const char* value = std::getenv(name.c_str());
    if (!value) {
        return default_val;
    }
    try {
        size_t consumed = 0;
        int parsed = std::stoi(value, &consumed);
        if (consumed != std::string(value).size()) {
            throw std::invalid_argument(name);
        }
        return parsed;
    } catch (const std::exception&) {
        throw std::runtime_error(fmt::format("Invalid integer value for env var {}: {}", name, value));
    }
}

// Secret from the file named by <env_var>_FILE, falling back to <env_var> itself.
std::string read_secret(const std::string& env_var) {
    const char* file_path = std::getenv((env_var + "_FILE").c_str());
    if (file_path) {
        std::ifstream file(file_path);
        if (!file.is_open()) {
            throw std::runtime_error(fmt::format("Cannot open {}_FILE: {}", env_var, file_path));
        }
        std::string content;
        std::getline(file, content);
        return content;
    }

    return get_env(env_var, "");
}

std::vector<std::string> split_list(const std::string& value) {
    std::vector<std::string> items;
    std::stringstream ss(value);
    std::string item;
    while (std::getline(ss, item, ',')) {
        auto first = item.find_first_not_of(" \t");
        auto last = item.find_last_not_of(" \t");
        if (first != std::string::npos) {
            items.push_back(item.substr(first, last - first + 1));
        }
    }
    return items;
}

}

Config Config::from_env() {
    Config config;

    config.service_name = get_env("SERVICE_NAME", "gateway");
    config.log_level = get_env("LOG_LEVEL", "info");

    config.listen_addr = get_env("LISTEN_ADDR", "0.0.0.0");
    config.listen_port = get_env_int("LISTEN_PORT", 8000);

    for (const char* key_var : {"TELEGRAM_API_KEY", "WEB_API_KEY", "CLI_API_KEY"}) {
        std::string key = read_secret(key_var);
        if (!key.empty()) {
            config.api_keys.push_back(key);
        }
    }
    config.cors_origins = split_list(get_env("CORS_ORIGINS", "*"));

    config.max_web_sessions = get_env_int("MAX_WEB_SESSIONS", 1024);
    config.cli_history_capacity = get_env_int("CLI_HISTORY_CAPACITY", 100);

    return config;
}

void Config::validate() const {
    if (api_keys.empty()) {
        throw std::runtime_error("No API keys configured: set TELEGRAM_API_KEY, WEB_API_KEY or CLI_API_KEY");
    }

    if (listen_port <= 0 || listen_port > 65535) {
        throw std::runtime_error("LISTEN_PORT must be between 1 and 65535");
    }

    if (max_web_sessions <= 0) {
        throw std::runtime_error("MAX_WEB_SESSIONS must be positive");
    }

    // History must hold at least the entries the CLI renders
    if (cli_history_capacity < 10) {
        throw std::runtime_error("CLI_HISTORY_CAPACITY must be at least 10");
    }

    if (log_level != "debug" && log_level != "info" && log_level != "warn" && log_level != "error") {
        throw std::runtime_error("LOG_LEVEL must be one of debug, info, warn, error");
    }

    spdlog::info("Configuration validated successfully");
}
