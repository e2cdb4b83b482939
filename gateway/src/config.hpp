
#pragma once
#include <string>
#include <vector>

struct Config {
    std::string service_name = "gateway";
    std::string log_level = "info";

    // HTTP transport
    std::string listen_addr = "0.0.0.0";
    int listen_port = 8000;
    std::vector<std::string> api_keys;
    std::vector<std::string> cors_origins = {"*"};

    // Adapter-local state bounds
    int max_web_sessions = 1024;
    int cli_history_capacity = 100;

    static Config from_env();
    void validate() const;
};
