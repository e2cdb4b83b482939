
#include "auth.hpp"
#include <spdlog/spdlog.h>

ApiKeyAuth::ApiKeyAuth(const Config& config)
    : valid_keys_(config.api_keys.begin(), config.api_keys.end()) {}

AuthResult ApiKeyAuth::check(const std::string& api_key) const {
    if (api_key.empty()) {
        return AuthResult::MISSING_KEY;
    }

    if (valid_keys_.find(api_key) == valid_keys_.end()) {
        spdlog::warn("Rejected request with invalid API key");
        return AuthResult::INVALID_KEY;
    }

    return AuthResult::OK;
}
