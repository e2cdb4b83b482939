
#pragma once
#include "config.hpp"
#include <string>
#include <unordered_set>

enum class AuthResult {
    OK,
    MISSING_KEY,
    INVALID_KEY
};

// X-API-Key check for the HTTP surface.
class ApiKeyAuth {
public:
    explicit ApiKeyAuth(const Config& config);

    AuthResult check(const std::string& api_key) const;

private:
    std::unordered_set<std::string> valid_keys_;
};
