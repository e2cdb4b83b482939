
#pragma once
#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace util {
    void setup_logging(const std::string& service_name, const std::string& level);
    std::string generate_uuid();
    std::string current_iso8601();

    // UTC, millisecond precision, trailing 'Z'
    std::string format_iso8601(const std::chrono::system_clock::time_point& tp);

    // Accepts "YYYY-MM-DDTHH:MM:SS" with optional fraction and 'Z' / "+HH:MM" suffix.
    std::optional<std::chrono::system_clock::time_point> parse_iso8601(const std::string& iso_string);

    // Local wall-clock "HH:MM:SS"
    std::string format_clock_time(const std::chrono::system_clock::time_point& tp);

    std::string to_lower(std::string s);
    std::string join(const std::vector<std::string>& parts, const std::string& sep);
    std::vector<std::string> split_tokens(const std::string& text);
}
