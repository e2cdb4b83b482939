
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <algorithm>
#include <cctype>
#include <ctime>
#include <iomanip>
#include <random>
#include <sstream>

namespace util {

void setup_logging(const std::string& service_name, const std::string& level) {
    auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    auto logger = std::make_shared<spdlog::logger>(service_name, console_sink);
    spdlog::set_default_logger(logger);

    if (level == "debug") {
        spdlog::set_level(spdlog::level::debug);
    } else if (level == "info") {
        spdlog::set_level(spdlog::level::info);
    } else if (level == "warn") {
        spdlog::set_level(spdlog::level::warn);
    } else if (level == "error") {
        spdlog::set_level(spdlog::level::err);
    }

    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");
}

std::string generate_uuid() {
    static thread_local std::mt19937 gen(std::random_device{}());
    std::uniform_int_distribution<> dis(0, 15);
    std::uniform_int_distribution<> dis2(8, 11);

    std::stringstream ss;
    ss << std::hex;
    for (int i = 0; i < 8; i++) {
        ss << dis(gen);
    }
    ss << "-";
    for (int i = 0; i < 4; i++) {
        ss << dis(gen);
    }
    ss << "-4";
    for (int i = 0; i < 3; i++) {
        ss << dis(gen);
    }
    ss << "-";
    ss << dis2(gen);
    for (int i = 0; i < 3; i++) {
        ss << dis(gen);
    }
    ss << "-";
    for (int i = 0; i < 12; i++) {
        ss << dis(gen);
    }
    return ss.str();
}

std::string current_iso8601() {
    return format_iso8601(std::chrono::system_clock::now());
}

std::string format_iso8601(const std::chrono::system_clock::time_point& tp) {
    auto tt = std::chrono::system_clock::to_time_t(tp);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()) % 1000;
    if (ms.count() < 0) {
        ms += std::chrono::milliseconds(1000);
        tt -= 1;
    }

    std::tm tm = {};
    gmtime_r(&tt, &tm);

    std::stringstream ss;
    ss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S");
    ss << '.' << std::setfill('0') << std::setw(3) << ms.count() << 'Z';
    return ss.str();
}

std::optional<std::chrono::system_clock::time_point> parse_iso8601(const std::string& iso_string) {
    std::tm tm = {};
    std::istringstream ss(iso_string);
    ss >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
    if (ss.fail()) {
        return std::nullopt;
    }

    // Fractional seconds, any precision; only milliseconds are kept
    int millis = 0;
    if (ss.peek() == '.') {
        ss.get();
        int digits = 0;
        while (std::isdigit(ss.peek())) {
            char c = static_cast<char>(ss.get());
            if (digits < 3) {
                millis = millis * 10 + (c - '0');
            }
            digits++;
        }
        if (digits == 0) {
            return std::nullopt;
        }
        for (; digits < 3; digits++) {
            millis *= 10;
        }
    }

    std::chrono::minutes offset(0);
    int next = ss.peek();
    if (next == 'Z' || next == 'z') {
        ss.get();
    } else if (next == '+' || next == '-') {
        char sign = static_cast<char>(ss.get());
        int hours = 0;
        int minutes = 0;
        char colon = 0;
        ss >> hours >> colon >> minutes;
        if (ss.fail() || colon != ':') {
            return std::nullopt;
        }
        offset = std::chrono::hours(hours) + std::chrono::minutes(minutes);
        if (sign == '-') {
            offset = -offset;
        }
    }

    if (ss.peek() != std::char_traits<char>::eof()) {
        return std::nullopt;
    }

    // Naive timestamps are treated as UTC
    auto time = std::chrono::system_clock::from_time_t(timegm(&tm));
    time += std::chrono::milliseconds(millis);
    time -= offset;
    return time;
}

std::string format_clock_time(const std::chrono::system_clock::time_point& tp) {
    auto tt = std::chrono::system_clock::to_time_t(tp);
    std::tm tm = {};
    localtime_r(&tt, &tm);

    std::stringstream ss;
    ss << std::put_time(&tm, "%H:%M:%S");
    return ss.str();
}

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string join(const std::vector<std::string>& parts, const std::string& sep) {
    std::string out;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) {
            out += sep;
        }
        out += parts[i];
    }
    return out;
}

std::vector<std::string> split_tokens(const std::string& text) {
    std::istringstream iss(text);
    std::vector<std::string> tokens;
    std::string token;

    while (iss >> token) {
        tokens.push_back(token);
    }

    return tokens;
}

}
