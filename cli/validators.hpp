#pragma once

#include <string>
#include <string_view>
#include <vector>

#include <CLI/CLI.hpp>


namespace wiredown::cli {

// -------------------------------------------------------------
// WebSocket URL validator
// -------------------------------------------------------------
inline auto ws_url_validator = CLI::Validator(
    [](std::string& value) -> std::string {
        if (value.rfind("ws://", 0) == 0 || value.rfind("wss://", 0) == 0) {
            return {};
        }
        return "URL must start with ws:// or wss://";
    },
    "WebSocket URL validator"
);


// -------------------------------------------------------------
// Login server validator
// -------------------------------------------------------------
inline auto http_url_validator = CLI::Validator(
    [](std::string& value) -> std::string {
        if (value.rfind("http://", 0) == 0 || value.rfind("https://", 0) == 0) {
            return {};
        }
        return "URL must start with http:// or https://";
    },
    "Login server URL validator"
);


// -------------------------------------------------------------
// Log level validator
// -------------------------------------------------------------
inline auto log_level_validator = CLI::IsMember(std::vector<std::string>{"trace", "debug", "info", "warn", "error"});

} // namespace wiredown::cli
