#pragma once

#include <cstdint>
#include <string_view>


namespace wiredown::core::protocol::showdown::parser {

// ===============================================
// PARSER RESULT ENUM
// ===============================================
enum class Result : std::uint8_t {
    Ok             = 0,            // Structurally valid (helper level)
    Ignored        = 1,            // Not applicable / unknown command
    InvalidJson    = 2,            // Payload is not well-formed JSON
    InvalidSchema  = 3,            // Wrong JSON type where a specific one is required
    Parsed         = 4             // Parsed successfully
};

// -----------------------------------------------------------------------------
// Convert enum → string (for logging / diagnostics)
// -----------------------------------------------------------------------------
[[nodiscard]]
inline constexpr std::string_view to_string(Result r) noexcept {
    switch (r) {
        case Result::Ok:             return "Ok";
        case Result::Ignored:        return "Ignored";
        case Result::InvalidJson:    return "InvalidJson";
        case Result::InvalidSchema:  return "InvalidSchema";
        case Result::Parsed:         return "Parsed";
        default:                     return "unknown";
    }
}

} // namespace wiredown::core::protocol::showdown::parser
