#pragma once

#include <string>
#include <string_view>
#include <initializer_list>

#include "lcr/optional.hpp"


namespace wiredown::core::protocol::showdown::command {

// -----------------------------------------------------------------------------
// Outbound message framing: "<room>|<part>|<part>..."
// The global room is the empty string ("|/search gen9randombattle").
// -----------------------------------------------------------------------------
[[nodiscard]]
inline std::string message(std::string_view room, std::initializer_list<std::string_view> parts) {
    std::string out(room);
    out += '|';
    bool first = true;
    for (std::string_view p : parts) {
        if (!first) {
            out += '|';
        }
        out += p;
        first = false;
    }
    return out;
}

// Global-room commands -------------------------------------------------------

[[nodiscard]]
inline std::string join(std::string_view room) {
    return "/join " + std::string(room);
}

// Packed team, or "None" to clear it (random formats)
[[nodiscard]]
inline std::string utm(const lcr::optional<std::string>& team) {
    return "/utm " + (team.has() ? team.value() : std::string("None"));
}

[[nodiscard]]
inline std::string search(std::string_view format) {
    return "/search " + std::string(format);
}

[[nodiscard]]
inline std::string trn(std::string_view username, std::string_view assertion) {
    std::string out("/trn ");
    out += username;
    out += ",0,";
    out += assertion;
    return out;
}

// Battle-room commands -------------------------------------------------------

[[nodiscard]]
inline std::string timer_on() {
    return "/timer on";
}

inline constexpr std::string_view CHOOSE_PREFIX = "/choose ";

// Trim the action text and make sure it is a /choose command.
// Returns false when nothing is left after trimming.
[[nodiscard]]
inline bool normalize_choice(std::string_view text, std::string& out) {
    constexpr std::string_view blanks = " \t\n\r\v\f";
    const auto first = text.find_first_not_of(blanks);
    if (first == std::string_view::npos) {
        out.clear();
        return false;
    }
    const auto last = text.find_last_not_of(blanks);
    text = text.substr(first, last - first + 1);
    if (text.substr(0, CHOOSE_PREFIX.size()) == CHOOSE_PREFIX) {
        out = std::string(text);
    }
    else {
        out = std::string(CHOOSE_PREFIX) + std::string(text);
    }
    return true;
}

} // namespace wiredown::core::protocol::showdown::command
