#pragma once

#include <string>
#include <string_view>
#include <variant>
#include <initializer_list>
#include <cstdint>

#include "wiredown/core/protocol/showdown/schema/request.hpp"
#include "lcr/optional.hpp"


namespace wiredown::core::protocol::showdown {

// -----------------------------------------------------------------------------
// Typed events, one per classified protocol line
// -----------------------------------------------------------------------------
namespace event {

// |challstr|<client id>|<challstr>
struct Challstr {
    std::string client_id;
    std::string challstr;

    // Value the login server expects: "<client id>|<challstr>"
    [[nodiscard]]
    inline std::string challenge() const {
        return client_id + "|" + challstr;
    }
};

// |init|battle
struct Init {};

// |title|<text>
struct Title {
    std::string text;
};

// |request|<json>
struct RequestUpdate {
    schema::RequestSnapshot snapshot;
};

// |turn|<n>   (turn unset when <n> is not an integer)
struct TurnAdvance {
    lcr::optional<std::int64_t> turn;
};

// |error|<message>
struct Error {
    std::string message;
};

// |win|<user>
struct Win {
    std::string winner;
};

// |tie
struct Tie {};

// Everything else
struct Other {
    std::string raw;
};

} // namespace event


// Alternative order matches EventType
using Event = std::variant<
    event::Challstr,
    event::Init,
    event::Title,
    event::RequestUpdate,
    event::TurnAdvance,
    event::Error,
    event::Win,
    event::Tie,
    event::Other
>;

enum class EventType : std::uint8_t {
    Challstr = 0,
    Init,
    Title,
    RequestUpdate,
    TurnAdvance,
    Error,
    Win,
    Tie,
    Other
};

static_assert(std::variant_size_v<Event> == static_cast<std::size_t>(EventType::Other) + 1);

[[nodiscard]]
inline constexpr std::string_view to_string(EventType t) noexcept {
    switch (t) {
        case EventType::Challstr:      return "Challstr";
        case EventType::Init:          return "Init";
        case EventType::Title:         return "Title";
        case EventType::RequestUpdate: return "RequestUpdate";
        case EventType::TurnAdvance:   return "TurnAdvance";
        case EventType::Error:         return "Error";
        case EventType::Win:           return "Win";
        case EventType::Tie:           return "Tie";
        case EventType::Other:         return "Other";
        default:                       return "Unknown";
    }
}

[[nodiscard]]
inline EventType type_of(const Event& e) noexcept {
    return static_cast<EventType>(e.index());
}


// Set of event classes (e.g. the classes that terminate a wait)
class EventMask {
public:
    constexpr EventMask() noexcept = default;

    constexpr EventMask(std::initializer_list<EventType> types) noexcept {
        for (EventType t : types) {
            bits_ |= bit_(t);
        }
    }

    [[nodiscard]]
    constexpr bool contains(EventType t) const noexcept {
        return (bits_ & bit_(t)) != 0;
    }

    [[nodiscard]]
    constexpr bool empty() const noexcept {
        return bits_ == 0;
    }

private:
    std::uint16_t bits_{0};

    static constexpr std::uint16_t bit_(EventType t) noexcept {
        return static_cast<std::uint16_t>(1u << static_cast<unsigned>(t));
    }
};

} // namespace wiredown::core::protocol::showdown
