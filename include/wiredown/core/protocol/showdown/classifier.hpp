#pragma once

#include <string>
#include <string_view>
#include <charconv>
#include <cstdint>
#include <cstddef>

#include "wiredown/core/protocol/showdown/frame.hpp"
#include "wiredown/core/protocol/showdown/event.hpp"
#include "wiredown/core/protocol/showdown/parser/result.hpp"
#include "wiredown/core/protocol/showdown/parser/request.hpp"
#include "lcr/log/logger.hpp"

#include "simdjson.h"


namespace wiredown::core::protocol::showdown {

// -----------------------------------------------------------------------------
// Line segmentation
// -----------------------------------------------------------------------------
//
// Protocol lines look like "|command|arg|arg...". Segment 0 is the (empty)
// text before the first '|', segment 1 is the command token.
//
namespace line {

// i-th '|' separated segment, "" when the line has fewer segments
[[nodiscard]]
inline std::string_view segment(std::string_view l, std::size_t index) noexcept {
    std::size_t start = 0;
    for (std::size_t i = 0; i < index; ++i) {
        const std::size_t bar = l.find('|', start);
        if (bar == std::string_view::npos) {
            return {};
        }
        start = bar + 1;
    }
    const std::size_t bar = l.find('|', start);
    return (bar == std::string_view::npos) ? l.substr(start) : l.substr(start, bar - start);
}

// Segments index.. rejoined with '|' (i.e. everything after the index-th '|')
[[nodiscard]]
inline std::string_view rest(std::string_view l, std::size_t index) noexcept {
    std::size_t start = 0;
    for (std::size_t i = 0; i < index; ++i) {
        const std::size_t bar = l.find('|', start);
        if (bar == std::string_view::npos) {
            return {};
        }
        start = bar + 1;
    }
    return l.substr(start);
}

// Integer with optional surrounding blanks and sign
[[nodiscard]]
inline bool parse_int(std::string_view text, std::int64_t& out) noexcept {
    while (!text.empty() && (text.front() == ' ' || text.front() == '\t')) text.remove_prefix(1);
    while (!text.empty() && (text.back() == ' ' || text.back() == '\t' || text.back() == '\r')) text.remove_suffix(1);
    if (!text.empty() && text.front() == '+') {
        text.remove_prefix(1);
        if (!text.empty() && text.front() == '-') {
            return false;
        }
    }
    if (text.empty()) {
        return false;
    }
    const char* first = text.data();
    const char* last = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(first, last, out);
    return ec == std::errc{} && ptr == last;
}

} // namespace line


/*
================================================================================
 Classifier
================================================================================

Maps one (room, line) pair to a typed Event by its command token.

  |challstr|ID|CHALLSTR   → Challstr   (challstr keeps any further '|')
  |init|battle            → Init
  |title|TEXT             → Title
  |win|USER               → Win
  |tie                    → Tie
  |error|TEXT             → Error
  |turn|N                 → TurnAdvance (turn unset if N is not an integer)
  |request|JSON           → RequestUpdate (empty JSON text → empty object)
  anything else           → Other

classify() is total: every line produces an event. The only failure is a
|request| line carrying malformed JSON, reported as Result::InvalidJson (the
event is then set to Other so callers never observe a half-decoded request).

The classifier owns the simdjson parser so its buffers are reused across lines.
================================================================================
*/
class Classifier {
    constexpr static std::size_t PARSER_BUFFER_INITIAL_SIZE_ = 16 * 1024; // 16 KB

public:
    Classifier() {
        // Requests for six-pokemon teams are a few KB; avoid regrowth per battle
        if (parser_.allocate(PARSER_BUFFER_INITIAL_SIZE_)) {
            WD_WARN("[PARSER] Could not pre-allocate JSON parser buffers");
        }
    }

    Classifier(const Classifier&) = delete;
    Classifier& operator=(const Classifier&) = delete;

    [[nodiscard]]
    inline parser::Result classify(const RoomLine& rl, Event& out) {
        return classify(rl.line, out);
    }

    [[nodiscard]]
    inline parser::Result classify(std::string_view l, Event& out) {
        const std::string_view command = line::segment(l, 1);

        if (command == "challstr") {
            out = event::Challstr{std::string(line::segment(l, 2)), std::string(line::rest(l, 3))};
        }
        else if (command == "init" && line::segment(l, 2) == "battle") {
            out = event::Init{};
        }
        else if (command == "title") {
            out = event::Title{std::string(line::rest(l, 2))};
        }
        else if (command == "win") {
            out = event::Win{std::string(line::segment(l, 2))};
        }
        else if (command == "tie") {
            out = event::Tie{};
        }
        else if (command == "error") {
            out = event::Error{std::string(line::rest(l, 2))};
        }
        else if (command == "turn") {
            event::TurnAdvance turn;
            std::int64_t n = 0;
            if (line::parse_int(line::segment(l, 2), n)) {
                turn.turn = n;
            }
            else {
                WD_DEBUG("[PARSER] Ignoring non-numeric turn: " << l);
            }
            out = turn;
        }
        else if (command == "request") {
            event::RequestUpdate update;
            auto r = parser::request::parse(parser_, line::rest(l, 2), update.snapshot);
            if (r != parser::Result::Parsed) {
                out = event::Other{std::string(l)};
                return r;
            }
            out = std::move(update);
        }
        else {
            out = event::Other{std::string(l)};
        }
        return parser::Result::Parsed;
    }

private:
    simdjson::dom::parser parser_;
};

} // namespace wiredown::core::protocol::showdown
