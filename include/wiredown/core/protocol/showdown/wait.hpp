#pragma once

#include <string>
#include <string_view>
#include <vector>
#include <chrono>
#include <concepts>
#include <algorithm>
#include <cstdint>

#include "wiredown/core/transport/error.hpp"
#include "wiredown/core/protocol/showdown/frame.hpp"
#include "wiredown/core/protocol/showdown/event.hpp"
#include "wiredown/core/protocol/showdown/classifier.hpp"
#include "wiredown/core/protocol/showdown/schema/request.hpp"
#include "lcr/optional.hpp"
#include "lcr/log/logger.hpp"


namespace wiredown::core::protocol::showdown {

/*
===============================================================================
 Bounded wait engine
===============================================================================

Every wait is a pull loop over one connection:

    receive one frame (per-read timeout = max(100 ms, deadline - now))
      → demux into (room, line)
      → classify lines of the watched room
      → stop on a terminal event class, otherwise accumulate

A read timeout ends the loop without error: callers get whatever was
accumulated so far and decide themselves whether that is a failure.

Accumulated state (WaitResult):
  - latest request snapshot, latest turn, latest |error| text
  - optional ordered event log (raw lines, terminal win/tie included)
  - finished / winner / tie (only when Win or Tie are terminal classes)

Hard failures:
  - WaitError::Decode     a |request| line in the watched room is not JSON
  - WaitError::Transport  the connection failed or was closed by the peer
===============================================================================
*/

using clock = std::chrono::steady_clock;

inline constexpr std::chrono::milliseconds MIN_READ_TIMEOUT{100};

enum class WaitError : std::uint8_t {
    None = 0,
    Timeout,      // a required event never arrived (challstr, battle start)
    Decode,       // malformed |request| payload
    Transport     // connection failure while waiting
};

[[nodiscard]]
inline constexpr std::string_view to_string(WaitError e) noexcept {
    switch (e) {
        case WaitError::None:      return "None";
        case WaitError::Timeout:   return "Timeout";
        case WaitError::Decode:    return "Decode";
        case WaitError::Transport: return "Transport";
        default:                   return "Unknown";
    }
}

// Anything frames can be pulled from (transport::Connection, test doubles)
template<class C>
concept FrameSource =
    requires(C c, std::string& out, std::chrono::milliseconds timeout) {
        { c.receive(out, timeout) } -> std::same_as<transport::Error>;
    };


struct WaitResult {
    lcr::optional<schema::RequestSnapshot> request;
    lcr::optional<std::int64_t> turn;
    lcr::optional<std::string> error;

    // Event-log waits only
    std::vector<std::string> events;
    bool finished{false};
    lcr::optional<std::string> winner;
    bool tie{false};
};

struct BattleInit {
    std::string battle_id;
    lcr::optional<std::string> title;
};


// Terminal classes of the two standard waits
inline constexpr EventMask REQUEST_TERMINAL{EventType::RequestUpdate};
inline constexpr EventMask OUTCOME_TERMINAL{EventType::RequestUpdate, EventType::Win, EventType::Tie};


// -----------------------------------------------------------------------------
// Receive one frame with the remaining budget. Returns false when the loop
// should stop (timeout or failure); `failure` tells which.
// -----------------------------------------------------------------------------
template <FrameSource Conn>
[[nodiscard]]
inline bool receive_before_(Conn& conn, clock::time_point deadline, std::string& frame, WaitError& failure) {
    failure = WaitError::None;
    const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - clock::now());
    const auto timeout = std::max(MIN_READ_TIMEOUT, remaining);
    const transport::Error err = conn.receive(frame, timeout);
    if (err == transport::Error::None) {
        return true;
    }
    if (err != transport::Error::Timeout) {
        WD_ERROR("[WAIT] Connection lost while waiting (" << transport::to_string(err) << ")");
        failure = WaitError::Transport;
    }
    return false;
}


// -----------------------------------------------------------------------------
// Primitive: wait on `room` until an event in `terminal` or the deadline.
// -----------------------------------------------------------------------------
template <FrameSource Conn>
[[nodiscard]]
inline WaitError wait_for(Conn& conn, Classifier& classifier, std::string_view room,
                          clock::time_point deadline, EventMask terminal, bool log_events,
                          WaitResult& out) {
    out = WaitResult{};
    std::string frame;
    WaitError failure = WaitError::None;
    while (clock::now() < deadline) {
        if (!receive_before_(conn, deadline, frame, failure)) {
            break;
        }
        for (const RoomLine& rl : demux(frame)) {
            if (rl.room != room) {
                continue;
            }
            Event ev;
            if (classifier.classify(rl, ev) != parser::Result::Parsed) {
                WD_ERROR("[WAIT] Undecodable request in room '" << room << "'");
                return WaitError::Decode;
            }
            const EventType type = type_of(ev);
            WD_TRACE("[WAIT] " << room << " " << to_string(type));

            switch (type) {
                case EventType::RequestUpdate:
                    out.request = std::move(std::get<event::RequestUpdate>(ev).snapshot);
                    break;
                case EventType::TurnAdvance:
                    if (const auto* n = std::get<event::TurnAdvance>(ev).turn.get_if()) {
                        out.turn = *n;
                    }
                    break;
                case EventType::Error:
                    out.error = std::move(std::get<event::Error>(ev).message);
                    break;
                default:
                    break;
            }

            if (terminal.contains(type)) {
                if (type == EventType::Win) {
                    out.finished = true;
                    out.winner = std::move(std::get<event::Win>(ev).winner);
                }
                else if (type == EventType::Tie) {
                    out.finished = true;
                    out.tie = true;
                }
                if (log_events && type != EventType::RequestUpdate) {
                    out.events.emplace_back(rl.line);
                }
                return WaitError::None;
            }
            if (log_events) {
                out.events.emplace_back(rl.line);
            }
        }
    }
    return failure;
}


// Wait for the next |request| of `room`. Never times out: partial results.
template <FrameSource Conn>
[[nodiscard]]
inline WaitError wait_for_request(Conn& conn, Classifier& classifier, std::string_view room,
                                  std::chrono::milliseconds timeout, WaitResult& out) {
    WD_DEBUG("[WAIT] Waiting up to " << timeout.count() << " ms for a request in '" << room << "'");
    return wait_for(conn, classifier, room, clock::now() + timeout, REQUEST_TERMINAL, false, out);
}

// Wait for the consequence of an action: next request, win or tie. Every other
// line of the room is logged in arrival order.
template <FrameSource Conn>
[[nodiscard]]
inline WaitError wait_for_request_with_events(Conn& conn, Classifier& classifier, std::string_view room,
                                              std::chrono::milliseconds timeout, WaitResult& out) {
    WD_DEBUG("[WAIT] Waiting up to " << timeout.count() << " ms for the outcome in '" << room << "'");
    return wait_for(conn, classifier, room, clock::now() + timeout, OUTCOME_TERMINAL, true, out);
}


// -----------------------------------------------------------------------------
// First server message after connect. No overall deadline: each read may idle
// for `idle_timeout`, which stands in for the transport's own liveness.
// -----------------------------------------------------------------------------
template <FrameSource Conn>
[[nodiscard]]
inline WaitError wait_for_challstr(Conn& conn, Classifier& classifier,
                                   std::chrono::milliseconds idle_timeout, event::Challstr& out) {
    std::string frame;
    for (;;) {
        const transport::Error err = conn.receive(frame, idle_timeout);
        if (err == transport::Error::Timeout) {
            WD_ERROR("[WAIT] Server went silent before sending a challenge");
            return WaitError::Timeout;
        }
        if (err != transport::Error::None) {
            WD_ERROR("[WAIT] Connection lost before challenge (" << transport::to_string(err) << ")");
            return WaitError::Transport;
        }
        for (const RoomLine& rl : demux(frame)) {
            if (!rl.room.empty() || line::segment(rl.line, 1) != "challstr") {
                continue;
            }
            Event ev;
            if (classifier.classify(rl, ev) == parser::Result::Parsed && type_of(ev) == EventType::Challstr) {
                out = std::move(std::get<event::Challstr>(ev));
                WD_DEBUG("[WAIT] Challenge received (client id " << out.client_id << ")");
                return WaitError::None;
            }
        }
    }
}


// -----------------------------------------------------------------------------
// Wait for |init|battle in any room. The battle room is the room of that line.
// Returns as soon as the room's |title| is seen, or at the end of the frame
// that carried the init (title unset). Timeout if no init before deadline.
// -----------------------------------------------------------------------------
template <FrameSource Conn>
[[nodiscard]]
inline WaitError wait_for_battle_start(Conn& conn, Classifier& classifier,
                                       std::chrono::milliseconds timeout, BattleInit& out) {
    out = BattleInit{};
    const auto deadline = clock::now() + timeout;
    std::string frame;
    WaitError failure = WaitError::None;
    lcr::optional<std::string> battle_id;

    while (clock::now() < deadline) {
        if (!receive_before_(conn, deadline, frame, failure)) {
            break;
        }
        for (const RoomLine& rl : demux(frame)) {
            const std::string_view command = line::segment(rl.line, 1);
            if (command != "init" && command != "title") {
                continue;
            }
            Event ev;
            if (classifier.classify(rl, ev) != parser::Result::Parsed) {
                continue;
            }
            const EventType type = type_of(ev);
            if (type == EventType::Init && !rl.room.empty()) {
                battle_id = std::string(rl.room);
                WD_INFO("[WAIT] Battle started: " << rl.room);
            }
            else if (type == EventType::Title && battle_id.has() && rl.room == battle_id.value()) {
                out.battle_id = battle_id.value();
                out.title = std::move(std::get<event::Title>(ev).text);
                return WaitError::None;
            }
        }
        if (battle_id.has()) {
            out.battle_id = battle_id.value();
            return WaitError::None;
        }
    }
    if (failure != WaitError::None) {
        return failure;
    }
    WD_ERROR("[WAIT] Timed out waiting for battle to start");
    return WaitError::Timeout;
}

} // namespace wiredown::core::protocol::showdown
