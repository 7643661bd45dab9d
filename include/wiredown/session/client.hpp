#pragma once

#include <string>
#include <string_view>
#include <chrono>
#include <thread>
#include <utility>
#include <cstdint>

#include "wiredown/error.hpp"
#include "wiredown/core/transport/websocket_concept.hpp"
#include "wiredown/core/transport/http_concept.hpp"
#include "wiredown/core/transport/connection.hpp"
#include "wiredown/core/auth/login.hpp"
#include "wiredown/core/protocol/showdown/classifier.hpp"
#include "wiredown/core/protocol/showdown/command.hpp"
#include "wiredown/core/protocol/showdown/options.hpp"
#include "wiredown/core/protocol/showdown/wait.hpp"
#include "wiredown/session/config.hpp"
#include "wiredown/session/state.hpp"
#include "wiredown/session/result.hpp"
#include "lcr/optional.hpp"
#include "lcr/log/logger.hpp"


namespace wiredown::session {

/*
===============================================================================
 wiredown::session::Client
===============================================================================

Stateless battle client. Each operation is one complete interaction:

    open connection → wait for challenge → log in (/trn)
      → protocol steps → merge outcome into the state file → close

  start()    search a ladder battle and wait for its first request
  observe()  join a battle and report its latest request
  act()      join a battle, submit a /choose and report what happened next

Nothing survives between operations except the state file. The connection is
a scoped resource: it is closed on every exit path, failures included.

Template parameters:
  WS    transport::WebSocketConcept  (battle server)
  Http  transport::HttpConcept       (login server)
===============================================================================
*/

namespace showdown = core::protocol::showdown;

struct StartParams {
    std::string format;
    lcr::optional<std::string> team;                     // unset → "/utm None"
    std::chrono::milliseconds start_timeout{60000};
    std::chrono::milliseconds request_timeout{30000};
};

struct ObserveParams {
    lcr::optional<std::string> battle_id;                // unset → state
    std::chrono::milliseconds timeout{30000};
};

struct ActParams {
    lcr::optional<std::string> battle_id;                // unset → state
    std::string choice;                                  // "move 1", "switch 3", "/choose move 2 terastallize"
    lcr::optional<std::int64_t> rqid;
    bool refresh{true};
    std::chrono::milliseconds timeout{15000};
    std::chrono::milliseconds post_timeout{30000};
};


template <core::transport::WebSocketConcept WS, core::transport::HttpConcept Http>
class Client {
    using Connection = core::transport::Connection<WS>;

public:
    explicit Client(Config config)
        : config_(std::move(config))
    {}

    Client(const Client&) = delete;
    Client& operator=(const Client&) = delete;

    [[nodiscard]]
    inline const Config& config() const noexcept {
        return config_;
    }

    // -------------------------------------------------------------------------
    // start: /utm, /search, wait for the battle room, /timer on, first request
    // -------------------------------------------------------------------------
    [[nodiscard]]
    inline Error start(const StartParams& params, StartResult& out) {
        out = StartResult{};
        if (params.format.empty()) {
            return make_error(ErrorCode::Configuration, "pokemon_format is required");
        }

        Connection conn;
        Error error = open_and_login_(conn);
        if (!error.ok()) {
            return error;
        }
        error = send_(conn, "", showdown::command::utm(params.team));
        if (!error.ok()) {
            return error;
        }
        error = send_(conn, "", showdown::command::search(params.format));
        if (!error.ok()) {
            return error;
        }
        WD_INFO("[CLIENT] Searching for a " << params.format << " battle ...");

        showdown::BattleInit init;
        error = map_wait_(showdown::wait_for_battle_start(conn, classifier_, params.start_timeout, init),
                          "Timed out waiting for battle to start");
        if (!error.ok()) {
            return error;
        }
        error = send_(conn, init.battle_id, showdown::command::timer_on());
        if (!error.ok()) {
            return error;
        }

        showdown::WaitResult wait;
        error = map_wait_(showdown::wait_for_request(conn, classifier_, init.battle_id, params.request_timeout, wait), {});
        if (!error.ok()) {
            return error;
        }

        out.battle_id = init.battle_id;
        out.title = init.title;
        out.turn = wait.turn;
        out.rqid = rqid_of(wait.request);
        out.error = wait.error;
        out.request = wait.request;
        out.options = showdown::derive_options(wait.request);
        out.state_path = config_.state_path.string();

        return save_state_([&](StateDocument& state) {
            state.set("battle_id", out.battle_id);
            state.set("rqid", out.rqid);
            state.set("turn", out.turn);
            set_request_(state, out.request);
            // A new battle: forget the outcome of the previous one
            state.set("finished", false);
            state.set_null("winner");
            state.set("tie", false);
        });
    }

    // -------------------------------------------------------------------------
    // observe: /join, latest request
    // -------------------------------------------------------------------------
    [[nodiscard]]
    inline Error observe(const ObserveParams& params, ObserveResult& out) {
        out = ObserveResult{};
        std::string battle_id;
        Error error = resolve_battle_id_(params.battle_id, battle_id);
        if (!error.ok()) {
            return error;
        }

        Connection conn;
        error = open_and_login_(conn);
        if (!error.ok()) {
            return error;
        }
        error = send_(conn, "", showdown::command::join(battle_id));
        if (!error.ok()) {
            return error;
        }

        showdown::WaitResult wait;
        error = map_wait_(showdown::wait_for_request(conn, classifier_, battle_id, params.timeout, wait), {});
        if (!error.ok()) {
            return error;
        }

        out.battle_id = battle_id;
        out.turn = wait.turn;
        out.error = wait.error;
        out.rqid = rqid_of(wait.request);
        out.request = wait.request;
        out.options = showdown::derive_options(wait.request);
        out.state_path = config_.state_path.string();

        return save_state_([&](StateDocument& state) {
            state.set("battle_id", out.battle_id);
            state.set("rqid", out.rqid);
            state.set("turn", out.turn);
            set_request_(state, out.request);
        });
    }

    // -------------------------------------------------------------------------
    // act: /join, optional refresh, /choose <action>|<rqid>, outcome
    // -------------------------------------------------------------------------
    [[nodiscard]]
    inline Error act(const ActParams& params, ActResult& out) {
        out = ActResult{};
        std::string payload;
        if (!showdown::command::normalize_choice(params.choice, payload)) {
            return make_error(ErrorCode::Configuration, "choice must be non-empty");
        }
        std::string battle_id;
        Error error = resolve_battle_id_(params.battle_id, battle_id);
        if (!error.ok()) {
            return error;
        }

        Connection conn;
        error = open_and_login_(conn);
        if (!error.ok()) {
            return error;
        }
        error = send_(conn, "", showdown::command::join(battle_id));
        if (!error.ok()) {
            return error;
        }

        // 1) Resolve the request id the action answers
        showdown::WaitResult refreshed;
        if (params.refresh) {
            error = map_wait_(showdown::wait_for_request(conn, classifier_, battle_id, params.timeout, refreshed), {});
            if (!error.ok()) {
                return error;
            }
        }
        // A refreshed request is authoritative, even when it carries no rqid.
        // The persisted rqid is only trusted when no refresh was attempted.
        lcr::optional<std::int64_t> rqid = params.rqid;
        if (params.refresh) {
            if (refreshed.request.has()) {
                rqid = rqid_of(refreshed.request);
            }
        }
        else if (!rqid.has()) {
            rqid = StateDocument::load(config_.state_path).get_int("rqid");
        }
        if (!rqid.has()) {
            return make_error(params.refresh ? ErrorCode::Timeout : ErrorCode::Configuration,
                              "rqid is required (or use refresh polling)");
        }

        // 2) Submit
        error = send_(conn, battle_id, payload, std::to_string(rqid.value()));
        if (!error.ok()) {
            return error;
        }
        WD_INFO("[CLIENT] Sent '" << payload << "' for rqid " << rqid.value());

        // 3) Observe the consequence
        showdown::WaitResult next;
        error = map_wait_(showdown::wait_for_request_with_events(conn, classifier_, battle_id, params.post_timeout, next), {});
        if (!error.ok()) {
            return error;
        }

        out.battle_id = battle_id;
        out.sent = payload;
        out.rqid = rqid.value();
        out.error = next.error.has() ? next.error : refreshed.error;
        out.turn = next.turn;
        out.request = next.request;
        out.options = showdown::derive_options(next.request);
        out.events = std::move(next.events);
        out.finished = next.finished;
        out.winner = next.winner;
        out.tie = next.tie;
        out.state_path = config_.state_path.string();

        const lcr::optional<std::int64_t> next_rqid = rqid_of(next.request);
        return save_state_([&](StateDocument& state) {
            state.set("battle_id", out.battle_id);
            state.set("rqid", next_rqid.has() ? next_rqid.value() : out.rqid);
            state.set("turn", next.turn.has() ? next.turn : refreshed.turn);
            set_request_(state, next.request.has() ? next.request : refreshed.request);
            state.set("finished", out.finished);
            state.set("winner", out.winner);
            state.set("tie", out.tie);
        });
    }

#ifdef WD_UNIT_TEST
public:
    Http& http() {
        return http_;
    }
#endif // WD_UNIT_TEST

private:
    Config config_;
    Http http_;
    showdown::Classifier classifier_;

    // Connect, answer the challenge and rename to the configured user
    [[nodiscard]]
    inline Error open_and_login_(Connection& conn) {
        const auto terr = conn.open(config_.websocket_uri);
        if (terr == core::transport::Error::InvalidUrl) {
            return make_error(ErrorCode::Configuration, "websocket_uri is not a valid ws:// or wss:// URL: " + config_.websocket_uri);
        }
        if (terr != core::transport::Error::None) {
            return make_error(ErrorCode::Transport, "Could not connect to " + config_.websocket_uri +
                                                    " (" + std::string(core::transport::to_string(terr)) + ")");
        }

        showdown::event::Challstr challstr;
        Error error = map_wait_(showdown::wait_for_challstr(conn, classifier_, config_.challstr_idle_timeout, challstr),
                                "Timed out waiting for challstr");
        if (!error.ok()) {
            return error;
        }

        core::auth::Assertion assertion;
        std::string detail;
        const auto aerr = core::auth::get_assertion(http_, config_.login_server, config_.credentials(),
                                                    challstr.challenge(), config_.login_timeout, assertion, detail);
        if (aerr != core::auth::Error::None) {
            return make_error(ErrorCode::Authentication, detail);
        }

        error = send_(conn, "", showdown::command::trn(config_.username, assertion.assertion));
        if (!error.ok()) {
            return error;
        }
        if (config_.settle_delay.count() > 0) {
            std::this_thread::sleep_for(config_.settle_delay);
        }
        WD_INFO("[CLIENT] Logged in as '" << assertion.userid << "'");
        return Error{};
    }

    template <typename... Parts>
    [[nodiscard]]
    inline Error send_(Connection& conn, std::string_view room, const Parts&... parts) {
        if (!conn.send(showdown::command::message(room, {std::string_view(parts)...}))) {
            return make_error(ErrorCode::Transport, "Connection to battle server lost while sending");
        }
        return Error{};
    }

    [[nodiscard]]
    inline Error resolve_battle_id_(const lcr::optional<std::string>& explicit_id, std::string& out) const {
        if (explicit_id.has() && !explicit_id.value().empty()) {
            out = explicit_id.value();
        }
        else {
            out = StateDocument::load(config_.state_path).get_string("battle_id").value_or(std::string{});
        }
        if (out.empty()) {
            return make_error(ErrorCode::Configuration, "battle_id is required (or provide in state)");
        }
        return Error{};
    }

    [[nodiscard]]
    static inline Error map_wait_(showdown::WaitError e, std::string_view timeout_message) {
        switch (e) {
            case showdown::WaitError::None:
                return Error{};
            case showdown::WaitError::Timeout:
                return make_error(ErrorCode::Timeout, std::string(timeout_message));
            case showdown::WaitError::Decode:
                return make_error(ErrorCode::ProtocolDecode, "Malformed request payload from server");
            case showdown::WaitError::Transport:
            default:
                return make_error(ErrorCode::Transport, "Connection to battle server lost");
        }
    }

    static inline void set_request_(StateDocument& state, const lcr::optional<showdown::schema::RequestSnapshot>& request) {
        if (const auto* r = request.get_if()) {
            state.set_raw("request", r->raw);
        }
        else {
            state.set_null("request");
        }
    }

    // Read-modify-write of the state file: identity keys, the operation's own
    // keys, then updated_at
    template <typename F>
    [[nodiscard]]
    inline Error save_state_(F&& update) {
        StateDocument state = StateDocument::load(config_.state_path);
        state.set("websocket_uri", config_.websocket_uri);
        state.set("ps_username", config_.username);
        state.set("ps_password", config_.password);
        update(state);
        const auto now = std::chrono::system_clock::now().time_since_epoch();
        state.set("updated_at", std::chrono::duration<double>(now).count());

        std::string detail;
        if (!state.save(config_.state_path, detail)) {
            return make_error(ErrorCode::Configuration, "Could not write state file: " + detail);
        }
        return Error{};
    }
};

} // namespace wiredown::session
