#pragma once

#include <string>
#include <string_view>
#include <iostream>
#include <cstdint>
#include <cstdlib>

#include <CLI/CLI.hpp>

#include "validators.hpp"
#include "wiredown/version.hpp"
#include "wiredown/session/config.hpp"
#include "wiredown/session/state.hpp"
#include "lcr/optional.hpp"
#include "lcr/log/logger.hpp"


namespace wiredown::cli {

enum class Command {
    Start,
    Poll,
    Choose
};

struct Params {
    Command command{Command::Start};

    // Global options
    lcr::optional<std::string> websocket_uri;
    lcr::optional<std::string> ps_username;
    lcr::optional<std::string> ps_password;
    lcr::optional<std::string> login_server;
    std::string state_path{session::DEFAULT_STATE_PATH};
    std::string log_level = "warn";

    // start
    std::string pokemon_format;
    lcr::optional<std::string> team;
    int start_timeout_s   = 60;
    int request_timeout_s = 30;

    // poll / choose
    lcr::optional<std::string> battle_id;
    int poll_timeout_s = 30;

    // choose
    std::string choice;
    lcr::optional<std::int64_t> rqid;
    int choose_timeout_s = 15;
    bool no_refresh      = false;
    int post_timeout_s   = 30;

    [[nodiscard]]
    inline session::Overrides overrides() const {
        session::Overrides o;
        o.websocket_uri = websocket_uri;
        o.username = ps_username;
        o.password = ps_password;
        o.login_server = login_server;
        o.state_path = state_path;
        return o;
    }
};


namespace detail {

// Copy a parsed option into an lcr::optional when it was given
template <typename T>
inline void assign_if_given(const CLI::Option* opt, const T& value, lcr::optional<T>& out) {
    if (opt->count() > 0) {
        out = value;
    }
}

} // namespace detail


[[nodiscard]]
inline Params configure(int argc, char** argv) {
    CLI::App app{"Stateless Pokemon Showdown battle client"};
    app.set_version_flag("--version", std::string(WD_VERSION_STRING));
    Params params{};

    std::string websocket_uri, ps_username, ps_password, login_server;
    auto* uri_opt  = app.add_option("--websocket-uri", websocket_uri, "Battle server, e.g. wss://sim3.psim.us/showdown/websocket")->check(ws_url_validator);
    auto* user_opt = app.add_option("--ps-username", ps_username, "Showdown user name");
    auto* pass_opt = app.add_option("--ps-password", ps_password, "Password (omit for guest login)");
    auto* login_opt = app.add_option("--login-server", login_server, "Login server base URL")
                        ->check(http_url_validator)->default_str(std::string(core::auth::DEFAULT_LOGIN_SERVER));
    app.add_option("--state-path", params.state_path, "Path to persist battle_id/rqid/credentials")->default_val(params.state_path);
    app.add_option("-l,--log-level", params.log_level, "Log level: trace | debug | info | warn | error")
        ->check(log_level_validator)->default_val(params.log_level);

    // start ------------------------------------------------------------------
    auto* start = app.add_subcommand("start", "Start a ladder battle");
    std::string team;
    start->add_option("--pokemon-format", params.pokemon_format, "Battle format, e.g. gen9randombattle")->required();
    auto* team_opt = start->add_option("--team", team, "Packed team or 'None'");
    start->add_option("--timeout-s", params.start_timeout_s, "How long to wait for the battle to start")
        ->check(CLI::NonNegativeNumber)->default_val(params.start_timeout_s);
    start->add_option("--request-timeout-s", params.request_timeout_s, "How long to wait for the first request after battle start")
        ->check(CLI::NonNegativeNumber)->default_val(params.request_timeout_s);

    // poll -------------------------------------------------------------------
    auto* poll = app.add_subcommand("poll", "Poll current battle request");
    std::string poll_battle_id;
    auto* poll_battle_opt = poll->add_option("--battle-id", poll_battle_id, "Battle room (default: from state)");
    poll->add_option("--timeout-s", params.poll_timeout_s, "How long to wait for a request")
        ->check(CLI::NonNegativeNumber)->default_val(params.poll_timeout_s);

    // choose -----------------------------------------------------------------
    auto* choose = app.add_subcommand("choose", "Submit a battle choice");
    std::string choose_battle_id;
    std::int64_t rqid = 0;
    auto* choose_battle_opt = choose->add_option("--battle-id", choose_battle_id, "Battle room (default: from state)");
    choose->add_option("--choice", params.choice, "e.g. 'move 1', 'switch 2', 'move 1 terastallize'")
        ->required();
    auto* rqid_opt = choose->add_option("--rqid", rqid, "Request id. If omitted, the client polls for it.");
    choose->add_option("--timeout-s", params.choose_timeout_s, "How long to poll for the current request")
        ->check(CLI::NonNegativeNumber)->default_val(params.choose_timeout_s);
    choose->add_flag("--no-refresh", params.no_refresh, "Skip polling for the latest request before sending /choose");
    choose->add_option("--post-timeout-s", params.post_timeout_s, "How long to wait for the next request after submitting a choice")
        ->check(CLI::NonNegativeNumber)->default_val(params.post_timeout_s);

    app.require_subcommand(1);
    app.footer(
        "Each command opens one connection, logs in, performs one bounded\n"
        "interaction and prints a single JSON record on stdout."
    );

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        std::exit(app.exit(e, std::cout, std::cerr));
    }

    detail::assign_if_given(uri_opt, websocket_uri, params.websocket_uri);
    detail::assign_if_given(user_opt, ps_username, params.ps_username);
    detail::assign_if_given(pass_opt, ps_password, params.ps_password);
    detail::assign_if_given(login_opt, login_server, params.login_server);

    if (start->parsed()) {
        params.command = Command::Start;
        detail::assign_if_given(team_opt, team, params.team);
    }
    else if (poll->parsed()) {
        params.command = Command::Poll;
        detail::assign_if_given(poll_battle_opt, poll_battle_id, params.battle_id);
    }
    else {
        params.command = Command::Choose;
        detail::assign_if_given(choose_battle_opt, choose_battle_id, params.battle_id);
        detail::assign_if_given(rqid_opt, rqid, params.rqid);
    }

    lcr::log::Logger::instance().set_level(params.log_level);
    return params;
}

} // namespace wiredown::cli
