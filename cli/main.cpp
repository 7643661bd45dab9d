#include <iostream>
#include <chrono>
#include <exception>
#include <utility>

#include "params.hpp"
#include "wiredown/error.hpp"
#include "wiredown/session/client.hpp"
#include "wiredown/session/config.hpp"
#include "wiredown/session/result.hpp"
#include "wiredown/session/state.hpp"
#include "wiredown/core/transport/beast/websocket.hpp"
#include "wiredown/core/transport/beast/https.hpp"
#include "lcr/log/logger.hpp"


using namespace wiredown;

using WS   = core::transport::beast::WebSocket;
using Http = core::transport::beast::HttpClient;

namespace {

int fail(const Error& error) {
    WD_ERROR("[CLI] " << to_string(error.code) << ": " << error.message);
    std::cout << session::to_json(error) << std::endl;
    return 1;
}

template <typename R>
int succeed(const R& result) {
    std::cout << session::to_json(result) << std::endl;
    return 0;
}

int run(const cli::Params& params) {
    using std::chrono::seconds;

    const auto state = session::StateDocument::load(session::expand_user(params.state_path));
    session::Config config;
    Error error = session::resolve_config(params.overrides(), state, config);
    if (!error.ok()) {
        return fail(error);
    }

    session::Client<WS, Http> client(std::move(config));

    switch (params.command) {
        case cli::Command::Start: {
            session::StartParams p;
            p.format = params.pokemon_format;
            p.team = params.team;
            p.start_timeout = seconds(params.start_timeout_s);
            p.request_timeout = seconds(params.request_timeout_s);
            session::StartResult result;
            error = client.start(p, result);
            return error.ok() ? succeed(result) : fail(error);
        }
        case cli::Command::Poll: {
            session::ObserveParams p;
            p.battle_id = params.battle_id;
            p.timeout = seconds(params.poll_timeout_s);
            session::ObserveResult result;
            error = client.observe(p, result);
            return error.ok() ? succeed(result) : fail(error);
        }
        case cli::Command::Choose: {
            session::ActParams p;
            p.battle_id = params.battle_id;
            p.choice = params.choice;
            p.rqid = params.rqid;
            p.refresh = !params.no_refresh;
            p.timeout = seconds(params.choose_timeout_s);
            p.post_timeout = seconds(params.post_timeout_s);
            session::ActResult result;
            error = client.act(p, result);
            return error.ok() ? succeed(result) : fail(error);
        }
    }
    return fail(make_error(ErrorCode::Configuration, "unknown command"));
}

} // namespace


int main(int argc, char** argv) {
    const cli::Params params = cli::configure(argc, argv);
    try {
        return run(params);
    } catch (const std::exception& e) {
        // Allocation and filesystem failures escaping the library
        return fail(make_error(ErrorCode::Transport, e.what()));
    }
}
