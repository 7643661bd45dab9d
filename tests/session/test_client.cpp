/*
===============================================================================
 session::Client - Unit Tests
===============================================================================

End-to-end operations over MockWebSocket (battle server) and MockHttp (login
server), with a scratch state file and no settle delay.

Covered:
- start: exact command sequence, result fields, state written
- observe: battle id from state, unknown state keys preserved
- act: rqid resolution order, message format, outcome events, finish state
- input errors are reported before any network I/O
- login and wait failures map onto operation errors
- the connection is closed on every exit path
===============================================================================
*/

#include <iostream>
#include <fstream>
#include <string>
#include <filesystem>

#include "wiredown/session/client.hpp"
#include "common/mock_websocket.hpp"
#include "common/mock_http.hpp"
#include "common/test_check.hpp"

using namespace wiredown;
using namespace wiredown::session;
using namespace std::chrono_literals;
namespace fs = std::filesystem;

using core::transport::test::MockWebSocket;
using core::transport::test::MockHttp;
using TestClient = Client<MockWebSocket, MockHttp>;

static constexpr std::string_view BATTLE = "battle-gen9randombattle-1";
static constexpr std::string_view REQUEST_5 =
    R"({"active":[{"moves":[{"move":"Tackle","id":"tackle","pp":20,"maxpp":20,"target":"normal"}]}],"side":{"pokemon":[{"ident":"p1: A","details":"A","condition":"100/100","active":true}]},"rqid":5})";


static Config test_config(const std::string& name) {
    const fs::path dir = fs::temp_directory_path() / "wiredown_test_client" / name;
    std::error_code ec;
    fs::remove_all(dir, ec);

    Config cfg;
    cfg.websocket_uri = "ws://localhost:8000/showdown/websocket";
    cfg.username = "Alice";
    cfg.state_path = dir / "state.json";
    cfg.settle_delay = 0ms;
    cfg.challstr_idle_timeout = 1000ms;
    return cfg;
}

static void seed_state(const Config& cfg, const std::string& json) {
    fs::create_directories(cfg.state_path.parent_path());
    std::ofstream f(cfg.state_path, std::ios::binary | std::ios::trunc);
    f << json;
}

static void script_login() {
    MockWebSocket::reset();
    MockWebSocket::push_frame("|updateuser| Guest 12|0|170|{}\n|challstr|4|abcdef");
}

static std::string battle_frame(std::string_view body) {
    return ">" + std::string(BATTLE) + "\n" + std::string(body);
}


void test_start() {
    std::cout << "[TEST] Client: start\n";

    const Config cfg = test_config("start");
    seed_state(cfg, R"({"finished":true,"winner":"Bob","custom":[1]})");
    script_login();
    MockWebSocket::push_frame("|updatesearch|{\"searching\":[\"gen9randombattle\"],\"games\":null}");
    MockWebSocket::push_frame(battle_frame("|init|battle\n|title|Alice vs. Bob\n|j|Alice"));
    MockWebSocket::push_frame(battle_frame("|request|" + std::string(REQUEST_5)));

    TestClient client(cfg);
    StartParams params;
    params.format = "gen9randombattle";
    StartResult result;
    const Error err = client.start(params, result);
    TEST_CHECK(err.ok());

    const auto& sent = MockWebSocket::sent();
    TEST_CHECK(sent.size() == 4);
    TEST_CHECK(sent[0] == "|/trn Alice,0,assertion-token");
    TEST_CHECK(sent[1] == "|/utm None");
    TEST_CHECK(sent[2] == "|/search gen9randombattle");
    TEST_CHECK(sent[3] == "battle-gen9randombattle-1|/timer on");

    TEST_CHECK(client.http().requests.size() == 1);
    TEST_CHECK(client.http().requests[0].body == "act=getassertion&userid=Alice&challstr=4%7Cabcdef");

    TEST_CHECK(result.battle_id == BATTLE);
    TEST_CHECK(result.title.value() == "Alice vs. Bob");
    TEST_CHECK(result.rqid.value() == 5);
    TEST_CHECK(!result.turn.has());
    TEST_CHECK(result.request.value().raw == REQUEST_5);
    TEST_CHECK(result.options.moves.size() == 1);
    TEST_CHECK(result.options.moves[0].slot == 1);
    TEST_CHECK(result.options.moves[0].id.value() == "tackle");
    TEST_CHECK(result.options.switches.empty());
    TEST_CHECK(result.state_path == cfg.state_path.string());

    TEST_CHECK(!MockWebSocket::is_connected());
    TEST_CHECK(MockWebSocket::close_count() == 1);

    const StateDocument state = StateDocument::load(cfg.state_path);
    TEST_CHECK(state.get_string("battle_id").value() == BATTLE);
    TEST_CHECK(state.get_int("rqid").value() == 5);
    TEST_CHECK(state.raw("request").value() == REQUEST_5);
    TEST_CHECK(state.raw("finished").value() == "false");
    TEST_CHECK(state.raw("winner").value() == "null");
    TEST_CHECK(state.raw("tie").value() == "false");
    TEST_CHECK(state.raw("turn").value() == "null");
    TEST_CHECK(state.raw("custom").value() == "[1]");
    TEST_CHECK(state.get_string("ps_username").value() == "Alice");
    TEST_CHECK(state.raw("ps_password").value() == "null");
    TEST_CHECK(state.get_string("websocket_uri").value() == cfg.websocket_uri);
    TEST_CHECK(state.has("updated_at"));

    std::cout << "[TEST] OK\n";
}

void test_start_with_team_and_timeout() {
    std::cout << "[TEST] Client: start with team, battle never starts\n";

    const Config cfg = test_config("start_timeout");
    script_login();

    TestClient client(cfg);
    StartParams params;
    params.format = "gen9ou";
    params.team = std::string("Pikachu||LightBall|Static|thunderbolt|Timid|||||");
    params.start_timeout = 200ms;
    StartResult result;
    const Error err = client.start(params, result);
    TEST_CHECK(err.code == ErrorCode::Timeout);
    TEST_CHECK(err.message == "Timed out waiting for battle to start");
    TEST_CHECK(MockWebSocket::sent()[1] == "|/utm Pikachu||LightBall|Static|thunderbolt|Timid|||||");
    TEST_CHECK(MockWebSocket::close_count() == 1);
    TEST_CHECK(!fs::exists(cfg.state_path));

    StartParams blank;
    MockWebSocket::reset();
    TEST_CHECK(client.start(blank, result).code == ErrorCode::Configuration);
    TEST_CHECK(MockWebSocket::connect_count() == 0);

    std::cout << "[TEST] OK\n";
}

void test_observe() {
    std::cout << "[TEST] Client: observe\n";

    const Config cfg = test_config("observe");
    seed_state(cfg, R"({"battle_id":"battle-gen9randombattle-1","other_tool":{"k":"v"}})");
    script_login();
    MockWebSocket::push_frame(battle_frame("|turn|4\n|error|[Unavailable choice] Can't move"));
    MockWebSocket::push_frame(battle_frame("|request|{\"wait\":true,\"rqid\":9}"));

    TestClient client(cfg);
    ObserveResult result;
    TEST_CHECK(client.observe(ObserveParams{}, result).ok());

    TEST_CHECK(MockWebSocket::sent().size() == 2);
    TEST_CHECK(MockWebSocket::sent()[1] == "|/join battle-gen9randombattle-1");
    TEST_CHECK(result.battle_id == BATTLE);
    TEST_CHECK(result.turn.value() == 4);
    TEST_CHECK(result.error.value() == "[Unavailable choice] Can't move");
    TEST_CHECK(result.rqid.value() == 9);
    TEST_CHECK(result.options.wait);
    TEST_CHECK(result.options.moves.empty());

    TEST_CHECK(to_json(result) ==
        R"({"battle_id":"battle-gen9randombattle-1","turn":4,"error":"[Unavailable choice] Can't move","rqid":9,)"
        R"("request":{"wait":true,"rqid":9},)"
        R"("options":{"moves":[],"switches":[],"can_terastallize":null,"trapped":false,"force_switch":false,"wait":true},)"
        R"("state_path":")" + cfg.state_path.string() + R"("})");

    const StateDocument state = StateDocument::load(cfg.state_path);
    TEST_CHECK(state.get_int("rqid").value() == 9);
    TEST_CHECK(state.get_int("turn").value() == 4);
    TEST_CHECK(state.raw("other_tool").value() == R"({"k":"v"})");
    TEST_CHECK(!state.has("finished"));

    std::cout << "[TEST] OK\n";
}

void test_observe_without_request() {
    std::cout << "[TEST] Client: observe with nothing to report\n";

    const Config cfg = test_config("observe_empty");
    script_login();

    TestClient client(cfg);
    ObserveParams params;
    params.battle_id = std::string("battle-x-7");
    params.timeout = 200ms;
    ObserveResult result;
    TEST_CHECK(client.observe(params, result).ok());
    TEST_CHECK(!result.request.has());
    TEST_CHECK(!result.rqid.has());
    TEST_CHECK(result.options == core::protocol::showdown::schema::OptionsView{});

    const StateDocument state = StateDocument::load(cfg.state_path);
    TEST_CHECK(state.get_string("battle_id").value() == "battle-x-7");
    TEST_CHECK(state.raw("request").value() == "null");
    TEST_CHECK(state.raw("rqid").value() == "null");

    std::cout << "[TEST] OK\n";
}

void test_act_with_refresh() {
    std::cout << "[TEST] Client: act with refreshed rqid\n";

    const Config cfg = test_config("act_refresh");
    seed_state(cfg, R"({"battle_id":"battle-gen9randombattle-1","rqid":2})");
    script_login();
    MockWebSocket::push_frame(battle_frame("|request|" + std::string(REQUEST_5)));
    MockWebSocket::push_frame(battle_frame("|\n|move|p1a: A|Tackle|p2a: B\n|-damage|p2a: B|0 fnt\n|faint|p2a: B"));
    MockWebSocket::push_frame(battle_frame("|win|Alice"));

    TestClient client(cfg);
    ActParams params;
    params.choice = "  move 1 ";
    params.rqid = std::int64_t{3};
    ActResult result;
    TEST_CHECK(client.act(params, result).ok());

    TEST_CHECK(MockWebSocket::sent().size() == 3);
    TEST_CHECK(MockWebSocket::sent()[2] == "battle-gen9randombattle-1|/choose move 1|5");
    TEST_CHECK(result.sent == "/choose move 1");
    TEST_CHECK(result.rqid == 5);
    TEST_CHECK(result.finished);
    TEST_CHECK(result.winner.value() == "Alice");
    TEST_CHECK(!result.tie);
    TEST_CHECK(result.events.size() == 5);
    TEST_CHECK(result.events[0] == "|");
    TEST_CHECK(result.events.back() == "|win|Alice");
    TEST_CHECK(!result.request.has());

    const StateDocument state = StateDocument::load(cfg.state_path);
    TEST_CHECK(state.get_int("rqid").value() == 5);
    TEST_CHECK(state.raw("finished").value() == "true");
    TEST_CHECK(state.get_string("winner").value() == "Alice");
    TEST_CHECK(state.raw("request").value() == REQUEST_5);     // last request seen
    TEST_CHECK(MockWebSocket::close_count() == 1);

    std::cout << "[TEST] OK\n";
}

void test_act_rqid_fallbacks() {
    std::cout << "[TEST] Client: act rqid fallbacks\n";

    // No refresh: explicit rqid beats persisted
    {
        const Config cfg = test_config("act_explicit");
        seed_state(cfg, R"({"battle_id":"battle-gen9randombattle-1","rqid":2})");
        script_login();
        MockWebSocket::push_frame(battle_frame("|request|{\"rqid\":4}"));

        TestClient client(cfg);
        ActParams params;
        params.choice = "/choose switch 2";
        params.rqid = std::int64_t{3};
        params.refresh = false;
        ActResult result;
        TEST_CHECK(client.act(params, result).ok());
        TEST_CHECK(MockWebSocket::sent()[2] == "battle-gen9randombattle-1|/choose switch 2|3");
        TEST_CHECK(result.request.value().rqid.value() == 4);
        TEST_CHECK(StateDocument::load(cfg.state_path).get_int("rqid").value() == 4);
    }
    // No refresh, no explicit rqid: persisted rqid
    {
        const Config cfg = test_config("act_persisted");
        seed_state(cfg, R"({"battle_id":"battle-gen9randombattle-1","rqid":12})");
        script_login();

        TestClient client(cfg);
        ActParams params;
        params.choice = "move 2";
        params.refresh = false;
        params.post_timeout = 150ms;
        ActResult result;
        TEST_CHECK(client.act(params, result).ok());
        TEST_CHECK(MockWebSocket::sent()[2] == "battle-gen9randombattle-1|/choose move 2|12");
        TEST_CHECK(result.rqid == 12);
        TEST_CHECK(result.events.empty());
        TEST_CHECK(!result.finished);
        TEST_CHECK(StateDocument::load(cfg.state_path).get_int("rqid").value() == 12);
    }
    // Refresh finds nothing: the persisted rqid is not trusted
    {
        const Config cfg = test_config("act_refresh_stale");
        seed_state(cfg, R"({"battle_id":"battle-gen9randombattle-1","rqid":12})");
        script_login();

        TestClient client(cfg);
        ActParams params;
        params.choice = "move 2";
        params.timeout = 150ms;
        params.post_timeout = 150ms;
        ActResult result;
        const Error err = client.act(params, result);
        TEST_CHECK(err.code == ErrorCode::Timeout);
        TEST_CHECK(err.message == "rqid is required (or use refresh polling)");
        TEST_CHECK(MockWebSocket::sent().size() == 2);            // no /choose
        TEST_CHECK(MockWebSocket::close_count() == 1);
        TEST_CHECK(StateDocument::load(cfg.state_path).get_int("rqid").value() == 12);
    }
    // Refresh finds nothing: explicit rqid
    {
        const Config cfg = test_config("act_refresh_explicit");
        seed_state(cfg, R"({"battle_id":"battle-gen9randombattle-1","rqid":12})");
        script_login();

        TestClient client(cfg);
        ActParams params;
        params.choice = "move 3";
        params.rqid = std::int64_t{11};
        params.timeout = 150ms;
        params.post_timeout = 150ms;
        ActResult result;
        TEST_CHECK(client.act(params, result).ok());
        TEST_CHECK(MockWebSocket::sent()[2] == "battle-gen9randombattle-1|/choose move 3|11");
        TEST_CHECK(result.rqid == 11);
        TEST_CHECK(StateDocument::load(cfg.state_path).get_int("rqid").value() == 11);
    }
    // Refreshed request without rqid overrides the explicit one
    {
        const Config cfg = test_config("act_refresh_no_rqid");
        script_login();
        MockWebSocket::push_frame(battle_frame("|request|{\"wait\":true}"));

        TestClient client(cfg);
        ActParams params;
        params.battle_id = std::string(BATTLE);
        params.choice = "move 1";
        params.rqid = std::int64_t{7};
        params.timeout = 150ms;
        ActResult result;
        TEST_CHECK(client.act(params, result).code == ErrorCode::Timeout);
        TEST_CHECK(MockWebSocket::sent().size() == 2);
        TEST_CHECK(MockWebSocket::close_count() == 1);
    }

    std::cout << "[TEST] OK\n";
}

void test_act_without_rqid() {
    std::cout << "[TEST] Client: act without any rqid\n";

    {
        const Config cfg = test_config("act_none_refresh");
        script_login();
        TestClient client(cfg);
        ActParams params;
        params.battle_id = std::string(BATTLE);
        params.choice = "move 1";
        params.timeout = 150ms;
        ActResult result;
        const Error err = client.act(params, result);
        TEST_CHECK(err.code == ErrorCode::Timeout);
        TEST_CHECK(err.message == "rqid is required (or use refresh polling)");
        TEST_CHECK(MockWebSocket::sent().size() == 2);            // no /choose
        TEST_CHECK(MockWebSocket::close_count() == 1);
    }
    {
        const Config cfg = test_config("act_none_norefresh");
        script_login();
        TestClient client(cfg);
        ActParams params;
        params.battle_id = std::string(BATTLE);
        params.choice = "move 1";
        params.refresh = false;
        ActResult result;
        TEST_CHECK(client.act(params, result).code == ErrorCode::Configuration);
        TEST_CHECK(MockWebSocket::close_count() == 1);
    }

    std::cout << "[TEST] OK\n";
}

void test_errors_before_network() {
    std::cout << "[TEST] Client: input errors before network I/O\n";

    const Config cfg = test_config("preflight");
    MockWebSocket::reset();
    TestClient client(cfg);

    ActParams blank;
    blank.battle_id = std::string(BATTLE);
    blank.choice = "   ";
    ActResult act;
    Error err = client.act(blank, act);
    TEST_CHECK(err.code == ErrorCode::Configuration);
    TEST_CHECK(err.message == "choice must be non-empty");
    TEST_CHECK(to_json(err) == R"({"error":"choice must be non-empty"})");

    blank.choice.clear();
    err = client.act(blank, act);
    TEST_CHECK(err.code == ErrorCode::Configuration);
    TEST_CHECK(err.message == "choice must be non-empty");

    ActParams no_battle;
    no_battle.choice = "move 1";
    err = client.act(no_battle, act);
    TEST_CHECK(err.code == ErrorCode::Configuration);
    TEST_CHECK(err.message == "battle_id is required (or provide in state)");

    ObserveResult obs;
    TEST_CHECK(client.observe(ObserveParams{}, obs).code == ErrorCode::Configuration);

    TEST_CHECK(MockWebSocket::connect_count() == 0);
    TEST_CHECK(client.http().requests.empty());

    std::cout << "[TEST] OK\n";
}

void test_login_failures() {
    std::cout << "[TEST] Client: login failures\n";

    // Bad URI
    {
        Config cfg = test_config("bad_uri");
        cfg.websocket_uri = "sim3.psim.us/showdown/websocket";
        MockWebSocket::reset();
        TestClient client(cfg);
        ObserveParams params;
        params.battle_id = std::string(BATTLE);
        ObserveResult result;
        TEST_CHECK(client.observe(params, result).code == ErrorCode::Configuration);
        TEST_CHECK(MockWebSocket::connect_count() == 0);
    }
    // Connect refused
    {
        const Config cfg = test_config("refused");
        MockWebSocket::reset();
        MockWebSocket::set_connect_result(core::transport::Error::ConnectionFailed);
        TestClient client(cfg);
        ObserveParams params;
        params.battle_id = std::string(BATTLE);
        ObserveResult result;
        TEST_CHECK(client.observe(params, result).code == ErrorCode::Transport);
    }
    // Server never sends a challenge
    {
        const Config cfg = test_config("no_challstr");
        MockWebSocket::reset();
        MockWebSocket::push_frame("|updateuser| Guest 12|0|170|{}");
        TestClient client(cfg);
        ObserveParams params;
        params.battle_id = std::string(BATTLE);
        ObserveResult result;
        const Error err = client.observe(params, result);
        TEST_CHECK(err.code == ErrorCode::Timeout);
        TEST_CHECK(err.message == "Timed out waiting for challstr");
        TEST_CHECK(MockWebSocket::close_count() == 1);
    }
    // Name refused by the login server
    {
        const Config cfg = test_config("name_refused");
        script_login();
        TestClient client(cfg);
        client.http().response = {200, ";;Your username is registered"};
        ObserveParams params;
        params.battle_id = std::string(BATTLE);
        ObserveResult result;
        const Error err = client.observe(params, result);
        TEST_CHECK(err.code == ErrorCode::Authentication);
        TEST_CHECK(err.message.find("registered") != std::string::npos);
        TEST_CHECK(MockWebSocket::sent().empty());
        TEST_CHECK(MockWebSocket::close_count() == 1);
        TEST_CHECK(!fs::exists(cfg.state_path));
    }

    std::cout << "[TEST] OK\n";
}

void test_wait_failures() {
    std::cout << "[TEST] Client: decode and transport failures\n";

    {
        const Config cfg = test_config("decode");
        script_login();
        MockWebSocket::push_frame(battle_frame("|request|{\"rqid\":"));
        TestClient client(cfg);
        ObserveParams params;
        params.battle_id = std::string(BATTLE);
        ObserveResult result;
        TEST_CHECK(client.observe(params, result).code == ErrorCode::ProtocolDecode);
        TEST_CHECK(MockWebSocket::close_count() == 1);
    }
    {
        const Config cfg = test_config("dropped");
        script_login();
        MockWebSocket::push_error(core::transport::Error::RemoteClosed);
        TestClient client(cfg);
        ActParams params;
        params.battle_id = std::string(BATTLE);
        params.choice = "move 1";
        ActResult result;
        TEST_CHECK(client.act(params, result).code == ErrorCode::Transport);
        TEST_CHECK(!MockWebSocket::is_connected());
    }

    std::cout << "[TEST] OK\n";
}

void test_error_json() {
    std::cout << "[TEST] Client: error rendering\n";

    TEST_CHECK(to_json(make_error(ErrorCode::Configuration, "battle_id is required (or provide in state)")) ==
               R"json({"error":"battle_id is required (or provide in state)"})json");

    std::cout << "[TEST] OK\n";
}

int main() {
    test_start();
    test_start_with_team_and_timeout();
    test_observe();
    test_observe_without_request();
    test_act_with_refresh();
    test_act_rqid_fallbacks();
    test_act_without_rqid();
    test_errors_before_network();
    test_login_failures();
    test_wait_failures();
    test_error_json();

    std::cout << "[TEST] ALL CLIENT TESTS PASSED!\n";
    return 0;
}
