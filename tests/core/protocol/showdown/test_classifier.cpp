/*
===============================================================================
 Event classifier - Unit Tests
===============================================================================

Covered:
- every known command token maps to its event
- argument rejoining for challstr / title / error / request
- non-numeric turns keep the event but drop the number
- unknown commands (and non-protocol text) classify as Other
- malformed request JSON is reported, never silently emptied
- classify() builds strings, so it may throw std::bad_alloc
===============================================================================
*/

#include <iostream>
#include <string>
#include <utility>
#include <variant>

#include "wiredown/core/protocol/showdown/classifier.hpp"
#include "common/test_check.hpp"

using namespace wiredown::core::protocol::showdown;

static_assert(!noexcept(std::declval<Classifier&>().classify(std::string_view{}, std::declval<Event&>())));
static_assert(!noexcept(std::declval<Classifier&>().classify(std::declval<const RoomLine&>(), std::declval<Event&>())));


static Event classify_ok(Classifier& c, std::string_view line) {
    Event ev;
    TEST_CHECK(c.classify(line, ev) == parser::Result::Parsed);
    return ev;
}

void test_segments() {
    std::cout << "[TEST] Classifier: line segmentation\n";

    TEST_CHECK(line::segment("|win|Alice", 0) == "");
    TEST_CHECK(line::segment("|win|Alice", 1) == "win");
    TEST_CHECK(line::segment("|win|Alice", 2) == "Alice");
    TEST_CHECK(line::segment("|win|Alice", 3) == "");
    TEST_CHECK(line::rest("|error|[Invalid choice] Can't move: a|b", 2) == "[Invalid choice] Can't move: a|b");
    TEST_CHECK(line::rest("|tie", 2) == "");

    std::int64_t n = 0;
    TEST_CHECK(line::parse_int("12", n) && n == 12);
    TEST_CHECK(line::parse_int(" 7 ", n) && n == 7);
    TEST_CHECK(line::parse_int("+3", n) && n == 3);
    TEST_CHECK(line::parse_int("-2", n) && n == -2);
    TEST_CHECK(!line::parse_int("", n));
    TEST_CHECK(!line::parse_int("x", n));
    TEST_CHECK(!line::parse_int("3a", n));
    TEST_CHECK(!line::parse_int("+-3", n));

    std::cout << "[TEST] OK\n";
}

void test_challstr() {
    std::cout << "[TEST] Classifier: challstr keeps everything after the client id\n";
    Classifier c;

    Event ev = classify_ok(c, "|challstr|4|314159abcdef");
    TEST_CHECK(type_of(ev) == EventType::Challstr);
    const auto& ch = std::get<event::Challstr>(ev);
    TEST_CHECK(ch.client_id == "4");
    TEST_CHECK(ch.challstr == "314159abcdef");
    TEST_CHECK(ch.challenge() == "4|314159abcdef");

    ev = classify_ok(c, "|challstr|4|abc|def");
    TEST_CHECK(std::get<event::Challstr>(ev).challstr == "abc|def");

    std::cout << "[TEST] OK\n";
}

void test_lifecycle_events() {
    std::cout << "[TEST] Classifier: init / title / win / tie\n";
    Classifier c;

    TEST_CHECK(type_of(classify_ok(c, "|init|battle")) == EventType::Init);
    TEST_CHECK(type_of(classify_ok(c, "|init|chat")) == EventType::Other);

    Event ev = classify_ok(c, "|title|Alice vs. Bob|rematch");
    TEST_CHECK(type_of(ev) == EventType::Title);
    TEST_CHECK(std::get<event::Title>(ev).text == "Alice vs. Bob|rematch");

    ev = classify_ok(c, "|win|Alice");
    TEST_CHECK(type_of(ev) == EventType::Win);
    TEST_CHECK(std::get<event::Win>(ev).winner == "Alice");

    ev = classify_ok(c, "|win|");
    TEST_CHECK(std::get<event::Win>(ev).winner.empty());

    TEST_CHECK(type_of(classify_ok(c, "|tie")) == EventType::Tie);
    TEST_CHECK(type_of(classify_ok(c, "|tie|")) == EventType::Tie);

    std::cout << "[TEST] OK\n";
}

void test_error_and_turn() {
    std::cout << "[TEST] Classifier: error text and turn numbers\n";
    Classifier c;

    Event ev = classify_ok(c, "|error|[Invalid choice] There's nothing to choose");
    TEST_CHECK(type_of(ev) == EventType::Error);
    TEST_CHECK(std::get<event::Error>(ev).message == "[Invalid choice] There's nothing to choose");

    ev = classify_ok(c, "|turn|12");
    TEST_CHECK(type_of(ev) == EventType::TurnAdvance);
    TEST_CHECK(std::get<event::TurnAdvance>(ev).turn.has());
    TEST_CHECK(std::get<event::TurnAdvance>(ev).turn.value() == 12);

    ev = classify_ok(c, "|turn|soon");
    TEST_CHECK(type_of(ev) == EventType::TurnAdvance);
    TEST_CHECK(!std::get<event::TurnAdvance>(ev).turn.has());

    ev = classify_ok(c, "|turn");
    TEST_CHECK(type_of(ev) == EventType::TurnAdvance);
    TEST_CHECK(!std::get<event::TurnAdvance>(ev).turn.has());

    std::cout << "[TEST] OK\n";
}

void test_request() {
    std::cout << "[TEST] Classifier: request payloads\n";
    Classifier c;

    Event ev = classify_ok(c, R"(|request|{"rqid":7,"wait":true})");
    TEST_CHECK(type_of(ev) == EventType::RequestUpdate);
    const auto& snap = std::get<event::RequestUpdate>(ev).snapshot;
    TEST_CHECK(snap.rqid.has() && snap.rqid.value() == 7);
    TEST_CHECK(snap.wait);
    TEST_CHECK(snap.raw == R"({"rqid":7,"wait":true})");

    // Empty payload → empty object
    ev = classify_ok(c, "|request|");
    TEST_CHECK(type_of(ev) == EventType::RequestUpdate);
    TEST_CHECK(std::get<event::RequestUpdate>(ev).snapshot == schema::RequestSnapshot{});
    TEST_CHECK(std::get<event::RequestUpdate>(ev).snapshot.raw == "{}");

    // JSON containing '|' survives rejoining
    ev = classify_ok(c, R"(|request|{"side":{"pokemon":[{"ident":"p1a: A|B","condition":"100/100"}]}})");
    TEST_CHECK(std::get<event::RequestUpdate>(ev).snapshot.pokemon.size() == 1);
    TEST_CHECK(std::get<event::RequestUpdate>(ev).snapshot.pokemon[0].ident.value() == "p1a: A|B");

    std::cout << "[TEST] OK\n";
}

void test_malformed_request_is_fatal() {
    std::cout << "[TEST] Classifier: malformed request JSON is reported\n";
    Classifier c;

    Event ev;
    TEST_CHECK(c.classify("|request|{\"rqid\":", ev) == parser::Result::InvalidJson);
    TEST_CHECK(type_of(ev) == EventType::Other);

    // The classifier stays usable afterwards
    ev = classify_ok(c, R"(|request|{"rqid":1})");
    TEST_CHECK(std::get<event::RequestUpdate>(ev).snapshot.rqid.value() == 1);

    std::cout << "[TEST] OK\n";
}

void test_other_is_total() {
    std::cout << "[TEST] Classifier: unknown lines classify as Other\n";
    Classifier c;

    const char* lines[] = {
        "|move|p1a: Pikachu|Thunderbolt|p2a: Gyarados",
        "|",
        "",
        "plain text",
        "|upkeep",
        "|j| Guest 12",
        "|t:|1700000000",
    };
    for (const char* l : lines) {
        Event ev = classify_ok(c, l);
        TEST_CHECK(type_of(ev) == EventType::Other);
        TEST_CHECK(std::get<event::Other>(ev).raw == l);
    }

    std::cout << "[TEST] OK\n";
}

void test_event_mask() {
    std::cout << "[TEST] EventMask membership\n";

    constexpr EventMask mask{EventType::RequestUpdate, EventType::Win, EventType::Tie};
    static_assert(mask.contains(EventType::Win));
    TEST_CHECK(mask.contains(EventType::RequestUpdate));
    TEST_CHECK(mask.contains(EventType::Tie));
    TEST_CHECK(!mask.contains(EventType::Error));
    TEST_CHECK(!mask.contains(EventType::Other));
    TEST_CHECK(EventMask{}.empty());
    TEST_CHECK(to_string(EventType::TurnAdvance) == "TurnAdvance");

    std::cout << "[TEST] OK\n";
}

int main() {
    test_segments();
    test_challstr();
    test_lifecycle_events();
    test_error_and_turn();
    test_request();
    test_malformed_request_is_fatal();
    test_other_is_total();
    test_event_mask();

    std::cout << "[TEST] ALL CLASSIFIER TESTS PASSED!\n";
    return 0;
}
