/*
===============================================================================
 StateDocument - Unit Tests
===============================================================================

Covered:
- lenient load (absent, malformed, non-object)
- typed getters
- unknown keys (nested values included) survive a read-modify-write
- sorted keys, two-space indent, parent directory creation
- "~" expansion
===============================================================================
*/

#include <iostream>
#include <fstream>
#include <sstream>
#include <string>
#include <filesystem>
#include <cstdlib>

#include "wiredown/session/state.hpp"
#include "common/test_check.hpp"

using namespace wiredown::session;
namespace fs = std::filesystem;


static fs::path scratch(const std::string& name) {
    fs::path dir = fs::temp_directory_path() / "wiredown_test_state" / name;
    std::error_code ec;
    fs::remove_all(dir, ec);
    return dir;
}

static void write_file(const fs::path& path, const std::string& text) {
    fs::create_directories(path.parent_path());
    std::ofstream f(path, std::ios::binary | std::ios::trunc);
    f << text;
}

static std::string read_file(const fs::path& path) {
    std::ifstream f(path, std::ios::binary);
    std::stringstream ss;
    ss << f.rdbuf();
    return ss.str();
}

void test_lenient_load() {
    std::cout << "[TEST] State: lenient load\n";

    const fs::path dir = scratch("lenient");
    TEST_CHECK(StateDocument::load(dir / "missing.json").values().empty());

    write_file(dir / "broken.json", "{\"battle_id\": ");
    TEST_CHECK(StateDocument::load(dir / "broken.json").values().empty());

    write_file(dir / "array.json", "[1, 2, 3]");
    TEST_CHECK(StateDocument::load(dir / "array.json").values().empty());

    write_file(dir / "empty.json", "");
    TEST_CHECK(StateDocument::load(dir / "empty.json").values().empty());

    std::cout << "[TEST] OK\n";
}

void test_typed_getters() {
    std::cout << "[TEST] State: typed getters\n";

    const fs::path dir = scratch("getters");
    write_file(dir / "s.json", R"({"battle_id":"battle-x-1","rqid":12,"turn":"3","ps_password":null,"request":{"rqid":12}})");

    const StateDocument doc = StateDocument::load(dir / "s.json");
    TEST_CHECK(doc.get_string("battle_id").value() == "battle-x-1");
    TEST_CHECK(doc.get_int("rqid").value() == 12);
    TEST_CHECK(!doc.get_int("turn").has());           // wrong type
    TEST_CHECK(!doc.get_string("ps_password").has());  // null
    TEST_CHECK(!doc.get_string("missing").has());
    TEST_CHECK(doc.has("ps_password"));
    TEST_CHECK(doc.raw("request").value() == R"({"rqid":12})");

    std::cout << "[TEST] OK\n";
}

void test_setters() {
    std::cout << "[TEST] State: setters\n";

    StateDocument doc;
    doc.set("s", "a\"b");
    doc.set("i", std::int64_t{-4});
    doc.set("b", true);
    doc.set("d", 1.25);
    doc.set_null("n");
    doc.set("o1", lcr::optional<std::string>{});
    doc.set("o2", lcr::optional<std::int64_t>{std::int64_t{9}});

    TEST_CHECK(doc.raw("s").value() == R"("a\"b")");
    TEST_CHECK(doc.raw("i").value() == "-4");
    TEST_CHECK(doc.raw("b").value() == "true");
    TEST_CHECK(doc.raw("d").value() == "1.25");
    TEST_CHECK(doc.raw("n").value() == "null");
    TEST_CHECK(doc.raw("o1").value() == "null");
    TEST_CHECK(doc.raw("o2").value() == "9");

    std::cout << "[TEST] OK\n";
}

void test_read_modify_write() {
    std::cout << "[TEST] State: unknown keys survive a save\n";

    const fs::path dir = scratch("merge");
    const fs::path path = dir / "nested" / "state.json";
    write_file(path, R"({"zeta": {"deep": [1, {"x": "y"}]}, "notes": "keep me", "rqid": 1})");

    StateDocument doc = StateDocument::load(path);
    doc.set("rqid", std::int64_t{2});
    doc.set("battle_id", "battle-x-2");
    std::string error;
    TEST_CHECK(doc.save(path, error));
    TEST_CHECK(error.empty());
    TEST_CHECK(!fs::exists(path.string() + ".tmp"));

    TEST_CHECK(read_file(path) ==
        "{\n"
        "  \"battle_id\": \"battle-x-2\",\n"
        "  \"notes\": \"keep me\",\n"
        "  \"rqid\": 2,\n"
        "  \"zeta\": {\"deep\":[1,{\"x\":\"y\"}]}\n"
        "}");

    const StateDocument again = StateDocument::load(path);
    TEST_CHECK(again.get_string("notes").value() == "keep me");
    TEST_CHECK(again.raw("zeta").value() == R"({"deep":[1,{"x":"y"}]})");

    std::cout << "[TEST] OK\n";
}

void test_save_creates_directories() {
    std::cout << "[TEST] State: save creates parent directories\n";

    const fs::path dir = scratch("mkdir");
    const fs::path path = dir / "a" / "b" / "c.json";
    StateDocument doc;
    std::string error;
    TEST_CHECK(doc.save(path, error));
    TEST_CHECK(read_file(path) == "{}");

    // A directory where the file should be
    fs::create_directories(dir / "taken");
    TEST_CHECK(!doc.save(dir / "taken", error));
    TEST_CHECK(!error.empty());

    std::cout << "[TEST] OK\n";
}

void test_expand_user() {
    std::cout << "[TEST] State: home expansion\n";

    const char* home = std::getenv("HOME");
    if (home != nullptr && *home != '\0') {
        TEST_CHECK(expand_user("~/ps/state.json") == fs::path(std::string(home) + "/ps/state.json"));
        TEST_CHECK(expand_user("~") == fs::path(home));
    }
    TEST_CHECK(expand_user("~other/x") == fs::path("~other/x"));
    TEST_CHECK(expand_user("relative.json") == fs::path("relative.json"));
    TEST_CHECK(expand_user("") == fs::path(""));

    std::cout << "[TEST] OK\n";
}

int main() {
    test_lenient_load();
    test_typed_getters();
    test_setters();
    test_read_modify_write();
    test_save_creates_directories();
    test_expand_user();

    std::cout << "[TEST] ALL STATE TESTS PASSED!\n";
    return 0;
}
