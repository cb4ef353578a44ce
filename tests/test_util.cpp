#include <catch2/catch_test_macros.hpp>
#include "util.hpp"
#include <filesystem>
#include <fstream>
#include <sstream>

using namespace agentstream;

static std::string read_file(const std::string& path) {
    std::ifstream in(path);
    std::stringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

// ── trim ─────────────────────────────────────────────────────────

TEST_CASE("trim: removes leading and trailing spaces", "[util]") {
    REQUIRE(trim("  hello  ") == "hello");
}

TEST_CASE("trim: removes tabs and mixed whitespace", "[util]") {
    REQUIRE(trim("\t hello \n") == "hello");
}

TEST_CASE("trim: all whitespace returns empty", "[util]") {
    REQUIRE(trim("   \t\n  ").empty());
    REQUIRE(trim("").empty());
}

TEST_CASE("trim: inner whitespace kept", "[util]") {
    REQUIRE(trim(" Hello World ") == "Hello World");
}

// ── expand_home ──────────────────────────────────────────────────

TEST_CASE("expand_home: path without tilde unchanged", "[util]") {
    REQUIRE(expand_home("/usr/local") == "/usr/local");
    REQUIRE(expand_home("").empty());
}

TEST_CASE("expand_home: tilde is expanded", "[util]") {
    std::string result = expand_home("~/.agentstream/config.json");
    REQUIRE(result.find('~') == std::string::npos);
    REQUIRE(result.size() > std::string("/.agentstream/config.json").size());
}

// ── atomic_write_file ────────────────────────────────────────────

TEST_CASE("atomic_write_file: creates parent directories", "[util]") {
    auto dir = std::filesystem::temp_directory_path() / "agentstream_test_util";
    std::filesystem::remove_all(dir);
    std::string path = (dir / "nested" / "file.json").string();

    REQUIRE(atomic_write_file(path, "{\"a\":1}"));
    REQUIRE(read_file(path) == "{\"a\":1}");
    REQUIRE_FALSE(std::filesystem::exists(path + ".tmp"));

    REQUIRE(atomic_write_file(path, "replaced"));
    REQUIRE(read_file(path) == "replaced");

    std::filesystem::remove_all(dir);
}
