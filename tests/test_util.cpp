#include <catch2/catch.hpp>
#include "util.hpp"
#include <filesystem>
#include <fstream>
#include <unistd.h>

using namespace callguard;

// ── trim / split / to_upper ──────────────────────────────────────

TEST_CASE("trim: strips surrounding whitespace", "[util]") {
    REQUIRE(trim("  key  ") == "key");
    REQUIRE(trim("\tkey\n") == "key");
    REQUIRE(trim("   ").empty());
    REQUIRE(trim("").empty());
}

TEST_CASE("split: trims tokens and drops empty ones", "[util]") {
    auto parts = split(" a, b ,,c ,", ',');
    REQUIRE(parts.size() == 3);
    REQUIRE(parts[0] == "a");
    REQUIRE(parts[1] == "b");
    REQUIRE(parts[2] == "c");
}

TEST_CASE("split: no delimiter yields one token", "[util]") {
    auto parts = split("single", ',');
    REQUIRE(parts.size() == 1);
    REQUIRE(parts[0] == "single");
}

TEST_CASE("to_upper: ASCII only", "[util]") {
    REQUIRE(to_upper("exa") == "EXA");
    REQUIRE(to_upper("exa-v2") == "EXA-V2");
}

// ── glob_match ───────────────────────────────────────────────────

TEST_CASE("glob_match: literal pattern is anchored", "[util]") {
    REQUIRE(glob_match("user:1", "user:1"));
    REQUIRE_FALSE(glob_match("user:1", "user:10"));
    REQUIRE_FALSE(glob_match("user:1", "xuser:1"));
}

TEST_CASE("glob_match: star matches any run", "[util]") {
    REQUIRE(glob_match("user:*", "user:"));
    REQUIRE(glob_match("user:*", "user:42"));
    REQUIRE(glob_match("*:42", "user:42"));
    REQUIRE(glob_match("a*b*c", "a-x-b-y-c"));
    REQUIRE_FALSE(glob_match("user:*", "session:42"));
    REQUIRE(glob_match("*", ""));
}

TEST_CASE("glob_match: question mark matches exactly one", "[util]") {
    REQUIRE(glob_match("user:?", "user:1"));
    REQUIRE_FALSE(glob_match("user:?", "user:"));
    REQUIRE_FALSE(glob_match("user:?", "user:12"));
}

TEST_CASE("glob_match: regex metacharacters are literal", "[util]") {
    REQUIRE(glob_match("a.c", "a.c"));
    REQUIRE_FALSE(glob_match("a.c", "abc"));
    REQUIRE(glob_match("price[1]+", "price[1]+"));
    REQUIRE_FALSE(glob_match("a?c", "ac"));
    REQUIRE_FALSE(glob_match("a?c", "abcd"));
}

TEST_CASE("glob_match: star backtracks", "[util]") {
    REQUIRE(glob_match("*ab", "aab"));
    REQUIRE(glob_match("a*ab", "aaab"));
    REQUIRE_FALSE(glob_match("a*ab", "aaa"));
}

// ── elapsed_ms ───────────────────────────────────────────────────

TEST_CASE("elapsed_ms: never negative", "[util]") {
    auto now = Clock::now();
    auto later = now + std::chrono::milliseconds(250);
    REQUIRE(elapsed_ms(now, later) == 250);
    REQUIRE(elapsed_ms(later, now) == 0);
}

// ── expand_home ──────────────────────────────────────────────────

TEST_CASE("expand_home: replaces leading tilde", "[util]") {
    const char* home = std::getenv("HOME");
    REQUIRE(home != nullptr);
    REQUIRE(expand_home("~/.callguard") == std::string(home) + "/.callguard");
    REQUIRE(expand_home("/abs/path") == "/abs/path");
}

// ── atomic_write_file ────────────────────────────────────────────

TEST_CASE("atomic_write_file: creates parent directories", "[util]") {
    auto base = std::filesystem::temp_directory_path() /
                ("callguard_util_" + std::to_string(getpid()));
    std::string path = (base / "nested" / "out.json").string();

    REQUIRE(atomic_write_file(path, "{}\n"));

    std::ifstream in(path);
    std::string content((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    REQUIRE(content == "{}\n");
    REQUIRE_FALSE(std::filesystem::exists(path + ".tmp"));

    std::filesystem::remove_all(base);
}

// ── random_uniform ───────────────────────────────────────────────

TEST_CASE("random_uniform: stays in range", "[util]") {
    for (int i = 0; i < 1000; i++) {
        double v = random_uniform(0.5, 1.0);
        REQUIRE(v >= 0.5);
        REQUIRE(v < 1.0);
    }
}
