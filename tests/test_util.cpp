#include <catch2/catch_test_macros.hpp>
#include "util.hpp"
#include <cctype>
#include <cstdlib>

using namespace perouter;

// ── trim ─────────────────────────────────────────────────────────

TEST_CASE("trim: removes leading and trailing whitespace", "[util]") {
    REQUIRE(trim("  hello  ") == "hello");
    REQUIRE(trim("\t\nhello\r\n") == "hello");
}

TEST_CASE("trim: keeps inner whitespace", "[util]") {
    REQUIRE(trim(" tcp port 22 ") == "tcp port 22");
}

TEST_CASE("trim: all-whitespace becomes empty", "[util]") {
    REQUIRE(trim("   \t ").empty());
    REQUIRE(trim("").empty());
}

// ── compact_timestamp ────────────────────────────────────────────

TEST_CASE("compact_timestamp: YYYYmmdd_HHMMSS shape", "[util]") {
    std::string ts = compact_timestamp();
    REQUIRE(ts.size() == 15);
    REQUIRE(ts[8] == '_');
    for (size_t i = 0; i < ts.size(); ++i) {
        if (i == 8) continue;
        REQUIRE(std::isdigit(static_cast<unsigned char>(ts[i])));
    }
}

// ── expand_home ──────────────────────────────────────────────────

TEST_CASE("expand_home: replaces leading tilde", "[util]") {
    const char* home = std::getenv("HOME");
    REQUIRE(home != nullptr);
    REQUIRE(expand_home("~/.perouter-mcp/config.json") ==
            std::string(home) + "/.perouter-mcp/config.json");
}

TEST_CASE("expand_home: leaves other paths alone", "[util]") {
    REQUIRE(expand_home("/etc/hosts") == "/etc/hosts");
    REQUIRE(expand_home("relative/~/path") == "relative/~/path");
}

// ── join_path ────────────────────────────────────────────────────

TEST_CASE("join_path: inserts exactly one separator", "[util]") {
    REQUIRE(join_path("/opt/scripts", "a.sh") == "/opt/scripts/a.sh");
    REQUIRE(join_path("/opt/scripts/", "a.sh") == "/opt/scripts/a.sh");
}

TEST_CASE("join_path: empty directory yields the name", "[util]") {
    REQUIRE(join_path("", "a.sh") == "a.sh");
}
