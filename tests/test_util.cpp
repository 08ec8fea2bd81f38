#include <catch2/catch.hpp>
#include "util.hpp"
#include "temp_dir.hpp"
#include <cstdlib>
#include <filesystem>

using namespace tman;

TEST_CASE("trim: strips surrounding whitespace only", "[util]") {
    REQUIRE(trim("  a b \t\r\n") == "a b");
    REQUIRE(trim("") == "");
    REQUIRE(trim(" \n ") == "");
}

TEST_CASE("contains_ci: case-insensitive, empty needle matches", "[util]") {
    REQUIRE(contains_ci("CRON[123]: job", "cron"));
    REQUIRE_FALSE(contains_ci("sshd", "cron"));
    REQUIRE(contains_ci("anything", ""));
}

TEST_CASE("split_lines: trailing newline adds no empty line", "[util]") {
    REQUIRE(split_lines("a\nb\n") == std::vector<std::string>{"a", "b"});
    REQUIRE(split_lines("a\n\nb") == std::vector<std::string>{"a", "", "b"});
    REQUIRE(split_lines("").empty());
}

TEST_CASE("expand_home: only a leading ~ is expanded", "[util]") {
    const char* home = std::getenv("HOME");
    REQUIRE(home != nullptr);
    REQUIRE(expand_home("~") == std::string(home));
    REQUIRE(expand_home("~/notes.txt") == std::string(home) + "/notes.txt");
    REQUIRE(expand_home("/tmp/~x") == "/tmp/~x");
    REQUIRE(expand_home("~other/x") == "~other/x");
}

TEST_CASE("format_bytes and format_uptime", "[util]") {
    REQUIRE(format_bytes(512) == "512 B");
    REQUIRE(format_bytes(2048) == "2.0 KB");
    REQUIRE(format_bytes(5LL * 1024 * 1024) == "5.0 MB");
    REQUIRE(format_bytes(3LL * 1024 * 1024 * 1024) == "3.00 GB");

    REQUIRE(format_uptime(3 * 3600 + 5 * 60) == "3h 5m");
    REQUIRE(format_uptime(2 * 86400 + 3600) == "2d 1h 0m");
}

TEST_CASE("atomic_write_file: creates parents and replaces content", "[util]") {
    TempDir dir;
    const std::string path = dir.file("nested/deeper/file.txt");
    std::string error;

    REQUIRE(atomic_write_file(path, "first", error));
    REQUIRE(read_file(path) == "first");

    REQUIRE(atomic_write_file(path, "second", error));
    REQUIRE(read_file(path) == "second");

    // No temp files left behind
    size_t entries = 0;
    for ([[maybe_unused]] const auto& entry : std::filesystem::directory_iterator(dir.file("nested/deeper"))) {
        ++entries;
    }
    REQUIRE(entries == 1);
}

TEST_CASE("atomic_write_file: reports an unwritable location", "[util]") {
    TempDir dir;
    const std::string blocker = dir.write("plain_file", "x");
    std::string error;
    REQUIRE_FALSE(atomic_write_file(blocker + "/child.txt", "data", error));
    REQUIRE_FALSE(error.empty());
}

TEST_CASE("shell_join: quotes only what the shell would split", "[util]") {
    REQUIRE(shell_join({"ssh", "-p", "2200", "me@host"}) == "ssh -p 2200 me@host");
    REQUIRE(shell_join({"nano", "/tmp/a b.txt"}) == "nano '/tmp/a b.txt'");
    REQUIRE(shell_join({"echo", "it's", ""}) == "echo 'it'\\''s' ''");
    REQUIRE(shell_join({"echo", "$HOME;rm"}) == "echo '$HOME;rm'");
}
