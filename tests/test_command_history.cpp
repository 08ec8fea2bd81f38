#include <catch2/catch.hpp>
#include "command_history.hpp"
#include <string>

using namespace tman;

TEST_CASE("CommandHistory: up walks back, down returns to an empty line", "[history]") {
    CommandHistory history;
    history.add("ls");
    history.add("pwd");
    history.add("whoami");

    REQUIRE(history.previous() == "whoami");
    REQUIRE(history.previous() == "pwd");
    REQUIRE(history.previous() == "ls");
    // Stops at the oldest entry
    REQUIRE(history.previous() == "ls");

    REQUIRE(history.next() == "pwd");
    REQUIRE(history.next() == "whoami");
    REQUIRE(history.next().empty());
}

TEST_CASE("CommandHistory: re-entered command moves to the end", "[history]") {
    CommandHistory history;
    history.add("ls");
    history.add("pwd");
    history.add("ls");

    REQUIRE(history.entries() == std::vector<std::string>{"pwd", "ls"});
    REQUIRE(history.previous() == "ls");
}

TEST_CASE("CommandHistory: ignores empty commands and is bounded", "[history]") {
    CommandHistory history;
    history.add("");
    REQUIRE(history.empty());
    REQUIRE(history.previous().empty());

    for (size_t i = 0; i < CommandHistory::kMaxEntries + 10; ++i) {
        history.add("cmd " + std::to_string(i));
    }
    REQUIRE(history.entries().size() == CommandHistory::kMaxEntries);
    REQUIRE(history.entries().front() == "cmd 10");
}

TEST_CASE("CommandHistory: adding resets navigation", "[history]") {
    CommandHistory history;
    history.add("a");
    history.add("b");
    REQUIRE(history.previous() == "b");
    REQUIRE(history.previous() == "a");

    history.add("c");
    REQUIRE(history.previous() == "c");
}
