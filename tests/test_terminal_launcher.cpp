#include <catch2/catch.hpp>
#include "terminal_launcher.hpp"
#include "fake_command_runner.hpp"

using namespace tman;

TEST_CASE("TerminalLauncher::build_command: per-emulator syntax", "[launcher]") {
    const std::vector<std::string> argv = {"ssh", "-t", "me@host"};

    REQUIRE(TerminalLauncher::build_command("gnome-terminal", argv) ==
            std::vector<std::string>{"gnome-terminal", "--", "ssh", "-t", "me@host"});
    REQUIRE(TerminalLauncher::build_command("xterm", argv) ==
            std::vector<std::string>{"xterm", "-e", "ssh", "-t", "me@host"});
    REQUIRE(TerminalLauncher::build_command("xfce4-terminal", argv) ==
            std::vector<std::string>{"xfce4-terminal", "-e", "ssh -t me@host"});
}

TEST_CASE("TerminalLauncher::build_command: single-string emulators get quoted words", "[launcher]") {
    const std::vector<std::string> argv = {"nano", "/home/me/My Notes/todo.txt"};
    REQUIRE(TerminalLauncher::build_command("xfce4-terminal", argv) ==
            std::vector<std::string>{"xfce4-terminal", "-e", "nano '/home/me/My Notes/todo.txt'"});
}

TEST_CASE("TerminalLauncher::launch: first installed emulator wins", "[launcher]") {
    FakeCommandRunner runner;
    runner.executables = {"konsole", "lxterminal"};
    TerminalLauncher launcher(runner);

    auto used = launcher.launch({"htop"});
    REQUIRE(used == std::optional<std::string>("konsole"));
    REQUIRE(runner.spawned.size() == 1);
}

TEST_CASE("TerminalLauncher::launch: preferred emulator goes first", "[launcher]") {
    FakeCommandRunner runner;
    runner.executables = {"xterm", "lxterminal"};
    TerminalLauncher launcher(runner, "lxterminal");

    REQUIRE(launcher.launch({"htop"}) == std::optional<std::string>("lxterminal"));

    launcher.set_preferred("alacritty");
    REQUIRE(launcher.launch({"htop"}) == std::optional<std::string>("xterm"));
}

TEST_CASE("TerminalLauncher::launch: nothing available", "[launcher]") {
    FakeCommandRunner runner;
    TerminalLauncher launcher(runner);
    REQUIRE_FALSE(launcher.launch({"htop"}).has_value());
    REQUIRE(runner.spawned.empty());

    runner.executables = {"xterm"};
    runner.spawn_result = false;
    REQUIRE_FALSE(launcher.launch({"htop"}).has_value());
    REQUIRE_FALSE(launcher.launch({}).has_value());
}
