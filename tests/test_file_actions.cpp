#include <catch2/catch.hpp>
#include "config.hpp"
#include "files/file_actions.hpp"
#include "files/text_document.hpp"
#include "terminal_launcher.hpp"
#include "fake_command_runner.hpp"
#include "temp_dir.hpp"

using namespace tman;

TEST_CASE("FileActions::open_path: hands existing paths to xdg-open", "[files]") {
    TempDir dir;
    const std::string file = dir.write("report.pdf", "%PDF");
    FakeCommandRunner runner;
    TerminalLauncher launcher(runner);
    FileActions files(runner, launcher);

    auto result = files.open_path(file);
    REQUIRE(result.success);
    REQUIRE(result.message == "Opened: " + file);
    REQUIRE(runner.runs.back().argv == std::vector<std::string>{"xdg-open", file});
    REQUIRE(runner.runs.back().timeout == FileActions::kOpenTimeout);

    // Directories go to the file manager the same way
    REQUIRE(files.open_path(dir.path()).success);
}

TEST_CASE("FileActions::open_path: failures", "[files]") {
    TempDir dir;
    const std::string file = dir.write("data.bin", "x");
    FakeCommandRunner runner;
    TerminalLauncher launcher(runner);
    FileActions files(runner, launcher);

    REQUIRE(files.open_path("  ").message == "No path given");
    REQUIRE(files.open_path(dir.file("missing")).message == "Path not found: " + dir.file("missing"));
    REQUIRE(runner.runs.empty());

    runner.next_result = FakeCommandRunner::not_launched("xdg-open: command not found");
    REQUIRE(files.open_path(file).message == "xdg-open not found; install xdg-utils");

    runner.next_result = FakeCommandRunner::failed(3, "");
    REQUIRE(files.open_path(file).message == "No application is associated with " + file);

    runner.next_result = FakeCommandRunner::failed(4, "boom\n");
    REQUIRE(files.open_path(file).message == "Failed to open " + file + ": boom");

    // A handler that keeps xdg-open attached past the timeout was still started
    runner.next_result = FakeCommandRunner::timed_out();
    REQUIRE(files.open_path(file).success);
}

TEST_CASE("FileActions::open_in_terminal_editor: terminal, then the editor itself", "[files]") {
    FakeCommandRunner runner;
    runner.executables = {"konsole"};
    TerminalLauncher launcher(runner);
    FileActions files(runner, launcher);

    REQUIRE(files.open_in_terminal_editor("", "vim").message == "Please save the file first!");

    auto result = files.open_in_terminal_editor("/tmp/a.txt", "vim");
    REQUIRE(result.success);
    REQUIRE(result.message == "Opened in vim: /tmp/a.txt");
    REQUIRE(runner.spawned.back() == std::vector<std::string>{"konsole", "-e", "vim", "/tmp/a.txt"});

    // No terminal: spawn the editor directly
    runner.executables.clear();
    REQUIRE(files.open_in_terminal_editor("/tmp/a.txt", "gedit").success);
    REQUIRE(runner.spawned.back() == std::vector<std::string>{"gedit", "/tmp/a.txt"});

    runner.spawn_result = false;
    auto failed = files.open_in_terminal_editor("/tmp/a.txt", "");
    REQUIRE_FALSE(failed.success);
    REQUIRE(failed.message == "Could not find a suitable terminal emulator or nano");
}

TEST_CASE("FileActions::edit_in_foreground: editor exit status", "[files]") {
    FakeCommandRunner runner;
    TerminalLauncher launcher(runner);
    FileActions files(runner, launcher);

    auto edited = files.edit_in_foreground("/etc/hosts", "vi");
    REQUIRE(edited.success);
    REQUIRE(edited.message == "Edited in vi: /etc/hosts");
    REQUIRE(runner.foreground_runs.back() == std::vector<std::string>{"vi", "/etc/hosts"});

    runner.foreground_exit_code = 1;
    REQUIRE(files.edit_in_foreground("/etc/hosts", "vi").message == "vi exited with code 1");

    runner.foreground_exit_code = -1;
    runner.foreground_error = "nano: command not found";
    REQUIRE(files.edit_in_foreground("/etc/hosts", "").message == "Failed to start nano: nano: command not found");

    REQUIRE(files.edit_in_foreground(" ", "vi").message == "No path given");
}

TEST_CASE("FileActions::open_recent: vanished files leave the list", "[files]") {
    TempDir dir;
    FakeCommandRunner runner;
    TerminalLauncher launcher(runner);
    FileActions files(runner, launcher);
    Config config;
    config.path = dir.file("config.json");

    const std::string kept = dir.write("kept.txt", "hello");
    const std::string gone = dir.file("gone.txt");
    config.add_recent_file(gone);
    config.add_recent_file(kept);

    TextDocument document;
    auto missing = files.open_recent(config, gone, document);
    REQUIRE_FALSE(missing.success);
    REQUIRE(missing.message == "File no longer exists");
    REQUIRE(config.recent_files == std::vector<std::string>{kept});

    config.add_recent_file(dir.write("other.txt", "x"));
    auto opened = files.open_recent(config, kept, document);
    REQUIRE(opened.success);
    REQUIRE(document.content() == "hello");
    REQUIRE(config.recent_files.front() == kept);
    REQUIRE(Config::load(config.path).recent_files.front() == kept);
}
