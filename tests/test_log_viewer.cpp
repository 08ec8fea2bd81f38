#include <catch2/catch.hpp>
#include "log_viewer.hpp"
#include "fake_command_runner.hpp"
#include "temp_dir.hpp"

using namespace tman;

TEST_CASE("LogDocument: info line and case-insensitive search", "[logs]") {
    LogDocument doc("syslog", "Error one\nall fine\nerror ERROR twice\n");
    REQUIRE(doc.line_count() == 3);
    REQUIRE(doc.info_line() == "Lines: 3 | Characters: 37 | File: syslog");

    auto found = doc.search("error");
    REQUIRE(found.count == 3);
    REQUIRE(found.matching_lines == std::vector<size_t>{0, 2});
    REQUIRE(found.message == "Found 3 matches");

    auto none = doc.search("panic");
    REQUIRE(none.count == 0);
    REQUIRE(none.message == "No matches found for 'panic'");

    REQUIRE(doc.search("  ").message.empty());
}

TEST_CASE("LogDocument: save and clear", "[logs]") {
    TempDir dir;
    LogDocument doc("cron", "a\nb\n");

    auto saved = doc.save(dir.file("saved.log"));
    REQUIRE(saved.success);
    REQUIRE(saved.message == "Log saved to " + dir.file("saved.log"));
    REQUIRE(read_file(dir.file("saved.log")) == "a\nb\n");
    REQUIRE(doc.save("").message == "No path given");

    doc.clear();
    REQUIRE(doc.line_count() == 0);
    REQUIRE(doc.char_count() == 0);
    REQUIRE(doc.title() == "cron");
}

namespace {

// Answers `tail -N <path>` with the file's content
CommandResult fake_tail(const CommandSpec& spec) {
    if (spec.argv.size() == 3 && spec.argv[0] == "tail") {
        return FakeCommandRunner::ok(read_file(spec.argv[2]));
    }
    return FakeCommandRunner::failed(1, "no journal");
}

} // namespace

TEST_CASE("LogSource: cron log keeps only cron lines", "[logs]") {
    TempDir dir;
    const std::string syslog = dir.write("syslog",
        "Jan 1 sshd[1]: accepted\n"
        "Jan 1 CRON[22]: (root) CMD (backup)\n"
        "Jan 1 kernel: eth0 up\n");
    FakeCommandRunner runner;
    runner.on_run = fake_tail;
    LogSource source(runner, {dir.file("cron"), syslog}, {});

    auto fetched = source.fetch(LogKind::Cron);
    REQUIRE(fetched.found);
    REQUIRE(fetched.document.title() == "Cron Logs - " + syslog);
    REQUIRE(fetched.document.content() == "Jan 1 CRON[22]: (root) CMD (backup)\n");
    REQUIRE(runner.runs.front().argv == std::vector<std::string>{"tail", "-100", syslog});
}

TEST_CASE("LogSource: cron file without cron lines is shown whole", "[logs]") {
    TempDir dir;
    const std::string log = dir.write("messages", "nothing relevant\n");
    FakeCommandRunner runner;
    runner.on_run = fake_tail;
    LogSource source(runner, {log}, {});

    auto fetched = source.fetch(LogKind::Cron);
    REQUIRE(fetched.found);
    REQUIRE(fetched.document.title() == "System Logs - " + log);
    REQUIRE(fetched.document.content() == "nothing relevant\n");
}

TEST_CASE("LogSource: falls back to journalctl", "[logs]") {
    FakeCommandRunner runner;
    runner.next_result = FakeCommandRunner::ok("journal line\n");
    LogSource source(runner, {"/nonexistent/cron.log"}, {"/nonexistent/syslog"});

    auto cron = source.fetch(LogKind::Cron);
    REQUIRE(cron.found);
    REQUIRE(cron.document.title() == "Cron Logs - journalctl");
    REQUIRE(runner.runs.back().argv == std::vector<std::string>{"journalctl", "-u", "cron", "-n", "50"});

    auto system = source.fetch(LogKind::System);
    REQUIRE(system.found);
    REQUIRE(system.document.title() == "System Logs - journalctl");
    REQUIRE(runner.runs.back().argv == std::vector<std::string>{"journalctl", "-n", "100"});
}

TEST_CASE("LogSource: nothing readable lists what was tried", "[logs]") {
    FakeCommandRunner runner;
    runner.next_result = FakeCommandRunner::failed(1, "No journal files were found.");
    LogSource source(runner, {"/nonexistent/cron.log"}, {"/nonexistent/syslog"});

    auto cron = source.fetch(LogKind::Cron);
    REQUIRE_FALSE(cron.found);
    REQUIRE(cron.message == "No accessible cron logs found.\n\nTried locations:\n- /nonexistent/cron.log\n- journalctl");

    auto system = source.fetch(LogKind::System);
    REQUIRE_FALSE(system.found);
    REQUIRE(system.message == "No accessible system logs found or insufficient permissions.");
}

TEST_CASE("LogSource: system log uses the first readable file", "[logs]") {
    TempDir dir;
    const std::string messages = dir.write("messages", "boot ok\n");
    FakeCommandRunner runner;
    runner.on_run = fake_tail;
    LogSource source(runner, {}, {dir.file("syslog"), messages});

    auto fetched = source.fetch(LogKind::System);
    REQUIRE(fetched.found);
    REQUIRE(fetched.document.title() == "System Logs - " + messages);
    REQUIRE(runner.runs.front().argv == std::vector<std::string>{"tail", "-200", messages});
}
