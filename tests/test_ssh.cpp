#include <catch2/catch.hpp>
#include "config.hpp"
#include "ssh/ssh_connection.hpp"
#include "ssh/ssh_manager.hpp"
#include "ssh/ssh_session.hpp"
#include "terminal_launcher.hpp"
#include "fake_command_runner.hpp"
#include "temp_dir.hpp"
#include <algorithm>

using namespace tman;

namespace {

SshConnection make_conn(const std::string& name = "web") {
    SshConnection conn;
    conn.name = name;
    conn.host = "web.example.com";
    conn.user = "deploy";
    return conn;
}

bool has_pair(const std::vector<std::string>& args, const std::string& flag, const std::string& value) {
    for (size_t i = 0; i + 1 < args.size(); ++i) {
        if (args[i] == flag && args[i + 1] == value) return true;
    }
    return false;
}

bool has(const std::vector<std::string>& args, const std::string& value) {
    return std::find(args.begin(), args.end(), value) != args.end();
}

} // namespace

TEST_CASE("SshConnection::validate: required fields and port range", "[ssh]") {
    auto conn = make_conn();
    REQUIRE(conn.validate().valid);

    conn.name = " ";
    REQUIRE(conn.validate().error == "Connection name is required");
    conn = make_conn();
    conn.host.clear();
    REQUIRE(conn.validate().error == "Host is required");
    conn = make_conn();
    conn.user.clear();
    REQUIRE(conn.validate().error == "Username is required");
    conn = make_conn();
    conn.port = 70000;
    REQUIRE(conn.validate().error == "Invalid port: Port must be between 1 and 65535");
}

TEST_CASE("SshConnection::validate: host and user cannot pass as ssh options", "[ssh]") {
    auto conn = make_conn();
    conn.user = "-oProxyCommand=x";
    auto check = conn.validate();
    REQUIRE_FALSE(check.valid);
    REQUIRE(check.error == "Username must not start with '-'");

    conn = make_conn();
    conn.host = "-oProxyCommand=x";
    REQUIRE(conn.validate().error == "Host must not start with '-'");

    conn = make_conn();
    conn.host = "evil@web.example.com";
    REQUIRE(conn.validate().error == "Host must not contain spaces or '@'");

    conn = make_conn();
    conn.host = "web example.com";
    REQUIRE_FALSE(conn.validate().valid);

    conn = make_conn();
    conn.user = "de ploy";
    REQUIRE(conn.validate().error == "Username must not contain spaces");

    conn = make_conn();
    conn.user = "deploy\n";
    REQUIRE_FALSE(conn.validate().valid);
}

TEST_CASE("SshManager: option-like targets never reach the runner", "[ssh][manager]") {
    FakeCommandRunner runner;
    runner.executables = {"xterm"};
    TerminalLauncher launcher(runner);
    Config config;
    SshManager manager(runner, launcher, config);
    SshSession session(runner);

    auto conn = make_conn();
    conn.user = "-oProxyCommand=touch /tmp/pwned";

    REQUIRE(manager.test_connection(conn).message == "Username must not start with '-'");
    REQUIRE_FALSE(manager.connect(conn, session).success);
    REQUIRE_FALSE(manager.connect_foreground(conn).success);
    REQUIRE(manager.quick_connect("-oProxyCommand=x", "root", "", session).message
            == "Host must not start with '-'");
    REQUIRE_FALSE(manager.add_connection(conn).success);

    REQUIRE(runner.runs.empty());
    REQUIRE(runner.spawned.empty());
    REQUIRE(runner.foreground_runs.empty());
    REQUIRE(config.ssh_connections.empty());
}

TEST_CASE("SshConnection::validate: a missing key file only warns", "[ssh]") {
    auto conn = make_conn();
    conn.key_file = "/nonexistent/id_rsa";
    auto check = conn.validate();
    REQUIRE(check.valid);
    REQUIRE(check.warning == "SSH key file does not exist: /nonexistent/id_rsa");
}

TEST_CASE("SshConnection::display_string", "[ssh]") {
    auto conn = make_conn();
    conn.port = 2222;
    REQUIRE(conn.display_string() == "web (deploy@web.example.com:2222)");
    REQUIRE(conn.target() == "deploy@web.example.com");
}

TEST_CASE("build_ssh_args: options per mode", "[ssh]") {
    SshOptions options;
    auto conn = make_conn();

    auto interactive = build_ssh_args(conn, options, SshMode::Interactive);
    REQUIRE(interactive.front() == "ssh");
    REQUIRE(interactive.back() == "deploy@web.example.com");
    REQUIRE(has(interactive, "-t"));
    REQUIRE(has_pair(interactive, "-o", "StrictHostKeyChecking=accept-new"));
    REQUIRE(has_pair(interactive, "-o", "ConnectTimeout=10"));
    // Default port is not spelled out
    REQUIRE_FALSE(has(interactive, "-p"));

    auto embedded = build_ssh_args(conn, options, SshMode::Embedded);
    REQUIRE(has(embedded, "-T"));
    REQUIRE(has_pair(embedded, "-o", "BatchMode=yes"));

    auto test = build_ssh_args(conn, options, SshMode::Test, {"echo", "ok"});
    REQUIRE(has_pair(test, "-o", "BatchMode=yes"));
    REQUIRE(test[test.size() - 3] == "deploy@web.example.com");
    REQUIRE(test.back() == "ok");
}

TEST_CASE("build_ssh_args: port and existing key file", "[ssh]") {
    TempDir dir;
    auto conn = make_conn();
    conn.port = 2200;
    conn.key_file = dir.write("id_test", "key");

    auto args = build_ssh_args(conn, SshOptions{}, SshMode::Interactive);
    REQUIRE(has_pair(args, "-p", "2200"));
    REQUIRE(has_pair(args, "-i", conn.key_file));

    conn.key_file = dir.file("missing_key");
    REQUIRE_FALSE(has(build_ssh_args(conn, SshOptions{}, SshMode::Interactive), "-i"));
}

TEST_CASE("parse_port: empty means 22", "[ssh]") {
    int port = 0;
    std::string error;
    REQUIRE(parse_port("", port, error));
    REQUIRE(port == 22);
    REQUIRE(parse_port(" 2022 ", port, error));
    REQUIRE(port == 2022);
    REQUIRE_FALSE(parse_port("22x", port, error));
    REQUIRE(error == "Port must be a number");
    REQUIRE_FALSE(parse_port("0", port, error));
    REQUIRE(error == "Invalid port: Port must be between 1 and 65535");
}

TEST_CASE("SshManager: profiles are validated and persisted", "[ssh][manager]") {
    TempDir dir;
    FakeCommandRunner runner;
    TerminalLauncher launcher(runner);
    Config config;
    config.path = dir.file("config.json");
    SshManager manager(runner, launcher, config);

    auto added = manager.add_connection(make_conn("web"));
    REQUIRE(added.success);
    REQUIRE(added.message == "SSH connection added successfully");
    REQUIRE(Config::load(config.path).ssh_connections.size() == 1);

    auto duplicate = manager.add_connection(make_conn("web"));
    REQUIRE_FALSE(duplicate.success);
    REQUIRE(duplicate.message == "A connection named 'web' already exists");

    SshConnection invalid = make_conn("bad");
    invalid.host.clear();
    REQUIRE(manager.add_connection(invalid).message == "Host is required");

    REQUIRE(manager.add_connection(make_conn("db")).success);
    auto renamed = make_conn("web");
    REQUIRE_FALSE(manager.update_connection(1, renamed).success);
    renamed.name = "database";
    renamed.port = 2222;
    REQUIRE(manager.update_connection(1, renamed).success);
    REQUIRE(manager.connections()[1].port == 2222);
    REQUIRE_FALSE(manager.update_connection(9, renamed).success);

    REQUIRE(manager.remove_connection(0).success);
    REQUIRE(manager.connections().size() == 1);
    REQUIRE(manager.connections()[0].name == "database");
    REQUIRE(manager.remove_connection(5).message == "Please select a connection to delete");

    const auto reloaded = Config::load(config.path);
    REQUIRE(reloaded.ssh_connections.size() == 1);
    REQUIRE(reloaded.ssh_connections[0].name == "database");
}

TEST_CASE("SshManager::test_connection: outcome mapping", "[ssh][manager]") {
    FakeCommandRunner runner;
    TerminalLauncher launcher(runner);
    Config config;
    SshManager manager(runner, launcher, config);
    const auto conn = make_conn();

    runner.next_result = FakeCommandRunner::ok("Connection test successful\n");
    auto ok = manager.test_connection(conn);
    REQUIRE(ok.success);
    REQUIRE(ok.message == "SSH connection test successful!");
    REQUIRE(runner.runs.back().timeout == SshManager::kTestTimeout);
    REQUIRE(has_pair(runner.runs.back().argv, "-o", "BatchMode=yes"));

    runner.next_result = FakeCommandRunner::failed(255, "Permission denied (publickey).\n");
    auto denied = manager.test_connection(conn);
    REQUIRE_FALSE(denied.success);
    REQUIRE(denied.message.starts_with("Connection test failed:\nPermission denied (publickey)."));

    runner.next_result = FakeCommandRunner::timed_out();
    REQUIRE(manager.test_connection(conn).message == "Connection test timed out. Host may be unreachable.");

    auto no_host = conn;
    no_host.host.clear();
    REQUIRE(manager.test_connection(no_host).message == "Host and User are required for testing");
}

TEST_CASE("SshManager::connect: terminal window first", "[ssh][manager]") {
    FakeCommandRunner runner;
    runner.executables = {"xterm"};
    TerminalLauncher launcher(runner);
    Config config;
    SshManager manager(runner, launcher, config);
    SshSession session(runner);

    auto result = manager.connect(make_conn(), session);
    REQUIRE(result.success);
    REQUIRE(result.message == "SSH connection initiated to deploy@web.example.com");
    REQUIRE(runner.spawned.size() == 1);
    REQUIRE(runner.spawned[0][0] == "xterm");
    REQUIRE(has(runner.spawned[0], "-t"));
    REQUIRE_FALSE(session.is_open());

    const auto lines = session.output().lines();
    REQUIRE(lines.front() == "Connecting to deploy@web.example.com:22...");
    REQUIRE(lines.back() == "SSH session opened in new terminal window");
}

TEST_CASE("SshManager::connect: embedded fallback failure is reported", "[ssh][manager]") {
    FakeCommandRunner runner;
    TerminalLauncher launcher(runner);
    Config config;
    SshManager manager(runner, launcher, config);
    SshSession session(runner);

    auto result = manager.connect(make_conn(), session);
    REQUIRE_FALSE(result.success);
    REQUIRE(result.message == "Failed to start SSH session: start is not scripted");
    REQUIRE(has_pair(runner.runs.back().argv, "-o", "BatchMode=yes"));
    REQUIRE(has(runner.runs.back().argv, "-T"));
}

TEST_CASE("SshManager::quick_connect: validates the typed fields", "[ssh][manager]") {
    FakeCommandRunner runner;
    runner.executables = {"gnome-terminal"};
    TerminalLauncher launcher(runner);
    Config config;
    SshManager manager(runner, launcher, config);
    SshSession session(runner);

    REQUIRE(manager.quick_connect("", "root", "", session).message == "Please enter both host and user");
    REQUIRE(manager.quick_connect("host", "root", "abc", session).message == "Port must be a number");

    REQUIRE(manager.quick_connect(" host ", "root", "2200", session).success);
    REQUIRE(has_pair(runner.spawned.back(), "-p", "2200"));
    REQUIRE(runner.spawned.back().back() == "root@host");
}

TEST_CASE("SshManager::connect_foreground: exit codes", "[ssh][manager]") {
    FakeCommandRunner runner;
    TerminalLauncher launcher(runner);
    Config config;
    SshManager manager(runner, launcher, config);
    const auto conn = make_conn();

    auto ended = manager.connect_foreground(conn);
    REQUIRE(ended.success);
    REQUIRE(ended.message == "SSH session with deploy@web.example.com ended");
    REQUIRE(has(runner.foreground_runs.back(), "-t"));

    runner.foreground_exit_code = 255;
    auto failed = manager.connect_foreground(conn);
    REQUIRE_FALSE(failed.success);
    REQUIRE(failed.message == "Connection to deploy@web.example.com failed");

    runner.foreground_exit_code = -1;
    runner.foreground_error = "ssh: not found";
    REQUIRE(manager.connect_foreground(conn).message == "Failed to start SSH session: ssh: not found");
}
