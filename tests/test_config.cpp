#include <catch2/catch.hpp>
#include "config.hpp"
#include "temp_dir.hpp"
#include <cstdlib>
#include <filesystem>
#include <limits>
#include <nlohmann/json.hpp>

using namespace tman;

TEST_CASE("Config: missing file is created with defaults", "[config]") {
    TempDir dir;
    const std::string path = dir.file("tman/config.json");

    Config cfg = Config::load(path);
    REQUIRE(cfg.path == path);
    REQUIRE(cfg.preferred_editor == "nano");
    REQUIRE(cfg.terminal_emulator.empty());
    REQUIRE(cfg.monitor.auto_refresh);
    REQUIRE(cfg.monitor.refresh_interval_ms == 5000);
    REQUIRE(cfg.ssh.strict_host_key_checking == "accept-new");
    REQUIRE(cfg.ssh_connections.empty());

    REQUIRE(std::filesystem::exists(path));
    const auto on_disk = nlohmann::json::parse(read_file(path));
    REQUIRE(on_disk == Config::defaults_json());
}

TEST_CASE("Config: missing keys are filled and written back", "[config]") {
    TempDir dir;
    const std::string path = dir.write("config.json", R"({
        "preferred_editor": "vim",
        "monitor": {"refresh_interval_ms": 2000}
    })");

    Config cfg = Config::load(path);
    REQUIRE(cfg.preferred_editor == "vim");
    REQUIRE(cfg.monitor.refresh_interval_ms == 2000);
    REQUIRE(cfg.monitor.auto_refresh);
    REQUIRE(cfg.ssh.connect_timeout == 10);

    const auto on_disk = nlohmann::json::parse(read_file(path));
    REQUIRE(on_disk["preferred_editor"] == "vim");
    REQUIRE(on_disk["monitor"]["refresh_interval_ms"] == 2000);
    REQUIRE(on_disk["monitor"]["max_processes"] == 0);
    REQUIRE(on_disk.contains("ssh_connections"));
}

TEST_CASE("Config: malformed file falls back to defaults and is left alone", "[config]") {
    TempDir dir;
    const std::string broken = "{ this is not json";
    const std::string path = dir.write("config.json", broken);

    Config cfg = Config::load(path);
    REQUIRE(cfg.preferred_editor == "nano");
    REQUIRE(read_file(path) == broken);

    // The next save replaces it
    cfg.preferred_editor = "vi";
    REQUIRE(cfg.save().success);
    REQUIRE(nlohmann::json::parse(read_file(path))["preferred_editor"] == "vi");
}

TEST_CASE("Config: incomplete SSH entries are skipped", "[config]") {
    TempDir dir;
    const std::string path = dir.write("config.json", R"({
        "ssh_connections": [
            {"name": "web", "host": "web.example.com", "user": "deploy", "port": 2222, "key_file": "~/.ssh/id_web"},
            {"name": "nohost", "user": "x"},
            "not an object"
        ]
    })");

    Config cfg = Config::load(path);
    REQUIRE(cfg.ssh_connections.size() == 1);
    const auto& conn = cfg.ssh_connections.front();
    REQUIRE(conn.name == "web");
    REQUIRE(conn.port == 2222);
    REQUIRE(conn.key_file == "~/.ssh/id_web");
}

TEST_CASE("Config: out-of-range monitor values are clamped", "[config]") {
    TempDir dir;
    const std::string path = dir.write("config.json", R"({
        "monitor": {"refresh_interval_ms": 10, "max_processes": -4}
    })");

    Config cfg = Config::load(path);
    REQUIRE(cfg.monitor.refresh_interval_ms == 250);
    REQUIRE(cfg.monitor.max_processes == 0);
}

TEST_CASE("Config: SSH entries that fail validation are skipped", "[config]") {
    TempDir dir;
    const std::string path = dir.write("config.json", R"({
        "ssh_connections": [
            {"name": "opt", "host": "example.org", "user": "-oProxyCommand=touch /tmp/x"},
            {"name": "dash", "host": "-F/tmp/cfg", "user": "deploy"},
            {"name": "zero", "host": "example.org", "user": "deploy", "port": 0},
            {"name": "huge", "host": "example.org", "user": "deploy", "port": 4294967318},
            {"name": "ok", "host": "example.org", "user": "deploy", "port": 65535}
        ]
    })");

    Config cfg = Config::load(path);
    REQUIRE(cfg.ssh_connections.size() == 1);
    REQUIRE(cfg.ssh_connections.front().name == "ok");
    REQUIRE(cfg.ssh_connections.front().port == 65535);
}

TEST_CASE("Config: 64-bit integers are clamped, not truncated", "[config]") {
    TempDir dir;
    const std::string path = dir.write("config.json", R"({
        "monitor": {"refresh_interval_ms": 4294967546, "max_processes": 9223372036854775807},
        "ssh": {"connect_timeout": -4294967295}
    })");

    Config cfg = Config::load(path);
    REQUIRE(cfg.monitor.refresh_interval_ms == 3600 * 1000);
    REQUIRE(cfg.monitor.max_processes == std::numeric_limits<int>::max());
    REQUIRE(cfg.ssh.connect_timeout == 1);
}

TEST_CASE("Config: save and reload keeps profiles and recent files", "[config]") {
    TempDir dir;
    const std::string path = dir.file("config.json");

    Config cfg = Config::load(path);
    SshConnection conn;
    conn.name = "db";
    conn.host = "10.0.0.5";
    conn.user = "admin";
    cfg.ssh_connections.push_back(conn);
    cfg.add_recent_file("/etc/hosts");
    cfg.monitor.auto_refresh = false;
    REQUIRE(cfg.save().success);

    Config reloaded = Config::load(path);
    REQUIRE(reloaded.ssh_connections.size() == 1);
    REQUIRE(reloaded.ssh_connections.front() == conn);
    REQUIRE(reloaded.recent_files == std::vector<std::string>{"/etc/hosts"});
    REQUIRE_FALSE(reloaded.monitor.auto_refresh);
}

TEST_CASE("Config: save without a path fails", "[config]") {
    Config cfg;
    auto result = cfg.save();
    REQUIRE_FALSE(result.success);
    REQUIRE(result.message.find("no config path") != std::string::npos);
}

TEST_CASE("Config: recent files are most-recent-first, unique and bounded", "[config]") {
    Config cfg;
    cfg.add_recent_file("/a");
    cfg.add_recent_file("/b");
    cfg.add_recent_file("/a");
    REQUIRE(cfg.recent_files == std::vector<std::string>{"/a", "/b"});

    for (int i = 0; i < 20; ++i) {
        cfg.add_recent_file("/f" + std::to_string(i));
    }
    REQUIRE(cfg.recent_files.size() == Config::kMaxRecentFiles);
    REQUIRE(cfg.recent_files.front() == "/f19");

    REQUIRE(cfg.remove_recent_file("/f19"));
    REQUIRE_FALSE(cfg.remove_recent_file("/f19"));
    REQUIRE(cfg.recent_files.front() == "/f18");
}

TEST_CASE("Config: default_path follows XDG_CONFIG_HOME", "[config]") {
    const char* old = std::getenv("XDG_CONFIG_HOME");
    const std::string saved = old ? old : "";

    setenv("XDG_CONFIG_HOME", "/tmp/xdg-test", 1);
    REQUIRE(Config::default_path() == "/tmp/xdg-test/tman/config.json");

    unsetenv("XDG_CONFIG_HOME");
    REQUIRE(Config::default_path().ends_with("/.config/tman/config.json"));

    if (old) setenv("XDG_CONFIG_HOME", saved.c_str(), 1);
}
