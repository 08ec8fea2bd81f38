#pragma once

#include "errors.hpp"
#include "ssh/ssh_connection.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace tman {

struct MonitorConfig {
    bool auto_refresh = true;
    int refresh_interval_ms = 5000;
    int max_processes = 0;      // 0 = no limit
};

struct Config {
    std::vector<SshConnection> ssh_connections;
    std::vector<std::string> recent_files;     // Most recent first
    std::string preferred_editor = "nano";
    std::string terminal_emulator;             // Empty = auto-detect
    MonitorConfig monitor;
    SshOptions ssh;

    // File this config was loaded from and is saved to
    std::string path;

    // Load from `path`, filling missing keys from defaults.
    // A missing file is created with defaults. A malformed file falls back to
    // defaults and is left untouched until save() is called.
    static Config load(const std::string& path);

    // $XDG_CONFIG_HOME/tman/config.json, or ~/.config/tman/config.json
    static std::string default_path();

    static nlohmann::json defaults_json();
    [[nodiscard]] nlohmann::json to_json() const;

    ActionResult save() const;

    void add_recent_file(const std::string& file);
    bool remove_recent_file(const std::string& file);

    static constexpr size_t kMaxRecentFiles = 10;
};

} // namespace tman
