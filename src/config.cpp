#include "config.hpp"
#include "util.hpp"

#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <limits>
#include <stdexcept>

namespace tman {

namespace {
constexpr int kMaxRefreshIntervalMs = 3600 * 1000;
constexpr int kMaxConnectTimeout = 3600;
}

nlohmann::json Config::defaults_json() {
    return {
        {"ssh_connections", nlohmann::json::array()},
        {"recent_files", nlohmann::json::array()},
        {"preferred_editor", "nano"},
        {"terminal_emulator", ""},
        {"monitor", {
            {"auto_refresh", true},
            {"refresh_interval_ms", 5000},
            {"max_processes", 0}
        }},
        {"ssh", {
            {"strict_host_key_checking", "accept-new"},
            {"connect_timeout", 10},
            {"program", "ssh"}
        }}
    };
}

static nlohmann::json merge_defaults(const nlohmann::json& existing,
                                     const nlohmann::json& defaults) {
    nlohmann::json merged = existing;
    for (auto& [key, value] : defaults.items()) {
        if (!merged.contains(key)) {
            merged[key] = value;
        } else if (value.is_object() && merged[key].is_object()) {
            merged[key] = merge_defaults(merged[key], value);
        }
    }
    return merged;
}

// JSON integers are 64-bit; narrow to int only after clamping
static int clamped_int(const nlohmann::json& value, const int lo, const int hi) {
    if (value.is_number_unsigned()) {
        return static_cast<int>(std::min<uint64_t>(value.get<uint64_t>(), static_cast<uint64_t>(hi)));
    }
    return static_cast<int>(std::clamp<int64_t>(value.get<int64_t>(), lo, hi));
}

static void apply_json(Config& cfg, const nlohmann::json& j) {
    if (j.contains("ssh_connections") && j["ssh_connections"].is_array()) {
        for (const auto& c : j["ssh_connections"]) {
            if (!c.is_object()) continue;
            SshConnection conn;
            if (c.contains("name") && c["name"].is_string())
                conn.name = c["name"].get<std::string>();
            if (c.contains("host") && c["host"].is_string())
                conn.host = c["host"].get<std::string>();
            if (c.contains("user") && c["user"].is_string())
                conn.user = c["user"].get<std::string>();
            // Clamped just past the valid range so validate() still rejects it
            if (c.contains("port") && c["port"].is_number_integer())
                conn.port = clamped_int(c["port"], 0, 65536);
            if (c.contains("key_file") && c["key_file"].is_string())
                conn.key_file = c["key_file"].get<std::string>();

            if (conn.name.empty() || conn.host.empty() || conn.user.empty()) {
                std::cerr << "[config] Skipping incomplete SSH connection entry\n";
                continue;
            }
            if (const auto check = conn.validate(); !check.valid) {
                std::cerr << "[config] Skipping SSH connection '" << conn.name << "': " << check.error << "\n";
                continue;
            }
            cfg.ssh_connections.push_back(std::move(conn));
        }
    }

    if (j.contains("recent_files") && j["recent_files"].is_array()) {
        for (const auto& f : j["recent_files"]) {
            if (f.is_string() && cfg.recent_files.size() < Config::kMaxRecentFiles)
                cfg.recent_files.push_back(f.get<std::string>());
        }
    }

    if (j.contains("preferred_editor") && j["preferred_editor"].is_string())
        cfg.preferred_editor = j["preferred_editor"].get<std::string>();
    if (j.contains("terminal_emulator") && j["terminal_emulator"].is_string())
        cfg.terminal_emulator = j["terminal_emulator"].get<std::string>();

    if (j.contains("monitor") && j["monitor"].is_object()) {
        auto& m = j["monitor"];
        if (m.contains("auto_refresh") && m["auto_refresh"].is_boolean())
            cfg.monitor.auto_refresh = m["auto_refresh"].get<bool>();
        if (m.contains("refresh_interval_ms") && m["refresh_interval_ms"].is_number_integer())
            cfg.monitor.refresh_interval_ms = clamped_int(m["refresh_interval_ms"], 250, kMaxRefreshIntervalMs);
        if (m.contains("max_processes") && m["max_processes"].is_number_integer())
            cfg.monitor.max_processes = clamped_int(m["max_processes"], 0, std::numeric_limits<int>::max());
    }

    if (j.contains("ssh") && j["ssh"].is_object()) {
        auto& s = j["ssh"];
        if (s.contains("strict_host_key_checking") && s["strict_host_key_checking"].is_string())
            cfg.ssh.strict_host_key_checking = s["strict_host_key_checking"].get<std::string>();
        if (s.contains("connect_timeout") && s["connect_timeout"].is_number_integer())
            cfg.ssh.connect_timeout = clamped_int(s["connect_timeout"], 1, kMaxConnectTimeout);
        if (s.contains("program") && s["program"].is_string())
            cfg.ssh.program = s["program"].get<std::string>();
    }
}

Config Config::load(const std::string& path) {
    Config cfg;
    cfg.path = path;
    nlohmann::json j;

    std::ifstream file(path);
    if (file.is_open()) {
        try {
            nlohmann::json original = nlohmann::json::parse(file);
            file.close();
            if (!original.is_object()) {
                throw std::runtime_error("top-level value is not an object");
            }
            j = merge_defaults(original, defaults_json());
            if (j != original) {
                std::string error;
                if (atomic_write_file(path, j.dump(2) + "\n", error)) {
                    std::cerr << "[config] Migrated config with new defaults: " << path << "\n";
                } else {
                    std::cerr << "[config] " << error << "\n";
                }
            }
        } catch (const std::exception& e) {
            // Left on disk as-is; the next save() replaces it
            std::cerr << "[config] Malformed config " << path << " (" << e.what()
                      << "), using defaults\n";
            j = defaults_json();
        }
    } else {
        j = defaults_json();
        std::string error;
        if (atomic_write_file(path, j.dump(2) + "\n", error)) {
            std::cerr << "[config] Created default config: " << path << "\n";
        } else {
            std::cerr << "[config] " << error << "\n";
        }
    }

    apply_json(cfg, j);
    return cfg;
}

std::string Config::default_path() {
    if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg) {
        return std::string(xdg) + "/tman/config.json";
    }
    return expand_home("~/.config/tman/config.json");
}

nlohmann::json Config::to_json() const {
    nlohmann::json connections = nlohmann::json::array();
    for (const auto& c : ssh_connections) {
        connections.push_back({
            {"name", c.name},
            {"host", c.host},
            {"user", c.user},
            {"port", c.port},
            {"key_file", c.key_file}
        });
    }

    return {
        {"ssh_connections", connections},
        {"recent_files", recent_files},
        {"preferred_editor", preferred_editor},
        {"terminal_emulator", terminal_emulator},
        {"monitor", {
            {"auto_refresh", monitor.auto_refresh},
            {"refresh_interval_ms", monitor.refresh_interval_ms},
            {"max_processes", monitor.max_processes}
        }},
        {"ssh", {
            {"strict_host_key_checking", ssh.strict_host_key_checking},
            {"connect_timeout", ssh.connect_timeout},
            {"program", ssh.program}
        }}
    };
}

ActionResult Config::save() const {
    if (path.empty()) {
        return {false, "Failed to save config: no config path"};
    }
    std::string error;
    if (!atomic_write_file(path, to_json().dump(2) + "\n", error)) {
        return {false, "Failed to save config: " + error};
    }
    return {true, "Settings saved"};
}

void Config::add_recent_file(const std::string& file) {
    std::erase(recent_files, file);
    recent_files.insert(recent_files.begin(), file);
    if (recent_files.size() > kMaxRecentFiles) {
        recent_files.resize(kMaxRecentFiles);
    }
}

bool Config::remove_recent_file(const std::string& file) {
    return std::erase(recent_files, file) > 0;
}

} // namespace tman
