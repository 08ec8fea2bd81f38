#include "ssh_manager.hpp"
#include "../config.hpp"
#include "../util.hpp"
#include <algorithm>
#include <format>

namespace tman {

SshManager::SshManager(ICommandRunner& runner, TerminalLauncher& launcher, Config& config)
    : runner_(runner)
    , launcher_(launcher)
    , config_(config) {
}

const std::vector<SshConnection>& SshManager::connections() const {
    return config_.ssh_connections;
}

ActionResult SshManager::persist(const std::string& success_message) {
    if (auto saved = config_.save(); !saved.success) {
        return {false, success_message + ", but " + saved.message};
    }
    return {true, success_message};
}

ActionResult SshManager::add_connection(const SshConnection& conn) {
    if (auto check = conn.validate(); !check.valid) {
        return {false, check.error};
    }
    const bool duplicate = std::ranges::any_of(config_.ssh_connections,
        [&conn](const SshConnection& c) { return c.name == conn.name; });
    if (duplicate) {
        return {false, std::format("A connection named '{}' already exists", conn.name)};
    }

    config_.ssh_connections.push_back(conn);
    return persist("SSH connection added successfully");
}

ActionResult SshManager::update_connection(const size_t index, const SshConnection& conn) {
    if (index >= config_.ssh_connections.size()) {
        return {false, "Please select a connection to edit"};
    }
    if (auto check = conn.validate(); !check.valid) {
        return {false, check.error};
    }
    for (size_t i = 0; i < config_.ssh_connections.size(); ++i) {
        if (i != index && config_.ssh_connections[i].name == conn.name) {
            return {false, std::format("A connection named '{}' already exists", conn.name)};
        }
    }

    config_.ssh_connections[index] = conn;
    return persist("SSH connection updated successfully");
}

ActionResult SshManager::remove_connection(const size_t index) {
    if (index >= config_.ssh_connections.size()) {
        return {false, "Please select a connection to delete"};
    }
    config_.ssh_connections.erase(config_.ssh_connections.begin() + static_cast<std::ptrdiff_t>(index));
    return persist("SSH connection deleted successfully");
}

ActionResult SshManager::test_connection(const SshConnection& conn) {
    if (trim(conn.host).empty() || trim(conn.user).empty()) {
        return {false, "Host and User are required for testing"};
    }
    if (auto error = ssh_target_error(conn.host, conn.user); !error.empty()) {
        return {false, error};
    }
    if (conn.port < 1 || conn.port > 65535) {
        return {false, "Invalid port: Port must be between 1 and 65535"};
    }

    CommandSpec spec;
    spec.argv = build_ssh_args(conn, config_.ssh, SshMode::Test, {"echo", "Connection test successful"});
    spec.timeout = kTestTimeout;
    const auto result = runner_.run(spec);

    if (!result.launched) {
        return {false, "Connection test failed:\n" + result.error_message};
    }
    if (result.timed_out) {
        return {false, "Connection test timed out. Host may be unreachable."};
    }
    if (result.exit_code != 0) {
        return {false, std::format("Connection test failed:\n{}\n\n"
                                   "This might be due to:\n"
                                   "- Host unreachable\n"
                                   "- Wrong credentials\n"
                                   "- Firewall blocking\n"
                                   "- SSH key issues",
                                   trim(result.error_output))};
    }
    return {true, "SSH connection test successful!"};
}

ActionResult SshManager::connect(const SshConnection& conn, SshSession& session) {
    if (trim(conn.host).empty() || trim(conn.user).empty()) {
        return {false, "Please enter both host and user"};
    }
    if (auto error = ssh_target_error(conn.host, conn.user); !error.empty()) {
        return {false, error};
    }

    auto& out = session.output();
    out.append_line(std::format("Connecting to {}@{}:{}...", conn.user, conn.host, conn.port));

    if (launcher_.launch(build_ssh_args(conn, config_.ssh, SshMode::Interactive))) {
        out.append_line("SSH session opened in new terminal window");
        return {true, "SSH connection initiated to " + conn.target()};
    }

    out.append_line("Could not open terminal window, trying embedded connection...");
    std::string error;
    if (!session.open(build_ssh_args(conn, config_.ssh, SshMode::Embedded), error)) {
        out.append_line("Failed to start embedded SSH: " + error);
        return {false, "Failed to start SSH session: " + error};
    }
    out.append_line("Embedded SSH session started");
    return {true, "SSH connection initiated to " + conn.target()};
}

ActionResult SshManager::connect_foreground(const SshConnection& conn) {
    if (trim(conn.host).empty() || trim(conn.user).empty()) {
        return {false, "Please enter both host and user"};
    }
    if (auto error = ssh_target_error(conn.host, conn.user); !error.empty()) {
        return {false, error};
    }

    std::string error;
    const int code = runner_.run_foreground(build_ssh_args(conn, config_.ssh, SshMode::Interactive), error);
    if (code < 0) {
        return {false, "Failed to start SSH session: " + error};
    }
    if (code == 255) {
        return {false, std::format("Connection to {} failed", conn.target())};
    }
    return {true, std::format("SSH session with {} ended", conn.target())};
}

ActionResult SshManager::quick_connect(const std::string& host, const std::string& user,
                                       const std::string& port_text, SshSession& session) {
    SshConnection conn;
    conn.name = "quick";
    conn.host = trim(host);
    conn.user = trim(user);
    if (conn.host.empty() || conn.user.empty()) {
        return {false, "Please enter both host and user"};
    }
    if (auto error = ssh_target_error(conn.host, conn.user); !error.empty()) {
        return {false, error};
    }
    if (std::string error; !parse_port(port_text, conn.port, error)) {
        return {false, error};
    }
    return connect(conn, session);
}

} // namespace tman
