#pragma once

#include "../errors.hpp"
#include <string>
#include <vector>

namespace tman {

// Client-side options applied to every ssh invocation
struct SshOptions {
    std::string strict_host_key_checking = "accept-new";
    int connect_timeout = 10;   // seconds
    std::string program = "ssh";
};

// A saved connection profile. Only the key file path is stored, never a secret.
struct SshConnection {
    std::string name;
    std::string host;
    std::string user;
    int port = 22;
    std::string key_file;

    // name, host and user are required; port must be 1-65535.
    // Host and user must pass ssh_target_error().
    // A key file that does not exist is reported as a warning only.
    [[nodiscard]] ValidationResult validate() const;

    // "name (user@host:port)"
    [[nodiscard]] std::string display_string() const;

    [[nodiscard]] std::string target() const { return user + "@" + host; }

    bool operator==(const SshConnection&) const = default;
};

enum class SshMode {
    Interactive,    // Terminal window, forces a tty
    Embedded,       // Piped session, no tty, never prompts
    Test            // Non-interactive reachability check
};

// Host and user end up as one argv word for ssh. A leading '-' would be
// read as an option, so it is refused along with whitespace, control
// characters and an '@' in the host. Empty when both are usable.
std::string ssh_target_error(const std::string& host, const std::string& user);

// Builds the full argv for the ssh client, program name first.
// `remote_command` is appended after the target when non-empty.
std::vector<std::string> build_ssh_args(const SshConnection& conn,
                                        const SshOptions& options,
                                        SshMode mode,
                                        const std::vector<std::string>& remote_command = {});

// Parses a port field typed by the user. Empty means 22.
bool parse_port(const std::string& text, int& port, std::string& error);

} // namespace tman
