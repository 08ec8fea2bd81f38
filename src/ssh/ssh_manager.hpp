#pragma once

#include "ssh_connection.hpp"
#include "ssh_session.hpp"
#include "../errors.hpp"
#include "../interfaces/i_command_runner.hpp"
#include "../terminal_launcher.hpp"
#include <string>
#include <vector>

namespace tman {

struct Config;

// Saved profiles plus the ways of reaching a host: a terminal window,
// the embedded session, or a non-interactive reachability check
class SshManager {
public:
    SshManager(ICommandRunner& runner, TerminalLauncher& launcher, Config& config);

    [[nodiscard]] const std::vector<SshConnection>& connections() const;

    // Profile changes are saved to the config file immediately
    ActionResult add_connection(const SshConnection& conn);
    ActionResult update_connection(size_t index, const SshConnection& conn);
    ActionResult remove_connection(size_t index);

    ActionResult test_connection(const SshConnection& conn);

    // Terminal window first, embedded session when no emulator can be started.
    // Progress lines go to the session's output.
    ActionResult connect(const SshConnection& conn, SshSession& session);

    // Interactive ssh on the caller's own terminal; returns when it exits.
    // ssh reserves exit code 255 for its own errors.
    ActionResult connect_foreground(const SshConnection& conn);

    // Unsaved connection from the quick-connect fields
    ActionResult quick_connect(const std::string& host, const std::string& user,
                               const std::string& port_text, SshSession& session);

    static constexpr auto kTestTimeout = std::chrono::seconds(15);

private:
    ActionResult persist(const std::string& success_message);

    ICommandRunner& runner_;
    TerminalLauncher& launcher_;
    Config& config_;
};

} // namespace tman
