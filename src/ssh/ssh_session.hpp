#pragma once

#include "../command_history.hpp"
#include "../errors.hpp"
#include "../interfaces/i_command_runner.hpp"
#include "../output_buffer.hpp"
#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace tman {

// An ssh client running on pipes inside the application window.
// There is no tty, so the client must never prompt (BatchMode).
class SshSession {
public:
    explicit SshSession(ICommandRunner& runner);
    ~SshSession();

    SshSession(const SshSession&) = delete;
    SshSession& operator=(const SshSession&) = delete;

    // Starts the client; an open session is disconnected first
    bool open(const std::vector<std::string>& argv, std::string& error);

    // Writes one line to the remote shell and echoes it as "$ <command>"
    ActionResult send(const std::string& command);

    ActionResult disconnect();

    [[nodiscard]] bool is_open() const { return open_; }

    // Exit code of the last client once it has ended
    [[nodiscard]] std::optional<int> exit_status() const;

    OutputBuffer& output() { return output_; }
    CommandHistory& history() { return history_; }

    static constexpr auto kDisconnectGracePeriod = std::chrono::seconds(2);

private:
    void reader_loop(IChildProcess* child);
    void close_child();

    ICommandRunner& runner_;
    OutputBuffer output_;
    CommandHistory history_;

    std::unique_ptr<IChildProcess> child_;
    std::thread reader_;
    std::atomic<bool> open_{false};
    std::atomic<bool> closing_{false};

    mutable std::mutex status_mutex_;
    std::optional<int> exit_status_;
};

} // namespace tman
