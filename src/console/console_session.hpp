#pragma once

#include "../command_history.hpp"
#include "../errors.hpp"
#include "../interfaces/i_command_runner.hpp"
#include "../output_buffer.hpp"
#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace tman {

// Runs one shell command at a time in a chosen directory and streams its
// combined output into a scrollback buffer
class ConsoleSession {
public:
    // An empty or invalid directory falls back to the process's current one
    explicit ConsoleSession(ICommandRunner& runner, const std::string& working_dir = {});
    ~ConsoleSession();

    ConsoleSession(const ConsoleSession&) = delete;
    ConsoleSession& operator=(const ConsoleSession&) = delete;

    // Handles the built-ins (clear, cd, pwd, exit/quit) or starts `/bin/sh -c`
    void execute(const std::string& command);

    ActionResult set_working_dir(const std::string& dir);
    [[nodiscard]] std::string working_dir() const;

    [[nodiscard]] bool is_busy() const { return busy_; }

    // SIGTERM to the command's process group, SIGKILL after the grace period
    ActionResult stop();

    OutputBuffer& output() { return output_; }
    CommandHistory& history() { return history_; }

    static constexpr auto kStopGracePeriod = std::chrono::seconds(2);

private:
    bool handle_builtin(const std::string& command);
    void change_directory(const std::string& arg);
    void reader_loop(IChildProcess* child);
    // Joins a finished reader and drops its child
    void reap_finished();

    ICommandRunner& runner_;
    OutputBuffer output_;
    CommandHistory history_;

    mutable std::mutex dir_mutex_;
    std::string working_dir_;

    std::unique_ptr<IChildProcess> child_;
    std::thread reader_;
    std::atomic<bool> busy_{false};
};

} // namespace tman
