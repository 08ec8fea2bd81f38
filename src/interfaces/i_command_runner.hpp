#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace tman {

struct CommandSpec {
    std::vector<std::string> argv;          // argv[0] is looked up on PATH, no shell involved
    std::string working_dir;                // Empty = inherit
    std::optional<std::string> stdin_data;  // Written then closed; nullopt = /dev/null
    std::chrono::milliseconds timeout{0};   // 0 = wait forever
};

struct CommandResult {
    bool launched = false;       // false if the program could not be executed at all
    int exit_code = -1;          // 128 + signal when terminated by a signal
    bool timed_out = false;
    std::string output;          // stdout
    std::string error_output;    // stderr
    std::string error_message;   // Why launching failed

    [[nodiscard]] bool succeeded() const { return launched && !timed_out && exit_code == 0; }
};

// A running child with piped stdin and merged stdout/stderr.
class IChildProcess {
public:
    virtual ~IChildProcess() = default;

    [[nodiscard]] virtual int pid() const = 0;

    // Appends available output to `out`, waiting at most `timeout`.
    // Returns false once the output stream has reached EOF.
    virtual bool read_output(std::string& out, std::chrono::milliseconds timeout) = 0;

    virtual bool write_input(const std::string& data) = 0;
    virtual void close_input() = 0;

    // SIGTERM, or SIGKILL when force is set
    virtual void terminate(bool force) = 0;

    // Reaps the child and returns its exit code (128 + signal if signalled).
    // Safe to call more than once.
    virtual int wait() = 0;
    [[nodiscard]] virtual bool is_running() = 0;
};

class ICommandRunner {
public:
    virtual ~ICommandRunner() = default;

    // Runs to completion (or timeout) and captures output
    virtual CommandResult run(const CommandSpec& spec) = 0;

    // Starts a program that outlives the call; nothing is captured.
    // Returns false if the program is not on PATH or could not be started.
    virtual bool spawn_detached(const std::vector<std::string>& argv) = 0;

    // Starts an interactive child. Returns nullptr and fills `error` on failure.
    virtual std::unique_ptr<IChildProcess> start(const CommandSpec& spec, std::string& error) = 0;

    // Runs in the foreground on the caller's own terminal and waits.
    // Returns the exit code, or -1 with `error` set if it could not start.
    virtual int run_foreground(const std::vector<std::string>& argv, std::string& error) = 0;

    [[nodiscard]] virtual bool find_executable(const std::string& name) const = 0;
};

} // namespace tman
