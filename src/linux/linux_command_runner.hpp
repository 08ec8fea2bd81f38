#pragma once

#include "../interfaces/i_command_runner.hpp"
#include <mutex>
#include <sys/types.h>

namespace tman {

class LinuxChildProcess : public IChildProcess {
public:
    LinuxChildProcess(pid_t pid, int stdin_fd, int output_fd);
    ~LinuxChildProcess() override;

    LinuxChildProcess(const LinuxChildProcess&) = delete;
    LinuxChildProcess& operator=(const LinuxChildProcess&) = delete;

    [[nodiscard]] int pid() const override { return pid_; }
    bool read_output(std::string& out, std::chrono::milliseconds timeout) override;
    bool write_input(const std::string& data) override;
    void close_input() override;
    void terminate(bool force) override;
    int wait() override;
    [[nodiscard]] bool is_running() override;

private:
    pid_t pid_;
    int stdin_fd_;
    int output_fd_;

    std::mutex state_mutex_;
    bool reaped_ = false;
    int exit_code_ = -1;
};

class LinuxCommandRunner : public ICommandRunner {
public:
    LinuxCommandRunner() = default;
    ~LinuxCommandRunner() override = default;

    CommandResult run(const CommandSpec& spec) override;
    bool spawn_detached(const std::vector<std::string>& argv) override;
    std::unique_ptr<IChildProcess> start(const CommandSpec& spec, std::string& error) override;
    int run_foreground(const std::vector<std::string>& argv, std::string& error) override;
    [[nodiscard]] bool find_executable(const std::string& name) const override;

    // Converts a waitpid() status to an exit code, 128 + signal when signalled
    static int decode_status(int status);
};

} // namespace tman
