#include "linux_command_runner.hpp"
#include <algorithm>
#include <array>
#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <format>
#include <poll.h>
#include <sys/stat.h>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>

namespace tman {

namespace {

// Both ends are O_CLOEXEC so concurrent spawns never inherit each other's pipes
struct Pipe {
    int read_end = -1;
    int write_end = -1;

    Pipe() = default;
    Pipe(const Pipe&) = delete;
    Pipe& operator=(const Pipe&) = delete;
    ~Pipe() {
        close_read();
        close_write();
    }

    bool open() {
        int fds[2];
        if (pipe2(fds, O_CLOEXEC) != 0) return false;
        read_end = fds[0];
        write_end = fds[1];
        return true;
    }
    void close_read() {
        if (read_end >= 0) ::close(read_end);
        read_end = -1;
    }
    void close_write() {
        if (write_end >= 0) ::close(write_end);
        write_end = -1;
    }
    int release_read() {
        const int fd = read_end;
        read_end = -1;
        return fd;
    }
    int release_write() {
        const int fd = write_end;
        write_end = -1;
        return fd;
    }
};

constexpr int kExitCheckMs = 100;

enum LaunchStage : int {
    kStageChdir = 1,
    kStageExec = 2
};

// Runs in the forked child. Reports the failing stage and errno through
// status_fd; a successful exec closes it silently.
[[noreturn]] void exec_child(const std::vector<char*>& argv, const std::string& working_dir, const int status_fd) {
    int report[2] = {0, 0};
    if (!working_dir.empty() && chdir(working_dir.c_str()) != 0) {
        report[0] = kStageChdir;
        report[1] = errno;
    } else {
        execvp(argv[0], argv.data());
        report[0] = kStageExec;
        report[1] = errno;
    }
    [[maybe_unused]] auto n = write(status_fd, report, sizeof(report));
    _exit(127);
}

std::vector<char*> make_argv(const std::vector<std::string>& args) {
    std::vector<char*> argv;
    argv.reserve(args.size() + 1);
    for (const auto& arg : args) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);
    return argv;
}

// Blocks until the child execs or dies. Returns an error message if it never got to exec.
std::string read_launch_status(const int status_fd, const std::string& program, const std::string& working_dir) {
    int report[2] = {0, 0};
    size_t got = 0;
    auto* buf = reinterpret_cast<char*>(report);
    while (got < sizeof(report)) {
        const ssize_t n = read(status_fd, buf + got, sizeof(report) - got);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) break;
        got += static_cast<size_t>(n);
    }
    if (got < sizeof(report)) return {};

    if (report[0] == kStageChdir) {
        return std::format("Cannot change to directory {}: {}", working_dir, strerror(report[1]));
    }
    if (report[1] == ENOENT) {
        return std::format("{}: command not found", program);
    }
    return std::format("{}: {}", program, strerror(report[1]));
}

pid_t wait_pid(const pid_t pid, int& status, const int options) {
    pid_t ret;
    do {
        ret = waitpid(pid, &status, options);
    } while (ret < 0 && errno == EINTR);
    return ret;
}

bool write_all(const int fd, const std::string& data) {
    size_t written = 0;
    while (written < data.size()) {
        const ssize_t n = write(fd, data.data() + written, data.size() - written);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) return false;
        written += static_cast<size_t>(n);
    }
    return true;
}

} // namespace

int LinuxCommandRunner::decode_status(const int status) {
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
    return -1;
}

CommandResult LinuxCommandRunner::run(const CommandSpec& spec) {
    CommandResult result;
    if (spec.argv.empty() || spec.argv[0].empty()) {
        result.error_message = "No command given";
        return result;
    }

    Pipe out, err, in, status;
    if (!out.open() || !err.open() || !status.open() || (spec.stdin_data && !in.open())) {
        result.error_message = std::format("Failed to create pipes: {}", strerror(errno));
        return result;
    }

    auto argv = make_argv(spec.argv);
    const pid_t pid = fork();
    if (pid < 0) {
        result.error_message = std::format("Failed to fork: {}", strerror(errno));
        return result;
    }

    if (pid == 0) {
        if (in.read_end >= 0) {
            dup2(in.read_end, STDIN_FILENO);
        } else if (const int devnull = open("/dev/null", O_RDONLY); devnull >= 0) {
            dup2(devnull, STDIN_FILENO);
        }
        dup2(out.write_end, STDOUT_FILENO);
        dup2(err.write_end, STDERR_FILENO);
        exec_child(argv, spec.working_dir, status.write_end);
    }

    out.close_write();
    err.close_write();
    in.close_read();
    status.close_write();

    if (auto launch_error = read_launch_status(status.read_end, spec.argv[0], spec.working_dir); !launch_error.empty()) {
        int st = 0;
        wait_pid(pid, st, 0);
        result.exit_code = 127;
        result.error_message = std::move(launch_error);
        return result;
    }
    result.launched = true;

    const std::string pending = spec.stdin_data.value_or("");
    size_t written = 0;
    if (in.write_end >= 0) {
        if (pending.empty()) {
            in.close_write();
        } else {
            fcntl(in.write_end, F_SETFL, fcntl(in.write_end, F_GETFL) | O_NONBLOCK);
        }
    }

    const bool has_deadline = spec.timeout.count() > 0;
    const auto deadline = std::chrono::steady_clock::now() + spec.timeout;
    auto remaining_ms = [&]() -> int {
        if (!has_deadline) return -1;
        const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
        return static_cast<int>(std::max<int64_t>(0, left.count()));
    };

    std::array<char, 4096> buffer;
    auto read_into = [&](int& fd) {
        const ssize_t n = read(fd, buffer.data(), buffer.size());
        if (n > 0) {
            std::string& target = &fd == &out.read_end ? result.output : result.error_output;
            target.append(buffer.data(), static_cast<size_t>(n));
            return true;
        }
        if (n < 0 && errno == EINTR) return true;
        if (n < 0 && errno == EAGAIN) return false;
        ::close(fd);
        fd = -1;
        return false;
    };

    int st = 0;
    bool reaped = false;
    while (out.read_end >= 0 || err.read_end >= 0) {
        int wait_ms = remaining_ms();
        if (has_deadline && wait_ms == 0) {
            result.timed_out = true;
            break;
        }
        // Wake periodically to notice a child that exited while a
        // background descendant still holds the output pipes open
        wait_ms = wait_ms < 0 ? kExitCheckMs : std::min(wait_ms, kExitCheckMs);

        pollfd fds[3];
        int* owners[3];
        nfds_t count = 0;
        for (int* fd : {&out.read_end, &err.read_end}) {
            if (*fd >= 0) {
                fds[count] = {*fd, POLLIN, 0};
                owners[count++] = fd;
            }
        }
        if (in.write_end >= 0) {
            fds[count] = {in.write_end, POLLOUT, 0};
            owners[count++] = &in.write_end;
        }

        const int ret = poll(fds, count, wait_ms);
        if (ret < 0) {
            if (errno == EINTR) continue;
            break;
        }

        for (nfds_t i = 0; i < count && ret > 0; ++i) {
            if (fds[i].revents == 0) continue;

            if (owners[i] == &in.write_end) {
                if (fds[i].revents & POLLOUT) {
                    const ssize_t n = write(in.write_end, pending.data() + written, pending.size() - written);
                    if (n > 0) written += static_cast<size_t>(n);
                    if (written >= pending.size() || (n < 0 && errno != EAGAIN && errno != EINTR)) {
                        in.close_write();
                    }
                } else {
                    in.close_write();
                }
                continue;
            }

            read_into(*owners[i]);
        }

        if (ret == 0 && wait_pid(pid, st, WNOHANG) == pid) {
            reaped = true;
            // Take whatever is already buffered, then stop listening
            for (int* fd : {&out.read_end, &err.read_end}) {
                if (*fd < 0) continue;
                fcntl(*fd, F_SETFL, fcntl(*fd, F_GETFL) | O_NONBLOCK);
                while (*fd >= 0 && read_into(*fd)) {}
                if (*fd >= 0) {
                    ::close(*fd);
                    *fd = -1;
                }
            }
        }
    }
    in.close_write();

    if (reaped) {
        result.exit_code = decode_status(st);
        return result;
    }

    if (!result.timed_out && has_deadline) {
        // Output closed but the process may still be running
        while (wait_pid(pid, st, WNOHANG) == 0) {
            if (remaining_ms() == 0) {
                result.timed_out = true;
                break;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
        if (!result.timed_out) {
            result.exit_code = decode_status(st);
            return result;
        }
    }

    if (result.timed_out) {
        kill(pid, SIGKILL);
        result.error_message = std::format("Timed out after {} ms", spec.timeout.count());
    }
    wait_pid(pid, st, 0);
    result.exit_code = decode_status(st);
    return result;
}

bool LinuxCommandRunner::spawn_detached(const std::vector<std::string>& args) {
    if (args.empty() || !find_executable(args[0])) return false;

    Pipe status;
    if (!status.open()) return false;

    auto argv = make_argv(args);
    const pid_t pid = fork();
    if (pid < 0) return false;

    if (pid == 0) {
        // Intermediate child: new session, then fork the real program so it
        // is reparented to init and never becomes our zombie.
        setsid();
        if (const pid_t grandchild = fork(); grandchild != 0) {
            _exit(grandchild < 0 ? 1 : 0);
        }
        if (const int devnull = open("/dev/null", O_RDWR); devnull >= 0) {
            dup2(devnull, STDIN_FILENO);
            dup2(devnull, STDOUT_FILENO);
            dup2(devnull, STDERR_FILENO);
        }
        exec_child(argv, {}, status.write_end);
    }

    status.close_write();
    int st = 0;
    wait_pid(pid, st, 0);
    if (decode_status(st) != 0) return false;

    return read_launch_status(status.read_end, args[0], {}).empty();
}

std::unique_ptr<IChildProcess> LinuxCommandRunner::start(const CommandSpec& spec, std::string& error) {
    if (spec.argv.empty() || spec.argv[0].empty()) {
        error = "No command given";
        return nullptr;
    }

    Pipe in, out, status;
    if (!in.open() || !out.open() || !status.open()) {
        error = std::format("Failed to create pipes: {}", strerror(errno));
        return nullptr;
    }

    auto argv = make_argv(spec.argv);
    const pid_t pid = fork();
    if (pid < 0) {
        error = std::format("Failed to fork: {}", strerror(errno));
        return nullptr;
    }

    if (pid == 0) {
        // Own process group so terminate() reaches the whole pipeline
        setsid();
        dup2(in.read_end, STDIN_FILENO);
        dup2(out.write_end, STDOUT_FILENO);
        dup2(out.write_end, STDERR_FILENO);
        exec_child(argv, spec.working_dir, status.write_end);
    }

    in.close_read();
    out.close_write();
    status.close_write();

    if (auto launch_error = read_launch_status(status.read_end, spec.argv[0], spec.working_dir); !launch_error.empty()) {
        int st = 0;
        wait_pid(pid, st, 0);
        error = std::move(launch_error);
        return nullptr;
    }

    auto child = std::make_unique<LinuxChildProcess>(pid, in.release_write(), out.release_read());
    if (spec.stdin_data && !spec.stdin_data->empty()) {
        if (!child->write_input(*spec.stdin_data)) {
            error = "Failed to write to process input";
        }
    }
    return child;
}

int LinuxCommandRunner::run_foreground(const std::vector<std::string>& args, std::string& error) {
    if (args.empty() || args[0].empty()) {
        error = "No command given";
        return -1;
    }

    Pipe status;
    if (!status.open()) {
        error = std::format("Failed to create pipes: {}", strerror(errno));
        return -1;
    }

    auto argv = make_argv(args);
    const pid_t pid = fork();
    if (pid < 0) {
        error = std::format("Failed to fork: {}", strerror(errno));
        return -1;
    }
    if (pid == 0) {
        // Terminal-driven programs expect default signal handling
        signal(SIGPIPE, SIG_DFL);
        signal(SIGINT, SIG_DFL);
        exec_child(argv, {}, status.write_end);
    }
    status.close_write();

    // Ctrl-C belongs to the foreground program while it runs
    struct sigaction ignore{}, old_int{};
    ignore.sa_handler = SIG_IGN;
    sigaction(SIGINT, &ignore, &old_int);

    std::string launch_error = read_launch_status(status.read_end, args[0], {});
    int st = 0;
    wait_pid(pid, st, 0);
    sigaction(SIGINT, &old_int, nullptr);

    if (!launch_error.empty()) {
        error = std::move(launch_error);
        return -1;
    }
    return decode_status(st);
}

bool LinuxCommandRunner::find_executable(const std::string& name) const {
    if (name.empty()) return false;

    auto is_executable = [](const std::string& path) {
        struct stat st{};
        return stat(path.c_str(), &st) == 0 && S_ISREG(st.st_mode) && access(path.c_str(), X_OK) == 0;
    };

    if (name.find('/') != std::string::npos) {
        return is_executable(name);
    }

    const char* path_env = std::getenv("PATH");
    const std::string path = path_env ? path_env : "/usr/local/bin:/usr/bin:/bin";
    size_t start = 0;
    while (start <= path.size()) {
        size_t end = path.find(':', start);
        if (end == std::string::npos) end = path.size();
        std::string dir = path.substr(start, end - start);
        if (dir.empty()) dir = ".";
        if (is_executable(dir + "/" + name)) return true;
        start = end + 1;
    }
    return false;
}

LinuxChildProcess::LinuxChildProcess(const pid_t pid, const int stdin_fd, const int output_fd)
    : pid_(pid)
    , stdin_fd_(stdin_fd)
    , output_fd_(output_fd) {
}

LinuxChildProcess::~LinuxChildProcess() {
    close_input();
    if (output_fd_ >= 0) {
        ::close(output_fd_);
        output_fd_ = -1;
    }
    if (is_running()) {
        terminate(true);
    }
    wait();
}

bool LinuxChildProcess::read_output(std::string& out, const std::chrono::milliseconds timeout) {
    if (output_fd_ < 0) return false;

    pollfd pfd{output_fd_, POLLIN, 0};
    const int ret = poll(&pfd, 1, static_cast<int>(timeout.count()));
    if (ret < 0) {
        return errno == EINTR;
    }
    if (ret == 0) return true;

    std::array<char, 4096> buffer;
    const ssize_t n = read(output_fd_, buffer.data(), buffer.size());
    if (n > 0) {
        out.append(buffer.data(), static_cast<size_t>(n));
        return true;
    }
    if (n < 0 && (errno == EINTR || errno == EAGAIN)) return true;

    ::close(output_fd_);
    output_fd_ = -1;
    return false;
}

bool LinuxChildProcess::write_input(const std::string& data) {
    if (stdin_fd_ < 0) return false;
    if (!write_all(stdin_fd_, data)) {
        close_input();
        return false;
    }
    return true;
}

void LinuxChildProcess::close_input() {
    if (stdin_fd_ >= 0) {
        ::close(stdin_fd_);
        stdin_fd_ = -1;
    }
}

void LinuxChildProcess::terminate(const bool force) {
    std::lock_guard lock(state_mutex_);
    const int sig = force ? SIGKILL : SIGTERM;
    // The child leads its own process group, which can outlive it while
    // background jobs still hold the output pipe
    if (kill(-pid_, sig) != 0 && !reaped_) {
        kill(pid_, sig);
    }
}

int LinuxChildProcess::wait() {
    // Polls so terminate() from another thread is never blocked behind us
    while (is_running()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    std::lock_guard lock(state_mutex_);
    return exit_code_;
}

bool LinuxChildProcess::is_running() {
    std::lock_guard lock(state_mutex_);
    if (reaped_) return false;
    int st = 0;
    const pid_t ret = wait_pid(pid_, st, WNOHANG);
    if (ret == 0) return true;
    if (ret == pid_) {
        exit_code_ = LinuxCommandRunner::decode_status(st);
    }
    reaped_ = true;
    return false;
}

} // namespace tman
