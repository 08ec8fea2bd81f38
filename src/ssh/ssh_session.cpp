#include "ssh_session.hpp"
#include "../util.hpp"
#include <format>

namespace tman {

SshSession::SshSession(ICommandRunner& runner)
    : runner_(runner) {
}

SshSession::~SshSession() {
    close_child();
}

std::optional<int> SshSession::exit_status() const {
    std::lock_guard lock(status_mutex_);
    return exit_status_;
}

bool SshSession::open(const std::vector<std::string>& argv, std::string& error) {
    close_child();

    CommandSpec spec;
    spec.argv = argv;
    child_ = runner_.start(spec, error);
    if (!child_) {
        return false;
    }

    {
        std::lock_guard lock(status_mutex_);
        exit_status_.reset();
    }
    closing_ = false;
    open_ = true;
    reader_ = std::thread(&SshSession::reader_loop, this, child_.get());
    return true;
}

void SshSession::reader_loop(IChildProcess* child) {
    std::string chunk;
    while (child->read_output(chunk, std::chrono::milliseconds(100))) {
        if (!chunk.empty()) {
            output_.append_text(chunk);
            chunk.clear();
        }
    }
    if (!chunk.empty()) {
        output_.append_text(chunk);
    }
    output_.flush_partial();

    const int code = child->wait();
    {
        std::lock_guard lock(status_mutex_);
        exit_status_ = code;
    }
    open_ = false;

    // A user disconnect reports for itself
    if (!closing_) {
        output_.append_line(code == 0 ? "SSH connection terminated"
                                      : std::format("SSH connection terminated (exit code {})", code));
    }
}

void SshSession::close_child() {
    if (child_) {
        closing_ = true;
        child_->close_input();
        child_->terminate(false);
        const auto deadline = std::chrono::steady_clock::now() + kDisconnectGracePeriod;
        while (open_ && std::chrono::steady_clock::now() < deadline) {
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
        }
        if (open_) {
            child_->terminate(true);
        }
    }
    if (reader_.joinable()) {
        reader_.join();
    }
    child_.reset();
    open_ = false;
}

ActionResult SshSession::send(const std::string& raw_command) {
    const std::string command = trim(raw_command);
    if (command.empty()) {
        return {false, {}};
    }

    output_.append_line("$ " + command);
    history_.add(command);

    if (!open_ || !child_) {
        output_.append_line("No active SSH connection");
        return {false, "No active SSH connection"};
    }
    if (!child_->write_input(command + "\n")) {
        const std::string message = "Error sending command: connection closed";
        output_.append_line(message);
        return {false, message};
    }
    return {true, {}};
}

ActionResult SshSession::disconnect() {
    if (!child_ || !open_) {
        // Collects a client that already exited on its own
        close_child();
        output_.append_line("No active SSH connection");
        return {false, "No active SSH connection"};
    }
    close_child();
    output_.append_line("SSH connection terminated");
    return {true, "SSH disconnected"};
}

} // namespace tman
