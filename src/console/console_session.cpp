#include "console_session.hpp"
#include "../util.hpp"
#include <filesystem>
#include <format>

namespace fs = std::filesystem;

namespace tman {

ConsoleSession::ConsoleSession(ICommandRunner& runner, const std::string& working_dir)
    : runner_(runner) {
    std::error_code ec;
    if (!working_dir.empty() && fs::is_directory(expand_home(working_dir), ec)) {
        working_dir_ = fs::absolute(expand_home(working_dir), ec).lexically_normal().string();
    }
    if (working_dir_.empty()) {
        working_dir_ = fs::current_path(ec).string();
    }
}

ConsoleSession::~ConsoleSession() {
    if (busy_) {
        [[maybe_unused]] auto result = stop();
    }
    if (reader_.joinable()) {
        reader_.join();
    }
}

std::string ConsoleSession::working_dir() const {
    std::lock_guard lock(dir_mutex_);
    return working_dir_;
}

ActionResult ConsoleSession::set_working_dir(const std::string& dir) {
    const std::string path = expand_home(trim(dir));
    std::error_code ec;
    if (path.empty() || !fs::is_directory(path, ec)) {
        return {false, "Invalid directory path"};
    }

    const std::string resolved = fs::absolute(path, ec).lexically_normal().string();
    {
        std::lock_guard lock(dir_mutex_);
        working_dir_ = resolved;
    }
    output_.append_line("Changed working directory to: " + resolved);
    return {true, "Working directory: " + resolved};
}

void ConsoleSession::change_directory(const std::string& arg) {
    std::string target = arg.empty() ? "~" : arg;
    target = expand_home(target);

    fs::path path(target);
    if (path.is_relative()) {
        path = fs::path(working_dir()) / path;
    }

    std::error_code ec;
    if (!fs::is_directory(path, ec)) {
        output_.append_line("Directory not found: " + path.string());
        return;
    }

    std::string resolved = fs::canonical(path, ec).string();
    if (ec) resolved = path.lexically_normal().string();
    {
        std::lock_guard lock(dir_mutex_);
        working_dir_ = resolved;
    }
    output_.append_line("Changed to " + resolved);
}

bool ConsoleSession::handle_builtin(const std::string& command) {
    if (command == "clear") {
        output_.clear();
        return true;
    }
    if (command == "cd" || command.starts_with("cd ")) {
        change_directory(trim(command.substr(2)));
        return true;
    }
    if (command == "pwd") {
        output_.append_line(working_dir());
        return true;
    }
    if (command == "exit" || command == "quit") {
        output_.append_line("Use the GUI to exit the application");
        return true;
    }
    return false;
}

void ConsoleSession::reap_finished() {
    if (!busy_ && reader_.joinable()) {
        reader_.join();
        child_.reset();
    }
}

void ConsoleSession::execute(const std::string& raw_command) {
    const std::string command = trim(raw_command);
    if (command.empty()) return;

    reap_finished();
    history_.add(command);

    if (busy_) {
        output_.append_line("A command is still running. Stop it first.");
        return;
    }

    const std::string dir = working_dir();
    output_.append_line(std::format("{}$ {}", dir, command));

    if (handle_builtin(command)) return;

    CommandSpec spec;
    spec.argv = {"/bin/sh", "-c", command};
    spec.working_dir = dir;

    std::string error;
    child_ = runner_.start(spec, error);
    if (!child_) {
        output_.append_line("Error: " + error);
        return;
    }
    // Commands that read stdin see EOF instead of hanging
    child_->close_input();

    busy_ = true;
    reader_ = std::thread(&ConsoleSession::reader_loop, this, child_.get());
}

void ConsoleSession::reader_loop(IChildProcess* child) {
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

    if (const int code = child->wait(); code != 0) {
        output_.append_line(std::format("Command exited with code {}", code));
    }
    busy_ = false;
}

ActionResult ConsoleSession::stop() {
    if (!busy_ || !child_) {
        reap_finished();
        return {false, "No command is running"};
    }

    child_->terminate(false);
    const auto deadline = std::chrono::steady_clock::now() + kStopGracePeriod;
    // The reader finishes once every process holding the output pipe is gone
    while (busy_ && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
    if (busy_) {
        child_->terminate(true);
    }

    if (reader_.joinable()) {
        reader_.join();
    }
    child_.reset();
    return {true, "Process stopped"};
}

} // namespace tman
