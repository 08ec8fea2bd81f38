#include "linux_process_killer.hpp"
#include <format>
#include <csignal>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <filesystem>
#include <functional>
#include <set>
#include <sstream>
#include <thread>
#include <charconv>

namespace fs = std::filesystem;

namespace tman {

namespace {
constexpr auto kTermGracePeriod = std::chrono::milliseconds(100);
constexpr const char* kStillRunningMessage =
    "SIGTERM sent. Process may still be running. Use Force Kill (SIGKILL) if it doesn't terminate.";
}

LinuxProcessKiller::LinuxProcessKiller(std::string proc_root)
    : proc_root_(std::move(proc_root)) {
}

bool LinuxProcessKiller::read_stat(const int pid, int& ppid, char& state) const {
    std::ifstream file(proc_root_ + "/" + std::to_string(pid) + "/stat");
    if (!file) return false;

    std::string content;
    std::getline(file, content);

    // Format: pid (comm) state ppid ...
    // comm can contain spaces/parens, so find last ')'
    const size_t comm_end = content.rfind(')');
    if (comm_end == std::string::npos || comm_end + 2 >= content.size()) return false;

    std::istringstream iss(content.substr(comm_end + 2));
    std::string state_field;
    iss >> state_field >> ppid;
    if (iss.fail() || state_field.empty()) return false;

    state = state_field[0];
    return true;
}

bool LinuxProcessKiller::is_alive(const int pid) const {
    if (kill(pid, 0) != 0) {
        return errno == EPERM;
    }
    int ppid = 0;
    char state = '?';
    if (read_stat(pid, ppid, state)) {
        return state != 'Z' && state != 'X';
    }
    return true;
}

std::map<int, std::vector<int>> LinuxProcessKiller::build_children_map() const {
    std::map<int, std::vector<int>> children_map;

    std::error_code ec;
    fs::directory_iterator it(proc_root_, ec);
    if (ec) return children_map;

    for (const auto& entry : it) {
        std::error_code entry_ec;
        if (!entry.is_directory(entry_ec)) continue;

        const auto name = entry.path().filename().string();
        int pid = 0;
        auto [ptr, pec] = std::from_chars(name.data(), name.data() + name.size(), pid);
        if (pec != std::errc{} || ptr != name.data() + name.size()) continue;

        // Processes that disappear mid-scan are skipped
        int ppid = 0;
        char state = '?';
        if (read_stat(pid, ppid, state) && ppid > 0) {
            children_map[ppid].push_back(pid);
        }
    }

    return children_map;
}

std::vector<int> LinuxProcessKiller::collect_kill_order(const int root_pid) const {
    const auto children_map = build_children_map();

    // Post-order traversal to get kill order (children before parents)
    std::vector<int> kill_order;
    std::set<int> visited;

    std::function<void(int)> postorder = [&](int p) {
        if (visited.contains(p)) return;
        visited.insert(p);

        if (const auto it = children_map.find(p); it != children_map.end()) {
            for (const int child : it->second) {
                postorder(child);
            }
        }
        kill_order.push_back(p);
    };

    postorder(root_pid);
    return kill_order;
}

std::string LinuxProcessKiller::get_kill_error_message(int err) {
    switch (err) {
        case EPERM:
            return "Permission denied. You may need root privileges or CAP_KILL capability to signal this process.";
        case ESRCH:
            return "Process not found. It may have already terminated.";
        case EINVAL:
            return "Invalid signal.";
        default:
            return std::format("Failed to send signal: {} (errno {})", strerror(err), err);
    }
}

KillResult LinuxProcessKiller::kill_process(int pid, bool force) {
    KillResult result;

    if (pid <= 0) {
        result.error_message = "Invalid PID";
        return result;
    }

    const int signal = force ? SIGKILL : SIGTERM;
    if (kill(pid, signal) == -1) {
        const int err = errno;
        result.error_message = get_kill_error_message(err);
        result.process_still_running = err != ESRCH;
        return result;
    }

    // Give process a moment to terminate, then check if still alive
    if (!force) {
        std::this_thread::sleep_for(kTermGracePeriod);
        if (is_alive(pid)) {
            result.success = true;
            result.process_still_running = true;
            result.error_message = kStillRunningMessage;
            return result;
        }
    }

    result.success = true;
    return result;
}

KillResult LinuxProcessKiller::kill_process_tree(int pid, bool force) {
    KillResult result;

    if (pid <= 0) {
        result.error_message = "Invalid PID";
        return result;
    }

    // Check the root first so a bad pid reports the real errno
    const int signal = force ? SIGKILL : SIGTERM;
    if (kill(pid, 0) == -1) {
        const int err = errno;
        result.error_message = get_kill_error_message(err);
        result.process_still_running = err != ESRCH;
        return result;
    }

    // Kill in post-order (leaves first, root last)
    for (const int p : collect_kill_order(pid)) {
        kill(p, signal);
    }

    // SIGKILL is delivered asynchronously too, so both modes wait
    std::this_thread::sleep_for(kTermGracePeriod);

    if (is_alive(pid)) {
        if (!force) {
            result.success = true;
            result.process_still_running = true;
            result.error_message = kStillRunningMessage;
            return result;
        }
        result.process_still_running = true;
        result.error_message = "Process tree kill failed - some processes may still be running";
        return result;
    }

    result.success = true;
    return result;
}

} // namespace tman
