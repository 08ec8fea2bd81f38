#include "procfs_reader.hpp"
#include "system_info.hpp"
#include <algorithm>
#include <charconv>
#include <filesystem>
#include <format>
#include <fstream>
#include <pwd.h>
#include <sstream>
#include <unistd.h>

namespace fs = std::filesystem;

namespace tman {

ProcfsReader::ProcfsReader(std::string proc_root)
    : proc_root_(std::move(proc_root)) {
}

void ProcfsReader::add_error(const std::string& message) {
    std::lock_guard lock(errors_mutex_);
    recent_errors_.push_back({std::chrono::steady_clock::now(), message});
    if (recent_errors_.size() > kMaxErrors) {
        recent_errors_.erase(recent_errors_.begin());
    }
}

std::vector<ParseError> ProcfsReader::get_recent_errors() {
    std::lock_guard lock(errors_mutex_);
    // Return errors from the last 10 seconds
    auto cutoff = std::chrono::steady_clock::now() - std::chrono::seconds(10);
    std::vector<ParseError> result;
    for (const auto& err : recent_errors_) {
        if (err.timestamp > cutoff) {
            result.push_back(err);
        }
    }
    return result;
}

void ProcfsReader::clear_errors() {
    std::lock_guard lock(errors_mutex_);
    recent_errors_.clear();
}

std::string ProcfsReader::read_file(const std::string& path) {
    std::ifstream file(path);
    if (!file) return {};
    std::ostringstream ss;
    ss << file.rdbuf();
    return ss.str();
}

std::string ProcfsReader::get_username(const int uid) {
    if (const auto it = uid_cache_.find(uid); it != uid_cache_.end()) {
        return it->second;
    }

    const passwd* pw = getpwuid(uid);
    std::string name = pw ? pw->pw_name : std::to_string(uid);
    uid_cache_[uid] = name;
    return name;
}

std::vector<ProcessInfo> ProcfsReader::get_all_processes(int64_t total_memory) {
    std::vector<ProcessInfo> processes;

    // Fetch memory info once for the entire snapshot
    if (total_memory < 0) {
        total_memory = SystemInfo::get_memory_info().total;
    }

    std::error_code ec;
    fs::directory_iterator it(proc_root_, ec);
    if (ec) {
        add_error(std::format("Failed to iterate {}: {}", proc_root_, ec.message()));
        return processes;
    }

    for (const auto& entry : it) {
        std::error_code entry_ec;
        if (!entry.is_directory(entry_ec)) continue;

        const auto name = entry.path().filename().string();
        int pid = 0;
        if (auto [ptr, pec] = std::from_chars(name.data(), name.data() + name.size(), pid);
            pec != std::errc{} || ptr != name.data() + name.size()) continue;

        // A process that exits mid-read simply yields nullopt
        if (auto info = get_process_info(pid, total_memory)) {
            processes.push_back(std::move(*info));
        }
    }

    return processes;
}

bool ProcfsReader::parse_stat(const std::string& content, ProcessInfo& info, std::string& error) {
    // Format: pid (comm) state ppid ...
    // comm can contain spaces and parentheses, so find the last ')'
    const size_t comm_start = content.find('(');
    const size_t comm_end = content.rfind(')');
    if (comm_start == std::string::npos || comm_end == std::string::npos || comm_end <= comm_start) {
        error = "malformed stat (missing comm)";
        return false;
    }

    info.name = content.substr(comm_start + 1, comm_end - comm_start - 1);

    if (comm_end + 2 >= content.size()) {
        error = "truncated stat (no fields after comm)";
        return false;
    }

    std::istringstream iss(content.substr(comm_end + 2));
    std::string state;
    int ppid = 0, pgrp = 0, session = 0, tty_nr = 0, tpgid = 0;
    unsigned int flags = 0;
    uint64_t minflt = 0, cminflt = 0, majflt = 0, cmajflt = 0, utime = 0, stime = 0;
    int64_t cutime = 0, cstime = 0, priority = 0, nice = 0;
    int64_t num_threads = 1, itrealvalue = 0;
    uint64_t starttime = 0;

    iss >> state >> ppid >> pgrp >> session >> tty_nr >> tpgid >> flags
        >> minflt >> cminflt >> majflt >> cmajflt >> utime >> stime
        >> cutime >> cstime >> priority >> nice >> num_threads >> itrealvalue >> starttime;

    if (iss.fail() && state.empty()) {
        error = "failed to parse stat fields";
        return false;
    }

    info.state_char = state.empty() ? '?' : state[0];
    info.parent_pid = ppid;
    info.user_time = utime;
    info.kernel_time = stime;
    info.priority = static_cast<int>(priority);
    info.thread_count = static_cast<int>(num_threads);
    info.start_time_ticks = starttime;
    return true;
}

std::optional<ProcessInfo> ProcfsReader::get_process_info(const int pid, const int64_t total_memory) {
    const std::string proc_path = proc_root_ + "/" + std::to_string(pid);

    const std::string stat_content = read_file(proc_path + "/stat");
    if (stat_content.empty()) return std::nullopt;

    ProcessInfo info;
    info.pid = pid;

    if (std::string error; !parse_stat(stat_content, info, error)) {
        add_error(std::format("PID {}: {}", pid, error));
        return std::nullopt;
    }

    auto& sys = SystemInfo::instance();
    if (const long ticks = sys.get_clock_ticks_per_second(); ticks > 0) {
        const uint64_t start_seconds = sys.get_boot_time_seconds() + (info.start_time_ticks / ticks);
        info.start_time = std::chrono::system_clock::from_time_t(static_cast<time_t>(start_seconds));
    }

    if (const std::string statm = read_file(proc_path + "/statm"); !statm.empty()) {
        std::istringstream statm_iss(statm);
        uint64_t size = 0, resident = 0;
        statm_iss >> size >> resident;
        if (!statm_iss.fail()) {
            const long page_size = sysconf(_SC_PAGESIZE);
            info.virtual_memory = static_cast<int64_t>(size * page_size);
            info.resident_memory = static_cast<int64_t>(resident * page_size);

            if (total_memory > 0) {
                info.memory_percent = static_cast<double>(info.resident_memory) / static_cast<double>(total_memory) * 100.0;
            }
        }
    }

    std::string cmdline = read_file(proc_path + "/cmdline");
    std::ranges::replace(cmdline, '\0', ' ');
    while (!cmdline.empty() && cmdline.back() == ' ') {
        cmdline.pop_back();
    }
    // Kernel threads have no command line
    info.command_line = cmdline.empty() ? "[" + info.name + "]" : cmdline;

    const std::string status = read_file(proc_path + "/status");
    std::istringstream status_iss(status);
    std::string line;
    while (std::getline(status_iss, line)) {
        if (line.starts_with("Uid:")) {
            std::istringstream uid_iss(line);
            std::string key;
            int uid = 0;
            uid_iss >> key >> uid;
            if (!uid_iss.fail()) {
                info.uid = uid;
                info.user_name = get_username(uid);
            }
            break;
        }
    }

    return info;
}

} // namespace tman
