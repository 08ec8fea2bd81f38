#pragma once

#include "errors.hpp"
#include "process_info.hpp"
#include <chrono>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace tman {

class ProcfsReader {
public:
    explicit ProcfsReader(std::string proc_root = "/proc");

    std::vector<ProcessInfo> get_all_processes(int64_t total_memory = -1);
    std::optional<ProcessInfo> get_process_info(int pid, int64_t total_memory);

    // Fills the fields that come from a /proc/<pid>/stat line.
    // The command name may itself contain spaces and parentheses.
    static bool parse_stat(const std::string& content, ProcessInfo& info, std::string& error);

    std::vector<ParseError> get_recent_errors();
    void clear_errors();

private:
    static std::string read_file(const std::string& path);
    std::string get_username(int uid);

    std::string proc_root_;
    std::map<int, std::string> uid_cache_;

    void add_error(const std::string& message);
    mutable std::mutex errors_mutex_;
    std::vector<ParseError> recent_errors_;
    static constexpr size_t kMaxErrors = 10;
};

} // namespace tman
