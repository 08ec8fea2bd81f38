#pragma once

#include "process_info.hpp"
#include <string>
#include <vector>

namespace tman {

enum class ProcessSortColumn {
    Pid,
    Name,
    User,
    Cpu,
    Memory,
    Threads,
    State,
    Command
};

struct ProcessFilter {
    std::string text;        // Matches name or command line, case-insensitive
    std::string user;        // Exact user name, empty = any
    double min_cpu_percent = 0.0;

    [[nodiscard]] bool is_empty() const {
        return text.empty() && user.empty() && min_cpu_percent <= 0.0;
    }

    [[nodiscard]] bool matches(const ProcessInfo& info) const;
};

// Filters then sorts. Pointers refer into `processes`. Ties are broken by PID.
std::vector<const ProcessInfo*> filter_and_sort(const std::vector<ProcessInfo>& processes,
                                                const ProcessFilter& filter,
                                                ProcessSortColumn column,
                                                bool ascending);

const char* sort_column_name(ProcessSortColumn column);

} // namespace tman
