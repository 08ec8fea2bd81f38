#include "process_filter.hpp"
#include "util.hpp"
#include <algorithm>

namespace tman {

bool ProcessFilter::matches(const ProcessInfo& info) const {
    if (!user.empty() && info.user_name != user) return false;
    if (min_cpu_percent > 0.0 && info.cpu_percent < min_cpu_percent) return false;
    if (!text.empty()) {
        return contains_ci(info.name, text) || contains_ci(info.command_line, text);
    }
    return true;
}

namespace {

// Negative, zero, positive like strcmp
int compare(const ProcessInfo& a, const ProcessInfo& b, const ProcessSortColumn column) {
    auto cmp = [](const auto& x, const auto& y) { return x < y ? -1 : (y < x ? 1 : 0); };

    switch (column) {
        case ProcessSortColumn::Pid:     return cmp(a.pid, b.pid);
        case ProcessSortColumn::Name:    return cmp(to_lower(a.name), to_lower(b.name));
        case ProcessSortColumn::User:    return cmp(a.user_name, b.user_name);
        case ProcessSortColumn::Cpu:     return cmp(a.cpu_percent, b.cpu_percent);
        case ProcessSortColumn::Memory:  return cmp(a.resident_memory, b.resident_memory);
        case ProcessSortColumn::Threads: return cmp(a.thread_count, b.thread_count);
        case ProcessSortColumn::State:   return cmp(a.state_char, b.state_char);
        case ProcessSortColumn::Command: return cmp(a.command_line, b.command_line);
    }
    return 0;
}

} // namespace

std::vector<const ProcessInfo*> filter_and_sort(const std::vector<ProcessInfo>& processes,
                                                const ProcessFilter& filter,
                                                const ProcessSortColumn column,
                                                const bool ascending) {
    std::vector<const ProcessInfo*> result;
    result.reserve(processes.size());
    for (const auto& proc : processes) {
        if (filter.matches(proc)) {
            result.push_back(&proc);
        }
    }

    std::ranges::sort(result, [column, ascending](const ProcessInfo* a, const ProcessInfo* b) {
        int c = compare(*a, *b, column);
        if (c == 0) return a->pid < b->pid;
        return ascending ? c < 0 : c > 0;
    });
    return result;
}

const char* sort_column_name(const ProcessSortColumn column) {
    switch (column) {
        case ProcessSortColumn::Pid:     return "PID";
        case ProcessSortColumn::Name:    return "Name";
        case ProcessSortColumn::User:    return "User";
        case ProcessSortColumn::Cpu:     return "CPU%";
        case ProcessSortColumn::Memory:  return "Memory";
        case ProcessSortColumn::Threads: return "Threads";
        case ProcessSortColumn::State:   return "State";
        case ProcessSortColumn::Command: return "Command";
    }
    return "?";
}

} // namespace tman
