#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace tman {

// Process state characters as reported in /proc/<pid>/stat:
// 'R' = Running/Runnable
// 'S' = Sleeping (interruptible)
// 'D' = Disk sleep (uninterruptible)
// 'Z' = Zombie
// 'T' = Stopped (signal or debugger)
// 'I' = Idle
// '?' = Unknown

struct ProcessInfo {
    int pid = 0;
    int parent_pid = 0;
    std::string name;
    std::string command_line;
    char state_char = '?';
    int uid = -1;
    std::string user_name;

    // Calculated by ProcessMonitor from tick deltas
    double cpu_percent = 0.0;        // Per-core (100% = 1 core)

    // Memory (in bytes)
    int64_t resident_memory = 0;
    int64_t virtual_memory = 0;
    double memory_percent = 0.0;     // Percentage of total system memory

    int thread_count = 0;
    int priority = 0;
    uint64_t start_time_ticks = 0;
    std::chrono::system_clock::time_point start_time;

    // Cumulative clock ticks; only the delta between snapshots is meaningful
    uint64_t user_time = 0;
    uint64_t kernel_time = 0;
};

} // namespace tman
