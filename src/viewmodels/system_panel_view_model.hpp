#pragma once

#include "../process_monitor.hpp"
#include "../system_info.hpp"
#include <string>

namespace tman {

struct SystemPanelViewModel {
    // Visibility
    bool is_visible = true;

    // Memory stats
    int64_t memory_used = 0;
    int64_t memory_total = 0;

    // Swap stats
    SwapInfo swap_info;

    // Load average
    LoadAverage load_average;

    // Uptime
    UptimeInfo uptime_info;

    // Process counts
    int process_count = 0;
    int thread_count = 0;
    int running_count = 0;

    // Overall CPU usage
    double cpu_usage = 0.0;

    // "System Info" report, rebuilt on request
    std::string overview_text;
    bool show_overview = false;

    void update_from_snapshot(const ProcessSnapshot& snapshot) {
        memory_used = snapshot.memory_used;
        memory_total = snapshot.memory_total;
        swap_info = snapshot.swap_info;
        load_average = snapshot.load_average;
        uptime_info = snapshot.uptime_info;
        process_count = snapshot.process_count;
        thread_count = snapshot.thread_count;
        running_count = snapshot.running_count;
        cpu_usage = snapshot.cpu_usage;
    }
};

} // namespace tman
