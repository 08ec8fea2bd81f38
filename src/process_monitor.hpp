#pragma once

#include "process_info.hpp"
#include "errors.hpp"
#include "system_info.hpp"
#include "interfaces/i_process_data_provider.hpp"
#include "interfaces/i_system_data_provider.hpp"
#include <vector>
#include <map>
#include <memory>
#include <thread>
#include <mutex>
#include <atomic>
#include <condition_variable>
#include <functional>

namespace tman {

// Snapshot of the process table and host counters - returned to UI.
// Never modified once published.
struct ProcessSnapshot {
    std::vector<ProcessInfo> processes;  // Sorted by PID

    // System stats
    int process_count = 0;
    int thread_count = 0;
    int running_count = 0;
    double cpu_usage = 0.0;
    int64_t memory_used = 0;
    int64_t memory_total = 0;

    SwapInfo swap_info;
    LoadAverage load_average;
    UptimeInfo uptime_info;

    // Incremented on every collection; 0 means nothing collected yet
    uint64_t generation = 0;
    std::chrono::steady_clock::time_point timestamp;

    [[nodiscard]] const ProcessInfo* find(int pid) const;
};

class ProcessMonitor {
public:
    // Non-owning: both providers must outlive the monitor
    ProcessMonitor(IProcessDataProvider* process_provider, ISystemDataProvider* system_provider);
    ~ProcessMonitor();

    ProcessMonitor(const ProcessMonitor&) = delete;
    ProcessMonitor& operator=(const ProcessMonitor&) = delete;

    // Start/stop the background collection thread
    void start();
    void stop();
    [[nodiscard]] bool is_running() const { return running_; }

    // Set refresh interval in milliseconds
    void set_refresh_interval(int ms);
    [[nodiscard]] int get_refresh_interval() const;

    // Keep only the N busiest processes; 0 keeps all
    void set_max_processes(int count);

    [[nodiscard]] std::shared_ptr<const ProcessSnapshot> get_snapshot() const;

    // Collect on the next wakeup even while auto-refresh is paused
    void refresh_now();

    // Auto-refresh toggle
    void pause();
    void resume();
    [[nodiscard]] bool is_paused() const;

    // Register callback for when new data is available
    void set_on_data_updated(std::function<void()> callback);

    [[nodiscard]] std::vector<ParseError> get_recent_errors();

    // Runs one collection on the calling thread
    void collect_data();

private:
    void collection_thread_func();

    IProcessDataProvider* process_provider_;
    ISystemDataProvider* system_provider_;

    std::thread collection_thread_;
    std::atomic<bool> running_{false};
    std::atomic<bool> paused_{false};
    std::atomic<bool> refresh_requested_{false};
    std::atomic<int> refresh_interval_ms_{5000};
    std::atomic<int> max_processes_{0};
    std::condition_variable cv_;
    std::mutex cv_mutex_;

    mutable std::mutex data_mutex_;
    std::shared_ptr<const ProcessSnapshot> current_snapshot_;

    // Only touched by whichever thread collects
    std::mutex collect_mutex_;
    CpuTimes previous_system_cpu_times_;
    std::map<int, std::pair<uint64_t, uint64_t>> previous_cpu_times_;
    uint64_t generation_ = 0;

    std::function<void()> on_data_updated_;
};

} // namespace tman
