#include "process_monitor.hpp"
#include <algorithm>
#include <cassert>
#include <set>

namespace tman {

const ProcessInfo* ProcessSnapshot::find(const int pid) const {
    const auto it = std::ranges::lower_bound(processes, pid, {}, &ProcessInfo::pid);
    if (it == processes.end() || it->pid != pid) return nullptr;
    return &*it;
}

ProcessMonitor::ProcessMonitor(IProcessDataProvider* process_provider, ISystemDataProvider* system_provider)
    : process_provider_(process_provider)
    , system_provider_(system_provider) {
    assert(process_provider_ && "IProcessDataProvider must not be null");
    assert(system_provider_ && "ISystemDataProvider must not be null");

    previous_system_cpu_times_ = system_provider_->get_cpu_times();

    auto initial = std::make_shared<ProcessSnapshot>();
    initial->timestamp = std::chrono::steady_clock::now();
    current_snapshot_ = std::move(initial);
}

ProcessMonitor::~ProcessMonitor() {
    stop();
}

void ProcessMonitor::start() {
    if (running_) return;

    running_ = true;
    collection_thread_ = std::thread(&ProcessMonitor::collection_thread_func, this);
}

void ProcessMonitor::stop() {
    if (!running_) return;

    {
        std::lock_guard lock(cv_mutex_);
        running_ = false;
    }
    cv_.notify_all();

    if (collection_thread_.joinable()) {
        collection_thread_.join();
    }
}

void ProcessMonitor::set_refresh_interval(const int ms) {
    refresh_interval_ms_ = std::max(ms, 250);
    cv_.notify_all(); // Wake up thread to adjust timing
}

int ProcessMonitor::get_refresh_interval() const {
    return refresh_interval_ms_;
}

void ProcessMonitor::set_max_processes(const int count) {
    max_processes_ = std::max(count, 0);
}

std::shared_ptr<const ProcessSnapshot> ProcessMonitor::get_snapshot() const {
    std::lock_guard lock(data_mutex_);
    return current_snapshot_;
}

void ProcessMonitor::refresh_now() {
    {
        std::lock_guard lock(cv_mutex_);
        refresh_requested_ = true;
    }
    cv_.notify_all();
}

void ProcessMonitor::pause() {
    paused_ = true;
}

void ProcessMonitor::resume() {
    paused_ = false;
    cv_.notify_all();
}

bool ProcessMonitor::is_paused() const {
    return paused_;
}

void ProcessMonitor::set_on_data_updated(std::function<void()> callback) {
    std::lock_guard lock(data_mutex_);
    on_data_updated_ = std::move(callback);
}

std::vector<ParseError> ProcessMonitor::get_recent_errors() {
    return process_provider_->get_recent_errors();
}

void ProcessMonitor::collection_thread_func() {
    collect_data();

    while (running_) {
        {
            std::unique_lock lock(cv_mutex_);
            cv_.wait_for(lock, std::chrono::milliseconds(refresh_interval_ms_), [this] {
                return !running_ || refresh_requested_;
            });
        }

        if (!running_) break;

        if (refresh_requested_.exchange(false) || !paused_) {
            collect_data();
        }
    }
}

void ProcessMonitor::collect_data() {
    std::lock_guard collect_lock(collect_mutex_);

    auto snapshot = std::make_shared<ProcessSnapshot>();
    snapshot->timestamp = std::chrono::steady_clock::now();

    const auto mem_info = system_provider_->get_memory_info();
    const auto current_cpu_times = system_provider_->get_cpu_times();
    const uint64_t total_cpu_delta = current_cpu_times.total() - previous_system_cpu_times_.total();

    auto processes = process_provider_->get_all_processes(mem_info.total);

    // CPU % per process from tick deltas, 100% = one core
    std::set<int> current_pids;
    const unsigned int proc_count = system_provider_->get_processor_count();
    for (auto& proc : processes) {
        current_pids.insert(proc.pid);
        if (auto it = previous_cpu_times_.find(proc.pid); it != previous_cpu_times_.end() && total_cpu_delta > 0) {
            const uint64_t process_ticks = proc.user_time + proc.kernel_time;
            const uint64_t previous_ticks = it->second.first + it->second.second;
            // A recycled pid can report fewer ticks than before
            const uint64_t process_delta = process_ticks >= previous_ticks ? process_ticks - previous_ticks : 0;
            proc.cpu_percent = static_cast<double>(process_delta) / static_cast<double>(total_cpu_delta) * 100.0 * proc_count;
        }
        previous_cpu_times_[proc.pid] = {proc.user_time, proc.kernel_time};
    }

    // Prune stale entries for processes that no longer exist
    std::erase_if(previous_cpu_times_, [&current_pids](const auto& entry) {
        return !current_pids.contains(entry.first);
    });

    snapshot->process_count = static_cast<int>(processes.size());
    for (const auto& proc : processes) {
        snapshot->thread_count += proc.thread_count;
        if (proc.state_char == 'R') {
            snapshot->running_count++;
        }
    }

    if (const int limit = max_processes_; limit > 0 && processes.size() > static_cast<size_t>(limit)) {
        std::ranges::partial_sort(processes, processes.begin() + limit, std::ranges::greater{}, &ProcessInfo::cpu_percent);
        processes.resize(static_cast<size_t>(limit));
    }

    std::ranges::sort(processes, {}, &ProcessInfo::pid);
    snapshot->processes = std::move(processes);

    snapshot->memory_used = mem_info.used;
    snapshot->memory_total = mem_info.total;

    if (total_cpu_delta > 0) {
        const uint64_t active_delta = current_cpu_times.active() - previous_system_cpu_times_.active();
        snapshot->cpu_usage = static_cast<double>(active_delta) / static_cast<double>(total_cpu_delta) * 100.0;
    }

    snapshot->swap_info = system_provider_->get_swap_info();
    snapshot->load_average = system_provider_->get_load_average();
    snapshot->uptime_info = system_provider_->get_uptime();

    previous_system_cpu_times_ = current_cpu_times;
    snapshot->generation = ++generation_;

    // Swap the snapshot
    std::function<void()> callback;
    {
        std::lock_guard lock(data_mutex_);
        current_snapshot_ = std::move(snapshot);
        callback = on_data_updated_;
    }

    // Notify callback outside of lock
    if (callback) {
        callback();
    }
}

} // namespace tman
