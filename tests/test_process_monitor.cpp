#include <catch2/catch.hpp>
#include "process_monitor.hpp"
#include "wait_until.hpp"
#include <atomic>
#include <mutex>

using namespace tman;

namespace {

class FakeProcessProvider : public IProcessDataProvider {
public:
    std::vector<ProcessInfo> get_all_processes(int64_t /*total_memory*/) override {
        std::lock_guard lock(mutex);
        return processes;
    }

    std::optional<ProcessInfo> get_process_info(int pid, int64_t /*total_memory*/) override {
        std::lock_guard lock(mutex);
        for (const auto& p : processes) {
            if (p.pid == pid) return p;
        }
        return std::nullopt;
    }

    std::vector<ParseError> get_recent_errors() override { return errors; }
    void clear_errors() override { errors.clear(); }

    void set(std::vector<ProcessInfo> list) {
        std::lock_guard lock(mutex);
        processes = std::move(list);
    }

    std::mutex mutex;
    std::vector<ProcessInfo> processes;
    std::vector<ParseError> errors;
};

class FakeSystemProvider : public ISystemDataProvider {
public:
    CpuTimes get_cpu_times() override {
        std::lock_guard lock(mutex);
        return cpu;
    }
    MemoryInfo get_memory_info() override { return {8000, 6000, 2000}; }
    SwapInfo get_swap_info() override { return {1000, 750, 250}; }
    LoadAverage get_load_average() override { return {0.5, 0.25, 0.1, 1, 5}; }
    UptimeInfo get_uptime() override { return {3600, 100}; }

    [[nodiscard]] unsigned int get_processor_count() const override { return 2; }
    [[nodiscard]] long get_clock_ticks_per_second() const override { return 100; }
    [[nodiscard]] uint64_t get_boot_time_seconds() const override { return 0; }
    [[nodiscard]] std::string get_system_info_string() const override { return "test"; }

    void advance(uint64_t user, uint64_t idle) {
        std::lock_guard lock(mutex);
        cpu.user += user;
        cpu.idle += idle;
    }

    std::mutex mutex;
    CpuTimes cpu;
};

ProcessInfo make_proc(int pid, uint64_t user_ticks, char state = 'S', int threads = 1) {
    ProcessInfo info;
    info.pid = pid;
    info.name = "proc" + std::to_string(pid);
    info.user_time = user_ticks;
    info.state_char = state;
    info.thread_count = threads;
    return info;
}

} // namespace

TEST_CASE("ProcessMonitor: snapshot totals", "[process][monitor]") {
    FakeProcessProvider processes;
    FakeSystemProvider system;
    processes.set({make_proc(30, 0, 'R', 4), make_proc(10, 0), make_proc(20, 0, 'R', 2)});
    ProcessMonitor monitor(&processes, &system);

    REQUIRE(monitor.get_snapshot()->generation == 0);
    monitor.collect_data();
    auto snap = monitor.get_snapshot();

    REQUIRE(snap->generation == 1);
    REQUIRE(snap->process_count == 3);
    REQUIRE(snap->thread_count == 7);
    REQUIRE(snap->running_count == 2);
    REQUIRE(snap->memory_used == 2000);
    REQUIRE(snap->memory_total == 8000);
    REQUIRE(snap->swap_info.used == 250);
    REQUIRE(snap->uptime_info.uptime_seconds == 3600);

    // Sorted by PID for lookup
    REQUIRE(snap->processes.front().pid == 10);
    REQUIRE(snap->find(20) != nullptr);
    REQUIRE(snap->find(25) == nullptr);
}

TEST_CASE("ProcessMonitor: CPU percentages come from tick deltas", "[process][monitor]") {
    FakeProcessProvider processes;
    FakeSystemProvider system;
    processes.set({make_proc(1, 100), make_proc(2, 500)});
    ProcessMonitor monitor(&processes, &system);
    monitor.collect_data();

    // 200 ticks pass; 150 busy, 50 idle. pid 1 used 50, pid 2 used 100.
    system.advance(150, 50);
    processes.set({make_proc(1, 150), make_proc(2, 600), make_proc(3, 999)});
    monitor.collect_data();

    auto snap = monitor.get_snapshot();
    REQUIRE(snap->cpu_usage == Approx(75.0));
    // 100% is one core; the fake host has two
    REQUIRE(snap->find(1)->cpu_percent == Approx(50.0));
    REQUIRE(snap->find(2)->cpu_percent == Approx(100.0));
    // Newly seen processes have no baseline yet
    REQUIRE(snap->find(3)->cpu_percent == 0.0);
}

TEST_CASE("ProcessMonitor: a recycled PID never shows negative CPU", "[process][monitor]") {
    FakeProcessProvider processes;
    FakeSystemProvider system;
    processes.set({make_proc(7, 1000)});
    ProcessMonitor monitor(&processes, &system);
    monitor.collect_data();

    system.advance(100, 100);
    processes.set({make_proc(7, 5)});
    monitor.collect_data();
    REQUIRE(monitor.get_snapshot()->find(7)->cpu_percent == 0.0);
}

TEST_CASE("ProcessMonitor: max_processes keeps the busiest", "[process][monitor]") {
    FakeProcessProvider processes;
    FakeSystemProvider system;
    processes.set({make_proc(1, 0), make_proc(2, 0), make_proc(3, 0)});
    ProcessMonitor monitor(&processes, &system);
    monitor.set_max_processes(2);
    monitor.collect_data();

    system.advance(100, 0);
    processes.set({make_proc(1, 10), make_proc(2, 0), make_proc(3, 50)});
    monitor.collect_data();

    auto snap = monitor.get_snapshot();
    REQUIRE(snap->process_count == 3);
    REQUIRE(snap->processes.size() == 2);
    REQUIRE(snap->processes[0].pid == 1);
    REQUIRE(snap->processes[1].pid == 3);
}

TEST_CASE("ProcessMonitor: refresh interval has a floor", "[process][monitor]") {
    FakeProcessProvider processes;
    FakeSystemProvider system;
    ProcessMonitor monitor(&processes, &system);

    monitor.set_refresh_interval(10);
    REQUIRE(monitor.get_refresh_interval() == 250);
    monitor.set_refresh_interval(2000);
    REQUIRE(monitor.get_refresh_interval() == 2000);
}

TEST_CASE("ProcessMonitor: background thread publishes and honours pause", "[process][monitor]") {
    FakeProcessProvider processes;
    FakeSystemProvider system;
    processes.set({make_proc(1, 0)});
    ProcessMonitor monitor(&processes, &system);
    monitor.set_refresh_interval(60000);

    std::atomic<int> updates{0};
    monitor.set_on_data_updated([&updates] { ++updates; });

    monitor.pause();
    monitor.start();
    REQUIRE(monitor.is_running());
    // One collection on start, even while paused
    REQUIRE(wait_until([&] { return monitor.get_snapshot()->generation == 1; }));

    monitor.refresh_now();
    // The callback runs after the snapshot is swapped in
    REQUIRE(wait_until([&] { return updates == 2; }));
    REQUIRE(monitor.get_snapshot()->generation == 2);

    monitor.stop();
    REQUIRE_FALSE(monitor.is_running());
}

TEST_CASE("ProcessMonitor: provider errors are passed through", "[process][monitor]") {
    FakeProcessProvider processes;
    FakeSystemProvider system;
    processes.errors.push_back({std::chrono::steady_clock::now(), "PID 9: malformed stat"});
    ProcessMonitor monitor(&processes, &system);

    const auto errors = monitor.get_recent_errors();
    REQUIRE(errors.size() == 1);
    REQUIRE(errors[0].message == "PID 9: malformed stat");
}
