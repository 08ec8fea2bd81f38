#include "system_info.hpp"
#include <charconv>
#include <fstream>
#include <sstream>
#include <string>
#include <thread>
#include <unistd.h>

namespace tman {

namespace {

// Scans /proc/meminfo once, picking two keys (values are in kB)
void read_meminfo_pair(const char* first_key, int64_t& first,
                       const char* second_key, int64_t& second) {
    std::ifstream meminfo("/proc/meminfo");
    std::string line;

    while (std::getline(meminfo, line)) {
        std::istringstream iss(line);
        std::string key;
        int64_t value = 0;
        iss >> key >> value;
        if (iss.fail()) continue;

        if (key == first_key) {
            first = value * 1024;
        } else if (key == second_key) {
            second = value * 1024;
        }
    }
}

int parse_int(const std::string& text) {
    int value = 0;
    std::from_chars(text.data(), text.data() + text.size(), value);
    return value;
}

} // namespace

SystemInfo& SystemInfo::instance() {
    static SystemInfo instance;
    return instance;
}

SystemInfo::SystemInfo() {
    processor_count_ = std::thread::hardware_concurrency();
    if (processor_count_ == 0) processor_count_ = 1;

    clock_ticks_ = sysconf(_SC_CLK_TCK);
    if (clock_ticks_ <= 0) clock_ticks_ = 100;

    std::ifstream stat("/proc/stat");
    std::string line;
    while (std::getline(stat, line)) {
        if (line.starts_with("btime ")) {
            std::istringstream iss(line);
            std::string key;
            iss >> key >> boot_time_seconds_;
            break;
        }
    }
}

CpuTimes SystemInfo::get_cpu_times() {
    CpuTimes times;
    std::ifstream stat("/proc/stat");
    std::string line;

    if (std::getline(stat, line) && line.starts_with("cpu ")) {
        std::istringstream iss(line);
        std::string cpu;
        iss >> cpu >> times.user >> times.nice >> times.system >> times.idle
            >> times.iowait >> times.irq >> times.softirq >> times.steal;
    }

    return times;
}

MemoryInfo SystemInfo::get_memory_info() {
    MemoryInfo info;
    read_meminfo_pair("MemTotal:", info.total, "MemAvailable:", info.available);
    info.used = info.total - info.available;
    return info;
}

SwapInfo SystemInfo::get_swap_info() {
    SwapInfo info;
    read_meminfo_pair("SwapTotal:", info.total, "SwapFree:", info.free);
    info.used = info.total - info.free;
    return info;
}

LoadAverage SystemInfo::get_load_average() {
    LoadAverage load;

    if (std::ifstream loadavg("/proc/loadavg"); loadavg) {
        std::string running_total;
        loadavg >> load.one_min >> load.five_min >> load.fifteen_min >> running_total;

        // Parse "running/total" format
        const size_t slash = running_total.find('/');
        if (slash != std::string::npos) {
            load.running_tasks = parse_int(running_total.substr(0, slash));
            load.total_tasks = parse_int(running_total.substr(slash + 1));
        }
    }

    return load;
}

UptimeInfo SystemInfo::get_uptime() {
    UptimeInfo info;
    std::ifstream uptime("/proc/uptime");

    if (uptime) {
        double uptime_sec = 0.0, idle_sec = 0.0;
        uptime >> uptime_sec >> idle_sec;
        info.uptime_seconds = static_cast<uint64_t>(uptime_sec);
        info.idle_seconds = static_cast<uint64_t>(idle_sec);
    }

    return info;
}

unsigned int SystemInfo::get_processor_count() const {
    return processor_count_;
}

long SystemInfo::get_clock_ticks_per_second() const {
    return clock_ticks_;
}

uint64_t SystemInfo::get_boot_time_seconds() const {
    return boot_time_seconds_;
}

} // namespace tman
