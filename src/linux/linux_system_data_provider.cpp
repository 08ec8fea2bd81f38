#include "linux_system_data_provider.hpp"
#include "../system_info.hpp"

#include <sys/utsname.h>
#include <fstream>

namespace tman {

// PRETTY_NAME from os-release, empty when unavailable
static std::string get_distro_name() {
    std::ifstream file("/etc/os-release");
    if (!file) {
        file.open("/usr/lib/os-release");
    }
    if (!file) {
        return "";
    }

    std::string line;
    std::string pretty_name;
    while (std::getline(file, line)) {
        if (line.starts_with("PRETTY_NAME=")) {
            pretty_name = line.substr(12);
            if (pretty_name.size() >= 2 && pretty_name.front() == '"' && pretty_name.back() == '"') {
                pretty_name = pretty_name.substr(1, pretty_name.size() - 2);
            }
            break;
        }
    }
    return pretty_name;
}

LinuxSystemDataProvider::LinuxSystemDataProvider() {
    auto& sys_info = SystemInfo::instance();
    processor_count_ = sys_info.get_processor_count();
    clock_ticks_per_second_ = sys_info.get_clock_ticks_per_second();
    boot_time_seconds_ = sys_info.get_boot_time_seconds();
}

CpuTimes LinuxSystemDataProvider::get_cpu_times() {
    return SystemInfo::get_cpu_times();
}

MemoryInfo LinuxSystemDataProvider::get_memory_info() {
    return SystemInfo::get_memory_info();
}

SwapInfo LinuxSystemDataProvider::get_swap_info() {
    return SystemInfo::get_swap_info();
}

LoadAverage LinuxSystemDataProvider::get_load_average() {
    return SystemInfo::get_load_average();
}

UptimeInfo LinuxSystemDataProvider::get_uptime() {
    return SystemInfo::get_uptime();
}

unsigned int LinuxSystemDataProvider::get_processor_count() const {
    return processor_count_;
}

long LinuxSystemDataProvider::get_clock_ticks_per_second() const {
    return clock_ticks_per_second_;
}

uint64_t LinuxSystemDataProvider::get_boot_time_seconds() const {
    return boot_time_seconds_;
}

std::string LinuxSystemDataProvider::get_system_info_string() const {
    struct utsname uts;
    if (uname(&uts) != 0) {
        return "Linux";
    }

    // Example: "Linux 6.1.0-18-amd64 x86_64 (Debian GNU/Linux 12)"
    std::string result = std::string(uts.sysname) + " " + uts.release + " " + uts.machine;
    if (const std::string distro = get_distro_name(); !distro.empty()) {
        result += " (" + distro + ")";
    }
    return result;
}

} // namespace tman
