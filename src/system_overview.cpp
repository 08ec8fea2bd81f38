#include "system_overview.hpp"
#include "util.hpp"
#include <ctime>
#include <format>
#include <sys/utsname.h>

namespace tman {

namespace {

constexpr auto kCommandTimeout = std::chrono::seconds(5);
constexpr size_t kMaxInterfaceLines = 20;

std::string command_section(ICommandRunner& runner, std::vector<std::string> argv, size_t max_lines) {
    CommandSpec spec;
    spec.argv = std::move(argv);
    spec.timeout = kCommandTimeout;
    const auto result = runner.run(spec);

    if (!result.launched) {
        return "  " + result.error_message + "\n";
    }
    if (result.timed_out) {
        return "  " + spec.argv[0] + " timed out\n";
    }
    if (result.exit_code != 0) {
        return std::format("  {} failed: {}\n", spec.argv[0], trim(result.error_output));
    }

    std::string text;
    size_t count = 0;
    for (const auto& line : split_lines(result.output)) {
        if (max_lines > 0 && count++ >= max_lines) break;
        text += line + "\n";
    }
    return text;
}

} // namespace

std::string format_local_time(const std::chrono::system_clock::time_point tp) {
    const auto time_t_val = std::chrono::system_clock::to_time_t(tp);
    std::tm tm_val;
    localtime_r(&time_t_val, &tm_val);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm_val);
    return buf;
}

std::string build_system_overview(ICommandRunner& runner,
                                  ISystemDataProvider& system,
                                  const std::chrono::system_clock::time_point now) {
    std::string text = std::format("System Information - {}\n", format_local_time(now));
    text += std::string(50, '=') + "\n\n";

    if (struct utsname uts; uname(&uts) == 0) {
        text += std::format("System: {}\n", uts.sysname);
        text += std::format("Node: {}\n", uts.nodename);
        text += std::format("Release: {}\n", uts.release);
        text += std::format("Version: {}\n", uts.version);
        text += std::format("Machine: {}\n", uts.machine);
    } else {
        text += "System: unknown (uname failed)\n";
    }
    text += "\n";

    text += std::format("Uptime: {}\n\n", format_uptime(system.get_uptime().uptime_seconds));

    const auto mem = system.get_memory_info();
    const double mem_percent = mem.total > 0 ? static_cast<double>(mem.used) / static_cast<double>(mem.total) * 100.0 : 0.0;
    text += std::format("Memory: {} / {} ({:.1f}%)\n", format_bytes(mem.used), format_bytes(mem.total), mem_percent);
    const auto swap = system.get_swap_info();
    text += std::format("Swap: {} / {}\n\n", format_bytes(swap.used), format_bytes(swap.total));

    text += "Disk Usage:\n";
    text += command_section(runner, {"df", "-h"}, 0);
    text += "\n";

    const auto load = system.get_load_average();
    text += std::format("Load Average: {:.2f} {:.2f} {:.2f} (1m 5m 15m)\n\n",
                        load.one_min, load.five_min, load.fifteen_min);

    text += "Network Interfaces:\n";
    text += command_section(runner, {"ip", "addr", "show"}, kMaxInterfaceLines);

    return text;
}

} // namespace tman
