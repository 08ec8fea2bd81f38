#include <catch2/catch.hpp>
#include "process_filter.hpp"

using namespace tman;

namespace {

ProcessInfo make_proc(int pid, const std::string& name, const std::string& user, double cpu,
                      int64_t memory = 0, const std::string& cmdline = {}) {
    ProcessInfo info;
    info.pid = pid;
    info.name = name;
    info.user_name = user;
    info.cpu_percent = cpu;
    info.resident_memory = memory;
    info.command_line = cmdline.empty() ? name : cmdline;
    return info;
}

std::vector<int> pids(const std::vector<const ProcessInfo*>& rows) {
    std::vector<int> result;
    for (const auto* row : rows) result.push_back(row->pid);
    return result;
}

const std::vector<ProcessInfo> kProcesses = {
    make_proc(1, "systemd", "root", 0.1, 12000, "/sbin/init splash"),
    make_proc(420, "sshd", "root", 0.0, 8000),
    make_proc(1337, "Firefox", "alice", 35.5, 900000, "/usr/lib/firefox/firefox --new-window"),
    make_proc(2001, "bash", "alice", 0.0, 5000),
    make_proc(2002, "python3", "bob", 12.0, 70000, "python3 train.py --epochs 10"),
};

} // namespace

TEST_CASE("ProcessFilter: empty filter keeps everything, sorted by PID", "[process][filter]") {
    auto rows = filter_and_sort(kProcesses, {}, ProcessSortColumn::Pid, true);
    REQUIRE(pids(rows) == std::vector<int>{1, 420, 1337, 2001, 2002});
}

TEST_CASE("ProcessFilter: text matches name or command line", "[process][filter]") {
    ProcessFilter filter;
    filter.text = "FIREFOX";
    REQUIRE(pids(filter_and_sort(kProcesses, filter, ProcessSortColumn::Pid, true)) == std::vector<int>{1337});

    filter.text = "train.py";
    REQUIRE(pids(filter_and_sort(kProcesses, filter, ProcessSortColumn::Pid, true)) == std::vector<int>{2002});
}

TEST_CASE("ProcessFilter: user and minimum CPU combine", "[process][filter]") {
    ProcessFilter filter;
    filter.user = "alice";
    REQUIRE(pids(filter_and_sort(kProcesses, filter, ProcessSortColumn::Pid, true)) == std::vector<int>{1337, 2001});

    filter.min_cpu_percent = 1.0;
    REQUIRE(pids(filter_and_sort(kProcesses, filter, ProcessSortColumn::Pid, true)) == std::vector<int>{1337});
    REQUIRE_FALSE(filter.is_empty());
}

TEST_CASE("ProcessFilter: sort columns and direction", "[process][filter]") {
    REQUIRE(pids(filter_and_sort(kProcesses, {}, ProcessSortColumn::Cpu, false)).front() == 1337);
    REQUIRE(pids(filter_and_sort(kProcesses, {}, ProcessSortColumn::Memory, false)) ==
            std::vector<int>{1337, 2002, 1, 420, 2001});
    // Case-insensitive names
    REQUIRE(pids(filter_and_sort(kProcesses, {}, ProcessSortColumn::Name, true)) ==
            std::vector<int>{2001, 1337, 2002, 420, 1});
}

TEST_CASE("ProcessFilter: ties are broken by PID", "[process][filter]") {
    // sshd and bash both use 0% CPU
    const auto rows = pids(filter_and_sort(kProcesses, {}, ProcessSortColumn::Cpu, true));
    REQUIRE(rows == std::vector<int>{420, 2001, 1, 2002, 1337});
}

TEST_CASE("sort_column_name", "[process][filter]") {
    REQUIRE(std::string(sort_column_name(ProcessSortColumn::Cpu)) == "CPU%");
    REQUIRE(std::string(sort_column_name(ProcessSortColumn::Command)) == "Command");
}
