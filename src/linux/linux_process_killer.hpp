#pragma once

#include "../interfaces/i_process_killer.hpp"
#include <map>
#include <string>
#include <vector>

namespace tman {

class LinuxProcessKiller : public IProcessKiller {
public:
    explicit LinuxProcessKiller(std::string proc_root = "/proc");
    ~LinuxProcessKiller() override = default;

    KillResult kill_process(int pid, bool force) override;
    KillResult kill_process_tree(int pid, bool force) override;

    static std::string get_kill_error_message(int err);

private:
    // Children are listed before their parents
    std::vector<int> collect_kill_order(int root_pid) const;
    std::map<int, std::vector<int>> build_children_map() const;
    // Reads ppid and state; false if the process vanished
    bool read_stat(int pid, int& ppid, char& state) const;
    // A zombie has already exited and only waits to be reaped
    bool is_alive(int pid) const;

    std::string proc_root_;
};

} // namespace tman
