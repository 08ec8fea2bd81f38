#pragma once

#include "../interfaces/i_process_data_provider.hpp"
#include "../procfs_reader.hpp"

namespace tman {

class LinuxProcessDataProvider : public IProcessDataProvider {
public:
    explicit LinuxProcessDataProvider(std::string proc_root = "/proc");
    ~LinuxProcessDataProvider() override = default;

    std::vector<ProcessInfo> get_all_processes(int64_t total_memory) override;
    std::optional<ProcessInfo> get_process_info(int pid, int64_t total_memory) override;

    std::vector<ParseError> get_recent_errors() override;
    void clear_errors() override;

private:
    ProcfsReader reader_;
};

} // namespace tman
