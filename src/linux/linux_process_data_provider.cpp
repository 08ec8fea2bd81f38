#include "linux_process_data_provider.hpp"

namespace tman {

LinuxProcessDataProvider::LinuxProcessDataProvider(std::string proc_root)
    : reader_(std::move(proc_root)) {
}

std::vector<ProcessInfo> LinuxProcessDataProvider::get_all_processes(int64_t total_memory) {
    return reader_.get_all_processes(total_memory);
}

std::optional<ProcessInfo> LinuxProcessDataProvider::get_process_info(int pid, int64_t total_memory) {
    return reader_.get_process_info(pid, total_memory);
}

std::vector<ParseError> LinuxProcessDataProvider::get_recent_errors() {
    return reader_.get_recent_errors();
}

void LinuxProcessDataProvider::clear_errors() {
    reader_.clear_errors();
}

} // namespace tman
