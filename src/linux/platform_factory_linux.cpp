#include "../platform_factory.hpp"

#include "linux_command_runner.hpp"
#include "linux_process_data_provider.hpp"
#include "linux_system_data_provider.hpp"
#include "linux_process_killer.hpp"

namespace tman {

std::unique_ptr<IProcessDataProvider> make_process_data_provider() {
    return std::make_unique<LinuxProcessDataProvider>();
}

std::unique_ptr<ISystemDataProvider> make_system_data_provider() {
    return std::make_unique<LinuxSystemDataProvider>();
}

std::unique_ptr<IProcessKiller> make_process_killer() {
    return std::make_unique<LinuxProcessKiller>();
}

std::unique_ptr<ICommandRunner> make_command_runner() {
    return std::make_unique<LinuxCommandRunner>();
}

} // namespace tman
