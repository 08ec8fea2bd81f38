#pragma once

#include "interfaces/i_command_runner.hpp"
#include "interfaces/i_process_data_provider.hpp"
#include "interfaces/i_system_data_provider.hpp"
#include "interfaces/i_process_killer.hpp"
#include <memory>

namespace tman {

// Factory functions to create platform-specific providers.
// Only Linux implementations exist.
std::unique_ptr<IProcessDataProvider> make_process_data_provider();
std::unique_ptr<ISystemDataProvider> make_system_data_provider();
std::unique_ptr<IProcessKiller> make_process_killer();
std::unique_ptr<ICommandRunner> make_command_runner();

} // namespace tman
