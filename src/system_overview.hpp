#pragma once

#include "interfaces/i_command_runner.hpp"
#include "interfaces/i_system_data_provider.hpp"
#include <chrono>
#include <string>

namespace tman {

// Multi-section host report: uname, uptime, memory, disks, load, network.
// Sections whose command fails show the failure instead of being dropped.
std::string build_system_overview(ICommandRunner& runner,
                                  ISystemDataProvider& system,
                                  std::chrono::system_clock::time_point now = std::chrono::system_clock::now());

// "YYYY-MM-DD HH:MM:SS" in local time
std::string format_local_time(std::chrono::system_clock::time_point tp);

} // namespace tman
