#pragma once

#include "crontab.hpp"
#include "../errors.hpp"
#include "../interfaces/i_command_runner.hpp"
#include <string>
#include <vector>

namespace tman {

struct CronListResult {
    bool success = false;
    std::vector<CronJob> jobs;
    std::string message;
};

// The current user's crontab, read and installed through the crontab(1) client
class CronManager {
public:
    explicit CronManager(ICommandRunner& runner);

    CronListResult list();

    ActionResult add(const std::string& schedule, const std::string& command);
    ActionResult update(size_t index, const std::string& schedule, const std::string& command);
    ActionResult remove(size_t index);

    static ValidationResult validate_command(const std::string& command);

    static constexpr auto kCrontabTimeout = std::chrono::seconds(10);

private:
    // Empty document when the user has no crontab yet
    bool read(Crontab& crontab, std::string& error);
    bool install(const Crontab& crontab, std::string& error);
    // Validates both fields; empty string when acceptable
    static std::string check_job(const std::string& schedule, const std::string& command);

    ICommandRunner& runner_;
};

} // namespace tman
