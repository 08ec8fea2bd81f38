#include "cron_manager.hpp"
#include "cron_schedule.hpp"
#include "../util.hpp"
#include <format>

namespace tman {

namespace {

bool is_no_crontab(const CommandResult& result) {
    return contains_ci(result.error_output, "no crontab for");
}

std::string failure_text(const CommandResult& result) {
    if (!result.launched) return result.error_message;
    if (result.timed_out) return "crontab did not respond";
    if (const std::string err = trim(result.error_output); !err.empty()) return err;
    return std::format("crontab exited with code {}", result.exit_code);
}

} // namespace

CronManager::CronManager(ICommandRunner& runner)
    : runner_(runner) {
}

ValidationResult CronManager::validate_command(const std::string& command) {
    ValidationResult result;
    const std::string trimmed = trim(command);
    if (trimmed.empty()) {
        result.error = "Command cannot be empty";
        return result;
    }
    if (trimmed.find('\n') != std::string::npos || trimmed.find('\r') != std::string::npos) {
        result.error = "Command must be a single line";
        return result;
    }
    // cron turns an unescaped % into a newline
    for (size_t i = 0; i < trimmed.size(); ++i) {
        if (trimmed[i] == '%' && (i == 0 || trimmed[i - 1] != '\\')) {
            result.warning = "cron treats % as a newline; escape it as \\%";
            break;
        }
    }
    result.valid = true;
    return result;
}

std::string CronManager::check_job(const std::string& schedule, const std::string& command) {
    if (auto cmd = validate_command(command); !cmd.valid) {
        return cmd.error;
    }
    if (auto sched = validate_cron_schedule(schedule); !sched.valid) {
        return "Invalid schedule: " + sched.error;
    }
    return {};
}

bool CronManager::read(Crontab& crontab, std::string& error) {
    CommandSpec spec;
    spec.argv = {"crontab", "-l"};
    spec.timeout = kCrontabTimeout;
    const auto result = runner_.run(spec);

    if (result.succeeded()) {
        crontab = Crontab::parse(result.output);
        return true;
    }
    if (result.launched && !result.timed_out && is_no_crontab(result)) {
        crontab = Crontab{};
        return true;
    }
    error = failure_text(result);
    return false;
}

bool CronManager::install(const Crontab& crontab, std::string& error) {
    CommandSpec spec;
    spec.timeout = kCrontabTimeout;
    if (crontab.is_blank()) {
        spec.argv = {"crontab", "-r"};
    } else {
        spec.argv = {"crontab", "-"};
        spec.stdin_data = crontab.render();
    }

    const auto result = runner_.run(spec);
    if (result.succeeded()) return true;
    // Removing a crontab that is already gone
    if (crontab.is_blank() && result.launched && !result.timed_out && is_no_crontab(result)) return true;

    error = failure_text(result);
    return false;
}

CronListResult CronManager::list() {
    CronListResult list_result;
    CommandSpec spec;
    spec.argv = {"crontab", "-l"};
    spec.timeout = kCrontabTimeout;
    const auto result = runner_.run(spec);

    if (result.launched && !result.timed_out && !result.succeeded() && is_no_crontab(result)) {
        list_result.success = true;
        list_result.message = "No crontab found for current user";
        return list_result;
    }
    if (!result.succeeded()) {
        list_result.message = "Failed to read crontab: " + failure_text(result);
        return list_result;
    }

    list_result.jobs = Crontab::parse(result.output).jobs();
    list_result.success = true;
    list_result.message = std::format("Cron jobs refreshed - Found {} jobs", list_result.jobs.size());
    return list_result;
}

ActionResult CronManager::add(const std::string& schedule, const std::string& command) {
    if (auto problem = check_job(schedule, command); !problem.empty()) {
        return {false, problem};
    }

    Crontab crontab;
    std::string error;
    if (!read(crontab, error)) {
        return {false, "Failed to add cron job: " + error};
    }
    crontab.add_job(schedule, command);
    if (!install(crontab, error)) {
        return {false, "Failed to add cron job: " + error};
    }
    return {true, "Cron job added successfully"};
}

ActionResult CronManager::update(const size_t index, const std::string& schedule, const std::string& command) {
    if (auto problem = check_job(schedule, command); !problem.empty()) {
        return {false, problem};
    }

    Crontab crontab;
    std::string error;
    if (!read(crontab, error)) {
        return {false, "Failed to update cron job: " + error};
    }
    if (!crontab.update_job(index, schedule, command)) {
        return {false, "Failed to update cron job: job no longer exists"};
    }
    if (!install(crontab, error)) {
        return {false, "Failed to update cron job: " + error};
    }
    return {true, "Cron job updated successfully"};
}

ActionResult CronManager::remove(const size_t index) {
    Crontab crontab;
    std::string error;
    if (!read(crontab, error)) {
        return {false, "Failed to delete cron job: " + error};
    }
    if (!crontab.remove_job(index)) {
        return {false, "Failed to delete cron job: job no longer exists"};
    }
    if (!install(crontab, error)) {
        return {false, "Failed to delete cron job: " + error};
    }
    return {true, "Cron job deleted successfully"};
}

} // namespace tman
