#pragma once

#include "../errors.hpp"
#include <string>
#include <vector>

namespace tman {

struct CronPreset {
    const char* label;
    const char* schedule;   // Empty for "Custom"
};

// The preset list offered by the add/edit dialog, "Custom" last
const std::vector<CronPreset>& cron_presets();

// Index into cron_presets() whose schedule equals `schedule`, or the Custom index
size_t find_cron_preset(const std::string& schedule);

// Syntax check of a five-field schedule or an @-keyword. The cron daemon
// remains the final authority; this only rejects what it would refuse.
ValidationResult validate_cron_schedule(const std::string& schedule);

// Human-readable wording, e.g. "Daily at midnight (00:00)" or "at 02:30 on Monday"
std::string describe_cron_schedule(const std::string& schedule);

// "This job will run: ..." or the format error, for the dialog's live preview
std::string cron_schedule_preview(const std::string& schedule);

// Whitespace-separated fields
std::vector<std::string> split_cron_fields(const std::string& schedule);

bool is_cron_keyword(const std::string& schedule);

} // namespace tman
