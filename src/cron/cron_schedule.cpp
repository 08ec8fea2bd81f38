#include "cron_schedule.hpp"
#include "../util.hpp"
#include <array>
#include <charconv>
#include <format>
#include <sstream>

namespace tman {

namespace {

struct FieldSpec {
    const char* title;      // For error messages
    const char* lower;
    int min;
    int max;
    const char* range_note;
};

constexpr std::array<FieldSpec, 5> kFields = {{
    {"Minute", "minute", 0, 59, "0-59"},
    {"Hour", "hour", 0, 23, "0-23"},
    {"Day", "day", 1, 31, "1-31"},
    {"Month", "month", 1, 12, "1-12"},
    {"Weekday", "weekday", 0, 7, "0-7 (0 or 7=Sunday)"},
}};

constexpr std::array<const char*, 12> kMonthAbbrev = {
    "jan", "feb", "mar", "apr", "may", "jun", "jul", "aug", "sep", "oct", "nov", "dec"
};
constexpr std::array<const char*, 7> kWeekdayAbbrev = {
    "sun", "mon", "tue", "wed", "thu", "fri", "sat"
};
constexpr std::array<const char*, 12> kMonthNames = {
    "January", "February", "March", "April", "May", "June",
    "July", "August", "September", "October", "November", "December"
};
constexpr std::array<const char*, 7> kWeekdayNames = {
    "Sunday", "Monday", "Tuesday", "Wednesday", "Thursday", "Friday", "Saturday"
};

constexpr std::array<const char*, 8> kKeywords = {
    "@reboot", "@yearly", "@annually", "@monthly", "@weekly", "@daily", "@midnight", "@hourly"
};

bool parse_number(const std::string& text, int& value) {
    if (text.empty()) return false;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    return ec == std::errc{} && ptr == text.data() + text.size();
}

// Digits, or a three-letter name in the month and weekday fields
bool parse_value(const std::string& text, const size_t field, int& value) {
    if (parse_number(text, value)) return true;

    const std::string lower = to_lower(text);
    if (field == 3) {
        for (size_t i = 0; i < kMonthAbbrev.size(); ++i) {
            if (lower == kMonthAbbrev[i]) {
                value = static_cast<int>(i) + 1;
                return true;
            }
        }
    } else if (field == 4) {
        for (size_t i = 0; i < kWeekdayAbbrev.size(); ++i) {
            if (lower == kWeekdayAbbrev[i]) {
                value = static_cast<int>(i);
                return true;
            }
        }
    }
    return false;
}

std::string range_error(const FieldSpec& spec) {
    return std::format("{} must be {}", spec.title, spec.range_note);
}

// One comma-separated item: *, */N, N, N-M, N-M/S, N/S
std::string validate_item(const std::string& item, const size_t field) {
    const FieldSpec& spec = kFields[field];
    if (item.empty()) {
        return std::format("Empty list item in {} field", spec.lower);
    }

    std::string base = item;
    if (const size_t slash = item.find('/'); slash != std::string::npos) {
        base = item.substr(0, slash);
        int step = 0;
        if (!parse_number(item.substr(slash + 1), step) || step < 1 || step > spec.max) {
            return std::format("Invalid step in {} field: {}", spec.lower, item);
        }
    }

    if (base == "*") return {};

    int low = 0;
    int high = 0;
    if (const size_t dash = base.find('-'); dash != std::string::npos) {
        if (!parse_value(base.substr(0, dash), field, low) || !parse_value(base.substr(dash + 1), field, high)) {
            return std::format("Invalid {} value: {}", spec.lower, item);
        }
        if (low > high) {
            return std::format("Invalid range in {} field: {}", spec.lower, item);
        }
    } else {
        if (!parse_value(base, field, low)) {
            return std::format("Invalid {} value: {}", spec.lower, item);
        }
        high = low;
    }

    if (low < spec.min || high > spec.max) {
        return range_error(spec);
    }
    return {};
}

bool is_step(const std::string& field) {
    return field.starts_with("*/");
}

bool is_plain_number(const std::string& field) {
    int value = 0;
    return parse_number(field, value);
}

} // namespace

const std::vector<CronPreset>& cron_presets() {
    static const std::vector<CronPreset> presets = {
        {"Every minute", "* * * * *"},
        {"Every 5 minutes", "*/5 * * * *"},
        {"Every 15 minutes", "*/15 * * * *"},
        {"Every 30 minutes", "*/30 * * * *"},
        {"Every hour", "0 * * * *"},
        {"Every 2 hours", "0 */2 * * *"},
        {"Every 6 hours", "0 */6 * * *"},
        {"Daily at midnight", "0 0 * * *"},
        {"Daily at 6 AM", "0 6 * * *"},
        {"Daily at 9 AM", "0 9 * * *"},
        {"Daily at 6 PM", "0 18 * * *"},
        {"Weekly (Monday midnight)", "0 0 * * 1"},
        {"Weekly (Sunday 2 AM)", "0 2 * * 0"},
        {"Monthly (1st at midnight)", "0 0 1 * *"},
        {"Custom", ""},
    };
    return presets;
}

size_t find_cron_preset(const std::string& schedule) {
    const auto& presets = cron_presets();
    const std::string normalized = join_args(split_cron_fields(schedule));
    for (size_t i = 0; i + 1 < presets.size(); ++i) {
        if (normalized == presets[i].schedule) return i;
    }
    return presets.size() - 1;
}

std::vector<std::string> split_cron_fields(const std::string& schedule) {
    std::vector<std::string> fields;
    std::istringstream iss(schedule);
    std::string field;
    while (iss >> field) {
        fields.push_back(field);
    }
    return fields;
}

bool is_cron_keyword(const std::string& schedule) {
    const std::string lower = to_lower(trim(schedule));
    for (const char* keyword : kKeywords) {
        if (lower == keyword) return true;
    }
    return false;
}

ValidationResult validate_cron_schedule(const std::string& schedule) {
    ValidationResult result;
    const std::string text = trim(schedule);
    if (text.empty()) {
        result.error = "Schedule cannot be empty";
        return result;
    }

    if (text.starts_with('@')) {
        if (!is_cron_keyword(text)) {
            result.error = "Unknown schedule keyword: " + text;
            return result;
        }
        result.valid = true;
        return result;
    }

    const auto fields = split_cron_fields(text);
    if (fields.size() != kFields.size()) {
        result.error = "Invalid format: Must have 5 fields (minute hour day month weekday)";
        return result;
    }

    for (size_t i = 0; i < fields.size(); ++i) {
        std::string item;
        std::istringstream items(fields[i]);
        // getline drops a trailing empty item, so check the separators directly
        if (fields[i].front() == ',' || fields[i].back() == ',' || fields[i].find(",,") != std::string::npos) {
            result.error = std::format("Empty list item in {} field", kFields[i].lower);
            return result;
        }
        while (std::getline(items, item, ',')) {
            if (auto error = validate_item(item, i); !error.empty()) {
                result.error = std::move(error);
                return result;
            }
        }
    }

    result.valid = true;
    return result;
}

std::string describe_cron_schedule(const std::string& schedule) {
    const std::string text = trim(schedule);

    if (text.starts_with('@')) {
        const std::string lower = to_lower(text);
        if (lower == "@reboot") return "At system startup";
        if (lower == "@yearly" || lower == "@annually") return "Yearly on January 1st at midnight";
        if (lower == "@monthly") return "Monthly on the 1st day at midnight";
        if (lower == "@weekly") return "Weekly on Sunday at midnight";
        if (lower == "@daily" || lower == "@midnight") return "Daily at midnight (00:00)";
        if (lower == "@hourly") return "Every hour";
        return "Invalid schedule format";
    }

    const auto fields = split_cron_fields(text);
    if (fields.size() != 5) {
        return "Invalid schedule format";
    }
    const std::string normalized = join_args(fields);
    const auto& minute = fields[0];
    const auto& hour = fields[1];
    const auto& day = fields[2];
    const auto& month = fields[3];
    const auto& weekday = fields[4];

    // Common patterns
    if (normalized == "* * * * *") return "Every minute";
    if (normalized == "0 * * * *") return "Every hour";
    if (normalized == "0 0 * * *") return "Daily at midnight (00:00)";
    if (normalized == "0 9 * * *") return "Daily at 9:00 AM";
    if (normalized == "0 18 * * *") return "Daily at 6:00 PM";
    if (normalized == "0 0 * * 0") return "Weekly on Sunday at midnight";
    if (normalized == "0 0 * * 1") return "Weekly on Monday at midnight";
    if (normalized == "0 0 1 * *") return "Monthly on the 1st day at midnight";
    if (is_step(minute) && hour == "*" && day == "*" && month == "*" && weekday == "*") {
        return std::format("Every {} minutes", minute.substr(2));
    }
    if (minute == "0" && is_step(hour) && day == "*" && month == "*" && weekday == "*") {
        return std::format("Every {} hours", hour.substr(2));
    }

    std::vector<std::string> parts;

    if (minute == "*" && hour == "*") {
        parts.emplace_back("every minute");
    } else if (hour == "*") {
        parts.push_back(is_step(minute) ? std::format("every {} minutes", minute.substr(2))
                                        : std::format("at minute {} of every hour", minute));
    } else if (minute == "*") {
        parts.push_back(is_step(hour) ? std::format("every minute of every {} hours", hour.substr(2))
                                      : std::format("every minute at hour {}", hour));
    } else if (is_plain_number(minute) && is_plain_number(hour)) {
        parts.push_back(std::format("at {:02d}:{:02d}", std::stoi(hour), std::stoi(minute)));
    } else {
        parts.push_back(is_step(minute) ? std::format("every {} minutes", minute.substr(2))
                                        : std::format("at minute {}", minute));
        parts.push_back(is_step(hour) ? std::format("every {} hours", hour.substr(2))
                                      : std::format("at hour {}", hour));
    }

    if (day != "*") {
        parts.push_back("on day " + day);
    }

    if (month != "*") {
        int value = 0;
        if (parse_value(month, 3, value) && value >= 1 && value <= 12) {
            parts.push_back(std::format("in {}", kMonthNames[static_cast<size_t>(value - 1)]));
        } else {
            parts.push_back("in month " + month);
        }
    }

    if (weekday != "*") {
        int value = 0;
        if (parse_value(weekday, 4, value) && value >= 0 && value <= 7) {
            parts.push_back(std::format("on {}", kWeekdayNames[static_cast<size_t>(value % 7)]));
        } else {
            parts.push_back("on weekday " + weekday);
        }
    }

    return join_args(parts);
}

std::string cron_schedule_preview(const std::string& schedule) {
    const std::string text = trim(schedule);
    if (!text.starts_with('@') && split_cron_fields(text).size() != 5) {
        return "Invalid format: Must have 5 fields (minute hour day month weekday)";
    }
    if (auto check = validate_cron_schedule(text); !check.valid) {
        return "Invalid schedule: " + check.error;
    }
    return "This job will run: " + describe_cron_schedule(text);
}

} // namespace tman
