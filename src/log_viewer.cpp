#include "log_viewer.hpp"
#include "util.hpp"
#include <filesystem>
#include <format>

namespace fs = std::filesystem;

namespace tman {

namespace {
constexpr auto kLogCommandTimeout = std::chrono::seconds(10);
}

LogDocument::LogDocument(std::string title, std::string content)
    : title_(std::move(title))
    , content_(std::move(content))
    , lines_(split_lines(content_)) {
}

std::string LogDocument::info_line() const {
    return std::format("Lines: {} | Characters: {} | File: {}", line_count(), char_count(), title_);
}

LogSearchResult LogDocument::search(const std::string& term) const {
    LogSearchResult result;
    const std::string needle = to_lower(trim(term));
    if (needle.empty()) return result;

    for (size_t i = 0; i < lines_.size(); ++i) {
        const std::string haystack = to_lower(lines_[i]);
        size_t pos = haystack.find(needle);
        if (pos == std::string::npos) continue;

        result.matching_lines.push_back(i);
        while (pos != std::string::npos) {
            ++result.count;
            pos = haystack.find(needle, pos + needle.size());
        }
    }

    result.message = result.count > 0
        ? std::format("Found {} matches", result.count)
        : std::format("No matches found for '{}'", trim(term));
    return result;
}

ActionResult LogDocument::save(const std::string& path) const {
    const std::string target = expand_home(trim(path));
    if (target.empty()) {
        return {false, "No path given"};
    }
    if (std::string error; !atomic_write_file(target, content_, error)) {
        return {false, "Failed to save log: " + error};
    }
    return {true, "Log saved to " + target};
}

void LogDocument::clear() {
    content_.clear();
    lines_.clear();
}

LogSource::LogSource(ICommandRunner& runner)
    : LogSource(runner, default_cron_paths(), default_system_paths()) {
}

LogSource::LogSource(ICommandRunner& runner, std::vector<std::string> cron_paths, std::vector<std::string> system_paths)
    : runner_(runner)
    , cron_paths_(std::move(cron_paths))
    , system_paths_(std::move(system_paths)) {
}

const std::vector<std::string>& LogSource::default_cron_paths() {
    static const std::vector<std::string> paths = {"/var/log/cron", "/var/log/cron.log", "/var/log/syslog"};
    return paths;
}

const std::vector<std::string>& LogSource::default_system_paths() {
    static const std::vector<std::string> paths = {
        "/var/log/syslog", "/var/log/messages", "/var/log/kern.log", "/var/log/dmesg"
    };
    return paths;
}

LogFetchResult LogSource::fetch(const LogKind kind) {
    return kind == LogKind::Cron ? fetch_cron() : fetch_system();
}

bool LogSource::tail_file(const std::string& path, const int lines, std::string& output) {
    std::error_code ec;
    if (!fs::exists(path, ec)) return false;

    CommandSpec spec;
    spec.argv = {"tail", std::format("-{}", lines), path};
    spec.timeout = kLogCommandTimeout;
    auto result = runner_.run(spec);
    if (!result.succeeded()) return false;

    output = std::move(result.output);
    return true;
}

bool LogSource::run_journal(std::vector<std::string> argv, std::string& output) {
    CommandSpec spec;
    spec.argv = std::move(argv);
    spec.timeout = kLogCommandTimeout;
    auto result = runner_.run(spec);
    if (!result.succeeded()) return false;

    output = std::move(result.output);
    return true;
}

LogFetchResult LogSource::fetch_cron() {
    LogFetchResult fetched;
    std::string output;

    for (const auto& path : cron_paths_) {
        if (!tail_file(path, kCronTailLines, output)) continue;

        std::string cron_lines;
        for (const auto& line : split_lines(output)) {
            if (contains_ci(line, "cron")) {
                cron_lines += line + "\n";
            }
        }

        fetched.found = true;
        if (!cron_lines.empty()) {
            fetched.document = LogDocument("Cron Logs - " + path, cron_lines);
        } else {
            fetched.document = LogDocument("System Logs - " + path, output);
        }
        return fetched;
    }

    if (run_journal({"journalctl", "-u", "cron", "-n", std::to_string(kCronJournalLines)}, output)) {
        fetched.found = true;
        fetched.document = LogDocument("Cron Logs - journalctl", output);
        return fetched;
    }

    fetched.message = "No accessible cron logs found.\n\nTried locations:";
    for (const auto& path : cron_paths_) {
        fetched.message += "\n- " + path;
    }
    fetched.message += "\n- journalctl";
    return fetched;
}

LogFetchResult LogSource::fetch_system() {
    LogFetchResult fetched;
    std::string output;

    for (const auto& path : system_paths_) {
        if (tail_file(path, kSystemTailLines, output)) {
            fetched.found = true;
            fetched.document = LogDocument("System Logs - " + path, output);
            return fetched;
        }
    }

    if (run_journal({"journalctl", "-n", std::to_string(kSystemJournalLines)}, output)) {
        fetched.found = true;
        fetched.document = LogDocument("System Logs - journalctl", output);
        return fetched;
    }

    fetched.message = "No accessible system logs found or insufficient permissions.";
    return fetched;
}

} // namespace tman
