#pragma once

#include "errors.hpp"
#include "interfaces/i_command_runner.hpp"
#include <string>
#include <vector>

namespace tman {

enum class LogKind {
    Cron,
    System
};

struct LogSearchResult {
    size_t count = 0;
    std::vector<size_t> matching_lines;     // 0-based, one entry per line with a match
    std::string message;                    // "Found N matches" / "No matches found for '...'"
};

// Log text shown in the viewer window
class LogDocument {
public:
    LogDocument() = default;
    LogDocument(std::string title, std::string content);

    [[nodiscard]] const std::string& title() const { return title_; }
    [[nodiscard]] const std::string& content() const { return content_; }
    [[nodiscard]] const std::vector<std::string>& lines() const { return lines_; }

    [[nodiscard]] size_t line_count() const { return lines_.size(); }
    [[nodiscard]] size_t char_count() const { return content_.size(); }

    // "Lines: N | Characters: N | File: <title>"
    [[nodiscard]] std::string info_line() const;

    // Case-insensitive; counts every occurrence, not just matching lines
    [[nodiscard]] LogSearchResult search(const std::string& term) const;

    ActionResult save(const std::string& path) const;
    void clear();

private:
    std::string title_;
    std::string content_;
    std::vector<std::string> lines_;
};

struct LogFetchResult {
    bool found = false;
    LogDocument document;
    std::string message;    // Set when nothing could be read
};

// Locates and tails the host's cron or system log
class LogSource {
public:
    explicit LogSource(ICommandRunner& runner);
    LogSource(ICommandRunner& runner, std::vector<std::string> cron_paths, std::vector<std::string> system_paths);

    LogFetchResult fetch(LogKind kind);

    static const std::vector<std::string>& default_cron_paths();
    static const std::vector<std::string>& default_system_paths();

    static constexpr int kCronTailLines = 100;
    static constexpr int kCronJournalLines = 50;
    static constexpr int kSystemTailLines = 200;
    static constexpr int kSystemJournalLines = 100;

private:
    LogFetchResult fetch_cron();
    LogFetchResult fetch_system();
    // Output of `tail -N path`, false if unreadable
    bool tail_file(const std::string& path, int lines, std::string& output);
    bool run_journal(std::vector<std::string> argv, std::string& output);

    ICommandRunner& runner_;
    std::vector<std::string> cron_paths_;
    std::vector<std::string> system_paths_;
};

} // namespace tman
