#pragma once

#include "errors.hpp"
#include <chrono>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace tman {

enum class StatusLevel {
    Info,
    Warning,
    Error
};

struct StatusMessage {
    std::chrono::steady_clock::time_point timestamp;
    StatusLevel level = StatusLevel::Info;
    std::string text;
};

// Thread-safe bounded log of status messages for the status bar.
// Background threads (monitor, session readers) write; the UI thread reads.
class StatusLog {
public:
    void add(StatusLevel level, const std::string& text);
    void info(const std::string& text) { add(StatusLevel::Info, text); }
    void warning(const std::string& text) { add(StatusLevel::Warning, text); }
    void error(const std::string& text) { add(StatusLevel::Error, text); }

    // Logs success as Info, failure as Error
    void report(const ActionResult& result);

    [[nodiscard]] std::optional<StatusMessage> latest() const;
    [[nodiscard]] std::vector<StatusMessage> get_recent(std::chrono::seconds window) const;
    [[nodiscard]] std::vector<StatusMessage> get_all() const;
    void clear();

    static constexpr size_t kMaxMessages = 50;

private:
    mutable std::mutex mutex_;
    std::vector<StatusMessage> messages_;
};

} // namespace tman
