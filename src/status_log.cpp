#include "status_log.hpp"

namespace tman {

void StatusLog::add(const StatusLevel level, const std::string& text) {
    std::lock_guard lock(mutex_);
    messages_.push_back({std::chrono::steady_clock::now(), level, text});
    if (messages_.size() > kMaxMessages) {
        messages_.erase(messages_.begin());
    }
}

void StatusLog::report(const ActionResult& result) {
    add(result.success ? StatusLevel::Info : StatusLevel::Error, result.message);
}

std::optional<StatusMessage> StatusLog::latest() const {
    std::lock_guard lock(mutex_);
    if (messages_.empty()) return std::nullopt;
    return messages_.back();
}

std::vector<StatusMessage> StatusLog::get_recent(const std::chrono::seconds window) const {
    std::lock_guard lock(mutex_);
    const auto cutoff = std::chrono::steady_clock::now() - window;
    std::vector<StatusMessage> result;
    for (const auto& msg : messages_) {
        if (msg.timestamp > cutoff) {
            result.push_back(msg);
        }
    }
    return result;
}

std::vector<StatusMessage> StatusLog::get_all() const {
    std::lock_guard lock(mutex_);
    return messages_;
}

void StatusLog::clear() {
    std::lock_guard lock(mutex_);
    messages_.clear();
}

} // namespace tman
