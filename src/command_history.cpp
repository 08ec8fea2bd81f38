#include "command_history.hpp"
#include <algorithm>

namespace tman {

void CommandHistory::add(const std::string& command) {
    if (command.empty()) return;
    std::erase(entries_, command);
    entries_.push_back(command);
    if (entries_.size() > kMaxEntries) {
        entries_.erase(entries_.begin());
    }
    cursor_ = entries_.size();
}

std::string CommandHistory::previous() {
    if (entries_.empty()) return {};
    if (cursor_ > 0) --cursor_;
    return entries_[cursor_];
}

std::string CommandHistory::next() {
    if (cursor_ + 1 < entries_.size()) {
        return entries_[++cursor_];
    }
    cursor_ = entries_.size();
    return {};
}

} // namespace tman
