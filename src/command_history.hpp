#pragma once

#include <string>
#include <vector>

namespace tman {

// Shell-style history: up walks back, down walks forward and finally
// returns to an empty line. Re-entering a command moves it to the end.
class CommandHistory {
public:
    void add(const std::string& command);

    // Entry to show after pressing up/down, empty when past the newest
    std::string previous();
    std::string next();

    void reset_navigation() { cursor_ = entries_.size(); }

    [[nodiscard]] const std::vector<std::string>& entries() const { return entries_; }
    [[nodiscard]] bool empty() const { return entries_.empty(); }

    static constexpr size_t kMaxEntries = 100;

private:
    std::vector<std::string> entries_;
    size_t cursor_ = 0;
};

} // namespace tman
