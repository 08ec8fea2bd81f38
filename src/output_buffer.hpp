#pragma once

#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

namespace tman {

// Scrollback shared between a reader thread and the UI.
// Text is split into lines; an unterminated tail is held until its newline arrives.
class OutputBuffer {
public:
    explicit OutputBuffer(size_t max_lines = kDefaultMaxLines);

    void append_text(const std::string& text);
    void append_line(const std::string& line);

    // Emits a pending partial line, if any
    void flush_partial();
    void clear();

    [[nodiscard]] std::vector<std::string> lines() const;
    [[nodiscard]] std::string text() const;

    // Changes whenever the contents change; lets the UI skip copying
    [[nodiscard]] uint64_t version() const;

    static constexpr size_t kDefaultMaxLines = 5000;

private:
    void push_locked(std::string line);

    mutable std::mutex mutex_;
    std::vector<std::string> lines_;
    std::string partial_;
    size_t max_lines_;
    uint64_t version_ = 0;
};

} // namespace tman
