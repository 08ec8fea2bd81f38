#include "output_buffer.hpp"

namespace tman {

OutputBuffer::OutputBuffer(const size_t max_lines)
    : max_lines_(max_lines == 0 ? kDefaultMaxLines : max_lines) {
}

void OutputBuffer::push_locked(std::string line) {
    if (!line.empty() && line.back() == '\r') line.pop_back();
    lines_.push_back(std::move(line));
    if (lines_.size() > max_lines_) {
        lines_.erase(lines_.begin(), lines_.begin() + static_cast<std::ptrdiff_t>(lines_.size() - max_lines_));
    }
}

void OutputBuffer::append_text(const std::string& text) {
    if (text.empty()) return;
    std::lock_guard lock(mutex_);

    size_t start = 0;
    while (start < text.size()) {
        const size_t nl = text.find('\n', start);
        if (nl == std::string::npos) {
            partial_ += text.substr(start);
            break;
        }
        partial_ += text.substr(start, nl - start);
        push_locked(std::move(partial_));
        partial_.clear();
        start = nl + 1;
    }
    ++version_;
}

void OutputBuffer::append_line(const std::string& line) {
    std::lock_guard lock(mutex_);
    if (!partial_.empty()) {
        push_locked(std::move(partial_));
        partial_.clear();
    }
    push_locked(line);
    ++version_;
}

void OutputBuffer::flush_partial() {
    std::lock_guard lock(mutex_);
    if (partial_.empty()) return;
    push_locked(std::move(partial_));
    partial_.clear();
    ++version_;
}

void OutputBuffer::clear() {
    std::lock_guard lock(mutex_);
    lines_.clear();
    partial_.clear();
    ++version_;
}

std::vector<std::string> OutputBuffer::lines() const {
    std::lock_guard lock(mutex_);
    std::vector<std::string> result = lines_;
    if (!partial_.empty()) result.push_back(partial_);
    return result;
}

std::string OutputBuffer::text() const {
    std::lock_guard lock(mutex_);
    std::string result;
    for (const auto& line : lines_) {
        result += line;
        result += '\n';
    }
    result += partial_;
    return result;
}

uint64_t OutputBuffer::version() const {
    std::lock_guard lock(mutex_);
    return version_;
}

} // namespace tman
