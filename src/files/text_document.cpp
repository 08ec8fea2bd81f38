#include "text_document.hpp"
#include "../util.hpp"
#include <filesystem>
#include <format>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

namespace tman {

namespace {

// Well-formed UTF-8: no overlong forms, surrogates or code points past U+10FFFF
bool is_valid_utf8(const std::string& data) {
    const auto* p = reinterpret_cast<const unsigned char*>(data.data());
    const auto* end = p + data.size();
    while (p < end) {
        const unsigned char c = *p;
        if (c < 0x80) {
            ++p;
            continue;
        }
        int length = 0;
        unsigned char lo = 0x80, hi = 0xBF;
        if (c >= 0xC2 && c <= 0xDF) {
            length = 2;
        } else if (c >= 0xE0 && c <= 0xEF) {
            length = 3;
            if (c == 0xE0) lo = 0xA0;
            if (c == 0xED) hi = 0x9F;
        } else if (c >= 0xF0 && c <= 0xF4) {
            length = 4;
            if (c == 0xF0) lo = 0x90;
            if (c == 0xF4) hi = 0x8F;
        } else {
            return false;
        }
        if (end - p < length) return false;
        if (p[1] < lo || p[1] > hi) return false;
        for (int i = 2; i < length; ++i) {
            if (p[i] < 0x80 || p[i] > 0xBF) return false;
        }
        p += length;
    }
    return true;
}

} // namespace

void TextDocument::new_document() {
    path_.clear();
    content_.clear();
    dirty_ = false;
}

ActionResult TextDocument::load(const std::string& path) {
    const std::string full_path = expand_home(path);

    std::error_code ec;
    if (!fs::is_regular_file(full_path, ec)) {
        return {false, std::format("Failed to open file: {}: not a regular file", full_path)};
    }
    if (const auto size = fs::file_size(full_path, ec); ec || size > kMaxFileSize) {
        return {false, std::format("Failed to open file: {}: too large", full_path)};
    }

    std::ifstream file(full_path, std::ios::binary);
    if (!file) {
        return {false, std::format("Failed to open file: {}: permission denied", full_path)};
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    std::string data = ss.str();

    if (data.find('\0') != std::string::npos || !is_valid_utf8(data)) {
        return {false, std::format("Failed to open file: {}: not a text file", full_path)};
    }

    path_ = full_path;
    content_ = std::move(data);
    dirty_ = false;
    return {true, "Opened: " + full_path};
}

ActionResult TextDocument::write_to(const std::string& path) {
    if (std::string error; !atomic_write_file(path, content_, error)) {
        return {false, "Failed to save file: " + error};
    }
    path_ = path;
    dirty_ = false;
    return {true, {}};
}

ActionResult TextDocument::save() {
    if (path_.empty()) {
        return {false, "No file name yet, use Save As"};
    }
    auto result = write_to(path_);
    if (result.success) result.message = "Saved: " + path_;
    return result;
}

ActionResult TextDocument::save_as(const std::string& path) {
    const std::string full_path = expand_home(trim(path));
    if (full_path.empty()) {
        return {false, "No path given"};
    }
    auto result = write_to(full_path);
    if (result.success) result.message = "Saved as: " + full_path;
    return result;
}

void TextDocument::set_content(std::string content) {
    if (content != content_) {
        content_ = std::move(content);
        dirty_ = true;
    }
}

std::string TextDocument::title() const {
    std::string name = path_.empty() ? "Untitled" : fs::path(path_).filename().string();
    if (dirty_) name += " *";
    return name;
}

} // namespace tman
