#pragma once

#include "../errors.hpp"
#include <string>

namespace tman {

// In-memory text file for the editor tab
class TextDocument {
public:
    void new_document();

    // Replaces the contents; the document stays untouched on failure
    ActionResult load(const std::string& path);

    // Writes to the current path; fails if the document was never saved
    ActionResult save();
    ActionResult save_as(const std::string& path);

    void set_content(std::string content);

    [[nodiscard]] const std::string& content() const { return content_; }
    [[nodiscard]] const std::string& path() const { return path_; }
    [[nodiscard]] bool has_path() const { return !path_.empty(); }
    [[nodiscard]] bool is_dirty() const { return dirty_; }

    // "Untitled" or the file name, with a trailing '*' when modified
    [[nodiscard]] std::string title() const;

    static constexpr size_t kMaxFileSize = 16 * 1024 * 1024;

private:
    ActionResult write_to(const std::string& path);

    std::string path_;
    std::string content_;
    bool dirty_ = false;
};

} // namespace tman
