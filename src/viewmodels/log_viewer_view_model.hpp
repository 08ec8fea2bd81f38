#pragma once

#include "../log_viewer.hpp"
#include <string>

namespace tman {

struct LogViewerViewModel {
    bool is_visible = false;
    LogDocument document;

    char search_buffer[256] = {};
    std::string search_message;
    int highlight_line = -1;        // First match, scrolled into view once
    bool scroll_to_highlight = false;

    char save_path_buffer[1024] = {};
    bool show_save_dialog = false;

    void show(LogDocument doc) {
        document = std::move(doc);
        search_message.clear();
        highlight_line = -1;
        scroll_to_highlight = false;
        is_visible = true;
    }
};

} // namespace tman
