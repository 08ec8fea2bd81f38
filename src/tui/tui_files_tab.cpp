#include "tui_app.hpp"
#include "tui_colors.hpp"
#include "../util.hpp"
#include <algorithm>
#include <filesystem>

namespace tman {

std::string TuiApp::selected_recent_file() const {
    const auto& recent = services_->config().recent_files;
    if (recent_index_ < 0 || recent_index_ >= static_cast<int>(recent.size())) return {};
    return recent[recent_index_];
}

void TuiApp::render_files_tab() {
    if (!main_win_) return;

    int max_y, max_x;
    getmaxyx(main_win_, max_y, max_x);
    draw_box_title(main_win_, "Files");

    const Config& config = services_->config();
    mvwprintw(main_win_, 1, 2, "Editor: ");
    wattron(main_win_, COLOR_PAIR(COLOR_PAIR_TITLE) | A_BOLD);
    wprintw(main_win_, "%s", config.preferred_editor.c_str());
    wattroff(main_win_, COLOR_PAIR(COLOR_PAIR_TITLE) | A_BOLD);
    wattron(main_win_, A_DIM);
    wprintw(main_win_, "   [e] change, [o] edit a file by path");
    wattroff(main_win_, A_DIM);

    wattron(main_win_, COLOR_PAIR(COLOR_PAIR_HEADER) | A_BOLD);
    mvwprintw(main_win_, 3, 2, "Recent Files");
    wattroff(main_win_, COLOR_PAIR(COLOR_PAIR_HEADER) | A_BOLD);

    const auto& recent = config.recent_files;
    if (recent.empty()) {
        wattron(main_win_, A_DIM);
        mvwprintw(main_win_, 4, 2, "No recent files. Press 'o' to open one.");
        wattroff(main_win_, A_DIM);
        return;
    }

    const int list_rows = max_y - 5;
    clamp_selection(recent_index_, recent_scroll_, static_cast<int>(recent.size()), list_rows);

    int row = 4;
    for (int i = recent_scroll_; i < static_cast<int>(recent.size()) && row < max_y - 1; ++i, ++row) {
        const bool is_selected = i == recent_index_;
        std::error_code ec;
        const bool exists = std::filesystem::exists(recent[i], ec);

        if (is_selected) {
            wattron(main_win_, COLOR_PAIR(COLOR_PAIR_SELECTED));
            mvwhline(main_win_, row, 1, ' ', max_x - 2);
        } else if (!exists) {
            wattron(main_win_, A_DIM);
        }
        mvwprintw(main_win_, row, 2, "%s%s", fit(recent[i], max_x - 16).c_str(), exists ? "" : "  (missing)");
        if (is_selected) {
            wattroff(main_win_, COLOR_PAIR(COLOR_PAIR_SELECTED));
        } else if (!exists) {
            wattroff(main_win_, A_DIM);
        }
    }
}

void TuiApp::handle_files_input(int ch) {
    const auto& recent = services_->config().recent_files;
    const int count = static_cast<int>(recent.size());

    switch (ch) {
        case KEY_UP:
        case 'k':
            recent_index_ = std::max(0, recent_index_ - 1);
            break;

        case KEY_DOWN:
        case 'j':
            recent_index_ = std::min(std::max(0, count - 1), recent_index_ + 1);
            break;

        case '\n':
        case '\r':
        case KEY_ENTER:
            if (const std::string path = selected_recent_file(); !path.empty()) {
                edit_file(path);
            }
            break;

        case 'o':
            open_prompt("Edit file (~ is expanded)", selected_recent_file(), [this](const std::string& path) {
                edit_file(path);
            });
            break;

        case 'v':
            open_prompt("View file", selected_recent_file(), [this](const std::string& path) {
                preview_file(path);
            });
            break;

        case 'x':
            open_prompt("Open with default application", selected_recent_file(), [this](const std::string& path) {
                services_->status().report(services_->files().open_path(path));
            });
            break;

        case 'e':
            cycle_editor();
            break;

        case 'd':
            if (const std::string path = selected_recent_file(); !path.empty()) {
                Config& config = services_->config();
                if (!config.remove_recent_file(path)) break;
                if (const auto saved = config.save(); !saved.success) {
                    services_->status().report(saved);
                } else {
                    services_->status().info("Removed from recent files: " + path);
                }
            }
            break;
    }
}

void TuiApp::edit_file(const std::string& path) {
    if (trim(path).empty()) {
        services_->status().error("No path given");
        return;
    }
    run_suspended([this, &path] {
        static_cast<void>(services_->edit_in_foreground(path));
    });
    // The edited file is now first in the list
    recent_index_ = 0;
}

void TuiApp::preview_file(const std::string& path) {
    if (!services_->open_document(path).success) return;
    const TextDocument& doc = services_->document();
    show_text(LogDocument(doc.path(), doc.content()));
}

void TuiApp::cycle_editor() {
    const auto& editors = FileActions::editor_choices();
    const auto current = std::find(editors.begin(), editors.end(), services_->config().preferred_editor);
    const auto next = (current == editors.end() || current + 1 == editors.end()) ? editors.begin() : current + 1;

    if (services_->set_preferred_editor(*next).success) {
        services_->status().info("Preferred editor: " + *next);
    }
}

} // namespace tman
