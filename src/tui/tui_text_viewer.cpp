#include "tui_app.hpp"
#include "tui_colors.hpp"
#include "../system_overview.hpp"
#include "../util.hpp"
#include "../viewmodels/input_buffer.hpp"
#include <algorithm>

namespace tman {

void TuiApp::show_text(LogDocument document) {
    view_model_.log_viewer.show(std::move(document));
    viewer_scroll_ = 0;
    viewer_matches_.clear();
    viewer_match_index_ = 0;
}

void TuiApp::show_logs(const LogKind kind) {
    auto result = services_->logs().fetch(kind);
    if (!result.found) {
        services_->status().error(result.message);
        return;
    }
    show_text(std::move(result.document));
}

void TuiApp::show_system_overview() {
    auto& sp = view_model_.system_panel;
    sp.overview_text = build_system_overview(services_->runner(), *system_provider_);
    show_text(LogDocument("System Information", sp.overview_text));
}

void TuiApp::search_text_viewer(const std::string& term) {
    auto& lv = view_model_.log_viewer;
    set_buffer(lv.search_buffer, term);

    const auto found = lv.document.search(trim(term));
    lv.search_message = found.message;
    viewer_matches_ = found.matching_lines;
    viewer_match_index_ = 0;
    lv.highlight_line = viewer_matches_.empty() ? -1 : static_cast<int>(viewer_matches_.front());

    if (lv.highlight_line >= 0) {
        const int page = std::max(1, getmaxy(stdscr) - 6);
        viewer_scroll_ = std::max(0, lv.highlight_line - page / 2);
    }
}

void TuiApp::render_text_viewer() {
    const auto& lv = view_model_.log_viewer;

    int max_y, max_x;
    getmaxyx(stdscr, max_y, max_x);

    const int height = std::max(6, max_y - 2);
    const int width = std::max(20, max_x - 4);
    WINDOW* win = newwin(height, width, 1, 2);
    if (!win) return;

    const std::string title = lv.document.title().empty() ? std::string("Viewer") : lv.document.title();
    draw_box_title(win, title);

    const auto& lines = lv.document.lines();
    const int text_rows = height - 4;
    const int text_width = width - 4;

    for (int row = 0; row < text_rows; ++row) {
        const size_t index = static_cast<size_t>(viewer_scroll_ + row);
        if (index >= lines.size()) break;

        const bool highlighted = static_cast<int>(index) == lv.highlight_line;
        const bool is_match = std::binary_search(viewer_matches_.begin(), viewer_matches_.end(), index);
        if (highlighted) {
            wattron(win, COLOR_PAIR(COLOR_PAIR_SEARCH));
        } else if (is_match) {
            wattron(win, COLOR_PAIR(COLOR_PAIR_HEADER));
        }
        mvwprintw(win, row + 1, 2, "%s", fit(lines[index], text_width).c_str());
        if (highlighted) {
            wattroff(win, COLOR_PAIR(COLOR_PAIR_SEARCH));
        } else if (is_match) {
            wattroff(win, COLOR_PAIR(COLOR_PAIR_HEADER));
        }
    }

    // Footer: search result and document info
    if (!lv.search_message.empty()) {
        wattron(win, COLOR_PAIR(COLOR_PAIR_HEADER));
        mvwprintw(win, height - 3, 2, "%s", fit(lv.search_message, text_width).c_str());
        wattroff(win, COLOR_PAIR(COLOR_PAIR_HEADER));
    }
    wattron(win, A_DIM);
    mvwprintw(win, height - 2, 2, "%s", fit(lv.document.info_line() + "   /:Search n/N:Next/Prev s:Save c:Clear q:Close",
                                          text_width).c_str());
    wattroff(win, A_DIM);

    wrefresh(win);
    delwin(win);
}

} // namespace tman
