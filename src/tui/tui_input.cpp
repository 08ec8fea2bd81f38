#include "tui_app.hpp"
#include "tui_colors.hpp"
#include "../util.hpp"
#include "../viewmodels/input_buffer.hpp"
#include <algorithm>

namespace tman {

void TuiApp::handle_input(int ch) {
    // Debounce: ignore input for a few frames after showing dialogs
    if (dialog_debounce_ > 0) {
        dialog_debounce_--;
        return;
    }

    // Help overlay takes priority
    if (show_help_) {
        handle_help_input(ch);
        return;
    }

    // Prompts and dialogs own the keyboard while visible
    if (prompt_.is_visible) {
        handle_prompt_input(ch);
        return;
    }
    if (confirm_.is_visible) {
        handle_confirm_input(ch);
        return;
    }
    if (view_model_.kill_dialog.is_visible) {
        handle_kill_dialog_input(ch);
        return;
    }
    if (view_model_.log_viewer.is_visible) {
        handle_text_viewer_input(ch);
        return;
    }

    // Global keys
    switch (ch) {
        case 'q':
        case 'Q':
            running_ = false;
            return;

        case '?':
        case KEY_F(1):
            show_help_ = true;
            flushinp();  // Clear any pending input
            dialog_debounce_ = 5;  // Ignore input for 5 frames
            return;

        case '1':
            switch_tab(TuiTab::Files);
            return;
        case '2':
            switch_tab(TuiTab::Cron);
            return;
        case '3':
            switch_tab(TuiTab::Ssh);
            return;
        case '4':
            switch_tab(TuiTab::Processes);
            return;

        case '\t':  // Tab - next tab
            switch_tab(static_cast<TuiTab>((static_cast<int>(active_tab_) + 1) % 4));
            return;

        case KEY_BTAB:  // Shift+Tab - previous tab
            switch_tab(static_cast<TuiTab>((static_cast<int>(active_tab_) + 3) % 4));
            return;

        case 'I':
            show_system_overview();
            return;

        case 'L':
            show_logs(LogKind::System);
            return;
    }

    // Tab-specific input
    switch (active_tab_) {
        case TuiTab::Files:
            handle_files_input(ch);
            break;
        case TuiTab::Cron:
            handle_cron_input(ch);
            break;
        case TuiTab::Ssh:
            handle_ssh_input(ch);
            break;
        case TuiTab::Processes:
            handle_process_list_input(ch);
            break;
    }
}

void TuiApp::open_prompt(std::string title, std::string initial,
                         std::function<void(const std::string&)> on_submit,
                         std::function<std::string(const std::string&)> hint) {
    prompt_.title = std::move(title);
    prompt_.input = std::move(initial);
    prompt_.on_submit = std::move(on_submit);
    prompt_.hint = std::move(hint);
    prompt_.is_visible = true;
}

void TuiApp::open_confirm(std::string title, std::string message, std::function<void()> on_confirm) {
    confirm_.title = std::move(title);
    confirm_.message = std::move(message);
    confirm_.on_confirm = std::move(on_confirm);
    confirm_.is_visible = true;
    flushinp();
}

void TuiApp::handle_prompt_input(int ch) {
    switch (ch) {
        case 27:  // Escape - cancel
            prompt_.is_visible = false;
            prompt_.input.clear();
            break;

        case '\n':
        case '\r':
        case KEY_ENTER: {
            // The callback may open the next prompt, so hide this one first
            auto on_submit = std::move(prompt_.on_submit);
            const std::string input = prompt_.input;
            prompt_.is_visible = false;
            prompt_.on_submit = nullptr;
            prompt_.hint = nullptr;
            if (on_submit) {
                on_submit(input);
            }
            break;
        }

        case KEY_BACKSPACE:
        case 127:
        case 8:
            if (!prompt_.input.empty()) {
                prompt_.input.pop_back();
            }
            break;

        case 21:  // Ctrl-U clears the line
            prompt_.input.clear();
            break;

        default:
            if (ch >= 32 && ch < 127) {
                prompt_.input += static_cast<char>(ch);
            }
            break;
    }
}

void TuiApp::handle_confirm_input(int ch) {
    switch (ch) {
        case 'y':
        case 'Y': {
            auto on_confirm = std::move(confirm_.on_confirm);
            confirm_.is_visible = false;
            confirm_.on_confirm = nullptr;
            if (on_confirm) {
                on_confirm();
            }
            break;
        }

        case 'n':
        case 'N':
        case 27:  // Escape
            confirm_.is_visible = false;
            confirm_.on_confirm = nullptr;
            break;
    }
}

void TuiApp::handle_help_input(int ch) {
    (void)ch;
    show_help_ = false;
    flushinp();
    dialog_debounce_ = 3;
}

void TuiApp::handle_text_viewer_input(int ch) {
    auto& lv = view_model_.log_viewer;
    const int line_count = static_cast<int>(lv.document.line_count());
    int max_y = getmaxy(stdscr);
    const int page = std::max(1, max_y - 6);

    switch (ch) {
        case 'q':
        case 27:  // Escape
            lv.is_visible = false;
            break;

        case KEY_UP:
        case 'k':
            viewer_scroll_--;
            break;

        case KEY_DOWN:
        case 'j':
            viewer_scroll_++;
            break;

        case KEY_PPAGE:
            viewer_scroll_ -= page;
            break;

        case KEY_NPAGE:
        case ' ':
            viewer_scroll_ += page;
            break;

        case KEY_HOME:
        case 'g':
            viewer_scroll_ = 0;
            break;

        case KEY_END:
        case 'G':
            viewer_scroll_ = line_count - page;
            break;

        case '/':
            open_prompt("Search", lv.search_buffer, [this](const std::string& term) {
                search_text_viewer(term);
            });
            break;

        case 'n':  // Next search match
        case 'N':  // Previous search match
            if (!viewer_matches_.empty()) {
                const size_t count = viewer_matches_.size();
                viewer_match_index_ = ch == 'n' ? (viewer_match_index_ + 1) % count
                                                : (viewer_match_index_ + count - 1) % count;
                lv.highlight_line = static_cast<int>(viewer_matches_[viewer_match_index_]);
                viewer_scroll_ = lv.highlight_line - page / 2;
            }
            break;

        case 's':
            open_prompt("Save to file", lv.save_path_buffer, [this](const std::string& path) {
                auto& viewer = view_model_.log_viewer;
                set_buffer(viewer.save_path_buffer, path);
                services_->status().report(viewer.document.save(expand_home(trim(path))));
            });
            break;

        case 'c':
            lv.document.clear();
            lv.search_message.clear();
            lv.highlight_line = -1;
            viewer_matches_.clear();
            break;
    }

    viewer_scroll_ = std::clamp(viewer_scroll_, 0, std::max(0, line_count - page));
}

} // namespace tman
