#include "tui_app.hpp"
#include "tui_colors.hpp"
#include <algorithm>
#include <format>
#include <sstream>

namespace tman {

void TuiApp::request_kill_process(int pid, const std::string& name, bool is_tree) {
    view_model_.kill_dialog.open(pid, name, is_tree);
    flushinp();
}

void TuiApp::execute_kill(bool force) {
    auto& kd = view_model_.kill_dialog;
    if (kd.target_pid <= 0) return;

    KillResult result;
    if (kd.is_tree_kill) {
        result = killer_->kill_process_tree(kd.target_pid, force);
    } else {
        result = killer_->kill_process(kd.target_pid, force);
    }

    if (result.success && !result.process_still_running) {
        services_->status().info(std::format("Process {} ({}) terminated", kd.target_pid, kd.target_name));
        kd.is_visible = false;
        kd.target_pid = -1;
        monitor_->refresh_now();
    } else if (result.process_still_running && !force) {
        // Process didn't terminate, offer force kill
        kd.show_force_option = true;
        kd.error_message = result.error_message.empty() ? "Process still running after SIGTERM"
                                                        : result.error_message;
    } else {
        kd.error_message = result.error_message;
        services_->status().error(result.error_message);
    }
}

void TuiApp::handle_kill_dialog_input(int ch) {
    auto& kd = view_model_.kill_dialog;

    switch (ch) {
        case 'y':
        case 'Y':
            execute_kill(kd.show_force_option);
            break;

        case 'n':
        case 'N':
        case 27:  // Escape
            kd.is_visible = false;
            kd.target_pid = -1;
            break;
        // Ignore other keys
        default:
            break;
    }
}

void TuiApp::render_kill_dialog() {
    const auto& kd = view_model_.kill_dialog;
    if (!kd.is_visible) return;

    // Dialog dimensions
    int dialog_width = 56;
    int dialog_height = kd.show_force_option ? 10 : 8;
    if (!kd.error_message.empty()) dialog_height += 2;

    WINDOW* dialog_win = create_dialog(dialog_height, dialog_width,
                                       kd.is_tree_kill ? "Kill Process Tree" : "Kill Process");
    if (!dialog_win) return;

    // Process info
    mvwprintw(dialog_win, 2, 2, "%s", kd.is_tree_kill ? "Kill process tree starting at:" : "Kill process:");

    std::ostringstream proc_info;
    proc_info << kd.target_name << " (PID " << kd.target_pid << ")";
    wattron(dialog_win, A_BOLD);
    mvwprintw(dialog_win, 3, 4, "%s", fit(proc_info.str(), dialog_width - 6).c_str());
    wattroff(dialog_win, A_BOLD);

    int row = 5;

    // Error message
    if (!kd.error_message.empty()) {
        wattron(dialog_win, COLOR_PAIR(COLOR_PAIR_ERROR) | A_BOLD);
        mvwprintw(dialog_win, row++, 2, "%s", fit(kd.error_message, dialog_width - 4).c_str());
        wattroff(dialog_win, COLOR_PAIR(COLOR_PAIR_ERROR) | A_BOLD);
        row++;
    }

    // Buttons
    if (kd.show_force_option) {
        mvwprintw(dialog_win, row++, 2, "Process did not terminate. Force kill?");

        wattron(dialog_win, COLOR_PAIR(COLOR_PAIR_DIALOG_BUTTON));
        mvwprintw(dialog_win, row, 6, " [Y] Force Kill (SIGKILL) ");
        wattroff(dialog_win, COLOR_PAIR(COLOR_PAIR_DIALOG_BUTTON));

        mvwprintw(dialog_win, row, 36, " [N] Cancel ");
    } else {
        wattron(dialog_win, COLOR_PAIR(COLOR_PAIR_DIALOG_BUTTON));
        mvwprintw(dialog_win, row, 6, " [Y] Kill (SIGTERM) ");
        wattroff(dialog_win, COLOR_PAIR(COLOR_PAIR_DIALOG_BUTTON));

        mvwprintw(dialog_win, row, 30, " [N] Cancel ");
    }

    wrefresh(dialog_win);

    // Delete temporary window (but leave content on screen until next render)
    delwin(dialog_win);
}

void TuiApp::render_confirm() {
    const int width = std::max(44, static_cast<int>(confirm_.message.size()) + 6);
    WINDOW* win = create_dialog(7, width, confirm_.title);
    if (!win) return;

    mvwprintw(win, 2, 2, "%s", fit(confirm_.message, getmaxx(win) - 4).c_str());

    wattron(win, COLOR_PAIR(COLOR_PAIR_DIALOG_BUTTON));
    mvwprintw(win, 4, 6, " [Y] Yes ");
    wattroff(win, COLOR_PAIR(COLOR_PAIR_DIALOG_BUTTON));
    mvwprintw(win, 4, 20, " [N] No ");

    wrefresh(win);
    delwin(win);
}

void TuiApp::render_prompt() {
    const int max_x = getmaxx(stdscr);
    const int width = std::min(max_x - 4, 90);
    const bool has_hint = static_cast<bool>(prompt_.hint);

    WINDOW* win = create_dialog(has_hint ? 6 : 4, width, prompt_.title);
    if (!win) return;

    // Show the tail of long input so the cursor stays visible
    const int field_width = width - 6;
    std::string shown = prompt_.input;
    if (static_cast<int>(shown.size()) > field_width) {
        shown = shown.substr(shown.size() - field_width);
    }
    mvwprintw(win, 1, 2, "> %s", shown.c_str());

    if (has_hint) {
        wattron(win, A_DIM);
        mvwprintw(win, 3, 2, "%s", fit(prompt_.hint(prompt_.input), width - 4).c_str());
        wattroff(win, A_DIM);
    }
    mvwprintw(win, has_hint ? 4 : 2, 2, "Enter:OK  Esc:Cancel  Ctrl-U:Clear");

    wmove(win, 1, 4 + static_cast<int>(shown.size()));
    wrefresh(win);
    delwin(win);
}

void TuiApp::render_help_overlay() {
    int max_y, max_x;
    getmaxyx(stdscr, max_y, max_x);
    (void)max_x;

    // Help dialog dimensions
    int help_width = 64;
    int help_height = std::min(max_y, 40);

    WINDOW* help_win = create_dialog(help_height, help_width, "Help");
    if (!help_win) return;

    // Help content
    const char* help_lines[] = {
        "Global:",
        "  1-4, Tab        Switch tab",
        "  I               System information",
        "  L               System logs",
        "  q               Quit",
        "  ?/F1            This help",
        "",
        "Files:",
        "  Up/Down         Select recent file",
        "  Enter           Edit in the preferred editor",
        "  o               Edit a file by path",
        "  v               View file",
        "  x               Open with default application",
        "  e               Cycle preferred editor",
        "  d               Remove from recent list",
        "",
        "Cron:",
        "  a / e / d       Add / edit / delete job",
        "  r               Reload crontab",
        "  l               View cron logs",
        "",
        "SSH:",
        "  Enter           Connect (suspends the UI)",
        "  a / e / d       Add / edit / delete profile",
        "  t               Test connection",
        "  c               Quick connect user@host[:port]",
        "",
        "Processes:",
        "  Up/k, Down/j    Move selection",
        "  / u c           Filter by text / user / CPU%",
        "  s, S            Next sort column, reverse order",
        "  x, K            Kill process, kill tree",
        "  r/F5, p         Refresh now, pause auto refresh",
    };

    int row = 2;
    for (const char* line : help_lines) {
        if (row >= help_height - 2) break;

        if (line[0] == ' ' && line[1] == ' ') {
            // Key binding line
            std::string key(line, 2, 16);
            std::string desc(line + 18);

            wattron(help_win, COLOR_PAIR(COLOR_PAIR_HELP_KEY));
            mvwprintw(help_win, row, 2, "%s", key.c_str());
            wattroff(help_win, COLOR_PAIR(COLOR_PAIR_HELP_KEY));
            mvwprintw(help_win, row, 18, "%s", desc.c_str());
        } else {
            wattron(help_win, A_BOLD);
            mvwprintw(help_win, row, 2, "%s", line);
            wattroff(help_win, A_BOLD);
        }
        row++;
    }

    // Close instruction
    wattron(help_win, COLOR_PAIR(COLOR_PAIR_DIALOG_BUTTON));
    mvwprintw(help_win, help_height - 2, (help_width - 24) / 2, " Press any key to close ");
    wattroff(help_win, COLOR_PAIR(COLOR_PAIR_DIALOG_BUTTON));

    wrefresh(help_win);
    delwin(help_win);
}

void TuiApp::render_status_bar() {
    if (!status_win_) return;

    int max_x = getmaxx(status_win_);

    // First line: latest status message while it is fresh
    if (const auto latest = services_->status().latest();
        latest && std::chrono::steady_clock::now() - latest->timestamp < kStatusMessageTimeout) {
        // Multi-line messages show their first line only
        const std::string text = latest->text.substr(0, latest->text.find('\n'));
        const int pair = get_status_color(latest->level);
        wattron(status_win_, COLOR_PAIR(pair));
        mvwprintw(status_win_, 0, 1, "%s", fit(text, max_x - 2).c_str());
        wattroff(status_win_, COLOR_PAIR(pair));
    }

    // Second line: key hints
    const char* hints = "";
    switch (active_tab_) {
        case TuiTab::Files:
            hints = "Enter:Edit  o:Open  v:View  x:Default app  e:Editor  d:Forget";
            break;
        case TuiTab::Cron:
            hints = "a:Add  e:Edit  d:Delete  r:Reload  l:Cron logs";
            break;
        case TuiTab::Ssh:
            hints = "Enter:Connect  a:Add  e:Edit  d:Delete  t:Test  c:Quick connect";
            break;
        case TuiTab::Processes:
            hints = "/:Filter  u:User  s:Sort  x:Kill  K:Kill tree  p:Pause  r:Refresh";
            break;
    }

    wattron(status_win_, COLOR_PAIR(COLOR_PAIR_STATUS));
    mvwhline(status_win_, 1, 0, ' ', max_x);
    mvwprintw(status_win_, 1, 1, "%s", fit(std::string(hints) + "  q:Quit  ?:Help", max_x - 2).c_str());
    wattroff(status_win_, COLOR_PAIR(COLOR_PAIR_STATUS));
}

} // namespace tman
