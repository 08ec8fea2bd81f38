#include "tui_app.hpp"
#include "tui_colors.hpp"
#include "../util.hpp"
#include "../viewmodels/input_buffer.hpp"
#include <algorithm>
#include <cstdlib>
#include <format>

namespace tman {

void TuiApp::render_process_list() {
    if (!main_win_) return;

    auto& pl = view_model_.process_list;
    pl.update_rows();

    int max_y, max_x;
    getmaxyx(main_win_, max_y, max_x);

    // Title shows the active filter and sort order
    std::string title = std::format("Processes ({} of {})", pl.rows.size(),
                                    pl.data ? pl.data->process_count : 0);
    if (const auto filter = pl.make_filter(); !filter.is_empty()) {
        title += " filter:";
        if (!filter.text.empty()) title += " '" + filter.text + "'";
        if (!filter.user.empty()) title += " user=" + filter.user;
        if (filter.min_cpu_percent > 0.0) title += std::format(" cpu>={:.0f}%", filter.min_cpu_percent);
    }
    title += std::format(" sort: {} {}", sort_column_name(pl.sort_column), pl.sort_ascending ? "asc" : "desc");
    draw_box_title(main_win_, title);

    // Column headers - command line takes the rest
    wattron(main_win_, COLOR_PAIR(COLOR_PAIR_HEADER) | A_BOLD);
    mvwprintw(main_win_, 1, 2, "%7s %-20s %-10s %6s %9s %7s %5s  %s",
              "PID", "Name", "User", "CPU%", "Memory", "Threads", "State", "Command");
    wattroff(main_win_, COLOR_PAIR(COLOR_PAIR_HEADER) | A_BOLD);

    const int fixed_cols_end = 2 + 7 + 1 + 20 + 1 + 10 + 1 + 6 + 1 + 9 + 1 + 7 + 1 + 5 + 2;
    const int available_rows = max_y - 3;

    scroll_to_selection();

    int row = 2;
    for (size_t i = process_scroll_offset_;
         i < pl.rows.size() && row < max_y - 1;
         ++i) {
        const ProcessInfo& info = *pl.rows[i];
        const bool is_selected = info.pid == pl.selected_pid;

        const int state_color = get_state_color(info.state_char);
        if (is_selected) {
            wattron(main_win_, COLOR_PAIR(COLOR_PAIR_SELECTED));
            mvwhline(main_win_, row, 1, ' ', max_x - 2);
        } else {
            wattron(main_win_, COLOR_PAIR(state_color));
        }

        mvwprintw(main_win_, row, 2, "%7d %-20s %-10s %5.1f%% %9s %7d   %c  ",
                  info.pid,
                  fit(info.name, 20).c_str(),
                  fit(info.user_name, 10).c_str(),
                  info.cpu_percent,
                  format_bytes(info.resident_memory).c_str(),
                  info.thread_count,
                  info.state_char);

        // Command line column (truncate to fit remaining space)
        const int cmdline_max = max_x - fixed_cols_end - 2;
        if (cmdline_max > 3) {
            const std::string cmdline = info.command_line.empty() ? "[" + info.name + "]" : info.command_line;
            mvwprintw(main_win_, row, fixed_cols_end, "%s", fit(cmdline, cmdline_max).c_str());
        }

        if (is_selected) {
            wattroff(main_win_, COLOR_PAIR(COLOR_PAIR_SELECTED));
        } else {
            wattroff(main_win_, COLOR_PAIR(state_color));
        }
        row++;
    }

    if (pl.rows.empty()) {
        wattron(main_win_, A_DIM);
        mvwprintw(main_win_, 2, 2, "%s", pl.data ? "No processes match the filter" : "Collecting...");
        wattroff(main_win_, A_DIM);
    }

    // Scroll indicators
    if (process_scroll_offset_ > 0) {
        wattron(main_win_, COLOR_PAIR(COLOR_PAIR_TITLE));
        mvwprintw(main_win_, 1, max_x - 4, "^^^");
        wattroff(main_win_, COLOR_PAIR(COLOR_PAIR_TITLE));
    }
    if (process_scroll_offset_ + available_rows < static_cast<int>(pl.rows.size())) {
        wattron(main_win_, COLOR_PAIR(COLOR_PAIR_TITLE));
        mvwprintw(main_win_, max_y - 2, max_x - 4, "vvv");
        wattroff(main_win_, COLOR_PAIR(COLOR_PAIR_TITLE));
    }

    // Most recent read error, if any
    if (const auto errors = monitor_->get_recent_errors(); !errors.empty()) {
        wattron(main_win_, COLOR_PAIR(COLOR_PAIR_WARNING));
        mvwprintw(main_win_, max_y - 1, 2, " [!] %s ", fit(errors.back().message, max_x - 12).c_str());
        wattroff(main_win_, COLOR_PAIR(COLOR_PAIR_WARNING));
    }
}

void TuiApp::scroll_to_selection() {
    auto& pl = view_model_.process_list;
    int index = pl.selected_row();
    if (index < 0) {
        // Selection gone or filtered out: fall back to the first row
        if (pl.rows.empty()) {
            process_scroll_offset_ = 0;
            return;
        }
        index = std::clamp(process_scroll_offset_, 0, static_cast<int>(pl.rows.size()) - 1);
        pl.selected_pid = pl.rows[index]->pid;
    }
    clamp_selection(index, process_scroll_offset_, static_cast<int>(pl.rows.size()), visible_rows_);
}

void TuiApp::move_selection(int delta) {
    auto& pl = view_model_.process_list;
    if (pl.rows.empty()) return;

    int index = std::max(0, pl.selected_row());
    index = std::clamp(index + delta, 0, static_cast<int>(pl.rows.size()) - 1);
    pl.selected_pid = pl.rows[index]->pid;
    scroll_to_selection();
}

void TuiApp::page_up() {
    move_selection(-std::max(1, visible_rows_));
}

void TuiApp::page_down() {
    move_selection(std::max(1, visible_rows_));
}

void TuiApp::cycle_sort_column() {
    auto& pl = view_model_.process_list;
    const int next = (static_cast<int>(pl.sort_column) + 1) % (static_cast<int>(ProcessSortColumn::Command) + 1);
    pl.sort_column = static_cast<ProcessSortColumn>(next);
    // Text columns read naturally A-Z, numbers biggest first
    pl.sort_ascending = pl.sort_column == ProcessSortColumn::Pid ||
                        pl.sort_column == ProcessSortColumn::Name ||
                        pl.sort_column == ProcessSortColumn::User ||
                        pl.sort_column == ProcessSortColumn::Command;
    pl.rows_dirty = true;
}

void TuiApp::handle_process_list_input(int ch) {
    auto& pl = view_model_.process_list;

    switch (ch) {
        case KEY_UP:
        case 'k':
            move_selection(-1);
            break;

        case KEY_DOWN:
        case 'j':
            move_selection(1);
            break;

        case KEY_PPAGE:
            page_up();
            break;

        case KEY_NPAGE:
            page_down();
            break;

        case KEY_HOME:
        case 'g':
            if (!pl.rows.empty()) {
                pl.selected_pid = pl.rows.front()->pid;
                process_scroll_offset_ = 0;
            }
            break;

        case KEY_END:
        case 'G':
            if (!pl.rows.empty()) {
                pl.selected_pid = pl.rows.back()->pid;
                scroll_to_selection();
            }
            break;

        case '/':
            open_prompt("Filter by name or command", pl.filter_buffer, [this](const std::string& text) {
                auto& list = view_model_.process_list;
                set_buffer(list.filter_buffer, trim(text));
                list.rows_dirty = true;
            });
            break;

        case 'u':
            open_prompt("Filter by user (empty = any)", pl.user_buffer, [this](const std::string& text) {
                auto& list = view_model_.process_list;
                set_buffer(list.user_buffer, trim(text));
                list.rows_dirty = true;
            });
            break;

        case 'c':
            open_prompt("Minimum CPU% (0 = off)", std::format("{:.0f}", pl.min_cpu_percent),
                        [this](const std::string& text) {
                auto& list = view_model_.process_list;
                const std::string value = trim(text);
                char* end = nullptr;
                const double percent = value.empty() ? 0.0 : std::strtod(value.c_str(), &end);
                if (!value.empty() && (end == value.c_str() || *end != '\0' || percent < 0.0)) {
                    services_->status().error("Invalid CPU percentage: " + value);
                    return;
                }
                list.min_cpu_percent = static_cast<float>(percent);
                list.rows_dirty = true;
            });
            break;

        case 27:  // Escape - clear all filters
            clear_buffer(pl.filter_buffer);
            clear_buffer(pl.user_buffer);
            pl.min_cpu_percent = 0.0f;
            pl.rows_dirty = true;
            break;

        case 's':
            cycle_sort_column();
            break;

        case 'S':
            pl.sort_ascending = !pl.sort_ascending;
            pl.rows_dirty = true;
            break;

        case 'x':  // Kill process (single)
            if (const ProcessInfo* info = pl.selected()) {
                request_kill_process(info->pid, info->name, false);
            }
            break;

        case 'K':  // Kill process tree
            if (const ProcessInfo* info = pl.selected()) {
                request_kill_process(info->pid, info->name, true);
            }
            break;

        case 'r':
        case KEY_F(5):
            monitor_->refresh_now();
            services_->status().info("Refreshing process list");
            break;

        case 'p': {
            const bool auto_refresh = monitor_->is_paused();
            if (auto_refresh) {
                monitor_->resume();
            } else {
                monitor_->pause();
            }
            services_->config().monitor.auto_refresh = auto_refresh;
            if (const auto saved = services_->config().save(); !saved.success) {
                services_->status().report(saved);
            }
            break;
        }
    }
}

} // namespace tman
