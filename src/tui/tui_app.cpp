#include "tui_app.hpp"
#include "tui_colors.hpp"
#include <cassert>
#include <csignal>
#include <cstdio>
#include <algorithm>
#include <chrono>
#include <thread>

namespace tman {

// Signal handler for terminal resize
static std::atomic<bool> g_resize_requested{false};

static void handle_resize([[maybe_unused]] int sig) {
    g_resize_requested.store(true);
}

TuiApp::TuiApp(AppServices* services,
               ProcessMonitor* monitor,
               ISystemDataProvider* system_provider,
               IProcessKiller* killer)
    : services_(services)
    , monitor_(monitor)
    , system_provider_(system_provider)
    , killer_(killer)
{
    assert(services_ != nullptr);
    assert(monitor_ != nullptr);
    assert(system_provider_ != nullptr);
    assert(killer_ != nullptr);
}

TuiApp::~TuiApp() {
    cleanup_windows();
}

void TuiApp::run() {
    // Initialize ncurses
    initscr();
    cbreak();
    noecho();
    keypad(stdscr, TRUE);
    curs_set(0);  // Hide cursor
    nodelay(stdscr, TRUE);  // Non-blocking input
    set_escdelay(25);

    // Initialize colors
    init_colors();

    // Set terminal title (like GUI version: "Terminal Manager: uname-info")
    std::string title = "Terminal Manager: " + system_provider_->get_system_info_string();
    printf("\033]0;%s\007", title.c_str());
    fflush(stdout);

    // Set up resize handler
    signal(SIGWINCH, handle_resize);

    create_windows();

    // Start data collection
    monitor_->start();
    current_data_ = monitor_->get_snapshot();
    view_model_.update_from_snapshot(current_data_);

    services_->status().info("Welcome to Terminal Manager. Press ? for help.");

    running_ = true;
    auto last_update = std::chrono::steady_clock::now();
    constexpr auto update_interval = std::chrono::milliseconds(100);

    while (running_) {
        // Handle terminal resize
        if (g_resize_requested.exchange(false)) {
            endwin();
            refresh();
            resize_windows();
        }

        // Handle input
        int ch = getch();
        if (ch != ERR) {
            handle_input(ch);
        }

        // Update data periodically
        auto now = std::chrono::steady_clock::now();
        if (now - last_update >= update_interval) {
            auto new_data = monitor_->get_snapshot();
            if (new_data && (!current_data_ || new_data->generation != current_data_->generation)) {
                current_data_ = new_data;
                view_model_.update_from_snapshot(current_data_);
            }
            last_update = now;
        }

        render();

        // Small sleep to reduce CPU usage
        std::this_thread::sleep_for(std::chrono::milliseconds(16));
    }

    // Cleanup
    monitor_->stop();
    services_->shutdown();
    cleanup_windows();
    endwin();

    // Reset terminal title
    printf("\033]0;\007");
    fflush(stdout);
}

void TuiApp::run_suspended(const std::function<void()>& action) {
    def_prog_mode();
    endwin();

    action();

    reset_prog_mode();
    flushinp();
    refresh();
    resize_windows();
}

void TuiApp::switch_tab(TuiTab tab) {
    if (tab == active_tab_) return;
    active_tab_ = tab;
    if (tab == TuiTab::Cron && !view_model_.cron.loaded) {
        refresh_cron_jobs();
        view_model_.cron.loaded = true;
    }
    // The system panel only exists on the Processes tab
    resize_windows();
}

void TuiApp::create_windows() {
    int max_y, max_x;
    getmaxyx(stdscr, max_y, max_x);

    const int system_height = active_tab_ == TuiTab::Processes ? kSystemPanelHeight : 0;
    const int main_height = std::max(3, max_y - kTabBarHeight - system_height - kStatusBarHeight);

    int y = 0;
    tab_win_ = newwin(kTabBarHeight, max_x, y, 0);
    y += kTabBarHeight;

    if (system_height > 0) {
        system_win_ = newwin(system_height, max_x, y, 0);
        y += system_height;
    }

    main_win_ = newwin(main_height, max_x, y, 0);
    y += main_height;
    visible_rows_ = main_height - 3;  // Border and header row

    status_win_ = newwin(kStatusBarHeight, max_x, y, 0);

    keypad(tab_win_, TRUE);
    if (system_win_) keypad(system_win_, TRUE);
    keypad(main_win_, TRUE);
    keypad(status_win_, TRUE);
}

void TuiApp::resize_windows() {
    cleanup_windows();
    create_windows();
}

void TuiApp::cleanup_windows() {
    for (WINDOW** win : {&tab_win_, &system_win_, &main_win_, &status_win_}) {
        if (*win) {
            delwin(*win);
            *win = nullptr;
        }
    }
}

void TuiApp::render() {
    werase(tab_win_);
    if (system_win_) werase(system_win_);
    werase(main_win_);
    werase(status_win_);

    render_tab_bar();
    switch (active_tab_) {
        case TuiTab::Files:
            render_files_tab();
            break;
        case TuiTab::Cron:
            render_cron_tab();
            break;
        case TuiTab::Ssh:
            render_ssh_tab();
            break;
        case TuiTab::Processes:
            render_system_panel();
            render_process_list();
            break;
    }
    render_status_bar();

    wnoutrefresh(tab_win_);
    if (system_win_) wnoutrefresh(system_win_);
    wnoutrefresh(main_win_);
    wnoutrefresh(status_win_);
    doupdate();

    // Overlays draw straight to the screen on top of the panels
    curs_set(prompt_.is_visible ? 1 : 0);
    if (view_model_.log_viewer.is_visible) {
        render_text_viewer();
    }
    if (view_model_.kill_dialog.is_visible) {
        render_kill_dialog();
    }
    if (confirm_.is_visible) {
        render_confirm();
    }
    if (prompt_.is_visible) {
        render_prompt();
    }
    if (show_help_) {
        render_help_overlay();
    }
}

void TuiApp::render_tab_bar() {
    struct TabLabel {
        TuiTab tab;
        const char* label;
    };
    static constexpr TabLabel tabs[] = {
        {TuiTab::Files, "1:Files"},
        {TuiTab::Cron, "2:Cron"},
        {TuiTab::Ssh, "3:SSH"},
        {TuiTab::Processes, "4:Processes"},
    };

    int x = 1;
    for (const auto& t : tabs) {
        const int pair = t.tab == active_tab_ ? COLOR_PAIR_TAB_ACTIVE : COLOR_PAIR_TAB_INACTIVE;
        wattron(tab_win_, COLOR_PAIR(pair));
        mvwprintw(tab_win_, 0, x, " %s ", t.label);
        wattroff(tab_win_, COLOR_PAIR(pair));
        x += static_cast<int>(std::char_traits<char>::length(t.label)) + 3;
    }

    const std::string name = "Terminal Manager";
    const int name_x = getmaxx(tab_win_) - static_cast<int>(name.size()) - 1;
    if (name_x > x) {
        wattron(tab_win_, COLOR_PAIR(COLOR_PAIR_TITLE) | A_BOLD);
        mvwprintw(tab_win_, 0, name_x, "%s", name.c_str());
        wattroff(tab_win_, COLOR_PAIR(COLOR_PAIR_TITLE) | A_BOLD);
    }
}

void TuiApp::draw_box_title(WINDOW* win, const std::string& title) {
    box(win, 0, 0);
    if (!title.empty()) {
        wattron(win, COLOR_PAIR(COLOR_PAIR_TITLE) | A_BOLD);
        mvwprintw(win, 0, 2, " %s ", title.c_str());
        wattroff(win, COLOR_PAIR(COLOR_PAIR_TITLE) | A_BOLD);
    }
}

void TuiApp::draw_progress_bar(WINDOW* win, int y, int x, int width,
                               double percent, int color_pair, const std::string& label) {
    if (width < 3) return;

    int bar_width = width - 2;  // Account for brackets
    int filled = static_cast<int>(bar_width * std::clamp(percent, 0.0, 100.0) / 100.0);

    mvwaddch(win, y, x, '[');

    wattron(win, COLOR_PAIR(color_pair));
    for (int i = 0; i < filled; ++i) {
        waddch(win, ACS_CKBOARD);
    }
    wattroff(win, COLOR_PAIR(color_pair));

    for (int i = filled; i < bar_width; ++i) {
        waddch(win, ' ');
    }
    waddch(win, ']');

    if (!label.empty()) {
        mvwprintw(win, y, x + width + 1, "%s", label.c_str());
    }
}

WINDOW* TuiApp::create_dialog(int height, int width, const std::string& title) {
    int max_y, max_x;
    getmaxyx(stdscr, max_y, max_x);

    width = std::min(width, max_x);
    height = std::min(height, max_y);

    WINDOW* win = newwin(height, width, (max_y - height) / 2, (max_x - width) / 2);
    if (!win) return nullptr;

    wbkgd(win, COLOR_PAIR(COLOR_PAIR_DIALOG));
    box(win, 0, 0);

    if (!title.empty()) {
        const std::string text = " " + title + " ";
        wattron(win, A_BOLD);
        mvwprintw(win, 0, std::max(1, (width - static_cast<int>(text.size())) / 2), "%s", text.c_str());
        wattroff(win, A_BOLD);
    }
    return win;
}

void TuiApp::clamp_selection(int& index, int& scroll, int count, int visible_rows) {
    if (count <= 0) {
        index = 0;
        scroll = 0;
        return;
    }
    index = std::clamp(index, 0, count - 1);
    visible_rows = std::max(1, visible_rows);
    if (index < scroll) {
        scroll = index;
    } else if (index >= scroll + visible_rows) {
        scroll = index - visible_rows + 1;
    }
    scroll = std::clamp(scroll, 0, std::max(0, count - visible_rows));
}

std::string TuiApp::fit(const std::string& text, int width) {
    if (width <= 0) return {};
    if (static_cast<int>(text.size()) <= width) return text;
    if (width <= 3) return text.substr(0, width);
    return text.substr(0, width - 3) + "...";
}

} // namespace tman
