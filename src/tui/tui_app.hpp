#pragma once

#include "../app_services.hpp"
#include "../interfaces/i_process_killer.hpp"
#include "../interfaces/i_system_data_provider.hpp"
#include "../process_monitor.hpp"
#include "../viewmodels/app_view_model.hpp"
#include <atomic>
#include <functional>
#include <memory>
#include <string>
#include <vector>
#include <ncurses.h>

namespace tman {

enum class TuiTab {
    Files,
    Cron,
    Ssh,
    Processes
};

// Single-line text entry drawn over the current tab
struct TuiPrompt {
    bool is_visible = false;
    std::string title;
    std::string input;
    // Optional line under the input, recomputed after every keystroke
    std::function<std::string(const std::string&)> hint;
    std::function<void(const std::string&)> on_submit;
};

// Yes/No question; on_confirm runs only for Yes
struct TuiConfirm {
    bool is_visible = false;
    std::string title;
    std::string message;
    std::function<void()> on_confirm;
};

class TuiApp {
public:
    // Non-owning constructor: TuiApp uses but does not own these.
    // All pointers must be non-null and must outlive the TuiApp instance.
    TuiApp(AppServices* services,
           ProcessMonitor* monitor,
           ISystemDataProvider* system_provider,
           IProcessKiller* killer);
    ~TuiApp();

    void run();

private:
    // Rendering
    void render();
    void render_tab_bar();
    void render_files_tab();
    void render_cron_tab();
    void render_ssh_tab();
    void render_system_panel();
    void render_process_list();
    void render_status_bar();
    void render_kill_dialog();
    void render_help_overlay();
    void render_prompt();
    void render_confirm();
    void render_text_viewer();

    // Input handling
    void handle_input(int ch);
    void handle_files_input(int ch);
    void handle_cron_input(int ch);
    void handle_ssh_input(int ch);
    void handle_process_list_input(int ch);
    void handle_kill_dialog_input(int ch);
    void handle_help_input(int ch);
    void handle_prompt_input(int ch);
    void handle_confirm_input(int ch);
    void handle_text_viewer_input(int ch);

    void switch_tab(TuiTab tab);

    // Overlays
    void open_prompt(std::string title, std::string initial,
                     std::function<void(const std::string&)> on_submit,
                     std::function<std::string(const std::string&)> hint = {});
    void open_confirm(std::string title, std::string message, std::function<void()> on_confirm);
    void show_text(LogDocument document);
    void show_logs(LogKind kind);
    void show_system_overview();
    void search_text_viewer(const std::string& term);

    // Files tab
    void edit_file(const std::string& path);
    void preview_file(const std::string& path);
    void cycle_editor();
    [[nodiscard]] std::string selected_recent_file() const;

    // Cron tab
    void refresh_cron_jobs();
    void prompt_cron_schedule();
    void prompt_cron_command();
    void submit_cron_job();

    // SSH tab
    void prompt_ssh_field(int step);
    void submit_ssh_profile();
    void connect_ssh(const SshConnection& conn);
    void quick_connect(const std::string& target);

    // Process list navigation
    void move_selection(int delta);
    void page_up();
    void page_down();
    void scroll_to_selection();
    void cycle_sort_column();

    // Kill functionality
    void request_kill_process(int pid, const std::string& name, bool is_tree);
    void execute_kill(bool force);

    // Leaves curses, runs `action` on the plain terminal, then restores the screen
    void run_suspended(const std::function<void()>& action);

    // Window management
    void create_windows();
    void resize_windows();
    void cleanup_windows();

    // Utility
    void draw_progress_bar(WINDOW* win, int y, int x, int width,
                           double percent, int color_pair, const std::string& label = "");
    void draw_box_title(WINDOW* win, const std::string& title);
    // Centered dialog window with border and title; caller deletes it
    WINDOW* create_dialog(int height, int width, const std::string& title);
    // Keeps `index` within [0, count) and the scroll offset around it
    static void clamp_selection(int& index, int& scroll, int count, int visible_rows);
    static std::string fit(const std::string& text, int width);

    // Non-owned references
    AppServices* services_ = nullptr;
    ProcessMonitor* monitor_ = nullptr;
    ISystemDataProvider* system_provider_ = nullptr;
    IProcessKiller* killer_ = nullptr;

    // Current snapshot from the monitor
    std::shared_ptr<const ProcessSnapshot> current_data_;

    // ViewModel (holds the state shared with the GUI)
    AppViewModel view_model_;

    // ncurses windows
    WINDOW* tab_win_ = nullptr;
    WINDOW* system_win_ = nullptr;
    WINDOW* main_win_ = nullptr;
    WINDOW* status_win_ = nullptr;

    // UI state
    TuiTab active_tab_ = TuiTab::Files;
    TuiPrompt prompt_;
    TuiConfirm confirm_;
    bool show_help_ = false;
    std::atomic<bool> running_{false};
    int dialog_debounce_ = 0;

    // Selections and scroll positions
    int recent_index_ = 0;
    int recent_scroll_ = 0;
    int cron_scroll_ = 0;
    int ssh_scroll_ = 0;
    int process_scroll_offset_ = 0;
    int visible_rows_ = 0;
    int viewer_scroll_ = 0;
    std::vector<size_t> viewer_matches_;
    size_t viewer_match_index_ = 0;

    // Layout constants
    static constexpr int kTabBarHeight = 1;
    static constexpr int kSystemPanelHeight = 4;
    static constexpr int kStatusBarHeight = 2;
    static constexpr auto kStatusMessageTimeout = std::chrono::seconds(10);
};

} // namespace tman
