#pragma once

#include "../app_services.hpp"
#include "../interfaces/i_process_killer.hpp"
#include "../interfaces/i_system_data_provider.hpp"
#include "../process_monitor.hpp"
#include "../viewmodels/app_view_model.hpp"
#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <string>

struct GLFWwindow;

namespace tman {

class ImGuiApp {
public:
    // Non-owning constructor: ImGuiApp uses but does not own these.
    // - services: file, cron, ssh, console and log actions
    // - monitor: background process collection (managed externally)
    // - system_provider: host info for the window title and system overview
    // - killer: for process termination
    // Precondition: all pointers != nullptr (asserted in constructor)
    ImGuiApp(AppServices* services,
             ProcessMonitor* monitor,
             ISystemDataProvider* system_provider,
             IProcessKiller* killer);
    ~ImGuiApp();

    void run();

private:
    void render();
    void render_menu_bar();
    void render_status_bar();
    void render_quit_confirmation();
    void request_quit();

    // File Editor tab
    void render_editor_tab();
    void render_editor_dialogs();
    // Path prompt shared by Open, Save As and Open with default app; true when submitted
    bool open_path_dialog(bool& visible, const char* title, const char* button);
    void handle_editor_shortcuts();

    // Cron Manager tab
    void render_cron_tab();
    void render_cron_dialog();
    void render_cron_delete_confirmation();
    void refresh_cron_jobs();
    void submit_cron_dialog();

    // SSH Manager tab
    void render_ssh_tab();
    void render_ssh_session_panel();
    void render_ssh_dialog();
    void render_ssh_delete_confirmation();
    void submit_ssh_dialog();

    // Terminal tab
    void render_console_tab();

    // System Monitor tab
    void render_monitor_tab();
    void render_system_panel();
    void render_process_toolbar();
    void render_process_list();
    void handle_process_list_keys();
    void render_system_overview();

    // Kill functionality
    void request_kill_process(int pid, const std::string& name, bool is_tree);
    void execute_kill(bool force);
    void render_kill_confirmation_dialog();

    // Log viewer window
    void show_logs(LogKind kind);
    void render_log_viewer();

    // Scrollback shared by the console and the SSH session panel.
    // Returns true when the input line was submitted.
    bool render_output_panel(const char* id, OutputBuffer& output, uint64_t& seen_version,
                             char* input, size_t input_size, bool& focus_input,
                             CommandHistory& history, bool input_enabled);

    // Non-owned references (managed externally)
    AppServices* services_ = nullptr;
    ProcessMonitor* monitor_ = nullptr;
    ISystemDataProvider* system_provider_ = nullptr;
    IProcessKiller* killer_ = nullptr;

    // ViewModel (holds all UI state - single source of truth)
    AppViewModel view_model_;

    // Window pointer for close handling
    GLFWwindow* window_ = nullptr;

    // Event debouncing
    void post_empty_event_debounced();
    std::mutex event_debounce_mutex_;
    std::chrono::steady_clock::time_point last_event_post_time_;
    static constexpr auto kEventDebounceInterval = std::chrono::milliseconds(16);
};

} // namespace tman
