#pragma once

#include "editor_view_model.hpp"
#include "cron_view_model.hpp"
#include "ssh_view_model.hpp"
#include "console_view_model.hpp"
#include "process_list_view_model.hpp"
#include "system_panel_view_model.hpp"
#include "kill_dialog_view_model.hpp"
#include "log_viewer_view_model.hpp"

namespace tman {

enum class MainTab {
    Editor,
    Cron,
    Ssh,
    Terminal,
    Monitor
};

// Root ViewModel containing all child ViewModels
struct AppViewModel {
    MainTab active_tab = MainTab::Editor;

    EditorViewModel editor;
    CronViewModel cron;
    SshViewModel ssh;
    ConsoleViewModel console;
    ProcessListViewModel process_list;
    SystemPanelViewModel system_panel;
    KillDialogViewModel kill_dialog;
    LogViewerViewModel log_viewer;

    // Asked before closing while an SSH session is open
    bool show_quit_confirm = false;

    void update_from_snapshot(const std::shared_ptr<const ProcessSnapshot>& snapshot) {
        if (!snapshot) return;
        process_list.data = snapshot;
        system_panel.update_from_snapshot(*snapshot);
    }
};

} // namespace tman
