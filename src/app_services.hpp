#pragma once

#include "config.hpp"
#include "errors.hpp"
#include "log_viewer.hpp"
#include "status_log.hpp"
#include "terminal_launcher.hpp"
#include "console/console_session.hpp"
#include "cron/cron_manager.hpp"
#include "files/file_actions.hpp"
#include "files/text_document.hpp"
#include "interfaces/i_command_runner.hpp"
#include "ssh/ssh_manager.hpp"
#include "ssh/ssh_session.hpp"
#include <string>

namespace tman {

// Everything a front-end acts on, apart from the process monitor.
// Shared by the ImGui and the ncurses UI; both only add presentation.
class AppServices {
public:
    // Non-owning: config and runner must outlive this object
    AppServices(Config* config, ICommandRunner* runner);
    ~AppServices();

    AppServices(const AppServices&) = delete;
    AppServices& operator=(const AppServices&) = delete;

    Config& config() { return *config_; }
    ICommandRunner& runner() { return *runner_; }
    TerminalLauncher& launcher() { return launcher_; }
    FileActions& files() { return files_; }
    TextDocument& document() { return document_; }
    CronManager& cron() { return cron_; }
    SshManager& ssh() { return ssh_; }
    SshSession& ssh_session() { return ssh_session_; }
    ConsoleSession& console() { return console_; }
    LogSource& logs() { return logs_; }
    StatusLog& status() { return status_; }

    // Document operations that also maintain the recent-files list
    ActionResult open_document(const std::string& path);
    ActionResult open_recent_document(const std::string& path);
    ActionResult save_document();
    ActionResult save_document_as(const std::string& path);

    // Re-reads the current file, dropping unsaved edits
    ActionResult reload_document();

    // Saves pending edits first so the editor sees them
    ActionResult edit_in_terminal();
    // Blocks until the editor exits. The file joins the recent list once it exists.
    ActionResult edit_in_foreground(const std::string& path);
    ActionResult set_preferred_editor(const std::string& editor);

    // Ends the embedded SSH session and any running console command
    void shutdown();

private:
    void remember_recent(const std::string& path);

    Config* config_;
    ICommandRunner* runner_;

    TerminalLauncher launcher_;
    FileActions files_;
    TextDocument document_;
    CronManager cron_;
    SshManager ssh_;
    SshSession ssh_session_;
    ConsoleSession console_;
    LogSource logs_;
    StatusLog status_;
};

} // namespace tman
