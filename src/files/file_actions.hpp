#pragma once

#include "../errors.hpp"
#include "../interfaces/i_command_runner.hpp"
#include "../terminal_launcher.hpp"
#include <string>
#include <vector>

namespace tman {

struct Config;
class TextDocument;

class FileActions {
public:
    FileActions(ICommandRunner& runner, TerminalLauncher& launcher);

    // Hands the path to the desktop's default handler (xdg-open).
    // Folders open in the file manager.
    ActionResult open_path(const std::string& path);

    // Runs `<editor> <path>` in a terminal window, or directly when
    // no terminal emulator is available
    ActionResult open_in_terminal_editor(const std::string& path, const std::string& editor);

    // Runs `<editor> <path>` on the caller's terminal and waits for it.
    // The text UI suspends curses around this call.
    ActionResult edit_in_foreground(const std::string& path, const std::string& editor);

    // Loads a recent file into `document` and moves it to the front of the
    // list. A file that no longer exists is dropped from the list.
    ActionResult open_recent(Config& config, const std::string& path, TextDocument& document);

    static const std::vector<std::string>& editor_choices();

    static constexpr auto kOpenTimeout = std::chrono::seconds(10);

private:
    ICommandRunner& runner_;
    TerminalLauncher& launcher_;
};

} // namespace tman
