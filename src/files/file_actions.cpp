#include "file_actions.hpp"
#include "text_document.hpp"
#include "../config.hpp"
#include "../util.hpp"
#include <filesystem>
#include <format>

namespace fs = std::filesystem;

namespace tman {

FileActions::FileActions(ICommandRunner& runner, TerminalLauncher& launcher)
    : runner_(runner)
    , launcher_(launcher) {
}

const std::vector<std::string>& FileActions::editor_choices() {
    static const std::vector<std::string> editors = {"nano", "vim", "vi", "gedit", "code"};
    return editors;
}

ActionResult FileActions::open_path(const std::string& path) {
    const std::string trimmed = trim(path);
    if (trimmed.empty()) {
        return {false, "No path given"};
    }

    const std::string full_path = expand_home(trimmed);
    std::error_code ec;
    if (!fs::exists(full_path, ec)) {
        return {false, "Path not found: " + full_path};
    }

    CommandSpec spec;
    spec.argv = {"xdg-open", full_path};
    spec.timeout = kOpenTimeout;
    const auto result = runner_.run(spec);

    if (!result.launched) {
        return {false, "xdg-open not found; install xdg-utils"};
    }
    // xdg-open hands off and exits; a handler still attached after the
    // timeout was started all the same
    if (result.timed_out) {
        return {true, "Opened: " + full_path};
    }

    switch (result.exit_code) {
        case 0:
            return {true, "Opened: " + full_path};
        case 2:
            return {false, "Path not found: " + full_path};
        case 3:
            return {false, "No application is associated with " + full_path};
        default:
            return {false, std::format("Failed to open {}: {}", full_path, trim(result.error_output))};
    }
}

ActionResult FileActions::open_in_terminal_editor(const std::string& path, const std::string& editor) {
    if (path.empty()) {
        return {false, "Please save the file first!"};
    }
    const std::string program = editor.empty() ? "nano" : editor;
    const std::vector<std::string> argv = {program, path};

    if (launcher_.launch(argv)) {
        return {true, std::format("Opened in {}: {}", program, path)};
    }

    // GUI editors need no terminal
    if (runner_.spawn_detached(argv)) {
        return {true, std::format("Opened in {}: {}", program, path)};
    }

    return {false, "Could not find a suitable terminal emulator or " + program};
}

ActionResult FileActions::edit_in_foreground(const std::string& path, const std::string& editor) {
    const std::string trimmed = trim(path);
    if (trimmed.empty()) {
        return {false, "No path given"};
    }
    const std::string full_path = expand_home(trimmed);
    const std::string program = editor.empty() ? "nano" : editor;

    std::string error;
    const int code = runner_.run_foreground({program, full_path}, error);
    if (code < 0) {
        return {false, std::format("Failed to start {}: {}", program, error)};
    }
    if (code != 0) {
        return {false, std::format("{} exited with code {}", program, code)};
    }
    return {true, std::format("Edited in {}: {}", program, full_path)};
}

ActionResult FileActions::open_recent(Config& config, const std::string& path, TextDocument& document) {
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        config.remove_recent_file(path);
        if (auto saved = config.save(); !saved.success) {
            return {false, "File no longer exists. " + saved.message};
        }
        return {false, "File no longer exists"};
    }

    auto result = document.load(path);
    if (result.success) {
        config.add_recent_file(document.path());
        if (auto saved = config.save(); !saved.success) {
            result.message += " (" + saved.message + ")";
        }
    }
    return result;
}

} // namespace tman
