#include "terminal_launcher.hpp"
#include "util.hpp"

namespace tman {

TerminalLauncher::TerminalLauncher(ICommandRunner& runner, std::string preferred)
    : runner_(runner)
    , preferred_(std::move(preferred)) {
}

const std::vector<std::string>& TerminalLauncher::known_emulators() {
    static const std::vector<std::string> emulators = {
        "gnome-terminal", "xterm", "konsole", "lxterminal", "xfce4-terminal"
    };
    return emulators;
}

std::vector<std::string> TerminalLauncher::build_command(const std::string& emulator,
                                                         const std::vector<std::string>& argv) {
    std::vector<std::string> cmd = {emulator};
    if (emulator == "gnome-terminal") {
        cmd.emplace_back("--");
        cmd.insert(cmd.end(), argv.begin(), argv.end());
    } else if (emulator == "xfce4-terminal") {
        // Takes the command as a single string and splits it shell-style
        cmd.emplace_back("-e");
        cmd.push_back(shell_join(argv));
    } else {
        cmd.emplace_back("-e");
        cmd.insert(cmd.end(), argv.begin(), argv.end());
    }
    return cmd;
}

std::optional<std::string> TerminalLauncher::launch(const std::vector<std::string>& argv) {
    if (argv.empty()) return std::nullopt;

    std::vector<std::string> candidates;
    if (!preferred_.empty()) {
        candidates.push_back(preferred_);
    }
    for (const auto& emulator : known_emulators()) {
        if (emulator != preferred_) candidates.push_back(emulator);
    }

    for (const auto& emulator : candidates) {
        if (!runner_.find_executable(emulator)) continue;
        if (runner_.spawn_detached(build_command(emulator, argv))) {
            return emulator;
        }
    }
    return std::nullopt;
}

} // namespace tman
