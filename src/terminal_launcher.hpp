#pragma once

#include "interfaces/i_command_runner.hpp"
#include <optional>
#include <string>
#include <vector>

namespace tman {

// Opens a program in a new terminal emulator window
class TerminalLauncher {
public:
    // `preferred` is tried before the built-in list; empty = auto-detect
    explicit TerminalLauncher(ICommandRunner& runner, std::string preferred = {});

    void set_preferred(std::string emulator) { preferred_ = std::move(emulator); }
    [[nodiscard]] const std::string& preferred() const { return preferred_; }

    // Returns the emulator that was started, nullopt if none could be
    std::optional<std::string> launch(const std::vector<std::string>& argv);

    // Full argv for running `argv` inside `emulator`
    static std::vector<std::string> build_command(const std::string& emulator,
                                                  const std::vector<std::string>& argv);

    // Emulators tried when no preference is configured, in order
    static const std::vector<std::string>& known_emulators();

private:
    ICommandRunner& runner_;
    std::string preferred_;
};

} // namespace tman
