#pragma once

#include <string>

namespace tman {

struct KillDialogViewModel {
    // Visibility
    bool is_visible = false;

    // Target process
    int target_pid = -1;
    std::string target_name;

    // Kill mode
    bool is_tree_kill = false;

    // Error state
    std::string error_message;
    bool show_force_option = false;  // Show force kill after SIGTERM fails

    void open(int pid, const std::string& name, bool tree) {
        target_pid = pid;
        target_name = name;
        is_tree_kill = tree;
        error_message.clear();
        show_force_option = false;
        is_visible = true;
    }
};

} // namespace tman
