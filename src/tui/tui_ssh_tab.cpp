#include "tui_app.hpp"
#include "tui_colors.hpp"
#include "../util.hpp"
#include "../viewmodels/input_buffer.hpp"
#include <algorithm>
#include <cstdio>
#include <format>

namespace tman {

void TuiApp::render_ssh_tab() {
    if (!main_win_) return;

    auto& sv = view_model_.ssh;
    const auto& connections = services_->ssh().connections();

    int max_y, max_x;
    getmaxyx(main_win_, max_y, max_x);
    draw_box_title(main_win_, std::format("SSH Connections ({})", connections.size()));

    wattron(main_win_, COLOR_PAIR(COLOR_PAIR_HEADER) | A_BOLD);
    mvwprintw(main_win_, 1, 2, "%-20s %-30s %-16s %5s  %s", "Name", "Host", "User", "Port", "Key File");
    wattroff(main_win_, COLOR_PAIR(COLOR_PAIR_HEADER) | A_BOLD);

    if (connections.empty()) {
        wattron(main_win_, A_DIM);
        mvwprintw(main_win_, 2, 2, "No saved connections. Press 'a' to add one or 'c' to quick connect.");
        wattroff(main_win_, A_DIM);
        return;
    }

    clamp_selection(sv.selected_index, ssh_scroll_, static_cast<int>(connections.size()), visible_rows_);

    int row = 2;
    for (int i = ssh_scroll_; i < static_cast<int>(connections.size()) && row < max_y - 1; ++i, ++row) {
        const SshConnection& conn = connections[i];
        const bool is_selected = i == sv.selected_index;
        if (is_selected) {
            wattron(main_win_, COLOR_PAIR(COLOR_PAIR_SELECTED));
            mvwhline(main_win_, row, 1, ' ', max_x - 2);
        }
        mvwprintw(main_win_, row, 2, "%-20s %-30s %-16s %5d  %s",
                  fit(conn.name, 20).c_str(),
                  fit(conn.host, 30).c_str(),
                  fit(conn.user, 16).c_str(),
                  conn.port,
                  fit(conn.key_file.empty() ? "-" : conn.key_file, std::max(1, max_x - 80)).c_str());
        if (is_selected) {
            wattroff(main_win_, COLOR_PAIR(COLOR_PAIR_SELECTED));
        }
    }
}

void TuiApp::handle_ssh_input(int ch) {
    auto& sv = view_model_.ssh;
    const auto& connections = services_->ssh().connections();
    const int count = static_cast<int>(connections.size());
    const SshConnection* selected = (sv.selected_index >= 0 && sv.selected_index < count)
                                        ? &connections[sv.selected_index] : nullptr;

    switch (ch) {
        case KEY_UP:
        case 'k':
            sv.selected_index = std::max(0, sv.selected_index - 1);
            break;

        case KEY_DOWN:
        case 'j':
            sv.selected_index = std::min(std::max(0, count - 1), sv.selected_index + 1);
            break;

        case '\n':
        case '\r':
        case KEY_ENTER:
            if (selected) {
                connect_ssh(*selected);
            }
            break;

        case 'a':
            sv.dialog.open_for_add();
            prompt_ssh_field(0);
            break;

        case 'e':
            if (selected) {
                sv.dialog.open_for_edit(sv.selected_index, *selected);
                prompt_ssh_field(0);
            }
            break;

        case 'd':
            if (selected) {
                const int index = sv.selected_index;
                open_confirm("Delete SSH Connection",
                             std::format("Delete the connection '{}'?", selected->name),
                             [this, index] {
                    services_->status().report(services_->ssh().remove_connection(static_cast<size_t>(index)));
                });
            }
            break;

        case 't':
            if (selected) {
                services_->status().info("Testing connection to " + selected->target() + "...");
                render();
                services_->status().report(services_->ssh().test_connection(*selected));
            }
            break;

        case 'c':
            open_prompt("Quick connect: user@host[:port]", {}, [this](const std::string& target) {
                quick_connect(target);
            });
            break;
    }
}

void TuiApp::prompt_ssh_field(int step) {
    auto& dlg = view_model_.ssh.dialog;
    const std::string action = dlg.edit_index < 0 ? "Add SSH Connection" : "Edit SSH Connection";

    auto next = [this, step](auto& buffer) {
        return [this, step, &buffer](const std::string& input) {
            set_buffer(buffer, trim(input));
            prompt_ssh_field(step + 1);
        };
    };

    switch (step) {
        case 0:
            open_prompt(action + ": name", dlg.name_buffer, next(dlg.name_buffer));
            break;
        case 1:
            open_prompt(action + ": host", dlg.host_buffer, next(dlg.host_buffer));
            break;
        case 2:
            open_prompt(action + ": user", dlg.user_buffer, next(dlg.user_buffer));
            break;
        case 3:
            open_prompt(action + ": port", dlg.port_buffer, next(dlg.port_buffer));
            break;
        case 4:
            open_prompt(action + ": key file (empty = ssh defaults)", dlg.key_file_buffer, next(dlg.key_file_buffer));
            break;
        default:
            submit_ssh_profile();
            break;
    }
}

void TuiApp::submit_ssh_profile() {
    auto& dlg = view_model_.ssh.dialog;
    dlg.is_visible = false;

    SshConnection conn;
    if (std::string error; !dlg.to_connection(conn, error)) {
        services_->status().error(error);
        return;
    }

    ActionResult result;
    if (dlg.edit_index < 0) {
        result = services_->ssh().add_connection(conn);
    } else {
        result = services_->ssh().update_connection(static_cast<size_t>(dlg.edit_index), conn);
    }
    services_->status().report(result);

    if (result.success) {
        if (const auto check = conn.validate(); !check.warning.empty()) {
            services_->status().warning(check.warning);
        }
    }
}

void TuiApp::connect_ssh(const SshConnection& conn) {
    // Copy: the profile list may change while the session runs
    const SshConnection target = conn;
    run_suspended([this, &target] {
        printf("Connecting to %s@%s:%d...\n", target.user.c_str(), target.host.c_str(), target.port);
        fflush(stdout);
        services_->status().report(services_->ssh().connect_foreground(target));
    });
}

void TuiApp::quick_connect(const std::string& target) {
    const std::string text = trim(target);
    const auto at = text.find('@');
    if (at == std::string::npos) {
        services_->status().error("Please enter both host and user");
        return;
    }

    SshConnection conn;
    conn.name = "quick";
    conn.user = text.substr(0, at);
    std::string host_port = text.substr(at + 1);
    std::string port_text;
    if (const auto colon = host_port.rfind(':'); colon != std::string::npos) {
        port_text = host_port.substr(colon + 1);
        host_port.resize(colon);
    }
    conn.host = host_port;

    if (conn.user.empty() || conn.host.empty()) {
        services_->status().error("Please enter both host and user");
        return;
    }
    if (std::string error; !parse_port(port_text, conn.port, error)) {
        services_->status().error(error);
        return;
    }
    connect_ssh(conn);
}

} // namespace tman
