#include "imgui_app.hpp"
#include "../viewmodels/input_buffer.hpp"
#include "imgui.h"

namespace tman {

void ImGuiApp::render_ssh_tab() {
    auto& sv = view_model_.ssh;
    SshManager& ssh = services_->ssh();
    const auto& connections = ssh.connections();

    if (sv.selected_index >= static_cast<int>(connections.size())) {
        sv.selected_index = -1;
    }
    const SshConnection* selected = sv.selected_index >= 0 ? &connections[sv.selected_index] : nullptr;

    // Saved profiles
    ImGui::Text("Saved Connections");
    ImGui::BeginChild("SshProfiles", ImVec2(0, ImGui::GetTextLineHeightWithSpacing() * 8), true);
    if (connections.empty()) {
        ImGui::TextDisabled("No saved connections. Use \"Add\" to create one.");
    }
    for (size_t i = 0; i < connections.size(); ++i) {
        ImGui::PushID(static_cast<int>(i));
        if (ImGui::Selectable(connections[i].display_string().c_str(),
                              static_cast<int>(i) == sv.selected_index,
                              ImGuiSelectableFlags_AllowDoubleClick)) {
            sv.selected_index = static_cast<int>(i);
            if (ImGui::IsMouseDoubleClicked(0)) {
                services_->status().report(ssh.connect(connections[i], services_->ssh_session()));
                sv.focus_input = true;
            }
        }
        ImGui::PopID();
    }
    ImGui::EndChild();

    if (ImGui::Button("Add")) {
        sv.dialog.open_for_add();
    }
    ImGui::SameLine();
    ImGui::BeginDisabled(selected == nullptr);
    if (ImGui::Button("Edit")) {
        sv.dialog.open_for_edit(sv.selected_index, *selected);
    }
    ImGui::SameLine();
    if (ImGui::Button("Delete")) {
        sv.confirm_delete = true;
    }
    ImGui::SameLine();
    if (ImGui::Button("Connect")) {
        services_->status().report(ssh.connect(*selected, services_->ssh_session()));
        sv.focus_input = true;
    }
    ImGui::SameLine();
    if (ImGui::Button("Test")) {
        services_->status().report(ssh.test_connection(*selected));
    }
    ImGui::EndDisabled();

    ImGui::Separator();

    // Quick connect
    ImGui::Text("Quick Connect:");
    ImGui::SameLine();
    ImGui::SetNextItemWidth(200);
    ImGui::InputTextWithHint("##qhost", "host", sv.quick_host_buffer, sizeof(sv.quick_host_buffer));
    ImGui::SameLine();
    ImGui::SetNextItemWidth(120);
    ImGui::InputTextWithHint("##quser", "user", sv.quick_user_buffer, sizeof(sv.quick_user_buffer));
    ImGui::SameLine();
    ImGui::SetNextItemWidth(60);
    ImGui::InputTextWithHint("##qport", "22", sv.quick_port_buffer, sizeof(sv.quick_port_buffer));
    ImGui::SameLine();
    if (ImGui::Button("Connect##quick")) {
        services_->status().report(ssh.quick_connect(sv.quick_host_buffer, sv.quick_user_buffer,
                                                     sv.quick_port_buffer, services_->ssh_session()));
        sv.focus_input = true;
    }

    ImGui::Separator();

    render_ssh_session_panel();
}

void ImGuiApp::render_ssh_session_panel() {
    auto& sv = view_model_.ssh;
    SshSession& session = services_->ssh_session();

    if (session.is_open()) {
        ImGui::TextColored(ImVec4(0.4f, 0.9f, 0.4f, 1.0f), "Session open");
    } else {
        ImGui::TextDisabled("Not connected");
    }
    ImGui::SameLine();
    ImGui::BeginDisabled(!session.is_open());
    if (ImGui::Button("Disconnect")) {
        services_->status().report(session.disconnect());
    }
    ImGui::EndDisabled();
    ImGui::SameLine();
    if (ImGui::Button("Clear##session")) {
        session.output().clear();
    }

    if (render_output_panel("SshSession", session.output(), sv.seen_output_version,
                            sv.input_buffer, sizeof(sv.input_buffer), sv.focus_input,
                            session.history(), session.is_open())) {
        if (const auto result = session.send(sv.input_buffer); !result.success) {
            services_->status().report(result);
        }
        clear_buffer(sv.input_buffer);
    }
}

void ImGuiApp::submit_ssh_dialog() {
    auto& dlg = view_model_.ssh.dialog;

    SshConnection conn;
    if (std::string error; !dlg.to_connection(conn, error)) {
        dlg.error_message = error;
        return;
    }

    ActionResult result;
    if (dlg.edit_index < 0) {
        result = services_->ssh().add_connection(conn);
    } else {
        result = services_->ssh().update_connection(static_cast<size_t>(dlg.edit_index), conn);
    }

    if (!result.success) {
        dlg.error_message = result.message;
        return;
    }
    services_->status().report(result);
    dlg.is_visible = false;
}

void ImGuiApp::render_ssh_dialog() {
    auto& dlg = view_model_.ssh.dialog;
    if (!dlg.is_visible) return;

    const char* title = dlg.edit_index < 0 ? "Add SSH Connection###SshDialog" : "Edit SSH Connection###SshDialog";
    ImGui::OpenPopup("###SshDialog");

    ImVec2 center = ImGui::GetMainViewport()->GetCenter();
    ImGui::SetNextWindowPos(center, ImGuiCond_Appearing, ImVec2(0.5f, 0.5f));
    ImGui::SetNextWindowSize(ImVec2(640, 0), ImGuiCond_Always);

    if (ImGui::BeginPopupModal(title, &dlg.is_visible, ImGuiWindowFlags_AlwaysAutoResize)) {
        auto field = [](const char* label, const char* id, char* buffer, size_t size) {
            ImGui::Text("%s", label);
            ImGui::SameLine(120);
            ImGui::SetNextItemWidth(-1);
            ImGui::InputText(id, buffer, size);
        };
        field("Name:", "##name", dlg.name_buffer, sizeof(dlg.name_buffer));
        field("Host:", "##host", dlg.host_buffer, sizeof(dlg.host_buffer));
        field("User:", "##user", dlg.user_buffer, sizeof(dlg.user_buffer));
        field("Port:", "##port", dlg.port_buffer, sizeof(dlg.port_buffer));
        field("Key File:", "##key", dlg.key_file_buffer, sizeof(dlg.key_file_buffer));
        ImGui::TextDisabled("Only the key file path is stored. Leave empty to use ssh defaults.");

        if (!dlg.test_message.empty()) {
            ImGui::Spacing();
            ImGui::PushStyleColor(ImGuiCol_Text, dlg.test_succeeded ? ImVec4(0.4f, 0.9f, 0.4f, 1.0f)
                                                                    : ImVec4(1.0f, 0.5f, 0.3f, 1.0f));
            ImGui::TextWrapped("%s", dlg.test_message.c_str());
            ImGui::PopStyleColor();
        }

        if (!dlg.error_message.empty()) {
            ImGui::Spacing();
            ImGui::PushStyleColor(ImGuiCol_Text, ImVec4(1.0f, 0.4f, 0.4f, 1.0f));
            ImGui::TextWrapped("%s", dlg.error_message.c_str());
            ImGui::PopStyleColor();
        }

        ImGui::Spacing();
        ImGui::Separator();
        ImGui::Spacing();

        if (ImGui::Button("Save", ImVec2(120, 0))) {
            submit_ssh_dialog();
        }
        ImGui::SameLine();
        if (ImGui::Button("Test Connection", ImVec2(180, 0))) {
            SshConnection conn;
            if (std::string error; !dlg.to_connection(conn, error)) {
                dlg.test_succeeded = false;
                dlg.test_message = error;
            } else {
                const auto result = services_->ssh().test_connection(conn);
                dlg.test_succeeded = result.success;
                dlg.test_message = result.message;
            }
        }
        ImGui::SameLine();
        if (ImGui::Button("Cancel", ImVec2(100, 0)) || ImGui::IsKeyPressed(ImGuiKey_Escape)) {
            dlg.is_visible = false;
        }

        if (!dlg.is_visible) {
            ImGui::CloseCurrentPopup();
        }
        ImGui::EndPopup();
    }
}

void ImGuiApp::render_ssh_delete_confirmation() {
    auto& sv = view_model_.ssh;
    if (!sv.confirm_delete) return;

    const auto& connections = services_->ssh().connections();
    if (sv.selected_index < 0 || sv.selected_index >= static_cast<int>(connections.size())) {
        sv.confirm_delete = false;
        return;
    }

    ImGui::OpenPopup("Delete SSH Connection");

    ImVec2 center = ImGui::GetMainViewport()->GetCenter();
    ImGui::SetNextWindowPos(center, ImGuiCond_Appearing, ImVec2(0.5f, 0.5f));

    if (ImGui::BeginPopupModal("Delete SSH Connection", &sv.confirm_delete, ImGuiWindowFlags_AlwaysAutoResize)) {
        ImGui::Text("Are you sure you want to delete the connection '%s'?",
                    connections[sv.selected_index].name.c_str());
        ImGui::Spacing();

        if (ImGui::Button("Delete", ImVec2(120, 0))) {
            services_->status().report(services_->ssh().remove_connection(static_cast<size_t>(sv.selected_index)));
            sv.selected_index = -1;
            sv.confirm_delete = false;
        }
        ImGui::SameLine();
        if (ImGui::Button("Cancel", ImVec2(100, 0)) || ImGui::IsKeyPressed(ImGuiKey_Escape)) {
            sv.confirm_delete = false;
        }

        if (!sv.confirm_delete) {
            ImGui::CloseCurrentPopup();
        }
        ImGui::EndPopup();
    }
}

} // namespace tman
