#include "imgui_app.hpp"
#include "imgui.h"
#include <format>

namespace tman {

void ImGuiApp::request_kill_process(const int pid, const std::string& name, const bool is_tree) {
    view_model_.kill_dialog.open(pid, name, is_tree);
}

void ImGuiApp::execute_kill(const bool force) {
    auto& kd = view_model_.kill_dialog;
    if (kd.target_pid <= 0) return;

    KillResult result;
    if (kd.is_tree_kill) {
        result = killer_->kill_process_tree(kd.target_pid, force);
    } else {
        result = killer_->kill_process(kd.target_pid, force);
    }

    if (result.success && !result.process_still_running) {
        services_->status().info(std::format("Process {} ({}) terminated", kd.target_pid, kd.target_name));
        kd.is_visible = false;
        monitor_->refresh_now();
        return;
    }

    if (!result.error_message.empty()) {
        kd.error_message = result.error_message;
        if (!result.process_still_running) {
            services_->status().error(result.error_message);
        }
    }

    if (result.process_still_running && !force) {
        kd.show_force_option = true;
    }
}

void ImGuiApp::render_kill_confirmation_dialog() {
    auto& kd = view_model_.kill_dialog;
    if (!kd.is_visible) return;

    ImGui::OpenPopup("Kill Confirmation");

    ImVec2 center = ImGui::GetMainViewport()->GetCenter();
    ImGui::SetNextWindowPos(center, ImGuiCond_Appearing, ImVec2(0.5f, 0.5f));
    ImGui::SetNextWindowSize(ImVec2(620, 0), ImGuiCond_Always);

    if (ImGui::BeginPopupModal("Kill Confirmation", &kd.is_visible, ImGuiWindowFlags_AlwaysAutoResize)) {
        if (ImGui::IsKeyPressed(ImGuiKey_Escape)) {
            kd.is_visible = false;
            ImGui::CloseCurrentPopup();
            ImGui::EndPopup();
            return;
        }

        if (kd.is_tree_kill) {
            ImGui::TextWrapped("Are you sure you want to terminate the process tree?");
            ImGui::Spacing();
            ImGui::Text("Root process: %s (PID %d)", kd.target_name.c_str(), kd.target_pid);
            ImGui::TextColored(ImVec4(1.0f, 0.6f, 0.2f, 1.0f),
                "Warning: This will terminate all child processes!");
        } else {
            ImGui::TextWrapped("Are you sure you want to terminate this process?");
            ImGui::Spacing();
            ImGui::Text("Process: %s (PID %d)", kd.target_name.c_str(), kd.target_pid);
        }

        if (!kd.error_message.empty()) {
            ImGui::Spacing();
            ImGui::Separator();
            ImGui::Spacing();
            ImGui::PushStyleColor(ImGuiCol_Text, ImVec4(1.0f, 0.4f, 0.4f, 1.0f));
            ImGui::TextWrapped("%s", kd.error_message.c_str());
            ImGui::PopStyleColor();
        }

        ImGui::Spacing();
        ImGui::Separator();
        ImGui::Spacing();

        if (!kd.show_force_option) {
            if (ImGui::Button("Terminate", ImVec2(120, 0))) {
                execute_kill(false);
            }
            if (ImGui::IsItemHovered()) {
                ImGui::SetTooltip("SIGTERM - allows process to clean up gracefully");
            }
            ImGui::SameLine();
        }
        if (ImGui::Button("Force Kill", ImVec2(120, 0))) {
            execute_kill(true);
        }
        if (ImGui::IsItemHovered()) {
            ImGui::SetTooltip("SIGKILL - immediate termination, no cleanup");
        }
        ImGui::SameLine();
        if (ImGui::Button("Cancel", ImVec2(100, 0))) {
            kd.is_visible = false;
        }

        ImGui::Spacing();
        ImGui::PushStyleColor(ImGuiCol_Text, ImGui::GetStyleColorVec4(ImGuiCol_TextDisabled));
        ImGui::TextWrapped("Note: Killing other users' processes requires root or CAP_KILL.");
        ImGui::PopStyleColor();

        ImGui::EndPopup();
    }
}

} // namespace tman
