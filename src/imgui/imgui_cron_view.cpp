#include "imgui_app.hpp"
#include "../cron/cron_schedule.hpp"
#include "../util.hpp"
#include "imgui.h"

namespace tman {

void ImGuiApp::refresh_cron_jobs() {
    auto result = services_->cron().list();
    if (result.success) {
        view_model_.cron.set_jobs(std::move(result.jobs));
    }
    services_->status().report({result.success, result.message});
}

void ImGuiApp::render_cron_tab() {
    auto& cv = view_model_.cron;
    if (!cv.loaded) {
        refresh_cron_jobs();
        // A failed read still counts as loaded; Refresh retries
        cv.loaded = true;
    }

    if (ImGui::Button("Add Job")) {
        cv.dialog.open_for_add();
    }
    ImGui::SameLine();
    ImGui::BeginDisabled(cv.selected() == nullptr);
    if (ImGui::Button("Edit Job")) {
        cv.dialog.open_for_edit(*cv.selected());
    }
    ImGui::SameLine();
    if (ImGui::Button("Delete Job")) {
        cv.confirm_delete = true;
    }
    ImGui::EndDisabled();
    ImGui::SameLine();
    if (ImGui::Button("Refresh")) {
        refresh_cron_jobs();
    }
    ImGui::SameLine();
    if (ImGui::Button("View Cron Logs")) {
        show_logs(LogKind::Cron);
    }

    ImGui::Separator();

    const float details_height = ImGui::GetTextLineHeightWithSpacing() * 14;
    ImGui::BeginChild("CronJobs", ImVec2(0, -details_height), true);
    if (cv.jobs.empty()) {
        ImGui::TextDisabled("No cron jobs. Use \"Add Job\" to create one.");
    } else if (ImGui::BeginTable("CronTable", 3,
                   ImGuiTableFlags_Resizable | ImGuiTableFlags_ScrollY |
                   ImGuiTableFlags_RowBg | ImGuiTableFlags_BordersOuter)) {
        ImGui::TableSetupScrollFreeze(0, 1);
        ImGui::TableSetupColumn("Schedule", ImGuiTableColumnFlags_WidthFixed, 160);
        ImGui::TableSetupColumn("Command", ImGuiTableColumnFlags_WidthStretch);
        ImGui::TableSetupColumn("Description", ImGuiTableColumnFlags_WidthFixed, 300);
        ImGui::TableHeadersRow();

        for (size_t i = 0; i < cv.jobs.size(); ++i) {
            const CronJob& job = cv.jobs[i];
            ImGui::PushID(static_cast<int>(i));
            ImGui::TableNextRow();

            ImGui::TableNextColumn();
            const bool is_selected = static_cast<int>(i) == cv.selected_index;
            if (ImGui::Selectable(job.schedule.c_str(), is_selected,
                                  ImGuiSelectableFlags_SpanAllColumns | ImGuiSelectableFlags_AllowDoubleClick)) {
                cv.selected_index = static_cast<int>(i);
                if (ImGui::IsMouseDoubleClicked(0)) {
                    cv.dialog.open_for_edit(job);
                }
            }

            ImGui::TableNextColumn();
            ImGui::TextUnformatted(job.command.c_str());

            ImGui::TableNextColumn();
            ImGui::TextUnformatted(describe_cron_schedule(job.schedule).c_str());

            ImGui::PopID();
        }
        ImGui::EndTable();
    }
    ImGui::EndChild();

    ImGui::Text("Job Details");
    ImGui::BeginChild("CronDetails", ImVec2(0, 0), true);
    if (const CronJob* job = cv.selected()) {
        ImGui::TextUnformatted(cron_job_details(*job).c_str());
    } else {
        ImGui::TextDisabled("Select a job to see its details.");
    }
    ImGui::EndChild();
}

void ImGuiApp::submit_cron_dialog() {
    auto& dlg = view_model_.cron.dialog;
    const std::string schedule = trim(dlg.schedule_buffer);
    const std::string command = trim(dlg.command_buffer);

    ActionResult result;
    if (dlg.edit_index < 0) {
        result = services_->cron().add(schedule, command);
    } else {
        result = services_->cron().update(static_cast<size_t>(dlg.edit_index), schedule, command);
    }

    if (!result.success) {
        // Keep the dialog open so the input can be corrected
        dlg.error_message = result.message;
        return;
    }

    dlg.is_visible = false;
    refresh_cron_jobs();
    services_->status().report(result);
}

void ImGuiApp::render_cron_dialog() {
    auto& dlg = view_model_.cron.dialog;
    if (!dlg.is_visible) return;

    const char* title = dlg.edit_index < 0 ? "Add Cron Job###CronDialog" : "Edit Cron Job###CronDialog";
    ImGui::OpenPopup("###CronDialog");

    ImVec2 center = ImGui::GetMainViewport()->GetCenter();
    ImGui::SetNextWindowPos(center, ImGuiCond_Appearing, ImVec2(0.5f, 0.5f));
    ImGui::SetNextWindowSize(ImVec2(760, 0), ImGuiCond_Always);

    if (ImGui::BeginPopupModal(title, &dlg.is_visible, ImGuiWindowFlags_AlwaysAutoResize)) {
        const auto& presets = cron_presets();

        ImGui::Text("Preset:");
        ImGui::SetNextItemWidth(-1);
        if (ImGui::BeginCombo("##preset", presets[dlg.preset_index].label)) {
            for (size_t i = 0; i < presets.size(); ++i) {
                const bool selected = static_cast<int>(i) == dlg.preset_index;
                if (ImGui::Selectable(presets[i].label, selected)) {
                    dlg.apply_preset(static_cast<int>(i));
                }
                if (selected) ImGui::SetItemDefaultFocus();
            }
            ImGui::EndCombo();
        }

        ImGui::Text("Schedule (minute hour day month weekday):");
        ImGui::SetNextItemWidth(-1);
        if (ImGui::InputText("##schedule", dlg.schedule_buffer, sizeof(dlg.schedule_buffer))) {
            dlg.preset_index = static_cast<int>(find_cron_preset(trim(dlg.schedule_buffer)));
        }

        const std::string preview = cron_schedule_preview(trim(dlg.schedule_buffer));
        const bool valid = validate_cron_schedule(trim(dlg.schedule_buffer)).valid;
        ImGui::PushStyleColor(ImGuiCol_Text, valid ? ImVec4(0.4f, 0.9f, 0.4f, 1.0f) : ImVec4(1.0f, 0.5f, 0.3f, 1.0f));
        ImGui::TextWrapped("%s", preview.c_str());
        ImGui::PopStyleColor();

        ImGui::Spacing();
        ImGui::Text("Command:");
        ImGui::SetNextItemWidth(-1);
        ImGui::InputText("##command", dlg.command_buffer, sizeof(dlg.command_buffer));

        if (const auto check = CronManager::validate_command(dlg.command_buffer); !check.warning.empty()) {
            ImGui::TextColored(ImVec4(1.0f, 0.8f, 0.2f, 1.0f), "%s", check.warning.c_str());
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
            submit_cron_dialog();
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

void ImGuiApp::render_cron_delete_confirmation() {
    auto& cv = view_model_.cron;
    if (!cv.confirm_delete) return;

    const CronJob* job = cv.selected();
    if (!job) {
        cv.confirm_delete = false;
        return;
    }

    ImGui::OpenPopup("Delete Cron Job");

    ImVec2 center = ImGui::GetMainViewport()->GetCenter();
    ImGui::SetNextWindowPos(center, ImGuiCond_Appearing, ImVec2(0.5f, 0.5f));

    if (ImGui::BeginPopupModal("Delete Cron Job", &cv.confirm_delete, ImGuiWindowFlags_AlwaysAutoResize)) {
        ImGui::Text("Are you sure you want to delete this cron job?");
        ImGui::Spacing();
        ImGui::TextColored(ImVec4(0.8f, 0.8f, 1.0f, 1.0f), "%s", job->line.c_str());
        ImGui::Spacing();

        if (ImGui::Button("Delete", ImVec2(120, 0))) {
            const auto result = services_->cron().remove(job->index);
            cv.confirm_delete = false;
            if (result.success) {
                refresh_cron_jobs();
            }
            services_->status().report(result);
        }
        ImGui::SameLine();
        if (ImGui::Button("Cancel", ImVec2(100, 0)) || ImGui::IsKeyPressed(ImGuiKey_Escape)) {
            cv.confirm_delete = false;
        }

        if (!cv.confirm_delete) {
            ImGui::CloseCurrentPopup();
        }
        ImGui::EndPopup();
    }
}

} // namespace tman
