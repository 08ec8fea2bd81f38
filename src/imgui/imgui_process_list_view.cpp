#include "imgui_app.hpp"
#include "../system_overview.hpp"
#include "../util.hpp"
#include "imgui.h"
#include <algorithm>
#include <format>

namespace tman {

// Helper function to get color for process state
static ImVec4 get_state_color(const char state) {
    switch (state) {
        case 'R': return {0.2f, 0.9f, 0.2f, 1.0f};  // Green - Running
        case 'D': return {1.0f, 0.3f, 0.3f, 1.0f};  // Red - Disk sleep
        case 'Z': return {0.8f, 0.3f, 0.8f, 1.0f};  // Purple - Zombie
        case 'T': case 't': return {1.0f, 0.9f, 0.2f, 1.0f};  // Yellow - Stopped
        default:  return {0.7f, 0.7f, 0.7f, 1.0f};  // Gray - Sleeping/Idle
    }
}

// Column order matches ProcessSortColumn
static constexpr const char* kColumnTooltips[] = {
    "Process ID",
    "Process name",
    "Owner username",
    "CPU usage per core (100% = 1 core)",
    "Resident memory (RSS)",
    "Number of threads",
    "R=Running, S=Sleeping, D=Disk, Z=Zombie, T=Stopped",
    "Full command line with arguments"
};
static constexpr int kColumnCount = 8;

static void show_column_tooltips() {
    for (int col = 0; col < kColumnCount; col++) {
        if (ImGui::TableSetColumnIndex(col)) {
            if (ImGui::IsItemHovered()) {
                ImGui::SetTooltip("%s", kColumnTooltips[col]);
            }
        }
    }
}

void ImGuiApp::render_monitor_tab() {
    render_system_panel();
    render_process_toolbar();

    // Leave room for the errors line
    ImGui::BeginChild("ProcessPane", ImVec2(0, -ImGui::GetFrameHeightWithSpacing()), true);
    handle_process_list_keys();
    render_process_list();
    ImGui::EndChild();

    if (const auto errors = monitor_->get_recent_errors(); !errors.empty()) {
        ImGui::PushStyleColor(ImGuiCol_Text, ImVec4(1.0f, 0.8f, 0.2f, 1.0f));
        ImGui::Text("[!] %s", errors.back().message.c_str());
        ImGui::PopStyleColor();
    } else if (const auto& pl = view_model_.process_list; pl.data) {
        ImGui::TextDisabled("Showing %zu of %d processes", pl.rows.size(), pl.data->process_count);
    }
}

void ImGuiApp::render_process_toolbar() {
    auto& pl = view_model_.process_list;

    ImGui::Text("Filter:");
    ImGui::SameLine();
    ImGui::SetNextItemWidth(200);
    if (pl.focus_filter_box) {
        ImGui::SetKeyboardFocusHere();
        pl.focus_filter_box = false;
    }
    if (ImGui::InputTextWithHint("##filter", "name or command", pl.filter_buffer, sizeof(pl.filter_buffer))) {
        pl.rows_dirty = true;
    }
    ImGui::SameLine();

    ImGui::SetNextItemWidth(120);
    if (ImGui::InputTextWithHint("##user", "user", pl.user_buffer, sizeof(pl.user_buffer))) {
        pl.rows_dirty = true;
    }
    ImGui::SameLine();

    ImGui::SetNextItemWidth(120);
    if (ImGui::SliderFloat("##mincpu", &pl.min_cpu_percent, 0.0f, 100.0f, "CPU >= %.0f%%")) {
        pl.rows_dirty = true;
    }
    ImGui::SameLine();

    if (ImGui::Button("Refresh")) {
        monitor_->refresh_now();
    }
    ImGui::SameLine();

    bool auto_refresh = !monitor_->is_paused();
    if (ImGui::Checkbox("Auto Refresh", &auto_refresh)) {
        if (auto_refresh) {
            monitor_->resume();
        } else {
            monitor_->pause();
        }
        services_->config().monitor.auto_refresh = auto_refresh;
        if (const auto saved = services_->config().save(); !saved.success) {
            services_->status().report(saved);
        }
    }
    ImGui::SameLine();

    const ProcessInfo* selected = pl.selected();

    if (ImGui::Button("Kill") && selected) {
        request_kill_process(selected->pid, selected->name, false);
    }
    ImGui::SameLine();

    if (ImGui::Button("Kill Tree") && selected) {
        request_kill_process(selected->pid, selected->name, true);
    }
    ImGui::SameLine();

    if (ImGui::Button("System Info")) {
        view_model_.system_panel.overview_text = build_system_overview(services_->runner(), *system_provider_);
        view_model_.system_panel.show_overview = true;
    }
}

void ImGuiApp::handle_process_list_keys() {
    auto& pl = view_model_.process_list;

    // Ctrl+F to focus filter box
    if (ImGui::GetIO().KeyCtrl && ImGui::IsKeyPressed(ImGuiKey_F)) {
        pl.focus_filter_box = true;
        return;
    }

    // F5 for refresh
    if (ImGui::IsKeyPressed(ImGuiKey_F5)) {
        monitor_->refresh_now();
        return;
    }

    if (!ImGui::IsWindowFocused(ImGuiFocusedFlags_RootAndChildWindows)) return;

    if (ImGui::IsKeyPressed(ImGuiKey_Delete)) {
        if (const ProcessInfo* selected = pl.selected()) {
            request_kill_process(selected->pid, selected->name, ImGui::GetIO().KeyShift);
        }
        return;
    }

    if (pl.rows.empty()) return;

    const int last = static_cast<int>(pl.rows.size()) - 1;
    const int current_idx = pl.selected_row();
    int new_idx = current_idx;
    constexpr int page_size = 20;

    if (ImGui::IsKeyPressed(ImGuiKey_DownArrow)) {
        new_idx = (current_idx < 0) ? 0 : std::min(current_idx + 1, last);
    } else if (ImGui::IsKeyPressed(ImGuiKey_UpArrow)) {
        new_idx = (current_idx < 0) ? 0 : std::max(current_idx - 1, 0);
    } else if (ImGui::IsKeyPressed(ImGuiKey_PageDown)) {
        new_idx = (current_idx < 0) ? 0 : std::min(current_idx + page_size, last);
    } else if (ImGui::IsKeyPressed(ImGuiKey_PageUp)) {
        new_idx = (current_idx < 0) ? 0 : std::max(current_idx - page_size, 0);
    } else if (ImGui::IsKeyPressed(ImGuiKey_Home)) {
        new_idx = 0;
    } else if (ImGui::IsKeyPressed(ImGuiKey_End)) {
        new_idx = last;
    }

    if (new_idx != current_idx && new_idx >= 0) {
        pl.selected_pid = pl.rows[new_idx]->pid;
        pl.scroll_to_selected = true;
    }
}

void ImGuiApp::render_process_list() {
    auto& pl = view_model_.process_list;
    if (!pl.data) return;

    if (ImGui::BeginTable("ProcessList", kColumnCount,
            ImGuiTableFlags_Resizable | ImGuiTableFlags_Reorderable |
            ImGuiTableFlags_Hideable | ImGuiTableFlags_Sortable |
            ImGuiTableFlags_ScrollX | ImGuiTableFlags_ScrollY |
            ImGuiTableFlags_RowBg | ImGuiTableFlags_BordersOuter)) {

        ImGui::TableSetupScrollFreeze(0, 1);
        ImGui::TableSetupColumn("PID", ImGuiTableColumnFlags_WidthFixed, 70);
        ImGui::TableSetupColumn("Name", ImGuiTableColumnFlags_NoHide | ImGuiTableColumnFlags_WidthFixed, 180);
        ImGui::TableSetupColumn("User", ImGuiTableColumnFlags_WidthFixed, 100);
        ImGui::TableSetupColumn("CPU %", ImGuiTableColumnFlags_DefaultSort | ImGuiTableColumnFlags_PreferSortDescending |
                                ImGuiTableColumnFlags_WidthFixed, 70);
        ImGui::TableSetupColumn("Memory", ImGuiTableColumnFlags_PreferSortDescending | ImGuiTableColumnFlags_WidthFixed, 90);
        ImGui::TableSetupColumn("Threads", ImGuiTableColumnFlags_WidthFixed, 70);
        ImGui::TableSetupColumn("State", ImGuiTableColumnFlags_WidthFixed, 50);
        ImGui::TableSetupColumn("Command", ImGuiTableColumnFlags_WidthStretch);
        ImGui::TableHeadersRow();

        show_column_tooltips();

        // Handle sorting
        if (ImGuiTableSortSpecs* sort_specs = ImGui::TableGetSortSpecs()) {
            if (sort_specs->SpecsDirty && sort_specs->SpecsCount > 0) {
                const auto& spec = sort_specs->Specs[0];
                pl.sort_column = static_cast<ProcessSortColumn>(spec.ColumnIndex);
                pl.sort_ascending = (spec.SortDirection == ImGuiSortDirection_Ascending);
                pl.rows_dirty = true;
                sort_specs->SpecsDirty = false;
            }
        }

        pl.update_rows();

        for (const ProcessInfo* row : pl.rows) {
            const ProcessInfo& info = *row;
            ImGui::PushID(info.pid);
            ImGui::TableNextRow();

            const bool is_selected = (info.pid == pl.selected_pid);
            if (is_selected && pl.scroll_to_selected) {
                ImGui::SetScrollHereY(0.5f);
                pl.scroll_to_selected = false;
            }

            ImGui::TableNextColumn();
            if (ImGui::Selectable(std::format("{}", info.pid).c_str(), is_selected,
                                  ImGuiSelectableFlags_SpanAllColumns)) {
                pl.selected_pid = info.pid;
            }
            if (ImGui::BeginPopupContextItem("RowMenu")) {
                pl.selected_pid = info.pid;
                if (ImGui::MenuItem("Kill Process...")) {
                    request_kill_process(info.pid, info.name, false);
                }
                if (ImGui::MenuItem("Kill Tree...")) {
                    request_kill_process(info.pid, info.name, true);
                }
                ImGui::EndPopup();
            }

            ImGui::TableNextColumn();
            ImGui::TextUnformatted(info.name.c_str());

            ImGui::TableNextColumn();
            ImGui::TextUnformatted(info.user_name.c_str());

            ImGui::TableNextColumn();
            ImGui::Text("%.1f", info.cpu_percent);

            ImGui::TableNextColumn();
            ImGui::TextUnformatted(format_bytes(info.resident_memory).c_str());

            ImGui::TableNextColumn();
            ImGui::Text("%d", info.thread_count);

            ImGui::TableNextColumn();
            ImGui::TextColored(get_state_color(info.state_char), "%c", info.state_char);

            ImGui::TableNextColumn();
            ImGui::TextUnformatted(info.command_line.c_str());

            ImGui::PopID();
        }

        ImGui::EndTable();
    }
}

void ImGuiApp::render_system_overview() {
    auto& sp = view_model_.system_panel;
    if (!sp.show_overview) return;

    ImGui::SetNextWindowSize(ImVec2(800, 600), ImGuiCond_FirstUseEver);
    if (ImGui::Begin("System Information", &sp.show_overview)) {
        if (ImGui::Button("Refresh")) {
            sp.overview_text = build_system_overview(services_->runner(), *system_provider_);
        }
        ImGui::Separator();
        ImGui::BeginChild("OverviewText", ImVec2(0, 0), false, ImGuiWindowFlags_HorizontalScrollbar);
        ImGui::TextUnformatted(sp.overview_text.c_str());
        ImGui::EndChild();
    }
    ImGui::End();
}

} // namespace tman
