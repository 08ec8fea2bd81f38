#include "imgui_app.hpp"
#include "../util.hpp"
#include "imgui.h"
#include <format>

namespace tman {

void ImGuiApp::render_system_panel() {
    const auto& sp = view_model_.system_panel;
    if (!sp.is_visible) return;

    // Compact bytes format like htop
    auto format_compact = [](int64_t bytes) -> std::string {
        if (bytes < 1024) return std::format("{}B", bytes);
        if (bytes < 1024 * 1024) return std::format("{:.0f}K", bytes / 1024.0);
        if (bytes < 1024LL * 1024 * 1024) return std::format("{:.0f}M", bytes / (1024.0 * 1024));
        return std::format("{:.2f}G", bytes / (1024.0 * 1024 * 1024));
    };

    const float text_height = ImGui::GetTextLineHeight();

    auto draw_bar = [&](const float ratio, const float width, const ImVec4& color) {
        ImGui::PushStyleVar(ImGuiStyleVar_FramePadding, ImVec2(0, 0));
        ImGui::PushStyleColor(ImGuiCol_PlotHistogram, color);
        ImGui::PushStyleColor(ImGuiCol_FrameBg, ImVec4(0.2f, 0.2f, 0.2f, 1.0f));
        ImGui::ProgressBar(ratio, ImVec2(width, text_height), "");
        ImGui::PopStyleColor(2);
        ImGui::PopStyleVar();
    };

    if (ImGui::BeginTable("SystemPanelLayout", 2, ImGuiTableFlags_None)) {
        ImGui::TableSetupColumn("Bars", ImGuiTableColumnFlags_WidthFixed, 420);
        ImGui::TableSetupColumn("Stats", ImGuiTableColumnFlags_WidthStretch);

        ImGui::TableNextRow();

        // Left column - usage bars
        ImGui::TableNextColumn();
        {
            const double usage = sp.cpu_usage;
            ImVec4 bar_color;
            if (usage < 25.0) bar_color = ImVec4(0.0f, 0.8f, 0.0f, 1.0f);
            else if (usage < 50.0) bar_color = ImVec4(0.5f, 0.8f, 0.0f, 1.0f);
            else if (usage < 75.0) bar_color = ImVec4(0.8f, 0.8f, 0.0f, 1.0f);
            else bar_color = ImVec4(0.8f, 0.2f, 0.0f, 1.0f);

            ImGui::Text("CPU[");
            ImGui::SameLine(0, 0);
            draw_bar(static_cast<float>(usage / 100.0), 160, bar_color);
            ImGui::SameLine(0, 0);
            ImGui::Text("] %5.1f%%", usage);
        }

        {
            const float mem_ratio = sp.memory_total > 0
                ? static_cast<float>(sp.memory_used) / static_cast<float>(sp.memory_total) : 0.0f;
            ImGui::Text("Mem[");
            ImGui::SameLine(0, 0);
            draw_bar(mem_ratio, 160, ImVec4(0.0f, 0.6f, 0.0f, 1.0f));
            ImGui::SameLine(0, 0);
            ImGui::Text("] %s/%s", format_compact(sp.memory_used).c_str(), format_compact(sp.memory_total).c_str());
        }

        {
            const float swap_ratio = sp.swap_info.total > 0
                ? static_cast<float>(sp.swap_info.used) / static_cast<float>(sp.swap_info.total) : 0.0f;
            ImGui::Text("Swp[");
            ImGui::SameLine(0, 0);
            draw_bar(swap_ratio, 160, ImVec4(0.6f, 0.0f, 0.0f, 1.0f));
            ImGui::SameLine(0, 0);
            ImGui::Text("] %s/%s", format_compact(sp.swap_info.used).c_str(), format_compact(sp.swap_info.total).c_str());
        }

        // Right column - counters
        ImGui::TableNextColumn();
        ImGui::Text("Tasks: %d, %d thr; %d running", sp.process_count, sp.thread_count, sp.running_count);
        ImGui::Text("Load average: %.2f %.2f %.2f",
                    sp.load_average.one_min, sp.load_average.five_min, sp.load_average.fifteen_min);
        ImGui::Text("Uptime: %s", format_uptime(sp.uptime_info.uptime_seconds).c_str());

        ImGui::EndTable();
    }

    ImGui::Separator();
}

} // namespace tman
