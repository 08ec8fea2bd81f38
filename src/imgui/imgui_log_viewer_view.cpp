#include "imgui_app.hpp"
#include "../util.hpp"
#include "imgui.h"

namespace tman {

void ImGuiApp::show_logs(const LogKind kind) {
    auto result = services_->logs().fetch(kind);
    if (!result.found) {
        services_->status().error(result.message);
        return;
    }
    view_model_.log_viewer.show(std::move(result.document));
}

void ImGuiApp::render_log_viewer() {
    auto& lv = view_model_.log_viewer;
    if (!lv.is_visible) return;

    ImGui::SetNextWindowSize(ImVec2(900, 650), ImGuiCond_FirstUseEver);
    const std::string title = (lv.document.title().empty() ? std::string("Log Viewer") : lv.document.title())
                              + "###LogViewer";
    if (ImGui::Begin(title.c_str(), &lv.is_visible)) {
        ImGui::SetNextItemWidth(250);
        bool do_search = ImGui::InputTextWithHint("##logsearch", "search", lv.search_buffer, sizeof(lv.search_buffer),
                                                  ImGuiInputTextFlags_EnterReturnsTrue);
        ImGui::SameLine();
        do_search |= ImGui::Button("Find");
        if (do_search) {
            const auto found = lv.document.search(trim(lv.search_buffer));
            lv.search_message = found.message;
            lv.highlight_line = found.matching_lines.empty() ? -1 : static_cast<int>(found.matching_lines.front());
            lv.scroll_to_highlight = lv.highlight_line >= 0;
        }
        ImGui::SameLine();
        if (ImGui::Button("Save...")) {
            lv.show_save_dialog = true;
        }
        ImGui::SameLine();
        if (ImGui::Button("Clear")) {
            lv.document.clear();
            lv.search_message.clear();
            lv.highlight_line = -1;
        }
        ImGui::SameLine();
        if (ImGui::Button("Close")) {
            lv.is_visible = false;
        }

        if (!lv.search_message.empty()) {
            ImGui::TextColored(ImVec4(0.8f, 0.8f, 0.4f, 1.0f), "%s", lv.search_message.c_str());
        }

        if (lv.show_save_dialog) {
            ImGui::SetNextItemWidth(400);
            const bool enter = ImGui::InputTextWithHint("##logsave", "save to path", lv.save_path_buffer,
                                                        sizeof(lv.save_path_buffer),
                                                        ImGuiInputTextFlags_EnterReturnsTrue);
            ImGui::SameLine();
            if (ImGui::Button("Save##confirm") || enter) {
                services_->status().report(lv.document.save(expand_home(trim(lv.save_path_buffer))));
                lv.show_save_dialog = false;
            }
            ImGui::SameLine();
            if (ImGui::Button("Cancel##save")) {
                lv.show_save_dialog = false;
            }
        }

        ImGui::Separator();

        ImGui::BeginChild("LogText", ImVec2(0, -ImGui::GetFrameHeightWithSpacing()), true,
                          ImGuiWindowFlags_HorizontalScrollbar);
        const auto& lines = lv.document.lines();
        for (size_t i = 0; i < lines.size(); ++i) {
            if (static_cast<int>(i) == lv.highlight_line) {
                ImGui::PushStyleColor(ImGuiCol_Text, ImVec4(1.0f, 1.0f, 0.3f, 1.0f));
                ImGui::TextUnformatted(lines[i].c_str());
                ImGui::PopStyleColor();
                if (lv.scroll_to_highlight) {
                    ImGui::SetScrollHereY(0.5f);
                    lv.scroll_to_highlight = false;
                }
            } else {
                ImGui::TextUnformatted(lines[i].c_str());
            }
        }
        ImGui::EndChild();

        ImGui::TextDisabled("%s", lv.document.info_line().c_str());
    }
    ImGui::End();
}

} // namespace tman
