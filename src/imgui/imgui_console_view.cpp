#include "imgui_app.hpp"
#include "../viewmodels/input_buffer.hpp"
#include "imgui.h"

namespace tman {

// Up/Down walk the command history
static int history_callback(ImGuiInputTextCallbackData* data) {
    if (data->EventFlag != ImGuiInputTextFlags_CallbackHistory) return 0;

    auto* history = static_cast<CommandHistory*>(data->UserData);
    std::string entry;
    if (data->EventKey == ImGuiKey_UpArrow) {
        entry = history->previous();
    } else if (data->EventKey == ImGuiKey_DownArrow) {
        entry = history->next();
    } else {
        return 0;
    }
    data->DeleteChars(0, data->BufTextLen);
    data->InsertChars(0, entry.c_str());
    return 0;
}

bool ImGuiApp::render_output_panel(const char* id, OutputBuffer& output, uint64_t& seen_version,
                                   char* input, size_t input_size, bool& focus_input,
                                   CommandHistory& history, bool input_enabled) {
    ImGui::PushID(id);

    ImGui::BeginChild("Output", ImVec2(0, -ImGui::GetFrameHeightWithSpacing()), true,
                      ImGuiWindowFlags_HorizontalScrollbar);
    const auto lines = output.lines();
    ImGuiListClipper clipper;
    clipper.Begin(static_cast<int>(lines.size()));
    while (clipper.Step()) {
        for (int i = clipper.DisplayStart; i < clipper.DisplayEnd; ++i) {
            ImGui::TextUnformatted(lines[i].c_str());
        }
    }
    // Follow new output unless the user scrolled up
    if (const uint64_t version = output.version(); version != seen_version) {
        if (ImGui::GetScrollY() >= ImGui::GetScrollMaxY() - 5.0f || seen_version == 0) {
            ImGui::SetScrollHereY(1.0f);
        }
        seen_version = version;
    }
    ImGui::EndChild();

    bool submitted = false;
    ImGui::BeginDisabled(!input_enabled);
    ImGui::SetNextItemWidth(-1);
    if (focus_input) {
        ImGui::SetKeyboardFocusHere();
        focus_input = false;
    }
    if (ImGui::InputText("##input", input, input_size,
                         ImGuiInputTextFlags_EnterReturnsTrue | ImGuiInputTextFlags_CallbackHistory,
                         history_callback, &history)) {
        submitted = true;
        focus_input = true;
    }
    ImGui::EndDisabled();

    ImGui::PopID();
    return submitted;
}

void ImGuiApp::render_console_tab() {
    auto& cv = view_model_.console;
    ConsoleSession& console = services_->console();

    if (!cv.working_dir_initialized) {
        set_buffer(cv.working_dir_buffer, console.working_dir());
        cv.working_dir_initialized = true;
    }

    ImGui::Text("Working Directory:");
    ImGui::SameLine();
    ImGui::SetNextItemWidth(400);
    bool apply_dir = ImGui::InputText("##workdir", cv.working_dir_buffer, sizeof(cv.working_dir_buffer),
                                      ImGuiInputTextFlags_EnterReturnsTrue);
    ImGui::SameLine();
    apply_dir |= ImGui::Button("Set");
    if (apply_dir) {
        const auto result = console.set_working_dir(cv.working_dir_buffer);
        if (result.success) {
            set_buffer(cv.working_dir_buffer, console.working_dir());
        }
        services_->status().report(result);
    }
    ImGui::SameLine();
    if (ImGui::Button("Clear")) {
        console.output().clear();
    }
    ImGui::SameLine();
    ImGui::BeginDisabled(!console.is_busy());
    if (ImGui::Button("Stop")) {
        services_->status().report(console.stop());
    }
    ImGui::EndDisabled();
    if (console.is_busy()) {
        ImGui::SameLine();
        ImGui::TextColored(ImVec4(1.0f, 0.8f, 0.2f, 1.0f), "Running...");
    }

    if (render_output_panel("Console", console.output(), cv.seen_output_version,
                            cv.input_buffer, sizeof(cv.input_buffer), cv.focus_input,
                            console.history(), true)) {
        console.execute(cv.input_buffer);
        clear_buffer(cv.input_buffer);
        // cd may have moved the working directory
        set_buffer(cv.working_dir_buffer, console.working_dir());
    }
}

} // namespace tman
