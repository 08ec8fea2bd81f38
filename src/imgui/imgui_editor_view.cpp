#include "imgui_app.hpp"
#include "../viewmodels/input_buffer.hpp"
#include "imgui.h"
#include <string>

namespace tman {

// Grows the std::string behind a multi-line widget as the user types
static int text_resize_callback(ImGuiInputTextCallbackData* data) {
    if (data->EventFlag == ImGuiInputTextFlags_CallbackResize) {
        auto* text = static_cast<std::string*>(data->UserData);
        text->resize(static_cast<size_t>(data->BufTextLen));
        data->Buf = text->data();
    }
    return 0;
}

void ImGuiApp::handle_editor_shortcuts() {
    const ImGuiIO& io = ImGui::GetIO();
    if (!io.KeyCtrl) return;

    auto& ed = view_model_.editor;
    if (ImGui::IsKeyPressed(ImGuiKey_N, false)) {
        services_->document().new_document();
        ed.text_stale = true;
    } else if (ImGui::IsKeyPressed(ImGuiKey_O, false)) {
        ed.show_open_dialog = true;
    } else if (ImGui::IsKeyPressed(ImGuiKey_S, false)) {
        if (services_->document().has_path()) {
            services_->save_document();
        } else {
            ed.show_save_as_dialog = true;
        }
    }
}

void ImGuiApp::render_editor_tab() {
    auto& ed = view_model_.editor;
    TextDocument& doc = services_->document();

    handle_editor_shortcuts();

    if (ImGui::Button("New")) {
        doc.new_document();
        ed.text_stale = true;
    }
    ImGui::SameLine();
    if (ImGui::Button("Open...")) {
        set_buffer(ed.path_buffer, doc.path());
        ed.show_open_dialog = true;
    }
    ImGui::SameLine();
    if (ImGui::Button("Save")) {
        if (doc.has_path()) {
            services_->save_document();
        } else {
            ed.show_save_as_dialog = true;
        }
    }
    ImGui::SameLine();
    if (ImGui::Button("Save As...")) {
        set_buffer(ed.path_buffer, doc.path());
        ed.show_save_as_dialog = true;
    }
    ImGui::SameLine();

    const auto& recent = services_->config().recent_files;
    ImGui::BeginDisabled(recent.empty());
    if (ImGui::Button("Recent")) {
        ImGui::OpenPopup("RecentFiles");
    }
    ImGui::EndDisabled();
    if (ImGui::BeginPopup("RecentFiles")) {
        // Copy: opening a recent file rewrites the list
        const auto entries = recent;
        for (const auto& path : entries) {
            if (ImGui::MenuItem(path.c_str())) {
                if (services_->open_recent_document(path).success) {
                    ed.text_stale = true;
                }
            }
        }
        ImGui::EndPopup();
    }
    ImGui::SameLine();
    if (ImGui::Button("Open with Default App...")) {
        set_buffer(ed.path_buffer, doc.path());
        ed.show_open_external_dialog = true;
    }

    // Editor choice and external editing
    const auto& editors = FileActions::editor_choices();
    ImGui::Text("Editor:");
    ImGui::SameLine();
    ImGui::SetNextItemWidth(120);
    if (ImGui::BeginCombo("##editor", editors[ed.editor_index].c_str())) {
        for (size_t i = 0; i < editors.size(); ++i) {
            const bool selected = static_cast<int>(i) == ed.editor_index;
            if (ImGui::Selectable(editors[i].c_str(), selected)) {
                ed.editor_index = static_cast<int>(i);
                services_->set_preferred_editor(editors[i]);
            }
            if (selected) ImGui::SetItemDefaultFocus();
        }
        ImGui::EndCombo();
    }
    ImGui::SameLine();
    if (ImGui::Button("Edit in Terminal")) {
        if (services_->edit_in_terminal().success) {
            ed.edited_externally = true;
        }
    }
    if (ed.edited_externally) {
        ImGui::SameLine();
        if (ImGui::Button("Reload")) {
            if (services_->reload_document().success) {
                ed.text_stale = true;
                ed.edited_externally = false;
            }
        }
    }
    ImGui::SameLine();
    ImGui::TextDisabled("%s", doc.has_path() ? doc.path().c_str() : doc.title().c_str());

    ImGui::Separator();

    if (ed.text_stale) {
        ed.text = doc.content();
        ed.text_stale = false;
        ed.edited_externally = false;
    }

    const ImVec2 size = ImGui::GetContentRegionAvail();
    if (ImGui::InputTextMultiline("##document", ed.text.data(), ed.text.capacity() + 1, size,
                                  ImGuiInputTextFlags_AllowTabInput | ImGuiInputTextFlags_CallbackResize,
                                  text_resize_callback, &ed.text)) {
        doc.set_content(ed.text);
    }
}

bool ImGuiApp::open_path_dialog(bool& visible, const char* title, const char* button) {
    if (!visible) return false;

    auto& ed = view_model_.editor;
    if (!ImGui::IsPopupOpen(title)) {
        ImGui::OpenPopup(title);
        ed.focus_path_field = true;
    }

    ImVec2 center = ImGui::GetMainViewport()->GetCenter();
    ImGui::SetNextWindowPos(center, ImGuiCond_Appearing, ImVec2(0.5f, 0.5f));
    ImGui::SetNextWindowSize(ImVec2(700, 0), ImGuiCond_Always);

    bool submitted = false;
    if (ImGui::BeginPopupModal(title, &visible, ImGuiWindowFlags_AlwaysAutoResize)) {
        ImGui::Text("Path:");
        ImGui::SetNextItemWidth(-1);
        if (ed.focus_path_field) {
            ImGui::SetKeyboardFocusHere();
            ed.focus_path_field = false;
        }
        if (ImGui::InputText("##path", ed.path_buffer, sizeof(ed.path_buffer),
                             ImGuiInputTextFlags_EnterReturnsTrue)) {
            submitted = true;
        }
        ImGui::TextDisabled("A leading ~ is expanded to your home directory.");
        ImGui::Spacing();

        if (ImGui::Button(button, ImVec2(120, 0))) {
            submitted = true;
        }
        ImGui::SameLine();
        if (ImGui::Button("Cancel", ImVec2(100, 0)) || ImGui::IsKeyPressed(ImGuiKey_Escape)) {
            visible = false;
        }

        if (submitted || !visible) {
            ImGui::CloseCurrentPopup();
        }
        ImGui::EndPopup();
    }
    if (submitted) visible = false;
    return submitted;
}

void ImGuiApp::render_editor_dialogs() {
    auto& ed = view_model_.editor;

    if (open_path_dialog(ed.show_open_dialog, "Open File", "Open")) {
        if (services_->open_document(ed.path_buffer).success) {
            ed.text_stale = true;
        }
    }

    if (open_path_dialog(ed.show_save_as_dialog, "Save As", "Save")) {
        services_->save_document_as(ed.path_buffer);
    }

    if (open_path_dialog(ed.show_open_external_dialog, "Open with Default Application", "Open")) {
        services_->status().report(services_->files().open_path(ed.path_buffer));
    }
}

} // namespace tman
