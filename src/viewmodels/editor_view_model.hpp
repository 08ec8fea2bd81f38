#pragma once

#include <string>

namespace tman {

struct EditorViewModel {
    // Text bound to the editor widget; copied back into the document on edit
    std::string text;
    // Set when the document changed underneath (open, new) and text must be reloaded
    bool text_stale = true;
    // A terminal editor was started on the file; offer to reload it
    bool edited_externally = false;

    // Path field of the Open / Save As / Open with default app dialogs
    char path_buffer[1024] = {};
    bool show_open_dialog = false;
    bool show_save_as_dialog = false;
    bool show_open_external_dialog = false;
    bool focus_path_field = false;

    // Index into FileActions::editor_choices()
    int editor_index = 0;
};

} // namespace tman
