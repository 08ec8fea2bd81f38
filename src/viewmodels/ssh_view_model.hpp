#pragma once

#include "input_buffer.hpp"
#include "../ssh/ssh_connection.hpp"
#include "../util.hpp"
#include <cstdint>
#include <string>

namespace tman {

struct SshDialogViewModel {
    bool is_visible = false;
    int edit_index = -1;            // -1 adds a new profile

    char name_buffer[128] = {};
    char host_buffer[256] = {};
    char user_buffer[64] = {};
    char port_buffer[8] = {};
    char key_file_buffer[1024] = {};

    std::string error_message;
    std::string test_message;
    bool test_succeeded = false;

    void open_for_add() {
        edit_index = -1;
        clear_buffer(name_buffer);
        clear_buffer(host_buffer);
        clear_buffer(user_buffer);
        set_buffer(port_buffer, "22");
        clear_buffer(key_file_buffer);
        error_message.clear();
        test_message.clear();
        is_visible = true;
    }

    void open_for_edit(int index, const SshConnection& conn) {
        edit_index = index;
        set_buffer(name_buffer, conn.name);
        set_buffer(host_buffer, conn.host);
        set_buffer(user_buffer, conn.user);
        set_buffer(port_buffer, std::to_string(conn.port));
        set_buffer(key_file_buffer, conn.key_file);
        error_message.clear();
        test_message.clear();
        is_visible = true;
    }

    // Reads the fields; fails only on an unparsable port
    bool to_connection(SshConnection& conn, std::string& error) const {
        conn.name = trim(name_buffer);
        conn.host = trim(host_buffer);
        conn.user = trim(user_buffer);
        conn.key_file = trim(key_file_buffer);
        return parse_port(port_buffer, conn.port, error);
    }
};

struct SshViewModel {
    int selected_index = -1;
    bool confirm_delete = false;

    char quick_host_buffer[256] = {};
    char quick_user_buffer[64] = {};
    char quick_port_buffer[8] = "22";

    // Embedded session command line
    char input_buffer[1024] = {};
    bool focus_input = false;
    uint64_t seen_output_version = 0;

    SshDialogViewModel dialog;
};

} // namespace tman
