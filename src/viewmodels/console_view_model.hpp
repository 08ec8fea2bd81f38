#pragma once

#include <cstdint>

namespace tman {

struct ConsoleViewModel {
    char input_buffer[1024] = {};
    char working_dir_buffer[1024] = {};
    bool working_dir_initialized = false;

    bool focus_input = false;
    uint64_t seen_output_version = 0;
};

} // namespace tman
