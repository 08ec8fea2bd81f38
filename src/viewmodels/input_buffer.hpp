#pragma once

#include <algorithm>
#include <cstddef>
#include <string>

namespace tman {

// Fixed-size text fields bound to input widgets. Longer text is truncated.
template <size_t N>
void set_buffer(char (&buffer)[N], const std::string& text) {
    const size_t n = std::min(text.size(), N - 1);
    text.copy(buffer, n);
    buffer[n] = '\0';
}

template <size_t N>
void clear_buffer(char (&buffer)[N]) {
    buffer[0] = '\0';
}

} // namespace tman
