#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace tman {

// Expand a leading ~ to $HOME
std::string expand_home(const std::string& path);

std::string trim(const std::string& s);
std::string to_lower(std::string s);

// Case-insensitive substring test
bool contains_ci(const std::string& haystack, const std::string& needle);

// Splits on '\n', dropping a trailing empty line
std::vector<std::string> split_lines(const std::string& text);

// Joins argv with single spaces (display only, no quoting)
std::string join_args(const std::vector<std::string>& args);

// Joins argv into one POSIX shell command line. Words with anything outside
// [A-Za-z0-9_@%+=:,./-] are single-quoted.
std::string shell_join(const std::vector<std::string>& args);

std::string format_bytes(int64_t bytes);
std::string format_uptime(uint64_t seconds);

// Writes to a temp file beside `path`, then renames over it.
// Creates parent directories. Returns false and fills `error` on failure.
bool atomic_write_file(const std::string& path, const std::string& content, std::string& error);

} // namespace tman
