#pragma once

#include <chrono>
#include <string>

namespace tman {

// Outcome of a user-triggered action. The message is shown verbatim in the UI.
struct ActionResult {
    bool success = false;
    std::string message;
};

struct ValidationResult {
    bool valid = false;
    std::string error;      // First problem found, empty when valid
    std::string warning;    // Non-blocking remark (e.g. missing key file)
};

// Parse/error info surfaced from data providers
struct ParseError {
    std::chrono::steady_clock::time_point timestamp;
    std::string message;
};

} // namespace tman
