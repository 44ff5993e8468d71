#pragma once

#include <print>
#include <string_view>

// Informational lines are only printed with --verbose; errors always go to stderr.
inline void log_info(bool verbose, std::string_view msg) {
    if (verbose) {
        std::println(stderr, "[voxdiff] {}", msg);
    }
}

inline void log_error(std::string_view component, std::string_view msg) {
    std::println(stderr, "{}: {}", component, msg);
}
