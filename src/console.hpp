#pragma once

#include <string>
#include <iostream>

namespace x5 {

// ========== ANSI Escape Codes ==========

// ANSI escape codes for terminal colors.
namespace ansi {
    constexpr const char* RESET = "\033[0m";
    constexpr const char* BOLD = "\033[1m";
    constexpr const char* RED = "\033[31m";
    constexpr const char* GREEN = "\033[32m";
    constexpr const char* YELLOW = "\033[33m";
    constexpr const char* CYAN = "\033[36m";
}

/**
 * Status output for the x5conv CLI.
 *
 * Writes to stderr so that stdout carries only the generated document.
 * Colors are dropped when TERM is unset or dumb, or stderr is not a TTY.
 */
class Console {
public:
    Console();

    // ========== Colored Output ==========

    // Prints error message in red.
    void print_error(const std::string& text) const;

    // Prints warning message in yellow.
    void print_warning(const std::string& text) const;

    // Prints success message in green with a checkmark prefix.
    void print_success(const std::string& text) const;

    // Prints a "label value" line with the label in cyan.
    void print_field(const std::string& label, const std::string& value) const;

private:
    bool colors_enabled_;  // True if stderr supports ANSI colors.

    void enable_colors();
    void print_styled(const std::string& text, const char* color) const;
};

} // namespace x5
