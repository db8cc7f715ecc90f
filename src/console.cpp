#include "console.hpp"
#include <cstdlib>
#include <unistd.h>

namespace x5 {

Console::Console() : colors_enabled_(true) {
    enable_colors();
}

void Console::enable_colors() {
    const char* term = std::getenv("TERM");
    if (!term || std::string(term) == "dumb" || !isatty(STDERR_FILENO)) {
        colors_enabled_ = false;
    }
}

void Console::print_styled(const std::string& text, const char* color) const {
    if (colors_enabled_) {
        std::cerr << color << text << ansi::RESET << std::endl;
    } else {
        std::cerr << text << std::endl;
    }
}

void Console::print_error(const std::string& text) const {
    print_styled(text, ansi::RED);
}

void Console::print_warning(const std::string& text) const {
    print_styled(text, ansi::YELLOW);
}

void Console::print_success(const std::string& text) const {
    if (colors_enabled_) {
        std::cerr << ansi::GREEN << "✓" << ansi::RESET << " " << text << std::endl;
    } else {
        std::cerr << "* " << text << std::endl;
    }
}

void Console::print_field(const std::string& label, const std::string& value) const {
    if (colors_enabled_) {
        std::cerr << ansi::BOLD << ansi::CYAN << label << ansi::RESET << " " << value << std::endl;
    } else {
        std::cerr << label << " " << value << std::endl;
    }
}

} // namespace x5
