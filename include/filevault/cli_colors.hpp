#pragma once

#include <iostream>
#include <ostream>
#include <string>

namespace filevault::cli {

// ANSI color codes
namespace color {
    constexpr const char* RESET = "\033[0m";

    constexpr const char* RED = "\033[0;31m";
    constexpr const char* GREEN = "\033[0;32m";
    constexpr const char* YELLOW = "\033[0;33m";
    constexpr const char* CYAN = "\033[0;36m";

    constexpr const char* BOLD_RED = "\033[1;31m";
    constexpr const char* BOLD_YELLOW = "\033[1;33m";

    constexpr const char* BRIGHT_BLACK = "\033[0;90m";
}

// TTY detection on first use, unless FILEVAULT_NO_COLOR / NO_COLOR is set
// or SetColorsEnabled() was called.
bool ColorsEnabled(std::ostream& os = std::cerr);

// --no-color
void SetColorsEnabled(bool enabled);

std::string Colorize(const std::string& text, const char* color, std::ostream& os = std::cerr);

inline std::string Red(const std::string& text) { return Colorize(text, color::RED); }
inline std::string Green(const std::string& text) { return Colorize(text, color::GREEN); }
inline std::string Yellow(const std::string& text) { return Colorize(text, color::YELLOW); }
inline std::string Gray(const std::string& text) { return Colorize(text, color::BRIGHT_BLACK); }

}  // namespace filevault::cli
