#include "filevault/cli_colors.hpp"

#include "filevault/constants.hpp"
#include "filevault/env.hpp"

#include <atomic>
#include <cstdio>
#include <iostream>

#include <unistd.h>

namespace filevault::cli {

namespace {
    // 0 = auto, 1 = forced on, 2 = forced off
    std::atomic<int> g_override{0};

    bool EnvDisablesColor() {
        return filevault::env::IsEnabled(constants::kEnvNoColor) || !filevault::env::Get("NO_COLOR").empty();
    }
}

bool ColorsEnabled(std::ostream& os) {
    int forced = g_override.load(std::memory_order_relaxed);
    if (forced != 0) {
        return forced == 1;
    }
    if (EnvDisablesColor()) {
        return false;
    }
    if (&os == &std::cout) {
        return isatty(fileno(stdout)) != 0;
    }
    if (&os == &std::cerr || &os == &std::clog) {
        return isatty(fileno(stderr)) != 0;
    }
    return false;
}

void SetColorsEnabled(bool enabled) {
    g_override.store(enabled ? 1 : 2, std::memory_order_relaxed);
}

std::string Colorize(const std::string& text, const char* color, std::ostream& os) {
    if (!ColorsEnabled(os)) {
        return text;
    }
    return std::string(color) + text + color::RESET;
}

}  // namespace filevault::cli
