#include "filevault/log.hpp"

#include "filevault/cli_colors.hpp"
#include "filevault/constants.hpp"
#include "filevault/env.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <iostream>
#include <mutex>

namespace filevault::log {

namespace {

std::mutex g_write_mutex;
std::atomic<int> g_level{-1};

Level LevelFromEnv() {
    auto parsed = ParseLevel(filevault::env::Get(constants::kEnvLogLevel));
    return parsed ? *parsed : Level::Warn;
}

const char* ColorFor(Level level) {
    switch (level) {
        case Level::Debug:
            return cli::color::BRIGHT_BLACK;
        case Level::Info:
            return cli::color::CYAN;
        case Level::Warn:
            return cli::color::YELLOW;
        case Level::Error:
        case Level::Off:
            return cli::color::BOLD_RED;
    }
    return cli::color::RESET;
}

}  // namespace

Level GetLevel() {
    int current = g_level.load(std::memory_order_relaxed);
    if (current < 0) {
        Level from_env = LevelFromEnv();
        int expected = -1;
        g_level.compare_exchange_strong(expected, static_cast<int>(from_env));
        current = g_level.load(std::memory_order_relaxed);
    }
    return static_cast<Level>(current);
}

void SetLevel(Level level) {
    g_level.store(static_cast<int>(level), std::memory_order_relaxed);
}

std::optional<Level> ParseLevel(std::string_view text) {
    std::string value(text);
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    if (value == "debug" || value == "trace") return Level::Debug;
    if (value == "info") return Level::Info;
    if (value == "warn" || value == "warning") return Level::Warn;
    if (value == "error") return Level::Error;
    if (value == "off" || value == "none" || value == "quiet") return Level::Off;
    return std::nullopt;
}

std::string_view ToString(Level level) {
    switch (level) {
        case Level::Debug:
            return "debug";
        case Level::Info:
            return "info";
        case Level::Warn:
            return "warn";
        case Level::Error:
            return "error";
        case Level::Off:
            return "off";
    }
    return "unknown";
}

void Write(Level level, const std::string& message) {
    if (level == Level::Off || static_cast<int>(level) < static_cast<int>(GetLevel())) {
        return;
    }
    std::string tag = "[" + std::string(ToString(level)) + "]";
    std::lock_guard<std::mutex> lock(g_write_mutex);
    std::cerr << cli::Colorize(tag, ColorFor(level), std::cerr) << " " << message << "\n";
}

}  // namespace filevault::log
