#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace filevault::log {

enum class Level { Debug = 0, Info = 1, Warn = 2, Error = 3, Off = 4 };

// Default is Warn, or FILEVAULT_LOG_LEVEL when set.
Level GetLevel();
void SetLevel(Level level);
std::optional<Level> ParseLevel(std::string_view text);
std::string_view ToString(Level level);

// Thread-safe; one line per call on stderr.
void Write(Level level, const std::string& message);

inline void Debug(const std::string& message) { Write(Level::Debug, message); }
inline void Info(const std::string& message) { Write(Level::Info, message); }
inline void Warn(const std::string& message) { Write(Level::Warn, message); }
inline void Error(const std::string& message) { Write(Level::Error, message); }

}  // namespace filevault::log
