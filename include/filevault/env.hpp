#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace filevault::env {

std::string Get(std::string_view name);
bool IsEnabled(std::string_view name, bool default_value = false);
std::optional<std::uint64_t> GetUnsigned(std::string_view name);

// Byte count with an optional K/M/G suffix (powers of 1024).
// Throws Error(InvalidInput) on malformed or overflowing values.
std::uint64_t ParseByteSize(const std::string& raw);
std::string HomeDir();

}  // namespace filevault::env
