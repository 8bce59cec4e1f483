#include "filevault/env.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <limits>
#include <stdexcept>

#include "filevault/error.hpp"

namespace filevault::env {

namespace {

std::string ToLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    return value;
}

}  // namespace

std::string Get(std::string_view name) {
    std::string key(name);
    const char* value = std::getenv(key.c_str());
    if (!value) {
        return {};
    }
    return std::string(value);
}

bool IsEnabled(std::string_view name, bool default_value) {
    std::string value = Get(name);
    if (value.empty()) {
        return default_value;
    }
    value = ToLower(value);
    return value == "1" || value == "true" || value == "yes" || value == "on";
}

std::optional<std::uint64_t> GetUnsigned(std::string_view name) {
    std::string raw = Get(name);
    if (raw.empty()) {
        return std::nullopt;
    }
    if (!std::all_of(raw.begin(), raw.end(), [](unsigned char ch) { return std::isdigit(ch) != 0; })) {
        return std::nullopt;
    }
    try {
        return static_cast<std::uint64_t>(std::stoull(raw));
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

std::uint64_t ParseByteSize(const std::string& raw) {
    if (raw.empty() || !std::isdigit(static_cast<unsigned char>(raw[0]))) {
        throw Error(ErrorCode::InvalidInput, "Invalid size: " + raw);
    }
    std::size_t used = 0;
    std::uint64_t value = 0;
    try {
        value = static_cast<std::uint64_t>(std::stoull(raw, &used));
    } catch (const std::out_of_range&) {
        throw Error(ErrorCode::InvalidInput, "Size too large: " + raw);
    } catch (const std::invalid_argument&) {
        throw Error(ErrorCode::InvalidInput, "Invalid size: " + raw);
    }
    std::string suffix = ToLower(raw.substr(used));
    std::uint64_t scale = 1;
    if (suffix == "k") {
        scale = 1024ull;
    } else if (suffix == "m") {
        scale = 1024ull * 1024ull;
    } else if (suffix == "g") {
        scale = 1024ull * 1024ull * 1024ull;
    } else if (!suffix.empty()) {
        throw Error(ErrorCode::InvalidInput, "Invalid size: " + raw);
    }
    if (value > std::numeric_limits<std::uint64_t>::max() / scale) {
        throw Error(ErrorCode::InvalidInput, "Size too large: " + raw);
    }
    return value * scale;
}

std::string HomeDir() {
    std::string home = Get("HOME");
    if (home.empty()) {
        home = Get("USERPROFILE");
    }
    return home;
}

}  // namespace filevault::env
