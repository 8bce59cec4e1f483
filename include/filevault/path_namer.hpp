#pragma once

#include <filesystem>
#include <optional>

namespace filevault::naming {

// "<name>" -> "<name>.encrypted", relocated under output_dir when given.
std::filesystem::path EncryptedPath(const std::filesystem::path& input,
                                    const std::optional<std::filesystem::path>& output_dir = std::nullopt);

// Strips ".encrypted"; appends ".decrypted" when the suffix is absent.
std::filesystem::path DecryptedPath(const std::filesystem::path& input,
                                    const std::optional<std::filesystem::path>& output_dir = std::nullopt);

bool HasEncryptedSuffix(const std::filesystem::path& input);

// "<input>.backup", beside the input.
std::filesystem::path SourceBackupPath(const std::filesystem::path& input);

}  // namespace filevault::naming
