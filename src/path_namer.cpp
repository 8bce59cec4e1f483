#include "filevault/path_namer.hpp"

#include "filevault/constants.hpp"

#include <string>

namespace filevault::naming {

namespace {

std::filesystem::path Place(const std::filesystem::path& input,
                            const std::string& filename,
                            const std::optional<std::filesystem::path>& output_dir) {
    if (output_dir && !output_dir->empty()) {
        return *output_dir / filename;
    }
    return input.parent_path() / filename;
}

bool EndsWith(const std::string& text, std::string_view suffix) {
    return text.size() >= suffix.size()
        && text.compare(text.size() - suffix.size(), suffix.size(), suffix) == 0;
}

}  // namespace

std::filesystem::path EncryptedPath(const std::filesystem::path& input,
                                    const std::optional<std::filesystem::path>& output_dir) {
    std::string filename = input.filename().string();
    filename += constants::kEncryptedSuffix;
    return Place(input, filename, output_dir);
}

std::filesystem::path DecryptedPath(const std::filesystem::path& input,
                                    const std::optional<std::filesystem::path>& output_dir) {
    std::string filename = input.filename().string();
    if (EndsWith(filename, constants::kEncryptedSuffix) && filename.size() > constants::kEncryptedSuffix.size()) {
        filename.resize(filename.size() - constants::kEncryptedSuffix.size());
    } else {
        filename += constants::kDecryptedSuffix;
    }
    return Place(input, filename, output_dir);
}

bool HasEncryptedSuffix(const std::filesystem::path& input) {
    std::string filename = input.filename().string();
    return filename.size() > constants::kEncryptedSuffix.size()
        && EndsWith(filename, constants::kEncryptedSuffix);
}

std::filesystem::path SourceBackupPath(const std::filesystem::path& input) {
    std::filesystem::path backup = input;
    backup += constants::kSourceBackupSuffix;
    return backup;
}

}  // namespace filevault::naming
