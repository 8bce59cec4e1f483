#include "filevault/filesystem.hpp"

#include "filevault/error.hpp"

#include <algorithm>
#include <fstream>
#include <string>
#include <system_error>

namespace filevault::fs {

namespace {

[[noreturn]] void Fail(const std::string& what, const std::filesystem::path& path, const std::error_code& ec) {
    std::string message = what + ": " + path.string();
    if (ec) {
        message += " (" + ec.message() + ")";
    }
    throw Error(ErrorCode::IoFailure, message);
}

}  // namespace

std::unique_ptr<std::istream> LocalFilesystem::OpenRead(const std::filesystem::path& path) {
    auto input = std::make_unique<std::ifstream>(path, std::ios::binary);
    if (!*input) {
        Fail("Failed to open file for reading", path, {});
    }
    return input;
}

std::unique_ptr<std::ostream> LocalFilesystem::OpenWrite(const std::filesystem::path& path) {
    auto output = std::make_unique<std::ofstream>(path, std::ios::binary | std::ios::trunc);
    if (!*output) {
        Fail("Failed to open file for writing", path, {});
    }
    return output;
}

std::optional<FileStat> LocalFilesystem::Stat(const std::filesystem::path& path) {
    std::error_code ec;
    auto status = std::filesystem::status(path, ec);
    if (ec || !std::filesystem::exists(status)) {
        return std::nullopt;
    }
    FileStat stat;
    stat.is_directory = std::filesystem::is_directory(status);
    stat.is_regular = std::filesystem::is_regular_file(status);
    if (stat.is_regular) {
        stat.size = static_cast<std::uint64_t>(std::filesystem::file_size(path, ec));
        if (ec) {
            Fail("Failed to read file size", path, ec);
        }
    }
    stat.mtime = std::filesystem::last_write_time(path, ec);
    if (ec) {
        Fail("Failed to read modification time", path, ec);
    }
    return stat;
}

bool LocalFilesystem::Exists(const std::filesystem::path& path) {
    std::error_code ec;
    return std::filesystem::exists(path, ec);
}

void LocalFilesystem::Rename(const std::filesystem::path& from, const std::filesystem::path& to) {
    std::error_code ec;
    std::filesystem::rename(from, to, ec);
    if (ec) {
        Fail("Failed to rename " + from.string() + " to", to, ec);
    }
}

void LocalFilesystem::Copy(const std::filesystem::path& from, const std::filesystem::path& to) {
    std::error_code ec;
    std::filesystem::copy_file(from, to, std::filesystem::copy_options::overwrite_existing, ec);
    if (ec) {
        Fail("Failed to copy " + from.string() + " to", to, ec);
    }
}

bool LocalFilesystem::Remove(const std::filesystem::path& path) {
    std::error_code ec;
    bool removed = std::filesystem::remove(path, ec);
    if (ec) {
        Fail("Failed to remove", path, ec);
    }
    return removed;
}

void LocalFilesystem::CreateDirectories(const std::filesystem::path& path) {
    if (path.empty()) {
        return;
    }
    std::error_code ec;
    std::filesystem::create_directories(path, ec);
    if (ec) {
        Fail("Failed to create directory", path, ec);
    }
}

std::vector<std::filesystem::path> LocalFilesystem::ListFiles(const std::filesystem::path& dir,
                                                              std::string_view suffix) {
    std::error_code ec;
    std::filesystem::directory_iterator it(dir, ec);
    if (ec) {
        Fail("Failed to scan directory", dir, ec);
    }
    std::vector<std::filesystem::path> files;
    for (const auto& entry : it) {
        if (!entry.is_regular_file(ec)) {
            continue;
        }
        std::string name = entry.path().filename().string();
        if (!suffix.empty()
            && (name.size() < suffix.size() || name.compare(name.size() - suffix.size(), suffix.size(), suffix) != 0)) {
            continue;
        }
        files.push_back(entry.path());
    }
    std::sort(files.begin(), files.end());
    return files;
}

}  // namespace filevault::fs
