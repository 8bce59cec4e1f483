#pragma once

#include <cstdint>
#include <filesystem>
#include <istream>
#include <memory>
#include <optional>
#include <ostream>
#include <string_view>
#include <vector>

namespace filevault::fs {

struct FileStat {
    std::uint64_t size = 0;
    std::filesystem::file_time_type mtime{};
    bool is_directory = false;
    bool is_regular = false;
};

// Every operation the core performs on disk goes through this seam.
// Failures throw Error(IoFailure).
class FilesystemAccess {
public:
    virtual ~FilesystemAccess() = default;

    virtual std::unique_ptr<std::istream> OpenRead(const std::filesystem::path& path) = 0;
    // Truncates an existing file.
    virtual std::unique_ptr<std::ostream> OpenWrite(const std::filesystem::path& path) = 0;
    virtual std::optional<FileStat> Stat(const std::filesystem::path& path) = 0;
    virtual bool Exists(const std::filesystem::path& path) = 0;
    virtual void Rename(const std::filesystem::path& from, const std::filesystem::path& to) = 0;
    // Replaces an existing target.
    virtual void Copy(const std::filesystem::path& from, const std::filesystem::path& to) = 0;
    // Returns false when nothing was there.
    virtual bool Remove(const std::filesystem::path& path) = 0;
    virtual void CreateDirectories(const std::filesystem::path& path) = 0;
    // Regular files directly under dir whose names end in suffix, sorted.
    virtual std::vector<std::filesystem::path> ListFiles(const std::filesystem::path& dir,
                                                         std::string_view suffix = {}) = 0;
};

class LocalFilesystem : public FilesystemAccess {
public:
    std::unique_ptr<std::istream> OpenRead(const std::filesystem::path& path) override;
    std::unique_ptr<std::ostream> OpenWrite(const std::filesystem::path& path) override;
    std::optional<FileStat> Stat(const std::filesystem::path& path) override;
    bool Exists(const std::filesystem::path& path) override;
    void Rename(const std::filesystem::path& from, const std::filesystem::path& to) override;
    void Copy(const std::filesystem::path& from, const std::filesystem::path& to) override;
    bool Remove(const std::filesystem::path& path) override;
    void CreateDirectories(const std::filesystem::path& path) override;
    std::vector<std::filesystem::path> ListFiles(const std::filesystem::path& dir,
                                                 std::string_view suffix = {}) override;
};

}  // namespace filevault::fs
