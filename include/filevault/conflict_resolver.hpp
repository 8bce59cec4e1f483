#pragma once

#include <cstddef>
#include <filesystem>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

#include "filevault/constants.hpp"
#include "filevault/filesystem.hpp"

namespace filevault::conflict {

enum class Strategy {
    Skip,
    Overwrite,
    Rename,
    Backup,
    KeepNewer,
    KeepOlder,
    KeepLarger,
    KeepSmaller,
    SkipIdentical
};

enum class Operation { Encrypt, Decrypt };

enum class Action { Proceed, Skip, Rename, Backup };

struct ConflictOptions {
    Strategy strategy = Strategy::Skip;
    std::string rename_suffix = std::string(constants::kRenameSuffix);  // "$n" is replaced by the attempt
    std::size_t max_rename_attempts = constants::kMaxRenameAttempts;
    std::string backup_suffix = std::string(constants::kBackupSuffix);
};

struct ConflictRecord {
    std::filesystem::path source;
    std::filesystem::path destination;
    Operation operation = Operation::Encrypt;
    fs::FileStat source_stat;
    fs::FileStat destination_stat;
    std::optional<bool> identical;  // skip-identical only
    bool claimed = false;           // handed to another task in this batch
};

struct Resolution {
    Action action = Action::Proceed;
    std::optional<std::filesystem::path> new_destination;
    std::string reason;
};

struct ConflictOutcome {
    Action action = Action::Proceed;
    bool skip = false;
    std::filesystem::path destination;
    std::optional<std::filesystem::path> backup_path;
    std::string reason;
};

class ConflictResolver {
public:
    explicit ConflictResolver(fs::FilesystemAccess& filesystem, ConflictOptions options = {});

    // Exists on disk, or already claimed by another task in this run.
    bool HasConflict(const std::filesystem::path& destination) const;
    std::optional<ConflictRecord> DetectConflict(const std::filesystem::path& source,
                                                 const std::filesystem::path& destination,
                                                 Operation operation) const;
    // A claimed destination is renamed under the rename strategy and skipped
    // under every other one. Throws Error(ConflictUnresolved) when rename runs
    // out of attempts.
    Resolution ResolveConflict(const ConflictRecord& record) const;
    ConflictOutcome Apply(const Resolution& resolution, const std::filesystem::path& destination) const;

    // Detect, resolve and apply in one step, reserving the final destination.
    ConflictOutcome Handle(const std::filesystem::path& source,
                           const std::filesystem::path& destination,
                           Operation operation);

    Strategy strategy() const noexcept { return options_.strategy; }
    const ConflictOptions& options() const noexcept { return options_; }

private:
    std::filesystem::path UniqueName(const std::filesystem::path& destination, std::size_t attempt) const;
    std::filesystem::path CreateBackup(const std::filesystem::path& destination) const;
    bool IsReserved(const std::filesystem::path& path) const;

    fs::FilesystemAccess& filesystem_;
    ConflictOptions options_;
    std::mutex handle_mutex_;
    mutable std::mutex reserved_mutex_;
    std::set<std::filesystem::path> reserved_;
};

struct StrategyInfo {
    std::string_view name;
    std::string_view description;
};

std::optional<Strategy> ParseStrategy(std::string_view text);
std::string_view StrategyName(Strategy strategy);
const std::vector<StrategyInfo>& AvailableStrategies();
std::string_view ToString(Action action);
std::string_view ToString(Operation operation);

// SHA-256 of the file contents as lowercase hex.
std::string FileChecksum(fs::FilesystemAccess& filesystem, const std::filesystem::path& path);

}  // namespace filevault::conflict
