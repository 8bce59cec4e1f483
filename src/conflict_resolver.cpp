#include "filevault/conflict_resolver.hpp"

#include "filevault/crypto.hpp"
#include "filevault/error.hpp"

#include <algorithm>
#include <cctype>
#include <utility>

namespace filevault::conflict {

namespace {

Resolution Proceed(std::string reason) {
    return Resolution{Action::Proceed, std::nullopt, std::move(reason)};
}

Resolution Skip(std::string reason) {
    return Resolution{Action::Skip, std::nullopt, std::move(reason)};
}

fs::FileStat StatOrEmpty(fs::FilesystemAccess& filesystem, const std::filesystem::path& path) {
    auto stat = filesystem.Stat(path);
    return stat ? *stat : fs::FileStat{};
}

}  // namespace

ConflictResolver::ConflictResolver(fs::FilesystemAccess& filesystem, ConflictOptions options)
    : filesystem_(filesystem),
      options_(std::move(options)) {
    if (options_.max_rename_attempts == 0) {
        throw Error(ErrorCode::InvalidInput, "max_rename_attempts must be positive");
    }
    if (options_.rename_suffix.find("$n") == std::string::npos) {
        throw Error(ErrorCode::InvalidInput, "Rename suffix must contain $n");
    }
    if (options_.backup_suffix.empty()) {
        throw Error(ErrorCode::InvalidInput, "Backup suffix must not be empty");
    }
}

bool ConflictResolver::IsReserved(const std::filesystem::path& path) const {
    std::lock_guard<std::mutex> lock(reserved_mutex_);
    return reserved_.count(path) > 0;
}

bool ConflictResolver::HasConflict(const std::filesystem::path& destination) const {
    return filesystem_.Exists(destination) || IsReserved(destination);
}

std::optional<ConflictRecord> ConflictResolver::DetectConflict(const std::filesystem::path& source,
                                                               const std::filesystem::path& destination,
                                                               Operation operation) const {
    if (!HasConflict(destination)) {
        return std::nullopt;
    }
    ConflictRecord record;
    record.source = source;
    record.destination = destination;
    record.operation = operation;
    record.source_stat = StatOrEmpty(filesystem_, source);
    record.destination_stat = StatOrEmpty(filesystem_, destination);
    record.claimed = IsReserved(destination);
    if (options_.strategy == Strategy::SkipIdentical && record.source_stat.is_regular
        && record.destination_stat.is_regular) {
        record.identical = record.source_stat.size == record.destination_stat.size
            && FileChecksum(filesystem_, source) == FileChecksum(filesystem_, destination);
    }
    return record;
}

std::filesystem::path ConflictResolver::UniqueName(const std::filesystem::path& destination,
                                                   std::size_t attempt) const {
    std::string suffix = options_.rename_suffix;
    std::string::size_type pos = suffix.find("$n");
    suffix.replace(pos, 2, std::to_string(attempt));
    std::string name = destination.stem().string() + suffix + destination.extension().string();
    return destination.parent_path() / name;
}

Resolution ConflictResolver::ResolveConflict(const ConflictRecord& record) const {
    const auto& src = record.source_stat;
    const auto& dst = record.destination_stat;
    if (record.claimed && options_.strategy != Strategy::Rename) {
        return Skip("Destination claimed by another file in this batch, skipping");
    }
    switch (options_.strategy) {
        case Strategy::Skip:
            return Skip("Destination exists, skipping");
        case Strategy::Overwrite:
            return Proceed("Overwriting existing file");
        case Strategy::Rename: {
            for (std::size_t attempt = 1; attempt <= options_.max_rename_attempts; ++attempt) {
                std::filesystem::path candidate = UniqueName(record.destination, attempt);
                if (!HasConflict(candidate)) {
                    return Resolution{Action::Rename, candidate,
                                      "Renamed to avoid conflict: " + candidate.filename().string()};
                }
            }
            throw Error(ErrorCode::ConflictUnresolved,
                        "No free name for " + record.destination.string() + " after "
                            + std::to_string(options_.max_rename_attempts) + " attempts");
        }
        case Strategy::Backup:
            return Resolution{Action::Backup, std::nullopt, "Creating backup before overwriting"};
        case Strategy::KeepNewer:
            if (src.mtime > dst.mtime) {
                return Proceed("Source is newer, overwriting");
            }
            return Skip("Destination is newer, skipping");
        case Strategy::KeepOlder:
            if (src.mtime < dst.mtime) {
                return Proceed("Source is older, overwriting");
            }
            return Skip("Destination is older, skipping");
        case Strategy::KeepLarger:
            if (src.size > dst.size) {
                return Proceed("Source is larger, overwriting");
            }
            return Skip("Destination is larger, skipping");
        case Strategy::KeepSmaller:
            if (src.size < dst.size) {
                return Proceed("Source is smaller, overwriting");
            }
            return Skip("Destination is smaller, skipping");
        case Strategy::SkipIdentical:
            if (record.identical.value_or(false)) {
                return Skip("Files are identical (same checksum), skipping");
            }
            return Proceed("Files are different, overwriting");
    }
    throw Error(ErrorCode::ConflictUnresolved, "Unknown conflict strategy");
}

std::filesystem::path ConflictResolver::CreateBackup(const std::filesystem::path& destination) const {
    std::filesystem::path backup = destination;
    backup += options_.backup_suffix;
    std::size_t attempt = 1;
    while (filesystem_.Exists(backup)) {
        if (attempt > options_.max_rename_attempts) {
            throw Error(ErrorCode::ConflictUnresolved, "No free backup name for " + destination.string());
        }
        backup = destination;
        backup += options_.backup_suffix + "." + std::to_string(attempt);
        ++attempt;
    }
    filesystem_.Rename(destination, backup);
    return backup;
}

ConflictOutcome ConflictResolver::Apply(const Resolution& resolution,
                                        const std::filesystem::path& destination) const {
    ConflictOutcome outcome;
    outcome.action = resolution.action;
    outcome.reason = resolution.reason;
    outcome.destination = destination;
    switch (resolution.action) {
        case Action::Skip:
            outcome.skip = true;
            break;
        case Action::Proceed:
            break;
        case Action::Rename:
            if (!resolution.new_destination) {
                throw Error(ErrorCode::ConflictUnresolved, "Rename resolution without a destination");
            }
            outcome.destination = *resolution.new_destination;
            break;
        case Action::Backup:
            if (filesystem_.Exists(destination)) {
                outcome.backup_path = CreateBackup(destination);
            }
            break;
    }
    return outcome;
}

ConflictOutcome ConflictResolver::Handle(const std::filesystem::path& source,
                                         const std::filesystem::path& destination,
                                         Operation operation) {
    std::lock_guard<std::mutex> lock(handle_mutex_);
    ConflictOutcome outcome;
    auto record = DetectConflict(source, destination, operation);
    if (!record) {
        outcome.destination = destination;
        outcome.reason = "No conflict, proceeding";
    } else {
        outcome = Apply(ResolveConflict(*record), destination);
    }
    if (!outcome.skip) {
        std::lock_guard<std::mutex> reserved_lock(reserved_mutex_);
        reserved_.insert(outcome.destination);
    }
    return outcome;
}

std::optional<Strategy> ParseStrategy(std::string_view text) {
    std::string normalized(text);
    std::transform(normalized.begin(), normalized.end(), normalized.begin(), [](unsigned char ch) {
        return ch == '_' ? '-' : static_cast<char>(std::tolower(ch));
    });
    if (normalized == "skip") return Strategy::Skip;
    if (normalized == "overwrite") return Strategy::Overwrite;
    if (normalized == "rename") return Strategy::Rename;
    if (normalized == "backup") return Strategy::Backup;
    if (normalized == "keep-newer" || normalized == "newer") return Strategy::KeepNewer;
    if (normalized == "keep-older" || normalized == "older") return Strategy::KeepOlder;
    if (normalized == "keep-larger") return Strategy::KeepLarger;
    if (normalized == "keep-smaller") return Strategy::KeepSmaller;
    if (normalized == "skip-identical") return Strategy::SkipIdentical;
    return std::nullopt;
}

std::string_view StrategyName(Strategy strategy) {
    switch (strategy) {
        case Strategy::Skip:
            return "skip";
        case Strategy::Overwrite:
            return "overwrite";
        case Strategy::Rename:
            return "rename";
        case Strategy::Backup:
            return "backup";
        case Strategy::KeepNewer:
            return "keep-newer";
        case Strategy::KeepOlder:
            return "keep-older";
        case Strategy::KeepLarger:
            return "keep-larger";
        case Strategy::KeepSmaller:
            return "keep-smaller";
        case Strategy::SkipIdentical:
            return "skip-identical";
    }
    return "unknown";
}

const std::vector<StrategyInfo>& AvailableStrategies() {
    static const std::vector<StrategyInfo> kStrategies = {
        {"skip", "Skip the file and don't overwrite"},
        {"overwrite", "Overwrite the existing file"},
        {"rename", "Write under a numbered name (e.g. file_1.txt)"},
        {"backup", "Move the existing file to <name>.bak before writing"},
        {"keep-newer", "Overwrite only when the source is newer"},
        {"keep-older", "Overwrite only when the source is older"},
        {"keep-larger", "Overwrite only when the source is larger"},
        {"keep-smaller", "Overwrite only when the source is smaller"},
        {"skip-identical", "Skip when both files have the same SHA-256"},
    };
    return kStrategies;
}

std::string_view ToString(Action action) {
    switch (action) {
        case Action::Proceed:
            return "proceed";
        case Action::Skip:
            return "skip";
        case Action::Rename:
            return "rename";
        case Action::Backup:
            return "backup";
    }
    return "unknown";
}

std::string_view ToString(Operation operation) {
    return operation == Operation::Encrypt ? "encrypt" : "decrypt";
}

std::string FileChecksum(fs::FilesystemAccess& filesystem, const std::filesystem::path& path) {
    auto input = filesystem.OpenRead(path);
    crypto::Sha256 hasher;
    hasher.Update(*input);
    return hasher.FinalHex();
}

}  // namespace filevault::conflict
