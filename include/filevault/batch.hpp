#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "filevault/cancel.hpp"
#include "filevault/conflict_resolver.hpp"
#include "filevault/constants.hpp"
#include "filevault/error.hpp"
#include "filevault/filesystem.hpp"

namespace filevault::batch {

using conflict::Operation;

struct FileJob {
    std::filesystem::path input;
    std::optional<std::filesystem::path> output;  // overrides the derived name
};

struct FileTaskResult {
    std::filesystem::path input_path;
    std::filesystem::path output_path;
    bool success = false;
    bool skipped = false;
    bool streamed = false;
    std::uint64_t original_size = 0;
    std::uint64_t result_size = 0;
    conflict::Action conflict_action = conflict::Action::Proceed;
    std::string conflict_reason;
    std::optional<std::filesystem::path> backup_path;
    std::optional<std::filesystem::path> source_backup_path;
    std::optional<ErrorCode> error_code;
    std::string error_message;
};

struct BatchResult {
    std::size_t total = 0;
    std::size_t successful = 0;
    std::size_t failed = 0;
    std::size_t skipped = 0;
    std::size_t streamed_count = 0;
    std::uint64_t total_original_size = 0;
    std::uint64_t total_result_size = 0;
    std::uint64_t processing_time_ms = 0;
    bool cancelled = false;
    std::vector<FileTaskResult> results;  // input order
};

struct BatchOptions {
    std::optional<std::filesystem::path> output_dir;
    std::size_t concurrency = constants::DefaultConcurrency();
    bool force_stream = false;
    bool backup_sources = false;  // encrypt: copy each input to "<input>.backup" first
    std::size_t chunk_size = constants::kDefaultChunkSize;
    std::uint64_t stream_threshold = constants::kDefaultStreamThreshold;
    conflict::ConflictOptions conflict;
    std::uint32_t kdf_iterations = 0;
    std::uint64_t max_in_memory_size = constants::kDefaultMaxInMemorySize;
    std::shared_ptr<CancelToken> cancel;
};

// Callbacks are serialised by the orchestrator; implementations need no
// locking. Exceptions thrown from them are logged and do not fail the file.
class ProgressSink {
public:
    virtual ~ProgressSink() = default;

    virtual void OnProgress(const std::filesystem::path& file, std::uint64_t bytes_done, std::uint64_t bytes_total) = 0;
    virtual void OnFileComplete(const FileTaskResult& result, std::size_t completed, std::size_t total) {
        (void)result;
        (void)completed;
        (void)total;
    }
};

struct PreviewEntry {
    std::filesystem::path input_path;
    std::filesystem::path output_path;
    bool accessible = false;
    std::uint64_t size = 0;
    std::uint64_t estimated_output_size = 0;
    bool streamed = false;
    bool output_exists = false;
    bool would_backup = false;
    std::optional<std::filesystem::path> source_backup_path;
    bool looks_encrypted = false;
    std::vector<std::string> warnings;
};

// Throws Error(InvalidInput) before any work starts.
void ValidateOptions(const BatchOptions& options);

class BatchOrchestrator {
public:
    explicit BatchOrchestrator(fs::FilesystemAccess& filesystem, ProgressSink* sink = nullptr);

    BatchResult Encrypt(const std::vector<std::filesystem::path>& inputs,
                        const std::string& password,
                        const BatchOptions& options = {});
    BatchResult Decrypt(const std::vector<std::filesystem::path>& inputs,
                        const std::string& password,
                        const BatchOptions& options = {});
    BatchResult Run(Operation operation,
                    const std::vector<FileJob>& jobs,
                    const std::string& password,
                    const BatchOptions& options = {});

    // Dry run: reads headers and stats, writes nothing.
    std::vector<PreviewEntry> Preview(const std::vector<std::filesystem::path>& inputs,
                                      Operation operation,
                                      const BatchOptions& options = {});

private:
    FileTaskResult RunOne(Operation operation,
                          const FileJob& job,
                          const std::string& password,
                          const BatchOptions& options,
                          conflict::ConflictResolver& resolver);
    std::uint64_t EncryptInto(const FileJob& job,
                              const std::filesystem::path& temp,
                              std::uint64_t size,
                              bool streamed,
                              const std::string& password,
                              const BatchOptions& options);
    std::uint64_t DecryptInto(const FileJob& job,
                              const std::filesystem::path& temp,
                              std::uint64_t size,
                              bool& streamed,
                              const std::string& password,
                              const BatchOptions& options);
    void ReportProgress(const std::filesystem::path& file, std::uint64_t done, std::uint64_t total);
    void ReportComplete(const FileTaskResult& result, std::size_t total);

    fs::FilesystemAccess& filesystem_;
    ProgressSink* sink_ = nullptr;
    std::mutex sink_mutex_;
    std::size_t completed_ = 0;
};

}  // namespace filevault::batch
