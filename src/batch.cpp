#include "filevault/batch.hpp"

#include "filevault/chunked_codec.hpp"
#include "filevault/cipher_codec.hpp"
#include "filevault/container.hpp"
#include "filevault/crypto.hpp"
#include "filevault/log.hpp"
#include "filevault/path_namer.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <thread>

namespace filevault::batch {

namespace {

constexpr std::uint64_t kLargeFileWarning = 100ull * 1024ull * 1024ull;

template <typename Fn>
void ParallelFor(std::size_t count, std::size_t max_workers, Fn&& fn) {
    std::size_t workers = std::min(count, std::max<std::size_t>(1, max_workers));
    if (count == 0 || workers <= 1) {
        for (std::size_t i = 0; i < count; ++i) {
            fn(i);
        }
        return;
    }
    std::atomic<std::size_t> next{0};
    std::vector<std::thread> threads;
    threads.reserve(workers);
    for (std::size_t w = 0; w < workers; ++w) {
        threads.emplace_back([&]() {
            while (true) {
                std::size_t idx = next.fetch_add(1);
                if (idx >= count) {
                    break;
                }
                fn(idx);
            }
        });
    }
    for (auto& t : threads) {
        if (t.joinable()) {
            t.join();
        }
    }
}

std::filesystem::path TempSibling(const std::filesystem::path& destination) {
    std::filesystem::path temp = destination;
    temp += ".part-" + crypto::HexEncode(crypto::RandomBytes(4));
    return temp;
}

std::filesystem::path Destination(Operation operation, const FileJob& job, const BatchOptions& options) {
    if (job.output) {
        return *job.output;
    }
    return operation == Operation::Encrypt ? naming::EncryptedPath(job.input, options.output_dir)
                                           : naming::DecryptedPath(job.input, options.output_dir);
}

std::vector<FileJob> ToJobs(const std::vector<std::filesystem::path>& inputs) {
    std::vector<FileJob> jobs;
    jobs.reserve(inputs.size());
    for (const auto& input : inputs) {
        jobs.push_back(FileJob{input, std::nullopt});
    }
    return jobs;
}

void CloseOutput(std::ostream& output) {
    output.flush();
    if (!output) {
        throw Error(ErrorCode::IoFailure, "Failed to flush output");
    }
}

}  // namespace

void ValidateOptions(const BatchOptions& options) {
    if (options.concurrency == 0 || options.concurrency > constants::kMaxConcurrency) {
        throw Error(ErrorCode::InvalidInput,
                    "Concurrency must be between 1 and " + std::to_string(constants::kMaxConcurrency));
    }
    chunked::ValidateChunkSize(options.chunk_size);
    if (options.max_in_memory_size == 0) {
        throw Error(ErrorCode::InvalidInput, "In-memory limit must be positive");
    }
    if (options.stream_threshold == 0) {
        throw Error(ErrorCode::InvalidInput, "Stream threshold must be positive");
    }
    if (options.stream_threshold > options.max_in_memory_size) {
        throw Error(ErrorCode::InvalidInput, "Stream threshold exceeds the in-memory limit");
    }
    if (options.kdf_iterations > constants::kMaxKdfIterations) {
        throw Error(ErrorCode::InvalidInput, "KDF iteration count is too large");
    }
}

BatchOrchestrator::BatchOrchestrator(fs::FilesystemAccess& filesystem, ProgressSink* sink)
    : filesystem_(filesystem),
      sink_(sink) {}

BatchResult BatchOrchestrator::Encrypt(const std::vector<std::filesystem::path>& inputs,
                                       const std::string& password,
                                       const BatchOptions& options) {
    return Run(Operation::Encrypt, ToJobs(inputs), password, options);
}

BatchResult BatchOrchestrator::Decrypt(const std::vector<std::filesystem::path>& inputs,
                                       const std::string& password,
                                       const BatchOptions& options) {
    return Run(Operation::Decrypt, ToJobs(inputs), password, options);
}

BatchResult BatchOrchestrator::Run(Operation operation,
                                   const std::vector<FileJob>& jobs,
                                   const std::string& password,
                                   const BatchOptions& options) {
    if (jobs.empty()) {
        throw Error(ErrorCode::InvalidInput, "No files to process");
    }
    if (password.empty()) {
        throw Error(ErrorCode::InvalidInput, "Password must not be empty");
    }
    ValidateOptions(options);

    auto start = std::chrono::steady_clock::now();
    conflict::ConflictResolver resolver(filesystem_, options.conflict);
    {
        std::lock_guard<std::mutex> lock(sink_mutex_);
        completed_ = 0;
    }
    log::Debug(std::string(conflict::ToString(operation)) + " batch: " + std::to_string(jobs.size())
               + " file(s), concurrency " + std::to_string(options.concurrency));

    BatchResult batch;
    batch.total = jobs.size();
    batch.results.resize(jobs.size());
    ParallelFor(jobs.size(), options.concurrency, [&](std::size_t idx) {
        batch.results[idx] = RunOne(operation, jobs[idx], password, options, resolver);
        ReportComplete(batch.results[idx], jobs.size());
    });

    for (const auto& result : batch.results) {
        if (result.success) {
            batch.successful += 1;
            if (result.skipped) {
                batch.skipped += 1;
            }
        } else {
            batch.failed += 1;
        }
        if (result.streamed) {
            batch.streamed_count += 1;
        }
        batch.total_original_size += result.original_size;
        batch.total_result_size += result.result_size;
    }
    batch.cancelled = options.cancel && options.cancel->IsCancelled();
    batch.processing_time_ms = static_cast<std::uint64_t>(
        std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start).count());
    return batch;
}

FileTaskResult BatchOrchestrator::RunOne(Operation operation,
                                         const FileJob& job,
                                         const std::string& password,
                                         const BatchOptions& options,
                                         conflict::ConflictResolver& resolver) {
    FileTaskResult result;
    result.input_path = job.input;
    std::optional<std::filesystem::path> temp;
    std::optional<std::filesystem::path> backup;
    std::optional<std::filesystem::path> source_backup;
    try {
        if (options.cancel) {
            options.cancel->ThrowIfCancelled();
        }
        result.output_path = Destination(operation, job, options);
        auto stat = filesystem_.Stat(job.input);
        if (!stat || !stat->is_regular) {
            throw Error(ErrorCode::InvalidInput, "Not a readable file: " + job.input.string());
        }
        result.original_size = stat->size;
        if (result.output_path == job.input) {
            throw Error(ErrorCode::InvalidInput, "Output path equals input path: " + job.input.string());
        }
        filesystem_.CreateDirectories(result.output_path.parent_path());

        conflict::ConflictOutcome outcome = resolver.Handle(job.input, result.output_path, operation);
        result.conflict_action = outcome.action;
        result.conflict_reason = outcome.reason;
        result.backup_path = outcome.backup_path;
        backup = outcome.backup_path;
        if (outcome.skip) {
            log::Info("Skipped " + job.input.string() + ": " + outcome.reason);
            result.success = true;
            result.skipped = true;
            return result;
        }
        result.output_path = outcome.destination;

        if (operation == Operation::Encrypt && options.backup_sources) {
            source_backup = naming::SourceBackupPath(job.input);
            filesystem_.Copy(job.input, *source_backup);
            result.source_backup_path = source_backup;
        }

        temp = TempSibling(result.output_path);
        if (operation == Operation::Encrypt) {
            result.streamed = options.force_stream || result.original_size > options.stream_threshold;
            result.result_size = EncryptInto(job, *temp, result.original_size, result.streamed, password, options);
        } else {
            result.result_size = DecryptInto(job, *temp, result.original_size, result.streamed, password, options);
        }
        filesystem_.Rename(*temp, result.output_path);
        temp.reset();
        result.success = true;
        log::Debug(std::string(conflict::ToString(operation)) + " " + job.input.string() + " -> "
                   + result.output_path.string() + (result.streamed ? " (streamed)" : ""));
    } catch (const Error& err) {
        result.success = false;
        result.error_code = err.code();
        result.error_message = err.what();
    } catch (const std::exception& exc) {
        result.success = false;
        result.error_code = ErrorCode::IoFailure;
        result.error_message = exc.what();
    }

    if (!result.success) {
        result.result_size = 0;
        try {
            if (temp) {
                filesystem_.Remove(*temp);
            }
            if (backup && !filesystem_.Exists(result.output_path)) {
                filesystem_.Rename(*backup, result.output_path);
                result.backup_path.reset();
            }
            if (source_backup) {
                filesystem_.Remove(*source_backup);
                result.source_backup_path.reset();
            }
        } catch (const std::exception& exc) {
            log::Warn("Cleanup after failure of " + job.input.string() + " incomplete: " + exc.what());
        }
        log::Error(job.input.string() + ": " + result.error_message);
    }
    return result;
}

std::uint64_t BatchOrchestrator::EncryptInto(const FileJob& job,
                                             const std::filesystem::path& temp,
                                             std::uint64_t size,
                                             bool streamed,
                                             const std::string& password,
                                             const BatchOptions& options) {
    auto input = filesystem_.OpenRead(job.input);
    auto output = filesystem_.OpenWrite(temp);
    std::uint64_t written = 0;
    if (streamed) {
        chunked::ChunkOptions chunk_options;
        chunk_options.chunk_size = options.chunk_size;
        chunk_options.iterations = options.kdf_iterations;
        StreamHooks hooks;
        hooks.cancel = options.cancel.get();
        hooks.total_bytes = size;
        hooks.progress = [this, &job](std::uint64_t done, std::uint64_t total) {
            ReportProgress(job.input, done, total);
        };
        written = chunked::EncryptStream(*input, *output, password, chunk_options, hooks);
    } else {
        codec::CodecOptions codec_options;
        codec_options.iterations = options.kdf_iterations;
        codec_options.max_in_memory_size = options.max_in_memory_size;
        written = codec::EncryptFile(*input, *output, password, codec_options);
        ReportProgress(job.input, size, size);
    }
    CloseOutput(*output);
    return written;
}

std::uint64_t BatchOrchestrator::DecryptInto(const FileJob& job,
                                             const std::filesystem::path& temp,
                                             std::uint64_t size,
                                             bool& streamed,
                                             const std::string& password,
                                             const BatchOptions& options) {
    auto input = filesystem_.OpenRead(job.input);
    crypto::Bytes raw_header;
    container::Header header = container::ReadHeader(*input, raw_header);
    streamed = header.mode == container::Mode::Streaming;
    auto output = filesystem_.OpenWrite(temp);
    std::uint64_t written = 0;
    if (streamed) {
        StreamHooks hooks;
        hooks.cancel = options.cancel.get();
        hooks.total_bytes = size;
        hooks.progress = [this, &job](std::uint64_t done, std::uint64_t total) {
            ReportProgress(job.input, done, total);
        };
        written = chunked::DecryptAfterHeader(header, raw_header, *input, *output, password, hooks);
    } else {
        codec::CodecOptions codec_options;
        codec_options.max_in_memory_size = options.max_in_memory_size;
        written = codec::DecryptAfterHeader(header, raw_header, *input, *output, password, codec_options);
        ReportProgress(job.input, size, size);
    }
    CloseOutput(*output);
    return written;
}

void BatchOrchestrator::ReportProgress(const std::filesystem::path& file, std::uint64_t done, std::uint64_t total) {
    if (sink_ == nullptr) {
        return;
    }
    std::lock_guard<std::mutex> lock(sink_mutex_);
    try {
        sink_->OnProgress(file, done, total);
    } catch (const std::exception& exc) {
        log::Warn(std::string("Progress sink failed: ") + exc.what());
    }
}

void BatchOrchestrator::ReportComplete(const FileTaskResult& result, std::size_t total) {
    std::lock_guard<std::mutex> lock(sink_mutex_);
    completed_ += 1;
    if (sink_ == nullptr) {
        return;
    }
    try {
        sink_->OnFileComplete(result, completed_, total);
    } catch (const std::exception& exc) {
        log::Warn(std::string("Progress sink failed: ") + exc.what());
    }
}

std::vector<PreviewEntry> BatchOrchestrator::Preview(const std::vector<std::filesystem::path>& inputs,
                                                     Operation operation,
                                                     const BatchOptions& options) {
    ValidateOptions(options);
    std::vector<PreviewEntry> entries;
    entries.reserve(inputs.size());
    for (const auto& input : inputs) {
        PreviewEntry entry;
        entry.input_path = input;
        entry.output_path = Destination(operation, FileJob{input, std::nullopt}, options);
        auto stat = filesystem_.Stat(input);
        if (!stat || !stat->is_regular) {
            entry.warnings.push_back("File not found or not a regular file");
            entries.push_back(std::move(entry));
            continue;
        }
        entry.accessible = true;
        entry.size = stat->size;
        entry.output_exists = filesystem_.Exists(entry.output_path);
        entry.would_backup = entry.output_exists && options.conflict.strategy == conflict::Strategy::Backup;

        std::optional<container::Header> header;
        try {
            auto stream = filesystem_.OpenRead(input);
            header = container::PeekHeader(*stream);
        } catch (const Error& err) {
            entry.accessible = false;
            entry.warnings.push_back(err.what());
            entries.push_back(std::move(entry));
            continue;
        }
        entry.looks_encrypted = header.has_value();

        if (operation == Operation::Encrypt) {
            entry.streamed = options.force_stream || entry.size > options.stream_threshold;
            entry.estimated_output_size = container::EstimateOutputSize(
                entry.streamed ? container::Mode::Streaming : container::Mode::WholeFile, entry.size,
                options.chunk_size);
            if (entry.looks_encrypted) {
                entry.warnings.push_back("File appears to be already encrypted");
            } else if (naming::HasEncryptedSuffix(input)) {
                entry.warnings.push_back("File name ends in .encrypted but has no container header");
            }
            if (options.backup_sources) {
                entry.source_backup_path = naming::SourceBackupPath(input);
                if (filesystem_.Exists(*entry.source_backup_path)) {
                    entry.warnings.push_back("Existing source backup will be replaced");
                }
            }
        } else if (header) {
            entry.streamed = header->mode == container::Mode::Streaming;
            auto estimate = container::EstimatePlaintextSize(*header, entry.size);
            if (estimate) {
                entry.estimated_output_size = *estimate;
            } else {
                entry.warnings.push_back("Container is truncated");
            }
        } else {
            entry.warnings.push_back("File is not an encrypted container");
        }
        if (entry.size > kLargeFileWarning) {
            entry.warnings.push_back("Large file - processing may take longer");
        }
        if (entry.output_exists) {
            entry.warnings.push_back("Output exists; conflict strategy '"
                                     + std::string(conflict::StrategyName(options.conflict.strategy))
                                     + "' applies");
        }
        entries.push_back(std::move(entry));
    }
    return entries;
}

}  // namespace filevault::batch
