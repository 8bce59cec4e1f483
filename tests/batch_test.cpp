#include <gtest/gtest.h>

#include "filevault/batch.hpp"
#include "filevault/constants.hpp"
#include "filevault/container.hpp"
#include "filevault/crypto.hpp"
#include "filevault/error.hpp"
#include "filevault/filesystem.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "test_helpers.hpp"

namespace filevault::batch {
namespace {

using crypto::Bytes;
using test_support::CountEntries;
using test_support::kFastIterations;
using test_support::PatternBytes;
using test_support::ReadFile;
using test_support::ReadText;
using test_support::TempDir;
using test_support::WriteFile;

const std::string kPassword = "Tr0ub4dor&3";

BatchOptions FastOptions() {
    BatchOptions options;
    options.kdf_iterations = kFastIterations;
    options.concurrency = 2;
    return options;
}

bool HasPartFiles(const std::filesystem::path& dir) {
    for (const auto& entry : std::filesystem::recursive_directory_iterator(dir)) {
        if (entry.path().filename().string().find(".part-") != std::string::npos) {
            return true;
        }
    }
    return false;
}

class RecordingSink : public ProgressSink {
public:
    void OnProgress(const std::filesystem::path& file, std::uint64_t bytes_done, std::uint64_t bytes_total) override {
        (void)file;
        (void)bytes_total;
        progress_calls += 1;
        last_done = bytes_done;
        if (cancel_on_progress) {
            cancel_on_progress->Cancel();
        }
    }

    void OnFileComplete(const FileTaskResult& result, std::size_t completed, std::size_t total) override {
        (void)result;
        completions.push_back(completed);
        last_total = total;
    }

    std::shared_ptr<CancelToken> cancel_on_progress;
    std::size_t progress_calls = 0;
    std::uint64_t last_done = 0;
    std::vector<std::size_t> completions;
    std::size_t last_total = 0;
};

// Tracks how many tasks are inside Stat() at once.
class CountingFilesystem : public fs::LocalFilesystem {
public:
    std::optional<fs::FileStat> Stat(const std::filesystem::path& path) override {
        int now = in_flight.fetch_add(1) + 1;
        int seen = max_in_flight.load();
        while (now > seen && !max_in_flight.compare_exchange_weak(seen, now)) {
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(30));
        in_flight.fetch_sub(1);
        return fs::LocalFilesystem::Stat(path);
    }

    std::atomic<int> in_flight{0};
    std::atomic<int> max_in_flight{0};
};

class BatchTest : public ::testing::Test {
protected:
    std::vector<std::filesystem::path> Files(std::initializer_list<const char*> names) {
        std::vector<std::filesystem::path> paths;
        for (const char* name : names) {
            paths.push_back(dir_ / name);
        }
        return paths;
    }

    TempDir dir_;
    fs::LocalFilesystem filesystem_;
};

TEST_F(BatchTest, EncryptsAndDecryptsMixedSizes) {
    Bytes big = PatternBytes(12 * 1024 * 1024, 99);
    WriteFile(dir_ / "a.txt", "hi");
    WriteFile(dir_ / "b.txt", big);
    WriteFile(dir_ / "c.txt", "");

    BatchOptions options = FastOptions();
    options.stream_threshold = 10 * 1024 * 1024;
    BatchOrchestrator orchestrator(filesystem_);
    BatchResult encrypted = orchestrator.Encrypt(Files({"a.txt", "b.txt", "c.txt"}), kPassword, options);

    EXPECT_EQ(encrypted.total, 3u);
    EXPECT_EQ(encrypted.successful, 3u);
    EXPECT_EQ(encrypted.failed, 0u);
    EXPECT_EQ(encrypted.streamed_count, 1u);
    EXPECT_FALSE(encrypted.cancelled);
    ASSERT_EQ(encrypted.results.size(), 3u);
    EXPECT_EQ(encrypted.results[0].input_path, dir_ / "a.txt");
    EXPECT_EQ(encrypted.results[0].output_path, dir_ / "a.txt.encrypted");
    EXPECT_FALSE(encrypted.results[0].streamed);
    EXPECT_TRUE(encrypted.results[1].streamed);
    EXPECT_EQ(encrypted.total_original_size, big.size() + 2);
    EXPECT_EQ(std::filesystem::file_size(dir_ / "a.txt.encrypted"),
              constants::kBaseHeaderLen + constants::kRecordOverhead + 2);
    EXPECT_EQ(std::filesystem::file_size(dir_ / "c.txt.encrypted"),
              constants::kBaseHeaderLen + constants::kRecordOverhead);
    EXPECT_EQ(std::filesystem::file_size(dir_ / "b.txt.encrypted"),
              container::EstimateOutputSize(container::Mode::Streaming, big.size(), constants::kDefaultChunkSize));
    EXPECT_EQ(encrypted.results[1].result_size, std::filesystem::file_size(dir_ / "b.txt.encrypted"));

    options.output_dir = dir_ / "restored";
    BatchResult decrypted = orchestrator.Decrypt(
        Files({"a.txt.encrypted", "b.txt.encrypted", "c.txt.encrypted"}), kPassword, options);
    EXPECT_EQ(decrypted.successful, 3u);
    EXPECT_EQ(decrypted.streamed_count, 1u);
    EXPECT_EQ(ReadText(dir_ / "restored" / "a.txt"), "hi");
    EXPECT_EQ(ReadFile(dir_ / "restored" / "b.txt"), big);
    EXPECT_EQ(ReadText(dir_ / "restored" / "c.txt"), "");
    EXPECT_EQ(decrypted.total_result_size, big.size() + 2);
    EXPECT_FALSE(HasPartFiles(dir_.path()));
}

TEST_F(BatchTest, FailuresStayIsolated) {
    WriteFile(dir_ / "good.txt", "payload");
    WriteFile(dir_ / "other.txt", "more payload");
    BatchOrchestrator orchestrator(filesystem_);
    BatchResult encrypted = orchestrator.Encrypt(Files({"good.txt", "missing.txt", "other.txt"}), kPassword,
                                                 FastOptions());
    EXPECT_EQ(encrypted.successful, 2u);
    EXPECT_EQ(encrypted.failed, 1u);
    EXPECT_FALSE(encrypted.results[1].success);
    EXPECT_EQ(encrypted.results[1].error_code, ErrorCode::InvalidInput);
    EXPECT_FALSE(encrypted.results[1].error_message.empty());
    EXPECT_TRUE(std::filesystem::exists(dir_ / "other.txt.encrypted"));
    EXPECT_FALSE(std::filesystem::exists(dir_ / "missing.txt.encrypted"));

    Bytes container = ReadFile(dir_ / "good.txt.encrypted");
    container[container.size() - 20] ^= 0x40;
    WriteFile(dir_ / "good.txt.encrypted", container);
    std::filesystem::remove(dir_ / "good.txt");
    std::filesystem::remove(dir_ / "other.txt");

    BatchResult decrypted = orchestrator.Decrypt(Files({"good.txt.encrypted", "other.txt.encrypted"}), kPassword,
                                                 FastOptions());
    EXPECT_EQ(decrypted.failed, 1u);
    EXPECT_EQ(decrypted.results[0].error_code, ErrorCode::DecryptionFailed);
    EXPECT_TRUE(decrypted.results[1].success);
    EXPECT_FALSE(std::filesystem::exists(dir_ / "good.txt"));
    EXPECT_EQ(ReadText(dir_ / "other.txt"), "more payload");
    EXPECT_FALSE(HasPartFiles(dir_.path()));
}

TEST_F(BatchTest, WrongPasswordWritesNothing) {
    WriteFile(dir_ / "a.txt", "secret");
    BatchOrchestrator orchestrator(filesystem_);
    orchestrator.Encrypt(Files({"a.txt"}), kPassword, FastOptions());
    std::filesystem::remove(dir_ / "a.txt");

    BatchResult result = orchestrator.Decrypt(Files({"a.txt.encrypted"}), "not it", FastOptions());
    EXPECT_EQ(result.failed, 1u);
    EXPECT_EQ(result.results[0].error_code, ErrorCode::DecryptionFailed);
    EXPECT_FALSE(std::filesystem::exists(dir_ / "a.txt"));
    EXPECT_EQ(CountEntries(dir_.path()), 1u);
}

TEST_F(BatchTest, ConcurrencyIsBounded) {
    std::vector<std::filesystem::path> inputs;
    for (int i = 0; i < 6; ++i) {
        auto path = dir_ / ("f" + std::to_string(i));
        WriteFile(path, "x");
        inputs.push_back(path);
    }
    CountingFilesystem counting;
    BatchOrchestrator orchestrator(counting);
    BatchResult result = orchestrator.Encrypt(inputs, kPassword, FastOptions());
    EXPECT_EQ(result.successful, 6u);
    EXPECT_GE(counting.max_in_flight.load(), 1);
    EXPECT_LE(counting.max_in_flight.load(), 2);
}

TEST_F(BatchTest, SkipStrategyKeepsExistingOutput) {
    WriteFile(dir_ / "a.txt", "new");
    WriteFile(dir_ / "a.txt.encrypted", "existing");
    BatchOrchestrator orchestrator(filesystem_);
    BatchResult result = orchestrator.Encrypt(Files({"a.txt"}), kPassword, FastOptions());
    EXPECT_EQ(result.skipped, 1u);
    EXPECT_EQ(result.successful, 1u);
    EXPECT_TRUE(result.results[0].skipped);
    EXPECT_EQ(result.results[0].conflict_action, conflict::Action::Skip);
    EXPECT_EQ(ReadText(dir_ / "a.txt.encrypted"), "existing");
}

TEST_F(BatchTest, RenameStrategyWritesBesideExisting) {
    WriteFile(dir_ / "a.txt", "new");
    WriteFile(dir_ / "a.txt.encrypted", "existing");
    BatchOptions options = FastOptions();
    options.conflict.strategy = conflict::Strategy::Rename;
    BatchOrchestrator orchestrator(filesystem_);
    BatchResult result = orchestrator.Encrypt(Files({"a.txt"}), kPassword, options);
    EXPECT_EQ(result.successful, 1u);
    EXPECT_EQ(result.results[0].output_path, dir_ / "a.txt_1.encrypted");
    EXPECT_EQ(ReadText(dir_ / "a.txt.encrypted"), "existing");
    EXPECT_TRUE(std::filesystem::exists(dir_ / "a.txt_1.encrypted"));
}

TEST_F(BatchTest, BackupStrategyPreservesPreviousOutput) {
    WriteFile(dir_ / "a.txt", "new");
    WriteFile(dir_ / "a.txt.encrypted", "existing");
    BatchOptions options = FastOptions();
    options.conflict.strategy = conflict::Strategy::Backup;
    BatchOrchestrator orchestrator(filesystem_);
    BatchResult result = orchestrator.Encrypt(Files({"a.txt"}), kPassword, options);
    EXPECT_EQ(result.successful, 1u);
    ASSERT_TRUE(result.results[0].backup_path.has_value());
    EXPECT_EQ(ReadText(*result.results[0].backup_path), "existing");
    EXPECT_NE(ReadText(dir_ / "a.txt.encrypted"), "existing");
}

TEST_F(BatchTest, FailedTaskRestoresBackup) {
    WriteFile(dir_ / "a.txt.encrypted", "not a container at all, just text");
    WriteFile(dir_ / "a.txt", "previous plaintext");
    BatchOptions options = FastOptions();
    options.conflict.strategy = conflict::Strategy::Backup;
    BatchOrchestrator orchestrator(filesystem_);
    BatchResult result = orchestrator.Decrypt(Files({"a.txt.encrypted"}), kPassword, options);
    EXPECT_EQ(result.failed, 1u);
    EXPECT_EQ(ReadText(dir_ / "a.txt"), "previous plaintext");
    EXPECT_FALSE(std::filesystem::exists(dir_ / "a.txt.bak"));
    EXPECT_FALSE(HasPartFiles(dir_.path()));
}

TEST_F(BatchTest, SourceBackupKeepsOriginalBytes) {
    WriteFile(dir_ / "a.txt", "keep me");
    WriteFile(dir_ / "b.txt", "no copy");
    BatchOptions options = FastOptions();
    options.backup_sources = true;
    BatchOrchestrator orchestrator(filesystem_);

    BatchResult result = orchestrator.Encrypt(Files({"a.txt"}), kPassword, options);
    ASSERT_EQ(result.successful, 1u);
    ASSERT_TRUE(result.results[0].source_backup_path.has_value());
    EXPECT_EQ(*result.results[0].source_backup_path, dir_ / "a.txt.backup");
    EXPECT_EQ(ReadText(dir_ / "a.txt.backup"), "keep me");
    EXPECT_EQ(ReadText(dir_ / "a.txt"), "keep me");

    options.backup_sources = false;
    BatchResult plain = orchestrator.Encrypt(Files({"b.txt"}), kPassword, options);
    ASSERT_EQ(plain.successful, 1u);
    EXPECT_FALSE(plain.results[0].source_backup_path.has_value());
    EXPECT_FALSE(std::filesystem::exists(dir_ / "b.txt.backup"));
}

TEST_F(BatchTest, SourceBackupSkippedWithOutput) {
    WriteFile(dir_ / "a.txt", "plain");
    WriteFile(dir_ / "a.txt.encrypted", "existing");
    BatchOptions options = FastOptions();
    options.backup_sources = true;
    BatchOrchestrator orchestrator(filesystem_);
    BatchResult result = orchestrator.Encrypt(Files({"a.txt"}), kPassword, options);
    EXPECT_EQ(result.skipped, 1u);
    EXPECT_FALSE(std::filesystem::exists(dir_ / "a.txt.backup"));
}

TEST_F(BatchTest, CancelledBeforeStart) {
    WriteFile(dir_ / "a.txt", "one");
    WriteFile(dir_ / "b.txt", "two");
    BatchOptions options = FastOptions();
    options.cancel = std::make_shared<CancelToken>();
    options.cancel->Cancel();
    BatchOrchestrator orchestrator(filesystem_);
    BatchResult result = orchestrator.Encrypt(Files({"a.txt", "b.txt"}), kPassword, options);
    EXPECT_TRUE(result.cancelled);
    EXPECT_EQ(result.failed, 2u);
    for (const auto& task : result.results) {
        EXPECT_EQ(task.error_code, ErrorCode::Cancelled);
    }
    EXPECT_EQ(CountEntries(dir_.path()), 2u);
}

TEST_F(BatchTest, CancelledMidStream) {
    for (const char* name : {"a.bin", "b.bin", "c.bin"}) {
        WriteFile(dir_ / name, PatternBytes(64 * 1024, 5));
    }
    RecordingSink sink;
    BatchOptions options = FastOptions();
    options.concurrency = 1;
    options.force_stream = true;
    options.chunk_size = constants::kMinChunkSize;
    options.cancel = std::make_shared<CancelToken>();
    sink.cancel_on_progress = options.cancel;
    BatchOrchestrator orchestrator(filesystem_, &sink);
    BatchResult result = orchestrator.Encrypt(Files({"a.bin", "b.bin", "c.bin"}), kPassword, options);
    EXPECT_TRUE(result.cancelled);
    EXPECT_EQ(result.successful, 0u);
    EXPECT_EQ(result.failed, 3u);
    EXPECT_EQ(sink.progress_calls, 1u);
    EXPECT_EQ(CountEntries(dir_.path()), 3u);
}

TEST_F(BatchTest, ReportsEveryCompletion) {
    WriteFile(dir_ / "a.txt", "1");
    WriteFile(dir_ / "b.txt", "22");
    WriteFile(dir_ / "c.txt", "333");
    RecordingSink sink;
    BatchOrchestrator orchestrator(filesystem_, &sink);
    orchestrator.Encrypt(Files({"a.txt", "b.txt", "c.txt"}), kPassword, FastOptions());
    std::vector<std::size_t> completions = sink.completions;
    std::sort(completions.begin(), completions.end());
    EXPECT_EQ(completions, (std::vector<std::size_t>{1, 2, 3}));
    EXPECT_EQ(sink.last_total, 3u);
    EXPECT_EQ(sink.progress_calls, 3u);
}

TEST_F(BatchTest, ThrowingSinkDoesNotFailFiles) {
    class ThrowingSink : public ProgressSink {
    public:
        void OnProgress(const std::filesystem::path&, std::uint64_t, std::uint64_t) override {
            throw std::runtime_error("sink failure");
        }
        void OnFileComplete(const FileTaskResult&, std::size_t, std::size_t) override {
            throw std::runtime_error("sink failure");
        }
    };
    WriteFile(dir_ / "a.txt", "hello");
    WriteFile(dir_ / "b.bin", PatternBytes(40000, 8));
    BatchOptions options = FastOptions();
    options.stream_threshold = 20000;
    options.chunk_size = constants::kMinChunkSize;
    ThrowingSink sink;
    BatchOrchestrator orchestrator(filesystem_, &sink);
    BatchResult result = orchestrator.Encrypt(Files({"a.txt", "b.bin"}), kPassword, options);
    EXPECT_EQ(result.successful, 2u);
    EXPECT_EQ(result.failed, 0u);
    EXPECT_TRUE(result.results[1].streamed);
    EXPECT_TRUE(std::filesystem::exists(dir_ / "b.bin.encrypted"));
}

TEST_F(BatchTest, RejectsInvalidRequests) {
    WriteFile(dir_ / "a.txt", "x");
    BatchOrchestrator orchestrator(filesystem_);
    EXPECT_THROW(orchestrator.Encrypt({}, kPassword, FastOptions()), Error);
    EXPECT_THROW(orchestrator.Encrypt(Files({"a.txt"}), "", FastOptions()), Error);

    BatchOptions zero = FastOptions();
    zero.concurrency = 0;
    EXPECT_THROW(orchestrator.Encrypt(Files({"a.txt"}), kPassword, zero), Error);

    BatchOptions bad_chunk = FastOptions();
    bad_chunk.chunk_size = 10;
    EXPECT_THROW(ValidateOptions(bad_chunk), Error);

    BatchOptions bad_threshold = FastOptions();
    bad_threshold.max_in_memory_size = 1024;
    EXPECT_THROW(ValidateOptions(bad_threshold), Error);

    BatchOptions zero_threshold = FastOptions();
    zero_threshold.stream_threshold = 0;
    EXPECT_THROW(ValidateOptions(zero_threshold), Error);
    EXPECT_THROW(orchestrator.Encrypt(Files({"a.txt"}), kPassword, zero_threshold), Error);
    EXPECT_EQ(CountEntries(dir_.path()), 1u);
}

TEST_F(BatchTest, RejectsOutputOverInput) {
    WriteFile(dir_ / "a.txt", "x");
    BatchOrchestrator orchestrator(filesystem_);
    BatchResult result = orchestrator.Run(Operation::Encrypt, {FileJob{dir_ / "a.txt", dir_ / "a.txt"}}, kPassword,
                                          FastOptions());
    EXPECT_EQ(result.failed, 1u);
    EXPECT_EQ(ReadText(dir_ / "a.txt"), "x");
}

TEST_F(BatchTest, PreviewMatchesActualSizes) {
    WriteFile(dir_ / "a.txt", "hello preview");
    WriteFile(dir_ / "b.bin", PatternBytes(40000, 3));
    BatchOptions options = FastOptions();
    options.stream_threshold = 20000;
    options.chunk_size = constants::kMinChunkSize;
    BatchOrchestrator orchestrator(filesystem_);

    auto preview = orchestrator.Preview(Files({"a.txt", "b.bin", "nope"}), Operation::Encrypt, options);
    ASSERT_EQ(preview.size(), 3u);
    EXPECT_EQ(CountEntries(dir_.path()), 2u);
    EXPECT_FALSE(preview[0].streamed);
    EXPECT_TRUE(preview[1].streamed);
    EXPECT_FALSE(preview[2].accessible);
    EXPECT_FALSE(preview[2].warnings.empty());

    BatchResult encrypted = orchestrator.Encrypt(Files({"a.txt", "b.bin"}), kPassword, options);
    EXPECT_EQ(preview[0].estimated_output_size, encrypted.results[0].result_size);
    EXPECT_EQ(preview[1].estimated_output_size, encrypted.results[1].result_size);

    auto reverse = orchestrator.Preview(Files({"a.txt.encrypted", "b.bin.encrypted", "a.txt"}), Operation::Decrypt,
                                        options);
    EXPECT_TRUE(reverse[0].looks_encrypted);
    EXPECT_EQ(reverse[0].estimated_output_size, 13u);
    EXPECT_TRUE(reverse[0].output_exists);
    EXPECT_TRUE(reverse[1].streamed);
    EXPECT_EQ(reverse[1].estimated_output_size, 40000u);
    EXPECT_FALSE(reverse[2].looks_encrypted);
    EXPECT_FALSE(reverse[2].warnings.empty());
}

TEST_F(BatchTest, PreviewReportsSourceBackupAndSuffix) {
    WriteFile(dir_ / "a.txt", "hello");
    WriteFile(dir_ / "a.txt.backup", "stale");
    WriteFile(dir_ / "b.txt.encrypted", "plain text with the wrong name");
    BatchOptions options = FastOptions();
    options.backup_sources = true;
    BatchOrchestrator orchestrator(filesystem_);

    auto preview = orchestrator.Preview(Files({"a.txt", "b.txt.encrypted"}), Operation::Encrypt, options);
    ASSERT_EQ(preview.size(), 2u);
    ASSERT_TRUE(preview[0].source_backup_path.has_value());
    EXPECT_EQ(*preview[0].source_backup_path, dir_ / "a.txt.backup");
    EXPECT_EQ(preview[0].warnings.size(), 1u);
    EXPECT_FALSE(preview[1].looks_encrypted);
    bool suffix_warned = std::any_of(preview[1].warnings.begin(), preview[1].warnings.end(),
                                     [](const std::string& w) { return w.find(".encrypted") != std::string::npos; });
    EXPECT_TRUE(suffix_warned);
    EXPECT_EQ(ReadText(dir_ / "a.txt.backup"), "stale");
    EXPECT_EQ(CountEntries(dir_.path()), 3u);

    options.backup_sources = false;
    auto without = orchestrator.Preview(Files({"a.txt"}), Operation::Encrypt, options);
    EXPECT_FALSE(without[0].source_backup_path.has_value());
}

TEST_F(BatchTest, DecryptModeFollowsHeader) {
    WriteFile(dir_ / "small.txt", "tiny but streamed");
    BatchOptions options = FastOptions();
    options.force_stream = true;
    BatchOrchestrator orchestrator(filesystem_);
    orchestrator.Encrypt(Files({"small.txt"}), kPassword, options);

    BatchOptions decrypt_options = FastOptions();
    decrypt_options.output_dir = dir_ / "nested" / "out";
    BatchResult result = orchestrator.Decrypt(Files({"small.txt.encrypted"}), kPassword, decrypt_options);
    EXPECT_EQ(result.successful, 1u);
    EXPECT_TRUE(result.results[0].streamed);
    EXPECT_EQ(ReadText(dir_ / "nested" / "out" / "small.txt"), "tiny but streamed");
}

TEST_F(BatchTest, SameDestinationIsNotClobberedWithinBatch) {
    WriteFile(dir_ / "a.txt", "first");
    WriteFile(dir_ / "b.txt", "second");
    BatchOptions options = FastOptions();
    options.conflict.strategy = conflict::Strategy::Rename;
    BatchOrchestrator orchestrator(filesystem_);
    auto shared = dir_ / "shared.encrypted";
    BatchResult result = orchestrator.Run(
        Operation::Encrypt, {FileJob{dir_ / "a.txt", shared}, FileJob{dir_ / "b.txt", shared}}, kPassword, options);
    EXPECT_EQ(result.successful, 2u);
    EXPECT_NE(result.results[0].output_path, result.results[1].output_path);
    EXPECT_TRUE(std::filesystem::exists(shared));
    EXPECT_TRUE(std::filesystem::exists(dir_ / "shared_1.encrypted"));
}

}  // namespace
}  // namespace filevault::batch
