#include "filevault/batch.hpp"
#include "filevault/cli_colors.hpp"
#include "filevault/conflict_resolver.hpp"
#include "filevault/constants.hpp"
#include "filevault/container.hpp"
#include "filevault/crypto.hpp"
#include "filevault/env.hpp"
#include "filevault/filesystem.hpp"
#include "filevault/log.hpp"
#include "filevault/password_source.hpp"

#include <csignal>
#include <cstdio>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <memory>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include <unistd.h>

namespace {

filevault::CancelToken* g_cancel_token = nullptr;

void HandleInterrupt(int) {
    if (g_cancel_token != nullptr) {
        g_cancel_token->Cancel();
    }
}

class UsageError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

void PrintUsage() {
    std::cout << "Usage:\n";
    std::cout << "  filevault encrypt (--files <f...> | --directory <dir>) [options]\n";
    std::cout << "  filevault decrypt (--files <f...> | --directory <dir>) [options]\n";
    std::cout << "  filevault inspect <file>\n";
    std::cout << "  filevault strategies\n";
    std::cout << "\nPassword (prompted when omitted):\n";
    std::cout << "  -p, --password <pw> | --password-file <path> | --password-env <VAR>\n";
    std::cout << "\nOptions:\n";
    std::cout << "  -o, --output <dir>          write results into <dir>\n";
    std::cout << "  --filter <suffix>           with --directory, only files ending in <suffix>\n";
    std::cout << "  --parallel <n>              files in flight (default " << filevault::constants::DefaultConcurrency()
              << ")\n";
    std::cout << "  --stream                    force chunked streaming\n";
    std::cout << "  --backup, --no-backup       encrypt: copy each input to <input>.backup first (default off)\n";
    std::cout << "  --chunk-size <bytes>        streaming chunk size (16K..16M, default 64K)\n";
    std::cout << "  --stream-threshold <bytes>  stream files larger than this (default 10M)\n";
    std::cout << "  --conflict <strategy>       see `filevault strategies` (default skip)\n";
    std::cout << "  --kdf-iters <n>             PBKDF2 iterations (default "
              << filevault::constants::kDefaultKdfIterations << ")\n";
    std::cout << "  --dry-run                   show what would happen\n";
    std::cout << "  --no-color                  disable ANSI colors\n";
    std::cout << "  -v, --verbose               debug logging\n";
}

struct BatchArgs {
    std::vector<std::string> files;
    std::string directory;
    std::string filter;
    std::optional<std::string> password;
    std::string password_file;
    std::string password_env;
    std::string output;
    std::size_t parallel = filevault::constants::DefaultConcurrency();
    bool stream = false;
    bool backup = false;
    std::size_t chunk_size = filevault::constants::kDefaultChunkSize;
    std::uint64_t stream_threshold = filevault::constants::kDefaultStreamThreshold;
    filevault::conflict::Strategy conflict = filevault::conflict::Strategy::Skip;
    std::uint32_t kdf_iters = 0;
    bool dry_run = false;
    bool no_color = false;
    bool verbose = false;
};

std::uint64_t ParseSize(const std::string& flag, const std::string& raw) {
    try {
        return filevault::env::ParseByteSize(raw);
    } catch (const filevault::Error& err) {
        throw UsageError(std::string(err.what()) + " (" + flag + ")");
    }
}

BatchArgs ParseBatchArgs(int argc, char** argv, int start_index) {
    BatchArgs opts;
    int idx = start_index;
    auto value = [&](const std::string& flag) -> std::string {
        if (idx + 1 >= argc) {
            throw UsageError("Missing value for " + flag);
        }
        std::string out(argv[idx + 1]);
        idx += 2;
        return out;
    };
    while (idx < argc) {
        std::string flag(argv[idx]);
        if (flag == "--files" || flag == "-f") {
            idx += 1;
            while (idx < argc && argv[idx][0] != '-') {
                opts.files.emplace_back(argv[idx]);
                idx += 1;
            }
        } else if (flag == "--directory" || flag == "-d") {
            opts.directory = value(flag);
        } else if (flag == "--filter") {
            opts.filter = value(flag);
        } else if (flag == "-p" || flag == "--password") {
            opts.password = value(flag);
        } else if (flag == "--password-file") {
            opts.password_file = value(flag);
        } else if (flag == "--password-env") {
            opts.password_env = value(flag);
        } else if (flag == "-o" || flag == "--output") {
            opts.output = value(flag);
        } else if (flag == "--parallel") {
            opts.parallel = static_cast<std::size_t>(ParseSize(flag, value(flag)));
        } else if (flag == "--stream") {
            opts.stream = true;
            idx += 1;
        } else if (flag == "--backup") {
            opts.backup = true;
            idx += 1;
        } else if (flag == "--no-backup") {
            opts.backup = false;
            idx += 1;
        } else if (flag == "--chunk-size") {
            opts.chunk_size = static_cast<std::size_t>(ParseSize(flag, value(flag)));
        } else if (flag == "--stream-threshold") {
            opts.stream_threshold = ParseSize(flag, value(flag));
        } else if (flag == "--conflict") {
            std::string raw = value(flag);
            auto parsed = filevault::conflict::ParseStrategy(raw);
            if (!parsed) {
                throw UsageError("Unknown conflict strategy: " + raw);
            }
            opts.conflict = *parsed;
        } else if (flag == "--kdf-iters") {
            std::uint64_t iters = ParseSize(flag, value(flag));
            if (iters > filevault::constants::kMaxKdfIterations) {
                throw UsageError("--kdf-iters is too large");
            }
            opts.kdf_iters = static_cast<std::uint32_t>(iters);
        } else if (flag == "--dry-run") {
            opts.dry_run = true;
            idx += 1;
        } else if (flag == "--no-color") {
            opts.no_color = true;
            idx += 1;
        } else if (flag == "-v" || flag == "--verbose") {
            opts.verbose = true;
            idx += 1;
        } else {
            throw UsageError("Unknown flag: " + flag);
        }
    }
    if (opts.files.empty() && opts.directory.empty()) {
        throw UsageError("Use --files or --directory to select input files");
    }
    if (!opts.files.empty() && !opts.directory.empty()) {
        throw UsageError("--files and --directory are mutually exclusive");
    }
    int password_flags = (opts.password ? 1 : 0) + (opts.password_file.empty() ? 0 : 1)
        + (opts.password_env.empty() ? 0 : 1);
    if (password_flags > 1) {
        throw UsageError("Give at most one of --password, --password-file, --password-env");
    }
    return opts;
}

std::unique_ptr<filevault::password::PasswordSource> MakePasswordSource(const BatchArgs& opts, bool confirm) {
    if (opts.password) {
        return std::make_unique<filevault::password::StaticPasswordSource>(*opts.password);
    }
    if (!opts.password_file.empty()) {
        return std::make_unique<filevault::password::FilePasswordSource>(opts.password_file);
    }
    if (!opts.password_env.empty()) {
        return std::make_unique<filevault::password::EnvPasswordSource>(opts.password_env);
    }
    return std::make_unique<filevault::password::PromptPasswordSource>(std::cin, std::cerr, confirm);
}

std::string HumanSize(std::uint64_t bytes) {
    static const char* kUnits[] = {"B", "KiB", "MiB", "GiB", "TiB"};
    double value = static_cast<double>(bytes);
    std::size_t unit = 0;
    while (value >= 1024.0 && unit + 1 < sizeof(kUnits) / sizeof(kUnits[0])) {
        value /= 1024.0;
        unit += 1;
    }
    std::ostringstream out;
    if (unit == 0) {
        out << bytes << " B";
    } else {
        out << std::fixed << std::setprecision(1) << value << " " << kUnits[unit];
    }
    return out.str();
}

class ConsoleProgress : public filevault::batch::ProgressSink {
public:
    ConsoleProgress() : interactive_(isatty(fileno(stderr)) != 0) {}

    void OnProgress(const std::filesystem::path& file, std::uint64_t bytes_done, std::uint64_t bytes_total) override {
        if (!interactive_ || bytes_total == 0) {
            return;
        }
        int percent = static_cast<int>((bytes_done * 100) / bytes_total);
        if (percent > 100) {
            percent = 100;
        }
        std::cerr << "\r  " << file.filename().string() << " " << percent << "%" << std::flush;
        dirty_ = true;
    }

    void OnFileComplete(const filevault::batch::FileTaskResult& result, std::size_t completed, std::size_t total) override {
        if (dirty_) {
            std::cerr << "\r\033[K";
            dirty_ = false;
        }
        std::string counter = "[" + std::to_string(completed) + "/" + std::to_string(total) + "] ";
        std::string line;
        if (!result.success) {
            line = filevault::cli::Red("FAIL ") + result.input_path.string() + ": " + result.error_message;
        } else if (result.skipped) {
            line = filevault::cli::Yellow("SKIP ") + result.input_path.string() + " (" + result.conflict_reason + ")";
        } else {
            line = filevault::cli::Green("OK   ") + result.input_path.string() + " -> " + result.output_path.string();
            if (result.streamed) {
                line += filevault::cli::Gray(" [streamed]");
            }
            if (result.backup_path) {
                line += filevault::cli::Gray(" [backup: " + result.backup_path->string() + "]");
            }
            if (result.source_backup_path) {
                line += filevault::cli::Gray(" [source backup: " + result.source_backup_path->string() + "]");
            }
        }
        std::cerr << counter << line << "\n";
    }

private:
    bool interactive_ = false;
    bool dirty_ = false;
};

void PrintPreview(const std::vector<filevault::batch::PreviewEntry>& entries) {
    std::cout << filevault::cli::Colorize("Dry run, nothing will be written", filevault::cli::color::CYAN, std::cout) << "\n";
    for (const auto& entry : entries) {
        std::cout << "  " << entry.input_path.string() << " -> " << entry.output_path.string() << "\n";
        if (entry.accessible) {
            std::cout << "    size " << HumanSize(entry.size) << ", output ~" << HumanSize(entry.estimated_output_size)
                      << (entry.streamed ? ", streamed" : "") << (entry.would_backup ? ", backup" : "") << "\n";
        }
        if (entry.source_backup_path) {
            std::cout << "    source backup " << entry.source_backup_path->string() << "\n";
        }
        for (const auto& warning : entry.warnings) {
            std::cout << "    " << filevault::cli::Colorize("! ", filevault::cli::color::YELLOW, std::cout) << warning << "\n";
        }
    }
}

void PrintSummary(const filevault::batch::BatchResult& result, filevault::batch::Operation operation) {
    std::cout << "\n" << (operation == filevault::batch::Operation::Encrypt ? "Encrypted" : "Decrypted") << ": "
              << (result.successful - result.skipped) << "/" << result.total;
    if (result.skipped > 0) {
        std::cout << ", skipped " << result.skipped;
    }
    if (result.failed > 0) {
        std::cout << ", " << filevault::cli::Colorize("failed " + std::to_string(result.failed),
                                                       filevault::cli::color::BOLD_RED, std::cout);
    }
    if (result.streamed_count > 0) {
        std::cout << ", streamed " << result.streamed_count;
    }
    std::cout << "\n";
    std::cout << "Input " << HumanSize(result.total_original_size) << ", output "
              << HumanSize(result.total_result_size) << ", " << result.processing_time_ms << " ms\n";
    if (result.cancelled) {
        std::cout << filevault::cli::Colorize("Cancelled", filevault::cli::color::BOLD_YELLOW, std::cout) << "\n";
    }
}

int RunBatch(filevault::batch::Operation operation, int argc, char** argv) {
    BatchArgs opts = ParseBatchArgs(argc, argv, 2);
    if (opts.no_color) {
        filevault::cli::SetColorsEnabled(false);
    }
    if (opts.verbose) {
        filevault::log::SetLevel(filevault::log::Level::Debug);
    } else if (filevault::log::GetLevel() > filevault::log::Level::Info) {
        filevault::log::SetLevel(filevault::log::Level::Info);
    }

    filevault::fs::LocalFilesystem filesystem;
    std::vector<std::filesystem::path> inputs;
    if (!opts.directory.empty()) {
        std::string suffix = opts.filter;
        if (suffix.empty() && operation == filevault::batch::Operation::Decrypt) {
            suffix = std::string(filevault::constants::kEncryptedSuffix);
        }
        inputs = filesystem.ListFiles(opts.directory, suffix);
        filevault::log::Info("Found " + std::to_string(inputs.size()) + " file(s) in " + opts.directory);
    } else {
        inputs.assign(opts.files.begin(), opts.files.end());
    }
    if (inputs.empty()) {
        std::cout << filevault::cli::Colorize("No files to process", filevault::cli::color::YELLOW, std::cout) << "\n";
        return 0;
    }

    filevault::batch::BatchOptions options;
    if (!opts.output.empty()) {
        options.output_dir = std::filesystem::path(opts.output);
    }
    options.concurrency = opts.parallel;
    options.force_stream = opts.stream;
    options.backup_sources = opts.backup && operation == filevault::batch::Operation::Encrypt;
    options.chunk_size = opts.chunk_size;
    options.stream_threshold = opts.stream_threshold;
    options.conflict.strategy = opts.conflict;
    options.kdf_iterations = opts.kdf_iters;
    options.cancel = std::make_shared<filevault::CancelToken>();
    try {
        filevault::batch::ValidateOptions(options);
    } catch (const filevault::Error& err) {
        throw UsageError(err.what());
    }

    ConsoleProgress progress;
    filevault::batch::BatchOrchestrator orchestrator(filesystem, &progress);
    if (opts.dry_run) {
        PrintPreview(orchestrator.Preview(inputs, operation, options));
        return 0;
    }

    auto source = MakePasswordSource(opts, operation == filevault::batch::Operation::Encrypt);
    std::string password = source->Get(inputs.size() == 1 ? inputs.front().string() : "filevault");

    g_cancel_token = options.cancel.get();
    std::signal(SIGINT, HandleInterrupt);
    filevault::batch::BatchResult result = operation == filevault::batch::Operation::Encrypt
        ? orchestrator.Encrypt(inputs, password, options)
        : orchestrator.Decrypt(inputs, password, options);
    std::signal(SIGINT, SIG_DFL);
    g_cancel_token = nullptr;
    filevault::crypto::SecureWipe(password);

    PrintSummary(result, operation);
    return result.failed == 0 ? 0 : 1;
}

int Inspect(const std::string& path) {
    filevault::fs::LocalFilesystem filesystem;
    auto stat = filesystem.Stat(path);
    if (!stat || !stat->is_regular) {
        throw std::runtime_error("Not a readable file: " + path);
    }
    auto input = filesystem.OpenRead(path);
    filevault::crypto::Bytes raw;
    filevault::container::Header header = filevault::container::ReadHeader(*input, raw);
    bool streaming = header.mode == filevault::container::Mode::Streaming;
    std::cout << "format_version: " << static_cast<int>(header.version) << "\n";
    std::cout << "mode: " << (streaming ? "streaming" : "whole-file") << "\n";
    std::cout << "kdf: PBKDF2-HMAC-SHA256, " << header.iterations << " iterations\n";
    std::cout << "salt: " << filevault::crypto::HexEncode(header.salt) << "\n";
    if (streaming) {
        std::cout << "chunk_size: " << header.chunk_size << " bytes\n";
    }
    std::cout << "container_size: " << stat->size << " bytes\n";
    auto plaintext = filevault::container::EstimatePlaintextSize(header, stat->size);
    if (plaintext) {
        std::cout << "plaintext_size: " << *plaintext << " bytes\n";
    } else {
        std::cout << "plaintext_size: <truncated container>\n";
    }
    return 0;
}

int ListStrategies() {
    for (const auto& info : filevault::conflict::AvailableStrategies()) {
        std::cout << "  " << std::left << std::setw(16) << info.name << info.description << "\n";
    }
    return 0;
}

}  // namespace

int main(int argc, char** argv) {
    if (argc < 2) {
        PrintUsage();
        return 2;
    }
    std::string command(argv[1]);
    try {
        if (command == "encrypt") {
            return RunBatch(filevault::batch::Operation::Encrypt, argc, argv);
        }
        if (command == "decrypt") {
            return RunBatch(filevault::batch::Operation::Decrypt, argc, argv);
        }
        if (command == "inspect") {
            if (argc != 3) {
                PrintUsage();
                return 2;
            }
            return Inspect(argv[2]);
        }
        if (command == "strategies") {
            return ListStrategies();
        }
        if (command == "-h" || command == "--help" || command == "help") {
            PrintUsage();
            return 0;
        }
        PrintUsage();
        return 2;
    } catch (const UsageError& exc) {
        std::cerr << "Error: " << exc.what() << "\n";
        PrintUsage();
        return 2;
    } catch (const std::exception& exc) {
        std::cerr << "Error: " << exc.what() << "\n";
        return 1;
    }
}
