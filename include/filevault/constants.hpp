#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>

#include "filevault/env.hpp"

namespace filevault::constants {

inline constexpr std::size_t kKeyLen = 32;
inline constexpr std::size_t kSaltLen = 16;
inline constexpr std::size_t kNonceLen = 12;
inline constexpr std::size_t kNoncePrefixLen = 4;
inline constexpr std::size_t kTagLen = 16;

// Iterations travel in the header as a 16-bit count of thousands.
inline constexpr std::uint32_t kKdfIterationUnit = 1000;
inline constexpr std::uint32_t kDefaultKdfIterations = 210000;
inline constexpr std::uint32_t kMinKdfIterations = 100000;
// The header field could carry 65 535 000; readers refuse anything above
// this ceiling before running PBKDF2 on an unauthenticated count.
inline constexpr std::uint32_t kMaxKdfIterations = 5000000;

inline constexpr std::string_view kMagic = "FVLT";
inline constexpr std::uint8_t kFormatVersion = 1;
inline constexpr std::uint8_t kModeWholeFile = 0;
inline constexpr std::uint8_t kModeStreaming = 1;
inline constexpr std::size_t kBaseHeaderLen = 4 + 1 + 1 + 2 + kSaltLen;
inline constexpr std::size_t kStreamHeaderLen = kBaseHeaderLen + 4;
inline constexpr std::size_t kRecordOverhead = kNonceLen + 4 + kTagLen;

inline constexpr std::size_t kDefaultChunkSize = 64u * 1024u;
inline constexpr std::size_t kMinChunkSize = 16u * 1024u;
inline constexpr std::size_t kMaxChunkSize = 16u * 1024u * 1024u;
inline constexpr std::uint64_t kDefaultStreamThreshold = 10ull * 1024ull * 1024ull;
inline constexpr std::uint64_t kDefaultMaxInMemorySize = 512ull * 1024ull * 1024ull;

inline constexpr std::size_t kDefaultConcurrency = 4;
inline constexpr std::size_t kMaxConcurrency = 256;

inline constexpr std::string_view kEncryptedSuffix = ".encrypted";
inline constexpr std::string_view kDecryptedSuffix = ".decrypted";
inline constexpr std::string_view kSourceBackupSuffix = ".backup";
inline constexpr std::string_view kRenameSuffix = "_$n";
inline constexpr std::string_view kBackupSuffix = ".bak";
inline constexpr std::size_t kMaxRenameAttempts = 100;

inline constexpr std::string_view kEnvKdfIters = "FILEVAULT_KDF_ITERS";
inline constexpr std::string_view kEnvLogLevel = "FILEVAULT_LOG_LEVEL";
inline constexpr std::string_view kEnvNoColor = "FILEVAULT_NO_COLOR";
inline constexpr std::string_view kEnvParallel = "FILEVAULT_PARALLEL";

inline std::size_t DefaultConcurrency() {
    auto parsed = filevault::env::GetUnsigned(kEnvParallel);
    if (!parsed || *parsed == 0) {
        return kDefaultConcurrency;
    }
    if (*parsed > kMaxConcurrency) {
        return kMaxConcurrency;
    }
    return static_cast<std::size_t>(*parsed);
}

}  // namespace filevault::constants
