#pragma once

#include <cstdint>
#include <string>
#include <utility>

#include "filevault/crypto.hpp"

namespace filevault::kdf {

// 32-byte PBKDF2-HMAC-SHA-256 key. Move-only; scrubbed on destruction.
class DerivedKey {
public:
    explicit DerivedKey(crypto::Bytes bytes) noexcept : bytes_(std::move(bytes)) {}
    ~DerivedKey();

    DerivedKey(const DerivedKey&) = delete;
    DerivedKey& operator=(const DerivedKey&) = delete;
    DerivedKey(DerivedKey&& other) noexcept;
    DerivedKey& operator=(DerivedKey&& other) noexcept;

    const crypto::Bytes& bytes() const noexcept { return bytes_; }

private:
    crypto::Bytes bytes_;
};

DerivedKey Derive(const std::string& password, const crypto::Bytes& salt, std::uint32_t iterations);

// Applies the safety floor, the ceiling and the thousand-step rounding
// required by the container header. 0 selects FILEVAULT_KDF_ITERS when set,
// otherwise the default.
std::uint32_t ResolveIterations(std::uint32_t requested = 0);

std::uint16_t EncodeIterations(std::uint32_t iterations);
std::uint32_t DecodeIterations(std::uint16_t encoded) noexcept;

}  // namespace filevault::kdf
