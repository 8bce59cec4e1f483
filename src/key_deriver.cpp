#include "filevault/key_deriver.hpp"

#include "filevault/constants.hpp"
#include "filevault/env.hpp"
#include "filevault/error.hpp"

#include <algorithm>
#include <utility>

namespace filevault::kdf {

DerivedKey::~DerivedKey() {
    crypto::SecureWipe(bytes_);
}

DerivedKey::DerivedKey(DerivedKey&& other) noexcept : bytes_(std::move(other.bytes_)) {
    other.bytes_.clear();
}

DerivedKey& DerivedKey::operator=(DerivedKey&& other) noexcept {
    if (this != &other) {
        crypto::SecureWipe(bytes_);
        bytes_ = std::move(other.bytes_);
        other.bytes_.clear();
    }
    return *this;
}

DerivedKey Derive(const std::string& password, const crypto::Bytes& salt, std::uint32_t iterations) {
    if (iterations == 0) {
        throw Error(ErrorCode::InvalidInput, "KDF iteration count must be positive");
    }
    if (salt.empty()) {
        throw Error(ErrorCode::InvalidInput, "KDF salt must not be empty");
    }
    return DerivedKey(crypto::Pbkdf2HmacSha256(password, salt, iterations, constants::kKeyLen));
}

std::uint32_t ResolveIterations(std::uint32_t requested) {
    std::uint64_t value = requested;
    if (value == 0) {
        auto from_env = env::GetUnsigned(constants::kEnvKdfIters);
        value = from_env && *from_env > 0 ? *from_env : constants::kDefaultKdfIterations;
    }
    value = std::max<std::uint64_t>(value, constants::kMinKdfIterations);
    value = std::min<std::uint64_t>(value, constants::kMaxKdfIterations);
    std::uint64_t unit = constants::kKdfIterationUnit;
    value = ((value + unit - 1) / unit) * unit;
    return static_cast<std::uint32_t>(value);
}

std::uint16_t EncodeIterations(std::uint32_t iterations) {
    if (iterations == 0 || iterations % constants::kKdfIterationUnit != 0
        || iterations > constants::kMaxKdfIterations) {
        throw Error(ErrorCode::InvalidInput, "KDF iteration count is not encodable: " + std::to_string(iterations));
    }
    return static_cast<std::uint16_t>(iterations / constants::kKdfIterationUnit);
}

std::uint32_t DecodeIterations(std::uint16_t encoded) noexcept {
    return static_cast<std::uint32_t>(encoded) * constants::kKdfIterationUnit;
}

}  // namespace filevault::kdf
