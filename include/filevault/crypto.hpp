#pragma once

#include <cstddef>
#include <cstdint>
#include <istream>
#include <string>
#include <vector>

#include "filevault/crypto_utils.hpp"

namespace filevault::crypto {

using Bytes = std::vector<std::uint8_t>;

Bytes RandomBytes(std::size_t size);
Bytes Pbkdf2HmacSha256(const std::string& password, const Bytes& salt, std::size_t iterations, std::size_t length);

// Returns the ciphertext; the 16-byte tag is written to tag_out.
Bytes AesGcmEncryptWithIv(const Bytes& key,
                          const Bytes& iv,
                          const std::uint8_t* plaintext,
                          std::size_t plaintext_len,
                          const Bytes& aad,
                          std::uint8_t* tag_out);

// Throws Error(DecryptionFailed) when the tag does not verify. Nothing is
// returned on failure and the scratch plaintext is wiped.
Bytes AesGcmDecryptWithIv(const Bytes& key,
                          const Bytes& iv,
                          const std::uint8_t* ciphertext,
                          std::size_t ciphertext_len,
                          const Bytes& aad,
                          const std::uint8_t* tag);

void SecureWipe(Bytes& data) noexcept;
void SecureWipe(std::string& data) noexcept;

class Sha256 {
public:
    Sha256();

    void Update(const std::uint8_t* data, std::size_t len);
    void Update(std::istream& input);
    std::string FinalHex();

private:
    detail::UniqueMDCtx ctx_;
    bool finalized_ = false;
};

std::string HexEncode(const Bytes& data);

}  // namespace filevault::crypto
