#pragma once

#include <cstdint>
#include <istream>
#include <ostream>
#include <string>

#include "filevault/constants.hpp"
#include "filevault/container.hpp"
#include "filevault/crypto.hpp"

namespace filevault::codec {

using Bytes = crypto::Bytes;

struct CodecOptions {
    std::uint32_t iterations = 0;  // 0 -> kdf::ResolveIterations()
    std::uint64_t max_in_memory_size = constants::kDefaultMaxInMemorySize;
};

struct SealedBuffer {
    Bytes salt;
    Bytes nonce;
    Bytes ciphertext;
    Bytes tag;
    std::uint32_t iterations = 0;
};

SealedBuffer Encrypt(const Bytes& plaintext, const std::string& password, const CodecOptions& options = {});
Bytes Decrypt(const SealedBuffer& sealed, const std::string& password);
Bytes Decrypt(const Bytes& ciphertext,
              const std::string& password,
              const Bytes& salt,
              const Bytes& nonce,
              const Bytes& tag,
              std::uint32_t iterations);

// Whole-file container: header || nonce || length || ciphertext || tag, with
// the header bound in as associated data.
Bytes EncryptBuffer(const Bytes& plaintext, const std::string& password, const CodecOptions& options = {});
Bytes DecryptBuffer(const Bytes& blob, const std::string& password, const CodecOptions& options = {});

// Return the number of bytes written to output.
std::uint64_t EncryptFile(std::istream& input,
                          std::ostream& output,
                          const std::string& password,
                          const CodecOptions& options = {});
std::uint64_t DecryptFile(std::istream& input,
                          std::ostream& output,
                          const std::string& password,
                          const CodecOptions& options = {});
std::uint64_t DecryptAfterHeader(const container::Header& header,
                                 const Bytes& raw_header,
                                 std::istream& input,
                                 std::ostream& output,
                                 const std::string& password,
                                 const CodecOptions& options = {});

}  // namespace filevault::codec
