#include "filevault/cipher_codec.hpp"

#include "filevault/error.hpp"
#include "filevault/key_deriver.hpp"

#include <iterator>
#include <utility>
#include <vector>
#include <string>

namespace filevault::codec {

namespace {

SealedBuffer SealWithSalt(const Bytes& plaintext,
                          const std::string& password,
                          Bytes salt,
                          std::uint32_t iterations,
                          const Bytes& aad) {
    SealedBuffer sealed;
    sealed.iterations = iterations;
    sealed.salt = std::move(salt);
    sealed.nonce = crypto::RandomBytes(constants::kNonceLen);
    sealed.tag.resize(constants::kTagLen);
    kdf::DerivedKey key = kdf::Derive(password, sealed.salt, iterations);
    sealed.ciphertext = crypto::AesGcmEncryptWithIv(key.bytes(), sealed.nonce, plaintext.data(), plaintext.size(),
                                                    aad, sealed.tag.data());
    return sealed;
}

Bytes Open(const SealedBuffer& sealed, const std::string& password, const Bytes& aad) {
    if (sealed.nonce.size() != constants::kNonceLen || sealed.tag.size() != constants::kTagLen) {
        throw Error(ErrorCode::DecryptionFailed, "Nonce or tag has the wrong length");
    }
    kdf::DerivedKey key = kdf::Derive(password, sealed.salt, sealed.iterations);
    return crypto::AesGcmDecryptWithIv(key.bytes(), sealed.nonce, sealed.ciphertext.data(),
                                       sealed.ciphertext.size(), aad, sealed.tag.data());
}

Bytes ReadAll(std::istream& input, std::uint64_t limit) {
    Bytes data;
    std::vector<std::uint8_t> buffer(constants::kDefaultChunkSize);
    while (input) {
        input.read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(buffer.size()));
        std::streamsize got = input.gcount();
        if (got <= 0) {
            break;
        }
        if (data.size() + static_cast<std::uint64_t>(got) > limit) {
            throw Error(ErrorCode::InvalidInput,
                        "Input exceeds the in-memory limit of " + std::to_string(limit) + " bytes; use streaming");
        }
        data.insert(data.end(), buffer.begin(), buffer.begin() + got);
    }
    if (input.bad()) {
        throw Error(ErrorCode::IoFailure, "Failed to read input");
    }
    return data;
}

void WriteAll(std::ostream& output, const Bytes& data) {
    if (!data.empty()) {
        output.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
    }
    output.flush();
    if (!output) {
        throw Error(ErrorCode::IoFailure, "Failed to write output");
    }
}

}  // namespace

SealedBuffer Encrypt(const Bytes& plaintext, const std::string& password, const CodecOptions& options) {
    std::uint32_t iterations = kdf::ResolveIterations(options.iterations);
    return SealWithSalt(plaintext, password, crypto::RandomBytes(constants::kSaltLen), iterations, {});
}

Bytes Decrypt(const SealedBuffer& sealed, const std::string& password) {
    return Open(sealed, password, {});
}

Bytes Decrypt(const Bytes& ciphertext,
              const std::string& password,
              const Bytes& salt,
              const Bytes& nonce,
              const Bytes& tag,
              std::uint32_t iterations) {
    SealedBuffer sealed{salt, nonce, ciphertext, tag, iterations};
    return Open(sealed, password, {});
}

Bytes EncryptBuffer(const Bytes& plaintext, const std::string& password, const CodecOptions& options) {
    if (plaintext.size() > options.max_in_memory_size) {
        throw Error(ErrorCode::InvalidInput, "Plaintext exceeds the in-memory limit; use streaming");
    }
    container::Header header;
    header.mode = container::Mode::WholeFile;
    header.iterations = kdf::ResolveIterations(options.iterations);
    header.salt = crypto::RandomBytes(constants::kSaltLen);
    Bytes blob = container::EncodeHeader(header);

    SealedBuffer sealed = SealWithSalt(plaintext, password, header.salt, header.iterations, blob);
    Bytes record = container::EncodeRecord(sealed.nonce, sealed.ciphertext, sealed.tag.data());
    blob.insert(blob.end(), record.begin(), record.end());
    return blob;
}

Bytes DecryptBuffer(const Bytes& blob, const std::string& password, const CodecOptions& options) {
    Bytes raw_header;
    container::Header header = container::ParseHeader(blob);
    if (header.mode != container::Mode::WholeFile) {
        throw Error(ErrorCode::DecryptionFailed, "Container is in streaming mode");
    }
    raw_header.assign(blob.begin(), blob.begin() + container::HeaderLength(header.mode));

    std::size_t offset = raw_header.size();
    if (blob.size() < offset + constants::kRecordOverhead) {
        throw Error(ErrorCode::DecryptionFailed, "Malformed container: truncated record");
    }
    std::uint32_t ct_len = container::ReadU32Be(blob.data() + offset + constants::kNonceLen);
    if (ct_len > options.max_in_memory_size) {
        throw Error(ErrorCode::DecryptionFailed, "Malformed container: record exceeds in-memory limit");
    }
    if (blob.size() != offset + constants::kRecordOverhead + ct_len) {
        throw Error(ErrorCode::DecryptionFailed, "Malformed container: record length mismatch");
    }
    SealedBuffer sealed;
    sealed.iterations = header.iterations;
    sealed.salt = header.salt;
    auto cursor = blob.begin() + static_cast<std::ptrdiff_t>(offset);
    sealed.nonce.assign(cursor, cursor + constants::kNonceLen);
    cursor += constants::kNonceLen + 4;
    sealed.ciphertext.assign(cursor, cursor + ct_len);
    cursor += ct_len;
    sealed.tag.assign(cursor, cursor + constants::kTagLen);
    return Open(sealed, password, raw_header);
}

std::uint64_t EncryptFile(std::istream& input,
                          std::ostream& output,
                          const std::string& password,
                          const CodecOptions& options) {
    Bytes plaintext = ReadAll(input, options.max_in_memory_size);
    Bytes blob = EncryptBuffer(plaintext, password, options);
    crypto::SecureWipe(plaintext);
    WriteAll(output, blob);
    return blob.size();
}

std::uint64_t DecryptFile(std::istream& input,
                          std::ostream& output,
                          const std::string& password,
                          const CodecOptions& options) {
    Bytes raw_header;
    container::Header header = container::ReadHeader(input, raw_header);
    return DecryptAfterHeader(header, raw_header, input, output, password, options);
}

std::uint64_t DecryptAfterHeader(const container::Header& header,
                                 const Bytes& raw_header,
                                 std::istream& input,
                                 std::ostream& output,
                                 const std::string& password,
                                 const CodecOptions& options) {
    if (header.mode != container::Mode::WholeFile) {
        throw Error(ErrorCode::DecryptionFailed, "Container is in streaming mode");
    }
    std::size_t limit = static_cast<std::size_t>(options.max_in_memory_size);
    auto record = container::ReadRecord(input, limit);
    if (!record) {
        throw Error(ErrorCode::DecryptionFailed, "Malformed container: missing record");
    }
    if (input.peek() != std::char_traits<char>::eof()) {
        throw Error(ErrorCode::DecryptionFailed, "Malformed container: trailing bytes after record");
    }
    SealedBuffer sealed{header.salt, std::move(record->nonce), std::move(record->ciphertext),
                        std::move(record->tag), header.iterations};
    Bytes plaintext = Open(sealed, password, raw_header);
    WriteAll(output, plaintext);
    std::uint64_t written = plaintext.size();
    crypto::SecureWipe(plaintext);
    return written;
}

}  // namespace filevault::codec
