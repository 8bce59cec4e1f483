#include "filevault/chunked_codec.hpp"

#include "filevault/error.hpp"

#include <algorithm>
#include <cstring>
#include <istream>
#include <ostream>
#include <string>
#include <utility>
#include <vector>

namespace filevault::chunked {

namespace {

Bytes NonceForIndex(const Bytes& prefix, std::uint64_t index) {
    Bytes nonce(constants::kNonceLen);
    std::memcpy(nonce.data(), prefix.data(), prefix.size());
    container::WriteU64Be(nonce.data() + prefix.size(), index);
    return nonce;
}

Bytes ChunkAad(const Bytes& header, std::uint64_t index, bool is_final) {
    Bytes aad(header);
    std::uint8_t tail[9];
    container::WriteU64Be(tail, index);
    tail[8] = is_final ? 1 : 0;
    aad.insert(aad.end(), tail, tail + sizeof(tail));
    return aad;
}

bool AtEnd(std::istream& source) {
    return source.peek() == std::char_traits<char>::eof();
}

void WriteBytes(std::ostream& dest, const Bytes& data) {
    dest.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
    if (!dest) {
        throw Error(ErrorCode::IoFailure, "Failed to write encrypted stream");
    }
}

void Report(const StreamHooks& hooks, std::uint64_t done) {
    if (hooks.progress) {
        hooks.progress(done, hooks.total_bytes);
    }
}

void CheckCancel(const StreamHooks& hooks) {
    if (hooks.cancel != nullptr) {
        hooks.cancel->ThrowIfCancelled();
    }
}

}  // namespace

void ValidateChunkSize(std::size_t chunk_size) {
    if (chunk_size < constants::kMinChunkSize || chunk_size > constants::kMaxChunkSize) {
        throw Error(ErrorCode::InvalidInput,
                    "Chunk size must be between " + std::to_string(constants::kMinChunkSize) + " and "
                        + std::to_string(constants::kMaxChunkSize) + " bytes");
    }
}

ChunkEncryptor::ChunkEncryptor(const std::string& password, const ChunkOptions& options)
    : password_(password),
      options_(options) {
    ValidateChunkSize(options_.chunk_size);
}

Bytes ChunkEncryptor::Start() {
    if (started_) {
        throw Error(ErrorCode::InvalidInput, "ChunkEncryptor already started");
    }
    container::Header header;
    header.mode = container::Mode::Streaming;
    header.iterations = kdf::ResolveIterations(options_.iterations);
    header.salt = crypto::RandomBytes(constants::kSaltLen);
    header.chunk_size = static_cast<std::uint32_t>(options_.chunk_size);
    header_ = container::EncodeHeader(header);
    key_.emplace(kdf::Derive(password_, header.salt, header.iterations));
    nonce_prefix_ = crypto::RandomBytes(constants::kNoncePrefixLen);
    started_ = true;
    return header_;
}

Bytes ChunkEncryptor::Update(const Bytes& chunk, bool is_final) {
    return Update(chunk.data(), chunk.size(), is_final);
}

Bytes ChunkEncryptor::Update(const std::uint8_t* data, std::size_t len, bool is_final) {
    if (!started_) {
        throw Error(ErrorCode::InvalidInput, "ChunkEncryptor::Start() must be called before Update()");
    }
    if (finished_) {
        throw Error(ErrorCode::InvalidInput, "ChunkEncryptor already emitted its final chunk");
    }
    if (len > options_.chunk_size) {
        throw Error(ErrorCode::InvalidInput, "Chunk exceeds the configured chunk size");
    }
    if (!is_final && len != options_.chunk_size) {
        throw Error(ErrorCode::InvalidInput, "Only the final chunk may be short");
    }
    Bytes nonce = NonceForIndex(nonce_prefix_, index_);
    Bytes aad = ChunkAad(header_, index_, is_final);
    Bytes tag(constants::kTagLen);
    Bytes ct = crypto::AesGcmEncryptWithIv(key_->bytes(), nonce, data, len, aad, tag.data());
    index_ += 1;
    finished_ = is_final;
    return container::EncodeRecord(nonce, ct, tag.data());
}

ChunkDecryptor::ChunkDecryptor(const std::string& password) : password_(password) {}

void ChunkDecryptor::Start(const container::Header& header, const Bytes& raw_header) {
    if (started_) {
        throw Error(ErrorCode::InvalidInput, "ChunkDecryptor already started");
    }
    if (header.mode != container::Mode::Streaming) {
        throw Error(ErrorCode::DecryptionFailed, "Container is not in streaming mode");
    }
    chunk_size_ = header.chunk_size;
    header_ = raw_header;
    key_.emplace(kdf::Derive(password_, header.salt, header.iterations));
    started_ = true;
}

Bytes ChunkDecryptor::Open(const container::Record& record, bool is_final) {
    if (!started_) {
        throw Error(ErrorCode::InvalidInput, "ChunkDecryptor::Start() must be called before Open()");
    }
    if (finished_) {
        throw Error(ErrorCode::DecryptionFailed, "Record found after the final chunk");
    }
    if (record.nonce.size() != constants::kNonceLen || record.tag.size() != constants::kTagLen) {
        throw Error(ErrorCode::DecryptionFailed, "Malformed container: bad record framing");
    }
    if (expected_index_ == 0) {
        nonce_prefix_.assign(record.nonce.begin(), record.nonce.begin() + constants::kNoncePrefixLen);
    }
    if (record.nonce != NonceForIndex(nonce_prefix_, expected_index_)) {
        throw Error(ErrorCode::DecryptionFailed, "Chunk out of sequence at index " + std::to_string(expected_index_));
    }
    Bytes aad = ChunkAad(header_, expected_index_, is_final);
    Bytes plain = crypto::AesGcmDecryptWithIv(key_->bytes(), record.nonce, record.ciphertext.data(),
                                              record.ciphertext.size(), aad, record.tag.data());
    expected_index_ += 1;
    finished_ = is_final;
    return plain;
}

void ChunkDecryptor::Finalize() const {
    if (!started_) {
        throw Error(ErrorCode::DecryptionFailed, "Missing stream header");
    }
    if (!finished_) {
        throw Error(ErrorCode::DecryptionFailed, "Stream ended without a final chunk");
    }
}

std::uint64_t EncryptStream(std::istream& source,
                            std::ostream& dest,
                            const std::string& password,
                            const ChunkOptions& options,
                            const StreamHooks& hooks) {
    ChunkEncryptor encryptor(password, options);
    std::uint64_t written = 0;
    std::uint64_t consumed = 0;

    Bytes header = encryptor.Start();
    WriteBytes(dest, header);
    written += header.size();

    std::vector<std::uint8_t> buffer(options.chunk_size);
    while (!encryptor.finished()) {
        CheckCancel(hooks);
        source.read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(buffer.size()));
        if (source.bad()) {
            throw Error(ErrorCode::IoFailure, "Failed to read plaintext stream");
        }
        std::size_t got = static_cast<std::size_t>(std::max<std::streamsize>(source.gcount(), 0));
        bool last = got < buffer.size() || AtEnd(source);
        Bytes record = encryptor.Update(buffer.data(), got, last);
        WriteBytes(dest, record);
        written += record.size();
        consumed += got;
        Report(hooks, consumed);
    }
    crypto::SecureWipe(buffer);
    dest.flush();
    if (!dest) {
        throw Error(ErrorCode::IoFailure, "Failed to flush encrypted stream");
    }
    return written;
}

std::uint64_t DecryptStream(std::istream& source,
                            std::ostream& dest,
                            const std::string& password,
                            const StreamHooks& hooks) {
    Bytes raw_header;
    container::Header header = container::ReadHeader(source, raw_header);
    return DecryptAfterHeader(header, raw_header, source, dest, password, hooks);
}

std::uint64_t DecryptAfterHeader(const container::Header& header,
                                 const Bytes& raw_header,
                                 std::istream& source,
                                 std::ostream& dest,
                                 const std::string& password,
                                 const StreamHooks& hooks) {
    ChunkDecryptor decryptor(password);
    decryptor.Start(header, raw_header);
    std::uint64_t written = 0;
    std::uint64_t consumed = raw_header.size();

    while (true) {
        CheckCancel(hooks);
        auto record = container::ReadRecord(source, decryptor.chunk_size());
        if (!record) {
            break;
        }
        bool last = AtEnd(source);
        Bytes plain = decryptor.Open(*record, last);
        if (!plain.empty()) {
            dest.write(reinterpret_cast<const char*>(plain.data()), static_cast<std::streamsize>(plain.size()));
            if (!dest) {
                throw Error(ErrorCode::IoFailure, "Failed to write decrypted stream");
            }
            written += plain.size();
        }
        crypto::SecureWipe(plain);
        consumed += constants::kRecordOverhead + record->ciphertext.size();
        Report(hooks, consumed);
        if (last) {
            break;
        }
    }
    decryptor.Finalize();
    dest.flush();
    if (!dest) {
        throw Error(ErrorCode::IoFailure, "Failed to flush decrypted stream");
    }
    return written;
}

}  // namespace filevault::chunked
