#include "filevault/container.hpp"

#include "filevault/error.hpp"
#include "filevault/key_deriver.hpp"

#include <algorithm>
#include <array>
#include <cstring>
#include <string>

namespace filevault::container {

namespace {

[[noreturn]] void Malformed(const std::string& what) {
    throw Error(ErrorCode::DecryptionFailed, "Malformed container: " + what);
}

std::size_t ReadFully(std::istream& input, std::uint8_t* out, std::size_t len) {
    if (len == 0) {
        return 0;
    }
    input.read(reinterpret_cast<char*>(out), static_cast<std::streamsize>(len));
    std::streamsize got = input.gcount();
    if (input.bad()) {
        throw Error(ErrorCode::IoFailure, "Read failed while parsing container");
    }
    return got > 0 ? static_cast<std::size_t>(got) : 0;
}

}  // namespace

std::size_t HeaderLength(Mode mode) noexcept {
    return mode == Mode::Streaming ? constants::kStreamHeaderLen : constants::kBaseHeaderLen;
}

Bytes EncodeHeader(const Header& header) {
    if (header.salt.size() != constants::kSaltLen) {
        throw Error(ErrorCode::InvalidInput, "Container salt must be 16 bytes");
    }
    Bytes out(HeaderLength(header.mode));
    std::memcpy(out.data(), constants::kMagic.data(), constants::kMagic.size());
    out[4] = header.version;
    out[5] = static_cast<std::uint8_t>(header.mode);
    WriteU16Be(out.data() + 6, kdf::EncodeIterations(header.iterations));
    std::memcpy(out.data() + 8, header.salt.data(), header.salt.size());
    if (header.mode == Mode::Streaming) {
        WriteU32Be(out.data() + constants::kBaseHeaderLen, header.chunk_size);
    }
    return out;
}

Header ParseHeader(const Bytes& data) {
    if (data.size() < constants::kBaseHeaderLen) {
        Malformed("truncated header");
    }
    if (!std::equal(constants::kMagic.begin(), constants::kMagic.end(), data.begin())) {
        Malformed("bad magic");
    }
    Header header;
    header.version = data[4];
    if (header.version != constants::kFormatVersion) {
        Malformed("unsupported version " + std::to_string(header.version));
    }
    std::uint8_t mode = data[5];
    if (mode != constants::kModeWholeFile && mode != constants::kModeStreaming) {
        Malformed("unknown mode flag " + std::to_string(mode));
    }
    header.mode = static_cast<Mode>(mode);
    std::uint16_t encoded_iters = ReadU16Be(data.data() + 6);
    if (encoded_iters == 0) {
        Malformed("zero KDF iteration count");
    }
    header.iterations = kdf::DecodeIterations(encoded_iters);
    if (header.iterations > constants::kMaxKdfIterations) {
        Malformed("KDF iteration count " + std::to_string(header.iterations) + " exceeds limit");
    }
    header.salt.assign(data.begin() + 8, data.begin() + 8 + constants::kSaltLen);
    if (header.mode == Mode::Streaming) {
        if (data.size() < constants::kStreamHeaderLen) {
            Malformed("truncated streaming header");
        }
        header.chunk_size = ReadU32Be(data.data() + constants::kBaseHeaderLen);
        if (header.chunk_size < constants::kMinChunkSize || header.chunk_size > constants::kMaxChunkSize) {
            Malformed("chunk size out of range");
        }
    }
    return header;
}

Header ReadHeader(std::istream& input, Bytes& raw_out) {
    raw_out.assign(constants::kBaseHeaderLen, 0);
    if (ReadFully(input, raw_out.data(), raw_out.size()) != raw_out.size()) {
        Malformed("truncated header");
    }
    if (raw_out[5] == constants::kModeStreaming) {
        std::array<std::uint8_t, 4> extra{};
        if (ReadFully(input, extra.data(), extra.size()) != extra.size()) {
            Malformed("truncated streaming header");
        }
        raw_out.insert(raw_out.end(), extra.begin(), extra.end());
    }
    return ParseHeader(raw_out);
}

std::optional<Header> PeekHeader(std::istream& input) {
    Bytes raw;
    try {
        return ReadHeader(input, raw);
    } catch (const Error& err) {
        if (err.code() == ErrorCode::DecryptionFailed) {
            return std::nullopt;
        }
        throw;
    }
}

Bytes EncodeRecord(const Bytes& nonce, const Bytes& ciphertext, const std::uint8_t* tag) {
    if (nonce.size() != constants::kNonceLen) {
        throw Error(ErrorCode::InvalidInput, "Record nonce must be 12 bytes");
    }
    if (ciphertext.size() > 0xFFFFFFFFu) {
        throw Error(ErrorCode::InvalidInput, "Record ciphertext exceeds 4 GiB");
    }
    Bytes out(constants::kRecordOverhead + ciphertext.size());
    std::uint8_t* cursor = out.data();
    std::memcpy(cursor, nonce.data(), nonce.size());
    cursor += nonce.size();
    WriteU32Be(cursor, static_cast<std::uint32_t>(ciphertext.size()));
    cursor += 4;
    if (!ciphertext.empty()) {
        std::memcpy(cursor, ciphertext.data(), ciphertext.size());
        cursor += ciphertext.size();
    }
    std::memcpy(cursor, tag, constants::kTagLen);
    return out;
}

void WriteRecord(std::ostream& output, const Bytes& nonce, const Bytes& ciphertext, const std::uint8_t* tag) {
    Bytes record = EncodeRecord(nonce, ciphertext, tag);
    output.write(reinterpret_cast<const char*>(record.data()), static_cast<std::streamsize>(record.size()));
    if (!output) {
        throw Error(ErrorCode::IoFailure, "Failed to write container record");
    }
}

std::optional<Record> ReadRecord(std::istream& input, std::size_t max_ciphertext) {
    std::array<std::uint8_t, constants::kNonceLen + 4> prefix{};
    std::size_t got = ReadFully(input, prefix.data(), prefix.size());
    if (got == 0) {
        return std::nullopt;
    }
    if (got != prefix.size()) {
        Malformed("truncated record header");
    }
    std::uint32_t ct_len = ReadU32Be(prefix.data() + constants::kNonceLen);
    if (ct_len > max_ciphertext) {
        Malformed("record length " + std::to_string(ct_len) + " exceeds limit");
    }
    Record record;
    record.nonce.assign(prefix.begin(), prefix.begin() + constants::kNonceLen);
    record.ciphertext.resize(ct_len);
    if (ReadFully(input, record.ciphertext.data(), ct_len) != ct_len) {
        Malformed("truncated record body");
    }
    record.tag.resize(constants::kTagLen);
    if (ReadFully(input, record.tag.data(), record.tag.size()) != record.tag.size()) {
        Malformed("truncated record tag");
    }
    return record;
}

std::uint64_t EstimateOutputSize(Mode mode, std::uint64_t plaintext_size, std::size_t chunk_size) {
    if (mode == Mode::WholeFile) {
        return constants::kBaseHeaderLen + constants::kRecordOverhead + plaintext_size;
    }
    if (chunk_size == 0) {
        throw Error(ErrorCode::InvalidInput, "Chunk size must be positive");
    }
    std::uint64_t chunks = plaintext_size == 0 ? 1 : (plaintext_size + chunk_size - 1) / chunk_size;
    return constants::kStreamHeaderLen + chunks * constants::kRecordOverhead + plaintext_size;
}

std::optional<std::uint64_t> EstimatePlaintextSize(const Header& header, std::uint64_t container_size) {
    std::uint64_t header_len = HeaderLength(header.mode);
    if (container_size < header_len + constants::kRecordOverhead) {
        return std::nullopt;
    }
    std::uint64_t body = container_size - header_len;
    if (header.mode == Mode::WholeFile) {
        return body - constants::kRecordOverhead;
    }
    if (header.chunk_size == 0) {
        return std::nullopt;
    }
    std::uint64_t record_len = static_cast<std::uint64_t>(header.chunk_size) + constants::kRecordOverhead;
    std::uint64_t full = body / record_len;
    std::uint64_t rest = body % record_len;
    if (rest == 0) {
        return full * header.chunk_size;
    }
    if (rest < constants::kRecordOverhead) {
        return std::nullopt;
    }
    return full * header.chunk_size + (rest - constants::kRecordOverhead);
}

void WriteU16Be(std::uint8_t* out, std::uint16_t value) noexcept {
    out[0] = static_cast<std::uint8_t>((value >> 8) & 0xFF);
    out[1] = static_cast<std::uint8_t>(value & 0xFF);
}

void WriteU32Be(std::uint8_t* out, std::uint32_t value) noexcept {
    out[0] = static_cast<std::uint8_t>((value >> 24) & 0xFF);
    out[1] = static_cast<std::uint8_t>((value >> 16) & 0xFF);
    out[2] = static_cast<std::uint8_t>((value >> 8) & 0xFF);
    out[3] = static_cast<std::uint8_t>(value & 0xFF);
}

void WriteU64Be(std::uint8_t* out, std::uint64_t value) noexcept {
    for (int i = 0; i < 8; ++i) {
        out[i] = static_cast<std::uint8_t>((value >> ((7 - i) * 8)) & 0xFF);
    }
}

std::uint16_t ReadU16Be(const std::uint8_t* ptr) noexcept {
    return static_cast<std::uint16_t>((static_cast<std::uint16_t>(ptr[0]) << 8) | ptr[1]);
}

std::uint32_t ReadU32Be(const std::uint8_t* ptr) noexcept {
    return (static_cast<std::uint32_t>(ptr[0]) << 24)
        | (static_cast<std::uint32_t>(ptr[1]) << 16)
        | (static_cast<std::uint32_t>(ptr[2]) << 8)
        | static_cast<std::uint32_t>(ptr[3]);
}

std::uint64_t ReadU64Be(const std::uint8_t* ptr) noexcept {
    std::uint64_t value = 0;
    for (int i = 0; i < 8; ++i) {
        value = (value << 8) | static_cast<std::uint64_t>(ptr[i]);
    }
    return value;
}

}  // namespace filevault::container
