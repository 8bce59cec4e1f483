#pragma once

#include <cstddef>
#include <cstdint>
#include <istream>
#include <optional>
#include <ostream>
#include <vector>

#include "filevault/constants.hpp"
#include "filevault/crypto.hpp"

namespace filevault::container {

using Bytes = crypto::Bytes;

enum class Mode : std::uint8_t {
    WholeFile = constants::kModeWholeFile,
    Streaming = constants::kModeStreaming
};

struct Header {
    std::uint8_t version = constants::kFormatVersion;
    Mode mode = Mode::WholeFile;
    std::uint32_t iterations = 0;
    Bytes salt;
    std::uint32_t chunk_size = 0;  // streaming only
};

struct Record {
    Bytes nonce;
    Bytes ciphertext;
    Bytes tag;
};

std::size_t HeaderLength(Mode mode) noexcept;
Bytes EncodeHeader(const Header& header);

// Parsing failures throw Error(DecryptionFailed).
Header ParseHeader(const Bytes& data);
Header ReadHeader(std::istream& input, Bytes& raw_out);
std::optional<Header> PeekHeader(std::istream& input);

Bytes EncodeRecord(const Bytes& nonce, const Bytes& ciphertext, const std::uint8_t* tag);
void WriteRecord(std::ostream& output, const Bytes& nonce, const Bytes& ciphertext, const std::uint8_t* tag);
// Returns nullopt on a clean end of input before the record starts.
std::optional<Record> ReadRecord(std::istream& input, std::size_t max_ciphertext);

std::uint64_t EstimateOutputSize(Mode mode, std::uint64_t plaintext_size, std::size_t chunk_size);
// nullopt when container_size cannot hold a well-formed body for header.
std::optional<std::uint64_t> EstimatePlaintextSize(const Header& header, std::uint64_t container_size);

void WriteU16Be(std::uint8_t* out, std::uint16_t value) noexcept;
void WriteU32Be(std::uint8_t* out, std::uint32_t value) noexcept;
void WriteU64Be(std::uint8_t* out, std::uint64_t value) noexcept;
std::uint16_t ReadU16Be(const std::uint8_t* ptr) noexcept;
std::uint32_t ReadU32Be(const std::uint8_t* ptr) noexcept;
std::uint64_t ReadU64Be(const std::uint8_t* ptr) noexcept;

}  // namespace filevault::container
