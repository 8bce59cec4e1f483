#pragma once

#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <optional>
#include <string>

#include "filevault/cancel.hpp"
#include "filevault/constants.hpp"
#include "filevault/container.hpp"
#include "filevault/crypto.hpp"
#include "filevault/key_deriver.hpp"

namespace filevault::chunked {

using Bytes = crypto::Bytes;

struct ChunkOptions {
    std::size_t chunk_size = constants::kDefaultChunkSize;
    std::uint32_t iterations = 0;  // 0 -> kdf::ResolveIterations()
};

void ValidateChunkSize(std::size_t chunk_size);

// Chunk i is sealed under nonce (prefix || be64(i)) with associated data
// (header || be64(i) || final_flag). Reordering, dropping or appending
// records breaks authentication.
class ChunkEncryptor {
public:
    ChunkEncryptor(const std::string& password, const ChunkOptions& options = {});

    Bytes Start();
    Bytes Update(const Bytes& chunk, bool is_final);
    Bytes Update(const std::uint8_t* data, std::size_t len, bool is_final);

    bool finished() const noexcept { return finished_; }
    std::uint64_t chunks_written() const noexcept { return index_; }

private:
    std::string password_;
    ChunkOptions options_;
    bool started_ = false;
    bool finished_ = false;
    std::uint64_t index_ = 0;
    Bytes header_;
    Bytes nonce_prefix_;
    std::optional<kdf::DerivedKey> key_;
};

class ChunkDecryptor {
public:
    explicit ChunkDecryptor(const std::string& password);

    void Start(const container::Header& header, const Bytes& raw_header);
    Bytes Open(const container::Record& record, bool is_final);
    void Finalize() const;

    std::size_t chunk_size() const noexcept { return chunk_size_; }

private:
    std::string password_;
    bool started_ = false;
    bool finished_ = false;
    std::uint64_t expected_index_ = 0;
    std::size_t chunk_size_ = 0;
    Bytes header_;
    Bytes nonce_prefix_;
    std::optional<kdf::DerivedKey> key_;
};

std::uint64_t EncryptStream(std::istream& source,
                            std::ostream& dest,
                            const std::string& password,
                            const ChunkOptions& options = {},
                            const StreamHooks& hooks = {});

std::uint64_t DecryptStream(std::istream& source,
                            std::ostream& dest,
                            const std::string& password,
                            const StreamHooks& hooks = {});

// Continues after a header already consumed from source.
std::uint64_t DecryptAfterHeader(const container::Header& header,
                                 const Bytes& raw_header,
                                 std::istream& source,
                                 std::ostream& dest,
                                 const std::string& password,
                                 const StreamHooks& hooks = {});

}  // namespace filevault::chunked
