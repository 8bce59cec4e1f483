#include <gtest/gtest.h>

#include "filevault/cipher_codec.hpp"
#include "filevault/constants.hpp"
#include "filevault/container.hpp"
#include "filevault/error.hpp"

#include <sstream>
#include <string>

#include "test_helpers.hpp"

namespace filevault::codec {
namespace {

using test_support::kFastIterations;
using test_support::PatternBytes;

const std::string kPassword = "Tr0ub4dor&3";

CodecOptions FastOptions() {
    CodecOptions options;
    options.iterations = kFastIterations;
    return options;
}

ErrorCode CodeOf(const Bytes& blob, const std::string& password) {
    try {
        DecryptBuffer(blob, password);
    } catch (const Error& err) {
        return err.code();
    }
    ADD_FAILURE() << "container was accepted";
    return ErrorCode::IoFailure;
}

TEST(CipherCodecTest, SealedBufferRoundTrip) {
    Bytes plain = PatternBytes(1000, 1);
    SealedBuffer sealed = Encrypt(plain, kPassword, FastOptions());
    EXPECT_EQ(sealed.salt.size(), constants::kSaltLen);
    EXPECT_EQ(sealed.nonce.size(), constants::kNonceLen);
    EXPECT_EQ(sealed.tag.size(), constants::kTagLen);
    EXPECT_EQ(sealed.ciphertext.size(), plain.size());
    EXPECT_EQ(sealed.iterations, kFastIterations);
    EXPECT_EQ(Decrypt(sealed, kPassword), plain);
    EXPECT_EQ(Decrypt(sealed.ciphertext, kPassword, sealed.salt, sealed.nonce, sealed.tag, sealed.iterations), plain);
}

TEST(CipherCodecTest, SealedBufferRejectsBadFraming) {
    SealedBuffer sealed = Encrypt(PatternBytes(10, 2), kPassword, FastOptions());
    sealed.tag.pop_back();
    EXPECT_THROW(Decrypt(sealed, kPassword), Error);
}

TEST(CipherCodecTest, ContainerRoundTrip) {
    Bytes plain = PatternBytes(4096, 3);
    Bytes blob = EncryptBuffer(plain, kPassword, FastOptions());
    EXPECT_EQ(blob.size(), container::EstimateOutputSize(container::Mode::WholeFile, plain.size(), 0));
    EXPECT_EQ(DecryptBuffer(blob, kPassword), plain);
}

TEST(CipherCodecTest, EmptyPlaintextRoundTrip) {
    Bytes blob = EncryptBuffer({}, kPassword, FastOptions());
    EXPECT_EQ(blob.size(), constants::kBaseHeaderLen + constants::kRecordOverhead);
    EXPECT_TRUE(DecryptBuffer(blob, kPassword).empty());
}

TEST(CipherCodecTest, EncryptionIsRandomised) {
    Bytes plain = PatternBytes(64, 4);
    EXPECT_NE(EncryptBuffer(plain, kPassword, FastOptions()), EncryptBuffer(plain, kPassword, FastOptions()));
}

TEST(CipherCodecTest, HeaderRecordsIterationCount) {
    Bytes blob = EncryptBuffer(PatternBytes(8, 5), kPassword, FastOptions());
    container::Header header = container::ParseHeader(blob);
    EXPECT_EQ(header.mode, container::Mode::WholeFile);
    EXPECT_EQ(header.iterations, kFastIterations);
    EXPECT_EQ(container::ReadU16Be(blob.data() + 6), kFastIterations / 1000);
}

TEST(CipherCodecTest, WrongPasswordFails) {
    Bytes blob = EncryptBuffer(PatternBytes(100, 6), kPassword, FastOptions());
    EXPECT_EQ(CodeOf(blob, "tr0ub4dor&3"), ErrorCode::DecryptionFailed);
}

TEST(CipherCodecTest, AnyModifiedByteFails) {
    Bytes blob = EncryptBuffer(PatternBytes(100, 7), kPassword, FastOptions());
    const std::size_t record = constants::kBaseHeaderLen;
    const std::size_t positions[] = {
        8,                                           // salt
        record,                                      // nonce
        record + constants::kNonceLen + 1,           // length
        record + constants::kNonceLen + 4 + 10,      // ciphertext
        blob.size() - 1,                             // tag
    };
    for (std::size_t pos : positions) {
        Bytes tampered = blob;
        tampered[pos] ^= 0x01;
        EXPECT_EQ(CodeOf(tampered, kPassword), ErrorCode::DecryptionFailed) << "offset " << pos;
    }
}

TEST(CipherCodecTest, TrailingAndMissingBytesFail) {
    Bytes blob = EncryptBuffer(PatternBytes(100, 8), kPassword, FastOptions());
    Bytes longer = blob;
    longer.push_back(0);
    EXPECT_EQ(CodeOf(longer, kPassword), ErrorCode::DecryptionFailed);
    Bytes shorter(blob.begin(), blob.end() - 1);
    EXPECT_EQ(CodeOf(shorter, kPassword), ErrorCode::DecryptionFailed);
    EXPECT_EQ(CodeOf(Bytes(blob.begin(), blob.begin() + 20), kPassword), ErrorCode::DecryptionFailed);
}

TEST(CipherCodecTest, StreamsRoundTrip) {
    Bytes plain = PatternBytes(200000, 9);
    std::istringstream input(std::string(plain.begin(), plain.end()));
    std::ostringstream sealed;
    std::uint64_t written = EncryptFile(input, sealed, kPassword, FastOptions());
    EXPECT_EQ(written, sealed.str().size());

    std::istringstream encrypted(sealed.str());
    std::ostringstream opened;
    EXPECT_EQ(DecryptFile(encrypted, opened, kPassword), plain.size());
    EXPECT_EQ(opened.str(), std::string(plain.begin(), plain.end()));
}

TEST(CipherCodecTest, StreamRejectsTrailingBytes) {
    std::istringstream input("hello");
    std::ostringstream sealed;
    EncryptFile(input, sealed, kPassword, FastOptions());

    std::istringstream encrypted(sealed.str() + "x");
    std::ostringstream opened;
    EXPECT_THROW(DecryptFile(encrypted, opened, kPassword), Error);
    EXPECT_TRUE(opened.str().empty());
}

TEST(CipherCodecTest, InMemoryCeilingIsEnforced) {
    CodecOptions options = FastOptions();
    options.max_in_memory_size = 1024;
    std::istringstream input(std::string(4096, 'a'));
    std::ostringstream sealed;
    try {
        EncryptFile(input, sealed, kPassword, options);
        FAIL() << "oversized input accepted";
    } catch (const Error& err) {
        EXPECT_EQ(err.code(), ErrorCode::InvalidInput);
    }
    EXPECT_THROW(EncryptBuffer(Bytes(2048, 1), kPassword, options), Error);
}

}  // namespace
}  // namespace filevault::codec
