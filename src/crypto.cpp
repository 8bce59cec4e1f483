#include "filevault/crypto.hpp"

#include "filevault/constants.hpp"
#include "filevault/error.hpp"

#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/rand.h>

#include <algorithm>
#include <array>
#include <limits>
#include <stdexcept>
#include <string>

namespace filevault::crypto {

namespace {

void Ensure(bool ok, const char* message) {
    if (!ok) {
        throw std::runtime_error(message);
    }
}

int CheckedLen(std::size_t len, const char* what) {
    if (len > static_cast<std::size_t>(std::numeric_limits<int>::max())) {
        throw std::runtime_error(std::string(what) + " too large for OpenSSL");
    }
    return static_cast<int>(len);
}

void CheckKeyAndIv(const Bytes& key, const Bytes& iv) {
    if (key.size() != constants::kKeyLen) {
        throw std::runtime_error("AES-GCM expects 32-byte key");
    }
    if (iv.size() != constants::kNonceLen) {
        throw std::runtime_error("AES-GCM expects 12-byte IV");
    }
}

}  // namespace

Bytes RandomBytes(std::size_t size) {
    Bytes out(size);
    if (size == 0) {
        return out;
    }
    Ensure(RAND_bytes(out.data(), CheckedLen(out.size(), "random request")) == 1, "RAND_bytes failed");
    return out;
}

Bytes Pbkdf2HmacSha256(const std::string& password, const Bytes& salt, std::size_t iterations, std::size_t length) {
    Bytes out(length);
    Ensure(PKCS5_PBKDF2_HMAC(password.data(), CheckedLen(password.size(), "password"), salt.data(),
                             CheckedLen(salt.size(), "salt"), CheckedLen(iterations, "iteration count"),
                             EVP_sha256(), CheckedLen(out.size(), "key"), out.data()) == 1,
           "PBKDF2 failed");
    return out;
}

Bytes AesGcmEncryptWithIv(const Bytes& key,
                          const Bytes& iv,
                          const std::uint8_t* plaintext,
                          std::size_t plaintext_len,
                          const Bytes& aad,
                          std::uint8_t* tag_out) {
    CheckKeyAndIv(key, iv);
    detail::UniqueCipherCtx ctx(EVP_CIPHER_CTX_new());
    if (!ctx) {
        throw std::runtime_error("AES-GCM context allocation failed");
    }
    Bytes ciphertext(plaintext_len);
    std::array<std::uint8_t, 16> final_block{};
    int out_len = 0;
    int total_len = 0;

    Ensure(EVP_EncryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) == 1,
           "AES-GCM init failed");
    Ensure(EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, static_cast<int>(iv.size()), nullptr) == 1,
           "AES-GCM set iv length failed");
    Ensure(EVP_EncryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), iv.data()) == 1,
           "AES-GCM set key failed");
    if (!aad.empty()) {
        Ensure(EVP_EncryptUpdate(ctx.get(), nullptr, &out_len, aad.data(), CheckedLen(aad.size(), "aad")) == 1,
               "AES-GCM aad failed");
    }
    if (plaintext_len > 0) {
        Ensure(EVP_EncryptUpdate(ctx.get(), ciphertext.data(), &out_len, plaintext,
                                 CheckedLen(plaintext_len, "plaintext")) == 1,
               "AES-GCM encrypt failed");
        total_len += out_len;
    }
    Ensure(EVP_EncryptFinal_ex(ctx.get(), final_block.data(), &out_len) == 1, "AES-GCM final failed");
    Ensure(EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_GET_TAG, static_cast<int>(constants::kTagLen), tag_out) == 1,
           "AES-GCM get tag failed");
    ciphertext.resize(static_cast<std::size_t>(total_len));
    return ciphertext;
}

Bytes AesGcmDecryptWithIv(const Bytes& key,
                          const Bytes& iv,
                          const std::uint8_t* ciphertext,
                          std::size_t ciphertext_len,
                          const Bytes& aad,
                          const std::uint8_t* tag) {
    CheckKeyAndIv(key, iv);
    detail::UniqueCipherCtx ctx(EVP_CIPHER_CTX_new());
    if (!ctx) {
        throw std::runtime_error("AES-GCM context allocation failed");
    }
    Bytes plaintext(ciphertext_len);
    std::array<std::uint8_t, 16> final_block{};
    std::array<std::uint8_t, constants::kTagLen> tag_copy{};
    std::copy(tag, tag + constants::kTagLen, tag_copy.begin());
    int out_len = 0;
    int total_len = 0;

    Ensure(EVP_DecryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) == 1,
           "AES-GCM init failed");
    Ensure(EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, static_cast<int>(iv.size()), nullptr) == 1,
           "AES-GCM set iv length failed");
    Ensure(EVP_DecryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), iv.data()) == 1,
           "AES-GCM set key failed");
    if (!aad.empty()) {
        Ensure(EVP_DecryptUpdate(ctx.get(), nullptr, &out_len, aad.data(), CheckedLen(aad.size(), "aad")) == 1,
               "AES-GCM aad failed");
    }
    if (ciphertext_len > 0) {
        Ensure(EVP_DecryptUpdate(ctx.get(), plaintext.data(), &out_len, ciphertext,
                                 CheckedLen(ciphertext_len, "ciphertext")) == 1,
               "AES-GCM decrypt failed");
        total_len += out_len;
    }
    Ensure(EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_TAG, static_cast<int>(tag_copy.size()),
                               tag_copy.data()) == 1,
           "AES-GCM set tag failed");
    if (EVP_DecryptFinal_ex(ctx.get(), final_block.data(), &out_len) != 1) {
        SecureWipe(plaintext);
        throw Error(ErrorCode::DecryptionFailed,
                    "Authentication failed: wrong password or corrupted data");
    }
    plaintext.resize(static_cast<std::size_t>(total_len));
    return plaintext;
}

void SecureWipe(Bytes& data) noexcept {
    if (!data.empty()) {
        OPENSSL_cleanse(data.data(), data.size());
    }
    data.clear();
}

void SecureWipe(std::string& data) noexcept {
    if (!data.empty()) {
        OPENSSL_cleanse(&data[0], data.size());
    }
    data.clear();
}

Sha256::Sha256() : ctx_(EVP_MD_CTX_new()) {
    if (!ctx_) {
        throw std::runtime_error("SHA-256 context allocation failed");
    }
    Ensure(EVP_DigestInit_ex(ctx_.get(), EVP_sha256(), nullptr) == 1, "SHA-256 init failed");
}

void Sha256::Update(const std::uint8_t* data, std::size_t len) {
    if (finalized_) {
        throw std::runtime_error("SHA-256 already finalized");
    }
    if (len == 0) {
        return;
    }
    Ensure(EVP_DigestUpdate(ctx_.get(), data, len) == 1, "SHA-256 update failed");
}

void Sha256::Update(std::istream& input) {
    std::vector<std::uint8_t> buffer(constants::kDefaultChunkSize);
    while (input) {
        input.read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(buffer.size()));
        std::streamsize got = input.gcount();
        if (got <= 0) {
            break;
        }
        Update(buffer.data(), static_cast<std::size_t>(got));
    }
    if (input.bad()) {
        throw std::runtime_error("SHA-256 input read failed");
    }
}

std::string Sha256::FinalHex() {
    if (finalized_) {
        throw std::runtime_error("SHA-256 already finalized");
    }
    std::array<std::uint8_t, EVP_MAX_MD_SIZE> out{};
    unsigned int out_len = 0;
    Ensure(EVP_DigestFinal_ex(ctx_.get(), out.data(), &out_len) == 1, "SHA-256 final failed");
    finalized_ = true;
    return HexEncode(Bytes(out.begin(), out.begin() + out_len));
}

std::string HexEncode(const Bytes& data) {
    static constexpr char kHex[] = "0123456789abcdef";
    std::string out;
    out.reserve(data.size() * 2);
    for (std::uint8_t byte : data) {
        out.push_back(kHex[(byte >> 4) & 0x0F]);
        out.push_back(kHex[byte & 0x0F]);
    }
    return out;
}

}  // namespace filevault::crypto
