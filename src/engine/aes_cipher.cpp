#include "engine/aes_cipher.hpp"
#include "core/base64.hpp"

#include <openssl/evp.h>
#include <openssl/hmac.h>

#include <format>
#include <memory>

namespace anonymizer {

namespace {

constexpr int kIvLen = 12;
constexpr int kTagLen = 16;

struct CipherCtxDeleter {
    void operator()(EVP_CIPHER_CTX* ctx) const { EVP_CIPHER_CTX_free(ctx); }
};
using CipherCtxPtr = std::unique_ptr<EVP_CIPHER_CTX, CipherCtxDeleter>;

const EVP_CIPHER* cipher_for(size_t key_len) {
    switch (key_len) {
        case 16: return EVP_aes_128_gcm();
        case 24: return EVP_aes_192_gcm();
        default: return EVP_aes_256_gcm();
    }
}

} // anonymous namespace

Result<AesCipher> AesCipher::create(std::string_view key) {
    if (!is_valid_key_length(key.size())) {
        return invalid_param<AesCipher>(std::format(
            "Invalid input, key must be of length 128, 192 or 256 bits, got {} bits",
            key.size() * 8));
    }
    return Result<AesCipher>::ok(AesCipher(std::vector<uint8_t>(key.begin(), key.end())));
}

Result<std::string> AesCipher::encrypt(std::string_view plaintext) const {
    // Synthetic IV: HMAC-SHA256(key, plaintext), truncated
    uint8_t mac[EVP_MAX_MD_SIZE];
    unsigned int mac_len = 0;
    if (!HMAC(EVP_sha256(), key_.data(), static_cast<int>(key_.size()),
              reinterpret_cast<const uint8_t*>(plaintext.data()), plaintext.size(),
              mac, &mac_len) || mac_len < kIvLen) {
        return Result<std::string>::error(ErrorCategory::INTERNAL_ERROR, "HMAC failed deriving IV");
    }

    CipherCtxPtr ctx(EVP_CIPHER_CTX_new());
    if (!ctx) {
        return Result<std::string>::error(ErrorCategory::INTERNAL_ERROR, "EVP_CIPHER_CTX_new failed");
    }

    std::vector<uint8_t> ciphertext(plaintext.size() + EVP_MAX_BLOCK_LENGTH);
    uint8_t tag[kTagLen];
    int len = 0;
    int ciphertext_len = 0;

    const auto fail = [] {
        return Result<std::string>::error(ErrorCategory::INTERNAL_ERROR, "AES-GCM encryption failed");
    };

    if (EVP_EncryptInit_ex(ctx.get(), cipher_for(key_.size()), nullptr, nullptr, nullptr) != 1 ||
        EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, kIvLen, nullptr) != 1 ||
        EVP_EncryptInit_ex(ctx.get(), nullptr, nullptr, key_.data(), mac) != 1) {
        return fail();
    }
    if (EVP_EncryptUpdate(ctx.get(), ciphertext.data(), &len,
            reinterpret_cast<const uint8_t*>(plaintext.data()),
            static_cast<int>(plaintext.size())) != 1) {
        return fail();
    }
    ciphertext_len = len;
    if (EVP_EncryptFinal_ex(ctx.get(), ciphertext.data() + ciphertext_len, &len) != 1) {
        return fail();
    }
    ciphertext_len += len;
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_GET_TAG, kTagLen, tag) != 1) {
        return fail();
    }

    // Pack: iv + ciphertext + tag
    std::vector<uint8_t> packed;
    packed.reserve(kIvLen + ciphertext_len + kTagLen);
    packed.insert(packed.end(), mac, mac + kIvLen);
    packed.insert(packed.end(), ciphertext.begin(), ciphertext.begin() + ciphertext_len);
    packed.insert(packed.end(), tag, tag + kTagLen);

    return Result<std::string>::ok(base64::encode(packed));
}

Result<std::string> AesCipher::decrypt(std::string_view ciphertext) const {
    const auto packed = base64::decode(ciphertext);
    if (!packed) {
        return invalid_param<std::string>("Invalid input, text to decrypt is not valid base64");
    }
    if (packed->size() < static_cast<size_t>(kIvLen + kTagLen)) {
        return invalid_param<std::string>("Invalid input, text to decrypt is too short");
    }

    const uint8_t* iv = packed->data();
    const size_t ct_len = packed->size() - kIvLen - kTagLen;
    const uint8_t* ct = packed->data() + kIvLen;
    const uint8_t* tag = packed->data() + kIvLen + ct_len;

    CipherCtxPtr ctx(EVP_CIPHER_CTX_new());
    if (!ctx) {
        return Result<std::string>::error(ErrorCategory::INTERNAL_ERROR, "EVP_CIPHER_CTX_new failed");
    }

    std::vector<uint8_t> plaintext(ct_len + EVP_MAX_BLOCK_LENGTH);
    int len = 0;
    int plaintext_len = 0;

    const bool setup_ok =
        EVP_DecryptInit_ex(ctx.get(), cipher_for(key_.size()), nullptr, nullptr, nullptr) == 1 &&
        EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, kIvLen, nullptr) == 1 &&
        EVP_DecryptInit_ex(ctx.get(), nullptr, nullptr, key_.data(), iv) == 1 &&
        EVP_DecryptUpdate(ctx.get(), plaintext.data(), &len, ct, static_cast<int>(ct_len)) == 1;
    if (!setup_ok) {
        return Result<std::string>::error(ErrorCategory::INTERNAL_ERROR, "AES-GCM decryption setup failed");
    }
    plaintext_len = len;

    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_TAG, kTagLen, const_cast<uint8_t*>(tag)) != 1) {
        return Result<std::string>::error(ErrorCategory::INTERNAL_ERROR, "AES-GCM tag setup failed");
    }

    if (EVP_DecryptFinal_ex(ctx.get(), plaintext.data() + len, &len) <= 0) {
        return invalid_param<std::string>(
            "Invalid input, text could not be decrypted with the given key");
    }
    plaintext_len += len;

    return Result<std::string>::ok(
        std::string(reinterpret_cast<const char*>(plaintext.data()), plaintext_len));
}

} // namespace anonymizer
