#pragma once

#include "core/error.hpp"

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace anonymizer {

/**
 * @brief AES-GCM cipher for the encrypt / decrypt operators
 *
 * Key size selects AES-128/192/256 (16, 24 or 32 bytes). The IV is the
 * first 12 bytes of HMAC-SHA256(key, plaintext), so equal inputs always
 * produce equal ciphertext.
 *
 * Wire format: base64(iv[12] || ciphertext || tag[16])
 */
class AesCipher {
public:
    [[nodiscard]] static Result<AesCipher> create(std::string_view key);

    [[nodiscard]] static bool is_valid_key_length(size_t len) {
        return len == 16 || len == 24 || len == 32;
    }

    [[nodiscard]] Result<std::string> encrypt(std::string_view plaintext) const;

    // INVALID_PARAM when the input is not base64, too short or fails authentication
    [[nodiscard]] Result<std::string> decrypt(std::string_view ciphertext) const;

private:
    explicit AesCipher(std::vector<uint8_t> key) : key_(std::move(key)) {}

    std::vector<uint8_t> key_;
};

} // namespace anonymizer
