#include "engine/text_operators.hpp"
#include "engine/aes_cipher.hpp"
#include "core/utf8.hpp"

#include <openssl/evp.h>

#include <algorithm>
#include <format>
#include <variant>

namespace anonymizer {

namespace {

constexpr std::string_view kNewValue     = "new_value";
constexpr std::string_view kMaskingChar  = "masking_char";
constexpr std::string_view kCharsToMask  = "chars_to_mask";
constexpr std::string_view kFromEnd      = "from_end";
constexpr std::string_view kHashType     = "hash_type";
constexpr std::string_view kKey          = "key";

constexpr std::string_view kSha256 = "sha256";
constexpr std::string_view kSha512 = "sha512";

Status missing_or_wrong(std::string_view op_name, std::string_view param, std::string_view expected) {
    return Status::error(ErrorCategory::INVALID_PARAM, std::format(
        "Invalid input, {} operator requires '{}' of type {}", op_name, param, expected));
}

// Present and of type T, or absent when optional
template<typename T>
bool param_ok(const OperatorConfig& config, std::string_view name, bool required) {
    const auto* v = config.find_param(name);
    if (!v) return !required;
    return std::holds_alternative<T>(*v);
}

} // anonymous namespace

Status TextOperators::validate(OperatorKind kind, const OperatorConfig& config) {
    const auto name = operator_kind_to_string(kind);

    switch (kind) {
        case OperatorKind::REPLACE:
            if (!param_ok<std::string>(config, kNewValue, false)) {
                return missing_or_wrong(name, kNewValue, "string");
            }
            return Status::ok();

        case OperatorKind::MASK: {
            if (!param_ok<std::string>(config, kMaskingChar, true)) {
                return missing_or_wrong(name, kMaskingChar, "string");
            }
            if (utf8::length(*config.param_as<std::string>(kMaskingChar)) != 1) {
                return Status::error(ErrorCategory::INVALID_PARAM,
                    "Invalid input, masking_char must be a single character");
            }
            if (!param_ok<int64_t>(config, kCharsToMask, true)) {
                return missing_or_wrong(name, kCharsToMask, "integer");
            }
            if (*config.param_as<int64_t>(kCharsToMask) < 0) {
                return Status::error(ErrorCategory::INVALID_PARAM,
                    "Invalid input, chars_to_mask must be non-negative");
            }
            if (!param_ok<bool>(config, kFromEnd, true)) {
                return missing_or_wrong(name, kFromEnd, "boolean");
            }
            return Status::ok();
        }

        case OperatorKind::HASH: {
            if (!param_ok<std::string>(config, kHashType, false)) {
                return missing_or_wrong(name, kHashType, "string");
            }
            const auto hash_type = config.param_as<std::string>(kHashType).value_or(std::string(kSha256));
            if (hash_type != kSha256 && hash_type != kSha512) {
                return Status::error(ErrorCategory::INVALID_PARAM, std::format(
                    "Invalid input, hash_type '{}' is not supported (sha256, sha512)", hash_type));
            }
            return Status::ok();
        }

        case OperatorKind::ENCRYPT:
        case OperatorKind::DECRYPT: {
            if (!param_ok<std::string>(config, kKey, true)) {
                return missing_or_wrong(name, kKey, "string");
            }
            const auto cipher = AesCipher::create(*config.param_as<std::string>(kKey));
            if (cipher.is_error()) {
                return Status::error(cipher.error_category(), cipher.error_message());
            }
            return Status::ok();
        }

        case OperatorKind::CUSTOM:
            if (!config.custom_transform) {
                return Status::error(ErrorCategory::INVALID_PARAM,
                    "Invalid input, custom operator requires an in-process transform");
            }
            return Status::ok();

        case OperatorKind::REDACT:
        case OperatorKind::KEEP:
        case OperatorKind::GENZ:
            return Status::ok();
    }
    return Status::error(ErrorCategory::INTERNAL_ERROR, "Unhandled operator kind");
}

Result<std::string> TextOperators::apply(
    OperatorKind kind,
    std::string_view span,
    std::string_view entity_type,
    const OperatorConfig& config) {

    switch (kind) {
        case OperatorKind::REPLACE: {
            auto new_value = config.param_as<std::string>(kNewValue);
            return Result<std::string>::ok(
                new_value ? std::move(*new_value) : std::format("<{}>", entity_type));
        }

        case OperatorKind::REDACT:
            return Result<std::string>::ok(std::string());

        case OperatorKind::MASK:
            return Result<std::string>::ok(mask(
                span,
                *config.param_as<std::string>(kMaskingChar),
                static_cast<size_t>(*config.param_as<int64_t>(kCharsToMask)),
                *config.param_as<bool>(kFromEnd)));

        case OperatorKind::HASH:
            return hash(span, config.param_as<std::string>(kHashType).value_or(std::string(kSha256)));

        case OperatorKind::ENCRYPT: {
            auto cipher = AesCipher::create(*config.param_as<std::string>(kKey));
            if (cipher.is_error()) return Result<std::string>::error_from(cipher);
            return cipher.value().encrypt(span);
        }

        case OperatorKind::DECRYPT: {
            auto cipher = AesCipher::create(*config.param_as<std::string>(kKey));
            if (cipher.is_error()) return Result<std::string>::error_from(cipher);
            return cipher.value().decrypt(span);
        }

        case OperatorKind::KEEP:
            return Result<std::string>::ok(std::string(span));

        case OperatorKind::GENZ:
            return Result<std::string>::ok(genz(entity_type));

        case OperatorKind::CUSTOM:
            if (!config.custom_transform) {
                return invalid_param<std::string>(
                    "Invalid input, custom operator requires an in-process transform");
            }
            return Result<std::string>::ok(config.custom_transform(span));
    }
    return Result<std::string>::error(ErrorCategory::INTERNAL_ERROR, "Unhandled operator kind");
}

std::string TextOperators::mask(
    std::string_view value, std::string_view masking_char,
    size_t chars_to_mask, bool from_end) {

    const auto b = utf8::boundaries(value);
    const size_t len = b.size() - 1;
    const size_t n = std::min(chars_to_mask, len);

    // Code point range to overwrite
    const size_t first = from_end ? len - n : 0;
    const size_t last = from_end ? len : n;

    std::string result;
    result.reserve(value.size() + n * masking_char.size());
    result.append(value.substr(0, b[first]));
    for (size_t i = first; i < last; ++i) {
        result.append(masking_char);
    }
    result.append(value.substr(b[last]));
    return result;
}

Result<std::string> TextOperators::hash(std::string_view value, std::string_view hash_type) {
    const EVP_MD* md = nullptr;
    if (hash_type == kSha256) {
        md = EVP_sha256();
    } else if (hash_type == kSha512) {
        md = EVP_sha512();
    } else {
        return invalid_param<std::string>(std::format(
            "Invalid input, hash_type '{}' is not supported (sha256, sha512)", hash_type));
    }

    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_len = 0;
    if (EVP_Digest(value.data(), value.size(), digest, &digest_len, md, nullptr) != 1) {
        return Result<std::string>::error(ErrorCategory::INTERNAL_ERROR, "EVP_Digest failed");
    }

    std::string result;
    result.reserve(digest_len * 2);
    for (unsigned int i = 0; i < digest_len; ++i) {
        result += std::format("{:02x}", digest[i]);
    }
    return Result<std::string>::ok(std::move(result));
}

std::string TextOperators::genz(std::string_view entity_type) {
    if (entity_type == "PERSON") return "GOAT";
    if (entity_type == "PHONE_NUMBER") return "vibe check";
    return "no cap";
}

} // namespace anonymizer
