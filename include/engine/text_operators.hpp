#pragma once

#include "core/error.hpp"
#include "core/operator_config.hpp"
#include "engine/operator_registry.hpp"

#include <string>
#include <string_view>

namespace anonymizer {

/**
 * @brief Span transformations applied by the anonymizer engine
 *
 * - REPLACE: new_value, default "<ENTITY_TYPE>"
 * - REDACT:  empty string
 * - MASK:    masking_char over chars_to_mask code points, from start or end
 * - HASH:    sha256 (default) or sha512 hex digest
 * - ENCRYPT: AES-GCM, base64 output (see AesCipher)
 * - KEEP:    unchanged
 * - GENZ:    slang stand-in chosen by entity type
 * - CUSTOM:  in-process callable attached to the rule
 *
 * validate() checks the rule's params without touching any text, so a bad
 * rule fails before the first span is rewritten.
 */
class TextOperators {
public:
    [[nodiscard]] static Status validate(OperatorKind kind, const OperatorConfig& config);

    [[nodiscard]] static Result<std::string> apply(
        OperatorKind kind,
        std::string_view span,
        std::string_view entity_type,
        const OperatorConfig& config);

    [[nodiscard]] static std::string mask(
        std::string_view value, std::string_view masking_char,
        size_t chars_to_mask, bool from_end);

    [[nodiscard]] static Result<std::string> hash(std::string_view value, std::string_view hash_type);

    [[nodiscard]] static std::string genz(std::string_view entity_type);
};

} // namespace anonymizer
