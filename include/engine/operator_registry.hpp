#pragma once

#include "core/types.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace anonymizer {

enum class OperatorKind {
    REPLACE,
    REDACT,
    MASK,
    HASH,
    ENCRYPT,
    KEEP,
    CUSTOM,
    GENZ,
    DECRYPT
};

namespace op {
inline constexpr std::string_view kReplace = "replace";
inline constexpr std::string_view kRedact  = "redact";
inline constexpr std::string_view kMask    = "mask";
inline constexpr std::string_view kHash    = "hash";
inline constexpr std::string_view kEncrypt = "encrypt";
inline constexpr std::string_view kKeep    = "keep";
inline constexpr std::string_view kCustom  = "custom";
inline constexpr std::string_view kGenz    = "genz";
inline constexpr std::string_view kDecrypt = "decrypt";
} // namespace op

[[nodiscard]] std::string_view operator_kind_to_string(OperatorKind kind);

/**
 * @brief Deanonymizer kind that undoes a forward operator
 * @return std::nullopt for operators that destroy information
 */
[[nodiscard]] std::optional<OperatorKind> reverse_of(OperatorKind forward);

/**
 * @brief Fixed, ordered registry of the operator kinds one engine accepts
 *
 * The translator validates operator names against the same registry the
 * listing endpoints publish, so the two can never drift apart.
 */
class OperatorRegistry {
public:
    [[nodiscard]] static const OperatorRegistry& anonymizers();
    [[nodiscard]] static const OperatorRegistry& deanonymizers();

    [[nodiscard]] std::optional<OperatorKind> find(std::string_view name) const;
    [[nodiscard]] bool contains(std::string_view name) const { return find(name).has_value(); }

    // Published order is stable across calls
    [[nodiscard]] const std::vector<OperatorDescriptor>& descriptors() const { return descriptors_; }

    // Operator of the implicit DEFAULT rule when a request names none
    [[nodiscard]] std::string_view fallback_operator() const { return fallback_; }

    // "anonymizer" / "deanonymizer", used in validation messages
    [[nodiscard]] std::string_view role() const { return role_; }

private:
    OperatorRegistry(std::string role,
                     std::vector<std::pair<std::string, OperatorKind>> entries,
                     std::string fallback);

    std::string role_;
    std::vector<std::pair<std::string, OperatorKind>> entries_;
    std::vector<OperatorDescriptor> descriptors_;
    std::string fallback_;
};

} // namespace anonymizer
