#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace anonymizer {

inline constexpr std::string_view kDefaultEntityKey = "DEFAULT";

// Scalar operator parameter as received on the wire
using ParamValue = std::variant<std::string, int64_t, double, bool>;
using OperatorParams = std::map<std::string, ParamValue, std::less<>>;

// In-process transformation for the "custom" operator (never from the wire)
using CustomTransform = std::function<std::string(std::string_view)>;

/**
 * @brief One transformation rule: which operator, for which entity type
 */
struct OperatorConfig {
    std::string operator_name;
    std::string entity_type_key{kDefaultEntityKey};
    OperatorParams params;
    CustomTransform custom_transform;
    // Synthesized DEFAULT rule for a request that named no rules
    bool implicit = false;

    OperatorConfig() = default;
    OperatorConfig(std::string name, std::string key, OperatorParams p = {})
        : operator_name(std::move(name)), entity_type_key(std::move(key)), params(std::move(p)) {}

    [[nodiscard]] const ParamValue* find_param(std::string_view name) const {
        const auto it = params.find(name);
        return it != params.end() ? &it->second : nullptr;
    }

    template<typename T>
    [[nodiscard]] std::optional<T> param_as(std::string_view name) const {
        const auto* v = find_param(name);
        if (!v) return std::nullopt;
        if (const auto* typed = std::get_if<T>(v)) return *typed;
        return std::nullopt;
    }
};

// Keyed by entity type (or "DEFAULT"); one rule per key
using OperatorConfigMap = std::map<std::string, OperatorConfig, std::less<>>;

/**
 * @brief Rule for an entity type: specific rule first, then DEFAULT
 * @return nullptr when neither exists
 */
[[nodiscard]] inline const OperatorConfig* select_operator(
    const OperatorConfigMap& operators, std::string_view entity_type) {
    if (auto it = operators.find(entity_type); it != operators.end()) {
        return &it->second;
    }
    if (auto it = operators.find(kDefaultEntityKey); it != operators.end()) {
        return &it->second;
    }
    return nullptr;
}

} // namespace anonymizer
