#pragma once

#include "core/error.hpp"
#include "core/json.hpp"
#include "core/operator_config.hpp"
#include "core/types.hpp"
#include "engine/operator_registry.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace anonymizer {

// Request body field names (exact, case-sensitive)
namespace field {
inline constexpr std::string_view kText              = "text";
inline constexpr std::string_view kAnalyzerResults   = "analyzer_results";
inline constexpr std::string_view kAnonymizers       = "anonymizers";
inline constexpr std::string_view kAnonymizerResults = "anonymizer_results";
inline constexpr std::string_view kDeanonymizers     = "deanonymizers";
inline constexpr std::string_view kEntityType        = "entity_type";
inline constexpr std::string_view kStart             = "start";
inline constexpr std::string_view kEnd               = "end";
inline constexpr std::string_view kScore             = "score";
inline constexpr std::string_view kType              = "type";
inline constexpr std::string_view kOperator          = "operator";
inline constexpr std::string_view kKey               = "key";
} // namespace field

/**
 * @brief Translates untyped request JSON into the validated entity and
 *        operator model
 *
 * Every function is total over well-formed input and returns an
 * INVALID_PARAM result naming the offending field otherwise. Values are
 * never coerced: a string where a number is expected is always an error.
 */
class RequestTranslator {
public:
    /**
     * @brief analyzer_results → DetectedEntity list (order and count kept)
     * @param raw Array of {entity_type, start, end, score?}; null means empty
     */
    [[nodiscard]] static Result<std::vector<DetectedEntity>> parse_entities(const JsonValue& raw);

    /**
     * @brief anonymizers / deanonymizers → rule map keyed by entity type
     *
     * Accepts an object keyed by entity type ({"PERSON": {"type": ...}}), a
     * single inline rule ({"entity_type": "PERSON", "type": ...}) or an array
     * of inline rules. Null or empty input yields one implicit DEFAULT rule
     * using the registry's fallback operator.
     */
    [[nodiscard]] static Result<OperatorConfigMap> parse_operator_configs(
        const JsonValue& raw,
        const OperatorRegistry& registry = OperatorRegistry::anonymizers());

    // True iff any rule uses the "custom" operator
    [[nodiscard]] static bool reject_custom_operator(const OperatorConfigMap& configs);

    // Same check on the raw rules in any accepted shape, before validation
    [[nodiscard]] static bool reject_custom_operator(const JsonValue& raw);

    /**
     * @brief content.anonymizer_results → PIIEntity list
     *
     * Each entity must name the reversible operator that produced it.
     * "encrypt" entities need a key, taken from the entity or else from the
     * deanonymizer rule for its type.
     * @param raw content.anonymizer_results; null means empty
     * @param rules Parsed deanonymizers
     */
    [[nodiscard]] static Result<std::vector<PIIEntity>> parse_deanonymize_entities(
        const JsonValue& raw, const OperatorConfigMap& rules);

private:
    struct Span {
        std::string entity_type;
        size_t start = 0;
        size_t end = 0;
    };

    [[nodiscard]] static Result<Span> parse_span(
        const JsonValue& item, std::string_view collection, size_t index);

    [[nodiscard]] static Result<size_t> parse_offset(
        const JsonValue& item, std::string_view name, std::string_view collection, size_t index);

    [[nodiscard]] static Result<OperatorConfig> parse_rule(
        std::string key, const JsonValue& raw, const OperatorRegistry& registry);

    [[nodiscard]] static Result<ParamValue> parse_param(
        std::string_view name, const JsonValue& raw, std::string_view owner);
};

} // namespace anonymizer
