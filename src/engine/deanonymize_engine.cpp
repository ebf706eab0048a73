#include "engine/deanonymize_engine.hpp"
#include "engine/operator_registry.hpp"
#include "engine/span_rewriter.hpp"
#include "engine/text_operators.hpp"
#include "core/utf8.hpp"

#include <algorithm>
#include <format>

namespace anonymizer {

Result<DeanonymizationResult> DeanonymizeEngine::deanonymize(
    const std::string& text,
    const std::vector<PIIEntity>& entities,
    const OperatorConfigMap& operators) const {

    const size_t text_len = utf8::length(text);
    for (const auto& e : entities) {
        if (e.start >= e.end) {
            return invalid_param<DeanonymizationResult>(std::format(
                "Invalid input, start index '{}' must be smaller than end index '{}'", e.start, e.end));
        }
        if (e.end > text_len) {
            return invalid_param<DeanonymizationResult>(std::format(
                "Invalid input, {} [{}, {}) is outside the text (length {})",
                e.entity_type, e.start, e.end, text_len));
        }
    }

    std::vector<PIIEntity> sorted = entities;
    std::stable_sort(sorted.begin(), sorted.end(), [](const PIIEntity& a, const PIIEntity& b) {
        if (a.start != b.start) return a.start < b.start;
        return a.end < b.end;
    });
    for (size_t i = 1; i < sorted.size(); ++i) {
        if (sorted[i].start < sorted[i - 1].end) {
            return invalid_param<DeanonymizationResult>(std::format(
                "Invalid input, entities {} [{}, {}) and {} [{}, {}) overlap",
                sorted[i - 1].entity_type, sorted[i - 1].start, sorted[i - 1].end,
                sorted[i].entity_type, sorted[i].start, sorted[i].end));
        }
    }

    const auto& forward_registry = OperatorRegistry::anonymizers();
    const auto& registry = OperatorRegistry::deanonymizers();
    const auto b = utf8::boundaries(text);

    std::vector<SpanEdit> edits;
    edits.reserve(sorted.size());

    for (const auto& e : sorted) {
        const OperatorConfig* rule = select_operator(operators, e.entity_type);
        if (!rule) {
            return invalid_param<DeanonymizationResult>(std::format(
                "Invalid input, no deanonymizer configured for entity type '{}' and no DEFAULT rule",
                e.entity_type));
        }

        const auto forward = forward_registry.find(e.operator_name);
        const auto expected = forward ? reverse_of(*forward) : std::nullopt;

        // An implicit DEFAULT restores each span with the reverse of its own operator
        const auto kind = rule->implicit && expected ? expected : registry.find(rule->operator_name);
        if (!kind) {
            return invalid_param<DeanonymizationResult>(std::format(
                "Invalid deanonymizer type '{}'", rule->operator_name));
        }
        if (!expected || *expected != *kind) {
            return invalid_param<DeanonymizationResult>(std::format(
                "Invalid input, deanonymizer '{}' cannot restore {} produced by '{}'",
                rule->operator_name, e.entity_type, e.operator_name));
        }

        // The entity's own key takes precedence over the rule's
        OperatorConfig effective = *rule;
        if (e.key) {
            effective.params.insert_or_assign("key", ParamValue{*e.key});
        }

        const auto valid = TextOperators::validate(*kind, effective);
        if (valid.is_error()) {
            return Result<DeanonymizationResult>::error(valid.error_category(), valid.error_message());
        }

        const std::string_view span(text.data() + b[e.start], b[e.end] - b[e.start]);
        auto restored = TextOperators::apply(*kind, span, e.entity_type, effective);
        if (restored.is_error()) return Result<DeanonymizationResult>::error_from(restored);

        edits.push_back(SpanEdit{
            e.start, e.end, e.entity_type, std::string(operator_kind_to_string(*kind)),
            std::move(restored.value())});
    }

    return Result<DeanonymizationResult>::ok(rewrite_spans(text, edits));
}

std::vector<OperatorDescriptor> DeanonymizeEngine::get_deanonymizers() const {
    return OperatorRegistry::deanonymizers().descriptors();
}

} // namespace anonymizer
