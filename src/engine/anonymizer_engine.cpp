#include "engine/anonymizer_engine.hpp"
#include "engine/operator_registry.hpp"
#include "engine/span_rewriter.hpp"
#include "engine/text_operators.hpp"
#include "core/utf8.hpp"

#include <algorithm>
#include <format>

namespace anonymizer {

Result<std::vector<DetectedEntity>> AnonymizerEngine::resolve_conflicts(
    std::vector<DetectedEntity> entities) {

    std::stable_sort(entities.begin(), entities.end(),
        [](const DetectedEntity& a, const DetectedEntity& b) {
            if (a.start != b.start) return a.start < b.start;
            return a.end < b.end;
        });

    std::vector<DetectedEntity> kept;
    kept.reserve(entities.size());

    for (auto& e : entities) {
        if (kept.empty() || e.start >= kept.back().end) {
            kept.push_back(std::move(e));
            continue;
        }

        auto& last = kept.back();
        if (e.start == last.start && e.end == last.end) {
            if (e.score > last.score) last = std::move(e);
        } else if (e.end <= last.end) {
            // e inside last
        } else if (e.start == last.start) {
            // last inside e
            last = std::move(e);
        } else if (e.entity_type == last.entity_type) {
            last.end = e.end;
            last.score = std::max(last.score, e.score);
        } else {
            return invalid_param<std::vector<DetectedEntity>>(std::format(
                "Invalid input, entities {} [{}, {}) and {} [{}, {}) overlap",
                last.entity_type, last.start, last.end, e.entity_type, e.start, e.end));
        }
    }
    return Result<std::vector<DetectedEntity>>::ok(std::move(kept));
}

Result<AnonymizationResult> AnonymizerEngine::anonymize(
    const std::string& text,
    const std::vector<DetectedEntity>& entities,
    const OperatorConfigMap& operators) const {

    const size_t text_len = utf8::length(text);
    for (const auto& e : entities) {
        if (e.start >= e.end) {
            return invalid_param<AnonymizationResult>(std::format(
                "Invalid input, start index '{}' must be smaller than end index '{}'", e.start, e.end));
        }
        if (e.end > text_len) {
            return invalid_param<AnonymizationResult>(std::format(
                "Invalid analyzer result, {} [{}, {}) is outside the text (length {})",
                e.entity_type, e.start, e.end, text_len));
        }
    }

    auto resolved = resolve_conflicts(entities);
    if (resolved.is_error()) return Result<AnonymizationResult>::error_from(resolved);

    const auto& registry = OperatorRegistry::anonymizers();
    const auto b = utf8::boundaries(text);

    std::vector<SpanEdit> edits;
    edits.reserve(resolved.value().size());

    for (const auto& e : resolved.value()) {
        const OperatorConfig* rule = select_operator(operators, e.entity_type);
        if (!rule) {
            return invalid_param<AnonymizationResult>(std::format(
                "Invalid input, no anonymizer configured for entity type '{}' and no DEFAULT rule",
                e.entity_type));
        }

        const auto kind = registry.find(rule->operator_name);
        if (!kind) {
            return invalid_param<AnonymizationResult>(std::format(
                "Invalid anonymizer type '{}'", rule->operator_name));
        }

        const auto valid = TextOperators::validate(*kind, *rule);
        if (valid.is_error()) {
            return Result<AnonymizationResult>::error(valid.error_category(), valid.error_message());
        }

        const std::string_view span(text.data() + b[e.start], b[e.end] - b[e.start]);
        auto replacement = TextOperators::apply(*kind, span, e.entity_type, *rule);
        if (replacement.is_error()) return Result<AnonymizationResult>::error_from(replacement);

        edits.push_back(SpanEdit{
            e.start, e.end, e.entity_type, rule->operator_name, std::move(replacement.value())});
    }

    return Result<AnonymizationResult>::ok(rewrite_spans(text, edits));
}

std::vector<OperatorDescriptor> AnonymizerEngine::get_anonymizers() const {
    return OperatorRegistry::anonymizers().descriptors();
}

} // namespace anonymizer
