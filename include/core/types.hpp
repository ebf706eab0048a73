#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace anonymizer {

// ============================================================================
// Entity Model
// ============================================================================

/**
 * @brief A span of sensitive text reported by the upstream analyzer
 *
 * Offsets are code point indices, start < end. Bounds against the text are
 * checked by the engine since text and entities arrive separately.
 */
struct DetectedEntity {
    std::string entity_type;
    size_t start = 0;
    size_t end = 0;
    double score = 0.0;

    DetectedEntity() = default;
    DetectedEntity(std::string type, size_t s, size_t e, double sc = 0.0)
        : entity_type(std::move(type)), start(s), end(e), score(sc) {}

    bool operator==(const DetectedEntity&) const = default;
};

/**
 * @brief A previously anonymized span that should be restored
 *
 * operator_name is the forward operator that produced the span; key is the
 * restoration key for "encrypt" spans (resolved by the translator from the
 * entity itself or from the matching deanonymizer rule).
 */
struct PIIEntity {
    std::string entity_type;
    size_t start = 0;
    size_t end = 0;
    std::string operator_name;
    std::optional<std::string> key;

    bool operator==(const PIIEntity&) const = default;
};

// ============================================================================
// Engine Results
// ============================================================================

/**
 * @brief Outcome for one processed entity; offsets refer to the output text
 */
struct OperatorResult {
    std::string entity_type;
    size_t start = 0;
    size_t end = 0;
    std::string operator_name;
    std::string text;

    bool operator==(const OperatorResult&) const = default;
};

// AnonymizationResult and DeanonymizationResult share this shape
struct EngineResult {
    std::string text;
    std::vector<OperatorResult> items;

    bool operator==(const EngineResult&) const = default;
};

using AnonymizationResult = EngineResult;
using DeanonymizationResult = EngineResult;

struct OperatorDescriptor {
    std::string name;

    bool operator==(const OperatorDescriptor&) const = default;
};

} // namespace anonymizer
