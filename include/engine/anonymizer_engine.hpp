#pragma once

#include "engine/ianonymization_engine.hpp"

#include <vector>

namespace anonymizer {

/**
 * @brief In-process anonymization engine
 *
 * Stateless after construction; one instance serves all request threads.
 *
 * Processing order:
 *   1. bounds check every entity against the text (code points)
 *   2. resolve conflicting spans (see resolve_conflicts)
 *   3. pick each entity's rule (specific type, then DEFAULT) and validate it
 *   4. rewrite spans in ascending order, tracking output offsets
 */
class AnonymizerEngine : public IAnonymizationEngine {
public:
    [[nodiscard]] Result<AnonymizationResult> anonymize(
        const std::string& text,
        const std::vector<DetectedEntity>& entities,
        const OperatorConfigMap& operators) const override;

    [[nodiscard]] std::vector<OperatorDescriptor> get_anonymizers() const override;

    /**
     * @brief Sort by (start, end) and remove span conflicts
     *
     * - identical spans: higher score wins, first one on a tie
     * - span contained in another: dropped
     * - partial overlap, same type: merged into the union (max score)
     * - partial overlap, different types: INVALID_PARAM
     */
    [[nodiscard]] static Result<std::vector<DetectedEntity>> resolve_conflicts(
        std::vector<DetectedEntity> entities);
};

} // namespace anonymizer
