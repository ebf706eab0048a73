#pragma once

#include "engine/ideanonymization_engine.hpp"

namespace anonymizer {

/**
 * @brief In-process deanonymization engine
 *
 * Each entity records the forward operator that produced it; the rule chosen
 * for its entity type must be that operator's inverse (decrypt for encrypt,
 * keep for keep). Restored spans must not overlap.
 */
class DeanonymizeEngine : public IDeanonymizationEngine {
public:
    [[nodiscard]] Result<DeanonymizationResult> deanonymize(
        const std::string& text,
        const std::vector<PIIEntity>& entities,
        const OperatorConfigMap& operators) const override;

    [[nodiscard]] std::vector<OperatorDescriptor> get_deanonymizers() const override;
};

} // namespace anonymizer
