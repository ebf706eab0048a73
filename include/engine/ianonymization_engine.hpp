#pragma once

#include "core/error.hpp"
#include "core/operator_config.hpp"
#include "core/types.hpp"

#include <string>
#include <vector>

namespace anonymizer {

/**
 * @brief Forward transformation collaborator
 *
 * Implementations are constructed once and shared by every request thread,
 * so anonymize() must be safe for concurrent calls.
 */
class IAnonymizationEngine {
public:
    virtual ~IAnonymizationEngine() = default;

    [[nodiscard]] virtual Result<AnonymizationResult> anonymize(
        const std::string& text,
        const std::vector<DetectedEntity>& entities,
        const OperatorConfigMap& operators) const = 0;

    [[nodiscard]] virtual std::vector<OperatorDescriptor> get_anonymizers() const = 0;
};

} // namespace anonymizer
