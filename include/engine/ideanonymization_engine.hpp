#pragma once

#include "core/error.hpp"
#include "core/operator_config.hpp"
#include "core/types.hpp"

#include <string>
#include <vector>

namespace anonymizer {

/**
 * @brief Reverse transformation collaborator (thread-safe, shared)
 */
class IDeanonymizationEngine {
public:
    virtual ~IDeanonymizationEngine() = default;

    [[nodiscard]] virtual Result<DeanonymizationResult> deanonymize(
        const std::string& text,
        const std::vector<PIIEntity>& entities,
        const OperatorConfigMap& operators) const = 0;

    [[nodiscard]] virtual std::vector<OperatorDescriptor> get_deanonymizers() const = 0;
};

} // namespace anonymizer
