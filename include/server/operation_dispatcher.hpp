#pragma once

#include "engine/ianonymization_engine.hpp"
#include "engine/ideanonymization_engine.hpp"
#include "server/server_types.hpp"

#include <memory>
#include <vector>

namespace anonymizer {

/**
 * @brief Hands translated requests to the engines
 *
 * Engine results (success or classified failure) are returned unchanged; the
 * dispatcher adds no validation and never retries. Engines are injected once
 * at start-up and shared by every request thread.
 */
class OperationDispatcher {
public:
    OperationDispatcher(
        std::shared_ptr<const IAnonymizationEngine> anonymizer,
        std::shared_ptr<const IDeanonymizationEngine> deanonymizer)
        : anonymizer_(std::move(anonymizer)),
          deanonymizer_(std::move(deanonymizer)) {}

    [[nodiscard]] Result<AnonymizationResult> dispatch(const AnonymizationRequest& request) const {
        return anonymizer_->anonymize(request.text, request.entities, request.operators);
    }

    [[nodiscard]] Result<DeanonymizationResult> dispatch(const DeanonymizationRequest& request) const {
        return deanonymizer_->deanonymize(request.text, request.entities, request.operators);
    }

    [[nodiscard]] std::vector<OperatorDescriptor> anonymizers() const {
        return anonymizer_->get_anonymizers();
    }

    [[nodiscard]] std::vector<OperatorDescriptor> deanonymizers() const {
        return deanonymizer_->get_deanonymizers();
    }

private:
    std::shared_ptr<const IAnonymizationEngine> anonymizer_;
    std::shared_ptr<const IDeanonymizationEngine> deanonymizer_;
};

} // namespace anonymizer
