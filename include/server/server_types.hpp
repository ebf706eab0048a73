#pragma once

#include "core/operator_config.hpp"
#include "core/types.hpp"

#include <string>
#include <vector>

namespace anonymizer {

// ============================================================================
// Request/Response Types
// ============================================================================

// Built per call by the translator, never mutated or shared
struct AnonymizationRequest {
    std::string text;
    std::vector<DetectedEntity> entities;
    OperatorConfigMap operators;
};

struct DeanonymizationRequest {
    std::string text;
    std::vector<PIIEntity> entities;
    OperatorConfigMap operators;
};

/**
 * @brief Transport-independent response produced by AnonymizerService
 */
struct HttpReply {
    int status = 200;
    std::string body;
    std::string content_type = "application/json";
};

} // namespace anonymizer
