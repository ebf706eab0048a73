#pragma once

#include "core/types.hpp"

#include <string>
#include <vector>

namespace anonymizer {

/**
 * @brief Engine results → response JSON
 *
 * {"text": "...", "items": [{"entity_type", "start", "end", "operator", "text"}]}
 * Pure function of its input; items keep the engine's order.
 */
class ResultSerializer {
public:
    [[nodiscard]] static std::string serialize(const EngineResult& result);

    // ["hash","mask",...] in registry order
    [[nodiscard]] static std::string serialize_descriptors(const std::vector<OperatorDescriptor>& descriptors);
};

} // namespace anonymizer
