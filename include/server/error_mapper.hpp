#pragma once

#include "core/error.hpp"
#include "server/server_types.hpp"

#include <string_view>

namespace anonymizer {

/**
 * @brief Collapses a classified failure into a response
 *
 *   INVALID_PARAM  → 422, message echoed, logged at WARN
 *   BAD_REQUEST    → 400, message echoed, logged at WARN
 *   anything else  → 500, generic message, full detail logged at ERROR
 */
class ErrorMapper {
public:
    [[nodiscard]] static int status_for(ErrorCategory category);

    [[nodiscard]] static HttpReply map(ErrorCategory category, std::string_view message);

    template<typename T>
    [[nodiscard]] static HttpReply map(const Result<T>& result) {
        return map(result.error_category(), result.error_message());
    }
};

} // namespace anonymizer
