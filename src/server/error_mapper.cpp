#include "server/error_mapper.hpp"
#include "server/http_constants.hpp"
#include "core/utils.hpp"

#include <format>

namespace anonymizer {

int ErrorMapper::status_for(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::INVALID_PARAM: return http::kUnprocessableEntity;
        case ErrorCategory::BAD_REQUEST:   return http::kBadRequest;
        case ErrorCategory::NONE:
        case ErrorCategory::INTERNAL_ERROR:
            return http::kInternalServerError;
    }
    return http::kInternalServerError;
}

HttpReply ErrorMapper::map(ErrorCategory category, std::string_view message) {
    HttpReply reply;
    reply.status = status_for(category);

    switch (category) {
        case ErrorCategory::INVALID_PARAM:
            utils::log::warn(std::format("Request failed with parameter validation error: {}", message));
            break;
        case ErrorCategory::BAD_REQUEST:
            utils::log::warn(std::format("Malformed request: {}", message));
            break;
        case ErrorCategory::NONE:
        case ErrorCategory::INTERNAL_ERROR:
            utils::log::error(std::format("A fatal error occurred during execution: {}", message));
            message = http::kInternalErrorMessage;
            break;
    }

    reply.body = std::format(R"({{"error":"{}"}})", utils::escape_json(message));
    return reply;
}

} // namespace anonymizer
