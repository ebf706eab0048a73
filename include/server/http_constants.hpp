#pragma once

#include <string>
#include <string_view>

namespace anonymizer::http {

inline constexpr int kOk = 200;
inline constexpr int kBadRequest = 400;
inline constexpr int kUnprocessableEntity = 422;
inline constexpr int kInternalServerError = 500;

inline constexpr const char* kJsonContentType = "application/json";
inline constexpr const char* kTextContentType = "text/plain";
// std::string because cpp-httplib APIs require const std::string&
inline const std::string kContentTypeHeader = "Content-Type";

inline constexpr std::string_view kHealthMessage = "Anonymizer service is up";
inline constexpr std::string_view kInternalErrorMessage = "Internal server error";

} // namespace anonymizer::http
