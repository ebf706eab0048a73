#pragma once

#include "core/error.hpp"
#include "core/json.hpp"
#include "server/operation_dispatcher.hpp"
#include "server/server_types.hpp"

#include <memory>
#include <string>
#include <string_view>

namespace anonymizer {

/**
 * @brief Request handlers, independent of the HTTP library
 *
 * Each POST handler runs Received → Translating → Dispatching → Serializing
 * → Responded; any failure jumps straight to an ErrorMapper reply. Handlers
 * keep no state between calls and are safe to call from any worker thread.
 */
class AnonymizerService {
public:
    explicit AnonymizerService(std::shared_ptr<const OperationDispatcher> dispatcher)
        : dispatcher_(std::move(dispatcher)) {}

    // POST: body plus the request's Content-Type header
    [[nodiscard]] HttpReply anonymize(std::string_view body, std::string_view content_type) const;
    [[nodiscard]] HttpReply deanonymize(std::string_view body, std::string_view content_type) const;

    // Like anonymize, but absent anonymizers mean DEFAULT genz and custom rules are not pre-rejected
    [[nodiscard]] HttpReply genz(std::string_view body, std::string_view content_type) const;

    // GET
    [[nodiscard]] HttpReply anonymizers() const;
    [[nodiscard]] HttpReply deanonymizers() const;
    [[nodiscard]] static HttpReply genz_preview();
    [[nodiscard]] static HttpReply health();

    /**
     * @brief Request shape check: JSON content type, non-empty object body
     * @return BAD_REQUEST otherwise
     */
    [[nodiscard]] static Result<JsonValue> parse_body(std::string_view body, std::string_view content_type);

private:
    [[nodiscard]] HttpReply run_anonymize(std::string_view body, std::string_view content_type,
                                          bool genz_mode) const;

    // Outermost boundary: unexpected exceptions become a logged 500
    template<typename Handler>
    [[nodiscard]] HttpReply guarded(std::string_view route, Handler&& handler) const;

    std::shared_ptr<const OperationDispatcher> dispatcher_;
};

} // namespace anonymizer
