#include "server/anonymizer_service.hpp"
#include "server/error_mapper.hpp"
#include "server/http_constants.hpp"
#include "server/result_serializer.hpp"
#include "translator/request_translator.hpp"
#include "core/utils.hpp"

#include <format>

namespace anonymizer {

namespace {

constexpr std::string_view kInvalidJson = "Invalid request json";

HttpReply json_reply(std::string body) {
    HttpReply reply;
    reply.status = http::kOk;
    reply.body = std::move(body);
    return reply;
}

// "text" is optional and defaults to ""; any other non-string is rejected
Result<std::string> extract_text(const JsonValue& content) {
    const auto text = content[field::kText];
    if (text.is_null()) return Result<std::string>::ok(std::string{});
    if (!text.is_string()) {
        return invalid_param<std::string>(std::format(
            "Invalid input, {} must be a string, got {}", field::kText, text.type_name()));
    }
    return Result<std::string>::ok(text.get<std::string>());
}

} // anonymous namespace

template<typename Handler>
HttpReply AnonymizerService::guarded(std::string_view route, Handler&& handler) const {
    const utils::Timer timer;
    HttpReply reply;
    try {
        reply = handler();
    } catch (const std::exception& e) {
        reply = ErrorMapper::map(ErrorCategory::INTERNAL_ERROR, std::format("{}: {}", route, e.what()));
    }
    utils::log::debug(std::format("{} -> {} ({}us)", route, reply.status, timer.elapsed_us().count()));
    return reply;
}

// ============================================================================
// Request shape
// ============================================================================

Result<JsonValue> AnonymizerService::parse_body(std::string_view body, std::string_view content_type) {
    const auto bad_request = [] {
        return Result<JsonValue>::error(ErrorCategory::BAD_REQUEST, std::string(kInvalidJson));
    };

    // Parameters such as "; charset=utf-8" are allowed
    const auto media_type = utils::trim(utils::to_lower(content_type.substr(0, content_type.find(';'))));
    if (media_type != http::kJsonContentType) {
        return Result<JsonValue>::error(ErrorCategory::BAD_REQUEST,
            std::format("Content-Type must be {}", http::kJsonContentType));
    }

    if (utils::trim(std::string(body)).empty()) return bad_request();

    JsonValue content;
    try {
        content = JsonValue::parse(body);
    } catch (const JsonValue::parse_error&) {
        return bad_request();
    }

    if (!content.is_object() || content.empty()) return bad_request();
    return Result<JsonValue>::ok(std::move(content));
}

// ============================================================================
// Handlers
// ============================================================================

HttpReply AnonymizerService::run_anonymize(std::string_view body, std::string_view content_type,
                                           bool genz_mode) const {
    auto content = parse_body(body, content_type);
    if (content.is_error()) return ErrorMapper::map(content);
    const auto& json = content.value();

    const auto raw_rules = json[field::kAnonymizers];
    if (!genz_mode && RequestTranslator::reject_custom_operator(raw_rules)) {
        return ErrorMapper::map(ErrorCategory::BAD_REQUEST, "Custom type anonymizer is not supported");
    }

    Result<OperatorConfigMap> rules = Result<OperatorConfigMap>::ok({});
    if (genz_mode && (raw_rules.is_null() || ((raw_rules.is_object() || raw_rules.is_array()) && raw_rules.empty()))) {
        const std::string key(kDefaultEntityKey);
        OperatorConfigMap defaults;
        defaults.emplace(key, OperatorConfig(std::string(op::kGenz), key));
        rules = Result<OperatorConfigMap>::ok(std::move(defaults));
    } else {
        rules = RequestTranslator::parse_operator_configs(raw_rules, OperatorRegistry::anonymizers());
        if (rules.is_error()) return ErrorMapper::map(rules);
    }

    auto entities = RequestTranslator::parse_entities(json[field::kAnalyzerResults]);
    if (entities.is_error()) return ErrorMapper::map(entities);

    auto text = extract_text(json);
    if (text.is_error()) return ErrorMapper::map(text);

    const AnonymizationRequest request{
        std::move(text.value()), std::move(entities.value()), std::move(rules.value())};

    const auto result = dispatcher_->dispatch(request);
    if (result.is_error()) return ErrorMapper::map(result);

    return json_reply(ResultSerializer::serialize(result.value()));
}

HttpReply AnonymizerService::anonymize(std::string_view body, std::string_view content_type) const {
    return guarded("anonymize", [&] { return run_anonymize(body, content_type, false); });
}

HttpReply AnonymizerService::genz(std::string_view body, std::string_view content_type) const {
    return guarded("genz", [&] { return run_anonymize(body, content_type, true); });
}

HttpReply AnonymizerService::deanonymize(std::string_view body, std::string_view content_type) const {
    return guarded("deanonymize", [&]() -> HttpReply {
        auto content = parse_body(body, content_type);
        if (content.is_error()) return ErrorMapper::map(content);
        const auto& json = content.value();

        auto text = extract_text(json);
        if (text.is_error()) return ErrorMapper::map(text);

        auto rules = RequestTranslator::parse_operator_configs(
            json[field::kDeanonymizers], OperatorRegistry::deanonymizers());
        if (rules.is_error()) return ErrorMapper::map(rules);

        auto entities = RequestTranslator::parse_deanonymize_entities(json[field::kAnonymizerResults], rules.value());
        if (entities.is_error()) return ErrorMapper::map(entities);

        const DeanonymizationRequest request{
            std::move(text.value()), std::move(entities.value()), std::move(rules.value())};

        const auto result = dispatcher_->dispatch(request);
        if (result.is_error()) return ErrorMapper::map(result);

        return json_reply(ResultSerializer::serialize(result.value()));
    });
}

HttpReply AnonymizerService::anonymizers() const {
    return guarded("anonymizers", [this] {
        return json_reply(ResultSerializer::serialize_descriptors(dispatcher_->anonymizers()));
    });
}

HttpReply AnonymizerService::deanonymizers() const {
    return guarded("deanonymizers", [this] {
        return json_reply(ResultSerializer::serialize_descriptors(dispatcher_->deanonymizers()));
    });
}

HttpReply AnonymizerService::genz_preview() {
    return json_reply(
        R"({"example":"Call Emily at 577-988-1234",)"
        R"("example output":"Call GOAT at vibe check",)"
        R"("description":"Example output of the genz anonymizer."})");
}

HttpReply AnonymizerService::health() {
    HttpReply reply;
    reply.status = http::kOk;
    reply.body = std::string(http::kHealthMessage);
    reply.content_type = http::kTextContentType;
    return reply;
}

} // namespace anonymizer
