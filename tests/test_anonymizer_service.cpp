#include <catch2/catch_test_macros.hpp>
#include "server/anonymizer_service.hpp"
#include "engine/anonymizer_engine.hpp"
#include "engine/deanonymize_engine.hpp"
#include "mocks/mock_engines.hpp"

#include <format>

using namespace anonymizer;
using namespace anonymizer::testing;

namespace {

constexpr std::string_view kJson = "application/json";

AnonymizerService make_service() {
    return AnonymizerService(std::make_shared<const OperationDispatcher>(
        std::make_shared<const AnonymizerEngine>(), std::make_shared<const DeanonymizeEngine>()));
}

// Value of a top-level string field in a response body
std::string json_string(const std::string& body, std::string_view key) {
    const auto json = JsonValue::parse(body);
    return json[key].get<std::string>();
}

} // anonymous namespace

// ============================================================================
// End-to-end scenarios
// ============================================================================

TEST_CASE("Anonymize replaces one entity and redacts the other", "[service]") {
    const auto service = make_service();
    const auto reply = service.anonymize(R"({
        "text": "Call Emily at 577-988-1234",
        "analyzer_results": [
            {"entity_type": "PERSON", "start": 5, "end": 10, "score": 0.9},
            {"entity_type": "PHONE_NUMBER", "start": 14, "end": 26, "score": 0.8}
        ],
        "anonymizers": {
            "PERSON": {"type": "replace", "new_value": "GOAT"},
            "DEFAULT": {"type": "redact"}
        }
    })", kJson);

    REQUIRE(reply.status == 200);
    CHECK(reply.content_type == "application/json");
    CHECK(reply.body ==
        R"({"text":"Call GOAT at ","items":[)"
        R"({"entity_type":"PERSON","start":5,"end":9,"operator":"replace","text":"GOAT"},)"
        R"({"entity_type":"PHONE_NUMBER","start":13,"end":13,"operator":"redact","text":""}]})");
}

TEST_CASE("Anonymize with no entities and no anonymizers returns the text", "[service]") {
    const auto service = make_service();
    const auto reply = service.anonymize(
        R"({"text": "hello world", "analyzer_results": []})", kJson);
    REQUIRE(reply.status == 200);
    CHECK(reply.body == R"({"text":"hello world","items":[]})");
}

TEST_CASE("Anonymize rejects a custom operator as a bad request", "[service]") {
    auto anon = std::make_shared<MockAnonymizationEngine>();
    const AnonymizerService service(std::make_shared<const OperationDispatcher>(
        anon, std::make_shared<MockDeanonymizationEngine>()));

    const auto inline_rule = service.anonymize(R"({
        "text": "hello world",
        "analyzer_results": [{"entity_type": "PERSON", "start": 0, "end": 5}],
        "anonymizers": {"entity_type": "PERSON", "type": "custom"}
    })", kJson);
    CHECK(inline_rule.status == 400);
    CHECK(json_string(inline_rule.body, "error") == "Custom type anonymizer is not supported");

    const auto keyed = service.anonymize(R"({
        "text": "hello world",
        "anonymizers": {"PERSON": {"type": "custom"}}
    })", kJson);
    CHECK(keyed.status == 400);
    CHECK(anon->call_count() == 0);
}

TEST_CASE("Custom operator wins over other rule errors", "[service]") {
    auto anon = std::make_shared<MockAnonymizationEngine>();
    const AnonymizerService service(std::make_shared<const OperationDispatcher>(
        anon, std::make_shared<MockDeanonymizationEngine>()));

    const auto bad_param = service.anonymize(R"({
        "text": "hello world",
        "anonymizers": {"PERSON": {"type": "custom", "lambda": {"f": 1}}}
    })", kJson);
    CHECK(bad_param.status == 400);
    CHECK(json_string(bad_param.body, "error") == "Custom type anonymizer is not supported");

    const auto unknown_first = service.anonymize(R"({
        "text": "hello world",
        "anonymizers": {"ADDRESS": {"type": "bogus"}, "PERSON": {"type": "custom"}}
    })", kJson);
    CHECK(unknown_first.status == 400);
    CHECK(json_string(unknown_first.body, "error") == "Custom type anonymizer is not supported");

    const auto unknown_only = service.anonymize(R"({
        "text": "hello world",
        "anonymizers": {"ADDRESS": {"type": "bogus"}}
    })", kJson);
    CHECK(unknown_only.status == 422);
    CHECK(anon->call_count() == 0);
}

TEST_CASE("Anonymize rejects a zero-width span before dispatch", "[service]") {
    auto anon = std::make_shared<MockAnonymizationEngine>();
    const AnonymizerService service(std::make_shared<const OperationDispatcher>(
        anon, std::make_shared<MockDeanonymizationEngine>()));

    const auto reply = service.anonymize(R"({
        "text": "Call Emily at 577-988-1234",
        "analyzer_results": [{"entity_type": "PERSON", "start": 10, "end": 10}]
    })", kJson);
    CHECK(reply.status == 422);
    CHECK(anon->call_count() == 0);
}

TEST_CASE("Anonymize maps engine parameter failures to 422", "[service]") {
    const auto service = make_service();
    const auto reply = service.anonymize(R"({
        "text": "Call Emily",
        "analyzer_results": [{"entity_type": "PERSON", "start": 5, "end": 10}],
        "anonymizers": {"PERSON": {"type": "encrypt", "key": "short"}}
    })", kJson);
    CHECK(reply.status == 422);
    CHECK(json_string(reply.body, "error").find("bits") != std::string::npos);
}

TEST_CASE("Anonymize with only a specific rule fails for other entity types", "[service]") {
    const auto service = make_service();
    const auto reply = service.anonymize(R"({
        "text": "Call Emily at 577-988-1234",
        "analyzer_results": [
            {"entity_type": "PERSON", "start": 5, "end": 10},
            {"entity_type": "PHONE_NUMBER", "start": 14, "end": 26}
        ],
        "anonymizers": {"PERSON": {"type": "redact"}}
    })", kJson);
    CHECK(reply.status == 422);
}

TEST_CASE("Internal engine failures become a generic 500", "[service]") {
    const AnonymizerService service(std::make_shared<const OperationDispatcher>(
        std::make_shared<MockAnonymizationEngine>(
            Result<AnonymizationResult>::error(ErrorCategory::INTERNAL_ERROR, "EVP failure at 0xdeadbeef")),
        std::make_shared<MockDeanonymizationEngine>()));

    const auto reply = service.anonymize(R"({"text": "x"})", kJson);
    CHECK(reply.status == 500);
    CHECK(reply.body == R"({"error":"Internal server error"})");
}

// ============================================================================
// Request shape
// ============================================================================

TEST_CASE("Malformed requests are rejected with 400", "[service]") {
    const auto service = make_service();
    CHECK(service.anonymize("", kJson).status == 400);
    CHECK(service.anonymize("   ", kJson).status == 400);
    CHECK(service.anonymize("{not json", kJson).status == 400);
    CHECK(service.anonymize("[1, 2]", kJson).status == 400);
    CHECK(service.anonymize("{}", kJson).status == 400);
    CHECK(service.anonymize(R"({"text": "x"})", "text/plain").status == 400);
    CHECK(service.deanonymize("{}", kJson).status == 400);
}

TEST_CASE("Content-Type parameters are accepted", "[service]") {
    const auto service = make_service();
    CHECK(service.anonymize(R"({"text": "x"})", "application/json; charset=utf-8").status == 200);
}

TEST_CASE("A non-string text is a parameter error", "[service]") {
    const auto service = make_service();
    CHECK(service.anonymize(R"({"text": 42})", kJson).status == 422);
}

// ============================================================================
// Deanonymize
// ============================================================================

TEST_CASE("Encrypt through anonymize and decrypt through deanonymize", "[service]") {
    const auto service = make_service();
    const std::string key = "WmZq4t7w!z%C&F)J";

    const auto anonymized = service.anonymize(std::format(R"({{
        "text": "My name is Emily",
        "analyzer_results": [{{"entity_type": "PERSON", "start": 11, "end": 16}}],
        "anonymizers": {{"DEFAULT": {{"type": "encrypt", "key": "{}"}}}}
    }})", key), kJson);
    REQUIRE(anonymized.status == 200);

    const auto json = JsonValue::parse(anonymized.body);
    const auto text = json["text"].get<std::string>();
    const auto item = json["items"][size_t{0}];

    const auto restored = service.deanonymize(std::format(R"({{
        "text": "{}",
        "anonymizer_results": [{{"entity_type": "PERSON", "start": {}, "end": {}, "operator": "encrypt"}}],
        "deanonymizers": {{"DEFAULT": {{"type": "decrypt", "key": "{}"}}}}
    }})", text, item["start"].get<size_t>(), item["end"].get<size_t>(), key), kJson);
    REQUIRE(restored.status == 200);
    CHECK(json_string(restored.body, "text") == "My name is Emily");
}

TEST_CASE("Deanonymize requires a key for encrypted entities", "[service]") {
    const auto service = make_service();
    const auto reply = service.deanonymize(R"({
        "text": "abc",
        "anonymizer_results": [{"entity_type": "PERSON", "start": 0, "end": 3, "operator": "encrypt"}]
    })", kJson);
    CHECK(reply.status == 422);
}

TEST_CASE("Deanonymize without deanonymizers restores keep spans", "[service]") {
    const auto service = make_service();
    const auto reply = service.deanonymize(R"({
        "text": "Hello Bob",
        "anonymizer_results": [{"entity_type": "PERSON", "start": 6, "end": 9, "operator": "keep"}]
    })", kJson);
    REQUIRE(reply.status == 200);
    CHECK(reply.body == R"({"text":"Hello Bob","items":[{"entity_type":"PERSON","start":6,"end":9,"operator":"keep","text":"Bob"}]})");
}

TEST_CASE("An explicit decrypt rule does not restore keep spans", "[service]") {
    const auto service = make_service();
    const auto reply = service.deanonymize(R"({
        "text": "Hello Bob",
        "anonymizer_results": [{"entity_type": "PERSON", "start": 6, "end": 9, "operator": "keep"}],
        "deanonymizers": {"DEFAULT": {"type": "decrypt", "key": "WmZq4t7w!z%C&F)J"}}
    })", kJson);
    CHECK(reply.status == 422);
}

// ============================================================================
// genz
// ============================================================================

TEST_CASE("Genz with no anonymizers uses slang replacements", "[service][genz]") {
    const auto service = make_service();
    const auto reply = service.genz(R"({
        "text": "Call Emily at 577-988-1234",
        "analyzer_results": [
            {"entity_type": "PERSON", "start": 5, "end": 10},
            {"entity_type": "PHONE_NUMBER", "start": 14, "end": 26}
        ]
    })", kJson);
    REQUIRE(reply.status == 200);
    CHECK(json_string(reply.body, "text") == "Call GOAT at vibe check");
}

TEST_CASE("Genz does not pre-reject custom rules", "[service][genz]") {
    const auto service = make_service();
    const auto reply = service.genz(R"({
        "text": "Call Emily",
        "analyzer_results": [{"entity_type": "PERSON", "start": 5, "end": 10}],
        "anonymizers": {"PERSON": {"type": "custom"}}
    })", kJson);
    CHECK(reply.status == 422);
}

TEST_CASE("Genz preview is a fixed example", "[service][genz]") {
    const auto reply = AnonymizerService::genz_preview();
    CHECK(reply.status == 200);
    CHECK(json_string(reply.body, "example") == "Call Emily at 577-988-1234");
    CHECK(json_string(reply.body, "example output") == "Call GOAT at vibe check");
}

// ============================================================================
// Listing and health
// ============================================================================

TEST_CASE("Listing endpoints match the translator's registry", "[service]") {
    const auto service = make_service();

    const auto anonymizers = service.anonymizers();
    CHECK(anonymizers.status == 200);
    CHECK(anonymizers.body == R"(["hash","mask","redact","replace","custom","keep","encrypt","genz"])");

    const auto listed = JsonValue::parse(anonymizers.body);
    REQUIRE(listed.size() == OperatorRegistry::anonymizers().descriptors().size());
    for (size_t i = 0; i < listed.size(); ++i) {
        CHECK(OperatorRegistry::anonymizers().contains(listed[i].get<std::string>()));
    }

    CHECK(service.deanonymizers().body == R"(["decrypt","keep"])");
    CHECK(service.anonymizers().body == anonymizers.body);
}

TEST_CASE("Health check returns plain text", "[service]") {
    const auto reply = AnonymizerService::health();
    CHECK(reply.status == 200);
    CHECK(reply.body == "Anonymizer service is up");
    CHECK(reply.content_type == "text/plain");
}
