#include <catch2/catch_test_macros.hpp>
#include "engine/text_operators.hpp"

using namespace anonymizer;

namespace {

OperatorConfig rule(std::string name, OperatorParams params = {}) {
    return OperatorConfig(std::move(name), "PERSON", std::move(params));
}

std::string apply_ok(OperatorKind kind, std::string_view span, const OperatorConfig& config) {
    REQUIRE(TextOperators::validate(kind, config).is_ok());
    const auto r = TextOperators::apply(kind, span, "PERSON", config);
    REQUIRE(r.is_ok());
    return r.value();
}

} // anonymous namespace

// ============================================================================
// replace / redact / keep
// ============================================================================

TEST_CASE("Replace uses new_value", "[operators]") {
    CHECK(apply_ok(OperatorKind::REPLACE, "Emily", rule("replace", {{"new_value", std::string("GOAT")}})) == "GOAT");
}

TEST_CASE("Replace without new_value uses the entity placeholder", "[operators]") {
    CHECK(apply_ok(OperatorKind::REPLACE, "Emily", rule("replace")) == "<PERSON>");
}

TEST_CASE("Replace rejects a non-string new_value", "[operators]") {
    const auto s = TextOperators::validate(OperatorKind::REPLACE, rule("replace", {{"new_value", int64_t{5}}}));
    CHECK(s.error_category() == ErrorCategory::INVALID_PARAM);
}

TEST_CASE("Redact removes the span and keep leaves it", "[operators]") {
    CHECK(apply_ok(OperatorKind::REDACT, "Emily", rule("redact")).empty());
    CHECK(apply_ok(OperatorKind::KEEP, "Emily", rule("keep")) == "Emily");
}

// ============================================================================
// mask
// ============================================================================

TEST_CASE("Mask from end", "[operators][mask]") {
    CHECK(TextOperators::mask("577-988-1234", "*", 4, true) == "577-988-****");
}

TEST_CASE("Mask from start", "[operators][mask]") {
    CHECK(TextOperators::mask("577-988-1234", "#", 3, false) == "###-988-1234");
}

TEST_CASE("Mask larger than the span masks the whole span", "[operators][mask]") {
    CHECK(TextOperators::mask("Emily", "*", 100, false) == "*****");
    CHECK(TextOperators::mask("Emily", "*", 0, false) == "Emily");
}

TEST_CASE("Mask counts code points, not bytes", "[operators][mask]") {
    CHECK(TextOperators::mask("Zo\xC3\xAB", "*", 1, true) == "Zo*");
    CHECK(TextOperators::mask("abc", "\xE2\x80\xA2", 2, false) == "\xE2\x80\xA2\xE2\x80\xA2" "c");
}

TEST_CASE("Mask requires all parameters with the right types", "[operators][mask]") {
    const OperatorParams complete{
        {"masking_char", std::string("*")}, {"chars_to_mask", int64_t{4}}, {"from_end", true}};
    CHECK(TextOperators::validate(OperatorKind::MASK, rule("mask", complete)).is_ok());

    auto missing_char = complete;
    missing_char.erase("masking_char");
    CHECK(TextOperators::validate(OperatorKind::MASK, rule("mask", missing_char)).is_error());

    auto long_char = complete;
    long_char["masking_char"] = std::string("**");
    CHECK(TextOperators::validate(OperatorKind::MASK, rule("mask", long_char)).is_error());

    auto string_count = complete;
    string_count["chars_to_mask"] = std::string("4");
    CHECK(TextOperators::validate(OperatorKind::MASK, rule("mask", string_count)).is_error());

    auto negative = complete;
    negative["chars_to_mask"] = int64_t{-1};
    CHECK(TextOperators::validate(OperatorKind::MASK, rule("mask", negative)).is_error());

    auto missing_from_end = complete;
    missing_from_end.erase("from_end");
    const auto s = TextOperators::validate(OperatorKind::MASK, rule("mask", missing_from_end));
    REQUIRE(s.is_error());
    CHECK(s.error_category() == ErrorCategory::INVALID_PARAM);
    CHECK(s.error_message().find("from_end") != std::string::npos);
}

// ============================================================================
// hash
// ============================================================================

TEST_CASE("Hash defaults to sha256 lower-case hex", "[operators][hash]") {
    CHECK(apply_ok(OperatorKind::HASH, "abc", rule("hash")) ==
          "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST_CASE("Hash sha512", "[operators][hash]") {
    const auto out = apply_ok(OperatorKind::HASH, "abc", rule("hash", {{"hash_type", std::string("sha512")}}));
    CHECK(out.size() == 128);
    CHECK(out.starts_with("ddaf35a193617aba"));
}

TEST_CASE("Hash rejects unknown algorithms", "[operators][hash]") {
    const auto s = TextOperators::validate(OperatorKind::HASH, rule("hash", {{"hash_type", std::string("md5")}}));
    CHECK(s.error_category() == ErrorCategory::INVALID_PARAM);
}

// ============================================================================
// encrypt / decrypt / genz / custom
// ============================================================================

TEST_CASE("Encrypt requires a valid key", "[operators][encrypt]") {
    CHECK(TextOperators::validate(OperatorKind::ENCRYPT, rule("encrypt")).is_error());
    CHECK(TextOperators::validate(OperatorKind::ENCRYPT, rule("encrypt", {{"key", std::string("short")}}))
              .error_category() == ErrorCategory::INVALID_PARAM);
}

TEST_CASE("Encrypt then decrypt restores the span", "[operators][encrypt]") {
    const auto config = rule("encrypt", {{"key", std::string("WmZq4t7w!z%C&F)J")}});
    const auto encrypted = apply_ok(OperatorKind::ENCRYPT, "Emily", config);
    CHECK(encrypted != "Emily");
    CHECK(apply_ok(OperatorKind::DECRYPT, encrypted, config) == "Emily");
}

TEST_CASE("Genz replaces by entity type", "[operators][genz]") {
    CHECK(TextOperators::genz("PERSON") == "GOAT");
    CHECK(TextOperators::genz("PHONE_NUMBER") == "vibe check");
    CHECK(TextOperators::genz("EMAIL_ADDRESS") == "no cap");
}

TEST_CASE("Custom requires an in-process transform", "[operators][custom]") {
    auto config = rule("custom");
    CHECK(TextOperators::validate(OperatorKind::CUSTOM, config).error_category() == ErrorCategory::INVALID_PARAM);

    config.custom_transform = [](std::string_view s) { return std::string(s.size(), 'x'); };
    CHECK(apply_ok(OperatorKind::CUSTOM, "Emily", config) == "xxxxx");
}
