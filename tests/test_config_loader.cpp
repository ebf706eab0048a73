#include <catch2/catch_test_macros.hpp>
#include "config/config_loader.hpp"

#include <cstdlib>

using namespace anonymizer;

TEST_CASE("Config defaults", "[config]") {
    const AnonymizerConfig config;
    CHECK(config.server.host == "0.0.0.0");
    CHECK(config.server.port == 3000);
    CHECK(config.server.thread_pool_size == 4);
    CHECK(config.routes.anonymize == "/anonymize");
    CHECK(config.routes.genz_preview == "/genz-preview");
    CHECK(ConfigLoader::validate_config(config).empty());
}

TEST_CASE("Config loads server, logging and routes", "[config]") {
    const auto result = ConfigLoader::load_from_string(R"(
[server]
host = "127.0.0.1"
threads = 8
max_body_bytes = 4096

[logging]
level = "debug"

[routes]
anonymize = "/v2/anonymize"
)");
    REQUIRE(result.success);
    CHECK(result.config.server.host == "127.0.0.1");
    CHECK(result.config.server.thread_pool_size == 8);
    CHECK(result.config.server.max_body_bytes == 4096);
    CHECK(result.config.routes.anonymize == "/v2/anonymize");
    CHECK(result.config.routes.deanonymize == "/deanonymize");
}

TEST_CASE("Config validation rejects port 0", "[config]") {
    AnonymizerConfig config;
    config.server.port = 0;
    const auto errors = ConfigLoader::validate_config(config);
    REQUIRE(errors.size() == 1);
    CHECK(errors[0].find("server.port") != std::string::npos);
}

TEST_CASE("Config validation rejects a route without a leading slash", "[config]") {
    AnonymizerConfig config;
    config.routes.health = "health";
    const auto errors = ConfigLoader::validate_config(config);
    REQUIRE(errors.size() == 1);
    CHECK(errors[0].find("routes.health") != std::string::npos);
}

TEST_CASE("Config validation requires TLS files when TLS is enabled", "[config]") {
    AnonymizerConfig config;
    config.server.tls.enabled = true;
    CHECK(ConfigLoader::validate_config(config).size() == 2);

    config.server.tls.cert_file = "cert.pem";
    config.server.tls.key_file = "key.pem";
    CHECK(ConfigLoader::validate_config(config).empty());
}

TEST_CASE("Config validation rejects zero threads and unknown log levels", "[config]") {
    AnonymizerConfig config;
    config.server.thread_pool_size = 0;
    config.logging.level = "verbose";
    CHECK(ConfigLoader::validate_config(config).size() == 2);
}

TEST_CASE("Config combines every validation error", "[config]") {
    const auto result = ConfigLoader::load_from_string(R"(
[server]
threads = 0

[routes]
genz = "genz"
)");
    REQUIRE_FALSE(result.success);
    CHECK(result.error_message.find("server.threads") != std::string::npos);
    CHECK(result.error_message.find("routes.genz") != std::string::npos);
}

TEST_CASE("Config rejects a negative max_body_bytes", "[config]") {
    const auto result = ConfigLoader::load_from_string(R"(
[server]
max_body_bytes = -1
)");
    REQUIRE_FALSE(result.success);
    CHECK(result.error_message.find("server.max_body_bytes must be > 0, got -1") != std::string::npos);
}

TEST_CASE("Config expands environment variables in strings", "[config]") {
    ::setenv("ANONYMIZER_TEST_CERT_DIR", "/etc/anonymizer", 1);
    ::unsetenv("ANONYMIZER_TEST_UNSET");
    const auto result = ConfigLoader::load_from_string(R"(
[server.tls]
enabled = true
cert_file = "${ANONYMIZER_TEST_CERT_DIR}/cert.pem"
key_file = "${ANONYMIZER_TEST_CERT_DIR}/key${ANONYMIZER_TEST_UNSET}.pem"
)");
    REQUIRE(result.success);
    CHECK(result.config.server.tls.cert_file == "/etc/anonymizer/cert.pem");
    CHECK(result.config.server.tls.key_file == "/etc/anonymizer/key.pem");

    const auto unclosed = ConfigLoader::load_from_string(R"(
[logging]
level = "${LOG"
)");
    CHECK_FALSE(unclosed.success);
}

TEST_CASE("Config reports TOML syntax errors", "[config]") {
    const auto result = ConfigLoader::load_from_string("[server\nport = ");
    CHECK_FALSE(result.success);
    CHECK(result.error_message.find("Failed to parse config") != std::string::npos);
}

TEST_CASE("Config falls back to defaults when the file is missing", "[config]") {
    const auto result = ConfigLoader::load_from_file("/nonexistent/anonymizer.toml");
    REQUIRE(result.success);
    CHECK(result.config.routes.health == "/health");
}
