#pragma once

#include <cstdint>
#include <string>

namespace anonymizer {

// ============================================================================
// Configuration Types (mirror the TOML hierarchy)
// ============================================================================

struct TlsConfig {
    bool enabled = false;
    std::string cert_file;            // Server certificate (PEM)
    std::string key_file;             // Server private key (PEM)
};

struct ServerConfig {
    std::string host = "0.0.0.0";
    int64_t port = 3000;              // Validated to 1-65535 before use
    int64_t thread_pool_size = 4;
    int64_t max_body_bytes = 1024 * 1024;
    TlsConfig tls;
};

struct LoggingConfig {
    std::string level = "info";
};

struct RouteConfig {
    std::string anonymize     = "/anonymize";
    std::string deanonymize   = "/deanonymize";
    std::string anonymizers   = "/anonymizers";
    std::string deanonymizers = "/deanonymizers";
    std::string health        = "/health";
    std::string genz          = "/genz";
    std::string genz_preview  = "/genz-preview";
};

struct AnonymizerConfig {
    ServerConfig server;
    LoggingConfig logging;
    RouteConfig routes;
};

} // namespace anonymizer
