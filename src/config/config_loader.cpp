#include "config/config_loader.hpp"
#include "core/utils.hpp"

#include <toml.hpp>

#include <charconv>
#include <cstdlib>
#include <filesystem>
#include <format>
#include <stdexcept>

namespace anonymizer {

// ============================================================================
// TOML Parsing Helpers
// ============================================================================

namespace {

// String setting with ${VAR} references replaced; unset variables expand to ""
std::string env_string(toml::node_view<const toml::node> node, const std::string& fallback) {
    std::string out = node.value_or(fallback);
    for (size_t open = out.find("${"); open != std::string::npos; open = out.find("${", open)) {
        const size_t close = out.find('}', open + 2);
        if (close == std::string::npos) {
            throw std::runtime_error(std::format("Unclosed ${{...}} in '{}'", out));
        }
        const char* env_val = std::getenv(out.substr(open + 2, close - open - 2).c_str());
        const std::string value = env_val ? env_val : "";
        out.replace(open, close - open + 1, value);
        open += value.size();
    }
    return out;
}

// ---- Section extractors ----------------------------------------------------

ServerConfig extract_server(const toml::table& root) {
    ServerConfig cfg;
    const auto* server = root["server"].as_table();
    if (!server) return cfg;
    const auto& s = *server;

    cfg.host = env_string(s["host"], cfg.host);
    cfg.port = s["port"].value_or(cfg.port);
    cfg.thread_pool_size = s["threads"].value_or(cfg.thread_pool_size);
    cfg.max_body_bytes = s["max_body_bytes"].value_or(cfg.max_body_bytes);

    if (const auto* tls = s["tls"].as_table()) {
        cfg.tls.enabled = (*tls)["enabled"].value_or(false);
        cfg.tls.cert_file = env_string((*tls)["cert_file"], "");
        cfg.tls.key_file = env_string((*tls)["key_file"], "");
    }
    return cfg;
}

LoggingConfig extract_logging(const toml::table& root) {
    LoggingConfig cfg;
    if (const auto* logging = root["logging"].as_table()) {
        cfg.level = env_string((*logging)["level"], cfg.level);
    }
    return cfg;
}

RouteConfig extract_routes(const toml::table& root) {
    RouteConfig cfg;
    const auto* routes = root["routes"].as_table();
    if (!routes) return cfg;
    const auto& r = *routes;

    cfg.anonymize     = env_string(r["anonymize"], cfg.anonymize);
    cfg.deanonymize   = env_string(r["deanonymize"], cfg.deanonymize);
    cfg.anonymizers   = env_string(r["anonymizers"], cfg.anonymizers);
    cfg.deanonymizers = env_string(r["deanonymizers"], cfg.deanonymizers);
    cfg.health        = env_string(r["health"], cfg.health);
    cfg.genz          = env_string(r["genz"], cfg.genz);
    cfg.genz_preview  = env_string(r["genz_preview"], cfg.genz_preview);
    return cfg;
}

AnonymizerConfig extract_all_sections(const toml::table& tbl) {
    AnonymizerConfig config;
    config.server = extract_server(tbl);
    config.logging = extract_logging(tbl);
    config.routes = extract_routes(tbl);
    return config;
}

} // anonymous namespace

// ============================================================================
// ConfigLoader Implementation
// ============================================================================

void ConfigLoader::apply_env_overrides(AnonymizerConfig& config, std::vector<std::string>& errors) {
    if (const char* port = std::getenv("PORT"); port && *port) {
        const std::string_view sv(port);
        int64_t value = 0;
        const auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), value);
        if (ec != std::errc{} || ptr != sv.data() + sv.size()) {
            errors.push_back(std::format("PORT must be an integer, got '{}'", sv));
        } else {
            config.server.port = value;
        }
    }
    if (const char* level = std::getenv("LOG_LEVEL"); level && *level) {
        config.logging.level = level;
    }
}

ConfigLoader::LoadResult ConfigLoader::finish(AnonymizerConfig config) {
    std::vector<std::string> errors;
    apply_env_overrides(config, errors);

    for (auto& err : validate_config(config)) {
        errors.push_back(std::move(err));
    }

    if (!errors.empty()) {
        std::string combined = "Config validation failed:";
        for (const auto& err : errors) { combined += "\n  - "; combined += err; }
        return LoadResult::error(std::move(combined));
    }
    return LoadResult::ok(std::move(config));
}

// ---- Public API ------------------------------------------------------------

ConfigLoader::LoadResult ConfigLoader::load_from_file(const std::string& config_path) {
    std::error_code ec;
    if (!std::filesystem::exists(config_path, ec)) {
        utils::log::warn(std::format("Config file '{}' not found, using defaults", config_path));
        return finish(AnonymizerConfig{});
    }

    try {
        return finish(extract_all_sections(toml::parse_file(config_path)));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to load config: {}", e.what()));
    }
}

ConfigLoader::LoadResult ConfigLoader::load_from_string(const std::string& toml_content) {
    try {
        return finish(extract_all_sections(toml::parse(toml_content)));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to parse config: {}", e.what()));
    }
}

// ============================================================================
// Config Validation
// ============================================================================

std::vector<std::string> ConfigLoader::validate_config(const AnonymizerConfig& config) {
    std::vector<std::string> errors;

    if (config.server.port < 1 || config.server.port > 65535) {
        errors.push_back(std::format("server.port must be 1-65535, got {}", config.server.port));
    }
    if (config.server.thread_pool_size < 1) {
        errors.push_back(std::format("server.threads must be >= 1, got {}", config.server.thread_pool_size));
    }
    if (config.server.max_body_bytes < 1) {
        errors.push_back(std::format("server.max_body_bytes must be > 0, got {}", config.server.max_body_bytes));
    }

    if (config.server.tls.enabled) {
        if (config.server.tls.cert_file.empty()) {
            errors.push_back("server.tls.cert_file required when TLS is enabled");
        }
        if (config.server.tls.key_file.empty()) {
            errors.push_back("server.tls.key_file required when TLS is enabled");
        }
    }

    if (!utils::log::parse_level(config.logging.level)) {
        errors.push_back(std::format(
            "logging.level must be one of debug, info, warning, error, got '{}'", config.logging.level));
    }

    const auto check_route = [&errors](std::string_view name, const std::string& path) {
        if (path.empty() || path.front() != '/') {
            errors.push_back(std::format("routes.{} must start with '/', got '{}'", name, path));
        }
    };
    const auto& r = config.routes;
    check_route("anonymize", r.anonymize);
    check_route("deanonymize", r.deanonymize);
    check_route("anonymizers", r.anonymizers);
    check_route("deanonymizers", r.deanonymizers);
    check_route("health", r.health);
    check_route("genz", r.genz);
    check_route("genz_preview", r.genz_preview);

    return errors;
}

} // namespace anonymizer
