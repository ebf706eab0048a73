#include "server/http_server.hpp"
#include "server/anonymizer_service.hpp"
#include "server/http_constants.hpp"
#include "core/utils.hpp"

// cpp-httplib is header-only; suppress its internal deprecation warnings
#define CPPHTTPLIB_OPENSSL_SUPPORT
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wdeprecated-declarations"
#include <httplib.h>
#pragma GCC diagnostic pop

#include <format>
#include <stdexcept>

namespace anonymizer {

HttpServer::HttpServer(std::shared_ptr<const AnonymizerService> service,
                       ServerConfig server_config,
                       RouteConfig routes)
    : service_(std::move(service)),
      config_(std::move(server_config)),
      routes_(std::move(routes)) {}

HttpServer::~HttpServer() = default;

// ============================================================================
// start(): creates server, registers routes, listens
// ============================================================================

void HttpServer::start() {
    std::unique_ptr<httplib::Server> svr_ptr;
    if (config_.tls.enabled) {
        svr_ptr = std::make_unique<httplib::SSLServer>(
            config_.tls.cert_file.c_str(), config_.tls.key_file.c_str());
        if (!svr_ptr->is_valid()) {
            throw std::runtime_error(std::format(
                "Failed to initialize TLS with cert={}, key={}", config_.tls.cert_file, config_.tls.key_file));
        }
        utils::log::info(std::format("TLS enabled: cert={}, key={}",
            config_.tls.cert_file, config_.tls.key_file));
    } else {
        svr_ptr = std::make_unique<httplib::Server>();
    }
    auto& svr = *svr_ptr;

    const auto pool_size = static_cast<size_t>(config_.thread_pool_size);
    svr.new_task_queue = [pool_size] {
        return new httplib::ThreadPool(pool_size);
    };
    svr.set_payload_max_length(static_cast<size_t>(config_.max_body_bytes));

    register_routes(svr);

    {
        std::lock_guard lock(server_mutex_);
        server_ = std::move(svr_ptr);
    }

    utils::log::info(std::format("Starting Anonymizer Server on {}:{} ({}, {} threads)",
        config_.host, config_.port, config_.tls.enabled ? "HTTPS" : "HTTP", pool_size));

    if (!svr.listen(config_.host, static_cast<int>(config_.port))) {
        throw std::runtime_error(std::format(
            "Failed to start HTTP server on {}:{}", config_.host, config_.port));
    }
}

void HttpServer::stop() {
    std::lock_guard lock(server_mutex_);
    if (server_) {
        server_->stop();
        utils::log::info("Server stopped");
    }
}

// ============================================================================
// Route registration
// ============================================================================

void HttpServer::write_reply(const HttpReply& reply, httplib::Response& res) {
    res.status = reply.status;
    res.set_content(reply.body, reply.content_type);
}

void HttpServer::register_routes(httplib::Server& svr) {
    const auto content_type = [](const httplib::Request& req) {
        return req.get_header_value(http::kContentTypeHeader);
    };

    svr.Post(routes_.anonymize, [this, content_type](const httplib::Request& req, httplib::Response& res) {
        write_reply(service_->anonymize(req.body, content_type(req)), res);
    });
    svr.Post(routes_.deanonymize, [this, content_type](const httplib::Request& req, httplib::Response& res) {
        write_reply(service_->deanonymize(req.body, content_type(req)), res);
    });
    svr.Post(routes_.genz, [this, content_type](const httplib::Request& req, httplib::Response& res) {
        write_reply(service_->genz(req.body, content_type(req)), res);
    });

    svr.Get(routes_.anonymizers, [this](const httplib::Request&, httplib::Response& res) {
        write_reply(service_->anonymizers(), res);
    });
    svr.Get(routes_.deanonymizers, [this](const httplib::Request&, httplib::Response& res) {
        write_reply(service_->deanonymizers(), res);
    });
    svr.Get(routes_.genz_preview, [](const httplib::Request&, httplib::Response& res) {
        write_reply(AnonymizerService::genz_preview(), res);
    });
    svr.Get(routes_.health, [](const httplib::Request&, httplib::Response& res) {
        write_reply(AnonymizerService::health(), res);
    });

    // Anything escaping a handler is reported the same way as in the service
    svr.set_exception_handler([](const httplib::Request& req, httplib::Response& res, std::exception_ptr ep) {
        std::string detail = "unknown exception";
        try {
            std::rethrow_exception(ep);
        } catch (const std::exception& e) {
            detail = e.what();
        } catch (...) {
            detail = "non-standard exception";
        }
        utils::log::error(std::format("A fatal error occurred during execution: {} {}: {}",
            req.method, req.path, detail));
        res.status = http::kInternalServerError;
        res.set_content(std::format(R"({{"error":"{}"}})", http::kInternalErrorMessage), http::kJsonContentType);
    });
}

} // namespace anonymizer
