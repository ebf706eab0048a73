#pragma once

#include "config/config_types.hpp"

#include <memory>
#include <mutex>
#include <string>

// Forward-declare httplib types (avoids pulling in massive header-only library)
namespace httplib {
struct Request;
struct Response;
class Server;
}

namespace anonymizer {

class AnonymizerService;
struct HttpReply;

/**
 * @brief HTTP binding for AnonymizerService
 *
 * Route paths come from RouteConfig ([routes] in TOML). Requests run on a
 * cpp-httplib ThreadPool sized from server.threads; TLS is used when
 * server.tls is enabled.
 */
class HttpServer {
public:
    HttpServer(std::shared_ptr<const AnonymizerService> service,
               ServerConfig server_config = {},
               RouteConfig routes = {});
    ~HttpServer();

    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    // Blocks until stop() is called; throws if the socket cannot be bound
    void start();

    // Safe to call from another thread
    void stop();

private:
    void register_routes(httplib::Server& svr);

    static void write_reply(const HttpReply& reply, httplib::Response& res);

    std::shared_ptr<const AnonymizerService> service_;
    const ServerConfig config_;
    const RouteConfig routes_;

    std::mutex server_mutex_;
    std::unique_ptr<httplib::Server> server_;
};

} // namespace anonymizer
