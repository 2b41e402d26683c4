#pragma once
#include "../batch.hpp"
#include "../service.hpp"
#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

// Forward declarations to avoid including heavy httplib header
namespace httplib {
    class Server;
}

namespace mojrpc {

/// Serves a body handler on `POST <path>`.
///
/// Status mapping: 200 with the JSON reply, 204 when there is no reply
/// (notifications only), 400 for malformed bodies, 403 for a rejected
/// Origin, 413 for bodies above max_body_bytes.
class HttpServer {
public:
    struct Options {
        std::string host = "127.0.0.1";
        uint16_t port = 8545;              // 0 picks a free port
        std::string path = "/";
        size_t max_body_bytes = 5 * 1024 * 1024;
        std::vector<std::string> allowed_origins;   // empty accepts any origin
        int worker_threads = 8;
    };

    using BodyHandler = std::function<ServiceReply(std::string_view body)>;

    HttpServer(Options opts, BodyHandler handler);
    ~HttpServer();

    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    /// Bind and serve. Blocks until shutdown().
    void listen();

    void shutdown();

    [[nodiscard]] bool is_running() const;

    /// Bound port once listen() has bound the socket, otherwise the configured one.
    [[nodiscard]] uint16_t port() const { return bound_port_.load(); }

private:
    bool validate_origin(const std::string& origin) const;
    void setup_routes();

    Options opts_;
    BodyHandler handler_;
    std::unique_ptr<httplib::Server> server_;
    std::atomic<bool> running_{false};
    std::atomic<uint16_t> bound_port_;
};

/// Adapts a service to the HTTP body handler. The service must outlive the server.
template<typename Context>
HttpServer::BodyHandler make_body_handler(const Service<Context>& service) {
    return [&service](std::string_view body) { return service.handle_reply(body); };
}

} // namespace mojrpc
