/// Echo server: minimal JSON-RPC service demonstrating method registration.
/// Usage: ./echo_server [port]
/// Serves POST / on 127.0.0.1 (default port 8545).

#include <mojrpc/mojrpc.hpp>
#include <spdlog/spdlog.h>
#include <cstdlib>
#include <string>

struct EchoContext {};

int main(int argc, char** argv) {
    spdlog::set_level(spdlog::level::debug);

    mojrpc::Registry<EchoContext> registry;
    registry.register_method("moj_echo", [](const mojrpc::Request& req, const EchoContext&) -> mojrpc::HandlerResult {
        return nlohmann::json{{"echo", req.params.value_or(nlohmann::json::array())}};
    });

    mojrpc::Service<EchoContext> service{EchoContext{}, std::move(registry)};

    mojrpc::HttpServer::Options opts;
    if (argc > 1) {
        opts.port = static_cast<uint16_t>(std::strtoul(argv[1], nullptr, 10));
    }
    mojrpc::HttpServer server{opts, mojrpc::make_body_handler(service)};

    // Serve over HTTP, blocks until shutdown
    server.listen();
    return 0;
}
