#pragma once
#include "../json_rpc.hpp"
#include "../registry.hpp"
#include <chrono>
#include <memory>
#include <string>

namespace mojrpc {

/// Relays requests to an upstream JSON-RPC node over HTTP.
///
/// Meant as a namespace fallback, e.g. every eth_* method a sequencer does
/// not implement itself. Upstream results and errors are passed through;
/// transport failures become "upstream unavailable" internal errors.
class UpstreamForwarder {
public:
    struct Options {
        std::string url;       // http://host:port[/path]
        std::chrono::seconds connect_timeout{5};
        std::chrono::seconds read_timeout{30};
    };

    explicit UpstreamForwarder(Options opts);

    [[nodiscard]] HandlerResult forward(const Request& req) const;

    [[nodiscard]] const std::string& host() const { return host_; }
    [[nodiscard]] const std::string& path() const { return path_; }

private:
    Options opts_;
    std::string host_;   // scheme://host:port
    std::string path_;
};

/// Fallback handler that forwards through a shared forwarder.
template<typename Context>
typename Registry<Context>::SyncHandler make_upstream_fallback(std::shared_ptr<const UpstreamForwarder> upstream) {
    return [upstream = std::move(upstream)](const Request& req, const Context&) {
        return upstream->forward(req);
    };
}

} // namespace mojrpc
