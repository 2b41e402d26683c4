#include "mojrpc/transport/upstream.hpp"
#include "mojrpc/codec.hpp"
#include "mojrpc/error.hpp"
#include "mojrpc/error_shaper.hpp"

#include <httplib.h>
#include <spdlog/spdlog.h>

namespace mojrpc {

namespace {

constexpr const char* UPSTREAM_UNAVAILABLE = "upstream unavailable";

} // anonymous namespace

UpstreamForwarder::UpstreamForwarder(Options opts)
    : opts_(std::move(opts)) {
    // Support http://host:port/path
    std::string url = opts_.url;
    std::string scheme = "http://";
    if (url.substr(0, 7) == "http://") {
        url = url.substr(7);
    } else if (url.substr(0, 8) == "https://") {
        throw std::invalid_argument("TLS upstreams are not supported: " + opts_.url);
    }

    auto slash = url.find('/');
    std::string hostport = (slash == std::string::npos) ? url : url.substr(0, slash);
    if (hostport.empty()) {
        throw std::invalid_argument("Upstream URL has no host: " + opts_.url);
    }
    host_ = scheme + hostport;
    path_ = (slash == std::string::npos) ? "/" : url.substr(slash);
}

HandlerResult UpstreamForwarder::forward(const Request& req) const {
    nlohmann::json body;
    to_json(body, req);

    // One client per call: calls arrive concurrently from the worker pool
    httplib::Client client(host_);
    client.set_connection_timeout(opts_.connect_timeout);
    client.set_read_timeout(opts_.read_timeout);

    auto result = client.Post(path_, Codec::dump(body), "application/json");
    if (!result) {
        spdlog::warn("upstream {} failed for {}: {}", host_, req.method, httplib::to_string(result.error()));
        return RpcErr::internal(UPSTREAM_UNAVAILABLE);
    }
    if (result->status < 200 || result->status >= 300) {
        // Some nodes answer JSON-RPC errors with a 4xx and a regular error body
        if (result->body.empty()) {
            spdlog::warn("upstream {} answered {} with HTTP {}", host_, req.method, result->status);
            return RpcErr::internal(UPSTREAM_UNAVAILABLE);
        }
    }
    if (req.is_notification() || result->body.empty()) {
        return nlohmann::json(nullptr);
    }

    Response resp;
    try {
        auto reply = Codec::decode(result->body);
        if (!reply.is_object()) {
            throw RpcParseError("upstream reply is not a JSON object");
        }
        from_json(reply, resp);
    } catch (const std::exception& e) {
        spdlog::warn("upstream {} sent an unusable reply for {}: {}", host_, req.method, e.what());
        return RpcErr::internal(UPSTREAM_UNAVAILABLE);
    }

    if (resp.error) {
        return ErrorShaper::from_wire(*resp.error);
    }
    return resp.result ? *resp.result : nlohmann::json(nullptr);
}

} // namespace mojrpc
