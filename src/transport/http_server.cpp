#include "mojrpc/transport/http_server.hpp"
#include "mojrpc/codec.hpp"
#include "mojrpc/error.hpp"
#include "mojrpc/error_shaper.hpp"

#include <httplib.h>
#include <spdlog/spdlog.h>

#include <algorithm>

namespace mojrpc {

HttpServer::HttpServer(Options opts, BodyHandler handler)
    : opts_(std::move(opts))
    , handler_(std::move(handler))
    , server_(std::make_unique<httplib::Server>())
    , bound_port_(opts_.port) {
    if (!handler_) {
        throw std::invalid_argument("HttpServer requires a body handler");
    }
}

HttpServer::~HttpServer() {
    shutdown();
}

bool HttpServer::validate_origin(const std::string& origin) const {
    if (opts_.allowed_origins.empty()) return true;
    return std::find(opts_.allowed_origins.begin(), opts_.allowed_origins.end(), origin)
           != opts_.allowed_origins.end();
}

void HttpServer::setup_routes() {
    const int threads = std::max(1, opts_.worker_threads);
    server_->new_task_queue = [threads] { return new httplib::ThreadPool(static_cast<size_t>(threads)); };
    server_->set_payload_max_length(opts_.max_body_bytes);

    // Preflight for browser clients
    server_->Options(opts_.path, [this](const httplib::Request& req, httplib::Response& res) {
        auto origin = req.get_header_value("Origin");
        if (!origin.empty() && !validate_origin(origin)) {
            res.status = 403;
            return;
        }
        res.set_header("Access-Control-Allow-Origin", origin.empty() ? "*" : origin);
        res.set_header("Access-Control-Allow-Methods", "POST, OPTIONS");
        res.set_header("Access-Control-Allow-Headers", "Content-Type");
        res.status = 204;
    });

    server_->Post(opts_.path, [this](const httplib::Request& req, httplib::Response& res) {
        auto origin = req.get_header_value("Origin");
        if (!origin.empty()) {
            if (!validate_origin(origin)) {
                res.status = 403;
                res.set_content("{\"error\":\"Invalid origin\"}", "application/json");
                return;
            }
            res.set_header("Access-Control-Allow-Origin", origin);
        }

        try {
            auto reply = handler_(req.body);
            if (!reply.body) {
                res.status = 204;
                return;
            }
            res.status = reply.malformed ? 400 : 200;
            res.set_content(*reply.body, "application/json");
        } catch (const std::exception& e) {
            spdlog::error("HTTP handler failed: {}", e.what());
            res.status = 500;
            res.set_content(Codec::serialize(ErrorShaper::error_response(
                                std::nullopt, ErrorShaper::shape(ErrorKind::InternalError))),
                            "application/json");
        }
    });
}

void HttpServer::listen() {
    if (running_.exchange(true)) return;

    setup_routes();

    if (opts_.port == 0) {
        int port = server_->bind_to_any_port(opts_.host);
        if (port < 0) {
            running_ = false;
            throw RpcTransportError("Failed to bind HTTP server on " + opts_.host);
        }
        bound_port_ = static_cast<uint16_t>(port);
    } else if (!server_->bind_to_port(opts_.host, opts_.port)) {
        running_ = false;
        throw RpcTransportError("Failed to bind HTTP server on " + opts_.host + ":"
                                + std::to_string(opts_.port));
    }

    spdlog::info("JSON-RPC server listening on http://{}:{}{}", opts_.host, bound_port_.load(), opts_.path);
    bool ok = server_->listen_after_bind();
    running_ = false;
    if (!ok) {
        spdlog::error("JSON-RPC server on {}:{} stopped unexpectedly", opts_.host, bound_port_.load());
    }
}

void HttpServer::shutdown() {
    if (server_) {
        server_->stop();
    }
}

bool HttpServer::is_running() const {
    return running_ && server_->is_running();
}

} // namespace mojrpc
