#pragma once
#include "codec.hpp"
#include "error_shaper.hpp"
#include "json_rpc.hpp"
#include "registry.hpp"
#include "worker_pool.hpp"
#include <chrono>
#include <exception>
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <spdlog/spdlog.h>

namespace mojrpc {

/// A future that already holds the given exception.
[[nodiscard]] std::future<HandlerResult> make_failed_outcome(std::exception_ptr ex);

/// One request between dispatch and its terminal state.
///
/// A call is either answered right away (validation or lookup failure),
/// silently dropped (notification for an unknown method), or running a
/// handler whose outcome is awaited by complete().
class PendingCall {
public:
    /// Terminal without running a handler.
    static PendingCall responded(std::optional<RequestId> id, JsonRpcError err);

    /// Terminal without running a handler and without a reply.
    static PendingCall suppressed(std::string method);

    /// `handler_started` yields the moment a queued handler began running.
    /// Leave it empty when the handler was invoked in place (async handlers);
    /// the call then counts as started on creation.
    static PendingCall running(std::shared_ptr<const Request> request,
                               ResolutionKind resolution,
                               std::future<HandlerResult> outcome,
                               std::shared_future<std::chrono::steady_clock::time_point> handler_started = {});

    PendingCall(PendingCall&&) = default;
    PendingCall& operator=(PendingCall&&) = default;

    /// Wait for the handler (at most `timeout` after the handler began running)
    /// and shape the outcome. Returns nullopt when the call is suppressed.
    [[nodiscard]] std::optional<Response> complete(std::chrono::milliseconds timeout);

    [[nodiscard]] bool is_running() const { return outcome_.valid(); }
    [[nodiscard]] const std::string& method() const { return method_; }

private:
    PendingCall() = default;

    [[nodiscard]] std::chrono::steady_clock::time_point handler_start() const;
    void abandon();

    std::string method_;
    std::shared_ptr<const Request> request_;
    ResolutionKind resolution_{ResolutionKind::NotFound};
    std::optional<Response> immediate_;
    std::future<HandlerResult> outcome_;
    std::shared_future<std::chrono::steady_clock::time_point> handler_started_;
    std::chrono::steady_clock::time_point started_{std::chrono::steady_clock::now()};
};

/// Runs single requests against a registry: validate, resolve, invoke.
/// The registry, context and pool must outlive the dispatcher.
template<typename Context>
class Dispatcher {
public:
    using Handler = typename Registry<Context>::Handler;
    using SyncHandler = typename Registry<Context>::SyncHandler;
    using AsyncHandler = typename Registry<Context>::AsyncHandler;

    Dispatcher(const Registry<Context>& registry, const Context& context, WorkerPool& pool)
        : registry_(registry), context_(context), pool_(pool) {}

    /// Validate a raw request item and start it.
    [[nodiscard]] PendingCall start(const nlohmann::json& item) const {
        Request req;
        try {
            req = Codec::parse_request(item);
        } catch (const RpcInvalidRequestError& e) {
            spdlog::debug("rejecting malformed request: {}", e.what());
            return PendingCall::responded(
                e.id, ErrorShaper::shape(ErrorKind::InvalidRequest, nlohmann::json(e.what())));
        }
        return start(std::move(req));
    }

    /// Resolve an already validated request and start its handler.
    [[nodiscard]] PendingCall start(Request req) const {
        auto request = std::make_shared<const Request>(std::move(req));
        auto resolution = registry_.lookup(request->method);

        if (resolution.kind == ResolutionKind::NotFound) {
            if (request->is_notification()) {
                spdlog::warn("dropping notification for unknown method {}", request->method);
                return PendingCall::suppressed(request->method);
            }
            spdlog::debug("method not found: {}", request->method);
            return PendingCall::responded(request->id, ErrorShaper::shape(ErrorKind::MethodNotFound));
        }

        spdlog::debug("dispatching {} ({})", request->method, to_string(resolution.kind));
        return invoke(*resolution.handler, std::move(request), resolution.kind);
    }

    /// Start and wait for a single request.
    [[nodiscard]] std::optional<Response> dispatch(const nlohmann::json& item,
                                                   std::chrono::milliseconds timeout) const {
        return start(item).complete(timeout);
    }

private:
    PendingCall invoke(const Handler& handler, std::shared_ptr<const Request> request,
                       ResolutionKind resolution) const {
        std::future<HandlerResult> outcome;
        std::shared_future<std::chrono::steady_clock::time_point> handler_started;
        try {
            if (const auto* sync = std::get_if<SyncHandler>(&handler)) {
                auto started = std::make_shared<std::promise<std::chrono::steady_clock::time_point>>();
                auto started_at = started->get_future().share();
                outcome = pool_.submit([sync, request, started, ctx = &context_]() {
                    started->set_value(std::chrono::steady_clock::now());
                    return (*sync)(*request, *ctx);
                });
                handler_started = std::move(started_at);
            } else {
                outcome = std::get<AsyncHandler>(handler)(*request, context_);
                if (!outcome.valid()) {
                    throw RpcError("async handler returned an empty future");
                }
            }
        } catch (...) {
            outcome = make_failed_outcome(std::current_exception());
        }
        return PendingCall::running(std::move(request), resolution, std::move(outcome),
                                    std::move(handler_started));
    }

    const Registry<Context>& registry_;
    const Context& context_;
    WorkerPool& pool_;
};

} // namespace mojrpc
