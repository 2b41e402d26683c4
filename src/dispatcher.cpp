#include "mojrpc/dispatcher.hpp"
#include <spdlog/spdlog.h>
#include <system_error>
#include <thread>

namespace mojrpc {

namespace {

std::string describe(const std::optional<RequestId>& id) {
    if (!id) return "none";
    if (const auto* i = std::get_if<int64_t>(&*id)) return std::to_string(*i);
    return "\"" + std::get<std::string>(*id) + "\"";
}

} // anonymous namespace

std::future<HandlerResult> make_failed_outcome(std::exception_ptr ex) {
    std::promise<HandlerResult> promise;
    promise.set_exception(std::move(ex));
    return promise.get_future();
}

PendingCall PendingCall::responded(std::optional<RequestId> id, JsonRpcError err) {
    PendingCall call;
    call.immediate_ = ErrorShaper::error_response(std::move(id), std::move(err));
    return call;
}

PendingCall PendingCall::suppressed(std::string method) {
    PendingCall call;
    call.method_ = std::move(method);
    return call;
}

PendingCall PendingCall::running(std::shared_ptr<const Request> request,
                                 ResolutionKind resolution,
                                 std::future<HandlerResult> outcome,
                                 std::shared_future<std::chrono::steady_clock::time_point> handler_started) {
    PendingCall call;
    call.method_ = request->method;
    call.request_ = std::move(request);
    call.resolution_ = resolution;
    call.outcome_ = std::move(outcome);
    call.handler_started_ = std::move(handler_started);
    return call;
}

std::optional<Response> PendingCall::complete(std::chrono::milliseconds timeout) {
    if (immediate_) {
        auto resp = std::move(immediate_);
        immediate_.reset();
        return resp;
    }
    if (!request_ || !outcome_.valid()) {
        return std::nullopt;
    }

    Response resp;
    resp.id = request_->id;

    // A deferred future reports ready immediately and runs inside get().
    if (outcome_.wait_until(handler_start() + timeout) == std::future_status::timeout) {
        abandon();
        resp.error = ErrorShaper::shape(
            std::make_exception_ptr(RpcTimeoutError("Request timed out: " + method_)));
    } else {
        try {
            auto result = outcome_.get();
            if (auto* ok = std::get_if<nlohmann::json>(&result)) {
                resp.result = std::move(*ok);
            } else {
                resp.error = ErrorShaper::shape(std::get<RpcErr>(result));
            }
        } catch (...) {
            resp.error = ErrorShaper::shape(std::current_exception());
        }
    }

    auto elapsed = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::steady_clock::now() - started_);
    if (resp.error) {
        spdlog::warn("{} id={} via {} failed with {} ({}) after {}us", method_, describe(resp.id),
                     to_string(resolution_), resp.error->code, resp.error->message, elapsed.count());
    } else {
        spdlog::debug("{} id={} via {} completed in {}us", method_, describe(resp.id),
                      to_string(resolution_), elapsed.count());
    }

    if (request_->is_notification()) {
        return std::nullopt;
    }
    return resp;
}

std::chrono::steady_clock::time_point PendingCall::handler_start() const {
    if (!handler_started_.valid()) return started_;
    // The pool adds a worker for every queued task, so the wait is short
    try {
        return handler_started_.get();
    } catch (const std::future_error& e) {
        spdlog::warn("{} never reported its start: {}", method_, e.what());
        return started_;
    }
}

void PendingCall::abandon() {
    // Futures of pool tasks do not block on destruction
    if (handler_started_.valid()) return;
    // A future from std::async blocks in its destructor. A detached waiter
    // holding only the future takes it over so the caller is released now.
    auto parked = std::make_shared<std::future<HandlerResult>>(std::move(outcome_));
    try {
        std::thread([parked] { parked->wait(); }).detach();
    } catch (const std::system_error& e) {
        spdlog::warn("could not detach timed out call {}: {}", method_, e.what());
    }
}

} // namespace mojrpc
