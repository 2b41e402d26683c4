#pragma once
#include "batch.hpp"
#include "codec.hpp"
#include "dispatcher.hpp"
#include "error_shaper.hpp"
#include "registry.hpp"
#include "worker_pool.hpp"
#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <spdlog/spdlog.h>

namespace mojrpc {

struct ServiceOptions {
    /// Upper bound for each handler invocation, unless the caller passes one.
    std::chrono::milliseconds handler_timeout{30000};
    /// Threads started up front for synchronous handlers; more are added when all are busy.
    int worker_threads = 4;
    /// 0 disables the limit.
    size_t max_batch_size = 0;
};

/// Binds a context and a registry behind a bytes-in, bytes-out entry point.
///
/// The registry is frozen once moved in. The context is handed to every
/// handler by const reference and is never modified by the service; any
/// mutable state inside it must synchronize itself.
template<typename Context>
class Service {
public:
    using Options = ServiceOptions;

    Service(Context context, Registry<Context> registry)
        : Service(std::move(context), std::move(registry), Options{}) {}

    Service(Context context, Registry<Context> registry, Options opts)
        : opts_(opts)
        , context_(std::move(context))
        , registry_(std::move(registry))
        , pool_(opts_.worker_threads)
        , dispatcher_(registry_, context_, pool_)
        , batch_([this](const nlohmann::json& item) { return dispatcher_.start(item); },
                 opts_.max_batch_size) {}

    // Non-copyable, non-movable
    Service(const Service&) = delete;
    Service& operator=(const Service&) = delete;

    /// Handle a raw body with the configured timeout.
    /// Returns nullopt when no response body must be sent.
    [[nodiscard]] std::optional<std::string> handle(std::string_view body) const {
        return handle_reply(body, opts_.handler_timeout).body;
    }

    [[nodiscard]] std::optional<std::string> handle(std::string_view body,
                                                    std::chrono::milliseconds timeout) const {
        return handle_reply(body, timeout).body;
    }

    /// Like handle(), but also reports whether the body was malformed.
    [[nodiscard]] ServiceReply handle_reply(std::string_view body) const {
        return handle_reply(body, opts_.handler_timeout);
    }

    [[nodiscard]] ServiceReply handle_reply(std::string_view body,
                                            std::chrono::milliseconds timeout) const {
        try {
            return batch_.handle(body, timeout);
        } catch (const std::exception& e) {
            spdlog::error("unexpected failure while handling request body: {}", e.what());
            ServiceReply reply;
            reply.body = Codec::serialize(
                ErrorShaper::error_response(std::nullopt, ErrorShaper::shape(ErrorKind::InternalError)));
            return reply;
        }
    }

    [[nodiscard]] const Registry<Context>& registry() const { return registry_; }
    [[nodiscard]] const Context& context() const { return context_; }
    [[nodiscard]] const Options& options() const { return opts_; }

private:
    Options opts_;
    Context context_;
    const Registry<Context> registry_;
    // Declared after the registry and context: workers are joined before those go away
    mutable WorkerPool pool_;
    Dispatcher<Context> dispatcher_;
    BatchProcessor batch_;
};

} // namespace mojrpc
