#pragma once
#include "dispatcher.hpp"
#include "json_rpc.hpp"
#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace mojrpc {

/// Result of handling one raw body.
struct ServiceReply {
    /// Empty when every request in the body was a notification.
    std::optional<std::string> body;
    /// The body was not JSON, or JSON that is neither an object nor an array.
    /// Transports may map this to a 4xx status.
    bool malformed{false};
};

/// Splits a body into single or batched requests, runs them concurrently and
/// recombines the replies in request order.
class BatchProcessor {
public:
    using Starter = std::function<PendingCall(const nlohmann::json& item)>;

    /// max_batch_size == 0 disables the limit.
    BatchProcessor(Starter start, size_t max_batch_size);

    /// Process a decoded body. Returns nullopt when nothing must be sent back.
    [[nodiscard]] std::optional<nlohmann::json> process(const nlohmann::json& body,
                                                        std::chrono::milliseconds timeout) const;

    /// Decode, process and serialize a raw body.
    [[nodiscard]] ServiceReply handle(std::string_view raw, std::chrono::milliseconds timeout) const;

private:
    std::optional<nlohmann::json> process_batch(const nlohmann::json& items,
                                                std::chrono::milliseconds timeout) const;

    Starter start_;
    size_t max_batch_size_;
};

} // namespace mojrpc
