#include "mojrpc/batch.hpp"
#include "mojrpc/codec.hpp"
#include "mojrpc/error_shaper.hpp"
#include <spdlog/spdlog.h>
#include <vector>

namespace mojrpc {

namespace {

nlohmann::json to_wire(const Response& resp) {
    nlohmann::json j;
    to_json(j, resp);
    return j;
}

nlohmann::json top_level_error(ErrorKind kind, std::optional<nlohmann::json> data = std::nullopt) {
    return to_wire(ErrorShaper::error_response(std::nullopt, ErrorShaper::shape(kind, std::move(data))));
}

} // anonymous namespace

BatchProcessor::BatchProcessor(Starter start, size_t max_batch_size)
    : start_(std::move(start)), max_batch_size_(max_batch_size) {}

std::optional<nlohmann::json> BatchProcessor::process(const nlohmann::json& body,
                                                      std::chrono::milliseconds timeout) const {
    if (body.is_object()) {
        auto resp = start_(body).complete(timeout);
        if (!resp) return std::nullopt;
        return to_wire(*resp);
    }
    if (body.is_array()) {
        return process_batch(body, timeout);
    }
    // Valid JSON that is neither a request nor a batch fails like unparseable input
    return top_level_error(ErrorKind::ParseError);
}

std::optional<nlohmann::json> BatchProcessor::process_batch(const nlohmann::json& items,
                                                            std::chrono::milliseconds timeout) const {
    if (items.empty()) {
        return top_level_error(ErrorKind::InvalidRequest, nlohmann::json("Empty batch"));
    }
    if (max_batch_size_ > 0 && items.size() > max_batch_size_) {
        spdlog::warn("rejecting batch of {} requests, limit is {}", items.size(), max_batch_size_);
        return top_level_error(ErrorKind::InvalidRequest,
                               nlohmann::json("Batch exceeds " + std::to_string(max_batch_size_) + " requests"));
    }

    // Start every item before waiting on any of them
    std::vector<PendingCall> calls;
    calls.reserve(items.size());
    for (const auto& item : items) {
        calls.push_back(start_(item));
    }

    nlohmann::json replies = nlohmann::json::array();
    for (auto& call : calls) {
        if (auto resp = call.complete(timeout)) {
            replies.push_back(to_wire(*resp));
        }
    }

    if (replies.empty()) return std::nullopt;
    return replies;
}

ServiceReply BatchProcessor::handle(std::string_view raw, std::chrono::milliseconds timeout) const {
    auto started = std::chrono::steady_clock::now();
    ServiceReply reply;

    nlohmann::json body;
    try {
        body = Codec::decode(raw);
    } catch (const RpcParseError& e) {
        spdlog::debug("rejecting undecodable body: {}", e.what());
        reply.malformed = true;
        reply.body = Codec::dump(top_level_error(ErrorKind::ParseError));
        return reply;
    }

    reply.malformed = !body.is_object() && !body.is_array();
    if (auto out = process(body, timeout)) {
        reply.body = Codec::dump(*out);
    }

    spdlog::debug("handled {} in {}us", body.is_array() ? "batch of " + std::to_string(body.size()) : "request",
                  std::chrono::duration_cast<std::chrono::microseconds>(
                      std::chrono::steady_clock::now() - started).count());
    return reply;
}

} // namespace mojrpc
