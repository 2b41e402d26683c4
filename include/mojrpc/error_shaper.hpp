#pragma once
#include "error.hpp"
#include "json_rpc.hpp"
#include <exception>
#include <optional>
#include <string_view>

namespace mojrpc {

/// The only place where failures are turned into wire-level error objects.
class ErrorShaper {
public:
    /// Part of the reserved JSON-RPC range that application errors may not use.
    /// The implementation-defined server range [-32099, -32000] stays available.
    static constexpr int RESERVED_MIN = -32768;
    static constexpr int RESERVED_MAX = -32100;

    [[nodiscard]] static int code_of(ErrorKind kind);
    [[nodiscard]] static std::string_view message_of(ErrorKind kind);

    /// Standard error for a kind, with optional data.
    [[nodiscard]] static JsonRpcError shape(ErrorKind kind,
                                            std::optional<nlohmann::json> data = std::nullopt);

    /// Handler-reported error. Application codes inside the reserved range are
    /// normalized to InternalError.
    [[nodiscard]] static JsonRpcError shape(const RpcErr& err);

    /// Error escaping a handler. Only RpcHandlerError keeps its details.
    [[nodiscard]] static JsonRpcError shape(std::exception_ptr ex);

    /// Inverse mapping for errors received from another JSON-RPC peer: standard
    /// codes become their kind, everything else an application error.
    [[nodiscard]] static RpcErr from_wire(const JsonRpcError& err);

    [[nodiscard]] static Response error_response(std::optional<RequestId> id, JsonRpcError err);
};

} // namespace mojrpc
