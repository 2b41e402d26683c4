#pragma once
#include <optional>
#include <stdexcept>
#include <string>
#include <variant>
#include <nlohmann/json.hpp>

namespace mojrpc {

using RequestId = std::variant<int64_t, std::string>;

/// Closed set of failure kinds. Numeric wire codes are assigned by ErrorShaper only.
enum class ErrorKind {
    ParseError,
    InvalidRequest,
    MethodNotFound,
    InvalidParams,
    InternalError,
    Application
};

/// Error value reported by a handler.
/// For ErrorKind::Application the handler supplies the code; for every other
/// kind the code is derived from the kind.
struct RpcErr {
    ErrorKind kind{ErrorKind::InternalError};
    std::string message;
    std::optional<nlohmann::json> data;
    int code{0};

    static RpcErr invalid_params(std::string message = {},
                                 std::optional<nlohmann::json> data = std::nullopt) {
        return RpcErr{ErrorKind::InvalidParams, std::move(message), std::move(data), 0};
    }

    static RpcErr internal(std::string message = {}) {
        return RpcErr{ErrorKind::InternalError, std::move(message), std::nullopt, 0};
    }

    static RpcErr application(int code, std::string message,
                              std::optional<nlohmann::json> data = std::nullopt) {
        return RpcErr{ErrorKind::Application, std::move(message), std::move(data), code};
    }

    bool operator==(const RpcErr& o) const {
        return kind == o.kind && message == o.message && data == o.data && code == o.code;
    }
};

class RpcError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// Raw bytes are not valid JSON.
class RpcParseError : public RpcError {
public:
    using RpcError::RpcError;
};

/// Valid JSON that is not a well-formed request. Keeps the request id when it
/// was usable so the error can still be correlated.
class RpcInvalidRequestError : public RpcError {
public:
    std::optional<RequestId> id;
    RpcInvalidRequestError(const std::string& msg, std::optional<RequestId> id = std::nullopt)
        : RpcError(msg), id(std::move(id)) {}
};

/// Thrown from inside a handler to report a JSON-RPC error instead of returning one.
class RpcHandlerError : public RpcError {
public:
    RpcErr err;
    explicit RpcHandlerError(RpcErr e)
        : RpcError(e.message), err(std::move(e)) {}
};

class RpcTransportError : public RpcError {
public:
    using RpcError::RpcError;
};

class RpcTimeoutError : public RpcError {
public:
    using RpcError::RpcError;
};

} // namespace mojrpc
