#include "mojrpc/error_shaper.hpp"
#include <spdlog/spdlog.h>
#include <string>

namespace mojrpc {

int ErrorShaper::code_of(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::ParseError:     return -32700;
        case ErrorKind::InvalidRequest: return -32600;
        case ErrorKind::MethodNotFound: return -32601;
        case ErrorKind::InvalidParams:  return -32602;
        case ErrorKind::InternalError:  return -32603;
        case ErrorKind::Application:    break;
    }
    // Application codes come from the handler, never from the kind
    return -32603;
}

std::string_view ErrorShaper::message_of(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::ParseError:     return "Parse error";
        case ErrorKind::InvalidRequest: return "Invalid Request";
        case ErrorKind::MethodNotFound: return "Method not found";
        case ErrorKind::InvalidParams:  return "Invalid params";
        case ErrorKind::InternalError:  return "Internal error";
        case ErrorKind::Application:    break;
    }
    return "Server error";
}

JsonRpcError ErrorShaper::shape(ErrorKind kind, std::optional<nlohmann::json> data) {
    if (kind == ErrorKind::Application) {
        kind = ErrorKind::InternalError;
    }
    return JsonRpcError{code_of(kind), std::string(message_of(kind)), std::move(data)};
}

JsonRpcError ErrorShaper::shape(const RpcErr& err) {
    if (err.kind != ErrorKind::Application) {
        std::string message = err.message.empty() ? std::string(message_of(err.kind)) : err.message;
        return JsonRpcError{code_of(err.kind), std::move(message), err.data};
    }

    bool standard = err.code == -32700 || (err.code >= -32603 && err.code <= -32600);
    if (standard || (err.code >= RESERVED_MIN && err.code <= RESERVED_MAX)) {
        spdlog::warn("application error code {} is reserved by JSON-RPC, reporting internal error",
                     err.code);
        return shape(ErrorKind::InternalError);
    }
    std::string message = err.message.empty() ? std::string(message_of(err.kind)) : err.message;
    return JsonRpcError{err.code, std::move(message), err.data};
}

JsonRpcError ErrorShaper::shape(std::exception_ptr ex) {
    try {
        if (ex) std::rethrow_exception(ex);
    } catch (const RpcHandlerError& e) {
        return shape(e.err);
    } catch (const RpcTimeoutError& e) {
        spdlog::warn("handler timed out: {}", e.what());
        return JsonRpcError{code_of(ErrorKind::InternalError), "handler timed out", std::nullopt};
    } catch (const std::exception& e) {
        spdlog::error("handler raised an unexpected exception: {}", e.what());
        return shape(ErrorKind::InternalError);
    } catch (...) {
        spdlog::error("handler raised a non-standard exception");
        return shape(ErrorKind::InternalError);
    }
    return shape(ErrorKind::InternalError);
}

RpcErr ErrorShaper::from_wire(const JsonRpcError& err) {
    for (auto kind : {ErrorKind::ParseError, ErrorKind::InvalidRequest, ErrorKind::MethodNotFound,
                      ErrorKind::InvalidParams, ErrorKind::InternalError}) {
        if (err.code == code_of(kind)) {
            return RpcErr{kind, err.message, err.data, 0};
        }
    }
    return RpcErr::application(err.code, err.message, err.data);
}

Response ErrorShaper::error_response(std::optional<RequestId> id, JsonRpcError err) {
    Response resp;
    resp.id = std::move(id);
    resp.error = std::move(err);
    return resp;
}

} // namespace mojrpc
