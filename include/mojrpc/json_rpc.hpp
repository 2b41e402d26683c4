#pragma once
#include "error.hpp"
#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <variant>
#include <nlohmann/json.hpp>

namespace mojrpc {

// Helper to convert RequestId to json
inline void to_json(nlohmann::json& j, const RequestId& id) {
    std::visit([&j](const auto& v) { j = v; }, id);
}

inline void from_json(const nlohmann::json& j, RequestId& id) {
    if (j.is_number_integer()) {
        if (j.is_number_unsigned() && j.get<uint64_t>() > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
            throw std::invalid_argument("RequestId is out of range");
        }
        id = j.get<int64_t>();
    } else if (j.is_string()) {
        id = j.get<std::string>();
    } else {
        throw std::invalid_argument("RequestId must be integer or string");
    }
}

struct JsonRpcError {
    int code;
    std::string message;
    std::optional<nlohmann::json> data;

    bool operator==(const JsonRpcError& o) const {
        return code == o.code && message == o.message && data == o.data;
    }
};

inline void to_json(nlohmann::json& j, const JsonRpcError& e) {
    j = nlohmann::json{{"code", e.code}, {"message", e.message}};
    if (e.data) j["data"] = *e.data;
}

inline void from_json(const nlohmann::json& j, JsonRpcError& e) {
    e.code = j.at("code").get<int>();
    e.message = j.at("message").get<std::string>();
    if (j.contains("data")) e.data = j.at("data");
}

/// A decoded request. An empty id (absent or null on the wire) marks a notification.
struct Request {
    std::optional<RequestId> id;
    std::string method;
    std::optional<nlohmann::json> params;

    [[nodiscard]] bool is_notification() const { return !id.has_value(); }

    bool operator==(const Request& o) const {
        return id == o.id && method == o.method && params == o.params;
    }
};

/// Exactly one of result/error is set. An empty id serializes as null.
struct Response {
    std::optional<RequestId> id;
    std::optional<nlohmann::json> result;
    std::optional<JsonRpcError> error;

    [[nodiscard]] bool is_error() const { return error.has_value(); }

    bool operator==(const Response& o) const {
        return id == o.id && result == o.result && error == o.error;
    }
};

void to_json(nlohmann::json& j, const Request& r);
void from_json(const nlohmann::json& j, Request& r);

void to_json(nlohmann::json& j, const Response& r);
void from_json(const nlohmann::json& j, Response& r);

} // namespace mojrpc
