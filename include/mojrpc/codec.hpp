#pragma once
#include "json_rpc.hpp"
#include "error.hpp"
#include <string>
#include <string_view>
#include <vector>

namespace mojrpc {

class Codec {
public:
    /// Decode raw bytes into a JSON value.
    /// Throws RpcParseError on empty input, invalid JSON or trailing content.
    [[nodiscard]] static nlohmann::json decode(std::string_view raw);

    /// Validate the shape of one request object.
    /// Throws RpcInvalidRequestError; the exception keeps the id when it was usable.
    [[nodiscard]] static Request parse_request(const nlohmann::json& j);

    /// Serialize a response to a JSON string.
    [[nodiscard]] static std::string serialize(const Response& resp);

    /// Serialize a batch of responses as a JSON array.
    [[nodiscard]] static std::string serialize_batch(const std::vector<Response>& resps);

    /// Compact dump that replaces invalid UTF-8 instead of throwing.
    [[nodiscard]] static std::string dump(const nlohmann::json& j);
};

} // namespace mojrpc
