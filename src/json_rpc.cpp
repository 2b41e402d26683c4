#include "mojrpc/json_rpc.hpp"
#include "mojrpc/version.hpp"

namespace mojrpc {

namespace {

nlohmann::json id_to_json(const std::optional<RequestId>& id) {
    if (!id) return nullptr;
    nlohmann::json j;
    to_json(j, *id);
    return j;
}

std::optional<RequestId> id_from_json(const nlohmann::json& j, const char* key) {
    if (!j.contains(key) || j.at(key).is_null()) return std::nullopt;
    RequestId id;
    from_json(j.at(key), id);
    return id;
}

} // anonymous namespace

void to_json(nlohmann::json& j, const Request& r) {
    j = nlohmann::json::object();
    j["jsonrpc"] = std::string(JSONRPC_VERSION);
    if (r.id) j["id"] = id_to_json(r.id);
    j["method"] = r.method;
    if (r.params) j["params"] = *r.params;
}

void from_json(const nlohmann::json& j, Request& r) {
    r.id = id_from_json(j, "id");
    r.method = j.at("method").get<std::string>();
    if (j.contains("params") && !j.at("params").is_null()) {
        r.params = j.at("params");
    } else {
        r.params.reset();
    }
}

void to_json(nlohmann::json& j, const Response& r) {
    j = nlohmann::json::object();
    j["jsonrpc"] = std::string(JSONRPC_VERSION);
    j["id"] = id_to_json(r.id);
    if (r.error) {
        j["error"] = *r.error;
    } else {
        j["result"] = r.result ? *r.result : nlohmann::json(nullptr);
    }
}

void from_json(const nlohmann::json& j, Response& r) {
    r.id = id_from_json(j, "id");
    r.result.reset();
    r.error.reset();
    if (j.contains("error")) {
        r.error = j.at("error").get<JsonRpcError>();
    } else if (j.contains("result")) {
        r.result = j.at("result");
    }
}

} // namespace mojrpc
