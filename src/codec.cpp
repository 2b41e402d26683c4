#include "mojrpc/codec.hpp"
#include "mojrpc/error.hpp"
#include "mojrpc/version.hpp"
#include <nlohmann/json.hpp>
#include <simdjson.h>
#include <stdexcept>
#include <string>

namespace mojrpc {

namespace {

// Convert simdjson value to nlohmann::json recursively
nlohmann::json simdjson_to_nlohmann(simdjson::ondemand::value val) {
    switch (val.type()) {
        case simdjson::ondemand::json_type::object: {
            nlohmann::json obj = nlohmann::json::object();
            auto object = val.get_object();
            for (auto field : object) {
                std::string_view key = field.unescaped_key();
                obj[std::string(key)] = simdjson_to_nlohmann(field.value());
            }
            return obj;
        }
        case simdjson::ondemand::json_type::array: {
            nlohmann::json arr = nlohmann::json::array();
            for (auto elem : val.get_array()) {
                arr.push_back(simdjson_to_nlohmann(elem.value()));
            }
            return arr;
        }
        case simdjson::ondemand::json_type::string: {
            std::string_view sv = val.get_string();
            return nlohmann::json(std::string(sv));
        }
        case simdjson::ondemand::json_type::number: {
            // Try integer first, then double
            auto result_int = val.get_int64();
            if (result_int.error() == simdjson::SUCCESS) {
                return nlohmann::json(result_int.value());
            }
            auto result_uint = val.get_uint64();
            if (result_uint.error() == simdjson::SUCCESS) {
                return nlohmann::json(result_uint.value());
            }
            return nlohmann::json(val.get_double().value());
        }
        case simdjson::ondemand::json_type::boolean:
            return nlohmann::json(val.get_bool().value());
        case simdjson::ondemand::json_type::null:
            if (!val.is_null().value()) throw RpcParseError("Invalid literal");
            return nlohmann::json(nullptr);
        default:
            throw RpcParseError("Unknown JSON value type");
    }
}

// Scalar documents cannot be viewed as a value, so they are read directly.
nlohmann::json simdjson_scalar_doc_to_nlohmann(simdjson::ondemand::document& doc,
                                               simdjson::ondemand::json_type type) {
    switch (type) {
        case simdjson::ondemand::json_type::string: {
            std::string_view sv = doc.get_string();
            return nlohmann::json(std::string(sv));
        }
        case simdjson::ondemand::json_type::number: {
            auto result_int = doc.get_int64();
            if (result_int.error() == simdjson::SUCCESS) {
                return nlohmann::json(result_int.value());
            }
            return nlohmann::json(doc.get_double().value());
        }
        case simdjson::ondemand::json_type::boolean:
            return nlohmann::json(doc.get_bool().value());
        case simdjson::ondemand::json_type::null:
            if (!doc.is_null().value()) throw RpcParseError("Invalid literal");
            return nlohmann::json(nullptr);
        default:
            throw RpcParseError("Unknown JSON document type");
    }
}

nlohmann::json simdjson_doc_to_nlohmann(simdjson::ondemand::document& doc) {
    auto type = doc.type();
    if (type.error()) {
        throw RpcParseError(std::string("JSON parse error: ") + simdjson::error_message(type.error()));
    }
    nlohmann::json j;
    if (type.value() == simdjson::ondemand::json_type::object
        || type.value() == simdjson::ondemand::json_type::array) {
        auto val = doc.get_value();
        if (val.error()) {
            throw RpcParseError("Failed to get document value");
        }
        j = simdjson_to_nlohmann(val.value());
    } else {
        j = simdjson_scalar_doc_to_nlohmann(doc, type.value());
    }
    if (!doc.at_end()) {
        throw RpcParseError("Trailing content after JSON document");
    }
    return j;
}

} // anonymous namespace

nlohmann::json Codec::decode(std::string_view raw) {
    if (raw.empty()) {
        throw RpcParseError("Empty input");
    }

    simdjson::ondemand::parser parser;
    // simdjson requires padded input
    simdjson::padded_string padded(raw.data(), raw.size());

    simdjson::ondemand::document doc;
    auto error = parser.iterate(padded).get(doc);
    if (error) {
        throw RpcParseError(std::string("JSON parse error: ") + simdjson::error_message(error));
    }

    try {
        return simdjson_doc_to_nlohmann(doc);
    } catch (const RpcParseError&) {
        throw;
    } catch (const std::exception& e) {
        throw RpcParseError(std::string("JSON conversion error: ") + e.what());
    }
}

Request Codec::parse_request(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw RpcInvalidRequestError("Request must be a JSON object");
    }

    // Read the id first so later validation errors can still echo it
    Request req;
    if (j.contains("id") && !j.at("id").is_null()) {
        try {
            RequestId id;
            from_json(j.at("id"), id);
            req.id = std::move(id);
        } catch (const std::invalid_argument& e) {
            throw RpcInvalidRequestError(std::string("Invalid 'id': ") + e.what());
        }
    }

    if (!j.contains("jsonrpc")) {
        throw RpcInvalidRequestError("Missing 'jsonrpc' field", req.id);
    }
    const auto& version = j.at("jsonrpc");
    if (!version.is_string() || version.get<std::string>() != JSONRPC_VERSION) {
        throw RpcInvalidRequestError("Invalid jsonrpc version, expected '2.0'", req.id);
    }

    if (!j.contains("method")) {
        throw RpcInvalidRequestError("Missing 'method' field", req.id);
    }
    const auto& method = j.at("method");
    if (!method.is_string()) {
        throw RpcInvalidRequestError("'method' must be a string", req.id);
    }
    req.method = method.get<std::string>();
    if (req.method.empty()) {
        throw RpcInvalidRequestError("'method' must not be empty", req.id);
    }

    if (j.contains("params") && !j.at("params").is_null()) {
        const auto& params = j.at("params");
        if (!params.is_array() && !params.is_object()) {
            throw RpcInvalidRequestError("'params' must be an array or an object", req.id);
        }
        req.params = params;
    }
    return req;
}

std::string Codec::serialize(const Response& resp) {
    nlohmann::json j;
    to_json(j, resp);
    return dump(j);
}

std::string Codec::serialize_batch(const std::vector<Response>& resps) {
    nlohmann::json arr = nlohmann::json::array();
    for (const auto& resp : resps) {
        nlohmann::json j;
        to_json(j, resp);
        arr.push_back(std::move(j));
    }
    return dump(arr);
}

std::string Codec::dump(const nlohmann::json& j) {
    return j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

} // namespace mojrpc
