#pragma once
#include <string_view>

namespace mojrpc {

constexpr std::string_view LIBRARY_VERSION     = "0.1.0";
constexpr std::string_view JSONRPC_VERSION     = "2.0";

} // namespace mojrpc
