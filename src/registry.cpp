#include "mojrpc/registry.hpp"
#include <stdexcept>

namespace mojrpc {

std::string_view to_string(ResolutionKind kind) {
    switch (kind) {
        case ResolutionKind::Exact:    return "exact";
        case ResolutionKind::Fallback: return "fallback";
        case ResolutionKind::NotFound: return "not-found";
    }
    return "unknown";
}

std::optional<std::string_view> method_namespace(std::string_view method) {
    auto pos = method.find('_');
    if (pos == std::string_view::npos || pos == 0) return std::nullopt;
    return method.substr(0, pos);
}

void validate_method_name(const std::string& method) {
    if (method.empty()) {
        throw std::invalid_argument("Method name must not be empty");
    }
}

void validate_namespace_name(const std::string& ns) {
    if (ns.empty()) {
        throw std::invalid_argument("Namespace must not be empty");
    }
    if (ns.find('_') != std::string::npos) {
        throw std::invalid_argument("Namespace must not contain '_': " + ns);
    }
}

} // namespace mojrpc
