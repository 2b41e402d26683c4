#pragma once
#include "error.hpp"
#include "json_rpc.hpp"
#include <algorithm>
#include <functional>
#include <future>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <variant>
#include <vector>

namespace mojrpc {

using HandlerResult = std::variant<nlohmann::json, RpcErr>;

enum class ResolutionKind {
    Exact,
    Fallback,
    NotFound
};

[[nodiscard]] std::string_view to_string(ResolutionKind kind);

/// Namespace of a method: the part before the first '_'.
/// Methods without '_' (or starting with it) have no namespace.
[[nodiscard]] std::optional<std::string_view> method_namespace(std::string_view method);

/// Throws std::invalid_argument for an empty method name.
void validate_method_name(const std::string& method);

/// Throws std::invalid_argument for an empty namespace or one containing '_'.
void validate_namespace_name(const std::string& ns);

/// Method table plus per-namespace fallbacks.
///
/// Built once at startup and then only read; lookup() is safe for concurrent
/// callers as long as no registration happens at the same time. Registering
/// a name twice replaces the previous handler.
template<typename Context>
class Registry {
public:
    /// Runs on the service worker pool.
    using SyncHandler = std::function<HandlerResult(const Request& req, const Context& ctx)>;
    /// Starts its own work and returns a future. It must copy what it needs
    /// from the request before returning.
    using AsyncHandler = std::function<std::future<HandlerResult>(const Request& req, const Context& ctx)>;
    using Handler = std::variant<SyncHandler, AsyncHandler>;

    struct Resolution {
        ResolutionKind kind{ResolutionKind::NotFound};
        const Handler* handler{nullptr};
    };

    Registry& register_method(const std::string& method, SyncHandler handler) {
        validate_method_name(method);
        handlers_[method] = Handler{std::in_place_type<SyncHandler>, std::move(handler)};
        return *this;
    }

    Registry& register_async(const std::string& method, AsyncHandler handler) {
        validate_method_name(method);
        handlers_[method] = Handler{std::in_place_type<AsyncHandler>, std::move(handler)};
        return *this;
    }

    Registry& register_fallback(const std::string& ns, SyncHandler handler) {
        validate_namespace_name(ns);
        fallbacks_[ns] = Handler{std::in_place_type<SyncHandler>, std::move(handler)};
        return *this;
    }

    Registry& register_fallback_async(const std::string& ns, AsyncHandler handler) {
        validate_namespace_name(ns);
        fallbacks_[ns] = Handler{std::in_place_type<AsyncHandler>, std::move(handler)};
        return *this;
    }

    /// Exact match first, then the namespace fallback.
    [[nodiscard]] Resolution lookup(const std::string& method) const {
        if (auto it = handlers_.find(method); it != handlers_.end()) {
            return Resolution{ResolutionKind::Exact, &it->second};
        }
        if (auto ns = method_namespace(method)) {
            if (auto it = fallbacks_.find(std::string(*ns)); it != fallbacks_.end()) {
                return Resolution{ResolutionKind::Fallback, &it->second};
            }
        }
        return Resolution{};
    }

    [[nodiscard]] bool contains(const std::string& method) const {
        return handlers_.count(method) > 0;
    }

    [[nodiscard]] bool has_fallback(const std::string& ns) const {
        return fallbacks_.count(ns) > 0;
    }

    [[nodiscard]] std::vector<std::string> methods() const {
        return sorted_keys(handlers_);
    }

    [[nodiscard]] std::vector<std::string> namespaces() const {
        return sorted_keys(fallbacks_);
    }

private:
    static std::vector<std::string> sorted_keys(const std::unordered_map<std::string, Handler>& table) {
        std::vector<std::string> keys;
        keys.reserve(table.size());
        for (const auto& [name, handler] : table) {
            keys.push_back(name);
        }
        std::sort(keys.begin(), keys.end());
        return keys;
    }

    std::unordered_map<std::string, Handler> handlers_;
    std::unordered_map<std::string, Handler> fallbacks_;
};

} // namespace mojrpc
