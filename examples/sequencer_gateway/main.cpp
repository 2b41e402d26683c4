/// Sequencer gateway: serves its own moj_* methods and forwards every eth_*
/// call it does not implement to an upstream execution node.
///
/// Usage: ./sequencer_gateway [--host H] [--port P] [--upstream URL] [--timeout-ms N]

#include <mojrpc/mojrpc.hpp>
#include <spdlog/spdlog.h>

#include <cstdlib>
#include <iostream>
#include <map>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

/// Proof jobs submitted through moj_sendProofInput. Shared by all handlers.
class JobStore {
public:
    uint64_t submit(nlohmann::json input) {
        std::lock_guard<std::mutex> lock(mutex_);
        uint64_t id = next_id_++;
        pending_[id] = std::move(input);
        return id;
    }

    std::vector<uint64_t> pending_ids() const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<uint64_t> ids;
        for (const auto& [id, input] : pending_) ids.push_back(id);
        return ids;
    }

    bool contains(uint64_t id) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return pending_.count(id) > 0;
    }

private:
    mutable std::mutex mutex_;
    std::map<uint64_t, nlohmann::json> pending_;
    uint64_t next_id_{1};
};

struct GatewayContext {
    std::string chain_id;
    std::shared_ptr<JobStore> jobs;
};

struct Args {
    std::string host = "127.0.0.1";
    uint16_t port = 8545;
    std::string upstream = "http://127.0.0.1:8546";
    long timeout_ms = 30000;
};

Args parse_args(int argc, char** argv) {
    Args args;
    for (int i = 1; i + 1 < argc; i += 2) {
        std::string key = argv[i];
        std::string value = argv[i + 1];
        if (key == "--host") {
            args.host = value;
        } else if (key == "--port") {
            args.port = static_cast<uint16_t>(std::strtoul(value.c_str(), nullptr, 10));
        } else if (key == "--upstream") {
            args.upstream = value;
        } else if (key == "--timeout-ms") {
            args.timeout_ms = std::strtol(value.c_str(), nullptr, 10);
        } else {
            throw std::invalid_argument("Unknown option: " + key);
        }
    }
    return args;
}

mojrpc::Registry<GatewayContext> build_registry(std::shared_ptr<const mojrpc::UpstreamForwarder> upstream) {
    using mojrpc::HandlerResult;
    using mojrpc::Request;
    using mojrpc::RpcErr;

    mojrpc::Registry<GatewayContext> registry;

    registry.register_method("moj_sendProofInput", [](const Request& req, const GatewayContext& ctx) -> HandlerResult {
        if (!req.params || !req.params->is_array() || req.params->empty()) {
            return RpcErr::invalid_params("expected [proofInput]");
        }
        return nlohmann::json(ctx.jobs->submit(req.params->at(0)));
    });

    registry.register_method("moj_getPendingJobIds", [](const Request&, const GatewayContext& ctx) -> HandlerResult {
        return nlohmann::json(ctx.jobs->pending_ids());
    });

    registry.register_method("moj_getProof", [](const Request& req, const GatewayContext& ctx) -> HandlerResult {
        if (!req.params || !req.params->is_array() || req.params->empty()
            || !req.params->at(0).is_number_unsigned()) {
            return RpcErr::invalid_params("expected [jobId]");
        }
        auto id = req.params->at(0).get<uint64_t>();
        if (!ctx.jobs->contains(id)) {
            return RpcErr::application(-32000, "unknown job", nlohmann::json(id));
        }
        // Proofs are produced by the prover; until then the job is pending
        return nlohmann::json{{"jobId", id}, {"status", "pending"}};
    });

    // Answered locally; everything else in eth_* goes upstream
    registry.register_method("eth_chainId", [](const Request&, const GatewayContext& ctx) -> HandlerResult {
        return nlohmann::json(ctx.chain_id);
    });
    registry.register_fallback("eth", mojrpc::make_upstream_fallback<GatewayContext>(upstream));
    registry.register_fallback("net", mojrpc::make_upstream_fallback<GatewayContext>(upstream));

    return registry;
}

} // namespace

int main(int argc, char** argv) {
    Args args;
    try {
        args = parse_args(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << e.what() << "\n"
                  << "usage: sequencer_gateway [--host H] [--port P] [--upstream URL] [--timeout-ms N]\n";
        return 2;
    }

    spdlog::set_level(spdlog::level::info);

    std::shared_ptr<const mojrpc::UpstreamForwarder> upstream;
    try {
        mojrpc::UpstreamForwarder::Options uopts;
        uopts.url = args.upstream;
        upstream = std::make_shared<const mojrpc::UpstreamForwarder>(uopts);
    } catch (const std::invalid_argument& e) {
        spdlog::error("invalid upstream: {}", e.what());
        return 2;
    }

    mojrpc::ServiceOptions sopts;
    sopts.handler_timeout = std::chrono::milliseconds(args.timeout_ms);
    sopts.max_batch_size = 1000;

    GatewayContext context{"0x1", std::make_shared<JobStore>()};
    mojrpc::Service<GatewayContext> service{std::move(context), build_registry(upstream), sopts};

    mojrpc::HttpServer::Options hopts;
    hopts.host = args.host;
    hopts.port = args.port;
    mojrpc::HttpServer server{hopts, mojrpc::make_body_handler(service)};

    spdlog::info("forwarding eth_* and net_* to {}", args.upstream);
    try {
        server.listen();
    } catch (const mojrpc::RpcTransportError& e) {
        spdlog::error("{}", e.what());
        return 1;
    }
    return 0;
}
