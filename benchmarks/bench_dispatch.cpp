#include <benchmark/benchmark.h>
#include "mojrpc/service.hpp"
#include <memory>
#include <string>
#include <vector>

using namespace mojrpc;

namespace {

struct BenchContext {
    std::string chain_id = "0x1";
};

// Registry with N exact methods and an eth fallback
Registry<BenchContext> make_registry(int n_methods) {
    Registry<BenchContext> reg;
    for (int i = 0; i < n_methods; ++i) {
        reg.register_method("moj_method" + std::to_string(i),
            [](const Request&, const BenchContext&) -> HandlerResult {
                return nlohmann::json{{"result", "ok"}};
            });
    }
    reg.register_method("moj_echo", [](const Request& req, const BenchContext&) -> HandlerResult {
        return nlohmann::json{{"echo", req.params.value_or(nlohmann::json(nullptr))}};
    });
    reg.register_fallback("eth", [](const Request&, const BenchContext& ctx) -> HandlerResult {
        return ctx.chain_id;
    });
    return reg;
}

std::string make_batch(int n) {
    nlohmann::json batch = nlohmann::json::array();
    for (int i = 0; i < n; ++i) {
        batch.push_back({{"jsonrpc", "2.0"}, {"id", i}, {"method", "moj_method" + std::to_string(i % 100)}});
    }
    return batch.dump();
}

} // namespace

static void BM_LookupExact(benchmark::State& state) {
    auto reg = make_registry(100);
    const std::string method = "moj_method42";
    for (auto _ : state) {
        auto res = reg.lookup(method);
        benchmark::DoNotOptimize(res);
    }
}
BENCHMARK(BM_LookupExact)->MinTime(1.0);

static void BM_LookupFallback(benchmark::State& state) {
    auto reg = make_registry(100);
    const std::string method = "eth_getBalance";
    for (auto _ : state) {
        auto res = reg.lookup(method);
        benchmark::DoNotOptimize(res);
    }
}
BENCHMARK(BM_LookupFallback)->MinTime(1.0);

static void BM_HandleKnownMethod(benchmark::State& state) {
    Service<BenchContext> service(BenchContext{}, make_registry(1));
    const std::string body = R"({"jsonrpc":"2.0","id":1,"method":"moj_echo","params":["hi"]})";

    for (auto _ : state) {
        auto out = service.handle(body);
        benchmark::DoNotOptimize(out);
    }
}
BENCHMARK(BM_HandleKnownMethod)->MinTime(1.0);

static void BM_HandleUnknownMethod(benchmark::State& state) {
    Service<BenchContext> service(BenchContext{}, make_registry(1));
    const std::string body = R"({"jsonrpc":"2.0","id":1,"method":"bogus"})";

    for (auto _ : state) {
        auto out = service.handle(body);
        benchmark::DoNotOptimize(out);
    }
}
BENCHMARK(BM_HandleUnknownMethod)->MinTime(1.0);

static void BM_HandleNotification(benchmark::State& state) {
    Service<BenchContext> service(BenchContext{}, make_registry(1));
    const std::string body = R"({"jsonrpc":"2.0","method":"moj_echo","params":[1]})";

    for (auto _ : state) {
        auto out = service.handle(body);
        benchmark::DoNotOptimize(out);
    }
}
BENCHMARK(BM_HandleNotification)->MinTime(1.0);

static void BM_HandleBatch(benchmark::State& state) {
    ServiceOptions opts;
    opts.worker_threads = 8;
    Service<BenchContext> service(BenchContext{}, make_registry(100), opts);
    const auto body = make_batch(static_cast<int>(state.range(0)));

    for (auto _ : state) {
        auto out = service.handle(body);
        benchmark::DoNotOptimize(out);
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_HandleBatch)->Arg(10)->Arg(100)->Arg(1000)->MinTime(1.0);
