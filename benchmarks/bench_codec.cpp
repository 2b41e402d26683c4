#include <benchmark/benchmark.h>
#include "mojrpc/codec.hpp"
#include "mojrpc/json_rpc.hpp"
#include <string>
#include <vector>

using namespace mojrpc;

// Small request (~70 bytes)
static const std::string kSmallRequest =
    R"({"jsonrpc":"2.0","id":1,"method":"eth_chainId","params":[]})";

// Proof input submission
static const std::string kProofInputRequest =
    R"({"jsonrpc":"2.0","id":42,"method":"moj_sendProofInput","params":[{"job_id":7,"block":"0x1b4","inputs":["0xdeadbeef","0xcafebabe"]}]})";

// Generate a large eth_getLogs style response with N entries
static std::string make_large_response(int n) {
    nlohmann::json logs = nlohmann::json::array();
    for (int i = 0; i < n; ++i) {
        logs.push_back({
            {"address", "0x5fbdb2315678afecb367f032d93f642f64180aa3"},
            {"blockNumber", "0x" + std::to_string(1000 + i)},
            {"logIndex", "0x" + std::to_string(i)},
            {"topics", {
                "0xddf252ad1be2c89b69c2b068fc378daa952ba7f163c4a11628f55a4df523b3ef",
                "0x000000000000000000000000f39fd6e51aad88f6f4ce6ab8827279cfffb92266"
            }},
            {"data", "0x00000000000000000000000000000000000000000000000000000000000003e8"},
            {"removed", false}
        });
    }
    nlohmann::json resp = {
        {"jsonrpc", "2.0"},
        {"id", 1},
        {"result", logs}
    };
    return resp.dump();
}

static const std::string kLargeResponse = make_large_response(100);

// ---- Decode benchmarks ----

static void BM_DecodeSmallRequest(benchmark::State& state) {
    for (auto _ : state) {
        auto j = Codec::decode(kSmallRequest);
        benchmark::DoNotOptimize(j);
    }
    state.SetBytesProcessed(state.iterations() * kSmallRequest.size());
}
BENCHMARK(BM_DecodeSmallRequest)->MinTime(1.0);

static void BM_DecodeAndValidate(benchmark::State& state) {
    for (auto _ : state) {
        auto req = Codec::parse_request(Codec::decode(kProofInputRequest));
        benchmark::DoNotOptimize(req);
    }
    state.SetBytesProcessed(state.iterations() * kProofInputRequest.size());
}
BENCHMARK(BM_DecodeAndValidate)->MinTime(1.0);

static void BM_DecodeLargeMessage(benchmark::State& state) {
    for (auto _ : state) {
        auto j = Codec::decode(kLargeResponse);
        benchmark::DoNotOptimize(j);
    }
    state.SetBytesProcessed(state.iterations() * kLargeResponse.size());
}
BENCHMARK(BM_DecodeLargeMessage)->MinTime(1.0);

static void BM_DecodeBatch(benchmark::State& state) {
    nlohmann::json batch = nlohmann::json::array();
    for (int i = 0; i < 50; ++i) {
        batch.push_back({{"jsonrpc", "2.0"}, {"id", i}, {"method", "eth_blockNumber"}, {"params", nlohmann::json::array()}});
    }
    std::string raw = batch.dump();

    for (auto _ : state) {
        auto j = Codec::decode(raw);
        std::vector<Request> reqs;
        reqs.reserve(j.size());
        for (const auto& item : j) {
            reqs.push_back(Codec::parse_request(item));
        }
        benchmark::DoNotOptimize(reqs);
    }
    state.SetBytesProcessed(state.iterations() * raw.size());
}
BENCHMARK(BM_DecodeBatch)->MinTime(1.0);

static void BM_DecodeInvalidJson(benchmark::State& state) {
    const std::string bad = "{this is not valid json at all!!!";
    for (auto _ : state) {
        try {
            auto j = Codec::decode(bad);
            benchmark::DoNotOptimize(j);
        } catch (const RpcParseError& e) {
            benchmark::DoNotOptimize(e.what());
        }
    }
}
BENCHMARK(BM_DecodeInvalidJson)->MinTime(1.0);

// ---- Serialize benchmarks ----

static void BM_SerializeSmallResponse(benchmark::State& state) {
    Response resp;
    resp.id = RequestId{int64_t{1}};
    resp.result = "0x1";

    for (auto _ : state) {
        auto s = Codec::serialize(resp);
        benchmark::DoNotOptimize(s);
    }
}
BENCHMARK(BM_SerializeSmallResponse)->MinTime(1.0);

static void BM_SerializeLargeResponse(benchmark::State& state) {
    Response resp;
    from_json(Codec::decode(kLargeResponse), resp);

    for (auto _ : state) {
        auto s = Codec::serialize(resp);
        benchmark::DoNotOptimize(s);
    }
    state.SetBytesProcessed(state.iterations() * kLargeResponse.size());
}
BENCHMARK(BM_SerializeLargeResponse)->MinTime(1.0);

static void BM_SerializeBatch(benchmark::State& state) {
    std::vector<Response> resps(50);
    for (int i = 0; i < 50; ++i) {
        resps[i].id = RequestId{int64_t{i}};
        resps[i].result = "0x" + std::to_string(i);
    }

    for (auto _ : state) {
        auto s = Codec::serialize_batch(resps);
        benchmark::DoNotOptimize(s);
    }
}
BENCHMARK(BM_SerializeBatch)->MinTime(1.0);
