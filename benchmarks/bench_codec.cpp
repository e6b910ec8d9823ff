#include <benchmark/benchmark.h>
#include "dtmcp/codec.hpp"
#include "dtmcp/json_rpc.hpp"
#include "dtmcp/tool_registry.hpp"
#include <string>

using namespace dtmcp;

static const std::string kInitializeRequest =
    R"({"jsonrpc":"2.0","id":1,"method":"initialize","params":{}})";

static const std::string kToolCallRequest =
    R"({"jsonrpc":"2.0","id":42,"method":"tools/call","params":{"name":"add_days","arguments":{"date":"2025-11-29","days":2}}})";

static const std::string kMalformedRequest =
    R"({"jsonrpc":"2.0","id":42,"method":"tools/call","params":{"name":)";

// ---- Parse benchmarks ----

static void BM_ParseInitialize(benchmark::State& state) {
    for (auto _ : state) {
        auto req = Codec::parse_request(kInitializeRequest);
        benchmark::DoNotOptimize(req);
    }
    state.SetBytesProcessed(state.iterations() * kInitializeRequest.size());
}
BENCHMARK(BM_ParseInitialize)->MinTime(1.0);

static void BM_ParseToolCallRequest(benchmark::State& state) {
    for (auto _ : state) {
        auto req = Codec::parse_request(kToolCallRequest);
        benchmark::DoNotOptimize(req);
    }
    state.SetBytesProcessed(state.iterations() * kToolCallRequest.size());
}
BENCHMARK(BM_ParseToolCallRequest)->MinTime(1.0);

static void BM_ParseMalformed(benchmark::State& state) {
    for (auto _ : state) {
        try {
            auto req = Codec::parse_request(kMalformedRequest);
            benchmark::DoNotOptimize(req);
        } catch (const McpParseError& e) {
            benchmark::DoNotOptimize(e);
        }
    }
}
BENCHMARK(BM_ParseMalformed)->MinTime(1.0);

// ---- Serialize benchmarks ----

static void BM_SerializeToolsList(benchmark::State& state) {
    auto resp = JsonRpcResponse::success(RequestId{int64_t{2}},
                                         nlohmann::json{{"tools", ToolRegistry::list()}});
    for (auto _ : state) {
        auto out = Codec::serialize(resp);
        benchmark::DoNotOptimize(out);
    }
}
BENCHMARK(BM_SerializeToolsList)->MinTime(1.0);

static void BM_SerializeError(benchmark::State& state) {
    auto resp = JsonRpcResponse::failure(std::nullopt, -32700, "Parse error");
    for (auto _ : state) {
        auto out = Codec::serialize(resp);
        benchmark::DoNotOptimize(out);
    }
}
BENCHMARK(BM_SerializeError)->MinTime(1.0);
