#include <benchmark/benchmark.h>
#include "dtmcp/server.hpp"
#include <string>

using namespace dtmcp;

static JsonRpcRequest make_request(const std::string& method,
                                   std::optional<nlohmann::json> params = std::nullopt) {
    JsonRpcRequest req;
    req.id = RequestId{int64_t{1}};
    req.method = method;
    req.params = std::move(params);
    return req;
}

static void BM_HandleInitialize(benchmark::State& state) {
    McpServer server;
    auto req = make_request("initialize");
    for (auto _ : state) {
        auto resp = server.handle(req);
        benchmark::DoNotOptimize(resp);
    }
}
BENCHMARK(BM_HandleInitialize)->MinTime(1.0);

static void BM_HandleToolsList(benchmark::State& state) {
    McpServer server;
    auto req = make_request("tools/list");
    for (auto _ : state) {
        auto resp = server.handle(req);
        benchmark::DoNotOptimize(resp);
    }
}
BENCHMARK(BM_HandleToolsList)->MinTime(1.0);

static void BM_HandleUnknownMethod(benchmark::State& state) {
    McpServer server;
    auto req = make_request("resources/list");
    for (auto _ : state) {
        auto resp = server.handle(req);
        benchmark::DoNotOptimize(resp);
    }
}
BENCHMARK(BM_HandleUnknownMethod)->MinTime(1.0);

static void BM_CallAddDays(benchmark::State& state) {
    McpServer server;
    auto req = make_request("tools/call", nlohmann::json{
        {"name", "add_days"},
        {"arguments", {{"date", "2025-11-29"}, {"days", 2}}}
    });
    for (auto _ : state) {
        auto resp = server.handle(req);
        benchmark::DoNotOptimize(resp);
    }
}
BENCHMARK(BM_CallAddDays)->MinTime(1.0);

static void BM_CallCurrentDatetimeUtc(benchmark::State& state) {
    McpServer server;
    auto req = make_request("tools/call", nlohmann::json{
        {"name", "get_current_datetime"},
        {"arguments", {{"timezone", "UTC"}}}
    });
    for (auto _ : state) {
        auto resp = server.handle(req);
        benchmark::DoNotOptimize(resp);
    }
}
BENCHMARK(BM_CallCurrentDatetimeUtc)->MinTime(1.0);
