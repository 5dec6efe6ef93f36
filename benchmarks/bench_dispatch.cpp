#include <benchmark/benchmark.h>
#include "echotest/router.hpp"
#include "echotest/version.hpp"
#include <string>

using namespace echotest;

static Router make_router() {
    Router::Options opts;
    opts.server_info = {std::string(SERVER_NAME), std::string(SERVER_VERSION)};
    opts.protocol_version = std::string(PROTOCOL_VERSION);
    opts.capabilities.tools = nlohmann::json{{"listChanged", false}};
    return Router{std::move(opts)};
}

static JsonRpcRequest make_request(const std::string& method, nlohmann::json params) {
    JsonRpcRequest req;
    req.id = 1;
    req.method = method;
    req.params = std::move(params);
    return req;
}

static void BM_DispatchInitialize(benchmark::State& state) {
    auto router = make_router();
    auto req = make_request("initialize", nlohmann::json::object());
    for (auto _ : state) {
        auto resp = router.dispatch(req);
        benchmark::DoNotOptimize(resp);
    }
}
BENCHMARK(BM_DispatchInitialize);

static void BM_DispatchToolsList(benchmark::State& state) {
    auto router = make_router();
    auto req = make_request("tools/list", nlohmann::json::object());
    for (auto _ : state) {
        auto resp = router.dispatch(req);
        benchmark::DoNotOptimize(resp);
    }
}
BENCHMARK(BM_DispatchToolsList);

static void BM_DispatchEcho(benchmark::State& state) {
    auto router = make_router();
    auto req = make_request("tools/call", {{"name", "echo"}, {"arguments", {{"message", "hi"}}}});
    for (auto _ : state) {
        auto resp = router.dispatch(req);
        benchmark::DoNotOptimize(resp);
    }
}
BENCHMARK(BM_DispatchEcho);

static void BM_DispatchUnknownMethod(benchmark::State& state) {
    auto router = make_router();
    auto req = make_request("not_a_method", nlohmann::json::object());
    for (auto _ : state) {
        auto resp = router.dispatch(req);
        benchmark::DoNotOptimize(resp);
    }
}
BENCHMARK(BM_DispatchUnknownMethod);
