#include <benchmark/benchmark.h>
#include "echotest/codec.hpp"
#include "echotest/json_rpc.hpp"
#include <string>

using namespace echotest;

// Small message (~50 bytes)
static const std::string kSmallRequest =
    R"({"jsonrpc":"2.0","id":1,"method":"tools/list"})";

// Tool call request
static const std::string kToolCallRequest =
    R"({"jsonrpc":"2.0","id":42,"method":"tools/call","params":{"name":"echo","arguments":{"message":"hello from the benchmark","count":3}}})";

// Echo call whose arguments hold N keys
static std::string make_large_request(int n) {
    nlohmann::json args = nlohmann::json::object();
    for (int i = 0; i < n; ++i) {
        args["key_" + std::to_string(i)] = {
            {"text", "A value that is echoed back, number " + std::to_string(i)},
            {"index", i},
            {"flags", {true, false, nullptr}}
        };
    }
    nlohmann::json req = {
        {"jsonrpc", "2.0"},
        {"id", 1},
        {"method", "tools/call"},
        {"params", {{"name", "echo"}, {"arguments", args}}}
    };
    return req.dump();
}

static const std::string kLargeRequest = make_large_request(100);

// ---- Parse benchmarks ----

static void BM_ParseSmallMessage(benchmark::State& state) {
    for (auto _ : state) {
        auto j = Codec::parse_line(kSmallRequest);
        benchmark::DoNotOptimize(j);
    }
    state.SetBytesProcessed(state.iterations() * static_cast<int64_t>(kSmallRequest.size()));
}
BENCHMARK(BM_ParseSmallMessage);

static void BM_ParseToolCall(benchmark::State& state) {
    for (auto _ : state) {
        auto j = Codec::parse_line(kToolCallRequest);
        benchmark::DoNotOptimize(j);
    }
    state.SetBytesProcessed(state.iterations() * static_cast<int64_t>(kToolCallRequest.size()));
}
BENCHMARK(BM_ParseToolCall);

static void BM_ParseLargeMessage(benchmark::State& state) {
    for (auto _ : state) {
        auto j = Codec::parse_line(kLargeRequest);
        benchmark::DoNotOptimize(j);
    }
    state.SetBytesProcessed(state.iterations() * static_cast<int64_t>(kLargeRequest.size()));
}
BENCHMARK(BM_ParseLargeMessage);

static void BM_ParseMalformed(benchmark::State& state) {
    const std::string bad = R"({"jsonrpc":"2.0","id":1,"method":)";
    for (auto _ : state) {
        try {
            auto j = Codec::parse_line(bad);
            benchmark::DoNotOptimize(j);
        } catch (const ParseError& e) {
            benchmark::DoNotOptimize(e.what());
        }
    }
}
BENCHMARK(BM_ParseMalformed);

// ---- Serialize benchmarks ----

static void BM_SerializeResult(benchmark::State& state) {
    auto resp = make_result(1, nlohmann::json{
        {"content", {{{"type", "text"}, {"text", "hello"}}}},
        {"isError", false}
    });
    for (auto _ : state) {
        auto out = Codec::serialize(resp);
        benchmark::DoNotOptimize(out);
    }
}
BENCHMARK(BM_SerializeResult);

static void BM_DumpLargeArguments(benchmark::State& state) {
    auto args = Codec::parse_line(kLargeRequest)["params"]["arguments"];
    for (auto _ : state) {
        auto out = Codec::dump_arguments(args);
        benchmark::DoNotOptimize(out);
    }
}
BENCHMARK(BM_DumpLargeArguments);
