#include <benchmark/benchmark.h>
#include "echotest/server.hpp"
#include "echotest/transport/stream_transport.hpp"
#include <sstream>
#include <string>

using namespace echotest;

static std::string make_session(int n) {
    std::string input;
    for (int i = 1; i <= n; ++i) {
        nlohmann::json req = {
            {"jsonrpc", "2.0"},
            {"id", i},
            {"method", "tools/call"},
            {"params", {{"name", "echo"}, {"arguments", {{"message", "payload " + std::to_string(i)}}}}}
        };
        input += req.dump();
        input += '\n';
    }
    return input;
}

static void BM_ServeEchoSession(benchmark::State& state) {
    const int n = static_cast<int>(state.range(0));
    const std::string input = make_session(n);
    EchoServer server;

    for (auto _ : state) {
        std::istringstream in(input);
        std::ostringstream out;
        StreamTransport transport(in, out);
        server.serve(transport, transport);
        benchmark::DoNotOptimize(out.str());
    }
    state.SetItemsProcessed(state.iterations() * n);
}
BENCHMARK(BM_ServeEchoSession)->Arg(100)->Arg(1000);

static void BM_HandleLine(benchmark::State& state) {
    EchoServer server;
    const std::string line = R"({"jsonrpc":"2.0","id":7,"method":"tools/list"})";
    for (auto _ : state) {
        auto out = server.handle_line(line);
        benchmark::DoNotOptimize(out);
    }
}
BENCHMARK(BM_HandleLine);
