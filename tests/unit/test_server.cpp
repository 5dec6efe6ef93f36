#include <gtest/gtest.h>
#include "echotest/server.hpp"
#include "echotest/error.hpp"
#include "echotest/logger.hpp"
#include "echotest/transport/stream_transport.hpp"
#include <sstream>
#include <string>
#include <vector>

using namespace echotest;

namespace {

nlohmann::json handle(const EchoServer& server, const std::string& line) {
    auto out = server.handle_line(line);
    if (!out) return nullptr;
    EXPECT_EQ(out->find('\n'), std::string::npos);
    return nlohmann::json::parse(*out);
}

std::vector<nlohmann::json> run(const EchoServer& server, const std::string& input) {
    std::istringstream in(input);
    std::ostringstream out;
    StreamTransport transport(in, out);
    server.serve(transport, transport);

    std::vector<nlohmann::json> responses;
    std::istringstream lines(out.str());
    std::string line;
    while (std::getline(lines, line)) {
        responses.push_back(nlohmann::json::parse(line));
    }
    return responses;
}

} // anonymous namespace

TEST(EchoServer, DefaultIdentity) {
    EchoServer server;
    EXPECT_EQ(server.options().server_info.name, "echo-test");
    EXPECT_EQ(server.options().server_info.version, "1.0.0");
    EXPECT_EQ(server.options().protocol_version, "2024-11-05");
}

TEST(EchoServer, ConstructionLeavesLogLevelAlone) {
    logger::set_level(logger::level::debug);
    EchoServer first;
    EchoServer second(EchoServer::default_options());
    EXPECT_EQ(logger::global_level.load(), logger::level::debug);
    EXPECT_TRUE(logger::enabled(logger::level::debug));

    // Per-line debug output must not disturb the protocol stream
    auto resp = second.handle_line(R"({"jsonrpc":"2.0","id":1,"method":"tools/list"})");
    ASSERT_TRUE(resp.has_value());
    EXPECT_EQ(nlohmann::json::parse(*resp)["id"], 1);

    logger::set_level(logger::level::warning);
    EXPECT_FALSE(logger::enabled(logger::level::debug));
    EXPECT_TRUE(first.handle_line(R"({"jsonrpc":"2.0","id":2,"method":"tools/list"})").has_value());
}

TEST(EchoServer, InitializeRequest) {
    EchoServer server;
    auto resp = handle(server, R"({"jsonrpc":"2.0","id":1,"method":"initialize","params":{"protocolVersion":"2024-11-05"}})");
    EXPECT_EQ(resp["jsonrpc"], "2.0");
    EXPECT_EQ(resp["id"], 1);
    EXPECT_EQ(resp["result"]["protocolVersion"], "2024-11-05");
    EXPECT_EQ(resp["result"]["serverInfo"]["name"], "echo-test");
    EXPECT_EQ(resp["result"]["capabilities"]["tools"]["listChanged"], false);
}

TEST(EchoServer, CustomOptions) {
    EchoServer::Options opts = EchoServer::default_options();
    opts.server_info.name = "other";
    EchoServer server{std::move(opts)};
    auto resp = handle(server, R"({"id":1,"method":"initialize"})");
    EXPECT_EQ(resp["result"]["serverInfo"]["name"], "other");
}

TEST(EchoServer, ToolsListExample) {
    EchoServer server;
    auto resp = handle(server, R"({"jsonrpc":"2.0","id":1,"method":"tools/list"})");
    ASSERT_EQ(resp["result"]["tools"].size(), 2u);
    EXPECT_EQ(resp["result"]["tools"][0]["name"], "echo");
    EXPECT_EQ(resp["result"]["tools"][1]["name"], "fail");
}

TEST(EchoServer, EchoToolRoundTripsArguments) {
    EchoServer server;
    nlohmann::json args = {{"message", "hi there"}, {"n", 1.5}, {"list", {true, nullptr, "x"}}};
    nlohmann::json req = {
        {"jsonrpc", "2.0"}, {"id", "call-1"}, {"method", "tools/call"},
        {"params", {{"name", "echo"}, {"arguments", args}}}
    };
    auto resp = handle(server, req.dump());
    EXPECT_EQ(resp["id"], "call-1");
    EXPECT_EQ(resp["result"]["isError"], false);
    EXPECT_EQ(nlohmann::json::parse(resp["result"]["content"][0]["text"].get<std::string>()), args);
}

TEST(EchoServer, EchoToolAcceptsIntegersBeyond64Bits) {
    EchoServer server;
    auto resp = handle(server,
        R"({"jsonrpc":"2.0","id":1,"method":"tools/call",)"
        R"("params":{"name":"echo","arguments":{"n":123456789012345678901234567890}}})");
    EXPECT_EQ(resp["id"], 1);
    ASSERT_TRUE(resp.contains("result"));
    EXPECT_EQ(resp["result"]["isError"], false);
    auto echoed = nlohmann::json::parse(resp["result"]["content"][0]["text"].get<std::string>());
    EXPECT_DOUBLE_EQ(echoed["n"].get<double>(), 123456789012345678901234567890.0);
}

TEST(EchoServer, BigIntegerIdIsEchoed) {
    EchoServer server;
    auto resp = handle(server, R"({"jsonrpc":"2.0","id":123456789012345678901234567890,"method":"tools/list"})");
    ASSERT_TRUE(resp["id"].is_number());
    EXPECT_DOUBLE_EQ(resp["id"].get<double>(), 123456789012345678901234567890.0);
    EXPECT_TRUE(resp.contains("result"));
}

TEST(EchoServer, FailToolIsSuccessfulResponse) {
    EchoServer server;
    auto resp = handle(server, R"({"jsonrpc":"2.0","id":2,"method":"tools/call","params":{"name":"fail"}})");
    ASSERT_TRUE(resp.contains("result"));
    EXPECT_FALSE(resp.contains("error"));
    EXPECT_EQ(resp["result"]["isError"], true);
    EXPECT_EQ(resp["result"]["content"][0]["text"], "Intentional failure");
}

TEST(EchoServer, UnknownTool) {
    EchoServer server;
    auto resp = handle(server, R"({"jsonrpc":"2.0","id":3,"method":"tools/call","params":{"name":"X"}})");
    EXPECT_EQ(resp["error"]["code"], -32601);
    EXPECT_EQ(resp["error"]["message"], "Tool not found: X");
    EXPECT_FALSE(resp.contains("result"));
}

TEST(EchoServer, UnknownMethod) {
    EchoServer server;
    auto resp = handle(server, R"({"jsonrpc":"2.0","id":4,"method":"M"})");
    EXPECT_EQ(resp["id"], 4);
    EXPECT_EQ(resp["error"]["code"], -32601);
    EXPECT_EQ(resp["error"]["message"], "Method not found: M");
}

TEST(EchoServer, MissingMethod) {
    EchoServer server;
    auto resp = handle(server, R"({"jsonrpc":"2.0","id":4})");
    EXPECT_EQ(resp["error"]["message"], "Method not found: ");
}

TEST(EchoServer, InitializedNotificationProducesNothing) {
    EchoServer server;
    EXPECT_FALSE(server.handle_line(R"({"jsonrpc":"2.0","method":"notifications/initialized"})"));
    EXPECT_FALSE(server.handle_line(R"({"jsonrpc":"2.0","id":9,"method":"notifications/initialized"})"));
}

TEST(EchoServer, IdlessRequestsProduceNoResult) {
    EchoServer server;
    EXPECT_FALSE(server.handle_line(R"({"jsonrpc":"2.0","method":"tools/list"})"));
    EXPECT_FALSE(server.handle_line(R"({"jsonrpc":"2.0","id":null,"method":"initialize"})"));
}

TEST(EchoServer, IdlessProtocolErrorEchoesNullId) {
    EchoServer server;
    auto resp = handle(server, R"({"jsonrpc":"2.0","method":"unknown"})");
    ASSERT_TRUE(resp.contains("id"));
    EXPECT_TRUE(resp["id"].is_null());
    EXPECT_EQ(resp["error"]["code"], -32601);
}

TEST(EchoServer, MalformedLineYieldsParseErrorWithNullId) {
    EchoServer server;
    auto resp = handle(server, R"({"jsonrpc":"2.0","id":5,"method":)");
    EXPECT_EQ(resp["jsonrpc"], "2.0");
    ASSERT_TRUE(resp.contains("id"));
    EXPECT_TRUE(resp["id"].is_null());
    EXPECT_EQ(resp["error"]["code"], -32700);
    EXPECT_EQ(resp["error"]["message"].get<std::string>().rfind("Parse error: ", 0), 0u);
}

TEST(EchoServer, ParseErrorNeverReusesPreviousId) {
    EchoServer server;
    auto first = handle(server, R"({"jsonrpc":"2.0","id":77,"method":"tools/list"})");
    EXPECT_EQ(first["id"], 77);
    auto second = handle(server, "garbage");
    EXPECT_TRUE(second["id"].is_null());
}

TEST(EchoServer, BlankLinesIgnored) {
    EchoServer server;
    EXPECT_FALSE(server.handle_line(""));
    EXPECT_FALSE(server.handle_line("   \t  "));
    EXPECT_FALSE(server.handle_line("\r"));
}

TEST(EchoServer, SurroundingWhitespaceStripped) {
    EchoServer server;
    auto resp = handle(server, "  \t{\"id\":1,\"method\":\"tools/list\"}  \r");
    EXPECT_EQ(resp["id"], 1);
    EXPECT_TRUE(resp.contains("result"));
}

TEST(EchoServer, NonObjectJsonDropped) {
    EchoServer server;
    EXPECT_FALSE(server.handle_line("[1,2,3]"));
    EXPECT_FALSE(server.handle_line("42"));
    EXPECT_FALSE(server.handle_line(R"("initialize")"));
}

TEST(EchoServer, InternalErrorCarriesId) {
    EchoServer server;
    auto resp = handle(server, R"({"jsonrpc":"2.0","id":12,"method":"tools/call","params":[1,2]})");
    EXPECT_EQ(resp["id"], 12);
    EXPECT_EQ(resp["error"]["code"], -32603);
}

// ---- serve loop ----

TEST(EchoServerServe, ResponsesInRequestOrder) {
    EchoServer server;
    auto responses = run(server,
        "{\"jsonrpc\":\"2.0\",\"id\":1,\"method\":\"initialize\"}\n"
        "{\"jsonrpc\":\"2.0\",\"id\":2,\"method\":\"tools/list\"}\n"
        "{\"jsonrpc\":\"2.0\",\"id\":3,\"method\":\"tools/call\",\"params\":{\"name\":\"echo\"}}\n");
    ASSERT_EQ(responses.size(), 3u);
    EXPECT_EQ(responses[0]["id"], 1);
    EXPECT_EQ(responses[1]["id"], 2);
    EXPECT_EQ(responses[2]["id"], 3);
}

TEST(EchoServerServe, BadLineDoesNotPoisonStream) {
    EchoServer server;
    auto responses = run(server,
        "{\"jsonrpc\":\"2.0\",\"id\":1,\"method\":\"tools/list\"}\n"
        "{oops\n"
        "{\"jsonrpc\":\"2.0\",\"method\":\"notifications/initialized\"}\n"
        "\n"
        "{\"jsonrpc\":\"2.0\",\"id\":2,\"method\":\"tools/call\",\"params\":{\"name\":\"fail\"}}\n");
    ASSERT_EQ(responses.size(), 3u);
    EXPECT_EQ(responses[0]["id"], 1);
    EXPECT_EQ(responses[1]["error"]["code"], -32700);
    EXPECT_TRUE(responses[1]["id"].is_null());
    EXPECT_EQ(responses[2]["id"], 2);
    EXPECT_EQ(responses[2]["result"]["isError"], true);
}

TEST(EchoServerServe, FinalLineWithoutNewline) {
    EchoServer server;
    auto responses = run(server, "{\"jsonrpc\":\"2.0\",\"id\":\"last\",\"method\":\"tools/list\"}");
    ASSERT_EQ(responses.size(), 1u);
    EXPECT_EQ(responses[0]["id"], "last");
}

TEST(EchoServerServe, EmptyInput) {
    EchoServer server;
    EXPECT_TRUE(run(server, "").empty());
}

TEST(EchoServerServe, CrlfLineEndings) {
    EchoServer server;
    auto responses = run(server,
        "{\"jsonrpc\":\"2.0\",\"id\":1,\"method\":\"tools/list\"}\r\n"
        "{\"jsonrpc\":\"2.0\",\"id\":2,\"method\":\"tools/list\"}\r\n");
    ASSERT_EQ(responses.size(), 2u);
    EXPECT_EQ(responses[1]["id"], 2);
}
