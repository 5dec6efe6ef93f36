#pragma once
#include <string_view>

namespace echotest {

constexpr std::string_view PROTOCOL_VERSION    = "2024-11-05";
constexpr std::string_view JSONRPC_VERSION     = "2.0";

constexpr std::string_view SERVER_NAME         = "echo-test";
constexpr std::string_view SERVER_VERSION      = "1.0.0";

} // namespace echotest
