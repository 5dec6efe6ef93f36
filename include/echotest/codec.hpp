#pragma once
#include "json_rpc.hpp"
#include "error.hpp"
#include <string>
#include <string_view>

namespace echotest {

class Codec {
public:
    /// Parse one line holding exactly one JSON value.
    /// Throws ParseError on empty input, invalid JSON or trailing content.
    [[nodiscard]] static nlohmann::json parse_line(std::string_view raw);

    /// Serialize a response to a single line of compact JSON (no newline).
    [[nodiscard]] static std::string serialize(const JsonRpcResponse& resp);

    /// Serialization used for tool arguments echoed back as text.
    [[nodiscard]] static std::string dump_arguments(const nlohmann::json& arguments);
};

} // namespace echotest
