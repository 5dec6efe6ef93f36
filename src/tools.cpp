#include "echotest/tools.hpp"
#include "echotest/codec.hpp"

namespace echotest {

namespace {

ToolDefinition make_echo_definition() {
    ToolDefinition def;
    def.name = std::string(tool_name(Tool::Echo));
    def.description = "Echo back input arguments";
    def.input_schema = {
        {"type", "object"},
        {"properties", {
            {"message", {{"type", "string"}}}
        }}
    };
    return def;
}

ToolDefinition make_fail_definition() {
    ToolDefinition def;
    def.name = std::string(tool_name(Tool::Fail));
    def.description = "Always returns an error";
    def.input_schema = nlohmann::json{{"type", "object"}};
    return def;
}

} // anonymous namespace

std::optional<Tool> find_tool(std::string_view name) {
    if (name == tool_name(Tool::Echo)) return Tool::Echo;
    if (name == tool_name(Tool::Fail)) return Tool::Fail;
    return std::nullopt;
}

std::string_view tool_name(Tool tool) {
    switch (tool) {
        case Tool::Echo: return "echo";
        case Tool::Fail: return "fail";
    }
    return "";
}

const std::vector<ToolDefinition>& tool_catalog() {
    static const std::vector<ToolDefinition> catalog = {
        make_echo_definition(),
        make_fail_definition(),
    };
    return catalog;
}

CallToolResult call_tool(Tool tool, const nlohmann::json& arguments) {
    CallToolResult result;
    switch (tool) {
        case Tool::Echo:
            result.content.push_back(TextContent{Codec::dump_arguments(arguments)});
            result.is_error = false;
            break;
        case Tool::Fail:
            result.content.push_back(TextContent{"Intentional failure"});
            result.is_error = true;
            break;
    }
    return result;
}

} // namespace echotest
