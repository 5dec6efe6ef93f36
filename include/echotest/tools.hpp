#pragma once
#include "types.hpp"
#include <optional>
#include <string_view>
#include <vector>

namespace echotest {

/// The fixture's tools. The set is fixed at build time.
enum class Tool {
    Echo,   // returns its arguments serialized as JSON text
    Fail,   // always reports a tool-level failure
};

[[nodiscard]] std::optional<Tool> find_tool(std::string_view name);

[[nodiscard]] std::string_view tool_name(Tool tool);

/// Descriptors advertised by tools/list, in catalog order.
[[nodiscard]] const std::vector<ToolDefinition>& tool_catalog();

/// Run a tool. A failing tool still produces a result, with is_error set;
/// it never turns into a protocol-level error.
[[nodiscard]] CallToolResult call_tool(Tool tool, const nlohmann::json& arguments);

} // namespace echotest
