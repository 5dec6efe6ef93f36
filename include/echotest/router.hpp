#pragma once
#include "types.hpp"
#include "json_rpc.hpp"
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace echotest {

/// Methods the fixture understands. Anything else maps to Unknown.
enum class Method {
    Initialize,
    Initialized,
    ToolsList,
    ToolsCall,
    Unknown,
};

[[nodiscard]] Method method_from_name(std::string_view name);

/// A handler either produces a result or a protocol-level error.
using HandlerResult = std::variant<nlohmann::json, JsonRpcError>;

class Router {
public:
    struct Options {
        Implementation server_info;
        std::string protocol_version;
        ServerCapabilities capabilities;
    };

    explicit Router(Options opts);

    /// Dispatch a request. Returns the response to write, if any.
    ///
    /// Results are only returned for requests carrying an id. Protocol errors
    /// (unknown method or tool) are returned even without one, echoing a null
    /// id. Unexpected failures become InternalError responses when an id is
    /// known and are dropped otherwise.
    [[nodiscard]] std::optional<JsonRpcResponse> dispatch(const JsonRpcRequest& req) const;

private:
    HandlerResult handle_initialize(const nlohmann::json& params) const;
    HandlerResult handle_tools_list(const nlohmann::json& params) const;
    HandlerResult handle_tools_call(const nlohmann::json& params) const;

    Options opts_;
};

} // namespace echotest
