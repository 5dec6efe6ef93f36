#include "echotest/router.hpp"
#include "echotest/error.hpp"
#include "echotest/logger.hpp"
#include "echotest/tools.hpp"
#include <stdexcept>

namespace echotest {

namespace {

// Names a JSON value the way it should read in an error message.
std::string display_name(const nlohmann::json& value) {
    if (value.is_string()) return value.get<std::string>();
    if (value.is_null()) return "";
    return value.dump();
}

} // anonymous namespace

Method method_from_name(std::string_view name) {
    if (name == "initialize") return Method::Initialize;
    if (name == "notifications/initialized") return Method::Initialized;
    if (name == "tools/list") return Method::ToolsList;
    if (name == "tools/call") return Method::ToolsCall;
    return Method::Unknown;
}

Router::Router(Options opts) : opts_(std::move(opts)) {}

HandlerResult Router::handle_initialize(const nlohmann::json& /*params*/) const {
    InitializeResult result;
    result.protocol_version = opts_.protocol_version;
    result.capabilities = opts_.capabilities;
    result.server_info = opts_.server_info;

    nlohmann::json j;
    to_json(j, result);
    return j;
}

HandlerResult Router::handle_tools_list(const nlohmann::json& /*params*/) const {
    return nlohmann::json{{"tools", tool_catalog()}};
}

HandlerResult Router::handle_tools_call(const nlohmann::json& params) const {
    if (!params.is_object()) {
        throw std::invalid_argument("Invalid params: expected an object, got " +
                                    std::string(params.type_name()));
    }

    nlohmann::json name_value = params.value("name", nlohmann::json());
    std::string name = display_name(name_value);
    nlohmann::json arguments = params.contains("arguments")
        ? params.at("arguments")
        : nlohmann::json::object();

    std::optional<Tool> tool;
    if (name_value.is_string()) tool = find_tool(name);
    if (!tool) {
        return JsonRpcError{error::MethodNotFound, "Tool not found: " + name};
    }

    ECHOTEST_LOG_DEBUG("tools/call {}", name);
    nlohmann::json j;
    to_json(j, call_tool(*tool, arguments));
    return j;
}

std::optional<JsonRpcResponse> Router::dispatch(const JsonRpcRequest& req) const {
    HandlerResult result;
    try {
        switch (method_from_name(req.method)) {
            case Method::Initialize:
                result = handle_initialize(req.params);
                break;
            case Method::Initialized:
                // Notification semantics: never answered, whatever the id
                return std::nullopt;
            case Method::ToolsList:
                result = handle_tools_list(req.params);
                break;
            case Method::ToolsCall:
                result = handle_tools_call(req.params);
                break;
            case Method::Unknown:
                result = JsonRpcError{error::MethodNotFound, "Method not found: " + req.method};
                break;
        }
    } catch (const std::exception& e) {
        if (!has_id(req.id)) {
            ECHOTEST_LOG_WARN("dropping failure for id-less '{}' request: {}", req.method, e.what());
            return std::nullopt;
        }
        ECHOTEST_LOG_ERROR("'{}' failed: {}", req.method, e.what());
        return make_error(req.id, error::InternalError, e.what());
    }

    if (auto* err = std::get_if<JsonRpcError>(&result)) {
        JsonRpcResponse resp;
        resp.id = req.id;
        resp.error = std::move(*err);
        return resp;
    }

    if (!has_id(req.id)) {
        ECHOTEST_LOG_DEBUG("no id on '{}' request, suppressing result", req.method);
        return std::nullopt;
    }
    return make_result(req.id, std::move(std::get<nlohmann::json>(result)));
}

} // namespace echotest
