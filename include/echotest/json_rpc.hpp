#pragma once
#include <string>
#include <optional>
#include <nlohmann/json.hpp>

namespace echotest {

/// Echoed verbatim: number, string, or null when the request carried none.
using RequestId = nlohmann::json;

inline bool has_id(const RequestId& id) {
    return !id.is_null();
}

struct JsonRpcError {
    int code;
    std::string message;
};

inline void to_json(nlohmann::json& j, const JsonRpcError& e) {
    j = nlohmann::json{{"code", e.code}, {"message", e.message}};
}

struct JsonRpcRequest {
    RequestId id;
    std::string method;
    nlohmann::json params = nlohmann::json::object();
};

struct JsonRpcResponse {
    RequestId id;
    std::optional<nlohmann::json> result;
    std::optional<JsonRpcError> error;
};

void to_json(nlohmann::json& j, const JsonRpcResponse& r);

/// Build a request from a decoded JSON object. Missing fields take their
/// defaults: null id, empty method, empty params object.
/// Throws std::invalid_argument if `j` is not an object.
[[nodiscard]] JsonRpcRequest request_from_json(const nlohmann::json& j);

[[nodiscard]] JsonRpcResponse make_result(RequestId id, nlohmann::json result);
[[nodiscard]] JsonRpcResponse make_error(RequestId id, int code, std::string message);

} // namespace echotest
