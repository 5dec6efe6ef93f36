#include "echotest/json_rpc.hpp"
#include "echotest/version.hpp"
#include <stdexcept>

namespace echotest {

void to_json(nlohmann::json& j, const JsonRpcResponse& r) {
    j = nlohmann::json::object();
    j["jsonrpc"] = std::string(JSONRPC_VERSION);
    j["id"] = r.id;
    if (r.result) j["result"] = *r.result;
    if (r.error) j["error"] = *r.error;
}

JsonRpcRequest request_from_json(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw std::invalid_argument("Request must be a JSON object");
    }

    JsonRpcRequest req;
    if (j.contains("id")) req.id = j.at("id");

    if (j.contains("method")) {
        const auto& m = j.at("method");
        // Non-string methods keep their JSON text so they can be reported back
        if (m.is_string()) {
            req.method = m.get<std::string>();
        } else if (!m.is_null()) {
            req.method = m.dump();
        }
    }

    if (j.contains("params") && !j.at("params").is_null()) {
        req.params = j.at("params");
    }
    return req;
}

JsonRpcResponse make_result(RequestId id, nlohmann::json result) {
    JsonRpcResponse resp;
    resp.id = std::move(id);
    resp.result = std::move(result);
    return resp;
}

JsonRpcResponse make_error(RequestId id, int code, std::string message) {
    JsonRpcResponse resp;
    resp.id = std::move(id);
    resp.error = JsonRpcError{code, std::move(message)};
    return resp;
}

} // namespace echotest
