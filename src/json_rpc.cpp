#include "devagent/json_rpc.hpp"
#include "devagent/version.hpp"

namespace devagent {

std::string request_id_to_string(const RequestId& id) {
    if (const auto* i = std::get_if<int64_t>(&id)) {
        return std::to_string(*i);
    }
    return std::get<std::string>(id);
}

void to_json(nlohmann::json& j, const JsonRpcResponse& r) {
    nlohmann::json id_j;
    to_json(id_j, r.id);
    j = nlohmann::json::object();
    j["jsonrpc"] = std::string(JSONRPC_VERSION);
    j["id"] = id_j;
    if (r.error) {
        j["error"] = *r.error;
    } else {
        // A success response always carries a result member, even if empty.
        j["result"] = r.result ? *r.result : nlohmann::json::object();
    }
}

} // namespace devagent
