#include "devagent/codec.hpp"
#include "devagent/error.hpp"
#include "devagent/version.hpp"
#include <nlohmann/json.hpp>
#include <simdjson.h>
#include <stdexcept>
#include <string>

namespace devagent {

namespace {

// Convert simdjson value to nlohmann::json recursively
nlohmann::json simdjson_to_nlohmann(simdjson::ondemand::value val) {
    switch (val.type()) {
        case simdjson::ondemand::json_type::object: {
            nlohmann::json obj = nlohmann::json::object();
            for (auto field : val.get_object()) {
                std::string_view key = field.unescaped_key();
                obj[std::string(key)] = simdjson_to_nlohmann(field.value());
            }
            return obj;
        }
        case simdjson::ondemand::json_type::array: {
            nlohmann::json arr = nlohmann::json::array();
            for (auto elem : val.get_array()) {
                arr.push_back(simdjson_to_nlohmann(elem.value()));
            }
            return arr;
        }
        case simdjson::ondemand::json_type::string: {
            std::string_view sv = val.get_string();
            return nlohmann::json(std::string(sv));
        }
        case simdjson::ondemand::json_type::number: {
            auto as_int = val.get_int64();
            if (as_int.error() == simdjson::SUCCESS) {
                return nlohmann::json(as_int.value());
            }
            auto as_uint = val.get_uint64();
            if (as_uint.error() == simdjson::SUCCESS) {
                return nlohmann::json(as_uint.value());
            }
            return nlohmann::json(val.get_double().value());
        }
        case simdjson::ondemand::json_type::boolean:
            return nlohmann::json(val.get_bool().value());
        case simdjson::ondemand::json_type::null:
            return nlohmann::json(nullptr);
        default:
            return nlohmann::json(nullptr);
    }
}

nlohmann::json parse_json(std::string_view raw) {
    simdjson::ondemand::parser parser;
    // simdjson requires padded input
    simdjson::padded_string padded(raw.data(), raw.size());

    simdjson::ondemand::document doc;
    auto err = parser.iterate(padded).get(doc);
    if (err) {
        throw ParseError(error::ParseError,
                         std::string("JSON parse error: ") + simdjson::error_message(err));
    }

    try {
        auto val = doc.get_value();
        if (val.error() == simdjson::SCALAR_DOCUMENT_AS_VALUE) {
            throw ParseError(error::InvalidRequest, "Message must be a JSON object");
        }
        if (val.error()) {
            throw ParseError(error::ParseError,
                             std::string("JSON parse error: ") + simdjson::error_message(val.error()));
        }
        nlohmann::json j = simdjson_to_nlohmann(val.value());
        if (!doc.at_end()) {
            throw ParseError(error::ParseError, "JSON parse error: trailing content");
        }
        return j;
    } catch (const simdjson::simdjson_error& e) {
        throw ParseError(error::ParseError, std::string("JSON parse error: ") + e.what());
    }
}

} // anonymous namespace

JsonRpcMessage Codec::parse_object(const nlohmann::json& j) {
    auto version = j.find("jsonrpc");
    if (version == j.end() || !version->is_string()
        || version->get<std::string>() != JSONRPC_VERSION) {
        throw ParseError(error::InvalidRequest, "Invalid JSON-RPC version, must be \"2.0\"");
    }

    auto method = j.find("method");
    if (method == j.end() || !method->is_string()) {
        throw ParseError(error::InvalidRequest, "Missing or invalid \"method\" field");
    }

    std::optional<nlohmann::json> params;
    if (j.contains("params")) params = j.at("params");

    auto id = j.find("id");
    if (id != j.end() && !id->is_null()) {
        JsonRpcRequest req;
        try {
            from_json(*id, req.id);
        } catch (const std::invalid_argument& e) {
            throw ParseError(error::InvalidRequest, e.what());
        }
        req.method = method->get<std::string>();
        req.params = std::move(params);
        return req;
    }

    JsonRpcNotification notif;
    notif.method = method->get<std::string>();
    notif.params = std::move(params);
    return notif;
}

JsonRpcMessage Codec::parse(std::string_view raw) {
    if (raw.empty()) {
        throw ParseError(error::ParseError, "Empty input");
    }

    nlohmann::json j = parse_json(raw);
    if (!j.is_object()) {
        throw ParseError(error::InvalidRequest, "Message must be a JSON object");
    }
    return parse_object(j);
}

bool Codec::is_request(const JsonRpcMessage& msg) {
    return std::holds_alternative<JsonRpcRequest>(msg);
}

JsonRpcResponse Codec::create_response(RequestId id, nlohmann::json result) {
    JsonRpcResponse resp;
    resp.id = std::move(id);
    resp.result = std::move(result);
    return resp;
}

JsonRpcResponse Codec::create_error_response(std::optional<RequestId> id, JsonRpcError error) {
    JsonRpcResponse resp;
    resp.id = id ? std::move(*id) : RequestId{int64_t{0}};
    resp.error = std::move(error);
    return resp;
}

JsonRpcError Codec::create_error(int code, std::string message,
                                 std::optional<nlohmann::json> data) {
    return JsonRpcError{code, std::move(message), std::move(data)};
}

std::string Codec::serialize(const JsonRpcResponse& msg) {
    nlohmann::json j;
    to_json(j, msg);
    return j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

} // namespace devagent
