#include "protocol/json_rpc.hpp"

namespace json_rpc {

static json build_envelope(const json &request_id) {
    json envelope;
    envelope["jsonrpc"] = PROTOCOL_TAG;
    envelope["id"] = request_id;
    return envelope;
}

json build_response(const json &request_id, const json &result_payload) {
    json response = build_envelope(request_id);
    response["result"] = result_payload;
    return response;
}

json build_error_response(const json &request_id, int error_code, const std::string &error_message) {
    json response = build_envelope(request_id);
    response["error"]["code"] = error_code;
    response["error"]["message"] = error_message;
    return response;
}

json build_error_response(const json &request_id, int error_code, const std::string &error_message,
                          const std::string &error_data) {
    json response = build_error_response(request_id, error_code, error_message);
    response["error"]["data"] = error_data;
    return response;
}

std::string get_method(const json &message) {
    if (message.contains("method") && message["method"].is_string()) {
        return message["method"].get<std::string>();
    }
    return "";
}

json get_id(const json &message) {
    if (message.contains("id") && !message["id"].is_null()) {
        return message["id"];
    }
    return UNKNOWN_ID;
}

json get_params(const json &message) {
    if (message.contains("params") && message["params"].is_object()) {
        return message["params"];
    }
    return json::object();
}

std::string serialize(const json &message) {
    return message.dump(-1, ' ', false, json::error_handler_t::replace);
}

} // namespace json_rpc
