#include "protocol/json_rpc.hpp"

namespace json_rpc {

json build_response(const json &request_id, const json &result_payload) {
    json response;
    response["jsonrpc"] = "2.0";
    response["id"] = request_id;
    response["result"] = result_payload;
    return response;
}

json build_error_response(const json &request_id, int error_code, const std::string &error_message) {
    json response;
    response["jsonrpc"] = "2.0";
    response["id"] = request_id;
    response["error"]["code"] = error_code;
    response["error"]["message"] = error_message;
    return response;
}

json build_parse_error_response() {
    return build_error_response(nullptr, PARSE_ERROR, "Parse error");
}

json build_text_result(const std::string &text, bool is_error) {
    json text_content;
    text_content["type"] = "text";
    text_content["text"] = text;

    json result;
    result["content"] = json::array({text_content});
    result["isError"] = is_error;
    return result;
}

json build_payload_result(const json &payload) {
    bool is_error = payload.is_object() && payload.contains("ok") && payload["ok"].is_boolean() &&
                    !payload["ok"].get<bool>();
    return build_text_result(payload.dump(-1, ' ', false, json::error_handler_t::replace), is_error);
}

std::string get_method(const json &message) {
    if (message.contains("method") && message["method"].is_string()) {
        return message["method"].get<std::string>();
    }
    return "";
}

json get_id(const json &message) {
    if (message.contains("id")) {
        return message["id"];
    }
    return nullptr;
}

json get_params(const json &message) {
    if (message.contains("params") && message["params"].is_object()) {
        return message["params"];
    }
    return json::object();
}

bool is_notification(const json &message) {
    return !message.contains("id");
}

std::string string_argument(const json &arguments, const std::string &key) {
    if (!arguments.is_object() || !arguments.contains(key) || !arguments[key].is_string()) {
        return "";
    }
    std::string value = arguments[key].get<std::string>();
    size_t first = value.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return "";
    }
    size_t last = value.find_last_not_of(" \t\r\n");
    return value.substr(first, last - first + 1);
}

} // namespace json_rpc
