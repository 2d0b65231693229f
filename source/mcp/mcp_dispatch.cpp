#include "mcp/mcp_dispatch.hpp"
#include "mcp/mcp_tools.hpp"
#include "protocol/json_rpc.hpp"

#include <string>

namespace mcp_dispatch {

static const std::string PROTOCOL_VERSION = "2024-11-05";

static const std::string SERVER_NAME = "simpilot";
static const std::string SERVER_VERSION = "0.1.0";
static const std::string SERVER_DESCRIPTION =
    "iOS Simulator MCP server: lists simulators, finds the Xcode workspace or "
    "project of a folder, resolves its schemes, and builds, installs and "
    "launches the app on a chosen simulator. Tools: list_devices, list_booted, "
    "detect_container, list_schemes, boot_and_focus, build_and_run, "
    "cancel_active_task. Requires macOS with Xcode.";

static json handle_initialize(const json &request_id, const json &params) {
    (void)params;

    json capabilities;
    capabilities["tools"] = json::object();

    json server_info;
    server_info["name"] = SERVER_NAME;
    server_info["version"] = SERVER_VERSION;
    server_info["description"] = SERVER_DESCRIPTION;

    json result;
    result["protocolVersion"] = PROTOCOL_VERSION;
    result["capabilities"] = capabilities;
    result["serverInfo"] = server_info;

    return json_rpc::build_response(request_id, result);
}

static json handle_tools_list(const json &request_id) {
    return json_rpc::build_response(request_id, mcp_tools::build_tools_list_response());
}

static json handle_tools_call(const json &request_id, const json &params) {
    if (!params.contains("name") || !params["name"].is_string()) {
        return json_rpc::build_error_response(request_id, json_rpc::INVALID_PARAMS,
                                              "Missing or invalid 'name' in tools/call");
    }
    std::string tool_name = params["name"].get<std::string>();

    json arguments = json::object();
    if (params.contains("arguments") && params["arguments"].is_object()) {
        arguments = params["arguments"];
    }

    return json_rpc::build_response(request_id, mcp_tools::dispatch_tool_call(tool_name, arguments));
}

json dispatch_message(const json &message) {
    if (!message.is_object()) {
        return json_rpc::build_error_response(nullptr, json_rpc::INVALID_REQUEST, "Invalid request");
    }

    // "notifications/initialized" is the only notification we expect; acknowledge silently.
    if (json_rpc::is_notification(message)) {
        return nullptr;
    }

    std::string method = json_rpc::get_method(message);
    json request_id = json_rpc::get_id(message);
    json params = json_rpc::get_params(message);

    if (method == "initialize") {
        return handle_initialize(request_id, params);
    }
    if (method == "tools/list") {
        return handle_tools_list(request_id);
    }
    if (method == "tools/call") {
        return handle_tools_call(request_id, params);
    }
    if (method == "ping") {
        return json_rpc::build_response(request_id, json::object());
    }

    return json_rpc::build_error_response(request_id, json_rpc::METHOD_NOT_FOUND,
                                          "Unknown method: " + method);
}

bool is_long_running_call(const json &message) {
    if (!message.is_object() || json_rpc::get_method(message) != "tools/call") {
        return false;
    }
    json params = json_rpc::get_params(message);
    if (!params.contains("name") || !params["name"].is_string()) {
        return false;
    }
    return mcp_tools::is_long_running(params["name"].get<std::string>());
}

} // namespace mcp_dispatch
