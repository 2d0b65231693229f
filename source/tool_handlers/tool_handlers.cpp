#include "tool_handlers/tool_handlers.hpp"
#include "protocol/json_rpc.hpp"

// Each tool_*.cpp defines its own namespace with a register_tool() function.

namespace tool_list_devices { void register_tool(); }
namespace tool_list_booted { void register_tool(); }
namespace tool_detect_container { void register_tool(); }
namespace tool_list_schemes { void register_tool(); }
namespace tool_boot_and_focus { void register_tool(); }
namespace tool_build_and_run { void register_tool(); }
namespace tool_cancel_active_task { void register_tool(); }

namespace tool_handlers {

void register_all_tools() {
    tool_list_devices::register_tool();
    tool_list_booted::register_tool();
    tool_detect_container::register_tool();
    tool_list_schemes::register_tool();
    tool_boot_and_focus::register_tool();
    tool_build_and_run::register_tool();
    tool_cancel_active_task::register_tool();
}

json missing_argument_result(const std::string &argument_name) {
    json payload;
    payload["ok"] = false;
    payload["stage"] = "validation";
    payload["error"] = "Missing required parameter '" + argument_name + "' (string).";
    return json_rpc::build_payload_result(payload);
}

json string_properties_schema(const json &properties, const json &required) {
    json input_schema;
    input_schema["type"] = "object";
    input_schema["properties"] = json::object();
    for (auto property = properties.begin(); property != properties.end(); ++property) {
        input_schema["properties"][property.key()] = {
            {"type", "string"},
            {"description", property.value()}
        };
    }
    if (!required.empty()) {
        input_schema["required"] = required;
    }
    return input_schema;
}

} // namespace tool_handlers
