#include "tool_handlers/tool_handlers.hpp"
#include "mcp/mcp_tools.hpp"
#include "orchestrator/orchestrator.hpp"
#include "protocol/json_rpc.hpp"
#include "utils/debug_log.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

// Tool handler for "list_devices".
// Returns the ranked iPhone simulators of the installed iOS runtimes.

static json handle_list_devices(const json &arguments) {
    (void)arguments;

    debug_log::log("list_devices invoked");
    simulator_types::DeviceListResult result = orchestrator::list_devices(orchestrator::default_state());
    if (result.success) {
        debug_log::log("list_devices found " + std::to_string(result.devices.size()) + " device(s)");
    }
    return json_rpc::build_payload_result(orchestrator::to_json(result));
}

namespace tool_list_devices {

void register_tool() {
    mcp_tools::register_tool({
        "list_devices",
        "List available iPhone simulators on installed iOS runtimes, best candidates first. "
        "The result includes bestUdid, the recommended simulator to target.",
        tool_handlers::string_properties_schema(json::object(), json::array()),
        handle_list_devices
    });
}

} // namespace tool_list_devices
