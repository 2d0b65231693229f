#include "tool_handlers/tool_handlers.hpp"
#include "mcp/mcp_tools.hpp"
#include "orchestrator/orchestrator.hpp"
#include "protocol/json_rpc.hpp"
#include "utils/debug_log.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

// Tool handler for "boot_and_focus".
// Boots the simulator, waits until it reports Booted, then brings Simulator.app forward.

static json handle_boot_and_focus(const json &arguments) {
    std::string udid = json_rpc::string_argument(arguments, "udid");
    if (udid.empty()) {
        return tool_handlers::missing_argument_result("udid");
    }

    debug_log::log("boot_and_focus invoked for " + udid);
    orchestrator::BootAndFocusResult result = orchestrator::boot_and_focus(orchestrator::default_state(), udid);
    return json_rpc::build_payload_result(orchestrator::to_json(result));
}

namespace tool_boot_and_focus {

void register_tool() {
    mcp_tools::register_tool({
        "boot_and_focus",
        "Boot a simulator (a no-op when it is already booted), wait for it to finish "
        "booting, and show it in Simulator.app. Cancellable with cancel_active_task.",
        tool_handlers::string_properties_schema(
            {{"udid", "UDID of the simulator, as returned by list_devices"}},
            json::array({"udid"})),
        handle_boot_and_focus,
        true
    });
}

} // namespace tool_boot_and_focus
