#include "tool_handlers/tool_handlers.hpp"
#include "mcp/mcp_tools.hpp"
#include "orchestrator/orchestrator.hpp"
#include "protocol/json_rpc.hpp"
#include "utils/debug_log.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

// Tool handler for "cancel_active_task".
// Flags the running boot or build task as cancelled and kills its current command.

static json handle_cancel_active_task(const json &arguments) {
    (void)arguments;

    debug_log::log("cancel_active_task invoked");
    json payload;
    payload["ok"] = true;
    payload["cancelled"] = orchestrator::cancel_active_task(orchestrator::default_state());
    return json_rpc::build_payload_result(payload);
}

namespace tool_cancel_active_task {

void register_tool() {
    mcp_tools::register_tool({
        "cancel_active_task",
        "Cancel the running boot_and_focus or build_and_run task. cancelled is false when "
        "nothing was running.",
        tool_handlers::string_properties_schema(json::object(), json::array()),
        handle_cancel_active_task
    });
}

} // namespace tool_cancel_active_task
