#include "tool_handlers/tool_handlers.hpp"
#include "mcp/mcp_tools.hpp"
#include "orchestrator/orchestrator.hpp"
#include "protocol/json_rpc.hpp"
#include "utils/debug_log.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

// Tool handler for "list_booted".

static json handle_list_booted(const json &arguments) {
    (void)arguments;

    debug_log::log("list_booted invoked");
    return json_rpc::build_payload_result(orchestrator::to_json(orchestrator::list_booted(orchestrator::default_state())));
}

namespace tool_list_booted {

void register_tool() {
    mcp_tools::register_tool({
        "list_booted",
        "List the iPhone simulators that are currently booted.",
        tool_handlers::string_properties_schema(json::object(), json::array()),
        handle_list_booted
    });
}

} // namespace tool_list_booted
