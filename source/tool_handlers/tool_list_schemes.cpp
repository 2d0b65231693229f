#include "tool_handlers/tool_handlers.hpp"
#include "mcp/mcp_tools.hpp"
#include "orchestrator/orchestrator.hpp"
#include "protocol/json_rpc.hpp"
#include "utils/debug_log.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

// Tool handler for "list_schemes".

static json handle_list_schemes(const json &arguments) {
    std::string root_path = json_rpc::string_argument(arguments, "root_path");
    if (root_path.empty()) {
        return tool_handlers::missing_argument_result("root_path");
    }

    debug_log::log("list_schemes invoked for " + root_path);
    xcode_types::SchemeListResult result = orchestrator::list_schemes(orchestrator::default_state(), root_path);
    return json_rpc::build_payload_result(orchestrator::to_json(result));
}

namespace tool_list_schemes {

void register_tool() {
    mcp_tools::register_tool({
        "list_schemes",
        "List the Xcode schemes of a project folder. defaultScheme is set when one "
        "scheme is clearly the app to build, and is null when the choice is ambiguous.",
        tool_handlers::string_properties_schema(
            {{"root_path", "Absolute path of the project folder"}},
            json::array({"root_path"})),
        handle_list_schemes,
        true
    });
}

} // namespace tool_list_schemes
