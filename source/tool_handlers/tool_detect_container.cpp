#include "tool_handlers/tool_handlers.hpp"
#include "mcp/mcp_tools.hpp"
#include "orchestrator/orchestrator.hpp"
#include "protocol/json_rpc.hpp"
#include "utils/debug_log.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

// Tool handler for "detect_container".
// Locates the Xcode workspace or project under a folder and reports whether it targets iOS.

static json handle_detect_container(const json &arguments) {
    std::string root_path = json_rpc::string_argument(arguments, "root_path");
    if (root_path.empty()) {
        return tool_handlers::missing_argument_result("root_path");
    }

    debug_log::log("detect_container invoked for " + root_path);
    project_detection::DetectResult result = orchestrator::detect_container(orchestrator::default_state(), root_path);
    return json_rpc::build_payload_result(orchestrator::to_json(result));
}

namespace tool_detect_container {

void register_tool() {
    mcp_tools::register_tool({
        "detect_container",
        "Find the .xcworkspace or .xcodeproj for a project folder (searching up to three "
        "levels deep) and report whether it is an iOS project.",
        tool_handlers::string_properties_schema(
            {{"root_path", "Absolute path of the project folder (or of the container itself)"}},
            json::array({"root_path"})),
        handle_detect_container,
        true
    });
}

} // namespace tool_detect_container
