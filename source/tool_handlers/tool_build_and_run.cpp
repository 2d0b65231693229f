#include "tool_handlers/tool_handlers.hpp"
#include "mcp/mcp_tools.hpp"
#include "orchestrator/orchestrator.hpp"
#include "protocol/json_rpc.hpp"
#include "utils/debug_log.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

// Tool handler for "build_and_run".
// Builds the project for the simulator, installs the app and launches it.

static json handle_build_and_run(const json &arguments) {
    std::string root_path = json_rpc::string_argument(arguments, "root_path");
    if (root_path.empty()) {
        return tool_handlers::missing_argument_result("root_path");
    }
    std::string udid = json_rpc::string_argument(arguments, "udid");
    if (udid.empty()) {
        return tool_handlers::missing_argument_result("udid");
    }
    // Optional; empty means "resolve the default scheme".
    std::string scheme = json_rpc::string_argument(arguments, "scheme");

    debug_log::log("build_and_run invoked for " + root_path + " on " + udid +
                   (scheme.empty() ? std::string() : " with scheme " + scheme));
    build_pipeline::PipelineResult result =
        orchestrator::build_and_run(orchestrator::default_state(), root_path, udid, scheme);
    return json_rpc::build_payload_result(orchestrator::to_json(result));
}

namespace tool_build_and_run {

void register_tool() {
    mcp_tools::register_tool({
        "build_and_run",
        "Build the iOS app in a project folder for a simulator, install it and launch it. "
        "The simulator boots in parallel with the build. On failure the result names the "
        "failing stage and, for build failures, the path of the retained build log. "
        "Cancellable with cancel_active_task.",
        tool_handlers::string_properties_schema(
            {{"root_path", "Absolute path of the project folder"},
             {"udid", "UDID of the target simulator"},
             {"scheme", "Scheme to build; defaults to the scheme list_schemes reports as default"}},
            json::array({"root_path", "udid"})),
        handle_build_and_run,
        true
    });
}

} // namespace tool_build_and_run
