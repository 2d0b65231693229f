#include "mcp/mcp_tools.hpp"
#include "protocol/json_rpc.hpp"
#include "utils/debug_log.hpp"

#include <exception>

namespace mcp_tools {

// Global tool registry (module-level, not class-based). Filled once at
// startup before any worker thread exists, read-only afterwards.
static std::vector<ToolDefinition> registered_tools;

void register_tool(const ToolDefinition &definition) {
    for (auto &tool : registered_tools) {
        if (tool.name == definition.name) {
            tool = definition;
            return;
        }
    }
    registered_tools.push_back(definition);
}

json build_tools_list_response() {
    json tools_array = json::array();
    for (const auto &tool : registered_tools) {
        json tool_entry;
        tool_entry["name"] = tool.name;
        tool_entry["description"] = tool.description;
        tool_entry["inputSchema"] = tool.input_schema;
        tools_array.push_back(tool_entry);
    }

    json result;
    result["tools"] = tools_array;
    return result;
}

json dispatch_tool_call(const std::string &tool_name, const json &arguments) {
    for (const auto &tool : registered_tools) {
        if (tool.name != tool_name) {
            continue;
        }
        try {
            return tool.handler(arguments);
        } catch (const std::exception &error) {
            debug_log::info(tool_name + " failed: " + error.what());
            return json_rpc::build_text_result(tool_name + " failed: " + error.what(), true);
        }
    }

    return json_rpc::build_text_result("Unknown tool: " + tool_name, true);
}

bool is_long_running(const std::string &tool_name) {
    for (const auto &tool : registered_tools) {
        if (tool.name == tool_name) {
            return tool.long_running;
        }
    }
    return false;
}

const std::vector<ToolDefinition> &get_registered_tools() {
    return registered_tools;
}

} // namespace mcp_tools
