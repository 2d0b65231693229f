#ifndef SIMPILOT_TOOL_HANDLERS_HPP
#define SIMPILOT_TOOL_HANDLERS_HPP

// Tool handler registration.
// Each tool_*.cpp file provides a register function that is called during startup.

#include <nlohmann/json.hpp>
#include <string>

namespace tool_handlers {

using json = nlohmann::json;

// Register all available tool handlers with the MCP tool registry.
void register_all_tools();

// Tool result for a call whose required argument is missing or not a string.
json missing_argument_result(const std::string &argument_name);

// JSON Schema for an object whose properties are all strings.
json string_properties_schema(const json &properties, const json &required);

} // namespace tool_handlers

#endif // SIMPILOT_TOOL_HANDLERS_HPP
