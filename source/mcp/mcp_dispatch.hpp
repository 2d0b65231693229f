#ifndef SIMPILOT_MCP_DISPATCH_HPP
#define SIMPILOT_MCP_DISPATCH_HPP

// MCP JSON-RPC method dispatch.

#include <nlohmann/json.hpp>

namespace mcp_dispatch {

using json = nlohmann::json;

// Dispatch a single JSON-RPC message. Returns the response JSON, or a null
// json value for notifications (which require no response).
json dispatch_message(const json &message);

// True for a tools/call request naming a long-running tool.
bool is_long_running_call(const json &message);

} // namespace mcp_dispatch

#endif // SIMPILOT_MCP_DISPATCH_HPP
