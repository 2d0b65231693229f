#ifndef SIMPILOT_MCP_STDIO_HPP
#define SIMPILOT_MCP_STDIO_HPP

// MCP stdio transport: framed JSON messages on stdin, responses on stdout.

#include <istream>
#include <string>

namespace mcp_stdio {

// Read a single complete JSON object from input.
// Returns the raw JSON string, or empty string on EOF.
std::string read_message(std::istream &input);

// Same, from std::cin.
std::string read_message();

// Write a JSON message to stdout followed by a newline. Safe to call from
// several threads; each message is written whole.
void write_message(const std::string &json_string);

} // namespace mcp_stdio

#endif // SIMPILOT_MCP_STDIO_HPP
