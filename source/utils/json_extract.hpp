#ifndef SIMPILOT_JSON_EXTRACT_HPP
#define SIMPILOT_JSON_EXTRACT_HPP

// Pulls a JSON object out of tool output that may be wrapped in noise
// (warnings before the payload, the payload on stderr, or split across both).

#include <nlohmann/json.hpp>
#include <string>

namespace json_extract {

using json = nlohmann::json;

// Tries stdout, then stderr, then stdout + "\n" + stderr. For each candidate
// the span from the first '{' to the last '}' is parsed; the first success wins.
// Returns a null json when no candidate parses.
json extract_object(const std::string &stdout_text, const std::string &stderr_text);

} // namespace json_extract

#endif // SIMPILOT_JSON_EXTRACT_HPP
