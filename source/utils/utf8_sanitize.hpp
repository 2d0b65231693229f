#ifndef SIMPILOT_UTF8_SANITIZE_HPP
#define SIMPILOT_UTF8_SANITIZE_HPP

// Captured tool output (xcodebuild logs, simctl errors) is arbitrary bytes.
// nlohmann::json::dump() throws on invalid UTF-8, so every string that leaves
// the core through JSON goes through here first.

#include <string>

namespace utf8_sanitize {

// Replaces every byte that does not start a well-formed UTF-8 sequence
// (stray continuation, overlong form, surrogate, > U+10FFFF, truncated tail)
// with U+FFFD. In-place version.
void sanitize(std::string &text);

// Same as above, returning a new string.
std::string sanitize(const std::string &text);

// True when text is already well-formed UTF-8.
bool is_valid(const std::string &text);

} // namespace utf8_sanitize

#endif // SIMPILOT_UTF8_SANITIZE_HPP
