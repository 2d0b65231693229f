#ifndef SIMPILOT_DEBUG_LOG_HPP
#define SIMPILOT_DEBUG_LOG_HPP

#include <string>

namespace debug_log {

// Returns true if SIMPILOT_DEBUG env is set to a truthy value (1, true, yes).
bool is_debug_enabled();

// Writes message to stderr with [simpilot] prefix only when is_debug_enabled().
void log(const std::string &message);

// Writes message to stderr with [simpilot] prefix unconditionally.
// Used for startup/shutdown and per-invocation timing summaries.
void info(const std::string &message);

} // namespace debug_log

#endif // SIMPILOT_DEBUG_LOG_HPP
