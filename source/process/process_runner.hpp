#ifndef SIMPILOT_PROCESS_RUNNER_HPP
#define SIMPILOT_PROCESS_RUNNER_HPP

// Runs one external command to completion, capturing bounded output,
// with optional timeout and cooperative cancellation through the
// orchestrator state's active task.

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace orchestrator_state {
class OrchestratorState;
}

namespace process_runner {

// Per-stream capture ceiling. Output past it is dropped, not rotated.
constexpr size_t OUTPUT_LIMIT_BYTES = 1024 * 1024;

// After SIGTERM, how long the process group gets before SIGKILL.
constexpr int TERMINATE_GRACE_MILLISECONDS = 1000;

// After a kill, how long to keep draining pipes that escaped descendants may hold open.
constexpr int KILL_DRAIN_GRACE_MILLISECONDS = 2000;

static const char CANCELLED_MESSAGE[] = "Cancelled";
static const char TIMEOUT_MESSAGE[] = "Command timeout";

struct RunOptions {
    std::string working_directory;
    int timeout_milliseconds = 0; // 0 = no timeout

    // Cancellation context. The command is tracked only when state is set
    // and task_id is the state's active task.
    orchestrator_state::OrchestratorState *state = nullptr;
    std::optional<uint64_t> task_id;

    // Whether a tracked command takes the active-command slot (and so is
    // killed by cancel() itself). A tracked command that does not is killed
    // by the runner once it sees the task's cancel flag.
    bool register_as_active = true;
};

struct CommandResult {
    bool success = false;
    std::string stdout_text;
    std::string stderr_text;
    std::optional<int> exit_code; // absent: spawn failure or killed by a signal
    std::string error_message;
    bool cancelled = false; // also set by a timeout
    bool timed_out = false;
};

CommandResult run(const std::string &command,
                  const std::vector<std::string> &arguments,
                  const RunOptions &options = {});

// Appends chunk to buffer without letting buffer grow past limit.
void append_bounded(std::string &buffer, const std::string &chunk, size_t limit = OUTPUT_LIMIT_BYTES);

// Best human-readable error for a failed result: stderr, then error, then fallback.
std::string failure_text(const CommandResult &result, const std::string &fallback);

} // namespace process_runner

#endif // SIMPILOT_PROCESS_RUNNER_HPP
