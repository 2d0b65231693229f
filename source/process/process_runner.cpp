#include "process/process_runner.hpp"
#include "core/orchestrator_state.hpp"
#include "platform/platform_abi.hpp"
#include "utils/debug_log.hpp"

#include <algorithm>
#include <chrono>

namespace process_runner {

using steady_clock = std::chrono::steady_clock;

// Poll slice: bounds how late a timeout or cancel-kill is noticed.
static constexpr int POLL_SLICE_MILLISECONDS = 50;

void append_bounded(std::string &buffer, const std::string &chunk, size_t limit) {
    if (buffer.size() >= limit) {
        return;
    }
    size_t room = limit - buffer.size();
    buffer.append(chunk, 0, std::min(room, chunk.size()));
}

std::string failure_text(const CommandResult &result, const std::string &fallback) {
    if (!result.stderr_text.empty()) {
        return result.stderr_text;
    }
    if (!result.error_message.empty()) {
        return result.error_message;
    }
    return fallback;
}

static std::string describe(const std::string &command, const std::vector<std::string> &arguments) {
    std::string text = command;
    for (const auto &argument : arguments) {
        text += " " + argument;
    }
    return text;
}

static long elapsed_milliseconds(steady_clock::time_point since) {
    return static_cast<long>(
        std::chrono::duration_cast<std::chrono::milliseconds>(steady_clock::now() - since).count());
}

CommandResult run(const std::string &command,
                  const std::vector<std::string> &arguments,
                  const RunOptions &options) {
    CommandResult result;
    orchestrator_state::OrchestratorState *state = options.state;

    bool tracked = state != nullptr && options.task_id && state->is_active_task(*options.task_id);
    if (tracked && state->is_cancel_requested(*options.task_id)) {
        debug_log::log("run: cancelled before spawn: " + describe(command, arguments));
        result.error_message = CANCELLED_MESSAGE;
        result.cancelled = true;
        return result;
    }

    debug_log::log("run: " + describe(command, arguments));
    platform::SpawnResult spawn_result =
        platform::spawn_process(command, arguments, options.working_directory);
    if (!spawn_result.success) {
        result.error_message = spawn_result.error_message;
        return result;
    }

    int process_id = spawn_result.process_id;
    uint64_t registration = 0;
    if (tracked && options.register_as_active) {
        bool already_cancelled = false;
        registration = state->register_command(*options.task_id, process_id, already_cancelled);
        if (already_cancelled) {
            platform::kill_process(process_id);
        }
    }

    bool timed_out = false;
    bool killed = false;
    bool force_killed = false;
    steady_clock::time_point started_at = steady_clock::now();
    steady_clock::time_point killed_at;

    std::vector<int> open_descriptors = {spawn_result.stdout_descriptor, spawn_result.stderr_descriptor};
    std::string chunk;

    while (true) {
        if (!killed) {
            if (options.timeout_milliseconds > 0 && elapsed_milliseconds(started_at) >= options.timeout_milliseconds) {
                timed_out = true;
                debug_log::log("run: timeout after " + std::to_string(options.timeout_milliseconds) +
                               " ms, killing pid " + std::to_string(process_id));
            }
            bool cancel_observed = (registration != 0 && state->is_command_cancelled(registration)) ||
                                   (tracked && state->is_cancel_requested(*options.task_id));
            if (timed_out || cancel_observed) {
                killed = true;
                killed_at = steady_clock::now();
                platform::kill_process(process_id);
            }
        } else {
            long since_kill = elapsed_milliseconds(killed_at);
            if (!force_killed && since_kill >= TERMINATE_GRACE_MILLISECONDS) {
                force_killed = true;
                debug_log::log("run: pid " + std::to_string(process_id) + " outlived SIGTERM, sending SIGKILL");
                platform::force_kill_process(process_id);
            }
            // Descendants that left the process group may keep the pipes open; stop waiting for them.
            if (since_kill >= KILL_DRAIN_GRACE_MILLISECONDS && !open_descriptors.empty()) {
                for (int descriptor : open_descriptors) {
                    platform::close_descriptor(descriptor);
                }
                open_descriptors.clear();
            }
        }

        if (open_descriptors.empty()) {
            if (platform::process_has_exited(process_id)) {
                break;
            }
            platform::sleep_milliseconds(POLL_SLICE_MILLISECONDS);
            continue;
        }

        std::vector<int> ready = platform::wait_readable(open_descriptors, POLL_SLICE_MILLISECONDS);
        for (int descriptor : ready) {
            bool still_open = platform::read_chunk(descriptor, chunk);
            if (descriptor == spawn_result.stdout_descriptor) {
                append_bounded(result.stdout_text, chunk);
            } else {
                append_bounded(result.stderr_text, chunk);
            }
            if (!still_open) {
                platform::close_descriptor(descriptor);
                open_descriptors.erase(std::remove(open_descriptors.begin(), open_descriptors.end(), descriptor),
                                       open_descriptors.end());
            }
        }
    }

    bool record_cancelled = timed_out;
    if (registration != 0) {
        // Unregister before reaping so cancel() never signals a recycled pid.
        record_cancelled = state->unregister_command(registration) || record_cancelled;
    }
    platform::ExitStatus exit_status = platform::wait_process(process_id);

    // A cancel that arrived while the command ran marks it cancelled even if it exited cleanly.
    if (tracked && state->is_cancel_requested(*options.task_id)) {
        record_cancelled = true;
    }

    if (exit_status.exited_normally) {
        result.exit_code = exit_status.exit_code;
    }
    result.cancelled = record_cancelled;
    result.timed_out = timed_out;
    result.success = !timed_out && !record_cancelled && exit_status.exited_normally && exit_status.exit_code == 0;
    if (timed_out) {
        result.error_message = TIMEOUT_MESSAGE;
    } else if (record_cancelled) {
        result.error_message = CANCELLED_MESSAGE;
    }

    debug_log::log("run: " + command + " finished in " + std::to_string(elapsed_milliseconds(started_at)) +
                   " ms, exit=" + (result.exit_code ? std::to_string(*result.exit_code) : std::string("none")) +
                   (result.cancelled ? " (cancelled)" : ""));
    return result;
}

} // namespace process_runner
