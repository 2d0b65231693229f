#ifndef SIMPILOT_BOOT_CONTROLLER_HPP
#define SIMPILOT_BOOT_CONTROLLER_HPP

// Simulator boot state transitions: idempotent boot, polling wait, and
// bringing Simulator.app to the front on a device.

#include <cstdint>
#include <string>

namespace orchestrator_state {
class OrchestratorState;
}

namespace boot_controller {

constexpr int BOOT_WAIT_TIMEOUT_MILLISECONDS = 10000;
constexpr int BOOT_POLL_INTERVAL_MILLISECONDS = 500;

// simctl's wording when the device is already up. Toolchain-version fragile:
// both substrings must appear in the lower-cased combined output.
static const char ALREADY_BOOTED_PHRASE[] = "unable to boot device in current state";
static const char ALREADY_BOOTED_STATE[] = "booted";

struct BootResult {
    bool success = false;
    bool cancelled = false;
    std::string error_message;
    std::string stdout_text;
    std::string stderr_text;
};

// True when a failed boot's output says the device is already booted.
bool is_already_booted_output(const std::string &stdout_text, const std::string &stderr_text);

// `simctl boot <udid>`, killed after timeout_milliseconds. register_as_active=false
// lets a concurrent command (the build) keep the kill-on-cancel slot; the boot
// is then killed by its runner when the task is cancelled.
BootResult boot(orchestrator_state::OrchestratorState &state,
                const std::string &udid,
                uint64_t task_id,
                bool register_as_active = true,
                int timeout_milliseconds = BOOT_WAIT_TIMEOUT_MILLISECONDS);

// Polls live device state until Booted. Returns false on timeout, on a
// failed query that outlasts the timeout, or as soon as a cancel is observed.
bool wait_until_booted(orchestrator_state::OrchestratorState &state,
                       const std::string &udid,
                       uint64_t task_id,
                       int timeout_milliseconds = BOOT_WAIT_TIMEOUT_MILLISECONDS,
                       int poll_milliseconds = BOOT_POLL_INTERVAL_MILLISECONDS);

// `open -a Simulator --args -CurrentDeviceUDID <udid>`.
BootResult focus(orchestrator_state::OrchestratorState &state, const std::string &udid, uint64_t task_id);

} // namespace boot_controller

#endif // SIMPILOT_BOOT_CONTROLLER_HPP
