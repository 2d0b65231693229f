#include "simctl/boot_controller.hpp"
#include "core/orchestrator_state.hpp"
#include "platform/platform_abi.hpp"
#include "process/process_runner.hpp"
#include "simctl/device_inventory.hpp"
#include "utils/debug_log.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>

namespace boot_controller {

bool is_already_booted_output(const std::string &stdout_text, const std::string &stderr_text) {
    std::string combined = stdout_text + "\n" + stderr_text;
    std::transform(combined.begin(), combined.end(), combined.begin(),
                   [](unsigned char character) { return static_cast<char>(std::tolower(character)); });
    return combined.find(ALREADY_BOOTED_PHRASE) != std::string::npos &&
           combined.find(ALREADY_BOOTED_STATE) != std::string::npos;
}

BootResult boot(orchestrator_state::OrchestratorState &state,
                const std::string &udid,
                uint64_t task_id,
                bool register_as_active,
                int timeout_milliseconds) {
    BootResult result;

    process_runner::RunOptions options;
    options.state = &state;
    options.task_id = task_id;
    options.register_as_active = register_as_active;
    options.timeout_milliseconds = timeout_milliseconds;
    process_runner::CommandResult boot_result =
        process_runner::run(state.config().xcrun_path, {"simctl", "boot", udid}, options);

    result.stdout_text = boot_result.stdout_text;
    result.stderr_text = boot_result.stderr_text;

    if (boot_result.success) {
        result.success = true;
        return result;
    }
    if (boot_result.timed_out) {
        result.error_message = "Simulator boot timed out.";
        return result;
    }
    if (boot_result.cancelled) {
        result.cancelled = true;
        result.error_message = process_runner::CANCELLED_MESSAGE;
        return result;
    }
    if (is_already_booted_output(boot_result.stdout_text, boot_result.stderr_text)) {
        debug_log::log("boot: " + udid + " already booted");
        result.success = true;
        return result;
    }

    result.error_message = process_runner::failure_text(boot_result, "Failed to boot simulator.");
    return result;
}

bool wait_until_booted(orchestrator_state::OrchestratorState &state,
                       const std::string &udid,
                       uint64_t task_id,
                       int timeout_milliseconds,
                       int poll_milliseconds) {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_milliseconds);

    while (true) {
        if (state.is_cancel_requested(task_id)) {
            debug_log::log("wait_until_booted: cancelled");
            return false;
        }

        std::optional<device_inventory::Device> device = device_inventory::find_device(state, udid, task_id);
        if (device && device->state == device_inventory::BOOTED_STATE) {
            return true;
        }
        debug_log::log("wait_until_booted: " + udid + " is " + (device ? device->state : std::string("not listed")));

        if (std::chrono::steady_clock::now() + std::chrono::milliseconds(poll_milliseconds) > deadline) {
            return false;
        }
        platform::sleep_milliseconds(poll_milliseconds);
    }
}

BootResult focus(orchestrator_state::OrchestratorState &state, const std::string &udid, uint64_t task_id) {
    BootResult result;

    process_runner::RunOptions options;
    options.state = &state;
    options.task_id = task_id;
    process_runner::CommandResult open_result = process_runner::run(
        state.config().open_path, {"-a", "Simulator", "--args", "-CurrentDeviceUDID", udid}, options);

    result.stdout_text = open_result.stdout_text;
    result.stderr_text = open_result.stderr_text;
    if (open_result.success) {
        result.success = true;
    } else if (open_result.cancelled) {
        result.cancelled = true;
        result.error_message = process_runner::CANCELLED_MESSAGE;
    } else {
        result.error_message = process_runner::failure_text(open_result, "Failed to open Simulator.");
    }
    return result;
}

} // namespace boot_controller
