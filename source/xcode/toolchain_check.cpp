#include "xcode/toolchain_check.hpp"
#include "core/orchestrator_state.hpp"
#include "process/process_runner.hpp"
#include "utils/debug_log.hpp"

namespace toolchain_check {

static const char XCODE_MISSING_MESSAGE[] = "Xcode is not installed. Install Xcode to use iOS simulators.";

XcodeCheckResult check_xcode_availability(orchestrator_state::OrchestratorState &state) {
    XcodeCheckResult result;

    process_runner::CommandResult version_result =
        process_runner::run(state.config().xcodebuild_path, {"-version"});
    if (version_result.success) {
        result.success = true;
        return result;
    }

    std::string reason = process_runner::failure_text(version_result, "");
    debug_log::log("xcodebuild -version failed: " + reason);
    // Only the command line tools are selected: xcodebuild points at xcode-select.
    if (reason.empty() || reason.find("xcode-select") != std::string::npos) {
        result.error_message = XCODE_MISSING_MESSAGE;
    } else {
        result.error_message = reason;
    }
    return result;
}

} // namespace toolchain_check
