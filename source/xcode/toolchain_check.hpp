#ifndef SIMPILOT_TOOLCHAIN_CHECK_HPP
#define SIMPILOT_TOOLCHAIN_CHECK_HPP

// Verifies that a usable Xcode is selected before any simctl/xcodebuild work.

#include <string>

namespace orchestrator_state {
class OrchestratorState;
}

namespace toolchain_check {

struct XcodeCheckResult {
    bool success = false;
    std::string error_message;
};

// Runs `xcodebuild -version`.
XcodeCheckResult check_xcode_availability(orchestrator_state::OrchestratorState &state);

} // namespace toolchain_check

#endif // SIMPILOT_TOOLCHAIN_CHECK_HPP
