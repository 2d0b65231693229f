#ifndef SIMPILOT_ORCHESTRATOR_HPP
#define SIMPILOT_ORCHESTRATOR_HPP

// Public operations consumed by the IPC layer. Every operation returns a
// plain result (never throws) and fails with stage "platform" on hosts
// without the simulator toolchain, before any external tool is touched.

#include <nlohmann/json.hpp>
#include <string>

#include "core/orchestrator_state.hpp"
#include "pipeline/build_pipeline.hpp"
#include "simctl/simulator_types.hpp"
#include "xcode/project_detection.hpp"
#include "xcode/xcode_types.hpp"

namespace orchestrator {

using json = nlohmann::json;

static const char UNSUPPORTED_PLATFORM_MESSAGE[] = "iOS Simulator is only available on macOS.";

// Result of boot_and_focus.
struct BootAndFocusResult {
    bool success = false;
    std::string stage;
    std::string error_message;
};

// The process-wide state used by the server's tool handlers.
orchestrator_state::OrchestratorState &default_state();

// True on macOS or when the configuration assumes a supported host.
bool host_supported(const orchestrator_state::OrchestratorState &state);

simulator_types::DeviceListResult list_devices(orchestrator_state::OrchestratorState &state);
simulator_types::DeviceListResult list_booted(orchestrator_state::OrchestratorState &state);
project_detection::DetectResult detect_container(orchestrator_state::OrchestratorState &state,
                                                 const std::string &root_path);
xcode_types::SchemeListResult list_schemes(orchestrator_state::OrchestratorState &state,
                                           const std::string &root_path);
BootAndFocusResult boot_and_focus(orchestrator_state::OrchestratorState &state, const std::string &udid);
build_pipeline::PipelineResult build_and_run(orchestrator_state::OrchestratorState &state,
                                             const std::string &root_path,
                                             const std::string &udid,
                                             const std::string &scheme);
// True when something (a task or a running command) was cancelled.
bool cancel_active_task(orchestrator_state::OrchestratorState &state);

// Wire shapes ({ok, stage?, error?, ...}); all strings are sanitized UTF-8.
json to_json(const simulator_types::DeviceListResult &result);
json to_json(const project_detection::DetectResult &result);
json to_json(const xcode_types::SchemeListResult &result);
json to_json(const BootAndFocusResult &result);
json to_json(const build_pipeline::PipelineResult &result);

} // namespace orchestrator

#endif // SIMPILOT_ORCHESTRATOR_HPP
