#ifndef SIMPILOT_BUILD_PIPELINE_HPP
#define SIMPILOT_BUILD_PIPELINE_HPP

// Build/install/launch pipeline:
//   validation -> container/schemes -> prepare -> (boot || build) -> app
//   -> boot wait -> bundle-id -> install (or in-place patch) -> launch.
// Runs as the orchestrator's single trackable task; failures after the run
// directory exists are quarantined under failures/.

#include <string>
#include <utility>
#include <vector>

#include "xcode/xcode_types.hpp"

namespace orchestrator_state {
class OrchestratorState;
}

namespace build_pipeline {

static const char BUILD_LOG_FILE_NAME[] = "build.log";

struct PipelineResult {
    bool success = false;
    std::string stage; // failing stage; empty on success
    std::string error_message;
    std::string scheme;
    std::string bundle_id;
    std::string app_path;
    std::string derived_data_path;
    bool has_details = false;
    xcode_types::CommandDetails details;
    // Stage name -> milliseconds, in execution order.
    std::vector<std::pair<std::string, long>> stage_timings;
};

// Per-project artifact locations under the configured work root.
struct WorkspacePaths {
    std::string base_directory;      // <work root>/<slug>-<hash>
    std::string derived_data_directory;
    std::string runs_directory;
    std::string failures_directory;
};

// Folder name with every run of characters outside [A-Za-z0-9._-] replaced by '-'.
std::string project_slug(const std::string &root_path);

// 32-bit FNV-1a of text as 8 lowercase hex digits.
std::string fnv1a_hex(const std::string &text);

WorkspacePaths workspace_paths(const std::string &work_root, const std::string &root_path);

// "<epoch ms>-<6 hex digits>".
std::string make_run_id();

// Last non-empty, trimmed line of tool output ("" when none).
std::string last_output_line(const std::string &text);

// Searches Debug-iphonesimulator, then Release-iphonesimulator, for
// <scheme>.app, else the first .app by name. Empty when nothing was built.
std::string find_built_app(const std::string &derived_data_directory, const std::string &scheme);

// Full pipeline. Never throws.
PipelineResult build_and_run(orchestrator_state::OrchestratorState &state,
                             const std::string &root_path,
                             const std::string &udid,
                             const std::string &requested_scheme);

// One "name=Nms" summary line of the recorded stage timings.
std::string format_timings(const PipelineResult &result);

} // namespace build_pipeline

#endif // SIMPILOT_BUILD_PIPELINE_HPP
