#ifndef SIMPILOT_PROJECT_DETECTION_HPP
#define SIMPILOT_PROJECT_DETECTION_HPP

// Decides whether a discovered container builds for iOS, first from
// project.pbxproj build-setting hints, then from xcodebuild -showBuildSettings.

#include <string>
#include <vector>

#include "xcode/xcode_types.hpp"

namespace orchestrator_state {
class OrchestratorState;
}

namespace project_detection {

constexpr size_t PBXPROJ_QUICK_READ_BYTES = 512 * 1024;
constexpr size_t PBXPROJ_FULL_READ_BYTES = 5 * 1024 * 1024;
constexpr int SHOW_BUILD_SETTINGS_TIMEOUT_MILLISECONDS = 10000;

const std::vector<std::string> &pbxproj_ios_hints();

// True when text contains any iOS build-setting hint.
bool text_has_ios_hints(const std::string &text);

// Hint check of one project.pbxproj (cached per file).
bool project_file_has_ios_hints(orchestrator_state::OrchestratorState &state, const std::string &pbxproj_path);

// Workspace: any referenced project has hints. Project: its own pbxproj.
bool container_has_ios_hints(orchestrator_state::OrchestratorState &state, const xcode_types::Container &container);

// `sdkroot = iphone...` / `supported_platforms = iphone...` in showBuildSettings output.
bool build_settings_target_ios(const std::string &settings_text);

struct DetectResult {
    bool success = false;
    bool is_ios_project = false;
    xcode_types::Container container;
    std::string stage;
    std::string error_message;
};

// Container discovery followed by the iOS check. Does not validate root_path.
DetectResult detect_ios_project(orchestrator_state::OrchestratorState &state, const std::string &root_path);

} // namespace project_detection

#endif // SIMPILOT_PROJECT_DETECTION_HPP
