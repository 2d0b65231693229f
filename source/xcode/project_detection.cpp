#include "xcode/project_detection.hpp"
#include "core/orchestrator_state.hpp"
#include "platform/platform_abi.hpp"
#include "process/process_runner.hpp"
#include "utils/debug_log.hpp"
#include "xcode/container_discovery.hpp"
#include "xcode/scheme_resolver.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>

namespace project_detection {

namespace fs = std::filesystem;

const std::vector<std::string> &pbxproj_ios_hints() {
    static const std::vector<std::string> hints = {
        "SDKROOT = iphoneos",
        "SDKROOT = iphonesimulator",
        "IPHONEOS_DEPLOYMENT_TARGET",
        "TARGETED_DEVICE_FAMILY",
    };
    return hints;
}

bool text_has_ios_hints(const std::string &text) {
    for (const auto &hint : pbxproj_ios_hints()) {
        if (text.find(hint) != std::string::npos) {
            return true;
        }
    }
    return false;
}

bool project_file_has_ios_hints(orchestrator_state::OrchestratorState &state, const std::string &pbxproj_path) {
    bool cached = false;
    if (state.project_hint_cache.lookup(pbxproj_path, cached)) {
        return cached;
    }

    bool has_hints = false;
    std::string contents;
    if (platform::read_file_prefix(pbxproj_path, PBXPROJ_QUICK_READ_BYTES, contents)) {
        has_hints = text_has_ios_hints(contents);
        // Large projects can keep build settings past the first chunk.
        if (!has_hints && contents.size() == PBXPROJ_QUICK_READ_BYTES &&
            platform::read_file_prefix(pbxproj_path, PBXPROJ_FULL_READ_BYTES, contents)) {
            has_hints = text_has_ios_hints(contents);
        }
    }

    state.project_hint_cache.store(pbxproj_path, has_hints);
    return has_hints;
}

bool container_has_ios_hints(orchestrator_state::OrchestratorState &state, const xcode_types::Container &container) {
    if (container.type == xcode_types::ContainerType::Project) {
        return project_file_has_ios_hints(state, (fs::path(container.path) / "project.pbxproj").string());
    }
    for (const auto &project_path : container_discovery::parse_workspace_projects(container.path)) {
        if (project_file_has_ios_hints(state, (fs::path(project_path) / "project.pbxproj").string())) {
            return true;
        }
    }
    return false;
}

bool build_settings_target_ios(const std::string &settings_text) {
    std::string lowered = settings_text;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char character) { return static_cast<char>(std::tolower(character)); });
    return lowered.find("sdkroot = iphone") != std::string::npos ||
           lowered.find("supported_platforms = iphone") != std::string::npos;
}

DetectResult detect_ios_project(orchestrator_state::OrchestratorState &state, const std::string &root_path) {
    DetectResult result;

    std::optional<xcode_types::Container> container = container_discovery::find_container(state, root_path);
    if (!container) {
        result.stage = "container";
        result.error_message = "No Xcode workspace or project found.";
        return result;
    }
    result.container = *container;

    if (container_has_ios_hints(state, *container)) {
        result.success = true;
        result.is_ios_project = true;
        return result;
    }

    // No hints in the project files: ask xcodebuild about the first app scheme.
    debug_log::log("detect: no pbxproj hints for " + container->path + ", reading build settings");
    xcode_types::SchemeListResult scheme_list = scheme_resolver::list_schemes(state, root_path, *container);
    if (!scheme_list.success) {
        result.stage = scheme_list.stage.empty() ? "schemes" : scheme_list.stage;
        result.error_message = scheme_list.error_message.empty() ? "No iOS targets detected." : scheme_list.error_message;
        return result;
    }

    auto candidate = std::find_if(scheme_list.schemes.begin(), scheme_list.schemes.end(),
                                  [](const std::string &scheme) { return !scheme_resolver::is_test_scheme(scheme); });
    if (candidate == scheme_list.schemes.end()) {
        result.stage = "schemes";
        result.error_message = "No iOS targets detected.";
        return result;
    }

    process_runner::RunOptions options;
    options.working_directory = root_path;
    options.timeout_milliseconds = SHOW_BUILD_SETTINGS_TIMEOUT_MILLISECONDS;
    process_runner::CommandResult settings_result = process_runner::run(
        state.config().xcodebuild_path,
        {"-showBuildSettings", xcode_types::container_flag(container->type), container->path, "-scheme", *candidate},
        options);

    std::string settings_text = settings_result.stdout_text;
    if (!settings_result.stderr_text.empty()) {
        settings_text += "\n" + settings_result.stderr_text;
    }
    if (settings_result.success && build_settings_target_ios(settings_text)) {
        result.success = true;
        result.is_ios_project = true;
        return result;
    }

    result.stage = "build";
    result.error_message = settings_result.success
        ? "No iOS targets detected."
        : process_runner::failure_text(settings_result, "Failed to read build settings.");
    return result;
}

} // namespace project_detection
