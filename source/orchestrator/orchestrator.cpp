#include "orchestrator/orchestrator.hpp"
#include "platform/platform_abi.hpp"
#include "process/process_runner.hpp"
#include "simctl/boot_controller.hpp"
#include "simctl/device_inventory.hpp"
#include "utils/debug_log.hpp"
#include "utils/utf8_sanitize.hpp"
#include "xcode/scheme_resolver.hpp"
#include "xcode/toolchain_check.hpp"

#include <filesystem>
#include <system_error>

namespace orchestrator {

namespace fs = std::filesystem;

orchestrator_state::OrchestratorState &default_state() {
    static orchestrator_state::OrchestratorState state(config::load_from_environment());
    return state;
}

bool host_supported(const orchestrator_state::OrchestratorState &state) {
    return platform::is_macos_host() || state.config().assume_supported_host;
}

// Empty string when root_path is a usable directory, else the validation message.
static std::string validate_root_path(const std::string &root_path) {
    if (root_path.empty()) {
        return "Project path is required.";
    }
    std::error_code error;
    bool is_directory = fs::is_directory(root_path, error);
    if (error) {
        return error.message();
    }
    if (!is_directory) {
        return "Project path is not a directory.";
    }
    return "";
}

simulator_types::DeviceListResult list_devices(orchestrator_state::OrchestratorState &state) {
    if (!host_supported(state)) {
        simulator_types::DeviceListResult result;
        result.stage = "platform";
        result.error_message = UNSUPPORTED_PLATFORM_MESSAGE;
        return result;
    }
    return device_inventory::list_devices(state);
}

simulator_types::DeviceListResult list_booted(orchestrator_state::OrchestratorState &state) {
    if (!host_supported(state)) {
        simulator_types::DeviceListResult result;
        result.stage = "platform";
        result.error_message = UNSUPPORTED_PLATFORM_MESSAGE;
        return result;
    }
    return device_inventory::list_booted(state);
}

project_detection::DetectResult detect_container(orchestrator_state::OrchestratorState &state,
                                                 const std::string &root_path) {
    project_detection::DetectResult result;
    if (!host_supported(state)) {
        result.stage = "platform";
        result.error_message = UNSUPPORTED_PLATFORM_MESSAGE;
        return result;
    }
    std::string invalid = validate_root_path(root_path);
    if (!invalid.empty()) {
        result.stage = "validation";
        result.error_message = invalid;
        return result;
    }
    return project_detection::detect_ios_project(state, root_path);
}

xcode_types::SchemeListResult list_schemes(orchestrator_state::OrchestratorState &state,
                                           const std::string &root_path) {
    xcode_types::SchemeListResult result;
    if (!host_supported(state)) {
        result.stage = "platform";
        result.error_message = UNSUPPORTED_PLATFORM_MESSAGE;
        return result;
    }
    std::string invalid = validate_root_path(root_path);
    if (!invalid.empty()) {
        result.stage = "validation";
        result.error_message = invalid;
        return result;
    }
    return scheme_resolver::list_schemes(state, root_path);
}

BootAndFocusResult boot_and_focus(orchestrator_state::OrchestratorState &state, const std::string &udid) {
    BootAndFocusResult result;
    if (!host_supported(state)) {
        result.stage = "platform";
        result.error_message = UNSUPPORTED_PLATFORM_MESSAGE;
        return result;
    }
    if (udid.empty()) {
        result.stage = "validation";
        result.error_message = "Simulator UDID is required.";
        return result;
    }

    toolchain_check::XcodeCheckResult xcode_check = toolchain_check::check_xcode_availability(state);
    if (!xcode_check.success) {
        result.stage = "xcode";
        result.error_message = xcode_check.error_message;
        return result;
    }

    uint64_t task_id = state.start_task();

    boot_controller::BootResult boot_result = boot_controller::boot(state, udid, task_id);
    if (!boot_result.success) {
        result.stage = boot_result.cancelled ? "cancelled" : "boot";
        result.error_message = boot_result.error_message;
    } else if (!boot_controller::wait_until_booted(state, udid, task_id)) {
        bool cancelled = state.is_cancel_requested(task_id);
        result.stage = cancelled ? "cancelled" : "bootstatus";
        result.error_message = cancelled ? process_runner::CANCELLED_MESSAGE : "Simulator did not finish booting.";
    } else {
        boot_controller::BootResult focus_result = boot_controller::focus(state, udid, task_id);
        if (!focus_result.success) {
            result.stage = focus_result.cancelled ? "cancelled" : "open";
            result.error_message = focus_result.error_message;
        } else {
            result.success = true;
        }
    }

    state.finish_task(task_id);
    debug_log::log("boot_and_focus " + udid + ": " + (result.success ? std::string("ok") : result.stage));
    return result;
}

build_pipeline::PipelineResult build_and_run(orchestrator_state::OrchestratorState &state,
                                             const std::string &root_path,
                                             const std::string &udid,
                                             const std::string &scheme) {
    if (!host_supported(state)) {
        build_pipeline::PipelineResult result;
        result.stage = "platform";
        result.error_message = UNSUPPORTED_PLATFORM_MESSAGE;
        return result;
    }
    return build_pipeline::build_and_run(state, root_path, udid, scheme);
}

bool cancel_active_task(orchestrator_state::OrchestratorState &state) {
    bool affected = state.cancel();
    debug_log::log(std::string("cancel_active_task: ") + (affected ? "cancelled" : "nothing to cancel"));
    return affected;
}

// Failure envelope shared by every result shape.
static json failure_json(const std::string &stage, const std::string &error_message) {
    json output;
    output["ok"] = false;
    output["stage"] = stage;
    output["error"] = utf8_sanitize::sanitize(error_message);
    return output;
}

static json details_json(const xcode_types::CommandDetails &details) {
    json output = json::object();
    output["stdout"] = utf8_sanitize::sanitize(details.stdout_text);
    output["stderr"] = utf8_sanitize::sanitize(details.stderr_text);
    if (!details.log_path.empty()) {
        output["logPath"] = details.log_path;
    }
    return output;
}

static json container_json(const xcode_types::Container &container) {
    json output;
    output["type"] = xcode_types::container_type_name(container.type);
    output["path"] = container.path;
    return output;
}

json to_json(const simulator_types::DeviceListResult &result) {
    if (!result.success) {
        return failure_json(result.stage, result.error_message);
    }
    json devices = json::array();
    for (const auto &device : result.devices) {
        json runtime;
        runtime["identifier"] = device.runtime.identifier;
        runtime["name"] = device.runtime.name;
        runtime["platform"] = device.runtime.platform;
        runtime["version"] = device.runtime.version;
        runtime["isAvailable"] = device.runtime.is_available;

        json entry;
        entry["name"] = utf8_sanitize::sanitize(device.name);
        entry["udid"] = device.udid;
        entry["state"] = device.state;
        entry["isAvailable"] = device.is_available;
        entry["runtime"] = runtime;
        entry["isIphone"] = device.is_phone_family;
        entry["modelNumber"] = device.model_number;
        devices.push_back(entry);
    }
    json output;
    output["ok"] = true;
    output["devices"] = devices;
    output["bestUdid"] = result.best_udid.empty() ? json(nullptr) : json(result.best_udid);
    return output;
}

json to_json(const project_detection::DetectResult &result) {
    if (!result.success) {
        return failure_json(result.stage, result.error_message);
    }
    json output;
    output["ok"] = true;
    output["isIosProject"] = result.is_ios_project;
    output["container"] = container_json(result.container);
    return output;
}

json to_json(const xcode_types::SchemeListResult &result) {
    if (!result.success) {
        json output = failure_json(result.stage, result.error_message);
        if (!result.details.stdout_text.empty() || !result.details.stderr_text.empty()) {
            output["details"] = details_json(result.details);
        }
        return output;
    }
    json output;
    output["ok"] = true;
    output["schemes"] = result.schemes;
    output["defaultScheme"] = result.default_scheme.empty() ? json(nullptr) : json(result.default_scheme);
    output["container"] = container_json(result.container);
    return output;
}

json to_json(const BootAndFocusResult &result) {
    if (!result.success) {
        return failure_json(result.stage, result.error_message);
    }
    json output;
    output["ok"] = true;
    return output;
}

json to_json(const build_pipeline::PipelineResult &result) {
    json output;
    if (result.success) {
        output["ok"] = true;
        output["scheme"] = result.scheme;
        output["bundleId"] = result.bundle_id;
        output["appPath"] = result.app_path;
    } else {
        output = failure_json(result.stage, result.error_message);
        if (!result.scheme.empty()) {
            output["scheme"] = result.scheme;
        }
        if (!result.derived_data_path.empty()) {
            output["derivedDataPath"] = result.derived_data_path;
        }
        if (result.has_details) {
            output["details"] = details_json(result.details);
        }
    }
    json timings = json::object();
    for (const auto &timing : result.stage_timings) {
        timings[timing.first] = timing.second;
    }
    output["timings"] = timings;
    return output;
}

} // namespace orchestrator
