#include "simctl/device_inventory.hpp"
#include "core/orchestrator_state.hpp"
#include "process/process_runner.hpp"
#include "utils/debug_log.hpp"
#include "utils/json_extract.hpp"
#include "xcode/toolchain_check.hpp"

#include <algorithm>
#include <cctype>
#include <map>
#include <stdexcept>

namespace device_inventory {

static std::string to_lower(const std::string &input) {
    std::string result = input;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char character) { return static_cast<char>(std::tolower(character)); });
    return result;
}

static bool starts_with(const std::string &text, const std::string &prefix) {
    return text.compare(0, prefix.size(), prefix) == 0;
}

// Catalog fields are loosely typed across Xcode versions; anything that is
// not a string reads as empty.
static std::string string_field(const json &object, const char *key) {
    if (!object.is_object()) {
        return "";
    }
    auto found = object.find(key);
    if (found == object.end() || !found->is_string()) {
        return "";
    }
    return found->get<std::string>();
}

// Only an explicit false counts as unavailable.
static bool availability_field(const json &object, const char *key) {
    auto found = object.find(key);
    if (found == object.end() || !found->is_boolean()) {
        return true;
    }
    return found->get<bool>();
}

static bool is_word_character(char character) {
    unsigned char byte = static_cast<unsigned char>(character);
    return std::isalnum(byte) || character == '_';
}

bool is_relevant_runtime(const Runtime &runtime) {
    return to_lower(runtime.platform) == "ios" ||
           starts_with(to_lower(runtime.name), "ios") ||
           to_lower(runtime.identifier).find("ios") != std::string::npos;
}

int parse_model_number(const std::string &device_name) {
    size_t index = 0;
    while (index < device_name.size()) {
        if (!std::isdigit(static_cast<unsigned char>(device_name[index]))) {
            ++index;
            continue;
        }
        size_t run_start = index;
        while (index < device_name.size() && std::isdigit(static_cast<unsigned char>(device_name[index]))) {
            ++index;
        }
        size_t run_length = index - run_start;
        bool boundary_before = run_start == 0 || !is_word_character(device_name[run_start - 1]);
        bool boundary_after = index == device_name.size() || !is_word_character(device_name[index]);
        if (boundary_before && boundary_after && run_length <= 2) {
            return std::stoi(device_name.substr(run_start, run_length));
        }
    }
    return 0;
}

int score_device(const Device &device, const DeviceScoreWeights &weights) {
    int score = device.model_number;
    if (device.is_phone_family) {
        score += weights.phone_family_bonus;
    }
    if (device.state == BOOTED_STATE) {
        score += weights.booted_bonus;
    }
    return score;
}

void sort_by_score(std::vector<Device> &devices, const DeviceScoreWeights &weights) {
    std::stable_sort(devices.begin(), devices.end(), [&weights](const Device &left, const Device &right) {
        return score_device(left, weights) > score_device(right, weights);
    });
}

std::vector<Device> parse_device_catalog(const json &payload) {
    if (!payload.is_object()) {
        throw std::runtime_error("Simulator list is not a JSON object.");
    }

    std::map<std::string, Runtime> runtimes_by_identifier;
    auto runtimes_found = payload.find("runtimes");
    if (runtimes_found != payload.end() && runtimes_found->is_array()) {
        for (const auto &entry : *runtimes_found) {
            Runtime runtime;
            runtime.identifier = string_field(entry, "identifier");
            if (runtime.identifier.empty()) {
                continue;
            }
            runtime.name = string_field(entry, "name");
            runtime.platform = string_field(entry, "platform");
            runtime.version = string_field(entry, "version");
            runtime.is_available = availability_field(entry, "isAvailable");
            runtimes_by_identifier[runtime.identifier] = runtime;
        }
    }

    std::vector<Device> devices;
    auto devices_found = payload.find("devices");
    if (devices_found == payload.end() || !devices_found->is_object()) {
        return devices;
    }

    for (auto bucket = devices_found->begin(); bucket != devices_found->end(); ++bucket) {
        auto runtime_found = runtimes_by_identifier.find(bucket.key());
        if (runtime_found == runtimes_by_identifier.end()) {
            continue;
        }
        const Runtime &runtime = runtime_found->second;
        if (!is_relevant_runtime(runtime) || !runtime.is_available) {
            continue;
        }
        if (!bucket.value().is_array()) {
            continue;
        }

        for (const auto &entry : bucket.value()) {
            if (!entry.is_object()) {
                continue;
            }
            std::string udid = string_field(entry, "udid");
            std::string name = string_field(entry, "name");
            if (udid.empty() || name.empty()) {
                continue;
            }
            std::string availability_error = to_lower(string_field(entry, "availabilityError"));
            bool available = availability_field(entry, "isAvailable") &&
                             availability_error != "unavailable" &&
                             availability_error != "not available";
            if (!available) {
                continue;
            }

            Device device;
            device.name = name;
            device.udid = udid;
            device.state = string_field(entry, "state");
            if (device.state.empty()) {
                device.state = "Unknown";
            }
            device.is_available = true;
            device.runtime = runtime;
            device.is_phone_family = starts_with(to_lower(name), "iphone");
            device.model_number = parse_model_number(name);
            devices.push_back(device);
        }
    }
    return devices;
}

DeviceListResult query_devices(orchestrator_state::OrchestratorState &state, std::optional<uint64_t> task_id) {
    DeviceListResult result;

    process_runner::RunOptions options;
    options.state = &state;
    options.task_id = task_id;
    process_runner::CommandResult list_result = process_runner::run(
        state.config().xcrun_path, {"simctl", "list", "-j", "devices", "runtimes"}, options);

    if (!list_result.success) {
        result.stage = list_result.cancelled ? "cancelled" : "simctl";
        result.error_message = process_runner::failure_text(list_result, "Failed to list simulators.");
        return result;
    }

    try {
        json payload = json_extract::extract_object(list_result.stdout_text, list_result.stderr_text);
        if (payload.is_null()) {
            // Surface the real parser message for the raw output.
            payload = json::parse(list_result.stdout_text);
        }
        result.devices = parse_device_catalog(payload);
    } catch (const std::exception &error) {
        result.stage = "parse";
        result.error_message = std::string("Failed to parse simulator list: ") + error.what();
        return result;
    }

    sort_by_score(result.devices);
    result.best_udid = result.devices.empty() ? "" : result.devices.front().udid;
    result.success = true;
    return result;
}

DeviceListResult list_devices(orchestrator_state::OrchestratorState &state) {
    DeviceListResult cached;
    if (state.device_list_cache.lookup("", cached)) {
        debug_log::log("list_devices: served from cache");
        return cached;
    }

    DeviceListResult result;
    toolchain_check::XcodeCheckResult xcode_check = toolchain_check::check_xcode_availability(state);
    if (!xcode_check.success) {
        result.stage = "xcode";
        result.error_message = xcode_check.error_message;
    } else {
        result = query_devices(state);
    }

    debug_log::log("list_devices: " + std::string(result.success ? "ok, " : "failed, ") +
                   std::to_string(result.devices.size()) + " device(s)");
    state.device_list_cache.store("", result);
    return result;
}

DeviceListResult list_booted(orchestrator_state::OrchestratorState &state) {
    DeviceListResult result = list_devices(state);
    if (!result.success) {
        return result;
    }
    std::vector<Device> booted;
    for (const auto &device : result.devices) {
        if (device.state == BOOTED_STATE) {
            booted.push_back(device);
        }
    }
    result.devices = booted;
    result.best_udid = booted.empty() ? "" : booted.front().udid;
    return result;
}

std::optional<Device> find_device(orchestrator_state::OrchestratorState &state,
                                  const std::string &udid,
                                  std::optional<uint64_t> task_id) {
    DeviceListResult result = query_devices(state, task_id);
    if (!result.success) {
        return std::nullopt;
    }
    for (const auto &device : result.devices) {
        if (device.udid == udid) {
            return device;
        }
    }
    return std::nullopt;
}

} // namespace device_inventory
