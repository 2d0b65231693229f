#include "config/config.hpp"
#include "utils/debug_log.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <system_error>

namespace config {

static std::string read_environment(const char *name) {
    const char *value = std::getenv(name);
    if (value == nullptr) {
        return "";
    }
    return std::string(value);
}

bool parse_flag(const std::string &value) {
    std::string normalized = value;
    std::transform(normalized.begin(), normalized.end(), normalized.begin(),
                   [](unsigned char character) { return static_cast<char>(std::tolower(character)); });
    return (normalized == "1" || normalized == "true" || normalized == "yes");
}

std::string default_work_root() {
    std::error_code error;
    std::filesystem::path temp_directory = std::filesystem::temp_directory_path(error);
    if (error) {
        temp_directory = "/tmp";
    }
    return (temp_directory / "simpilot").string();
}

Config load_from_environment() {
    Config loaded;

    std::string value = read_environment("SIMPILOT_XCRUN");
    if (!value.empty()) {
        loaded.xcrun_path = value;
    }
    value = read_environment("SIMPILOT_XCODEBUILD");
    if (!value.empty()) {
        loaded.xcodebuild_path = value;
    }
    value = read_environment("SIMPILOT_PLISTBUDDY");
    if (!value.empty()) {
        loaded.plistbuddy_path = value;
    }
    value = read_environment("SIMPILOT_OPEN");
    if (!value.empty()) {
        loaded.open_path = value;
    }

    value = read_environment("SIMPILOT_WORK_ROOT");
    loaded.work_root = value.empty() ? default_work_root() : value;

    loaded.assume_supported_host = parse_flag(read_environment("SIMPILOT_ASSUME_MACOS"));

    debug_log::log("config: xcrun=" + loaded.xcrun_path + " xcodebuild=" + loaded.xcodebuild_path +
                   " work_root=" + loaded.work_root);
    return loaded;
}

} // namespace config
