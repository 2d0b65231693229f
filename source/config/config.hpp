#ifndef SIMPILOT_CONFIG_HPP
#define SIMPILOT_CONFIG_HPP

// Runtime configuration: which external tools to invoke and where build
// artifacts live. Everything is read from the environment once at startup;
// tests construct a Config directly and point the tool paths at fakes.

#include <string>

namespace config {

struct Config {
    // External collaborators (bare names are resolved on PATH).
    std::string xcrun_path = "xcrun";
    std::string xcodebuild_path = "xcodebuild";
    std::string plistbuddy_path = "/usr/libexec/PlistBuddy";
    std::string open_path = "open";

    // Root under which derived data, run directories and failures/ live.
    std::string work_root;

    // When false, every public operation fails with stage "platform" on a
    // non-macOS host. SIMPILOT_ASSUME_MACOS=1 lifts the gate (fake toolchains).
    bool assume_supported_host = false;
};

// Default work root: <system temp directory>/simpilot.
std::string default_work_root();

// Build a Config from SIMPILOT_* environment variables, falling back to defaults.
Config load_from_environment();

// Parses 1/true/yes (case-insensitive) as true; anything else is false.
bool parse_flag(const std::string &value);

} // namespace config

#endif // SIMPILOT_CONFIG_HPP
