#ifndef SIMPILOT_SIMULATOR_TYPES_HPP
#define SIMPILOT_SIMULATOR_TYPES_HPP

// Simulator catalog types, as parsed from `simctl list -j devices runtimes`.

#include <string>
#include <vector>

namespace simulator_types {

// The OS image a device runs.
struct Runtime {
    std::string identifier; // e.g. "com.apple.CoreSimulator.SimRuntime.iOS-17-5"
    std::string name;       // e.g. "iOS 17.5"
    std::string platform;   // e.g. "iOS" (absent on older Xcodes)
    std::string version;
    bool is_available = true;
};

struct Device {
    std::string name;
    std::string udid;
    std::string state; // "Shutdown", "Booting", "Booted", ... ("Unknown" when absent)
    bool is_available = true;
    Runtime runtime;
    bool is_phone_family = false;
    int model_number = 0; // first standalone 1-2 digit number in the name, else 0
};

// Result of a device catalog query. stage is one of "platform", "xcode",
// "cancelled", "simctl", "parse" when success is false.
struct DeviceListResult {
    bool success = false;
    std::vector<Device> devices;
    std::string best_udid; // empty = none
    std::string stage;
    std::string error_message;
};

} // namespace simulator_types

#endif // SIMPILOT_SIMULATOR_TYPES_HPP
