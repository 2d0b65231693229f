#ifndef SIMPILOT_XCODE_TYPES_HPP
#define SIMPILOT_XCODE_TYPES_HPP

// Xcode container and scheme listing types.

#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace xcode_types {

using json = nlohmann::json;

enum class ContainerType {
    Workspace,
    Project
};

// The buildable root: a .xcworkspace or a .xcodeproj directory.
struct Container {
    ContainerType type = ContainerType::Project;
    std::string path;
};

inline const char *container_type_name(ContainerType type) {
    return type == ContainerType::Workspace ? "workspace" : "project";
}

// The flag xcodebuild expects in front of the container path.
inline const char *container_flag(ContainerType type) {
    return type == ContainerType::Workspace ? "-workspace" : "-project";
}

// Captured tool output attached to a failure for diagnostics.
struct CommandDetails {
    std::string stdout_text;
    std::string stderr_text;
    std::string log_path;
};

// Result of resolving the schemes of a root path.
struct SchemeListResult {
    bool success = false;
    std::vector<std::string> schemes;
    std::string default_scheme; // empty = ambiguous, caller must prompt
    Container container;
    // Parsed `xcodebuild -list -json` payload; null when the filesystem was authoritative.
    json list_payload;
    std::string stage;
    std::string error_message;
    CommandDetails details;
};

} // namespace xcode_types

#endif // SIMPILOT_XCODE_TYPES_HPP
