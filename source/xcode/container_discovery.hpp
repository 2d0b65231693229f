#ifndef SIMPILOT_CONTAINER_DISCOVERY_HPP
#define SIMPILOT_CONTAINER_DISCOVERY_HPP

// Finds the buildable Xcode container (.xcworkspace / .xcodeproj) for a
// project root with a bounded-depth scan and a deterministic scoring pick.

#include <optional>
#include <set>
#include <string>
#include <vector>

#include "xcode/xcode_types.hpp"

namespace orchestrator_state {
class OrchestratorState;
}

namespace container_discovery {

using xcode_types::Container;
using xcode_types::ContainerType;

static const char WORKSPACE_SUFFIX[] = ".xcworkspace";
static const char PROJECT_SUFFIX[] = ".xcodeproj";
static const char PLATFORM_FOLDER_NAME[] = "ios";

constexpr int MAX_SCAN_DEPTH = 3;

// Directory names never descended into.
const std::set<std::string> &ignored_directory_names();

struct Candidate {
    Container container;
    int depth = 0;
};

struct ContainerScoreWeights {
    int workspace_bonus = 1000;
    int name_match_bonus = 200;
    int platform_folder_bonus = 100;
    int depth_step = 10;
};

// Lower-cases and keeps only [a-z0-9].
std::string normalize_name(const std::string &name);

// "App.xcworkspace" -> "App"; names without a container suffix are returned unchanged.
std::string strip_container_suffix(const std::string &name);

// Container type implied by a directory name, nullopt when it has no container suffix.
std::optional<ContainerType> container_type_for_name(const std::string &name);

int score_candidate(const Candidate &candidate,
                    const std::string &root_basename,
                    int max_depth = MAX_SCAN_DEPTH,
                    const ContainerScoreWeights &weights = {});

// Iterative depth-bounded walk. Container directories are recorded and not entered.
std::vector<Candidate> scan_for_candidates(const std::string &root_path, int max_depth = MAX_SCAN_DEPTH);

// Highest score, then shallower depth, then lexicographic path.
std::optional<Container> select_best(const std::vector<Candidate> &candidates,
                                     const std::string &root_basename,
                                     int max_depth = MAX_SCAN_DEPTH);

// Uncached discovery.
std::optional<Container> discover(const std::string &root_path);

// Cached discovery (per root path, long TTL; "not found" is cached too).
std::optional<Container> find_container(orchestrator_state::OrchestratorState &state, const std::string &root_path);

// .xcodeproj paths referenced by a workspace's contents.xcworkspacedata.
std::vector<std::string> parse_workspace_projects(const std::string &workspace_path);

} // namespace container_discovery

#endif // SIMPILOT_CONTAINER_DISCOVERY_HPP
