#include "xcode/container_discovery.hpp"
#include "core/orchestrator_state.hpp"
#include "platform/platform_abi.hpp"
#include "utils/debug_log.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <system_error>
#include <utility>

namespace container_discovery {

namespace fs = std::filesystem;

const std::set<std::string> &ignored_directory_names() {
    static const std::set<std::string> names = {
        ".git", ".hg", ".svn",
        "node_modules", "Pods", "Carthage", "vendor",
        "build", "DerivedData", ".build",
        ".idea", ".vscode",
    };
    return names;
}

static bool ends_with(const std::string &text, const std::string &suffix) {
    return text.size() >= suffix.size() &&
           text.compare(text.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::string normalize_name(const std::string &name) {
    std::string normalized;
    for (char character : name) {
        unsigned char byte = static_cast<unsigned char>(character);
        if (std::isalnum(byte)) {
            normalized += static_cast<char>(std::tolower(byte));
        }
    }
    return normalized;
}

std::string strip_container_suffix(const std::string &name) {
    if (ends_with(name, WORKSPACE_SUFFIX)) {
        return name.substr(0, name.size() - std::string(WORKSPACE_SUFFIX).size());
    }
    if (ends_with(name, PROJECT_SUFFIX)) {
        return name.substr(0, name.size() - std::string(PROJECT_SUFFIX).size());
    }
    return name;
}

std::optional<ContainerType> container_type_for_name(const std::string &name) {
    if (ends_with(name, WORKSPACE_SUFFIX)) {
        return ContainerType::Workspace;
    }
    if (ends_with(name, PROJECT_SUFFIX)) {
        return ContainerType::Project;
    }
    return std::nullopt;
}

// Basename that tolerates a trailing slash ("/a/b/" -> "b").
static std::string base_name(const std::string &path) {
    fs::path as_path(path);
    if (!as_path.has_filename()) {
        as_path = as_path.parent_path();
    }
    return as_path.filename().string();
}

int score_candidate(const Candidate &candidate,
                    const std::string &root_basename,
                    int max_depth,
                    const ContainerScoreWeights &weights) {
    int score = 0;
    if (candidate.container.type == ContainerType::Workspace) {
        score += weights.workspace_bonus;
    }

    std::string candidate_name = normalize_name(strip_container_suffix(base_name(candidate.container.path)));
    std::string root_name = normalize_name(root_basename);
    if (!candidate_name.empty() && candidate_name == root_name) {
        score += weights.name_match_bonus;
    }

    // Any directory segment above the container itself.
    fs::path parent = fs::path(candidate.container.path).parent_path();
    for (const auto &segment : parent) {
        if (segment.string() == PLATFORM_FOLDER_NAME) {
            score += weights.platform_folder_bonus;
            break;
        }
    }

    score += (max_depth - candidate.depth) * weights.depth_step;
    return score;
}

std::vector<Candidate> scan_for_candidates(const std::string &root_path, int max_depth) {
    std::vector<Candidate> candidates;
    const std::set<std::string> &ignored = ignored_directory_names();

    std::vector<std::pair<fs::path, int>> pending;
    pending.emplace_back(fs::path(root_path), 0);

    while (!pending.empty()) {
        fs::path directory = pending.back().first;
        int depth = pending.back().second;
        pending.pop_back();

        std::error_code error;
        fs::directory_iterator iterator(directory, fs::directory_options::skip_permission_denied, error);
        if (error) {
            // Unreadable directories are skipped; the scan is best-effort.
            debug_log::log("scan: cannot read " + directory.string() + ": " + error.message());
            continue;
        }

        for (; iterator != fs::directory_iterator(); iterator.increment(error)) {
            if (error) {
                break;
            }
            const fs::directory_entry &entry = *iterator;
            std::error_code status_error;
            if (!entry.is_directory(status_error) || status_error) {
                continue;
            }

            std::string name = entry.path().filename().string();
            int child_depth = depth + 1;

            std::optional<ContainerType> type = container_type_for_name(name);
            if (type) {
                if (child_depth <= max_depth) {
                    candidates.push_back({Container{*type, entry.path().string()}, child_depth});
                }
                continue;
            }

            if (ignored.count(name) > 0 || child_depth >= max_depth) {
                continue;
            }
            if (entry.is_symlink(status_error)) {
                continue;
            }
            pending.emplace_back(entry.path(), child_depth);
        }
    }
    return candidates;
}

std::optional<Container> select_best(const std::vector<Candidate> &candidates,
                                     const std::string &root_basename,
                                     int max_depth) {
    if (candidates.empty()) {
        return std::nullopt;
    }

    std::vector<std::pair<int, Candidate>> scored;
    for (const auto &candidate : candidates) {
        scored.emplace_back(score_candidate(candidate, root_basename, max_depth), candidate);
    }
    std::sort(scored.begin(), scored.end(), [](const auto &left, const auto &right) {
        if (left.first != right.first) {
            return left.first > right.first;
        }
        if (left.second.depth != right.second.depth) {
            return left.second.depth < right.second.depth;
        }
        return left.second.container.path < right.second.container.path;
    });
    return scored.front().second.container;
}

std::optional<Container> discover(const std::string &root_path) {
    std::string root_basename = base_name(root_path);

    std::optional<ContainerType> direct_type = container_type_for_name(root_basename);
    if (direct_type) {
        return Container{*direct_type, root_path};
    }

    std::vector<Candidate> candidates = scan_for_candidates(root_path);
    debug_log::log("scan of " + root_path + " found " + std::to_string(candidates.size()) + " candidate(s)");
    return select_best(candidates, root_basename);
}

std::optional<Container> find_container(orchestrator_state::OrchestratorState &state, const std::string &root_path) {
    std::optional<Container> cached;
    if (state.container_cache.lookup(root_path, cached)) {
        return cached;
    }

    std::optional<Container> discovered = discover(root_path);
    state.container_cache.store(root_path, discovered);
    if (discovered) {
        debug_log::log("container for " + root_path + ": " + discovered->path);
    }
    return discovered;
}

std::vector<std::string> parse_workspace_projects(const std::string &workspace_path) {
    std::vector<std::string> projects;
    std::string contents;
    if (!platform::read_file_contents((fs::path(workspace_path) / "contents.xcworkspacedata").string(), contents)) {
        return projects;
    }

    // group:/container:/self: locations are relative to the directory holding the workspace.
    fs::path workspace_parent = fs::path(workspace_path).parent_path();

    size_t cursor = 0;
    while ((cursor = contents.find("location", cursor)) != std::string::npos) {
        cursor += 8;
        size_t position = contents.find_first_not_of(" \t\r\n", cursor);
        if (position == std::string::npos || contents[position] != '=') {
            continue;
        }
        position = contents.find_first_not_of(" \t\r\n", position + 1);
        if (position == std::string::npos || contents[position] != '"') {
            continue;
        }
        size_t closing = contents.find('"', position + 1);
        if (closing == std::string::npos) {
            break;
        }
        std::string location = contents.substr(position + 1, closing - position - 1);
        cursor = closing + 1;

        size_t colon = location.find(':');
        if (colon == std::string::npos || colon + 1 >= location.size()) {
            continue;
        }
        std::string prefix = location.substr(0, colon);
        std::string rest = location.substr(colon + 1);

        std::string resolved;
        if (prefix == "group" || prefix == "container" || prefix == "self") {
            resolved = (workspace_parent / rest).lexically_normal().string();
        } else if (prefix == "absolute") {
            resolved = rest;
        }
        if (resolved.empty() || !ends_with(resolved, PROJECT_SUFFIX)) {
            continue;
        }
        if (std::find(projects.begin(), projects.end(), resolved) == projects.end()) {
            projects.push_back(resolved);
        }
    }
    return projects;
}

} // namespace container_discovery
