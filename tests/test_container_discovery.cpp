// Tests for container discovery (bounded scan, scoring, tie-breaks, caching),
// workspace manifest parsing, and the iOS project check built on top of it.

#include "xcode/container_discovery.hpp"
#include "core/orchestrator_state.hpp"
#include "test_support.hpp"
#include "xcode/project_detection.hpp"

#include <algorithm>
#include <filesystem>
#include <iostream>

namespace test_container_discovery {

namespace fs = std::filesystem;
using test_support::check;
using test_support::check_equal;
using xcode_types::ContainerType;

static void make_directory(const std::string &path) {
    fs::create_directories(path);
}

static bool has_candidate(const std::vector<container_discovery::Candidate> &candidates, const std::string &path) {
    return std::any_of(candidates.begin(), candidates.end(),
                       [&path](const container_discovery::Candidate &candidate) {
                           return candidate.container.path == path;
                       });
}

static bool test_name_helpers() {
    bool ok = check_equal(container_discovery::normalize_name("My-App_2"), "myapp2", "normalize keeps [a-z0-9]");
    ok &= check_equal(container_discovery::strip_container_suffix("App.xcworkspace"), "App", "workspace suffix stripped");
    ok &= check_equal(container_discovery::strip_container_suffix("App.xcodeproj"), "App", "project suffix stripped");
    ok &= check_equal(container_discovery::strip_container_suffix("App"), "App", "plain name unchanged");
    ok &= check(!container_discovery::container_type_for_name("App.xcodeproj.bak"), "suffix must be at the end");
    return ok;
}

static bool test_root_is_container() {
    // The path does not exist: a container root is answered without touching the disk.
    std::optional<xcode_types::Container> found = container_discovery::discover("/nonexistent/Shop.xcworkspace");
    bool ok = check(found.has_value(), "container root accepted as is");
    ok &= check(found && found->type == ContainerType::Workspace, "container root keeps its type");
    ok &= check(found && found->path == "/nonexistent/Shop.xcworkspace", "container root keeps its path");
    return ok;
}

static bool test_scan_bounds_and_ignores() {
    test_support::ScratchDirectory scratch("scan");
    std::string root = scratch.child("MyApp");
    make_directory(root + "/MyApp.xcodeproj");
    make_directory(root + "/ios/MyApp.xcworkspace/Nested.xcodeproj");
    make_directory(root + "/node_modules/lib/Lib.xcworkspace");
    make_directory(root + "/Pods/Pods.xcodeproj");
    make_directory(root + "/a/b/Three.xcodeproj");
    make_directory(root + "/a/b/c/Deep.xcworkspace");

    std::vector<container_discovery::Candidate> candidates = container_discovery::scan_for_candidates(root);
    bool ok = check(has_candidate(candidates, root + "/MyApp.xcodeproj"), "depth-1 project found");
    ok &= check(has_candidate(candidates, root + "/ios/MyApp.xcworkspace"), "depth-2 workspace found");
    ok &= check(has_candidate(candidates, root + "/a/b/Three.xcodeproj"), "depth-3 project found");
    ok &= check(!has_candidate(candidates, root + "/a/b/c/Deep.xcworkspace"), "depth-4 workspace out of reach");
    ok &= check(!has_candidate(candidates, root + "/node_modules/lib/Lib.xcworkspace"), "node_modules ignored");
    ok &= check(!has_candidate(candidates, root + "/Pods/Pods.xcodeproj"), "Pods ignored");
    ok &= check(!has_candidate(candidates, root + "/ios/MyApp.xcworkspace/Nested.xcodeproj"),
                "containers are not descended into");

    std::optional<xcode_types::Container> best = container_discovery::discover(root);
    ok &= check(best && best->path == root + "/ios/MyApp.xcworkspace",
                "name-matching workspace under ios/ wins");
    return ok;
}

static bool test_scoring() {
    container_discovery::Candidate workspace{{ContainerType::Workspace, "/r/ios/Shop.xcworkspace"}, 2};
    container_discovery::Candidate project{{ContainerType::Project, "/r/Shop.xcodeproj"}, 1};
    bool ok = check_equal(container_discovery::score_candidate(workspace, "shop"), 1000 + 200 + 100 + 10,
                          "workspace score adds type, name, platform and depth");
    ok &= check_equal(container_discovery::score_candidate(project, "Shop"), 200 + 20,
                      "project score adds name and depth");
    return ok;
}

static bool test_tie_breaks() {
    std::vector<container_discovery::Candidate> candidates = {
        {{ContainerType::Project, "/r/Beta.xcodeproj"}, 1},
        {{ContainerType::Project, "/r/Alpha.xcodeproj"}, 1},
    };
    std::optional<xcode_types::Container> best = container_discovery::select_best(candidates, "Root");
    bool ok = check(best && best->path == "/r/Alpha.xcodeproj", "equal scores resolved by path");

    ok &= check(!container_discovery::select_best({}, "Root"), "no candidates, no container");
    return ok;
}

static bool test_find_container_is_cached() {
    test_support::ScratchDirectory scratch("scan-cache");
    orchestrator_state::OrchestratorState state(config::Config{});

    std::optional<xcode_types::Container> first = container_discovery::find_container(state, scratch.path());
    make_directory(scratch.child("Late.xcodeproj"));
    std::optional<xcode_types::Container> second = container_discovery::find_container(state, scratch.path());
    bool ok = check(!first, "empty folder has no container");
    ok &= check(!second, "not-found answer is cached");

    state.container_cache.clear();
    std::optional<xcode_types::Container> third = container_discovery::find_container(state, scratch.path());
    ok &= check(third && third->path == scratch.child("Late.xcodeproj"), "fresh scan after cache clear");
    return ok;
}

static bool test_workspace_manifest() {
    test_support::ScratchDirectory scratch("manifest");
    std::string workspace = scratch.child("Shop.xcworkspace");
    test_support::write_file(workspace + "/contents.xcworkspacedata",
                             "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n"
                             "<Workspace version = \"1.0\">\n"
                             "   <FileRef location = \"group:Shop/Shop.xcodeproj\"></FileRef>\n"
                             "   <FileRef location=\"container:Shop/Shop.xcodeproj\"></FileRef>\n"
                             "   <FileRef\n      location = \"absolute:/opt/Vendor.xcodeproj\">\n   </FileRef>\n"
                             "   <FileRef location = \"group:Pods\"></FileRef>\n"
                             "</Workspace>\n");

    std::vector<std::string> projects = container_discovery::parse_workspace_projects(workspace);
    std::vector<std::string> expected = {scratch.child("Shop/Shop.xcodeproj"), "/opt/Vendor.xcodeproj"};
    bool ok = check(projects == expected, "relative and absolute project refs resolved, duplicates dropped");
    ok &= check(container_discovery::parse_workspace_projects(scratch.child("Missing.xcworkspace")).empty(),
                "missing manifest yields no projects");
    return ok;
}

static bool test_detect_from_pbxproj_hints() {
    test_support::ScratchDirectory scratch("detect-hints");
    config::Config configuration = test_support::install_fake_toolchain(scratch.path());
    orchestrator_state::OrchestratorState state(configuration);

    std::string root = scratch.child("Shop");
    test_support::write_file(root + "/Shop.xcodeproj/project.pbxproj",
                             "buildSettings = {\n\t\t\t\tSDKROOT = iphoneos;\n\t\t\t};\n");
    project_detection::DetectResult result = project_detection::detect_ios_project(state, root);
    bool ok = check(result.success && result.is_ios_project, "pbxproj hint marks an iOS project");
    ok &= check(result.container.type == ContainerType::Project, "project container reported");
    ok &= check(!test_support::path_exists(scratch.child("calls.log")), "no tool invoked when hints suffice");
    return ok;
}

static bool test_detect_from_build_settings() {
    test_support::ScratchDirectory scratch("detect-settings");
    config::Config configuration = test_support::install_fake_toolchain(scratch.path());

    std::string root = scratch.child("Tool");
    test_support::write_file(root + "/Tool.xcodeproj/project.pbxproj", "buildSettings = { SDKROOT = macosx; };\n");
    test_support::write_file(root + "/Tool.xcodeproj/xcshareddata/xcschemes/Tool.xcscheme", "<Scheme/>\n");

    orchestrator_state::OrchestratorState mac_state(configuration);
    project_detection::DetectResult mac = project_detection::detect_ios_project(mac_state, root);
    bool ok = check(!mac.success, "macOS-only build settings are not iOS");
    ok &= check_equal(mac.stage, "build", "negative detection reported at stage build");

    test_support::write_file(scratch.child("build_settings"), "    SDKROOT = iphonesimulator17.5\n");
    orchestrator_state::OrchestratorState ios_state(configuration);
    project_detection::DetectResult ios = project_detection::detect_ios_project(ios_state, root);
    ok &= check(ios.success && ios.is_ios_project, "iphone SDK in build settings marks an iOS project");
    return ok;
}

bool run_all_tests() {
    bool all_passed = true;
    all_passed &= test_name_helpers();
    all_passed &= test_root_is_container();
    all_passed &= test_scan_bounds_and_ignores();
    all_passed &= test_scoring();
    all_passed &= test_tie_breaks();
    all_passed &= test_find_container_is_cached();
    all_passed &= test_workspace_manifest();
    all_passed &= test_detect_from_pbxproj_hints();
    all_passed &= test_detect_from_build_settings();
    return all_passed;
}

} // namespace test_container_discovery
