// Tests for test-scheme detection, the default-scheme heuristics and the
// two scheme sources (scheme files on disk, then xcodebuild -list).

#include "xcode/scheme_resolver.hpp"
#include "core/orchestrator_state.hpp"
#include "test_support.hpp"

#include <iostream>

namespace test_scheme_resolver {

using json = nlohmann::json;
using test_support::check;
using test_support::check_equal;

static bool test_test_scheme_detection() {
    bool ok = check(scheme_resolver::is_test_scheme("MyAppTests"), "MyAppTests is a test scheme");
    ok &= check(scheme_resolver::is_test_scheme("MyAppUITests"), "MyAppUITests is a test scheme");
    ok &= check(scheme_resolver::is_test_scheme("Unit Tests"), "'Unit Tests' is a test scheme");
    ok &= check(scheme_resolver::is_test_scheme("integration-test"), "integration-test is a test scheme");
    ok &= check(!scheme_resolver::is_test_scheme("Contest"), "Contest is not a test scheme");
    ok &= check(!scheme_resolver::is_test_scheme("Testimonials"), "Testimonials is not a test scheme");
    ok &= check(!scheme_resolver::is_test_scheme("MyApp"), "MyApp is not a test scheme");
    return ok;
}

static bool test_sample_detection() {
    bool ok = check(scheme_resolver::looks_like_sample("KitDemo"), "KitDemo looks like a sample");
    ok &= check(scheme_resolver::looks_like_sample("ExampleApp"), "ExampleApp looks like a sample");
    ok &= check(!scheme_resolver::looks_like_sample("Shop"), "Shop is not a sample");
    return ok;
}

static bool test_selection_thresholds() {
    bool ok = check_equal(scheme_resolver::choose_from_ranking({{"A", 80}, {"B", 65}}), "A",
                          "score 80 with lead 15 is chosen");
    ok &= check_equal(scheme_resolver::choose_from_ranking({{"A", 79}, {"B", 10}}), "",
                      "score 79 is below the minimum");
    ok &= check_equal(scheme_resolver::choose_from_ranking({{"A", 120}, {"B", 106}}), "",
                      "lead 14 is ambiguous");
    ok &= check_equal(scheme_resolver::choose_from_ranking({{"A", 80}}), "A", "single entry needs no lead");
    ok &= check_equal(scheme_resolver::choose_from_ranking({}), "", "empty ranking chooses nothing");
    return ok;
}

static bool test_default_pick_rules() {
    bool ok = check_equal(scheme_resolver::pick_default_scheme({"OnlyOne"}, {}), "OnlyOne",
                          "a single scheme is the default");
    ok &= check_equal(scheme_resolver::pick_default_scheme({"Shop", "ShopTests", "ShopUITests"}, {}), "Shop",
                      "the only non-test scheme is the default");
    ok &= check_equal(scheme_resolver::pick_default_scheme({"MyApp", "MyAppTests", "Widget"}, {"MyApp"}), "MyApp",
                      "exact hint match wins over other app schemes");
    ok &= check_equal(scheme_resolver::pick_default_scheme({"Alpha", "Beta"}, {"Unrelated"}), "",
                      "no hint match is ambiguous");
    ok &= check_equal(scheme_resolver::pick_default_scheme({"MyApp", "MyAppDemo"}, {"MyApp"}), "MyApp",
                      "demo scheme loses to the exact match");
    return ok;
}

static bool test_scoring_uses_best_single_hint() {
    // Exact (120) beats prefix matches; hints do not add up.
    int score = scheme_resolver::score_scheme("Shop", {"Shop", "ShopKit", "Sh"});
    bool ok = check_equal(score, 120, "best single hint contribution only");
    ok &= check_equal(scheme_resolver::score_scheme("ShopApp", {"Shop"}), 40 + 10,
                      "hint prefix of scheme plus app bonus");
    ok &= check_equal(scheme_resolver::score_scheme("ShopTests", {"Shop"}), 40 - 200, "test penalty applied");
    return ok;
}

static bool test_payload_helpers() {
    json workspace_payload = json::parse(R"({"workspace": {"name": "Shop", "schemes": ["Shop", "Pods-Shop"]}})");
    json project_payload = json::parse(R"({"project": {"name": "Tool", "schemes": ["Tool"], "targets": ["Tool"]}})");
    bool ok = check(scheme_resolver::schemes_from_payload(workspace_payload) ==
                        std::vector<std::string>({"Shop", "Pods-Shop"}),
                    "workspace schemes read");
    ok &= check(scheme_resolver::schemes_from_payload(project_payload) == std::vector<std::string>({"Tool"}),
                "project schemes read when there is no workspace");

    std::vector<std::string> hints = scheme_resolver::collect_hints(
        workspace_payload, {xcode_types::ContainerType::Workspace, "/src/shop/ios/ShopApp.xcworkspace"}, "/src/shop/");
    ok &= check(hints == std::vector<std::string>({"Shop", "ShopApp", "shop"}),
                "hints from payload name, container name and root folder");
    return ok;
}

static bool test_filesystem_schemes_are_authoritative() {
    test_support::ScratchDirectory scratch("schemes-fs");
    config::Config configuration = test_support::install_fake_toolchain(scratch.path());
    orchestrator_state::OrchestratorState state(configuration);

    std::string root = scratch.child("Shop");
    std::string project = root + "/Shop.xcodeproj";
    test_support::write_file(project + "/xcshareddata/xcschemes/ShopTests.xcscheme", "<Scheme/>\n");
    test_support::write_file(project + "/xcshareddata/xcschemes/Shop.xcscheme", "<Scheme/>\n");
    test_support::write_file(project + "/xcuserdata/dev.xcuserdatad/xcschemes/Shop.xcscheme", "<Scheme/>\n");
    test_support::write_file(project + "/xcuserdata/dev.xcuserdatad/xcschemes/Scratch.xcscheme", "<Scheme/>\n");

    xcode_types::SchemeListResult result = scheme_resolver::list_schemes(state, root);
    bool ok = check(result.success, "scheme files listed");
    ok &= check(result.schemes == std::vector<std::string>({"Scratch", "Shop", "ShopTests"}),
                "shared and user schemes merged, de-duplicated and sorted");
    ok &= check_equal(result.default_scheme, "Scratch", "first non-test scheme is the default");
    ok &= check(result.list_payload.is_null(), "no xcodebuild payload when files were found");
    ok &= check(!test_support::path_exists(scratch.child("calls.log")), "xcodebuild not asked");
    return ok;
}

static bool test_xcodebuild_listing_fallback() {
    test_support::ScratchDirectory scratch("schemes-list");
    config::Config configuration = test_support::install_fake_toolchain(scratch.path());
    orchestrator_state::OrchestratorState state(configuration);

    std::string root = scratch.child("MyApp");
    test_support::write_file(root + "/MyApp.xcodeproj/project.pbxproj", "// empty\n");
    test_support::write_file(scratch.child("list.json"),
                             R"({"project": {"name": "MyApp", "schemes": ["MyAppTests", "MyApp", "MyAppKit"]}})");

    xcode_types::SchemeListResult result = scheme_resolver::list_schemes(state, root);
    bool ok = check(result.success, "xcodebuild listing parsed through leading noise");
    ok &= check(result.schemes == std::vector<std::string>({"MyApp", "MyAppKit", "MyAppTests"}),
                "listed schemes sorted");
    ok &= check_equal(result.default_scheme, "MyApp", "hint-matching scheme chosen as default");

    // The listing is cached per container: removing the payload does not matter.
    test_support::write_file(scratch.child("list.json"), "{}");
    xcode_types::SchemeListResult cached = scheme_resolver::list_schemes(state, root);
    ok &= check(cached.success && cached.default_scheme == "MyApp", "second listing served from cache");
    return ok;
}

static bool test_listing_failures() {
    test_support::ScratchDirectory scratch("schemes-fail");
    config::Config configuration = test_support::install_fake_toolchain(scratch.path());
    orchestrator_state::OrchestratorState state(configuration);

    std::string root = scratch.child("Broken");
    test_support::write_file(root + "/Broken.xcodeproj/project.pbxproj", "// empty\n");
    xcode_types::SchemeListResult failed = scheme_resolver::list_schemes(state, root);
    bool ok = check(!failed.success && failed.stage == "schemes", "failing xcodebuild -list is stage schemes");
    ok &= check(!failed.details.stderr_text.empty(), "failure keeps tool output as details");

    test_support::write_file(scratch.child("list.json"), R"({"project": {"name": "Broken", "schemes": []}})");
    xcode_types::SchemeListResult empty = scheme_resolver::list_schemes(state, root);
    ok &= check_equal(empty.error_message, "No schemes found for this project.", "empty listing reported");

    std::string bare = scratch.child("Bare");
    test_support::write_file(bare + "/README", "nothing to build\n");
    xcode_types::SchemeListResult missing = scheme_resolver::list_schemes(state, bare);
    ok &= check_equal(missing.stage, "container", "folder without container is stage container");
    return ok;
}

bool run_all_tests() {
    bool all_passed = true;
    all_passed &= test_test_scheme_detection();
    all_passed &= test_sample_detection();
    all_passed &= test_selection_thresholds();
    all_passed &= test_default_pick_rules();
    all_passed &= test_scoring_uses_best_single_hint();
    all_passed &= test_payload_helpers();
    all_passed &= test_filesystem_schemes_are_authoritative();
    all_passed &= test_xcodebuild_listing_fallback();
    all_passed &= test_listing_failures();
    return all_passed;
}

} // namespace test_scheme_resolver
