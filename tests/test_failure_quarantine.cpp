// Tests for the failed-run ring: moving a run aside and pruning to the newest N.

#include "pipeline/failure_quarantine.hpp"
#include "test_support.hpp"

#include <chrono>
#include <filesystem>
#include <iostream>

namespace test_failure_quarantine {

namespace fs = std::filesystem;
using test_support::check;
using test_support::check_equal;

// Creates failures/<name> with a modification time `age` in the past.
static void make_aged_run(const std::string &failures_directory, const std::string &name, std::chrono::hours age) {
    fs::path run = fs::path(failures_directory) / name;
    fs::create_directories(run);
    fs::last_write_time(run, fs::file_time_type::clock::now() - age);
}

static bool test_prune_keeps_newest() {
    test_support::ScratchDirectory scratch("prune");
    std::string failures = scratch.child("failures");
    make_aged_run(failures, "run-a", std::chrono::hours(5));
    make_aged_run(failures, "run-b", std::chrono::hours(1));
    make_aged_run(failures, "run-c", std::chrono::hours(4));
    make_aged_run(failures, "run-d", std::chrono::hours(2));
    make_aged_run(failures, "run-e", std::chrono::hours(3));

    size_t remaining = failure_quarantine::prune_failure_runs(failures, 3);
    bool ok = check_equal(static_cast<long>(remaining), 3L, "prune reports three entries left");
    ok &= check_equal(static_cast<long>(test_support::count_entries(failures)), 3L, "three entries on disk");
    ok &= check(test_support::path_exists(failures + "/run-b") && test_support::path_exists(failures + "/run-d") &&
                    test_support::path_exists(failures + "/run-e"),
                "the three most recent runs survive");
    ok &= check(!test_support::path_exists(failures + "/run-a") && !test_support::path_exists(failures + "/run-c"),
                "older runs removed");
    return ok;
}

static bool test_prune_with_fewer_entries() {
    test_support::ScratchDirectory scratch("prune-few");
    std::string failures = scratch.child("failures");
    make_aged_run(failures, "only", std::chrono::hours(1));

    bool ok = check_equal(static_cast<long>(failure_quarantine::prune_failure_runs(failures, 3)), 1L,
                          "fewer entries than the limit are all kept");
    ok &= check_equal(static_cast<long>(failure_quarantine::prune_failure_runs(scratch.child("absent"), 3)), 0L,
                      "missing failures directory is empty");
    return ok;
}

static bool test_quarantine_moves_run() {
    test_support::ScratchDirectory scratch("quarantine");
    std::string run_directory = scratch.child("runs/1700000000000-abcdef");
    test_support::write_file(run_directory + "/build.log", "error: boom\n");
    std::string failures = scratch.child("failures");

    std::string quarantined = failure_quarantine::quarantine_run(run_directory, failures, "1700000000000-abcdef");
    bool ok = check_equal(quarantined, (fs::path(failures) / "1700000000000-abcdef").string(),
                          "run moved under failures/");
    ok &= check(!test_support::path_exists(run_directory), "run directory no longer in runs/");
    ok &= check_equal(test_support::read_file(quarantined + "/build.log"), "error: boom\n", "build log kept");
    return ok;
}

static bool test_quarantine_of_missing_run() {
    test_support::ScratchDirectory scratch("quarantine-missing");
    std::string run_directory = scratch.child("runs/gone");
    std::string quarantined = failure_quarantine::quarantine_run(run_directory, scratch.child("failures"), "gone");
    return check_equal(quarantined, run_directory, "failed move reports the original run directory");
}

static bool test_ring_holds_retained_runs() {
    test_support::ScratchDirectory scratch("quarantine-ring");
    std::string failures = scratch.child("failures");
    for (int index = 0; index < 5; ++index) {
        std::string run_id = "17000000000" + std::to_string(index) + "0-000000";
        test_support::write_file(scratch.child("runs/" + run_id + "/build.log"), "log\n");
        failure_quarantine::quarantine_run(scratch.child("runs/" + run_id), failures, run_id);
    }
    return check_equal(static_cast<long>(test_support::count_entries(failures)),
                       static_cast<long>(failure_quarantine::RETAINED_FAILURE_RUNS),
                       "ring never exceeds the retained run count");
}

bool run_all_tests() {
    bool all_passed = true;
    all_passed &= test_prune_keeps_newest();
    all_passed &= test_prune_with_fewer_entries();
    all_passed &= test_quarantine_moves_run();
    all_passed &= test_quarantine_of_missing_run();
    all_passed &= test_ring_holds_retained_runs();
    return all_passed;
}

} // namespace test_failure_quarantine
