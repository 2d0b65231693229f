#include "pipeline/build_pipeline.hpp"
#include "core/orchestrator_state.hpp"
#include "pipeline/failure_quarantine.hpp"
#include "platform/platform_abi.hpp"
#include "process/process_runner.hpp"
#include "simctl/boot_controller.hpp"
#include "utils/debug_log.hpp"
#include "xcode/container_discovery.hpp"
#include "xcode/scheme_resolver.hpp"
#include "xcode/toolchain_check.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <random>
#include <sstream>
#include <system_error>
#include <thread>

namespace build_pipeline {

namespace fs = std::filesystem;
using steady_clock = std::chrono::steady_clock;

std::string project_slug(const std::string &root_path) {
    fs::path root(root_path);
    if (!root.has_filename()) {
        root = root.parent_path();
    }
    std::string name = root.filename().string();

    std::string slug;
    bool in_replacement = false;
    for (char character : name) {
        unsigned char byte = static_cast<unsigned char>(character);
        bool allowed = std::isalnum(byte) || character == '.' || character == '_' || character == '-';
        if (allowed) {
            slug += character;
            in_replacement = false;
        } else if (!in_replacement) {
            slug += '-';
            in_replacement = true;
        }
    }
    return slug.empty() ? "project" : slug;
}

std::string fnv1a_hex(const std::string &text) {
    uint32_t hash = 2166136261u;
    for (unsigned char byte : text) {
        hash ^= byte;
        hash *= 16777619u;
    }
    char buffer[9];
    std::snprintf(buffer, sizeof(buffer), "%08x", hash);
    return std::string(buffer);
}

WorkspacePaths workspace_paths(const std::string &work_root, const std::string &root_path) {
    fs::path base = fs::path(work_root) / (project_slug(root_path) + "-" + fnv1a_hex(root_path));
    WorkspacePaths paths;
    paths.base_directory = base.string();
    paths.derived_data_directory = (base / "derived-data").string();
    paths.runs_directory = (base / "runs").string();
    paths.failures_directory = (base / "failures").string();
    return paths;
}

std::string make_run_id() {
    static std::mt19937 generator{std::random_device{}()};
    long long milliseconds = static_cast<long long>(
        std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::system_clock::now().time_since_epoch()).count());
    char suffix[7];
    std::snprintf(suffix, sizeof(suffix), "%06x", static_cast<unsigned>(generator() & 0xFFFFFFu));
    return std::to_string(milliseconds) + "-" + suffix;
}

std::string last_output_line(const std::string &text) {
    std::istringstream line_stream(text);
    std::string line;
    std::string last;
    while (std::getline(line_stream, line)) {
        size_t first = line.find_first_not_of(" \t\r");
        if (first == std::string::npos) {
            continue;
        }
        size_t final_character = line.find_last_not_of(" \t\r");
        last = line.substr(first, final_character - first + 1);
    }
    return last;
}

std::string find_built_app(const std::string &derived_data_directory, const std::string &scheme) {
    fs::path products = fs::path(derived_data_directory) / "Build" / "Products";
    for (const char *configuration : {"Debug-iphonesimulator", "Release-iphonesimulator"}) {
        fs::path directory = products / configuration;

        std::vector<std::string> bundles;
        std::error_code error;
        fs::directory_iterator iterator(directory, error);
        if (error) {
            continue;
        }
        for (; iterator != fs::directory_iterator(); iterator.increment(error)) {
            if (error) {
                break;
            }
            std::error_code status_error;
            std::string name = iterator->path().filename().string();
            if (iterator->is_directory(status_error) && name.size() > 4 &&
                name.compare(name.size() - 4, 4, ".app") == 0) {
                bundles.push_back(name);
            }
        }
        if (bundles.empty()) {
            continue;
        }
        std::sort(bundles.begin(), bundles.end());
        auto exact = std::find(bundles.begin(), bundles.end(), scheme + ".app");
        return (directory / (exact != bundles.end() ? *exact : bundles.front())).string();
    }
    return "";
}

std::string format_timings(const PipelineResult &result) {
    std::string line;
    for (const auto &timing : result.stage_timings) {
        if (!line.empty()) {
            line += " ";
        }
        line += timing.first + "=" + std::to_string(timing.second) + "ms";
    }
    return line;
}

namespace {

// Records stage durations into the result as the pipeline advances.
class StageClock {
public:
    explicit StageClock(PipelineResult &result) : result_(result), started_at_(steady_clock::now()) {}

    void mark(const std::string &stage) {
        steady_clock::time_point now = steady_clock::now();
        long elapsed = static_cast<long>(
            std::chrono::duration_cast<std::chrono::milliseconds>(now - started_at_).count());
        result_.stage_timings.emplace_back(stage, elapsed);
        started_at_ = now;
    }

private:
    PipelineResult &result_;
    steady_clock::time_point started_at_;
};

// Ends the trackable task on every exit path.
class TaskScope {
public:
    TaskScope(orchestrator_state::OrchestratorState &state, uint64_t task_id) : state_(state), task_id_(task_id) {}
    ~TaskScope() { state_.finish_task(task_id_); }

private:
    orchestrator_state::OrchestratorState &state_;
    uint64_t task_id_;
};

// Joins the concurrent boot on every exit path.
class ThreadJoiner {
public:
    explicit ThreadJoiner(std::thread &thread) : thread_(thread) {}
    ~ThreadJoiner() { join(); }
    void join() {
        if (thread_.joinable()) {
            thread_.join();
        }
    }

private:
    std::thread &thread_;
};

PipelineResult stage_failure(const std::string &stage, const std::string &error_message) {
    PipelineResult result;
    result.stage = stage;
    result.error_message = error_message;
    return result;
}

std::string command_stage(const process_runner::CommandResult &command, const std::string &stage) {
    return command.cancelled ? "cancelled" : stage;
}

std::string command_error(const process_runner::CommandResult &command, const std::string &fallback) {
    return command.cancelled ? process_runner::CANCELLED_MESSAGE : process_runner::failure_text(command, fallback);
}

// Everything from the resolved scheme onwards; state shared by the stages of one run.
class PipelineRun {
public:
    PipelineRun(orchestrator_state::OrchestratorState &state,
                uint64_t task_id,
                std::string root_path,
                std::string udid,
                PipelineResult &result,
                StageClock &clock)
        : state_(state), task_id_(task_id), root_path_(std::move(root_path)), udid_(std::move(udid)),
          result_(result), clock_(clock) {}

    void execute(const xcode_types::Container &container, const std::string &scheme);

private:
    process_runner::RunOptions tracked_options(const std::string &working_directory = "") const {
        process_runner::RunOptions options;
        options.state = &state_;
        options.task_id = task_id_;
        options.working_directory = working_directory;
        return options;
    }

    // Quarantines the run directory and fills the failure fields.
    void fail(const std::string &stage, const std::string &error_message,
              const process_runner::CommandResult *command = nullptr);

    bool install_or_patch(const std::string &app_path, const std::string &bundle_id, const std::string &executable);

    orchestrator_state::OrchestratorState &state_;
    uint64_t task_id_;
    std::string root_path_;
    std::string udid_;
    PipelineResult &result_;
    StageClock &clock_;

    WorkspacePaths paths_;
    std::string run_id_;
    std::string run_directory_;
};

void PipelineRun::fail(const std::string &stage, const std::string &error_message,
                       const process_runner::CommandResult *command) {
    result_.success = false;
    result_.stage = stage;
    result_.error_message = error_message;
    result_.derived_data_path = paths_.derived_data_directory;
    result_.has_details = true;
    if (command != nullptr) {
        result_.details.stdout_text = command->stdout_text;
        result_.details.stderr_text = command->stderr_text;
    }

    std::string quarantined = failure_quarantine::quarantine_run(run_directory_, paths_.failures_directory, run_id_);
    result_.details.log_path = (fs::path(quarantined) / BUILD_LOG_FILE_NAME).string();
    debug_log::info("build_and_run failed at " + stage + ", artifacts in " + quarantined);
}

bool PipelineRun::install_or_patch(const std::string &app_path,
                                   const std::string &bundle_id,
                                   const std::string &executable) {
    const config::Config &configuration = state_.config();

    process_runner::CommandResult container_result = process_runner::run(
        configuration.xcrun_path, {"simctl", "get_app_container", udid_, bundle_id, "app"}, tracked_options());
    if (container_result.cancelled) {
        fail("cancelled", process_runner::CANCELLED_MESSAGE, &container_result);
        return false;
    }

    std::string installed_app = container_result.success ? last_output_line(container_result.stdout_text) : "";
    std::error_code error;
    if (!installed_app.empty() && fs::is_regular_file(fs::path(installed_app) / executable, error)) {
        // Same bundle id already installed: swap the executable in place.
        fs::copy_file(fs::path(app_path) / executable, fs::path(installed_app) / executable,
                      fs::copy_options::overwrite_existing, error);
        if (!error) {
            debug_log::log("install: patched executable in " + installed_app);
            return true;
        }
        debug_log::log("install: in-place copy failed (" + error.message() + "), installing bundle");
    }

    process_runner::CommandResult install_result = process_runner::run(
        configuration.xcrun_path, {"simctl", "install", udid_, app_path}, tracked_options());
    if (!install_result.success) {
        fail(command_stage(install_result, "install"), command_error(install_result, "Failed to install app."),
             &install_result);
        return false;
    }
    return true;
}

void PipelineRun::execute(const xcode_types::Container &container, const std::string &scheme) {
    const config::Config &configuration = state_.config();
    result_.scheme = scheme;

    // Prepare: stable derived data per project, fresh run directory per invocation.
    paths_ = workspace_paths(configuration.work_root, root_path_);
    run_id_ = make_run_id();
    run_directory_ = (fs::path(paths_.runs_directory) / run_id_).string();
    std::error_code error;
    fs::create_directories(paths_.derived_data_directory, error);
    if (!error) {
        fs::create_directories(run_directory_, error);
    }
    if (error) {
        result_.stage = "build";
        result_.error_message = "Failed to prepare build directory: " + error.message();
        return;
    }
    clock_.mark("prepare");

    // Boot is dispatched now and only awaited after the app is located.
    // The build owns the kill-on-cancel slot; boot still sees the cancel flag.
    boot_controller::BootResult boot_result;
    std::thread boot_thread([this, &boot_result]() {
        boot_result = boot_controller::boot(state_, udid_, task_id_, false);
    });
    ThreadJoiner boot_joiner(boot_thread);

    std::vector<std::string> build_arguments = {
        xcode_types::container_flag(container.type), container.path,
        "-scheme", scheme,
        "-configuration", "Debug",
        "-destination", "platform=iOS Simulator,id=" + udid_,
        "-derivedDataPath", paths_.derived_data_directory,
        "CODE_SIGNING_ALLOWED=NO",
        "CODE_SIGNING_REQUIRED=NO",
        "COMPILER_INDEX_STORE_ENABLE=NO",
        "build",
    };
    process_runner::CommandResult build_result =
        process_runner::run(configuration.xcodebuild_path, build_arguments, tracked_options(root_path_));

    std::string build_log = build_result.stdout_text;
    if (!build_result.stderr_text.empty()) {
        build_log += "\n" + build_result.stderr_text;
    }
    if (!platform::write_file_contents((fs::path(run_directory_) / BUILD_LOG_FILE_NAME).string(), build_log)) {
        // Best-effort: a missing log never changes the outcome.
        debug_log::log("could not write build log in " + run_directory_);
    }
    clock_.mark("build");

    if (!build_result.success) {
        boot_joiner.join();
        fail(command_stage(build_result, "build"), command_error(build_result, "Build failed."), &build_result);
        return;
    }

    std::string app_path = find_built_app(paths_.derived_data_directory, scheme);
    if (app_path.empty()) {
        boot_joiner.join();
        fail("app", "Unable to locate built app.");
        return;
    }
    // Best-effort: keep a copy of the artifact beside the log in case a later stage fails.
    fs::copy(app_path, fs::path(run_directory_) / fs::path(app_path).filename(),
             fs::copy_options::recursive | fs::copy_options::overwrite_existing, error);
    if (error) {
        debug_log::log("could not copy " + app_path + " into run directory: " + error.message());
    }
    result_.app_path = app_path;
    clock_.mark("app");

    boot_joiner.join();
    if (!boot_result.success) {
        process_runner::CommandResult boot_output;
        boot_output.stdout_text = boot_result.stdout_text;
        boot_output.stderr_text = boot_result.stderr_text;
        fail(boot_result.cancelled ? "cancelled" : "boot", boot_result.error_message, &boot_output);
        return;
    }
    if (!boot_controller::wait_until_booted(state_, udid_, task_id_)) {
        if (state_.is_cancel_requested(task_id_)) {
            fail("cancelled", process_runner::CANCELLED_MESSAGE);
        } else {
            fail("bootstatus", "Simulator did not finish booting.");
        }
        return;
    }
    clock_.mark("boot");

    std::string info_plist = (fs::path(app_path) / "Info.plist").string();
    process_runner::CommandResult bundle_result = process_runner::run(
        configuration.plistbuddy_path, {"-c", "Print :CFBundleIdentifier", info_plist}, tracked_options());
    std::string bundle_id = bundle_result.success ? last_output_line(bundle_result.stdout_text) : "";
    if (bundle_id.empty()) {
        fail(command_stage(bundle_result, "bundle-id"),
             command_error(bundle_result, "Unable to read bundle identifier."), &bundle_result);
        return;
    }
    process_runner::CommandResult executable_result = process_runner::run(
        configuration.plistbuddy_path, {"-c", "Print :CFBundleExecutable", info_plist}, tracked_options());
    std::string executable = executable_result.success ? last_output_line(executable_result.stdout_text) : "";
    if (executable.empty()) {
        fail(command_stage(executable_result, "bundle-id"),
             command_error(executable_result, "Unable to read bundle executable."), &executable_result);
        return;
    }
    result_.bundle_id = bundle_id;
    clock_.mark("bundle-id");

    if (!install_or_patch(app_path, bundle_id, executable)) {
        return;
    }
    clock_.mark("install");

    process_runner::CommandResult launch_result = process_runner::run(
        configuration.xcrun_path, {"simctl", "launch", "--terminate-running-process", udid_, bundle_id},
        tracked_options());
    if (!launch_result.success) {
        fail(command_stage(launch_result, "launch"), command_error(launch_result, "Failed to launch app."),
             &launch_result);
        return;
    }
    clock_.mark("launch");

    // Launched: the run's log and artifact copy are no longer needed.
    fs::remove_all(run_directory_, error);
    if (error) {
        debug_log::log("could not remove run directory " + run_directory_ + ": " + error.message());
    }
    result_.success = true;
    result_.stage.clear();
    result_.error_message.clear();
}

PipelineResult run_pipeline(orchestrator_state::OrchestratorState &state,
                            const std::string &root_path,
                            const std::string &udid,
                            const std::string &requested_scheme) {
    if (root_path.empty() || udid.empty()) {
        return stage_failure("validation", "Project path and simulator UDID are required.");
    }

    toolchain_check::XcodeCheckResult xcode_check = toolchain_check::check_xcode_availability(state);
    if (!xcode_check.success) {
        return stage_failure("xcode", xcode_check.error_message);
    }

    uint64_t task_id = state.start_task();
    TaskScope task_scope(state, task_id);

    PipelineResult result;
    StageClock clock(result);

    std::error_code error;
    bool is_directory = fs::is_directory(root_path, error);
    if (error || !is_directory) {
        result.stage = "validation";
        result.error_message = error ? error.message() : "Project path is not a directory.";
        return result;
    }
    clock.mark("validation");

    xcode_types::Container container;
    std::string scheme = requested_scheme;
    if (!scheme.empty()) {
        std::optional<xcode_types::Container> found = container_discovery::find_container(state, root_path);
        if (!found) {
            result.stage = "container";
            result.error_message = "No Xcode workspace or project found.";
            return result;
        }
        container = *found;
    } else {
        xcode_types::SchemeListResult scheme_list = scheme_resolver::list_schemes(state, root_path);
        if (!scheme_list.success) {
            result.stage = scheme_list.stage.empty() ? "schemes" : scheme_list.stage;
            result.error_message = scheme_list.error_message.empty() ? "Failed to resolve Xcode schemes."
                                                                     : scheme_list.error_message;
            if (!scheme_list.details.stdout_text.empty() || !scheme_list.details.stderr_text.empty()) {
                result.has_details = true;
                result.details = scheme_list.details;
            }
            return result;
        }
        container = scheme_list.container;
        scheme = scheme_list.default_scheme;
        if (scheme.empty()) {
            result.stage = "schemes";
            result.error_message = "Select a scheme to build and run.";
            return result;
        }
    }
    clock.mark("schemes");

    PipelineRun run(state, task_id, root_path, udid, result, clock);
    run.execute(container, scheme);
    return result;
}

} // namespace

PipelineResult build_and_run(orchestrator_state::OrchestratorState &state,
                             const std::string &root_path,
                             const std::string &udid,
                             const std::string &requested_scheme) {
    PipelineResult result;
    try {
        result = run_pipeline(state, root_path, udid, requested_scheme);
    } catch (const std::exception &error) {
        result = stage_failure("build", std::string("Unexpected error: ") + error.what());
    }
    debug_log::info("build_and_run " + std::string(result.success ? "succeeded" : "failed (" + result.stage + ")") +
                    " timings: " + format_timings(result));
    return result;
}

} // namespace build_pipeline
