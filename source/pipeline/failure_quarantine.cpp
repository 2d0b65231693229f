#include "pipeline/failure_quarantine.hpp"
#include "utils/debug_log.hpp"

#include <algorithm>
#include <filesystem>
#include <system_error>
#include <utility>
#include <vector>

namespace failure_quarantine {

namespace fs = std::filesystem;

std::string quarantine_run(const std::string &run_directory,
                           const std::string &failures_directory,
                           const std::string &run_id,
                           size_t keep) {
    std::string reported_path = run_directory;

    std::error_code error;
    fs::create_directories(failures_directory, error);
    if (!error) {
        fs::path destination = fs::path(failures_directory) / run_id;
        fs::rename(run_directory, destination, error);
        if (!error) {
            reported_path = destination.string();
        }
    }
    if (error) {
        // The failure is still reported, pointing at the run directory.
        debug_log::log("quarantine: could not move " + run_directory + ": " + error.message());
    }

    prune_failure_runs(failures_directory, keep);
    return reported_path;
}

size_t prune_failure_runs(const std::string &failures_directory, size_t keep) {
    std::vector<std::pair<fs::file_time_type, fs::path>> entries;

    std::error_code error;
    fs::directory_iterator iterator(failures_directory, error);
    if (error) {
        return 0;
    }
    for (; iterator != fs::directory_iterator(); iterator.increment(error)) {
        if (error) {
            break;
        }
        std::error_code time_error;
        fs::file_time_type modified = fs::last_write_time(iterator->path(), time_error);
        if (time_error) {
            modified = fs::file_time_type::min();
        }
        entries.emplace_back(modified, iterator->path());
    }

    std::sort(entries.begin(), entries.end(), [](const auto &left, const auto &right) {
        if (left.first != right.first) {
            return left.first > right.first;
        }
        // Same timestamp: run ids start with epoch ms, so the larger name is newer.
        return left.second.filename().string() > right.second.filename().string();
    });

    size_t remaining = entries.size();
    for (size_t index = keep; index < entries.size(); ++index) {
        std::error_code remove_error;
        fs::remove_all(entries[index].second, remove_error);
        if (remove_error) {
            debug_log::log("quarantine: could not prune " + entries[index].second.string() + ": " +
                           remove_error.message());
            continue;
        }
        --remaining;
    }
    return remaining;
}

} // namespace failure_quarantine
