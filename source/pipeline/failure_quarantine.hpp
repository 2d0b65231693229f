#ifndef SIMPILOT_FAILURE_QUARANTINE_HPP
#define SIMPILOT_FAILURE_QUARANTINE_HPP

// Keeps the run directories of failed builds for post-mortem inspection,
// in a fixed-size ring under <project base>/failures/.

#include <cstddef>
#include <string>

namespace failure_quarantine {

constexpr size_t RETAINED_FAILURE_RUNS = 3;

// Moves run_directory to failures_directory/<run_id>, then prunes the ring.
// Returns the quarantined path, or run_directory itself if the move failed.
std::string quarantine_run(const std::string &run_directory,
                           const std::string &failures_directory,
                           const std::string &run_id,
                           size_t keep = RETAINED_FAILURE_RUNS);

// Deletes all but the `keep` most recently modified entries of failures_directory.
// Returns the number of entries left.
size_t prune_failure_runs(const std::string &failures_directory, size_t keep = RETAINED_FAILURE_RUNS);

} // namespace failure_quarantine

#endif // SIMPILOT_FAILURE_QUARANTINE_HPP
