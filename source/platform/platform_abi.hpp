#ifndef SIMPILOT_PLATFORM_ABI_HPP
#define SIMPILOT_PLATFORM_ABI_HPP

// Platform abstraction interface.
// The implementation lives under platform/posix/ (macOS is the target host,
// Linux builds run the test suite against fake toolchains).

#include <cstddef>
#include <string>
#include <vector>

namespace platform {

// Result of spawning a child process with captured stdout/stderr.
struct SpawnResult {
    bool success = false;
    int process_id = -1;
    int stdout_descriptor = -1; // read end, caller closes
    int stderr_descriptor = -1; // read end, caller closes
    std::string error_message;
};

// How a reaped child ended.
struct ExitStatus {
    bool exited_normally = false; // false: killed by a signal or wait failed
    int exit_code = -1;
    int signal_number = 0;
};

// Spawn a child process. A command without a slash is looked up on PATH.
// stdin is /dev/null; stdout and stderr are pipes returned to the caller.
// working_directory empty = inherit. The child leads a new process group
// (group id == process id) so its descendants can be signalled with it.
SpawnResult spawn_process(const std::string &command,
                          const std::vector<std::string> &arguments,
                          const std::string &working_directory);

// Wait up to timeout_milliseconds for any descriptor to become readable
// (or hang up). Returns the ready descriptors, empty on timeout.
std::vector<int> wait_readable(const std::vector<int> &descriptors, int timeout_milliseconds);

// Read whatever is available. Returns false at end-of-file or on a hard error;
// chunk may be empty with a true return after an interrupted read.
bool read_chunk(int descriptor, std::string &chunk);

void close_descriptor(int descriptor);

// Block until the child exits and reap it.
ExitStatus wait_process(int process_id);

// True once the child has exited (or cannot be waited for). Does not reap,
// so the process id stays reserved until wait_process.
bool process_has_exited(int process_id);

// Send SIGTERM to the process group led by process_id.
bool kill_process(int process_id);

// Send SIGKILL to the process group led by process_id.
bool force_kill_process(int process_id);

// True on macOS, the only host the simulator toolchain exists on.
bool is_macos_host();

// Read the entire contents of a file into a string.
// Returns true on success, false on failure (file not found, permission, etc.).
bool read_file_contents(const std::string &file_path, std::string &output_contents);

// Read at most maximum_bytes from the start of a file.
bool read_file_prefix(const std::string &file_path, size_t maximum_bytes, std::string &output_contents);

// Create or truncate a file and write contents. Returns false on any I/O error.
bool write_file_contents(const std::string &file_path, const std::string &contents);

void sleep_milliseconds(int milliseconds);

} // namespace platform

#endif // SIMPILOT_PLATFORM_ABI_HPP
