#include "platform/platform_abi.hpp"

#include <unistd.h>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <spawn.h>
#include <cerrno>
#include <fstream>
#include <sstream>
#include <thread>
#include <chrono>
#include <cstring>

extern char **environ;

namespace platform {

// Both ends are close-on-exec so a child spawned concurrently on another
// thread never inherits them; dup2 in the spawn file actions clears the
// flag on the child's copies of 1 and 2.
static bool create_pipe(int descriptors[2]) {
#if defined(__linux__)
    return pipe2(descriptors, O_CLOEXEC) == 0;
#else
    if (pipe(descriptors) != 0) {
        return false;
    }
    if (fcntl(descriptors[0], F_SETFD, FD_CLOEXEC) != 0 || fcntl(descriptors[1], F_SETFD, FD_CLOEXEC) != 0) {
        int saved_errno = errno;
        close(descriptors[0]);
        close(descriptors[1]);
        errno = saved_errno;
        return false;
    }
    return true;
#endif
}

static void close_pipe_pair(int descriptors[2]) {
    close(descriptors[0]);
    close(descriptors[1]);
}

SpawnResult spawn_process(const std::string &command,
                          const std::vector<std::string> &arguments,
                          const std::string &working_directory) {
    SpawnResult result;

    // Build argv array: [command, arg1, arg2, ..., nullptr]
    // We need mutable copies of strings for posix_spawn.
    std::vector<std::string> argv_strings;
    argv_strings.push_back(command);
    for (const auto &argument : arguments) {
        argv_strings.push_back(argument);
    }
    std::vector<char *> argv_pointers;
    for (auto &argument_string : argv_strings) {
        argv_pointers.push_back(argument_string.data());
    }
    argv_pointers.push_back(nullptr);

    int stdout_pipe[2] = {-1, -1};
    int stderr_pipe[2] = {-1, -1};
    if (!create_pipe(stdout_pipe)) {
        result.error_message = "pipe failed: " + std::string(strerror(errno));
        return result;
    }
    if (!create_pipe(stderr_pipe)) {
        result.error_message = "pipe failed: " + std::string(strerror(errno));
        close_pipe_pair(stdout_pipe);
        return result;
    }

    posix_spawnattr_t attributes;
    int spawn_status = posix_spawnattr_init(&attributes);
    if (spawn_status != 0) {
        close_pipe_pair(stdout_pipe);
        close_pipe_pair(stderr_pipe);
        result.error_message = "spawn " + command + " failed: " + std::string(strerror(spawn_status));
        return result;
    }
    spawn_status = posix_spawnattr_setflags(&attributes, POSIX_SPAWN_SETPGROUP);
    if (spawn_status == 0) {
        spawn_status = posix_spawnattr_setpgroup(&attributes, 0);
    }

    posix_spawn_file_actions_t file_actions;
    if (spawn_status == 0) {
        spawn_status = posix_spawn_file_actions_init(&file_actions);
    }
    bool file_actions_ready = spawn_status == 0;
    if (file_actions_ready) {
        spawn_status = posix_spawn_file_actions_addopen(&file_actions, STDIN_FILENO, "/dev/null", O_RDONLY, 0);
        if (spawn_status == 0) {
            spawn_status = posix_spawn_file_actions_adddup2(&file_actions, stdout_pipe[1], STDOUT_FILENO);
        }
        if (spawn_status == 0) {
            spawn_status = posix_spawn_file_actions_adddup2(&file_actions, stderr_pipe[1], STDERR_FILENO);
        }
        if (spawn_status == 0 && !working_directory.empty()) {
            spawn_status = posix_spawn_file_actions_addchdir_np(&file_actions, working_directory.c_str());
        }
    }

    pid_t child_pid = 0;
    if (spawn_status == 0) {
        spawn_status = posix_spawnp(&child_pid, command.c_str(), &file_actions, &attributes,
                                    argv_pointers.data(), environ);
    }
    if (file_actions_ready) {
        posix_spawn_file_actions_destroy(&file_actions);
    }
    posix_spawnattr_destroy(&attributes);

    // The parent only keeps the read ends.
    close(stdout_pipe[1]);
    close(stderr_pipe[1]);

    if (spawn_status != 0) {
        close(stdout_pipe[0]);
        close(stderr_pipe[0]);
        result.error_message = "spawn " + command + " failed: " + std::string(strerror(spawn_status));
        return result;
    }

    result.success = true;
    result.process_id = static_cast<int>(child_pid);
    result.stdout_descriptor = stdout_pipe[0];
    result.stderr_descriptor = stderr_pipe[0];
    return result;
}

std::vector<int> wait_readable(const std::vector<int> &descriptors, int timeout_milliseconds) {
    std::vector<pollfd> poll_entries;
    for (int descriptor : descriptors) {
        pollfd entry;
        entry.fd = descriptor;
        entry.events = POLLIN;
        entry.revents = 0;
        poll_entries.push_back(entry);
    }

    std::vector<int> ready;
    int poll_status = poll(poll_entries.data(), static_cast<nfds_t>(poll_entries.size()), timeout_milliseconds);
    if (poll_status <= 0) {
        return ready;
    }
    for (const auto &entry : poll_entries) {
        if (entry.revents & (POLLIN | POLLHUP | POLLERR | POLLNVAL)) {
            ready.push_back(entry.fd);
        }
    }
    return ready;
}

bool read_chunk(int descriptor, std::string &chunk) {
    char buffer[16384];
    ssize_t bytes_read = read(descriptor, buffer, sizeof(buffer));
    if (bytes_read > 0) {
        chunk.assign(buffer, static_cast<size_t>(bytes_read));
        return true;
    }
    chunk.clear();
    if (bytes_read < 0 && (errno == EINTR || errno == EAGAIN)) {
        return true;
    }
    return false;
}

void close_descriptor(int descriptor) {
    if (descriptor >= 0) {
        close(descriptor);
    }
}

ExitStatus wait_process(int process_id) {
    ExitStatus status;
    int raw_status = 0;
    pid_t waited = -1;
    do {
        waited = waitpid(static_cast<pid_t>(process_id), &raw_status, 0);
    } while (waited < 0 && errno == EINTR);

    if (waited < 0) {
        return status;
    }
    if (WIFEXITED(raw_status)) {
        status.exited_normally = true;
        status.exit_code = WEXITSTATUS(raw_status);
    } else if (WIFSIGNALED(raw_status)) {
        status.signal_number = WTERMSIG(raw_status);
    }
    return status;
}

bool process_has_exited(int process_id) {
    siginfo_t info;
    std::memset(&info, 0, sizeof(info));
    int wait_result = -1;
    do {
        wait_result = waitid(P_PID, static_cast<id_t>(process_id), &info, WEXITED | WNOHANG | WNOWAIT);
    } while (wait_result < 0 && errno == EINTR);

    if (wait_result < 0) {
        return true;
    }
    // WNOHANG leaves si_pid at zero while the child is still running.
    return info.si_pid != 0;
}

static bool signal_process_group(int process_id, int signal_number) {
    if (process_id <= 0) {
        return false;
    }
    int kill_result = kill(-static_cast<pid_t>(process_id), signal_number);
    return (kill_result == 0);
}

bool kill_process(int process_id) {
    return signal_process_group(process_id, SIGTERM);
}

bool force_kill_process(int process_id) {
    return signal_process_group(process_id, SIGKILL);
}

bool is_macos_host() {
#if defined(__APPLE__)
    return true;
#else
    return false;
#endif
}

bool read_file_contents(const std::string &file_path, std::string &output_contents) {
    std::ifstream file_stream(file_path, std::ios::binary);
    if (!file_stream.is_open()) {
        return false;
    }
    std::ostringstream string_stream;
    string_stream << file_stream.rdbuf();
    output_contents = string_stream.str();
    return true;
}

bool read_file_prefix(const std::string &file_path, size_t maximum_bytes, std::string &output_contents) {
    std::ifstream file_stream(file_path, std::ios::binary);
    if (!file_stream.is_open()) {
        return false;
    }
    output_contents.assign(maximum_bytes, '\0');
    file_stream.read(&output_contents[0], static_cast<std::streamsize>(maximum_bytes));
    output_contents.resize(static_cast<size_t>(file_stream.gcount()));
    return true;
}

bool write_file_contents(const std::string &file_path, const std::string &contents) {
    std::ofstream file_stream(file_path, std::ios::binary | std::ios::trunc);
    if (!file_stream.is_open()) {
        return false;
    }
    file_stream << contents;
    file_stream.flush();
    return static_cast<bool>(file_stream);
}

void sleep_milliseconds(int milliseconds) {
    if (milliseconds <= 0) {
        return;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(milliseconds));
}

} // namespace platform
