#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <sys/types.h>
#include <vector>

namespace zxcompile {

struct SpawnOptions {
    std::string working_directory;
    // Child becomes the leader of a new process group so the whole tree can be
    // signalled through -pid.
    bool new_process_group = true;
};

// A running child with the read ends of its stdout/stderr pipes.
struct SpawnedProcess {
    pid_t pid = -1;
    int stdout_fd = -1;
    int stderr_fd = -1;
};

struct WaitResult {
    bool exited = false;       // false means the deadline passed first
    bool signaled = false;
    int exit_code = -1;
    int term_signal = 0;
    std::string stdout_data;
    std::string stderr_data;
};

class Process {
public:
    using Clock = std::chrono::steady_clock;

    static std::string CreateTempDirectory(const std::string& parent);
    static bool RemoveDirectory(const std::string& path);
    static bool WriteFile(const std::string& path, const std::string& content);
    static std::optional<std::string> ReadFile(const std::string& path);

    // Forks and execs argv[0] (PATH lookup applies). Returns nullopt when the
    // child could not be started at all; *error then holds the reason. An exec
    // failure is detected through a close-on-exec pipe, so a successful return
    // always means the target program is running.
    static std::optional<SpawnedProcess> Spawn(const std::vector<std::string>& argv,
                                               const SpawnOptions& options,
                                               std::string* error);

    // Drains the child's pipes until it exits or the deadline passes. Output past
    // max_output bytes per stream is discarded. Closes the pipe fds once the child
    // has been reaped; on deadline the fds stay open and the child unreaped.
    static WaitResult WaitUntil(SpawnedProcess& process,
                                Clock::time_point deadline,
                                std::size_t max_output);

    // SIGTERM to the process group, up to `grace` for the leader to exit, then
    // SIGKILL. Always reaps the leader. Returns true if SIGKILL was needed.
    static bool TerminateAndReap(SpawnedProcess& process, std::chrono::milliseconds grace);

    static void CloseStreams(SpawnedProcess& process);

    // Non-destructive probe. Zombies count as dead.
    static bool IsAlive(pid_t pid);

    // Signals the process group led by pid when there is one, otherwise pid.
    // Returns false (with errno set) if the signal could not be delivered.
    static bool Signal(pid_t pid, int signal);

    // Seconds since the process started, from /proc/<pid>/stat and /proc/uptime.
    static std::optional<double> AgeSeconds(pid_t pid);

    static std::optional<std::vector<std::string>> CommandLine(pid_t pid);

    // All pids under /proc whose command line satisfies the predicate.
    static std::vector<pid_t> FindProcesses(
        const std::function<bool(const std::vector<std::string>&)>& matches);
};

} // namespace zxcompile
