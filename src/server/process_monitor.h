#pragma once

#include "src/server/config.h"

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <string>
#include <sys/types.h>
#include <thread>
#include <unordered_map>
#include <vector>

namespace zxcompile {

struct TrackedProcess {
    pid_t pid = -1;
    std::chrono::steady_clock::time_point registered_at;
};

struct SweepStats {
    size_t vanished = 0;
    size_t killed = 0;
    size_t orphans_killed = 0;
};

// Background safety net for compiler processes. Every sweep drops tracked
// processes that have exited and terminates those older than max_age. It can
// also SIGKILL untracked compiler processes (orphans) older than max_age.
// Faults on a single process are logged and skipped. An exception never
// stops the loop.
class ProcessMonitor {
public:
    using Clock = std::chrono::steady_clock;

    ProcessMonitor(const MonitorConfig& config, std::string compiler_executable);
    ~ProcessMonitor();

    ProcessMonitor(const ProcessMonitor&) = delete;
    ProcessMonitor& operator=(const ProcessMonitor&) = delete;

    void Start();
    void Stop();
    bool Running() const;

    void Register(pid_t pid);
    void Register(pid_t pid, Clock::time_point registered_at);
    void Deregister(pid_t pid);
    bool IsTracked(pid_t pid) const;
    size_t TrackedCount() const;

    SweepStats SweepOnce();

    // True when some argv element names the compiler executable.
    bool IsCompilerCommand(const std::vector<std::string>& args) const;

private:
    void Loop();
    void SweepTracked(SweepStats& stats);
    void SweepOrphans(SweepStats& stats);
    bool TerminateTracked(const TrackedProcess& process, double age_seconds);
    void Forget(const TrackedProcess& process);

    MonitorConfig config_;
    std::string compiler_name_;

    mutable std::mutex registry_mutex_;
    std::unordered_map<pid_t, TrackedProcess> registry_;

    mutable std::mutex state_mutex_;
    std::condition_variable wake_;
    bool running_ = false;
    bool stop_requested_ = false;
    std::thread thread_;
};

} // namespace zxcompile
