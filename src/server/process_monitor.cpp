#include "src/server/process_monitor.h"
#include "src/server/logger.h"
#include "src/server/process.h"

#include <cerrno>
#include <csignal>
#include <cstring>
#include <filesystem>
#include <iomanip>
#include <sstream>
#include <unistd.h>

namespace zxcompile {

namespace {

std::string Basename(const std::string& path) {
    return std::filesystem::path(path).filename().string();
}

std::string FormatAge(double seconds) {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(1) << seconds << "s";
    return ss.str();
}

} // namespace

ProcessMonitor::ProcessMonitor(const MonitorConfig& config, std::string compiler_executable)
    : config_(config), compiler_name_(Basename(compiler_executable)) {}

ProcessMonitor::~ProcessMonitor() {
    Stop();
}

void ProcessMonitor::Start() {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (running_) return;
    running_ = true;
    stop_requested_ = false;
    thread_ = std::thread(&ProcessMonitor::Loop, this);
    Logger::Info("[monitor] Started: sweeping every ", config_.sweep_interval.count(),
                 "s, killing compiler processes older than ", config_.max_age.count(), "s");
}

void ProcessMonitor::Stop() {
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (!running_) return;
        stop_requested_ = true;
    }
    wake_.notify_all();
    if (thread_.joinable()) thread_.join();

    std::lock_guard<std::mutex> lock(state_mutex_);
    running_ = false;
    Logger::Info("[monitor] Stopped");
}

bool ProcessMonitor::Running() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return running_;
}

void ProcessMonitor::Register(pid_t pid) {
    Register(pid, Clock::now());
}

void ProcessMonitor::Register(pid_t pid, Clock::time_point registered_at) {
    {
        std::lock_guard<std::mutex> lock(registry_mutex_);
        registry_[pid] = TrackedProcess{pid, registered_at};
    }
    Logger::Debug("[monitor] Tracking compiler process PID ", pid);
}

void ProcessMonitor::Deregister(pid_t pid) {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    registry_.erase(pid);
}

bool ProcessMonitor::IsTracked(pid_t pid) const {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    return registry_.count(pid) > 0;
}

size_t ProcessMonitor::TrackedCount() const {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    return registry_.size();
}

bool ProcessMonitor::IsCompilerCommand(const std::vector<std::string>& args) const {
    if (compiler_name_.empty()) return false;
    for (const auto& arg : args) {
        if (Basename(arg) == compiler_name_) return true;
    }
    return false;
}

SweepStats ProcessMonitor::SweepOnce() {
    SweepStats stats;
    SweepTracked(stats);
    if (config_.orphan_scan) SweepOrphans(stats);
    if (stats.vanished || stats.killed || stats.orphans_killed) {
        Logger::Debug("[monitor] Sweep: ", stats.vanished, " exited, ", stats.killed,
                      " killed, ", stats.orphans_killed, " orphans killed");
    }
    return stats;
}

void ProcessMonitor::Loop() {
    std::unique_lock<std::mutex> lock(state_mutex_);
    while (!stop_requested_) {
        lock.unlock();
        try {
            SweepOnce();
        } catch (const std::exception& e) {
            Logger::Error("[monitor] Error in monitor loop: ", e.what());
        }
        lock.lock();
        wake_.wait_for(lock, config_.sweep_interval, [this]() { return stop_requested_; });
    }
}

void ProcessMonitor::SweepTracked(SweepStats& stats) {
    std::vector<TrackedProcess> snapshot;
    {
        std::lock_guard<std::mutex> lock(registry_mutex_);
        snapshot.reserve(registry_.size());
        for (const auto& entry : registry_) snapshot.push_back(entry.second);
    }

    const auto now = Clock::now();
    for (const auto& process : snapshot) {
        try {
            if (!Process::IsAlive(process.pid)) {
                Forget(process);
                ++stats.vanished;
                continue;
            }

            double age = std::chrono::duration<double>(now - process.registered_at).count();
            if (age <= static_cast<double>(config_.max_age.count())) continue;

            TerminateTracked(process, age);
            Forget(process);
            ++stats.killed;
        } catch (const std::exception& e) {
            Logger::Error("[monitor] Failed to check PID ", process.pid, ": ", e.what());
        }
    }
}

bool ProcessMonitor::TerminateTracked(const TrackedProcess& process, double age_seconds) {
    Logger::Warn("[monitor] Killing stuck process PID ", process.pid, " (age: ",
                 FormatAge(age_seconds), ")");

    if (!Process::Signal(process.pid, SIGTERM)) {
        if (errno != ESRCH) {
            Logger::Warn("[monitor] SIGTERM to PID ", process.pid, " failed: ", strerror(errno));
        }
        return false;
    }

    std::this_thread::sleep_for(config_.termination_grace);
    if (!Process::IsAlive(process.pid)) return false;

    if (!Process::Signal(process.pid, SIGKILL)) {
        if (errno != ESRCH) {
            Logger::Warn("[monitor] SIGKILL to PID ", process.pid, " failed: ", strerror(errno));
        }
        return false;
    }
    Logger::Warn("[monitor] Force killed PID ", process.pid);
    return true;
}

void ProcessMonitor::Forget(const TrackedProcess& process) {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    auto it = registry_.find(process.pid);
    // A newer registration under a recycled PID is left alone.
    if (it != registry_.end() && it->second.registered_at == process.registered_at) {
        registry_.erase(it);
    }
}

void ProcessMonitor::SweepOrphans(SweepStats& stats) {
    const pid_t self = getpid();
    auto candidates = Process::FindProcesses(
        [this](const std::vector<std::string>& args) { return IsCompilerCommand(args); });

    for (pid_t pid : candidates) {
        if (pid == self || IsTracked(pid)) continue;

        try {
            auto age = Process::AgeSeconds(pid);
            if (!age) {
                Logger::Debug("[monitor] Could not determine age of PID ", pid);
                continue;
            }
            if (*age <= static_cast<double>(config_.max_age.count())) continue;
            if (!Process::IsAlive(pid)) continue;

            Logger::Warn("[monitor] Found orphan compiler process PID ", pid, " (age: ",
                         FormatAge(*age), "), killing");
            if (Process::Signal(pid, SIGKILL)) {
                ++stats.orphans_killed;
            } else if (errno != ESRCH) {
                Logger::Warn("[monitor] SIGKILL to orphan PID ", pid, " failed: ", strerror(errno));
            }
        } catch (const std::exception& e) {
            Logger::Error("[monitor] Failed to check orphan PID ", pid, ": ", e.what());
        }
    }
}

} // namespace zxcompile
