#include "src/server/process_monitor.h"
#include "src/server/process.h"
#include "tests/test_util.h"

#include <gtest/gtest.h>

#include <csignal>
#include <stdexcept>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>

namespace zxcompile {
namespace {

using std::chrono::milliseconds;
using std::chrono::seconds;
using test_util::TempDir;

MonitorConfig FastConfig() {
    MonitorConfig config;
    config.sweep_interval = seconds(1);
    config.max_age = seconds(8);
    config.termination_grace = milliseconds(100);
    config.orphan_scan = false;
    return config;
}

SpawnedProcess SpawnSleeper() {
    std::string error;
    auto child = Process::Spawn({"sleep", "60"}, {}, &error);
    if (!child) throw std::runtime_error(error);
    Process::CloseStreams(*child);
    return *child;
}

// Reaps pid and reports whether a signal ended it.
bool ReapSignaled(pid_t pid) {
    int status = 0;
    if (waitpid(pid, &status, 0) != pid) return false;
    return WIFSIGNALED(status);
}

TEST(ProcessMonitorTest, RegistryTracksAndForgets) {
    ProcessMonitor monitor(FastConfig(), "zxbc");
    monitor.Register(1234);
    monitor.Register(5678);
    EXPECT_TRUE(monitor.IsTracked(1234));
    EXPECT_EQ(monitor.TrackedCount(), 2u);

    monitor.Deregister(1234);
    EXPECT_FALSE(monitor.IsTracked(1234));
    EXPECT_EQ(monitor.TrackedCount(), 1u);
}

TEST(ProcessMonitorTest, KillsTrackedProcessPastMaxAge) {
    ProcessMonitor monitor(FastConfig(), "zxbc");
    SpawnedProcess child = SpawnSleeper();
    monitor.Register(child.pid, ProcessMonitor::Clock::now() - seconds(20));

    SweepStats stats = monitor.SweepOnce();
    EXPECT_EQ(stats.killed, 1u);
    EXPECT_FALSE(monitor.IsTracked(child.pid));
    EXPECT_TRUE(test_util::WaitUntilDead(child.pid, seconds(2)));
    EXPECT_TRUE(ReapSignaled(child.pid));
}

TEST(ProcessMonitorTest, ForceKillsProcessIgnoringTerm) {
    ProcessMonitor monitor(FastConfig(), "zxbc");
    std::string error;
    auto child = Process::Spawn({"/bin/sh", "-c", "trap '' TERM; sleep 60"}, {}, &error);
    ASSERT_TRUE(child) << error;
    Process::CloseStreams(*child);
    std::this_thread::sleep_for(milliseconds(200));
    monitor.Register(child->pid, ProcessMonitor::Clock::now() - seconds(20));

    SweepStats stats = monitor.SweepOnce();
    EXPECT_EQ(stats.killed, 1u);
    EXPECT_FALSE(monitor.IsTracked(child->pid));

    int status = 0;
    ASSERT_EQ(waitpid(child->pid, &status, 0), child->pid);
    ASSERT_TRUE(WIFSIGNALED(status));
    EXPECT_EQ(WTERMSIG(status), SIGKILL);
}

TEST(ProcessMonitorTest, LeavesYoungProcessAlone) {
    ProcessMonitor monitor(FastConfig(), "zxbc");
    SpawnedProcess child = SpawnSleeper();
    monitor.Register(child.pid);

    SweepStats stats = monitor.SweepOnce();
    EXPECT_EQ(stats.killed, 0u);
    EXPECT_TRUE(monitor.IsTracked(child.pid));
    EXPECT_TRUE(Process::IsAlive(child.pid));

    Process::TerminateAndReap(child, milliseconds(500));
}

TEST(ProcessMonitorTest, DropsProcessesThatAlreadyExited) {
    ProcessMonitor monitor(FastConfig(), "zxbc");
    std::string error;
    auto child = Process::Spawn({"/bin/true"}, {}, &error);
    ASSERT_TRUE(child) << error;
    Process::CloseStreams(*child);
    ASSERT_TRUE(test_util::WaitUntilDead(child->pid, seconds(5)));

    monitor.Register(child->pid);
    // A PID that never existed must not disturb the rest of the sweep.
    monitor.Register(999999999);

    SweepStats stats = monitor.SweepOnce();
    EXPECT_EQ(stats.vanished, 2u);
    EXPECT_EQ(monitor.TrackedCount(), 0u);
    waitpid(child->pid, nullptr, 0);
}

TEST(ProcessMonitorTest, BackgroundLoopKillsWithinOneInterval) {
    ProcessMonitor monitor(FastConfig(), "zxbc");
    monitor.Start();
    EXPECT_TRUE(monitor.Running());

    SpawnedProcess child = SpawnSleeper();
    monitor.Register(child.pid, ProcessMonitor::Clock::now() - seconds(20));

    auto deadline = std::chrono::steady_clock::now() + seconds(3);
    while (monitor.IsTracked(child.pid) && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(milliseconds(50));
    }
    EXPECT_FALSE(monitor.IsTracked(child.pid));
    EXPECT_TRUE(ReapSignaled(child.pid));

    monitor.Stop();
    EXPECT_FALSE(monitor.Running());
    monitor.Stop();
}

TEST(ProcessMonitorTest, StopReturnsPromptly) {
    MonitorConfig config = FastConfig();
    config.sweep_interval = seconds(30);
    ProcessMonitor monitor(config, "zxbc");
    monitor.Start();
    monitor.Start();
    std::this_thread::sleep_for(milliseconds(100));

    auto start = std::chrono::steady_clock::now();
    monitor.Stop();
    EXPECT_LT(std::chrono::steady_clock::now() - start, seconds(2));
}

TEST(ProcessMonitorTest, RecognisesCompilerCommandLines) {
    ProcessMonitor monitor(FastConfig(), "/usr/local/bin/zxbc");
    EXPECT_TRUE(monitor.IsCompilerCommand({"zxbc", "-taB", "a.bas"}));
    EXPECT_TRUE(monitor.IsCompilerCommand({"/bin/sh", "/opt/zx/zxbc", "-taB", "a.bas"}));
    EXPECT_FALSE(monitor.IsCompilerCommand({"zxbc.py", "a.bas"}));
    EXPECT_FALSE(monitor.IsCompilerCommand({"vim", "notes-on-zxbc.txt"}));
}

TEST(ProcessMonitorTest, OrphanScanKillsOldUntrackedCompilers) {
    TempDir dir;
    std::string name = "orphan_zxbc_" + std::to_string(getpid());
    std::string script = test_util::WriteScript(dir.Path(), name, "sleep 60\nexit 0\n");

    MonitorConfig config = FastConfig();
    config.orphan_scan = true;
    config.max_age = seconds(1);
    ProcessMonitor monitor(config, script);

    std::string error;
    auto orphan = Process::Spawn({script}, {}, &error);
    ASSERT_TRUE(orphan) << error;
    Process::CloseStreams(*orphan);

    // Too young on the first pass.
    EXPECT_EQ(monitor.SweepOnce().orphans_killed, 0u);
    EXPECT_TRUE(Process::IsAlive(orphan->pid));

    std::this_thread::sleep_for(milliseconds(1500));
    EXPECT_EQ(monitor.SweepOnce().orphans_killed, 1u);

    int status = 0;
    ASSERT_EQ(waitpid(orphan->pid, &status, 0), orphan->pid);
    ASSERT_TRUE(WIFSIGNALED(status));
    EXPECT_EQ(WTERMSIG(status), SIGKILL);
}

TEST(ProcessMonitorTest, OrphanScanSkipsTrackedProcesses) {
    TempDir dir;
    std::string name = "tracked_zxbc_" + std::to_string(getpid());
    std::string script = test_util::WriteScript(dir.Path(), name, "sleep 60\nexit 0\n");

    MonitorConfig config = FastConfig();
    config.orphan_scan = true;
    config.max_age = seconds(1);
    ProcessMonitor monitor(config, script);

    std::string error;
    auto child = Process::Spawn({script}, {}, &error);
    ASSERT_TRUE(child) << error;
    Process::CloseStreams(*child);

    // Older than the limit by /proc start time, but registered just now, so the
    // tracked path leaves it alone and only the orphan scan could touch it.
    std::this_thread::sleep_for(milliseconds(1500));
    monitor.Register(child->pid);

    SweepStats stats = monitor.SweepOnce();
    EXPECT_EQ(stats.killed, 0u);
    EXPECT_EQ(stats.orphans_killed, 0u);
    EXPECT_TRUE(Process::IsAlive(child->pid));
    EXPECT_TRUE(monitor.IsTracked(child->pid));

    // Once forgotten, the same process is an orphan.
    monitor.Deregister(child->pid);
    EXPECT_EQ(monitor.SweepOnce().orphans_killed, 1u);
    EXPECT_TRUE(ReapSignaled(child->pid));
}

} // namespace
} // namespace zxcompile
