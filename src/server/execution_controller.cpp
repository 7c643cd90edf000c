#include "src/server/execution_controller.h"
#include "src/server/logger.h"
#include "src/server/process.h"

#include <exception>
#include <future>
#include <thread>
#include <utility>

namespace zxcompile {

namespace {

using Clock = std::chrono::steady_clock;

std::chrono::milliseconds Since(Clock::time_point start) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start);
}

// Keeps a child in the monitor's registry for as long as the controller owns it.
class ScopedRegistration {
public:
    ScopedRegistration(ProcessMonitor& monitor, pid_t pid) : monitor_(monitor), pid_(pid) {
        monitor_.Register(pid_);
    }
    ~ScopedRegistration() { monitor_.Deregister(pid_); }

    ScopedRegistration(const ScopedRegistration&) = delete;
    ScopedRegistration& operator=(const ScopedRegistration&) = delete;

private:
    ProcessMonitor& monitor_;
    pid_t pid_;
};

// Kills and reaps a child that is still unreaped when the scope unwinds.
class ChildGuard {
public:
    explicit ChildGuard(SpawnedProcess& process) : process_(process) {}
    ~ChildGuard() {
        if (!reaped_) Process::TerminateAndReap(process_, std::chrono::milliseconds(0));
    }

    void MarkReaped() { reaped_ = true; }

    ChildGuard(const ChildGuard&) = delete;
    ChildGuard& operator=(const ChildGuard&) = delete;

private:
    SpawnedProcess& process_;
    bool reaped_ = false;
};

// Compiler messages name the job's private directory; callers only need the file name.
std::string StripDirectory(std::string text, const std::string& directory) {
    const std::string prefix = directory + "/";
    for (size_t pos = text.find(prefix); pos != std::string::npos; pos = text.find(prefix, pos)) {
        text.erase(pos, prefix.size());
    }
    return text;
}

struct FallbackResult {
    int exit_code = -1;
    std::string diagnostics;
};

} // namespace

const char* OutcomeKindName(OutcomeKind kind) {
    switch (kind) {
        case OutcomeKind::kSuccess: return "success";
        case OutcomeKind::kCompilerFailure: return "compiler-failure";
        case OutcomeKind::kNoOutput: return "no-output";
        case OutcomeKind::kTimeout: return "timeout";
        case OutcomeKind::kTimeoutUnconfirmed: return "timeout-unconfirmed";
        case OutcomeKind::kSystemError: return "system-error";
    }
    return "unknown";
}

ExecutionController::ExecutionController(const CompilerConfig& config, ProcessMonitor& monitor,
                                         std::shared_ptr<InProcessCompiler> fallback)
    : config_(config), monitor_(monitor), fallback_(std::move(fallback)) {}

ExecutionOutcome ExecutionController::Execute(const std::string& source) {
    std::unique_ptr<Job> job = Job::Create(config_, source);
    return Run(*job, config_.job_timeout);
}

std::vector<std::string> ExecutionController::CommandFor(const Job& job) const {
    std::vector<std::string> argv;
    argv.push_back(config_.executable);
    argv.insert(argv.end(), config_.flags.begin(), config_.flags.end());
    argv.push_back(job.InputPath());
    return argv;
}

ExecutionOutcome ExecutionController::Run(const Job& job, std::chrono::milliseconds timeout) {
    const auto start = Clock::now();

    SpawnOptions options;
    options.working_directory = job.Directory();

    std::string spawn_error;
    auto child = Process::Spawn(CommandFor(job), options, &spawn_error);
    if (!child) {
        if (fallback_) {
            Logger::Warn("Cannot spawn ", config_.executable, " (", spawn_error,
                         "); running in-process fallback, which cannot be forcibly interrupted");
            return RunInProcess(job, timeout);
        }
        ExecutionOutcome outcome;
        outcome.kind = OutcomeKind::kSystemError;
        outcome.diagnostics = spawn_error;
        outcome.elapsed = Since(start);
        return outcome;
    }

    ScopedRegistration registration(monitor_, child->pid);
    ChildGuard guard(*child);

    ExecutionOutcome outcome;
    outcome.strategy = Strategy::kSubprocess;

    WaitResult wait = Process::WaitUntil(*child, start + timeout, config_.max_captured_output);
    if (!wait.exited) {
        const pid_t pid = child->pid;
        bool forced = Process::TerminateAndReap(*child, config_.termination_grace);
        guard.MarkReaped();
        outcome.kind = OutcomeKind::kTimeout;
        outcome.elapsed = Since(start);
        outcome.diagnostics = "Compilation exceeded " + std::to_string(timeout.count()) + "ms";
        Logger::Warn("Compiler PID ", pid, " timed out after ", timeout.count(), "ms; ",
                     forced ? "killed with SIGKILL" : "exited after SIGTERM");
        return outcome;
    }
    guard.MarkReaped();

    outcome.exit_code = wait.exit_code;
    outcome.elapsed = Since(start);

    if (wait.signaled) {
        outcome.kind = OutcomeKind::kCompilerFailure;
        outcome.diagnostics = "Compiler terminated by signal " + std::to_string(wait.term_signal);
        return outcome;
    }
    if (wait.exit_code != 0) {
        outcome.kind = OutcomeKind::kCompilerFailure;
        outcome.diagnostics = StripDirectory(
            wait.stderr_data.empty() ? wait.stdout_data : wait.stderr_data, job.Directory());
        Logger::Info("Compiler exited with status ", wait.exit_code);
        return outcome;
    }

    outcome.diagnostics = wait.stderr_data;
    return CollectArtifact(job, std::move(outcome));
}

ExecutionOutcome ExecutionController::RunInProcess(const Job& job, std::chrono::milliseconds timeout) {
    const auto start = Clock::now();

    ExecutionOutcome outcome;
    outcome.strategy = Strategy::kInProcess;

    std::vector<std::string> args = CommandFor(job);
    args.erase(args.begin());

    std::promise<FallbackResult> promise;
    std::future<FallbackResult> future = promise.get_future();

    // The thread owns copies of everything it touches so it can outlive this call.
    std::thread worker([compiler = fallback_, args = std::move(args),
                        directory = job.Directory(), promise = std::move(promise)]() mutable {
        try {
            FallbackResult result;
            result.exit_code = compiler->Compile(args, directory, result.diagnostics);
            promise.set_value(std::move(result));
        } catch (...) {
            promise.set_exception(std::current_exception());
        }
    });
    worker.detach();

    if (future.wait_for(timeout) != std::future_status::ready) {
        outcome.kind = OutcomeKind::kTimeoutUnconfirmed;
        outcome.elapsed = Since(start);
        outcome.diagnostics = "Compilation exceeded " + std::to_string(timeout.count()) + "ms";
        Logger::Warn("In-process compilation timed out after ", timeout.count(),
                     "ms; the worker thread is still running and cannot be stopped");
        return outcome;
    }

    FallbackResult result;
    try {
        result = future.get();
    } catch (const std::exception& e) {
        Logger::Error("In-process compiler threw: ", e.what());
        outcome.kind = OutcomeKind::kSystemError;
        outcome.elapsed = Since(start);
        return outcome;
    }

    outcome.exit_code = result.exit_code;
    outcome.elapsed = Since(start);
    if (result.exit_code != 0) {
        outcome.kind = OutcomeKind::kCompilerFailure;
        outcome.diagnostics = StripDirectory(std::move(result.diagnostics), job.Directory());
        return outcome;
    }

    outcome.diagnostics = std::move(result.diagnostics);
    return CollectArtifact(job, std::move(outcome));
}

ExecutionOutcome ExecutionController::CollectArtifact(const Job& job, ExecutionOutcome outcome) const {
    auto artifact = Process::ReadFile(job.OutputPath());
    if (!artifact) {
        outcome.kind = OutcomeKind::kNoOutput;
        outcome.diagnostics = "Compiler reported success but no output produced";
        return outcome;
    }
    outcome.kind = OutcomeKind::kSuccess;
    outcome.artifact = std::move(*artifact);
    return outcome;
}

} // namespace zxcompile
