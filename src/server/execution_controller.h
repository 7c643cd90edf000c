#pragma once

#include "src/server/config.h"
#include "src/server/job.h"
#include "src/server/process_monitor.h"

#include <chrono>
#include <memory>
#include <string>
#include <vector>

namespace zxcompile {

enum class OutcomeKind {
    kSuccess,
    kCompilerFailure,
    kNoOutput,
    kTimeout,
    // The in-process fallback hit its deadline. Its worker thread could not be
    // stopped and may still be running.
    kTimeoutUnconfirmed,
    kSystemError
};

const char* OutcomeKindName(OutcomeKind kind);

enum class Strategy {
    kSubprocess,
    kInProcess
};

struct ExecutionOutcome {
    OutcomeKind kind = OutcomeKind::kSystemError;
    Strategy strategy = Strategy::kSubprocess;
    std::string artifact;      // contents of the output file on success
    std::string diagnostics;
    int exit_code = -1;
    std::chrono::milliseconds elapsed{0};
};

// Compiler entry point callable inside this process. Used only when the
// executable cannot be spawned.
class InProcessCompiler {
public:
    virtual ~InProcessCompiler() = default;

    // args is the command line without argv[0]; relative outputs land in
    // working_directory. Returns the compiler's exit status.
    virtual int Compile(const std::vector<std::string>& args,
                        const std::string& working_directory,
                        std::string& diagnostics) = 0;
};

// Runs one compilation with a hard deadline.
//
// The compiler normally runs as a child process in its own process group. It is
// registered with the ProcessMonitor while it runs. On timeout it gets SIGTERM,
// then SIGKILL after the grace period, and is always reaped.
//
// If the executable cannot be started at all and an InProcessCompiler was
// supplied, the job runs on a detached worker thread instead. This mode is
// best-effort: a hung call cannot be interrupted, so a timeout is reported as
// kTimeoutUnconfirmed and the thread keeps whatever it holds until it returns.
class ExecutionController {
public:
    ExecutionController(const CompilerConfig& config, ProcessMonitor& monitor,
                        std::shared_ptr<InProcessCompiler> fallback = nullptr);

    // Creates the job files, runs the compiler with the configured timeout and
    // removes the files again. Throws JobSetupError if the files cannot be created.
    ExecutionOutcome Execute(const std::string& source);

    ExecutionOutcome Run(const Job& job, std::chrono::milliseconds timeout);

    std::vector<std::string> CommandFor(const Job& job) const;

private:
    ExecutionOutcome RunInProcess(const Job& job, std::chrono::milliseconds timeout);
    ExecutionOutcome CollectArtifact(const Job& job, ExecutionOutcome outcome) const;

    CompilerConfig config_;
    ProcessMonitor& monitor_;
    std::shared_ptr<InProcessCompiler> fallback_;
};

} // namespace zxcompile
