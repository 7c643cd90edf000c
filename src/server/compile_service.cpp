#include "src/server/compile_service.h"
#include "src/server/logger.h"

#include <absl/strings/escaping.h>

#include <utility>

namespace zxcompile {

namespace {

constexpr char kInternalErrorDetail[] = "Internal error, please try again later";

SubmissionResult Failure(SubmissionStatus status, std::string detail) {
    SubmissionResult result;
    result.status = status;
    result.detail = std::move(detail);
    return result;
}

// Releases a concurrency slot on every exit path.
class ActiveJobSlot {
public:
    explicit ActiveJobSlot(std::atomic<int>& counter) : counter_(counter) {}
    ~ActiveJobSlot() { counter_.fetch_sub(1); }

    ActiveJobSlot(const ActiveJobSlot&) = delete;
    ActiveJobSlot& operator=(const ActiveJobSlot&) = delete;

private:
    std::atomic<int>& counter_;
};

} // namespace

const char* SubmissionStatusName(SubmissionStatus status) {
    switch (status) {
        case SubmissionStatus::kOk: return "ok";
        case SubmissionStatus::kRateLimited: return "rate-limited";
        case SubmissionStatus::kTimeout: return "timeout";
        case SubmissionStatus::kCompileFailure: return "compile-failure";
        case SubmissionStatus::kNoOutput: return "no-output";
        case SubmissionStatus::kInvalidRequest: return "invalid-request";
        case SubmissionStatus::kSystemError: return "system-error";
    }
    return "unknown";
}

CompileService::CompileService(const ServiceConfig& config,
                               std::shared_ptr<InProcessCompiler> fallback,
                               RateLimiter::NowFunction now)
    : config_(config),
      limiter_(config.rate_limit, std::move(now)),
      monitor_(config.monitor, config.compiler.executable),
      controller_(config.compiler, monitor_, std::move(fallback)) {}

CompileService::~CompileService() {
    Stop();
}

void CompileService::Start() {
    monitor_.Start();
}

void CompileService::Stop() {
    monitor_.Stop();
}

SubmissionResult CompileService::Submit(const std::string& source, const std::string& client_id) {
    if (source.empty()) {
        return Failure(SubmissionStatus::kInvalidRequest, "Source must not be empty");
    }
    if (source.size() > config_.max_source_bytes) {
        return Failure(SubmissionStatus::kInvalidRequest,
                       "Source exceeds " + std::to_string(config_.max_source_bytes) + " bytes");
    }

    // The slot is taken first so a busy rejection leaves the client's rate window untouched.
    int active = active_jobs_.fetch_add(1);
    ActiveJobSlot slot(active_jobs_);
    if (active >= config_.max_concurrent_jobs) {
        Logger::Warn("Too many active jobs (", active, "). Rejecting request from ", client_id);
        return Failure(SubmissionStatus::kSystemError, "Service busy, please try again later");
    }

    AdmissionDecision decision = limiter_.Admit(client_id);
    if (!decision.allowed) {
        SubmissionResult result = Failure(SubmissionStatus::kRateLimited, decision.reason);
        result.retry_after = decision.retry_after;
        return result;
    }

    Logger::Info("Compiling ", source.size(), " bytes for client ", client_id,
                 ". Active jobs: ", active + 1);
    try {
        ExecutionOutcome outcome = controller_.Execute(source);
        return FromOutcome(outcome, client_id);
    } catch (const JobSetupError& e) {
        Logger::Error("Job setup failed for client ", client_id, ": ", e.what());
    } catch (const std::exception& e) {
        Logger::Error("Unexpected error compiling for client ", client_id, ": ", e.what());
    }
    return Failure(SubmissionStatus::kSystemError, kInternalErrorDetail);
}

SubmissionResult CompileService::FromOutcome(const ExecutionOutcome& outcome,
                                             const std::string& client_id) {
    Logger::Info("Job for client ", client_id, " finished: ", OutcomeKindName(outcome.kind),
                 " in ", outcome.elapsed.count(), "ms");

    switch (outcome.kind) {
        case OutcomeKind::kSuccess: {
            SubmissionResult result;
            result.status = SubmissionStatus::kOk;
            result.artifact_base64 = absl::Base64Escape(outcome.artifact);
            return result;
        }
        case OutcomeKind::kCompilerFailure:
            return Failure(SubmissionStatus::kCompileFailure, outcome.diagnostics);
        case OutcomeKind::kNoOutput:
            return Failure(SubmissionStatus::kNoOutput, "Compiler produced no output");
        case OutcomeKind::kTimeoutUnconfirmed:
            Logger::Warn("Timeout for client ", client_id,
                         " came from the in-process fallback; the compilation may still be running");
            [[fallthrough]];
        case OutcomeKind::kTimeout:
            return Failure(SubmissionStatus::kTimeout,
                           "Compilation timed out after " +
                               std::to_string(config_.compiler.job_timeout.count()) +
                               " seconds. Try simplifying your program.");
        case OutcomeKind::kSystemError:
            Logger::Error("System error for client ", client_id, ": ", outcome.diagnostics);
            break;
    }
    return Failure(SubmissionStatus::kSystemError, kInternalErrorDetail);
}

} // namespace zxcompile
