#pragma once

#include "src/server/config.h"
#include "src/server/execution_controller.h"
#include "src/server/process_monitor.h"
#include "src/server/rate_limiter.h"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <memory>
#include <string>

namespace zxcompile {

enum class SubmissionStatus {
    kOk,
    kRateLimited,
    kTimeout,
    kCompileFailure,
    kNoOutput,
    kInvalidRequest,
    kSystemError
};

const char* SubmissionStatusName(SubmissionStatus status);

struct SubmissionResult {
    SubmissionStatus status = SubmissionStatus::kSystemError;
    std::string artifact_base64;
    // Caller-facing text. Never contains paths or exception details.
    std::string detail;
    std::chrono::seconds retry_after{0};
};

// Owns the admission gate, the process monitor and the execution controller
// for one running service. Submit() is safe to call from many threads.
class CompileService {
public:
    explicit CompileService(const ServiceConfig& config,
                            std::shared_ptr<InProcessCompiler> fallback = nullptr,
                            RateLimiter::NowFunction now = nullptr);
    ~CompileService();

    CompileService(const CompileService&) = delete;
    CompileService& operator=(const CompileService&) = delete;

    void Start();
    void Stop();

    SubmissionResult Submit(const std::string& source, const std::string& client_id);

    int ActiveJobs() const { return active_jobs_.load(); }
    size_t TrackedProcesses() const { return monitor_.TrackedCount(); }

    ProcessMonitor& Monitor() { return monitor_; }
    RateLimiter& Limiter() { return limiter_; }

private:
    SubmissionResult FromOutcome(const ExecutionOutcome& outcome, const std::string& client_id);

    ServiceConfig config_;
    RateLimiter limiter_;
    ProcessMonitor monitor_;
    ExecutionController controller_;
    std::atomic<int> active_jobs_{0};
};

} // namespace zxcompile
