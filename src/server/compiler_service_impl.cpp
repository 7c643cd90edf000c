#include "src/server/compiler_service_impl.h"
#include "src/server/logger.h"

#include <algorithm>
#include <cctype>
#include <mutex>
#include <thread>

using grpc::CallbackServerContext;
using grpc::ServerUnaryReactor;
using grpc::Status;
using grpc::StatusCode;

namespace zxcompile {

namespace {

constexpr char kUserIdHeader[] = "x-hasura-user-id";
constexpr char kRetryAfterHeader[] = "retry-after";
constexpr char kServiceName[] = "zxbasic-compiler";

std::string StripPort(const std::string& peer) {
    size_t colon = peer.rfind(':');
    if (colon == std::string::npos || colon + 1 == peer.size()) return peer;
    std::string tail = peer.substr(colon + 1);
    if (!std::all_of(tail.begin(), tail.end(), [](unsigned char c) { return std::isdigit(c); })) {
        return peer;
    }
    return peer.substr(0, colon);
}

std::optional<std::string> FindHeader(const CallbackServerContext& context, const std::string& key) {
    const auto& metadata = context.client_metadata();
    auto it = metadata.find(key);
    if (it == metadata.end()) return std::nullopt;
    return std::string(it->second.data(), it->second.size());
}

} // namespace

Status ToStatus(const SubmissionResult& result) {
    switch (result.status) {
        case SubmissionStatus::kOk:
            return Status::OK;
        case SubmissionStatus::kRateLimited:
            return Status(StatusCode::RESOURCE_EXHAUSTED, result.detail);
        case SubmissionStatus::kTimeout:
            return Status(StatusCode::DEADLINE_EXCEEDED, result.detail);
        case SubmissionStatus::kCompileFailure:
            return Status(StatusCode::INVALID_ARGUMENT, "Compilation failed: " + result.detail);
        case SubmissionStatus::kNoOutput:
            return Status(StatusCode::FAILED_PRECONDITION, result.detail);
        case SubmissionStatus::kInvalidRequest:
            return Status(StatusCode::INVALID_ARGUMENT, result.detail);
        case SubmissionStatus::kSystemError:
            return Status(StatusCode::INTERNAL, result.detail);
    }
    return Status(StatusCode::INTERNAL, "Internal error");
}

std::string ClientIdentity(const CompileRequest& request,
                           const std::optional<std::string>& user_id_header,
                           const std::string& peer) {
    // The header is set by the fronting proxy; the request body is caller-controlled.
    if (user_id_header && !user_id_header->empty()) {
        return "user:" + *user_id_header;
    }
    if (!request.session_variables().user_id().empty()) {
        return "user:" + request.session_variables().user_id();
    }
    return "peer:" + StripPort(peer);
}

ServerUnaryReactor* CompilerServiceImpl::Compile(CallbackServerContext* context,
                                                 const CompileRequest* request,
                                                 CompileResponse* response) {
    class CompileReactor : public ServerUnaryReactor {
    public:
        CompileReactor(CallbackServerContext* context, const CompileRequest* request,
                       CompileResponse* response, CompileService& service)
            : context_(context), request_(request), response_(response), service_(service) {
            // Submit blocks for up to the job timeout, so it gets its own thread.
            // Finish waits for mutex_ so worker_thread_ is assigned before OnDone can run.
            std::lock_guard<std::mutex> lock(mutex_);
            worker_thread_ = std::thread([this]() {
                std::string client = ClientIdentity(*request_, FindHeader(*context_, kUserIdHeader),
                                                    context_->peer());
                SubmissionResult result = service_.Submit(request_->basic(), client);

                if (result.status == SubmissionStatus::kOk) {
                    response_->set_base64_encoded(result.artifact_base64);
                } else {
                    Logger::Info("Compile request from ", client, " rejected: ",
                                 SubmissionStatusName(result.status));
                }
                if (result.status == SubmissionStatus::kRateLimited) {
                    context_->AddTrailingMetadata(kRetryAfterHeader,
                                                  std::to_string(result.retry_after.count()));
                }
                { std::lock_guard<std::mutex> lock(mutex_); }
                Finish(ToStatus(result));
            });
        }

        void OnDone() override {
            if (worker_thread_.joinable()) {
                if (worker_thread_.get_id() == std::this_thread::get_id()) {
                    worker_thread_.detach();
                } else {
                    worker_thread_.join();
                }
            }
            delete this;
        }

        void OnCancel() override {
            // The job keeps running; its timeout and the monitor bound it.
            Logger::Warn("Compile RPC cancelled by client.");
        }

    private:
        CallbackServerContext* context_;
        const CompileRequest* request_;
        CompileResponse* response_;
        CompileService& service_;
        std::mutex mutex_;
        std::thread worker_thread_;
    };

    return new CompileReactor(context, request, response, service_);
}

ServerUnaryReactor* CompilerServiceImpl::Health(CallbackServerContext* context,
                                                const HealthRequest* /*request*/,
                                                HealthResponse* response) {
    response->set_status("healthy");
    response->set_service(kServiceName);
    response->set_active_jobs(service_.ActiveJobs());
    response->set_tracked_processes(static_cast<int32_t>(service_.TrackedProcesses()));

    ServerUnaryReactor* reactor = context->DefaultReactor();
    reactor->Finish(Status::OK);
    return reactor;
}

} // namespace zxcompile
