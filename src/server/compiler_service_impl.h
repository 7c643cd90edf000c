#pragma once

#include "src/server/compile_service.h"

#include <grpcpp/grpcpp.h>
#include "proto/compiler.grpc.pb.h"

#include <optional>
#include <string>

namespace zxcompile {

// Maps a submission result onto the status returned to the gRPC caller.
grpc::Status ToStatus(const SubmissionResult& result);

// Rate-limit key for a request: the proxy's x-hasura-user-id header, else the
// session user id, else the peer address without its port.
std::string ClientIdentity(const CompileRequest& request,
                           const std::optional<std::string>& user_id_header,
                           const std::string& peer);

class CompilerServiceImpl final : public CompilerService::CallbackService {
public:
    explicit CompilerServiceImpl(CompileService& service) : service_(service) {}

    grpc::ServerUnaryReactor* Compile(grpc::CallbackServerContext* context,
                                      const CompileRequest* request,
                                      CompileResponse* response) override;

    grpc::ServerUnaryReactor* Health(grpc::CallbackServerContext* context,
                                     const HealthRequest* request,
                                     HealthResponse* response) override;

private:
    CompileService& service_;
};

} // namespace zxcompile
