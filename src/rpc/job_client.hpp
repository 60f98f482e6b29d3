#pragma once

#include <memory>
#include <string>
#include "core/context/call_context.hpp"
#include "core/errors/octavius_errors.hpp"
#include "protocol/execution_contract.hpp"
#include "protocol/job_metadata.hpp"
#include "rpc/rpc_codec.hpp"
#include "rpc/transport.hpp"

namespace octavius::rpc {

// Caller-side stub. Errors come back with the category the service reported.
class JobClient {
public:
    explicit JobClient(std::shared_ptr<Transport> transport);

    core::errors::Result<protocol::Metadata> save_metadata(
        const core::context::CallContext& ctx, const std::string& name,
        const protocol::Metadata& metadata) const;

    core::errors::Result<protocol::Metadata> get_metadata(
        const core::context::CallContext& ctx, const std::string& job_name) const;

    core::errors::Result<protocol::JobList> get_available_jobs(
        const core::context::CallContext& ctx) const;

    core::errors::Result<protocol::ExecutionResponse> execute_job(
        const core::context::CallContext& ctx, const std::string& job_name,
        const protocol::JobArguments& arguments) const;

private:
    core::errors::Result<nlohmann::json> call(const core::context::CallContext& ctx,
                                              const RpcRequest& request) const;

    std::shared_ptr<Transport> transport_;
};

}  // namespace octavius::rpc
