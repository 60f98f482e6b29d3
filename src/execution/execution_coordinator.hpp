#pragma once

#include <memory>
#include <string>
#include "core/context/call_context.hpp"
#include "core/errors/octavius_errors.hpp"
#include "core/logging/logger.hpp"
#include "execution/executor.hpp"
#include "policy/job_policy.hpp"
#include "protocol/execution_contract.hpp"
#include "registry/job_registry.hpp"

namespace octavius::execution {

// Turns an execution request into a single dispatch to the executor.
// Never retries: job execution is not assumed idempotent.
class ExecutionCoordinator {
public:
    ExecutionCoordinator(std::shared_ptr<const registry::JobRegistry> registry,
                         std::shared_ptr<Executor> executor,
                         core::logging::Logger& logger = core::logging::Logger::get());

    core::errors::Result<protocol::ExecutionResponse> execute(
        const core::context::CallContext& ctx, const std::string& job_name,
        const protocol::JobArguments& arguments) const;

    core::errors::Result<protocol::ExecutionResponse> execute(
        const core::context::CallContext& ctx,
        const protocol::ExecutionRequest& request) const {
        return execute(ctx, request.job_name, request.arguments);
    }

private:
    std::shared_ptr<const registry::JobRegistry> registry_;
    std::shared_ptr<Executor> executor_;
    core::logging::Logger& logger_;
    policy::JobPolicy policy_;
};

}  // namespace octavius::execution
