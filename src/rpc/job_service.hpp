#pragma once

#include <memory>
#include <string>
#include <nlohmann/json.hpp>
#include "core/context/call_context.hpp"
#include "core/errors/octavius_errors.hpp"
#include "core/logging/logger.hpp"
#include "execution/execution_coordinator.hpp"
#include "registry/job_registry.hpp"

namespace octavius::rpc {

// Server side of the RPC surface. Decodes a request frame, runs it against the
// registry or the coordinator and encodes the outcome with its status code.
class JobService {
public:
    JobService(std::shared_ptr<const registry::JobRegistry> registry,
               std::shared_ptr<const execution::ExecutionCoordinator> coordinator,
               core::logging::Logger& logger = core::logging::Logger::get());

    std::string handle(const core::context::CallContext& ctx,
                       const std::string& request_frame) const;

private:
    core::errors::Result<nlohmann::json> save_metadata(
        const core::context::CallContext& ctx, const nlohmann::json& payload) const;
    core::errors::Result<nlohmann::json> get_metadata(
        const core::context::CallContext& ctx, const nlohmann::json& payload) const;
    core::errors::Result<nlohmann::json> get_available_jobs(
        const core::context::CallContext& ctx) const;
    core::errors::Result<nlohmann::json> execute_job(
        const core::context::CallContext& ctx, const nlohmann::json& payload) const;

    std::shared_ptr<const registry::JobRegistry> registry_;
    std::shared_ptr<const execution::ExecutionCoordinator> coordinator_;
    core::logging::Logger& logger_;
};

}  // namespace octavius::rpc
