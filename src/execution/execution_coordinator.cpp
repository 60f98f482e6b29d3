#include "execution/execution_coordinator.hpp"

#include <utility>
#include "core/config/id_generator.hpp"

namespace octavius::execution {

using core::errors::ErrorCategory;
using core::errors::OctaviusError;

ExecutionCoordinator::ExecutionCoordinator(
    std::shared_ptr<const registry::JobRegistry> registry,
    std::shared_ptr<Executor> executor, core::logging::Logger& logger)
    : registry_(std::move(registry)), executor_(std::move(executor)), logger_(logger) {}

core::errors::Result<protocol::ExecutionResponse> ExecutionCoordinator::execute(
    const core::context::CallContext& ctx, const std::string& job_name,
    const protocol::JobArguments& arguments) const {
    for (const auto& argument : arguments) {
        const auto valid_key = policy_.validate_argument_key(argument.first);
        if (core::errors::is_error(valid_key)) {
            return core::errors::get_error(valid_key);
        }
    }

    // Unknown or unreadable jobs never reach the executor.
    auto fetched = registry_->fetch(ctx, job_name);
    if (core::errors::is_error(fetched)) {
        logger_.warn("ExecutionCoordinator: lookup of " + job_name + " failed: " +
                     core::errors::get_error(fetched).message);
        return core::errors::get_error(fetched);
    }
    const auto& metadata = core::errors::get_value(fetched);

    const auto valid_image = policy_.validate_image_name(metadata.image_name);
    if (core::errors::is_error(valid_image)) {
        return core::errors::with_context(core::errors::get_error(valid_image),
                                          "execute " + job_name);
    }

    protocol::ExecutionOrder order;
    order.execution_id = core::config::generate_execution_id();
    order.job_name = job_name;
    order.image_name = metadata.image_name;
    order.arguments = arguments;

    logger_.info("ExecutionCoordinator: dispatching " + job_name + " as " +
                 order.execution_id + " with " + std::to_string(arguments.size()) +
                 " arguments");

    auto ran = executor_->run(ctx, order);
    if (core::errors::is_error(ran)) {
        auto error = core::errors::as_internal(core::errors::get_error(ran),
                                               "execute " + job_name + " (" +
                                                   order.execution_id + ")");
        logger_.error("ExecutionCoordinator: " + error.message);
        return error;
    }

    protocol::ExecutionResponse response;
    response.status = core::errors::get_value(ran);
    logger_.info("ExecutionCoordinator: " + order.execution_id + " finished: " +
                 response.status);
    return response;
}

}  // namespace octavius::execution
