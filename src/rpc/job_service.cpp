#include "rpc/job_service.hpp"

#include <utility>
#include "core/errors/status_codes.hpp"
#include "rpc/rpc_codec.hpp"

namespace octavius::rpc {

using core::errors::ErrorCategory;
using core::errors::OctaviusError;
using nlohmann::json;

namespace {

core::errors::Result<std::string> required_string(const json& payload, const char* key) {
    if (!payload.contains(key) || !payload.at(key).is_string()) {
        return OctaviusError{ErrorCategory::Input,
                             std::string("rpc: missing string field '") + key + "'",
                             "invalid_payload"};
    }
    return payload.at(key).get<std::string>();
}

}  // namespace

JobService::JobService(std::shared_ptr<const registry::JobRegistry> registry,
                       std::shared_ptr<const execution::ExecutionCoordinator> coordinator,
                       core::logging::Logger& logger)
    : registry_(std::move(registry)),
      coordinator_(std::move(coordinator)),
      logger_(logger) {}

std::string JobService::handle(const core::context::CallContext& ctx,
                               const std::string& request_frame) const {
    auto decoded = decode_request(request_frame);
    if (core::errors::is_error(decoded)) {
        logger_.warn("JobService: " + core::errors::get_error(decoded).message);
        return encode_response(core::errors::get_error(decoded));
    }
    const auto& request = core::errors::get_value(decoded);

    core::errors::Result<json> outcome = json::object();
    if (request.method == kSaveMetadata) {
        outcome = save_metadata(ctx, request.payload);
    } else if (request.method == kGetMetadata) {
        outcome = get_metadata(ctx, request.payload);
    } else if (request.method == kGetAvailableJobs) {
        outcome = get_available_jobs(ctx);
    } else if (request.method == kExecuteJob) {
        outcome = execute_job(ctx, request.payload);
    } else {
        outcome = OctaviusError{ErrorCategory::Input,
                                "rpc: unknown method '" + request.method + "'",
                                "unknown_method"};
    }

    if (core::errors::is_error(outcome)) {
        const auto& error = core::errors::get_error(outcome);
        logger_.info("JobService: " + request.method + " -> " +
                     core::errors::to_string(
                         core::errors::to_status_code(error.category)) +
                     ": " + error.message);
    } else {
        logger_.debug("JobService: " + request.method + " -> OK");
    }
    return encode_response(outcome);
}

core::errors::Result<json> JobService::save_metadata(
    const core::context::CallContext& ctx, const json& payload) const {
    auto name = required_string(payload, "name");
    if (core::errors::is_error(name)) {
        return core::errors::get_error(name);
    }
    if (!payload.contains("metadata")) {
        return OctaviusError{ErrorCategory::Input, "rpc: missing field 'metadata'",
                             "invalid_payload"};
    }
    auto metadata = metadata_from_json(payload.at("metadata"));
    if (core::errors::is_error(metadata)) {
        return core::errors::get_error(metadata);
    }

    auto stored = registry_->register_job(ctx, core::errors::get_value(name),
                                          core::errors::get_value(metadata));
    if (core::errors::is_error(stored)) {
        return core::errors::get_error(stored);
    }
    return metadata_to_json(core::errors::get_value(stored));
}

core::errors::Result<json> JobService::get_metadata(
    const core::context::CallContext& ctx, const json& payload) const {
    auto job_name = required_string(payload, "job_name");
    if (core::errors::is_error(job_name)) {
        return core::errors::get_error(job_name);
    }

    auto fetched = registry_->fetch(ctx, core::errors::get_value(job_name));
    if (core::errors::is_error(fetched)) {
        return core::errors::get_error(fetched);
    }
    return metadata_to_json(core::errors::get_value(fetched));
}

core::errors::Result<json> JobService::get_available_jobs(
    const core::context::CallContext& ctx) const {
    auto listed = registry_->list(ctx);
    if (core::errors::is_error(listed)) {
        return core::errors::get_error(listed);
    }

    json payload;
    payload["jobs"] = core::errors::get_value(listed).jobs;
    return payload;
}

core::errors::Result<json> JobService::execute_job(
    const core::context::CallContext& ctx, const json& payload) const {
    auto job_name = required_string(payload, "job_name");
    if (core::errors::is_error(job_name)) {
        return core::errors::get_error(job_name);
    }

    protocol::JobArguments arguments;
    if (payload.contains("arguments")) {
        auto parsed = arguments_from_json(payload.at("arguments"));
        if (core::errors::is_error(parsed)) {
            return core::errors::get_error(parsed);
        }
        arguments = core::errors::take_value(std::move(parsed));
    }

    auto executed = coordinator_->execute(ctx, core::errors::get_value(job_name), arguments);
    if (core::errors::is_error(executed)) {
        return core::errors::get_error(executed);
    }

    json response;
    response["status"] = core::errors::get_value(executed).status;
    return response;
}

}  // namespace octavius::rpc
