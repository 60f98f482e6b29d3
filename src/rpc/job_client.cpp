#include "rpc/job_client.hpp"

#include <utility>

namespace octavius::rpc {

using core::errors::ErrorCategory;
using core::errors::OctaviusError;
using nlohmann::json;

namespace {

OctaviusError unexpected_payload(const std::string& method) {
    return OctaviusError{ErrorCategory::Internal,
                         "rpc: unexpected " + method + " response payload",
                         "malformed_frame"};
}

}  // namespace

JobClient::JobClient(std::shared_ptr<Transport> transport)
    : transport_(std::move(transport)) {}

core::errors::Result<json> JobClient::call(const core::context::CallContext& ctx,
                                           const RpcRequest& request) const {
    auto response = transport_->round_trip(ctx, encode_request(request));
    if (core::errors::is_error(response)) {
        return core::errors::as_internal(core::errors::get_error(response),
                                         "rpc " + request.method);
    }
    return decode_response(core::errors::get_value(response));
}

core::errors::Result<protocol::Metadata> JobClient::save_metadata(
    const core::context::CallContext& ctx, const std::string& name,
    const protocol::Metadata& metadata) const {
    json body;
    body["author"] = metadata.author;
    body["image_name"] = metadata.image_name;
    body["description"] = metadata.description;

    RpcRequest request;
    request.method = kSaveMetadata;
    request.payload["name"] = name;
    request.payload["metadata"] = body;

    auto payload = call(ctx, request);
    if (core::errors::is_error(payload)) {
        return core::errors::get_error(payload);
    }
    return metadata_from_json(core::errors::get_value(payload));
}

core::errors::Result<protocol::Metadata> JobClient::get_metadata(
    const core::context::CallContext& ctx, const std::string& job_name) const {
    RpcRequest request;
    request.method = kGetMetadata;
    request.payload["job_name"] = job_name;

    auto payload = call(ctx, request);
    if (core::errors::is_error(payload)) {
        return core::errors::get_error(payload);
    }
    return metadata_from_json(core::errors::get_value(payload));
}

core::errors::Result<protocol::JobList> JobClient::get_available_jobs(
    const core::context::CallContext& ctx) const {
    RpcRequest request;
    request.method = kGetAvailableJobs;

    auto payload = call(ctx, request);
    if (core::errors::is_error(payload)) {
        return core::errors::get_error(payload);
    }

    const auto& body = core::errors::get_value(payload);
    if (!body.contains("jobs") || !body.at("jobs").is_array()) {
        return unexpected_payload(kGetAvailableJobs);
    }
    protocol::JobList job_list;
    for (const auto& job : body.at("jobs")) {
        if (!job.is_string()) {
            return unexpected_payload(kGetAvailableJobs);
        }
        job_list.jobs.push_back(job.get<std::string>());
    }
    return job_list;
}

core::errors::Result<protocol::ExecutionResponse> JobClient::execute_job(
    const core::context::CallContext& ctx, const std::string& job_name,
    const protocol::JobArguments& arguments) const {
    RpcRequest request;
    request.method = kExecuteJob;
    request.payload["job_name"] = job_name;
    request.payload["arguments"] = arguments_to_json(arguments);

    auto payload = call(ctx, request);
    if (core::errors::is_error(payload)) {
        return core::errors::get_error(payload);
    }

    const auto& body = core::errors::get_value(payload);
    if (!body.contains("status") || !body.at("status").is_string()) {
        return unexpected_payload(kExecuteJob);
    }
    protocol::ExecutionResponse response;
    response.status = body.at("status").get<std::string>();
    return response;
}

}  // namespace octavius::rpc
